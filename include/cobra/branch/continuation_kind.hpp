#pragma once

#include <cstdint>
#include <optional>
#include <string_view>

namespace cobra::branch {

// Coarse branch tag stored on a ContinuationObject.
enum class BranchKind : std::uint8_t {
    kEquilibrium,
    kLimitCycle,
    kHomoclinicCurve,
    kHomotopySaddleCurve,
    kFoldCurve,
    kHopfCurve,
    kLPCCurve,
    kPDCurve,
    kNSCurve,
    kIsochroneCurve,
};

[[nodiscard]] std::string_view to_string(BranchKind kind) noexcept;
[[nodiscard]] std::optional<BranchKind> parse_branch_kind(std::string_view tag);
// Branches whose points carry limit-cycle profiles (multipliers, not
// eigenvalues).
[[nodiscard]] bool is_cycle_kind(BranchKind kind) noexcept;
[[nodiscard]] bool is_two_parameter(BranchKind kind) noexcept;

} // namespace cobra::branch
