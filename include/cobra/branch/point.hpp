#pragma once

#include <complex>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace cobra::branch {

// Stability classification attached to a continuation point. The first
// group is detected on codim-1 branches, the rest on two-parameter curves.
enum class BifurcationType : std::uint8_t {
    kNone,
    kFold,
    kHopf,
    kNeutralSaddle,
    kCycleFold,
    kPeriodDoubling,
    kNeimarkSacker,
    kCusp,
    kBogdanovTakens,
    kZeroHopf,
    kDoubleHopf,
    kGeneralizedHopf,
    kCuspOfCycles,
    kFoldFlip,
    kFoldNeimarkSacker,
    kFlipNeimarkSacker,
    kDoubleNeimarkSacker,
    kGeneralizedPeriodDoubling,
    kChenciner,
    kResonance1_1,
    kResonance1_2,
    kResonance1_3,
    kResonance1_4,
};

// Wire tag, e.g. "PeriodDoubling".
[[nodiscard]] std::string_view to_string(BifurcationType type) noexcept;
// Unknown tags map to kNone.
[[nodiscard]] BifurcationType parse_bifurcation_type(std::string_view tag);
[[nodiscard]] bool is_codim2(BifurcationType type) noexcept;
// Human readable label, e.g. "Neimark-Sacker". kNone reads "Unknown".
[[nodiscard]] std::string_view display_label(BifurcationType type) noexcept;
// "Index 12 - Hopf"
[[nodiscard]] std::string format_bifurcation_label(std::int64_t index,
                                                   BifurcationType type);

using Eigenvalue = std::complex<double>;

struct ContinuationPoint {
    std::vector<double> state;
    double param_value{};
    std::optional<double> param2_value;
    BifurcationType stability{BifurcationType::kNone};
    std::vector<Eigenvalue> eigenvalues;
    std::optional<double> auxiliary;

    bool operator==(const ContinuationPoint&) const = default;
};

} // namespace cobra::branch
