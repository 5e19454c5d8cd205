#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include "cobra/common/types.hpp"

namespace cobra::branch {

struct Mesh {
    SizeType ntst{};
    SizeType ncol{};

    bool operator==(const Mesh&) const = default;
};

inline constexpr Mesh kDefaultLimitCycleMesh{.ntst = 20, .ncol = 4};

struct Equilibrium {
    bool operator==(const Equilibrium&) const = default;
};

struct LimitCycle {
    SizeType ntst{kDefaultLimitCycleMesh.ntst};
    SizeType ncol{kDefaultLimitCycleMesh.ncol};

    bool operator==(const LimitCycle&) const = default;
};

struct HomoclinicCurve {
    SizeType ntst{};
    SizeType ncol{};
    std::string param1_name;
    std::string param2_name;
    bool free_time{};
    bool free_eps0{};
    bool free_eps1{};

    bool operator==(const HomoclinicCurve&) const = default;
};

enum class HomotopyStage : std::uint8_t { kStageA, kStageB, kStageC, kStageD };

struct HomotopySaddleCurve {
    SizeType ntst{};
    SizeType ncol{};
    std::string param1_name;
    std::string param2_name;
    HomotopyStage stage{HomotopyStage::kStageA};

    bool operator==(const HomotopySaddleCurve&) const = default;
};

struct FoldCurve {
    std::string param1_name;
    std::string param2_name;

    bool operator==(const FoldCurve&) const = default;
};

struct HopfCurve {
    std::string param1_name;
    std::string param2_name;

    bool operator==(const HopfCurve&) const = default;
};

// Two-parameter curves of limit cycles share one shape.
struct CycleCurveFields {
    std::string param1_name;
    std::string param2_name;
    SizeType ntst{};
    SizeType ncol{};

    bool operator==(const CycleCurveFields&) const = default;
};

struct LPCCurve : CycleCurveFields {};
struct PDCurve : CycleCurveFields {};
struct NSCurve : CycleCurveFields {};
struct IsochroneCurve : CycleCurveFields {};

using BranchType = std::variant<Equilibrium,
                                LimitCycle,
                                HomoclinicCurve,
                                HomotopySaddleCurve,
                                FoldCurve,
                                HopfCurve,
                                LPCCurve,
                                PDCurve,
                                NSCurve,
                                IsochroneCurve>;

// Variant tag as exchanged with the engine, e.g. "HomoclinicCurve".
[[nodiscard]] std::string_view kind_name(const BranchType& type) noexcept;
[[nodiscard]] std::optional<std::string>
param1_name(const BranchType& type);
[[nodiscard]] std::optional<std::string>
param2_name(const BranchType& type);
[[nodiscard]] std::optional<Mesh> mesh(const BranchType& type) noexcept;

[[nodiscard]] std::string_view to_string(HomotopyStage stage) noexcept;
[[nodiscard]] std::optional<HomotopyStage>
parse_homotopy_stage(std::string_view tag);

} // namespace cobra::branch
