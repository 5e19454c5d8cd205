#include "cobra/branch/branch_type.hpp"

#include <algorithm>
#include <array>

#include "cobra/branch/continuation_kind.hpp"

namespace cobra::branch {

std::string_view kind_name(const BranchType& type) noexcept {
    return std::visit(
        Overloaded{
            [](const Equilibrium&) -> std::string_view { return "Equilibrium"; },
            [](const LimitCycle&) -> std::string_view { return "LimitCycle"; },
            [](const HomoclinicCurve&) -> std::string_view {
                return "HomoclinicCurve";
            },
            [](const HomotopySaddleCurve&) -> std::string_view {
                return "HomotopySaddleCurve";
            },
            [](const FoldCurve&) -> std::string_view { return "FoldCurve"; },
            [](const HopfCurve&) -> std::string_view { return "HopfCurve"; },
            [](const LPCCurve&) -> std::string_view { return "LPCCurve"; },
            [](const PDCurve&) -> std::string_view { return "PDCurve"; },
            [](const NSCurve&) -> std::string_view { return "NSCurve"; },
            [](const IsochroneCurve&) -> std::string_view {
                return "IsochroneCurve";
            },
        },
        type);
}

std::optional<std::string> param1_name(const BranchType& type) {
    return std::visit(
        Overloaded{
            [](const Equilibrium&) -> std::optional<std::string> {
                return std::nullopt;
            },
            [](const LimitCycle&) -> std::optional<std::string> {
                return std::nullopt;
            },
            [](const auto& curve) -> std::optional<std::string> {
                return curve.param1_name;
            },
        },
        type);
}

std::optional<std::string> param2_name(const BranchType& type) {
    return std::visit(
        Overloaded{
            [](const Equilibrium&) -> std::optional<std::string> {
                return std::nullopt;
            },
            [](const LimitCycle&) -> std::optional<std::string> {
                return std::nullopt;
            },
            [](const auto& curve) -> std::optional<std::string> {
                return curve.param2_name;
            },
        },
        type);
}

std::optional<Mesh> mesh(const BranchType& type) noexcept {
    return std::visit(
        Overloaded{
            [](const Equilibrium&) -> std::optional<Mesh> {
                return std::nullopt;
            },
            [](const FoldCurve&) -> std::optional<Mesh> {
                return std::nullopt;
            },
            [](const HopfCurve&) -> std::optional<Mesh> {
                return std::nullopt;
            },
            [](const auto& meshed) -> std::optional<Mesh> {
                return Mesh{.ntst = meshed.ntst, .ncol = meshed.ncol};
            },
        },
        type);
}

namespace {
constexpr std::array<std::string_view, 4> kStageTags = {"StageA", "StageB",
                                                        "StageC", "StageD"};
} // namespace

std::string_view to_string(HomotopyStage stage) noexcept {
    return kStageTags[static_cast<SizeType>(stage)];
}

std::optional<HomotopyStage> parse_homotopy_stage(std::string_view tag) {
    for (SizeType i = 0; i < kStageTags.size(); ++i) {
        if (kStageTags[i] == tag) {
            return static_cast<HomotopyStage>(i);
        }
    }
    return std::nullopt;
}

namespace {
constexpr std::array<std::string_view, 10> kBranchKindTags = {
    "equilibrium", "limit_cycle", "homoclinic_curve", "homotopy_saddle_curve",
    "fold_curve",  "hopf_curve",  "lpc_curve",        "pd_curve",
    "ns_curve",    "isochrone_curve"};
} // namespace

std::string_view to_string(BranchKind kind) noexcept {
    return kBranchKindTags[static_cast<SizeType>(kind)];
}

std::optional<BranchKind> parse_branch_kind(std::string_view tag) {
    const auto it = std::ranges::find(kBranchKindTags, tag);
    if (it == kBranchKindTags.end()) {
        return std::nullopt;
    }
    return static_cast<BranchKind>(it - kBranchKindTags.begin());
}

bool is_cycle_kind(BranchKind kind) noexcept {
    switch (kind) {
    case BranchKind::kLimitCycle:
    case BranchKind::kIsochroneCurve:
    case BranchKind::kLPCCurve:
    case BranchKind::kPDCurve:
    case BranchKind::kNSCurve:
        return true;
    default:
        return false;
    }
}

bool is_two_parameter(BranchKind kind) noexcept {
    return kind != BranchKind::kEquilibrium && kind != BranchKind::kLimitCycle;
}

} // namespace cobra::branch
