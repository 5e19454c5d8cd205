#include "cobra/branch/point.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <cstddef>
#include <cstdint>

namespace cobra::branch {

namespace {

struct BifurcationInfo {
    BifurcationType type;
    std::string_view tag;
    std::string_view label;
};

constexpr std::array<BifurcationInfo, 23> kBifurcationTable = {{
    {BifurcationType::kNone, "None", "Unknown"},
    {BifurcationType::kFold, "Fold", "Fold"},
    {BifurcationType::kHopf, "Hopf", "Hopf"},
    {BifurcationType::kNeutralSaddle, "NeutralSaddle", "Neutral Saddle"},
    {BifurcationType::kCycleFold, "CycleFold", "Cycle Fold"},
    {BifurcationType::kPeriodDoubling, "PeriodDoubling", "Period Doubling"},
    {BifurcationType::kNeimarkSacker, "NeimarkSacker", "Neimark-Sacker"},
    {BifurcationType::kCusp, "Cusp", "Cusp"},
    {BifurcationType::kBogdanovTakens, "BogdanovTakens", "Bogdanov-Takens"},
    {BifurcationType::kZeroHopf, "ZeroHopf", "Zero-Hopf"},
    {BifurcationType::kDoubleHopf, "DoubleHopf", "Double-Hopf"},
    {BifurcationType::kGeneralizedHopf, "GeneralizedHopf", "Generalized Hopf"},
    {BifurcationType::kCuspOfCycles, "CuspOfCycles", "Cusp of Cycles"},
    {BifurcationType::kFoldFlip, "FoldFlip", "Fold-Flip"},
    {BifurcationType::kFoldNeimarkSacker, "FoldNeimarkSacker",
     "Fold-Neimark-Sacker"},
    {BifurcationType::kFlipNeimarkSacker, "FlipNeimarkSacker",
     "Flip-Neimark-Sacker"},
    {BifurcationType::kDoubleNeimarkSacker, "DoubleNeimarkSacker",
     "Double Neimark-Sacker"},
    {BifurcationType::kGeneralizedPeriodDoubling, "GeneralizedPeriodDoubling",
     "Generalized Period Doubling"},
    {BifurcationType::kChenciner, "Chenciner", "Chenciner"},
    {BifurcationType::kResonance1_1, "Resonance1_1", "Resonance 1:1"},
    {BifurcationType::kResonance1_2, "Resonance1_2", "Resonance 1:2"},
    {BifurcationType::kResonance1_3, "Resonance1_3", "Resonance 1:3"},
    {BifurcationType::kResonance1_4, "Resonance1_4", "Resonance 1:4"},
}};

const BifurcationInfo& info_for(BifurcationType type) noexcept {
    return kBifurcationTable[static_cast<std::size_t>(type)];
}

} // namespace

std::string_view to_string(BifurcationType type) noexcept {
    return info_for(type).tag;
}

BifurcationType parse_bifurcation_type(std::string_view tag) {
    const auto it = std::ranges::find(kBifurcationTable, tag,
                                       &BifurcationInfo::tag);
    return it != kBifurcationTable.end() ? it->type : BifurcationType::kNone;
}

bool is_codim2(BifurcationType type) noexcept {
    return static_cast<std::uint8_t>(type) >=
           static_cast<std::uint8_t>(BifurcationType::kCusp);
}

std::string_view display_label(BifurcationType type) noexcept {
    return info_for(type).label;
}

std::string format_bifurcation_label(std::int64_t index,
                                     BifurcationType type) {
    return std::format("Index {} - {}", index, display_label(type));
}

} // namespace cobra::branch
