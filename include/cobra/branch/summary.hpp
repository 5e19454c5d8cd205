#pragma once

#include <optional>
#include <span>
#include <string>

#include "cobra/branch/continuation_kind.hpp"
#include "cobra/branch/continuation_object.hpp"
#include "cobra/branch/point.hpp"

namespace cobra::branch {

// Fixed notation with 3 decimals, scientific with 4 below 1e-3 (non-zero)
// and from 1e4 upwards. Non-finite values print as NaN / Infinity.
[[nodiscard]] std::string format_number(double value);
// "NaN" for an absent or non-finite value.
[[nodiscard]] std::string format_number_safe(std::optional<double> value);
// "[1.000, 2.500]"
[[nodiscard]] std::string format_array(std::span<const double> values);

// "Eigenvalues: 0.100+0.000i, ..." with at most three entries. Cycle
// branches label their values "Multipliers".
[[nodiscard]] std::string summarize_eigenvalues(const ContinuationPoint& point,
                                                BranchKind kind);

struct BranchSummary {
    SizeType point_count{};
    std::optional<LogicalIndex> min_index;
    std::optional<LogicalIndex> max_index;
    std::optional<double> param_min;
    std::optional<double> param_max;
    SizeType bifurcation_count{};
    bool resumable_forward{};
    bool resumable_backward{};
};

[[nodiscard]] BranchSummary summarize_branch(const ContinuationBranchData& data);
// Multi-line report: header, parameter span, one line per bifurcation.
[[nodiscard]] std::string describe_branch(const ContinuationObject& object);

} // namespace cobra::branch
