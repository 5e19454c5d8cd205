#pragma once

#include <cstdint>
#include <optional>
#include <span>
#include <vector>

#include "cobra/branch/branch_type.hpp"
#include "cobra/branch/point.hpp"
#include "cobra/common/types.hpp"

namespace cobra::branch {

// State, tangent and step needed to resume continuation from one branch
// boundary. aug_state and tangent live in (parameter, state...) space.
struct EndpointSeed {
    LogicalIndex endpoint_index;
    std::vector<double> aug_state;
    std::vector<double> tangent;
    double step_size{};

    bool operator==(const EndpointSeed&) const = default;
};

struct ResumeState {
    std::optional<EndpointSeed> min_index_seed;
    std::optional<EndpointSeed> max_index_seed;

    [[nodiscard]] bool empty() const noexcept {
        return !min_index_seed && !max_index_seed;
    }
    bool operator==(const ResumeState&) const = default;
};

struct HomoclinicBasis {
    std::vector<double> stable_q;
    std::vector<double> unstable_q;
    SizeType dim{};
    SizeType nneg{};
    SizeType npos{};

    bool operator==(const HomoclinicBasis&) const = default;
};

// Engine setup retained on homoclinic branches so a restart can reuse the
// fixed time/eps values and the saddle basis.
struct HomoclinicContext {
    std::vector<double> base_params;
    SizeType param1_index{};
    SizeType param2_index{};
    HomoclinicBasis basis;
    double fixed_time{};
    double fixed_eps0{};
    double fixed_eps1{};

    [[nodiscard]] bool is_valid() const noexcept;
    bool operator==(const HomoclinicContext&) const = default;
};

struct ContinuationBranchData {
    std::vector<ContinuationPoint> points;
    std::vector<LogicalIndex> indices;
    std::vector<ArrayIndex> bifurcations;
    std::optional<BranchType> branch_type;
    std::optional<ResumeState> resume_state;
    std::optional<std::vector<std::vector<double>>> upoldp;
    std::optional<HomoclinicContext> homoc_context;

    [[nodiscard]] SizeType size() const noexcept { return points.size(); }
    [[nodiscard]] bool empty() const noexcept { return points.empty(); }
};

struct Frontier {
    ArrayIndex array_index;
    LogicalIndex logical_index;
};

[[nodiscard]] std::vector<LogicalIndex> sequential_indices(SizeType count);
[[nodiscard]] std::vector<std::int64_t>
logical_values(std::span<const LogicalIndex> indices);
[[nodiscard]] std::vector<LogicalIndex>
to_logical(std::span<const std::int64_t> values);

// indices when they cover every point, [0..n) otherwise.
[[nodiscard]] std::vector<LogicalIndex>
resolved_indices(const ContinuationBranchData& data);
// Regenerates indices as [0..n) when their length does not match points.
void ensure_indices(ContinuationBranchData& data);
// Index lengths agree, bifurcations are in range and every seed endpoint
// resolves to a stored logical index.
[[nodiscard]] bool is_consistent(const ContinuationBranchData& data);

// Array positions ordered by logical index (stable for equal labels).
[[nodiscard]] std::vector<ArrayIndex>
sorted_array_order(std::span<const LogicalIndex> indices);
[[nodiscard]] std::optional<ArrayIndex>
find_array_index(const ContinuationBranchData& data, LogicalIndex logical);
[[nodiscard]] const ContinuationPoint& point_at(const ContinuationBranchData& data,
                                                ArrayIndex index);

// Continuation frontier: largest logical index going forward, smallest going
// backward. Not the first/last array slot, which diverge after trimming.
[[nodiscard]] std::optional<Frontier>
select_frontier(const ContinuationBranchData& data, Direction direction);

// Removes seeds whose endpoint no longer resolves to a stored index.
void drop_dangling_seeds(ContinuationBranchData& data);

} // namespace cobra::branch
