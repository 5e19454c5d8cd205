#include "cobra/branch/branch_data.hpp"
#include "cobra/branch/continuation_object.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <cmath>
#include <iterator>
#include <numeric>
#include <set>

#include "cobra/exceptions.hpp"

namespace cobra::branch {

namespace {

bool seed_resolves(const std::optional<EndpointSeed>& seed,
                   const std::set<LogicalIndex>& valid) {
    return !seed || valid.contains(seed->endpoint_index);
}

bool positive_finite(double value) noexcept {
    return std::isfinite(value) && value > 0.0;
}

} // namespace

bool HomoclinicContext::is_valid() const noexcept {
    return param1_index < base_params.size() &&
           param2_index < base_params.size() && positive_finite(fixed_time) &&
           positive_finite(fixed_eps0) && positive_finite(fixed_eps1);
}

std::vector<LogicalIndex> sequential_indices(SizeType count) {
    std::vector<LogicalIndex> indices(count);
    for (SizeType i = 0; i < count; ++i) {
        indices[i] = LogicalIndex{static_cast<std::int64_t>(i)};
    }
    return indices;
}

std::vector<std::int64_t>
logical_values(std::span<const LogicalIndex> indices) {
    std::vector<std::int64_t> values;
    values.reserve(indices.size());
    std::ranges::transform(indices, std::back_inserter(values),
                           &LogicalIndex::value);
    return values;
}

std::vector<LogicalIndex> to_logical(std::span<const std::int64_t> values) {
    std::vector<LogicalIndex> indices;
    indices.reserve(values.size());
    for (const auto value : values) {
        indices.push_back(LogicalIndex{value});
    }
    return indices;
}

std::vector<LogicalIndex> resolved_indices(const ContinuationBranchData& data) {
    if (data.indices.size() == data.points.size()) {
        return data.indices;
    }
    return sequential_indices(data.points.size());
}

void ensure_indices(ContinuationBranchData& data) {
    if (data.indices.size() != data.points.size()) {
        data.indices = sequential_indices(data.points.size());
    }
}

bool is_consistent(const ContinuationBranchData& data) {
    if (data.indices.size() != data.points.size()) {
        return false;
    }
    const auto n = data.points.size();
    if (!std::ranges::all_of(data.bifurcations,
                             [n](ArrayIndex idx) { return idx.value < n; })) {
        return false;
    }
    if (!data.resume_state) {
        return true;
    }
    const std::set<LogicalIndex> valid(data.indices.begin(),
                                       data.indices.end());
    return seed_resolves(data.resume_state->min_index_seed, valid) &&
           seed_resolves(data.resume_state->max_index_seed, valid);
}

std::vector<ArrayIndex>
sorted_array_order(std::span<const LogicalIndex> indices) {
    std::vector<SizeType> order(indices.size());
    std::iota(order.begin(), order.end(), SizeType{0});
    std::ranges::stable_sort(order, [&](SizeType a, SizeType b) {
        return indices[a] < indices[b];
    });
    std::vector<ArrayIndex> result;
    result.reserve(order.size());
    for (const auto pos : order) {
        result.push_back(ArrayIndex{pos});
    }
    return result;
}

std::optional<ArrayIndex> find_array_index(const ContinuationBranchData& data,
                                           LogicalIndex logical) {
    const auto indices = resolved_indices(data);
    const auto it      = std::ranges::find(indices, logical);
    if (it == indices.end()) {
        return std::nullopt;
    }
    return ArrayIndex{static_cast<SizeType>(it - indices.begin())};
}

const ContinuationPoint& point_at(const ContinuationBranchData& data,
                                  ArrayIndex index) {
    error_check::check_range(index.value, data.points.size(),
                             "point_at: array index");
    return data.points[index.value];
}

std::optional<Frontier> select_frontier(const ContinuationBranchData& data,
                                        Direction direction) {
    const auto indices = resolved_indices(data);
    if (indices.empty()) {
        return std::nullopt;
    }
    SizeType selected = 0;
    for (SizeType i = 1; i < indices.size(); ++i) {
        const bool better = direction == Direction::kForward
                                ? indices[i] > indices[selected]
                                : indices[i] < indices[selected];
        if (better) {
            selected = i;
        }
    }
    return Frontier{.array_index   = ArrayIndex{selected},
                    .logical_index = indices[selected]};
}

void drop_dangling_seeds(ContinuationBranchData& data) {
    if (!data.resume_state) {
        return;
    }
    const std::set<LogicalIndex> valid(data.indices.begin(),
                                       data.indices.end());
    auto& state = *data.resume_state;
    if (!seed_resolves(state.min_index_seed, valid)) {
        state.min_index_seed.reset();
    }
    if (!seed_resolves(state.max_index_seed, valid)) {
        state.max_index_seed.reset();
    }
    if (state.empty()) {
        data.resume_state.reset();
    }
}

std::string current_timestamp() {
    const auto now = std::chrono::floor<std::chrono::milliseconds>(
        std::chrono::system_clock::now());
    return std::format("{:%FT%TZ}", now);
}

} // namespace cobra::branch
