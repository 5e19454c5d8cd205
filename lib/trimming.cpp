#include "cobra/seeds/trimming.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>
#include <ranges>
#include <set>
#include <span>
#include <vector>

#include "cobra/seeds/resume.hpp"

namespace cobra::seeds {

namespace {

using branch::ContinuationPoint;
using branch::EndpointSeed;

std::vector<double> difference(std::span<const double> a,
                               std::span<const double> b) {
    std::vector<double> diff(a.size());
    std::ranges::transform(a, b, diff.begin(), std::minus<>{});
    return diff;
}

// Tangent for the retained boundary point. The central difference spans the
// discarded point and the second neighbour on the original branch; the
// secant between the two retained boundary points is the fallback.
std::optional<std::vector<double>>
boundary_tangent(std::span<const ContinuationPoint> original,
                 std::span<const ContinuationPoint> kept,
                 Direction side) {
    const bool forward = side == Direction::kForward;
    const auto n       = original.size();
    const auto m       = kept.size();
    const auto retained =
        augmented_state(forward ? kept.front() : kept.back());
    if (retained.empty()) {
        return std::nullopt;
    }

    if (n >= 3) {
        const auto prev = augmented_state(forward ? original[0] : original[n - 1]);
        const auto next = augmented_state(forward ? original[2] : original[n - 3]);
        if (!prev.empty() && prev.size() == retained.size() &&
            next.size() == retained.size()) {
            if (auto tangent = normalized(difference(next, prev))) {
                return tangent;
            }
        }
    }

    const auto neighbour = augmented_state(forward ? kept[1] : kept[m - 2]);
    if (neighbour.empty() || neighbour.size() != retained.size()) {
        return std::nullopt;
    }
    return normalized(difference(retained, neighbour));
}

double resolve_step_hint(const branch::ContinuationBranchData& data,
                         const TrimOptions& options) {
    double hint = kDefaultSeedStep;
    if (options.step_hint) {
        hint = *options.step_hint;
    } else if (data.resume_state && data.resume_state->min_index_seed) {
        hint = data.resume_state->min_index_seed->step_size;
    } else if (data.resume_state && data.resume_state->max_index_seed) {
        hint = data.resume_state->max_index_seed->step_size;
    }
    return std::isfinite(hint) && hint > 0.0 ? hint : kDefaultSeedStep;
}

std::optional<EndpointSeed>
remap_seed(const std::optional<EndpointSeed>& seed,
           std::int64_t base,
           const std::set<LogicalIndex>& valid) {
    if (!seed) {
        return std::nullopt;
    }
    auto remapped           = *seed;
    remapped.endpoint_index = LogicalIndex{seed->endpoint_index.value - base};
    if (!valid.contains(remapped.endpoint_index)) {
        return std::nullopt;
    }
    return remapped;
}

} // namespace

branch::ContinuationBranchData
discard_initial_approximation_point(const branch::ContinuationBranchData& data,
                                    const TrimOptions& options) {
    const auto n = data.size();
    if (n <= 1) {
        return data;
    }
    const bool forward    = options.side == Direction::kForward;
    const SizeType dropped = forward ? 0 : n - 1;
    const auto incoming   = branch::resolved_indices(data);

    branch::ContinuationBranchData trimmed = data;
    trimmed.points.erase(trimmed.points.begin() +
                         static_cast<IndexType>(dropped));
    const auto m = trimmed.size();

    // Forward trims re-base so the new first logical index is 0.
    trimmed.indices.clear();
    const std::int64_t base = forward ? incoming[1].value : 0;
    for (SizeType i = 0; i < n; ++i) {
        if (i != dropped) {
            trimmed.indices.push_back(LogicalIndex{incoming[i].value - base});
        }
    }
    const std::set<LogicalIndex> valid(trimmed.indices.begin(),
                                       trimmed.indices.end());

    trimmed.bifurcations.clear();
    for (const auto bif : data.bifurcations) {
        if (bif.value == dropped) {
            continue;
        }
        const auto shifted = forward ? bif.value - 1 : bif.value;
        if (shifted < m) {
            trimmed.bifurcations.push_back(ArrayIndex{shifted});
        }
    }

    std::optional<EndpointSeed> min_seed;
    std::optional<EndpointSeed> max_seed;
    if (data.resume_state) {
        min_seed = remap_seed(data.resume_state->min_index_seed, base, valid);
        max_seed = remap_seed(data.resume_state->max_index_seed, base, valid);
    }

    if (m > 1 && (!min_seed || !max_seed)) {
        const auto boundary =
            forward ? trimmed.indices.front() : trimmed.indices.back();
        const auto tangent =
            boundary_tangent(data.points, trimmed.points, options.side);
        if (tangent) {
            EndpointSeed synthesized{
                .endpoint_index = boundary,
                .aug_state      = augmented_state(forward ? trimmed.points.front()
                                                          : trimmed.points.back()),
                .tangent        = *tangent,
                .step_size      = resolve_step_hint(data, options),
            };
            const auto [lo, hi] = std::ranges::minmax(trimmed.indices);
            if (!min_seed && lo == boundary) {
                min_seed = synthesized;
            }
            if (!max_seed && hi == boundary) {
                max_seed = std::move(synthesized);
            }
        }
    }

    if (min_seed || max_seed) {
        trimmed.resume_state = branch::ResumeState{
            .min_index_seed = std::move(min_seed),
            .max_index_seed = std::move(max_seed),
        };
    } else {
        trimmed.resume_state.reset();
    }

    const auto anchor = augmented_state(data.points[dropped]);
    if (!anchor.empty()) {
        trimmed.upoldp = std::vector<std::vector<double>>{anchor};
    }
    return trimmed;
}

} // namespace cobra::seeds
