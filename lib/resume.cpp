#include "cobra/seeds/resume.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <ranges>

#include <Eigen/Dense>

namespace cobra::seeds {

namespace {

bool all_finite(std::span<const double> values) {
    return std::ranges::all_of(values,
                               [](double v) { return std::isfinite(v); });
}

std::int64_t step_magnitude(std::int64_t raw) {
    return std::max<std::int64_t>(1, raw < 0 ? -raw : raw);
}

} // namespace

std::vector<double> augmented_state(const branch::ContinuationPoint& point) {
    if (!std::isfinite(point.param_value) || point.state.empty() ||
        !all_finite(point.state)) {
        return {};
    }
    std::vector<double> aug;
    aug.reserve(point.state.size() + 1);
    aug.push_back(point.param_value);
    aug.insert(aug.end(), point.state.begin(), point.state.end());
    return aug;
}

std::optional<std::vector<double>> normalized(std::span<const double> v) {
    if (v.empty()) {
        return std::nullopt;
    }
    const Eigen::Map<const Eigen::VectorXd> vec(
        v.data(), static_cast<Eigen::Index>(v.size()));
    const double norm = vec.norm();
    if (!std::isfinite(norm) || norm <= kDegenerateNorm) {
        return std::nullopt;
    }
    const Eigen::VectorXd unit = vec / norm;
    return std::vector<double>(unit.data(), unit.data() + unit.size());
}

std::optional<std::string>
validate_resume_seed(const branch::EndpointSeed& seed,
                     LogicalIndex endpoint,
                     SizeType expected_aug_len) {
    if (seed.endpoint_index != endpoint) {
        return std::format("seed anchors index {}, endpoint is {}",
                           seed.endpoint_index.value, endpoint.value);
    }
    if (seed.aug_state.size() != expected_aug_len ||
        seed.tangent.size() != expected_aug_len) {
        return std::format("seed dimension {}/{} does not match {}",
                           seed.aug_state.size(), seed.tangent.size(),
                           expected_aug_len);
    }
    if (!all_finite(seed.aug_state) || !all_finite(seed.tangent)) {
        return std::string("seed contains non-finite values");
    }
    if (!std::isfinite(seed.step_size) || seed.step_size <= 0.0) {
        return std::format("invalid seed step size {}", seed.step_size);
    }
    if (!normalized(seed.tangent)) {
        return std::string("seed tangent is degenerate");
    }
    return std::nullopt;
}

std::optional<branch::EndpointSeed>
select_resume_seed(const branch::ContinuationBranchData& data,
                   Direction direction,
                   LogicalIndex endpoint,
                   SizeType expected_aug_len) {
    if (!data.resume_state) {
        return std::nullopt;
    }
    const auto& seed = direction == Direction::kForward
                           ? data.resume_state->max_index_seed
                           : data.resume_state->min_index_seed;
    if (!seed || validate_resume_seed(*seed, endpoint, expected_aug_len)) {
        return std::nullopt;
    }
    return seed;
}

branch::ContinuationBranchData
merge_homoclinic_extension(const branch::ContinuationBranchData& source,
                           const branch::ContinuationBranchData& extension,
                           LogicalIndex endpoint,
                           Direction direction) {
    const std::int64_t sign = direction == Direction::kForward ? 1 : -1;
    const auto origin_count = source.size();
    const auto extension_indices = branch::resolved_indices(extension);

    branch::ContinuationBranchData merged = source;
    merged.indices = branch::resolved_indices(source);
    for (SizeType i = 1; i < extension.size(); ++i) {
        merged.points.push_back(extension.points[i]);
        const auto step = step_magnitude(extension_indices[i].value);
        merged.indices.push_back(LogicalIndex{endpoint.value + sign * step});
    }

    for (const auto bif : extension.bifurcations) {
        if (bif.value > 0) {
            merged.bifurcations.push_back(
                ArrayIndex{origin_count + bif.value - 1});
        }
    }
    std::erase_if(merged.bifurcations, [&](ArrayIndex idx) {
        return idx.value >= merged.size();
    });
    std::ranges::sort(merged.bifurcations);
    const auto [first, last] = std::ranges::unique(merged.bifurcations);
    merged.bifurcations.erase(first, last);

    if (extension.branch_type) {
        merged.branch_type = extension.branch_type;
    }
    if (extension.upoldp) {
        merged.upoldp = extension.upoldp;
    }
    if (extension.homoc_context) {
        merged.homoc_context = extension.homoc_context;
    }

    auto resume = source.resume_state.value_or(branch::ResumeState{});
    auto& slot  = direction == Direction::kForward ? resume.max_index_seed
                                                   : resume.min_index_seed;
    slot.reset();
    if (extension.resume_state) {
        const auto& ext_seed = direction == Direction::kForward
                                   ? extension.resume_state->max_index_seed
                                   : extension.resume_state->min_index_seed;
        if (ext_seed) {
            const auto raw = ext_seed->endpoint_index.value;
            auto mapped    = *ext_seed;
            mapped.endpoint_index =
                raw == 0 ? endpoint
                         : LogicalIndex{endpoint.value +
                                        sign * step_magnitude(raw)};
            if (std::ranges::find(merged.indices, mapped.endpoint_index) !=
                merged.indices.end()) {
                slot = std::move(mapped);
            }
        }
    }
    merged.resume_state =
        resume.empty() ? std::nullopt : std::make_optional(std::move(resume));
    branch::drop_dangling_seeds(merged);
    return merged;
}

} // namespace cobra::seeds
