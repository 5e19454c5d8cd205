#include "cobra/branch/metrics.hpp"

#include <cmath>
#include <format>

#include <Eigen/Dense>

#include "cobra/exceptions.hpp"

namespace cobra::branch {

namespace {

using RowMatrix =
    Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;

constexpr double kTrivialMultiplierTol = 0.01;
constexpr double kUnitCircleTol        = 1e-6;

} // namespace

CycleProfile extract_lc_profile(std::span<const double> state,
                                SizeType dim,
                                SizeType ntst,
                                SizeType ncol) {
    error_check::check_greater(dim, 0U, "Cycle dimension must be positive");
    error_check::check_greater(ntst * ncol, 0U, "Cycle mesh must be non-empty");
    const SizeType n_points = (ntst * ncol) + 1;
    error_check::check_greater_equal(state.size(), (n_points * dim) + 1,
                                     "Cycle state is shorter than its mesh");

    CycleProfile profile;
    profile.period = state.back();
    profile.points.reserve(n_points);
    for (SizeType i = 0; i < n_points; ++i) {
        const auto row = state.subspan(i * dim, dim);
        profile.points.emplace_back(row.begin(), row.end());
    }
    return profile;
}

LimitCycleMetrics compute_lc_metrics(const CycleProfile& profile) {
    LimitCycleMetrics metrics;
    metrics.period = profile.period;
    if (profile.points.empty() || profile.points.front().empty()) {
        return metrics;
    }
    const auto n_rows = static_cast<Eigen::Index>(profile.points.size());
    const auto n_cols = static_cast<Eigen::Index>(profile.points.front().size());
    RowMatrix samples(n_rows, n_cols);
    for (Eigen::Index i = 0; i < n_rows; ++i) {
        const auto& row = profile.points[static_cast<SizeType>(i)];
        error_check::check_equal(row.size(), static_cast<SizeType>(n_cols),
                                 "Ragged cycle profile");
        samples.row(i) = Eigen::Map<const Eigen::RowVectorXd>(row.data(), n_cols);
    }

    const Eigen::RowVectorXd mins  = samples.colwise().minCoeff();
    const Eigen::RowVectorXd maxs  = samples.colwise().maxCoeff();
    const Eigen::RowVectorXd means = samples.colwise().mean();
    const RowMatrix centered       = samples.rowwise() - means;
    const Eigen::RowVectorXd rms =
        (centered.array().square().colwise().sum() / static_cast<double>(n_rows))
            .sqrt()
            .matrix();

    for (Eigen::Index d = 0; d < n_cols; ++d) {
        metrics.ranges.push_back(
            {.min = mins(d), .max = maxs(d), .range = maxs(d) - mins(d)});
        metrics.means.push_back(means(d));
        metrics.rms_amplitudes.push_back(rms(d));
    }
    return metrics;
}

std::string interpret_lc_stability(std::span<const Eigenvalue> multipliers) {
    if (multipliers.empty()) {
        return "unknown";
    }
    SizeType unstable_count = 0;
    bool has_complex_pair   = false;
    for (const auto& mu : multipliers) {
        const double magnitude = std::abs(mu);
        if (std::abs(magnitude - 1.0) < kTrivialMultiplierTol &&
            std::abs(mu.imag()) < kTrivialMultiplierTol) {
            continue;
        }
        if (magnitude > 1.0 + kUnitCircleTol) {
            ++unstable_count;
            if (std::abs(mu.imag()) > kUnitCircleTol) {
                has_complex_pair = true;
            }
        }
    }
    if (unstable_count == 0) {
        return "stable";
    }
    if (has_complex_pair) {
        return "unstable (torus)";
    }
    return std::format("unstable ({}D)", unstable_count);
}

} // namespace cobra::branch
