#pragma once

#include <span>
#include <string>
#include <vector>

#include "cobra/branch/point.hpp"
#include "cobra/common/types.hpp"

namespace cobra::branch {

// Collocation profile of a limit-cycle state laid out as
// [x(t_0), x(t_1), ..., x(t_N), period] with N = ntst * ncol.
struct CycleProfile {
    std::vector<std::vector<double>> points;
    double period{};
};

struct ComponentRange {
    double min{};
    double max{};
    double range{};
};

struct LimitCycleMetrics {
    double period{};
    std::vector<ComponentRange> ranges;
    std::vector<double> means;
    std::vector<double> rms_amplitudes;
};

// Throws DetailedException when the state is shorter than the mesh
// requires.
[[nodiscard]] CycleProfile extract_lc_profile(std::span<const double> state,
                                              SizeType dim,
                                              SizeType ntst,
                                              SizeType ncol);
[[nodiscard]] LimitCycleMetrics compute_lc_metrics(const CycleProfile& profile);

// "stable", "unstable (torus)", "unstable (<n>D)" or "unknown". The trivial
// multiplier at 1 is ignored.
[[nodiscard]] std::string
interpret_lc_stability(std::span<const Eigenvalue> multipliers);

} // namespace cobra::branch
