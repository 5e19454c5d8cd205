#pragma once

#include <optional>
#include <span>

#include "cobra/branch/branch_type.hpp"
#include "cobra/branch/continuation_object.hpp"
#include "cobra/branch/point.hpp"
#include "cobra/engine/requests.hpp"

namespace cobra::orchestration {

// Imaginary part of the eigenvalue closest to the imaginary axis among
// those with a significant imaginary part. Falls back to 1.0.
[[nodiscard]] double
extract_hopf_omega(std::span<const branch::Eigenvalue> eigenvalues);

// cos(arg mu) of the first complex multiplier, 0 when every multiplier is
// real.
[[nodiscard]] double
ns_initial_k(std::span<const branch::Eigenvalue> multipliers);

// Period stored as the last entry of a limit-cycle state, if finite and
// positive.
[[nodiscard]] std::optional<double>
cycle_period(std::span<const double> state);

// Collocation mesh recorded on a limit-cycle or cycle-curve branch, clamped
// to ntst >= 2 and ncol >= 1. Default mesh when none is recorded.
[[nodiscard]] branch::Mesh cycle_mesh(const branch::ContinuationBranchData& data);

struct HomoclinicFixedValues {
    double time{};
    double eps0{};
    double eps1{};
    bool from_context{};
};

// T/eps0/eps1 retained on a homoclinic branch, or 1.0/0.01/0.1 when the
// branch carries no usable context.
[[nodiscard]] HomoclinicFixedValues
homoclinic_fixed_values(const branch::ContinuationBranchData& data);

// Replaces the branch type with the fallback unless the engine already
// reported a HomoclinicCurve.
void ensure_homoclinic_branch_type(branch::ContinuationBranchData& data,
                                   const branch::HomoclinicCurve& fallback);

[[nodiscard]] branch::BranchKind to_branch_kind(engine::CycleCurveKind kind);

} // namespace cobra::orchestration
