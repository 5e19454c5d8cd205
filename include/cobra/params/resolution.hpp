#pragma once

#include <optional>
#include <span>
#include <string>
#include <vector>

#include "cobra/branch/continuation_object.hpp"
#include "cobra/config/system.hpp"
#include "cobra/storage/object_store.hpp"

namespace cobra::params {

// Per-point values of the continuation parameter(s).
struct PointOverrides {
    std::string param_name;
    double param_value{};
    std::optional<std::string> param2_name;
    std::optional<double> param2_value;
};

// Parameter vector a branch runs under: the branch's own params, then the
// parent object's custom or solved parameters, then the system defaults.
// Only vectors matching the system's parameter count qualify. Never throws;
// store may be null.
[[nodiscard]] std::vector<double>
get_branch_params(const config::SystemConfig& system,
                  const branch::ContinuationObject& branch,
                  const storage::ObjectStore* store);

// Writes the override values at the indices of their parameter names.
// Unknown names leave params untouched.
void apply_point_overrides(std::vector<double>& params,
                           std::span<const std::string> param_names,
                           const PointOverrides& overrides);

// Names the branch's point values refer to: the two curve parameters for
// two-parameter branches, otherwise the branch parameter.
[[nodiscard]] PointOverrides
point_overrides(const branch::ContinuationObject& branch,
                const branch::ContinuationPoint& point);

// get_branch_params with the point's own parameter values written in.
[[nodiscard]] std::vector<double>
resolve_point_params(const config::SystemConfig& system,
                     const branch::ContinuationObject& branch,
                     const branch::ContinuationPoint& point,
                     const storage::ObjectStore* store);

} // namespace cobra::params
