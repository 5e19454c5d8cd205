#include "cobra/params/resolution.hpp"

#include <algorithm>
#include <exception>

#include <spdlog/spdlog.h>

namespace cobra::params {

namespace {

bool matches(const std::optional<std::vector<double>>& values,
             SizeType expected) {
    return values && values->size() == expected;
}

void write_value(std::vector<double>& params,
                 std::span<const std::string> param_names,
                 std::string_view name,
                 double value) {
    const auto it = std::ranges::find(param_names, name);
    if (it == param_names.end()) {
        return;
    }
    const auto index = static_cast<SizeType>(it - param_names.begin());
    if (index < params.size()) {
        params[index] = value;
    }
}

} // namespace

std::vector<double> get_branch_params(const config::SystemConfig& system,
                                      const branch::ContinuationObject& branch,
                                      const storage::ObjectStore* store) {
    const auto expected = system.params.size();
    if (branch.params.size() == expected) {
        return branch.params;
    }

    if (store != nullptr && !branch.parent_object.empty()) {
        try {
            const auto parent =
                store->load_object(system.name, branch.parent_object);
            if (matches(parent.custom_parameters, expected)) {
                return *parent.custom_parameters;
            }
            if (matches(parent.parameters, expected)) {
                return *parent.parameters;
            }
        } catch (const std::exception& e) {
            spdlog::debug("Parent object '{}' unavailable for branch '{}': {}",
                          branch.parent_object, branch.name, e.what());
        }
    }
    return system.params;
}

void apply_point_overrides(std::vector<double>& params,
                           std::span<const std::string> param_names,
                           const PointOverrides& overrides) {
    write_value(params, param_names, overrides.param_name,
                overrides.param_value);
    if (overrides.param2_name && overrides.param2_value) {
        write_value(params, param_names, *overrides.param2_name,
                    *overrides.param2_value);
    }
}

PointOverrides point_overrides(const branch::ContinuationObject& branch,
                               const branch::ContinuationPoint& point) {
    PointOverrides overrides{.param_name  = branch.parameter_name,
                             .param_value = point.param_value};
    if (branch.data.branch_type) {
        const auto p1 = branch::param1_name(*branch.data.branch_type);
        const auto p2 = branch::param2_name(*branch.data.branch_type);
        if (p1 && p2) {
            overrides.param_name   = *p1;
            overrides.param2_name  = *p2;
            overrides.param2_value = point.param2_value;
        }
    }
    return overrides;
}

std::vector<double>
resolve_point_params(const config::SystemConfig& system,
                     const branch::ContinuationObject& branch,
                     const branch::ContinuationPoint& point,
                     const storage::ObjectStore* store) {
    auto params = get_branch_params(system, branch, store);
    apply_point_overrides(params, system.param_names,
                          point_overrides(branch, point));
    return params;
}

} // namespace cobra::params
