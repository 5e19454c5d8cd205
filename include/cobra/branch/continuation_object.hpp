#pragma once

#include <optional>
#include <string>
#include <vector>

#include "cobra/branch/branch_data.hpp"
#include "cobra/branch/continuation_kind.hpp"
#include "cobra/config/settings.hpp"
#include "cobra/params/subsystem.hpp"

namespace cobra::branch {

// A named, persisted branch together with the configuration it was
// computed under.
struct ContinuationObject {
    std::string name;
    std::string system_name;
    // Display label; "p1, p2" for two-parameter curves.
    std::string parameter_name;
    std::string parent_object;
    std::string start_object;
    BranchKind branch_kind{BranchKind::kEquilibrium};
    ContinuationBranchData data;
    config::ContinuationSettings settings;
    std::vector<double> params;
    std::optional<SizeType> map_iterations;
    std::string timestamp;
    std::optional<params::SubsystemSnapshot> subsystem;
    std::optional<params::ParameterRef> parameter_ref;
    std::optional<params::ParameterRef> parameter2_ref;
};

[[nodiscard]] std::string current_timestamp();

} // namespace cobra::branch
