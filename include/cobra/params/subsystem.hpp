#pragma once

#include <map>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "cobra/common/types.hpp"
#include "cobra/config/system.hpp"

namespace cobra::params {

inline constexpr std::string_view kFrozenVariableLabelPrefix = "var:";
inline constexpr std::string_view kFrozenParameterPrefix     = "fv__";

// State variables pinned to fixed values. A frozen variable is removed from
// the integrated system and reappears as a generated parameter.
struct FrozenVariables {
    std::map<std::string, double> values_by_var;
};

struct NativeParam {
    std::string name;

    bool operator==(const NativeParam&) const = default;
};

struct FrozenVar {
    std::string variable_name;

    bool operator==(const FrozenVar&) const = default;
};

// A continuation parameter: either a declared system parameter or a frozen
// state variable.
using ParameterRef = std::variant<NativeParam, FrozenVar>;

struct SubsystemSnapshot {
    std::vector<std::string> base_var_names;
    std::vector<std::string> base_param_names;
    std::vector<std::string> free_variable_names;
    std::vector<SizeType> free_variable_indices;
    std::map<std::string, double> frozen_values_by_var;
    std::map<std::string, std::string> frozen_param_names_by_var;
    std::string hash;

    [[nodiscard]] bool is_frozen(std::string_view var_name) const;
    [[nodiscard]] bool has_frozen_variables() const noexcept {
        return !frozen_values_by_var.empty();
    }
    bool operator==(const SubsystemSnapshot&) const = default;
};

struct SnapshotOptions {
    std::optional<SizeType> max_free_variables;
    bool require_at_least_one_free{true};
};

struct ParameterOption {
    ParameterRef ref;
    std::string label;
};

// Overrides applied when a reduced state is shown in full coordinates and
// the continuation parameter itself is a frozen variable.
struct FrozenStateOverrides {
    std::optional<ParameterRef> parameter_ref;
    std::optional<double> param_value;
    std::optional<ParameterRef> parameter2_ref;
    std::optional<double> param2_value;
};

// Drops unknown variables and non-finite values (replaced by 0).
[[nodiscard]] FrozenVariables
normalize_frozen_variables(const config::SystemConfig& system,
                           const FrozenVariables& frozen);

[[nodiscard]] SubsystemSnapshot
build_subsystem_snapshot(const config::SystemConfig& system,
                         const FrozenVariables& frozen,
                         const SnapshotOptions& options = {});

[[nodiscard]] bool is_snapshot_compatible(const config::SystemConfig& system,
                                          const SubsystemSnapshot& snapshot);

// The preferred snapshot if it still matches the system, otherwise a fresh
// one built from the fallback frozen configuration.
[[nodiscard]] SubsystemSnapshot
resolve_subsystem_snapshot(const config::SystemConfig& system,
                           const std::optional<SubsystemSnapshot>& preferred,
                           const FrozenVariables& fallback,
                           const SnapshotOptions& options = {});

[[nodiscard]] config::SystemConfig
build_reduced_run_config(const config::SystemConfig& system,
                         const SubsystemSnapshot& snapshot,
                         std::span<const double> parameter_values = {});

[[nodiscard]] std::vector<double>
project_state_to_reduced(const SubsystemSnapshot& snapshot,
                         std::span<const double> full_state);

[[nodiscard]] std::vector<double>
embed_reduced_state(const SubsystemSnapshot& snapshot,
                    std::span<const double> reduced_state,
                    const FrozenStateOverrides& overrides = {});

// Full-dimension states pass through; reduced states are embedded; anything
// else is returned unchanged.
[[nodiscard]] std::vector<double>
state_to_display(const SubsystemSnapshot& snapshot,
                 std::span<const double> state,
                 const FrozenStateOverrides& overrides = {});

[[nodiscard]] std::string format_parameter_ref_label(const ParameterRef& ref);
[[nodiscard]] ParameterRef
parse_parameter_ref_label(const config::SystemConfig& system,
                          const SubsystemSnapshot& snapshot,
                          std::string_view label);
// Name of the parameter the engine sees for this reference.
[[nodiscard]] std::string
resolve_runtime_parameter_name(const SubsystemSnapshot& snapshot,
                               const ParameterRef& ref);
[[nodiscard]] std::vector<ParameterOption>
continuation_parameter_options(const config::SystemConfig& system,
                               const SubsystemSnapshot& snapshot);

} // namespace cobra::params
