#include "cobra/params/subsystem.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <format>
#include <regex>
#include <set>

#include "cobra/exceptions.hpp"

namespace cobra::params {

namespace {

std::string escape_regex(std::string_view value) {
    static constexpr std::string_view kSpecial = R"(.*+?^${}()|[]\)";
    std::string escaped;
    escaped.reserve(value.size());
    for (const char c : value) {
        if (kSpecial.find(c) != std::string_view::npos) {
            escaped.push_back('\\');
        }
        escaped.push_back(c);
    }
    return escaped;
}

std::string replace_identifier(const std::string& expr,
                               std::string_view identifier,
                               const std::string& replacement) {
    if (identifier.empty()) {
        return expr;
    }
    const std::regex pattern(std::format(R"(\b{}\b)", escape_regex(identifier)));
    return std::regex_replace(expr, pattern, replacement);
}

std::string make_frozen_param_name(std::string_view var_name,
                                   std::set<std::string>& occupied) {
    const auto base = std::format("{}{}", kFrozenParameterPrefix, var_name);
    if (occupied.insert(base).second) {
        return base;
    }
    SizeType suffix = 1;
    while (occupied.contains(std::format("{}_{}", base, suffix))) {
        ++suffix;
    }
    auto candidate = std::format("{}_{}", base, suffix);
    occupied.insert(candidate);
    return candidate;
}

// FNV-1a over a canonical text form of the snapshot.
std::string stable_hash(const SubsystemSnapshot& snapshot) {
    std::string canonical;
    const auto append_list = [&](const auto& items) {
        canonical += '[';
        for (const auto& item : items) {
            canonical += std::format("{};", item);
        }
        canonical += ']';
    };
    append_list(snapshot.base_var_names);
    append_list(snapshot.base_param_names);
    append_list(snapshot.free_variable_names);
    append_list(snapshot.free_variable_indices);
    for (const auto& [name, value] : snapshot.frozen_values_by_var) {
        canonical += std::format("{}={:.17g};", name, value);
    }
    for (const auto& [name, param] : snapshot.frozen_param_names_by_var) {
        canonical += std::format("{}->{};", name, param);
    }

    std::uint32_t hash = 2166136261U;
    for (const unsigned char c : canonical) {
        hash ^= c;
        hash *= 16777619U;
    }
    return std::format("ss:{:08x}", hash);
}

void ensure_snapshot_for_system(const config::SystemConfig& system,
                                const SubsystemSnapshot& snapshot) {
    if (snapshot.base_var_names != system.var_names) {
        throw ValidationError("Subsystem snapshot is incompatible with current "
                              "system variables.");
    }
    if (snapshot.base_param_names != system.param_names) {
        throw ValidationError("Subsystem snapshot is incompatible with current "
                              "system parameters.");
    }
}

void apply_frozen_override(const SubsystemSnapshot& snapshot,
                           std::vector<double>& values,
                           const std::optional<ParameterRef>& ref,
                           const std::optional<double>& value) {
    if (!ref || !value || !std::isfinite(*value)) {
        return;
    }
    const auto* frozen = std::get_if<FrozenVar>(&*ref);
    if (frozen == nullptr) {
        return;
    }
    const auto it =
        std::ranges::find(snapshot.base_var_names, frozen->variable_name);
    if (it == snapshot.base_var_names.end()) {
        return;
    }
    const auto index = static_cast<SizeType>(it - snapshot.base_var_names.begin());
    if (index < values.size()) {
        values[index] = *value;
    }
}

} // namespace

bool SubsystemSnapshot::is_frozen(std::string_view var_name) const {
    return frozen_values_by_var.contains(std::string(var_name));
}

FrozenVariables normalize_frozen_variables(const config::SystemConfig& system,
                                           const FrozenVariables& frozen) {
    FrozenVariables normalized;
    for (const auto& name : system.var_names) {
        const auto it = frozen.values_by_var.find(name);
        if (it == frozen.values_by_var.end()) {
            continue;
        }
        normalized.values_by_var[name] =
            std::isfinite(it->second) ? it->second : 0.0;
    }
    return normalized;
}

SubsystemSnapshot build_subsystem_snapshot(const config::SystemConfig& system,
                                           const FrozenVariables& frozen,
                                           const SnapshotOptions& options) {
    const auto normalized = normalize_frozen_variables(system, frozen);
    SubsystemSnapshot snapshot;
    snapshot.base_var_names       = system.var_names;
    snapshot.base_param_names     = system.param_names;
    snapshot.frozen_values_by_var = normalized.values_by_var;

    std::set<std::string> occupied(system.param_names.begin(),
                                   system.param_names.end());
    for (SizeType i = 0; i < system.var_names.size(); ++i) {
        const auto& var_name = system.var_names[i];
        if (normalized.values_by_var.contains(var_name)) {
            snapshot.frozen_param_names_by_var[var_name] =
                make_frozen_param_name(var_name, occupied);
            continue;
        }
        snapshot.free_variable_names.push_back(var_name);
        snapshot.free_variable_indices.push_back(i);
    }

    if (options.require_at_least_one_free &&
        snapshot.free_variable_names.empty()) {
        throw ValidationError("At least one free variable is required.");
    }
    if (options.max_free_variables &&
        snapshot.free_variable_names.size() > *options.max_free_variables) {
        throw ValidationError(std::format(
            "At most {} free variables are allowed.",
            *options.max_free_variables));
    }
    snapshot.hash = stable_hash(snapshot);
    return snapshot;
}

bool is_snapshot_compatible(const config::SystemConfig& system,
                            const SubsystemSnapshot& snapshot) {
    return snapshot.base_var_names == system.var_names &&
           snapshot.base_param_names == system.param_names;
}

SubsystemSnapshot
resolve_subsystem_snapshot(const config::SystemConfig& system,
                           const std::optional<SubsystemSnapshot>& preferred,
                           const FrozenVariables& fallback,
                           const SnapshotOptions& options) {
    if (preferred && is_snapshot_compatible(system, *preferred)) {
        return *preferred;
    }
    return build_subsystem_snapshot(system, fallback, options);
}

config::SystemConfig
build_reduced_run_config(const config::SystemConfig& system,
                         const SubsystemSnapshot& snapshot,
                         std::span<const double> parameter_values) {
    ensure_snapshot_for_system(system, snapshot);
    config::SystemConfig reduced = system;
    if (parameter_values.size() == system.params.size()) {
        reduced.params.assign(parameter_values.begin(), parameter_values.end());
    }

    for (const auto& var_name : system.var_names) {
        const auto value_it = snapshot.frozen_values_by_var.find(var_name);
        if (value_it == snapshot.frozen_values_by_var.end()) {
            continue;
        }
        const auto name_it = snapshot.frozen_param_names_by_var.find(var_name);
        if (name_it == snapshot.frozen_param_names_by_var.end()) {
            throw ValidationError(std::format(
                "Missing generated frozen parameter for variable \"{}\".",
                var_name));
        }
        reduced.param_names.push_back(name_it->second);
        reduced.params.push_back(value_it->second);
    }

    reduced.equations.clear();
    for (const auto base_index : snapshot.free_variable_indices) {
        std::string expr = base_index < system.equations.size()
                               ? system.equations[base_index]
                               : std::string{};
        for (const auto& [var_name, param_name] :
             snapshot.frozen_param_names_by_var) {
            expr = replace_identifier(expr, var_name, param_name);
        }
        reduced.equations.push_back(std::move(expr));
    }
    reduced.var_names = snapshot.free_variable_names;
    return reduced;
}

std::vector<double> project_state_to_reduced(const SubsystemSnapshot& snapshot,
                                             std::span<const double> full_state) {
    if (full_state.size() != snapshot.base_var_names.size()) {
        throw ValidationError(
            "State dimension mismatch while projecting to reduced subsystem.");
    }
    std::vector<double> reduced;
    reduced.reserve(snapshot.free_variable_indices.size());
    for (const auto index : snapshot.free_variable_indices) {
        reduced.push_back(full_state[index]);
    }
    return reduced;
}

std::vector<double> embed_reduced_state(const SubsystemSnapshot& snapshot,
                                        std::span<const double> reduced_state,
                                        const FrozenStateOverrides& overrides) {
    std::vector<double> full;
    full.reserve(snapshot.base_var_names.size());
    for (const auto& name : snapshot.base_var_names) {
        const auto it = snapshot.frozen_values_by_var.find(name);
        full.push_back(it != snapshot.frozen_values_by_var.end() ? it->second
                                                                 : 0.0);
    }
    for (SizeType i = 0; i < snapshot.free_variable_indices.size(); ++i) {
        const auto full_index = snapshot.free_variable_indices[i];
        if (full_index >= full.size() || i >= reduced_state.size()) {
            continue;
        }
        const double value = reduced_state[i];
        full[full_index]   = std::isfinite(value) ? value : 0.0;
    }
    apply_frozen_override(snapshot, full, overrides.parameter_ref,
                          overrides.param_value);
    apply_frozen_override(snapshot, full, overrides.parameter2_ref,
                          overrides.param2_value);
    return full;
}

std::vector<double> state_to_display(const SubsystemSnapshot& snapshot,
                                     std::span<const double> state,
                                     const FrozenStateOverrides& overrides) {
    if (state.size() == snapshot.base_var_names.size()) {
        return {state.begin(), state.end()};
    }
    if (state.size() == snapshot.free_variable_names.size()) {
        return embed_reduced_state(snapshot, state, overrides);
    }
    return {state.begin(), state.end()};
}

std::string format_parameter_ref_label(const ParameterRef& ref) {
    return std::visit(
        Overloaded{
            [](const NativeParam& p) { return p.name; },
            [](const FrozenVar& v) {
                return std::format("{}{}", kFrozenVariableLabelPrefix,
                                   v.variable_name);
            },
        },
        ref);
}

ParameterRef parse_parameter_ref_label(const config::SystemConfig& system,
                                       const SubsystemSnapshot& snapshot,
                                       std::string_view label) {
    if (label.starts_with(kFrozenVariableLabelPrefix)) {
        const auto variable = label.substr(kFrozenVariableLabelPrefix.size());
        if (variable.empty() || !snapshot.is_frozen(variable)) {
            throw ValidationError("Select a valid frozen variable.");
        }
        return FrozenVar{std::string(variable)};
    }
    if (!system.has_param(label)) {
        throw ValidationError("Select a valid continuation parameter.");
    }
    return NativeParam{std::string(label)};
}

std::string resolve_runtime_parameter_name(const SubsystemSnapshot& snapshot,
                                           const ParameterRef& ref) {
    if (const auto* native = std::get_if<NativeParam>(&ref)) {
        return native->name;
    }
    const auto& variable = std::get<FrozenVar>(ref).variable_name;
    const auto it        = snapshot.frozen_param_names_by_var.find(variable);
    if (it == snapshot.frozen_param_names_by_var.end()) {
        throw ValidationError(std::format(
            "Frozen variable \"{}\" is not available in this subsystem.",
            variable));
    }
    return it->second;
}

std::vector<ParameterOption>
continuation_parameter_options(const config::SystemConfig& system,
                               const SubsystemSnapshot& snapshot) {
    std::vector<ParameterOption> options;
    for (const auto& name : system.param_names) {
        options.push_back({.ref = NativeParam{name}, .label = name});
    }
    for (const auto& var_name : snapshot.base_var_names) {
        if (!snapshot.is_frozen(var_name)) {
            continue;
        }
        options.push_back(
            {.ref   = FrozenVar{var_name},
             .label = std::format("{}{}", kFrozenVariableLabelPrefix, var_name)});
    }
    return options;
}

} // namespace cobra::params
