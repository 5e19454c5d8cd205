#include "cobra/config/settings.hpp"
#include "cobra/config/system.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <format>
#include <limits>
#include <set>

#include "cobra/common/naming.hpp"
#include "cobra/exceptions.hpp"

namespace cobra::config {

namespace {

constexpr double kMinStepFloor  = 1e-9;
constexpr double kMinMinStep    = 1e-12;
constexpr double kEpsilon       = std::numeric_limits<double>::epsilon();

double floor_or_default(double value, double floor, double fallback) {
    if (!std::isfinite(value)) {
        return std::max(fallback, floor);
    }
    return std::max(value, floor);
}

bool is_blank(const std::string& text) {
    return std::ranges::all_of(text, [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

std::string join(const std::vector<std::string>& items) {
    std::string result;
    for (const auto& item : items) {
        if (!result.empty()) {
            result += ", ";
        }
        result += item;
    }
    return result;
}

std::vector<std::string> duplicates(const std::vector<std::string>& names) {
    std::set<std::string> seen;
    std::set<std::string> dup;
    for (const auto& name : names) {
        if (!seen.insert(name).second) {
            dup.insert(name);
        }
    }
    return {dup.begin(), dup.end()};
}

void validate_identifiers(const std::vector<std::string>& names,
                          std::string_view label,
                          std::vector<std::string>& errors) {
    std::vector<std::string> invalid;
    for (const auto& name : names) {
        if (!is_identifier(name)) {
            invalid.push_back(name);
        }
    }
    if (!invalid.empty()) {
        errors.push_back(
            std::format("Invalid {} names: {}.", label, join(invalid)));
        return;
    }
    const auto dup = duplicates(names);
    if (!dup.empty()) {
        errors.push_back(
            std::format("Duplicate {} names: {}.", label, join(dup)));
    }
}

} // namespace

// --- SystemConfig ---
std::optional<SizeType>
SystemConfig::param_index(std::string_view param_name) const {
    const auto it = std::ranges::find(param_names, param_name);
    if (it == param_names.end()) {
        return std::nullopt;
    }
    return static_cast<SizeType>(it - param_names.begin());
}

std::string SystemValidation::get_summary() const {
    if (errors.empty()) {
        return "System settings are valid.";
    }
    return std::format("System settings are invalid: {}", join(errors));
}

SystemValidation validate_system(const SystemConfig& system) {
    SystemValidation result;
    if (auto error = name_error(system.name)) {
        result.errors.push_back(std::format("System name: {}", *error));
    }

    if (system.var_names.empty()) {
        result.errors.emplace_back("At least one variable is required.");
    } else if (std::ranges::any_of(system.var_names, is_blank)) {
        result.errors.emplace_back("Variable names cannot be empty.");
    } else {
        validate_identifiers(system.var_names, "variable", result.errors);
    }

    if (std::ranges::any_of(system.param_names, is_blank)) {
        result.errors.emplace_back("Parameter names cannot be empty.");
    } else {
        validate_identifiers(system.param_names, "parameter", result.errors);
    }

    for (SizeType i = 0; i < system.var_names.size(); ++i) {
        const bool missing =
            i >= system.equations.size() || is_blank(system.equations[i]);
        if (missing) {
            result.errors.push_back(
                std::format("Equation required for {}.", system.var_names[i]));
        }
    }

    if (system.param_names.size() != system.params.size()) {
        result.errors.push_back(std::format(
            "Parameter count mismatch: {} names, {} values.",
            system.param_names.size(), system.params.size()));
    } else if (!std::ranges::all_of(system.params,
                                    [](double v) { return std::isfinite(v); })) {
        result.errors.emplace_back("Parameter values must be numeric.");
    }

    if (system.type == SystemType::kMap && system.solver != "discrete") {
        result.errors.emplace_back(
            "Map systems must use the discrete solver.");
    }
    if (system.type == SystemType::kFlow && system.solver != "rk4" &&
        system.solver != "tsit5") {
        result.errors.emplace_back("Flow systems must use rk4 or tsit5.");
    }
    if (system.param_names.empty()) {
        result.warnings.emplace_back(
            "System has no parameters; continuation is unavailable.");
    }
    return result;
}

void require_valid_system(const SystemConfig& system) {
    const auto validation = validate_system(system);
    if (!validation.valid()) {
        throw ValidationError(validation.get_summary());
    }
}

// --- ContinuationSettings ---
ContinuationSettings ContinuationSettings::sanitized() const {
    const ContinuationSettings defaults{};
    ContinuationSettings out;
    out.step_size =
        floor_or_default(step_size, kMinStepFloor, defaults.step_size);
    out.min_step_size =
        floor_or_default(min_step_size, kMinMinStep, defaults.min_step_size);
    out.max_step_size =
        floor_or_default(max_step_size, kMinStepFloor, defaults.max_step_size);
    out.max_steps       = std::max<SizeType>(max_steps, 1);
    out.corrector_steps = std::max<SizeType>(corrector_steps, 1);
    out.corrector_tolerance = floor_or_default(corrector_tolerance, kEpsilon,
                                               defaults.corrector_tolerance);
    out.step_tolerance =
        floor_or_default(step_tolerance, kEpsilon, defaults.step_tolerance);
    return out;
}

void ContinuationSettings::validate() const {
    const auto positive = [](double v) { return std::isfinite(v) && v > 0.0; };
    require(positive(step_size), "Step size must be a positive number.");
    require(positive(min_step_size),
            "Minimum step size must be a positive number.");
    require(positive(max_step_size),
            "Maximum step size must be a positive number.");
    require(min_step_size <= max_step_size,
            "Minimum step size must not exceed the maximum step size.");
    require(max_steps >= 1, "Max steps must be at least 1.");
    require(corrector_steps >= 1, "Corrector steps must be at least 1.");
    require(positive(corrector_tolerance),
            "Corrector tolerance must be a positive number.");
    require(positive(step_tolerance),
            "Step tolerance must be a positive number.");
}

ContinuationSettings default_settings(branch::BranchKind kind) {
    using branch::BranchKind;
    ContinuationSettings settings;
    switch (kind) {
    case BranchKind::kEquilibrium:
        settings.max_steps           = 100;
        settings.corrector_steps     = 4;
        settings.corrector_tolerance = 1e-6;
        settings.step_tolerance      = 1e-6;
        break;
    case BranchKind::kLimitCycle:
        settings.max_steps           = 50;
        settings.corrector_steps     = 10;
        settings.corrector_tolerance = 1e-6;
        settings.step_tolerance      = 1e-6;
        break;
    case BranchKind::kHomoclinicCurve:
    case BranchKind::kHomotopySaddleCurve:
        break;
    case BranchKind::kFoldCurve:
    case BranchKind::kHopfCurve:
    case BranchKind::kLPCCurve:
    case BranchKind::kPDCurve:
    case BranchKind::kNSCurve:
    case BranchKind::kIsochroneCurve:
        settings.corrector_steps     = 10;
        settings.corrector_tolerance = 1e-8;
        settings.step_tolerance      = 1e-8;
        break;
    }
    return settings;
}

} // namespace cobra::config
