#include "cobra/branch/summary.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <sstream>

namespace cobra::branch {

namespace {

std::string non_finite_label(double value) {
    if (std::isnan(value)) {
        return "NaN";
    }
    return value > 0 ? "Infinity" : "-Infinity";
}

} // namespace

std::string format_number(double value) {
    if (!std::isfinite(value)) {
        return non_finite_label(value);
    }
    const double abs_val = std::abs(value);
    if ((abs_val != 0.0 && abs_val < 1e-3) || abs_val >= 1e4) {
        return std::format("{:.4e}", value);
    }
    return std::format("{:.3f}", value);
}

std::string format_number_safe(std::optional<double> value) {
    if (!value || !std::isfinite(*value)) {
        return "NaN";
    }
    return format_number(*value);
}

std::string format_array(std::span<const double> values) {
    std::string out = "[";
    for (SizeType i = 0; i < values.size(); ++i) {
        if (i > 0) {
            out += ", ";
        }
        out += format_number(values[i]);
    }
    out += "]";
    return out;
}

std::string summarize_eigenvalues(const ContinuationPoint& point,
                                  BranchKind kind) {
    const std::string_view label =
        is_cycle_kind(kind) ? "Multipliers" : "Eigenvalues";
    if (point.eigenvalues.empty()) {
        return std::format("{}: []", label);
    }
    constexpr SizeType kShown = 3;
    std::string out           = std::format("{}: ", label);
    const auto shown = std::min(kShown, point.eigenvalues.size());
    for (SizeType i = 0; i < shown; ++i) {
        const auto& ev = point.eigenvalues[i];
        if (i > 0) {
            out += ", ";
        }
        out += std::format("{}+{}i", format_number_safe(ev.real()),
                           format_number_safe(ev.imag()));
    }
    if (point.eigenvalues.size() > kShown) {
        out += " …";
    }
    return out;
}

BranchSummary summarize_branch(const ContinuationBranchData& data) {
    BranchSummary summary;
    summary.point_count       = data.size();
    summary.bifurcation_count = data.bifurcations.size();
    if (data.empty()) {
        return summary;
    }
    const auto indices = resolved_indices(data);
    const auto [min_it, max_it] =
        std::minmax_element(indices.begin(), indices.end());
    summary.min_index = *min_it;
    summary.max_index = *max_it;

    for (const auto& point : data.points) {
        if (!std::isfinite(point.param_value)) {
            continue;
        }
        summary.param_min =
            std::min(summary.param_min.value_or(point.param_value),
                     point.param_value);
        summary.param_max =
            std::max(summary.param_max.value_or(point.param_value),
                     point.param_value);
    }
    if (data.resume_state) {
        const auto& seeds          = *data.resume_state;
        summary.resumable_forward  = seeds.max_index_seed.has_value();
        summary.resumable_backward = seeds.min_index_seed.has_value();
    }
    return summary;
}

std::string describe_branch(const ContinuationObject& object) {
    const auto summary = summarize_branch(object.data);
    std::ostringstream os;
    os << std::format("Branch {} ({}) of {} in {}\n", object.name,
                      to_string(object.branch_kind), object.parent_object,
                      object.system_name);
    os << std::format("  Parameter: {}\n", object.parameter_name);
    os << std::format("  Points: {}", summary.point_count);
    if (summary.min_index && summary.max_index) {
        os << std::format(" (indices {}..{})", summary.min_index->value,
                          summary.max_index->value);
    }
    os << '\n';
    if (summary.param_min && summary.param_max) {
        os << std::format("  Range: [{}, {}]\n",
                          format_number(*summary.param_min),
                          format_number(*summary.param_max));
    }
    os << std::format("  Bifurcations: {}\n", summary.bifurcation_count);
    const auto indices = resolved_indices(object.data);
    for (const auto& bif : object.data.bifurcations) {
        if (bif.value >= object.data.size()) {
            continue;
        }
        const auto& point = object.data.points[bif.value];
        os << std::format("    {} at {}\n",
                          format_bifurcation_label(indices[bif.value].value,
                                                   point.stability),
                          format_number(point.param_value));
    }
    return os.str();
}

} // namespace cobra::branch
