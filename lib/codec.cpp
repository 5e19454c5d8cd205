#include "cobra/wire/codec.hpp"

#include <algorithm>
#include <charconv>
#include <string_view>
#include <system_error>

#include "cobra/common/types.hpp"

namespace cobra::wire {

namespace {

double parse_number(std::string_view text) {
    constexpr std::string_view kSpace = " \t\n\r\f\v";
    const auto first                  = text.find_first_not_of(kSpace);
    if (first == std::string_view::npos) {
        return 0.0;
    }
    text = text.substr(first, text.find_last_not_of(kSpace) - first + 1);
    if (text.starts_with('+')) {
        text.remove_prefix(1);
    }
    double value{};
    const auto* end      = text.data() + text.size();
    const auto [ptr, ec] = std::from_chars(text.data(), end, value);
    if (ec != std::errc{} || ptr != end) {
        return 0.0;
    }
    return value;
}

std::vector<std::int64_t> raw_positions(std::span<const ArrayIndex> positions) {
    std::vector<std::int64_t> raw;
    raw.reserve(positions.size());
    for (const auto pos : positions) {
        raw.push_back(static_cast<std::int64_t>(pos.value));
    }
    return raw;
}

std::vector<ArrayIndex> in_range_positions(std::span<const std::int64_t> raw,
                                           SizeType count) {
    std::vector<ArrayIndex> positions;
    for (const auto value : raw) {
        if (value >= 0 && static_cast<SizeType>(value) < count) {
            positions.push_back(ArrayIndex{static_cast<SizeType>(value)});
        }
    }
    return positions;
}

std::vector<LogicalIndex>
indices_for(const std::optional<std::vector<std::int64_t>>& raw,
            SizeType count) {
    if (raw && raw->size() == count) {
        return branch::to_logical(*raw);
    }
    return branch::sequential_indices(count);
}

} // namespace

double coerce_scalar(const Scalar& value) {
    return std::visit(Overloaded{
                          [](std::monostate) { return 0.0; },
                          [](double v) { return v; },
                          [](const std::string& s) { return parse_number(s); },
                      },
                      value);
}

std::vector<branch::Eigenvalue>
normalize_eigenvalue_array(const std::optional<std::vector<RawEigenvalue>>& raw) {
    if (!raw) {
        return {};
    }
    std::vector<branch::Eigenvalue> normalized;
    normalized.reserve(raw->size());
    for (const auto& entry : *raw) {
        normalized.push_back(std::visit(
            Overloaded{
                [](std::monostate) { return branch::Eigenvalue{}; },
                [](const std::vector<Scalar>& tuple) {
                    const double re = !tuple.empty() ? coerce_scalar(tuple[0]) : 0.0;
                    const double im = tuple.size() > 1 ? coerce_scalar(tuple[1]) : 0.0;
                    return branch::Eigenvalue{re, im};
                },
                [](const StructuredEigenvalue& s) {
                    return branch::Eigenvalue{coerce_scalar(s.re),
                                              coerce_scalar(s.im)};
                },
            },
            entry));
    }
    return normalized;
}

std::vector<RawEigenvalue>
to_wire_eigenvalues(std::span<const branch::Eigenvalue> eigenvalues) {
    std::vector<RawEigenvalue> wire;
    wire.reserve(eigenvalues.size());
    for (const auto& ev : eigenvalues) {
        wire.emplace_back(std::vector<Scalar>{ev.real(), ev.imag()});
    }
    return wire;
}

BranchPayload serialize_branch_data(const branch::ContinuationBranchData& data) {
    BranchPayload payload;
    payload.points.reserve(data.size());
    for (const auto& pt : data.points) {
        payload.points.push_back(RawPoint{
            .state        = pt.state,
            .param_value  = pt.param_value,
            .param2_value = pt.param2_value,
            .stability    = std::string(branch::to_string(pt.stability)),
            .eigenvalues  = to_wire_eigenvalues(pt.eigenvalues),
            .auxiliary    = pt.auxiliary,
        });
    }
    payload.bifurcations  = raw_positions(data.bifurcations);
    payload.indices       = branch::logical_values(branch::resolved_indices(data));
    payload.branch_type   = data.branch_type;
    payload.resume_state  = data.resume_state;
    payload.upoldp        = data.upoldp;
    payload.homoc_context = data.homoc_context;
    return payload;
}

BranchPayload serialize_branch_data(const branch::ContinuationObject& object) {
    auto payload = serialize_branch_data(object.data);
    if (object.branch_kind != branch::BranchKind::kLimitCycle) {
        return payload;
    }
    branch::LimitCycle cycle;
    if (payload.branch_type) {
        if (const auto* stored =
                std::get_if<branch::LimitCycle>(&*payload.branch_type)) {
            cycle = *stored;
        }
    }
    if (cycle.ntst == 0) {
        cycle.ntst = branch::kDefaultLimitCycleMesh.ntst;
    }
    if (cycle.ncol == 0) {
        cycle.ncol = branch::kDefaultLimitCycleMesh.ncol;
    }
    payload.branch_type = cycle;
    return payload;
}

branch::ContinuationBranchData
normalize_branch_eigenvalues(const BranchPayload& payload) {
    branch::ContinuationBranchData data;
    data.points.reserve(payload.points.size());
    for (const auto& raw : payload.points) {
        data.points.push_back(branch::ContinuationPoint{
            .state        = raw.state,
            .param_value  = raw.param_value,
            .param2_value = raw.param2_value,
            .stability    = branch::parse_bifurcation_type(raw.stability),
            .eigenvalues  = normalize_eigenvalue_array(raw.eigenvalues),
            .auxiliary    = raw.auxiliary,
        });
    }
    data.indices       = indices_for(payload.indices, data.size());
    data.bifurcations  = in_range_positions(payload.bifurcations, data.size());
    data.branch_type   = payload.branch_type;
    data.resume_state  = payload.resume_state;
    data.upoldp        = payload.upoldp;
    data.homoc_context = payload.homoc_context;
    branch::drop_dangling_seeds(data);
    return data;
}

branch::ContinuationBranchData
curve_to_branch_data(const CurvePayload& payload,
                     const branch::BranchType& branch_type) {
    branch::ContinuationBranchData data;
    data.points.reserve(payload.points.size());
    for (const auto& raw : payload.points) {
        data.points.push_back(branch::ContinuationPoint{
            .state        = raw.state,
            .param_value  = raw.param1_value,
            .param2_value = raw.param2_value,
            .stability    = branch::parse_bifurcation_type(raw.codim2_type),
            .eigenvalues  = normalize_eigenvalue_array(raw.eigenvalues),
            .auxiliary    = raw.auxiliary,
        });
    }
    data.indices = indices_for(payload.indices, data.size());
    data.bifurcations =
        in_range_positions(payload.codim2_bifurcations, data.size());
    data.branch_type = branch_type;
    return data;
}

} // namespace cobra::wire
