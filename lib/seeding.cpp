#include "cobra/orchestration/seeding.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace cobra::orchestration {

namespace {

constexpr double kOmegaRelativeFloor = 1e-3;
constexpr double kComplexThreshold   = 1e-6;

constexpr HomoclinicFixedValues kFallbackFixedValues{
    .time = 1.0, .eps0 = 0.01, .eps1 = 0.1, .from_context = false};

} // namespace

double extract_hopf_omega(std::span<const branch::Eigenvalue> eigenvalues) {
    double max_imag = 0.0;
    for (const auto& ev : eigenvalues) {
        if (std::isfinite(ev.real()) && std::isfinite(ev.imag())) {
            max_imag = std::max(max_imag, std::abs(ev.imag()));
        }
    }
    if (max_imag <= 0.0) {
        return 1.0;
    }

    const double floor = kOmegaRelativeFloor * max_imag;
    double best_real   = std::numeric_limits<double>::infinity();
    double best_imag   = 0.0;
    for (const auto& ev : eigenvalues) {
        if (!std::isfinite(ev.real()) || !std::isfinite(ev.imag())) {
            continue;
        }
        const double abs_imag = std::abs(ev.imag());
        if (abs_imag < floor) {
            continue;
        }
        const double abs_real = std::abs(ev.real());
        if (abs_real < best_real ||
            (abs_real == best_real && abs_imag > best_imag)) {
            best_real = abs_real;
            best_imag = abs_imag;
        }
    }
    return best_imag > 0.0 ? best_imag : 1.0;
}

double ns_initial_k(std::span<const branch::Eigenvalue> multipliers) {
    const auto it = std::ranges::find_if(multipliers, [](const auto& mu) {
        return std::abs(mu.imag()) > kComplexThreshold;
    });
    if (it == multipliers.end()) {
        return 0.0;
    }
    return std::cos(std::arg(*it));
}

std::optional<double> cycle_period(std::span<const double> state) {
    if (state.empty()) {
        return std::nullopt;
    }
    const double period = state.back();
    if (!std::isfinite(period) || period <= 0.0) {
        return std::nullopt;
    }
    return period;
}

branch::Mesh cycle_mesh(const branch::ContinuationBranchData& data) {
    branch::Mesh result = branch::kDefaultLimitCycleMesh;
    if (data.branch_type) {
        if (const auto recorded = branch::mesh(*data.branch_type)) {
            result.ntst = recorded->ntst == 0 ? result.ntst : recorded->ntst;
            result.ncol = recorded->ncol == 0 ? result.ncol : recorded->ncol;
        }
    }
    result.ntst = std::max<SizeType>(result.ntst, 2);
    result.ncol = std::max<SizeType>(result.ncol, 1);
    return result;
}

HomoclinicFixedValues
homoclinic_fixed_values(const branch::ContinuationBranchData& data) {
    if (!data.homoc_context || !data.homoc_context->is_valid()) {
        return kFallbackFixedValues;
    }
    const auto& context = *data.homoc_context;
    return {.time         = context.fixed_time,
            .eps0         = context.fixed_eps0,
            .eps1         = context.fixed_eps1,
            .from_context = true};
}

void ensure_homoclinic_branch_type(branch::ContinuationBranchData& data,
                                   const branch::HomoclinicCurve& fallback) {
    if (data.branch_type &&
        std::holds_alternative<branch::HomoclinicCurve>(*data.branch_type)) {
        return;
    }
    data.branch_type = fallback;
}

branch::BranchKind to_branch_kind(engine::CycleCurveKind kind) {
    switch (kind) {
    case engine::CycleCurveKind::kLPC:
        return branch::BranchKind::kLPCCurve;
    case engine::CycleCurveKind::kPD:
        return branch::BranchKind::kPDCurve;
    case engine::CycleCurveKind::kNS:
        return branch::BranchKind::kNSCurve;
    case engine::CycleCurveKind::kIsochrone:
        return branch::BranchKind::kIsochroneCurve;
    }
    return branch::BranchKind::kLPCCurve;
}

} // namespace cobra::orchestration
