#include "cobra/orchestration/service.hpp"

#include <algorithm>
#include <cmath>
#include <format>
#include <stop_token>
#include <utility>

#include <spdlog/spdlog.h>

#include "cobra/common/naming.hpp"
#include "cobra/exceptions.hpp"
#include "cobra/orchestration/seeding.hpp"
#include "cobra/params/resolution.hpp"
#include "cobra/params/subsystem.hpp"
#include "cobra/progress.hpp"
#include "cobra/seeds/resume.hpp"
#include "cobra/seeds/trimming.hpp"
#include "cobra/wire/codec.hpp"

namespace cobra::orchestration {

namespace {

using branch::BifurcationType;
using branch::BranchKind;
using branch::ContinuationBranchData;
using branch::ContinuationObject;
using branch::ContinuationPoint;
using engine::HomoclinicTarget;

constexpr std::string_view kNoParameters =
    "System has no parameters to continue. Add at least one parameter first.";
constexpr std::string_view kNeedTwoParameters =
    "Two-parameter continuation requires at least 2 parameters. Add another "
    "parameter first.";
constexpr std::string_view kFlowOnlyCycles =
    "Limit cycle continuation is only available for flow (ODE) systems.";
constexpr std::string_view kFlowOnlyHomoclinic =
    "Homoclinic continuation is only available for flow systems.";
constexpr std::string_view kUndefinedParameter =
    "Continuation parameter is not defined in this system.";
constexpr std::string_view kNoFreeHomoclinicValue =
    "At least one of T, eps0, or eps1 must be free.";

// Engine-facing system and parameter name for a run. Branches computed on a
// frozen-variable subsystem run on the reduced configuration.
struct RunTarget {
    config::SystemConfig system;
    std::string runtime_parameter;
    std::optional<params::ParameterRef> parameter_ref;
};

RunTarget
resolve_run_target(const config::SystemConfig& system,
                   const std::optional<params::SubsystemSnapshot>& snapshot,
                   std::span<const double> param_values,
                   std::string_view label) {
    RunTarget target{.system = system};
    if (snapshot && snapshot->has_frozen_variables()) {
        auto ref = params::parse_parameter_ref_label(system, *snapshot, label);
        target.runtime_parameter =
            params::resolve_runtime_parameter_name(*snapshot, ref);
        target.system =
            params::build_reduced_run_config(system, *snapshot, param_values);
        target.parameter_ref = std::move(ref);
        return target;
    }
    require(system.has_param(label), kUndefinedParameter);
    target.system.params.assign(param_values.begin(), param_values.end());
    target.runtime_parameter = std::string(label);
    return target;
}

engine::RunContext make_context(config::SystemConfig system,
                                const config::ContinuationSettings& settings,
                                Direction direction,
                                SizeType map_iterations = 1) {
    return {.system         = std::move(system),
            .settings       = settings,
            .direction      = direction,
            .map_iterations = std::max<SizeType>(map_iterations, 1)};
}

config::ContinuationSettings resolve_settings(const RunOptions& options,
                                              BranchKind kind) {
    auto settings =
        options.settings.value_or(config::default_settings(kind)).sanitized();
    settings.validate();
    return settings;
}

const ContinuationPoint& select_point(const ContinuationObject& source,
                                      ArrayIndex index) {
    require(index.value < source.data.size(), "Select a valid branch point.");
    return branch::point_at(source.data, index);
}

void require_stability(const ContinuationPoint& point, BifurcationType type) {
    require(point.stability == type,
            std::format("Selected point is not a {} bifurcation.",
                        branch::display_label(type)));
}

// Second curve parameter: the requested one, or the first parameter that
// differs from p1.
std::string second_parameter(const config::SystemConfig& system,
                             std::string_view param1,
                             std::string_view requested) {
    if (!requested.empty()) {
        require(system.has_param(requested),
                "Select a valid second continuation parameter.");
        require(requested != param1,
                "First and second parameters must differ.");
        return std::string(requested);
    }
    const auto it = std::ranges::find_if(
        system.param_names, [&](const auto& name) { return name != param1; });
    require(it != system.param_names.end(), kNeedTwoParameters);
    return *it;
}

double param_value(const config::SystemConfig& system,
                   std::span<const double> param_values,
                   std::string_view name) {
    const auto index = system.param_index(name);
    require(index.has_value() && *index < param_values.size(),
            std::format("Parameter \"{}\" has no valid value.", name));
    return param_values[*index];
}

void set_param(std::vector<double>& param_values,
               const config::SystemConfig& system,
               std::string_view name,
               double value) {
    const auto index = system.param_index(name);
    if (index && *index < param_values.size()) {
        param_values[*index] = value;
    }
}

std::string curve_label(std::string_view param1, std::string_view param2) {
    return std::format("{}, {}", param1, param2);
}

std::optional<SizeType> map_iterations_of(const config::SystemConfig& system,
                                          const ContinuationObject& source) {
    if (system.is_flow()) {
        return std::nullopt;
    }
    return source.map_iterations.value_or(1);
}

void require_homoclinic_progress(const ContinuationBranchData& data) {
    if (data.size() <= 1) {
        throw EngineError("Homoclinic continuation stopped at the seed point. "
                          "Try a smaller step size or adjust parameters.");
    }
}

branch::BranchType make_cycle_curve_type(engine::CycleCurveKind kind,
                                         branch::CycleCurveFields fields) {
    switch (kind) {
    case engine::CycleCurveKind::kLPC:
        return branch::LPCCurve{std::move(fields)};
    case engine::CycleCurveKind::kPD:
        return branch::PDCurve{std::move(fields)};
    case engine::CycleCurveKind::kNS:
        return branch::NSCurve{std::move(fields)};
    case engine::CycleCurveKind::kIsochrone:
        return branch::IsochroneCurve{std::move(fields)};
    }
    return branch::LPCCurve{std::move(fields)};
}

std::optional<BifurcationType> required_stability(engine::CycleCurveKind kind) {
    switch (kind) {
    case engine::CycleCurveKind::kLPC:
        return BifurcationType::kCycleFold;
    case engine::CycleCurveKind::kPD:
        return BifurcationType::kPeriodDoubling;
    case engine::CycleCurveKind::kNS:
        return BifurcationType::kNeimarkSacker;
    case engine::CycleCurveKind::kIsochrone:
        return std::nullopt;
    }
    return std::nullopt;
}

std::string_view curve_title(engine::CycleCurveKind kind) {
    switch (kind) {
    case engine::CycleCurveKind::kLPC:
        return "LPC";
    case engine::CycleCurveKind::kPD:
        return "PD";
    case engine::CycleCurveKind::kNS:
        return "NS";
    case engine::CycleCurveKind::kIsochrone:
        return "Isochrone";
    }
    return "Cycle";
}

std::string_view curve_prefix(engine::CycleCurveKind kind) {
    switch (kind) {
    case engine::CycleCurveKind::kLPC:
        return "lpc";
    case engine::CycleCurveKind::kPD:
        return "pd";
    case engine::CycleCurveKind::kNS:
        return "ns";
    case engine::CycleCurveKind::kIsochrone:
        return "isochrone";
    }
    return "cycle";
}

// Extension keeps the branch's predictor bounds and only swaps the step
// budget and, optionally, the initial step.
config::ContinuationSettings
extension_settings(const config::ContinuationSettings& base,
                   const ExtensionOptions& options) {
    auto positive_or = [](double value, double fallback) {
        return std::isfinite(value) && value > 0 ? value : fallback;
    };
    config::ContinuationSettings settings{
        .step_size = options.step_size.value_or(positive_or(base.step_size, 0.01)),
        .min_step_size   = positive_or(base.min_step_size, 1e-5),
        .max_step_size   = positive_or(base.max_step_size, 0.1),
        .max_steps       = options.max_steps,
        .corrector_steps = base.corrector_steps > 0 ? base.corrector_steps : 4,
        .corrector_tolerance = positive_or(base.corrector_tolerance, 1e-6),
        .step_tolerance      = positive_or(base.step_tolerance, 1e-6),
    };
    settings = settings.sanitized();
    settings.validate();
    return settings;
}

// Branch-type metadata the engine does not echo back on extension.
void restore_metadata(ContinuationBranchData& updated,
                      const ContinuationObject& source) {
    if (!updated.branch_type) {
        updated.branch_type = source.data.branch_type;
    }
    if (!updated.homoc_context) {
        updated.homoc_context = source.data.homoc_context;
    }
    if (source.branch_kind == BranchKind::kLimitCycle &&
        !(updated.branch_type &&
          std::holds_alternative<branch::LimitCycle>(*updated.branch_type))) {
        const auto mesh     = cycle_mesh(source.data);
        updated.branch_type = branch::LimitCycle{.ntst = mesh.ntst,
                                                 .ncol = mesh.ncol};
    }
}

} // namespace

ContinuationService::ContinuationService(std::string system_name,
                                         storage::ObjectStore& store,
                                         jobs::JobClient& client,
                                         bool show_progress)
    : m_system_name(std::move(system_name)),
      m_store(store),
      m_client(client),
      m_show_progress(show_progress) {}

config::SystemConfig ContinuationService::load_system() const {
    return m_store.load_system(m_system_name);
}

std::string
ContinuationService::claim_branch_name(std::string_view requested,
                                       std::string_view fallback,
                                       std::string_view parent) const {
    std::string name(requested.empty() ? fallback : requested);
    validate_name(name);
    const auto existing = m_store.list_branches(m_system_name, parent);
    require(std::ranges::find(existing, name) == existing.end(),
            std::format("Branch \"{}\" already exists.", name));
    return name;
}

void ContinuationService::claim_object_name(std::string_view name) const {
    validate_name(name);
    bool exists = true;
    try {
        static_cast<void>(m_store.load_object(m_system_name, name));
    } catch (const storage::NotFoundError&) {
        exists = false;
    }
    require(!exists, std::format("Object \"{}\" already exists.", name));
}

engine::JobResult ContinuationService::execute(engine::JobPayload payload,
                                               std::string_view label,
                                               std::stop_token stop) {
    if (stop.stop_requested()) {
        throw AbortError();
    }
    spdlog::info("{}: starting {} job", label, engine::payload_name(payload));
    progress::ProgressReporter reporter(label, m_show_progress);
    auto submission = m_client.submit(
        std::move(payload),
        [&reporter](const engine::Progress& snapshot) {
            reporter.update(snapshot);
        });
    engine::JobResult result;
    {
        const auto id = submission.id;
        std::stop_callback on_stop(stop, [this, id] { m_client.cancel(id); });
        result = submission.result.get();
    }
    reporter.finish();
    spdlog::info("{}: finished after {} steps ({} points)", label,
                 reporter.last().current_step,
                 reporter.last().points_computed);
    return result;
}

ContinuationBranchData
ContinuationService::run_branch_job(engine::JobPayload payload,
                                    std::string_view label,
                                    std::stop_token stop) {
    const auto result = execute(std::move(payload), label, std::move(stop));
    const auto* payload_data = std::get_if<wire::BranchPayload>(&result);
    if (payload_data == nullptr) {
        throw EngineError(std::format(
            "{}: engine returned a curve where a branch was expected", label));
    }
    return wire::normalize_branch_eigenvalues(*payload_data);
}

ContinuationBranchData
ContinuationService::run_curve_job(engine::JobPayload payload,
                                   std::string_view label,
                                   const branch::BranchType& branch_type,
                                   std::span<const double> seed_state,
                                   std::stop_token stop) {
    const auto result = execute(std::move(payload), label, std::move(stop));
    const auto* curve = std::get_if<wire::CurvePayload>(&result);
    if (curve == nullptr) {
        throw EngineError(std::format(
            "{}: engine returned a branch where a curve was expected", label));
    }
    auto data = wire::curve_to_branch_data(*curve, branch_type);
    if (data.empty()) {
        throw EngineError(std::format("{} returned no points", label));
    }
    for (auto& point : data.points) {
        if (point.state.empty()) {
            point.state.assign(seed_state.begin(), seed_state.end());
        }
    }
    return data;
}

void ContinuationService::commit(ContinuationObject& branch) {
    branch.system_name = m_system_name;
    branch.timestamp   = branch::current_timestamp();
    m_store.save_branch(m_system_name, branch.parent_object, branch);
    spdlog::info("Saved branch '{}' under '{}': {} points, {} bifurcations",
                 branch.name, branch.parent_object, branch.data.size(),
                 branch.data.bifurcations.size());
}

ContinuationObject ContinuationService::create_equilibrium_branch(
    const EquilibriumBranchOptions& options) {
    const auto system = load_system();
    require(!system.param_names.empty(), kNoParameters);

    storage::StoredObject object;
    try {
        object = m_store.load_object(m_system_name, options.object_name);
    } catch (const storage::NotFoundError& e) {
        throw ValidationError(e.what());
    }
    require(object.kind == storage::ObjectKind::kEquilibrium,
            "Equilibrium branches start from an equilibrium object.");
    require(object.is_solved(),
            "This equilibrium object has no solution. Solve it first.");

    const std::string label =
        options.parameter.empty() ? system.param_names.front()
                                  : options.parameter;
    const auto param_values =
        object.parameters && object.parameters->size() == system.params.size()
            ? *object.parameters
            : system.params;

    std::optional<params::SubsystemSnapshot> snapshot;
    if (object.frozen_variables &&
        !object.frozen_variables->values_by_var.empty()) {
        snapshot = params::resolve_subsystem_snapshot(
            system, object.subsystem, *object.frozen_variables);
    }
    auto target = resolve_run_target(system, snapshot, param_values, label);
    const auto state =
        snapshot ? params::project_state_to_reduced(*snapshot, object.state)
                 : object.state;

    const std::string default_name = std::format(
        "{}_{}", object.name,
        target.parameter_ref
            ? std::visit(Overloaded{[](const params::NativeParam& p) {
                                        return p.name;
                                    },
                                    [](const params::FrozenVar& v) {
                                        return v.variable_name;
                                    }},
                         *target.parameter_ref)
            : label);
    const auto name =
        claim_branch_name(options.run.name, default_name, object.name);
    const auto settings =
        resolve_settings(options.run, BranchKind::kEquilibrium);

    auto data = run_branch_job(
        engine::EquilibriumRequest{
            .context           = make_context(std::move(target.system),
                                              settings, options.run.direction),
            .equilibrium_state = state,
            .parameter_name    = target.runtime_parameter},
        "Equilibrium continuation", options.run.stop);

    ContinuationObject result{
        .name           = name,
        .system_name    = m_system_name,
        .parameter_name = label,
        .parent_object  = object.name,
        .start_object   = object.name,
        .branch_kind    = BranchKind::kEquilibrium,
        .data           = std::move(data),
        .settings       = settings,
        .params         = param_values,
        .map_iterations = system.is_flow() ? std::nullopt
                                           : std::optional<SizeType>(1),
        .subsystem      = snapshot,
        .parameter_ref  = target.parameter_ref,
    };
    commit(result);
    return result;
}

ContinuationObject ContinuationService::initiate_equilibrium_from_point(
    const ContinuationObject& source,
    ArrayIndex point_index,
    const EquilibriumFromPointOptions& options) {
    const auto system = load_system();
    require(!system.param_names.empty(), kNoParameters);
    require(source.branch_kind == BranchKind::kEquilibrium,
            "Select an equilibrium branch to continue from.");
    const auto& point = select_point(source, point_index);

    const std::string label =
        options.parameter.empty() ? source.parameter_name : options.parameter;
    const auto param_values =
        params::resolve_point_params(system, source, point, &m_store);
    auto target =
        resolve_run_target(system, source.subsystem, param_values, label);
    const auto name = claim_branch_name(
        options.run.name, std::format("{}_{}", source.name, target.runtime_parameter),
        source.parent_object);
    const auto settings =
        resolve_settings(options.run, BranchKind::kEquilibrium);
    const auto map_iterations = map_iterations_of(system, source);

    auto data = run_branch_job(
        engine::EquilibriumRequest{
            .context = make_context(std::move(target.system), settings,
                                    options.run.direction,
                                    map_iterations.value_or(1)),
            .equilibrium_state = point.state,
            .parameter_name    = target.runtime_parameter},
        "Equilibrium continuation", options.run.stop);

    ContinuationObject result{
        .name           = name,
        .system_name    = m_system_name,
        .parameter_name = label,
        .parent_object  = source.parent_object,
        .start_object   = source.name,
        .branch_kind    = BranchKind::kEquilibrium,
        .data           = std::move(data),
        .settings       = settings,
        .params         = param_values,
        .map_iterations = map_iterations,
        .subsystem      = source.subsystem,
        .parameter_ref  = target.parameter_ref,
    };
    commit(result);
    return result;
}

ContinuationObject ContinuationService::initiate_limit_cycle_from_hopf(
    const ContinuationObject& source,
    ArrayIndex point_index,
    const LimitCycleFromHopfOptions& options) {
    const auto system = load_system();
    require(system.is_flow(), kFlowOnlyCycles);
    require(!system.param_names.empty(), kNoParameters);
    require(source.branch_kind == BranchKind::kEquilibrium,
            "Limit cycles start from a Hopf point of an equilibrium branch.");
    const auto& point = select_point(source, point_index);
    require_stability(point, BifurcationType::kHopf);
    require(std::isfinite(options.amplitude) && options.amplitude > 0,
            "Amplitude must be a positive number.");
    require(options.ntst >= 2, "NTST must be at least 2.");
    require(options.ncol >= 1, "NCOL must be a positive integer.");

    const auto param_values =
        params::resolve_point_params(system, source, point, &m_store);
    auto target = resolve_run_target(system, source.subsystem, param_values,
                                     source.parameter_name);
    const auto name = claim_branch_name(
        options.run.name, std::format("lc_{}", source.name),
        source.parent_object);
    const auto settings =
        resolve_settings(options.run, BranchKind::kLimitCycle);

    auto data = run_branch_job(
        engine::LimitCycleFromHopfRequest{
            .context        = make_context(std::move(target.system), settings,
                                           options.run.direction),
            .hopf_state     = point.state,
            .parameter_name = target.runtime_parameter,
            .param_value    = point.param_value,
            .amplitude      = options.amplitude,
            .ntst           = options.ntst,
            .ncol           = options.ncol},
        "Limit cycle from Hopf", options.run.stop);
    if (!data.branch_type) {
        data.branch_type =
            branch::LimitCycle{.ntst = options.ntst, .ncol = options.ncol};
    }

    ContinuationObject result{
        .name           = name,
        .system_name    = m_system_name,
        .parameter_name = source.parameter_name,
        .parent_object  = source.parent_object,
        .start_object   = source.name,
        .branch_kind    = BranchKind::kLimitCycle,
        .data           = std::move(data),
        .settings       = settings,
        .params         = param_values,
        .subsystem      = source.subsystem,
        .parameter_ref  = target.parameter_ref,
    };
    commit(result);
    return result;
}

ContinuationObject ContinuationService::initiate_limit_cycle_from_orbit(
    const LimitCycleFromOrbitOptions& options) {
    const auto system = load_system();
    require(!system.param_names.empty(), kNoParameters);
    require(system.is_flow(), kFlowOnlyCycles);

    storage::StoredObject orbit;
    try {
        orbit = m_store.load_object(m_system_name, options.orbit_name);
    } catch (const storage::NotFoundError& e) {
        throw ValidationError(e.what());
    }
    require(orbit.kind == storage::ObjectKind::kOrbit,
            "Select an orbit object to detect a cycle in.");
    require(orbit.orbit.size() >= 2, "Orbit has no samples. Simulate it first.");
    const auto dim = system.dimension();
    require(std::ranges::all_of(orbit.orbit,
                                [dim](const auto& row) {
                                    return row.size() == dim + 1;
                                }),
            "Orbit samples do not match the system dimension.");
    require(std::isfinite(options.tolerance) && options.tolerance > 0,
            "Cycle detection tolerance must be a positive number.");
    require(options.ntst >= 2, "NTST must be at least 2.");
    require(options.ncol >= 1, "NCOL must be a positive integer.");

    const std::string parameter = options.parameter.empty()
                                      ? system.param_names.front()
                                      : options.parameter;
    require(system.has_param(parameter), kUndefinedParameter);
    require(!options.cycle_object_name.empty(),
            "Please provide a limit cycle object name.");
    claim_object_name(options.cycle_object_name);
    const auto name = claim_branch_name(
        options.run.name,
        std::format("{}_{}", options.cycle_object_name, parameter),
        options.cycle_object_name);

    const auto param_values =
        orbit.parameters && orbit.parameters->size() == system.params.size()
            ? *orbit.parameters
            : system.params;
    std::vector<double> times;
    std::vector<std::vector<double>> states;
    times.reserve(orbit.orbit.size());
    states.reserve(orbit.orbit.size());
    for (const auto& row : orbit.orbit) {
        times.push_back(row.front());
        states.emplace_back(row.begin() + 1, row.end());
    }
    const auto settings =
        resolve_settings(options.run, BranchKind::kLimitCycle);
    auto run_system   = system;
    run_system.params = param_values;

    auto data = run_branch_job(
        engine::LimitCycleFromOrbitRequest{
            .context        = make_context(std::move(run_system), settings,
                                           options.run.direction),
            .orbit_times    = std::move(times),
            .orbit_states   = std::move(states),
            .parameter_name = parameter,
            .param_value    = param_value(system, param_values, parameter),
            .tolerance      = options.tolerance,
            .ntst           = options.ntst,
            .ncol           = options.ncol},
        "Limit cycle from orbit", options.run.stop);
    if (data.empty()) {
        throw EngineError("Limit cycle continuation returned no points.");
    }
    if (!data.branch_type) {
        data.branch_type =
            branch::LimitCycle{.ntst = options.ntst, .ncol = options.ncol};
    }

    m_store.save_object(m_system_name,
                        storage::StoredObject{
                            .name       = options.cycle_object_name,
                            .kind       = storage::ObjectKind::kLimitCycle,
                            .state      = data.points.front().state,
                            .parameters = param_values,
                        });
    ContinuationObject result{
        .name           = name,
        .system_name    = m_system_name,
        .parameter_name = parameter,
        .parent_object  = options.cycle_object_name,
        .start_object   = orbit.name,
        .branch_kind    = BranchKind::kLimitCycle,
        .data           = std::move(data),
        .settings       = settings,
        .params         = param_values,
    };
    commit(result);
    return result;
}

ContinuationObject ContinuationService::initiate_limit_cycle_from_pd(
    const ContinuationObject& source,
    ArrayIndex point_index,
    const LimitCycleFromPDOptions& options) {
    const auto system = load_system();
    require(system.is_flow(), kFlowOnlyCycles);
    require(source.branch_kind == BranchKind::kLimitCycle,
            "Period-doubling branching requires a limit cycle branch.");
    const auto& point = select_point(source, point_index);
    require_stability(point, BifurcationType::kPeriodDoubling);
    require(std::isfinite(options.amplitude) && options.amplitude > 0,
            "Amplitude must be a positive number.");
    require(options.ncol >= 1, "NCOL must be a positive integer.");

    const auto param_values =
        params::resolve_point_params(system, source, point, &m_store);
    auto target = resolve_run_target(system, source.subsystem, param_values,
                                     source.parameter_name);
    std::string parent = source.parent_object;
    if (!options.cycle_object_name.empty()) {
        claim_object_name(options.cycle_object_name);
        parent = options.cycle_object_name;
    }
    const auto name = claim_branch_name(
        options.run.name, std::format("lc_pd_{}", source.name), parent);
    const auto mesh = cycle_mesh(source.data);
    const auto settings =
        resolve_settings(options.run, BranchKind::kLimitCycle);

    auto data = run_branch_job(
        engine::LimitCycleFromPDRequest{
            .context        = make_context(std::move(target.system), settings,
                                           options.run.direction),
            .lc_state       = point.state,
            .parameter_name = target.runtime_parameter,
            .param_value    = point.param_value,
            .amplitude      = options.amplitude,
            .ntst           = mesh.ntst,
            .ncol           = options.ncol},
        "Limit cycle from period doubling", options.run.stop);
    if (data.size() <= 1) {
        throw EngineError("Limit cycle continuation stopped at the seed point. "
                          "Try a smaller step size or adjust parameters.");
    }
    if (!data.branch_type) {
        data.branch_type =
            branch::LimitCycle{.ntst = mesh.ntst * 2, .ncol = options.ncol};
    }
    if (!cycle_period(data.points.front().state)) {
        throw EngineError(
            "Limit cycle continuation returned an invalid period.");
    }

    if (!options.cycle_object_name.empty()) {
        m_store.save_object(m_system_name,
                            storage::StoredObject{
                                .name       = options.cycle_object_name,
                                .kind       = storage::ObjectKind::kLimitCycle,
                                .state      = data.points.front().state,
                                .parameters = param_values,
                                .origin_branch = source.name,
                            });
    }
    ContinuationObject result{
        .name           = name,
        .system_name    = m_system_name,
        .parameter_name = source.parameter_name,
        .parent_object  = parent,
        .start_object   = source.name,
        .branch_kind    = BranchKind::kLimitCycle,
        .data           = std::move(data),
        .settings       = settings,
        .params         = param_values,
        .subsystem      = source.subsystem,
        .parameter_ref  = target.parameter_ref,
    };
    commit(result);
    return result;
}

ContinuationObject ContinuationService::initiate_map_cycle_from_pd(
    const ContinuationObject& source,
    ArrayIndex point_index,
    const MapCycleFromPDOptions& options) {
    const auto system = load_system();
    require(!system.is_flow(),
            "Cycle continuation is only available for map systems.");
    require(source.branch_kind == BranchKind::kEquilibrium,
            "Period-doubling branching for maps requires a cycle branch.");
    const auto& point = select_point(source, point_index);
    require_stability(point, BifurcationType::kPeriodDoubling);
    require(std::isfinite(options.amplitude) && options.amplitude > 0,
            "Amplitude must be a positive number.");

    const auto param_values =
        params::resolve_point_params(system, source, point, &m_store);
    auto target = resolve_run_target(system, source.subsystem, param_values,
                                     source.parameter_name);
    std::string parent = source.parent_object;
    if (!options.cycle_object_name.empty()) {
        claim_object_name(options.cycle_object_name);
        parent = options.cycle_object_name;
    }
    const auto name = claim_branch_name(
        options.run.name, std::format("cycle_pd_{}", source.name), parent);
    const SizeType source_iterations =
        std::max<SizeType>(source.map_iterations.value_or(1), 1);
    const SizeType next_iterations = source_iterations * 2;
    const auto settings =
        resolve_settings(options.run, BranchKind::kEquilibrium);

    auto data = run_branch_job(
        engine::MapCycleFromPDRequest{
            .context        = make_context(std::move(target.system), settings,
                                           options.run.direction,
                                           next_iterations),
            .pd_state       = point.state,
            .parameter_name = target.runtime_parameter,
            .param_value    = point.param_value,
            .map_iterations = source_iterations,
            .amplitude      = options.amplitude},
        "Map cycle from period doubling", options.run.stop);

    if (!options.cycle_object_name.empty() && !data.empty()) {
        m_store.save_object(m_system_name,
                            storage::StoredObject{
                                .name       = options.cycle_object_name,
                                .kind       = storage::ObjectKind::kEquilibrium,
                                .state      = data.points.front().state,
                                .parameters = param_values,
                                .origin_branch = source.name,
                            });
    }
    ContinuationObject result{
        .name           = name,
        .system_name    = m_system_name,
        .parameter_name = source.parameter_name,
        .parent_object  = parent,
        .start_object   = source.name,
        .branch_kind    = BranchKind::kEquilibrium,
        .data           = std::move(data),
        .settings       = settings,
        .params         = param_values,
        .map_iterations = next_iterations,
        .subsystem      = source.subsystem,
        .parameter_ref  = target.parameter_ref,
    };
    commit(result);
    return result;
}

ContinuationObject ContinuationService::initiate_homoclinic_from_large_cycle(
    const ContinuationObject& source,
    ArrayIndex point_index,
    const HomoclinicFromLargeCycleOptions& options) {
    const auto system = load_system();
    require(system.is_flow(), kFlowOnlyHomoclinic);
    require(source.branch_kind == BranchKind::kLimitCycle,
            "Homoclinic initialization from a large cycle requires a limit "
            "cycle branch point.");
    require(system.param_names.size() >= 2,
            "Homoclinic continuation requires at least two system "
            "parameters.");
    const auto& point = select_point(source, point_index);

    std::string param1 = options.param1_name;
    if (param1.empty()) {
        param1 = system.has_param(source.parameter_name)
                     ? source.parameter_name
                     : system.param_names.front();
    }
    require(system.has_param(param1), kUndefinedParameter);
    const auto param2 = second_parameter(system, param1, options.param2_name);
    require(options.free_time || options.free_eps0 || options.free_eps1,
            kNoFreeHomoclinicValue);

    const auto mesh = cycle_mesh(source.data);
    const HomoclinicTarget target{
        .param1_name = param1,
        .param2_name = param2,
        .target_ntst = std::max<SizeType>(
            options.target_ntst.value_or(std::max<SizeType>(mesh.ntst, 40)),
            2),
        .target_ncol =
            std::max<SizeType>(options.target_ncol.value_or(mesh.ncol), 1),
        .free_time = options.free_time,
        .free_eps0 = options.free_eps0,
        .free_eps1 = options.free_eps1,
    };
    const auto name = claim_branch_name(
        options.run.name, std::format("homoc_{}", source.name),
        source.parent_object);

    auto param_values =
        params::resolve_point_params(system, source, point, &m_store);
    set_param(param_values, system, param1, point.param_value);
    auto run_system   = system;
    run_system.params = param_values;
    const auto settings =
        resolve_settings(options.run, BranchKind::kHomoclinicCurve);

    auto raw = run_branch_job(
        engine::HomoclinicFromLargeCycleRequest{
            .context     = make_context(std::move(run_system), settings,
                                        options.run.direction),
            .lc_state    = point.state,
            .source_ntst = mesh.ntst,
            .source_ncol = mesh.ncol,
            .target      = target},
        "Homoclinic from large cycle", options.run.stop);
    require_homoclinic_progress(raw);
    auto data = seeds::discard_initial_approximation_point(raw);
    ensure_homoclinic_branch_type(data,
                                  branch::HomoclinicCurve{
                                      .ntst        = target.target_ntst,
                                      .ncol        = target.target_ncol,
                                      .param1_name = param1,
                                      .param2_name = param2,
                                      .free_time   = target.free_time,
                                      .free_eps0   = target.free_eps0,
                                      .free_eps1   = target.free_eps1,
                                  });

    ContinuationObject result{
        .name           = name,
        .system_name    = m_system_name,
        .parameter_name = curve_label(param1, param2),
        .parent_object  = source.parent_object,
        .start_object   = source.name,
        .branch_kind    = BranchKind::kHomoclinicCurve,
        .data           = std::move(data),
        .settings       = settings,
        .params         = param_values,
    };
    commit(result);
    return result;
}

ContinuationObject ContinuationService::initiate_homoclinic_from_homoclinic(
    const ContinuationObject& source,
    ArrayIndex point_index,
    const HomoclinicRestartOptions& options) {
    return run_homoclinic_restart(source, point_index, options, false);
}

ContinuationObject ContinuationService::initiate_homoclinic_from_homotopy_saddle(
    const ContinuationObject& source,
    ArrayIndex point_index,
    const HomoclinicRestartOptions& options) {
    return run_homoclinic_restart(source, point_index, options, true);
}

ContinuationObject ContinuationService::run_homoclinic_restart(
    const ContinuationObject& source,
    ArrayIndex point_index,
    const HomoclinicRestartOptions& options,
    bool from_homotopy) {
    const auto system = load_system();
    require(system.is_flow(), kFlowOnlyHomoclinic);

    std::string param1;
    std::string param2;
    branch::Mesh source_mesh;
    HomoclinicTarget target;
    if (from_homotopy) {
        require(source.branch_kind == BranchKind::kHomotopySaddleCurve,
                "Homoclinic initialization requires a homotopy-saddle "
                "branch.");
        const auto* type =
            source.data.branch_type
                ? std::get_if<branch::HomotopySaddleCurve>(
                      &*source.data.branch_type)
                : nullptr;
        require(type != nullptr, "Source homotopy-saddle metadata is missing.");
        require(type->stage == branch::HomotopyStage::kStageD,
                "Homoclinic initialization is only possible from StageD "
                "points.");
        param1      = type->param1_name;
        param2      = type->param2_name;
        source_mesh = {.ntst = type->ntst, .ncol = type->ncol};
    } else {
        require(source.branch_kind == BranchKind::kHomoclinicCurve,
                "Homoclinic restart requires an existing homoclinic branch.");
        const auto* type =
            source.data.branch_type
                ? std::get_if<branch::HomoclinicCurve>(&*source.data.branch_type)
                : nullptr;
        require(type != nullptr, "Source homoclinic branch metadata is missing.");
        param1           = type->param1_name;
        param2           = type->param2_name;
        source_mesh      = {.ntst = type->ntst, .ncol = type->ncol};
        target.free_time = type->free_time;
        target.free_eps0 = type->free_eps0;
        target.free_eps1 = type->free_eps1;
    }
    require(system.has_param(param1) && system.has_param(param2),
            kUndefinedParameter);
    const auto& point = select_point(source, point_index);

    target.param1_name = param1;
    target.param2_name = param2;
    target.target_ntst =
        std::max<SizeType>(options.target_ntst.value_or(source_mesh.ntst), 2);
    target.target_ncol =
        std::max<SizeType>(options.target_ncol.value_or(source_mesh.ncol), 1);
    target.free_time = options.free_time.value_or(target.free_time);
    target.free_eps0 = options.free_eps0.value_or(target.free_eps0);
    target.free_eps1 = options.free_eps1.value_or(target.free_eps1);
    require(target.free_time || target.free_eps0 || target.free_eps1,
            kNoFreeHomoclinicValue);

    const auto name = claim_branch_name(
        options.run.name,
        from_homotopy ? std::format("homoc_{}_stage_d", source.name)
                      : std::format("homoc_{}_restart", source.name),
        source.parent_object);
    auto param_values =
        params::resolve_point_params(system, source, point, &m_store);
    set_param(param_values, system, param1, point.param_value);
    auto run_system   = system;
    run_system.params = param_values;
    const auto settings =
        resolve_settings(options.run, BranchKind::kHomoclinicCurve);
    auto context = make_context(std::move(run_system), settings,
                                options.run.direction);

    ContinuationBranchData data;
    if (from_homotopy) {
        data = run_branch_job(
            engine::HomoclinicFromHomotopySaddleRequest{
                .context     = std::move(context),
                .point_state = point.state,
                .source_ntst = source_mesh.ntst,
                .source_ncol = source_mesh.ncol,
                .target      = target},
            "Homoclinic from homotopy saddle", options.run.stop);
    } else {
        const auto fixed = homoclinic_fixed_values(source.data);
        if (!fixed.from_context) {
            spdlog::warn("Branch '{}' carries no homoclinic context; using "
                         "fixed T={}, eps0={}, eps1={}",
                         source.name, fixed.time, fixed.eps0, fixed.eps1);
        }
        data = run_branch_job(
            engine::HomoclinicFromHomoclinicRequest{
                .context     = std::move(context),
                .point_state = point.state,
                .source_ntst = source_mesh.ntst,
                .source_ncol = source_mesh.ncol,
                .target      = target,
                .fixed_time  = fixed.time,
                .fixed_eps0  = fixed.eps0,
                .fixed_eps1  = fixed.eps1},
            "Homoclinic restart", options.run.stop);
    }
    require_homoclinic_progress(data);
    ensure_homoclinic_branch_type(data,
                                  branch::HomoclinicCurve{
                                      .ntst        = target.target_ntst,
                                      .ncol        = target.target_ncol,
                                      .param1_name = param1,
                                      .param2_name = param2,
                                      .free_time   = target.free_time,
                                      .free_eps0   = target.free_eps0,
                                      .free_eps1   = target.free_eps1,
                                  });

    ContinuationObject result{
        .name           = name,
        .system_name    = m_system_name,
        .parameter_name = curve_label(param1, param2),
        .parent_object  = source.parent_object,
        .start_object   = source.name,
        .branch_kind    = BranchKind::kHomoclinicCurve,
        .data           = std::move(data),
        .settings       = settings,
        .params         = param_values,
    };
    commit(result);
    return result;
}

ContinuationObject
ContinuationService::initiate_homotopy_saddle_from_equilibrium(
    const ContinuationObject& source,
    ArrayIndex point_index,
    const HomotopySaddleOptions& options) {
    const auto system = load_system();
    require(system.is_flow(),
            "Homotopy-saddle continuation is only available for flow "
            "systems.");
    require(source.branch_kind == BranchKind::kEquilibrium,
            "Homotopy-saddle continuation requires an equilibrium branch "
            "point.");
    require(system.param_names.size() >= 2,
            "Homotopy-saddle continuation requires at least two system "
            "parameters.");
    const auto& point = select_point(source, point_index);

    const std::string param1 = options.param1_name.empty()
                                   ? source.parameter_name
                                   : options.param1_name;
    require(system.has_param(param1), kUndefinedParameter);
    const auto param2 = second_parameter(system, param1, options.param2_name);
    require(options.ntst >= 2, "NTST must be at least 2.");
    require(options.ncol >= 1, "NCOL must be a positive integer.");
    const auto positive = [](double v) { return std::isfinite(v) && v > 0; };
    require(positive(options.eps0) && positive(options.eps1) &&
                positive(options.time) && positive(options.eps1_tol),
            "eps0, eps1, T and eps1 tolerance must be positive numbers.");

    const auto name = claim_branch_name(
        options.run.name, std::format("homotopy_saddle_{}", source.name),
        source.parent_object);
    const auto param_values =
        params::resolve_point_params(system, source, point, &m_store);
    auto run_system   = system;
    run_system.params = param_values;
    const auto settings =
        resolve_settings(options.run, BranchKind::kHomotopySaddleCurve);

    auto data = run_branch_job(
        engine::HomotopySaddleRequest{
            .context           = make_context(std::move(run_system), settings,
                                              options.run.direction),
            .equilibrium_state = point.state,
            .param1_name       = param1,
            .param2_name       = param2,
            .ntst              = options.ntst,
            .ncol              = options.ncol,
            .eps0              = options.eps0,
            .eps1              = options.eps1,
            .time              = options.time,
            .eps1_tol          = options.eps1_tol},
        "Homotopy saddle", options.run.stop);
    if (!data.branch_type) {
        data.branch_type = branch::HomotopySaddleCurve{
            .ntst        = options.ntst,
            .ncol        = options.ncol,
            .param1_name = param1,
            .param2_name = param2,
            .stage       = branch::HomotopyStage::kStageA};
    }

    ContinuationObject result{
        .name           = name,
        .system_name    = m_system_name,
        .parameter_name = curve_label(param1, param2),
        .parent_object  = source.parent_object,
        .start_object   = source.name,
        .branch_kind    = BranchKind::kHomotopySaddleCurve,
        .data           = std::move(data),
        .settings       = settings,
        .params         = param_values,
    };
    commit(result);
    return result;
}

ContinuationObject
ContinuationService::initiate_fold_curve(const ContinuationObject& source,
                                         ArrayIndex point_index,
                                         const CurveOptions& options) {
    const auto system = load_system();
    require(system.param_names.size() >= 2, kNeedTwoParameters);
    require(source.branch_kind == BranchKind::kEquilibrium,
            "Fold curve continuation requires an equilibrium branch.");
    const auto& point = select_point(source, point_index);
    require_stability(point, BifurcationType::kFold);

    const auto& param1 = source.parameter_name;
    require(system.has_param(param1), kUndefinedParameter);
    const auto param2 = second_parameter(system, param1, options.param2_name);
    const auto name = claim_branch_name(
        options.run.name, std::format("fold_curve_{}", source.name),
        source.parent_object);
    const auto param_values =
        params::resolve_point_params(system, source, point, &m_store);
    const auto map_iterations = map_iterations_of(system, source);
    auto run_system           = system;
    run_system.params         = param_values;
    const auto settings =
        resolve_settings(options.run, BranchKind::kFoldCurve);

    auto data = run_curve_job(
        engine::FoldCurveRequest{
            .context      = make_context(std::move(run_system), settings,
                                         options.run.direction,
                                         map_iterations.value_or(1)),
            .fold_state   = point.state,
            .param1_name  = param1,
            .param1_value = point.param_value,
            .param2_name  = param2,
            .param2_value = param_value(system, param_values, param2)},
        "Fold curve", branch::FoldCurve{.param1_name = param1, .param2_name = param2},
        point.state, options.run.stop);

    ContinuationObject result{
        .name           = name,
        .system_name    = m_system_name,
        .parameter_name = curve_label(param1, param2),
        .parent_object  = source.parent_object,
        .start_object   = source.name,
        .branch_kind    = BranchKind::kFoldCurve,
        .data           = std::move(data),
        .settings       = settings,
        .params         = param_values,
        .map_iterations = map_iterations,
    };
    commit(result);
    return result;
}

ContinuationObject
ContinuationService::initiate_hopf_curve(const ContinuationObject& source,
                                         ArrayIndex point_index,
                                         const CurveOptions& options) {
    const auto system = load_system();
    require(system.param_names.size() >= 2, kNeedTwoParameters);
    require(source.branch_kind == BranchKind::kEquilibrium,
            "Hopf curve continuation requires an equilibrium branch.");
    const auto& point = select_point(source, point_index);
    require_stability(point, BifurcationType::kHopf);

    const auto& param1 = source.parameter_name;
    require(system.has_param(param1), kUndefinedParameter);
    const auto param2 = second_parameter(system, param1, options.param2_name);
    const auto name = claim_branch_name(
        options.run.name, std::format("hopf_curve_{}", source.name),
        source.parent_object);
    const auto param_values =
        params::resolve_point_params(system, source, point, &m_store);
    const auto map_iterations = map_iterations_of(system, source);
    auto run_system           = system;
    run_system.params         = param_values;
    const auto settings =
        resolve_settings(options.run, BranchKind::kHopfCurve);
    const double omega = extract_hopf_omega(point.eigenvalues);
    spdlog::debug("Hopf curve seed omega = {}", omega);

    auto data = run_curve_job(
        engine::HopfCurveRequest{
            .context      = make_context(std::move(run_system), settings,
                                         options.run.direction,
                                         map_iterations.value_or(1)),
            .hopf_state   = point.state,
            .hopf_omega   = omega,
            .param1_name  = param1,
            .param1_value = point.param_value,
            .param2_name  = param2,
            .param2_value = param_value(system, param_values, param2)},
        "Hopf curve", branch::HopfCurve{.param1_name = param1, .param2_name = param2},
        point.state, options.run.stop);

    ContinuationObject result{
        .name           = name,
        .system_name    = m_system_name,
        .parameter_name = curve_label(param1, param2),
        .parent_object  = source.parent_object,
        .start_object   = source.name,
        .branch_kind    = BranchKind::kHopfCurve,
        .data           = std::move(data),
        .settings       = settings,
        .params         = param_values,
        .map_iterations = map_iterations,
    };
    commit(result);
    return result;
}

ContinuationObject
ContinuationService::initiate_lpc_curve(const ContinuationObject& source,
                                        ArrayIndex point_index,
                                        const CurveOptions& options) {
    return run_cycle_curve(source, point_index, engine::CycleCurveKind::kLPC,
                           options);
}

ContinuationObject
ContinuationService::initiate_isochrone_curve(const ContinuationObject& source,
                                              ArrayIndex point_index,
                                              const CurveOptions& options) {
    return run_cycle_curve(source, point_index,
                           engine::CycleCurveKind::kIsochrone, options);
}

ContinuationObject
ContinuationService::initiate_pd_curve(const ContinuationObject& source,
                                       ArrayIndex point_index,
                                       const CurveOptions& options) {
    return run_cycle_curve(source, point_index, engine::CycleCurveKind::kPD,
                           options);
}

ContinuationObject
ContinuationService::initiate_ns_curve(const ContinuationObject& source,
                                       ArrayIndex point_index,
                                       const CurveOptions& options) {
    return run_cycle_curve(source, point_index, engine::CycleCurveKind::kNS,
                           options);
}

ContinuationObject
ContinuationService::run_cycle_curve(const ContinuationObject& source,
                                     ArrayIndex point_index,
                                     engine::CycleCurveKind kind,
                                     const CurveOptions& options) {
    const auto title  = curve_title(kind);
    const auto system = load_system();
    require(system.is_flow(), kFlowOnlyCycles);
    require(system.param_names.size() >= 2, kNeedTwoParameters);
    if (kind == engine::CycleCurveKind::kIsochrone) {
        require(source.branch_kind == BranchKind::kLimitCycle ||
                    source.branch_kind == BranchKind::kIsochroneCurve,
                "Isochrone continuation requires a limit cycle or isochrone "
                "branch.");
    } else {
        require(source.branch_kind == BranchKind::kLimitCycle,
                std::format("{} curve requires a limit cycle branch.", title));
    }
    const auto& point = select_point(source, point_index);
    if (const auto stability = required_stability(kind)) {
        require_stability(point, *stability);
    }

    std::string param1 = source.parameter_name;
    if (source.branch_kind == BranchKind::kIsochroneCurve &&
        source.data.branch_type) {
        param1 = branch::param1_name(*source.data.branch_type).value_or(param1);
    }
    require(system.has_param(param1),
            "Source continuation parameter is not defined in this system.");
    const auto param2 = second_parameter(system, param1, options.param2_name);
    const auto period = cycle_period(point.state);
    require(period.has_value(), "Selected point has no valid period.");

    const auto mesh = cycle_mesh(source.data);
    const auto name = claim_branch_name(
        options.run.name,
        std::format("{}_curve_{}", curve_prefix(kind), source.name),
        source.parent_object);
    const auto param_values =
        params::resolve_point_params(system, source, point, &m_store);
    auto run_system   = system;
    run_system.params = param_values;
    const auto branch_kind = to_branch_kind(kind);
    const auto settings    = resolve_settings(options.run, branch_kind);
    const std::vector<double> lc_state(point.state.begin(),
                                       point.state.end() - 1);

    auto data = run_curve_job(
        engine::CycleCurveRequest{
            .context      = make_context(std::move(run_system), settings,
                                         options.run.direction),
            .kind         = kind,
            .lc_state     = lc_state,
            .period       = *period,
            .param1_name  = param1,
            .param1_value = param_value(system, param_values, param1),
            .param2_name  = param2,
            .param2_value = param_value(system, param_values, param2),
            .ntst         = mesh.ntst,
            .ncol         = mesh.ncol,
            .initial_k    = kind == engine::CycleCurveKind::kNS
                                ? ns_initial_k(point.eigenvalues)
                                : 0.0},
        std::format("{} curve", title),
        make_cycle_curve_type(kind, branch::CycleCurveFields{
                                        .param1_name = param1,
                                        .param2_name = param2,
                                        .ntst        = mesh.ntst,
                                        .ncol        = mesh.ncol}),
        point.state, options.run.stop);

    ContinuationObject result{
        .name           = name,
        .system_name    = m_system_name,
        .parameter_name = curve_label(param1, param2),
        .parent_object  = source.parent_object,
        .start_object   = source.name,
        .branch_kind    = branch_kind,
        .data           = std::move(data),
        .settings       = settings,
        .params         = param_values,
    };
    commit(result);
    return result;
}

ContinuationObject
ContinuationService::extend_branch(const ContinuationObject& source,
                                   const ExtensionOptions& options) {
    const auto system = load_system();
    require(source.branch_kind != BranchKind::kHomotopySaddleCurve,
            "Homotopy-saddle branches cannot be extended. Initialize a "
            "homoclinic branch from a StageD point instead.");
    require(!source.data.empty(), "Branch has no points to extend.");
    require(options.max_steps >= 1, "Max steps must be a positive number.");
    if (options.step_size) {
        require(std::isfinite(*options.step_size) && *options.step_size > 0,
                "Step size must be a positive number.");
    }

    std::string parameter = source.parameter_name;
    if (source.data.branch_type) {
        parameter =
            branch::param1_name(*source.data.branch_type).value_or(parameter);
    }
    const auto frontier = branch::select_frontier(source.data, options.direction);
    require(frontier.has_value(), "Branch has no points to extend.");
    const auto settings = extension_settings(source.settings, options);
    auto param_values =
        params::get_branch_params(system, source, &m_store);
    const bool carries_map_iterations =
        !system.is_flow() && (source.branch_kind == BranchKind::kEquilibrium ||
                              source.branch_kind == BranchKind::kFoldCurve ||
                              source.branch_kind == BranchKind::kHopfCurve);
    const SizeType map_iterations =
        carries_map_iterations ? source.map_iterations.value_or(1) : 1;

    spdlog::info("Extending branch '{}' {} from logical index {}", source.name,
                 options.direction == Direction::kForward ? "forward"
                                                          : "backward",
                 frontier->logical_index.value);

    std::optional<ContinuationBranchData> updated;
    if (source.branch_kind == BranchKind::kHomoclinicCurve) {
        const auto* type =
            source.data.branch_type
                ? std::get_if<branch::HomoclinicCurve>(&*source.data.branch_type)
                : nullptr;
        require(type != nullptr,
                "Homoclinic branch metadata is missing. Reinitialize from a "
                "valid homoclinic point.");
        const auto& endpoint = branch::point_at(source.data, frontier->array_index);
        set_param(param_values, system, type->param1_name, endpoint.param_value);
        auto target = resolve_run_target(system, source.subsystem, param_values,
                                         type->param1_name);

        try {
            auto generic = run_branch_job(
                engine::ExtensionRequest{
                    .context        = make_context(target.system, settings,
                                                   options.direction),
                    .branch         = wire::serialize_branch_data(source),
                    .parameter_name = target.runtime_parameter},
                "Homoclinic extension", options.stop);
            if (generic.size() > source.data.size()) {
                updated = std::move(generic);
            } else {
                spdlog::info("Homoclinic extension added no points, "
                             "restarting from the endpoint");
            }
        } catch (const EngineError& e) {
            spdlog::warn("Homoclinic extension failed ({}), restarting from "
                         "the endpoint",
                         e.what());
        }

        if (!updated) {
            const auto fixed = homoclinic_fixed_values(source.data);
            if (!fixed.from_context) {
                spdlog::warn("Branch '{}' carries no homoclinic context; "
                             "using fixed T={}, eps0={}, eps1={}",
                             source.name, fixed.time, fixed.eps0, fixed.eps1);
            }
            auto extension = run_branch_job(
                engine::HomoclinicFromHomoclinicRequest{
                    .context     = make_context(std::move(target.system),
                                                settings, options.direction),
                    .point_state = endpoint.state,
                    .source_ntst = type->ntst,
                    .source_ncol = type->ncol,
                    .target      = {.param1_name = type->param1_name,
                                    .param2_name = type->param2_name,
                                    .target_ntst = type->ntst,
                                    .target_ncol = type->ncol,
                                    .free_time   = type->free_time,
                                    .free_eps0   = type->free_eps0,
                                    .free_eps1   = type->free_eps1},
                    .fixed_time  = fixed.time,
                    .fixed_eps0  = fixed.eps0,
                    .fixed_eps1  = fixed.eps1},
                "Homoclinic extension (restart)", options.stop);
            if (extension.size() <= 1) {
                throw EngineError(
                    "Homoclinic extension stopped at the endpoint. Try a "
                    "smaller step size or adjust parameters.");
            }
            updated = seeds::merge_homoclinic_extension(
                source.data, extension, frontier->logical_index,
                options.direction);
        }
    } else {
        auto target = resolve_run_target(system, source.subsystem, param_values,
                                         parameter);
        updated = run_branch_job(
            engine::ExtensionRequest{
                .context        = make_context(std::move(target.system),
                                               settings, options.direction,
                                               map_iterations),
                .branch         = wire::serialize_branch_data(source),
                .parameter_name = target.runtime_parameter},
            "Extension", options.stop);
    }

    restore_metadata(*updated, source);
    ContinuationObject result = source;
    result.data               = std::move(*updated);
    result.settings           = settings;
    commit(result);
    return result;
}

} // namespace cobra::orchestration
