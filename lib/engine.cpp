#include "cobra/engine/engine.hpp"

#include <chrono>
#include <exception>
#include <format>
#include <utility>

#include "cobra/common/types.hpp"
#include "cobra/exceptions.hpp"

namespace cobra::engine {

std::unique_ptr<BranchRunner>
Engine::create_equilibrium_runner(const EquilibriumRequest& /*request*/) {
    throw MissingCapabilityError("equilibrium continuation");
}

std::unique_ptr<BranchRunner>
Engine::create_extension_runner(const ExtensionRequest& /*request*/) {
    throw MissingCapabilityError("branch extension");
}

std::unique_ptr<BranchRunner> Engine::create_limit_cycle_from_hopf_runner(
    const LimitCycleFromHopfRequest& /*request*/) {
    throw MissingCapabilityError("limit cycle from Hopf");
}

std::unique_ptr<BranchRunner> Engine::create_limit_cycle_from_orbit_runner(
    const LimitCycleFromOrbitRequest& /*request*/) {
    throw MissingCapabilityError("limit cycle from orbit");
}

std::unique_ptr<BranchRunner> Engine::create_limit_cycle_from_pd_runner(
    const LimitCycleFromPDRequest& /*request*/) {
    throw MissingCapabilityError("limit cycle from period doubling");
}

std::unique_ptr<BranchRunner> Engine::create_map_cycle_from_pd_runner(
    const MapCycleFromPDRequest& /*request*/) {
    throw MissingCapabilityError("map cycle from period doubling");
}

std::unique_ptr<BranchRunner> Engine::create_homoclinic_from_large_cycle_runner(
    const HomoclinicFromLargeCycleRequest& /*request*/) {
    throw MissingCapabilityError("homoclinic from large cycle");
}

std::unique_ptr<BranchRunner> Engine::create_homoclinic_from_homoclinic_runner(
    const HomoclinicFromHomoclinicRequest& /*request*/) {
    throw MissingCapabilityError("homoclinic from homoclinic");
}

std::unique_ptr<BranchRunner>
Engine::create_homoclinic_from_homotopy_saddle_runner(
    const HomoclinicFromHomotopySaddleRequest& /*request*/) {
    throw MissingCapabilityError("homoclinic from homotopy saddle");
}

std::unique_ptr<BranchRunner>
Engine::create_homotopy_saddle_runner(const HomotopySaddleRequest& /*request*/) {
    throw MissingCapabilityError("homotopy saddle");
}

std::unique_ptr<CurveRunner>
Engine::create_fold_curve_runner(const FoldCurveRequest& /*request*/) {
    throw MissingCapabilityError("fold curve");
}

std::unique_ptr<CurveRunner>
Engine::create_hopf_curve_runner(const HopfCurveRequest& /*request*/) {
    throw MissingCapabilityError("Hopf curve");
}

std::unique_ptr<CurveRunner>
Engine::create_cycle_curve_runner(const CycleCurveRequest& request) {
    throw MissingCapabilityError(
        std::format("{} curve", to_string(request.kind)));
}

EngineLoader::EngineLoader(std::shared_future<std::shared_ptr<Engine>> future)
    : m_future(std::move(future)) {}

EngineLoader EngineLoader::ready(std::shared_ptr<Engine> engine) {
    std::promise<std::shared_ptr<Engine>> promise;
    promise.set_value(std::move(engine));
    return EngineLoader(promise.get_future().share());
}

EngineLoader EngineLoader::deferred(Factory factory) {
    return EngineLoader(
        std::async(std::launch::async, std::move(factory)).share());
}

std::shared_ptr<Engine> EngineLoader::get() const {
    std::shared_ptr<Engine> engine;
    try {
        engine = m_future.get();
    } catch (const std::exception& e) {
        throw EngineError(std::format("Engine failed to load: {}", e.what()));
    }
    if (!engine) {
        throw EngineError("Engine failed to load: no engine instance");
    }
    return engine;
}

bool EngineLoader::is_ready() const {
    return m_future.valid() && m_future.wait_for(std::chrono::seconds(0)) ==
                                   std::future_status::ready;
}

std::string_view to_string(CycleCurveKind kind) noexcept {
    switch (kind) {
    case CycleCurveKind::kLPC:
        return "LPC";
    case CycleCurveKind::kPD:
        return "PD";
    case CycleCurveKind::kNS:
        return "NS";
    case CycleCurveKind::kIsochrone:
        return "isochrone";
    }
    return "cycle";
}

std::string_view payload_name(const JobPayload& payload) noexcept {
    return std::visit(
        Overloaded{
            [](const EquilibriumRequest&) -> std::string_view {
                return "equilibrium";
            },
            [](const ExtensionRequest&) -> std::string_view {
                return "extension";
            },
            [](const LimitCycleFromHopfRequest&) -> std::string_view {
                return "limit_cycle_from_hopf";
            },
            [](const LimitCycleFromOrbitRequest&) -> std::string_view {
                return "limit_cycle_from_orbit";
            },
            [](const LimitCycleFromPDRequest&) -> std::string_view {
                return "limit_cycle_from_pd";
            },
            [](const MapCycleFromPDRequest&) -> std::string_view {
                return "map_cycle_from_pd";
            },
            [](const HomoclinicFromLargeCycleRequest&) -> std::string_view {
                return "homoclinic_from_large_cycle";
            },
            [](const HomoclinicFromHomoclinicRequest&) -> std::string_view {
                return "homoclinic_from_homoclinic";
            },
            [](const HomoclinicFromHomotopySaddleRequest&) -> std::string_view {
                return "homoclinic_from_homotopy_saddle";
            },
            [](const HomotopySaddleRequest&) -> std::string_view {
                return "homotopy_saddle";
            },
            [](const FoldCurveRequest&) -> std::string_view {
                return "fold_curve";
            },
            [](const HopfCurveRequest&) -> std::string_view {
                return "hopf_curve";
            },
            [](const CycleCurveRequest& r) -> std::string_view {
                switch (r.kind) {
                case CycleCurveKind::kLPC:
                    return "lpc_curve";
                case CycleCurveKind::kPD:
                    return "pd_curve";
                case CycleCurveKind::kNS:
                    return "ns_curve";
                case CycleCurveKind::kIsochrone:
                    return "isochrone_curve";
                }
                return "cycle_curve";
            },
        },
        payload);
}

const RunContext& context_of(const JobPayload& payload) noexcept {
    return std::visit(
        [](const auto& request) -> const RunContext& {
            return request.context;
        },
        payload);
}

} // namespace cobra::engine
