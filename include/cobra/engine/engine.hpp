#pragma once

#include <functional>
#include <future>
#include <memory>
#include <string_view>

#include "cobra/engine/requests.hpp"
#include "cobra/engine/runner.hpp"
#include "cobra/wire/codec.hpp"

namespace cobra::engine {

using BranchRunner = SteppedRunner<wire::BranchPayload>;
using CurveRunner  = SteppedRunner<wire::CurvePayload>;

// Native computation engine. Every factory has a default that throws
// MissingCapabilityError, so a build only overrides what it provides.
class Engine {
public:
    Engine()                         = default;
    virtual ~Engine()                = default;
    Engine(const Engine&)            = delete;
    Engine& operator=(const Engine&) = delete;
    Engine(Engine&&)                 = delete;
    Engine& operator=(Engine&&)      = delete;

    [[nodiscard]] virtual std::string_view name() const { return "engine"; }

    virtual std::unique_ptr<BranchRunner>
    create_equilibrium_runner(const EquilibriumRequest& request);
    virtual std::unique_ptr<BranchRunner>
    create_extension_runner(const ExtensionRequest& request);
    virtual std::unique_ptr<BranchRunner>
    create_limit_cycle_from_hopf_runner(const LimitCycleFromHopfRequest& request);
    virtual std::unique_ptr<BranchRunner> create_limit_cycle_from_orbit_runner(
        const LimitCycleFromOrbitRequest& request);
    virtual std::unique_ptr<BranchRunner>
    create_limit_cycle_from_pd_runner(const LimitCycleFromPDRequest& request);
    virtual std::unique_ptr<BranchRunner>
    create_map_cycle_from_pd_runner(const MapCycleFromPDRequest& request);
    virtual std::unique_ptr<BranchRunner> create_homoclinic_from_large_cycle_runner(
        const HomoclinicFromLargeCycleRequest& request);
    virtual std::unique_ptr<BranchRunner> create_homoclinic_from_homoclinic_runner(
        const HomoclinicFromHomoclinicRequest& request);
    virtual std::unique_ptr<BranchRunner>
    create_homoclinic_from_homotopy_saddle_runner(
        const HomoclinicFromHomotopySaddleRequest& request);
    virtual std::unique_ptr<BranchRunner>
    create_homotopy_saddle_runner(const HomotopySaddleRequest& request);
    virtual std::unique_ptr<CurveRunner>
    create_fold_curve_runner(const FoldCurveRequest& request);
    virtual std::unique_ptr<CurveRunner>
    create_hopf_curve_runner(const HopfCurveRequest& request);
    virtual std::unique_ptr<CurveRunner>
    create_cycle_curve_runner(const CycleCurveRequest& request);
};

// Resolves the engine asynchronously. Jobs block on it inside their own
// worker, so a job can be cancelled while the engine is still loading.
class EngineLoader {
public:
    using Factory = std::function<std::shared_ptr<Engine>()>;

    explicit EngineLoader(std::shared_future<std::shared_ptr<Engine>> future);

    [[nodiscard]] static EngineLoader ready(std::shared_ptr<Engine> engine);
    [[nodiscard]] static EngineLoader deferred(Factory factory);

    // Waits for the engine; rethrows a load failure as EngineError.
    [[nodiscard]] std::shared_ptr<Engine> get() const;
    [[nodiscard]] bool is_ready() const;

private:
    std::shared_future<std::shared_ptr<Engine>> m_future;
};

} // namespace cobra::engine
