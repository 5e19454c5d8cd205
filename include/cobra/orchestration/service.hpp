#pragma once

#include <optional>
#include <span>
#include <stop_token>
#include <string>
#include <string_view>
#include <vector>

#include "cobra/branch/continuation_object.hpp"
#include "cobra/config/settings.hpp"
#include "cobra/config/system.hpp"
#include "cobra/engine/requests.hpp"
#include "cobra/jobs/client.hpp"
#include "cobra/storage/object_store.hpp"

namespace cobra::orchestration {

// Settings shared by every procedure. An empty name selects the
// procedure's default branch name; absent settings select the per-kind
// defaults. A stop request on `stop` cancels the running job, which then
// raises AbortError and stores nothing.
struct RunOptions {
    std::string name;
    std::optional<config::ContinuationSettings> settings;
    Direction direction{Direction::kForward};
    std::stop_token stop;
};

struct EquilibriumBranchOptions {
    std::string object_name;
    // Parameter label: a system parameter or "var:<name>" for a frozen
    // variable. Empty selects the first system parameter.
    std::string parameter;
    RunOptions run;
};

struct EquilibriumFromPointOptions {
    // Empty continues in the source branch parameter.
    std::string parameter;
    RunOptions run;
};

struct LimitCycleFromHopfOptions {
    double amplitude{0.1};
    SizeType ntst{20};
    SizeType ncol{4};
    RunOptions run;
};

struct LimitCycleFromOrbitOptions {
    std::string orbit_name;
    // Limit-cycle object created to hold the new branch.
    std::string cycle_object_name;
    std::string parameter;
    double tolerance{0.1};
    SizeType ntst{20};
    SizeType ncol{4};
    RunOptions run;
};

struct LimitCycleFromPDOptions {
    // Empty keeps the branch under the source branch's parent object.
    std::string cycle_object_name;
    double amplitude{0.01};
    SizeType ncol{4};
    RunOptions run;
};

struct MapCycleFromPDOptions {
    std::string cycle_object_name;
    double amplitude{0.01};
    RunOptions run;
};

struct HomoclinicFromLargeCycleOptions {
    // Defaults: the branch parameter and the first other parameter.
    std::string param1_name;
    std::string param2_name;
    std::optional<SizeType> target_ntst;
    std::optional<SizeType> target_ncol;
    bool free_time{false};
    bool free_eps0{true};
    bool free_eps1{true};
    RunOptions run;
};

struct HomoclinicRestartOptions {
    // Default to the source branch's mesh and free flags.
    std::optional<SizeType> target_ntst;
    std::optional<SizeType> target_ncol;
    std::optional<bool> free_time;
    std::optional<bool> free_eps0;
    std::optional<bool> free_eps1;
    RunOptions run;
};

struct HomotopySaddleOptions {
    std::string param1_name;
    std::string param2_name;
    SizeType ntst{40};
    SizeType ncol{4};
    double eps0{0.01};
    double eps1{0.1};
    double time{40.0};
    double eps1_tol{1e-4};
    RunOptions run;
};

struct CurveOptions {
    // Empty selects the first parameter other than the branch parameter.
    std::string param2_name;
    RunOptions run;
};

struct ExtensionOptions {
    Direction direction{Direction::kForward};
    SizeType max_steps{50};
    std::optional<double> step_size;
    std::stop_token stop;
};

// Runs continuation procedures for one system through the job protocol and
// persists the resulting branches. Every procedure validates its inputs
// before submitting a job (ValidationError) and writes to the store only
// after the job succeeded.
class ContinuationService {
public:
    ContinuationService(std::string system_name,
                        storage::ObjectStore& store,
                        jobs::JobClient& client,
                        bool show_progress = false);

    [[nodiscard]] const std::string& system_name() const noexcept {
        return m_system_name;
    }

    branch::ContinuationObject
    create_equilibrium_branch(const EquilibriumBranchOptions& options);

    branch::ContinuationObject
    initiate_equilibrium_from_point(const branch::ContinuationObject& source,
                                    ArrayIndex point,
                                    const EquilibriumFromPointOptions& options);
    branch::ContinuationObject
    initiate_limit_cycle_from_hopf(const branch::ContinuationObject& source,
                                   ArrayIndex point,
                                   const LimitCycleFromHopfOptions& options);
    branch::ContinuationObject
    initiate_limit_cycle_from_orbit(const LimitCycleFromOrbitOptions& options);
    branch::ContinuationObject
    initiate_limit_cycle_from_pd(const branch::ContinuationObject& source,
                                 ArrayIndex point,
                                 const LimitCycleFromPDOptions& options);
    branch::ContinuationObject
    initiate_map_cycle_from_pd(const branch::ContinuationObject& source,
                               ArrayIndex point,
                               const MapCycleFromPDOptions& options);

    branch::ContinuationObject initiate_homoclinic_from_large_cycle(
        const branch::ContinuationObject& source,
        ArrayIndex point,
        const HomoclinicFromLargeCycleOptions& options);
    branch::ContinuationObject
    initiate_homoclinic_from_homoclinic(const branch::ContinuationObject& source,
                                        ArrayIndex point,
                                        const HomoclinicRestartOptions& options);
    branch::ContinuationObject initiate_homoclinic_from_homotopy_saddle(
        const branch::ContinuationObject& source,
        ArrayIndex point,
        const HomoclinicRestartOptions& options);
    branch::ContinuationObject initiate_homotopy_saddle_from_equilibrium(
        const branch::ContinuationObject& source,
        ArrayIndex point,
        const HomotopySaddleOptions& options);

    branch::ContinuationObject
    initiate_fold_curve(const branch::ContinuationObject& source,
                        ArrayIndex point,
                        const CurveOptions& options);
    branch::ContinuationObject
    initiate_hopf_curve(const branch::ContinuationObject& source,
                        ArrayIndex point,
                        const CurveOptions& options);
    branch::ContinuationObject
    initiate_lpc_curve(const branch::ContinuationObject& source,
                       ArrayIndex point,
                       const CurveOptions& options);
    branch::ContinuationObject
    initiate_isochrone_curve(const branch::ContinuationObject& source,
                             ArrayIndex point,
                             const CurveOptions& options);
    branch::ContinuationObject
    initiate_pd_curve(const branch::ContinuationObject& source,
                      ArrayIndex point,
                      const CurveOptions& options);
    branch::ContinuationObject
    initiate_ns_curve(const branch::ContinuationObject& source,
                      ArrayIndex point,
                      const CurveOptions& options);

    // Continues an existing branch past its frontier and stores it back
    // under the same name.
    branch::ContinuationObject
    extend_branch(const branch::ContinuationObject& source,
                  const ExtensionOptions& options);

private:
    std::string m_system_name;
    storage::ObjectStore& m_store;
    jobs::JobClient& m_client;
    bool m_show_progress;

    [[nodiscard]] config::SystemConfig load_system() const;
    [[nodiscard]] std::string claim_branch_name(std::string_view requested,
                                                std::string_view fallback,
                                                std::string_view parent) const;
    void claim_object_name(std::string_view name) const;
    [[nodiscard]] engine::JobResult execute(engine::JobPayload payload,
                                            std::string_view label,
                                            std::stop_token stop);
    [[nodiscard]] branch::ContinuationBranchData
    run_branch_job(engine::JobPayload payload,
                   std::string_view label,
                   std::stop_token stop);
    [[nodiscard]] branch::ContinuationBranchData
    run_curve_job(engine::JobPayload payload,
                  std::string_view label,
                  const branch::BranchType& branch_type,
                  std::span<const double> seed_state,
                  std::stop_token stop);
    branch::ContinuationObject
    run_cycle_curve(const branch::ContinuationObject& source,
                    ArrayIndex point,
                    engine::CycleCurveKind kind,
                    const CurveOptions& options);
    branch::ContinuationObject
    run_homoclinic_restart(const branch::ContinuationObject& source,
                           ArrayIndex point,
                           const HomoclinicRestartOptions& options,
                           bool from_homotopy);
    void commit(branch::ContinuationObject& branch);
};

} // namespace cobra::orchestration
