#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

#include "cobra/common/types.hpp"
#include "cobra/config/settings.hpp"
#include "cobra/config/system.hpp"
#include "cobra/wire/codec.hpp"

namespace cobra::engine {

// Fields every engine request carries. system.params holds the resolved
// parameter vector the run starts from.
struct RunContext {
    config::SystemConfig system;
    config::ContinuationSettings settings;
    Direction direction{Direction::kForward};
    // Iterate count of the map for cycle branches of map systems.
    SizeType map_iterations{1};
};

struct EquilibriumRequest {
    RunContext context;
    std::vector<double> equilibrium_state;
    std::string parameter_name;
};

// Continue an existing branch past its frontier.
struct ExtensionRequest {
    RunContext context;
    wire::BranchPayload branch;
    std::string parameter_name;
};

struct LimitCycleFromHopfRequest {
    RunContext context;
    std::vector<double> hopf_state;
    std::string parameter_name;
    double param_value{};
    double amplitude{0.1};
    SizeType ntst{20};
    SizeType ncol{4};
};

struct LimitCycleFromOrbitRequest {
    RunContext context;
    std::vector<double> orbit_times;
    std::vector<std::vector<double>> orbit_states;
    std::string parameter_name;
    double param_value{};
    double tolerance{0.1};
    SizeType ntst{20};
    SizeType ncol{4};
};

struct LimitCycleFromPDRequest {
    RunContext context;
    std::vector<double> lc_state;
    std::string parameter_name;
    double param_value{};
    double amplitude{0.01};
    SizeType ntst{20};
    SizeType ncol{4};
};

struct MapCycleFromPDRequest {
    RunContext context;
    std::vector<double> pd_state;
    std::string parameter_name;
    double param_value{};
    SizeType map_iterations{1};
    double amplitude{0.01};
};

struct HomoclinicTarget {
    std::string param1_name;
    std::string param2_name;
    SizeType target_ntst{40};
    SizeType target_ncol{4};
    bool free_time{false};
    bool free_eps0{true};
    bool free_eps1{true};
};

struct HomoclinicFromLargeCycleRequest {
    RunContext context;
    std::vector<double> lc_state;
    SizeType source_ntst{};
    SizeType source_ncol{};
    HomoclinicTarget target;
};

// Restart from a point of an existing homoclinic branch. The fixed values
// are used for whichever of T/eps0/eps1 is not free.
struct HomoclinicFromHomoclinicRequest {
    RunContext context;
    std::vector<double> point_state;
    SizeType source_ntst{};
    SizeType source_ncol{};
    HomoclinicTarget target;
    double fixed_time{};
    double fixed_eps0{};
    double fixed_eps1{};
};

struct HomoclinicFromHomotopySaddleRequest {
    RunContext context;
    std::vector<double> point_state;
    SizeType source_ntst{};
    SizeType source_ncol{};
    HomoclinicTarget target;
};

struct HomotopySaddleRequest {
    RunContext context;
    std::vector<double> equilibrium_state;
    std::string param1_name;
    std::string param2_name;
    SizeType ntst{40};
    SizeType ncol{4};
    double eps0{0.01};
    double eps1{0.1};
    double time{40.0};
    double eps1_tol{1e-4};
};

struct FoldCurveRequest {
    RunContext context;
    std::vector<double> fold_state;
    std::string param1_name;
    double param1_value{};
    std::string param2_name;
    double param2_value{};
};

struct HopfCurveRequest {
    RunContext context;
    std::vector<double> hopf_state;
    double hopf_omega{1.0};
    std::string param1_name;
    double param1_value{};
    std::string param2_name;
    double param2_value{};
};

enum class CycleCurveKind : std::uint8_t { kLPC, kPD, kNS, kIsochrone };

// Two-parameter continuation of a limit-cycle bifurcation (or of a fixed
// period, for isochrones).
struct CycleCurveRequest {
    RunContext context;
    CycleCurveKind kind{CycleCurveKind::kLPC};
    std::vector<double> lc_state;
    double period{};
    std::string param1_name;
    double param1_value{};
    std::string param2_name;
    double param2_value{};
    SizeType ntst{20};
    SizeType ncol{4};
    // Neimark-Sacker only: cos of the multiplier angle.
    double initial_k{};
};

using JobPayload = std::variant<EquilibriumRequest,
                                ExtensionRequest,
                                LimitCycleFromHopfRequest,
                                LimitCycleFromOrbitRequest,
                                LimitCycleFromPDRequest,
                                MapCycleFromPDRequest,
                                HomoclinicFromLargeCycleRequest,
                                HomoclinicFromHomoclinicRequest,
                                HomoclinicFromHomotopySaddleRequest,
                                HomotopySaddleRequest,
                                FoldCurveRequest,
                                HopfCurveRequest,
                                CycleCurveRequest>;

using JobResult = std::variant<wire::BranchPayload, wire::CurvePayload>;

// Name used in logs and progress labels, e.g. "equilibrium".
[[nodiscard]] std::string_view payload_name(const JobPayload& payload) noexcept;
[[nodiscard]] std::string_view to_string(CycleCurveKind kind) noexcept;
[[nodiscard]] const RunContext& context_of(const JobPayload& payload) noexcept;

} // namespace cobra::engine
