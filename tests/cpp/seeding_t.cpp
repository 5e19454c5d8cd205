#include <cmath>
#include <limits>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "cobra/orchestration/seeding.hpp"

using namespace cobra;
using namespace cobra::orchestration;
using Catch::Matchers::WithinAbs;

TEST_CASE("extract_hopf_omega", "[seeding]") {
    const std::vector<branch::Eigenvalue> eigenvalues = {
        {-3.0, 0.0}, {-0.5, 4.0}, {-0.5, -4.0}, {0.01, 2.0}, {0.01, -2.0}};
    REQUIRE(extract_hopf_omega(eigenvalues) == 2.0);

    const std::vector<branch::Eigenvalue> real_only = {{-1.0, 0.0}, {2.0, 0.0}};
    REQUIRE(extract_hopf_omega(real_only) == 1.0);
    REQUIRE(extract_hopf_omega({}) == 1.0);

    const std::vector<branch::Eigenvalue> with_nan = {
        {std::nan(""), 9.0}, {-0.2, 1.5}};
    REQUIRE(extract_hopf_omega(with_nan) == 1.5);
}

TEST_CASE("ns_initial_k", "[seeding]") {
    const std::vector<branch::Eigenvalue> real = {{0.5, 0.0}, {-0.3, 0.0}};
    REQUIRE(ns_initial_k(real) == 0.0);
    const std::vector<branch::Eigenvalue> complex = {
        {0.5, 0.0}, {0.0, 1.0}, {0.0, -1.0}};
    REQUIRE_THAT(ns_initial_k(complex), WithinAbs(0.0, 1e-12));
    const std::vector<branch::Eigenvalue> rotated = {
        {std::cos(0.5), std::sin(0.5)}};
    REQUIRE_THAT(ns_initial_k(rotated), WithinAbs(std::cos(0.5), 1e-12));
}

TEST_CASE("cycle_period", "[seeding]") {
    REQUIRE(cycle_period(std::vector<double>{1.0, 2.0, 6.5}) ==
            std::optional<double>(6.5));
    REQUIRE_FALSE(cycle_period(std::vector<double>{}).has_value());
    REQUIRE_FALSE(cycle_period(std::vector<double>{1.0, -2.0}).has_value());
    REQUIRE_FALSE(
        cycle_period(std::vector<double>{
                         1.0, std::numeric_limits<double>::infinity()})
            .has_value());
}

TEST_CASE("cycle_mesh", "[seeding]") {
    branch::ContinuationBranchData data;
    REQUIRE(cycle_mesh(data) == branch::kDefaultLimitCycleMesh);

    data.branch_type = branch::LimitCycle{.ntst = 30, .ncol = 5};
    REQUIRE(cycle_mesh(data) == branch::Mesh{.ntst = 30, .ncol = 5});

    data.branch_type = branch::LimitCycle{.ntst = 1, .ncol = 0};
    REQUIRE(cycle_mesh(data) == branch::Mesh{.ntst = 2, .ncol = 4});
}

TEST_CASE("homoclinic_fixed_values", "[seeding]") {
    branch::ContinuationBranchData data;
    auto fixed = homoclinic_fixed_values(data);
    REQUIRE_FALSE(fixed.from_context);
    REQUIRE(fixed.time == 1.0);
    REQUIRE(fixed.eps0 == 0.01);
    REQUIRE(fixed.eps1 == 0.1);

    data.homoc_context = branch::HomoclinicContext{.base_params  = {1.0, 2.0},
                                                   .param1_index = 0,
                                                   .param2_index = 1,
                                                   .fixed_time   = 25.0,
                                                   .fixed_eps0   = 0.02,
                                                   .fixed_eps1   = 0.05};
    fixed = homoclinic_fixed_values(data);
    REQUIRE(fixed.from_context);
    REQUIRE(fixed.time == 25.0);
    REQUIRE(fixed.eps1 == 0.05);

    data.homoc_context->fixed_eps0 = 0.0;
    REQUIRE_FALSE(homoclinic_fixed_values(data).from_context);
}

TEST_CASE("ensure_homoclinic_branch_type", "[seeding]") {
    const branch::HomoclinicCurve fallback{.ntst        = 40,
                                           .ncol        = 4,
                                           .param1_name = "a",
                                           .param2_name = "b"};
    branch::ContinuationBranchData data;
    ensure_homoclinic_branch_type(data, fallback);
    REQUIRE(data.branch_type == std::optional<branch::BranchType>(fallback));

    const branch::HomoclinicCurve reported{.ntst = 12, .ncol = 3};
    data.branch_type = reported;
    ensure_homoclinic_branch_type(data, fallback);
    REQUIRE(data.branch_type == std::optional<branch::BranchType>(reported));

    data.branch_type = branch::LimitCycle{};
    ensure_homoclinic_branch_type(data, fallback);
    REQUIRE(data.branch_type == std::optional<branch::BranchType>(fallback));

    REQUIRE(to_branch_kind(engine::CycleCurveKind::kNS) ==
            branch::BranchKind::kNSCurve);
}
