#include <cmath>
#include <cstdint>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "cobra/branch/continuation_object.hpp"
#include "cobra/wire/codec.hpp"

using namespace cobra;
using namespace cobra::wire;
using cobra::branch::Eigenvalue;

TEST_CASE("coerce_scalar", "[codec]") {
    REQUIRE(coerce_scalar(Scalar{}) == 0.0);
    REQUIRE(coerce_scalar(Scalar{2.5}) == 2.5);
    REQUIRE(coerce_scalar(Scalar{std::string("-1.25")}) == -1.25);
    REQUIRE(coerce_scalar(Scalar{std::string("  +3e2 ")}) == 300.0);
    REQUIRE(coerce_scalar(Scalar{std::string("12abc")}) == 0.0);
    REQUIRE(coerce_scalar(Scalar{std::string("")}) == 0.0);
    REQUIRE(coerce_scalar(Scalar{std::string("nope")}) == 0.0);
}

TEST_CASE("normalize_eigenvalue_array", "[codec]") {
    SECTION("Absent array") {
        REQUIRE(normalize_eigenvalue_array(std::nullopt).empty());
    }
    SECTION("Mixed wire shapes") {
        const std::vector<RawEigenvalue> raw = {
            RawEigenvalue{},
            StructuredEigenvalue{.re = std::string("5"), .im = 6.0},
        };
        const auto out = normalize_eigenvalue_array(raw);
        const std::vector<Eigenvalue> expected = {{0.0, 0.0}, {5.0, 6.0}};
        REQUIRE(out == expected);
    }
    SECTION("Tuples") {
        const std::vector<RawEigenvalue> raw = {
            std::vector<Scalar>{1.0, -2.0},
            std::vector<Scalar>{3.0},
            std::vector<Scalar>{},
            std::vector<Scalar>{std::string("x"), std::string("0.5")},
        };
        const auto out = normalize_eigenvalue_array(raw);
        const std::vector<Eigenvalue> expected = {
            {1.0, -2.0}, {3.0, 0.0}, {0.0, 0.0}, {0.0, 0.5}};
        REQUIRE(out == expected);
    }
    SECTION("Structured with missing fields") {
        const std::vector<RawEigenvalue> raw = {
            StructuredEigenvalue{.re = 1.5}};
        const auto out = normalize_eigenvalue_array(raw);
        REQUIRE(out == std::vector<Eigenvalue>{{1.5, 0.0}});
    }
}

TEST_CASE("Branch payload round trip", "[codec]") {
    branch::ContinuationBranchData data;
    data.points = {
        {.state       = {1.0, 2.0},
         .param_value = 0.1,
         .stability   = branch::BifurcationType::kNone,
         .eigenvalues = {{-1.0, 0.5}, {-1.0, -0.5}}},
        {.state       = {1.1, 2.1},
         .param_value = 0.2,
         .stability   = branch::BifurcationType::kHopf,
         .eigenvalues = {{0.0, 1.0}, {0.0, -1.0}}},
        {.state        = {1.2, 2.2},
         .param_value  = 0.3,
         .param2_value = 4.0,
         .auxiliary    = 7.0},
    };
    data.indices      = branch::to_logical(std::vector<std::int64_t>{-1, 0, 1});
    data.bifurcations = {ArrayIndex{1}};
    data.branch_type  = branch::Equilibrium{};
    data.resume_state = branch::ResumeState{
        .max_index_seed = branch::EndpointSeed{.endpoint_index = LogicalIndex{1},
                                               .aug_state = {0.3, 1.2, 2.2},
                                               .tangent   = {1.0, 0.0, 0.0},
                                               .step_size = 0.01}};
    data.upoldp = std::vector<std::vector<double>>{{0.1, 1.0, 2.0}};

    const auto payload = serialize_branch_data(data);
    REQUIRE(payload.points.size() == 3);
    REQUIRE(payload.points[1].stability == "Hopf");
    REQUIRE(payload.bifurcations == std::vector<std::int64_t>{1});
    REQUIRE(payload.indices == std::vector<std::int64_t>{-1, 0, 1});

    const auto restored = normalize_branch_eigenvalues(payload);
    REQUIRE(restored.points == data.points);
    REQUIRE(restored.indices == data.indices);
    REQUIRE(restored.bifurcations == data.bifurcations);
    REQUIRE(restored.branch_type == data.branch_type);
    REQUIRE(restored.resume_state == data.resume_state);
    REQUIRE(restored.upoldp == data.upoldp);
    REQUIRE(branch::is_consistent(restored));
}

TEST_CASE("normalize_branch_eigenvalues repairs payloads", "[codec]") {
    BranchPayload payload;
    payload.points.resize(3);
    payload.indices      = std::vector<std::int64_t>{4, 5};
    payload.bifurcations = {-1, 0, 2, 3};
    payload.resume_state = branch::ResumeState{
        .min_index_seed = branch::EndpointSeed{.endpoint_index = LogicalIndex{4}},
        .max_index_seed =
            branch::EndpointSeed{.endpoint_index = LogicalIndex{2}}};

    const auto data = normalize_branch_eigenvalues(payload);
    REQUIRE(branch::logical_values(data.indices) ==
            std::vector<std::int64_t>{0, 1, 2});
    REQUIRE(data.bifurcations ==
            std::vector<ArrayIndex>{ArrayIndex{0}, ArrayIndex{2}});
    REQUIRE(data.resume_state.has_value());
    REQUIRE_FALSE(data.resume_state->min_index_seed.has_value());
    REQUIRE(data.resume_state->max_index_seed.has_value());
    REQUIRE(data.points[0].eigenvalues.empty());
    REQUIRE(branch::is_consistent(data));
}

TEST_CASE("serialize_branch_data for limit cycle objects", "[codec]") {
    branch::ContinuationObject object;
    object.branch_kind = branch::BranchKind::kLimitCycle;
    object.data.points.resize(2);

    SECTION("Missing mesh uses the default") {
        const auto payload = serialize_branch_data(object);
        REQUIRE(payload.branch_type ==
                std::optional<branch::BranchType>(
                    branch::LimitCycle{.ntst = 20, .ncol = 4}));
    }
    SECTION("Stored mesh is kept") {
        object.data.branch_type = branch::LimitCycle{.ntst = 60, .ncol = 5};
        const auto payload      = serialize_branch_data(object);
        REQUIRE(payload.branch_type ==
                std::optional<branch::BranchType>(
                    branch::LimitCycle{.ntst = 60, .ncol = 5}));
    }
    SECTION("Non-cycle objects are untouched") {
        object.branch_kind = branch::BranchKind::kEquilibrium;
        REQUIRE_FALSE(serialize_branch_data(object).branch_type.has_value());
    }
}

TEST_CASE("curve_to_branch_data", "[codec]") {
    CurvePayload payload;
    payload.points = {
        {.state = {1.0}, .param1_value = 0.5, .param2_value = 2.0},
        {.state        = {1.1},
         .param1_value = 0.6,
         .param2_value = 2.1,
         .codim2_type  = "BogdanovTakens"},
    };
    payload.codim2_bifurcations = {1, 7};
    const branch::BranchType type =
        branch::FoldCurve{.param1_name = "a", .param2_name = "b"};

    const auto data = curve_to_branch_data(payload, type);
    REQUIRE(data.size() == 2);
    REQUIRE(data.points[1].param_value == 0.6);
    REQUIRE(data.points[1].param2_value == std::optional<double>(2.1));
    REQUIRE(data.points[1].stability ==
            branch::BifurcationType::kBogdanovTakens);
    REQUIRE(data.bifurcations == std::vector<ArrayIndex>{ArrayIndex{1}});
    REQUIRE(branch::logical_values(data.indices) ==
            std::vector<std::int64_t>{0, 1});
    REQUIRE(data.branch_type == std::optional<branch::BranchType>(type));
}
