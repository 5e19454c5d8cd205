#include <cstdint>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "cobra/branch/branch_data.hpp"
#include "cobra/branch/branch_type.hpp"
#include "cobra/branch/continuation_kind.hpp"
#include "cobra/branch/point.hpp"
#include "cobra/exceptions.hpp"

using namespace cobra;
using namespace cobra::branch;

namespace {

ContinuationBranchData make_branch(std::vector<std::int64_t> labels) {
    ContinuationBranchData data;
    for (SizeType i = 0; i < labels.size(); ++i) {
        data.points.push_back(ContinuationPoint{
            .state       = {static_cast<double>(i)},
            .param_value = static_cast<double>(i) * 0.5});
    }
    data.indices = to_logical(labels);
    return data;
}

} // namespace

TEST_CASE("sequential_indices", "[branch]") {
    const auto indices = sequential_indices(4);
    REQUIRE(logical_values(indices) == std::vector<std::int64_t>{0, 1, 2, 3});
    REQUIRE(sequential_indices(0).empty());
}

TEST_CASE("ensure_indices", "[branch]") {
    SECTION("Regenerates mismatched indices") {
        auto data    = make_branch({0, 1, 2});
        data.indices = to_logical(std::vector<std::int64_t>{5});
        ensure_indices(data);
        REQUIRE(logical_values(data.indices) ==
                std::vector<std::int64_t>{0, 1, 2});
    }
    SECTION("Keeps matching indices") {
        auto data = make_branch({-3, 7, 2});
        ensure_indices(data);
        REQUIRE(logical_values(data.indices) ==
                std::vector<std::int64_t>{-3, 7, 2});
    }
}

TEST_CASE("is_consistent", "[branch]") {
    auto data = make_branch({0, 1, 2});
    REQUIRE(is_consistent(data));

    SECTION("Index length mismatch") {
        data.indices.pop_back();
        REQUIRE_FALSE(is_consistent(data));
    }
    SECTION("Bifurcation out of range") {
        data.bifurcations = {ArrayIndex{3}};
        REQUIRE_FALSE(is_consistent(data));
    }
    SECTION("Seed endpoint must resolve") {
        data.resume_state = ResumeState{
            .max_index_seed = EndpointSeed{.endpoint_index = LogicalIndex{9}}};
        REQUIRE_FALSE(is_consistent(data));
        data.resume_state->max_index_seed->endpoint_index = LogicalIndex{2};
        REQUIRE(is_consistent(data));
    }
}

TEST_CASE("sorted_array_order", "[branch]") {
    const auto indices = to_logical(std::vector<std::int64_t>{3, -1, 0, -1});
    const auto order   = sorted_array_order(indices);
    const std::vector<ArrayIndex> expected = {ArrayIndex{1}, ArrayIndex{3},
                                              ArrayIndex{2}, ArrayIndex{0}};
    REQUIRE(order == expected);
}

TEST_CASE("select_frontier", "[branch]") {
    SECTION("Uses logical order, not array order") {
        const auto data = make_branch({-1, 0, 1, -2, -3});
        const auto fwd  = select_frontier(data, Direction::kForward);
        REQUIRE(fwd.has_value());
        REQUIRE(fwd->array_index == ArrayIndex{2});
        REQUIRE(fwd->logical_index == LogicalIndex{1});
        const auto bwd = select_frontier(data, Direction::kBackward);
        REQUIRE(bwd.has_value());
        REQUIRE(bwd->array_index == ArrayIndex{4});
        REQUIRE(bwd->logical_index == LogicalIndex{-3});
    }
    SECTION("Empty branch") {
        REQUIRE_FALSE(
            select_frontier(ContinuationBranchData{}, Direction::kForward));
    }
}

TEST_CASE("find_array_index and point_at", "[branch]") {
    const auto data = make_branch({10, 11, 12});
    REQUIRE(find_array_index(data, LogicalIndex{11}) == ArrayIndex{1});
    REQUIRE_FALSE(find_array_index(data, LogicalIndex{0}).has_value());
    REQUIRE(point_at(data, ArrayIndex{2}).param_value == 1.0);
    REQUIRE_THROWS_AS(point_at(data, ArrayIndex{3}),
                      error_check::DetailedException);
}

TEST_CASE("drop_dangling_seeds", "[branch]") {
    auto data         = make_branch({0, 1});
    data.resume_state = ResumeState{
        .min_index_seed = EndpointSeed{.endpoint_index = LogicalIndex{0}},
        .max_index_seed = EndpointSeed{.endpoint_index = LogicalIndex{4}}};
    drop_dangling_seeds(data);
    REQUIRE(data.resume_state.has_value());
    REQUIRE(data.resume_state->min_index_seed.has_value());
    REQUIRE_FALSE(data.resume_state->max_index_seed.has_value());

    data.resume_state->min_index_seed->endpoint_index = LogicalIndex{-1};
    drop_dangling_seeds(data);
    REQUIRE_FALSE(data.resume_state.has_value());
}

TEST_CASE("HomoclinicContext validity", "[branch]") {
    HomoclinicContext context{.base_params  = {1.0, 2.0},
                              .param1_index = 0,
                              .param2_index = 1,
                              .fixed_time   = 20.0,
                              .fixed_eps0   = 0.01,
                              .fixed_eps1   = 0.1};
    REQUIRE(context.is_valid());
    context.param2_index = 2;
    REQUIRE_FALSE(context.is_valid());
    context.param2_index = 1;
    context.fixed_eps0   = 0.0;
    REQUIRE_FALSE(context.is_valid());
}

TEST_CASE("Bifurcation tags", "[branch]") {
    REQUIRE(to_string(BifurcationType::kPeriodDoubling) == "PeriodDoubling");
    REQUIRE(parse_bifurcation_type("NeimarkSacker") ==
            BifurcationType::kNeimarkSacker);
    REQUIRE(parse_bifurcation_type("NotATag") == BifurcationType::kNone);
    REQUIRE(display_label(BifurcationType::kCycleFold) == "Cycle Fold");
    REQUIRE(display_label(BifurcationType::kNone) == "Unknown");
    REQUIRE(format_bifurcation_label(12, BifurcationType::kHopf) ==
            "Index 12 - Hopf");
    REQUIRE(is_codim2(BifurcationType::kBogdanovTakens));
    REQUIRE_FALSE(is_codim2(BifurcationType::kFold));
}

TEST_CASE("Branch types", "[branch]") {
    SECTION("Curve parameter names") {
        const BranchType fold = FoldCurve{.param1_name = "a",
                                          .param2_name = "b"};
        REQUIRE(kind_name(fold) == "FoldCurve");
        REQUIRE(param1_name(fold) == std::optional<std::string>("a"));
        REQUIRE(param2_name(fold) == std::optional<std::string>("b"));
        REQUIRE_FALSE(mesh(fold).has_value());
    }
    SECTION("Meshes") {
        const BranchType cycle = LimitCycle{.ntst = 30, .ncol = 5};
        REQUIRE(mesh(cycle) == Mesh{.ntst = 30, .ncol = 5});
        REQUIRE_FALSE(param1_name(cycle).has_value());
        const BranchType lpc =
            LPCCurve{{.param1_name = "a", .param2_name = "b", .ntst = 12,
                      .ncol = 3}};
        REQUIRE(kind_name(lpc) == "LPCCurve");
        REQUIRE(mesh(lpc) == Mesh{.ntst = 12, .ncol = 3});
    }
    SECTION("Homotopy stages") {
        REQUIRE(to_string(HomotopyStage::kStageD) == "StageD");
        REQUIRE(parse_homotopy_stage("StageB") == HomotopyStage::kStageB);
        REQUIRE_FALSE(parse_homotopy_stage("StageE").has_value());
    }
}

TEST_CASE("Branch kinds", "[branch]") {
    REQUIRE(to_string(BranchKind::kHomotopySaddleCurve) ==
            "homotopy_saddle_curve");
    REQUIRE(parse_branch_kind("pd_curve") == BranchKind::kPDCurve);
    REQUIRE_FALSE(parse_branch_kind("torus").has_value());
    REQUIRE(is_cycle_kind(BranchKind::kLimitCycle));
    REQUIRE(is_cycle_kind(BranchKind::kNSCurve));
    REQUIRE_FALSE(is_cycle_kind(BranchKind::kHopfCurve));
    REQUIRE(is_two_parameter(BranchKind::kFoldCurve));
    REQUIRE_FALSE(is_two_parameter(BranchKind::kLimitCycle));
}
