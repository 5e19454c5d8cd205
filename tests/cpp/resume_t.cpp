#include <cmath>
#include <cstdint>
#include <limits>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "cobra/branch/branch_data.hpp"
#include "cobra/seeds/resume.hpp"

using namespace cobra;
using namespace cobra::branch;
using Catch::Matchers::WithinAbs;

namespace {

EndpointSeed good_seed(std::int64_t endpoint) {
    return EndpointSeed{.endpoint_index = LogicalIndex{endpoint},
                        .aug_state      = {0.5, 1.0},
                        .tangent        = {0.0, 1.0},
                        .step_size      = 0.01};
}

ContinuationBranchData homoclinic_source() {
    ContinuationBranchData data;
    data.points = {
        {.state = {1.0}, .param_value = 0.0},
        {.state = {2.0}, .param_value = 0.1},
        {.state = {3.0}, .param_value = 0.2},
    };
    data.indices      = sequential_indices(3);
    data.bifurcations = {ArrayIndex{1}};
    data.resume_state = ResumeState{.min_index_seed = good_seed(0),
                                    .max_index_seed = good_seed(2)};
    return data;
}

ContinuationBranchData homoclinic_extension() {
    ContinuationBranchData data;
    data.points = {
        {.state = {3.0}, .param_value = 0.2},
        {.state = {4.0}, .param_value = 0.3},
        {.state = {5.0}, .param_value = 0.4},
    };
    data.indices      = sequential_indices(3);
    data.bifurcations = {ArrayIndex{0}, ArrayIndex{2}};
    data.resume_state = ResumeState{.max_index_seed = good_seed(2)};
    return data;
}

} // namespace

TEST_CASE("augmented_state", "[resume]") {
    const ContinuationPoint point{.state = {1.0, 2.0}, .param_value = 0.5};
    REQUIRE(seeds::augmented_state(point) == std::vector<double>{0.5, 1.0, 2.0});

    SECTION("Empty state") {
        REQUIRE(seeds::augmented_state(ContinuationPoint{}).empty());
    }
    SECTION("Non-finite entries") {
        ContinuationPoint bad = point;
        bad.state[1]          = std::numeric_limits<double>::infinity();
        REQUIRE(seeds::augmented_state(bad).empty());
        bad             = point;
        bad.param_value = std::nan("");
        REQUIRE(seeds::augmented_state(bad).empty());
    }
}

TEST_CASE("normalized", "[resume]") {
    const std::vector<double> v = {3.0, 4.0};
    const auto unit             = seeds::normalized(v);
    REQUIRE(unit.has_value());
    REQUIRE_THAT((*unit)[0], WithinAbs(0.6, 1e-12));
    REQUIRE_THAT((*unit)[1], WithinAbs(0.8, 1e-12));

    const std::vector<double> tiny = {1e-14, 0.0};
    REQUIRE_FALSE(seeds::normalized(tiny).has_value());
    REQUIRE_FALSE(seeds::normalized(std::vector<double>{}).has_value());
}

TEST_CASE("validate_resume_seed", "[resume]") {
    const auto seed = good_seed(4);
    REQUIRE_FALSE(seeds::validate_resume_seed(seed, LogicalIndex{4}, 2));
    REQUIRE(seeds::validate_resume_seed(seed, LogicalIndex{3}, 2));
    REQUIRE(seeds::validate_resume_seed(seed, LogicalIndex{4}, 3));

    SECTION("Step size must be positive") {
        auto bad      = seed;
        bad.step_size = 0.0;
        REQUIRE(seeds::validate_resume_seed(bad, LogicalIndex{4}, 2));
    }
    SECTION("Tangent must not be degenerate") {
        auto bad    = seed;
        bad.tangent = {0.0, 0.0};
        REQUIRE(seeds::validate_resume_seed(bad, LogicalIndex{4}, 2));
    }
    SECTION("Values must be finite") {
        auto bad         = seed;
        bad.aug_state[0] = std::nan("");
        REQUIRE(seeds::validate_resume_seed(bad, LogicalIndex{4}, 2));
    }
}

TEST_CASE("select_resume_seed", "[resume]") {
    ContinuationBranchData data;
    data.points.resize(3);
    data.indices      = to_logical(std::vector<std::int64_t>{-1, 0, 1});
    data.resume_state = ResumeState{.min_index_seed = good_seed(-1),
                                    .max_index_seed = good_seed(1)};

    const auto fwd = seeds::select_resume_seed(data, Direction::kForward,
                                               LogicalIndex{1}, 2);
    REQUIRE(fwd.has_value());
    REQUIRE(fwd->endpoint_index == LogicalIndex{1});
    const auto bwd = seeds::select_resume_seed(data, Direction::kBackward,
                                               LogicalIndex{-1}, 2);
    REQUIRE(bwd.has_value());
    REQUIRE(bwd->endpoint_index == LogicalIndex{-1});

    SECTION("Mismatched endpoint is rejected") {
        REQUIRE_FALSE(seeds::select_resume_seed(data, Direction::kForward,
                                                LogicalIndex{0}, 2));
    }
    SECTION("No resume state") {
        data.resume_state.reset();
        REQUIRE_FALSE(seeds::select_resume_seed(data, Direction::kForward,
                                                LogicalIndex{1}, 2));
    }
}

TEST_CASE("merge_homoclinic_extension", "[resume]") {
    SECTION("Forward merge appends past the endpoint") {
        const auto merged = seeds::merge_homoclinic_extension(
            homoclinic_source(), homoclinic_extension(), LogicalIndex{2},
            Direction::kForward);
        REQUIRE(merged.size() == 5);
        REQUIRE(logical_values(merged.indices) ==
                std::vector<std::int64_t>{0, 1, 2, 3, 4});
        REQUIRE(merged.points[3].param_value == 0.3);
        REQUIRE(merged.bifurcations ==
                std::vector<ArrayIndex>{ArrayIndex{1}, ArrayIndex{4}});
        REQUIRE(merged.resume_state.has_value());
        REQUIRE(merged.resume_state->min_index_seed ==
                std::optional<EndpointSeed>(good_seed(0)));
        REQUIRE(merged.resume_state->max_index_seed.has_value());
        REQUIRE(merged.resume_state->max_index_seed->endpoint_index ==
                LogicalIndex{4});
        REQUIRE(is_consistent(merged));
    }

    SECTION("Backward merge counts down from the endpoint") {
        auto extension         = homoclinic_extension();
        extension.resume_state = ResumeState{.min_index_seed = good_seed(-2)};
        extension.indices =
            to_logical(std::vector<std::int64_t>{0, -1, -2});
        const auto merged = seeds::merge_homoclinic_extension(
            homoclinic_source(), extension, LogicalIndex{0},
            Direction::kBackward);
        REQUIRE(logical_values(merged.indices) ==
                std::vector<std::int64_t>{0, 1, 2, -1, -2});
        REQUIRE(merged.resume_state->min_index_seed->endpoint_index ==
                LogicalIndex{-2});
        REQUIRE(merged.resume_state->max_index_seed ==
                std::optional<EndpointSeed>(good_seed(2)));
        const auto frontier = select_frontier(merged, Direction::kBackward);
        REQUIRE(frontier->array_index == ArrayIndex{4});
    }

    SECTION("Extension without a seed clears the stale slot") {
        auto extension = homoclinic_extension();
        extension.resume_state.reset();
        const auto merged = seeds::merge_homoclinic_extension(
            homoclinic_source(), extension, LogicalIndex{2},
            Direction::kForward);
        REQUIRE(merged.resume_state.has_value());
        REQUIRE_FALSE(merged.resume_state->max_index_seed.has_value());
        REQUIRE(merged.resume_state->min_index_seed.has_value());
    }
}
