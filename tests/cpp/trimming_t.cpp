#include <cmath>
#include <cstdint>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>

#include "cobra/branch/branch_data.hpp"
#include "cobra/seeds/trimming.hpp"

using namespace cobra;
using namespace cobra::branch;
using Catch::Matchers::WithinAbs;

namespace {

ContinuationBranchData three_point_branch() {
    ContinuationBranchData data;
    data.points = {
        {.state = {1.0, 1.0}, .param_value = 0.0},
        {.state = {2.0, 2.0}, .param_value = 0.1},
        {.state = {3.0, 3.0}, .param_value = 0.2},
    };
    data.indices = to_logical(std::vector<std::int64_t>{10, 11, 12});
    data.resume_state = ResumeState{
        .max_index_seed = EndpointSeed{.endpoint_index = LogicalIndex{12},
                                       .aug_state      = {0.2, 3.0, 3.0},
                                       .tangent        = {1.0, 0.0, 0.0},
                                       .step_size      = 0.05}};
    return data;
}

double norm(const std::vector<double>& v) {
    double sum = 0.0;
    for (const auto x : v) {
        sum += x * x;
    }
    return std::sqrt(sum);
}

} // namespace

TEST_CASE("discard_initial_approximation_point", "[trimming]") {
    SECTION("Forward trim re-bases indices and remaps seeds") {
        const auto trimmed =
            seeds::discard_initial_approximation_point(three_point_branch());
        REQUIRE(trimmed.size() == 2);
        REQUIRE(logical_values(trimmed.indices) ==
                std::vector<std::int64_t>{0, 1});
        REQUIRE(trimmed.points.front().param_value == 0.1);
        REQUIRE(trimmed.resume_state.has_value());

        const auto& max_seed = trimmed.resume_state->max_index_seed;
        REQUIRE(max_seed.has_value());
        REQUIRE(max_seed->endpoint_index == LogicalIndex{1});
        REQUIRE(max_seed->step_size == 0.05);
        REQUIRE(max_seed->tangent == std::vector<double>{1.0, 0.0, 0.0});

        const auto& min_seed = trimmed.resume_state->min_index_seed;
        REQUIRE(min_seed.has_value());
        REQUIRE(min_seed->endpoint_index == LogicalIndex{0});
        REQUIRE(min_seed->aug_state == std::vector<double>{0.1, 2.0, 2.0});
        REQUIRE(min_seed->step_size == 0.05);
        REQUIRE(min_seed->tangent.size() == 3);
        REQUIRE_THAT(norm(min_seed->tangent), WithinAbs(1.0, 1e-12));
        // Central difference over the dropped point and its second
        // neighbour: (0.2, 2, 2) normalised.
        const double scale = std::sqrt(0.04 + 8.0);
        REQUIRE_THAT(min_seed->tangent[0], WithinAbs(0.2 / scale, 1e-12));
        REQUIRE_THAT(min_seed->tangent[1], WithinAbs(2.0 / scale, 1e-12));

        REQUIRE(trimmed.upoldp ==
                std::optional<std::vector<std::vector<double>>>(
                    std::vector<std::vector<double>>{{0.0, 1.0, 1.0}}));
        REQUIRE(is_consistent(trimmed));
    }

    SECTION("Bifurcations shift and the dropped one disappears") {
        auto data         = three_point_branch();
        data.bifurcations = {ArrayIndex{0}, ArrayIndex{2}};
        const auto trimmed = seeds::discard_initial_approximation_point(data);
        REQUIRE(trimmed.bifurcations == std::vector<ArrayIndex>{ArrayIndex{1}});
    }

    SECTION("Seeds on both retained endpoints survive the re-base") {
        auto data         = three_point_branch();
        data.bifurcations = {ArrayIndex{0}, ArrayIndex{2}};
        data.resume_state->min_index_seed =
            EndpointSeed{.endpoint_index = LogicalIndex{11},
                         .aug_state      = {0.1, 2.0, 2.0},
                         .tangent        = {0.0, 1.0, 0.0},
                         .step_size      = 0.03};
        const auto trimmed = seeds::discard_initial_approximation_point(data);

        REQUIRE(logical_values(trimmed.indices) ==
                std::vector<std::int64_t>{0, 1});
        REQUIRE(trimmed.bifurcations == std::vector<ArrayIndex>{ArrayIndex{1}});
        REQUIRE(trimmed.resume_state.has_value());

        const auto& min_seed = trimmed.resume_state->min_index_seed;
        REQUIRE(min_seed.has_value());
        REQUIRE(min_seed->endpoint_index == LogicalIndex{0});
        REQUIRE(min_seed->tangent == std::vector<double>{0.0, 1.0, 0.0});
        REQUIRE(min_seed->aug_state == std::vector<double>{0.1, 2.0, 2.0});
        REQUIRE(min_seed->step_size == 0.03);

        const auto& max_seed = trimmed.resume_state->max_index_seed;
        REQUIRE(max_seed.has_value());
        REQUIRE(max_seed->endpoint_index == LogicalIndex{1});
        REQUIRE(max_seed->tangent == std::vector<double>{1.0, 0.0, 0.0});
        REQUIRE(max_seed->step_size == 0.05);
        REQUIRE(is_consistent(trimmed));
    }

    SECTION("Explicit step hint wins") {
        const auto trimmed = seeds::discard_initial_approximation_point(
            three_point_branch(), {.step_hint = 0.2});
        REQUIRE(trimmed.resume_state->min_index_seed->step_size == 0.2);
        REQUIRE(trimmed.resume_state->max_index_seed->step_size == 0.05);
    }

    SECTION("Invalid step hint falls back to the default") {
        auto data         = three_point_branch();
        data.resume_state.reset();
        const auto trimmed = seeds::discard_initial_approximation_point(
            data, {.step_hint = -1.0});
        REQUIRE(trimmed.resume_state->min_index_seed->step_size ==
                kDefaultSeedStep);
    }

    SECTION("Backward trim keeps labels") {
        const auto trimmed = seeds::discard_initial_approximation_point(
            three_point_branch(), {.side = Direction::kBackward});
        REQUIRE(logical_values(trimmed.indices) ==
                std::vector<std::int64_t>{10, 11});
        REQUIRE(trimmed.points.back().param_value == 0.1);
        REQUIRE(trimmed.resume_state.has_value());
        const auto& max_seed = trimmed.resume_state->max_index_seed;
        REQUIRE(max_seed.has_value());
        REQUIRE(max_seed->endpoint_index == LogicalIndex{11});
        REQUIRE(max_seed->step_size == 0.05);
        REQUIRE_FALSE(trimmed.resume_state->min_index_seed.has_value());
        REQUIRE(is_consistent(trimmed));
    }

    SECTION("Single point branches are returned unchanged") {
        ContinuationBranchData data;
        data.points  = {{.state = {1.0}, .param_value = 0.5}};
        data.indices = sequential_indices(1);
        const auto trimmed = seeds::discard_initial_approximation_point(data);
        REQUIRE(trimmed.points == data.points);
        REQUIRE(trimmed.indices == data.indices);
        REQUIRE_FALSE(trimmed.upoldp.has_value());
    }

    SECTION("Degenerate tangent leaves the boundary without a seed") {
        ContinuationBranchData data;
        data.points = {
            {.state = {1.0}, .param_value = 0.5},
            {.state = {1.0}, .param_value = 0.5},
            {.state = {1.0}, .param_value = 0.5},
        };
        data.indices       = sequential_indices(3);
        const auto trimmed = seeds::discard_initial_approximation_point(data);
        REQUIRE(trimmed.size() == 2);
        REQUIRE_FALSE(trimmed.resume_state.has_value());
    }

    SECTION("Non-finite states fall back to the secant") {
        auto data               = three_point_branch();
        data.points[0].state[0] = std::nan("");
        data.resume_state.reset();
        const auto trimmed = seeds::discard_initial_approximation_point(data);
        REQUIRE_FALSE(trimmed.upoldp.has_value());
        const auto& min_seed = trimmed.resume_state->min_index_seed;
        REQUIRE(min_seed.has_value());
        // Secant from the second retained point back to the boundary.
        const double scale = std::sqrt(0.01 + 2.0);
        REQUIRE_THAT(min_seed->tangent[0], WithinAbs(-0.1 / scale, 1e-12));
    }
}
