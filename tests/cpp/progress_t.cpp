#include <cmath>
#include <limits>
#include <optional>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "cobra/branch/metrics.hpp"
#include "cobra/branch/summary.hpp"
#include "cobra/exceptions.hpp"
#include "cobra/progress.hpp"

using namespace cobra;
using namespace cobra::branch;
using Catch::Matchers::ContainsSubstring;
using Catch::Matchers::EndsWith;
using Catch::Matchers::StartsWith;
using Catch::Matchers::WithinAbs;

TEST_CASE("format_number", "[summary]") {
    REQUIRE(format_number(1.5) == "1.500");
    REQUIRE(format_number(-2.25) == "-2.250");
    REQUIRE(format_number(0.0) == "0.000");
    REQUIRE(format_number(1e-4) == "1.0000e-04");
    REQUIRE(format_number(12345.0) == "1.2345e+04");
    REQUIRE(format_number(std::nan("")) == "NaN");
    REQUIRE(format_number(std::numeric_limits<double>::infinity()) ==
            "Infinity");
    REQUIRE(format_number(-std::numeric_limits<double>::infinity()) ==
            "-Infinity");
    REQUIRE(format_number_safe(std::nullopt) == "NaN");
    REQUIRE(format_number_safe(2.0) == "2.000");
    REQUIRE(format_array(std::vector<double>{1.0, 2.5}) == "[1.000, 2.500]");
    REQUIRE(format_array(std::vector<double>{}) == "[]");
}

TEST_CASE("summarize_eigenvalues", "[summary]") {
    ContinuationPoint point;
    REQUIRE(summarize_eigenvalues(point, BranchKind::kEquilibrium) ==
            "Eigenvalues: []");

    point.eigenvalues = {{0.1, 0.0}, {-1.0, 2.0}};
    REQUIRE(summarize_eigenvalues(point, BranchKind::kEquilibrium) ==
            "Eigenvalues: 0.100+0.000i, -1.000+2.000i");
    REQUIRE_THAT(summarize_eigenvalues(point, BranchKind::kLimitCycle),
                 StartsWith("Multipliers: "));

    point.eigenvalues.emplace_back(3.0, 0.0);
    point.eigenvalues.emplace_back(4.0, 0.0);
    const auto text = summarize_eigenvalues(point, BranchKind::kEquilibrium);
    REQUIRE_THAT(text, EndsWith(" …"));
    REQUIRE_FALSE(text.find("4.000") != std::string::npos);
}

TEST_CASE("Branch summaries", "[summary]") {
    ContinuationObject object;
    object.name           = "eq_a";
    object.system_name    = "sys";
    object.parent_object  = "eq";
    object.parameter_name = "a";
    object.data.points    = {
        {.state = {0.0}, .param_value = 0.0},
        {.state = {1.0}, .param_value = 0.5, .stability = BifurcationType::kHopf},
        {.state = {2.0}, .param_value = 1.5},
    };
    object.data.indices      = sequential_indices(3);
    object.data.bifurcations = {ArrayIndex{1}};

    const auto summary = summarize_branch(object.data);
    REQUIRE(summary.point_count == 3);
    REQUIRE(summary.min_index == std::optional<LogicalIndex>(LogicalIndex{0}));
    REQUIRE(summary.max_index == std::optional<LogicalIndex>(LogicalIndex{2}));
    REQUIRE(summary.param_min == std::optional<double>(0.0));
    REQUIRE(summary.param_max == std::optional<double>(1.5));
    REQUIRE(summary.bifurcation_count == 1);
    REQUIRE_FALSE(summary.resumable_forward);

    const auto text = describe_branch(object);
    REQUIRE_THAT(text, StartsWith("Branch eq_a (equilibrium) of eq in sys"));
    REQUIRE_THAT(text, ContainsSubstring("Points: 3 (indices 0..2)"));
    REQUIRE_THAT(text, ContainsSubstring("Range: [0.000, 1.500]"));
    REQUIRE_THAT(text, ContainsSubstring("Index 1 - Hopf at 0.500"));

    SECTION("Empty branches") {
        const auto empty = summarize_branch(ContinuationBranchData{});
        REQUIRE(empty.point_count == 0);
        REQUIRE_FALSE(empty.min_index.has_value());
        REQUIRE_FALSE(empty.param_min.has_value());
    }
    SECTION("Resume seeds") {
        object.data.resume_state = ResumeState{
            .max_index_seed = EndpointSeed{.endpoint_index = LogicalIndex{2},
                                           .aug_state = {1.5, 2.0},
                                           .tangent   = {1.0, 0.0},
                                           .step_size = 0.01}};
        const auto seeded = summarize_branch(object.data);
        REQUIRE(seeded.resumable_forward);
        REQUIRE_FALSE(seeded.resumable_backward);
    }
}

TEST_CASE("Limit cycle metrics", "[metrics]") {
    const std::vector<double> state = {0.0, 1.0, 2.0, 3.0, 4.0, 5.0, 6.0};
    const auto profile = extract_lc_profile(state, 2, 1, 2);
    REQUIRE(profile.points.size() == 3);
    REQUIRE(profile.points[1] == std::vector<double>{2.0, 3.0});
    REQUIRE(profile.period == 6.0);

    const auto metrics = compute_lc_metrics(profile);
    REQUIRE(metrics.period == 6.0);
    REQUIRE(metrics.ranges.size() == 2);
    REQUIRE(metrics.ranges[0].min == 0.0);
    REQUIRE(metrics.ranges[0].max == 4.0);
    REQUIRE(metrics.ranges[1].range == 4.0);
    REQUIRE_THAT(metrics.means[1], WithinAbs(3.0, 1e-12));
    REQUIRE_THAT(metrics.rms_amplitudes[0],
                 WithinAbs(std::sqrt(8.0 / 3.0), 1e-12));

    REQUIRE_THROWS_AS(extract_lc_profile(state, 2, 2, 2),
                      error_check::DetailedException);
    REQUIRE(compute_lc_metrics(CycleProfile{}).ranges.empty());
}

TEST_CASE("interpret_lc_stability", "[metrics]") {
    REQUIRE(interpret_lc_stability({}) == "unknown");
    const std::vector<Eigenvalue> stable = {{1.0, 0.0}, {0.5, 0.0}};
    REQUIRE(interpret_lc_stability(stable) == "stable");
    const std::vector<Eigenvalue> saddle = {{1.0, 0.0}, {1.5, 0.0}, {2.0, 0.0}};
    REQUIRE(interpret_lc_stability(saddle) == "unstable (2D)");
    const std::vector<Eigenvalue> torus = {{1.0, 0.0}, {0.9, 0.9}, {0.9, -0.9}};
    REQUIRE(interpret_lc_stability(torus) == "unstable (torus)");
}

TEST_CASE("ProgressReporter", "[progress]") {
    progress::ProgressReporter reporter("Equilibrium continuation", false);
    REQUIRE(reporter.updates() == 0);
    const engine::Progress first{.current_step = 0, .max_steps = 10};
    const engine::Progress last{.done            = true,
                                .current_step    = 10,
                                .max_steps       = 10,
                                .points_computed = 11};
    reporter.update(first);
    reporter.update(last);
    reporter.finish();
    REQUIRE(reporter.updates() == 2);
    REQUIRE(reporter.last() == last);
}

TEST_CASE("ContinuationBar", "[progress]") {
    auto bar = progress::make_continuation_bar("Fold curve", 10, true);
    bar->set_points(7);
    bar->set_bifurcations(2);
    bar->set_progress(5);
    REQUIRE(bar->get_progress() == 5);
    REQUIRE_FALSE(bar->is_completed());
    const auto line = bar->to_string();
    REQUIRE_THAT(line, ContainsSubstring("Fold curve"));
    REQUIRE_THAT(line, ContainsSubstring("50%"));
    REQUIRE_THAT(line, ContainsSubstring("Points: 7"));
    REQUIRE_THAT(line, ContainsSubstring("Bifurcations: 2"));
    bar->mark_as_completed();
    REQUIRE(bar->is_completed());
}
