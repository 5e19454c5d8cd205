#include <cmath>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "cobra/config/system.hpp"
#include "cobra/exceptions.hpp"
#include "cobra/params/subsystem.hpp"

using namespace cobra;
using namespace cobra::params;
using Catch::Matchers::StartsWith;

namespace {

config::SystemConfig make_system() {
    return config::SystemConfig{.name        = "sys",
                                .equations   = {"a * x - y", "x * y - z",
                                                "b * z + x"},
                                .params      = {1.0, 2.0},
                                .param_names = {"a", "b"},
                                .var_names   = {"x", "y", "z"}};
}

} // namespace

TEST_CASE("build_subsystem_snapshot", "[subsystem]") {
    const auto system = make_system();

    SECTION("Freezing a variable") {
        const auto snapshot = build_subsystem_snapshot(
            system, FrozenVariables{.values_by_var = {{"y", 0.5}}});
        REQUIRE(snapshot.free_variable_names ==
                std::vector<std::string>{"x", "z"});
        REQUIRE(snapshot.free_variable_indices ==
                std::vector<SizeType>{0, 2});
        REQUIRE(snapshot.frozen_param_names_by_var.at("y") == "fv__y");
        REQUIRE(snapshot.is_frozen("y"));
        REQUIRE_FALSE(snapshot.is_frozen("x"));
        REQUIRE_THAT(snapshot.hash, StartsWith("ss:"));
        REQUIRE(snapshot.hash.size() == 11);
    }
    SECTION("Hash is stable and content dependent") {
        const FrozenVariables frozen{.values_by_var = {{"y", 0.5}}};
        const auto a = build_subsystem_snapshot(system, frozen);
        const auto b = build_subsystem_snapshot(system, frozen);
        REQUIRE(a.hash == b.hash);
        const auto c = build_subsystem_snapshot(
            system, FrozenVariables{.values_by_var = {{"y", 0.25}}});
        REQUIRE(a.hash != c.hash);
    }
    SECTION("Generated names avoid existing parameters") {
        auto clashing = system;
        clashing.param_names.push_back("fv__y");
        clashing.params.push_back(0.0);
        const auto snapshot = build_subsystem_snapshot(
            clashing, FrozenVariables{.values_by_var = {{"y", 0.5}}});
        REQUIRE(snapshot.frozen_param_names_by_var.at("y") == "fv__y_1");
    }
    SECTION("Unknown and non-finite entries are normalised") {
        const auto snapshot = build_subsystem_snapshot(
            system, FrozenVariables{.values_by_var = {{"q", 1.0},
                                                      {"z", std::nan("")}}});
        REQUIRE(snapshot.frozen_values_by_var.size() == 1);
        REQUIRE(snapshot.frozen_values_by_var.at("z") == 0.0);
    }
    SECTION("At least one free variable") {
        REQUIRE_THROWS_WITH(
            build_subsystem_snapshot(
                system, FrozenVariables{.values_by_var = {{"x", 1.0},
                                                          {"y", 1.0},
                                                          {"z", 1.0}}}),
            "At least one free variable is required.");
        REQUIRE_THROWS_AS(
            build_subsystem_snapshot(system, FrozenVariables{},
                                     {.max_free_variables = 2}),
            ValidationError);
    }
}

TEST_CASE("build_reduced_run_config", "[subsystem]") {
    const auto system   = make_system();
    const auto snapshot = build_subsystem_snapshot(
        system, FrozenVariables{.values_by_var = {{"y", 0.5}}});
    const std::vector<double> values = {3.0, 4.0};

    const auto reduced = build_reduced_run_config(system, snapshot, values);
    REQUIRE(reduced.var_names == std::vector<std::string>{"x", "z"});
    REQUIRE(reduced.param_names ==
            std::vector<std::string>{"a", "b", "fv__y"});
    REQUIRE(reduced.params == std::vector<double>{3.0, 4.0, 0.5});
    REQUIRE(reduced.equations ==
            std::vector<std::string>{"a * x - fv__y", "b * z + x"});

    SECTION("Incompatible snapshots are rejected") {
        auto changed = system;
        changed.var_names.push_back("w");
        REQUIRE_FALSE(is_snapshot_compatible(changed, snapshot));
        REQUIRE_THROWS_AS(build_reduced_run_config(changed, snapshot),
                          ValidationError);
    }
}

TEST_CASE("State projection", "[subsystem]") {
    const auto system   = make_system();
    const auto snapshot = build_subsystem_snapshot(
        system, FrozenVariables{.values_by_var = {{"y", 0.5}}});
    const std::vector<double> full = {1.0, 2.0, 3.0};

    REQUIRE(project_state_to_reduced(snapshot, full) ==
            std::vector<double>{1.0, 3.0});
    REQUIRE_THROWS_WITH(
        project_state_to_reduced(snapshot, std::vector<double>{1.0}),
        "State dimension mismatch while projecting to reduced subsystem.");

    const std::vector<double> reduced = {7.0, std::nan("")};
    REQUIRE(embed_reduced_state(snapshot, reduced) ==
            std::vector<double>{7.0, 0.5, 0.0});

    SECTION("Frozen continuation parameter overrides its slot") {
        const FrozenStateOverrides overrides{
            .parameter_ref = ParameterRef{FrozenVar{"y"}},
            .param_value   = 0.9};
        REQUIRE(embed_reduced_state(snapshot, std::vector<double>{7.0, 8.0},
                                    overrides) ==
                std::vector<double>{7.0, 0.9, 8.0});
    }
    SECTION("Display states") {
        REQUIRE(state_to_display(snapshot, full) == full);
        REQUIRE(state_to_display(snapshot, std::vector<double>{7.0, 8.0}) ==
                std::vector<double>{7.0, 0.5, 8.0});
    }
}

TEST_CASE("Parameter references", "[subsystem]") {
    const auto system   = make_system();
    const auto snapshot = build_subsystem_snapshot(
        system, FrozenVariables{.values_by_var = {{"y", 0.5}}});

    const auto native = parse_parameter_ref_label(system, snapshot, "b");
    REQUIRE(native == ParameterRef{NativeParam{"b"}});
    REQUIRE(resolve_runtime_parameter_name(snapshot, native) == "b");

    const auto frozen = parse_parameter_ref_label(system, snapshot, "var:y");
    REQUIRE(frozen == ParameterRef{FrozenVar{"y"}});
    REQUIRE(format_parameter_ref_label(frozen) == "var:y");
    REQUIRE(resolve_runtime_parameter_name(snapshot, frozen) == "fv__y");

    REQUIRE_THROWS_WITH(parse_parameter_ref_label(system, snapshot, "var:x"),
                        "Select a valid frozen variable.");
    REQUIRE_THROWS_WITH(parse_parameter_ref_label(system, snapshot, "c"),
                        "Select a valid continuation parameter.");

    const auto options = continuation_parameter_options(system, snapshot);
    REQUIRE(options.size() == 3);
    REQUIRE(options.back().label == "var:y");
}

TEST_CASE("resolve_subsystem_snapshot", "[subsystem]") {
    const auto system = make_system();
    const auto stored = build_subsystem_snapshot(
        system, FrozenVariables{.values_by_var = {{"y", 0.5}}});
    const FrozenVariables fallback{.values_by_var = {{"z", 1.0}}};

    REQUIRE(resolve_subsystem_snapshot(system, stored, fallback) == stored);

    auto changed = system;
    changed.param_names.push_back("c");
    changed.params.push_back(0.0);
    const auto rebuilt = resolve_subsystem_snapshot(changed, stored, fallback);
    REQUIRE(rebuilt.is_frozen("z"));
    REQUIRE_FALSE(rebuilt.is_frozen("y"));
}
