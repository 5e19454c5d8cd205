#include <cmath>
#include <limits>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "cobra/config/settings.hpp"
#include "cobra/config/system.hpp"
#include "cobra/exceptions.hpp"

using namespace cobra;
using namespace cobra::config;
using Catch::Matchers::ContainsSubstring;

namespace {

SystemConfig valid_system() {
    return SystemConfig{.name        = "lorenz",
                        .equations   = {"s * (y - x)", "x * (r - z) - y",
                                        "x * y - b * z"},
                        .params      = {10.0, 28.0, 8.0 / 3.0},
                        .param_names = {"s", "r", "b"},
                        .var_names   = {"x", "y", "z"}};
}

bool has_error(const SystemValidation& validation, const std::string& text) {
    for (const auto& error : validation.errors) {
        if (error == text) {
            return true;
        }
    }
    return false;
}

} // namespace

TEST_CASE("validate_system", "[config]") {
    SECTION("Valid system") {
        const auto validation = validate_system(valid_system());
        REQUIRE(validation.valid());
        REQUIRE(validation.get_summary() == "System settings are valid.");
        REQUIRE_NOTHROW(require_valid_system(valid_system()));
    }
    SECTION("Missing variables") {
        auto system = valid_system();
        system.var_names.clear();
        system.equations.clear();
        REQUIRE(has_error(validate_system(system),
                          "At least one variable is required."));
    }
    SECTION("Missing equation") {
        auto system         = valid_system();
        system.equations[1] = "  ";
        REQUIRE(has_error(validate_system(system), "Equation required for y."));
    }
    SECTION("Solver must match the system type") {
        auto system = valid_system();
        system.type = SystemType::kMap;
        REQUIRE(has_error(validate_system(system),
                          "Map systems must use the discrete solver."));
        system.type   = SystemType::kFlow;
        system.solver = "euler";
        REQUIRE(has_error(validate_system(system),
                          "Flow systems must use rk4 or tsit5."));
    }
    SECTION("Identifiers") {
        auto system         = valid_system();
        system.param_names  = {"s", "s", "b"};
        const auto validation = validate_system(system);
        REQUIRE_FALSE(validation.valid());
        REQUIRE_THAT(validation.get_summary(),
                     ContainsSubstring("System settings are invalid: ") &&
                         ContainsSubstring("Duplicate parameter names: s."));
        system.var_names = {"x", "2y", "z"};
        REQUIRE(has_error(validate_system(system),
                          "Invalid variable names: 2y."));
    }
    SECTION("Parameter values") {
        auto system      = valid_system();
        system.params[0] = std::nan("");
        REQUIRE(has_error(validate_system(system),
                          "Parameter values must be numeric."));
        system.params.pop_back();
        REQUIRE_THROWS_AS(require_valid_system(system), ValidationError);
    }
    SECTION("No parameters is only a warning") {
        auto system = valid_system();
        system.params.clear();
        system.param_names.clear();
        const auto validation = validate_system(system);
        REQUIRE(validation.valid());
        REQUIRE(validation.warnings.size() == 1);
    }
    SECTION("Parameter lookup") {
        const auto system = valid_system();
        REQUIRE(system.param_index("r") == std::optional<SizeType>(1));
        REQUIRE_FALSE(system.has_param("q"));
        REQUIRE(system.dimension() == 3);
    }
}

TEST_CASE("ContinuationSettings", "[config]") {
    SECTION("Sanitized clamps to floors") {
        const ContinuationSettings raw{
            .step_size           = 0.0,
            .min_step_size       = -1.0,
            .max_step_size       = std::numeric_limits<double>::infinity(),
            .max_steps           = 0,
            .corrector_steps     = 0,
            .corrector_tolerance = 0.0,
            .step_tolerance      = std::nan("")};
        const auto out = raw.sanitized();
        REQUIRE(out.step_size == 1e-9);
        REQUIRE(out.min_step_size == 1e-12);
        REQUIRE(out.max_step_size == 0.1);
        REQUIRE(out.max_steps == 1);
        REQUIRE(out.corrector_steps == 1);
        REQUIRE(out.corrector_tolerance ==
                std::numeric_limits<double>::epsilon());
        REQUIRE(out.step_tolerance == 1e-7);
        REQUIRE_NOTHROW(out.validate());
    }
    SECTION("Valid settings are unchanged") {
        const ContinuationSettings settings{};
        REQUIRE(settings.sanitized() == settings);
    }
    SECTION("Validation") {
        ContinuationSettings settings;
        settings.min_step_size = 1.0;
        settings.max_step_size = 0.5;
        REQUIRE_THROWS_AS(settings.validate(), ValidationError);
        settings = ContinuationSettings{};
        settings.step_size = -0.1;
        REQUIRE_THROWS_WITH(settings.validate(),
                            "Step size must be a positive number.");
    }
    SECTION("Per-kind defaults") {
        const auto eq = default_settings(branch::BranchKind::kEquilibrium);
        REQUIRE(eq.max_steps == 100);
        REQUIRE(eq.corrector_steps == 4);
        REQUIRE(eq.corrector_tolerance == 1e-6);
        const auto lc = default_settings(branch::BranchKind::kLimitCycle);
        REQUIRE(lc.max_steps == 50);
        REQUIRE(lc.corrector_steps == 10);
        const auto homoc =
            default_settings(branch::BranchKind::kHomoclinicCurve);
        REQUIRE(homoc == ContinuationSettings{});
        const auto fold = default_settings(branch::BranchKind::kFoldCurve);
        REQUIRE(fold.max_steps == 300);
        REQUIRE(fold.step_tolerance == 1e-8);
    }
}
