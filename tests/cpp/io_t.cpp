#include <filesystem>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>

#include "cobra/io/branch_file.hpp"

using namespace cobra;

namespace {

branch::ContinuationObject make_cycle_branch() {
    branch::ContinuationObject object;
    object.name           = "lc_eq";
    object.system_name    = "sys";
    object.parameter_name = "a";
    object.parent_object  = "eq";
    object.start_object   = "eq_a";
    object.branch_kind    = branch::BranchKind::kLimitCycle;
    object.params         = {0.5, 2.0};
    object.settings.max_steps = 77;
    object.data.points = {
        {.state       = {1.0, 2.0, 6.0},
         .param_value = 0.1,
         .eigenvalues = {{1.0, 0.0}, {0.5, 0.1}}},
        {.state       = {1.5, 2.5, 6.5},
         .param_value = 0.2,
         .stability   = branch::BifurcationType::kPeriodDoubling,
         .eigenvalues = {{1.0, 0.0}}},
    };
    object.data.indices      = {LogicalIndex{-1}, LogicalIndex{0}};
    object.data.bifurcations = {ArrayIndex{1}};
    object.data.branch_type  = branch::LimitCycle{.ntst = 12, .ncol = 3};
    return object;
}

} // namespace

TEST_CASE("BranchFileWriter", "[io]") {
    const auto path =
        std::filesystem::temp_directory_path() / "cobra_branch_file_t.h5";
    const auto original = make_cycle_branch();

    io::BranchFileWriter writer(path);
    writer.write_branch(original);
    REQUIRE_THROWS_AS(writer.write_branch(original), std::runtime_error);
    REQUIRE(io::list_branch_file(path) == std::vector<std::string>{"lc_eq"});

    const auto loaded = io::read_branch_file(path, "lc_eq");
    REQUIRE(loaded.parent_object == "eq");
    REQUIRE(loaded.start_object == "eq_a");
    REQUIRE(loaded.branch_kind == branch::BranchKind::kLimitCycle);
    REQUIRE(loaded.params == original.params);
    REQUIRE(loaded.settings.max_steps == 77);
    REQUIRE(loaded.data.points == original.data.points);
    REQUIRE(loaded.data.indices == original.data.indices);
    REQUIRE(loaded.data.bifurcations == original.data.bifurcations);
    REQUIRE(loaded.data.branch_type == original.data.branch_type);

    SECTION("Append mode keeps earlier branches") {
        auto second = original;
        second.name = "lc_eq2";
        io::BranchFileWriter appender(path, io::BranchFileWriter::Mode::kAppend);
        appender.write_branch(second);
        REQUIRE(io::list_branch_file(path).size() == 2);
    }
    REQUIRE_THROWS_AS(io::read_branch_file(path, "missing"),
                      std::runtime_error);
    std::filesystem::remove(path);
}
