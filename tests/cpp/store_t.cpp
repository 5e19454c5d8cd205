#include <algorithm>
#include <string>
#include <vector>

#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_string.hpp>

#include "cobra/common/naming.hpp"
#include "cobra/exceptions.hpp"
#include "cobra/storage/object_store.hpp"

using namespace cobra;
using Catch::Matchers::ContainsSubstring;

namespace {

branch::ContinuationObject make_branch(std::string name,
                                       std::string parent,
                                       std::string start) {
    branch::ContinuationObject object;
    object.name          = std::move(name);
    object.system_name   = "sys";
    object.parent_object = std::move(parent);
    object.start_object  = std::move(start);
    return object;
}

} // namespace

TEST_CASE("Name validation", "[naming]") {
    REQUIRE(is_valid_name("eq_1"));
    REQUIRE(is_valid_name("1abc"));
    REQUIRE_FALSE(is_valid_name(""));
    REQUIRE_FALSE(is_valid_name("has space"));
    REQUIRE_FALSE(is_valid_name("dash-name"));
    REQUIRE(name_error("") == std::optional<std::string>("Name cannot be empty."));
    REQUIRE(name_error("a b") ==
            std::optional<std::string>(
                "Name must contain only alphanumeric characters and "
                "underscores (no spaces)."));
    REQUIRE_FALSE(name_error("ok").has_value());
    REQUIRE_THROWS_AS(validate_name("bad name"), ValidationError);
    REQUIRE_NOTHROW(validate_name("good_name"));

    SECTION("Identifiers") {
        REQUIRE(is_identifier("_x1"));
        REQUIRE_FALSE(is_identifier("1x"));
        REQUIRE_FALSE(is_identifier(""));
    }
}

TEST_CASE("InMemoryObjectStore", "[store]") {
    storage::InMemoryObjectStore store;
    store.save_system(config::SystemConfig{.name = "sys"});

    SECTION("Missing entries raise NotFoundError") {
        REQUIRE_THROWS_AS(store.load_system("other"), storage::NotFoundError);
        REQUIRE_THROWS_WITH(store.load_object("sys", "eq"),
                            "Object \"eq\" does not exist in system \"sys\".");
        REQUIRE_THROWS_WITH(store.load_branch("sys", "eq", "b"),
                            "Branch \"b\" does not exist under object \"eq\".");
    }

    SECTION("Invalid names are rejected on save") {
        REQUIRE_THROWS_AS(
            store.save_object("sys", storage::StoredObject{.name = "bad name"}),
            ValidationError);
        REQUIRE_THROWS_AS(store.save_branch("sys", "eq", make_branch("", "eq", "eq")),
                          ValidationError);
    }

    SECTION("Branch listing and deletion") {
        store.save_branch("sys", "eq", make_branch("b1", "eq", "eq"));
        store.save_branch("sys", "eq", make_branch("b2", "eq", "eq"));
        store.save_branch("sys", "other", make_branch("b3", "other", "other"));
        REQUIRE(store.list_branches("sys", "eq") ==
                std::vector<std::string>{"b1", "b2"});
        store.delete_branch("sys", "eq", "b1");
        REQUIRE(store.list_branches("sys", "eq") ==
                std::vector<std::string>{"b2"});
        REQUIRE(store.branch_count() == 2);
    }

    SECTION("Renaming an object moves its branches") {
        store.save_object("sys", storage::StoredObject{.name = "eq"});
        store.save_branch("sys", "eq", make_branch("b1", "eq", "eq"));
        store.save_branch("sys", "eq", make_branch("b2", "eq", "b1"));
        store.rename_object("sys", "eq", "eq2");

        REQUIRE_THROWS_AS(store.load_object("sys", "eq"),
                          storage::NotFoundError);
        REQUIRE(store.load_object("sys", "eq2").name == "eq2");
        REQUIRE(store.list_branches("sys", "eq").empty());
        const auto b1 = store.load_branch("sys", "eq2", "b1");
        REQUIRE(b1.parent_object == "eq2");
        REQUIRE(b1.start_object == "eq2");
        REQUIRE(store.load_branch("sys", "eq2", "b2").start_object == "b1");
    }

    SECTION("Renaming a missing object fails") {
        store.save_branch("sys", "ghost", make_branch("b1", "ghost", "ghost"));
        REQUIRE_THROWS_AS(store.rename_object("sys", "ghost", "eq2"),
                          storage::NotFoundError);
        REQUIRE_THROWS_WITH(store.rename_object("sys", "ghost", "eq2"),
                            "Object \"ghost\" does not exist.");
        REQUIRE(store.load_branch("sys", "ghost", "b1").parent_object ==
                "ghost");
        REQUIRE(store.list_branches("sys", "eq2").empty());
    }

    SECTION("Object rename keeps start_object names owned by branches") {
        // A branch sharing the object's name elsewhere must not be rewritten.
        store.save_object("sys", storage::StoredObject{.name = "eq"});
        store.save_object("sys", storage::StoredObject{.name = "lc"});
        store.save_branch("sys", "eq", make_branch("eq", "eq", "eq"));
        store.save_branch("sys", "lc", make_branch("lc_b", "lc", "eq"));
        store.save_branch("sys", "eq", make_branch("next", "eq", "orbit"));
        store.rename_object("sys", "eq", "eq2");

        REQUIRE(store.load_branch("sys", "eq2", "eq").start_object == "eq2");
        REQUIRE(store.load_branch("sys", "lc", "lc_b").start_object == "eq");
        REQUIRE(store.load_branch("sys", "eq2", "next").start_object ==
                "orbit");
    }

    SECTION("Renaming onto an existing object fails") {
        store.save_object("sys", storage::StoredObject{.name = "a"});
        store.save_object("sys", storage::StoredObject{.name = "b"});
        REQUIRE_THROWS_AS(store.rename_object("sys", "a", "b"),
                          ValidationError);
    }

    SECTION("Renaming a branch cascades") {
        store.save_object("sys",
                          storage::StoredObject{
                              .name          = "lc",
                              .kind          = storage::ObjectKind::kLimitCycle,
                              .origin_branch = std::string("b1")});
        store.save_branch("sys", "eq", make_branch("b1", "eq", "eq"));
        store.save_branch("sys", "eq", make_branch("b2", "eq", "b1"));
        store.rename_branch("sys", "eq", "b1", "main");

        const auto names = store.list_branches("sys", "eq");
        REQUIRE(std::ranges::find(names, "main") != names.end());
        REQUIRE(std::ranges::find(names, "b1") == names.end());
        REQUIRE(store.load_branch("sys", "eq", "main").name == "main");
        REQUIRE(store.load_branch("sys", "eq", "b2").start_object == "main");
        REQUIRE(store.load_object("sys", "lc").origin_branch ==
                std::optional<std::string>("main"));
    }

    SECTION("Branch rename conflicts") {
        store.save_branch("sys", "eq", make_branch("b1", "eq", "eq"));
        store.save_branch("sys", "eq", make_branch("b2", "eq", "eq"));
        REQUIRE_THROWS_AS(store.rename_branch("sys", "eq", "b1", "b2"),
                          ValidationError);
        REQUIRE_THROWS_AS(store.rename_branch("sys", "eq", "nope", "b3"),
                          storage::NotFoundError);
        REQUIRE_THROWS_WITH(store.rename_branch("sys", "eq", "b1", "bad name"),
                            ContainsSubstring("alphanumeric"));
    }
}
