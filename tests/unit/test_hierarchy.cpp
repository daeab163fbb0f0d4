#include <catch2/catch.hpp>
#include <flow_model/hierarchy.hpp>
#include "test_flows.hpp"

using namespace test_flows;
using Ids = std::vector<std::string>;

TEST_CASE("group_descendants walks nested groups", "[hierarchy]") {
    const std::vector<flow_model::Node> nodes = {
        group("outer", false),
        node("a", "outer"),
        group("inner", true, "outer"),
        node("b", "inner"),
        node("c", "inner"),
        node("loose"),
    };

    SECTION("pre-order in node order") {
        REQUIRE(flow_model::group_descendants(nodes, "outer") == Ids{ "a", "inner", "b", "c" });
        REQUIRE(flow_model::group_descendants(nodes, "inner") == Ids{ "b", "c" });
    }

    SECTION("unknown id and leaf give empty results") {
        REQUIRE(flow_model::group_descendants(nodes, "missing").empty());
        REQUIRE(flow_model::group_descendants(nodes, "loose").empty());
    }

    SECTION("ancestry queries") {
        REQUIRE(flow_model::is_ancestor_of(nodes, "outer", "b"));
        REQUIRE_FALSE(flow_model::is_ancestor_of(nodes, "b", "outer"));
        REQUIRE(flow_model::ancestor_chain(nodes, "b") == Ids{ "inner", "outer" });
        REQUIRE(flow_model::ancestor_chain(nodes, "loose").empty());
        REQUIRE(flow_model::direct_members(nodes, "outer") == Ids{ "a", "inner" });
    }
}

TEST_CASE("Traversals terminate on cyclic parent references", "[hierarchy]") {
    const std::vector<flow_model::Node> nodes = {
        group("g1", false, "g2"),
        group("g2", false, "g1"),
        node("x", "g1"),
    };

    const auto descendants = flow_model::descendant_set(nodes, "g1");
    REQUIRE(descendants.count("g2") == 1);
    REQUIRE(descendants.count("x") == 1);
    REQUIRE(descendants.count("g1") == 0);
    REQUIRE(flow_model::ancestor_chain(nodes, "x") == Ids{ "g1", "g2" });
}

TEST_CASE("ancestor_chain stops at a dangling parent", "[hierarchy]") {
    const std::vector<flow_model::Node> nodes = { node("x", "ghost") };
    REQUIRE(flow_model::ancestor_chain(nodes, "x").empty());
}

TEST_CASE("common_parent_group", "[hierarchy]") {
    const std::vector<flow_model::Node> nodes = {
        group("g", false),
        node("a", "g"),
        node("b", "g"),
        node("c"),
        node("d"),
    };

    const auto shared = flow_model::common_parent_group(nodes, { "a", "b" });
    REQUIRE(shared.has_value());
    REQUIRE(*shared == std::optional<std::string>("g"));

    const auto top = flow_model::common_parent_group(nodes, { "c", "d" });
    REQUIRE(top.has_value());
    REQUIRE_FALSE(top->has_value());

    REQUIRE_FALSE(flow_model::common_parent_group(nodes, { "a", "c" }).has_value());
    REQUIRE_FALSE(flow_model::common_parent_group(nodes, { "a", "missing" }).has_value());
}
