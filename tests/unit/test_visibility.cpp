#include <catch2/catch.hpp>
#include <flow_groups/group_ops.hpp>
#include <flow_groups/synthetic_edges.hpp>
#include <flow_groups/visibility.hpp>
#include "test_flows.hpp"

using namespace test_flows;

namespace {

flow_model::Flow nested_flow(bool outer_collapsed, bool inner_collapsed) {
    flow_model::Flow flow;
    flow.nodes = {
        group("outer", outer_collapsed),
        node("a", "outer"),
        group("inner", inner_collapsed, "outer"),
        node("b", "inner"),
        node("c", "inner"),
        node("x"),
    };
    flow.edges = { edge("a", "b"), edge("c", "x"), edge("x", "a") };
    return flow;
}

const flow_model::Edge* find_edge(const flow_model::Flow& flow, const std::string& source, const std::string& target) {
    for (const auto& e : flow.edges) {
        if (e.source == source && e.target == target) return &e;
    }
    return nullptr;
}

} // namespace

TEST_CASE("Grouping two nodes and expanding again", "[visibility]") {
    flow_model::Flow flow;
    flow.nodes = { node("a", std::nullopt, { 0, 0 }), node("b", std::nullopt, { 100, 0 }), node("external") };
    flow.edges = { edge("a", "external") };

    flow_groups::CreateGroupOptions options;
    options.group_id = "g1";
    options.label = "G1";
    options.member_ids = { "a", "b" };
    const auto grouped = flow_groups::apply_group_visibility(flow_groups::create_group(flow, options));

    REQUIRE(get(grouped, "a").hidden);
    REQUIRE(get(grouped, "a").group_hidden);
    REQUIRE_FALSE(get(grouped, "g1").hidden);
    const auto* synthetic = find_edge(grouped, "g1", "external");
    REQUIRE(synthetic != nullptr);
    REQUIRE(synthetic->is_synthetic);
    REQUIRE(synthetic->id == "group-edge-g1->external");
    REQUIRE_FALSE(synthetic->hidden);
    REQUIRE(find_edge(grouped, "a", "external")->hidden);

    const auto expanded = flow_groups::apply_group_visibility(flow_groups::toggle_expansion(grouped, "g1"));
    REQUIRE_FALSE(get(expanded, "a").hidden);
    REQUIRE_FALSE(get(expanded, "a").group_hidden);
    REQUIRE(get(expanded, "g1").hidden);
    REQUIRE(find_edge(expanded, "g1", "external") == nullptr);
    REQUIRE_FALSE(find_edge(expanded, "a", "external")->hidden);
}

TEST_CASE("Visibility follows the collapse state of ancestors", "[visibility]") {
    SECTION("collapsed outer hides every descendant") {
        const auto out = flow_groups::apply_group_visibility(nested_flow(true, false));
        REQUIRE_FALSE(get(out, "outer").hidden);
        for (const char* id : { "a", "inner", "b", "c" }) {
            REQUIRE(get(out, id).hidden);
            REQUIRE(get(out, id).group_hidden);
        }
        REQUIRE_FALSE(get(out, "x").hidden);
    }

    SECTION("expanded outer shows direct members, collapsed inner stands in for its own") {
        const auto out = flow_groups::apply_group_visibility(nested_flow(false, true));
        REQUIRE(get(out, "outer").hidden);
        REQUIRE_FALSE(get(out, "outer").group_hidden);
        REQUIRE_FALSE(get(out, "a").hidden);
        REQUIRE_FALSE(get(out, "inner").hidden);
        REQUIRE(get(out, "b").group_hidden);
        REQUIRE(get(out, "c").group_hidden);
    }

    SECTION("everything expanded") {
        const auto out = flow_groups::apply_group_visibility(nested_flow(false, false));
        for (const char* id : { "a", "b", "c", "x" }) REQUIRE(get(out, id).is_visible());
        REQUIRE(get(out, "outer").hidden);
        REQUIRE(get(out, "inner").hidden);
        REQUIRE(flow_groups::boundary_keys(out.edges).empty());
    }
}

TEST_CASE("External hiding survives the visibility pass", "[visibility]") {
    auto flow = nested_flow(false, false);
    for (auto& n : flow.nodes) {
        if (n.id == "x") n.hidden = true;
    }
    const auto out = flow_groups::apply_group_visibility(flow);
    REQUIRE(get(out, "x").hidden);
    REQUIRE_FALSE(get(out, "x").group_hidden);
    REQUIRE(find_edge(out, "c", "x")->hidden);
    REQUIRE_FALSE(find_edge(out, "c", "x")->group_hidden);
}

TEST_CASE("Visibility passes are idempotent", "[visibility]") {
    for (bool outer : { false, true }) {
        for (bool inner : { false, true }) {
            const auto once = flow_groups::apply_group_visibility(nested_flow(outer, inner));
            const auto twice = flow_groups::apply_group_visibility(once);
            REQUIRE(once == twice);

            const auto refreshed = flow_groups::refresh_flow(once);
            REQUIRE_FALSE(refreshed.changed);
            REQUIRE(refreshed.flow == once);

            const auto direct = flow_groups::apply_visibility(once.nodes, once.edges);
            const auto again = flow_groups::apply_visibility(direct.nodes, direct.edges);
            REQUIRE(direct.nodes == again.nodes);
            REQUIRE(direct.edges == again.edges);
        }
    }
}

TEST_CASE("refresh_flow reports changes", "[visibility]") {
    const auto raw = nested_flow(true, false);
    REQUIRE(flow_groups::refresh_flow(raw).changed);

    const auto settled = flow_groups::apply_group_visibility(raw);
    const auto toggled = flow_groups::toggle_expansion(settled, "outer");
    REQUIRE(flow_groups::refresh_flow(toggled).changed);
}

TEST_CASE("ancestor_hidden_set tolerates broken hierarchies", "[visibility]") {
    const std::vector<flow_model::Node> nodes = {
        group("g1", true, "g2"),
        group("g2", false, "g1"),
        node("x", "g2"),
        node("y", "ghost"),
    };
    const auto hidden = flow_groups::ancestor_hidden_set(nodes);
    REQUIRE(hidden.count("g2") == 1);
    REQUIRE(hidden.count("x") == 1);
    REQUIRE(hidden.count("g1") == 0);
    REQUIRE(hidden.count("y") == 0);
}
