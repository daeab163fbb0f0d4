#include <catch2/catch.hpp>
#include <flow_groups/visibility.hpp>
#include <flow_loaders/debug_flow.hpp>
#include <flow_placement/layered_layout.hpp>
#include "test_flows.hpp"
#include <cmath>

using namespace test_flows;

namespace {

flow_model::Node hidden_group(const std::string& id, std::optional<std::string> parent = std::nullopt) {
    auto g = group(id, false, std::move(parent));
    g.hidden = true;
    return g;
}

flow_model::Flow layout(const flow_model::Flow& flow,
    flow_placement::LayoutDirection direction = flow_placement::LayoutDirection::LeftToRight)
{
    flow_placement::LayoutOptions options;
    options.direction = direction;
    return flow_placement::layout_flow(flow, options);
}

} // namespace

TEST_CASE("Empty input gives empty output", "[layout]") {
    const flow_model::Flow empty;
    REQUIRE(flow_placement::layout_flow(empty) == empty);
}

TEST_CASE("Simple chain stays on one line", "[layout]") {
    flow_model::Flow flow;
    flow.nodes = { node("p", std::nullopt, { 40, 900 }), node("c", std::nullopt, { -300, 7 }) };
    flow.edges = { edge("p", "c") };

    SECTION("left to right") {
        const auto out = layout(flow);
        REQUIRE(get(out, "p").position.y == Approx(get(out, "c").position.y));
        REQUIRE(get(out, "c").position.x - get(out, "p").position.x == Approx(172 + 50));
    }

    SECTION("top to bottom") {
        const auto out = layout(flow, flow_placement::LayoutDirection::TopToBottom);
        REQUIRE(get(out, "p").position.x == Approx(get(out, "c").position.x));
        REQUIRE(get(out, "c").position.y - get(out, "p").position.y == Approx(36 + 50));
    }
}

TEST_CASE("Hidden nodes keep their position", "[layout]") {
    flow_model::Flow flow;
    flow.nodes = { node("a"), node("b"), node("h", std::nullopt, { 123, 456 }) };
    flow.nodes[2].hidden = true;
    flow.edges = { edge("a", "b"), edge("b", "h") };

    const auto out = layout(flow);
    REQUIRE(get(out, "h").position == flow_model::Position{ 123, 456 });
    REQUIRE(get(out, "a").position.y == Approx(get(out, "b").position.y));
}

TEST_CASE("Parent and direct children inside one group stay aligned", "[layout][groups]") {
    flow_model::Flow flow;
    flow.nodes = {
        node("vito_corleone"),
        node("sonny_corleone", "group-sonny"),
        node("francesco_corleone", "group-sonny"),
        node("sonny_heir", "group-sonny"),
        hidden_group("group-sonny"),
    };
    flow.edges = {
        edge("vito_corleone", "sonny_corleone"),
        edge("sonny_corleone", "francesco_corleone"),
        edge("francesco_corleone", "sonny_heir"),
    };

    const auto out = layout(flow);
    REQUIRE(get(out, "sonny_corleone").position.y == Approx(get(out, "francesco_corleone").position.y));
    REQUIRE(get(out, "francesco_corleone").position.y == Approx(get(out, "sonny_heir").position.y));
}

TEST_CASE("Sibling members are spaced by the member gap", "[layout][groups]") {
    flow_model::Flow flow;
    flow.nodes = {
        node("vito_corleone"),
        node("sonny_corleone", "group-sonny"),
        node("francesco_corleone", "group-sonny"),
        hidden_group("group-sonny"),
    };
    flow.edges = {
        edge("vito_corleone", "sonny_corleone"),
        edge("vito_corleone", "francesco_corleone"),
    };

    const auto out = layout(flow);
    const double dy = get(out, "sonny_corleone").position.y - get(out, "francesco_corleone").position.y;
    REQUIRE(std::abs(dy) == Approx(flow_placement::layout::member_gap));
    REQUIRE(get(out, "sonny_corleone").position.x == Approx(get(out, "francesco_corleone").position.x));
}

TEST_CASE("Cross-group edges do not push a chain onto a diagonal", "[layout][groups]") {
    flow_model::Flow flow;
    flow.nodes = {
        node("vito", "main-group", { 222, 130.75 }),
        node("michael", "sub-group", { 444, 61.5 }),
        node("kay", "main-group", { 666, 50.75 }),
        node("kay-child", "main-group", { 888, 50.75 }),
        hidden_group("sub-group", "main-group"),
        hidden_group("main-group"),
    };
    flow.edges = { edge("vito", "michael"), edge("michael", "kay"), edge("kay", "kay-child") };

    const auto out = layout(flow);
    REQUIRE(get(out, "kay-child").position.y == Approx(get(out, "kay").position.y));
    REQUIRE(get(out, "kay").position.y == Approx(get(out, "vito").position.y));
    REQUIRE(get(out, "michael").position.x > get(out, "vito").position.x);
    REQUIRE(get(out, "kay-child").position.x > get(out, "kay").position.x);
}

TEST_CASE("Nodes sharing a rank never overlap", "[layout]") {
    flow_model::Flow flow;
    flow.nodes = { node("root"), node("c1"), node("c2"), node("c3"), node("m1", "g"), node("m2", "g"), hidden_group("g") };
    flow.edges = { edge("root", "c1"), edge("root", "c2"), edge("root", "m1"), edge("root", "c3"), edge("root", "m2") };

    const auto out = layout(flow);
    const std::vector<std::string> rank1 = { "c1", "c2", "c3", "m1", "m2" };
    for (std::size_t i = 0; i < rank1.size(); ++i) {
        for (std::size_t j = i + 1; j < rank1.size(); ++j) {
            const double dy = std::abs(get(out, rank1[i]).position.y - get(out, rank1[j]).position.y);
            REQUIRE(dy >= 36 - 1e-6);
        }
    }
    const double members = std::abs(get(out, "m1").position.y - get(out, "m2").position.y);
    REQUIRE(members == Approx(flow_placement::layout::member_gap));
}

TEST_CASE("Disconnected components are stacked", "[layout]") {
    flow_model::Flow flow;
    flow.nodes = { node("a"), node("b") };

    const auto out = layout(flow);
    REQUIRE(get(out, "a").position.x == Approx(get(out, "b").position.x));
    REQUIRE(get(out, "b").position.y - get(out, "a").position.y == Approx(36 + flow_placement::layout::component_gap));
}

TEST_CASE("Custom dimensions and spacing", "[layout]") {
    flow_model::Flow flow;
    flow.nodes = { node("a"), node("b") };
    flow.edges = { edge("a", "b") };

    flow_placement::LayoutOptions options;
    options.spacing.rank_sep = 10;
    options.dimensions = flow_model::uniform_dimensions({ 100, 20 });
    const auto out = flow_placement::layout_flow(flow, options);
    REQUIRE(get(out, "b").position.x - get(out, "a").position.x == Approx(110));
}

TEST_CASE("Collapsed groups are laid out through their synthetic edges", "[layout][groups]") {
    flow_model::Flow flow;
    flow.nodes = { group("g", true), node("m", "g"), node("x") };
    flow.edges = { edge("m", "x") };

    const auto out = layout(flow_groups::apply_group_visibility(flow));
    REQUIRE(get(out, "x").position.x > get(out, "g").position.x);
    REQUIRE(get(out, "x").position.y == Approx(get(out, "g").position.y));
    REQUIRE(get(out, "m").position == flow_model::Position{});
}

TEST_CASE("Layout is deterministic", "[layout]") {
    const auto flow = flow_groups::apply_group_visibility(flow_loaders::generate_debug_flow());

    SECTION("two runs give the same positions") {
        REQUIRE(layout(flow) == layout(flow));
    }

    SECTION("laying out a laid-out flow changes nothing") {
        const auto once = layout(flow);
        REQUIRE(layout(once) == once);
    }
}

TEST_CASE("assign_ranks", "[layout]") {
    SECTION("longest path from sources") {
        const auto ranks = flow_placement::assign_ranks({ "a", "b", "c", "d" },
            { { "a", "b" }, { "b", "c" }, { "a", "c" }, { "d", "c" } });
        REQUIRE(ranks.at("a") == 0);
        REQUIRE(ranks.at("b") == 1);
        REQUIRE(ranks.at("c") == 2);
        REQUIRE(ranks.at("d") == 0);
    }

    SECTION("cycles are broken") {
        const auto ranks = flow_placement::assign_ranks({ "a", "b", "c" },
            { { "a", "b" }, { "b", "c" }, { "c", "a" } });
        REQUIRE(ranks.at("a") == 0);
        REQUIRE(ranks.at("b") == 1);
        REQUIRE(ranks.at("c") == 2);
    }

    SECTION("unknown ids and self loops are ignored") {
        const auto ranks = flow_placement::assign_ranks({ "a", "b" }, { { "a", "a" }, { "a", "zz" }, { "a", "b" } });
        REQUIRE(ranks.size() == 2);
        REQUIRE(ranks.at("b") == 1);
    }
}

TEST_CASE("build_depth_map is relative to each group's lowest rank", "[layout][groups]") {
    const std::vector<flow_model::Node> nodes = {
        node("x"), node("m1", "g"), node("m2", "g"), node("m3", "g"), node("unranked", "g"),
    };
    const flow_placement::RankMap ranks = { { "x", 0 }, { "m1", 2 }, { "m2", 3 }, { "m3", 2 } };

    const auto depth = flow_placement::build_depth_map(nodes, ranks);
    REQUIRE(depth.at("x") == 0);
    REQUIRE(depth.at("m1") == 0);
    REQUIRE(depth.at("m3") == 0);
    REQUIRE(depth.at("m2") == 1);
    REQUIRE(depth.count("unranked") == 0);
}
