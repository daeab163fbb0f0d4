#include <catch2/catch.hpp>
#include <flow_groups/group_commands.hpp>
#include "test_flows.hpp"

using namespace test_flows;

namespace {

flow_model::Flow base_flow() {
    flow_model::Flow flow;
    flow.nodes = { node("a"), node("b"), node("c"), node("d") };
    flow.edges = { edge("a", "b"), edge("b", "c"), edge("c", "d") };
    return flow;
}

flow_groups::CreateGroupRequest members(std::vector<std::string> ids) {
    flow_groups::CreateGroupRequest request;
    request.member_ids = std::move(ids);
    return request;
}

bool contains(const std::string& text, const std::string& part) {
    return text.find(part) != std::string::npos;
}

} // namespace

TEST_CASE("create_group_command", "[group_commands]") {
    const auto flow = base_flow();

    SECTION("generates id and default label and applies visibility") {
        const auto result = flow_groups::create_group_command(flow, members({ "a", "b" }));
        REQUIRE(result.success);
        REQUIRE(result.group_id == std::optional<std::string>("group-1"));
        const auto& updated = *result.updated_flow;
        REQUIRE(get(updated, "group-1").label == "Group 1");
        REQUIRE(get(updated, "a").hidden);
        REQUIRE_FALSE(get(updated, "group-1").hidden);
        REQUIRE(flow_model::find_node(updated.nodes, "group-1")->is_collapsed());
    }

    SECTION("keeps a requested label and expanded state") {
        auto request = members({ "a", "b" });
        request.label = "Team";
        request.collapse = false;
        const auto result = flow_groups::create_group_command(flow, request);
        REQUIRE(result.success);
        REQUIRE(get(*result.updated_flow, *result.group_id).label == "Team");
        REQUIRE_FALSE(get(*result.updated_flow, "a").hidden);
    }

    SECTION("generated ids stay unique") {
        auto first = flow_groups::create_group_command(flow, members({ "a", "b" }));
        auto second = flow_groups::create_group_command(*first.updated_flow, members({ "c", "d" }));
        REQUIRE(second.success);
        REQUIRE(second.group_id == std::optional<std::string>("group-2"));

        auto taken = flow;
        taken.nodes.push_back(node("group-1"));
        REQUIRE(flow_groups::next_group_id(taken.nodes) == "group-2");
    }

    SECTION("sub-grouping inside an existing group") {
        auto request = members({ "a", "b", "c" });
        request.collapse = false;
        const auto outer = flow_groups::create_group_command(flow, request);
        const auto inner = flow_groups::create_group_command(*outer.updated_flow, members({ "a", "b" }));
        REQUIRE(inner.success);
        REQUIRE(get(*inner.updated_flow, *inner.group_id).parent_group_id == outer.group_id);
    }

    SECTION("rejections") {
        const auto one = flow_groups::create_group_command(flow, members({ "a" }));
        REQUIRE_FALSE(one.success);
        REQUIRE(contains(one.error, "At least 2 memberIds"));
        REQUIRE_FALSE(one.updated_flow.has_value());

        const auto missing = flow_groups::create_group_command(flow, members({ "a", "zz" }));
        REQUIRE_FALSE(missing.success);
        REQUIRE(contains(missing.error, "not found"));

        const auto grouped = flow_groups::create_group_command(flow, members({ "a", "b" }));
        const auto mixed = flow_groups::create_group_command(*grouped.updated_flow, members({ "a", "c" }));
        REQUIRE_FALSE(mixed.success);
        REQUIRE(contains(mixed.error, "different parent groups"));
        REQUIRE(contains(mixed.error, "Nodes already in groups: a"));

        auto request = members({ "c", "d" });
        request.group_id = "a";
        REQUIRE_FALSE(flow_groups::create_group_command(flow, request).success);
    }
}

TEST_CASE("ungroup and toggle commands", "[group_commands]") {
    const auto created = flow_groups::create_group_command(base_flow(), members({ "a", "b" }));
    const auto& flow = *created.updated_flow;
    const std::string id = *created.group_id;

    SECTION("ungroup") {
        const auto result = flow_groups::ungroup_command(flow, id);
        REQUIRE(result.success);
        REQUIRE_FALSE(get(*result.updated_flow, "a").hidden);
        REQUIRE_FALSE(get(*result.updated_flow, "a").parent_group_id.has_value());

        REQUIRE(contains(flow_groups::ungroup_command(flow, "missing").error, "not found"));
        REQUIRE(contains(flow_groups::ungroup_command(flow, "c").error, "not found"));
    }

    SECTION("toggle") {
        const auto expanded = flow_groups::toggle_group_command(flow, id, true);
        REQUIRE(expanded.success);
        REQUIRE_FALSE(get(*expanded.updated_flow, "a").hidden);
        REQUIRE(get(*expanded.updated_flow, id).hidden);

        const auto flipped = flow_groups::toggle_group_command(*expanded.updated_flow, id);
        REQUIRE(get(*flipped.updated_flow, "a").hidden);

        REQUIRE(contains(flow_groups::toggle_group_command(flow, "missing").error, "not found"));
    }
}

TEST_CASE("attach, detach and subtree commands", "[group_commands]") {
    auto request = members({ "a", "b" });
    request.collapse = false;
    const auto created = flow_groups::create_group_command(base_flow(), request);
    const auto& flow = *created.updated_flow;
    const std::string id = *created.group_id;

    const auto attached = flow_groups::attach_command(flow, "c", id);
    REQUIRE(attached.success);
    REQUIRE(get(*attached.updated_flow, "c").parent_group_id == std::optional<std::string>(id));
    REQUIRE_FALSE(flow_groups::attach_command(flow, "a", id).success);
    REQUIRE_FALSE(flow_groups::attach_command(flow, id, id).success);

    const auto detached = flow_groups::detach_command(*attached.updated_flow, "c");
    REQUIRE(detached.success);
    REQUIRE_FALSE(get(*detached.updated_flow, "c").parent_group_id.has_value());
    REQUIRE(contains(flow_groups::detach_command(flow, "d").error, "not in a group"));

    const auto collapsed = flow_groups::collapse_subtree_command(flow, "b", true);
    REQUIRE(collapsed.success);
    REQUIRE(get(*collapsed.updated_flow, "c").hidden);
    REQUIRE(get(*collapsed.updated_flow, "d").hidden);
    REQUIRE_FALSE(get(*collapsed.updated_flow, "b").hidden);
    REQUIRE_FALSE(flow_groups::collapse_subtree_command(flow, "zz", true).success);
}
