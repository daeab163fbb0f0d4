#include <flow_groups/group_commands.hpp>
#include <flow_groups/group_constants.hpp>
#include <flow_groups/group_ops.hpp>
#include <flow_groups/validation.hpp>
#include <flow_groups/visibility.hpp>
#include <flow_model/hierarchy.hpp>
#include <flow_model/log.hpp>
#include <algorithm>
#include <string_view>
#include <utility>

namespace flow_groups {

using flow_model::Flow;
using flow_model::Node;

namespace {

CommandResult rejected(const char* command, std::string error) {
    flow_model::engine_logger()->warn("{} rejected: {}", command, error);
    return CommandResult::fail(std::move(error));
}

std::string join_ids(const std::vector<std::string>& ids) {
    std::string out;
    for (const auto& id : ids) {
        if (!out.empty()) out += ", ";
        out += id;
    }
    return out;
}

std::string group_number(const std::string& group_id) {
    const std::string_view prefix = constants::generated_group_prefix;
    if (group_id.compare(0, prefix.size(), prefix) == 0) return group_id.substr(prefix.size());
    return group_id;
}

} // namespace

CommandResult CommandResult::ok(Flow flow, std::optional<std::string> group_id) {
    CommandResult r;
    r.success = true;
    r.updated_flow = std::move(flow);
    r.group_id = std::move(group_id);
    return r;
}

CommandResult CommandResult::fail(std::string error) {
    CommandResult r;
    r.error = std::move(error);
    return r;
}

std::string next_group_id(const std::vector<Node>& nodes) {
    const auto groups = std::count_if(nodes.begin(), nodes.end(), [](const Node& n) { return n.is_group(); });
    for (long n = static_cast<long>(groups) + 1;; ++n) {
        std::string id = std::string(constants::generated_group_prefix) + std::to_string(n);
        if (!flow_model::find_node(nodes, id)) return id;
    }
}

CommandResult create_group_command(const Flow& flow, const CreateGroupRequest& request) {
    if (request.member_ids.size() < 2)
        return rejected("create_group", "At least 2 memberIds are required");

    const auto validation = validate_membership(request.member_ids, flow.nodes);
    if (!validation) return rejected("create_group", validation.error);

    if (!flow_model::common_parent_group(flow.nodes, request.member_ids)) {
        std::vector<std::string> grouped;
        for (const auto& id : request.member_ids) {
            const Node* n = flow_model::find_node(flow.nodes, id);
            if (n && n->parent_group_id) grouped.push_back(id);
        }
        return rejected("create_group",
            "Cannot group nodes from different parent groups. Nodes already in groups: " + join_ids(grouped));
    }

    std::string group_id;
    if (request.group_id && !request.group_id->empty()) {
        if (flow_model::find_node(flow.nodes, *request.group_id))
            return rejected("create_group", "Node " + *request.group_id + " already exists");
        group_id = *request.group_id;
    } else {
        group_id = next_group_id(flow.nodes);
    }

    CreateGroupOptions options;
    options.group_id = group_id;
    options.label = request.label && !request.label->empty()
        ? *request.label
        : std::string(constants::default_group_label_prefix) + group_number(group_id);
    options.member_ids = request.member_ids;
    options.position = request.position;
    options.collapse = request.collapse;

    Flow updated = apply_group_visibility(create_group(flow, options));
    flow_model::engine_logger()->info("Created group {} ({}) with {} members",
        group_id, options.label, options.member_ids.size());
    return CommandResult::ok(std::move(updated), group_id);
}

CommandResult ungroup_command(const Flow& flow, const std::string& group_id) {
    if (!flow_model::find_group(flow.nodes, group_id))
        return rejected("ungroup", "Group " + group_id + " not found");
    return CommandResult::ok(apply_group_visibility(ungroup(flow, group_id)));
}

CommandResult toggle_group_command(const Flow& flow, const std::string& group_id, std::optional<bool> expand) {
    if (!flow_model::find_group(flow.nodes, group_id))
        return rejected("toggle_group", "Group " + group_id + " not found");
    std::optional<bool> collapsed;
    if (expand) collapsed = !*expand;
    return CommandResult::ok(apply_group_visibility(toggle_expansion(flow, group_id, collapsed)), group_id);
}

CommandResult attach_command(const Flow& flow, const std::string& node_id, const std::string& group_id) {
    const auto validation = validate_attachment(node_id, group_id, flow.nodes);
    if (!validation) return rejected("attach", validation.error);
    return CommandResult::ok(apply_group_visibility(attach_to_group(flow, node_id, group_id)), group_id);
}

CommandResult detach_command(const Flow& flow, const std::string& node_id) {
    const Node* node = flow_model::find_node(flow.nodes, node_id);
    if (!node) return rejected("detach", "Node " + node_id + " not found");
    if (!node->parent_group_id) return rejected("detach", "Node " + node_id + " is not in a group");
    return CommandResult::ok(apply_group_visibility(detach_from_group(flow, node_id)));
}

CommandResult collapse_subtree_command(const Flow& flow, const std::string& node_id, bool collapsed) {
    if (!flow_model::find_node(flow.nodes, node_id))
        return rejected("collapse_subtree", "Node " + node_id + " not found");
    return CommandResult::ok(apply_group_visibility(collapse_subtree(flow, node_id, collapsed)));
}

} // namespace flow_groups
