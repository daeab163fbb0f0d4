#include <flow_groups/group_ops.hpp>
#include <flow_groups/group_constants.hpp>
#include <flow_model/hierarchy.hpp>
#include <flow_model/log.hpp>
#include <stdexcept>
#include <unordered_map>

namespace flow_groups {

using flow_model::Edge;
using flow_model::Flow;
using flow_model::GroupDisplayState;
using flow_model::IdSet;
using flow_model::Node;
using flow_model::Position;

namespace {

Position member_centroid(const std::vector<Node>& nodes, const IdSet& members) {
    Position sum;
    std::size_t count = 0;
    for (const auto& n : nodes) {
        if (!members.count(n.id)) continue;
        sum.x += n.position.x;
        sum.y += n.position.y;
        ++count;
    }
    if (count == 0) return {};
    return { sum.x / static_cast<double>(count),
        sum.y / static_cast<double>(count) + constants::group_centroid_offset_y };
}

// Group-caused hiding no longer applies once a node leaves the group.
void clear_group_hiding(Node& node) {
    if (node.group_hidden) {
        node.group_hidden = false;
        node.hidden = node.subtree_hidden;
    }
}

} // namespace

Flow create_group(const Flow& flow, const CreateGroupOptions& options) {
    if (options.group_id.empty())
        throw std::invalid_argument("create_group requires a non-empty group id");

    const IdSet members(options.member_ids.begin(), options.member_ids.end());
    const auto shared_parent = flow_model::common_parent_group(flow.nodes, options.member_ids);

    Flow out;
    out.edges = flow.edges;
    out.nodes.reserve(flow.nodes.size() + 1);
    for (const auto& n : flow.nodes) {
        Node next = n;
        if (members.count(n.id)) next.parent_group_id = options.group_id;
        out.nodes.push_back(std::move(next));
    }

    Node group;
    group.id = options.group_id;
    group.kind = flow_model::NodeKind::Group;
    group.label = options.label;
    group.position = options.position ? *options.position : member_centroid(flow.nodes, members);
    group.display_state = options.collapse ? GroupDisplayState::Collapsed : GroupDisplayState::Expanded;
    // Sub-grouping: the new group takes the place of its members inside their parent.
    if (shared_parent && *shared_parent)
        group.parent_group_id = **shared_parent;
    out.nodes.push_back(std::move(group));

    flow_model::engine_logger()->debug("create_group id={} members={} collapsed={}",
        options.group_id, options.member_ids.size(), options.collapse);
    return out;
}

Flow ungroup(const Flow& flow, const std::string& group_id) {
    const Node* group = flow_model::find_group(flow.nodes, group_id);
    if (!group) return flow;
    const std::optional<std::string> new_parent = group->parent_group_id;

    Flow out;
    out.edges = flow.edges;
    out.nodes.reserve(flow.nodes.size());
    for (const auto& n : flow.nodes) {
        if (n.id == group_id) continue;
        Node next = n;
        if (n.parent_group_id && *n.parent_group_id == group_id) {
            next.parent_group_id = new_parent;
            clear_group_hiding(next);
        }
        out.nodes.push_back(std::move(next));
    }

    flow_model::engine_logger()->debug("ungroup id={} members_moved_to={}",
        group_id, new_parent ? *new_parent : std::string("<top level>"));
    return out;
}

Flow toggle_expansion(const Flow& flow, const std::string& group_id, std::optional<bool> collapsed) {
    const Node* group = flow_model::find_group(flow.nodes, group_id);
    if (!group) return flow;

    const bool next_collapsed = collapsed ? *collapsed : !group->is_collapsed();
    Flow out = flow;
    for (auto& n : out.nodes) {
        if (n.id != group_id) continue;
        n.display_state = next_collapsed ? GroupDisplayState::Collapsed : GroupDisplayState::Expanded;
        break;
    }
    flow_model::engine_logger()->debug("toggle_expansion id={} collapsed={}", group_id, next_collapsed);
    return out;
}

Flow attach_to_group(const Flow& flow, const std::string& node_id, const std::string& group_id) {
    Flow out = flow;
    for (auto& n : out.nodes) {
        if (n.id == node_id) {
            n.parent_group_id = group_id;
            break;
        }
    }
    return out;
}

Flow detach_from_group(const Flow& flow, const std::string& node_id) {
    const Node* node = flow_model::find_node(flow.nodes, node_id);
    if (!node || !node->parent_group_id) return flow;

    std::optional<std::string> new_parent;
    if (const Node* group = flow_model::find_node(flow.nodes, *node->parent_group_id))
        new_parent = group->parent_group_id;

    Flow out = flow;
    for (auto& n : out.nodes) {
        if (n.id != node_id) continue;
        n.parent_group_id = new_parent;
        clear_group_hiding(n);
        break;
    }
    return out;
}

std::vector<std::string> edge_descendants(const Flow& flow, const std::string& node_id) {
    std::vector<std::string> out;
    if (!flow_model::find_node(flow.nodes, node_id)) return out;

    std::unordered_map<std::string, std::vector<std::string>> successors;
    for (const auto& e : flow.edges) {
        if (e.is_synthetic) continue;
        successors[e.source].push_back(e.target);
    }

    IdSet visited{ node_id };
    std::vector<std::string> stack{ node_id };
    while (!stack.empty()) {
        const std::string current = stack.back();
        stack.pop_back();
        auto it = successors.find(current);
        if (it == successors.end()) continue;
        for (auto child = it->second.rbegin(); child != it->second.rend(); ++child) {
            if (!visited.insert(*child).second) continue;
            if (!flow_model::find_node(flow.nodes, *child)) continue;
            out.push_back(*child);
            stack.push_back(*child);
        }
    }
    return out;
}

Flow collapse_subtree(const Flow& flow, const std::string& node_id, bool collapsed) {
    if (!flow_model::find_node(flow.nodes, node_id)) return flow;

    const auto descendants = edge_descendants(flow, node_id);
    const IdSet descendant_ids(descendants.begin(), descendants.end());

    Flow out = flow;
    for (auto& n : out.nodes) {
        if (n.id == node_id) {
            n.subtree_collapsed = collapsed;
        } else if (descendant_ids.count(n.id)) {
            n.hidden = collapsed;
            n.subtree_hidden = collapsed;
        }
    }
    for (auto& e : out.edges) {
        if (descendant_ids.count(e.source) || descendant_ids.count(e.target))
            e.hidden = collapsed;
    }

    flow_model::engine_logger()->debug("collapse_subtree root={} descendants={} collapsed={}",
        node_id, descendants.size(), collapsed);
    return out;
}

} // namespace flow_groups
