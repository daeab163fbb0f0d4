#include <flow_groups/validation.hpp>
#include <flow_model/hierarchy.hpp>
#include <flow_model/log.hpp>
#include <unordered_map>

namespace flow_groups {

using flow_model::IdSet;
using flow_model::Node;

ValidationResult validate_membership(const std::vector<std::string>& candidate_ids,
    const std::vector<Node>& nodes)
{
    if (candidate_ids.size() < 2)
        return ValidationResult::fail("Group must contain at least 2 nodes");

    IdSet unique;
    for (const auto& id : candidate_ids) {
        if (!unique.insert(id).second)
            return ValidationResult::fail("Cannot group duplicate nodes: " + id);
    }

    for (const auto& id : candidate_ids) {
        if (!flow_model::find_node(nodes, id))
            return ValidationResult::fail("Node " + id + " not found");
    }

    // One traversal per candidate instead of one per pair.
    std::unordered_map<std::string, IdSet> descendants;
    for (const auto& id : candidate_ids)
        descendants.emplace(id, flow_model::descendant_set(nodes, id));

    for (std::size_t i = 0; i < candidate_ids.size(); ++i) {
        for (std::size_t j = i + 1; j < candidate_ids.size(); ++j) {
            const std::string& a = candidate_ids[i];
            const std::string& b = candidate_ids[j];
            if (descendants[a].count(b))
                return ValidationResult::fail("Cannot group node " + a + " with its descendant " + b);
            if (descendants[b].count(a))
                return ValidationResult::fail("Cannot group node " + b + " with its descendant " + a);
        }
    }

    return ValidationResult::ok();
}

ValidationResult validate_attachment(const std::string& node_id, const std::string& group_id,
    const std::vector<Node>& nodes)
{
    const Node* node = flow_model::find_node(nodes, node_id);
    if (!node) return ValidationResult::fail("Node " + node_id + " not found");
    if (!flow_model::find_group(nodes, group_id))
        return ValidationResult::fail("Group " + group_id + " not found");
    if (node_id == group_id)
        return ValidationResult::fail("Cannot attach group " + group_id + " to itself");
    if (node->parent_group_id && *node->parent_group_id == group_id)
        return ValidationResult::fail("Node " + node_id + " is already in group " + group_id);
    if (flow_model::is_ancestor_of(nodes, node_id, group_id))
        return ValidationResult::fail("Cannot attach " + node_id + " to its descendant " + group_id);
    return ValidationResult::ok();
}

HierarchyReport validate_hierarchy(const std::vector<Node>& nodes) {
    HierarchyReport report;
    const auto index = flow_model::build_node_index(nodes);

    IdSet seen;
    for (const auto& n : nodes) {
        if (!seen.insert(n.id).second)
            report.issues.push_back({ "duplicate_id", n.id, "Duplicate node id " + n.id });
    }

    IdSet reported_cycle;
    for (const auto& n : nodes) {
        if (!n.parent_group_id) continue;
        auto parent = index.find(*n.parent_group_id);
        if (parent == index.end()) {
            report.issues.push_back({ "dangling_parent", n.id,
                "Node " + n.id + " references missing group " + *n.parent_group_id });
            continue;
        }
        if (!nodes[parent->second].is_group()) {
            report.issues.push_back({ "parent_not_group", n.id,
                "Node " + n.id + " references non-group parent " + *n.parent_group_id });
        }

        // Walk up until the chain ends or returns to n.
        IdSet walked{ n.id };
        const Node* current = &nodes[parent->second];
        while (true) {
            if (current->id == n.id || !walked.insert(current->id).second) {
                if (current->id == n.id && !reported_cycle.count(n.id)) {
                    reported_cycle.insert(n.id);
                    report.issues.push_back({ "parent_cycle", n.id,
                        "Node " + n.id + " is its own ancestor" });
                }
                break;
            }
            if (!current->parent_group_id) break;
            auto next = index.find(*current->parent_group_id);
            if (next == index.end()) break;
            current = &nodes[next->second];
        }
    }

    if (!report.ok()) {
        flow_model::engine_logger()->warn("Hierarchy audit found {} issue(s), first: {}",
            report.issues.size(), report.issues.front().message);
    }
    return report;
}

} // namespace flow_groups
