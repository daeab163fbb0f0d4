#pragma once

#include <flow_model/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace flow_groups {

// Pure mutations. None of them recompute hidden flags or synthetic edges:
// callers run apply_group_visibility() on the result.

struct CreateGroupOptions {
    std::string group_id;
    std::string label;
    std::vector<std::string> member_ids;
    std::optional<flow_model::Position> position; // defaults to the members' centroid
    bool collapse = true;
};

// Throws std::invalid_argument when group_id is empty.
flow_model::Flow create_group(const flow_model::Flow& flow, const CreateGroupOptions& options);

// Removes the group node; direct members move up to the group's own parent.
// Returns the flow unchanged when group_id is not a group.
flow_model::Flow ungroup(const flow_model::Flow& flow, const std::string& group_id);

// Sets the display state, or flips it when collapsed is empty.
flow_model::Flow toggle_expansion(const flow_model::Flow& flow, const std::string& group_id,
    std::optional<bool> collapsed = std::nullopt);

flow_model::Flow attach_to_group(const flow_model::Flow& flow, const std::string& node_id,
    const std::string& group_id);

// Moves node_id one level up (to its group's parent, or top level).
flow_model::Flow detach_from_group(const flow_model::Flow& flow, const std::string& node_id);

// Nodes reachable from node_id over outgoing edges (not group membership), in visit order.
std::vector<std::string> edge_descendants(const flow_model::Flow& flow, const std::string& node_id);

// Hides or shows the edge subtree below node_id and marks node_id as its collapsed root.
flow_model::Flow collapse_subtree(const flow_model::Flow& flow, const std::string& node_id, bool collapsed);

} // namespace flow_groups
