#pragma once

#include <flow_model/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace flow_groups {

// Result shape shared by every front end. On success updated_flow holds the flow
// after the full visibility pass; on failure error names the offending ids.
struct CommandResult {
    bool success = false;
    std::string error;
    std::optional<flow_model::Flow> updated_flow;
    std::optional<std::string> group_id;

    static CommandResult ok(flow_model::Flow flow, std::optional<std::string> group_id = std::nullopt);
    static CommandResult fail(std::string error);
};

struct CreateGroupRequest {
    std::vector<std::string> member_ids;
    std::optional<std::string> label;
    std::optional<flow_model::Position> position;
    bool collapse = true;
    std::optional<std::string> group_id;
};

CommandResult create_group_command(const flow_model::Flow& flow, const CreateGroupRequest& request);
CommandResult ungroup_command(const flow_model::Flow& flow, const std::string& group_id);

// expand empty flips the current state.
CommandResult toggle_group_command(const flow_model::Flow& flow, const std::string& group_id,
    std::optional<bool> expand = std::nullopt);

CommandResult attach_command(const flow_model::Flow& flow, const std::string& node_id, const std::string& group_id);
CommandResult detach_command(const flow_model::Flow& flow, const std::string& node_id);
CommandResult collapse_subtree_command(const flow_model::Flow& flow, const std::string& node_id, bool collapsed);

// First free "group-<n>" id, counting from the number of existing groups.
std::string next_group_id(const std::vector<flow_model::Node>& nodes);

} // namespace flow_groups
