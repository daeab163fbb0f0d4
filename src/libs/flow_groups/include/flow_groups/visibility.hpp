#pragma once

#include <flow_model/hierarchy.hpp>
#include <flow_model/types.hpp>
#include <vector>

namespace flow_groups {

struct VisibilityResult {
    std::vector<flow_model::Node> nodes;
    std::vector<flow_model::Edge> edges;
};

// Ids with at least one collapsed group on their parent chain.
flow_model::IdSet ancestor_hidden_set(const std::vector<flow_model::Node>& nodes);

// Recomputes hidden / group_hidden on every node and edge. A regular node hidden
// for a reason other than grouping stays hidden.
VisibilityResult apply_visibility(const std::vector<flow_model::Node>& nodes,
    const std::vector<flow_model::Edge>& edges);

// Full pass: node visibility, synthetic edges rebuilt from the real ones, edge flags.
flow_model::Flow apply_group_visibility(const flow_model::Flow& flow);

struct RefreshResult {
    flow_model::Flow flow;
    bool changed = false;
};

// apply_group_visibility() plus a report of whether any flag or boundary edge moved.
RefreshResult refresh_flow(const flow_model::Flow& flow);

} // namespace flow_groups
