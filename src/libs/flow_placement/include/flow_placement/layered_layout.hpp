#pragma once

#include <flow_placement/layout_constants.hpp>
#include <flow_model/geometry.hpp>
#include <flow_model/types.hpp>
#include <string>
#include <unordered_map>
#include <utility>
#include <vector>

namespace flow_placement {

// LeftToRight: ranks advance along x, siblings stack along y. TopToBottom swaps the axes.
enum class LayoutDirection { LeftToRight, TopToBottom };

struct LayoutSpacing {
    double rank_sep = layout::rank_sep;
    double node_sep = layout::node_sep;
    double member_gap = layout::member_gap;
    double component_gap = layout::component_gap;
};

struct LayoutOptions {
    LayoutDirection direction = LayoutDirection::LeftToRight;
    LayoutSpacing spacing;
    flow_model::DimensionsFn dimensions; // empty: flow_model::NodeDimensions defaults
};

// Positions every node that is not hidden; hidden nodes keep their position.
// Real and synthetic edges between visible nodes drive the layering.
flow_model::Flow layout_flow(const flow_model::Flow& flow, const LayoutOptions& options = {});

using RankMap = std::unordered_map<std::string, int>;

// Longest-path ranks from the sources after reversing DFS back edges.
// Edges naming unknown ids and self loops are ignored.
RankMap assign_ranks(const std::vector<std::string>& ids,
    const std::vector<std::pair<std::string, std::string>>& edges);

// Rank of each ranked node relative to the lowest rank among its group's ranked
// members (top-level nodes form one group). Nodes missing from ranks are skipped.
RankMap build_depth_map(const std::vector<flow_model::Node>& nodes, const RankMap& ranks);

} // namespace flow_placement
