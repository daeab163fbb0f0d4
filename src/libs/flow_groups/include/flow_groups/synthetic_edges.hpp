#pragma once

#include <flow_model/types.hpp>
#include <set>
#include <string>
#include <vector>

namespace flow_groups {

// One boundary edge per (collapsed group, external node) pair and direction, so a
// collapsed group keeps its links to the rest of the graph. Synthetic edges in the
// input are ignored; ids are "group-edge-<source>-><target>".
std::vector<flow_model::Edge> compute_synthetic_edges(const std::vector<flow_model::Node>& nodes,
    const std::vector<flow_model::Edge>& edges);

std::vector<flow_model::Edge> real_edges(const std::vector<flow_model::Edge>& edges);

std::string synthetic_edge_id(const std::string& source, const std::string& target);

// "<source>-><target>" for every synthetic edge.
std::set<std::string> boundary_keys(const std::vector<flow_model::Edge>& edges);

bool same_boundary(const std::vector<flow_model::Edge>& a, const std::vector<flow_model::Edge>& b);

} // namespace flow_groups
