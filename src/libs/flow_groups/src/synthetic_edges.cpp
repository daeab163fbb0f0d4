#include <flow_groups/synthetic_edges.hpp>
#include <flow_groups/group_constants.hpp>
#include <flow_model/hierarchy.hpp>
#include <flow_model/log.hpp>

namespace flow_groups {

using flow_model::Edge;
using flow_model::Node;

namespace {

std::string boundary_key(const std::string& source, const std::string& target) {
    return source + "->" + target;
}

} // namespace

std::string synthetic_edge_id(const std::string& source, const std::string& target) {
    return std::string(constants::synthetic_edge_prefix) + boundary_key(source, target);
}

std::vector<Edge> real_edges(const std::vector<Edge>& edges) {
    std::vector<Edge> out;
    out.reserve(edges.size());
    for (const auto& e : edges) {
        if (!e.is_synthetic) out.push_back(e);
    }
    return out;
}

std::vector<Edge> compute_synthetic_edges(const std::vector<Node>& nodes, const std::vector<Edge>& edges) {
    std::vector<Edge> out;
    std::set<std::string> emitted;

    auto emit = [&](const std::string& source, const std::string& target) {
        if (source == target) return;
        if (!emitted.insert(boundary_key(source, target)).second) return;
        Edge e;
        e.id = synthetic_edge_id(source, target);
        e.source = source;
        e.target = target;
        e.is_synthetic = true;
        out.push_back(std::move(e));
    };

    for (const auto& group : nodes) {
        if (!group.is_collapsed()) continue;
        const auto members = flow_model::descendant_set(nodes, group.id);
        if (members.empty()) continue;

        for (const auto& e : edges) {
            if (e.is_synthetic) continue;
            const bool source_inside = members.count(e.source) > 0;
            const bool target_inside = members.count(e.target) > 0;
            if (source_inside && !target_inside) {
                emit(group.id, e.target);
            } else if (!source_inside && target_inside) {
                emit(e.source, group.id);
            }
        }
    }

    flow_model::engine_logger()->trace("compute_synthetic_edges emitted={}", out.size());
    return out;
}

std::set<std::string> boundary_keys(const std::vector<Edge>& edges) {
    std::set<std::string> keys;
    for (const auto& e : edges) {
        if (e.is_synthetic) keys.insert(boundary_key(e.source, e.target));
    }
    return keys;
}

bool same_boundary(const std::vector<Edge>& a, const std::vector<Edge>& b) {
    return boundary_keys(a) == boundary_keys(b);
}

} // namespace flow_groups
