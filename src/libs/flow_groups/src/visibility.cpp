#include <flow_groups/visibility.hpp>
#include <flow_groups/synthetic_edges.hpp>
#include <flow_model/log.hpp>
#include <iterator>
#include <unordered_map>
#include <utility>

namespace flow_groups {

using flow_model::Edge;
using flow_model::Flow;
using flow_model::IdSet;
using flow_model::Node;

namespace {

void apply_edge_flags(std::vector<Edge>& edges, const std::vector<Node>& nodes) {
    const auto index = flow_model::build_node_index(nodes);
    auto flags = [&](const std::string& id) -> std::pair<bool, bool> {
        auto it = index.find(id);
        if (it == index.end()) return { false, false };
        const Node& n = nodes[it->second];
        return { n.hidden, n.group_hidden };
    };
    for (auto& e : edges) {
        const auto [source_hidden, source_group_hidden] = flags(e.source);
        const auto [target_hidden, target_group_hidden] = flags(e.target);
        e.hidden = source_hidden || target_hidden;
        e.group_hidden = source_group_hidden || target_group_hidden;
    }
}

bool same_flags(const Node& a, const Node& b) {
    return a.hidden == b.hidden && a.group_hidden == b.group_hidden;
}

bool same_flags(const Edge& a, const Edge& b) {
    return a.hidden == b.hidden && a.group_hidden == b.group_hidden;
}

} // namespace

IdSet ancestor_hidden_set(const std::vector<Node>& nodes) {
    const auto index = flow_model::build_node_index(nodes);
    std::unordered_map<std::string, bool> memo;

    // Walks up from each node until a collapsed parent, a memoized parent, a missing
    // parent or a return to a node already on the walk.
    auto resolve = [&](const Node& start) {
        std::vector<std::string> path{ start.id };
        IdSet on_path{ start.id };
        const Node* current = &start;
        bool result = false;
        bool cyclic = false;
        while (current->parent_group_id) {
            auto parent = index.find(*current->parent_group_id);
            if (parent == index.end()) break;
            const Node& p = nodes[parent->second];
            if (on_path.count(p.id)) {
                cyclic = true;
                break;
            }
            if (p.is_collapsed()) {
                result = true;
                break;
            }
            auto known = memo.find(p.id);
            if (known != memo.end()) {
                result = known->second;
                break;
            }
            on_path.insert(p.id);
            path.push_back(p.id);
            current = &p;
        }
        // Ids above the start were reached through non-collapsed parents and share its
        // answer, unless the walk looped back and each of them sees a different chain.
        if (cyclic) {
            memo.emplace(start.id, result);
        } else {
            for (const auto& id : path) memo.emplace(id, result);
        }
    };

    for (const auto& n : nodes) {
        if (!memo.count(n.id)) resolve(n);
    }

    IdSet hidden;
    for (const auto& [id, value] : memo) {
        if (value) hidden.insert(id);
    }
    return hidden;
}

VisibilityResult apply_visibility(const std::vector<Node>& nodes, const std::vector<Edge>& edges) {
    const IdSet ancestor_hidden = ancestor_hidden_set(nodes);

    VisibilityResult result;
    result.nodes.reserve(nodes.size());
    for (const auto& n : nodes) {
        Node next = n;
        const bool by_ancestor = ancestor_hidden.count(n.id) > 0;
        next.group_hidden = by_ancestor;
        if (n.is_group()) {
            next.hidden = by_ancestor || n.subtree_hidden || !n.is_collapsed();
        } else {
            next.hidden = by_ancestor || n.subtree_hidden || (n.hidden && !n.group_hidden);
        }
        result.nodes.push_back(std::move(next));
    }

    result.edges = edges;
    apply_edge_flags(result.edges, result.nodes);
    return result;
}

Flow apply_group_visibility(const Flow& flow) {
    auto visible = apply_visibility(flow.nodes, real_edges(flow.edges));

    auto synthetic = compute_synthetic_edges(visible.nodes, visible.edges);
    apply_edge_flags(synthetic, visible.nodes);

    Flow out;
    out.nodes = std::move(visible.nodes);
    out.edges = std::move(visible.edges);
    out.edges.insert(out.edges.end(), std::make_move_iterator(synthetic.begin()),
        std::make_move_iterator(synthetic.end()));
    return out;
}

RefreshResult refresh_flow(const Flow& flow) {
    RefreshResult result{ apply_group_visibility(flow), false };

    bool changed = !same_boundary(flow.edges, result.flow.edges)
        || flow.nodes.size() != result.flow.nodes.size();
    for (std::size_t i = 0; !changed && i < flow.nodes.size(); ++i)
        changed = !same_flags(flow.nodes[i], result.flow.nodes[i]);

    if (!changed) {
        // Real edges keep their relative order through the pass.
        const auto before = real_edges(flow.edges);
        const auto after = real_edges(result.flow.edges);
        changed = before.size() != after.size();
        for (std::size_t i = 0; !changed && i < before.size(); ++i)
            changed = !same_flags(before[i], after[i]);
    }
    if (!changed) {
        // Synthetic flags can move without the key set changing.
        std::unordered_map<std::string, const Edge*> previous;
        for (const auto& e : flow.edges) {
            if (e.is_synthetic) previous.emplace(e.id, &e);
        }
        for (const auto& f : result.flow.edges) {
            if (!f.is_synthetic) continue;
            auto it = previous.find(f.id);
            if (it == previous.end() || !same_flags(*it->second, f)) {
                changed = true;
                break;
            }
        }
    }

    result.changed = changed;
    flow_model::engine_logger()->debug("refresh_flow nodes={} edges={} changed={}",
        result.flow.nodes.size(), result.flow.edges.size(), changed);
    return result;
}

} // namespace flow_groups
