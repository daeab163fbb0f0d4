#include <flow_model/hierarchy.hpp>
#include <utility>

namespace flow_model {

namespace {

using ChildMap = std::unordered_map<std::string, std::vector<std::size_t>>;

ChildMap build_child_map(const std::vector<Node>& nodes) {
    ChildMap children;
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        if (nodes[i].parent_group_id)
            children[*nodes[i].parent_group_id].push_back(i);
    }
    return children;
}

} // namespace

NodeIndex build_node_index(const std::vector<Node>& nodes) {
    NodeIndex index;
    index.reserve(nodes.size());
    for (std::size_t i = 0; i < nodes.size(); ++i)
        index.emplace(nodes[i].id, i);
    return index;
}

const Node* find_node(const std::vector<Node>& nodes, const std::string& id) {
    for (const auto& n : nodes) {
        if (n.id == id) return &n;
    }
    return nullptr;
}

const Node* find_group(const std::vector<Node>& nodes, const std::string& id) {
    const Node* node = find_node(nodes, id);
    if (!node || !node->is_group()) return nullptr;
    return node;
}

std::vector<std::string> direct_members(const std::vector<Node>& nodes, const std::string& group_id) {
    std::vector<std::string> out;
    for (const auto& n : nodes) {
        if (n.parent_group_id && *n.parent_group_id == group_id)
            out.push_back(n.id);
    }
    return out;
}

std::vector<std::string> group_descendants(const std::vector<Node>& nodes, const std::string& group_id) {
    std::vector<std::string> out;
    if (!find_node(nodes, group_id)) return out;

    const ChildMap children = build_child_map(nodes);
    IdSet visited{ group_id };
    std::vector<std::string> stack{ group_id };

    while (!stack.empty()) {
        std::string current = std::move(stack.back());
        stack.pop_back();
        if (current != group_id) out.push_back(current);

        auto it = children.find(current);
        if (it == children.end()) continue;
        // Reverse push keeps the pre-order in node order.
        for (auto child = it->second.rbegin(); child != it->second.rend(); ++child) {
            const std::string& child_id = nodes[*child].id;
            if (visited.insert(child_id).second)
                stack.push_back(child_id);
        }
    }
    return out;
}

IdSet descendant_set(const std::vector<Node>& nodes, const std::string& group_id) {
    const auto ids = group_descendants(nodes, group_id);
    return IdSet(ids.begin(), ids.end());
}

bool is_ancestor_of(const std::vector<Node>& nodes, const std::string& a, const std::string& b) {
    return descendant_set(nodes, a).count(b) > 0;
}

std::vector<std::string> ancestor_chain(const std::vector<Node>& nodes, const std::string& id) {
    std::vector<std::string> chain;
    const NodeIndex index = build_node_index(nodes);
    auto it = index.find(id);
    if (it == index.end()) return chain;

    IdSet seen{ id };
    const Node* current = &nodes[it->second];
    while (current->parent_group_id) {
        const std::string& parent_id = *current->parent_group_id;
        auto parent = index.find(parent_id);
        if (parent == index.end()) break;
        if (!seen.insert(parent_id).second) break;
        chain.push_back(parent_id);
        current = &nodes[parent->second];
    }
    return chain;
}

std::optional<std::optional<std::string>> common_parent_group(const std::vector<Node>& nodes,
    const std::vector<std::string>& ids)
{
    if (ids.empty()) return std::nullopt;
    std::optional<std::optional<std::string>> shared;
    for (const auto& id : ids) {
        const Node* node = find_node(nodes, id);
        if (!node) return std::nullopt;
        if (!shared) {
            shared = node->parent_group_id;
        } else if (*shared != node->parent_group_id) {
            return std::nullopt;
        }
    }
    return shared;
}

} // namespace flow_model
