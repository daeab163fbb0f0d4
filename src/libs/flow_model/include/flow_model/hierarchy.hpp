#pragma once

#include <flow_model/types.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace flow_model {

using IdSet = std::unordered_set<std::string>;
using NodeIndex = std::unordered_map<std::string, std::size_t>;

// id -> position in the node array. Later duplicates do not overwrite earlier ids.
NodeIndex build_node_index(const std::vector<Node>& nodes);

const Node* find_node(const std::vector<Node>& nodes, const std::string& id);
const Node* find_group(const std::vector<Node>& nodes, const std::string& id);

// Ids whose parent_group_id is group_id, in node order.
std::vector<std::string> direct_members(const std::vector<Node>& nodes, const std::string& group_id);

// Transitive closure over parent_group_id, depth-first in node order.
// Unknown ids give an empty result; cycles in stored data terminate.
std::vector<std::string> group_descendants(const std::vector<Node>& nodes, const std::string& group_id);
IdSet descendant_set(const std::vector<Node>& nodes, const std::string& group_id);

// True if b is a descendant of a.
bool is_ancestor_of(const std::vector<Node>& nodes, const std::string& a, const std::string& b);

// Parent chain of id, nearest parent first. Stops at a dangling reference or a repeat.
std::vector<std::string> ancestor_chain(const std::vector<Node>& nodes, const std::string& id);

// The parent shared by every id (nullopt inside means "all top-level"),
// or nothing when the ids disagree or one of them is unknown.
std::optional<std::optional<std::string>> common_parent_group(const std::vector<Node>& nodes,
    const std::vector<std::string>& ids);

} // namespace flow_model
