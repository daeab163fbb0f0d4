#pragma once

#include <optional>
#include <string>
#include <vector>

namespace flow_model {

struct Position {
    double x = 0;
    double y = 0;

    bool operator==(const Position&) const = default;
};

enum class NodeKind { Regular, Group };

// Group nodes invert their own visibility: a collapsed group stands in for its
// members, an expanded group disappears and its members (plus a halo) show instead.
enum class GroupDisplayState { Expanded, Collapsed };

struct Node {
    std::string id;
    NodeKind kind = NodeKind::Regular;
    std::string label;
    Position position;
    std::optional<std::string> parent_group_id;
    GroupDisplayState display_state = GroupDisplayState::Expanded;

    // Derived by the visibility pass.
    bool hidden = false;
    bool group_hidden = false;

    // Edge-subtree collapse (Alt+Click style), independent of groups.
    bool subtree_hidden = false;
    bool subtree_collapsed = false;

    bool is_group() const { return kind == NodeKind::Group; }
    bool is_collapsed() const { return is_group() && display_state == GroupDisplayState::Collapsed; }
    bool is_visible() const { return !hidden && !group_hidden; }

    bool operator==(const Node&) const = default;
};

struct Edge {
    std::string id;
    std::string source;
    std::string target;
    std::string label;
    bool is_synthetic = false;
    bool hidden = false;
    bool group_hidden = false;

    bool operator==(const Edge&) const = default;
};

struct Flow {
    std::vector<Node> nodes;
    std::vector<Edge> edges;

    bool operator==(const Flow&) const = default;
};

} // namespace flow_model
