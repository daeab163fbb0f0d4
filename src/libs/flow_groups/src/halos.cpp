#include <flow_groups/halos.hpp>
#include <flow_model/hierarchy.hpp>
#include <flow_model/log.hpp>
#include <algorithm>
#include <cmath>
#include <functional>
#include <limits>
#include <unordered_map>

namespace flow_groups {

using flow_model::IdSet;
using flow_model::Node;
using flow_model::Rect;

namespace {

struct Candidate {
    const Node* group;
    Rect bounds;
};

// Height of the nested halo tree below each eligible group; 0 for leaves.
std::unordered_map<std::string, int> eligible_depths(const std::vector<Node>& nodes, const IdSet& eligible) {
    std::unordered_map<std::string, std::vector<std::string>> children;
    for (const auto& id : eligible) children[id];
    for (const auto& n : nodes) {
        if (!n.is_group() || !eligible.count(n.id) || !n.parent_group_id) continue;
        if (!eligible.count(*n.parent_group_id)) continue;
        children[*n.parent_group_id].push_back(n.id);
    }

    std::unordered_map<std::string, int> memo;
    IdSet on_stack;
    std::function<int(const std::string&)> visit = [&](const std::string& id) -> int {
        auto known = memo.find(id);
        if (known != memo.end()) return known->second;
        if (!on_stack.insert(id).second) {
            memo[id] = 0;
            return 0;
        }
        int deepest = 0;
        const auto& kids = children[id];
        for (const auto& child : kids) deepest = std::max(deepest, visit(child));
        on_stack.erase(id);
        const int depth = kids.empty() ? 0 : deepest + 1;
        memo[id] = depth;
        return depth;
    };

    for (const auto& id : eligible) visit(id);
    return memo;
}

} // namespace

double halo_padding_for_depth(int depth, const HaloAxisPadding& axis) {
    double padding = axis.base;
    for (int level = 0; level < depth; ++level) {
        const double step = axis.increment * std::pow(axis.decay, level);
        padding += std::isfinite(step) ? std::max(axis.min_step, std::round(step)) : axis.min_step;
    }
    return padding;
}

std::optional<Rect> compute_node_bounds(const std::vector<const Node*>& nodes,
    const flow_model::DimensionsFn& dimensions)
{
    if (nodes.empty()) return std::nullopt;

    double min_x = std::numeric_limits<double>::infinity();
    double min_y = std::numeric_limits<double>::infinity();
    double max_x = -std::numeric_limits<double>::infinity();
    double max_y = -std::numeric_limits<double>::infinity();
    for (const Node* n : nodes) {
        const flow_model::Size size = dimensions ? dimensions(*n) : flow_model::Size{};
        min_x = std::min(min_x, n->position.x);
        min_y = std::min(min_y, n->position.y);
        max_x = std::max(max_x, n->position.x + size.width);
        max_y = std::max(max_y, n->position.y + size.height);
    }
    if (!std::isfinite(min_x) || !std::isfinite(min_y) || !std::isfinite(max_x) || !std::isfinite(max_y))
        return std::nullopt;
    return Rect{ min_x, min_y, max_x - min_x, max_y - min_y };
}

std::vector<Halo> compute_halos(const std::vector<Node>& nodes,
    const flow_model::DimensionsFn& dimensions, const HaloPaddingConfig& padding)
{
    std::vector<Halo> halos;
    if (nodes.empty()) return halos;

    const auto index = flow_model::build_node_index(nodes);
    std::vector<Candidate> candidates;
    for (const auto& group : nodes) {
        if (!group.is_group() || group.group_hidden || group.is_collapsed()) continue;

        std::vector<const Node*> visible;
        for (const auto& id : flow_model::group_descendants(nodes, group.id)) {
            auto it = index.find(id);
            if (it == index.end()) continue;
            const Node& member = nodes[it->second];
            if (member.is_visible()) visible.push_back(&member);
        }
        auto bounds = compute_node_bounds(visible, dimensions);
        if (!bounds) continue;
        candidates.push_back({ &group, *bounds });
    }
    if (candidates.empty()) return halos;

    IdSet eligible;
    for (const auto& c : candidates) eligible.insert(c.group->id);
    const auto depths = eligible_depths(nodes, eligible);

    const double pad_x = halo_padding_for_depth(0, padding.x);
    for (const auto& c : candidates) {
        auto depth = depths.find(c.group->id);
        const double pad_y = halo_padding_for_depth(depth == depths.end() ? 0 : depth->second, padding.y);
        Halo halo;
        halo.group_id = c.group->id;
        halo.label = c.group->label.empty() ? "Group" : c.group->label;
        halo.bounds = Rect{ c.bounds.x - pad_x, c.bounds.y - pad_y,
            c.bounds.width + pad_x * 2, c.bounds.height + pad_y * 2 };
        halos.push_back(std::move(halo));
    }

    flow_model::engine_logger()->debug("compute_halos groups={}", halos.size());
    return halos;
}

void sort_halos_by_area(std::vector<Halo>& halos) {
    std::stable_sort(halos.begin(), halos.end(),
        [](const Halo& a, const Halo& b) { return a.bounds.area() < b.bounds.area(); });
}

} // namespace flow_groups
