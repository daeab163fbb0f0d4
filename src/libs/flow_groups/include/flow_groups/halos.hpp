#pragma once

#include <flow_groups/group_constants.hpp>
#include <flow_model/geometry.hpp>
#include <flow_model/types.hpp>
#include <optional>
#include <string>
#include <vector>

namespace flow_groups {

// Padding on one axis: base + sum over nesting levels of max(min_step, round(increment * decay^level)).
struct HaloAxisPadding {
    double base = 0;
    double increment = 0;
    double decay = 1;
    double min_step = 0;
};

struct HaloPaddingConfig {
    HaloAxisPadding x{ constants::halo_base_x, 0, 1, 0 };
    HaloAxisPadding y{ constants::halo_base_y, constants::halo_increment_y,
        constants::halo_decay_y, constants::halo_min_step_y };
};

struct Halo {
    std::string group_id;
    std::string label;
    flow_model::Rect bounds;
};

double halo_padding_for_depth(int depth, const HaloAxisPadding& axis);

// Box over position .. position + size of each node; nullopt when nodes is empty.
std::optional<flow_model::Rect> compute_node_bounds(const std::vector<const flow_model::Node*>& nodes,
    const flow_model::DimensionsFn& dimensions);

// One halo per expanded, not group-hidden group that has visible descendants, in node order.
std::vector<Halo> compute_halos(const std::vector<flow_model::Node>& nodes,
    const flow_model::DimensionsFn& dimensions, const HaloPaddingConfig& padding = {});

// Smallest first, so nested halos draw over their parents.
void sort_halos_by_area(std::vector<Halo>& halos);

} // namespace flow_groups
