#pragma once

#include <string_view>

namespace flow_groups {

// Shared constants for group operations, halos and synthetic edges.
// Geometry values are in world units (double), same as node positions.

namespace constants {

inline constexpr std::string_view synthetic_edge_prefix = "group-edge-";
inline constexpr std::string_view generated_group_prefix = "group-";
inline constexpr std::string_view default_group_label_prefix = "Group ";

// A group created without a position sits above its members' centroid.
constexpr double group_centroid_offset_y = -60.0;

// Halo padding defaults: constant horizontally, growing with nesting depth vertically.
constexpr double halo_base_x = 18.0;
constexpr double halo_base_y = 12.0;
constexpr double halo_increment_y = 8.0;
constexpr double halo_decay_y = 0.7;
constexpr double halo_min_step_y = 1.0;

} // namespace constants
} // namespace flow_groups
