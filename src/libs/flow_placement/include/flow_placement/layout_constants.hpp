#pragma once

namespace flow_placement {

// Layered layout defaults, in world units like node positions.

namespace layout {

constexpr double rank_sep = 50.0;       // gap between neighbouring rank columns (rows in TB)
constexpr double node_sep = 50.0;       // gap between neighbouring nodes inside one rank
// Members of one group sharing a rank are re-spaced this far apart (center to center).
constexpr double member_gap = 80.0;
constexpr double component_gap = 80.0;  // between stacked connected components

constexpr int ordering_sweeps = 4;      // barycenter down+up iterations
constexpr int coordinate_sweeps = 8;    // perpendicular averaging iterations

constexpr double epsilon = 1e-6;

} // namespace layout
} // namespace flow_placement
