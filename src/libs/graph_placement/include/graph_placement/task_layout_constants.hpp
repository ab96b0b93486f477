#pragma once

namespace graph_placement {

// Shared layout constants for task boxes and dependency lines (used by
// placement and renderer). All values in world units.

namespace layout {

// Edges stop this far outside the task border so the arrow head stays visible.
constexpr double edge_margin = 8.0;

constexpr double task_padding_x = 12.0;
constexpr double task_padding_y = 8.0;
constexpr double task_min_width = 48.0;
constexpr double task_rounding = 4.0;

constexpr double edge_thickness = 2.0;
constexpr double arrow_head_length = 10.0;
constexpr double arrow_head_half_width = 5.0;

constexpr double selection_outline_thickness = 3.0;

} // namespace layout
} // namespace graph_placement
