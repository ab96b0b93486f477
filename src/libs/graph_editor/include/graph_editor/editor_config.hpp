#pragma once

#include <graph_geometry/geometry.hpp>
#include <graph_placement/task_layout_constants.hpp>

namespace graph_editor {

struct EditorConfig {
    // Pointer travel (screen units) that turns a press into a drag.
    double drag_threshold = 5.0;

    double zoom_snap_tolerance = 0.1;
    double min_zoom = 0.1;
    double max_zoom = 10.0;
    double wheel_zoom_in_factor = 1.2;
    double wheel_zoom_out_factor = 1.0 / 1.2;

    double edge_margin = graph_placement::layout::edge_margin;

    // Canvas size in screen units; new tasks are centered in it.
    graph_geometry::Size viewport{ 1280.0, 720.0 };

    // Link mode toggle at startup. Holding shift links regardless.
    bool link_mode = false;

    double squared_drag_threshold() const { return drag_threshold * drag_threshold; }
};

} // namespace graph_editor
