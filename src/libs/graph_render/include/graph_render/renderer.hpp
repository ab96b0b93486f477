#pragma once

#include <graph_geometry/geometry.hpp>
#include <graph_model/task_graph.hpp>
#include <graph_placement/connection_lines.hpp>
#include <optional>
#include <unordered_map>

struct ImDrawList;

namespace graph_render {

struct ViewTransform {
    float origin_x = 0; // canvas top-left in screen pixels
    float origin_y = 0;
    float pan_x = 0;
    float pan_y = 0;
    float zoom = 1.0f;
};

void render_task_graph(ImDrawList* draw_list,
    const graph_model::TaskGraph& graph,
    const graph_placement::ConnectionLines& lines,
    const ViewTransform& view,
    const std::optional<graph_geometry::Segment>& provisional_line = std::nullopt,
    std::optional<graph_model::TaskId> dragged_task = std::nullopt);

// Box size per task from its label, using ImGui::CalcTextSize (current font).
// Call only when an ImGui context is active.
std::unordered_map<graph_model::TaskId, graph_geometry::Size> compute_task_sizes(
    const graph_model::TaskGraph& graph);

} // namespace graph_render
