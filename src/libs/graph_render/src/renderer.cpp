#include <graph_render/renderer.hpp>
#include <graph_placement/task_layout_constants.hpp>
#include "imgui.h"
#include <algorithm>
#include <cfloat>
#include <cmath>

namespace graph_render {

namespace {

using namespace graph_placement::layout;

ImVec2 world_to_screen(double wx, double wy, const ViewTransform& view) {
    return ImVec2(view.origin_x + view.pan_x + (float)wx * view.zoom,
                  view.origin_y + view.pan_y + (float)wy * view.zoom);
}

void draw_arrow(ImDrawList* dl, const graph_geometry::Segment& s, const ViewTransform& view,
    unsigned int color, float thickness)
{
    ImVec2 a = world_to_screen(s.from.x, s.from.y, view);
    ImVec2 b = world_to_screen(s.to.x, s.to.y, view);
    dl->AddLine(a, b, color, thickness);

    const float dx = b.x - a.x;
    const float dy = b.y - a.y;
    const float len = std::sqrt(dx * dx + dy * dy);
    if (len < 1.0f) return;
    const float ux = dx / len;
    const float uy = dy / len;
    const float head_len = (float)arrow_head_length * view.zoom;
    const float head_half = (float)arrow_head_half_width * view.zoom;
    ImVec2 base(b.x - ux * head_len, b.y - uy * head_len);
    ImVec2 left(base.x - uy * head_half, base.y + ux * head_half);
    ImVec2 right(base.x + uy * head_half, base.y - ux * head_half);
    dl->AddTriangleFilled(b, left, right, color);
}

} // namespace

void render_task_graph(ImDrawList* draw_list,
    const graph_model::TaskGraph& graph,
    const graph_placement::ConnectionLines& lines,
    const ViewTransform& view,
    const std::optional<graph_geometry::Segment>& provisional_line,
    std::optional<graph_model::TaskId> dragged_task)
{
    if (!draw_list) return;

    const unsigned int edge_color = IM_COL32(140, 140, 150, 255);
    const unsigned int provisional_color = IM_COL32(90, 160, 250, 255);
    const unsigned int todo_fill = IM_COL32(45, 45, 48, 255);
    const unsigned int completed_fill = IM_COL32(38, 70, 46, 255);
    const unsigned int dragged_fill = IM_COL32(60, 60, 66, 255);
    const unsigned int border_color = IM_COL32(100, 100, 105, 255);
    const unsigned int selected_color = IM_COL32(90, 160, 250, 255);
    const unsigned int text_color = IM_COL32(220, 220, 220, 255);
    const unsigned int completed_text_color = IM_COL32(150, 190, 155, 255);
    const float line_thickness = (float)edge_thickness;

    for (const auto& line : lines.visible_lines(graph))
        draw_arrow(draw_list, line.segment, view, edge_color, line_thickness);

    if (provisional_line)
        draw_arrow(draw_list, *provisional_line, view, provisional_color, line_thickness);

    const float rounding = (float)task_rounding * view.zoom;
    for (const graph_model::Task* t : graph.tasks()) {
        ImVec2 min_pt = world_to_screen(t->position.x, t->position.y, view);
        ImVec2 max_pt = world_to_screen(t->position.x + t->size.width, t->position.y + t->size.height, view);

        const bool completed = t->status == graph_model::TaskStatus::Completed;
        const bool dragged = dragged_task && *dragged_task == t->id;
        unsigned int fill = completed ? completed_fill : todo_fill;
        if (dragged) fill = dragged_fill;

        draw_list->AddRectFilled(min_pt, max_pt, fill, rounding);
        if (t->selected) {
            draw_list->AddRect(min_pt, max_pt, selected_color, rounding, 0, (float)selection_outline_thickness);
        } else {
            draw_list->AddRect(min_pt, max_pt, border_color, rounding, 0, line_thickness);
        }

        if (!t->name.empty()) {
            ImFont* font = ImGui::GetFont();
            const float font_size = ImGui::GetFontSize() * view.zoom;
            ImVec2 text_size = font->CalcTextSizeA(font_size, FLT_MAX, 0.0f, t->name.c_str());
            float tx = min_pt.x + (max_pt.x - min_pt.x - text_size.x) * 0.5f;
            float ty = min_pt.y + (max_pt.y - min_pt.y - text_size.y) * 0.5f;
            draw_list->AddText(font, font_size, ImVec2(tx, ty),
                completed ? completed_text_color : text_color, t->name.c_str());
            if (completed) {
                const float mid_y = ty + text_size.y * 0.5f;
                draw_list->AddLine(ImVec2(tx, mid_y), ImVec2(tx + text_size.x, mid_y), completed_text_color, 1.0f);
            }
        }
    }
}

std::unordered_map<graph_model::TaskId, graph_geometry::Size> compute_task_sizes(
    const graph_model::TaskGraph& graph)
{
    std::unordered_map<graph_model::TaskId, graph_geometry::Size> out;
    for (const graph_model::Task* t : graph.tasks()) {
        ImVec2 text = ImGui::CalcTextSize(t->name.c_str());
        graph_geometry::Size size;
        size.width = std::max(task_min_width, (double)text.x + 2.0 * task_padding_x);
        size.height = (double)text.y + 2.0 * task_padding_y;
        out[t->id] = size;
    }
    return out;
}

} // namespace graph_render
