#pragma once

#include <graph_editor/interaction.hpp>
#include <graph_editor/task_editor.hpp>
#include <graph_model/types.hpp>
#include <string>

struct ImVec2;

namespace canvas {

// ImGui surface for a TaskEditor: feeds mouse state to the interaction
// controller as pointer events and draws grid, edges and tasks.
class TaskCanvas {
public:
    explicit TaskCanvas(graph_editor::TaskEditor& editor);
    ~TaskCanvas();

    void set_grid_step(float step) { grid_step_ = step; }
    float grid_step() const { return grid_step_; }

    // Re-measure task labels on the next frame (after load, add, rename).
    void invalidate_task_sizes() { sizes_dirty_ = true; }

    graph_editor::InteractionController& interaction() { return interaction_; }
    const graph_editor::InteractionController& interaction() const { return interaction_; }

    bool update_and_draw(float region_width, float region_height);

private:
    void draw_grid(ImVec2 region_min, ImVec2 region_max);
    void draw_zoom_indicator(ImVec2 region_min, ImVec2 region_max);
    void handle_input(ImVec2 region_min, float region_width, float region_height);
    void sync_task_sizes();
    void trace_gesture_end(graph_editor::InteractionState previous);

    graph_editor::TaskEditor& editor_;
    graph_editor::InteractionController interaction_;
    float grid_step_ = 40.0f;
    bool sizes_dirty_ = true;
    std::size_t measured_task_count_ = 0;
    float last_mouse_x_ = 0;
    float last_mouse_y_ = 0;
};

} // namespace canvas
