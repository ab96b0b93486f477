#pragma once

#include <graph_editor/editor_config.hpp>
#include <graph_editor/editor_events.hpp>
#include <graph_editor/pan_zoom.hpp>
#include <graph_editor/selection.hpp>
#include <graph_model/document.hpp>
#include <graph_model/task_graph.hpp>
#include <graph_placement/connection_lines.hpp>
#include <optional>
#include <vector>

namespace graph_editor {

// Everything one canvas needs; several editors can coexist.
struct EditorState {
    explicit EditorState(const EditorConfig& config);

    graph_model::TaskGraph graph;
    PanZoom pan_zoom;
    graph_placement::ConnectionLines lines;
    graph_geometry::Size viewport;
    bool link_mode = false;
};

// Facade used by the host application and by the interaction controller.
// Keeps the cached edge paths in step with every model mutation and raises
// the editor events.
class TaskEditor {
public:
    explicit TaskEditor(const EditorConfig& config = {});

    TaskEditor(const TaskEditor&) = delete;
    TaskEditor& operator=(const TaskEditor&) = delete;

    graph_model::LoadReport load_graph(const graph_model::GraphDocument& document);
    graph_model::GraphDocument get_graph() const;

    // Tasks without a position are centered in the current view.
    graph_model::TaskId add_task(const graph_model::TaskSpec& spec);
    void delete_selected();
    // Toggles completion of every selected task; returns how many changed.
    std::size_t complete_selected();
    void select_all();
    void clear_graph();

    bool delete_task(graph_model::TaskId task);
    bool delete_dependency(graph_model::DependencyId dependency);
    bool move_task(graph_model::TaskId task, const graph_geometry::Point& position);
    bool set_task_size(graph_model::TaskId task, const graph_geometry::Size& size);
    // Commits a dependency and raises new_dependency on success.
    graph_model::DependencyResult link(graph_model::TaskId predecessor, graph_model::TaskId successor);

    std::optional<graph_model::TaskId> task_at_screen(const graph_geometry::Point& screen) const;
    graph_geometry::Point view_center_world() const;

    void set_viewport_size(const graph_geometry::Size& size) { state_.viewport = size; }
    void set_link_mode(bool enabled) { state_.link_mode = enabled; }
    bool link_mode() const { return state_.link_mode; }

    const graph_model::TaskGraph& graph() const { return state_.graph; }
    PanZoom& pan_zoom() { return state_.pan_zoom; }
    const PanZoom& pan_zoom() const { return state_.pan_zoom; }
    const graph_placement::ConnectionLines& lines() const { return state_.lines; }
    SelectionManager& selection() { return selection_; }
    const SelectionManager& selection() const { return selection_; }
    EditorEvents& events() { return events_; }
    const EditorConfig& config() const { return config_; }

private:
    graph_geometry::Point centered_position(const graph_geometry::Size& size) const;

    EditorConfig config_;
    EditorState state_;
    EditorEvents events_;
    SelectionManager selection_;
};

} // namespace graph_editor
