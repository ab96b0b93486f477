#include <graph_editor/task_editor.hpp>

namespace graph_editor {

EditorState::EditorState(const EditorConfig& config)
    : pan_zoom(config)
    , lines(config.edge_margin)
    , viewport(config.viewport)
    , link_mode(config.link_mode)
{
}

TaskEditor::TaskEditor(const EditorConfig& config)
    : config_(config)
    , state_(config)
    , selection_(state_.graph, events_)
{
}

graph_geometry::Point TaskEditor::view_center_world() const {
    const graph_geometry::Point screen_center{ state_.viewport.width * 0.5, state_.viewport.height * 0.5 };
    return state_.pan_zoom.screen_to_world(screen_center);
}

graph_geometry::Point TaskEditor::centered_position(const graph_geometry::Size& size) const {
    const graph_geometry::Point c = view_center_world();
    return { c.x - size.width * 0.5, c.y - size.height * 0.5 };
}

graph_model::LoadReport TaskEditor::load_graph(const graph_model::GraphDocument& document) {
    const bool had_selection = !selection_.empty();
    graph_model::LoadReport report = graph_model::from_document(state_.graph, document,
        centered_position(state_.graph.default_task_size()));
    state_.lines.rebuild(state_.graph);
    if (had_selection) events_.emit_selection_changed({});
    return report;
}

graph_model::GraphDocument TaskEditor::get_graph() const {
    return graph_model::to_document(state_.graph);
}

graph_model::TaskId TaskEditor::add_task(const graph_model::TaskSpec& spec) {
    graph_model::TaskSpec resolved = spec;
    if (!resolved.position)
        resolved.position = centered_position(resolved.size.value_or(state_.graph.default_task_size()));
    return state_.graph.add_task(resolved);
}

void TaskEditor::delete_selected() {
    for (graph_model::TaskId id : selection_.selected())
        state_.graph.delete_task(id);
    state_.lines.prune(state_.graph);
    events_.emit_selection_changed({});
}

std::size_t TaskEditor::complete_selected() {
    std::size_t changed = 0;
    for (graph_model::TaskId id : selection_.selected())
        if (state_.graph.toggle_status(id)) ++changed;
    return changed;
}

void TaskEditor::select_all() {
    selection_.select_all();
}

void TaskEditor::clear_graph() {
    const bool had_selection = !selection_.empty();
    state_.graph.clear();
    state_.lines.clear();
    if (had_selection) events_.emit_selection_changed({});
}

bool TaskEditor::delete_task(graph_model::TaskId task) {
    const graph_model::Task* t = state_.graph.task(task);
    if (!t) return false;
    const bool was_selected = t->selected;
    state_.graph.delete_task(task);
    state_.lines.prune(state_.graph);
    if (was_selected) selection_.notify();
    return true;
}

bool TaskEditor::delete_dependency(graph_model::DependencyId dependency) {
    if (!state_.graph.delete_dependency(dependency)) return false;
    state_.lines.erase(dependency);
    return true;
}

bool TaskEditor::move_task(graph_model::TaskId task, const graph_geometry::Point& position) {
    if (!state_.graph.move_task(task, position)) return false;
    state_.lines.update_incident(state_.graph, task);
    return true;
}

bool TaskEditor::set_task_size(graph_model::TaskId task, const graph_geometry::Size& size) {
    if (!state_.graph.set_task_size(task, size)) return false;
    state_.lines.update_incident(state_.graph, task);
    return true;
}

graph_model::DependencyResult TaskEditor::link(graph_model::TaskId predecessor, graph_model::TaskId successor) {
    graph_model::DependencyResult r = state_.graph.add_dependency(predecessor, successor);
    if (!r) return r;
    state_.lines.update(state_.graph, r.id);
    events_.emit_new_dependency();
    return r;
}

std::optional<graph_model::TaskId> TaskEditor::task_at_screen(const graph_geometry::Point& screen) const {
    return state_.graph.task_at(state_.pan_zoom.screen_to_world(screen));
}

} // namespace graph_editor
