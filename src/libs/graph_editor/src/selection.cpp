#include <graph_editor/selection.hpp>

namespace graph_editor {

SelectionManager::SelectionManager(graph_model::TaskGraph& graph, const EditorEvents& events)
    : graph_(graph)
    , events_(events)
{
}

void SelectionManager::reset_flags() {
    for (graph_model::TaskId id : graph_.selected_task_ids())
        graph_.set_selected(id, false);
}

void SelectionManager::click(graph_model::TaskId task, bool shift) {
    if (shift)
        toggle(task);
    else
        select_only(task);
}

void SelectionManager::select_only(graph_model::TaskId task) {
    if (!graph_.contains(task)) return;
    reset_flags();
    graph_.set_selected(task, true);
    notify();
}

void SelectionManager::toggle(graph_model::TaskId task) {
    const graph_model::Task* t = graph_.task(task);
    if (!t) return;
    graph_.set_selected(task, !t->selected);
    notify();
}

void SelectionManager::select_all() {
    for (graph_model::TaskId id : graph_.task_ids())
        graph_.set_selected(id, true);
    notify();
}

void SelectionManager::clear() {
    reset_flags();
    events_.emit_selection_changed({});
}

std::vector<graph_model::TaskId> SelectionManager::selected() const {
    return graph_.selected_task_ids();
}

bool SelectionManager::empty() const {
    for (const graph_model::Task* t : graph_.tasks())
        if (t->selected) return false;
    return true;
}

bool SelectionManager::is_selected(graph_model::TaskId task) const {
    const graph_model::Task* t = graph_.task(task);
    return t && t->selected;
}

void SelectionManager::notify() const {
    events_.emit_selection_changed(selected());
}

} // namespace graph_editor
