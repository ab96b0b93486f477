#include <graph_editor/editor_events.hpp>
#include <utility>

namespace graph_editor {

void EditorEvents::on_selection_changed(SelectionChangedHandler handler) {
    if (handler) selection_changed_.push_back(std::move(handler));
}

void EditorEvents::on_task_moved(TaskMovedHandler handler) {
    if (handler) task_moved_.push_back(std::move(handler));
}

void EditorEvents::on_new_dependency(NewDependencyHandler handler) {
    if (handler) new_dependency_.push_back(std::move(handler));
}

void EditorEvents::clear() {
    selection_changed_.clear();
    task_moved_.clear();
    new_dependency_.clear();
}

void EditorEvents::emit_selection_changed(const std::vector<graph_model::TaskId>& selection) const {
    for (const auto& h : selection_changed_) h(selection);
}

void EditorEvents::emit_task_moved(graph_model::TaskId task) const {
    for (const auto& h : task_moved_) h(task);
}

void EditorEvents::emit_new_dependency() const {
    for (const auto& h : new_dependency_) h();
}

} // namespace graph_editor
