#pragma once

#include <graph_model/types.hpp>
#include <functional>
#include <vector>

namespace graph_editor {

// Listeners for the three notifications the editor raises. Handlers run
// synchronously, after the triggering mutation is complete.
class EditorEvents {
public:
    using SelectionChangedHandler = std::function<void(const std::vector<graph_model::TaskId>&)>;
    using TaskMovedHandler = std::function<void(graph_model::TaskId)>;
    using NewDependencyHandler = std::function<void()>;

    void on_selection_changed(SelectionChangedHandler handler);
    void on_task_moved(TaskMovedHandler handler);
    void on_new_dependency(NewDependencyHandler handler);
    void clear();

    void emit_selection_changed(const std::vector<graph_model::TaskId>& selection) const;
    void emit_task_moved(graph_model::TaskId task) const;
    void emit_new_dependency() const;

private:
    std::vector<SelectionChangedHandler> selection_changed_;
    std::vector<TaskMovedHandler> task_moved_;
    std::vector<NewDependencyHandler> new_dependency_;
};

} // namespace graph_editor
