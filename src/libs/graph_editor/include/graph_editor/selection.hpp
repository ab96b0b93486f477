#pragma once

#include <graph_editor/editor_events.hpp>
#include <graph_model/task_graph.hpp>
#include <vector>

namespace graph_editor {

// Selection is the set of live tasks whose selected flag is set. Every
// mutation reports the resulting selection in render order.
class SelectionManager {
public:
    SelectionManager(graph_model::TaskGraph& graph, const EditorEvents& events);

    // Plain click selects only the task; shift-click toggles it.
    void click(graph_model::TaskId task, bool shift);
    void select_only(graph_model::TaskId task);
    void toggle(graph_model::TaskId task);
    void select_all();
    void clear();

    std::vector<graph_model::TaskId> selected() const;
    bool empty() const;
    bool is_selected(graph_model::TaskId task) const;

    void notify() const;

private:
    void reset_flags();

    graph_model::TaskGraph& graph_;
    const EditorEvents& events_;
};

} // namespace graph_editor
