#pragma once

#include <graph_model/errors.hpp>
#include <graph_model/types.hpp>
#include <graph_geometry/geometry.hpp>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace graph_model {

// Owns every Task and Dependency. Entities live in slot arenas addressed by
// id; deleting one empties its slot. Ids are never reused, not even across
// clear(), so a stale id can only ever miss.
// Emptied slots are only released by clear() (and so by every document load);
// until then the arenas grow with each task or dependency ever created, and
// scans such as tasks() and task_at() walk the dead slots too.
class TaskGraph {
public:
    TaskGraph();

    // Tasks without an explicit position land at the origin; the editor
    // resolves view-centered placement before calling this.
    TaskId add_task(const TaskSpec& spec);

    DependencyResult add_dependency(TaskId predecessor, TaskId successor);
    DependencyResult add_dependency(const std::string& predecessor_name, const std::string& successor_name);

    // Severs every incident dependency before dropping the task.
    bool delete_task(TaskId id);
    bool delete_dependency(DependencyId id);
    void clear();

    bool move_task(TaskId id, const graph_geometry::Point& position);
    bool set_task_size(TaskId id, const graph_geometry::Size& size);
    bool rename_task(TaskId id, const std::string& name);
    bool set_status(TaskId id, TaskStatus status);
    bool toggle_status(TaskId id);
    bool set_selected(TaskId id, bool selected);

    bool contains(TaskId id) const;
    bool contains(DependencyId id) const;
    const Task* task(TaskId id) const;
    const Dependency* dependency(DependencyId id) const;
    std::optional<DependencyId> find_dependency(TaskId predecessor, TaskId successor) const;

    // Live tasks in render order (creation order). Pointers stay valid until
    // the next mutation.
    std::vector<const Task*> tasks() const;
    std::vector<const Dependency*> dependencies() const;
    std::vector<TaskId> task_ids() const;
    std::vector<TaskId> selected_task_ids() const;

    std::vector<TaskId> find_tasks_by_name(const std::string& name) const;
    NameResolution resolve_name(const std::string& name) const;

    std::optional<graph_geometry::Box> task_box(TaskId id) const;

    // Topmost task (last in render order) whose box contains the point.
    std::optional<TaskId> task_at(const graph_geometry::Point& world) const;

    std::size_t task_count() const { return live_tasks_; }
    std::size_t dependency_count() const { return live_dependencies_; }
    bool empty() const { return live_tasks_ == 0; }

    void set_default_task_size(const graph_geometry::Size& size) { default_task_size_ = size; }
    const graph_geometry::Size& default_task_size() const { return default_task_size_; }

private:
    Task* mutable_task(TaskId id);
    std::optional<std::size_t> task_slot(TaskId id) const;
    std::optional<std::size_t> dependency_slot(DependencyId id) const;

    std::vector<std::optional<Task>> tasks_;
    std::vector<std::optional<Dependency>> dependencies_;
    std::uint32_t task_base_ = 1;
    std::uint32_t dependency_base_ = 1;
    std::size_t live_tasks_ = 0;
    std::size_t live_dependencies_ = 0;
    graph_geometry::Size default_task_size_;
};

} // namespace graph_model
