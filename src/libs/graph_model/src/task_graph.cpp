#include <graph_model/task_graph.hpp>
#include <graph_model/log.hpp>
#include <algorithm>
#include <utility>

namespace graph_model {

namespace {

void remove_id(std::vector<DependencyId>& list, DependencyId id) {
    auto it = std::find(list.begin(), list.end(), id);
    if (it != list.end()) list.erase(it);
}

} // namespace

const char* to_string(TaskStatus status) {
    return status == TaskStatus::Completed ? "completed" : "todo";
}

std::optional<TaskStatus> task_status_from_string(const std::string& s) {
    if (s == "todo") return TaskStatus::Todo;
    if (s == "completed") return TaskStatus::Completed;
    return std::nullopt;
}

const char* to_string(GraphError error) {
    switch (error) {
    case GraphError::None: return "none";
    case GraphError::EndpointNotFound: return "endpoint_not_found";
    case GraphError::AmbiguousName: return "ambiguous_name";
    case GraphError::SelfLoop: return "self_loop";
    case GraphError::DuplicateDependency: return "duplicate_dependency";
    }
    return "unknown";
}

TaskGraph::TaskGraph()
    : default_task_size_{ default_task_width, default_task_height }
{
}

std::optional<std::size_t> TaskGraph::task_slot(TaskId id) const {
    if (id.value < task_base_) return std::nullopt;
    const std::size_t slot = id.value - task_base_;
    if (slot >= tasks_.size() || !tasks_[slot]) return std::nullopt;
    return slot;
}

std::optional<std::size_t> TaskGraph::dependency_slot(DependencyId id) const {
    if (id.value < dependency_base_) return std::nullopt;
    const std::size_t slot = id.value - dependency_base_;
    if (slot >= dependencies_.size() || !dependencies_[slot]) return std::nullopt;
    return slot;
}

Task* TaskGraph::mutable_task(TaskId id) {
    auto slot = task_slot(id);
    return slot ? &*tasks_[*slot] : nullptr;
}

TaskId TaskGraph::add_task(const TaskSpec& spec) {
    Task t;
    t.id = TaskId{ task_base_ + static_cast<std::uint32_t>(tasks_.size()) };
    t.name = spec.name;
    t.position = spec.position.value_or(graph_geometry::Point{});
    t.size = spec.size.value_or(default_task_size_);
    t.status = spec.status;
    tasks_.emplace_back(std::move(t));
    ++live_tasks_;
    return tasks_.back()->id;
}

DependencyResult TaskGraph::add_dependency(TaskId predecessor, TaskId successor) {
    auto log = graph_logger();
    Task* from = mutable_task(predecessor);
    Task* to = mutable_task(successor);
    if (!from || !to) {
        log->warn("add_dependency skipped: endpoint not found predecessor={} successor={}",
            predecessor.value, successor.value);
        return { {}, GraphError::EndpointNotFound };
    }
    if (predecessor == successor) {
        log->warn("add_dependency skipped: self loop task={} name={}", predecessor.value, from->name);
        return { {}, GraphError::SelfLoop };
    }
    if (auto existing = find_dependency(predecessor, successor)) {
        log->warn("add_dependency skipped: duplicate {} -> {}", from->name, to->name);
        return { *existing, GraphError::DuplicateDependency };
    }

    Dependency d;
    d.id = DependencyId{ dependency_base_ + static_cast<std::uint32_t>(dependencies_.size()) };
    d.predecessor = predecessor;
    d.successor = successor;
    from->outgoing.push_back(d.id);
    to->incoming.push_back(d.id);
    dependencies_.emplace_back(d);
    ++live_dependencies_;
    return { d.id, GraphError::None };
}

DependencyResult TaskGraph::add_dependency(const std::string& predecessor_name, const std::string& successor_name) {
    auto log = graph_logger();
    const NameResolution from = resolve_name(predecessor_name);
    if (!from.ok()) {
        log->warn("add_dependency skipped: predecessor '{}' {}", predecessor_name, to_string(from.error));
        return { {}, from.error };
    }
    const NameResolution to = resolve_name(successor_name);
    if (!to.ok()) {
        log->warn("add_dependency skipped: successor '{}' {}", successor_name, to_string(to.error));
        return { {}, to.error };
    }
    return add_dependency(from.id, to.id);
}

bool TaskGraph::delete_task(TaskId id) {
    Task* t = mutable_task(id);
    if (!t) return false;

    const std::vector<DependencyId> outgoing = t->outgoing;
    for (DependencyId d : outgoing) delete_dependency(d);
    const std::vector<DependencyId> incoming = t->incoming;
    for (DependencyId d : incoming) delete_dependency(d);

    tasks_[*task_slot(id)].reset();
    --live_tasks_;
    return true;
}

bool TaskGraph::delete_dependency(DependencyId id) {
    auto slot = dependency_slot(id);
    if (!slot) return false;

    const Dependency& d = *dependencies_[*slot];
    if (Task* from = mutable_task(d.predecessor)) remove_id(from->outgoing, id);
    if (Task* to = mutable_task(d.successor)) remove_id(to->incoming, id);
    dependencies_[*slot].reset();
    --live_dependencies_;
    return true;
}

void TaskGraph::clear() {
    task_base_ += static_cast<std::uint32_t>(tasks_.size());
    dependency_base_ += static_cast<std::uint32_t>(dependencies_.size());
    tasks_.clear();
    dependencies_.clear();
    live_tasks_ = 0;
    live_dependencies_ = 0;
}

bool TaskGraph::move_task(TaskId id, const graph_geometry::Point& position) {
    Task* t = mutable_task(id);
    if (!t) return false;
    t->position = position;
    return true;
}

bool TaskGraph::set_task_size(TaskId id, const graph_geometry::Size& size) {
    Task* t = mutable_task(id);
    if (!t) return false;
    t->size = size;
    return true;
}

bool TaskGraph::rename_task(TaskId id, const std::string& name) {
    Task* t = mutable_task(id);
    if (!t) return false;
    t->name = name;
    return true;
}

bool TaskGraph::set_status(TaskId id, TaskStatus status) {
    Task* t = mutable_task(id);
    if (!t) return false;
    t->status = status;
    return true;
}

bool TaskGraph::toggle_status(TaskId id) {
    Task* t = mutable_task(id);
    if (!t) return false;
    t->status = t->status == TaskStatus::Completed ? TaskStatus::Todo : TaskStatus::Completed;
    return true;
}

bool TaskGraph::set_selected(TaskId id, bool selected) {
    Task* t = mutable_task(id);
    if (!t) return false;
    t->selected = selected;
    return true;
}

bool TaskGraph::contains(TaskId id) const {
    return task_slot(id).has_value();
}

bool TaskGraph::contains(DependencyId id) const {
    return dependency_slot(id).has_value();
}

const Task* TaskGraph::task(TaskId id) const {
    auto slot = task_slot(id);
    return slot ? &*tasks_[*slot] : nullptr;
}

const Dependency* TaskGraph::dependency(DependencyId id) const {
    auto slot = dependency_slot(id);
    return slot ? &*dependencies_[*slot] : nullptr;
}

std::optional<DependencyId> TaskGraph::find_dependency(TaskId predecessor, TaskId successor) const {
    const Task* from = task(predecessor);
    if (!from) return std::nullopt;
    for (DependencyId id : from->outgoing) {
        const Dependency* d = dependency(id);
        if (d && d->successor == successor) return id;
    }
    return std::nullopt;
}

std::vector<const Task*> TaskGraph::tasks() const {
    std::vector<const Task*> out;
    out.reserve(live_tasks_);
    for (const auto& slot : tasks_)
        if (slot) out.push_back(&*slot);
    return out;
}

std::vector<const Dependency*> TaskGraph::dependencies() const {
    std::vector<const Dependency*> out;
    out.reserve(live_dependencies_);
    for (const auto& slot : dependencies_)
        if (slot) out.push_back(&*slot);
    return out;
}

std::vector<TaskId> TaskGraph::task_ids() const {
    std::vector<TaskId> out;
    out.reserve(live_tasks_);
    for (const auto& slot : tasks_)
        if (slot) out.push_back(slot->id);
    return out;
}

std::vector<TaskId> TaskGraph::selected_task_ids() const {
    std::vector<TaskId> out;
    for (const auto& slot : tasks_)
        if (slot && slot->selected) out.push_back(slot->id);
    return out;
}

std::vector<TaskId> TaskGraph::find_tasks_by_name(const std::string& name) const {
    std::vector<TaskId> out;
    for (const auto& slot : tasks_)
        if (slot && slot->name == name) out.push_back(slot->id);
    return out;
}

NameResolution TaskGraph::resolve_name(const std::string& name) const {
    const std::vector<TaskId> matches = find_tasks_by_name(name);
    if (matches.empty()) return { {}, GraphError::EndpointNotFound };
    if (matches.size() > 1) return { {}, GraphError::AmbiguousName };
    return { matches.front(), GraphError::None };
}

std::optional<graph_geometry::Box> TaskGraph::task_box(TaskId id) const {
    const Task* t = task(id);
    if (!t) return std::nullopt;
    return graph_geometry::make_box(t->position, t->size);
}

std::optional<TaskId> TaskGraph::task_at(const graph_geometry::Point& world) const {
    for (auto it = tasks_.rbegin(); it != tasks_.rend(); ++it) {
        if (!*it) continue;
        const Task& t = **it;
        if (graph_geometry::box_contains(graph_geometry::make_box(t.position, t.size), world))
            return t.id;
    }
    return std::nullopt;
}

} // namespace graph_model
