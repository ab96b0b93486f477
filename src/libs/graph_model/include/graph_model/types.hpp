#pragma once

#include <graph_geometry/geometry.hpp>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace graph_model {

// Box size used until the renderer has measured the label.
constexpr double default_task_width = 140.0;
constexpr double default_task_height = 32.0;

struct TaskId {
    std::uint32_t value = 0;
    bool operator==(const TaskId&) const = default;
};

struct DependencyId {
    std::uint32_t value = 0;
    bool operator==(const DependencyId&) const = default;
};

enum class TaskStatus { Todo, Completed };

struct Task {
    TaskId id;
    std::string name;
    // Top-left of the task box, world units.
    graph_geometry::Point position;
    graph_geometry::Size size;
    TaskStatus status = TaskStatus::Todo;
    bool selected = false;
    std::vector<DependencyId> outgoing; // this task is the predecessor
    std::vector<DependencyId> incoming; // this task is the successor
};

struct Dependency {
    DependencyId id;
    TaskId predecessor;
    TaskId successor;
};

// Creation request. A missing position is resolved by the caller
// (the editor centers new tasks in the current view).
struct TaskSpec {
    std::string name;
    std::optional<graph_geometry::Point> position;
    std::optional<graph_geometry::Size> size;
    TaskStatus status = TaskStatus::Todo;
};

const char* to_string(TaskStatus status);
std::optional<TaskStatus> task_status_from_string(const std::string& s);

} // namespace graph_model

namespace std {

template <>
struct hash<graph_model::TaskId> {
    size_t operator()(const graph_model::TaskId& id) const noexcept {
        return hash<uint32_t>{}(id.value);
    }
};

template <>
struct hash<graph_model::DependencyId> {
    size_t operator()(const graph_model::DependencyId& id) const noexcept {
        return hash<uint32_t>{}(id.value);
    }
};

} // namespace std
