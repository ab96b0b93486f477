#pragma once

#include <graph_model/errors.hpp>
#include <graph_model/task_graph.hpp>
#include <graph_geometry/geometry.hpp>
#include <optional>
#include <string>
#include <vector>

namespace graph_model {

// Exchange form of a graph. Dependencies name their endpoints; names are
// resolved against live tasks only when the document is loaded.
struct TaskRecord {
    std::string name;
    std::optional<graph_geometry::Point> pos;
    TaskStatus status = TaskStatus::Todo;

    bool operator==(const TaskRecord&) const = default;
};

struct DependencyRecord {
    std::string predecessor;
    std::string successor;

    bool operator==(const DependencyRecord&) const = default;
};

struct GraphDocument {
    std::vector<TaskRecord> tasks;
    std::vector<DependencyRecord> dependencies;

    bool operator==(const GraphDocument&) const = default;
};

GraphDocument to_document(const TaskGraph& graph);

// Clears the graph, then creates tasks and dependencies in document order.
// Records without a position are placed at default_position. Dependencies
// whose endpoints do not resolve to exactly one task are skipped and
// reported.
LoadReport from_document(TaskGraph& graph, const GraphDocument& document,
    const graph_geometry::Point& default_position = {});

} // namespace graph_model
