#pragma once

#include <graph_model/types.hpp>
#include <string>
#include <vector>

namespace graph_model {

enum class GraphError {
    None,
    EndpointNotFound,    // name or id does not resolve to a live task
    AmbiguousName,       // name matches more than one live task
    SelfLoop,            // predecessor and successor are the same task
    DuplicateDependency  // the ordered pair is already linked
};

const char* to_string(GraphError error);

struct DependencyResult {
    DependencyId id;
    GraphError error = GraphError::None;

    bool ok() const { return error == GraphError::None; }
    explicit operator bool() const { return ok(); }
};

struct NameResolution {
    TaskId id;
    GraphError error = GraphError::None;

    bool ok() const { return error == GraphError::None; }
};

// A dependency record from a document that could not be linked.
struct SkippedDependency {
    std::size_t index = 0;
    std::string predecessor;
    std::string successor;
    GraphError error = GraphError::None;
};

struct LoadReport {
    std::size_t tasks_created = 0;
    std::size_t dependencies_created = 0;
    std::vector<SkippedDependency> skipped;

    bool complete() const { return skipped.empty(); }
};

} // namespace graph_model
