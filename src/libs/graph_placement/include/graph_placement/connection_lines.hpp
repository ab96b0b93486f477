#pragma once

#include <graph_model/task_graph.hpp>
#include <graph_geometry/geometry.hpp>
#include <graph_placement/task_layout_constants.hpp>
#include <optional>
#include <unordered_map>
#include <vector>

namespace graph_placement {

// Straight line for a committed dependency, running between the two box
// centers and clipped to each box grown by margin. Empty when either anchor
// cannot be computed (missing endpoint, degenerate or overlapping boxes).
std::optional<graph_geometry::Segment> dependency_path(
    const graph_model::TaskGraph& graph,
    graph_model::DependencyId dependency,
    double margin = layout::edge_margin);

// Line for a link still being dragged: the destination anchor is the raw
// pointer position instead of a box intersection.
std::optional<graph_geometry::Segment> provisional_path(
    const graph_model::TaskGraph& graph,
    graph_model::TaskId from,
    const graph_geometry::Point& live_destination,
    double margin = layout::edge_margin);

struct ConnectionLine {
    graph_model::DependencyId dependency;
    graph_model::TaskId from_task;
    graph_model::TaskId to_task;
    graph_geometry::Segment segment;
};

// Cached line per dependency. Kept in sync by the editor: rebuilt on load,
// refreshed for the incident edges of a moved task, pruned on delete.
class ConnectionLines {
public:
    explicit ConnectionLines(double margin = layout::edge_margin);

    void rebuild(const graph_model::TaskGraph& graph);
    void update(const graph_model::TaskGraph& graph, graph_model::DependencyId dependency);
    void update_incident(const graph_model::TaskGraph& graph, graph_model::TaskId task);
    void erase(graph_model::DependencyId dependency);
    // Drops entries whose dependency no longer exists.
    void prune(const graph_model::TaskGraph& graph);
    void clear() { paths_.clear(); }

    // Empty for hidden edges and unknown ids.
    std::optional<graph_geometry::Segment> path(graph_model::DependencyId dependency) const;

    // Visible lines in dependency creation order.
    std::vector<ConnectionLine> visible_lines(const graph_model::TaskGraph& graph) const;

    double margin() const { return margin_; }

private:
    double margin_;
    std::unordered_map<graph_model::DependencyId, std::optional<graph_geometry::Segment>> paths_;
};

} // namespace graph_placement
