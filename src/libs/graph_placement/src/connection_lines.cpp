#include <graph_placement/connection_lines.hpp>

namespace graph_placement {

namespace {

using graph_geometry::Point;
using graph_geometry::Segment;

// Anchor pair between two boxes: both ends lie on the margin-expanded
// borders along the line joining the centers.
std::optional<Segment> anchors(const graph_geometry::Box& from_box,
    const Point& to_center,
    const graph_geometry::Box* to_box,
    double margin)
{
    const Point from_center = graph_geometry::box_center(from_box);
    auto a = graph_geometry::intersect_line_box(from_center, to_center,
        graph_geometry::expand_box(from_box, margin));
    if (!a) return std::nullopt;

    if (!to_box) return Segment{ *a, to_center };

    auto b = graph_geometry::intersect_line_box(from_center, to_center,
        graph_geometry::expand_box(*to_box, margin));
    if (!b) return std::nullopt;
    return Segment{ *a, *b };
}

} // namespace

std::optional<graph_geometry::Segment> dependency_path(
    const graph_model::TaskGraph& graph,
    graph_model::DependencyId dependency,
    double margin)
{
    const graph_model::Dependency* d = graph.dependency(dependency);
    if (!d) return std::nullopt;
    auto from_box = graph.task_box(d->predecessor);
    auto to_box = graph.task_box(d->successor);
    if (!from_box || !to_box) return std::nullopt;

    return anchors(*from_box, graph_geometry::box_center(*to_box), &*to_box, margin);
}

std::optional<graph_geometry::Segment> provisional_path(
    const graph_model::TaskGraph& graph,
    graph_model::TaskId from,
    const graph_geometry::Point& live_destination,
    double margin)
{
    auto from_box = graph.task_box(from);
    if (!from_box) return std::nullopt;
    return anchors(*from_box, live_destination, nullptr, margin);
}

ConnectionLines::ConnectionLines(double margin)
    : margin_(margin)
{
}

void ConnectionLines::rebuild(const graph_model::TaskGraph& graph) {
    paths_.clear();
    for (const graph_model::Dependency* d : graph.dependencies())
        paths_[d->id] = dependency_path(graph, d->id, margin_);
}

void ConnectionLines::update(const graph_model::TaskGraph& graph, graph_model::DependencyId dependency) {
    if (!graph.contains(dependency)) {
        paths_.erase(dependency);
        return;
    }
    paths_[dependency] = dependency_path(graph, dependency, margin_);
}

void ConnectionLines::update_incident(const graph_model::TaskGraph& graph, graph_model::TaskId task) {
    const graph_model::Task* t = graph.task(task);
    if (!t) return;
    for (graph_model::DependencyId d : t->outgoing) update(graph, d);
    for (graph_model::DependencyId d : t->incoming) update(graph, d);
}

void ConnectionLines::erase(graph_model::DependencyId dependency) {
    paths_.erase(dependency);
}

void ConnectionLines::prune(const graph_model::TaskGraph& graph) {
    for (auto it = paths_.begin(); it != paths_.end();) {
        if (!graph.contains(it->first))
            it = paths_.erase(it);
        else
            ++it;
    }
}

std::optional<graph_geometry::Segment> ConnectionLines::path(graph_model::DependencyId dependency) const {
    auto it = paths_.find(dependency);
    if (it == paths_.end()) return std::nullopt;
    return it->second;
}

std::vector<ConnectionLine> ConnectionLines::visible_lines(const graph_model::TaskGraph& graph) const {
    std::vector<ConnectionLine> lines;
    for (const graph_model::Dependency* d : graph.dependencies()) {
        auto it = paths_.find(d->id);
        if (it == paths_.end() || !it->second) continue;
        lines.push_back(ConnectionLine{ d->id, d->predecessor, d->successor, *it->second });
    }
    return lines;
}

} // namespace graph_placement
