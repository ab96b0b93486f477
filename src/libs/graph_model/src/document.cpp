#include <graph_model/document.hpp>
#include <graph_model/log.hpp>

namespace graph_model {

GraphDocument to_document(const TaskGraph& graph) {
    GraphDocument doc;
    for (const Task* t : graph.tasks())
        doc.tasks.push_back(TaskRecord{ t->name, t->position, t->status });

    for (const Dependency* d : graph.dependencies()) {
        const Task* from = graph.task(d->predecessor);
        const Task* to = graph.task(d->successor);
        if (!from || !to) continue;
        doc.dependencies.push_back(DependencyRecord{ from->name, to->name });
    }
    return doc;
}

LoadReport from_document(TaskGraph& graph, const GraphDocument& document,
    const graph_geometry::Point& default_position)
{
    LoadReport report;
    graph.clear();

    for (const auto& rec : document.tasks) {
        TaskSpec spec;
        spec.name = rec.name;
        spec.position = rec.pos.value_or(default_position);
        spec.status = rec.status;
        graph.add_task(spec);
        ++report.tasks_created;
    }

    for (std::size_t i = 0; i < document.dependencies.size(); ++i) {
        const auto& rec = document.dependencies[i];
        DependencyResult r = graph.add_dependency(rec.predecessor, rec.successor);
        if (r) {
            ++report.dependencies_created;
        } else {
            report.skipped.push_back(SkippedDependency{ i, rec.predecessor, rec.successor, r.error });
        }
    }

    auto log = graph_logger();
    if (report.complete()) {
        log->info("graph loaded tasks={} dependencies={}", report.tasks_created, report.dependencies_created);
    } else {
        log->warn("graph loaded tasks={} dependencies={} skipped={}",
            report.tasks_created, report.dependencies_created, report.skipped.size());
    }
    return report;
}

} // namespace graph_model
