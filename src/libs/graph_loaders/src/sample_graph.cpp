#include <graph_loaders/sample_graph.hpp>

namespace graph_loaders {

graph_model::GraphDocument generate_sample_graph() {
    graph_model::GraphDocument out;

    auto add_task = [&](const char* name, double x, double y,
        graph_model::TaskStatus status = graph_model::TaskStatus::Todo)
    {
        out.tasks.push_back(graph_model::TaskRecord{ name, graph_geometry::Point{ x, y }, status });
    };
    auto link = [&](const char* predecessor, const char* successor) {
        out.dependencies.push_back(graph_model::DependencyRecord{ predecessor, successor });
    };

    add_task("Gather requirements", 40, 40, graph_model::TaskStatus::Completed);
    add_task("Sketch UI", 40, 160, graph_model::TaskStatus::Completed);
    add_task("Design data model", 280, 40);
    add_task("Implement storage", 520, 40);
    add_task("Implement canvas", 280, 160);
    add_task("Write tests", 520, 160);
    add_task("Package release", 760, 100);

    link("Gather requirements", "Design data model");
    link("Gather requirements", "Sketch UI");
    link("Sketch UI", "Implement canvas");
    link("Design data model", "Implement storage");
    link("Design data model", "Implement canvas");
    link("Implement storage", "Write tests");
    link("Implement canvas", "Write tests");
    link("Write tests", "Package release");

    return out;
}

} // namespace graph_loaders
