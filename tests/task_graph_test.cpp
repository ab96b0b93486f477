#include <gtest/gtest.h>
#include <graph_model/task_graph.hpp>

using graph_model::DependencyId;
using graph_model::GraphError;
using graph_model::TaskGraph;
using graph_model::TaskId;
using graph_model::TaskSpec;
using graph_model::TaskStatus;

namespace {

TaskId add(TaskGraph& g, const std::string& name, double x = 0, double y = 0) {
    TaskSpec spec;
    spec.name = name;
    spec.position = graph_geometry::Point{ x, y };
    return g.add_task(spec);
}

} // namespace

TEST(TaskGraphTest, AddTaskUsesDefaults) {
    TaskGraph g;
    TaskSpec spec;
    spec.name = "Write docs";
    const TaskId id = g.add_task(spec);

    const graph_model::Task* t = g.task(id);
    ASSERT_NE(t, nullptr);
    EXPECT_EQ(t->name, "Write docs");
    EXPECT_EQ(t->status, TaskStatus::Todo);
    EXPECT_FALSE(t->selected);
    EXPECT_EQ(t->position, (graph_geometry::Point{ 0, 0 }));
    EXPECT_EQ(t->size, (graph_geometry::Size{ graph_model::default_task_width, graph_model::default_task_height }));
    EXPECT_EQ(g.task_count(), 1u);
}

TEST(TaskGraphTest, DependencyUpdatesAdjacency) {
    TaskGraph g;
    const TaskId a = add(g, "A");
    const TaskId b = add(g, "B");

    auto r = g.add_dependency(a, b);
    ASSERT_TRUE(r.ok());
    EXPECT_EQ(g.dependency_count(), 1u);
    ASSERT_EQ(g.task(a)->outgoing.size(), 1u);
    EXPECT_EQ(g.task(a)->outgoing[0], r.id);
    ASSERT_EQ(g.task(b)->incoming.size(), 1u);
    EXPECT_EQ(g.task(b)->incoming[0], r.id);
    EXPECT_TRUE(g.task(a)->incoming.empty());

    const graph_model::Dependency* d = g.dependency(r.id);
    ASSERT_NE(d, nullptr);
    EXPECT_EQ(d->predecessor, a);
    EXPECT_EQ(d->successor, b);
}

TEST(TaskGraphTest, SelfLoopIsRejected) {
    TaskGraph g;
    const TaskId a = add(g, "A");
    auto r = g.add_dependency(a, a);
    EXPECT_FALSE(r.ok());
    EXPECT_EQ(r.error, GraphError::SelfLoop);
    EXPECT_EQ(g.dependency_count(), 0u);
}

TEST(TaskGraphTest, DuplicateDependencyIsRejected) {
    TaskGraph g;
    const TaskId a = add(g, "A");
    const TaskId b = add(g, "B");

    auto first = g.add_dependency(a, b);
    auto second = g.add_dependency(a, b);
    EXPECT_EQ(second.error, GraphError::DuplicateDependency);
    EXPECT_EQ(second.id, first.id);
    EXPECT_EQ(g.dependency_count(), 1u);

    // The reverse direction is a different ordered pair.
    EXPECT_TRUE(g.add_dependency(b, a).ok());
    EXPECT_EQ(g.dependency_count(), 2u);
}

TEST(TaskGraphTest, UnknownEndpointIsRejected) {
    TaskGraph g;
    const TaskId a = add(g, "A");
    auto r = g.add_dependency(a, TaskId{ 999 });
    EXPECT_EQ(r.error, GraphError::EndpointNotFound);
    EXPECT_TRUE(g.task(a)->outgoing.empty());
}

TEST(TaskGraphTest, DeleteTaskSeversIncidentDependencies) {
    TaskGraph g;
    const TaskId a = add(g, "A");
    const TaskId b = add(g, "B");
    const TaskId c = add(g, "C");
    const DependencyId ab = g.add_dependency(a, b).id;
    const DependencyId bc = g.add_dependency(b, c).id;
    const DependencyId ac = g.add_dependency(a, c).id;

    EXPECT_TRUE(g.delete_task(b));
    EXPECT_FALSE(g.contains(b));
    EXPECT_FALSE(g.contains(ab));
    EXPECT_FALSE(g.contains(bc));
    EXPECT_TRUE(g.contains(ac));
    EXPECT_EQ(g.dependency_count(), 1u);
    ASSERT_EQ(g.task(a)->outgoing.size(), 1u);
    EXPECT_EQ(g.task(a)->outgoing[0], ac);
    ASSERT_EQ(g.task(c)->incoming.size(), 1u);
    EXPECT_EQ(g.task(c)->incoming[0], ac);

    EXPECT_FALSE(g.delete_task(b));
}

TEST(TaskGraphTest, DeleteDependencyLeavesTasks) {
    TaskGraph g;
    const TaskId a = add(g, "A");
    const TaskId b = add(g, "B");
    const DependencyId ab = g.add_dependency(a, b).id;

    EXPECT_TRUE(g.delete_dependency(ab));
    EXPECT_EQ(g.task_count(), 2u);
    EXPECT_TRUE(g.task(a)->outgoing.empty());
    EXPECT_TRUE(g.task(b)->incoming.empty());
    EXPECT_FALSE(g.delete_dependency(ab));
}

TEST(TaskGraphTest, IdsAreNeverReused) {
    TaskGraph g;
    const TaskId a = add(g, "A");
    g.delete_task(a);
    const TaskId b = add(g, "B");
    EXPECT_NE(a, b);
    EXPECT_EQ(g.task(a), nullptr);

    g.clear();
    EXPECT_TRUE(g.empty());
    EXPECT_EQ(g.dependency_count(), 0u);
    const TaskId c = add(g, "C");
    EXPECT_GT(c.value, b.value);
    EXPECT_EQ(g.task(b), nullptr);
    EXPECT_NE(g.task(c), nullptr);
}

TEST(TaskGraphTest, NameResolution) {
    TaskGraph g;
    add(g, "Build");
    add(g, "Test");
    add(g, "Test");

    EXPECT_TRUE(g.resolve_name("Build").ok());
    EXPECT_EQ(g.resolve_name("Deploy").error, GraphError::EndpointNotFound);
    EXPECT_EQ(g.resolve_name("Test").error, GraphError::AmbiguousName);
    EXPECT_EQ(g.find_tasks_by_name("Test").size(), 2u);

    EXPECT_EQ(g.add_dependency("Build", "Test").error, GraphError::AmbiguousName);
    EXPECT_EQ(g.add_dependency("Build", "Deploy").error, GraphError::EndpointNotFound);
    EXPECT_EQ(g.dependency_count(), 0u);
}

TEST(TaskGraphTest, RenderOrderIsCreationOrder) {
    TaskGraph g;
    const TaskId a = add(g, "A");
    const TaskId b = add(g, "B");
    const TaskId c = add(g, "C");
    g.delete_task(b);

    const auto ids = g.task_ids();
    ASSERT_EQ(ids.size(), 2u);
    EXPECT_EQ(ids[0], a);
    EXPECT_EQ(ids[1], c);
}

TEST(TaskGraphTest, TaskAtReturnsTopmost) {
    TaskGraph g;
    add(g, "Below", 0, 0);
    const TaskId above = add(g, "Above", 50, 10);

    auto hit = g.task_at({ 60, 20 });
    ASSERT_TRUE(hit.has_value());
    EXPECT_EQ(*hit, above);
    EXPECT_FALSE(g.task_at({ 500, 500 }).has_value());
}

TEST(TaskGraphTest, StatusAndSelectionFlags) {
    TaskGraph g;
    const TaskId a = add(g, "A");
    const TaskId b = add(g, "B");

    EXPECT_TRUE(g.toggle_status(a));
    EXPECT_EQ(g.task(a)->status, TaskStatus::Completed);
    EXPECT_TRUE(g.toggle_status(a));
    EXPECT_EQ(g.task(a)->status, TaskStatus::Todo);

    g.set_selected(b, true);
    const auto selected = g.selected_task_ids();
    ASSERT_EQ(selected.size(), 1u);
    EXPECT_EQ(selected[0], b);

    EXPECT_FALSE(g.toggle_status(TaskId{ 77 }));
    EXPECT_FALSE(g.move_task(TaskId{ 77 }, { 1, 1 }));
}

TEST(TaskGraphTest, ChurnLeavesOnlyLiveEntities) {
    TaskGraph g;
    const TaskId keep = add(g, "Keep", 0, 0);
    TaskId last;
    for (int i = 0; i < 200; ++i) {
        const TaskId t = add(g, "Temp", 500, 500);
        g.add_dependency(keep, t);
        EXPECT_NE(t, last);
        last = t;
        g.delete_task(t);
    }

    EXPECT_EQ(g.task_count(), 1u);
    EXPECT_EQ(g.dependency_count(), 0u);
    ASSERT_EQ(g.tasks().size(), 1u);
    EXPECT_EQ(g.tasks()[0]->id, keep);
    EXPECT_TRUE(g.dependencies().empty());
    EXPECT_TRUE(g.task(keep)->outgoing.empty());
    EXPECT_FALSE(g.task_at({ 510, 510 }).has_value());
    EXPECT_TRUE(g.find_tasks_by_name("Temp").empty());

    g.clear();
    EXPECT_GT(add(g, "Fresh").value, last.value);
}
