#include <gtest/gtest.h>
#include <graph_editor/interaction.hpp>

using graph_editor::InteractionController;
using graph_editor::InteractionState;
using graph_editor::PointerEvent;
using graph_editor::PointerEventType;
using graph_geometry::Point;
using graph_model::TaskId;

namespace {

// Two 100x40 tasks side by side, identity view.
class InteractionTest : public ::testing::Test {
protected:
    InteractionTest()
        : controller(editor)
    {
        a = add("A", { 0, 0 });
        b = add("B", { 300, 0 });
        editor.events().on_selection_changed([this](const std::vector<TaskId>& ids) { selections.push_back(ids); });
        editor.events().on_task_moved([this](TaskId id) { moved.push_back(id); });
        editor.events().on_new_dependency([this]() { ++new_dependencies; });
    }

    TaskId add(const std::string& name, Point position) {
        graph_model::TaskSpec spec;
        spec.name = name;
        spec.position = position;
        spec.size = graph_geometry::Size{ 100, 40 };
        return editor.add_task(spec);
    }

    bool send(PointerEventType type, Point position, bool shift = false, int pointer_id = 1) {
        PointerEvent ev;
        ev.type = type;
        ev.pointer_id = pointer_id;
        ev.position = position;
        ev.shift = shift;
        return controller.handle(ev);
    }

    graph_editor::TaskEditor editor;
    InteractionController controller;
    TaskId a;
    TaskId b;
    std::vector<std::vector<TaskId>> selections;
    std::vector<TaskId> moved;
    int new_dependencies = 0;
};

} // namespace

TEST_F(InteractionTest, PressAndReleaseOnTaskSelectsIt) {
    send(PointerEventType::Down, { 50, 20 });
    EXPECT_EQ(controller.state(), InteractionState::DraggingTask);
    send(PointerEventType::Up, { 50, 20 });

    EXPECT_EQ(controller.state(), InteractionState::Idle);
    EXPECT_TRUE(editor.selection().is_selected(a));
    ASSERT_EQ(selections.size(), 1u);
    EXPECT_EQ(selections[0], (std::vector<TaskId>{ a }));
    EXPECT_TRUE(moved.empty());
}

TEST_F(InteractionTest, MovementBelowThresholdIsAClick) {
    send(PointerEventType::Down, { 50, 20 });
    send(PointerEventType::Move, { 52, 22 });
    send(PointerEventType::Up, { 53, 20 });

    EXPECT_TRUE(moved.empty());
    EXPECT_EQ(editor.graph().task(a)->position, (Point{ 0, 0 }));
    EXPECT_TRUE(editor.selection().is_selected(a));
}

TEST_F(InteractionTest, DragPastThresholdMovesTaskOnce) {
    const auto dep = editor.link(a, b).id;
    const auto path_before = editor.lines().path(dep);

    send(PointerEventType::Down, { 50, 20 });
    send(PointerEventType::Move, { 53, 24 });
    send(PointerEventType::Move, { 56, 28 });
    send(PointerEventType::Up, { 56, 28 });

    ASSERT_EQ(moved.size(), 1u);
    EXPECT_EQ(moved[0], a);
    EXPECT_EQ(editor.graph().task(a)->position, (Point{ 6, 8 }));
    EXPECT_TRUE(selections.empty());

    const auto path_after = editor.lines().path(dep);
    EXPECT_NE(path_after, path_before);
    EXPECT_EQ(path_after, graph_placement::dependency_path(editor.graph(), dep, editor.config().edge_margin));
}

TEST_F(InteractionTest, DragThresholdIsMeasuredOnScreen) {
    editor.pan_zoom().set_zoom(2.0);
    // A now covers (0,0)-(200,80) on screen.
    send(PointerEventType::Down, { 100, 40 });
    send(PointerEventType::Move, { 104, 40 });
    EXPECT_EQ(editor.graph().task(a)->position, (Point{ 0, 0 }));

    send(PointerEventType::Move, { 120, 40 });
    send(PointerEventType::Up, { 120, 40 });
    EXPECT_EQ(editor.graph().task(a)->position, (Point{ 10, 0 }));
    EXPECT_EQ(moved.size(), 1u);
}

TEST_F(InteractionTest, ShiftDragLinksTasks) {
    send(PointerEventType::Down, { 50, 20 }, true);
    EXPECT_EQ(controller.state(), InteractionState::Linking);
    send(PointerEventType::Move, { 200, 20 }, true);

    const auto line = controller.provisional_line();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(line->to, (Point{ 200, 20 }));

    send(PointerEventType::Move, { 350, 20 }, true);
    send(PointerEventType::Up, { 350, 20 }, true);

    EXPECT_EQ(controller.state(), InteractionState::Idle);
    EXPECT_FALSE(controller.provisional_line().has_value());
    EXPECT_TRUE(editor.graph().find_dependency(a, b).has_value());
    EXPECT_EQ(new_dependencies, 1);
    EXPECT_EQ(editor.lines().visible_lines(editor.graph()).size(), 1u);
}

TEST_F(InteractionTest, LinkModeLinksWithoutShift) {
    editor.set_link_mode(true);
    send(PointerEventType::Down, { 50, 20 });
    send(PointerEventType::Move, { 350, 20 });
    send(PointerEventType::Up, { 350, 20 });

    EXPECT_TRUE(editor.graph().find_dependency(a, b).has_value());
    EXPECT_EQ(editor.graph().task(a)->position, (Point{ 0, 0 }));
}

TEST_F(InteractionTest, LinkReleasedOnEmptyCanvasIsDiscarded) {
    send(PointerEventType::Down, { 50, 20 }, true);
    send(PointerEventType::Move, { 200, 300 }, true);
    send(PointerEventType::Up, { 200, 300 }, true);

    EXPECT_EQ(editor.graph().dependency_count(), 0u);
    EXPECT_EQ(new_dependencies, 0);
    EXPECT_EQ(controller.state(), InteractionState::Idle);
}

TEST_F(InteractionTest, LinkReleasedOnSourceIsDiscarded) {
    send(PointerEventType::Down, { 50, 20 }, true);
    send(PointerEventType::Move, { 90, 30 }, true);
    send(PointerEventType::Up, { 90, 30 }, true);

    EXPECT_EQ(editor.graph().dependency_count(), 0u);
    EXPECT_EQ(new_dependencies, 0);
}

TEST_F(InteractionTest, DuplicateLinkIsDiscarded) {
    editor.link(a, b);
    send(PointerEventType::Down, { 50, 20 }, true);
    send(PointerEventType::Move, { 350, 20 }, true);
    send(PointerEventType::Up, { 350, 20 }, true);

    EXPECT_EQ(editor.graph().dependency_count(), 1u);
    EXPECT_EQ(new_dependencies, 1);
}

TEST_F(InteractionTest, LinkWithoutMovementIsAClick) {
    send(PointerEventType::Down, { 50, 20 }, true);
    send(PointerEventType::Up, { 51, 20 }, true);

    EXPECT_EQ(editor.graph().dependency_count(), 0u);
    EXPECT_TRUE(editor.selection().is_selected(a));
}

TEST_F(InteractionTest, ListenersSeeIdleController) {
    InteractionState seen = InteractionState::Linking;
    editor.events().on_new_dependency([&]() { seen = controller.state(); });

    send(PointerEventType::Down, { 50, 20 }, true);
    send(PointerEventType::Move, { 350, 20 }, true);
    send(PointerEventType::Up, { 350, 20 }, true);
    EXPECT_EQ(seen, InteractionState::Idle);
}

TEST_F(InteractionTest, CancelledPressOnTaskSelectsIt) {
    send(PointerEventType::Down, { 50, 20 });
    send(PointerEventType::Cancel, { 50, 20 });

    EXPECT_EQ(controller.state(), InteractionState::Idle);
    EXPECT_TRUE(editor.selection().is_selected(a));
    ASSERT_EQ(selections.size(), 1u);
    EXPECT_EQ(selections[0], (std::vector<TaskId>{ a }));
    EXPECT_TRUE(moved.empty());
}

TEST_F(InteractionTest, CancelledDragRestoresTaskAndClicks) {
    send(PointerEventType::Down, { 50, 20 });
    send(PointerEventType::Move, { 150, 120 });
    EXPECT_EQ(editor.graph().task(a)->position, (Point{ 100, 100 }));

    send(PointerEventType::Cancel, { 150, 120 });
    EXPECT_EQ(controller.state(), InteractionState::Idle);
    EXPECT_EQ(editor.graph().task(a)->position, (Point{ 0, 0 }));
    EXPECT_TRUE(moved.empty());
    EXPECT_TRUE(editor.selection().is_selected(a));
    ASSERT_EQ(selections.size(), 1u);
}

TEST_F(InteractionTest, CancelledLinkCommitsNothing) {
    send(PointerEventType::Down, { 50, 20 }, true);
    send(PointerEventType::Move, { 350, 20 }, true);
    ASSERT_TRUE(controller.provisional_line().has_value());

    send(PointerEventType::Cancel, { 350, 20 }, true);
    EXPECT_EQ(controller.state(), InteractionState::Idle);
    EXPECT_FALSE(controller.provisional_line().has_value());
    EXPECT_EQ(editor.graph().dependency_count(), 0u);
    EXPECT_EQ(new_dependencies, 0);
    EXPECT_TRUE(editor.selection().is_selected(a));
}

TEST_F(InteractionTest, CancelledPanReturnsToIdle) {
    send(PointerEventType::Down, { 200, 300 });
    send(PointerEventType::Move, { 210, 305 });
    const std::size_t reports = selections.size();

    EXPECT_TRUE(send(PointerEventType::Cancel, { 210, 305 }));
    EXPECT_EQ(controller.state(), InteractionState::Idle);
    EXPECT_EQ(editor.pan_zoom().pan(), (Point{ 10, 5 }));
    EXPECT_EQ(selections.size(), reports);
}

TEST_F(InteractionTest, ForeignPointerIsIgnored) {
    send(PointerEventType::Down, { 50, 20 }, false, 1);
    EXPECT_FALSE(send(PointerEventType::Move, { 150, 120 }, false, 2));
    EXPECT_FALSE(send(PointerEventType::Up, { 150, 120 }, false, 2));
    EXPECT_EQ(controller.state(), InteractionState::DraggingTask);
    EXPECT_EQ(editor.graph().task(a)->position, (Point{ 0, 0 }));

    // A second press while a gesture is live is ignored too.
    EXPECT_FALSE(send(PointerEventType::Down, { 350, 20 }, false, 2));
    EXPECT_EQ(controller.gesture().task, a);
}

TEST_F(InteractionTest, BackgroundPressClearsSelectionAndPans) {
    editor.selection().click(a, false);
    selections.clear();

    send(PointerEventType::Down, { 200, 300 });
    EXPECT_EQ(controller.state(), InteractionState::Panning);
    ASSERT_EQ(selections.size(), 1u);
    EXPECT_TRUE(selections[0].empty());
    EXPECT_FALSE(editor.selection().is_selected(a));

    send(PointerEventType::Move, { 210, 305 });
    send(PointerEventType::Move, { 230, 310 });
    send(PointerEventType::Up, { 230, 310 });
    EXPECT_EQ(editor.pan_zoom().pan(), (Point{ 30, 10 }));
    EXPECT_EQ(editor.graph().task(a)->position, (Point{ 0, 0 }));
}

TEST_F(InteractionTest, DeletedTaskEndsGesture) {
    send(PointerEventType::Down, { 50, 20 });
    editor.delete_task(a);

    EXPECT_TRUE(send(PointerEventType::Move, { 150, 120 }));
    EXPECT_EQ(controller.state(), InteractionState::Idle);
    EXPECT_TRUE(moved.empty());
}

TEST_F(InteractionTest, WheelZoomsInAndBackOut) {
    controller.handle_wheel(1.0);
    EXPECT_DOUBLE_EQ(editor.pan_zoom().zoom(), 1.2);
    controller.handle_wheel(-1.0);
    EXPECT_EQ(editor.pan_zoom().zoom(), 1.0);
    controller.handle_wheel(0.0);
    EXPECT_EQ(editor.pan_zoom().zoom(), 1.0);
}
