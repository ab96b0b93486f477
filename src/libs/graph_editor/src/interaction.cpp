#include <graph_editor/interaction.hpp>
#include <graph_model/log.hpp>

namespace graph_editor {

const char* to_string(InteractionState state) {
    switch (state) {
    case InteractionState::Idle: return "idle";
    case InteractionState::Panning: return "panning";
    case InteractionState::DraggingTask: return "dragging_task";
    case InteractionState::Linking: return "linking";
    }
    return "unknown";
}

InteractionController::InteractionController(TaskEditor& editor)
    : editor_(editor)
{
}

bool InteractionController::handle(const PointerEvent& event) {
    if (event.type == PointerEventType::Down) {
        if (active()) return false;
        return pointer_down(event);
    }

    if (!active() || event.pointer_id != gesture_.pointer_id) return false;

    // The pressed task may have been deleted by another callback.
    if (gesture_.state != InteractionState::Panning && !task_alive()) {
        graph_model::graph_logger()->debug("gesture dropped: task {} no longer exists", gesture_.task.value);
        reset();
        return true;
    }

    switch (event.type) {
    case PointerEventType::Move:
        pointer_move(event);
        break;
    case PointerEventType::Up:
        pointer_up(event);
        break;
    case PointerEventType::Cancel:
        pointer_cancel(event);
        break;
    case PointerEventType::Down:
        break;
    }
    return true;
}

void InteractionController::handle_wheel(double delta) {
    if (delta == 0.0) return;
    const EditorConfig& config = editor_.config();
    editor_.pan_zoom().apply_zoom_factor(delta > 0.0 ? config.wheel_zoom_in_factor : config.wheel_zoom_out_factor);
}

bool InteractionController::pointer_down(const PointerEvent& event) {
    gesture_ = Gesture{};
    gesture_.pointer_id = event.pointer_id;
    gesture_.start = event.position;
    gesture_.last = event.position;

    auto hit = editor_.task_at_screen(event.position);
    if (!hit) {
        editor_.selection().clear();
        gesture_.state = InteractionState::Panning;
        return true;
    }

    const graph_model::Task* task = editor_.graph().task(*hit);
    gesture_.task = *hit;
    gesture_.task_start = task->position;

    if (event.shift || editor_.link_mode()) {
        gesture_.state = InteractionState::Linking;
        return true;
    }

    const graph_geometry::Point world = editor_.pan_zoom().screen_to_world(event.position);
    gesture_.grab_offset = { world.x - task->position.x, world.y - task->position.y };
    gesture_.state = InteractionState::DraggingTask;
    return true;
}

void InteractionController::track_movement(const graph_geometry::Point& position) {
    if (gesture_.moved) return;
    if (graph_geometry::squared_distance(gesture_.start, position) > editor_.config().squared_drag_threshold())
        gesture_.moved = true;
}

void InteractionController::pointer_move(const PointerEvent& event) {
    switch (gesture_.state) {
    case InteractionState::Panning:
        editor_.pan_zoom().apply_pan_delta(event.position.x - gesture_.last.x, event.position.y - gesture_.last.y);
        break;
    case InteractionState::Linking:
        track_movement(event.position);
        gesture_.live_destination = editor_.pan_zoom().screen_to_world(event.position);
        break;
    case InteractionState::DraggingTask: {
        track_movement(event.position);
        if (gesture_.moved) {
            const graph_geometry::Point world = editor_.pan_zoom().screen_to_world(event.position);
            editor_.move_task(gesture_.task, { world.x - gesture_.grab_offset.x, world.y - gesture_.grab_offset.y });
        }
        break;
    }
    case InteractionState::Idle:
        break;
    }
    gesture_.last = event.position;
}

void InteractionController::pointer_up(const PointerEvent& event) {
    // Back to idle before any listener runs.
    const Gesture finished = gesture_;
    reset();

    switch (finished.state) {
    case InteractionState::Panning:
        break;
    case InteractionState::Linking:
        if (finished.moved)
            finish_link(finished, event);
        else
            click(finished, event);
        break;
    case InteractionState::DraggingTask:
        if (finished.moved)
            editor_.events().emit_task_moved(finished.task);
        else
            click(finished, event);
        break;
    case InteractionState::Idle:
        break;
    }
}

// A cancelled drag or link resolves like a release that never moved: nothing
// is committed and the pressed task gets a plain click.
void InteractionController::pointer_cancel(const PointerEvent& event) {
    const Gesture finished = gesture_;
    reset();

    switch (finished.state) {
    case InteractionState::DraggingTask:
        if (finished.moved) editor_.move_task(finished.task, finished.task_start);
        click(finished, event);
        break;
    case InteractionState::Linking:
        click(finished, event);
        break;
    case InteractionState::Panning:
    case InteractionState::Idle:
        break;
    }
}

void InteractionController::click(const Gesture& finished, const PointerEvent& event) {
    editor_.selection().click(finished.task, event.shift);
}

void InteractionController::finish_link(const Gesture& finished, const PointerEvent& event) {
    auto target = editor_.task_at_screen(event.position);
    if (!target || *target == finished.task) return;

    graph_model::DependencyResult r = editor_.link(finished.task, *target);
    if (!r) {
        graph_model::graph_logger()->debug("link discarded: {}", graph_model::to_string(r.error));
    }
}

bool InteractionController::task_alive() const {
    return editor_.graph().contains(gesture_.task);
}

void InteractionController::reset() {
    gesture_ = Gesture{};
}

std::optional<graph_geometry::Segment> InteractionController::provisional_line() const {
    if (gesture_.state != InteractionState::Linking || !gesture_.live_destination) return std::nullopt;
    return graph_placement::provisional_path(editor_.graph(), gesture_.task,
        *gesture_.live_destination, editor_.config().edge_margin);
}

} // namespace graph_editor
