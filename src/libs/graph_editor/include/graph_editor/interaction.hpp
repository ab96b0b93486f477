#pragma once

#include <graph_editor/task_editor.hpp>
#include <graph_geometry/geometry.hpp>
#include <graph_model/types.hpp>
#include <optional>

namespace graph_editor {

enum class PointerEventType { Down, Move, Up, Cancel };

// Position is in canvas (screen) coordinates.
struct PointerEvent {
    PointerEventType type = PointerEventType::Move;
    int pointer_id = 0;
    graph_geometry::Point position;
    bool shift = false;
};

enum class InteractionState { Idle, Panning, DraggingTask, Linking };

const char* to_string(InteractionState state);

// The one gesture in flight. Only ids are kept; the task is looked up again
// on every event.
struct Gesture {
    InteractionState state = InteractionState::Idle;
    int pointer_id = 0;
    graph_geometry::Point start;       // screen, at press
    graph_geometry::Point last;        // screen, latest event
    graph_model::TaskId task;
    graph_geometry::Point grab_offset; // world, press point minus task top-left
    graph_geometry::Point task_start;  // world, task position at press
    bool moved = false;
    std::optional<graph_geometry::Point> live_destination; // world, while linking
};

// Turns pointer down/move/up/cancel into selection, task drags, link
// creation and canvas panning. Each call resolves the event completely.
class InteractionController {
public:
    explicit InteractionController(TaskEditor& editor);

    // Returns false when the event was ignored (foreign pointer, second
    // press, nothing in progress).
    bool handle(const PointerEvent& event);

    // Positive delta zooms in.
    void handle_wheel(double delta);

    const Gesture& gesture() const { return gesture_; }
    InteractionState state() const { return gesture_.state; }
    bool active() const { return gesture_.state != InteractionState::Idle; }

    // Line from the pressed task to the pointer while linking.
    std::optional<graph_geometry::Segment> provisional_line() const;

private:
    bool pointer_down(const PointerEvent& event);
    void pointer_move(const PointerEvent& event);
    void pointer_up(const PointerEvent& event);
    void pointer_cancel(const PointerEvent& event);

    void track_movement(const graph_geometry::Point& position);
    void click(const Gesture& finished, const PointerEvent& event);
    void finish_link(const Gesture& finished, const PointerEvent& event);
    bool task_alive() const;
    void reset();

    TaskEditor& editor_;
    Gesture gesture_;
};

} // namespace graph_editor
