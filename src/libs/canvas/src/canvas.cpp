#include <canvas/canvas.hpp>
#include <graph_render/renderer.hpp>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/spdlog.h>
#include "imgui.h"
#include <cmath>
#include <filesystem>
#include <memory>

namespace {

std::filesystem::path find_project_root() {
    std::filesystem::path p = std::filesystem::current_path();
    for (int i = 0; i < 8; ++i) {
        if (std::filesystem::exists(p / "CMakeLists.txt") && std::filesystem::exists(p / "src")) {
            return p;
        }
        if (!p.has_parent_path()) break;
        p = p.parent_path();
    }
    return std::filesystem::current_path();
}

std::shared_ptr<spdlog::logger> canvas_logger() {
    static std::shared_ptr<spdlog::logger> logger;
    if (logger) return logger;

    try {
        const std::filesystem::path logs_dir = find_project_root() / "logs";
        std::filesystem::create_directories(logs_dir);
        const std::filesystem::path log_file = logs_dir / "task_canvas_latest.log";
        logger = spdlog::basic_logger_mt("task_canvas_logger", log_file.string(), true);
        logger->set_level(spdlog::level::info);
        logger->flush_on(spdlog::level::info);
        logger->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] %v");
        logger->info("Canvas logger initialized. file={}", log_file.string());
    } catch (const spdlog::spdlog_ex&) {
        logger = spdlog::default_logger();
    } catch (const std::filesystem::filesystem_error&) {
        logger = spdlog::default_logger();
    }
    return logger;
}

} // namespace

namespace canvas {

TaskCanvas::TaskCanvas(graph_editor::TaskEditor& editor)
    : editor_(editor)
    , interaction_(editor)
{
}

TaskCanvas::~TaskCanvas() = default;

void TaskCanvas::draw_grid(ImVec2 region_min, ImVec2 region_max) {
    ImDrawList* dl = ImGui::GetWindowDrawList();
    if (!dl) return;

    const unsigned int grid_color = IM_COL32(60, 60, 65, 255);
    const float grid_thickness = 1.0f;

    const auto& pz = editor_.pan_zoom();
    const graph_geometry::Point top_left = pz.screen_to_world({ 0.0, 0.0 });
    const graph_geometry::Point bottom_right = pz.screen_to_world(
        { (double)(region_max.x - region_min.x), (double)(region_max.y - region_min.y) });

    // Skip lines that would be denser than 8 pixels apart.
    double step = grid_step_;
    while (step * pz.zoom() < 8.0) step *= 2.0;

    const double start_x = std::floor(top_left.x / step) * step;
    const double start_y = std::floor(top_left.y / step) * step;

    for (double wx = start_x; wx <= bottom_right.x; wx += step) {
        const float sx = region_min.x + (float)pz.world_to_screen({ wx, 0.0 }).x;
        dl->AddLine(ImVec2(sx, region_min.y), ImVec2(sx, region_max.y), grid_color, grid_thickness);
    }
    for (double wy = start_y; wy <= bottom_right.y; wy += step) {
        const float sy = region_min.y + (float)pz.world_to_screen({ 0.0, wy }).y;
        dl->AddLine(ImVec2(region_min.x, sy), ImVec2(region_max.x, sy), grid_color, grid_thickness);
    }
}

void TaskCanvas::draw_zoom_indicator(ImVec2 region_min, ImVec2 region_max) {
    const std::string text = editor_.pan_zoom().zoom_indicator_text();
    if (text.empty()) return;
    ImDrawList* dl = ImGui::GetWindowDrawList();
    if (!dl) return;
    ImVec2 size = ImGui::CalcTextSize(text.c_str());
    dl->AddText(ImVec2(region_max.x - size.x - 12.0f, region_min.y + 8.0f),
        IM_COL32(200, 200, 200, 255), text.c_str());
}

void TaskCanvas::sync_task_sizes() {
    const graph_model::TaskGraph& graph = editor_.graph();
    if (!sizes_dirty_ && graph.task_count() == measured_task_count_) return;

    for (const auto& [id, size] : graph_render::compute_task_sizes(graph)) {
        const graph_model::Task* t = graph.task(id);
        if (t && !(t->size == size)) editor_.set_task_size(id, size);
    }
    measured_task_count_ = graph.task_count();
    sizes_dirty_ = false;
}

void TaskCanvas::trace_gesture_end(graph_editor::InteractionState previous) {
    if (previous == graph_editor::InteractionState::Idle || interaction_.active()) return;
    canvas_logger()->info("gesture_end state={} tasks={} dependencies={} selected={}",
        graph_editor::to_string(previous),
        editor_.graph().task_count(),
        editor_.graph().dependency_count(),
        editor_.selection().selected().size());
}

void TaskCanvas::handle_input(ImVec2 region_min, float region_width, float region_height) {
    ImGuiIO& io = ImGui::GetIO();
    ImVec2 mouse = io.MousePos;
    const bool mouse_valid = ImGui::IsMousePosValid(&mouse);

    bool in_region = mouse_valid &&
                     mouse.x >= region_min.x && mouse.x <= region_min.x + region_width &&
                     mouse.y >= region_min.y && mouse.y <= region_min.y + region_height;

    graph_editor::PointerEvent ev;
    ev.pointer_id = 0;
    ev.position = { (double)(mouse.x - region_min.x), (double)(mouse.y - region_min.y) };
    ev.shift = io.KeyShift;

    const graph_editor::InteractionState before = interaction_.state();

    if (ImGui::IsMouseClicked(0) && in_region && ImGui::IsWindowHovered()) {
        ev.type = graph_editor::PointerEventType::Down;
        interaction_.handle(ev);
    }

    if (interaction_.active()) {
        if (ImGui::IsKeyPressed(ImGuiKey_Escape) || !mouse_valid) {
            ev.type = graph_editor::PointerEventType::Cancel;
            interaction_.handle(ev);
        } else {
            if (mouse.x != last_mouse_x_ || mouse.y != last_mouse_y_) {
                ev.type = graph_editor::PointerEventType::Move;
                interaction_.handle(ev);
            }
            if (ImGui::IsMouseReleased(0)) {
                ev.type = graph_editor::PointerEventType::Up;
                interaction_.handle(ev);
            }
        }
    }
    trace_gesture_end(before);

    if (in_region && io.MouseWheel != 0.0f)
        interaction_.handle_wheel(io.MouseWheel);

    last_mouse_x_ = mouse.x;
    last_mouse_y_ = mouse.y;
}

bool TaskCanvas::update_and_draw(float region_width, float region_height) {
    if (region_width <= 0 || region_height <= 0) return false;

    editor_.set_viewport_size({ (double)region_width, (double)region_height });
    sync_task_sizes();

    ImVec2 region_min = ImGui::GetCursorScreenPos();
    ImVec2 region_max = ImVec2(region_min.x + region_width, region_min.y + region_height);

    handle_input(region_min, region_width, region_height);

    ImDrawList* draw_list = ImGui::GetWindowDrawList();
    if (!draw_list) return true;

    draw_grid(region_min, region_max);

    const auto& pz = editor_.pan_zoom();
    graph_render::ViewTransform view;
    view.origin_x = region_min.x;
    view.origin_y = region_min.y;
    view.pan_x = (float)pz.pan().x;
    view.pan_y = (float)pz.pan().y;
    view.zoom = (float)pz.zoom();

    std::optional<graph_model::TaskId> dragged;
    const auto& g = interaction_.gesture();
    if (g.state == graph_editor::InteractionState::DraggingTask && g.moved) dragged = g.task;

    draw_list->PushClipRect(region_min, region_max, true);
    graph_render::render_task_graph(draw_list, editor_.graph(), editor_.lines(), view,
        interaction_.provisional_line(), dragged);
    draw_list->PopClipRect();

    draw_zoom_indicator(region_min, region_max);
    return true;
}

} // namespace canvas
