#include <graph_editor/pan_zoom.hpp>
#include <algorithm>
#include <cmath>

namespace graph_editor {

PanZoom::PanZoom(const EditorConfig& config)
    : snap_tolerance_(config.zoom_snap_tolerance)
    , min_zoom_(config.min_zoom)
    , max_zoom_(config.max_zoom)
{
}

void PanZoom::apply_pan_delta(double dx, double dy) {
    pan_.x += dx;
    pan_.y += dy;
}

double PanZoom::snap(double zoom) const {
    if (std::abs(zoom - 1.0) < snap_tolerance_) return 1.0;
    return zoom;
}

void PanZoom::apply_zoom_factor(double factor) {
    if (!(factor > 0.0)) return;
    zoom_ = snap(std::clamp(zoom_ * factor, min_zoom_, max_zoom_));
}

void PanZoom::set_zoom(double zoom) {
    if (!(zoom > 0.0)) return;
    zoom_ = std::clamp(zoom, min_zoom_, max_zoom_);
}

void PanZoom::reset() {
    pan_ = {};
    zoom_ = 1.0;
}

graph_geometry::Point PanZoom::screen_to_world(const graph_geometry::Point& screen) const {
    return { (screen.x - pan_.x) / zoom_, (screen.y - pan_.y) / zoom_ };
}

graph_geometry::Point PanZoom::world_to_screen(const graph_geometry::Point& world) const {
    return { world.x * zoom_ + pan_.x, world.y * zoom_ + pan_.y };
}

std::string PanZoom::zoom_indicator_text() const {
    if (zoom_ == 1.0) return {};
    return std::to_string(static_cast<int>(std::floor(zoom_ * 100.0))) + "% zoom";
}

} // namespace graph_editor
