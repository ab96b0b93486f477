#pragma once

#include <graph_editor/editor_config.hpp>
#include <graph_geometry/geometry.hpp>
#include <string>

namespace graph_editor {

// Translation + scale applied to the whole item layer:
// screen = pan + world * zoom. Task coordinates never change with it.
class PanZoom {
public:
    PanZoom() = default;
    explicit PanZoom(const EditorConfig& config);

    void apply_pan_delta(double dx, double dy);

    // Multiplies, clamps to the configured limits, then snaps to exactly 1.0
    // inside the tolerance window so the baseline does not drift.
    void apply_zoom_factor(double factor);

    void set_pan(const graph_geometry::Point& pan) { pan_ = pan; }
    void set_zoom(double zoom);
    void reset();

    const graph_geometry::Point& pan() const { return pan_; }
    double zoom() const { return zoom_; }

    graph_geometry::Point screen_to_world(const graph_geometry::Point& screen) const;
    graph_geometry::Point world_to_screen(const graph_geometry::Point& world) const;

    // "150% zoom", or empty at exactly 100%.
    std::string zoom_indicator_text() const;

private:
    double snap(double zoom) const;

    graph_geometry::Point pan_;
    double zoom_ = 1.0;
    double snap_tolerance_ = 0.1;
    double min_zoom_ = 0.1;
    double max_zoom_ = 10.0;
};

} // namespace graph_editor
