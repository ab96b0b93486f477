#include <graph_geometry/geometry.hpp>
#include <cmath>

namespace graph_geometry {

namespace {

constexpr double span_epsilon = 1e-9;

// Parameter t along a -> b where the segment meets the vertical line x = line_x,
// provided the crossing lies within [min_y, max_y].
std::optional<double> cross_vertical(const Point& a, const Point& b,
    double line_x, double min_y, double max_y)
{
    const double dx = b.x - a.x;
    if (dx == 0.0) return std::nullopt;
    const double t = (line_x - a.x) / dx;
    const double y = a.y + (b.y - a.y) * t;
    if (y < min_y - span_epsilon || y > max_y + span_epsilon) return std::nullopt;
    return t;
}

std::optional<double> cross_horizontal(const Point& a, const Point& b,
    double line_y, double min_x, double max_x)
{
    const double dy = b.y - a.y;
    if (dy == 0.0) return std::nullopt;
    const double t = (line_y - a.y) / dy;
    const double x = a.x + (b.x - a.x) * t;
    if (x < min_x - span_epsilon || x > max_x + span_epsilon) return std::nullopt;
    return t;
}

} // namespace

Box make_box(const Point& top_left, const Size& size) {
    return Box{ top_left.x, top_left.y, size.width, size.height };
}

double squared_distance(const Point& p, const Point& q) {
    const double dx = q.x - p.x;
    const double dy = q.y - p.y;
    return dx * dx + dy * dy;
}

Point box_center(const Box& box) {
    return Point{ box.x + box.width * 0.5, box.y + box.height * 0.5 };
}

Box expand_box(const Box& box, double margin) {
    return Box{ box.x - margin, box.y - margin, box.width + 2.0 * margin, box.height + 2.0 * margin };
}

bool box_contains(const Box& box, const Point& p) {
    return p.x >= box.left() && p.x <= box.right() &&
           p.y >= box.top() && p.y <= box.bottom();
}

std::optional<Point> intersect_line_box(const Point& a, const Point& b, const Box& box) {
    if (a == b) return std::nullopt;
    if (box.width <= 0.0 || box.height <= 0.0) return std::nullopt;

    const std::optional<double> candidates[4] = {
        cross_vertical(a, b, box.left(), box.top(), box.bottom()),
        cross_vertical(a, b, box.right(), box.top(), box.bottom()),
        cross_horizontal(a, b, box.top(), box.left(), box.right()),
        cross_horizontal(a, b, box.bottom(), box.left(), box.right()),
    };

    std::optional<double> best;
    for (const auto& t : candidates) {
        if (!t || *t <= 0.0 || *t > 1.0) continue;
        if (!best || *t < *best) best = t;
    }
    if (!best) return std::nullopt;

    return Point{ a.x + (b.x - a.x) * *best, a.y + (b.y - a.y) * *best };
}

} // namespace graph_geometry
