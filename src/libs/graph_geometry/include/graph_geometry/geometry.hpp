#pragma once

#include <optional>

namespace graph_geometry {

struct Point {
    double x = 0;
    double y = 0;

    bool operator==(const Point&) const = default;
};

struct Size {
    double width = 0;
    double height = 0;

    bool operator==(const Size&) const = default;
};

// Axis-aligned box, top-left corner plus extent (world units).
struct Box {
    double x = 0;
    double y = 0;
    double width = 0;
    double height = 0;

    double left() const { return x; }
    double top() const { return y; }
    double right() const { return x + width; }
    double bottom() const { return y + height; }

    bool operator==(const Box&) const = default;
};

struct Segment {
    Point from;
    Point to;

    bool operator==(const Segment&) const = default;
};

Box make_box(const Point& top_left, const Size& size);

// Only used for threshold comparisons, so no square root.
double squared_distance(const Point& p, const Point& q);

Point box_center(const Box& box);

// Grows the box by margin on all four sides.
Box expand_box(const Box& box, double margin);

bool box_contains(const Box& box, const Point& p);

// Point where the directed segment a -> b crosses the boundary of box.
// Each edge's supporting line is tested; the hit with the smallest positive
// parameter along the segment that also lies within that edge's span wins.
// Empty when a and b coincide, when the box has no area, or when the
// segment never reaches the boundary.
std::optional<Point> intersect_line_box(const Point& a, const Point& b, const Box& box);

} // namespace graph_geometry
