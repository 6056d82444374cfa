#pragma once

#include <cstdint>
#include <string_view>
#include <utility>
#include <variant>
#include <vector>
#include "plane.hpp"

namespace regionbridge {

struct Point2 {
    double x = 0.0;
    double y = 0.0;

    bool operator==(const Point2&) const noexcept = default;
};

/// @brief Axis-aligned rectangle given by its bounds
struct Rectangle {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    bool operator==(const Rectangle&) const noexcept = default;
};

/// @brief Axis-aligned ellipse inscribed in the given bounds
struct Ellipse {
    double x = 0.0;
    double y = 0.0;
    double width = 0.0;
    double height = 0.0;

    bool operator==(const Ellipse&) const noexcept = default;
};

/// @brief Straight segment between two points
struct Line {
    Point2 start;
    Point2 end;

    bool operator==(const Line&) const noexcept = default;
};

/// @brief Open vertex chain
struct Polyline {
    std::vector<Point2> vertices;

    bool operator==(const Polyline&) const = default;
};

/// @brief Polygon with an exterior ring and optional holes
/// @note Rings are stored open: the closing vertex is implicit
struct Polygon {
    std::vector<Point2> exterior;
    std::vector<std::vector<Point2>> holes;

    bool operator==(const Polygon&) const = default;
};

struct MultiPolygon {
    std::vector<Polygon> polygons;

    bool operator==(const MultiPolygon&) const = default;
};

/// @brief Unconnected point set
struct Points {
    std::vector<Point2> points;

    bool operator==(const Points&) const = default;
};

/// Closed set of shapes handled by the geometry layer
using Shape = std::variant<Rectangle, Ellipse, Line, Polyline, Polygon, MultiPolygon, Points>;

enum class ShapeKind : uint8_t {
    Rectangle,
    Ellipse,
    Line,
    Polyline,
    Polygon,
    MultiPolygon,
    Points
};

[[nodiscard]] constexpr std::string_view to_string(ShapeKind kind) noexcept {
    switch (kind) {
        case ShapeKind::Rectangle: return "rectangle";
        case ShapeKind::Ellipse: return "ellipse";
        case ShapeKind::Line: return "line";
        case ShapeKind::Polyline: return "polyline";
        case ShapeKind::Polygon: return "polygon";
        case ShapeKind::MultiPolygon: return "multipolygon";
        case ShapeKind::Points: return "points";
    }
    return "unknown";
}

/// @brief A shape bound to exactly one image plane
class Region {
public:
    Region() = default;

    explicit Region(Shape shape, Plane plane = Plane::default_plane())
        : shape_(std::move(shape)), plane_(plane) {}

    [[nodiscard]] const Shape& shape() const noexcept { return shape_; }
    [[nodiscard]] Plane plane() const noexcept { return plane_; }

    [[nodiscard]] ShapeKind kind() const noexcept {
        return static_cast<ShapeKind>(shape_.index());
    }

    bool operator==(const Region&) const = default;

private:
    Shape shape_;
    Plane plane_;
};

} // namespace regionbridge
