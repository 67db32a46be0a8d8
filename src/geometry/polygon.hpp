#pragma once

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "../core/drawables.hpp"
#include "../core/types.hpp"

namespace mathud::geometry {

enum class PolygonKind {
    Triangle,
    Quadrilateral,
    Pentagon,
    Hexagon,
    Heptagon,
    Octagon,
    Nonagon,
    Decagon,
    Generic,
};

inline constexpr std::size_t kGenericPolygonMinSides = 11;

// Exact side count for fixed kinds, 0 for Generic.
[[nodiscard]] std::size_t required_side_count(PolygonKind kind);
[[nodiscard]] const char* polygon_kind_name(PolygonKind kind);

// Independent flags so further classifications can be added later.
struct PolygonFlags {
    bool regular = false;
    bool irregular = false;
};

struct TriangleFlags {
    bool equilateral = false;
    bool isosceles = false;
    bool scalene = false;
    bool right = false;
};

struct QuadrilateralFlags {
    bool square = false;
    bool rectangle = false;
    bool rhombus = false;
    bool parallelogram = false;
    bool kite = false;
    bool trapezoid = false;
    // None of square, rectangle or rhombus.
    bool irregular = false;
};

// Side lengths of the closed vertex loop; side i joins vertex i and i + 1.
[[nodiscard]] std::vector<double> polygon_side_lengths(const std::vector<core::Point2D>& vertices);

// Interior angles in degrees, one per vertex.
// Throws std::invalid_argument on coincident consecutive vertices.
[[nodiscard]] std::vector<double> polygon_interior_angles(const std::vector<core::Point2D>& vertices);

// Regular iff all sides and all interior angles are equal within tolerance.
// Throws std::invalid_argument for fewer than three or coincident vertices.
[[nodiscard]] PolygonFlags classify_polygon(const std::vector<core::Point2D>& vertices);
[[nodiscard]] TriangleFlags classify_triangle(const std::vector<core::Point2D>& vertices);
[[nodiscard]] QuadrilateralFlags classify_quadrilateral(const std::vector<core::Point2D>& vertices);

// Walks a segment cycle and returns its vertices in traversal order (first
// vertex not repeated). Points are identified by name. Absent when the
// segments are not a single simple closed loop.
[[nodiscard]] std::optional<std::vector<core::Point>> order_segments_into_loop(
    const std::vector<core::Segment>& segments);

// Math model of an N-gon built from its boundary segments.
class Polygon : public core::Drawable {
public:
    // Throws std::invalid_argument when the segments do not form a closed
    // loop with the side count required by `kind`.
    Polygon(PolygonKind kind, std::vector<core::Segment> segments,
            bool is_renderable = false, std::string color = core::kDefaultColor);

    [[nodiscard]] const char* class_name() const override { return polygon_kind_name(kind_); }

    [[nodiscard]] PolygonKind kind() const { return kind_; }
    [[nodiscard]] std::size_t side_count() const { return points_.size(); }
    [[nodiscard]] const std::vector<core::Point>& points() const { return points_; }
    [[nodiscard]] const std::vector<core::Segment>& segments() const { return segments_; }
    [[nodiscard]] std::vector<core::Point2D> vertices() const;

    // Recomputed from the current vertices on every call.
    [[nodiscard]] PolygonFlags flags() const;
    [[nodiscard]] bool is_regular() const { return flags().regular; }
    [[nodiscard]] bool is_irregular() const { return flags().irregular; }

    [[nodiscard]] bool is_renderable() const { return is_renderable_; }

    void translate(double dx, double dy);
    // Rotates counter-clockwise around the vertex centroid.
    void rotate(double degrees);

private:
    Polygon(PolygonKind kind, std::vector<core::Point> ordered_points,
            bool is_renderable, std::string color, int);

    void rebuild_segments();

    PolygonKind kind_;
    std::vector<core::Point> points_;
    std::vector<core::Segment> segments_;
    bool is_renderable_ = false;
};

} // namespace mathud::geometry
