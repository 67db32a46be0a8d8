#include "polygon.hpp"

#include <algorithm>
#include <cmath>
#include <map>
#include <numbers>
#include <stdexcept>

namespace mathud::geometry {

namespace {

constexpr double kLengthEpsilon = 1e-9;
constexpr double kAngleToleranceDegrees = 1e-3;
constexpr double kParallelTolerance = 1e-6;

double comparison_tolerance(double a, double b) {
    const double scale = std::max({std::abs(a), std::abs(b), 1.0});
    return std::max(kLengthEpsilon * scale * 10.0, 1e-6);
}

bool is_close(double a, double b) {
    return std::abs(a - b) <= comparison_tolerance(a, b);
}

bool all_close(const std::vector<double>& values, double absolute_tolerance = -1.0) {
    if (values.empty()) {
        return true;
    }
    const double first = values.front();
    return std::all_of(values.begin() + 1, values.end(), [&](double value) {
        if (absolute_tolerance >= 0.0) {
            return std::abs(first - value) <= absolute_tolerance;
        }
        return is_close(first, value);
    });
}

bool has_equal_pair(const std::vector<double>& values) {
    for (std::size_t i = 0; i < values.size(); ++i) {
        for (std::size_t j = i + 1; j < values.size(); ++j) {
            if (is_close(values[i], values[j])) {
                return true;
            }
        }
    }
    return false;
}

void require_loop(const std::vector<core::Point2D>& vertices, std::size_t minimum) {
    if (vertices.size() < minimum) {
        throw std::invalid_argument("At least " + std::to_string(minimum) +
                                    " vertices are required to analyze a polygon");
    }
    for (const auto& vertex : vertices) {
        if (!vertex.is_finite()) {
            throw std::invalid_argument("Polygon vertex has non-finite coordinates");
        }
    }
}

// Side i and side j are parallel.
bool sides_parallel(const std::vector<core::Point2D>& v, std::size_t i, std::size_t j) {
    const std::size_t n = v.size();
    const double ux = v[(i + 1) % n].x - v[i].x;
    const double uy = v[(i + 1) % n].y - v[i].y;
    const double wx = v[(j + 1) % n].x - v[j].x;
    const double wy = v[(j + 1) % n].y - v[j].y;
    const double cross = ux * wy - uy * wx;
    return std::abs(cross) <= kParallelTolerance * std::hypot(ux, uy) * std::hypot(wx, wy);
}

} // namespace

std::size_t required_side_count(PolygonKind kind) {
    switch (kind) {
        case PolygonKind::Triangle: return 3;
        case PolygonKind::Quadrilateral: return 4;
        case PolygonKind::Pentagon: return 5;
        case PolygonKind::Hexagon: return 6;
        case PolygonKind::Heptagon: return 7;
        case PolygonKind::Octagon: return 8;
        case PolygonKind::Nonagon: return 9;
        case PolygonKind::Decagon: return 10;
        case PolygonKind::Generic: return 0;
    }
    return 0;
}

const char* polygon_kind_name(PolygonKind kind) {
    switch (kind) {
        case PolygonKind::Triangle: return "Triangle";
        case PolygonKind::Quadrilateral: return "Quadrilateral";
        case PolygonKind::Pentagon: return "Pentagon";
        case PolygonKind::Hexagon: return "Hexagon";
        case PolygonKind::Heptagon: return "Heptagon";
        case PolygonKind::Octagon: return "Octagon";
        case PolygonKind::Nonagon: return "Nonagon";
        case PolygonKind::Decagon: return "Decagon";
        case PolygonKind::Generic: return "GenericPolygon";
    }
    return "Polygon";
}

std::vector<double> polygon_side_lengths(const std::vector<core::Point2D>& vertices) {
    require_loop(vertices, 3);
    std::vector<double> lengths;
    lengths.reserve(vertices.size());
    for (std::size_t i = 0; i < vertices.size(); ++i) {
        const auto& a = vertices[i];
        const auto& b = vertices[(i + 1) % vertices.size()];
        lengths.push_back(std::hypot(b.x - a.x, b.y - a.y));
    }
    return lengths;
}

std::vector<double> polygon_interior_angles(const std::vector<core::Point2D>& vertices) {
    require_loop(vertices, 3);
    const std::size_t count = vertices.size();
    std::vector<double> angles;
    angles.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        const auto& prev = vertices[(i + count - 1) % count];
        const auto& curr = vertices[i];
        const auto& next = vertices[(i + 1) % count];

        const double v1x = prev.x - curr.x;
        const double v1y = prev.y - curr.y;
        const double v2x = next.x - curr.x;
        const double v2y = next.y - curr.y;
        if (std::hypot(v1x, v1y) == 0.0 || std::hypot(v2x, v2y) == 0.0) {
            throw std::invalid_argument("Degenerate polygon with overlapping points");
        }

        const double dot = v1x * v2x + v1y * v2y;
        const double cross = v1x * v2y - v1y * v2x;
        angles.push_back(std::atan2(std::abs(cross), dot) * 180.0 / std::numbers::pi);
    }
    return angles;
}

PolygonFlags classify_polygon(const std::vector<core::Point2D>& vertices) {
    const auto sides = polygon_side_lengths(vertices);
    const auto angles = polygon_interior_angles(vertices);
    const bool regular = all_close(sides) && all_close(angles, kAngleToleranceDegrees);
    return PolygonFlags{.regular = regular, .irregular = !regular};
}

TriangleFlags classify_triangle(const std::vector<core::Point2D>& vertices) {
    if (vertices.size() != 3) {
        throw std::invalid_argument("Triangle classification requires exactly three vertices");
    }
    const auto sides = polygon_side_lengths(vertices);
    const auto angles = polygon_interior_angles(vertices);

    TriangleFlags flags;
    flags.equilateral = all_close(sides);
    flags.isosceles = flags.equilateral || has_equal_pair(sides);
    flags.scalene = !has_equal_pair(sides);
    flags.right = std::any_of(angles.begin(), angles.end(), [](double angle) {
        return std::abs(angle - 90.0) <= kAngleToleranceDegrees;
    });
    return flags;
}

QuadrilateralFlags classify_quadrilateral(const std::vector<core::Point2D>& vertices) {
    if (vertices.size() != 4) {
        throw std::invalid_argument("Quadrilateral classification requires exactly four vertices");
    }
    const auto sides = polygon_side_lengths(vertices);
    const auto angles = polygon_interior_angles(vertices);

    const bool first_pair_parallel = sides_parallel(vertices, 0, 2);
    const bool second_pair_parallel = sides_parallel(vertices, 1, 3);
    const bool right_angles = std::all_of(angles.begin(), angles.end(), [](double angle) {
        return std::abs(angle - 90.0) <= kAngleToleranceDegrees;
    });

    QuadrilateralFlags flags;
    flags.parallelogram = first_pair_parallel && second_pair_parallel;
    flags.rhombus = flags.parallelogram && all_close(sides);
    flags.rectangle = flags.parallelogram && right_angles;
    flags.square = flags.rhombus && flags.rectangle;
    flags.trapezoid = first_pair_parallel != second_pair_parallel;
    const bool adjacent_pairs = (is_close(sides[0], sides[1]) && is_close(sides[2], sides[3])) ||
                                (is_close(sides[1], sides[2]) && is_close(sides[3], sides[0]));
    flags.kite = adjacent_pairs && !flags.rhombus;
    flags.irregular = !(flags.square || flags.rectangle || flags.rhombus);
    return flags;
}

std::optional<std::vector<core::Point>> order_segments_into_loop(
    const std::vector<core::Segment>& segments) {
    if (segments.size() < 3) {
        return std::nullopt;
    }

    std::map<std::string, std::vector<std::size_t>> adjacency;
    for (std::size_t i = 0; i < segments.size(); ++i) {
        const auto& segment = segments[i];
        if (segment.point1.name() == segment.point2.name()) {
            return std::nullopt;
        }
        adjacency[segment.point1.name()].push_back(i);
        adjacency[segment.point2.name()].push_back(i);
    }
    if (adjacency.size() != segments.size()) {
        return std::nullopt;
    }
    for (const auto& [name, incident] : adjacency) {
        if (incident.size() != 2) {
            return std::nullopt;
        }
    }

    // Deterministic start: the segment holding the smallest point name.
    const auto& start_incident = adjacency.begin()->second;
    std::size_t current_segment = std::min(start_incident[0], start_incident[1]);
    const auto& start = segments[current_segment];
    core::Point current_point = start.point1.name() == adjacency.begin()->first ? start.point1 : start.point2;

    std::vector<core::Point> loop{current_point};
    std::vector<bool> visited(segments.size(), false);
    std::size_t visited_count = 0;

    while (visited_count < segments.size()) {
        visited[current_segment] = true;
        ++visited_count;
        const auto& segment = segments[current_segment];
        const core::Point& next_point =
            segment.point1.name() == current_point.name() ? segment.point2 : segment.point1;

        std::optional<std::size_t> next_segment;
        for (std::size_t candidate : adjacency[next_point.name()]) {
            if (!visited[candidate]) {
                next_segment = candidate;
                break;
            }
        }
        if (!next_segment) {
            break;
        }
        loop.push_back(next_point);
        current_point = next_point;
        current_segment = *next_segment;
    }

    if (visited_count != segments.size() || loop.size() != segments.size()) {
        return std::nullopt;
    }
    return loop;
}

namespace {

std::vector<core::Point> validated_loop(PolygonKind kind, const std::vector<core::Segment>& segments) {
    const std::size_t required = required_side_count(kind);
    const std::string kind_name = polygon_kind_name(kind);
    if (kind == PolygonKind::Generic) {
        if (segments.size() < kGenericPolygonMinSides) {
            throw std::invalid_argument(kind_name + " requires at least " +
                                        std::to_string(kGenericPolygonMinSides) + " segments, got " +
                                        std::to_string(segments.size()));
        }
    } else if (segments.size() != required) {
        throw std::invalid_argument(kind_name + " requires exactly " + std::to_string(required) +
                                    " segments, got " + std::to_string(segments.size()));
    }

    auto ordered = order_segments_into_loop(segments);
    if (!ordered) {
        throw std::invalid_argument("Segments do not form a closed " + kind_name);
    }

    std::vector<core::Point2D> coords;
    coords.reserve(ordered->size());
    for (const auto& point : *ordered) {
        coords.push_back(point.position());
    }
    // Surfaces coincident vertices as a construction error.
    (void)polygon_interior_angles(coords);
    return std::move(*ordered);
}

std::string loop_name(const std::vector<core::Point>& points) {
    std::string name;
    for (const auto& point : points) {
        name += point.name();
    }
    return name;
}

} // namespace

Polygon::Polygon(PolygonKind kind, std::vector<core::Segment> segments,
                 bool is_renderable, std::string color)
    : Polygon(kind, validated_loop(kind, segments), is_renderable, std::move(color), 0) {}

Polygon::Polygon(PolygonKind kind, std::vector<core::Point> ordered_points,
                 bool is_renderable, std::string color, int)
    : core::Drawable(loop_name(ordered_points), std::move(color))
    , kind_(kind)
    , points_(std::move(ordered_points))
    , is_renderable_(is_renderable) {
    rebuild_segments();
}

std::vector<core::Point2D> Polygon::vertices() const {
    std::vector<core::Point2D> coords;
    coords.reserve(points_.size());
    for (const auto& point : points_) {
        coords.push_back(point.position());
    }
    return coords;
}

PolygonFlags Polygon::flags() const {
    return classify_polygon(vertices());
}

void Polygon::translate(double dx, double dy) {
    for (auto& point : points_) {
        point.x += dx;
        point.y += dy;
    }
    rebuild_segments();
}

void Polygon::rotate(double degrees) {
    if (points_.empty()) {
        return;
    }
    double cx = 0.0;
    double cy = 0.0;
    for (const auto& point : points_) {
        cx += point.x;
        cy += point.y;
    }
    cx /= static_cast<double>(points_.size());
    cy /= static_cast<double>(points_.size());

    const double radians = degrees * std::numbers::pi / 180.0;
    const double c = std::cos(radians);
    const double s = std::sin(radians);
    for (auto& point : points_) {
        const double dx = point.x - cx;
        const double dy = point.y - cy;
        point.x = cx + dx * c - dy * s;
        point.y = cy + dx * s + dy * c;
    }
    rebuild_segments();
}

void Polygon::rebuild_segments() {
    segments_.clear();
    segments_.reserve(points_.size());
    for (std::size_t i = 0; i < points_.size(); ++i) {
        segments_.emplace_back(points_[i], points_[(i + 1) % points_.size()], color());
    }
}

} // namespace mathud::geometry
