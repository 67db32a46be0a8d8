#include "drawables.hpp"

#include <cmath>
#include <exception>
#include <numbers>
#include <sstream>

namespace mathud::core {

Label::Label(std::string name, Point2D position_in, std::string text_in, std::string color)
    : Drawable(std::move(name), std::move(color))
    , position(position_in)
    , text(std::move(text_in)) {}

std::vector<std::string> Label::lines() const {
    std::vector<std::string> out;
    std::istringstream stream(text);
    std::string line;
    while (std::getline(stream, line)) {
        out.push_back(line);
    }
    if (out.empty()) {
        out.emplace_back();
    }
    return out;
}

Point::Point(std::string name, double x_in, double y_in, std::string color)
    : Drawable(std::move(name), std::move(color))
    , x(x_in)
    , y(y_in) {}

Segment::Segment(Point p1, Point p2, std::string color)
    : Drawable(p1.name() + p2.name(), std::move(color))
    , point1(std::move(p1))
    , point2(std::move(p2)) {}

Vector::Vector(Point origin, Point tip, std::string color)
    : Drawable(origin.name() + tip.name(), color)
    , segment(std::move(origin), std::move(tip), color) {}

Circle::Circle(std::string name, Point center_in, double radius_in, std::string color)
    : Drawable(std::move(name), std::move(color))
    , center(std::move(center_in))
    , radius(radius_in) {}

Ellipse::Ellipse(std::string name, Point center_in, double radius_x_in, double radius_y_in,
                 double rotation_degrees_in, std::string color)
    : Drawable(std::move(name), std::move(color))
    , center(std::move(center_in))
    , radius_x(radius_x_in)
    , radius_y(radius_y_in)
    , rotation_degrees(rotation_degrees_in) {}

Angle::Angle(std::string name, Point vertex_in, Point arm1_in, Point arm2_in,
             bool reflex_in, std::string color)
    : Drawable(std::move(name), std::move(color))
    , vertex(std::move(vertex_in))
    , arm1(std::move(arm1_in))
    , arm2(std::move(arm2_in))
    , reflex(reflex_in) {}

std::optional<double> Angle::degrees() const {
    const double v1x = arm1.x - vertex.x;
    const double v1y = arm1.y - vertex.y;
    const double v2x = arm2.x - vertex.x;
    const double v2y = arm2.y - vertex.y;
    if (std::hypot(v1x, v1y) == 0.0 || std::hypot(v2x, v2y) == 0.0) {
        return std::nullopt;
    }
    double sweep = std::atan2(v2y, v2x) - std::atan2(v1y, v1x);
    sweep *= 180.0 / std::numbers::pi;
    while (sweep < 0.0) {
        sweep += 360.0;
    }
    while (sweep >= 360.0) {
        sweep -= 360.0;
    }
    if (!std::isfinite(sweep)) {
        return std::nullopt;
    }
    const bool is_reflex = sweep > 180.0;
    if (is_reflex != reflex && sweep != 0.0) {
        // Measure the other side of the arms.
        sweep = 360.0 - sweep;
    }
    return sweep;
}

Function::Function(std::string name, Evaluator evaluator,
                   std::optional<Interval> domain, std::string color)
    : Drawable(std::move(name), std::move(color))
    , evaluator_(std::move(evaluator))
    , domain_(domain) {}

std::shared_ptr<const Function> Function::constant(double value) {
    return std::make_shared<const Function>(
        "y=" + std::to_string(value), [value](double) { return value; });
}

std::optional<double> Function::evaluate(double x) const {
    if (!evaluator_ || !std::isfinite(x)) {
        return std::nullopt;
    }
    try {
        const double y = evaluator_(x);
        if (!std::isfinite(y)) {
            return std::nullopt;
        }
        return y;
    } catch (const std::exception&) {
        return std::nullopt;
    }
}

FunctionsBoundedColoredArea::FunctionsBoundedColoredArea(std::string name,
                                                         std::shared_ptr<const Function> func1_in,
                                                         std::shared_ptr<const Function> func2_in,
                                                         std::string color)
    : ColoredArea(std::move(name), std::move(color))
    , func1(std::move(func1_in))
    , func2(std::move(func2_in)) {}

FunctionSegmentBoundedColoredArea::FunctionSegmentBoundedColoredArea(std::string name,
                                                                     std::shared_ptr<const Function> func_in,
                                                                     Segment segment_in,
                                                                     std::string color)
    : ColoredArea(std::move(name), std::move(color))
    , func(std::move(func_in))
    , segment(std::move(segment_in)) {}

SegmentsBoundedColoredArea::SegmentsBoundedColoredArea(std::string name, Segment segment1_in,
                                                       std::optional<Segment> segment2_in,
                                                       std::string color)
    : ColoredArea(std::move(name), std::move(color))
    , segment1(std::move(segment1_in))
    , segment2(std::move(segment2_in)) {}

ClosedShapeColoredArea::ClosedShapeColoredArea(std::string name, std::vector<Point2D> polygon_vertices,
                                               std::string color)
    : ColoredArea(std::move(name), std::move(color))
    , kind(ClosedShapeKind::Polygon)
    , vertices(std::move(polygon_vertices)) {}

ClosedShapeColoredArea::ClosedShapeColoredArea(std::string name, Circle circle_in, std::string color)
    : ColoredArea(std::move(name), std::move(color))
    , kind(ClosedShapeKind::Circle)
    , circle(std::move(circle_in)) {}

ClosedShapeColoredArea::ClosedShapeColoredArea(std::string name, Ellipse ellipse_in, std::string color)
    : ColoredArea(std::move(name), std::move(color))
    , kind(ClosedShapeKind::Ellipse)
    , ellipse(std::move(ellipse_in)) {}

ClosedShapeColoredArea::ClosedShapeColoredArea(std::string name, Circle circle_in, Segment chord_in,
                                               std::string color)
    : ColoredArea(std::move(name), std::move(color))
    , kind(ClosedShapeKind::CircleSegment)
    , circle(std::move(circle_in))
    , chord(std::move(chord_in))
    , resolution(64) {}

CartesianGrid::CartesianGrid() : Drawable("cartesian", kDefaultColor) {}

PolarGrid::PolarGrid() : Drawable("polar", kDefaultColor) {}

} // namespace mathud::core
