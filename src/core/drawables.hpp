#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "types.hpp"

namespace mathud::core {

inline constexpr const char* kDefaultColor = "black";

// Base of every object that can appear on the canvas. The render core reads
// name, color and geometry and never mutates a drawable.
class Drawable {
public:
    virtual ~Drawable() = default;

    [[nodiscard]] const std::string& name() const { return name_; }
    [[nodiscard]] const std::string& color() const { return color_; }
    [[nodiscard]] virtual const char* class_name() const = 0;

protected:
    Drawable(std::string name, std::string color)
        : name_(std::move(name)), color_(std::move(color)) {}
    Drawable(const Drawable&) = default;
    Drawable& operator=(const Drawable&) = default;

private:
    std::string name_;
    std::string color_;
};

// Free-standing text anchored at a math position.
class Label : public Drawable {
public:
    Label(std::string name, Point2D position, std::string text, std::string color = kDefaultColor);

    [[nodiscard]] const char* class_name() const override { return "Label"; }

    Point2D position;
    std::string text;
    double font_size = 14.0;
    // Scale factor at creation time; text shrinks when zooming out below it.
    double reference_scale_factor = 1.0;
    double rotation_degrees = 0.0;

    [[nodiscard]] std::vector<std::string> lines() const;
};

class Point : public Drawable {
public:
    Point(std::string name, double x_in, double y_in, std::string color = kDefaultColor);

    [[nodiscard]] const char* class_name() const override { return "Point"; }
    [[nodiscard]] Point2D position() const { return Point2D{x, y}; }

    double x = 0.0;
    double y = 0.0;
    // Replaces the default name label when set.
    std::shared_ptr<const Label> label;
};

class Segment : public Drawable {
public:
    Segment(Point p1, Point p2, std::string color = kDefaultColor);

    [[nodiscard]] const char* class_name() const override { return "Segment"; }

    Point point1;
    Point point2;
    std::shared_ptr<const Label> label;
};

class Vector : public Drawable {
public:
    Vector(Point origin, Point tip, std::string color = kDefaultColor);

    [[nodiscard]] const char* class_name() const override { return "Vector"; }

    Segment segment;
};

class Circle : public Drawable {
public:
    Circle(std::string name, Point center_in, double radius_in, std::string color = kDefaultColor);

    [[nodiscard]] const char* class_name() const override { return "Circle"; }

    Point center;
    double radius = 0.0;
};

class Ellipse : public Drawable {
public:
    Ellipse(std::string name, Point center_in, double radius_x_in, double radius_y_in,
            double rotation_degrees_in = 0.0, std::string color = kDefaultColor);

    [[nodiscard]] const char* class_name() const override { return "Ellipse"; }

    Point center;
    double radius_x = 0.0;
    double radius_y = 0.0;
    double rotation_degrees = 0.0;
};

// Angle at `vertex` swept counter-clockwise from `arm1` to `arm2`.
class Angle : public Drawable {
public:
    Angle(std::string name, Point vertex_in, Point arm1_in, Point arm2_in,
          bool reflex_in = false, std::string color = "blue");

    [[nodiscard]] const char* class_name() const override { return "Angle"; }

    // Swept angle in degrees in [0, 360), or absent when an arm is degenerate.
    [[nodiscard]] std::optional<double> degrees() const;

    Point vertex;
    Point arm1;
    Point arm2;
    bool reflex = false;
};

// y = f(x) with an optional declared domain.
class Function : public Drawable {
public:
    using Evaluator = std::function<double(double)>;

    Function(std::string name, Evaluator evaluator,
             std::optional<Interval> domain = std::nullopt,
             std::string color = kDefaultColor);

    [[nodiscard]] static std::shared_ptr<const Function> constant(double value);

    [[nodiscard]] const char* class_name() const override { return "Function"; }

    // Absent when the evaluator throws or yields a non-finite value.
    [[nodiscard]] std::optional<double> evaluate(double x) const;

    [[nodiscard]] const std::optional<Interval>& domain() const { return domain_; }

private:
    Evaluator evaluator_;
    std::optional<Interval> domain_;
};

// Common part of the filled-region drawables. An empty color falls back to
// the style's area_fill_color.
class ColoredArea : public Drawable {
public:
    std::optional<double> opacity;

protected:
    ColoredArea(std::string name, std::string color)
        : Drawable(std::move(name), std::move(color)) {}
};

// Region between two functions. A null function stands for the x axis.
class FunctionsBoundedColoredArea : public ColoredArea {
public:
    FunctionsBoundedColoredArea(std::string name,
                                std::shared_ptr<const Function> func1_in,
                                std::shared_ptr<const Function> func2_in,
                                std::string color = "");

    [[nodiscard]] const char* class_name() const override { return "FunctionsBoundedColoredArea"; }

    std::shared_ptr<const Function> func1;
    std::shared_ptr<const Function> func2;
    std::optional<double> left_bound;
    std::optional<double> right_bound;
    int num_sample_points = 100;
};

class FunctionSegmentBoundedColoredArea : public ColoredArea {
public:
    FunctionSegmentBoundedColoredArea(std::string name,
                                      std::shared_ptr<const Function> func_in,
                                      Segment segment_in,
                                      std::string color = "");

    [[nodiscard]] const char* class_name() const override { return "FunctionSegmentBoundedColoredArea"; }

    std::shared_ptr<const Function> func;
    Segment segment;
};

// Region under one segment (down to the x axis) or between two segments.
class SegmentsBoundedColoredArea : public ColoredArea {
public:
    SegmentsBoundedColoredArea(std::string name, Segment segment1_in,
                               std::optional<Segment> segment2_in = std::nullopt,
                               std::string color = "");

    [[nodiscard]] const char* class_name() const override { return "SegmentsBoundedColoredArea"; }

    Segment segment1;
    std::optional<Segment> segment2;
};

enum class ClosedShapeKind {
    Polygon,
    Circle,
    Ellipse,
    CircleSegment,
};

// Fill of an already closed boundary.
class ClosedShapeColoredArea : public ColoredArea {
public:
    ClosedShapeColoredArea(std::string name, std::vector<Point2D> polygon_vertices,
                           std::string color = "");
    ClosedShapeColoredArea(std::string name, Circle circle_in, std::string color = "");
    ClosedShapeColoredArea(std::string name, Ellipse ellipse_in, std::string color = "");
    // Region cut from a circle by a chord.
    ClosedShapeColoredArea(std::string name, Circle circle_in, Segment chord_in,
                           std::string color = "");

    [[nodiscard]] const char* class_name() const override { return "ClosedShapeColoredArea"; }

    ClosedShapeKind kind = ClosedShapeKind::Polygon;
    std::vector<Point2D> vertices;
    std::optional<Circle> circle;
    std::optional<Ellipse> ellipse;
    std::optional<Segment> chord;
    int resolution = 96;
    bool arc_clockwise = false;
};

class CartesianGrid : public Drawable {
public:
    CartesianGrid();

    [[nodiscard]] const char* class_name() const override { return "Cartesian2Axis"; }

    bool show_grid = true;
    bool show_tick_labels = true;
};

class PolarGrid : public Drawable {
public:
    PolarGrid();

    [[nodiscard]] const char* class_name() const override { return "PolarGrid"; }

    double angular_step_degrees = 30.0;
    bool show_angle_labels = true;
    bool show_radius_labels = true;
};

} // namespace mathud::core
