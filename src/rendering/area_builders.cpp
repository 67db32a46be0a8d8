#include "area_builders.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <vector>

namespace mathud::rendering {

namespace {

using core::Interval;
using core::ScreenPath;
using core::ScreenPoint;

constexpr double kDegToRad = std::numbers::pi / 180.0;

ClosedArea make_area(ScreenPath forward, ScreenPath reverse, const core::ColoredArea& area) {
    ClosedArea result;
    result.forward = std::move(forward);
    result.reverse = std::move(reverse);
    result.color = area.color();
    result.opacity = area.opacity;
    return result;
}

// Declared domain of a boundary function; the x axis has none.
std::optional<Interval> declared_domain(const std::shared_ptr<const core::Function>& func) {
    if (!func) {
        return std::nullopt;
    }
    return func->domain();
}

std::optional<double> evaluate_boundary(const std::shared_ptr<const core::Function>& func, double x) {
    if (!func) {
        return 0.0;
    }
    return func->evaluate(x);
}

ScreenPath sample_function(const std::shared_ptr<const core::Function>& func,
                           const std::vector<double>& xs,
                           const CoordinateMapper& mapper) {
    ScreenPath path;
    path.reserve(xs.size());
    for (double x : xs) {
        const auto y = evaluate_boundary(func, x);
        if (!y) {
            continue;
        }
        const auto screen = mapper.math_to_screen(x, *y);
        if (screen) {
            path.push_back(*screen);
        }
    }
    return path;
}

std::optional<double> interpolate_y(const ScreenPoint& a, const ScreenPoint& b, double x) {
    const double dx = b.x - a.x;
    if (dx == 0.0) {
        return a.y;
    }
    const double t = (x - a.x) / dx;
    const double y = a.y + t * (b.y - a.y);
    if (!std::isfinite(y)) {
        return std::nullopt;
    }
    return y;
}

std::optional<ScreenPath> sample_ellipse(const CoordinateMapper& mapper, double cx, double cy,
                                         double rx, double ry, double rotation_deg,
                                         double start_rad, double sweep_rad, int samples) {
    if (!std::isfinite(rx) || !std::isfinite(ry) || rx <= 0.0 || ry <= 0.0) {
        return std::nullopt;
    }
    const double cos_r = std::cos(rotation_deg * kDegToRad);
    const double sin_r = std::sin(rotation_deg * kDegToRad);
    ScreenPath path;
    path.reserve(static_cast<std::size_t>(samples));
    for (int i = 0; i < samples; ++i) {
        const double t = start_rad + sweep_rad * static_cast<double>(i) / static_cast<double>(samples - 1);
        const double ex = rx * std::cos(t);
        const double ey = ry * std::sin(t);
        const auto screen = mapper.math_to_screen(cx + ex * cos_r - ey * sin_r,
                                                  cy + ex * sin_r + ey * cos_r);
        if (!screen) {
            return std::nullopt;
        }
        path.push_back(*screen);
    }
    return path;
}

struct ChordHit {
    double t;
    core::Point2D point;
};

// Intersections of the chord segment with the circle, ordered along the chord.
std::vector<ChordHit> chord_intersections(const core::Circle& circle, const core::Segment& chord) {
    const double x1 = chord.point1.x - circle.center.x;
    const double y1 = chord.point1.y - circle.center.y;
    const double dx = chord.point2.x - chord.point1.x;
    const double dy = chord.point2.y - chord.point1.y;

    const double a = dx * dx + dy * dy;
    const double b = 2.0 * (x1 * dx + y1 * dy);
    const double c = x1 * x1 + y1 * y1 - circle.radius * circle.radius;
    const double discriminant = b * b - 4.0 * a * c;

    std::vector<ChordHit> hits;
    if (a == 0.0 || discriminant <= 0.0 || !std::isfinite(discriminant)) {
        return hits;
    }
    const double root = std::sqrt(discriminant);
    constexpr double kEps = 1e-9;
    for (double t : {(-b - root) / (2.0 * a), (-b + root) / (2.0 * a)}) {
        if (t >= -kEps && t <= 1.0 + kEps) {
            hits.push_back({t, {chord.point1.x + t * dx, chord.point1.y + t * dy}});
        }
    }
    return hits;
}

std::optional<ClosedArea> build_polygon_shape(const core::ClosedShapeColoredArea& area,
                                              const CoordinateMapper& mapper) {
    ScreenPath forward;
    forward.reserve(area.vertices.size());
    for (const auto& vertex : area.vertices) {
        const auto screen = mapper.math_to_screen(vertex);
        if (!screen) {
            return std::nullopt;
        }
        forward.push_back(*screen);
    }
    if (forward.size() < 3) {
        return std::nullopt;
    }
    ScreenPath reverse(forward.rbegin(), forward.rend());
    return make_area(std::move(forward), std::move(reverse), area);
}

std::optional<ClosedArea> build_circle_segment_shape(const core::ClosedShapeColoredArea& area,
                                                     const CoordinateMapper& mapper) {
    if (!area.circle || !area.chord) {
        return std::nullopt;
    }
    const auto& circle = *area.circle;
    const auto hits = chord_intersections(circle, *area.chord);
    if (hits.size() < 2) {
        return std::nullopt;
    }
    const auto& start = hits[0].point;
    const auto& end = hits[1].point;
    const double start_angle = std::atan2(start.y - circle.center.y, start.x - circle.center.x);
    const double end_angle = std::atan2(end.y - circle.center.y, end.x - circle.center.x);

    double sweep = end_angle - start_angle;
    if (area.arc_clockwise) {
        while (sweep >= 0.0) {
            sweep -= 2.0 * std::numbers::pi;
        }
    } else {
        while (sweep <= 0.0) {
            sweep += 2.0 * std::numbers::pi;
        }
    }

    const int samples = std::max(kMinShapeResolution, area.resolution);
    auto forward = sample_ellipse(mapper, circle.center.x, circle.center.y, circle.radius,
                                  circle.radius, 0.0, start_angle, sweep, samples);
    const auto start_screen = mapper.math_to_screen(start);
    const auto end_screen = mapper.math_to_screen(end);
    if (!forward || !start_screen || !end_screen) {
        return std::nullopt;
    }
    // Pin the arc ends exactly on the chord.
    forward->front() = *start_screen;
    forward->back() = *end_screen;
    if (forward->size() < 3) {
        return std::nullopt;
    }
    return make_area(std::move(*forward), ScreenPath{*end_screen, *start_screen}, area);
}

} // namespace

std::vector<double> sample_abscissas(const Interval& domain, int count) {
    const int n = std::max(2, count);
    std::vector<double> xs;
    xs.reserve(static_cast<std::size_t>(n));
    const double width = domain.right - domain.left;
    for (int i = 0; i < n; ++i) {
        xs.push_back(domain.left + width * static_cast<double>(i) / static_cast<double>(n - 1));
    }
    return xs;
}

bool paths_form_single_loop(const ScreenPath& forward, const ScreenPath& reverse, double tolerance) {
    if (forward.size() < 3 || forward.size() != reverse.size()) {
        return false;
    }
    const std::size_t n = forward.size();
    for (std::size_t i = 0; i < n; ++i) {
        const auto& a = forward[i];
        const auto& b = reverse[n - 1 - i];
        if (std::abs(a.x - b.x) > tolerance || std::abs(a.y - b.y) > tolerance) {
            return false;
        }
    }
    return true;
}

std::optional<ClosedArea> build_functions_area(const core::FunctionsBoundedColoredArea& area,
                                               const CoordinateMapper& mapper) {
    Interval domain{area.left_bound.value_or(mapper.visible_left_bound()),
                    area.right_bound.value_or(mapper.visible_right_bound())};
    if (!std::isfinite(domain.left) || !std::isfinite(domain.right)) {
        return std::nullopt;
    }
    if (auto left_domain = declared_domain(area.func1)) {
        domain = domain.intersect(*left_domain);
    }
    if (auto right_domain = declared_domain(area.func2)) {
        domain = domain.intersect(*right_domain);
    }
    if (domain.is_empty()) {
        return std::nullopt;
    }

    const auto xs = sample_abscissas(domain, area.num_sample_points);
    ScreenPath forward = sample_function(area.func1, xs, mapper);
    ScreenPath reverse = sample_function(area.func2, xs, mapper);
    if (forward.size() < 2 || reverse.size() < 2) {
        return std::nullopt;
    }
    std::reverse(reverse.begin(), reverse.end());
    return make_area(std::move(forward), std::move(reverse), area);
}

std::optional<ClosedArea> build_function_segment_area(const core::FunctionSegmentBoundedColoredArea& area,
                                                      const CoordinateMapper& mapper,
                                                      int num_points) {
    const auto& p1 = area.segment.point1;
    const auto& p2 = area.segment.point2;
    Interval domain{std::min(p1.x, p2.x), std::max(p1.x, p2.x)};
    if (!std::isfinite(domain.left) || !std::isfinite(domain.right)) {
        return std::nullopt;
    }
    if (auto func_domain = declared_domain(area.func)) {
        domain = domain.intersect(*func_domain);
    }
    if (domain.is_empty()) {
        return std::nullopt;
    }

    ScreenPath forward = sample_function(area.func, sample_abscissas(domain, num_points), mapper);
    if (forward.size() < 2) {
        return std::nullopt;
    }
    const auto end_screen = mapper.math_to_screen(p2.x, p2.y);
    const auto start_screen = mapper.math_to_screen(p1.x, p1.y);
    if (!end_screen || !start_screen) {
        return std::nullopt;
    }
    return make_area(std::move(forward), ScreenPath{*end_screen, *start_screen}, area);
}

std::optional<ClosedArea> build_segments_area(const core::SegmentsBoundedColoredArea& area,
                                              const CoordinateMapper& mapper) {
    const auto s1_a = mapper.math_to_screen(area.segment1.point1.x, area.segment1.point1.y);
    const auto s1_b = mapper.math_to_screen(area.segment1.point2.x, area.segment1.point2.y);
    if (!s1_a || !s1_b) {
        return std::nullopt;
    }

    if (!area.segment2) {
        // Trapezoid down (or up) to the x axis.
        const auto base_a = mapper.math_to_screen(area.segment1.point1.x, 0.0);
        const auto base_b = mapper.math_to_screen(area.segment1.point2.x, 0.0);
        if (!base_a || !base_b) {
            return std::nullopt;
        }
        return make_area(ScreenPath{*s1_a, *s1_b}, ScreenPath{*base_b, *base_a}, area);
    }

    const auto s2_a = mapper.math_to_screen(area.segment2->point1.x, area.segment2->point1.y);
    const auto s2_b = mapper.math_to_screen(area.segment2->point2.x, area.segment2->point2.y);
    if (!s2_a || !s2_b) {
        return std::nullopt;
    }

    const double left = std::max(std::min(s1_a->x, s1_b->x), std::min(s2_a->x, s2_b->x));
    const double right = std::min(std::max(s1_a->x, s1_b->x), std::max(s2_a->x, s2_b->x));
    if (!(right - left > 0.0)) {
        return std::nullopt;
    }

    const auto y1_left = interpolate_y(*s1_a, *s1_b, left);
    const auto y1_right = interpolate_y(*s1_a, *s1_b, right);
    const auto y2_left = interpolate_y(*s2_a, *s2_b, left);
    const auto y2_right = interpolate_y(*s2_a, *s2_b, right);
    if (!y1_left || !y1_right || !y2_left || !y2_right) {
        return std::nullopt;
    }

    ScreenPath forward{{left, *y1_left}, {right, *y1_right}};
    ScreenPath reverse{{right, *y2_right}, {left, *y2_left}};
    return make_area(std::move(forward), std::move(reverse), area);
}

std::optional<ClosedArea> build_closed_shape_area(const core::ClosedShapeColoredArea& area,
                                                  const CoordinateMapper& mapper) {
    const int samples = std::max(kMinShapeResolution, area.resolution);
    switch (area.kind) {
        case core::ClosedShapeKind::Polygon:
            return build_polygon_shape(area, mapper);
        case core::ClosedShapeKind::Circle: {
            if (!area.circle) {
                return std::nullopt;
            }
            const auto& circle = *area.circle;
            auto forward = sample_ellipse(mapper, circle.center.x, circle.center.y, circle.radius,
                                          circle.radius, 0.0, 0.0, 2.0 * std::numbers::pi, samples);
            if (!forward || forward->size() < 3) {
                return std::nullopt;
            }
            ScreenPath reverse(forward->rbegin(), forward->rend());
            return make_area(std::move(*forward), std::move(reverse), area);
        }
        case core::ClosedShapeKind::Ellipse: {
            if (!area.ellipse) {
                return std::nullopt;
            }
            const auto& ellipse = *area.ellipse;
            auto forward = sample_ellipse(mapper, ellipse.center.x, ellipse.center.y, ellipse.radius_x,
                                          ellipse.radius_y, ellipse.rotation_degrees, 0.0,
                                          2.0 * std::numbers::pi, samples);
            if (!forward || forward->size() < 3) {
                return std::nullopt;
            }
            ScreenPath reverse(forward->rbegin(), forward->rend());
            return make_area(std::move(*forward), std::move(reverse), area);
        }
        case core::ClosedShapeKind::CircleSegment:
            return build_circle_segment_shape(area, mapper);
    }
    return std::nullopt;
}

} // namespace mathud::rendering
