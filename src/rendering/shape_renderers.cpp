#include "shape_renderers.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdio>
#include <string>
#include <numbers>

#include "area_builders.hpp"

namespace mathud::rendering {

namespace {

constexpr double kDegToRad = std::numbers::pi / 180.0;
constexpr double kLabelVanishPx = 2.0;
constexpr int kCoordinatePrecision = 3;
constexpr int kMinFunctionSamples = 2;
constexpr int kMaxFunctionSamples = 10000;

FontStyle make_font(const Style& style, const std::string& size_key, double fallback_size) {
    FontStyle font;
    font.family = style.text("font_family", font.family);
    font.size = style.number(size_key, fallback_size);
    return font;
}

double positive_or(double value, double fallback) {
    return (std::isfinite(value) && value > 0.0) ? value : fallback;
}

bool draw_label(const core::Label& label, RenderContext& context);

bool fill_area(const std::optional<ClosedArea>& area, RenderContext& context) {
    if (!area || area->empty()) {
        return false;
    }
    FillStyle fill;
    fill.color = resolve_color(area->color, context.style, "area_fill_color");
    double opacity = area->opacity.value_or(context.style.number("area_opacity", 0.3));
    if (!std::isfinite(opacity)) {
        opacity = context.style.number("area_opacity", 0.3);
    }
    fill.opacity = std::clamp(opacity, 0.0, 1.0);

    ShapeScope scope(context.primitives);
    if (paths_form_single_loop(area->forward, area->reverse)) {
        context.primitives.fill_polygon(area->forward, fill);
    } else {
        context.primitives.fill_joined_area(area->forward, area->reverse, fill);
    }
    return true;
}

} // namespace

Color resolve_color(const std::string& own_color, const Style& style, const std::string& style_key) {
    if (!own_color.empty()) {
        if (auto parsed = parse_color(own_color)) {
            return *parsed;
        }
    }
    return style.color(style_key);
}

std::string format_number(double value, int precision) {
    if (!std::isfinite(value)) {
        return "";
    }
    char buffer[64];
    std::snprintf(buffer, sizeof(buffer), "%.*f", std::max(0, precision), value);
    std::string text(buffer);
    if (text.find('.') != std::string::npos) {
        while (!text.empty() && text.back() == '0') {
            text.pop_back();
        }
        if (!text.empty() && text.back() == '.') {
            text.pop_back();
        }
    }
    if (text == "-0") {
        text = "0";
    }
    return text;
}

void draw_label_block(RenderContext& context, const std::string& id,
                      const std::vector<std::string>& lines, const core::ScreenPoint& anchor,
                      const FontStyle& font, const Color& color, double rotation_rad) {
    if (lines.empty() || font.size <= 0.0) {
        return;
    }
    const double line_height = font.size * context.style.number("label_line_height_factor", 1.2);

    double dy = 0.0;
    if (context.labels) {
        double width = 0.0;
        for (const auto& line : lines) {
            width = std::max(width, context.primitives.measure_text(line, font).width);
        }
        const double top = anchor.y - font.size;
        const BoundingBox box(anchor.x, top, anchor.x + width,
                              top + line_height * static_cast<double>(lines.size()));
        dy = context.labels->get_or_place_dy(id, box, line_height);
    }

    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (lines[i].empty()) {
            continue;
        }
        const core::ScreenPoint position{anchor.x, anchor.y + dy + line_height * static_cast<double>(i)};
        context.primitives.draw_text(lines[i], position, font, color, TextAlignment{}, rotation_rad);
    }
}

bool render_point(const core::Point& point, RenderContext& context) {
    const auto screen = context.mapper.math_to_screen(point.x, point.y);
    if (!screen) {
        return false;
    }
    const double radius = context.style.number("point_radius", 2.0);
    if (!std::isfinite(radius) || radius <= 0.0) {
        return false;
    }

    FillStyle fill;
    fill.color = resolve_color(point.color(), context.style, "point_color");

    ShapeScope scope(context.primitives);
    context.primitives.fill_circle(*screen, radius, fill);

    if (point.label) {
        draw_label(*point.label, context);
        return true;
    }
    if (point.name().empty()) {
        return true;
    }
    const std::string text = point.name() + "(" + format_number(point.x, kCoordinatePrecision) + ", " +
                             format_number(point.y, kCoordinatePrecision) + ")";
    const FontStyle font = make_font(context.style, "point_label_font_size", 10.0);
    draw_label_block(context, "point:" + point.name(), {text},
                     core::ScreenPoint{screen->x + radius, screen->y - radius}, font, fill.color);
    return true;
}

bool render_segment(const core::Segment& segment, RenderContext& context) {
    const auto start = context.mapper.math_to_screen(segment.point1.x, segment.point1.y);
    const auto end = context.mapper.math_to_screen(segment.point2.x, segment.point2.y);
    if (!start || !end) {
        return false;
    }
    StrokeStyle stroke;
    stroke.color = resolve_color(segment.color(), context.style, "segment_color");
    stroke.width = positive_or(context.style.number("segment_stroke_width", 1.0), 1.0);
    ShapeScope scope(context.primitives);
    context.primitives.stroke_line(*start, *end, stroke);
    if (segment.label) {
        draw_label(*segment.label, context);
    }
    return true;
}

bool render_vector(const core::Vector& vector, RenderContext& context) {
    const auto& segment = vector.segment;
    const auto start = context.mapper.math_to_screen(segment.point1.x, segment.point1.y);
    const auto end = context.mapper.math_to_screen(segment.point2.x, segment.point2.y);
    if (!start || !end) {
        return false;
    }
    StrokeStyle stroke;
    stroke.color = resolve_color(vector.color(), context.style, "vector_color");
    stroke.width = positive_or(context.style.number("segment_stroke_width", 1.0), 1.0);

    // Equilateral tip with its apex on the end point.
    const double side = positive_or(context.style.number("vector_tip_size", 8.0), 8.0);
    const double half_base = side / 2.0;
    const double height = std::sqrt(std::max(side * side - half_base * half_base, 0.0));
    const double angle = std::atan2(end->y - start->y, end->x - start->x);
    const double cos_a = std::cos(angle);
    const double sin_a = std::sin(angle);
    const core::ScreenPath tip{
        *end,
        {end->x - height * cos_a - half_base * sin_a, end->y - height * sin_a + half_base * cos_a},
        {end->x - height * cos_a + half_base * sin_a, end->y - height * sin_a - half_base * cos_a},
    };

    ShapeScope scope(context.primitives);
    context.primitives.stroke_line(*start, *end, stroke);
    context.primitives.fill_polygon(tip, FillStyle{stroke.color, 1.0}, StrokeStyle{stroke.color, 1.0, {}});
    return true;
}

bool render_circle(const core::Circle& circle, RenderContext& context) {
    const auto center = context.mapper.math_to_screen(circle.center.x, circle.center.y);
    const auto radius = context.mapper.scale_value(circle.radius);
    if (!center || !radius || *radius <= 0.0) {
        return false;
    }
    StrokeStyle stroke;
    stroke.color = resolve_color(circle.color(), context.style, "circle_color");
    stroke.width = positive_or(context.style.number("circle_stroke_width", 1.0), 1.0);

    ShapeScope scope(context.primitives);
    context.primitives.stroke_circle(*center, *radius, stroke);
    return true;
}

bool render_ellipse(const core::Ellipse& ellipse, RenderContext& context) {
    const auto center = context.mapper.math_to_screen(ellipse.center.x, ellipse.center.y);
    const auto radius_x = context.mapper.scale_value(ellipse.radius_x);
    const auto radius_y = context.mapper.scale_value(ellipse.radius_y);
    if (!center || !radius_x || !radius_y || *radius_x <= 0.0 || *radius_y <= 0.0 ||
        !std::isfinite(ellipse.rotation_degrees)) {
        return false;
    }
    StrokeStyle stroke;
    stroke.color = resolve_color(ellipse.color(), context.style, "ellipse_color");
    stroke.width = positive_or(context.style.number("ellipse_stroke_width", 1.0), 1.0);

    ShapeScope scope(context.primitives);
    // Counter-clockwise in math space is clockwise-negative on screen.
    context.primitives.stroke_ellipse(*center, *radius_x, *radius_y, -ellipse.rotation_degrees * kDegToRad, stroke);
    return true;
}

bool render_angle(const core::Angle& angle, RenderContext& context) {
    const auto display_degrees = angle.degrees();
    const auto vertex = context.mapper.math_to_screen(angle.vertex.x, angle.vertex.y);
    const auto arm1 = context.mapper.math_to_screen(angle.arm1.x, angle.arm1.y);
    const auto arm2 = context.mapper.math_to_screen(angle.arm2.x, angle.arm2.y);
    if (!display_degrees || !vertex || !arm1 || !arm2) {
        return false;
    }

    const double arc_radius = positive_or(context.style.number("angle_arc_radius", 15.0), 15.0);
    const double min_arm = std::min(std::hypot(arm1->x - vertex->x, arm1->y - vertex->y),
                                    std::hypot(arm2->x - vertex->x, arm2->y - vertex->y));
    const double radius = min_arm > 0.0 ? std::min(arc_radius, min_arm) : arc_radius;

    // degrees() sweeps counter-clockwise from arm1 unless the reflex choice
    // flipped it, in which case the sweep starts at arm2.
    double ccw_from_arm1 = std::atan2(angle.arm2.y - angle.vertex.y, angle.arm2.x - angle.vertex.x) -
                           std::atan2(angle.arm1.y - angle.vertex.y, angle.arm1.x - angle.vertex.x);
    ccw_from_arm1 /= kDegToRad;
    while (ccw_from_arm1 < 0.0) {
        ccw_from_arm1 += 360.0;
    }
    const bool starts_at_arm1 = std::abs(ccw_from_arm1 - *display_degrees) < 1e-6;
    const auto& start_arm = starts_at_arm1 ? *arm1 : *arm2;

    const double start_rad = std::atan2(start_arm.y - vertex->y, start_arm.x - vertex->x);
    const double sweep_rad = *display_degrees * kDegToRad;

    StrokeStyle stroke;
    stroke.color = resolve_color(angle.color(), context.style, "angle_color");
    stroke.width = positive_or(context.style.number("angle_stroke_width", 1.0), 1.0);

    ShapeScope scope(context.primitives);
    context.primitives.stroke_arc(*vertex, radius, start_rad, start_rad - sweep_rad, false, stroke);

    FontStyle font = make_font(context.style, "angle_label_font_size", 12.0);
    font.size *= std::clamp(radius / arc_radius, 0.0, 1.0);
    if (font.size <= kLabelVanishPx) {
        return true;
    }
    const double text_radius = radius * context.style.number("angle_text_arc_radius_factor", 1.8);
    const double text_angle = start_rad - sweep_rad / 2.0;
    char text[32];
    std::snprintf(text, sizeof(text), "%.1f°", *display_degrees);
    context.primitives.draw_text(text,
                                 {vertex->x + text_radius * std::cos(text_angle),
                                  vertex->y + text_radius * std::sin(text_angle)},
                                 font, stroke.color, {TextAlign::Center, TextBaseline::Middle});
    return true;
}

std::vector<core::ScreenPath> function_screen_paths(const core::Function& function,
                                                    const CoordinateMapper& mapper,
                                                    int sample_count) {
    std::vector<core::ScreenPath> paths;
    core::Interval domain{mapper.visible_left_bound(), mapper.visible_right_bound()};
    if (function.domain()) {
        domain = domain.intersect(*function.domain());
    }
    if (domain.is_empty()) {
        return paths;
    }

    const double jump_limit = mapper.canvas_height();
    core::ScreenPath current;
    for (double x : sample_abscissas(domain, sample_count)) {
        const auto y = function.evaluate(x);
        const auto screen = y ? mapper.math_to_screen(x, *y) : std::nullopt;
        if (!screen) {
            if (current.size() >= 2) {
                paths.push_back(std::move(current));
            }
            current.clear();
            continue;
        }
        if (!current.empty() && std::abs(screen->y - current.back().y) > jump_limit) {
            if (current.size() >= 2) {
                paths.push_back(std::move(current));
            }
            current.clear();
        }
        current.push_back(*screen);
    }
    if (current.size() >= 2) {
        paths.push_back(std::move(current));
    }
    return paths;
}

bool render_function(const core::Function& function, RenderContext& context) {
    const double requested = context.style.number("function_sample_count", 400.0);
    const int samples = static_cast<int>(std::clamp(requested, static_cast<double>(kMinFunctionSamples),
                                                    static_cast<double>(kMaxFunctionSamples)));
    const auto paths = function_screen_paths(function, context.mapper, samples);
    if (paths.empty()) {
        return false;
    }
    StrokeStyle stroke;
    stroke.color = resolve_color(function.color(), context.style, "function_color");
    stroke.width = positive_or(context.style.number("function_stroke_width", 1.0), 1.0);

    ShapeScope scope(context.primitives);
    for (const auto& path : paths) {
        context.primitives.stroke_polyline(path, stroke);
    }

    if (!function.name().empty()) {
        const FontStyle font = make_font(context.style, "function_label_font_size", 12.0);
        const auto& first = paths.front().front();
        const double offset_x = (1.0 + static_cast<double>(function.name().size())) * font.size / 2.0;
        const core::ScreenPoint anchor{std::max(first.x - offset_x, 0.0), std::max(first.y, font.size)};
        draw_label_block(context, "function:" + function.name(), {function.name()}, anchor, font, stroke.color);
    }
    return true;
}

namespace {

// Unnamed labels are told apart by address, which is stable for the frame.
std::string label_layout_id(const core::Label& label) {
    if (!label.name().empty()) {
        return "label:" + label.name();
    }
    return "label@" + std::to_string(reinterpret_cast<std::uintptr_t>(&label));
}

bool draw_label(const core::Label& label, RenderContext& context) {
    const auto screen = context.mapper.math_to_screen(label.position);
    if (!screen) {
        return false;
    }
    FontStyle font = make_font(context.style, "label_font_size", 14.0);
    font.size = zoom_adjusted_font_size(positive_or(label.font_size, font.size),
                                        context.mapper.scale_factor(), label.reference_scale_factor);
    if (font.size <= 0.0) {
        // Zoomed out far enough that the text is not drawn.
        return true;
    }
    const double rotation = std::isfinite(label.rotation_degrees) ? -label.rotation_degrees * kDegToRad : 0.0;
    draw_label_block(context, label_layout_id(label), label.lines(), *screen, font,
                     resolve_color(label.color(), context.style, "label_color"), rotation);
    return true;
}

} // namespace

bool render_label(const core::Label& label, RenderContext& context) {
    ShapeScope scope(context.primitives);
    return draw_label(label, context);
}

bool render_functions_area(const core::FunctionsBoundedColoredArea& area, RenderContext& context) {
    return fill_area(build_functions_area(area, context.mapper), context);
}

bool render_function_segment_area(const core::FunctionSegmentBoundedColoredArea& area, RenderContext& context) {
    return fill_area(build_function_segment_area(area, context.mapper), context);
}

bool render_segments_area(const core::SegmentsBoundedColoredArea& area, RenderContext& context) {
    return fill_area(build_segments_area(area, context.mapper), context);
}

bool render_closed_shape_area(const core::ClosedShapeColoredArea& area, RenderContext& context) {
    return fill_area(build_closed_shape_area(area, context.mapper), context);
}

bool render_polygon(const geometry::Polygon& polygon, RenderContext& context) {
    if (!polygon.is_renderable()) {
        return false;
    }
    core::ScreenPath loop;
    for (const auto& vertex : polygon.vertices()) {
        const auto screen = context.mapper.math_to_screen(vertex);
        if (!screen) {
            return false;
        }
        loop.push_back(*screen);
    }
    if (loop.size() < 3) {
        return false;
    }
    loop.push_back(loop.front());

    StrokeStyle stroke;
    stroke.color = resolve_color(polygon.color(), context.style, "segment_color");
    stroke.width = positive_or(context.style.number("segment_stroke_width", 1.0), 1.0);

    ShapeScope scope(context.primitives);
    context.primitives.stroke_polyline(loop, stroke);
    return true;
}

} // namespace mathud::rendering
