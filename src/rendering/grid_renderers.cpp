#include "shape_renderers.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <numbers>
#include <stdexcept>

namespace mathud::rendering {

namespace {

constexpr double kDegToRad = std::numbers::pi / 180.0;
// Guards against drawing thousands of lines when the spacing degenerates.
constexpr int kMaxGridLines = 1000;

struct GridStyle {
    StrokeStyle axis;
    StrokeStyle grid;
    FontStyle font;
    Color label_color;
    double tick_size;
};

double grid_spacing_for(const CoordinateMapper& mapper, const Style& style) {
    const double target_px = style.number("grid_target_spacing_px", 100.0);
    return nice_grid_spacing(target_px / mapper.scale_factor());
}

// First and last multiple of spacing inside [low, high].
std::pair<long long, long long> multiple_range(double low, double high, double spacing) {
    return {static_cast<long long>(std::ceil(low / spacing)),
            static_cast<long long>(std::floor(high / spacing))};
}

std::string scientific(double value) {
    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1e", value);
    std::string text(buffer);
    const auto e = text.find('e');
    if (e == std::string::npos) {
        return text;
    }
    // "1.5e-04" -> "1.5e-4"
    std::string mantissa = text.substr(0, e);
    std::string exponent = text.substr(e + 1);
    char sign = '+';
    if (!exponent.empty() && (exponent.front() == '+' || exponent.front() == '-')) {
        sign = exponent.front();
        exponent.erase(0, 1);
    }
    exponent.erase(0, std::min(exponent.find_first_not_of('0'), exponent.size()));
    if (exponent.empty()) {
        exponent = "0";
    }
    return mantissa + "e" + sign + exponent;
}

} // namespace

double nice_grid_spacing(double raw_spacing) {
    if (!std::isfinite(raw_spacing) || raw_spacing <= 0.0) {
        throw std::invalid_argument("Grid spacing must be finite and positive");
    }
    const double base = std::pow(10.0, std::floor(std::log10(raw_spacing)));
    for (double multiplier : {1.0, 2.0, 5.0, 10.0}) {
        if (multiplier * base >= raw_spacing * (1.0 - 1e-12)) {
            return multiplier * base;
        }
    }
    return 10.0 * base;
}

int tick_precision(double spacing) {
    if (!std::isfinite(spacing) || spacing <= 0.0 || spacing >= 1.0) {
        return 0;
    }
    return std::max(0, static_cast<int>(std::ceil(-std::log10(spacing) - 1e-12)));
}

std::string format_tick_value(double value, int precision) {
    if (value == 0.0) {
        return "0";
    }
    if (!std::isfinite(value)) {
        return "";
    }
    if (std::abs(value) >= 1e6 || precision > 4 || std::abs(value) < 0.001) {
        return scientific(value);
    }
    return format_number(value, precision);
}

bool render_cartesian_grid(const core::CartesianGrid& grid, RenderContext& context) {
    const auto& mapper = context.mapper;
    const auto& style = context.style;
    const auto origin = mapper.math_to_screen(0.0, 0.0);
    if (!origin) {
        return false;
    }

    double spacing = 0.0;
    try {
        spacing = grid_spacing_for(mapper, style);
    } catch (const std::invalid_argument&) {
        return false;
    }

    GridStyle look;
    look.axis = StrokeStyle{resolve_color(grid.color(), style, "cartesian_axis_color"),
                            style.number("cartesian_axis_stroke_width", 1.0), {}};
    look.grid = StrokeStyle{style.color("cartesian_grid_color"),
                            style.number("cartesian_grid_stroke_width", 0.5), {}};
    look.font.family = style.text("font_family", look.font.family);
    look.font.size = style.number("cartesian_tick_font_size", 8.0);
    look.label_color = style.color("cartesian_label_color");
    look.tick_size = style.number("cartesian_tick_size", 3.0);

    const double width = mapper.canvas_width();
    const double height = mapper.canvas_height();
    const auto bounds = mapper.visible_bounds();
    const int precision = tick_precision(spacing);
    const auto [first_x, last_x] = multiple_range(bounds.left, bounds.right, spacing);
    const auto [first_y, last_y] = multiple_range(bounds.bottom, bounds.top, spacing);
    if (last_x - first_x > kMaxGridLines || last_y - first_y > kMaxGridLines) {
        return false;
    }

    ShapeScope scope(context.primitives);

    if (grid.show_grid) {
        for (long long i = first_x; i <= last_x; ++i) {
            const auto top = mapper.math_to_screen(static_cast<double>(i) * spacing, bounds.top);
            if (top) {
                context.primitives.stroke_line({top->x, 0.0}, {top->x, height}, look.grid);
            }
        }
        for (long long j = first_y; j <= last_y; ++j) {
            const auto left = mapper.math_to_screen(bounds.left, static_cast<double>(j) * spacing);
            if (left) {
                context.primitives.stroke_line({0.0, left->y}, {width, left->y}, look.grid);
            }
        }
    }

    context.primitives.stroke_line({0.0, origin->y}, {width, origin->y}, look.axis);
    context.primitives.stroke_line({origin->x, 0.0}, {origin->x, height}, look.axis);

    // Major ticks on multiples, minor half-size ticks half way between.
    const double step_px = spacing * mapper.scale_factor();
    const TextAlignment below{TextAlign::Center, TextBaseline::Top};
    const TextAlignment left_of{TextAlign::Right, TextBaseline::Middle};
    for (long long i = first_x; i <= last_x; ++i) {
        const double x_px = origin->x + static_cast<double>(i) * step_px;
        context.primitives.stroke_line({x_px, origin->y - look.tick_size}, {x_px, origin->y + look.tick_size}, look.axis);
        const double minor_px = x_px + step_px / 2.0;
        context.primitives.stroke_line({minor_px, origin->y - look.tick_size / 2.0},
                                       {minor_px, origin->y + look.tick_size / 2.0}, look.axis);
        if (!grid.show_tick_labels) {
            continue;
        }
        if (i == 0) {
            context.primitives.draw_text("O", {x_px + 2.0, origin->y + look.tick_size + 2.0},
                                         look.font, look.label_color, {TextAlign::Left, TextBaseline::Top});
            continue;
        }
        context.primitives.draw_text(format_tick_value(static_cast<double>(i) * spacing, precision),
                                     {x_px, origin->y + look.tick_size + 2.0}, look.font, look.label_color, below);
    }
    for (long long j = first_y; j <= last_y; ++j) {
        const double y_px = origin->y - static_cast<double>(j) * step_px;
        context.primitives.stroke_line({origin->x - look.tick_size, y_px}, {origin->x + look.tick_size, y_px}, look.axis);
        const double minor_px = y_px - step_px / 2.0;
        context.primitives.stroke_line({origin->x - look.tick_size / 2.0, minor_px},
                                       {origin->x + look.tick_size / 2.0, minor_px}, look.axis);
        if (!grid.show_tick_labels || j == 0) {
            continue;
        }
        context.primitives.draw_text(format_tick_value(static_cast<double>(j) * spacing, precision),
                                     {origin->x - look.tick_size - 2.0, y_px}, look.font, look.label_color, left_of);
    }
    return true;
}

bool render_polar_grid(const core::PolarGrid& grid, RenderContext& context) {
    const auto& mapper = context.mapper;
    const auto& style = context.style;
    const auto origin = mapper.math_to_screen(0.0, 0.0);
    if (!origin) {
        return false;
    }
    const double angular_step = grid.angular_step_degrees;
    if (!std::isfinite(angular_step) || angular_step <= 0.0 || angular_step > 360.0) {
        return false;
    }

    double spacing = 0.0;
    try {
        spacing = grid_spacing_for(mapper, style);
    } catch (const std::invalid_argument&) {
        return false;
    }

    const double width = mapper.canvas_width();
    const double height = mapper.canvas_height();
    // Farthest canvas corner bounds every circle and radial line.
    double max_radius_px = 0.0;
    for (const auto& corner : {core::ScreenPoint{0, 0}, core::ScreenPoint{width, 0},
                               core::ScreenPoint{0, height}, core::ScreenPoint{width, height}}) {
        max_radius_px = std::max(max_radius_px, std::hypot(corner.x - origin->x, corner.y - origin->y));
    }
    const double step_px = spacing * mapper.scale_factor();
    const auto circle_count = static_cast<long long>(std::floor(max_radius_px / step_px));
    if (circle_count > kMaxGridLines) {
        return false;
    }
    const double rays = std::floor(360.0 / angular_step + 1e-9);
    if (rays > kMaxGridLines) {
        return false;
    }
    const int ray_count = static_cast<int>(rays);

    const StrokeStyle axis{resolve_color(grid.color(), style, "polar_axis_color"), 1.0, {}};
    const StrokeStyle circles{style.color("polar_circle_color"), 0.5, {}};
    const StrokeStyle radials{style.color("polar_radial_color"), 0.5, {}};
    FontStyle font;
    font.family = style.text("font_family", font.family);
    font.size = style.number("polar_label_font_size", 8.0);
    const Color label_color = style.color("polar_label_color");
    const int precision = tick_precision(spacing);

    ShapeScope scope(context.primitives);

    for (long long k = 1; k <= circle_count; ++k) {
        const double radius_px = static_cast<double>(k) * step_px;
        context.primitives.stroke_circle(*origin, radius_px, circles);
        if (grid.show_radius_labels) {
            context.primitives.draw_text(format_tick_value(static_cast<double>(k) * spacing, precision),
                                         {origin->x + radius_px + 2.0, origin->y + 2.0}, font, label_color,
                                         {TextAlign::Left, TextBaseline::Top});
        }
    }

    const double label_radius_px = std::max(std::min(width, height) / 2.0 - 12.0, 0.0);
    for (int r = 0; r < ray_count; ++r) {
        const double degrees = angular_step * static_cast<double>(r);
        // Math angles turn counter-clockwise, screen y points down.
        const double screen_rad = -degrees * kDegToRad;
        const core::ScreenPoint end{origin->x + max_radius_px * std::cos(screen_rad),
                                    origin->y + max_radius_px * std::sin(screen_rad)};
        context.primitives.stroke_line(*origin, end, radials);
        if (grid.show_angle_labels && label_radius_px > 0.0) {
            context.primitives.draw_text(format_number(degrees, 1) + "°",
                                         {origin->x + label_radius_px * std::cos(screen_rad),
                                          origin->y + label_radius_px * std::sin(screen_rad)},
                                         font, label_color, {TextAlign::Center, TextBaseline::Middle});
        }
    }

    context.primitives.stroke_line({0.0, origin->y}, {width, origin->y}, axis);
    context.primitives.stroke_line({origin->x, 0.0}, {origin->x, height}, axis);
    return true;
}

} // namespace mathud::rendering
