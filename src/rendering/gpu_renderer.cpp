#include "gpu_renderer.hpp"

#include <algorithm>
#include <cmath>
#include <numbers>
#include <stdexcept>

#include "../geometry/triangulation.hpp"

namespace mathud::rendering {

namespace {

constexpr int kCircleSegments = 64;

std::shared_ptr<GpuDevice> checked_device(const RendererConfig& config) {
    if (!config.gpu_device) {
        throw std::runtime_error("No GPU device available");
    }
    if (!config.gpu_device->supports_rendering()) {
        throw std::runtime_error("GPU device " + config.gpu_device->name() + " does not support rendering");
    }
    return config.gpu_device;
}

Color with_opacity(const Color& color, double opacity) {
    return Color{color.r, color.g, color.b, color.a * opacity};
}

} // namespace

core::ScreenPath sample_screen_arc(const core::ScreenPoint& center, double radius_x, double radius_y,
                                   double rotation_rad, double start_rad, double sweep_rad, int segments) {
    const int n = std::max(1, segments);
    const double cos_r = std::cos(rotation_rad);
    const double sin_r = std::sin(rotation_rad);
    core::ScreenPath path;
    path.reserve(static_cast<std::size_t>(n) + 1);
    for (int i = 0; i <= n; ++i) {
        const double t = start_rad + sweep_rad * static_cast<double>(i) / static_cast<double>(n);
        const double ex = radius_x * std::cos(t);
        const double ey = radius_y * std::sin(t);
        path.emplace_back(center.x + ex * cos_r - ey * sin_r, center.y + ex * sin_r + ey * cos_r);
    }
    return path;
}

GpuPrimitives::GpuPrimitives(std::shared_ptr<GpuDevice> device)
    : device_(std::move(device)) {}

void GpuPrimitives::begin_frame(int width, int height) {
    batch_.reset();
    batch_.width = width;
    batch_.height = height;
    shape_depth_ = 0;
}

void GpuPrimitives::end_frame() {
    if (device_) {
        device_->submit(batch_);
    }
}

void GpuPrimitives::clear(const Color& background) {
    batch_.reset();
    batch_.clear_color = background;
}

void GpuPrimitives::push_triangle(const core::ScreenPoint& a, const core::ScreenPoint& b,
                                  const core::ScreenPoint& c, const Color& color) {
    const auto r = static_cast<float>(color.r);
    const auto g = static_cast<float>(color.g);
    const auto b_ = static_cast<float>(color.b);
    const auto alpha = static_cast<float>(color.a);
    for (const auto* p : {&a, &b, &c}) {
        batch_.vertices.push_back(GpuVertex{static_cast<float>(p->x), static_cast<float>(p->y), r, g, b_, alpha});
    }
}

void GpuPrimitives::push_quad_line(const core::ScreenPoint& start, const core::ScreenPoint& end,
                                   double width, const Color& color) {
    const double dx = end.x - start.x;
    const double dy = end.y - start.y;
    const double length = std::hypot(dx, dy);
    if (!(length > 0.0)) {
        return;
    }
    // Perpendicular offset of half the pen width.
    const double half = std::max(width, 1.0) / 2.0;
    const double nx = -dy / length * half;
    const double ny = dx / length * half;
    const core::ScreenPoint a{start.x + nx, start.y + ny};
    const core::ScreenPoint b{end.x + nx, end.y + ny};
    const core::ScreenPoint c{end.x - nx, end.y - ny};
    const core::ScreenPoint d{start.x - nx, start.y - ny};
    push_triangle(a, b, c, color);
    push_triangle(a, c, d, color);
}

void GpuPrimitives::stroke_line(const core::ScreenPoint& start, const core::ScreenPoint& end,
                                const StrokeStyle& stroke) {
    push_quad_line(start, end, stroke.width, stroke.color);
}

void GpuPrimitives::stroke_polyline(const core::ScreenPath& points, const StrokeStyle& stroke) {
    for (std::size_t i = 1; i < points.size(); ++i) {
        push_quad_line(points[i - 1], points[i], stroke.width, stroke.color);
    }
}

void GpuPrimitives::stroke_circle(const core::ScreenPoint& center, double radius, const StrokeStyle& stroke) {
    if (radius <= 0.0) return;
    stroke_polyline(sample_screen_arc(center, radius, radius, 0.0, 0.0, 2.0 * std::numbers::pi, kCircleSegments),
                    stroke);
}

void GpuPrimitives::fill_circle(const core::ScreenPoint& center, double radius, const FillStyle& fill,
                                const std::optional<StrokeStyle>& stroke) {
    if (radius <= 0.0) return;
    const auto rim = sample_screen_arc(center, radius, radius, 0.0, 0.0, 2.0 * std::numbers::pi, kCircleSegments);
    const Color color = with_opacity(fill.color, fill.opacity);
    for (std::size_t i = 1; i < rim.size(); ++i) {
        push_triangle(center, rim[i - 1], rim[i], color);
    }
    if (stroke) {
        stroke_polyline(rim, *stroke);
    }
}

void GpuPrimitives::stroke_ellipse(const core::ScreenPoint& center, double radius_x, double radius_y,
                                   double rotation_rad, const StrokeStyle& stroke) {
    if (radius_x <= 0.0 || radius_y <= 0.0) return;
    stroke_polyline(sample_screen_arc(center, radius_x, radius_y, rotation_rad, 0.0, 2.0 * std::numbers::pi,
                                      kCircleSegments),
                    stroke);
}

void GpuPrimitives::stroke_arc(const core::ScreenPoint& center, double radius, double start_rad,
                               double end_rad, bool clockwise, const StrokeStyle& stroke) {
    if (radius <= 0.0) return;
    // Same winding rules as cairo_arc / cairo_arc_negative.
    double sweep = end_rad - start_rad;
    const double turn = 2.0 * std::numbers::pi;
    if (clockwise) {
        while (sweep < 0.0) sweep += turn;
    } else {
        while (sweep > 0.0) sweep -= turn;
    }
    const int segments = std::max(2, static_cast<int>(std::ceil(kCircleSegments * std::abs(sweep) / turn - 1e-9)));
    stroke_polyline(sample_screen_arc(center, radius, radius, 0.0, start_rad, sweep, segments), stroke);
}

void GpuPrimitives::fill_polygon(const core::ScreenPath& points, const FillStyle& fill,
                                 const std::optional<StrokeStyle>& stroke) {
    if (points.size() < 3) return;
    std::vector<core::Point2D> loop;
    loop.reserve(points.size());
    for (const auto& p : points) {
        loop.emplace_back(p.x, p.y);
    }
    const Color color = with_opacity(fill.color, fill.opacity);
    for (const auto& triangle : geometry::triangulate_polygon(loop)) {
        push_triangle(points[triangle[0]], points[triangle[1]], points[triangle[2]], color);
    }
    if (stroke) {
        core::ScreenPath outline = points;
        outline.push_back(points.front());
        stroke_polyline(outline, *stroke);
    }
}

void GpuPrimitives::fill_joined_area(const core::ScreenPath& forward, const core::ScreenPath& reverse,
                                     const FillStyle& fill) {
    core::ScreenPath loop = forward;
    loop.insert(loop.end(), reverse.begin(), reverse.end());
    fill_polygon(loop, fill);
}

void GpuPrimitives::draw_text(const std::string& text, const core::ScreenPoint& position,
                              const FontStyle& font, const Color& color,
                              const TextAlignment& alignment, double rotation_rad) {
    if (text.empty() || font.size <= 0.0) return;
    batch_.text_runs.push_back(TextRun{text, position, font, color, alignment, rotation_rad});
}

TextMetrics GpuPrimitives::measure_text(const std::string& text, const FontStyle& font) const {
    return measurer_.measure(text, font);
}

GpuRenderer::GpuRenderer(const RendererConfig& config)
    : Renderer(std::make_unique<GpuPrimitives>(checked_device(config)), config) {}

const VertexBatch& GpuRenderer::batch() const {
    return static_cast<const GpuPrimitives&>(primitives()).batch();
}

} // namespace mathud::rendering
