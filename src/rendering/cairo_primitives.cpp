#include "cairo_primitives.hpp"

#include <cmath>

namespace mathud::rendering {

CairoPrimitives::~CairoPrimitives() {
    attach(nullptr);
}

void CairoPrimitives::attach(cairo_t* cr) {
    if (cr) {
        cairo_reference(cr);
    }
    if (cr_) {
        cairo_destroy(cr_);
    }
    cr_ = cr;
}

void CairoPrimitives::begin_frame(int width, int height) {
    width_ = width;
    height_ = height;
}

void CairoPrimitives::end_frame() {
    if (!cr_) return;
    cairo_surface_flush(cairo_get_target(cr_));
}

void CairoPrimitives::clear(const Color& background) {
    if (!cr_) return;
    cairo_save(cr_);
    cairo_set_operator(cr_, CAIRO_OPERATOR_SOURCE);
    cairo_set_source_rgba(cr_, background.r, background.g, background.b, background.a);
    cairo_paint(cr_);
    cairo_restore(cr_);
}

void CairoPrimitives::begin_shape() {
    if (!cr_) return;
    cairo_save(cr_);
    cairo_new_path(cr_);
}

void CairoPrimitives::end_shape() {
    if (!cr_) return;
    cairo_new_path(cr_);
    cairo_restore(cr_);
}

void CairoPrimitives::set_stroke(const StrokeStyle& stroke) {
    cairo_set_source_rgba(cr_, stroke.color.r, stroke.color.g, stroke.color.b, stroke.color.a);
    cairo_set_line_width(cr_, stroke.width);
    cairo_set_line_cap(cr_, CAIRO_LINE_CAP_ROUND);
    cairo_set_line_join(cr_, CAIRO_LINE_JOIN_ROUND);
    if (stroke.dash.empty()) {
        cairo_set_dash(cr_, nullptr, 0, 0.0);
    } else {
        cairo_set_dash(cr_, stroke.dash.data(), static_cast<int>(stroke.dash.size()), 0.0);
    }
}

void CairoPrimitives::set_fill(const FillStyle& fill) {
    cairo_set_source_rgba(cr_, fill.color.r, fill.color.g, fill.color.b, fill.color.a * fill.opacity);
}

void CairoPrimitives::trace(const core::ScreenPath& points) {
    bool first = true;
    for (const auto& point : points) {
        if (first) {
            cairo_move_to(cr_, point.x, point.y);
            first = false;
        } else {
            cairo_line_to(cr_, point.x, point.y);
        }
    }
}

void CairoPrimitives::stroke_line(const core::ScreenPoint& start, const core::ScreenPoint& end,
                                  const StrokeStyle& stroke) {
    if (!cr_) return;
    set_stroke(stroke);
    cairo_move_to(cr_, start.x, start.y);
    cairo_line_to(cr_, end.x, end.y);
    cairo_stroke(cr_);
}

void CairoPrimitives::stroke_polyline(const core::ScreenPath& points, const StrokeStyle& stroke) {
    if (!cr_ || points.size() < 2) return;
    set_stroke(stroke);
    trace(points);
    cairo_stroke(cr_);
}

void CairoPrimitives::stroke_circle(const core::ScreenPoint& center, double radius, const StrokeStyle& stroke) {
    if (!cr_ || radius <= 0.0) return;
    set_stroke(stroke);
    cairo_new_sub_path(cr_);
    cairo_arc(cr_, center.x, center.y, radius, 0, 2 * M_PI);
    cairo_stroke(cr_);
}

void CairoPrimitives::fill_circle(const core::ScreenPoint& center, double radius, const FillStyle& fill,
                                  const std::optional<StrokeStyle>& stroke) {
    if (!cr_ || radius <= 0.0) return;
    cairo_new_sub_path(cr_);
    cairo_arc(cr_, center.x, center.y, radius, 0, 2 * M_PI);
    set_fill(fill);
    if (stroke) {
        cairo_fill_preserve(cr_);
        set_stroke(*stroke);
        cairo_stroke(cr_);
    } else {
        cairo_fill(cr_);
    }
}

void CairoPrimitives::stroke_ellipse(const core::ScreenPoint& center, double radius_x, double radius_y,
                                     double rotation_rad, const StrokeStyle& stroke) {
    if (!cr_ || radius_x <= 0.0 || radius_y <= 0.0) return;
    // Scale a unit circle, then restore the matrix so the pen stays round.
    cairo_save(cr_);
    cairo_translate(cr_, center.x, center.y);
    cairo_rotate(cr_, rotation_rad);
    cairo_scale(cr_, radius_x, radius_y);
    cairo_new_sub_path(cr_);
    cairo_arc(cr_, 0.0, 0.0, 1.0, 0, 2 * M_PI);
    cairo_restore(cr_);
    set_stroke(stroke);
    cairo_stroke(cr_);
}

void CairoPrimitives::stroke_arc(const core::ScreenPoint& center, double radius, double start_rad,
                                 double end_rad, bool clockwise, const StrokeStyle& stroke) {
    if (!cr_ || radius <= 0.0) return;
    set_stroke(stroke);
    cairo_new_sub_path(cr_);
    if (clockwise) {
        cairo_arc(cr_, center.x, center.y, radius, start_rad, end_rad);
    } else {
        cairo_arc_negative(cr_, center.x, center.y, radius, start_rad, end_rad);
    }
    cairo_stroke(cr_);
}

void CairoPrimitives::fill_polygon(const core::ScreenPath& points, const FillStyle& fill,
                                   const std::optional<StrokeStyle>& stroke) {
    if (!cr_ || points.size() < 3) return;
    trace(points);
    cairo_close_path(cr_);
    set_fill(fill);
    if (stroke) {
        cairo_fill_preserve(cr_);
        set_stroke(*stroke);
        cairo_stroke(cr_);
    } else {
        cairo_fill(cr_);
    }
}

void CairoPrimitives::fill_joined_area(const core::ScreenPath& forward, const core::ScreenPath& reverse,
                                       const FillStyle& fill) {
    if (!cr_ || forward.empty() || reverse.empty()) return;
    trace(forward);
    for (const auto& point : reverse) {
        cairo_line_to(cr_, point.x, point.y);
    }
    cairo_close_path(cr_);
    set_fill(fill);
    cairo_fill(cr_);
}

void CairoPrimitives::draw_text(const std::string& text, const core::ScreenPoint& position,
                                const FontStyle& font, const Color& color,
                                const TextAlignment& alignment, double rotation_rad) {
    if (!cr_ || text.empty() || font.size <= 0.0) return;

    PangoLayout* layout = pango_cairo_create_layout(cr_);
    apply_font(layout, font);
    pango_layout_set_text(layout, text.c_str(), -1);
    const core::ScreenPoint offset = layout_anchor_offset(layout, alignment);

    cairo_save(cr_);
    cairo_set_source_rgba(cr_, color.r, color.g, color.b, color.a);
    cairo_translate(cr_, position.x, position.y);
    if (rotation_rad != 0.0) {
        cairo_rotate(cr_, rotation_rad);
    }
    cairo_move_to(cr_, offset.x, offset.y);
    pango_cairo_show_layout(cr_, layout);
    cairo_restore(cr_);

    g_object_unref(layout);
}

TextMetrics CairoPrimitives::measure_text(const std::string& text, const FontStyle& font) const {
    return measurer_.measure(text, font);
}

} // namespace mathud::rendering
