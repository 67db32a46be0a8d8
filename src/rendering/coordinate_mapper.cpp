#include "coordinate_mapper.hpp"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace mathud::rendering {

double sanitize_scale(double scale) {
    if (!std::isfinite(scale) || scale <= 0.0) {
        return 1.0;
    }
    return scale;
}

CoordinateMapper::CoordinateMapper(double canvas_width, double canvas_height)
    : canvas_width_(canvas_width)
    , canvas_height_(canvas_height)
    , origin_(canvas_width / 2.0, canvas_height / 2.0) {}

std::optional<core::ScreenPoint> CoordinateMapper::math_to_screen(double x, double y) const {
    if (!std::isfinite(x) || !std::isfinite(y)) {
        return std::nullopt;
    }
    const double scale = sanitize_scale(scale_factor_);
    core::ScreenPoint screen{origin_.x + x * scale + offset_.x,
                             origin_.y - y * scale + offset_.y};
    if (!screen.is_finite()) {
        return std::nullopt;
    }
    return screen;
}

std::optional<core::Point2D> CoordinateMapper::screen_to_math(double screen_x, double screen_y) const {
    if (!std::isfinite(screen_x) || !std::isfinite(screen_y)) {
        return std::nullopt;
    }
    const double scale = sanitize_scale(scale_factor_);
    core::Point2D math{(screen_x - offset_.x - origin_.x) / scale,
                       (origin_.y + offset_.y - screen_y) / scale};
    if (!math.is_finite()) {
        return std::nullopt;
    }
    return math;
}

std::optional<double> CoordinateMapper::scale_value(double math_length) const {
    const double scaled = math_length * sanitize_scale(scale_factor_);
    if (!std::isfinite(scaled)) {
        return std::nullopt;
    }
    return scaled;
}

std::optional<double> CoordinateMapper::unscale_value(double screen_length) const {
    const double unscaled = screen_length / sanitize_scale(scale_factor_);
    if (!std::isfinite(unscaled)) {
        return std::nullopt;
    }
    return unscaled;
}

void CoordinateMapper::set_scale_factor(double scale) {
    scale_factor_ = sanitize_scale(scale);
}

void CoordinateMapper::apply_zoom(double zoom_factor, std::optional<core::ScreenPoint> zoom_center) {
    if (!std::isfinite(zoom_factor) || zoom_factor <= 0.0) {
        return;
    }
    const double old_scale = sanitize_scale(scale_factor_);
    const double new_scale = std::max(kMinZoomScale, old_scale * zoom_factor);

    if (zoom_center && zoom_center->is_finite()) {
        // Keep the math point under the cursor fixed on screen.
        const auto anchor = screen_to_math(zoom_center->x, zoom_center->y);
        scale_factor_ = new_scale;
        if (anchor) {
            offset_.x = zoom_center->x - origin_.x - anchor->x * new_scale;
            offset_.y = zoom_center->y - origin_.y + anchor->y * new_scale;
        }
        return;
    }
    scale_factor_ = new_scale;
}

void CoordinateMapper::apply_zoom_step(int direction, std::optional<core::ScreenPoint> zoom_center) {
    if (direction == 0) {
        return;
    }
    const double factor = direction < 0 ? (1.0 + kZoomStep) : (1.0 - kZoomStep);
    apply_zoom(factor, zoom_center);
}

void CoordinateMapper::apply_pan(double dx, double dy) {
    if (!std::isfinite(dx) || !std::isfinite(dy)) {
        return;
    }
    offset_.x += dx;
    offset_.y += dy;
}

void CoordinateMapper::reset_pan() {
    offset_ = core::ScreenPoint{0, 0};
}

void CoordinateMapper::reset_transformations() {
    scale_factor_ = 1.0;
    offset_ = core::ScreenPoint{0, 0};
    origin_ = core::ScreenPoint{canvas_width_ / 2.0, canvas_height_ / 2.0};
}

void CoordinateMapper::resize(double canvas_width, double canvas_height) {
    canvas_width_ = canvas_width;
    canvas_height_ = canvas_height;
    origin_ = core::ScreenPoint{canvas_width_ / 2.0, canvas_height_ / 2.0};
}

void CoordinateMapper::set_visible_bounds(double left, double right, double top, double bottom) {
    if (!std::isfinite(left) || !std::isfinite(right) || !std::isfinite(top) || !std::isfinite(bottom)) {
        throw std::invalid_argument("Bounds must be finite values");
    }
    if (!(left < right && bottom < top)) {
        throw std::invalid_argument("Bounds must satisfy left < right and bottom < top");
    }

    const double scale_x = canvas_width_ / (right - left);
    const double scale_y = canvas_height_ / (top - bottom);
    scale_factor_ = sanitize_scale(std::max(std::min(scale_x, scale_y), 1e-9));

    const double center_x = (left + right) / 2.0;
    const double center_y = (top + bottom) / 2.0;
    offset_.x = -center_x * scale_factor_;
    offset_.y = center_y * scale_factor_;
}

core::MathBounds CoordinateMapper::visible_bounds() const {
    return core::MathBounds{visible_left_bound(), visible_right_bound(),
                            visible_top_bound(), visible_bottom_bound()};
}

double CoordinateMapper::visible_left_bound() const {
    return -(origin_.x + offset_.x) / sanitize_scale(scale_factor_);
}

double CoordinateMapper::visible_right_bound() const {
    return (canvas_width_ - origin_.x - offset_.x) / sanitize_scale(scale_factor_);
}

double CoordinateMapper::visible_top_bound() const {
    return (origin_.y + offset_.y) / sanitize_scale(scale_factor_);
}

double CoordinateMapper::visible_bottom_bound() const {
    return (origin_.y + offset_.y - canvas_height_) / sanitize_scale(scale_factor_);
}

} // namespace mathud::rendering
