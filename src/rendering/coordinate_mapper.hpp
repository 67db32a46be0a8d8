#pragma once

#include <optional>

#include "../core/types.hpp"

namespace mathud::rendering {

// Math <-> screen transformation for one canvas. The y axis is flipped so
// math y grows upwards while screen y grows downwards.
class CoordinateMapper {
public:
    CoordinateMapper(double canvas_width, double canvas_height);

    // Conversions
    [[nodiscard]] std::optional<core::ScreenPoint> math_to_screen(double x, double y) const;
    [[nodiscard]] std::optional<core::ScreenPoint> math_to_screen(const core::Point2D& point) const {
        return math_to_screen(point.x, point.y);
    }
    [[nodiscard]] std::optional<core::Point2D> screen_to_math(double screen_x, double screen_y) const;
    [[nodiscard]] std::optional<double> scale_value(double math_length) const;
    [[nodiscard]] std::optional<double> unscale_value(double screen_length) const;

    // Zoom and pan
    void set_scale_factor(double scale);
    void apply_zoom(double zoom_factor, std::optional<core::ScreenPoint> zoom_center = std::nullopt);
    // direction < 0 zooms in, direction > 0 zooms out.
    void apply_zoom_step(int direction, std::optional<core::ScreenPoint> zoom_center = std::nullopt);
    void apply_pan(double dx, double dy);
    void reset_pan();
    void reset_transformations();
    void resize(double canvas_width, double canvas_height);

    // Fits the rectangle into the canvas keeping the aspect ratio.
    // Throws std::invalid_argument unless left < right and bottom < top.
    void set_visible_bounds(double left, double right, double top, double bottom);
    [[nodiscard]] core::MathBounds visible_bounds() const;
    [[nodiscard]] double visible_left_bound() const;
    [[nodiscard]] double visible_right_bound() const;
    [[nodiscard]] double visible_top_bound() const;
    [[nodiscard]] double visible_bottom_bound() const;

    // Remembers the current scale as the reference for zoom-relative sizing.
    void snapshot_reference_scale() { reference_scale_factor_ = scale_factor_; }

    // Getters
    [[nodiscard]] double scale_factor() const { return scale_factor_; }
    [[nodiscard]] double reference_scale_factor() const { return reference_scale_factor_; }
    [[nodiscard]] double canvas_width() const { return canvas_width_; }
    [[nodiscard]] double canvas_height() const { return canvas_height_; }
    [[nodiscard]] const core::ScreenPoint& origin() const { return origin_; }
    [[nodiscard]] const core::ScreenPoint& offset() const { return offset_; }

private:
    double canvas_width_;
    double canvas_height_;
    double scale_factor_ = 1.0;
    double reference_scale_factor_ = 1.0;
    core::ScreenPoint origin_;
    core::ScreenPoint offset_{0, 0};

    static constexpr double kMinZoomScale = 0.01;
    static constexpr double kZoomStep = 0.1;
};

// Finite and strictly positive, otherwise 1.0.
[[nodiscard]] double sanitize_scale(double scale);

} // namespace mathud::rendering
