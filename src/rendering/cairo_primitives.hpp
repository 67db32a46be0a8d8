#pragma once

#include <cairo.h>

#include "primitives.hpp"
#include "text_layout.hpp"

namespace mathud::rendering {

// RendererPrimitives on a cairo context. Holds its own reference to the
// context so the owning backend can swap or drop it at any time.
class CairoPrimitives : public RendererPrimitives {
public:
    CairoPrimitives() = default;
    ~CairoPrimitives() override;

    CairoPrimitives(const CairoPrimitives&) = delete;
    CairoPrimitives& operator=(const CairoPrimitives&) = delete;

    // Replaces the target context; nullptr detaches. Drawing without a
    // context is a no-op.
    void attach(cairo_t* cr);
    [[nodiscard]] cairo_t* context() const { return cr_; }

    void begin_frame(int width, int height) override;
    void end_frame() override;
    void clear(const Color& background) override;

    void begin_shape() override;
    void end_shape() override;

    void stroke_line(const core::ScreenPoint& start, const core::ScreenPoint& end,
                     const StrokeStyle& stroke) override;
    void stroke_polyline(const core::ScreenPath& points, const StrokeStyle& stroke) override;
    void stroke_circle(const core::ScreenPoint& center, double radius, const StrokeStyle& stroke) override;
    void fill_circle(const core::ScreenPoint& center, double radius, const FillStyle& fill,
                     const std::optional<StrokeStyle>& stroke = std::nullopt) override;
    void stroke_ellipse(const core::ScreenPoint& center, double radius_x, double radius_y,
                        double rotation_rad, const StrokeStyle& stroke) override;
    void stroke_arc(const core::ScreenPoint& center, double radius, double start_rad,
                    double end_rad, bool clockwise, const StrokeStyle& stroke) override;
    void fill_polygon(const core::ScreenPath& points, const FillStyle& fill,
                      const std::optional<StrokeStyle>& stroke = std::nullopt) override;
    void fill_joined_area(const core::ScreenPath& forward, const core::ScreenPath& reverse,
                          const FillStyle& fill) override;
    void draw_text(const std::string& text, const core::ScreenPoint& position,
                   const FontStyle& font, const Color& color,
                   const TextAlignment& alignment = {}, double rotation_rad = 0.0) override;
    [[nodiscard]] TextMetrics measure_text(const std::string& text, const FontStyle& font) const override;

private:
    void set_stroke(const StrokeStyle& stroke);
    void set_fill(const FillStyle& fill);
    void trace(const core::ScreenPath& points);

    cairo_t* cr_ = nullptr;
    TextMeasurer measurer_;
    int width_ = 0;
    int height_ = 0;
};

} // namespace mathud::rendering
