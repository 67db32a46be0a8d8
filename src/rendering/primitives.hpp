#pragma once

#include <optional>
#include <string>
#include <vector>

#include "../core/types.hpp"
#include "style.hpp"

namespace mathud::rendering {

struct StrokeStyle {
    Color color;
    double width = 1.0;
    // Dash lengths in pixels, empty for a solid line.
    std::vector<double> dash;
};

struct FillStyle {
    Color color;
    double opacity = 1.0;
};

struct FontStyle {
    std::string family = "Inter, sans-serif";
    double size = 14.0;
    bool bold = false;
};

enum class TextAlign {
    Left,
    Center,
    Right,
};

enum class TextBaseline {
    Top,
    Middle,
    Alphabetic,
    Bottom,
};

struct TextAlignment {
    TextAlign align = TextAlign::Left;
    TextBaseline baseline = TextBaseline::Alphabetic;
};

struct TextMetrics {
    double width = 0.0;
    double height = 0.0;
};

// Drawing surface every backend implements. All coordinates are screen
// pixels; angles are radians measured clockwise on screen (y down).
class RendererPrimitives {
public:
    virtual ~RendererPrimitives() = default;

    virtual void begin_frame(int width, int height) = 0;
    virtual void end_frame() = 0;
    virtual void clear(const Color& background) = 0;

    // Bracket one drawable so state set while drawing it cannot leak.
    virtual void begin_shape() = 0;
    virtual void end_shape() = 0;

    virtual void stroke_line(const core::ScreenPoint& start, const core::ScreenPoint& end,
                             const StrokeStyle& stroke) = 0;
    virtual void stroke_polyline(const core::ScreenPath& points, const StrokeStyle& stroke) = 0;
    virtual void stroke_circle(const core::ScreenPoint& center, double radius, const StrokeStyle& stroke) = 0;
    virtual void fill_circle(const core::ScreenPoint& center, double radius, const FillStyle& fill,
                             const std::optional<StrokeStyle>& stroke = std::nullopt) = 0;
    virtual void stroke_ellipse(const core::ScreenPoint& center, double radius_x, double radius_y,
                                double rotation_rad, const StrokeStyle& stroke) = 0;
    virtual void stroke_arc(const core::ScreenPoint& center, double radius, double start_rad,
                            double end_rad, bool clockwise, const StrokeStyle& stroke) = 0;
    virtual void fill_polygon(const core::ScreenPath& points, const FillStyle& fill,
                              const std::optional<StrokeStyle>& stroke = std::nullopt) = 0;
    // Fills the loop forward + reverse.
    virtual void fill_joined_area(const core::ScreenPath& forward, const core::ScreenPath& reverse,
                                  const FillStyle& fill) = 0;
    virtual void draw_text(const std::string& text, const core::ScreenPoint& position,
                           const FontStyle& font, const Color& color,
                           const TextAlignment& alignment = {}, double rotation_rad = 0.0) = 0;
    [[nodiscard]] virtual TextMetrics measure_text(const std::string& text, const FontStyle& font) const = 0;
};

// Scoped begin_shape/end_shape pair.
class ShapeScope {
public:
    explicit ShapeScope(RendererPrimitives& primitives)
        : primitives_(primitives) {
        primitives_.begin_shape();
    }

    ~ShapeScope() {
        primitives_.end_shape();
    }

    ShapeScope(const ShapeScope&) = delete;
    ShapeScope& operator=(const ShapeScope&) = delete;

private:
    RendererPrimitives& primitives_;
};

} // namespace mathud::rendering
