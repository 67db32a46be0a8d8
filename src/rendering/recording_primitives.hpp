#pragma once

#include <algorithm>
#include <cstdio>
#include <string>
#include <vector>

#include "primitives.hpp"

namespace mathud::rendering {

// In-memory surface that logs every call as text. Used by tests to compare
// emitted primitives without a cairo surface.
class RecordingPrimitives : public RendererPrimitives {
public:
    std::vector<std::string> calls;
    int open_shapes = 0;
    int max_open_shapes = 0;

    void begin_frame(int width, int height) override {
        calls.push_back("begin_frame " + std::to_string(width) + "x" + std::to_string(height));
    }
    void end_frame() override { calls.push_back("end_frame"); }
    void clear(const Color& background) override {
        calls.push_back("clear " + fmt(background.r) + "," + fmt(background.g) + "," + fmt(background.b));
    }

    void begin_shape() override {
        ++open_shapes;
        max_open_shapes = std::max(max_open_shapes, open_shapes);
        calls.push_back("begin_shape");
    }
    void end_shape() override {
        --open_shapes;
        calls.push_back("end_shape");
    }

    void stroke_line(const core::ScreenPoint& start, const core::ScreenPoint& end,
                     const StrokeStyle& stroke) override {
        calls.push_back("stroke_line " + pt(start) + " " + pt(end) + " w" + fmt(stroke.width));
    }
    void stroke_polyline(const core::ScreenPath& points, const StrokeStyle&) override {
        calls.push_back("stroke_polyline n" + std::to_string(points.size()) + path_ends(points));
    }
    void stroke_circle(const core::ScreenPoint& center, double radius, const StrokeStyle&) override {
        calls.push_back("stroke_circle " + pt(center) + " r" + fmt(radius));
    }
    void fill_circle(const core::ScreenPoint& center, double radius, const FillStyle&,
                     const std::optional<StrokeStyle>&) override {
        calls.push_back("fill_circle " + pt(center) + " r" + fmt(radius));
    }
    void stroke_ellipse(const core::ScreenPoint& center, double radius_x, double radius_y,
                        double rotation_rad, const StrokeStyle&) override {
        calls.push_back("stroke_ellipse " + pt(center) + " " + fmt(radius_x) + "x" + fmt(radius_y) +
                        " rot" + fmt(rotation_rad));
    }
    void stroke_arc(const core::ScreenPoint& center, double radius, double start_rad, double end_rad,
                    bool clockwise, const StrokeStyle&) override {
        calls.push_back("stroke_arc " + pt(center) + " r" + fmt(radius) + " " + fmt(start_rad) + ".." +
                        fmt(end_rad) + (clockwise ? " cw" : " ccw"));
    }
    void fill_polygon(const core::ScreenPath& points, const FillStyle& fill,
                      const std::optional<StrokeStyle>&) override {
        calls.push_back("fill_polygon n" + std::to_string(points.size()) + " a" + fmt(fill.opacity));
    }
    void fill_joined_area(const core::ScreenPath& forward, const core::ScreenPath& reverse,
                          const FillStyle& fill) override {
        calls.push_back("fill_joined_area n" + std::to_string(forward.size()) + "+" +
                        std::to_string(reverse.size()) + " a" + fmt(fill.opacity));
    }
    void draw_text(const std::string& text, const core::ScreenPoint& position, const FontStyle& font,
                   const Color&, const TextAlignment&, double) override {
        calls.push_back("draw_text '" + text + "' " + pt(position) + " s" + fmt(font.size));
    }
    [[nodiscard]] TextMetrics measure_text(const std::string& text, const FontStyle& font) const override {
        return TextMetrics{0.6 * font.size * static_cast<double>(text.size()), font.size};
    }

    [[nodiscard]] std::size_t count(const std::string& prefix) const {
        std::size_t n = 0;
        for (const auto& call : calls) {
            if (call.rfind(prefix, 0) == 0) {
                ++n;
            }
        }
        return n;
    }

private:
    static std::string fmt(double value) {
        char buffer[32];
        std::snprintf(buffer, sizeof(buffer), "%.3f", value);
        return buffer;
    }
    static std::string pt(const core::ScreenPoint& p) {
        return "(" + fmt(p.x) + "," + fmt(p.y) + ")";
    }
    static std::string path_ends(const core::ScreenPath& points) {
        if (points.empty()) {
            return "";
        }
        return " " + pt(points.front()) + "->" + pt(points.back());
    }
};

} // namespace mathud::rendering
