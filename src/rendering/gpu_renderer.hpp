#pragma once

#include <memory>
#include <string>
#include <vector>

#include "primitives.hpp"
#include "renderer.hpp"
#include "text_layout.hpp"

namespace mathud::rendering {

struct GpuVertex {
    float x;
    float y;
    float r;
    float g;
    float b;
    float a;
};

// Text is left to the device, which rasterizes glyphs its own way.
struct TextRun {
    std::string text;
    core::ScreenPoint position;
    FontStyle font;
    Color color;
    TextAlignment alignment;
    double rotation_rad = 0.0;
};

// One frame of geometry: a triangle list in screen pixels plus text runs.
struct VertexBatch {
    int width = 0;
    int height = 0;
    Color clear_color{1.0, 1.0, 1.0, 1.0};
    std::vector<GpuVertex> vertices;
    std::vector<TextRun> text_runs;

    [[nodiscard]] std::size_t triangle_count() const { return vertices.size() / 3; }

    void reset() {
        vertices.clear();
        text_runs.clear();
    }
};

// Hardware behind the gpu backend, supplied by the host.
class GpuDevice {
public:
    virtual ~GpuDevice() = default;

    [[nodiscard]] virtual bool supports_rendering() const = 0;
    [[nodiscard]] virtual std::string name() const = 0;
    virtual void submit(const VertexBatch& batch) = 0;
};

// Tessellates every primitive into triangles and hands the frame to the
// device at end_frame().
class GpuPrimitives : public RendererPrimitives {
public:
    explicit GpuPrimitives(std::shared_ptr<GpuDevice> device);

    void begin_frame(int width, int height) override;
    void end_frame() override;
    void clear(const Color& background) override;

    void begin_shape() override { ++shape_depth_; }
    void end_shape() override { --shape_depth_; }

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

    [[nodiscard]] const VertexBatch& batch() const { return batch_; }
    [[nodiscard]] int shape_depth() const { return shape_depth_; }

private:
    void push_triangle(const core::ScreenPoint& a, const core::ScreenPoint& b,
                       const core::ScreenPoint& c, const Color& color);
    void push_quad_line(const core::ScreenPoint& start, const core::ScreenPoint& end,
                        double width, const Color& color);

    std::shared_ptr<GpuDevice> device_;
    VertexBatch batch_;
    TextMeasurer measurer_;
    int shape_depth_ = 0;
};

// GPU backend ("gpu").
class GpuRenderer : public Renderer {
public:
    static constexpr const char* kBackendId = "gpu";

    // Throws std::runtime_error without a device or when the device cannot render.
    explicit GpuRenderer(const RendererConfig& config);

    [[nodiscard]] const char* backend_id() const override { return kBackendId; }
    [[nodiscard]] const VertexBatch& batch() const;
};

// Points on an elliptical arc, `segments` + 1 samples from start to start + sweep.
[[nodiscard]] core::ScreenPath sample_screen_arc(const core::ScreenPoint& center, double radius_x,
                                                 double radius_y, double rotation_rad,
                                                 double start_rad, double sweep_rad, int segments);

} // namespace mathud::rendering
