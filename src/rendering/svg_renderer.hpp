#pragma once

#include <string>

#include <cairo.h>

#include "cairo_primitives.hpp"
#include "renderer.hpp"

namespace mathud::rendering {

// Vector backend ("svg"). Each frame is recorded, then replayed into an SVG
// surface on export so one frame can be written any number of times.
class SvgRenderer : public Renderer {
public:
    static constexpr const char* kBackendId = "svg";

    // Throws std::runtime_error when cairo cannot create a recording surface.
    explicit SvgRenderer(const RendererConfig& config);
    ~SvgRenderer() override;

    [[nodiscard]] const char* backend_id() const override { return kBackendId; }

    // Throws std::runtime_error on cairo failure.
    void write_svg(const std::string& path) const;
    [[nodiscard]] std::string svg_document() const;

protected:
    void on_begin_frame() override;

private:
    void start_recording();
    void replay_into(cairo_surface_t* target) const;

    cairo_surface_t* recording_ = nullptr;
};

} // namespace mathud::rendering
