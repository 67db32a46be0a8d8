#pragma once

#include <string>

#include <cairo.h>

#include "cairo_primitives.hpp"
#include "renderer.hpp"

namespace mathud::rendering {

// Immediate raster backend ("canvas2d") drawing into an ARGB32 image.
class CanvasRenderer : public Renderer {
public:
    static constexpr const char* kBackendId = "canvas2d";

    // Throws std::runtime_error when cairo cannot allocate the surface.
    explicit CanvasRenderer(const RendererConfig& config);
    ~CanvasRenderer() override;

    [[nodiscard]] const char* backend_id() const override { return kBackendId; }

    // Throws std::runtime_error when the PNG cannot be written.
    void write_png(const std::string& path) const;

    [[nodiscard]] cairo_surface_t* surface() const { return surface_; }

private:
    cairo_surface_t* surface_ = nullptr;
};

} // namespace mathud::rendering
