#include "canvas_renderer.hpp"

#include <stdexcept>

namespace mathud::rendering {

CanvasRenderer::CanvasRenderer(const RendererConfig& config)
    : Renderer(std::make_unique<CairoPrimitives>(), config) {
    surface_ = cairo_image_surface_create(CAIRO_FORMAT_ARGB32, width(), height());
    const cairo_status_t surface_status = cairo_surface_status(surface_);
    if (surface_status != CAIRO_STATUS_SUCCESS) {
        cairo_surface_destroy(surface_);
        surface_ = nullptr;
        throw std::runtime_error(std::string("Failed to create image surface: ") +
                                 cairo_status_to_string(surface_status));
    }

    cairo_t* cr = cairo_create(surface_);
    const cairo_status_t context_status = cairo_status(cr);
    if (context_status != CAIRO_STATUS_SUCCESS) {
        cairo_destroy(cr);
        cairo_surface_destroy(surface_);
        surface_ = nullptr;
        throw std::runtime_error(std::string("Failed to create cairo context: ") +
                                 cairo_status_to_string(context_status));
    }
    static_cast<CairoPrimitives&>(primitives()).attach(cr);
    cairo_destroy(cr);
}

CanvasRenderer::~CanvasRenderer() {
    static_cast<CairoPrimitives&>(primitives()).attach(nullptr);
    if (surface_) {
        cairo_surface_destroy(surface_);
    }
}

void CanvasRenderer::write_png(const std::string& path) const {
    cairo_surface_flush(surface_);
    const cairo_status_t status = cairo_surface_write_to_png(surface_, path.c_str());
    if (status != CAIRO_STATUS_SUCCESS) {
        throw std::runtime_error("Failed to write " + path + ": " + cairo_status_to_string(status));
    }
}

} // namespace mathud::rendering
