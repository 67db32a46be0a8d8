#include "svg_renderer.hpp"

#include <stdexcept>

#include <cairo-svg.h>

namespace mathud::rendering {

namespace {

cairo_status_t append_to_string(void* closure, const unsigned char* data, unsigned int length) {
    auto* out = static_cast<std::string*>(closure);
    out->append(reinterpret_cast<const char*>(data), length);
    return CAIRO_STATUS_SUCCESS;
}

} // namespace

SvgRenderer::SvgRenderer(const RendererConfig& config)
    : Renderer(std::make_unique<CairoPrimitives>(), config) {
    start_recording();
}

SvgRenderer::~SvgRenderer() {
    static_cast<CairoPrimitives&>(primitives()).attach(nullptr);
    if (recording_) {
        cairo_surface_destroy(recording_);
    }
}

void SvgRenderer::on_begin_frame() {
    start_recording();
}

void SvgRenderer::start_recording() {
    cairo_rectangle_t extents{0.0, 0.0, static_cast<double>(width()), static_cast<double>(height())};
    cairo_surface_t* recording = cairo_recording_surface_create(CAIRO_CONTENT_COLOR_ALPHA, &extents);
    const cairo_status_t status = cairo_surface_status(recording);
    if (status != CAIRO_STATUS_SUCCESS) {
        cairo_surface_destroy(recording);
        throw std::runtime_error(std::string("Failed to create recording surface: ") +
                                 cairo_status_to_string(status));
    }

    cairo_t* cr = cairo_create(recording);
    static_cast<CairoPrimitives&>(primitives()).attach(cr);
    cairo_destroy(cr);

    if (recording_) {
        cairo_surface_destroy(recording_);
    }
    recording_ = recording;
}

void SvgRenderer::replay_into(cairo_surface_t* target) const {
    cairo_surface_flush(recording_);
    cairo_t* cr = cairo_create(target);
    cairo_set_source_surface(cr, recording_, 0.0, 0.0);
    cairo_paint(cr);
    const cairo_status_t status = cairo_status(cr);
    cairo_destroy(cr);
    cairo_surface_finish(target);
    if (status != CAIRO_STATUS_SUCCESS) {
        throw std::runtime_error(std::string("Failed to replay SVG frame: ") + cairo_status_to_string(status));
    }
}

void SvgRenderer::write_svg(const std::string& path) const {
    cairo_surface_t* svg = cairo_svg_surface_create(path.c_str(), width(), height());
    const cairo_status_t status = cairo_surface_status(svg);
    if (status != CAIRO_STATUS_SUCCESS) {
        cairo_surface_destroy(svg);
        throw std::runtime_error("Failed to open " + path + ": " + cairo_status_to_string(status));
    }
    try {
        replay_into(svg);
    } catch (const std::runtime_error&) {
        cairo_surface_destroy(svg);
        throw;
    }
    cairo_surface_destroy(svg);
}

std::string SvgRenderer::svg_document() const {
    std::string document;
    cairo_surface_t* svg = cairo_svg_surface_create_for_stream(&append_to_string, &document, width(), height());
    const cairo_status_t status = cairo_surface_status(svg);
    if (status != CAIRO_STATUS_SUCCESS) {
        cairo_surface_destroy(svg);
        throw std::runtime_error(std::string("Failed to create SVG stream: ") + cairo_status_to_string(status));
    }
    try {
        replay_into(svg);
    } catch (const std::runtime_error&) {
        cairo_surface_destroy(svg);
        throw;
    }
    cairo_surface_destroy(svg);
    return document;
}

} // namespace mathud::rendering
