#include "renderer.hpp"

#include <stdexcept>

#include "../geometry/polygon.hpp"
#include "shape_renderers.hpp"

namespace mathud::rendering {

Renderer::Renderer(std::unique_ptr<RendererPrimitives> primitives, const RendererConfig& config)
    : primitives_(std::move(primitives))
    , style_(config.style_overrides, config.log_callback)
    , label_layout_(config.label_layout)
    , log_callback_(config.log_callback)
    , width_(config.width)
    , height_(config.height) {
    if (!primitives_) {
        throw std::invalid_argument("Renderer requires a primitive surface");
    }
    if (width_ <= 0 || height_ <= 0) {
        throw std::invalid_argument("Renderer surface size must be positive");
    }
}

Renderer::~Renderer() = default;

void Renderer::register_handler(std::type_index type, Handler handler) {
    handlers_[type] = std::move(handler);
}

void Renderer::register_default_drawables() {
    register_drawable<core::Point>(&render_point);
    register_drawable<core::Segment>(&render_segment);
    register_drawable<core::Vector>(&render_vector);
    register_drawable<core::Circle>(&render_circle);
    register_drawable<core::Ellipse>(&render_ellipse);
    register_drawable<core::Angle>(&render_angle);
    register_drawable<core::Function>(&render_function);
    register_drawable<core::Label>(&render_label);
    register_drawable<core::FunctionsBoundedColoredArea>(&render_functions_area);
    register_drawable<core::FunctionSegmentBoundedColoredArea>(&render_function_segment_area);
    register_drawable<core::SegmentsBoundedColoredArea>(&render_segments_area);
    register_drawable<core::ClosedShapeColoredArea>(&render_closed_shape_area);
    register_drawable<geometry::Polygon>(&render_polygon);
    register_drawable<core::CartesianGrid>(&render_cartesian_grid);
    register_drawable<core::PolarGrid>(&render_polar_grid);
}

bool Renderer::has_handler(std::type_index type) const {
    return handlers_.count(type) > 0;
}

bool Renderer::render(const core::Drawable& drawable, const CoordinateMapper& mapper) {
    auto it = handlers_.find(std::type_index(typeid(drawable)));
    if (it == handlers_.end()) {
        return false;
    }
    RenderContext context{*primitives_, mapper, style_, frame_labels_ ? &*frame_labels_ : nullptr};
    return it->second(drawable, context);
}

bool Renderer::render_cartesian(const core::CartesianGrid& grid, const CoordinateMapper& mapper) {
    return render(grid, mapper);
}

bool Renderer::render_polar(const core::PolarGrid& grid, const CoordinateMapper& mapper) {
    return render(grid, mapper);
}

void Renderer::begin_frame() {
    // A frame that was never closed is discarded.
    frame_labels_.emplace(label_layout_);
    on_begin_frame();
    primitives_->begin_frame(width_, height_);
    primitives_->clear(style_.color("background_color"));
}

void Renderer::end_frame() {
    if (!frame_labels_) {
        return;
    }
    primitives_->end_frame();
    on_end_frame();
    frame_labels_.reset();
}

void Renderer::clear() {
    primitives_->clear(style_.color("background_color"));
}

} // namespace mathud::rendering
