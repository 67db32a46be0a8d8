#pragma once

#include <functional>
#include <memory>
#include <optional>
#include <typeindex>
#include <unordered_map>

#include "../core/drawables.hpp"
#include "coordinate_mapper.hpp"
#include "label_overlap_resolver.hpp"
#include "primitives.hpp"
#include "renderer_config.hpp"
#include "style.hpp"

namespace mathud::rendering {

// Everything a draw handler may touch for one call.
struct RenderContext {
    RendererPrimitives& primitives;
    const CoordinateMapper& mapper;
    const Style& style;
    LabelOverlapResolver* labels;   // Null outside a frame
};

// Type-keyed dispatcher over a primitive surface. Backends derive from it to
// own their surface and export what was drawn.
class Renderer {
public:
    using Handler = std::function<bool(const core::Drawable&, RenderContext&)>;

    Renderer(std::unique_ptr<RendererPrimitives> primitives, const RendererConfig& config);
    virtual ~Renderer();

    Renderer(const Renderer&) = delete;
    Renderer& operator=(const Renderer&) = delete;

    [[nodiscard]] virtual const char* backend_id() const { return "custom"; }

    // Registry. A second registration for the same type replaces the first.
    void register_handler(std::type_index type, Handler handler);

    template <typename T>
    void register_drawable(std::function<bool(const T&, RenderContext&)> handler) {
        register_handler(std::type_index(typeid(T)),
                         [handler = std::move(handler)](const core::Drawable& drawable, RenderContext& context) {
                             return handler(static_cast<const T&>(drawable), context);
                         });
    }

    void register_default_drawables();
    [[nodiscard]] bool has_handler(std::type_index type) const;
    [[nodiscard]] std::size_t handler_count() const { return handlers_.size(); }

    // False when no handler is registered or the handler could not draw.
    bool render(const core::Drawable& drawable, const CoordinateMapper& mapper);
    bool render_cartesian(const core::CartesianGrid& grid, const CoordinateMapper& mapper);
    bool render_polar(const core::PolarGrid& grid, const CoordinateMapper& mapper);

    // Frame lifecycle
    void begin_frame();
    void end_frame();
    void clear();
    [[nodiscard]] bool in_frame() const { return frame_labels_.has_value(); }

    // Getters
    [[nodiscard]] const Style& style() const { return style_; }
    void set_style(Style style) { style_ = std::move(style); }
    [[nodiscard]] int width() const { return width_; }
    [[nodiscard]] int height() const { return height_; }
    [[nodiscard]] RendererPrimitives& primitives() { return *primitives_; }
    [[nodiscard]] const RendererPrimitives& primitives() const { return *primitives_; }
    [[nodiscard]] const core::LogCallback& log_callback() const { return log_callback_; }

protected:
    // Hooks around the primitive surface's own frame handling.
    virtual void on_begin_frame() {}
    virtual void on_end_frame() {}

private:
    std::unique_ptr<RendererPrimitives> primitives_;
    std::unordered_map<std::type_index, Handler> handlers_;
    Style style_;
    LabelLayoutConfig label_layout_;
    core::LogCallback log_callback_;
    std::optional<LabelOverlapResolver> frame_labels_;
    int width_;
    int height_;
};

} // namespace mathud::rendering
