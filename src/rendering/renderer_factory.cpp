#include "renderer_factory.hpp"

#include <algorithm>
#include <exception>

#include "canvas_renderer.hpp"
#include "gpu_renderer.hpp"
#include "svg_renderer.hpp"

namespace mathud::rendering {

namespace {

constexpr const char* kComponent = "RendererFactory";

} // namespace

std::optional<std::string> parse_backend_id(const std::string& text) {
    if (text == kCanvasBackend || text == kSvgBackend || text == kGpuBackend) {
        return text;
    }
    if (text == "webgl") {
        return std::string(kGpuBackend);
    }
    return std::nullopt;
}

std::vector<std::string> backend_preference_chain(const std::optional<std::string>& preferred) {
    std::vector<std::string> chain;
    if (preferred) {
        if (auto id = parse_backend_id(*preferred)) {
            chain.push_back(*id);
        }
    }
    for (const char* fallback : {kCanvasBackend, kSvgBackend, kGpuBackend}) {
        if (std::find(chain.begin(), chain.end(), fallback) == chain.end()) {
            chain.emplace_back(fallback);
        }
    }
    return chain;
}

RendererFactory::RendererFactory(core::LogCallback log_callback)
    : log_callback_(std::move(log_callback)) {}

RendererFactory RendererFactory::with_default_backends(const RendererConfig& config) {
    RendererFactory factory(config.log_callback);
    factory.register_backend(kCanvasBackend, [config]() -> std::unique_ptr<Renderer> {
        auto renderer = std::make_unique<CanvasRenderer>(config);
        renderer->register_default_drawables();
        return renderer;
    });
    factory.register_backend(kSvgBackend, [config]() -> std::unique_ptr<Renderer> {
        auto renderer = std::make_unique<SvgRenderer>(config);
        renderer->register_default_drawables();
        return renderer;
    });
    if (config.gpu_device) {
        factory.register_backend(kGpuBackend, [config]() -> std::unique_ptr<Renderer> {
            auto renderer = std::make_unique<GpuRenderer>(config);
            renderer->register_default_drawables();
            return renderer;
        });
    }
    return factory;
}

void RendererFactory::register_backend(const std::string& id, Constructor constructor) {
    constructors_[id] = std::move(constructor);
}

bool RendererFactory::has_backend(const std::string& id) const {
    return constructors_.count(id) > 0;
}

std::unique_ptr<Renderer> RendererFactory::create_renderer(const std::optional<std::string>& preferred) const {
    if (preferred && !parse_backend_id(*preferred)) {
        core::log_message(log_callback_, kComponent, "Unknown backend '" + *preferred + "', using defaults");
    }

    for (const auto& id : backend_preference_chain(preferred)) {
        auto it = constructors_.find(id);
        if (it == constructors_.end() || !it->second) {
            continue;
        }
        try {
            auto renderer = it->second();
            if (renderer) {
                core::log_message(log_callback_, kComponent, "Using " + id + " backend");
                return renderer;
            }
            core::log_message(log_callback_, kComponent, "Backend " + id + " returned no renderer", true);
        } catch (const std::exception& e) {
            core::log_message(log_callback_, kComponent, "Backend " + id + " failed: " + e.what(), true);
        } catch (...) {
            core::log_message(log_callback_, kComponent, "Backend " + id + " failed with an unknown error", true);
        }
    }

    core::log_message(log_callback_, kComponent, "No rendering backend available", true);
    return nullptr;
}

} // namespace mathud::rendering
