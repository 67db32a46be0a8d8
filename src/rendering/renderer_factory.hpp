#pragma once

#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "../core/logging.hpp"
#include "renderer.hpp"
#include "renderer_config.hpp"

namespace mathud::rendering {

inline constexpr const char* kCanvasBackend = "canvas2d";
inline constexpr const char* kSvgBackend = "svg";
inline constexpr const char* kGpuBackend = "gpu";

// Canonical backend id for `text`, or absent when it names no backend.
// "webgl" is accepted for the gpu backend.
[[nodiscard]] std::optional<std::string> parse_backend_id(const std::string& text);

// Order in which backends are attempted: the preferred one first, then the
// defaults, each id once.
[[nodiscard]] std::vector<std::string> backend_preference_chain(const std::optional<std::string>& preferred);

// Builds the first backend that can be constructed.
class RendererFactory {
public:
    using Constructor = std::function<std::unique_ptr<Renderer>()>;

    explicit RendererFactory(core::LogCallback log_callback = nullptr);

    // Canvas and svg always, gpu only when the config carries a device.
    [[nodiscard]] static RendererFactory with_default_backends(const RendererConfig& config);

    void register_backend(const std::string& id, Constructor constructor);
    [[nodiscard]] bool has_backend(const std::string& id) const;

    // Null when every backend in the chain failed or was missing.
    [[nodiscard]] std::unique_ptr<Renderer> create_renderer(const std::optional<std::string>& preferred = std::nullopt) const;

private:
    std::map<std::string, Constructor> constructors_;
    core::LogCallback log_callback_;
};

} // namespace mathud::rendering
