#pragma once

#include <map>
#include <memory>
#include <string>

#include "../core/logging.hpp"
#include "label_overlap_resolver.hpp"
#include "style.hpp"

namespace mathud::rendering {

class GpuDevice;

// Settings shared by every backend.
struct RendererConfig {
    int width = 800;                                        // Surface width in pixels
    int height = 600;                                       // Surface height in pixels
    std::map<std::string, StyleValue> style_overrides;      // Shadow Style::defaults()
    LabelLayoutConfig label_layout;                         // Per-frame label de-collision
    core::LogCallback log_callback;                         // Falls back to stdout/stderr
    std::shared_ptr<GpuDevice> gpu_device;                  // Enables the gpu backend when set
};

} // namespace mathud::rendering
