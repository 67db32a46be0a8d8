#pragma once

#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "core/drawables.hpp"

namespace mathud::tools {

struct RenderSceneConfig {
  std::optional<std::string> backend;     // Preferred backend id, defaults follow
  std::filesystem::path output = "scene.png";
  int width = 800;
  int height = 600;
  double zoom = 1.0;                      // Multiplies the 40 px per unit base scale
  bool polar = false;                     // Polar grid instead of the cartesian one
  bool quiet = false;
};

// Built-in demonstration drawables, in draw order.
std::vector<std::unique_ptr<core::Drawable>> build_demo_scene(bool polar);

// Returns a process exit code.
int run_render_scene(const RenderSceneConfig& config);

}  // namespace mathud::tools
