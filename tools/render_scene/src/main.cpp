#include "render_scene/render_scene.hpp"

#include <iostream>
#include <stdexcept>
#include <string>
#include <string_view>

namespace {

void print_usage() {
  std::cout << "Usage: mathud_render [options]\n"
               "\n"
               "Options:\n"
               "  -b, --backend <id>        canvas2d, svg or gpu (default: from output extension)\n"
               "  -o, --output <path>       Output file, .png or .svg (default: scene.png)\n"
               "  -W, --width <px>          Surface width (default: 800)\n"
               "  -H, --height <px>         Surface height (default: 600)\n"
               "  -z, --zoom <factor>       Zoom relative to 40 px per unit (default: 1)\n"
               "  -p, --polar               Draw a polar grid instead of the cartesian one\n"
               "  -q, --quiet               Suppress progress logging\n"
               "  -h, --help                Show this help text\n";
}

bool parse_int(std::string_view name, const char* text, int& out) {
  try {
    std::size_t used = 0;
    const int value = std::stoi(text, &used);
    if (used != std::string_view(text).size() || value <= 0) {
      throw std::invalid_argument(text);
    }
    out = value;
    return true;
  } catch (const std::exception&) {
    std::cerr << "[mathud_render] Invalid value for " << name << ": " << text << std::endl;
    return false;
  }
}

bool parse_double(std::string_view name, const char* text, double& out) {
  try {
    std::size_t used = 0;
    const double value = std::stod(text, &used);
    if (used != std::string_view(text).size() || !(value > 0.0)) {
      throw std::invalid_argument(text);
    }
    out = value;
    return true;
  } catch (const std::exception&) {
    std::cerr << "[mathud_render] Invalid value for " << name << ": " << text << std::endl;
    return false;
  }
}

}  // namespace

int main(int argc, char* argv[]) {
  mathud::tools::RenderSceneConfig config;

  for (int i = 1; i < argc; ++i) {
    const std::string_view arg(argv[i]);
    if (arg == "-h" || arg == "--help") {
      print_usage();
      return 0;
    }
    const bool takes_value = arg == "-b" || arg == "--backend" || arg == "-o" || arg == "--output" ||
                             arg == "-W" || arg == "--width" || arg == "-H" || arg == "--height" ||
                             arg == "-z" || arg == "--zoom";
    if (takes_value && i + 1 >= argc) {
      std::cerr << "[mathud_render] Missing value for " << arg << std::endl;
      return 1;
    }
    if (arg == "-b" || arg == "--backend") {
      config.backend = std::string(argv[++i]);
    } else if (arg == "-o" || arg == "--output") {
      config.output = argv[++i];
    } else if (arg == "-W" || arg == "--width") {
      if (!parse_int("--width", argv[++i], config.width)) return 1;
    } else if (arg == "-H" || arg == "--height") {
      if (!parse_int("--height", argv[++i], config.height)) return 1;
    } else if (arg == "-z" || arg == "--zoom") {
      if (!parse_double("--zoom", argv[++i], config.zoom)) return 1;
    } else if (arg == "-p" || arg == "--polar") {
      config.polar = true;
    } else if (arg == "-q" || arg == "--quiet") {
      config.quiet = true;
    } else {
      std::cerr << "[mathud_render] Unrecognized argument: " << arg << "\n";
      print_usage();
      return 1;
    }
  }

  return mathud::tools::run_render_scene(config);
}
