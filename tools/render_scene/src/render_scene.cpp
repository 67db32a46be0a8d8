#include "render_scene/render_scene.hpp"

#include <cmath>
#include <exception>
#include <iostream>
#include <numbers>
#include <stdexcept>

#include "geometry/polygon.hpp"
#include "rendering/canvas_renderer.hpp"
#include "rendering/coordinate_mapper.hpp"
#include "rendering/renderer_factory.hpp"
#include "rendering/svg_renderer.hpp"

namespace mathud::tools {

namespace {

constexpr double kBaseScale = 40.0;

using core::Point;
using core::Segment;

std::optional<std::string> backend_for_output(const std::filesystem::path& output) {
  if (output.extension() == ".svg") {
    return std::string(rendering::kSvgBackend);
  }
  if (output.extension() == ".png") {
    return std::string(rendering::kCanvasBackend);
  }
  return std::nullopt;
}

std::vector<core::Segment> hexagon_segments(double cx, double cy, double radius) {
  std::vector<Point> points;
  for (int i = 0; i < 6; ++i) {
    const double angle = std::numbers::pi / 3.0 * i;
    points.emplace_back(std::string(1, static_cast<char>('P' + i)), cx + radius * std::cos(angle),
                        cy + radius * std::sin(angle), "purple");
  }
  std::vector<Segment> segments;
  for (std::size_t i = 0; i < points.size(); ++i) {
    segments.emplace_back(points[i], points[(i + 1) % points.size()], "purple");
  }
  return segments;
}

}  // namespace

std::vector<std::unique_ptr<core::Drawable>> build_demo_scene(bool polar) {
  std::vector<std::unique_ptr<core::Drawable>> scene;

  if (polar) {
    scene.push_back(std::make_unique<core::PolarGrid>());
  } else {
    scene.push_back(std::make_unique<core::CartesianGrid>());
  }

  auto wave = std::make_shared<core::Function>(
      "f", [](double x) { return 2.0 * std::sin(x); }, std::nullopt, "red");
  auto bowl = std::make_shared<core::Function>(
      "g", [](double x) { return 0.25 * x * x - 3.0; }, core::Interval{-6.0, 6.0}, "green");
  auto hyperbola = std::make_shared<core::Function>(
      "h", [](double x) { return 1.0 / x; }, std::nullopt, "darkorange");

  auto between = std::make_unique<core::FunctionsBoundedColoredArea>("f_g_area", wave, bowl, "lightblue");
  between->left_bound = -2.0;
  between->right_bound = 2.0;
  scene.push_back(std::move(between));

  const Point a("A", -6.0, 1.0);
  const Point b("B", -3.0, 4.0);
  const Point c("C", -1.0, 1.5);
  const Segment ab(a, b, "teal");
  const Segment under(Point("D", 3.0, 3.0), Point("E", 6.0, 5.0), "gray");

  auto under_area = std::make_unique<core::SegmentsBoundedColoredArea>("under_de", under);
  under_area->opacity = 0.2;
  scene.push_back(std::move(under_area));

  scene.push_back(std::make_unique<core::FunctionSegmentBoundedColoredArea>(
      "wave_chord", wave, Segment(Point("F", 3.5, -1.0), Point("G", 5.5, -1.0)), "khaki"));

  const core::Circle circle("c1", Point("O1", 7.0, -3.0), 1.5, "navy");
  scene.push_back(std::make_unique<core::ClosedShapeColoredArea>(
      "cap", circle, Segment(Point("Q1", 5.5, -2.5), Point("Q2", 8.5, -2.5)), "salmon"));

  scene.push_back(std::make_unique<core::Function>(*wave));
  scene.push_back(std::make_unique<core::Function>(*bowl));
  scene.push_back(std::make_unique<core::Function>(*hyperbola));

  scene.push_back(std::make_unique<Segment>(ab));
  scene.push_back(std::make_unique<Segment>(under));
  scene.push_back(std::make_unique<core::Vector>(c, Point("V", 1.0, 3.0), "crimson"));
  scene.push_back(std::make_unique<core::Circle>(circle));
  scene.push_back(std::make_unique<core::Ellipse>("e1", Point("O2", -6.0, -4.0), 2.0, 1.0, 30.0, "olive"));
  scene.push_back(std::make_unique<core::Angle>("angle_bac", a, c, b));
  scene.push_back(std::make_unique<geometry::Polygon>(geometry::PolygonKind::Hexagon,
                                                      hexagon_segments(-2.0, -4.5, 1.2), true, "purple"));

  scene.push_back(std::make_unique<Point>(a));
  scene.push_back(std::make_unique<Point>(b));
  scene.push_back(std::make_unique<Point>(c));

  auto title = std::make_unique<core::Label>("title", core::Point2D{-9.0, 7.0}, "y = 2 sin(x)\ny = x^2/4 - 3");
  title->reference_scale_factor = kBaseScale;
  scene.push_back(std::move(title));

  return scene;
}

int run_render_scene(const RenderSceneConfig& config) {
  rendering::RendererConfig renderer_config;
  renderer_config.width = config.width;
  renderer_config.height = config.height;
  if (config.quiet) {
    renderer_config.log_callback = [](const std::string& message, bool is_error) {
      if (is_error) {
        std::cerr << "[mathud_render] " << message << std::endl;
      }
    };
  }

  const auto factory = rendering::RendererFactory::with_default_backends(renderer_config);
  const auto preferred = config.backend ? config.backend : backend_for_output(config.output);
  auto renderer = factory.create_renderer(preferred);
  if (!renderer) {
    std::cerr << "[mathud_render] No backend could be created" << std::endl;
    return 1;
  }

  rendering::CoordinateMapper mapper(config.width, config.height);
  mapper.set_scale_factor(kBaseScale);
  mapper.snapshot_reference_scale();
  mapper.apply_zoom(config.zoom);

  std::vector<std::unique_ptr<core::Drawable>> scene;
  try {
    scene = build_demo_scene(config.polar);
  } catch (const std::invalid_argument& e) {
    std::cerr << "[mathud_render] Invalid scene: " << e.what() << std::endl;
    return 1;
  }

  renderer->begin_frame();
  std::size_t skipped = 0;
  for (const auto& drawable : scene) {
    if (!renderer->render(*drawable, mapper)) {
      ++skipped;
    }
  }
  renderer->end_frame();

  if (!config.quiet) {
    std::cout << "[mathud_render] Drew " << scene.size() - skipped << " of " << scene.size()
              << " drawables with the " << renderer->backend_id() << " backend" << std::endl;
  }

  try {
    if (const auto* canvas = dynamic_cast<const rendering::CanvasRenderer*>(renderer.get())) {
      canvas->write_png(config.output.string());
    } else if (const auto* svg = dynamic_cast<const rendering::SvgRenderer*>(renderer.get())) {
      svg->write_svg(config.output.string());
    } else {
      std::cerr << "[mathud_render] Backend " << renderer->backend_id() << " cannot write files" << std::endl;
      return 1;
    }
  } catch (const std::exception& e) {
    std::cerr << "[mathud_render] " << e.what() << std::endl;
    return 1;
  }

  if (!config.quiet) {
    std::cout << "[mathud_render] Wrote " << config.output << std::endl;
  }
  return 0;
}

}  // namespace mathud::tools
