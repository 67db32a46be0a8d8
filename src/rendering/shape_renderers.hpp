#pragma once

#include <string>
#include <vector>

#include "../core/drawables.hpp"
#include "../geometry/polygon.hpp"
#include "renderer.hpp"

namespace mathud::rendering {

// Draw handlers registered by Renderer::register_default_drawables(). Each
// returns false without emitting anything when its geometry cannot be
// projected.
bool render_point(const core::Point& point, RenderContext& context);
bool render_segment(const core::Segment& segment, RenderContext& context);
bool render_vector(const core::Vector& vector, RenderContext& context);
bool render_circle(const core::Circle& circle, RenderContext& context);
bool render_ellipse(const core::Ellipse& ellipse, RenderContext& context);
bool render_angle(const core::Angle& angle, RenderContext& context);
bool render_function(const core::Function& function, RenderContext& context);
bool render_label(const core::Label& label, RenderContext& context);
bool render_functions_area(const core::FunctionsBoundedColoredArea& area, RenderContext& context);
bool render_function_segment_area(const core::FunctionSegmentBoundedColoredArea& area, RenderContext& context);
bool render_segments_area(const core::SegmentsBoundedColoredArea& area, RenderContext& context);
bool render_closed_shape_area(const core::ClosedShapeColoredArea& area, RenderContext& context);
// Polygons that are not renderable are drawn through their segments instead.
bool render_polygon(const geometry::Polygon& polygon, RenderContext& context);
bool render_cartesian_grid(const core::CartesianGrid& grid, RenderContext& context);
bool render_polar_grid(const core::PolarGrid& grid, RenderContext& context);

// Helpers shared by the handlers

// Drawable colour, or the style entry `style_key` when the drawable has none.
[[nodiscard]] Color resolve_color(const std::string& own_color, const Style& style, const std::string& style_key);

// Rounds to `precision` decimals and drops trailing zeros ("2.5", "-3", "0").
[[nodiscard]] std::string format_number(double value, int precision);

// Smallest 1, 2 or 5 x 10^k that is >= raw_spacing.
// Throws std::invalid_argument for a non-finite or non-positive spacing.
[[nodiscard]] double nice_grid_spacing(double raw_spacing);

// Decimals needed to tell adjacent multiples of `spacing` apart.
[[nodiscard]] int tick_precision(double spacing);

// Tick label text; switches to "1.5e-4" style for tiny, huge or very precise values.
[[nodiscard]] std::string format_tick_value(double value, int precision);

// Screen polylines of a sampled function, split wherever a sample is missing
// or the curve jumps by more than the canvas height between samples.
[[nodiscard]] std::vector<core::ScreenPath> function_screen_paths(const core::Function& function,
                                                                  const CoordinateMapper& mapper,
                                                                  int sample_count);

// Draws lines of text starting at `anchor` (first baseline). Inside a frame
// the block is moved vertically away from labels already placed there.
void draw_label_block(RenderContext& context, const std::string& id,
                      const std::vector<std::string>& lines, const core::ScreenPoint& anchor,
                      const FontStyle& font, const Color& color, double rotation_rad = 0.0);

} // namespace mathud::rendering
