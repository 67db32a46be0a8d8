#pragma once

#include <optional>

#include "../core/drawables.hpp"
#include "closed_area.hpp"
#include "coordinate_mapper.hpp"

namespace mathud::rendering {

// Each builder projects its boundary to screen space and returns nothing when
// the input is degenerate or cannot be projected. None of them throw.

constexpr int kDefaultAreaSamples = 100;
constexpr int kMinShapeResolution = 8;

[[nodiscard]] std::optional<ClosedArea> build_functions_area(
    const core::FunctionsBoundedColoredArea& area, const CoordinateMapper& mapper);

[[nodiscard]] std::optional<ClosedArea> build_function_segment_area(
    const core::FunctionSegmentBoundedColoredArea& area, const CoordinateMapper& mapper,
    int num_points = kDefaultAreaSamples);

[[nodiscard]] std::optional<ClosedArea> build_segments_area(
    const core::SegmentsBoundedColoredArea& area, const CoordinateMapper& mapper);

[[nodiscard]] std::optional<ClosedArea> build_closed_shape_area(
    const core::ClosedShapeColoredArea& area, const CoordinateMapper& mapper);

// Evenly spaced abscissas covering [left, right], both ends included.
[[nodiscard]] std::vector<double> sample_abscissas(const core::Interval& domain, int count);

// True when `reverse` is `forward` walked backwards, i.e. the area is a
// single polygon whose loop was written out twice.
[[nodiscard]] bool paths_form_single_loop(const core::ScreenPath& forward,
                                          const core::ScreenPath& reverse,
                                          double tolerance = 1e-9);

} // namespace mathud::rendering
