#include "coordinate_mapper.hpp"

#include <cmath>
#include <iostream>
#include <limits>
#include <stdexcept>

namespace mathud::rendering {

namespace coordinate_mapper_tests {

bool near(double a, double b, double tolerance = 1e-9) {
    return std::abs(a - b) <= tolerance;
}

bool test_origin_maps_to_canvas_center() {
    CoordinateMapper mapper(800, 600);
    const auto screen = mapper.math_to_screen(0.0, 0.0);
    return screen && near(screen->x, 400.0) && near(screen->y, 300.0);
}

bool test_y_axis_is_flipped() {
    CoordinateMapper mapper(800, 600);
    mapper.set_scale_factor(10.0);
    const auto screen = mapper.math_to_screen(2.0, 3.0);
    return screen && near(screen->x, 420.0) && near(screen->y, 270.0);
}

bool test_pan_offsets_screen_position() {
    CoordinateMapper mapper(800, 600);
    mapper.apply_pan(15.0, -5.0);
    const auto screen = mapper.math_to_screen(1.0, 1.0);
    return screen && near(screen->x, 416.0) && near(screen->y, 294.0);
}

bool test_invalid_scale_is_coerced() {
    CoordinateMapper mapper(200, 200);
    mapper.set_scale_factor(-4.0);
    if (!near(mapper.scale_factor(), 1.0)) {
        std::cerr << "Negative scale was not coerced" << std::endl;
        return false;
    }
    mapper.set_scale_factor(std::numeric_limits<double>::quiet_NaN());
    if (!near(mapper.scale_factor(), 1.0)) {
        std::cerr << "NaN scale was not coerced" << std::endl;
        return false;
    }
    mapper.set_scale_factor(0.0);
    const auto length = mapper.scale_value(3.0);
    return length && near(*length, 3.0);
}

bool test_non_finite_input_is_absent() {
    CoordinateMapper mapper(200, 200);
    const double inf = std::numeric_limits<double>::infinity();
    return !mapper.math_to_screen(inf, 0.0) &&
           !mapper.math_to_screen(0.0, std::numeric_limits<double>::quiet_NaN()) &&
           !mapper.scale_value(inf) &&
           !mapper.screen_to_math(inf, 1.0);
}

bool test_screen_to_math_inverts_projection() {
    CoordinateMapper mapper(640, 480);
    mapper.set_scale_factor(37.5);
    mapper.apply_pan(-12.0, 40.0);
    const auto screen = mapper.math_to_screen(-3.25, 7.5);
    if (!screen) {
        return false;
    }
    const auto math = mapper.screen_to_math(screen->x, screen->y);
    return math && near(math->x, -3.25) && near(math->y, 7.5);
}

bool test_zoom_keeps_anchor_fixed() {
    CoordinateMapper mapper(800, 600);
    mapper.set_scale_factor(20.0);
    const core::ScreenPoint anchor{600.0, 150.0};
    const auto before = mapper.screen_to_math(anchor.x, anchor.y);
    mapper.apply_zoom(2.5, anchor);
    const auto after = mapper.screen_to_math(anchor.x, anchor.y);
    return before && after && near(mapper.scale_factor(), 50.0) &&
           near(before->x, after->x, 1e-9) && near(before->y, after->y, 1e-9);
}

bool test_zoom_has_a_floor() {
    CoordinateMapper mapper(800, 600);
    for (int i = 0; i < 200; ++i) {
        mapper.apply_zoom_step(1);
    }
    return near(mapper.scale_factor(), 0.01);
}

bool test_zoom_step_direction() {
    CoordinateMapper mapper(800, 600);
    mapper.apply_zoom_step(-1);
    if (!near(mapper.scale_factor(), 1.1)) {
        std::cerr << "Zoom in step is wrong: " << mapper.scale_factor() << std::endl;
        return false;
    }
    mapper.reset_transformations();
    mapper.apply_zoom_step(1);
    return near(mapper.scale_factor(), 0.9);
}

bool test_visible_bounds_round_trip() {
    CoordinateMapper mapper(800, 400);
    mapper.set_visible_bounds(-10.0, 10.0, 5.0, -5.0);
    const auto bounds = mapper.visible_bounds();
    return near(mapper.scale_factor(), 40.0) &&
           near(bounds.left, -10.0) && near(bounds.right, 10.0) &&
           near(bounds.top, 5.0) && near(bounds.bottom, -5.0);
}

bool test_visible_bounds_keep_aspect_ratio() {
    CoordinateMapper mapper(800, 400);
    mapper.set_visible_bounds(0.0, 10.0, 10.0, 0.0);
    const auto bounds = mapper.visible_bounds();
    // Height governs, the x range widens around the centre.
    return near(mapper.scale_factor(), 40.0) && near(bounds.left, -5.0) &&
           near(bounds.right, 15.0) && near(bounds.top, 10.0) && near(bounds.bottom, 0.0);
}

bool test_inverted_visible_bounds_throw() {
    CoordinateMapper mapper(800, 400);
    try {
        mapper.set_visible_bounds(5.0, -5.0, 1.0, -1.0);
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

bool test_resize_recenters_origin() {
    CoordinateMapper mapper(800, 600);
    mapper.resize(1000, 500);
    const auto screen = mapper.math_to_screen(0.0, 0.0);
    return screen && near(screen->x, 500.0) && near(screen->y, 250.0);
}

bool test_reference_scale_snapshot() {
    CoordinateMapper mapper(800, 600);
    mapper.set_scale_factor(4.0);
    mapper.snapshot_reference_scale();
    mapper.apply_zoom(0.5);
    return near(mapper.reference_scale_factor(), 4.0) && near(mapper.scale_factor(), 2.0);
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"origin_maps_to_canvas_center", &test_origin_maps_to_canvas_center},
        {"y_axis_is_flipped", &test_y_axis_is_flipped},
        {"pan_offsets_screen_position", &test_pan_offsets_screen_position},
        {"invalid_scale_is_coerced", &test_invalid_scale_is_coerced},
        {"non_finite_input_is_absent", &test_non_finite_input_is_absent},
        {"screen_to_math_inverts_projection", &test_screen_to_math_inverts_projection},
        {"zoom_keeps_anchor_fixed", &test_zoom_keeps_anchor_fixed},
        {"zoom_has_a_floor", &test_zoom_has_a_floor},
        {"zoom_step_direction", &test_zoom_step_direction},
        {"visible_bounds_round_trip", &test_visible_bounds_round_trip},
        {"visible_bounds_keep_aspect_ratio", &test_visible_bounds_keep_aspect_ratio},
        {"inverted_visible_bounds_throw", &test_inverted_visible_bounds_throw},
        {"resize_recenters_origin", &test_resize_recenters_origin},
        {"reference_scale_snapshot", &test_reference_scale_snapshot},
    };

    bool all_passed = true;

    for (const auto& [name, fn] : tests) {
        if (!fn()) {
            std::cerr << "Test failed: " << name << std::endl;
            all_passed = false;
        }
    }

    return all_passed;
}

} // namespace coordinate_mapper_tests

} // namespace mathud::rendering

int main() {
    if (mathud::rendering::coordinate_mapper_tests::run_all_tests()) {
        std::cout << "All coordinate mapper tests passed" << std::endl;
        return 0;
    }

    std::cerr << "Coordinate mapper tests failed" << std::endl;
    return 1;
}
