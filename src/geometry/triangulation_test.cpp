#include "triangulation.hpp"

#include <cmath>
#include <iostream>
#include <numbers>
#include <vector>

namespace mathud::geometry {

namespace triangulation_tests {

using core::Point2D;

double triangles_area(const std::vector<Point2D>& loop, const std::vector<Triangle>& triangles) {
    double total = 0.0;
    for (const auto& t : triangles) {
        total += std::abs(signed_area2({loop[t[0]], loop[t[1]], loop[t[2]]})) / 2.0;
    }
    return total;
}

bool test_square_gives_two_triangles() {
    const std::vector<Point2D> square{{0, 0}, {1, 0}, {1, 1}, {0, 1}};
    const auto triangles = triangulate_polygon(square);
    return triangles.size() == 2 && std::abs(triangles_area(square, triangles) - 1.0) < 1e-12;
}

bool test_concave_polygon_area_is_preserved() {
    // L shape, area 3.
    const std::vector<Point2D> shape{{0, 0}, {2, 0}, {2, 1}, {1, 1}, {1, 2}, {0, 2}};
    const auto triangles = triangulate_polygon(shape);
    return triangles.size() == 4 && std::abs(triangles_area(shape, triangles) - 3.0) < 1e-12;
}

bool test_clockwise_input_is_accepted() {
    const std::vector<Point2D> shape{{0, 2}, {1, 2}, {1, 1}, {2, 1}, {2, 0}, {0, 0}};
    const auto triangles = triangulate_polygon(shape);
    return triangles.size() == 4 && std::abs(triangles_area(shape, triangles) - 3.0) < 1e-12;
}

bool test_closing_vertex_is_ignored() {
    const std::vector<Point2D> closed{{0, 0}, {4, 0}, {0, 3}, {0, 0}};
    const auto triangles = triangulate_polygon(closed);
    return triangles.size() == 1 && std::abs(triangles_area(closed, triangles) - 6.0) < 1e-12;
}

bool test_regular_polygon_fan_count() {
    std::vector<Point2D> loop;
    for (int i = 0; i < 40; ++i) {
        const double angle = 2.0 * std::numbers::pi * i / 40.0;
        loop.emplace_back(std::cos(angle), std::sin(angle));
    }
    return triangulate_polygon(loop).size() == 38;
}

bool test_degenerate_input_is_empty() {
    return triangulate_polygon({}).empty() && triangulate_polygon({{0, 0}, {1, 1}}).empty();
}

bool test_self_intersecting_input_still_covers() {
    // Bow tie: no valid ear clipping, fan fallback keeps n - 2 triangles.
    const std::vector<Point2D> bow_tie{{0, 0}, {2, 2}, {2, 0}, {0, 2}};
    return triangulate_polygon(bow_tie).size() == 2;
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"square_gives_two_triangles", &test_square_gives_two_triangles},
        {"concave_polygon_area_is_preserved", &test_concave_polygon_area_is_preserved},
        {"clockwise_input_is_accepted", &test_clockwise_input_is_accepted},
        {"closing_vertex_is_ignored", &test_closing_vertex_is_ignored},
        {"regular_polygon_fan_count", &test_regular_polygon_fan_count},
        {"degenerate_input_is_empty", &test_degenerate_input_is_empty},
        {"self_intersecting_input_still_covers", &test_self_intersecting_input_still_covers},
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

} // namespace triangulation_tests

} // namespace mathud::geometry

int main() {
    if (mathud::geometry::triangulation_tests::run_all_tests()) {
        std::cout << "All triangulation tests passed" << std::endl;
        return 0;
    }

    std::cerr << "Triangulation tests failed" << std::endl;
    return 1;
}
