#include "polygon.hpp"

#include <cmath>
#include <iostream>
#include <numbers>
#include <stdexcept>
#include <string>
#include <vector>

namespace mathud::geometry {

namespace polygon_tests {

using core::Point;
using core::Point2D;
using core::Segment;

std::vector<Point> regular_points(std::size_t sides, double radius = 5.0) {
    std::vector<Point> points;
    for (std::size_t i = 0; i < sides; ++i) {
        const double angle = 2.0 * std::numbers::pi * static_cast<double>(i) / static_cast<double>(sides);
        points.emplace_back("P" + std::to_string(i + 10), radius * std::cos(angle), radius * std::sin(angle));
    }
    return points;
}

std::vector<Segment> loop_segments(const std::vector<Point>& points) {
    std::vector<Segment> segments;
    for (std::size_t i = 0; i < points.size(); ++i) {
        segments.emplace_back(points[i], points[(i + 1) % points.size()]);
    }
    return segments;
}

PolygonKind kind_for(std::size_t sides) {
    switch (sides) {
        case 3: return PolygonKind::Triangle;
        case 4: return PolygonKind::Quadrilateral;
        case 5: return PolygonKind::Pentagon;
        case 6: return PolygonKind::Hexagon;
        case 7: return PolygonKind::Heptagon;
        case 8: return PolygonKind::Octagon;
        case 9: return PolygonKind::Nonagon;
        case 10: return PolygonKind::Decagon;
        default: return PolygonKind::Generic;
    }
}

template <typename Fn>
bool throws_invalid_argument(Fn&& fn) {
    try {
        fn();
    } catch (const std::invalid_argument&) {
        return true;
    }
    return false;
}

const std::vector<std::size_t> kTestedSideCounts{5, 6, 7, 8, 9, 10, 11, 15, 20};

bool test_regular_ngons_are_regular() {
    for (std::size_t sides : kTestedSideCounts) {
        Polygon polygon(kind_for(sides), loop_segments(regular_points(sides)));
        const auto flags = polygon.flags();
        if (!flags.regular || flags.irregular) {
            std::cerr << "Regular " << sides << "-gon was not classified as regular" << std::endl;
            return false;
        }
    }
    return true;
}

bool test_perturbed_vertex_is_irregular() {
    for (std::size_t sides : kTestedSideCounts) {
        auto points = regular_points(sides);
        points[1].x *= 1.15;
        Polygon polygon(kind_for(sides), loop_segments(points));
        if (polygon.is_regular() || !polygon.is_irregular()) {
            std::cerr << "Perturbed " << sides << "-gon was still regular" << std::endl;
            return false;
        }
    }
    return true;
}

bool test_flags_are_exclusive() {
    const std::vector<Point2D> kite{{0, 0}, {2, 1}, {0, 4}, {-2, 1}};
    const auto flags = classify_polygon(kite);
    return flags.regular != flags.irregular && flags.irregular;
}

bool test_wrong_side_count_is_rejected() {
    const auto hexagon_segments = loop_segments(regular_points(6));
    if (!throws_invalid_argument([&] { (void)Polygon(PolygonKind::Heptagon, hexagon_segments); })) {
        std::cerr << "Heptagon accepted six segments" << std::endl;
        return false;
    }
    if (!throws_invalid_argument([&] { (void)Polygon(PolygonKind::Pentagon, hexagon_segments); })) {
        std::cerr << "Pentagon accepted six segments" << std::endl;
        return false;
    }
    return true;
}

bool test_generic_minimum_side_count() {
    if (!throws_invalid_argument([] { (void)Polygon(PolygonKind::Generic, loop_segments(regular_points(10))); })) {
        std::cerr << "Generic polygon accepted ten sides" << std::endl;
        return false;
    }
    Polygon eleven(PolygonKind::Generic, loop_segments(regular_points(11)));
    return eleven.side_count() == 11 && !eleven.is_renderable();
}

bool test_open_chain_is_rejected() {
    auto points = regular_points(5);
    auto segments = loop_segments(points);
    segments.back() = Segment(points[4], Point("Z", 40.0, 40.0));
    return throws_invalid_argument([&] { (void)Polygon(PolygonKind::Pentagon, segments); });
}

bool test_coincident_vertices_are_rejected() {
    std::vector<Point> points{Point("A", 0, 0), Point("B", 1, 0), Point("C", 1, 0)};
    return throws_invalid_argument([&] { (void)Polygon(PolygonKind::Triangle, loop_segments(points)); });
}

bool test_segment_order_does_not_matter() {
    auto points = regular_points(7);
    auto segments = loop_segments(points);
    std::swap(segments[0], segments[4]);
    std::swap(segments[2], segments[6]);
    Polygon polygon(PolygonKind::Heptagon, segments);
    return polygon.side_count() == 7 && polygon.is_regular();
}

bool test_classification_tracks_moved_vertices() {
    Polygon polygon(PolygonKind::Hexagon, loop_segments(regular_points(6)));
    if (!polygon.is_regular()) {
        return false;
    }
    polygon.translate(3.0, -2.0);
    polygon.rotate(33.0);
    if (!polygon.is_regular()) {
        std::cerr << "Rigid motion changed regularity" << std::endl;
        return false;
    }
    return polygon.segments().size() == 6;
}

bool test_triangle_flags() {
    const auto right = classify_triangle({{0, 0}, {4, 0}, {0, 3}});
    if (!right.right || !right.scalene || right.isosceles) {
        std::cerr << "3-4-5 triangle flags are wrong" << std::endl;
        return false;
    }
    const double h = std::sqrt(3.0);
    const auto equilateral = classify_triangle({{0, 0}, {2, 0}, {1, h}});
    return equilateral.equilateral && equilateral.isosceles && !equilateral.scalene;
}

bool test_quadrilateral_flags() {
    const auto square = classify_quadrilateral({{0, 0}, {2, 0}, {2, 2}, {0, 2}});
    if (!square.square || !square.rectangle || !square.rhombus || !square.parallelogram) {
        std::cerr << "Square flags are wrong" << std::endl;
        return false;
    }
    const auto rectangle = classify_quadrilateral({{0, 0}, {4, 0}, {4, 2}, {0, 2}});
    if (rectangle.square || !rectangle.rectangle || rectangle.rhombus) {
        std::cerr << "Rectangle flags are wrong" << std::endl;
        return false;
    }
    const auto trapezoid = classify_quadrilateral({{0, 0}, {6, 0}, {4, 2}, {1, 2}});
    if (!trapezoid.trapezoid || trapezoid.parallelogram) {
        std::cerr << "Trapezoid flags are wrong" << std::endl;
        return false;
    }
    const auto kite = classify_quadrilateral({{0, 0}, {2, 1}, {0, 4}, {-2, 1}});
    return kite.kite && !kite.rhombus;
}

bool test_polygon_name_follows_loop() {
    std::vector<Point> points{Point("A", 0, 0), Point("B", 3, 0), Point("C", 0, 3)};
    Polygon triangle(PolygonKind::Triangle, loop_segments(points));
    return triangle.name() == "ABC" && std::string(triangle.class_name()) == "Triangle";
}

bool test_quadrilateral_irregular_flag() {
    const auto square = classify_quadrilateral({{0, 0}, {2, 0}, {2, 2}, {0, 2}});
    const auto rhombus = classify_quadrilateral({{0, 0}, {2, 0}, {3, std::sqrt(3.0)}, {1, std::sqrt(3.0)}});
    const auto trapezoid = classify_quadrilateral({{0, 0}, {6, 0}, {4, 2}, {1, 2}});
    const auto kite = classify_quadrilateral({{0, 0}, {2, 1}, {0, 4}, {-2, 1}});
    return !square.irregular && !rhombus.irregular && trapezoid.irregular && kite.irregular;
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"regular_ngons_are_regular", &test_regular_ngons_are_regular},
        {"perturbed_vertex_is_irregular", &test_perturbed_vertex_is_irregular},
        {"flags_are_exclusive", &test_flags_are_exclusive},
        {"wrong_side_count_is_rejected", &test_wrong_side_count_is_rejected},
        {"generic_minimum_side_count", &test_generic_minimum_side_count},
        {"open_chain_is_rejected", &test_open_chain_is_rejected},
        {"coincident_vertices_are_rejected", &test_coincident_vertices_are_rejected},
        {"segment_order_does_not_matter", &test_segment_order_does_not_matter},
        {"classification_tracks_moved_vertices", &test_classification_tracks_moved_vertices},
        {"triangle_flags", &test_triangle_flags},
        {"quadrilateral_flags", &test_quadrilateral_flags},
        {"polygon_name_follows_loop", &test_polygon_name_follows_loop},
        {"quadrilateral_irregular_flag", &test_quadrilateral_irregular_flag},
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

} // namespace polygon_tests

} // namespace mathud::geometry

int main() {
    if (mathud::geometry::polygon_tests::run_all_tests()) {
        std::cout << "All polygon tests passed" << std::endl;
        return 0;
    }

    std::cerr << "Polygon tests failed" << std::endl;
    return 1;
}
