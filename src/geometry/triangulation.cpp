#include "triangulation.hpp"

#include <cmath>
#include <iterator>
#include <list>

namespace mathud::geometry {

namespace {

constexpr double kEpsilon = 1e-12;

double cross(const core::Point2D& a, const core::Point2D& b, const core::Point2D& c) {
    return (b.x - a.x) * (c.y - a.y) - (b.y - a.y) * (c.x - a.x);
}

bool point_in_triangle(const core::Point2D& p, const core::Point2D& a,
                       const core::Point2D& b, const core::Point2D& c) {
    const double d1 = cross(a, b, p);
    const double d2 = cross(b, c, p);
    const double d3 = cross(c, a, p);
    const bool has_negative = d1 < -kEpsilon || d2 < -kEpsilon || d3 < -kEpsilon;
    const bool has_positive = d1 > kEpsilon || d2 > kEpsilon || d3 > kEpsilon;
    return !(has_negative && has_positive);
}

} // namespace

double signed_area2(const std::vector<core::Point2D>& loop) {
    double area = 0.0;
    const std::size_t n = loop.size();
    for (std::size_t i = 0; i < n; ++i) {
        const auto& a = loop[i];
        const auto& b = loop[(i + 1) % n];
        area += a.x * b.y - b.x * a.y;
    }
    return area;
}

std::vector<Triangle> triangulate_polygon(const std::vector<core::Point2D>& loop) {
    std::vector<Triangle> triangles;
    if (loop.size() < 3) {
        return triangles;
    }

    // Drop a closing vertex equal to the first one.
    std::size_t count = loop.size();
    if (std::abs(loop.front().x - loop.back().x) <= kEpsilon &&
        std::abs(loop.front().y - loop.back().y) <= kEpsilon) {
        --count;
    }
    if (count < 3) {
        return triangles;
    }

    std::list<std::size_t> remaining;
    for (std::size_t i = 0; i < count; ++i) {
        remaining.push_back(i);
    }
    const double orientation = signed_area2(loop) >= 0.0 ? 1.0 : -1.0;
    triangles.reserve(count - 2);

    auto next_of = [&remaining](std::list<std::size_t>::iterator it) {
        ++it;
        return it == remaining.end() ? remaining.begin() : it;
    };
    auto prev_of = [&remaining](std::list<std::size_t>::iterator it) {
        if (it == remaining.begin()) {
            it = remaining.end();
        }
        return --it;
    };

    auto current = remaining.begin();
    std::size_t attempts = 0;
    while (remaining.size() > 3) {
        const auto prev = prev_of(current);
        const auto next = next_of(current);
        const auto& a = loop[*prev];
        const auto& b = loop[*current];
        const auto& c = loop[*next];

        bool is_ear = cross(a, b, c) * orientation > kEpsilon;
        if (is_ear) {
            for (auto it = remaining.begin(); it != remaining.end(); ++it) {
                if (it == prev || it == current || it == next) {
                    continue;
                }
                if (point_in_triangle(loop[*it], a, b, c)) {
                    is_ear = false;
                    break;
                }
            }
        }

        if (is_ear) {
            triangles.push_back({*prev, *current, *next});
            current = remaining.erase(current);
            if (current == remaining.end()) {
                current = remaining.begin();
            }
            attempts = 0;
            continue;
        }

        current = next;
        if (++attempts > remaining.size()) {
            // No ear left, so the outline crosses itself.
            break;
        }
    }

    if (remaining.size() >= 3) {
        auto anchor = remaining.begin();
        auto second = std::next(anchor);
        for (auto third = std::next(second); third != remaining.end(); ++second, ++third) {
            triangles.push_back({*anchor, *second, *third});
        }
    }
    return triangles;
}

} // namespace mathud::geometry
