#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <vector>

namespace mathud::core {

// Math-space position.
struct Point2D {
    double x = 0.0;
    double y = 0.0;
    Point2D() = default;
    Point2D(double x_val, double y_val) : x(x_val), y(y_val) {}

    [[nodiscard]] bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y);
    }
};

// Device pixel position produced by the coordinate mapper.
struct ScreenPoint {
    double x = 0.0;
    double y = 0.0;
    ScreenPoint() = default;
    ScreenPoint(double x_val, double y_val) : x(x_val), y(y_val) {}

    [[nodiscard]] bool is_finite() const {
        return std::isfinite(x) && std::isfinite(y);
    }
};

using ScreenPath = std::vector<ScreenPoint>;

// Math-space rectangle, top > bottom.
struct MathBounds {
    double left = 0.0;
    double right = 0.0;
    double top = 0.0;
    double bottom = 0.0;

    [[nodiscard]] bool is_valid() const {
        return left < right && bottom < top;
    }

    [[nodiscard]] double width() const { return right - left; }
    [[nodiscard]] double height() const { return top - bottom; }
};

// Closed-open horizontal interval used for sampling domains.
struct Interval {
    double left = 0.0;
    double right = 0.0;

    [[nodiscard]] bool is_empty() const {
        return !(left < right);
    }

    [[nodiscard]] Interval intersect(const Interval& other) const {
        return Interval{std::max(left, other.left), std::min(right, other.right)};
    }
};

} // namespace mathud::core
