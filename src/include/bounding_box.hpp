#pragma once

namespace mathud {

// Screen-space axis aligned box, y grows downwards.
struct BoundingBox {
    double min_x;
    double min_y;
    double max_x;
    double max_y;

    BoundingBox()
        : min_x(0.0)
        , min_y(0.0)
        , max_x(0.0)
        , max_y(0.0) {}

    BoundingBox(double min_x_in, double min_y_in, double max_x_in, double max_y_in)
        : min_x(min_x_in)
        , min_y(min_y_in)
        , max_x(max_x_in)
        , max_y(max_y_in) {}

    // Touching edges do not count, so padded labels can stack flush.
    [[nodiscard]] bool overlaps(const BoundingBox& other) const {
        return !(max_x <= other.min_x || min_x >= other.max_x ||
                 max_y <= other.min_y || min_y >= other.max_y);
    }

    [[nodiscard]] BoundingBox inflated(double padding) const {
        if (!(padding > 0.0)) {
            return *this;
        }
        return BoundingBox(min_x - padding, min_y - padding, max_x + padding, max_y + padding);
    }

    [[nodiscard]] BoundingBox shifted_y(double dy) const {
        return BoundingBox(min_x, min_y + dy, max_x, max_y + dy);
    }

    [[nodiscard]] double height() const { return max_y - min_y; }
};

} // namespace mathud
