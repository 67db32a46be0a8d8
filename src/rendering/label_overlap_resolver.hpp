#pragma once

#include <cstddef>
#include <string>
#include <unordered_map>
#include <vector>

#include "../include/bounding_box.hpp"

namespace mathud::rendering {

struct LabelLayoutConfig {
    int max_steps = 10;         // Largest multiple of the step tried in each direction
    double padding_px = 2.0;    // Added on every side before the overlap test
};

// Vertical de-collision for labels within one layout pass. Create one per
// frame; placements are remembered for the resolver's lifetime only.
class LabelOverlapResolver {
public:
    LabelOverlapResolver() = default;
    explicit LabelOverlapResolver(const LabelLayoutConfig& config);

    // Vertical offset for the label `id` whose unshifted screen box is `box`.
    // A repeated id returns the stored offset without searching again.
    double get_or_place_dy(const std::string& id, const BoundingBox& box, double step);

    [[nodiscard]] bool contains(const std::string& id) const {
        return placements_.count(id) > 0;
    }
    [[nodiscard]] std::size_t placed_count() const { return placements_.size(); }
    [[nodiscard]] const LabelLayoutConfig& config() const { return config_; }

    void reset();

private:
    struct Placement {
        double dy;
        BoundingBox padded_box;
    };

    [[nodiscard]] bool collides(const BoundingBox& candidate) const;

    LabelLayoutConfig config_;
    std::unordered_map<std::string, Placement> placements_;
    std::vector<BoundingBox> occupied_;
};

} // namespace mathud::rendering
