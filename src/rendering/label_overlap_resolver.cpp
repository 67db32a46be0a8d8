#include "label_overlap_resolver.hpp"

#include <cmath>

namespace mathud::rendering {

LabelOverlapResolver::LabelOverlapResolver(const LabelLayoutConfig& config)
    : config_(config) {
    if (config_.max_steps < 0) {
        config_.max_steps = 0;
    }
    if (!std::isfinite(config_.padding_px) || config_.padding_px < 0.0) {
        config_.padding_px = 0.0;
    }
}

double LabelOverlapResolver::get_or_place_dy(const std::string& id, const BoundingBox& box, double step) {
    auto it = placements_.find(id);
    if (it != placements_.end()) {
        return it->second.dy;
    }

    if (!std::isfinite(step) || step <= 0.0) {
        step = 1.0;
    }

    const BoundingBox padded = box.inflated(config_.padding_px);

    // Candidates: 0, +1, -1, +2, -2, ... multiples of step.
    double dy = 0.0;
    BoundingBox candidate = padded;
    if (collides(candidate)) {
        bool placed = false;
        for (int k = 1; k <= config_.max_steps && !placed; ++k) {
            for (int sign : {1, -1}) {
                dy = sign * k * step;
                candidate = padded.shifted_y(dy);
                if (!collides(candidate)) {
                    placed = true;
                    break;
                }
            }
        }
        // Exhausted: the last attempted offset stands.
    }

    placements_.emplace(id, Placement{dy, candidate});
    occupied_.push_back(candidate);
    return dy;
}

bool LabelOverlapResolver::collides(const BoundingBox& candidate) const {
    for (const auto& box : occupied_) {
        if (candidate.overlaps(box)) {
            return true;
        }
    }
    return false;
}

void LabelOverlapResolver::reset() {
    placements_.clear();
    occupied_.clear();
}

} // namespace mathud::rendering
