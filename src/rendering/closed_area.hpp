#pragma once

#include <optional>
#include <string>

#include "../core/types.hpp"

namespace mathud::rendering {

// Screen-space region: walking `forward` then `reverse` traces the closed loop.
struct ClosedArea {
    core::ScreenPath forward;
    core::ScreenPath reverse;
    std::string color;
    std::optional<double> opacity;

    [[nodiscard]] bool empty() const { return forward.empty() || reverse.empty(); }
};

} // namespace mathud::rendering
