#pragma once

#include <string>

#include <pango/pangocairo.h>

#include "primitives.hpp"

namespace mathud::rendering {

// Applies family, size and weight to a pango layout.
void apply_font(PangoLayout* layout, const FontStyle& font);

// Offset from the requested anchor to the layout's top-left corner.
[[nodiscard]] core::ScreenPoint layout_anchor_offset(PangoLayout* layout, const TextAlignment& alignment);

// Measures text with pango without needing a drawing surface.
class TextMeasurer {
public:
    TextMeasurer();
    ~TextMeasurer();

    TextMeasurer(const TextMeasurer&) = delete;
    TextMeasurer& operator=(const TextMeasurer&) = delete;

    [[nodiscard]] TextMetrics measure(const std::string& text, const FontStyle& font) const;

private:
    PangoContext* context_ = nullptr;
};

} // namespace mathud::rendering
