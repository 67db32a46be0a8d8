#include "text_layout.hpp"

#include <stdexcept>

namespace mathud::rendering {

void apply_font(PangoLayout* layout, const FontStyle& font) {
    PangoFontDescription* font_desc = pango_font_description_from_string(font.family.c_str());
    pango_font_description_set_absolute_size(font_desc, font.size * PANGO_SCALE);
    if (font.bold) {
        pango_font_description_set_weight(font_desc, PANGO_WEIGHT_BOLD);
    }
    pango_layout_set_font_description(layout, font_desc);
    pango_font_description_free(font_desc);
}

core::ScreenPoint layout_anchor_offset(PangoLayout* layout, const TextAlignment& alignment) {
    int width = 0;
    int height = 0;
    pango_layout_get_pixel_size(layout, &width, &height);
    const double baseline = static_cast<double>(pango_layout_get_baseline(layout)) / PANGO_SCALE;

    core::ScreenPoint offset{0.0, 0.0};
    switch (alignment.align) {
        case TextAlign::Left: offset.x = 0.0; break;
        case TextAlign::Center: offset.x = -width / 2.0; break;
        case TextAlign::Right: offset.x = -static_cast<double>(width); break;
    }
    switch (alignment.baseline) {
        case TextBaseline::Top: offset.y = 0.0; break;
        case TextBaseline::Middle: offset.y = -height / 2.0; break;
        case TextBaseline::Alphabetic: offset.y = -baseline; break;
        case TextBaseline::Bottom: offset.y = -static_cast<double>(height); break;
    }
    return offset;
}

TextMeasurer::TextMeasurer() {
    PangoFontMap* font_map = pango_cairo_font_map_get_default();
    context_ = pango_font_map_create_context(font_map);
    if (!context_) {
        throw std::runtime_error("Failed to create pango context");
    }
}

TextMeasurer::~TextMeasurer() {
    if (context_) {
        g_object_unref(context_);
    }
}

TextMetrics TextMeasurer::measure(const std::string& text, const FontStyle& font) const {
    if (text.empty() || font.size <= 0.0) {
        return TextMetrics{0.0, 0.0};
    }
    PangoLayout* layout = pango_layout_new(context_);
    apply_font(layout, font);
    pango_layout_set_text(layout, text.c_str(), -1);
    int width = 0;
    int height = 0;
    pango_layout_get_pixel_size(layout, &width, &height);
    g_object_unref(layout);
    return TextMetrics{static_cast<double>(width), static_cast<double>(height)};
}

} // namespace mathud::rendering
