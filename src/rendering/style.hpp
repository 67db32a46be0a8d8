#pragma once

#include <map>
#include <optional>
#include <string>
#include <variant>

#include "../core/logging.hpp"

namespace mathud::rendering {

struct Color {
    double r = 0.0;
    double g = 0.0;
    double b = 0.0;
    double a = 1.0;
};

// Parses "#rgb", "#rrggbb", "rgb(r, g, b)", "rgba(r, g, b, a)" and CSS names.
[[nodiscard]] std::optional<Color> parse_color(const std::string& text);

// Same as parse_color but falls back to opaque black.
[[nodiscard]] Color color_or_black(const std::string& text);

using StyleValue = std::variant<double, std::string>;

// Flat style dictionary. Keys absent from the defaults table are rejected so a
// typo never silently creates a new style slot.
class Style {
public:
    Style() = default;
    explicit Style(const std::map<std::string, StyleValue>& overrides,
                   const core::LogCallback& log_callback = nullptr);

    // Returns false and logs when the key is unknown.
    bool set(const std::string& key, StyleValue value, const core::LogCallback& log_callback = nullptr);

    [[nodiscard]] std::optional<StyleValue> get(const std::string& key) const;
    [[nodiscard]] double number(const std::string& key, double fallback = 0.0) const;
    [[nodiscard]] std::string text(const std::string& key, const std::string& fallback = "") const;
    [[nodiscard]] Color color(const std::string& key) const;

    [[nodiscard]] bool has_override(const std::string& key) const {
        return overrides_.count(key) > 0;
    }

    static const std::map<std::string, StyleValue>& defaults();

private:
    std::map<std::string, StyleValue> overrides_;
};

// Font size adjusted for zoom relative to the label's reference scale. Text
// never grows past its base size; returns 0 once it would drop to 2 px or less.
[[nodiscard]] double zoom_adjusted_font_size(double base_size, double current_scale, double reference_scale);

} // namespace mathud::rendering
