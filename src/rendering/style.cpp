#include "style.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <sstream>
#include <unordered_map>
#include <vector>

namespace mathud::rendering {

namespace {

constexpr double kLabelVanishThresholdPx = 2.0;

std::string to_lower_trimmed(const std::string& text) {
    std::string result;
    result.reserve(text.size());
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            result.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(c))));
        }
    }
    return result;
}

std::optional<int> hex_digit(char c) {
    if (c >= '0' && c <= '9') {
        return c - '0';
    }
    if (c >= 'a' && c <= 'f') {
        return 10 + (c - 'a');
    }
    return std::nullopt;
}

std::optional<Color> parse_hex(const std::string& hex) {
    std::vector<int> digits;
    for (char c : hex) {
        auto digit = hex_digit(c);
        if (!digit) {
            return std::nullopt;
        }
        digits.push_back(*digit);
    }
    if (digits.size() == 3) {
        return Color{digits[0] * 17 / 255.0, digits[1] * 17 / 255.0, digits[2] * 17 / 255.0, 1.0};
    }
    if (digits.size() == 6) {
        return Color{(digits[0] * 16 + digits[1]) / 255.0,
                     (digits[2] * 16 + digits[3]) / 255.0,
                     (digits[4] * 16 + digits[5]) / 255.0, 1.0};
    }
    return std::nullopt;
}

std::optional<Color> parse_functional(const std::string& body, bool with_alpha) {
    std::vector<double> values;
    std::stringstream stream(body);
    std::string token;
    while (std::getline(stream, token, ',')) {
        try {
            std::size_t consumed = 0;
            const double value = std::stod(token, &consumed);
            if (consumed != token.size()) {
                return std::nullopt;
            }
            values.push_back(value);
        } catch (const std::exception&) {
            return std::nullopt;
        }
    }
    const std::size_t expected = with_alpha ? 4 : 3;
    if (values.size() != expected) {
        return std::nullopt;
    }
    Color color{std::clamp(values[0], 0.0, 255.0) / 255.0,
                std::clamp(values[1], 0.0, 255.0) / 255.0,
                std::clamp(values[2], 0.0, 255.0) / 255.0, 1.0};
    if (with_alpha) {
        color.a = std::clamp(values[3], 0.0, 1.0);
    }
    return color;
}

const std::unordered_map<std::string, Color>& named_colors() {
    static const std::unordered_map<std::string, Color> colors = {
        {"black", {0.0, 0.0, 0.0, 1.0}},
        {"white", {1.0, 1.0, 1.0, 1.0}},
        {"red", {1.0, 0.0, 0.0, 1.0}},
        {"green", {0.0, 128 / 255.0, 0.0, 1.0}},
        {"blue", {0.0, 0.0, 1.0, 1.0}},
        {"yellow", {1.0, 1.0, 0.0, 1.0}},
        {"orange", {1.0, 165 / 255.0, 0.0, 1.0}},
        {"purple", {128 / 255.0, 0.0, 128 / 255.0, 1.0}},
        {"magenta", {1.0, 0.0, 1.0, 1.0}},
        {"cyan", {0.0, 1.0, 1.0, 1.0}},
        {"grey", {128 / 255.0, 128 / 255.0, 128 / 255.0, 1.0}},
        {"gray", {128 / 255.0, 128 / 255.0, 128 / 255.0, 1.0}},
        {"lightgrey", {211 / 255.0, 211 / 255.0, 211 / 255.0, 1.0}},
        {"lightgray", {211 / 255.0, 211 / 255.0, 211 / 255.0, 1.0}},
        {"darkgrey", {169 / 255.0, 169 / 255.0, 169 / 255.0, 1.0}},
        {"darkgray", {169 / 255.0, 169 / 255.0, 169 / 255.0, 1.0}},
        {"lightblue", {173 / 255.0, 216 / 255.0, 230 / 255.0, 1.0}},
        {"darkblue", {0.0, 0.0, 139 / 255.0, 1.0}},
        {"lightgreen", {144 / 255.0, 238 / 255.0, 144 / 255.0, 1.0}},
        {"darkgreen", {0.0, 100 / 255.0, 0.0, 1.0}},
        {"pink", {1.0, 192 / 255.0, 203 / 255.0, 1.0}},
        {"brown", {165 / 255.0, 42 / 255.0, 42 / 255.0, 1.0}},
        {"transparent", {0.0, 0.0, 0.0, 0.0}},
    };
    return colors;
}

} // namespace

std::optional<Color> parse_color(const std::string& text) {
    const std::string normalized = to_lower_trimmed(text);
    if (normalized.empty()) {
        return std::nullopt;
    }
    if (normalized.front() == '#') {
        return parse_hex(normalized.substr(1));
    }
    if (normalized.rfind("rgba(", 0) == 0 && normalized.back() == ')') {
        return parse_functional(normalized.substr(5, normalized.size() - 6), true);
    }
    if (normalized.rfind("rgb(", 0) == 0 && normalized.back() == ')') {
        return parse_functional(normalized.substr(4, normalized.size() - 5), false);
    }
    const auto& names = named_colors();
    auto it = names.find(normalized);
    if (it != names.end()) {
        return it->second;
    }
    return std::nullopt;
}

Color color_or_black(const std::string& text) {
    return parse_color(text).value_or(Color{});
}

const std::map<std::string, StyleValue>& Style::defaults() {
    static const std::map<std::string, StyleValue> table = {
        // Points
        {"point_radius", 2.0},
        {"point_color", std::string("black")},
        {"point_label_font_size", 10.0},
        {"point_label_offset", 4.0},
        // Segments and vectors
        {"segment_color", std::string("black")},
        {"segment_stroke_width", 1.0},
        {"vector_color", std::string("black")},
        {"vector_tip_size", 8.0},
        // Circles and ellipses
        {"circle_color", std::string("black")},
        {"circle_stroke_width", 1.0},
        {"ellipse_color", std::string("black")},
        {"ellipse_stroke_width", 1.0},
        // Angles
        {"angle_color", std::string("blue")},
        {"angle_arc_radius", 15.0},
        {"angle_stroke_width", 1.0},
        {"angle_text_arc_radius_factor", 1.8},
        {"angle_label_font_size", 12.0},
        // Functions
        {"function_color", std::string("black")},
        {"function_stroke_width", 1.0},
        {"function_label_font_size", 12.0},
        {"function_sample_count", 400.0},
        // Areas
        {"area_fill_color", std::string("lightblue")},
        {"area_opacity", 0.3},
        // Labels
        {"label_color", std::string("black")},
        {"label_font_size", 14.0},
        {"label_line_height_factor", 1.2},
        {"label_placement_step", 12.0},
        // Cartesian grid
        {"cartesian_axis_color", std::string("black")},
        {"cartesian_axis_stroke_width", 1.0},
        {"cartesian_grid_color", std::string("lightgrey")},
        {"cartesian_grid_stroke_width", 0.5},
        {"cartesian_tick_size", 3.0},
        {"cartesian_tick_font_size", 8.0},
        {"cartesian_label_color", std::string("grey")},
        {"grid_target_spacing_px", 100.0},
        // Polar grid
        {"polar_axis_color", std::string("black")},
        {"polar_circle_color", std::string("lightgrey")},
        {"polar_radial_color", std::string("lightgrey")},
        {"polar_label_color", std::string("grey")},
        {"polar_label_font_size", 8.0},
        // Canvas
        {"background_color", std::string("white")},
        {"fill_style", std::string("rgba(0, 0, 0, 0)")},
        {"font_family", std::string("Inter, sans-serif")},
    };
    return table;
}

Style::Style(const std::map<std::string, StyleValue>& overrides, const core::LogCallback& log_callback) {
    for (const auto& [key, value] : overrides) {
        set(key, value, log_callback);
    }
}

bool Style::set(const std::string& key, StyleValue value, const core::LogCallback& log_callback) {
    if (defaults().count(key) == 0) {
        core::log_message(log_callback, "Style", "Ignoring unknown style key: " + key);
        return false;
    }
    overrides_[key] = std::move(value);
    return true;
}

std::optional<StyleValue> Style::get(const std::string& key) const {
    auto it = overrides_.find(key);
    if (it != overrides_.end()) {
        return it->second;
    }
    const auto& table = defaults();
    auto default_it = table.find(key);
    if (default_it != table.end()) {
        return default_it->second;
    }
    return std::nullopt;
}

double Style::number(const std::string& key, double fallback) const {
    auto value = get(key);
    if (!value) {
        return fallback;
    }
    if (const double* number = std::get_if<double>(&*value)) {
        return std::isfinite(*number) ? *number : fallback;
    }
    try {
        const double parsed = std::stod(std::get<std::string>(*value));
        return std::isfinite(parsed) ? parsed : fallback;
    } catch (const std::exception&) {
        return fallback;
    }
}

std::string Style::text(const std::string& key, const std::string& fallback) const {
    auto value = get(key);
    if (!value) {
        return fallback;
    }
    if (const std::string* text = std::get_if<std::string>(&*value)) {
        return *text;
    }
    std::ostringstream out;
    out << std::get<double>(*value);
    return out.str();
}

Color Style::color(const std::string& key) const {
    return color_or_black(text(key, "black"));
}

double zoom_adjusted_font_size(double base_size, double current_scale, double reference_scale) {
    if (!std::isfinite(base_size) || base_size <= 0.0) {
        return 0.0;
    }
    if (!std::isfinite(current_scale) || !std::isfinite(reference_scale) ||
        current_scale <= 0.0 || reference_scale <= 0.0) {
        return base_size;
    }
    const double ratio = current_scale / reference_scale;
    if (ratio >= 1.0) {
        return base_size;
    }
    const double scaled = base_size * ratio;
    if (scaled <= kLabelVanishThresholdPx) {
        return 0.0;
    }
    return std::max(scaled, 0.0);
}

} // namespace mathud::rendering
