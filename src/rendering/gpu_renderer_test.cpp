#include "gpu_renderer.hpp"

#include <cmath>
#include <iostream>
#include <memory>
#include <numbers>
#include <stdexcept>
#include <string>
#include <vector>

namespace mathud::rendering {

namespace gpu_renderer_tests {

// Keeps a copy of every submitted frame.
class RecordingDevice : public GpuDevice {
public:
    explicit RecordingDevice(bool can_render = true) : can_render_(can_render) {}

    [[nodiscard]] bool supports_rendering() const override { return can_render_; }
    [[nodiscard]] std::string name() const override { return "recording"; }
    void submit(const VertexBatch& batch) override { submitted.push_back(batch); }

    std::vector<VertexBatch> submitted;

private:
    bool can_render_;
};

bool near(double a, double b, double tolerance = 1e-6) {
    return std::abs(a - b) <= tolerance;
}

bool test_missing_device_is_rejected() {
    RendererConfig config;
    try {
        GpuRenderer renderer(config);
    } catch (const std::runtime_error&) {
        return true;
    }
    return false;
}

bool test_device_without_support_is_rejected() {
    RendererConfig config;
    config.gpu_device = std::make_shared<RecordingDevice>(false);
    try {
        GpuRenderer renderer(config);
    } catch (const std::runtime_error& e) {
        return std::string(e.what()).find("recording") != std::string::npos;
    }
    return false;
}

bool test_line_becomes_quad() {
    GpuPrimitives primitives(std::make_shared<RecordingDevice>());
    primitives.begin_frame(100, 100);
    primitives.stroke_line({10, 10}, {50, 10}, StrokeStyle{Color{1, 0, 0}, 4.0});
    const auto& batch = primitives.batch();
    if (batch.triangle_count() != 2) {
        std::cerr << "Expected 2 triangles, got " << batch.triangle_count() << std::endl;
        return false;
    }
    // Half the pen width on either side of the line.
    for (const auto& vertex : batch.vertices) {
        if (!near(std::abs(vertex.y - 10.0f), 2.0) || vertex.r != 1.0f) {
            return false;
        }
    }
    return true;
}

bool test_zero_length_line_is_skipped() {
    GpuPrimitives primitives(std::make_shared<RecordingDevice>());
    primitives.begin_frame(100, 100);
    primitives.stroke_line({10, 10}, {10, 10}, StrokeStyle{});
    return primitives.batch().vertices.empty();
}

bool test_disc_is_fan_with_opacity() {
    GpuPrimitives primitives(std::make_shared<RecordingDevice>());
    primitives.begin_frame(100, 100);
    primitives.fill_circle({50, 50}, 10.0, FillStyle{Color{0, 0, 1, 1}, 0.5});
    const auto& batch = primitives.batch();
    return batch.triangle_count() == 64 && near(batch.vertices.front().a, 0.5);
}

bool test_polygon_is_ear_clipped() {
    GpuPrimitives primitives(std::make_shared<RecordingDevice>());
    primitives.begin_frame(100, 100);
    const core::ScreenPath l_shape{{0, 0}, {20, 0}, {20, 10}, {10, 10}, {10, 20}, {0, 20}};
    primitives.fill_polygon(l_shape, FillStyle{Color{0, 1, 0}, 1.0});
    return primitives.batch().triangle_count() == 4;
}

bool test_joined_area_covers_both_paths() {
    GpuPrimitives primitives(std::make_shared<RecordingDevice>());
    primitives.begin_frame(100, 100);
    const core::ScreenPath forward{{0, 50}, {25, 40}, {50, 45}, {75, 40}};
    const core::ScreenPath reverse{{75, 60}, {50, 60}, {25, 60}, {0, 60}};
    primitives.fill_joined_area(forward, reverse, FillStyle{});
    return primitives.batch().triangle_count() == 6;
}

bool test_arc_direction_controls_sweep() {
    GpuPrimitives short_arc(std::make_shared<RecordingDevice>());
    short_arc.begin_frame(100, 100);
    short_arc.stroke_arc({50, 50}, 10.0, 0.0, std::numbers::pi / 2.0, true, StrokeStyle{});

    GpuPrimitives long_arc(std::make_shared<RecordingDevice>());
    long_arc.begin_frame(100, 100);
    long_arc.stroke_arc({50, 50}, 10.0, 0.0, std::numbers::pi / 2.0, false, StrokeStyle{});

    // A quarter turn takes 16 segments, three quarters 48, two triangles each.
    return short_arc.batch().triangle_count() == 32 && long_arc.batch().triangle_count() == 96;
}

bool test_sample_screen_arc_endpoints() {
    const auto path = sample_screen_arc({0, 0}, 10.0, 5.0, std::numbers::pi / 2.0, 0.0, std::numbers::pi, 4);
    if (path.size() != 5) {
        return false;
    }
    // Rotated a quarter turn, the x radius now points down the y axis.
    return near(path.front().x, 0.0) && near(path.front().y, 10.0) &&
           near(path.back().x, 0.0) && near(path.back().y, -10.0) &&
           near(path[2].x, -5.0) && near(path[2].y, 0.0);
}

bool test_frame_is_submitted_once() {
    auto device = std::make_shared<RecordingDevice>();
    RendererConfig config;
    config.width = 200;
    config.height = 100;
    config.gpu_device = device;
    GpuRenderer renderer(config);
    renderer.register_default_drawables();
    CoordinateMapper mapper(200, 100);

    renderer.begin_frame();
    const bool drawn = renderer.render(core::Point("A", 1, 1), mapper);
    if (!device->submitted.empty()) {
        std::cerr << "Frame was submitted before end_frame" << std::endl;
        return false;
    }
    renderer.end_frame();

    if (!drawn || device->submitted.size() != 1) {
        return false;
    }
    const auto& batch = device->submitted.front();
    return batch.width == 200 && batch.height == 100 &&
           batch.triangle_count() > 0 && batch.text_runs.size() == 1 &&
           batch.text_runs.front().text == "A(1, 1)" &&
           std::string(renderer.backend_id()) == "gpu";
}

bool test_clear_resets_batch() {
    GpuPrimitives primitives(std::make_shared<RecordingDevice>());
    primitives.begin_frame(100, 100);
    primitives.fill_circle({50, 50}, 10.0, FillStyle{});
    primitives.draw_text("x", {1, 1}, FontStyle{}, Color{});
    primitives.clear(Color{0, 0, 0});
    const auto& batch = primitives.batch();
    return batch.vertices.empty() && batch.text_runs.empty() && batch.clear_color.r == 0.0;
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"missing_device_is_rejected", &test_missing_device_is_rejected},
        {"device_without_support_is_rejected", &test_device_without_support_is_rejected},
        {"line_becomes_quad", &test_line_becomes_quad},
        {"zero_length_line_is_skipped", &test_zero_length_line_is_skipped},
        {"disc_is_fan_with_opacity", &test_disc_is_fan_with_opacity},
        {"polygon_is_ear_clipped", &test_polygon_is_ear_clipped},
        {"joined_area_covers_both_paths", &test_joined_area_covers_both_paths},
        {"arc_direction_controls_sweep", &test_arc_direction_controls_sweep},
        {"sample_screen_arc_endpoints", &test_sample_screen_arc_endpoints},
        {"frame_is_submitted_once", &test_frame_is_submitted_once},
        {"clear_resets_batch", &test_clear_resets_batch},
    };

    bool all_passed = true;

    for (const auto& [name, fn] : tests) {
        if (!fn()) {
            std::cerr << "Test failed: " << name << std::endl;
            all_passed = false;
        }
    }

    return all_passed;
}

} // namespace gpu_renderer_tests

} // namespace mathud::rendering

int main() {
    if (mathud::rendering::gpu_renderer_tests::run_all_tests()) {
        std::cout << "All gpu renderer tests passed" << std::endl;
        return 0;
    }

    std::cerr << "GPU renderer tests failed" << std::endl;
    return 1;
}
