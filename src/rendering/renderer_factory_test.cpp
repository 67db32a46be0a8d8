#include "renderer_factory.hpp"

#include <iostream>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "gpu_renderer.hpp"
#include "recording_primitives.hpp"

namespace mathud::rendering {

namespace renderer_factory_tests {

// Renderer over a recording surface that reports a chosen backend id.
class TaggedRenderer : public Renderer {
public:
    explicit TaggedRenderer(std::string id)
        : Renderer(std::make_unique<RecordingPrimitives>(), RendererConfig{})
        , id_(std::move(id)) {}

    [[nodiscard]] const char* backend_id() const override { return id_.c_str(); }

private:
    std::string id_;
};

class IdleDevice : public GpuDevice {
public:
    [[nodiscard]] bool supports_rendering() const override { return true; }
    [[nodiscard]] std::string name() const override { return "idle"; }
    void submit(const VertexBatch&) override {}
};

struct Attempts {
    std::vector<std::string> order;
    std::vector<std::string> errors;

    core::LogCallback logger() {
        return [this](const std::string& message, bool is_error) {
            if (is_error) {
                errors.push_back(message);
            }
        };
    }

    RendererFactory::Constructor succeeding(const std::string& id) {
        return [this, id]() -> std::unique_ptr<Renderer> {
            order.push_back(id);
            return std::make_unique<TaggedRenderer>(id);
        };
    }

    RendererFactory::Constructor throwing(const std::string& id) {
        return [this, id]() -> std::unique_ptr<Renderer> {
            order.push_back(id);
            throw std::runtime_error(id + " unavailable");
        };
    }

    RendererFactory::Constructor returning_null(const std::string& id) {
        return [this, id]() -> std::unique_ptr<Renderer> {
            order.push_back(id);
            return nullptr;
        };
    }
};

bool test_falls_back_after_failure() {
    Attempts attempts;
    RendererFactory factory(attempts.logger());
    factory.register_backend(kCanvasBackend, attempts.throwing(kCanvasBackend));
    factory.register_backend(kSvgBackend, attempts.succeeding(kSvgBackend));
    factory.register_backend(kGpuBackend, attempts.succeeding(kGpuBackend));

    auto renderer = factory.create_renderer();
    if (!renderer || std::string(renderer->backend_id()) != kSvgBackend) {
        return false;
    }
    // The gpu constructor is never reached.
    return attempts.order == std::vector<std::string>{kCanvasBackend, kSvgBackend} &&
           attempts.errors.size() == 1 &&
           attempts.errors.front().find("canvas2d unavailable") != std::string::npos;
}

bool test_preferred_backend_goes_first() {
    Attempts attempts;
    RendererFactory factory(attempts.logger());
    factory.register_backend(kCanvasBackend, attempts.succeeding(kCanvasBackend));
    factory.register_backend(kSvgBackend, attempts.succeeding(kSvgBackend));
    factory.register_backend(kGpuBackend, attempts.succeeding(kGpuBackend));

    auto renderer = factory.create_renderer(std::string(kGpuBackend));
    return renderer && std::string(renderer->backend_id()) == kGpuBackend &&
           attempts.order == std::vector<std::string>{kGpuBackend};
}

bool test_null_result_is_a_failure() {
    Attempts attempts;
    RendererFactory factory(attempts.logger());
    factory.register_backend(kCanvasBackend, attempts.returning_null(kCanvasBackend));
    factory.register_backend(kSvgBackend, attempts.succeeding(kSvgBackend));

    auto renderer = factory.create_renderer();
    return renderer && std::string(renderer->backend_id()) == kSvgBackend && attempts.errors.size() == 1;
}

bool test_exhaustion_returns_null() {
    Attempts attempts;
    RendererFactory factory(attempts.logger());
    factory.register_backend(kCanvasBackend, attempts.throwing(kCanvasBackend));
    factory.register_backend(kSvgBackend, attempts.returning_null(kSvgBackend));
    factory.register_backend(kGpuBackend, attempts.throwing(kGpuBackend));

    auto renderer = factory.create_renderer(std::string(kSvgBackend));
    return !renderer &&
           attempts.order == std::vector<std::string>{kSvgBackend, kCanvasBackend, kGpuBackend};
}

bool test_unregistered_backends_are_skipped() {
    Attempts attempts;
    RendererFactory factory(attempts.logger());
    factory.register_backend(kGpuBackend, attempts.succeeding(kGpuBackend));

    auto renderer = factory.create_renderer(std::string(kCanvasBackend));
    return renderer && attempts.order == std::vector<std::string>{kGpuBackend} && attempts.errors.empty();
}

bool test_unknown_preference_uses_defaults() {
    Attempts attempts;
    RendererFactory factory(attempts.logger());
    factory.register_backend(kCanvasBackend, attempts.succeeding(kCanvasBackend));
    factory.register_backend(kSvgBackend, attempts.succeeding(kSvgBackend));

    auto renderer = factory.create_renderer(std::string("vulkan"));
    return renderer && std::string(renderer->backend_id()) == kCanvasBackend &&
           attempts.order == std::vector<std::string>{kCanvasBackend};
}

bool test_parse_backend_id() {
    return parse_backend_id("canvas2d") == std::optional<std::string>("canvas2d") &&
           parse_backend_id("svg") == std::optional<std::string>("svg") &&
           parse_backend_id("webgl") == std::optional<std::string>("gpu") &&
           !parse_backend_id("").has_value() &&
           !parse_backend_id("SVG ").has_value();
}

bool test_preference_chain_has_no_duplicates() {
    const auto chain = backend_preference_chain(std::string("webgl"));
    return chain == std::vector<std::string>{kGpuBackend, kCanvasBackend, kSvgBackend} &&
           backend_preference_chain(std::nullopt) ==
               std::vector<std::string>{kCanvasBackend, kSvgBackend, kGpuBackend};
}

bool test_gpu_needs_a_device() {
    RendererConfig config;
    const auto without_device = RendererFactory::with_default_backends(config);
    if (without_device.has_backend(kGpuBackend) || !without_device.has_backend(kCanvasBackend) ||
        !without_device.has_backend(kSvgBackend)) {
        return false;
    }
    config.gpu_device = std::make_shared<IdleDevice>();
    const auto with_device = RendererFactory::with_default_backends(config);
    return with_device.has_backend(kGpuBackend);
}

bool test_non_standard_throw_falls_back() {
    Attempts attempts;
    RendererFactory factory(attempts.logger());
    factory.register_backend(kCanvasBackend, [&attempts]() -> std::unique_ptr<Renderer> {
        attempts.order.push_back(kCanvasBackend);
        throw 42;
    });
    factory.register_backend(kSvgBackend, attempts.succeeding(kSvgBackend));

    auto renderer = factory.create_renderer();
    return renderer && std::string(renderer->backend_id()) == kSvgBackend &&
           attempts.order == std::vector<std::string>{kCanvasBackend, kSvgBackend} &&
           attempts.errors.size() == 1;
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"falls_back_after_failure", &test_falls_back_after_failure},
        {"preferred_backend_goes_first", &test_preferred_backend_goes_first},
        {"null_result_is_a_failure", &test_null_result_is_a_failure},
        {"exhaustion_returns_null", &test_exhaustion_returns_null},
        {"unregistered_backends_are_skipped", &test_unregistered_backends_are_skipped},
        {"unknown_preference_uses_defaults", &test_unknown_preference_uses_defaults},
        {"parse_backend_id", &test_parse_backend_id},
        {"preference_chain_has_no_duplicates", &test_preference_chain_has_no_duplicates},
        {"gpu_needs_a_device", &test_gpu_needs_a_device},
        {"non_standard_throw_falls_back", &test_non_standard_throw_falls_back},
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

} // namespace renderer_factory_tests

} // namespace mathud::rendering

int main() {
    if (mathud::rendering::renderer_factory_tests::run_all_tests()) {
        std::cout << "All renderer factory tests passed" << std::endl;
        return 0;
    }

    std::cerr << "Renderer factory tests failed" << std::endl;
    return 1;
}
