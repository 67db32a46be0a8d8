#include "label_overlap_resolver.hpp"

#include <cmath>
#include <iostream>

namespace mathud::rendering {

namespace label_overlap_resolver_tests {

bool test_first_label_stays_in_place() {
    LabelOverlapResolver resolver;
    return resolver.get_or_place_dy("A", BoundingBox(0, 0, 40, 12), 14.0) == 0.0 &&
           resolver.placed_count() == 1;
}

bool test_identical_label_is_displaced_by_a_step() {
    LabelOverlapResolver resolver;
    const BoundingBox box(10, 10, 50, 22);
    const double first = resolver.get_or_place_dy("A", box, 14.0);
    const double second = resolver.get_or_place_dy("B", box, 14.0);
    return first == 0.0 && std::abs(second) >= 14.0;
}

bool test_repeated_id_returns_cached_offset() {
    LabelOverlapResolver resolver;
    const BoundingBox box(10, 10, 50, 22);
    resolver.get_or_place_dy("A", box, 14.0);
    const double second = resolver.get_or_place_dy("B", box, 14.0);
    // A third label would now move further, the cached id must not.
    const double again = resolver.get_or_place_dy("B", box, 14.0);
    return second == again && resolver.placed_count() == 2;
}

bool test_taller_block_pushes_label_clear() {
    LabelOverlapResolver resolver;
    const BoundingBox tall(0, 0, 40, 60);
    const BoundingBox small(0, 24, 40, 36);
    resolver.get_or_place_dy("block", tall, 5.0);
    const double dy = resolver.get_or_place_dy("label", small, 5.0);
    const double padding = resolver.config().padding_px;
    if (std::abs(dy) < tall.height() / 2.0 + padding) {
        std::cerr << "Label moved only " << dy << std::endl;
        return false;
    }
    const BoundingBox placed = small.shifted_y(dy).inflated(padding);
    return !placed.overlaps(tall.inflated(padding));
}

bool test_candidates_alternate_outwards() {
    LabelOverlapResolver resolver;
    // Block the centre and the slot below so only the slot above is free.
    resolver.get_or_place_dy("centre", BoundingBox(0, 100, 40, 110), 20.0);
    resolver.get_or_place_dy("below", BoundingBox(0, 120, 40, 130), 20.0);
    const double dy = resolver.get_or_place_dy("new", BoundingBox(0, 100, 40, 110), 20.0);
    return dy == -20.0;
}

bool test_touching_boxes_do_not_overlap() {
    LabelOverlapResolver resolver(LabelLayoutConfig{10, 0.0});
    resolver.get_or_place_dy("A", BoundingBox(0, 0, 10, 10), 5.0);
    return resolver.get_or_place_dy("B", BoundingBox(10, 0, 20, 10), 5.0) == 0.0;
}

bool test_exhausted_search_keeps_last_offset() {
    LabelOverlapResolver resolver(LabelLayoutConfig{2, 0.0});
    resolver.get_or_place_dy("wall", BoundingBox(0, -1000, 100, 1000), 1.0);
    const double dy = resolver.get_or_place_dy("stuck", BoundingBox(10, 0, 20, 10), 3.0);
    return dy == -6.0 && resolver.contains("stuck");
}

bool test_invalid_step_is_coerced() {
    LabelOverlapResolver resolver(LabelLayoutConfig{10, 0.0});
    const BoundingBox box(0, 0, 10, 0.5);
    resolver.get_or_place_dy("A", box, 0.0);
    const double dy = resolver.get_or_place_dy("B", box, std::nan(""));
    return dy == 1.0;
}

bool test_reset_forgets_placements() {
    LabelOverlapResolver resolver;
    const BoundingBox box(0, 0, 10, 10);
    resolver.get_or_place_dy("A", box, 12.0);
    resolver.reset();
    return resolver.placed_count() == 0 && resolver.get_or_place_dy("B", box, 12.0) == 0.0;
}

bool run_all_tests() {
    const std::pair<const char*, bool (*)()> tests[] = {
        {"first_label_stays_in_place", &test_first_label_stays_in_place},
        {"identical_label_is_displaced_by_a_step", &test_identical_label_is_displaced_by_a_step},
        {"repeated_id_returns_cached_offset", &test_repeated_id_returns_cached_offset},
        {"taller_block_pushes_label_clear", &test_taller_block_pushes_label_clear},
        {"candidates_alternate_outwards", &test_candidates_alternate_outwards},
        {"touching_boxes_do_not_overlap", &test_touching_boxes_do_not_overlap},
        {"exhausted_search_keeps_last_offset", &test_exhausted_search_keeps_last_offset},
        {"invalid_step_is_coerced", &test_invalid_step_is_coerced},
        {"reset_forgets_placements", &test_reset_forgets_placements},
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

} // namespace label_overlap_resolver_tests

} // namespace mathud::rendering

int main() {
    if (mathud::rendering::label_overlap_resolver_tests::run_all_tests()) {
        std::cout << "All label overlap resolver tests passed" << std::endl;
        return 0;
    }

    std::cerr << "Label overlap resolver tests failed" << std::endl;
    return 1;
}
