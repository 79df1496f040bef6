#pragma once
#include "test/test_base.hpp"

namespace strata::test {

/**
 * @brief Test suite for the memory services and the section loader
 */
class MemoryTest : public TestBase {
public:
    static bool run_tests();

private:
    static bool test_frame_allocator();
    static bool test_window_allocator();
    static bool test_window_mapper();
    static bool test_section_loading();
    static bool test_permissions();
    static bool test_out_of_memory();
    static bool test_array_allocation_failure();
};

} // namespace strata::test
