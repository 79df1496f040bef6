#pragma once
#include "test/test_base.hpp"

namespace strata::test {

/**
 * @brief Test suite for boot module catalogs and on-demand loading
 */
class BootTest : public TestBase {
public:
    static bool run_tests();

private:
    static bool test_catalog();
    static bool test_boot_layers();
    static bool test_on_demand_limits();
    static bool test_on_demand_cycle();
    static bool test_fuzzy_matching();
    static bool test_derived_identity();
};

} // namespace strata::test
