#pragma once
#include "test/test_base.hpp"

namespace strata::test {

/**
 * @brief Test suite for the k_printf and k_snprintf formatters
 */
class KPrintfTest : public TestBase {
public:
    static bool run_tests();

private:
    static bool test_basic_formatting();
    static bool test_wide_arguments();    // l, ll and z length modifiers
    static bool test_edge_cases();
};

} // namespace strata::test
