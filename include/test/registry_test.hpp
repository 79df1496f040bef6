#pragma once
#include "test/test_base.hpp"

namespace strata::test {

/**
 * @brief Test suite for module lifetime, handles and dependency queries
 */
class RegistryTest : public TestBase {
public:
    static bool run_tests();

private:
    static bool test_unload_order();
    static bool test_stale_handles();
    static bool test_pins();
    static bool test_address_queries();
    static bool test_namespace_teardown();
};

} // namespace strata::test
