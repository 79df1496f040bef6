#pragma once
#include "test/test_base.hpp"

namespace strata::test {

/**
 * @brief Test suite for the spinlock and reader-writer lock guarding the module tables
 */
class SyncTest : public TestBase {
public:
    static bool run_tests();

private:
    static bool test_spinlock_basic();
    static bool test_rw_lock_basic();
    static bool test_lock_guard();
};

} // namespace strata::test
