#pragma once
#include "display/console_sink.hpp"
#include "core/utils.hpp"
#include "modules/link_result.hpp"

namespace strata::test {

using namespace strata::display;
using namespace strata::utils;
using strata::modules::LinkResult;

/**
 * @brief Common reporting and assertion helpers for the strata test suites
 *
 * Every suite derives from TestBase and exposes a static run_tests().
 * Assertions never stop a test; they report through the console sink and
 * return false so the caller can fold the outcome into its pass flag.
 */
class TestBase {
public:
    virtual ~TestBase() = default;

    /**
     * @brief Run all tests in this suite
     * @return true if every test passed
     */
    static bool run_tests();

protected:
    static void print_test_result(const char* testName, bool passed);
    static void print_section_header(const char* sectionName);

    /**
     * @brief Print the suite tally, green when nothing failed
     */
    static void print_section_footer(const char* sectionName, u32 passed, u32 total);

    static void print_success(const char* message);
    static void print_error(const char* message);
    static void print_info(const char* message);

    static bool assert_condition(bool condition, const char* message);

    /**
     * @brief Compare two result codes, naming both on mismatch
     */
    static bool assert_result(LinkResult expected, LinkResult actual, const char* message);

    /**
     * @brief Compare two C strings; null only equals null
     */
    static bool assert_string_equal(const char* expected, const char* actual, const char* message);

    /**
     * @brief Compare two integral values, printing both in decimal and hex on mismatch
     */
    template<typename T>
    static bool assert_equal(T expected, T actual, const char* message) {
        if (expected == actual) {
            return true;
        }
        k_printf_colored(VGA_RED_ON_BLUE, "%s Expected: %lld (%llx) Actual: %lld (%llx)\n", message,
                         static_cast<long long>(expected), static_cast<unsigned long long>(expected),
                         static_cast<long long>(actual), static_cast<unsigned long long>(actual));
        return false;
    }

    template<typename T>
    static bool assert_not_equal(T unexpected, T actual, const char* message) {
        if (unexpected != actual) {
            return true;
        }
        k_printf_colored(VGA_RED_ON_BLUE, "%s Both values are: %lld\n",
                         message, static_cast<long long>(actual));
        return false;
    }
};

} // namespace strata::test
