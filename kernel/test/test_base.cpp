#include "test/test_base.hpp"

namespace strata::test {

using strata::modules::result_to_string;

void TestBase::print_test_result(const char* testName, bool passed) {
    k_printf_colored(passed ? VGA_GREEN_ON_BLUE : VGA_RED_ON_BLUE, "  [%s] %s\n",
                     passed ? "PASS" : "FAIL", testName);
}

void TestBase::print_section_header(const char* sectionName) {
    k_printf_colored(VGA_CYAN_ON_BLUE, "\n=== %s ===\n", sectionName);
}

void TestBase::print_section_footer(const char* sectionName, u32 passed, u32 total) {
    u16 color = (passed == total) ? VGA_GREEN_ON_BLUE : VGA_RED_ON_BLUE;
    k_printf_colored(color, "=== %s: %u/%u passed, %u failed ===\n",
                     sectionName, passed, total, total - passed);
}

void TestBase::print_success(const char* message) {
    k_printf_colored(VGA_GREEN_ON_BLUE, "    %s\n", message);
}

void TestBase::print_error(const char* message) {
    k_printf_colored(VGA_RED_ON_BLUE, "    %s\n", message);
}

void TestBase::print_info(const char* message) {
    k_printf_colored(VGA_CYAN_ON_BLUE, "    %s\n", message);
}

bool TestBase::assert_condition(bool condition, const char* message) {
    if (!condition) {
        print_error(message);
    }
    return condition;
}

bool TestBase::assert_result(LinkResult expected, LinkResult actual, const char* message) {
    if (expected == actual) {
        return true;
    }
    k_printf_colored(VGA_RED_ON_BLUE, "    %s Expected: %s Actual: %s\n", message,
                     result_to_string(expected), result_to_string(actual));
    return false;
}

bool TestBase::assert_string_equal(const char* expected, const char* actual, const char* message) {
    bool equal = (expected == nullptr || actual == nullptr) ? expected == actual : strcmp(expected, actual) == 0;
    if (!equal) {
        k_printf_colored(VGA_RED_ON_BLUE, "    %s Expected: \"%s\" Actual: \"%s\"\n", message, expected, actual);
    }
    return equal;
}

} // namespace strata::test
