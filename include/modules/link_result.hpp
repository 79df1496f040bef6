#pragma once

#include "core/types.hpp"

namespace strata::modules {

using namespace strata::system;

// Module loading, linking and lifecycle results
enum class LinkResult : i32 {
    SUCCESS = 0,
    MALFORMED_OBJECT_FILE = -1,
    UNRESOLVED_SYMBOL = -2,
    DUPLICATE_SYMBOL = -3,
    UNSUPPORTED_RELOCATION_KIND = -4,
    OUT_OF_RANGE_RELOCATION = -5,
    OUT_OF_MEMORY = -6,
    MODULE_STILL_IN_USE = -7,
    INCONSISTENT_SWAP_TARGET = -8,
    INVALID_PARAMETER = -9,
    INVALID_HANDLE = -10,
    NOT_FOUND = -11,
    MODULE_BUSY = -12,
    INVARIANT_VIOLATION = -13
};

/**
 * @brief Human readable name of a result code
 */
const char* result_to_string(LinkResult result);

inline bool succeeded(LinkResult result) {
    return result == LinkResult::SUCCESS;
}

} // namespace strata::modules
