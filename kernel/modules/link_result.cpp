#include "modules/link_result.hpp"

namespace strata::modules {

const char* result_to_string(LinkResult result) {
    switch (result) {
        case LinkResult::SUCCESS:                     return "SUCCESS";
        case LinkResult::MALFORMED_OBJECT_FILE:       return "MALFORMED_OBJECT_FILE";
        case LinkResult::UNRESOLVED_SYMBOL:           return "UNRESOLVED_SYMBOL";
        case LinkResult::DUPLICATE_SYMBOL:            return "DUPLICATE_SYMBOL";
        case LinkResult::UNSUPPORTED_RELOCATION_KIND: return "UNSUPPORTED_RELOCATION_KIND";
        case LinkResult::OUT_OF_RANGE_RELOCATION:     return "OUT_OF_RANGE_RELOCATION";
        case LinkResult::OUT_OF_MEMORY:               return "OUT_OF_MEMORY";
        case LinkResult::MODULE_STILL_IN_USE:         return "MODULE_STILL_IN_USE";
        case LinkResult::INCONSISTENT_SWAP_TARGET:    return "INCONSISTENT_SWAP_TARGET";
        case LinkResult::INVALID_PARAMETER:           return "INVALID_PARAMETER";
        case LinkResult::INVALID_HANDLE:              return "INVALID_HANDLE";
        case LinkResult::NOT_FOUND:                   return "NOT_FOUND";
        case LinkResult::MODULE_BUSY:                 return "MODULE_BUSY";
        case LinkResult::INVARIANT_VIOLATION:         return "INVARIANT_VIOLATION";
    }
    return "UNKNOWN";
}

} // namespace strata::modules
