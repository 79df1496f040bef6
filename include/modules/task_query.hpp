#pragma once

#include "core/types.hpp"

namespace strata::modules {

using namespace strata::system;

/**
 * @brief Scheduler query used to check that no task runs inside a module
 * 
 * Implemented by the embedding kernel's scheduler. The answer is only a
 * snapshot: callers that need a hard guarantee must keep the affected tasks
 * parked across the swap.
 */
class TaskQueryService {
public:
    virtual ~TaskQueryService() = default;

    /**
     * @brief Count tasks whose saved or current instruction pointer is in [start, end)
     */
    virtual u32 count_tasks_executing_in(uintptr_t start, uintptr_t end) = 0;
};

} // namespace strata::modules
