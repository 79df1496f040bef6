#pragma once

#include "core/types.hpp"
#include "core/array.hpp"
#include "modules/link_result.hpp"
#include "modules/loaded_module.hpp"
#include "modules/module_registry.hpp"
#include "modules/task_query.hpp"

namespace strata::modules {

using namespace strata::system;

/**
 * @brief Modules handed to a state transfer entry point, pairwise old and new
 */
struct StateTransferContext {
    const LoadedModule* const* oldModules;
    LoadedModule* const* newModules;
    u32 count;
};

/**
 * @brief Signature of a state transfer entry point exported by a replacement
 */
using StateTransferFunction = LinkResult (*)(const StateTransferContext& context);

/**
 * @brief Runs the state transfer entry points of a swap
 * 
 * The default runner calls the entry address directly.
 */
class StateTransferRunner {
public:
    virtual ~StateTransferRunner() = default;

    /**
     * @param name Entry point name as requested
     * @param entry Address of the entry point in a replacement module
     * @return Anything other than SUCCESS aborts the swap
     */
    virtual LinkResult run(const char* name, uintptr_t entry, const StateTransferContext& context) = 0;
};

/**
 * @brief Options of a live module replacement
 */
struct SwapOptions {
    bool reexportNewSymbolsAsOld;   // Old symbol names stay resolvable, aliased to the new module
    bool transferState;             // Copy data objects that exist in both versions
    bool dropOldModule;             // Free the old module once nothing references it
    TaskQueryService* taskQuery;    // Optional quiescence check
    const char* const* stateTransferFunctions;  // Entry points in the replacements, run before publishing
    u32 stateTransferCount;
    StateTransferRunner* stateTransferRunner;   // nullptr calls the entry points directly

    static SwapOptions defaults() {
        SwapOptions options = {false, false, true, nullptr, nullptr, 0, nullptr};
        return options;
    }
};

/**
 * @brief Swap/Unload Coordinator - retargets dependents onto a replacement module
 * 
 * Works on a replacement that is fully loaded, relocated and finalized but
 * not yet committed. Every dependent record on the old module is recomputed
 * against the matching export of the replacement before anything is
 * written; writes are journaled so a late failure restores every site.
 * The old module is never modified and keeps serving calls until the new
 * one is published. Several modules can be replaced in one step; their
 * retargets share one journal and their replacements are published together.
 */
class SwapCoordinator {
public:
    explicit SwapCoordinator(ModuleRegistry& registry);

    /**
     * @brief Ask the task query service whether any task is inside a module's code
     * @return SUCCESS, MODULE_BUSY or INVALID_HANDLE
     */
    LinkResult check_quiescence(ModuleHandle module, TaskQueryService* service);

    /**
     * @brief Copy data objects with the same name and size from old into replacement
     */
    void transfer_state(const LoadedModule& old, LoadedModule& replacement);

    /**
     * @brief Resolve the requested entry points in the replacements and run them in order
     * @return SUCCESS, INCONSISTENT_SWAP_TARGET for a missing entry point, or the entry point's error
     */
    LinkResult run_state_transfer(const StateTransferContext& context, const SwapOptions& options);

    /**
     * @brief Replace several committed modules in one step
     * 
     * The replacements may hold provisional handles on each other. The caller
     * holds one pin on every old module; they are consumed on success.
     * On failure nothing changed and the replacements still belong to the caller.
     * @param oldModules Modules being replaced
     * @param replacements Pending modules linked with the old modules excluded
     * @param count Number of modules in both arrays
     * @param options Swap options
     * @param newHandles Output: handle of each committed replacement
     */
    LinkResult commit_swap(const ModuleHandle* oldModules, LoadedModule* const* replacements, u32 count,
                           const SwapOptions& options, ModuleHandle* newHandles);

private:
    /**
     * @brief One dependent relocation, recomputed against the replacement
     */
    struct Retarget {
        LoadedModule* old;
        LoadedModule* replacement;
        LoadedModule* source;
        u32 relocationIndex;
        u32 oldSection;
        u32 newSection;
        u64 newOffset;
        u64 newSize;
        uintptr_t site;
        u64 value;
        u32 width;
    };

    struct UndoEntry {
        uintptr_t site;
        u64 previous;
        u32 width;
    };

    struct WritableRegion {
        LoadedModule* module;
        u32 region;
        PageFlags flags;    // Flags to restore
    };

    LinkResult commit_swap_locked(const ModuleHandle* oldModules, LoadedModule* const* replacements, u32 count,
                                  const SwapOptions& options, ModuleHandle* newHandles,
                                  DynamicArray<LoadedModule*>& dropped);
    LinkResult plan_retargets(LoadedModule& old, LoadedModule& replacement,
                              const DynamicArray<LoadedModule*>& replaced, DynamicArray<Retarget>& plan);
    LinkResult reserve_commit_space(DynamicArray<Retarget>& plan, u32 replacementCount);
    LinkResult apply_retargets(DynamicArray<Retarget>& plan);
    void restore_regions(DynamicArray<WritableRegion>& regions);
    void rollback(DynamicArray<UndoEntry>& undo);
    void move_dependents(DynamicArray<Retarget>& plan);

    ModuleRegistry& m_registry;
};

} // namespace strata::modules
