#pragma once

#include "core/types.hpp"
#include "core/array.hpp"
#include "core/sync.hpp"
#include "memory/memory_services.hpp"
#include "loaders/section_loader.hpp"
#include "modules/link_result.hpp"
#include "modules/loaded_module.hpp"
#include "modules/namespace.hpp"

namespace strata::modules {

using namespace strata::system;

class SwapCoordinator;

/**
 * @brief Module Registry - owns every committed module and the dependency graph
 * 
 * Modules live in generation-checked slots. Every change to the graph
 * (commit, reference counts, dependent records, unload, swap) happens under
 * the exclusive graph lock; memory is released only after the lock is
 * dropped. Namespace mutations are made only while the graph lock is held.
 */
class ModuleRegistry {
public:
    explicit ModuleRegistry(const MemoryServices& services);

    /**
     * @brief Drop every remaining module, dependents before their targets
     */
    ~ModuleRegistry();

    //=========================================================================
    // Lifecycle
    //=========================================================================

    /**
     * @brief Take a strong reference on a committed module
     * @return INVALID_HANDLE if the module no longer exists
     */
    LinkResult pin(ModuleHandle module);

    /**
     * @brief Release a reference taken by pin()
     */
    void unpin(ModuleHandle module);

    /**
     * @brief Publish a fully relocated, permission-finalized module
     * 
     * Records its dependent edges on the target sections, inserts its
     * exports into the namespace and makes it visible. On failure nothing
     * is changed and the module still belongs to the caller.
     * @param ns Namespace receiving the module
     * @param module Pending module (ownership passes to the registry on success)
     * @param handle Output: handle of the committed module
     */
    LinkResult commit(Namespace& ns, LoadedModule* module, ModuleHandle& handle);

    /**
     * @brief Publish modules that were linked together, all of them or none
     * 
     * The provisional handles the modules hold on each other are replaced
     * by their committed handles. Names are checked across the whole set,
     * so two global definitions in one namespace fail the commit.
     * @param modules Pending modules; a provisional handle's index refers to this array
     * @param namespaces Namespace receiving each module
     * @param count Number of modules
     * @param handles Output: handle of each committed module
     */
    LinkResult commit_batch(LoadedModule* const* modules, Namespace* const* namespaces, u32 count,
                            ModuleHandle* handles);

    /**
     * @brief Remove a module that nothing depends on and release its memory
     * @return MODULE_STILL_IN_USE if other modules reference it
     */
    LinkResult unload(ModuleHandle module);

    /**
     * @brief Unload a set of modules referenced only from within the set
     * 
     * Modules loaded together can depend on each other in a cycle, which
     * unload() alone never breaks.
     * @return MODULE_STILL_IN_USE if a module outside the set references one of them
     */
    LinkResult unload_batch(const ModuleHandle* modules, u32 count);

    /**
     * @brief Unload every module of a namespace that can be unloaded
     * 
     * Members left over by dependency cycles are unloaded as one set.
     * @return Number of modules still in the namespace
     */
    u32 unload_namespace(Namespace& ns);

    /**
     * @brief Clear the namespace of every module still attached to ns
     * 
     * Called before a namespace is destroyed; those modules can still be
     * unloaded afterwards.
     */
    void forget_namespace(const Namespace& ns);

    //=========================================================================
    // Queries
    //=========================================================================

    bool is_live(ModuleHandle module) const;

    /**
     * @brief Get a committed module
     * 
     * The pointer stays valid while the caller holds a pin on the module or
     * otherwise knows it cannot be unloaded.
     */
    const LoadedModule* get_module(ModuleHandle module) const;

    u32 module_count() const;

    /**
     * @brief Find the module and section covering an address
     */
    bool get_section_containing_address(uintptr_t addr, SectionRef& section) const;
    bool get_module_containing_address(uintptr_t addr, ModuleHandle& module) const;

    /**
     * @brief Address and size of a committed section
     */
    bool section_address(const SectionRef& section, uintptr_t& address, u64& size) const;

    /**
     * @brief Modules that hold relocations into module
     * @return Number found (results holds up to maxResults of them)
     */
    u32 modules_dependent_on(ModuleHandle module, ModuleHandle* results, u32 maxResults) const;

    /**
     * @brief Modules that module holds relocations into
     */
    u32 modules_depended_on_by(ModuleHandle module, ModuleHandle* results, u32 maxResults) const;

    /**
     * @brief Reference count and dependent record count of a module
     */
    bool get_usage(ModuleHandle module, u32& refCount, u32& dependents) const;

    loaders::SectionLoader& get_section_loader() { return m_sectionLoader; }

private:
    friend class SwapCoordinator;

    ModuleRegistry(const ModuleRegistry&) = delete;
    ModuleRegistry& operator=(const ModuleRegistry&) = delete;

    struct ModuleSlot {
        LoadedModule* module;
        u32 generation;
    };

    /**
     * @brief Modules holding reserved slots and prepared symbol batches
     */
    struct StagedCommit {
        LoadedModule* const* modules;
        Namespace* const* namespaces;
        u32 count;
        u32 reservedSlots;
        DynamicArray<SymbolBatch*> batches;
        DynamicArray<SymbolBatch*> group;       // Scratch for publishing one namespace
        DynamicArray<ModuleHandle> groupReplaced;

        StagedCommit(LoadedModule* const* pending, Namespace* const* targets, u32 pendingCount)
            : modules(pending), namespaces(targets), count(pendingCount), reservedSlots(0) {}
        ~StagedCommit();
    };

    LoadedModule* lookup_locked(ModuleHandle module) const;

    /**
     * @brief Reserve a free slot and assign its handle to module
     */
    LinkResult reserve_slot(LoadedModule* module, u32& index);

    /**
     * @brief Take slots, symbol batches and dependent records for a set of modules
     * 
     * All-or-nothing. The slots are occupied but the modules stay invisible
     * until publish_locked() because every reader takes the graph lock.
     * @param replaced Modules whose names do not collide (swap)
     * @param aliasesFrom Per module, exports to re-export as aliases, or nullptr
     */
    LinkResult stage_locked(StagedCommit& staged, const ModuleHandle* replaced, u32 replacedCount,
                            const LoadedModule* const* aliasesFrom);

    /**
     * @brief Undo a successful stage_locked()
     */
    void unstage_locked(StagedCommit& staged);

    /**
     * @brief Make staged modules visible, removing replaced ones from their namespaces
     */
    void publish_locked(StagedCommit& staged, const ModuleHandle* replaced, u32 replacedCount);

    void release_slots(StagedCommit& staged);

    /**
     * @brief Replace provisional handles by committed ones (bind) or back (unbind)
     */
    void bind_pending(StagedCommit& staged);
    void unbind_pending(StagedCommit& staged);

    /**
     * @brief Add the dependent records of module's cross-module relocations
     * 
     * All-or-nothing: on failure every record added so far is removed again.
     */
    LinkResult link_dependents(LoadedModule& module);

    /**
     * @brief Remove the dependent records module placed on its targets
     */
    void remove_dependent_records(LoadedModule& module);

    /**
     * @brief Remove module's dependent records and drop its strong references
     */
    void unlink_dependencies(LoadedModule& module);

    /**
     * @brief Detach a module from the graph after checking it is unreferenced
     * @return INVARIANT_VIOLATION if references remain
     */
    LinkResult drop_locked(LoadedModule* module);

    /**
     * @brief Release memory and free a module removed from the graph
     */
    void destroy(LoadedModule* module);

    loaders::SectionLoader m_sectionLoader;
    DynamicArray<ModuleSlot> m_slots;
    u32 m_moduleCount;
    mutable sync::ReadWriteLock m_graphLock;
};

} // namespace strata::modules
