#pragma once

#include "core/types.hpp"
#include "core/array.hpp"
#include "core/sync.hpp"
#include "modules/link_result.hpp"
#include "modules/loaded_module.hpp"

namespace strata::modules {

using namespace strata::system;

class ModuleCatalog;

constexpr u32 NAMESPACE_BUCKET_COUNT = 1024;

/**
 * @brief One name in a namespace symbol map
 */
struct SymbolEntry {
    char* name;             // Owned copy
    u32 hash;
    SymbolLocation location;
    bool alias;             // Re-exported old name pointing into a replacement module
    SymbolEntry* next;      // Bucket chain, or the shadow list
};

/**
 * @brief Symbols of one module, prepared for insertion into a namespace
 * 
 * Holds every allocation the insertion needs, so publishing cannot fail.
 * Entries that were never published are freed with the batch.
 */
class SymbolBatch {
public:
    SymbolBatch() : m_module(INVALID_MODULE), m_moduleName(nullptr) {}
    ~SymbolBatch();

    u32 size() const { return m_entries.size(); }
    ModuleHandle get_module() const { return m_module; }

private:
    friend class Namespace;

    SymbolBatch(const SymbolBatch&) = delete;
    SymbolBatch& operator=(const SymbolBatch&) = delete;

    DynamicArray<SymbolEntry*> m_entries;
    ModuleHandle m_module;
    char* m_moduleName;
};

/**
 * @brief Visitor for module membership queries
 */
using ModuleVisitor = void (*)(ModuleHandle module, const char* name, void* context);

/**
 * @brief Namespace - symbol resolution scope
 * 
 * Maps exported names to the sections defining them and tracks member
 * modules. Lookups walk the local map and then the parent chain, so a
 * personality namespace shadows its base. Reads take the lock shared;
 * insertions and removals happen only while the module registry holds its
 * graph lock, which serializes every writer.
 * 
 * Each name has one visible definition. Weak definitions hidden by another
 * definition of the same name are kept on a shadow list and one of them
 * becomes visible again when the visible definition's module goes away.
 */
class Namespace {
public:
    /**
     * @brief Create a namespace
     * @param name Namespace name (copied)
     * @param parent Fallback namespace for lookups, or nullptr for a root
     */
    Namespace(const char* name, Namespace* parent);
    ~Namespace();

    const char* get_name() const { return m_name; }
    Namespace* get_parent() const { return m_parent; }

    void set_catalog(ModuleCatalog* catalog) { m_catalog = catalog; }
    ModuleCatalog* get_catalog() const { return m_catalog; }

    //=========================================================================
    // Lookup
    //=========================================================================

    /**
     * @brief Resolve a name in this namespace, then in its parents
     * @return true if found
     */
    bool lookup(const char* name, SymbolLocation& location) const;

    /**
     * @brief Resolve a name ignoring symbols defined by the excluded modules
     */
    bool lookup_excluding(const char* name, const ModuleHandle* excluded, u32 excludedCount,
                          SymbolLocation& location) const;

    /**
     * @brief Resolve a name in this namespace only
     */
    bool lookup_local(const char* name, SymbolLocation& location) const;

    /**
     * @brief Resolve a name ignoring its hash; must match exactly one symbol
     * 
     * Walks the parent chain; the nearest namespace with any match decides.
     */
    bool lookup_without_hash(const char* name, ModuleHandle excluded, SymbolLocation& location) const;
    bool lookup_without_hash(const char* name, const ModuleHandle* excluded, u32 excludedCount,
                             SymbolLocation& location) const;

    /**
     * @brief Find the single symbol starting with prefix (local, then parents)
     * @return false if no symbol or several symbols match
     */
    bool get_symbol_starting_with(const char* prefix, SymbolLocation& location) const;

    /**
     * @brief Count the symbols starting with prefix, copying up to maxResults locations
     */
    u32 find_symbols_starting_with(const char* prefix, SymbolLocation* results, u32 maxResults) const;

    /**
     * @brief Number of names in the local map
     */
    u32 symbol_count() const;

    /**
     * @brief Number of hidden weak definitions waiting behind visible ones
     */
    u32 shadowed_count() const;

    //=========================================================================
    // Membership
    //=========================================================================

    bool contains_module(ModuleHandle module) const;
    u32 module_count() const;

    /**
     * @brief Find a member module by exact name
     * @param recursive Also search the parent chain
     */
    bool get_module(const char* name, ModuleHandle& module, bool recursive) const;

    /**
     * @brief Find the single member module whose name starts with prefix
     */
    bool get_module_starting_with(const char* prefix, ModuleHandle& module, bool recursive) const;

    /**
     * @brief Call visitor for every member module (under the shared lock)
     */
    void for_each_module(ModuleVisitor visitor, void* context, bool recursive) const;

    /**
     * @brief Print the local symbol map
     */
    void dump_symbol_map() const;

    //=========================================================================
    // Mutation (registry graph lock held)
    //=========================================================================

    /**
     * @brief Build the insertion batch of a module
     * @param module Module whose exports are inserted
     * @param replaced Modules being swapped out: their names do not collide
     * @param replacedCount Number of replaced modules (0 for a plain load)
     * @param aliasesFrom Exports re-exported as aliases into module, or nullptr
     * @param peers Batches published together with this one
     * @param peerCount Number of peer batches
     * @param batch Output batch
     * @return SUCCESS, DUPLICATE_SYMBOL or OUT_OF_MEMORY
     */
    LinkResult prepare_insert(const LoadedModule& module, const ModuleHandle* replaced, u32 replacedCount,
                              const LoadedModule* aliasesFrom, SymbolBatch* const* peers, u32 peerCount,
                              SymbolBatch& batch);

    /**
     * @brief Publish batches in one step, removing replaced modules first
     * @param batches Batches prepared together (emptied)
     * @param batchCount Number of batches
     * @param replaced Modules to remove
     * @param replacedCount Number of modules to remove
     */
    void publish(SymbolBatch* const* batches, u32 batchCount, const ModuleHandle* replaced, u32 replacedCount);

    /**
     * @brief Remove every name and the membership of a module
     */
    void remove_module(ModuleHandle module);

private:
    Namespace(const Namespace&) = delete;
    Namespace& operator=(const Namespace&) = delete;

    struct Member {
        ModuleHandle handle;
        char* name;
    };

    SymbolEntry* find_entry(const char* name, u32 hash, const ModuleHandle* excluded, u32 excludedCount) const;
    bool lookup_without_hash_local(const char* name, const ModuleHandle* excluded, u32 excludedCount,
                                   SymbolLocation& location, bool& ambiguous) const;
    u32 count_prefix_local(const char* prefix, SymbolLocation* results, u32 maxResults, u32 found) const;
    void insert_entry(SymbolEntry* entry);
    void detach_entry(SymbolEntry* entry);
    SymbolEntry* take_shadowed(const char* name, u32 hash);
    void unlink_entries_of(ModuleHandle module);

    char* m_name;
    Namespace* m_parent;
    ModuleCatalog* m_catalog;
    SymbolEntry* m_buckets[NAMESPACE_BUCKET_COUNT];
    SymbolEntry* m_shadowed;
    u32 m_symbolCount;
    DynamicArray<Member> m_members;
    mutable sync::ReadWriteLock m_lock;
};

} // namespace strata::modules
