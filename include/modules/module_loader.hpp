#pragma once

#include "core/types.hpp"
#include "core/array.hpp"
#include "loaders/object_reader.hpp"
#include "modules/link_result.hpp"
#include "modules/loaded_module.hpp"
#include "modules/module_registry.hpp"
#include "modules/namespace.hpp"
#include "modules/swap.hpp"

namespace strata::modules {

using namespace strata::system;

/**
 * @brief Loader settings, fixed at construction
 */
struct LoaderConfig {
    bool verboseRelocations;    // Log every applied relocation
    bool onDemandLoading;       // Load missing providers from namespace catalogs
    u32 maxOnDemandDepth;       // Nesting limit for on-demand loads
    bool fuzzySymbolMatching;   // Fall back to hash-less symbol names

    static LoaderConfig defaults() {
        LoaderConfig config = {false, true, 8, false};
        return config;
    }
};

/**
 * @brief Object image handed to the loader
 */
struct ModuleImage {
    const char* name;           // Module identity, or nullptr to derive it from the object
    const void* data;
    u64 size;
};

/**
 * @brief Replacement of one loaded module by a new build
 */
struct SwapRequest {
    ModuleHandle oldModule;
    ModuleImage image;
};

/**
 * @brief Module Loader - entry point for loading, resolving, swapping and unloading
 * 
 * Runs the pipeline object reader -> section loader -> relocation
 * resolver against pending state and commits through the registry, so a
 * failed load leaves namespaces and memory as they were.
 * 
 * Modules are linked in batches: the modules of one load_batch() call and
 * every provider pulled in on demand resolve against each other and are
 * committed together, which lets mutually dependent modules load.
 */
class ModuleLoader {
public:
    ModuleLoader(ModuleRegistry& registry, const LoaderConfig& config);

    /**
     * @brief Load, link and publish one module
     * @param ns Namespace receiving the module
     * @param image Object image
     * @param handle Output: handle of the committed module
     */
    LinkResult load(Namespace& ns, const ModuleImage& image, ModuleHandle& handle);

    /**
     * @brief Load, link and publish several modules as one unit
     * 
     * Symbols of the batch are visible to each other while linking, so the
     * modules may reference each other in any order. Either every module is
     * committed or none is.
     * @param ns Namespace receiving the modules
     * @param images Object images
     * @param count Number of images
     * @param handles Output: handle of each committed module, in image order
     */
    LinkResult load_batch(Namespace& ns, const ModuleImage* images, u32 count, ModuleHandle* handles);

    /**
     * @brief Resolve a symbol to the section defining it
     * @return false if the symbol is not visible from ns
     */
    bool resolve(const Namespace& ns, const char* name, SectionRef& section) const;

    /**
     * @brief Resolve a symbol to its full location
     */
    bool resolve_symbol(const Namespace& ns, const char* name, SymbolLocation& location) const;

    /**
     * @brief Resolve a symbol, loading its module from the catalog if needed
     * @return SUCCESS or NOT_FOUND (or the error of the on-demand load)
     */
    LinkResult get_symbol_or_load(Namespace& ns, const char* name, SymbolLocation& location);

    /**
     * @brief Replace a loaded module by a new build
     * @param oldModule Module to replace
     * @param image Object image of the replacement
     * @param options Swap options
     * @param newHandle Output: handle of the replacement
     */
    LinkResult swap(ModuleHandle oldModule, const ModuleImage& image, const SwapOptions& options,
                    ModuleHandle& newHandle);

    /**
     * @brief Replace several loaded modules in one step
     * 
     * The replacements are linked as a batch with every old module excluded
     * from resolution, then state is transferred and all dependents are
     * retargeted under one journal. Nothing changes unless every request
     * succeeds.
     * @param requests Old module and replacement image pairs
     * @param count Number of requests
     * @param options Swap options
     * @param newHandles Output: handle of each replacement, in request order
     */
    LinkResult swap(const SwapRequest* requests, u32 count, const SwapOptions& options, ModuleHandle* newHandles);

    /**
     * @brief Unload a module nothing depends on
     */
    LinkResult unload(ModuleHandle module);

    /**
     * @brief Unload modules that are referenced only by each other
     */
    LinkResult unload_batch(const ModuleHandle* modules, u32 count);

    ModuleRegistry& get_registry() { return m_registry; }
    const LoaderConfig& get_config() const { return m_config; }

private:
    class LinkContext;

    /**
     * @brief A module being linked with the rest of its batch
     */
    struct BatchMember {
        Namespace* ns;
        LoadedModule* module;
        loaders::ObjectDescriptor object;
        u32 depth;          // On-demand nesting level
    };

    /**
     * @brief Modules linked and committed as one unit
     */
    struct LoadBatch {
        DynamicArray<BatchMember*> members;
        const ModuleHandle* excluded;   // Modules being replaced
        u32 excludedCount;
        bool allowOnDemand;

        LoadBatch() : excluded(nullptr), excludedCount(0), allowOnDemand(true) {}
        ~LoadBatch();
    };

    ModuleLoader(const ModuleLoader&) = delete;
    ModuleLoader& operator=(const ModuleLoader&) = delete;

    /**
     * @brief Read an object and lay out its sections as a new batch member
     */
    LinkResult add_member(LoadBatch& batch, Namespace& ns, const ModuleImage& image, u32 depth);

    /**
     * @brief Add the catalog module a symbol's path points at to the batch
     */
    LinkResult add_on_demand(LoadBatch& batch, Namespace& ns, const char* symbol, u32 depth);

    /**
     * @brief Find an export of another batch member visible from member's namespace
     */
    bool find_member_export(const LoadBatch& batch, u32 member, const char* name, bool ignoreHash,
                            SymbolLocation& location) const;

    /**
     * @brief Relocate and finalize every member, including those added on the way
     */
    LinkResult link_batch(LoadBatch& batch);

    /**
     * @brief Commit every member through the registry
     * @param handles Output: handles of the first count members
     */
    LinkResult commit_batch(LoadBatch& batch, ModuleHandle* handles, u32 count);

    void discard_batch(LoadBatch& batch);

    LinkResult build_module(const loaders::ObjectDescriptor& object, const char* name, LoadedModule& module);

    /**
     * @brief Release everything a pending module holds
     */
    void discard(LoadedModule* module);

    ModuleRegistry& m_registry;
    SwapCoordinator m_swap;
    LoaderConfig m_config;
};

} // namespace strata::modules
