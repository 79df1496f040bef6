#pragma once

#include "core/types.hpp"
#include "core/array.hpp"
#include "modules/link_result.hpp"
#include "modules/module_catalog.hpp"
#include "modules/module_identity.hpp"
#include "modules/module_loader.hpp"
#include "modules/namespace.hpp"

namespace strata::modules {

using namespace strata::system;

/**
 * @brief Object image handed over by the bootloader
 */
struct BootModule {
    const char* name;       // "k#serial_port-4be8.o", "ksse#vga.o", "a#shell.o", ...
    const void* data;
    u64 size;
};

/**
 * @brief Boot Module Loader - builds the namespace tree from bootloader modules
 * 
 * Initialization order: the root namespace "_kernel" first, then one
 * "<personality>_kernel" namespace per personality chained to it, then the
 * application, userspace and executable namespaces chained to the kernel
 * namespace of their personality. Every image lands in its namespace's
 * catalog; only kernel modules are loaded eagerly.
 */
class BootModuleLoader {
public:
    explicit BootModuleLoader(ModuleLoader& loader);

    /**
     * @brief Unload every module and destroy the namespaces
     */
    ~BootModuleLoader();

    /**
     * @brief Catalog all boot modules and load the kernel ones
     * @return SUCCESS, or the first error met (loading continues past failures)
     */
    LinkResult load_boot_modules(const BootModule* modules, u32 count);

    Namespace* get_kernel_namespace() const;

    /**
     * @brief Find a namespace by name ("_kernel", "sse_kernel", "_applications", ...)
     */
    Namespace* find_namespace(const char* name) const;

    u32 namespace_count() const { return m_namespaces.size(); }

    /**
     * @brief Unload all modules, newest namespaces first
     * @return Number of modules that could not be unloaded
     */
    u32 shutdown();

private:
    BootModuleLoader(const BootModuleLoader&) = delete;
    BootModuleLoader& operator=(const BootModuleLoader&) = delete;

    struct NamespaceSlot {
        Namespace* ns;
        ModuleCatalog* catalog;
        ModuleKind kind;
    };

    Namespace* get_or_create_namespace(ModuleKind kind, const char* personality);
    LinkResult load_catalog(Namespace& ns);

    ModuleLoader& m_loader;
    DynamicArray<NamespaceSlot> m_namespaces;
};

} // namespace strata::modules
