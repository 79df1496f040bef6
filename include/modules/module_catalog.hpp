#pragma once

#include "core/types.hpp"
#include "core/array.hpp"
#include "core/sync.hpp"

namespace strata::modules {

using namespace strata::system;

/**
 * @brief Object image available for loading into a namespace
 */
struct CatalogEntry {
    char* name;             // Module name, e.g. "serial_port-4be8f0a1" (owned)
    const u8* data;         // Borrowed image; must outlive the catalog
    u64 size;
};

/**
 * @brief Module Catalog - the object images a namespace can load on demand
 */
class ModuleCatalog {
public:
    ModuleCatalog();
    ~ModuleCatalog();

    /**
     * @brief Register an image under a module name
     * @return false on allocation failure or if the name is taken
     */
    bool add(const char* name, const void* data, u64 size);

    /**
     * @brief Find an image by exact module name
     */
    bool find(const char* name, CatalogEntry& entry) const;

    /**
     * @brief Find the single image whose name without hash equals moduleName
     * @return false if none or several match
     */
    bool find_by_module_name(const char* moduleName, CatalogEntry& entry) const;

    u32 size() const;

    /**
     * @brief Get entry by position (for boot-time iteration)
     */
    bool get(u32 index, CatalogEntry& entry) const;

private:
    ModuleCatalog(const ModuleCatalog&) = delete;
    ModuleCatalog& operator=(const ModuleCatalog&) = delete;

    DynamicArray<CatalogEntry> m_entries;
    mutable sync::Spinlock m_lock;
};

} // namespace strata::modules
