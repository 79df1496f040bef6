#include "modules/module_catalog.hpp"
#include "modules/module_identity.hpp"
#include "core/utils.hpp"

namespace strata::modules {

using namespace strata::utils;
using strata::sync::SpinlockGuard;

ModuleCatalog::ModuleCatalog() {}

ModuleCatalog::~ModuleCatalog() {
    for (u32 i = 0; i < m_entries.size(); i++) {
        delete[] m_entries[i].name;
    }
}

bool ModuleCatalog::add(const char* name, const void* data, u64 size) {
    if (!name || !data || size == 0) {
        return false;
    }
    
    char* copy = strdup(name);
    if (!copy) {
        return false;
    }
    
    SpinlockGuard guard(m_lock);
    for (u32 i = 0; i < m_entries.size(); i++) {
        if (strcmp(m_entries[i].name, name) == 0) {
            delete[] copy;
            return false;
        }
    }
    
    CatalogEntry entry = {copy, static_cast<const u8*>(data), size};
    if (!m_entries.push_back(entry)) {
        delete[] copy;
        return false;
    }
    return true;
}

bool ModuleCatalog::find(const char* name, CatalogEntry& entry) const {
    SpinlockGuard guard(m_lock);
    for (u32 i = 0; i < m_entries.size(); i++) {
        if (strcmp(m_entries[i].name, name) == 0) {
            entry = m_entries[i];
            return true;
        }
    }
    return false;
}

bool ModuleCatalog::find_by_module_name(const char* moduleName, CatalogEntry& entry) const {
    SpinlockGuard guard(m_lock);
    
    u32 nameLength = strlen(moduleName);
    u32 matches = 0;
    for (u32 i = 0; i < m_entries.size(); i++) {
        const char* candidate = m_entries[i].name;
        if (module_name_hashless_length(candidate) == nameLength &&
            strncmp(candidate, moduleName, nameLength) == 0) {
            entry = m_entries[i];
            matches++;
        }
    }
    return matches == 1;
}

u32 ModuleCatalog::size() const {
    SpinlockGuard guard(m_lock);
    return m_entries.size();
}

bool ModuleCatalog::get(u32 index, CatalogEntry& entry) const {
    SpinlockGuard guard(m_lock);
    if (index >= m_entries.size()) {
        return false;
    }
    entry = m_entries[index];
    return true;
}

} // namespace strata::modules
