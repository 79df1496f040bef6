#include "modules/boot_modules.hpp"
#include "core/utils.hpp"
#include "debug/klog.hpp"

namespace strata::modules {

using namespace strata::utils;

static const char* const TAG = "boot";

BootModuleLoader::BootModuleLoader(ModuleLoader& loader) : m_loader(loader) {}

BootModuleLoader::~BootModuleLoader() {
    shutdown();
    
    ModuleRegistry& registry = m_loader.get_registry();
    for (u32 i = m_namespaces.size(); i > 0; i--) {
        NamespaceSlot& slot = m_namespaces[i - 1];
        registry.forget_namespace(*slot.ns);
        delete slot.ns;
        delete slot.catalog;
    }
    m_namespaces.clear();
}

Namespace* BootModuleLoader::find_namespace(const char* name) const {
    for (u32 i = 0; i < m_namespaces.size(); i++) {
        if (strcmp(m_namespaces[i].ns->get_name(), name) == 0) {
            return m_namespaces[i].ns;
        }
    }
    return nullptr;
}

Namespace* BootModuleLoader::get_kernel_namespace() const {
    return find_namespace("_kernel");
}

Namespace* BootModuleLoader::get_or_create_namespace(ModuleKind kind, const char* personality) {
    char name[MAX_NAMESPACE_NAME_LENGTH];
    if (!namespace_name_for(kind, personality, name, sizeof(name))) {
        return nullptr;
    }
    
    Namespace* existing = find_namespace(name);
    if (existing) {
        return existing;
    }
    
    // Kernel namespaces chain to the root, everything else to its personality's kernel
    Namespace* parent = nullptr;
    if (kind != ModuleKind::KERNEL) {
        parent = get_or_create_namespace(ModuleKind::KERNEL, personality);
        if (!parent) return nullptr;
    } else if (personality[0] != '\0') {
        parent = get_or_create_namespace(ModuleKind::KERNEL, "");
        if (!parent) return nullptr;
    }
    
    Namespace* ns = new (std::nothrow) Namespace(name, parent);
    ModuleCatalog* catalog = new (std::nothrow) ModuleCatalog();
    if (!ns || !catalog || !ns->get_name()) {
        delete ns;
        delete catalog;
        return nullptr;
    }
    ns->set_catalog(catalog);
    
    NamespaceSlot slot = {ns, catalog, kind};
    if (!m_namespaces.push_back(slot)) {
        delete ns;
        delete catalog;
        return nullptr;
    }
    
    LOG_DEBUG(TAG, "created namespace %s (parent %s)", name, parent ? parent->get_name() : "none");
    return ns;
}

LinkResult BootModuleLoader::load_catalog(Namespace& ns) {
    ModuleCatalog* catalog = ns.get_catalog();
    LinkResult firstError = LinkResult::SUCCESS;
    
    for (u32 i = 0; i < catalog->size(); i++) {
        CatalogEntry entry = {};
        if (!catalog->get(i, entry)) break;
        
        // May already be in by way of an on-demand load
        ModuleHandle handle = INVALID_MODULE;
        if (ns.get_module(entry.name, handle, false)) continue;
        
        ModuleImage image = {entry.name, entry.data, entry.size};
        LinkResult result = m_loader.load(ns, image, handle);
        if (result != LinkResult::SUCCESS) {
            LOG_ERROR(TAG, "boot module %s failed to load: %s", entry.name, result_to_string(result));
            if (firstError == LinkResult::SUCCESS) {
                firstError = result;
            }
        }
    }
    return firstError;
}

LinkResult BootModuleLoader::load_boot_modules(const BootModule* modules, u32 count) {
    if (!modules && count) {
        return LinkResult::INVALID_PARAMETER;
    }
    if (!get_or_create_namespace(ModuleKind::KERNEL, "")) {
        return LinkResult::OUT_OF_MEMORY;
    }
    
    LinkResult firstError = LinkResult::SUCCESS;
    for (u32 i = 0; i < count; i++) {
        BootModuleName parsed = {};
        if (!parse_boot_module_name(modules[i].name, parsed)) {
            LOG_WARN(TAG, "ignoring boot module with unrecognized name %s", modules[i].name);
            continue;
        }
        
        Namespace* ns = get_or_create_namespace(parsed.kind, parsed.personality);
        if (!ns) {
            return LinkResult::OUT_OF_MEMORY;
        }
        if (!ns->get_catalog()->add(parsed.moduleName, modules[i].data, modules[i].size)) {
            LOG_ERROR(TAG, "cannot catalog %s in %s", parsed.moduleName, ns->get_name());
            if (firstError == LinkResult::SUCCESS) {
                firstError = LinkResult::INVALID_PARAMETER;
            }
        }
    }
    
    // Namespaces are created parents first, so the base layer loads before personalities
    for (u32 i = 0; i < m_namespaces.size(); i++) {
        if (m_namespaces[i].kind != ModuleKind::KERNEL) continue;
        
        LinkResult result = load_catalog(*m_namespaces[i].ns);
        if (result != LinkResult::SUCCESS && firstError == LinkResult::SUCCESS) {
            firstError = result;
        }
    }
    
    LOG_INFO(TAG, "%u boot modules cataloged, %u modules loaded", count, m_loader.get_registry().module_count());
    return firstError;
}

u32 BootModuleLoader::shutdown() {
    ModuleRegistry& registry = m_loader.get_registry();
    
    // Cross-namespace references can need several rounds
    u32 remaining = 0;
    for (u32 round = 0; round < m_namespaces.size() + 1; round++) {
        remaining = 0;
        for (u32 i = m_namespaces.size(); i > 0; i--) {
            remaining += registry.unload_namespace(*m_namespaces[i - 1].ns);
        }
        if (remaining == 0) break;
    }
    return remaining;
}

} // namespace strata::modules
