#include "modules/module_registry.hpp"
#include "core/utils.hpp"
#include "debug/klog.hpp"

namespace strata::modules {

using namespace strata::utils;
using strata::sync::ReadGuard;
using strata::sync::WriteGuard;

static const char* const TAG = "registry";

ModuleRegistry::ModuleRegistry(const MemoryServices& services)
    : m_sectionLoader(services), m_moduleCount(0) {}

ModuleRegistry::~ModuleRegistry() {
    // Namespaces may already be gone at teardown, so only memory is released here
    for (u32 i = 0; i < m_slots.size(); i++) {
        LoadedModule* module = m_slots[i].module;
        if (!module) continue;
        
        if (module->refCount || module->dependent_count()) {
            LOG_DEBUG(TAG, "releasing %s with %u references at teardown", module->get_name(), module->refCount);
        }
        m_slots[i].module = nullptr;
        destroy(module);
    }
    m_moduleCount = 0;
}

LoadedModule* ModuleRegistry::lookup_locked(ModuleHandle module) const {
    if (!module.is_valid() || module.index >= m_slots.size()) {
        return nullptr;
    }
    
    const ModuleSlot& slot = m_slots[module.index];
    if (!slot.module || slot.generation != module.generation) {
        return nullptr;
    }
    return slot.module;
}

//=============================================================================
// Lifecycle
//=============================================================================

LinkResult ModuleRegistry::pin(ModuleHandle module) {
    WriteGuard guard(m_graphLock);
    
    LoadedModule* target = lookup_locked(module);
    if (!target) {
        return LinkResult::INVALID_HANDLE;
    }
    target->refCount++;
    return LinkResult::SUCCESS;
}

void ModuleRegistry::unpin(ModuleHandle module) {
    WriteGuard guard(m_graphLock);
    
    LoadedModule* target = lookup_locked(module);
    if (!target || target->refCount == 0) {
        LOG_ERROR(TAG, "unbalanced unpin of module %u", module.index);
        return;
    }
    target->refCount--;
}

LinkResult ModuleRegistry::reserve_slot(LoadedModule* module, u32& index) {
    for (index = 0; index < m_slots.size(); index++) {
        if (!m_slots[index].module) break;
    }
    
    if (index == m_slots.size()) {
        ModuleSlot slot = {nullptr, 0};
        if (!m_slots.push_back(slot)) {
            return LinkResult::OUT_OF_MEMORY;
        }
    }
    
    ModuleSlot& slot = m_slots[index];
    if (++slot.generation == 0 || slot.generation == PENDING_GENERATION) {
        slot.generation = 1;
    }
    module->handle.index = index;
    module->handle.generation = slot.generation;
    return LinkResult::SUCCESS;
}

static void remove_dependent(LoadedSection& section, ModuleHandle source, u32 relocationIndex) {
    for (u32 i = 0; i < section.dependents.size(); i++) {
        const DependentRecord& record = section.dependents[i];
        if (record.sourceModule == source && record.relocationIndex == relocationIndex) {
            section.dependents.remove_at(i);
            return;
        }
    }
}

LinkResult ModuleRegistry::link_dependents(LoadedModule& module) {
    for (u32 i = 0; i < module.relocations.size(); i++) {
        const RelocationRecord& relocation = module.relocations[i];
        if (!relocation.crossModule) continue;
        
        LoadedModule* target = lookup_locked(relocation.target.module);
        LinkResult result = LinkResult::SUCCESS;
        if (!target || relocation.target.sectionIndex >= target->sections.size()) {
            LOG_ERROR(TAG, "%s: relocation %u targets a module that is gone", module.get_name(), i);
            result = LinkResult::INVARIANT_VIOLATION;
        } else {
            DependentRecord record = {module.handle, i};
            if (!target->sections[relocation.target.sectionIndex].dependents.push_back(record)) {
                result = LinkResult::OUT_OF_MEMORY;
            }
        }
        
        if (result != LinkResult::SUCCESS) {
            for (u32 j = 0; j < i; j++) {
                const RelocationRecord& undo = module.relocations[j];
                if (!undo.crossModule) continue;
                LoadedModule* undoTarget = lookup_locked(undo.target.module);
                remove_dependent(undoTarget->sections[undo.target.sectionIndex], module.handle, j);
            }
            return result;
        }
    }
    return LinkResult::SUCCESS;
}

void ModuleRegistry::remove_dependent_records(LoadedModule& module) {
    for (u32 i = 0; i < module.strongDependencies.size(); i++) {
        LoadedModule* target = lookup_locked(module.strongDependencies[i].target);
        if (!target) continue;
        
        for (u32 s = 0; s < target->sections.size(); s++) {
            DynamicArray<DependentRecord>& dependents = target->sections[s].dependents;
            for (u32 d = dependents.size(); d > 0; d--) {
                if (dependents[d - 1].sourceModule == module.handle) {
                    dependents.remove_at(d - 1);
                }
            }
        }
    }
}

void ModuleRegistry::unlink_dependencies(LoadedModule& module) {
    remove_dependent_records(module);
    
    for (u32 i = 0; i < module.strongDependencies.size(); i++) {
        LoadedModule* target = lookup_locked(module.strongDependencies[i].target);
        if (!target || target->refCount == 0) {
            LOG_ERROR(TAG, "%s: unbalanced strong dependency", module.get_name());
            continue;
        }
        target->refCount--;
    }
    module.strongDependencies.clear();
}

//=============================================================================
// Commit
//=============================================================================

ModuleRegistry::StagedCommit::~StagedCommit() {
    for (u32 i = 0; i < batches.size(); i++) {
        delete batches[i];
    }
}

void ModuleRegistry::release_slots(StagedCommit& staged) {
    for (u32 i = 0; i < staged.reservedSlots; i++) {
        LoadedModule* module = staged.modules[i];
        m_slots[module->handle.index].module = nullptr;
        module->handle = INVALID_MODULE;
    }
    staged.reservedSlots = 0;
}

void ModuleRegistry::bind_pending(StagedCommit& staged) {
    for (u32 i = 0; i < staged.count; i++) {
        LoadedModule* module = staged.modules[i];
        
        for (u32 r = 0; r < module->relocations.size(); r++) {
            RelocationRecord& relocation = module->relocations[r];
            if (relocation.crossModule && relocation.target.module.is_pending()) {
                relocation.target.module = staged.modules[relocation.target.module.index]->handle;
            }
        }
        for (u32 e = 0; e < module->strongDependencies.size(); e++) {
            StrongDependency& edge = module->strongDependencies[e];
            if (!edge.target.is_pending()) continue;
            
            LoadedModule* target = staged.modules[edge.target.index];
            edge.target = target->handle;
            target->refCount++;
        }
    }
}

static i32 batch_index_of(const LoadedModule* const* modules, u32 count, ModuleHandle handle) {
    for (u32 i = 0; i < count; i++) {
        if (modules[i]->handle == handle) {
            return static_cast<i32>(i);
        }
    }
    return -1;
}

void ModuleRegistry::unbind_pending(StagedCommit& staged) {
    for (u32 i = 0; i < staged.count; i++) {
        LoadedModule* module = staged.modules[i];
        
        for (u32 r = 0; r < module->relocations.size(); r++) {
            RelocationRecord& relocation = module->relocations[r];
            if (!relocation.crossModule) continue;
            
            i32 index = batch_index_of(staged.modules, staged.count, relocation.target.module);
            if (index >= 0) {
                relocation.target.module = pending_module_handle(static_cast<u32>(index));
            }
        }
        for (u32 e = 0; e < module->strongDependencies.size(); e++) {
            StrongDependency& edge = module->strongDependencies[e];
            i32 index = batch_index_of(staged.modules, staged.count, edge.target);
            if (index < 0) continue;
            
            staged.modules[index]->refCount--;
            edge.target = pending_module_handle(static_cast<u32>(index));
        }
    }
}

LinkResult ModuleRegistry::stage_locked(StagedCommit& staged, const ModuleHandle* replaced, u32 replacedCount,
                                        const LoadedModule* const* aliasesFrom) {
    LinkResult result = LinkResult::SUCCESS;
    if (!staged.batches.reserve(staged.count) || !staged.group.reserve(staged.count) ||
        !staged.groupReplaced.reserve(replacedCount)) {
        return LinkResult::OUT_OF_MEMORY;
    }
    
    // Slots are occupied right away so the next reservation picks another one
    for (u32 i = 0; i < staged.count; i++) {
        u32 index = 0;
        result = reserve_slot(staged.modules[i], index);
        if (result != LinkResult::SUCCESS) {
            release_slots(staged);
            return result;
        }
        m_slots[index].module = staged.modules[i];
        staged.reservedSlots++;
    }
    
    DynamicArray<SymbolBatch*> peers;
    for (u32 i = 0; i < staged.count && result == LinkResult::SUCCESS; i++) {
        SymbolBatch* batch = new (std::nothrow) SymbolBatch();
        if (!batch || !staged.batches.push_back(batch)) {
            delete batch;
            result = LinkResult::OUT_OF_MEMORY;
            break;
        }
        
        peers.clear();
        for (u32 j = 0; j < i; j++) {
            if (staged.namespaces[j] == staged.namespaces[i] && !peers.push_back(staged.batches[j])) {
                result = LinkResult::OUT_OF_MEMORY;
                break;
            }
        }
        if (result == LinkResult::SUCCESS) {
            result = staged.namespaces[i]->prepare_insert(*staged.modules[i], replaced, replacedCount,
                                                          aliasesFrom ? aliasesFrom[i] : nullptr,
                                                          peers.data(), peers.size(), *batch);
        }
    }
    if (result != LinkResult::SUCCESS) {
        release_slots(staged);
        return result;
    }
    
    bind_pending(staged);
    for (u32 i = 0; i < staged.count; i++) {
        result = link_dependents(*staged.modules[i]);
        if (result != LinkResult::SUCCESS) {
            for (u32 j = 0; j < i; j++) {
                remove_dependent_records(*staged.modules[j]);
            }
            unbind_pending(staged);
            release_slots(staged);
            return result;
        }
    }
    return LinkResult::SUCCESS;
}

void ModuleRegistry::unstage_locked(StagedCommit& staged) {
    for (u32 i = 0; i < staged.count; i++) {
        remove_dependent_records(*staged.modules[i]);
    }
    unbind_pending(staged);
    release_slots(staged);
}

void ModuleRegistry::publish_locked(StagedCommit& staged, const ModuleHandle* replaced, u32 replacedCount) {
    // One publish per namespace, so readers never see half of a set; capacity comes from stage_locked()
    for (u32 i = 0; i < staged.count; i++) {
        Namespace* ns = staged.namespaces[i];
        bool seen = false;
        for (u32 j = 0; j < i; j++) {
            if (staged.namespaces[j] == ns) {
                seen = true;
                break;
            }
        }
        if (seen) continue;
        
        staged.group.clear();
        staged.groupReplaced.clear();
        for (u32 j = i; j < staged.count; j++) {
            if (staged.namespaces[j] == ns && !staged.group.push_back(staged.batches[j])) {
                LOG_ERROR(TAG, "%s: publish group truncated", ns->get_name());
            }
        }
        for (u32 r = 0; r < replacedCount; r++) {
            const LoadedModule* old = lookup_locked(replaced[r]);
            if (old && old->get_namespace() == ns && !staged.groupReplaced.push_back(replaced[r])) {
                LOG_ERROR(TAG, "%s: replaced list truncated", ns->get_name());
            }
        }
        ns->publish(staged.group.data(), staged.group.size(), staged.groupReplaced.data(),
                    staged.groupReplaced.size());
    }
    
    for (u32 i = 0; i < staged.count; i++) {
        LoadedModule* module = staged.modules[i];
        module->set_namespace(staged.namespaces[i]);
        m_moduleCount++;
        
        LOG_INFO(TAG, "committed %s into %s (%u exports, %u relocations)", module->get_name(),
                 staged.namespaces[i]->get_name(), module->exports.size(), module->relocations.size());
    }
    staged.reservedSlots = 0;
}

LinkResult ModuleRegistry::commit_batch(LoadedModule* const* modules, Namespace* const* namespaces, u32 count,
                                        ModuleHandle* handles) {
    if (!modules || !namespaces || !handles || count == 0) {
        return LinkResult::INVALID_PARAMETER;
    }
    for (u32 i = 0; i < count; i++) {
        if (!modules[i] || !namespaces[i]) {
            return LinkResult::INVALID_PARAMETER;
        }
    }
    
    WriteGuard guard(m_graphLock);
    
    StagedCommit staged(modules, namespaces, count);
    LinkResult result = stage_locked(staged, nullptr, 0, nullptr);
    if (result != LinkResult::SUCCESS) {
        return result;
    }
    
    // Publish point: nothing below can fail
    publish_locked(staged, nullptr, 0);
    for (u32 i = 0; i < count; i++) {
        handles[i] = modules[i]->handle;
    }
    return LinkResult::SUCCESS;
}

LinkResult ModuleRegistry::commit(Namespace& ns, LoadedModule* module, ModuleHandle& handle) {
    Namespace* namespaces[1] = {&ns};
    LoadedModule* modules[1] = {module};
    return commit_batch(modules, namespaces, 1, &handle);
}

LinkResult ModuleRegistry::drop_locked(LoadedModule* module) {
    u32 dependents = module->dependent_count();
    if (module->refCount != 0 || dependents != 0) {
        LOG_ERROR(TAG, "refusing to drop %s: %u references, %u dependents",
                  module->get_name(), module->refCount, dependents);
        return LinkResult::INVARIANT_VIOLATION;
    }
    
    Namespace* ns = module->get_namespace();
    if (ns && !module->detached) {
        ns->remove_module(module->handle);
    }
    module->set_namespace(nullptr);
    
    unlink_dependencies(*module);
    m_slots[module->handle.index].module = nullptr;
    m_moduleCount--;
    return LinkResult::SUCCESS;
}

void ModuleRegistry::destroy(LoadedModule* module) {
    m_sectionLoader.release_regions(module->regions, REGION_COUNT);
    delete module;
}

LinkResult ModuleRegistry::unload(ModuleHandle handle) {
    LoadedModule* module = nullptr;
    {
        WriteGuard guard(m_graphLock);
        
        module = lookup_locked(handle);
        if (!module) {
            return LinkResult::INVALID_HANDLE;
        }
        
        u32 dependents = module->dependent_count();
        if (module->refCount != 0 || dependents != 0) {
            LOG_WARN(TAG, "cannot unload %s: %u references, %u dependents",
                     module->get_name(), module->refCount, dependents);
            return LinkResult::MODULE_STILL_IN_USE;
        }
        
        LinkResult result = drop_locked(module);
        if (result != LinkResult::SUCCESS) {
            return result;
        }
    }
    
    LOG_INFO(TAG, "unloaded %s", module->get_name());
    destroy(module);
    return LinkResult::SUCCESS;
}

static bool contains_module(const DynamicArray<LoadedModule*>& modules, ModuleHandle handle) {
    for (u32 i = 0; i < modules.size(); i++) {
        if (modules[i]->handle == handle) {
            return true;
        }
    }
    return false;
}

LinkResult ModuleRegistry::unload_batch(const ModuleHandle* handles, u32 count) {
    if (!handles || count == 0) {
        return LinkResult::INVALID_PARAMETER;
    }
    
    DynamicArray<LoadedModule*> modules;
    {
        WriteGuard guard(m_graphLock);
        
        for (u32 i = 0; i < count; i++) {
            LoadedModule* module = lookup_locked(handles[i]);
            if (!module) {
                return LinkResult::INVALID_HANDLE;
            }
            if (contains_module(modules, handles[i])) {
                return LinkResult::INVALID_PARAMETER;
            }
            if (!modules.push_back(module)) {
                return LinkResult::OUT_OF_MEMORY;
            }
        }
        
        // Every reference must come from a strong dependency inside the set
        for (u32 i = 0; i < modules.size(); i++) {
            LoadedModule* module = modules[i];
            u32 internal = 0;
            for (u32 j = 0; j < modules.size(); j++) {
                if (modules[j]->find_strong_dependency(module->handle)) internal++;
            }
            
            bool outside = module->refCount != internal;
            for (u32 s = 0; s < module->sections.size() && !outside; s++) {
                const DynamicArray<DependentRecord>& dependents = module->sections[s].dependents;
                for (u32 d = 0; d < dependents.size(); d++) {
                    if (!contains_module(modules, dependents[d].sourceModule)) {
                        outside = true;
                        break;
                    }
                }
            }
            if (outside) {
                LOG_WARN(TAG, "cannot unload %s with its set: referenced from outside", module->get_name());
                return LinkResult::MODULE_STILL_IN_USE;
            }
        }
        
        for (u32 i = 0; i < modules.size(); i++) {
            unlink_dependencies(*modules[i]);
        }
        for (u32 i = 0; i < modules.size(); i++) {
            LinkResult result = drop_locked(modules[i]);
            if (result != LinkResult::SUCCESS) {
                // A module the graph refuses to drop stays registered
                modules.remove_at(i);
                i--;
            }
        }
    }
    
    for (u32 i = 0; i < modules.size(); i++) {
        LOG_INFO(TAG, "unloaded %s", modules[i]->get_name());
        destroy(modules[i]);
    }
    return modules.size() == count ? LinkResult::SUCCESS : LinkResult::INVARIANT_VIOLATION;
}

static void collect_member(ModuleHandle module, const char*, void* context) {
    DynamicArray<ModuleHandle>* members = static_cast<DynamicArray<ModuleHandle>*>(context);
    if (!members->push_back(module)) {
        LOG_WARN(TAG, "namespace member list truncated");
    }
}

u32 ModuleRegistry::unload_namespace(Namespace& ns) {
    bool progress = true;
    while (progress) {
        progress = false;
        
        DynamicArray<ModuleHandle> members;
        ns.for_each_module(collect_member, &members, false);
        for (u32 i = 0; i < members.size(); i++) {
            if (unload(members[i]) == LinkResult::SUCCESS) {
                progress = true;
            }
        }
    }
    
    // Whatever is left may only reference itself
    if (ns.module_count()) {
        DynamicArray<ModuleHandle> members;
        ns.for_each_module(collect_member, &members, false);
        if (members.size() && unload_batch(members.data(), members.size()) != LinkResult::SUCCESS) {
            LOG_DEBUG(TAG, "%s: remaining modules are referenced from outside", ns.get_name());
        }
    }
    
    u32 remaining = ns.module_count();
    if (remaining) {
        LOG_WARN(TAG, "%s: %u modules still referenced from other namespaces", ns.get_name(), remaining);
    }
    return remaining;
}

void ModuleRegistry::forget_namespace(const Namespace& ns) {
    WriteGuard guard(m_graphLock);
    
    for (u32 i = 0; i < m_slots.size(); i++) {
        LoadedModule* module = m_slots[i].module;
        if (module && module->get_namespace() == &ns) {
            module->set_namespace(nullptr);
        }
    }
}

//=============================================================================
// Queries
//=============================================================================

bool ModuleRegistry::is_live(ModuleHandle module) const {
    ReadGuard guard(m_graphLock);
    return lookup_locked(module) != nullptr;
}

const LoadedModule* ModuleRegistry::get_module(ModuleHandle module) const {
    ReadGuard guard(m_graphLock);
    return lookup_locked(module);
}

u32 ModuleRegistry::module_count() const {
    ReadGuard guard(m_graphLock);
    return m_moduleCount;
}

bool ModuleRegistry::get_section_containing_address(uintptr_t addr, SectionRef& section) const {
    ReadGuard guard(m_graphLock);
    
    for (u32 i = 0; i < m_slots.size(); i++) {
        const LoadedModule* module = m_slots[i].module;
        if (!module) continue;
        
        i32 index = module->section_containing(addr);
        if (index >= 0) {
            section.module = module->handle;
            section.sectionIndex = static_cast<u32>(index);
            return true;
        }
    }
    return false;
}

bool ModuleRegistry::get_module_containing_address(uintptr_t addr, ModuleHandle& module) const {
    ReadGuard guard(m_graphLock);
    
    for (u32 i = 0; i < m_slots.size(); i++) {
        const LoadedModule* candidate = m_slots[i].module;
        if (candidate && candidate->contains_address(addr)) {
            module = candidate->handle;
            return true;
        }
    }
    return false;
}

bool ModuleRegistry::section_address(const SectionRef& section, uintptr_t& address, u64& size) const {
    ReadGuard guard(m_graphLock);
    
    const LoadedModule* module = lookup_locked(section.module);
    if (!module || section.sectionIndex >= module->sections.size()) {
        return false;
    }
    address = module->sections[section.sectionIndex].address;
    size = module->sections[section.sectionIndex].size;
    return true;
}

u32 ModuleRegistry::modules_dependent_on(ModuleHandle handle, ModuleHandle* results, u32 maxResults) const {
    ReadGuard guard(m_graphLock);
    
    const LoadedModule* module = lookup_locked(handle);
    if (!module) {
        return 0;
    }
    
    DynamicArray<ModuleHandle> found;
    for (u32 s = 0; s < module->sections.size(); s++) {
        const DynamicArray<DependentRecord>& dependents = module->sections[s].dependents;
        for (u32 d = 0; d < dependents.size(); d++) {
            bool seen = false;
            for (u32 k = 0; k < found.size(); k++) {
                if (found[k] == dependents[d].sourceModule) {
                    seen = true;
                    break;
                }
            }
            if (!seen && !found.push_back(dependents[d].sourceModule)) {
                LOG_WARN(TAG, "dependent list of %s truncated", module->get_name());
            }
        }
    }
    
    for (u32 i = 0; i < found.size() && i < maxResults; i++) {
        results[i] = found[i];
    }
    return found.size();
}

u32 ModuleRegistry::modules_depended_on_by(ModuleHandle handle, ModuleHandle* results, u32 maxResults) const {
    ReadGuard guard(m_graphLock);
    
    const LoadedModule* module = lookup_locked(handle);
    if (!module) {
        return 0;
    }
    
    u32 count = module->strongDependencies.size();
    for (u32 i = 0; i < count && i < maxResults; i++) {
        results[i] = module->strongDependencies[i].target;
    }
    return count;
}

bool ModuleRegistry::get_usage(ModuleHandle handle, u32& refCount, u32& dependents) const {
    ReadGuard guard(m_graphLock);
    
    const LoadedModule* module = lookup_locked(handle);
    if (!module) {
        return false;
    }
    refCount = module->refCount;
    dependents = module->dependent_count();
    return true;
}

} // namespace strata::modules
