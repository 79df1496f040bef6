#include "modules/swap.hpp"
#include "modules/relocation.hpp"
#include "core/utils.hpp"
#include "debug/klog.hpp"

namespace strata::modules {

using namespace strata::utils;
using strata::sync::ReadGuard;
using strata::sync::WriteGuard;
using strata::formats::STT_FUNC;
using strata::formats::STT_NOTYPE;
using strata::formats::STT_OBJECT;
using strata::loaders::RegionKind;

static const char* const TAG = "swap";

/**
 * @brief Calls state transfer entry points in place
 */
class DirectStateTransfer : public StateTransferRunner {
public:
    LinkResult run(const char*, uintptr_t entry, const StateTransferContext& context) override {
        StateTransferFunction function = reinterpret_cast<StateTransferFunction>(entry);
        return function(context);
    }
};

static DirectStateTransfer g_directStateTransfer;

SwapCoordinator::SwapCoordinator(ModuleRegistry& registry) : m_registry(registry) {}

LinkResult SwapCoordinator::check_quiescence(ModuleHandle module, TaskQueryService* service) {
    if (!service) {
        return LinkResult::SUCCESS;
    }
    
    VirtualRange text = {};
    {
        ReadGuard guard(m_registry.m_graphLock);
        const LoadedModule* target = m_registry.lookup_locked(module);
        if (!target) {
            return LinkResult::INVALID_HANDLE;
        }
        text = target->regions[static_cast<u32>(RegionKind::TEXT)].pages;
    }
    
    if (text.is_empty()) {
        return LinkResult::SUCCESS;
    }
    
    u32 tasks = service->count_tasks_executing_in(text.start, text.end());
    if (tasks) {
        LOG_WARN(TAG, "%u tasks executing in module %u", tasks, module.index);
        return LinkResult::MODULE_BUSY;
    }
    return LinkResult::SUCCESS;
}

//=============================================================================
// Planning
//=============================================================================

static bool contains_handle(const DynamicArray<ModuleHandle>& handles, ModuleHandle handle) {
    for (u32 i = 0; i < handles.size(); i++) {
        if (handles[i] == handle) {
            return true;
        }
    }
    return false;
}

static bool contains_module(const DynamicArray<LoadedModule*>& modules, const LoadedModule* module) {
    for (u32 i = 0; i < modules.size(); i++) {
        if (modules[i] == module) {
            return true;
        }
    }
    return false;
}

LinkResult SwapCoordinator::plan_retargets(LoadedModule& old, LoadedModule& replacement,
                                           const DynamicArray<LoadedModule*>& replaced,
                                           DynamicArray<Retarget>& plan) {
    for (u32 s = 0; s < old.sections.size(); s++) {
        const LoadedSection& oldSection = old.sections[s];
        
        for (u32 d = 0; d < oldSection.dependents.size(); d++) {
            const DependentRecord& dependent = oldSection.dependents[d];
            LoadedModule* source = m_registry.lookup_locked(dependent.sourceModule);
            if (!source || dependent.relocationIndex >= source->relocations.size()) {
                LOG_ERROR(TAG, "%s: stale dependent record", old.get_name());
                return LinkResult::INVARIANT_VIOLATION;
            }
            // Replaced along with old: its sites keep pointing at the old code
            if (contains_module(replaced, source)) continue;
            
            const RelocationRecord& relocation = source->relocations[dependent.relocationIndex];
            const ExportedSymbol* oldExport = old.find_export(relocation.symbolName);
            if (!oldExport) {
                oldExport = old.find_export_without_hash(relocation.symbolName);
            }
            const ExportedSymbol* newExport = replacement.find_export(relocation.symbolName);
            if (!newExport) {
                newExport = replacement.find_export_without_hash(relocation.symbolName);
            }
            
            if (!newExport) {
                LOG_ERROR(TAG, "%s does not provide %s used by %s", replacement.get_name(),
                          relocation.symbolName, source->get_name());
                return LinkResult::INCONSISTENT_SWAP_TARGET;
            }
            if (oldExport && oldExport->type != newExport->type &&
                oldExport->type != STT_NOTYPE && newExport->type != STT_NOTYPE) {
                LOG_ERROR(TAG, "%s changed symbol type (%u -> %u)", relocation.symbolName,
                          oldExport->type, newExport->type);
                return LinkResult::INCONSISTENT_SWAP_TARGET;
            }
            
            const LoadedSection& newSection = replacement.sections[newExport->sectionIndex];
            if (newSection.region != oldSection.region) {
                LOG_ERROR(TAG, "%s moved from a %s to a %s section", relocation.symbolName,
                          loaders::section_type_name(oldSection.type), loaders::section_type_name(newSection.type));
                return LinkResult::INCONSISTENT_SWAP_TARGET;
            }
            
            Retarget retarget = {};
            retarget.old = &old;
            retarget.replacement = &replacement;
            retarget.source = source;
            retarget.relocationIndex = dependent.relocationIndex;
            retarget.oldSection = s;
            retarget.newSection = newExport->sectionIndex;
            retarget.newOffset = newExport->offset;
            retarget.newSize = newExport->size;
            retarget.site = source->sections[relocation.sourceSection].address + relocation.offset;
            
            LinkResult result = RelocationResolver::compute_value(relocation.kind,
                replacement.export_address(*newExport), relocation.addend, retarget.site,
                newExport->size, retarget.value, retarget.width);
            if (result != LinkResult::SUCCESS) {
                LOG_ERROR(TAG, "retargeting %s in %s: %s", relocation.symbolName, source->get_name(),
                          result_to_string(result));
                return result;
            }
            
            if (!plan.push_back(retarget)) {
                return LinkResult::OUT_OF_MEMORY;
            }
        }
    }
    return LinkResult::SUCCESS;
}

LinkResult SwapCoordinator::reserve_commit_space(DynamicArray<Retarget>& plan, u32 replacementCount) {
    for (u32 i = 0; i < plan.size(); i++) {
        bool counted = false;
        for (u32 j = 0; j < i; j++) {
            if (plan[j].replacement == plan[i].replacement && plan[j].newSection == plan[i].newSection) {
                counted = true;
                break;
            }
        }
        if (counted) continue;
        
        u32 incoming = 0;
        for (u32 j = i; j < plan.size(); j++) {
            if (plan[j].replacement == plan[i].replacement && plan[j].newSection == plan[i].newSection) incoming++;
        }
        DynamicArray<DependentRecord>& dependents = plan[i].replacement->sections[plan[i].newSection].dependents;
        if (!dependents.reserve(dependents.size() + incoming)) {
            return LinkResult::OUT_OF_MEMORY;
        }
    }
    
    // Each source gains at most one new strong dependency per replacement
    DynamicArray<ModuleHandle> sources;
    for (u32 i = 0; i < plan.size(); i++) {
        LoadedModule* source = plan[i].source;
        if (contains_handle(sources, source->handle)) continue;
        
        if (!sources.push_back(source->handle) ||
            !source->strongDependencies.reserve(source->strongDependencies.size() + replacementCount)) {
            return LinkResult::OUT_OF_MEMORY;
        }
    }
    return LinkResult::SUCCESS;
}

//=============================================================================
// Journaled writes
//=============================================================================

void SwapCoordinator::rollback(DynamicArray<UndoEntry>& undo) {
    for (u32 i = undo.size(); i > 0; i--) {
        const UndoEntry& entry = undo[i - 1];
        RelocationResolver::write_value(entry.site, entry.previous, entry.width);
    }
    undo.clear();
}

void SwapCoordinator::restore_regions(DynamicArray<WritableRegion>& regions) {
    loaders::SectionLoader& loader = m_registry.get_section_loader();
    for (u32 i = 0; i < regions.size(); i++) {
        WritableRegion& writable = regions[i];
        if (loader.restore_flags(writable.module->regions[writable.region], writable.flags) != LinkResult::SUCCESS) {
            LOG_ERROR(TAG, "%s: could not restore region %u permissions", writable.module->get_name(), writable.region);
        }
    }
    regions.clear();
}

LinkResult SwapCoordinator::apply_retargets(DynamicArray<Retarget>& plan) {
    loaders::SectionLoader& loader = m_registry.get_section_loader();
    DynamicArray<WritableRegion> regions;
    DynamicArray<UndoEntry> undo;
    LinkResult result = LinkResult::SUCCESS;
    
    if (!undo.reserve(plan.size())) {
        return LinkResult::OUT_OF_MEMORY;
    }
    
    for (u32 i = 0; i < plan.size() && result == LinkResult::SUCCESS; i++) {
        const Retarget& retarget = plan[i];
        const RelocationRecord& relocation = retarget.source->relocations[retarget.relocationIndex];
        u32 regionIndex = retarget.source->sections[relocation.sourceSection].region;
        MappedRegion& region = retarget.source->regions[regionIndex];
        
        // Text and rodata of the source are opened for the duration of the writes
        bool opened = false;
        for (u32 r = 0; r < regions.size(); r++) {
            if (regions[r].module == retarget.source && regions[r].region == regionIndex) {
                opened = true;
                break;
            }
        }
        if (!opened && !(region.flags & PAGE_WRITE)) {
            WritableRegion writable = {retarget.source, regionIndex, region.flags};
            bool changed = false;
            if (!regions.push_back(writable)) {
                result = LinkResult::OUT_OF_MEMORY;
                break;
            }
            result = loader.make_writable(region, changed);
            if (result != LinkResult::SUCCESS) {
                regions.pop_back();
                break;
            }
        }
        
        UndoEntry entry = {retarget.site, RelocationResolver::read_value(retarget.site, retarget.width), retarget.width};
        if (!undo.push_back(entry)) {
            result = LinkResult::OUT_OF_MEMORY;
            break;
        }
        RelocationResolver::write_value(retarget.site, retarget.value, retarget.width);
    }
    
    if (result != LinkResult::SUCCESS) {
        LOG_ERROR(TAG, "retarget write failed (%s), restoring %u sites", result_to_string(result), undo.size());
        rollback(undo);
    }
    restore_regions(regions);
    return result;
}

//=============================================================================
// Commit
//=============================================================================

void SwapCoordinator::transfer_state(const LoadedModule& old, LoadedModule& replacement) {
    u32 dataRegion = static_cast<u32>(RegionKind::DATA);
    
    for (u32 i = 0; i < old.exports.size(); i++) {
        const ExportedSymbol& oldSymbol = old.exports[i];
        if (oldSymbol.type != STT_OBJECT || old.sections[oldSymbol.sectionIndex].region != dataRegion) continue;
        
        const ExportedSymbol* newSymbol = replacement.find_export(oldSymbol.name);
        if (!newSymbol) {
            newSymbol = replacement.find_export_without_hash(oldSymbol.name);
        }
        if (!newSymbol || newSymbol->size != oldSymbol.size ||
            replacement.sections[newSymbol->sectionIndex].region != dataRegion) {
            continue;
        }
        
        memcpy(reinterpret_cast<void*>(replacement.export_address(*newSymbol)),
               reinterpret_cast<const void*>(old.export_address(oldSymbol)), oldSymbol.size);
        LOG_DEBUG(TAG, "transferred %llu bytes of %s", oldSymbol.size, oldSymbol.name);
    }
}

void SwapCoordinator::move_dependents(DynamicArray<Retarget>& plan) {
    for (u32 i = 0; i < plan.size(); i++) {
        const Retarget& retarget = plan[i];
        LoadedModule& old = *retarget.old;
        LoadedModule& replacement = *retarget.replacement;
        LoadedModule* source = retarget.source;
        
        DynamicArray<DependentRecord>& oldDependents = old.sections[retarget.oldSection].dependents;
        for (u32 d = 0; d < oldDependents.size(); d++) {
            if (oldDependents[d].sourceModule == source->handle &&
                oldDependents[d].relocationIndex == retarget.relocationIndex) {
                oldDependents.remove_at(d);
                break;
            }
        }
        
        // Capacity reserved by reserve_commit_space()
        DependentRecord record = {source->handle, retarget.relocationIndex};
        if (!replacement.sections[retarget.newSection].dependents.push_back(record)) {
            LOG_ERROR(TAG, "lost dependent record of %s", source->get_name());
        }
        
        RelocationRecord& relocation = source->relocations[retarget.relocationIndex];
        relocation.target.module = replacement.handle;
        relocation.target.sectionIndex = retarget.newSection;
        relocation.targetOffset = retarget.newOffset;
        relocation.targetSize = retarget.newSize;
        
        for (u32 e = 0; e < source->strongDependencies.size(); e++) {
            StrongDependency& edge = source->strongDependencies[e];
            if (edge.target == old.handle && --edge.edgeCount == 0) {
                source->strongDependencies.remove_at(e);
                old.refCount--;
                break;
            }
        }
        
        StrongDependency* newEdge = source->find_strong_dependency(replacement.handle);
        if (newEdge) {
            newEdge->edgeCount++;
        } else {
            StrongDependency edge = {replacement.handle, 1};
            if (!source->strongDependencies.push_back(edge)) {
                LOG_ERROR(TAG, "lost strong dependency of %s", source->get_name());
                continue;
            }
            replacement.refCount++;
        }
    }
}

LinkResult SwapCoordinator::run_state_transfer(const StateTransferContext& context, const SwapOptions& options) {
    StateTransferRunner* runner = options.stateTransferRunner ? options.stateTransferRunner : &g_directStateTransfer;
    u32 textRegion = static_cast<u32>(RegionKind::TEXT);
    
    for (u32 f = 0; f < options.stateTransferCount; f++) {
        const char* name = options.stateTransferFunctions[f];
        const LoadedModule* owner = nullptr;
        const ExportedSymbol* symbol = nullptr;
        for (u32 i = 0; i < context.count && !symbol; i++) {
            owner = context.newModules[i];
            symbol = owner->find_export(name);
            if (!symbol) {
                symbol = owner->find_export_without_hash(name);
            }
        }
        
        if (!symbol || symbol->type != STT_FUNC || owner->sections[symbol->sectionIndex].region != textRegion) {
            LOG_ERROR(TAG, "no replacement provides state transfer function %s", name);
            return LinkResult::INCONSISTENT_SWAP_TARGET;
        }
        
        LOG_DEBUG(TAG, "running state transfer %s of %s", name, owner->get_name());
        LinkResult result = runner->run(name, owner->export_address(*symbol), context);
        if (result != LinkResult::SUCCESS) {
            LOG_ERROR(TAG, "state transfer %s failed: %s", name, result_to_string(result));
            return result;
        }
    }
    return LinkResult::SUCCESS;
}

LinkResult SwapCoordinator::commit_swap(const ModuleHandle* oldHandles, LoadedModule* const* replacements, u32 count,
                                        const SwapOptions& options, ModuleHandle* newHandles) {
    if (!oldHandles || !replacements || !newHandles || count == 0) {
        return LinkResult::INVALID_PARAMETER;
    }
    for (u32 i = 0; i < count; i++) {
        if (!replacements[i]) {
            return LinkResult::INVALID_PARAMETER;
        }
    }
    
    DynamicArray<LoadedModule*> dropped;
    LinkResult result = commit_swap_locked(oldHandles, replacements, count, options, newHandles, dropped);
    
    // Memory goes back to the allocators outside the graph lock
    for (u32 i = 0; i < dropped.size(); i++) {
        LOG_INFO(TAG, "dropped %s", dropped[i]->get_name());
        m_registry.destroy(dropped[i]);
    }
    return result;
}

LinkResult SwapCoordinator::commit_swap_locked(const ModuleHandle* oldHandles, LoadedModule* const* replacements,
                                               u32 count, const SwapOptions& options, ModuleHandle* newHandles,
                                               DynamicArray<LoadedModule*>& dropped) {
    WriteGuard guard(m_registry.m_graphLock);
    
    DynamicArray<LoadedModule*> olds;
    DynamicArray<Namespace*> namespaces;
    DynamicArray<const LoadedModule*> aliases;
    if (!dropped.reserve(count)) {
        return LinkResult::OUT_OF_MEMORY;
    }
    
    for (u32 i = 0; i < count; i++) {
        LoadedModule* old = m_registry.lookup_locked(oldHandles[i]);
        if (!old) {
            return LinkResult::INVALID_HANDLE;
        }
        if (old->detached || !old->get_namespace() || contains_module(olds, old)) {
            LOG_ERROR(TAG, "%s was already replaced", old->get_name());
            return LinkResult::INVALID_PARAMETER;
        }
        if (!olds.push_back(old) || !namespaces.push_back(old->get_namespace()) ||
            !aliases.push_back(options.reexportNewSymbolsAsOld ? old : nullptr)) {
            return LinkResult::OUT_OF_MEMORY;
        }
    }
    
    // References other than committed dependents and the caller's pin belong to loads in flight
    for (u32 i = 0; i < count; i++) {
        LoadedModule* old = olds[i];
        DynamicArray<ModuleHandle> sources;
        for (u32 s = 0; s < old->sections.size(); s++) {
            const DynamicArray<DependentRecord>& dependents = old->sections[s].dependents;
            for (u32 d = 0; d < dependents.size(); d++) {
                if (!contains_handle(sources, dependents[d].sourceModule) &&
                    !sources.push_back(dependents[d].sourceModule)) {
                    return LinkResult::OUT_OF_MEMORY;
                }
            }
        }
        if (old->refCount != sources.size() + 1) {
            LOG_WARN(TAG, "%s is referenced by a module being loaded", old->get_name());
            return LinkResult::MODULE_BUSY;
        }
    }
    
    DynamicArray<Retarget> plan;
    LinkResult result = LinkResult::SUCCESS;
    for (u32 i = 0; i < count && result == LinkResult::SUCCESS; i++) {
        result = plan_retargets(*olds[i], *replacements[i], olds, plan);
    }
    if (result != LinkResult::SUCCESS) {
        return result;
    }
    
    ModuleRegistry::StagedCommit staged(replacements, namespaces.data(), count);
    result = m_registry.stage_locked(staged, oldHandles, count, aliases.data());
    if (result != LinkResult::SUCCESS) {
        return result;
    }
    
    result = reserve_commit_space(plan, count);
    if (result == LinkResult::SUCCESS) {
        result = apply_retargets(plan);
    }
    if (result != LinkResult::SUCCESS) {
        m_registry.unstage_locked(staged);
        return result;
    }
    
    // Publish point: nothing below can fail
    move_dependents(plan);
    m_registry.publish_locked(staged, oldHandles, count);
    
    for (u32 i = 0; i < count; i++) {
        olds[i]->detached = true;
        olds[i]->refCount--;
        newHandles[i] = replacements[i]->handle;
        LOG_INFO(TAG, "%s replaced by %s", olds[i]->get_name(), replacements[i]->get_name());
    }
    LOG_INFO(TAG, "%u sites retargeted", plan.size());
    
    if (options.dropOldModule) {
        // Edges among the replaced modules go first, so each of them ends up unreferenced
        for (u32 i = 0; i < count; i++) {
            m_registry.unlink_dependencies(*olds[i]);
        }
        for (u32 i = 0; i < count; i++) {
            if (m_registry.drop_locked(olds[i]) != LinkResult::SUCCESS) {
                LOG_ERROR(TAG, "%s stays resident detached", olds[i]->get_name());
            } else if (!dropped.push_back(olds[i])) {
                // Capacity reserved above
                LOG_ERROR(TAG, "lost dropped module %s", olds[i]->get_name());
            }
        }
    }
    return LinkResult::SUCCESS;
}

} // namespace strata::modules
