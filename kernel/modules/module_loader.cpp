#include "modules/module_loader.hpp"
#include "modules/module_catalog.hpp"
#include "modules/module_identity.hpp"
#include "modules/relocation.hpp"
#include "core/utils.hpp"
#include "debug/klog.hpp"

namespace strata::modules {

using namespace strata::utils;
using namespace strata::formats;
using strata::loaders::ObjectDescriptor;
using strata::loaders::ObjectReader;
using strata::loaders::ObjectSymbol;
using strata::loaders::SectionImage;
using strata::loaders::region_for_section;

static const char* const TAG = "loader";

//=============================================================================
// LinkContext - symbol resolution for one member of a batch
//=============================================================================

class ModuleLoader::LinkContext : public SymbolResolver {
public:
    LinkContext(ModuleLoader& loader, LoadBatch& batch, u32 member)
        : m_loader(loader), m_batch(batch), m_member(member) {}

    LinkResult resolve_external(const char* name, bool weak, SymbolLocation& location) override {
        if (lookup(name, location)) {
            return LinkResult::SUCCESS;
        }
        
        BatchMember* self = m_batch.members[m_member];
        const LoaderConfig& config = m_loader.m_config;
        if (!weak && m_batch.allowOnDemand && config.onDemandLoading && self->depth < config.maxOnDemandDepth) {
            if (m_loader.add_on_demand(m_batch, *self->ns, name, self->depth + 1) == LinkResult::SUCCESS &&
                lookup(name, location)) {
                return LinkResult::SUCCESS;
            }
        }
        return LinkResult::UNRESOLVED_SYMBOL;
    }

    // Batch members are held by the batch itself
    LinkResult pin(ModuleHandle module) override {
        if (module.is_pending()) {
            return LinkResult::SUCCESS;
        }
        return m_loader.m_registry.pin(module);
    }

    void unpin(ModuleHandle module) override {
        if (!module.is_pending()) {
            m_loader.m_registry.unpin(module);
        }
    }

private:
    bool lookup(const char* name, SymbolLocation& location) const {
        const Namespace& ns = *m_batch.members[m_member]->ns;
        SymbolLocation published = {};
        SymbolLocation peer = {};
        
        bool inNamespace = ns.lookup_excluding(name, m_batch.excluded, m_batch.excludedCount, published);
        bool inBatch = m_loader.find_member_export(m_batch, m_member, name, false, peer);
        if (!inNamespace && !inBatch && m_loader.m_config.fuzzySymbolMatching) {
            inNamespace = ns.lookup_without_hash(name, m_batch.excluded, m_batch.excludedCount, published);
            inBatch = m_loader.find_member_export(m_batch, m_member, name, true, peer);
            if (inNamespace || inBatch) {
                LOG_DEBUG(TAG, "%s matched ignoring its hash", name);
            }
        }
        
        // A weak definition in the batch stays behind a published one
        if (inBatch && (!inNamespace || peer.binding != STB_WEAK)) {
            location = peer;
            return true;
        }
        if (inNamespace) {
            location = published;
            return true;
        }
        return false;
    }

    ModuleLoader& m_loader;
    LoadBatch& m_batch;
    u32 m_member;
};

//=============================================================================
// ModuleLoader Implementation
//=============================================================================

ModuleLoader::LoadBatch::~LoadBatch() {
    for (u32 i = 0; i < members.size(); i++) {
        delete members[i];
    }
}

ModuleLoader::ModuleLoader(ModuleRegistry& registry, const LoaderConfig& config)
    : m_registry(registry), m_swap(registry), m_config(config) {}

LinkResult ModuleLoader::build_module(const ObjectDescriptor& object, const char* name, LoadedModule& module) {
    LinkResult result = module.copy_names(object, name);
    if (result != LinkResult::SUCCESS) {
        return result;
    }
    
    SectionImage image;
    result = m_registry.get_section_loader().load(object, image);
    if (result != LinkResult::SUCCESS) {
        return result;
    }
    for (u32 i = 0; i < loaders::REGION_COUNT; i++) {
        module.regions[i] = image.regions[i];
    }
    
    if (!module.sections.resize(object.sections.size())) {
        return LinkResult::OUT_OF_MEMORY;
    }
    for (u32 i = 0; i < object.sections.size(); i++) {
        const loaders::ObjectSection& source = object.sections[i];
        LoadedSection& section = module.sections[i];
        section.name = module.rebase_section_name(object, source.name);
        section.type = source.type;
        section.address = image.sectionAddresses[i];
        section.size = source.size;
        section.region = static_cast<u32>(region_for_section(source.type));
    }
    
    for (u32 i = 0; i < object.symbols.size(); i++) {
        const ObjectSymbol& symbol = object.symbols[i];
        if (symbol.binding == STB_LOCAL || symbol.sectionIndex < 0 || symbol.name[0] == '\0') continue;
        if (symbol.type != STT_FUNC && symbol.type != STT_OBJECT && symbol.type != STT_NOTYPE) continue;
        
        ExportedSymbol exported = {};
        exported.name = module.rebase_symbol_name(object, symbol.name);
        exported.sectionIndex = static_cast<u32>(symbol.sectionIndex);
        exported.offset = symbol.value;
        exported.size = symbol.size;
        exported.binding = symbol.binding;
        exported.type = symbol.type;
        if (!module.exports.push_back(exported)) {
            return LinkResult::OUT_OF_MEMORY;
        }
    }
    return LinkResult::SUCCESS;
}

void ModuleLoader::discard(LoadedModule* module) {
    for (u32 i = 0; i < module->strongDependencies.size(); i++) {
        ModuleHandle target = module->strongDependencies[i].target;
        if (!target.is_pending()) {
            m_registry.unpin(target);
        }
    }
    module->strongDependencies.clear();
    m_registry.get_section_loader().release_regions(module->regions, loaders::REGION_COUNT);
    delete module;
}

static bool is_excluded(ModuleHandle module, const ModuleHandle* excluded, u32 excludedCount) {
    for (u32 i = 0; i < excludedCount; i++) {
        if (excluded[i] == module) {
            return true;
        }
    }
    return false;
}

LinkResult ModuleLoader::add_member(LoadBatch& batch, Namespace& ns, const ModuleImage& image, u32 depth) {
    if (!image.data || image.size == 0) {
        return LinkResult::INVALID_PARAMETER;
    }
    
    BatchMember* member = new (std::nothrow) BatchMember();
    if (!member) {
        return LinkResult::OUT_OF_MEMORY;
    }
    member->ns = &ns;
    member->module = nullptr;
    member->depth = depth;
    
    LinkResult result = ObjectReader::read(image.data, image.size, member->object);
    if (result != LinkResult::SUCCESS) {
        delete member;
        return result;
    }
    
    char derivedName[MAX_MODULE_NAME_LENGTH];
    const char* name = image.name;
    if (!name) {
        if (!make_module_identity(member->object.sourceFileName, image.data, image.size,
                                  derivedName, sizeof(derivedName))) {
            delete member;
            return LinkResult::INVALID_PARAMETER;
        }
        name = derivedName;
    }
    
    ModuleHandle existing = INVALID_MODULE;
    bool duplicate = ns.get_module(name, existing, false) &&
                     !is_excluded(existing, batch.excluded, batch.excludedCount);
    for (u32 i = 0; i < batch.members.size() && !duplicate; i++) {
        const BatchMember* other = batch.members[i];
        duplicate = other->ns == &ns && strcmp(other->module->get_name(), name) == 0;
    }
    if (duplicate) {
        LOG_ERROR(TAG, "%s is already loaded in %s", name, ns.get_name());
        delete member;
        return LinkResult::DUPLICATE_SYMBOL;
    }
    
    member->module = new (std::nothrow) LoadedModule();
    if (!member->module) {
        delete member;
        return LinkResult::OUT_OF_MEMORY;
    }
    
    result = build_module(member->object, name, *member->module);
    if (result == LinkResult::SUCCESS && !batch.members.push_back(member)) {
        result = LinkResult::OUT_OF_MEMORY;
    }
    if (result != LinkResult::SUCCESS) {
        LOG_ERROR(TAG, "loading %s failed: %s", name, result_to_string(result));
        discard(member->module);
        delete member;
        return result;
    }
    return LinkResult::SUCCESS;
}

LinkResult ModuleLoader::add_on_demand(LoadBatch& batch, Namespace& ns, const char* symbol, u32 depth) {
    char prefix[MAX_MODULE_NAME_LENGTH];
    if (!module_prefix_of_symbol(symbol, prefix, sizeof(prefix))) {
        return LinkResult::NOT_FOUND;
    }
    
    for (Namespace* current = &ns; current; current = current->get_parent()) {
        ModuleCatalog* catalog = current->get_catalog();
        CatalogEntry entry = {};
        if (!catalog || !catalog->find_by_module_name(prefix, entry)) continue;
        
        // Already loaded or already linking: the symbol is simply not there
        ModuleHandle existing = INVALID_MODULE;
        if (current->get_module(entry.name, existing, false)) {
            return LinkResult::NOT_FOUND;
        }
        for (u32 i = 0; i < batch.members.size(); i++) {
            if (batch.members[i]->ns == current && strcmp(batch.members[i]->module->get_name(), entry.name) == 0) {
                return LinkResult::NOT_FOUND;
            }
        }
        
        LOG_INFO(TAG, "loading %s into %s for %s", entry.name, current->get_name(), symbol);
        ModuleImage image = {entry.name, entry.data, entry.size};
        return add_member(batch, *current, image, depth);
    }
    return LinkResult::NOT_FOUND;
}

static bool namespace_visible_from(const Namespace* from, const Namespace* target) {
    for (const Namespace* ns = from; ns; ns = ns->get_parent()) {
        if (ns == target) {
            return true;
        }
    }
    return false;
}

bool ModuleLoader::find_member_export(const LoadBatch& batch, u32 member, const char* name, bool ignoreHash,
                                      SymbolLocation& location) const {
    const Namespace* from = batch.members[member]->ns;
    
    for (u32 i = 0; i < batch.members.size(); i++) {
        const BatchMember* peer = batch.members[i];
        if (i == member || !namespace_visible_from(from, peer->ns)) continue;
        
        const ExportedSymbol* symbol = ignoreHash ? peer->module->find_export_without_hash(name)
                                                  : peer->module->find_export(name);
        if (!symbol) continue;
        
        location.section.module = pending_module_handle(i);
        location.section.sectionIndex = symbol->sectionIndex;
        location.address = peer->module->export_address(*symbol);
        location.offset = symbol->offset;
        location.size = symbol->size;
        location.binding = symbol->binding;
        location.type = symbol->type;
        return true;
    }
    return false;
}

LinkResult ModuleLoader::link_batch(LoadBatch& batch) {
    // Members added on demand join the end of the list and are linked in turn
    for (u32 i = 0; i < batch.members.size(); i++) {
        BatchMember* member = batch.members[i];
        LinkContext context(*this, batch, i);
        LinkResult result = RelocationResolver::apply_relocations(*member->module, member->object, context,
                                                                  m_config.verboseRelocations);
        if (result != LinkResult::SUCCESS) {
            LOG_ERROR(TAG, "linking %s failed: %s", member->module->get_name(), result_to_string(result));
            return result;
        }
    }
    
    for (u32 i = 0; i < batch.members.size(); i++) {
        LinkResult result = m_registry.get_section_loader().finalize_permissions(batch.members[i]->module->regions);
        if (result != LinkResult::SUCCESS) {
            return result;
        }
    }
    return LinkResult::SUCCESS;
}

LinkResult ModuleLoader::commit_batch(LoadBatch& batch, ModuleHandle* handles, u32 count) {
    u32 total = batch.members.size();
    DynamicArray<LoadedModule*> modules;
    DynamicArray<Namespace*> namespaces;
    DynamicArray<ModuleHandle> committed;
    if (!modules.resize(total) || !namespaces.resize(total) || !committed.resize(total)) {
        return LinkResult::OUT_OF_MEMORY;
    }
    for (u32 i = 0; i < total; i++) {
        modules[i] = batch.members[i]->module;
        namespaces[i] = batch.members[i]->ns;
    }
    
    LinkResult result = m_registry.commit_batch(modules.data(), namespaces.data(), total, committed.data());
    if (result != LinkResult::SUCCESS) {
        LOG_ERROR(TAG, "committing %u modules failed: %s", total, result_to_string(result));
        return result;
    }
    
    // The registry owns them now
    for (u32 i = 0; i < total; i++) {
        batch.members[i]->module = nullptr;
    }
    for (u32 i = 0; i < count; i++) {
        handles[i] = committed[i];
    }
    return LinkResult::SUCCESS;
}

void ModuleLoader::discard_batch(LoadBatch& batch) {
    for (u32 i = 0; i < batch.members.size(); i++) {
        if (batch.members[i]->module) {
            discard(batch.members[i]->module);
            batch.members[i]->module = nullptr;
        }
    }
}

LinkResult ModuleLoader::load_batch(Namespace& ns, const ModuleImage* images, u32 count, ModuleHandle* handles) {
    if (!images || !handles || count == 0) {
        return LinkResult::INVALID_PARAMETER;
    }
    
    LoadBatch batch;
    LinkResult result = LinkResult::SUCCESS;
    for (u32 i = 0; i < count && result == LinkResult::SUCCESS; i++) {
        result = add_member(batch, ns, images[i], 0);
    }
    if (result == LinkResult::SUCCESS) {
        result = link_batch(batch);
    }
    if (result == LinkResult::SUCCESS) {
        result = commit_batch(batch, handles, count);
    }
    
    if (result != LinkResult::SUCCESS) {
        discard_batch(batch);
    }
    return result;
}

LinkResult ModuleLoader::load(Namespace& ns, const ModuleImage& image, ModuleHandle& handle) {
    return load_batch(ns, &image, 1, &handle);
}

bool ModuleLoader::resolve_symbol(const Namespace& ns, const char* name, SymbolLocation& location) const {
    if (ns.lookup(name, location)) {
        return true;
    }
    return m_config.fuzzySymbolMatching && ns.lookup_without_hash(name, INVALID_MODULE, location);
}

bool ModuleLoader::resolve(const Namespace& ns, const char* name, SectionRef& section) const {
    SymbolLocation location = {};
    if (!resolve_symbol(ns, name, location)) {
        return false;
    }
    section = location.section;
    return true;
}

LinkResult ModuleLoader::get_symbol_or_load(Namespace& ns, const char* name, SymbolLocation& location) {
    if (resolve_symbol(ns, name, location)) {
        return LinkResult::SUCCESS;
    }
    if (!m_config.onDemandLoading) {
        return LinkResult::NOT_FOUND;
    }
    
    LoadBatch batch;
    LinkResult result = add_on_demand(batch, ns, name, 1);
    if (result == LinkResult::SUCCESS) {
        result = link_batch(batch);
    }
    if (result == LinkResult::SUCCESS) {
        ModuleHandle handle = INVALID_MODULE;
        result = commit_batch(batch, &handle, 1);
    }
    if (result != LinkResult::SUCCESS) {
        discard_batch(batch);
    }
    
    if (resolve_symbol(ns, name, location)) {
        return LinkResult::SUCCESS;
    }
    return result == LinkResult::SUCCESS ? LinkResult::NOT_FOUND : result;
}

LinkResult ModuleLoader::swap(ModuleHandle oldModule, const ModuleImage& image, const SwapOptions& options,
                              ModuleHandle& newHandle) {
    SwapRequest request = {oldModule, image};
    return swap(&request, 1, options, &newHandle);
}

LinkResult ModuleLoader::swap(const SwapRequest* requests, u32 count, const SwapOptions& options,
                              ModuleHandle* newHandles) {
    if (!requests || !newHandles || count == 0) {
        return LinkResult::INVALID_PARAMETER;
    }
    
    // Pins keep the old modules and their namespaces alive until the swap is decided
    DynamicArray<ModuleHandle> pinned;
    DynamicArray<const LoadedModule*> olds;
    LinkResult result = LinkResult::SUCCESS;
    for (u32 i = 0; i < count && result == LinkResult::SUCCESS; i++) {
        if (is_excluded(requests[i].oldModule, pinned.data(), pinned.size())) {
            result = LinkResult::INVALID_PARAMETER;
            break;
        }
        result = m_registry.pin(requests[i].oldModule);
        if (result != LinkResult::SUCCESS) break;
        
        if (!pinned.push_back(requests[i].oldModule)) {
            m_registry.unpin(requests[i].oldModule);
            result = LinkResult::OUT_OF_MEMORY;
            break;
        }
        
        const LoadedModule* old = m_registry.get_module(requests[i].oldModule);
        if (!old || !old->get_namespace() || old->detached) {
            result = LinkResult::INVALID_PARAMETER;
        } else if (!olds.push_back(old)) {
            result = LinkResult::OUT_OF_MEMORY;
        }
    }
    for (u32 i = 0; i < count && result == LinkResult::SUCCESS; i++) {
        result = m_swap.check_quiescence(requests[i].oldModule, options.taskQuery);
    }
    
    // Replacements link against each other, never against the modules they replace
    LoadBatch batch;
    batch.excluded = pinned.data();
    batch.excludedCount = pinned.size();
    batch.allowOnDemand = false;
    for (u32 i = 0; i < count && result == LinkResult::SUCCESS; i++) {
        result = add_member(batch, *olds[i]->get_namespace(), requests[i].image, 0);
    }
    if (result == LinkResult::SUCCESS) {
        result = link_batch(batch);
    }
    
    DynamicArray<LoadedModule*> replacements;
    if (result == LinkResult::SUCCESS && !replacements.resize(count)) {
        result = LinkResult::OUT_OF_MEMORY;
    }
    if (result == LinkResult::SUCCESS) {
        for (u32 i = 0; i < count; i++) {
            replacements[i] = batch.members[i]->module;
            if (options.transferState) {
                m_swap.transfer_state(*olds[i], *replacements[i]);
            }
        }
        StateTransferContext context = {olds.data(), replacements.data(), count};
        result = m_swap.run_state_transfer(context, options);
    }
    if (result == LinkResult::SUCCESS) {
        result = m_swap.commit_swap(pinned.data(), replacements.data(), count, options, newHandles);
        if (result == LinkResult::SUCCESS) {
            for (u32 i = 0; i < count; i++) {
                batch.members[i]->module = nullptr;
            }
        }
    }
    
    if (result != LinkResult::SUCCESS) {
        LOG_WARN(TAG, "swap of %u modules failed: %s", count, result_to_string(result));
        discard_batch(batch);
        for (u32 i = 0; i < pinned.size(); i++) {
            m_registry.unpin(pinned[i]);
        }
    }
    return result;
}

LinkResult ModuleLoader::unload(ModuleHandle module) {
    return m_registry.unload(module);
}

LinkResult ModuleLoader::unload_batch(const ModuleHandle* modules, u32 count) {
    return m_registry.unload_batch(modules, count);
}

} // namespace strata::modules
