#include "modules/namespace.hpp"
#include "modules/module_identity.hpp"
#include "core/utils.hpp"
#include "debug/klog.hpp"

namespace strata::modules {

using namespace strata::utils;
using strata::sync::ReadGuard;
using strata::sync::WriteGuard;
using strata::formats::STB_WEAK;
using strata::formats::STB_GLOBAL;

static const char* const TAG = "namespace";

static void free_entry(SymbolEntry* entry) {
    delete[] entry->name;
    delete entry;
}

static SymbolEntry* make_entry(const char* name, const SymbolLocation& location, bool alias) {
    SymbolEntry* entry = new (std::nothrow) SymbolEntry();
    if (!entry) {
        return nullptr;
    }
    
    entry->name = strdup(name);
    if (!entry->name) {
        delete entry;
        return nullptr;
    }
    entry->hash = elf_hash(name);
    entry->location = location;
    entry->alias = alias;
    entry->next = nullptr;
    return entry;
}

static bool is_excluded(ModuleHandle module, const ModuleHandle* excluded, u32 excludedCount) {
    for (u32 i = 0; i < excludedCount; i++) {
        if (excluded[i] == module) {
            return true;
        }
    }
    return false;
}

static SymbolLocation location_of_export(const LoadedModule& module, const ExportedSymbol& symbol) {
    SymbolLocation location = {};
    location.section.module = module.handle;
    location.section.sectionIndex = symbol.sectionIndex;
    location.address = module.export_address(symbol);
    location.offset = symbol.offset;
    location.size = symbol.size;
    location.binding = symbol.binding;
    location.type = symbol.type;
    return location;
}

//=============================================================================
// SymbolBatch Implementation
//=============================================================================

SymbolBatch::~SymbolBatch() {
    for (u32 i = 0; i < m_entries.size(); i++) {
        free_entry(m_entries[i]);
    }
    delete[] m_moduleName;
}

//=============================================================================
// Namespace Implementation
//=============================================================================

Namespace::Namespace(const char* name, Namespace* parent)
    : m_name(strdup(name)), m_parent(parent), m_catalog(nullptr), m_shadowed(nullptr), m_symbolCount(0) {
    for (u32 i = 0; i < NAMESPACE_BUCKET_COUNT; i++) {
        m_buckets[i] = nullptr;
    }
}

Namespace::~Namespace() {
    for (u32 i = 0; i < NAMESPACE_BUCKET_COUNT; i++) {
        SymbolEntry* entry = m_buckets[i];
        while (entry) {
            SymbolEntry* next = entry->next;
            free_entry(entry);
            entry = next;
        }
        m_buckets[i] = nullptr;
    }
    while (m_shadowed) {
        SymbolEntry* next = m_shadowed->next;
        free_entry(m_shadowed);
        m_shadowed = next;
    }
    
    for (u32 i = 0; i < m_members.size(); i++) {
        delete[] m_members[i].name;
    }
    delete[] m_name;
}

SymbolEntry* Namespace::find_entry(const char* name, u32 hash, const ModuleHandle* excluded,
                                   u32 excludedCount) const {
    for (SymbolEntry* entry = m_buckets[hash % NAMESPACE_BUCKET_COUNT]; entry; entry = entry->next) {
        if (entry->hash == hash && !is_excluded(entry->location.section.module, excluded, excludedCount) &&
            strcmp(entry->name, name) == 0) {
            return entry;
        }
    }
    return nullptr;
}

bool Namespace::lookup(const char* name, SymbolLocation& location) const {
    return lookup_excluding(name, nullptr, 0, location);
}

bool Namespace::lookup_excluding(const char* name, const ModuleHandle* excluded, u32 excludedCount,
                                 SymbolLocation& location) const {
    u32 hash = elf_hash(name);
    
    for (const Namespace* ns = this; ns; ns = ns->m_parent) {
        ReadGuard guard(ns->m_lock);
        const SymbolEntry* entry = ns->find_entry(name, hash, excluded, excludedCount);
        if (entry) {
            location = entry->location;
            return true;
        }
    }
    return false;
}

bool Namespace::lookup_local(const char* name, SymbolLocation& location) const {
    ReadGuard guard(m_lock);
    const SymbolEntry* entry = find_entry(name, elf_hash(name), nullptr, 0);
    if (!entry) {
        return false;
    }
    location = entry->location;
    return true;
}

bool Namespace::lookup_without_hash_local(const char* name, const ModuleHandle* excluded, u32 excludedCount,
                                          SymbolLocation& location, bool& ambiguous) const {
    ReadGuard guard(m_lock);
    
    bool found = false;
    ambiguous = false;
    for (u32 i = 0; i < NAMESPACE_BUCKET_COUNT; i++) {
        for (const SymbolEntry* entry = m_buckets[i]; entry; entry = entry->next) {
            if (is_excluded(entry->location.section.module, excluded, excludedCount)) continue;
            if (!symbol_names_match_without_hash(entry->name, name)) continue;
            
            if (found) {
                ambiguous = true;
                return false;
            }
            location = entry->location;
            found = true;
        }
    }
    return found;
}

bool Namespace::lookup_without_hash(const char* name, ModuleHandle excluded, SymbolLocation& location) const {
    return lookup_without_hash(name, &excluded, 1, location);
}

bool Namespace::lookup_without_hash(const char* name, const ModuleHandle* excluded, u32 excludedCount,
                                    SymbolLocation& location) const {
    for (const Namespace* ns = this; ns; ns = ns->m_parent) {
        bool ambiguous = false;
        if (ns->lookup_without_hash_local(name, excluded, excludedCount, location, ambiguous)) {
            return true;
        }
        if (ambiguous) {
            LOG_WARN(TAG, "%s: several symbols match %s ignoring hashes", ns->m_name, name);
            return false;
        }
    }
    return false;
}

u32 Namespace::count_prefix_local(const char* prefix, SymbolLocation* results, u32 maxResults, u32 found) const {
    ReadGuard guard(m_lock);
    
    for (u32 i = 0; i < NAMESPACE_BUCKET_COUNT; i++) {
        for (const SymbolEntry* entry = m_buckets[i]; entry; entry = entry->next) {
            if (!starts_with(entry->name, prefix)) continue;
            if (results && found < maxResults) {
                results[found] = entry->location;
            }
            found++;
        }
    }
    return found;
}

bool Namespace::get_symbol_starting_with(const char* prefix, SymbolLocation& location) const {
    for (const Namespace* ns = this; ns; ns = ns->m_parent) {
        SymbolLocation match = {};
        u32 count = ns->count_prefix_local(prefix, &match, 1, 0);
        if (count == 1) {
            location = match;
            return true;
        }
        if (count > 1) {
            return false;
        }
    }
    return false;
}

u32 Namespace::find_symbols_starting_with(const char* prefix, SymbolLocation* results, u32 maxResults) const {
    u32 found = 0;
    for (const Namespace* ns = this; ns; ns = ns->m_parent) {
        found = ns->count_prefix_local(prefix, results, maxResults, found);
    }
    return found;
}

u32 Namespace::symbol_count() const {
    ReadGuard guard(m_lock);
    return m_symbolCount;
}

u32 Namespace::shadowed_count() const {
    ReadGuard guard(m_lock);
    u32 count = 0;
    for (const SymbolEntry* entry = m_shadowed; entry; entry = entry->next) {
        count++;
    }
    return count;
}

bool Namespace::contains_module(ModuleHandle module) const {
    ReadGuard guard(m_lock);
    for (u32 i = 0; i < m_members.size(); i++) {
        if (m_members[i].handle == module) {
            return true;
        }
    }
    return false;
}

u32 Namespace::module_count() const {
    ReadGuard guard(m_lock);
    return m_members.size();
}

bool Namespace::get_module(const char* name, ModuleHandle& module, bool recursive) const {
    for (const Namespace* ns = this; ns; ns = recursive ? ns->m_parent : nullptr) {
        ReadGuard guard(ns->m_lock);
        for (u32 i = 0; i < ns->m_members.size(); i++) {
            if (strcmp(ns->m_members[i].name, name) == 0) {
                module = ns->m_members[i].handle;
                return true;
            }
        }
    }
    return false;
}

bool Namespace::get_module_starting_with(const char* prefix, ModuleHandle& module, bool recursive) const {
    for (const Namespace* ns = this; ns; ns = recursive ? ns->m_parent : nullptr) {
        ReadGuard guard(ns->m_lock);
        u32 matches = 0;
        for (u32 i = 0; i < ns->m_members.size(); i++) {
            if (starts_with(ns->m_members[i].name, prefix)) {
                module = ns->m_members[i].handle;
                matches++;
            }
        }
        if (matches == 1) {
            return true;
        }
        if (matches > 1) {
            return false;
        }
    }
    return false;
}

void Namespace::for_each_module(ModuleVisitor visitor, void* context, bool recursive) const {
    for (const Namespace* ns = this; ns; ns = recursive ? ns->m_parent : nullptr) {
        ReadGuard guard(ns->m_lock);
        for (u32 i = 0; i < ns->m_members.size(); i++) {
            visitor(ns->m_members[i].handle, ns->m_members[i].name, context);
        }
    }
}

void Namespace::dump_symbol_map() const {
    ReadGuard guard(m_lock);
    
    k_printf("Namespace %s: %u modules, %u symbols\n", m_name, m_members.size(), m_symbolCount);
    for (u32 i = 0; i < NAMESPACE_BUCKET_COUNT; i++) {
        for (const SymbolEntry* entry = m_buckets[i]; entry; entry = entry->next) {
            k_printf("  %p %llu %s%s%s\n", reinterpret_cast<void*>(entry->location.address),
                     entry->location.size, entry->name,
                     entry->location.binding == STB_WEAK ? " [weak]" : "",
                     entry->alias ? " [alias]" : "");
        }
    }
}

//=============================================================================
// Mutation
//=============================================================================

static bool both_global(const SymbolEntry* entry, u8 binding) {
    return entry->location.binding != STB_WEAK && binding != STB_WEAK;
}

LinkResult Namespace::prepare_insert(const LoadedModule& module, const ModuleHandle* replaced, u32 replacedCount,
                                     const LoadedModule* aliasesFrom, SymbolBatch* const* peers, u32 peerCount,
                                     SymbolBatch& batch) {
    batch.m_module = module.handle;
    batch.m_moduleName = strdup(module.get_name());
    if (!batch.m_moduleName || !batch.m_entries.reserve(module.exports.size())) {
        return LinkResult::OUT_OF_MEMORY;
    }
    
    {
        ReadGuard guard(m_lock);
        
        for (u32 i = 0; i < module.exports.size(); i++) {
            const ExportedSymbol& symbol = module.exports[i];
            u32 hash = elf_hash(symbol.name);
            
            // A weak definition never collides; it waits behind the visible one
            const SymbolEntry* existing = find_entry(symbol.name, hash, replaced, replacedCount);
            if (existing && both_global(existing, symbol.binding)) {
                LOG_ERROR(TAG, "%s: duplicate symbol %s in %s", m_name, symbol.name, module.get_name());
                return LinkResult::DUPLICATE_SYMBOL;
            }
            for (u32 p = 0; p < peerCount; p++) {
                for (u32 e = 0; e < peers[p]->m_entries.size(); e++) {
                    const SymbolEntry* peer = peers[p]->m_entries[e];
                    if (peer->hash == hash && strcmp(peer->name, symbol.name) == 0 &&
                        both_global(peer, symbol.binding)) {
                        LOG_ERROR(TAG, "%s: %s defined by %s and %s", m_name, symbol.name,
                                  peers[p]->m_moduleName, module.get_name());
                        return LinkResult::DUPLICATE_SYMBOL;
                    }
                }
            }
            
            SymbolEntry* entry = make_entry(symbol.name, location_of_export(module, symbol), false);
            if (!entry || !batch.m_entries.push_back(entry)) {
                if (entry) free_entry(entry);
                return LinkResult::OUT_OF_MEMORY;
            }
        }
        
        // Old names of a swapped module keep resolving into its replacement
        if (aliasesFrom) {
            for (u32 i = 0; i < aliasesFrom->exports.size(); i++) {
                const char* oldName = aliasesFrom->exports[i].name;
                if (module.find_export(oldName)) continue;
                
                const ExportedSymbol* target = module.find_export_without_hash(oldName);
                if (!target) continue;
                if (find_entry(oldName, elf_hash(oldName), replaced, replacedCount)) continue;
                
                SymbolEntry* entry = make_entry(oldName, location_of_export(module, *target), true);
                if (!entry || !batch.m_entries.push_back(entry)) {
                    if (entry) free_entry(entry);
                    return LinkResult::OUT_OF_MEMORY;
                }
            }
        }
    }
    
    // Membership slots for this batch and its peers, so publish() never allocates
    WriteGuard guard(m_lock);
    if (!m_members.reserve(m_members.size() + peerCount + 1)) {
        return LinkResult::OUT_OF_MEMORY;
    }
    return LinkResult::SUCCESS;
}

void Namespace::insert_entry(SymbolEntry* entry) {
    u32 bucket = entry->hash % NAMESPACE_BUCKET_COUNT;
    entry->next = m_buckets[bucket];
    m_buckets[bucket] = entry;
    m_symbolCount++;
}

void Namespace::detach_entry(SymbolEntry* target) {
    SymbolEntry** link = &m_buckets[target->hash % NAMESPACE_BUCKET_COUNT];
    while (*link) {
        if (*link == target) {
            *link = target->next;
            target->next = nullptr;
            m_symbolCount--;
            return;
        }
        link = &(*link)->next;
    }
}

SymbolEntry* Namespace::take_shadowed(const char* name, u32 hash) {
    for (SymbolEntry** link = &m_shadowed; *link; link = &(*link)->next) {
        SymbolEntry* entry = *link;
        if (entry->hash == hash && strcmp(entry->name, name) == 0) {
            *link = entry->next;
            entry->next = nullptr;
            return entry;
        }
    }
    return nullptr;
}

void Namespace::unlink_entries_of(ModuleHandle module) {
    // Hidden definitions of the module go first, so none of them is brought back
    SymbolEntry** shadow = &m_shadowed;
    while (*shadow) {
        SymbolEntry* entry = *shadow;
        if (entry->location.section.module == module) {
            *shadow = entry->next;
            free_entry(entry);
        } else {
            shadow = &entry->next;
        }
    }
    
    SymbolEntry* restored = nullptr;
    for (u32 i = 0; i < NAMESPACE_BUCKET_COUNT; i++) {
        SymbolEntry** link = &m_buckets[i];
        while (*link) {
            SymbolEntry* entry = *link;
            if (entry->location.section.module != module) {
                link = &entry->next;
                continue;
            }
            
            *link = entry->next;
            m_symbolCount--;
            SymbolEntry* hidden = take_shadowed(entry->name, entry->hash);
            if (hidden) {
                hidden->next = restored;
                restored = hidden;
            }
            free_entry(entry);
        }
    }
    
    while (restored) {
        SymbolEntry* next = restored->next;
        LOG_DEBUG(TAG, "%s: weak %s visible again", m_name, restored->name);
        insert_entry(restored);
        restored = next;
    }
    
    for (u32 i = 0; i < m_members.size(); i++) {
        if (m_members[i].handle == module) {
            delete[] m_members[i].name;
            m_members.remove_at(i);
            break;
        }
    }
}

void Namespace::publish(SymbolBatch* const* batches, u32 batchCount, const ModuleHandle* replaced,
                        u32 replacedCount) {
    WriteGuard guard(m_lock);
    
    for (u32 i = 0; i < replacedCount; i++) {
        unlink_entries_of(replaced[i]);
    }
    
    for (u32 b = 0; b < batchCount; b++) {
        SymbolBatch& batch = *batches[b];
        
        for (u32 i = 0; i < batch.m_entries.size(); i++) {
            SymbolEntry* entry = batch.m_entries[i];
            SymbolEntry* existing = find_entry(entry->name, entry->hash, nullptr, 0);
            if (existing) {
                // Batches were checked against each other, so one of the two is weak
                SymbolEntry* hidden = entry;
                if (entry->location.binding != STB_WEAK) {
                    LOG_DEBUG(TAG, "%s: %s overrides a weak definition", m_name, entry->name);
                    detach_entry(existing);
                    hidden = existing;
                    insert_entry(entry);
                }
                hidden->next = m_shadowed;
                m_shadowed = hidden;
                continue;
            }
            insert_entry(entry);
        }
        batch.m_entries.clear();
        
        Member member = {batch.m_module, batch.m_moduleName};
        batch.m_moduleName = nullptr;
        if (!m_members.push_back(member)) {
            // Capacity was reserved by prepare_insert()
            LOG_ERROR(TAG, "%s: lost membership of %s", m_name, member.name);
            delete[] member.name;
        }
    }
}

void Namespace::remove_module(ModuleHandle module) {
    WriteGuard guard(m_lock);
    unlink_entries_of(module);
}

} // namespace strata::modules
