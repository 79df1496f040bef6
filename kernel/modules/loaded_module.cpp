#include "modules/loaded_module.hpp"
#include "modules/module_identity.hpp"
#include "core/utils.hpp"

namespace strata::modules {

using namespace strata::utils;

LoadedModule::LoadedModule()
    : handle(INVALID_MODULE), refCount(0), detached(false), m_name(nullptr),
      m_strings(nullptr), m_stringsSize(0), m_sectionNames(nullptr), m_sectionNamesSize(0),
      m_namespace(nullptr) {
    for (u32 i = 0; i < REGION_COUNT; i++) {
        regions[i] = MappedRegion();
    }
}

LoadedModule::~LoadedModule() {
    delete[] m_name;
    delete[] m_strings;
    delete[] m_sectionNames;
}

static char* copy_table(const char* table, u64 size) {
    if (!table || size == 0) {
        return nullptr;
    }
    char* copy = new (std::nothrow) char[size];
    if (copy) {
        memcpy(copy, table, size);
    }
    return copy;
}

LinkResult LoadedModule::copy_names(const loaders::ObjectDescriptor& object, const char* moduleName) {
    m_name = strdup(moduleName);
    m_strings = copy_table(object.stringTable, object.stringTableSize);
    m_sectionNames = copy_table(object.sectionNameTable, object.sectionNameTableSize);
    
    if (!m_name || (object.stringTable && !m_strings) || (object.sectionNameTable && !m_sectionNames)) {
        return LinkResult::OUT_OF_MEMORY;
    }
    
    m_stringsSize = object.stringTableSize;
    m_sectionNamesSize = object.sectionNameTableSize;
    return LinkResult::SUCCESS;
}

const char* LoadedModule::rebase_symbol_name(const loaders::ObjectDescriptor& object, const char* name) const {
    if (!m_strings || name < object.stringTable || name >= object.stringTable + object.stringTableSize) {
        return "";
    }
    return m_strings + (name - object.stringTable);
}

const char* LoadedModule::rebase_section_name(const loaders::ObjectDescriptor& object, const char* name) const {
    if (!m_sectionNames || name < object.sectionNameTable ||
        name >= object.sectionNameTable + object.sectionNameTableSize) {
        return "";
    }
    return m_sectionNames + (name - object.sectionNameTable);
}

const ExportedSymbol* LoadedModule::find_export(const char* name) const {
    for (u32 i = 0; i < exports.size(); i++) {
        if (strcmp(exports[i].name, name) == 0) {
            return &exports[i];
        }
    }
    return nullptr;
}

const ExportedSymbol* LoadedModule::find_export_without_hash(const char* name) const {
    const ExportedSymbol* match = nullptr;
    for (u32 i = 0; i < exports.size(); i++) {
        if (!symbol_names_match_without_hash(exports[i].name, name)) continue;
        if (match) {
            return nullptr;
        }
        match = &exports[i];
    }
    return match;
}

i32 LoadedModule::section_containing(uintptr_t addr) const {
    for (u32 i = 0; i < sections.size(); i++) {
        if (sections[i].contains(addr)) {
            return static_cast<i32>(i);
        }
    }
    return -1;
}

bool LoadedModule::contains_address(uintptr_t addr) const {
    for (u32 i = 0; i < REGION_COUNT; i++) {
        if (regions[i].is_mapped() && regions[i].pages.contains(addr)) {
            return true;
        }
    }
    return false;
}

u32 LoadedModule::dependent_count() const {
    u32 count = 0;
    for (u32 i = 0; i < sections.size(); i++) {
        count += sections[i].dependents.size();
    }
    return count;
}

StrongDependency* LoadedModule::find_strong_dependency(ModuleHandle target) {
    for (u32 i = 0; i < strongDependencies.size(); i++) {
        if (strongDependencies[i].target == target) {
            return &strongDependencies[i];
        }
    }
    return nullptr;
}

} // namespace strata::modules
