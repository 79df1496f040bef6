#pragma once

#include "core/types.hpp"
#include "core/array.hpp"
#include "memory/memory_services.hpp"
#include "loaders/object_reader.hpp"
#include "loaders/section_loader.hpp"
#include "modules/link_result.hpp"

namespace strata::modules {

using namespace strata::system;
using strata::loaders::SectionType;
using strata::loaders::REGION_COUNT;

class Namespace;

/**
 * @brief Generation-checked reference to a registry slot
 * 
 * A handle whose slot was freed (or reused) no longer resolves, so stale
 * handles read as "not found" instead of touching freed memory.
 */
struct ModuleHandle {
    u32 index;
    u32 generation;     // 0 = invalid handle

    bool is_valid() const { return generation != 0; }
    bool is_pending() const;
    bool operator==(const ModuleHandle& other) const {
        return index == other.index && generation == other.generation;
    }
    bool operator!=(const ModuleHandle& other) const { return !(*this == other); }
};

constexpr ModuleHandle INVALID_MODULE = {0, 0};

// Generation of a provisional handle naming a module of a batch still being linked; slots never use it
constexpr u32 PENDING_GENERATION = 0xFFFFFFFF;

inline bool ModuleHandle::is_pending() const { return generation == PENDING_GENERATION; }

/**
 * @brief Provisional handle of the batch member at batchIndex
 */
inline ModuleHandle pending_module_handle(u32 batchIndex) {
    ModuleHandle handle = {batchIndex, PENDING_GENERATION};
    return handle;
}

/**
 * @brief Reference to one section of a loaded module
 */
struct SectionRef {
    ModuleHandle module;
    u32 sectionIndex;
};

/**
 * @brief Resolved symbol: where it lives and what it is
 */
struct SymbolLocation {
    SectionRef section;
    uintptr_t address;      // Absolute address of the symbol
    u64 offset;             // Offset within the defining section
    u64 size;
    u8 binding;
    u8 type;
};

/**
 * @brief Incoming record on a target section: "relocation N of module M points here"
 */
struct DependentRecord {
    ModuleHandle sourceModule;
    u32 relocationIndex;    // Index into the source module's relocations
};

/**
 * @brief Outgoing strong reference from one module to another
 */
struct StrongDependency {
    ModuleHandle target;
    u32 edgeCount;          // Relocations of this module that resolve into target
};

/**
 * @brief Applied relocation, kept so a swap can redo it against a new target
 */
struct RelocationRecord {
    u32 sourceSection;      // Patched section of this module
    u64 offset;             // Offset of the patched field in sourceSection
    const char* symbolName; // Target symbol (section name for section symbols)
    u32 kind;               // R_X86_64_*
    i64 addend;
    SectionRef target;      // Section the symbol resolved into (invalid module for absolute)
    u64 targetOffset;       // Symbol offset within target
    u64 targetSize;
    bool crossModule;       // Target lives in another module
};

/**
 * @brief Section of a loaded module
 */
struct LoadedSection {
    const char* name;
    SectionType type;
    uintptr_t address;
    u64 size;
    u32 region;             // Index into LoadedModule::regions
    DynamicArray<DependentRecord> dependents;

    bool contains(uintptr_t addr) const {
        return addr >= address && addr < address + size;
    }
};

/**
 * @brief Global or weak symbol defined by a module
 */
struct ExportedSymbol {
    const char* name;
    u32 sectionIndex;
    u64 offset;
    u64 size;
    u8 binding;
    u8 type;
};

/**
 * @brief A module with mapped, relocated sections
 * 
 * Owns copies of the name tables of its object so nothing refers back to
 * the image it was loaded from. Mutated only under the registry graph lock
 * once committed.
 */
class LoadedModule {
public:
    LoadedModule();
    ~LoadedModule();

    /**
     * @brief Take private copies of the object's string tables
     */
    LinkResult copy_names(const loaders::ObjectDescriptor& object, const char* moduleName);

    /**
     * @brief Translate a symbol name of the object into this module's copy
     */
    const char* rebase_symbol_name(const loaders::ObjectDescriptor& object, const char* name) const;

    /**
     * @brief Translate a section name of the object into this module's copy
     */
    const char* rebase_section_name(const loaders::ObjectDescriptor& object, const char* name) const;

    const ExportedSymbol* find_export(const char* name) const;

    /**
     * @brief Find the unique export whose name matches ignoring hashes
     * @return nullptr if none or several match
     */
    const ExportedSymbol* find_export_without_hash(const char* name) const;

    /**
     * @brief Index of the section containing addr, or -1
     */
    i32 section_containing(uintptr_t addr) const;

    bool contains_address(uintptr_t addr) const;

    /**
     * @brief Number of dependent records over all sections
     */
    u32 dependent_count() const;

    /**
     * @brief Address of an export
     */
    uintptr_t export_address(const ExportedSymbol& symbol) const {
        return sections[symbol.sectionIndex].address + symbol.offset;
    }

    StrongDependency* find_strong_dependency(ModuleHandle target);

    const char* get_name() const { return m_name; }
    Namespace* get_namespace() const { return m_namespace; }
    void set_namespace(Namespace* ns) { m_namespace = ns; }

    ModuleHandle handle;
    MappedRegion regions[REGION_COUNT];
    DynamicArray<LoadedSection> sections;
    DynamicArray<ExportedSymbol> exports;
    DynamicArray<RelocationRecord> relocations;
    DynamicArray<StrongDependency> strongDependencies;
    u32 refCount;           // Strong references from other modules (committed or pending)
    bool detached;          // Replaced by a swap, no longer in any namespace

private:
    LoadedModule(const LoadedModule&) = delete;
    LoadedModule& operator=(const LoadedModule&) = delete;

    char* m_name;
    char* m_strings;        // Copy of the symbol string table
    u64 m_stringsSize;
    char* m_sectionNames;   // Copy of the section name table
    u64 m_sectionNamesSize;
    Namespace* m_namespace;
};

} // namespace strata::modules
