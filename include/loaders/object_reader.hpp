#pragma once

#include "core/types.hpp"
#include "core/array.hpp"
#include "formats/elf.hpp"
#include "modules/link_result.hpp"

namespace strata::loaders {

using namespace strata::system;
using namespace strata::formats;
using strata::modules::LinkResult;

/**
 * @brief Permission class of a loadable section
 */
enum class SectionType : u8 {
    TEXT = 0,       // Executable, read-only
    RODATA = 1,     // Read-only data
    DATA = 2,       // Read-write initialized data
    BSS = 3         // Read-write zero-initialized data
};

constexpr u32 SECTION_TYPE_COUNT = 4;

const char* section_type_name(SectionType type);

// ObjectSymbol::sectionIndex values that do not name a loadable section
constexpr i32 SYMBOL_UNDEFINED = -1;    // Defined by another module
constexpr i32 SYMBOL_ABSOLUTE = -2;     // Value is an absolute address
constexpr i32 SYMBOL_NOT_LOADED = -3;   // Defined in a non-allocated section

/**
 * @brief Loadable (SHF_ALLOC) section of an object file
 */
struct ObjectSection {
    const char* name;       // Points into the object's section name table
    u32 elfIndex;           // Index in the ELF section header table
    SectionType type;
    u64 size;
    u64 alignment;          // Power of two, at least 1
    u64 fileOffset;         // Offset of the bytes in the image (unused for BSS)
};

/**
 * @brief Symbol table entry, indexed exactly like the ELF symbol table
 */
struct ObjectSymbol {
    const char* name;       // Points into the object's string table ("" if unnamed)
    u8 binding;             // STB_LOCAL / STB_GLOBAL / STB_WEAK
    u8 type;                // STT_*
    i32 sectionIndex;       // Index into ObjectDescriptor::sections or SYMBOL_*
    u64 value;              // Offset within the defining section
    u64 size;
};

/**
 * @brief One RELA entry against a loadable section
 */
struct ObjectRelocation {
    u32 sectionIndex;       // Patched section (index into ObjectDescriptor::sections)
    u64 offset;             // Offset of the patched field within that section
    u32 symbolIndex;        // Index into ObjectDescriptor::symbols
    u32 type;               // R_X86_64_*
    i64 addend;
};

/**
 * @brief In-memory description of a relocatable object
 * 
 * Borrows the object image: every name and byte range refers to the
 * buffer passed to ObjectReader::read(), which must outlive the descriptor.
 */
struct ObjectDescriptor {
    const u8* image;
    u64 imageSize;
    const char* stringTable;        // Symbol names
    u64 stringTableSize;
    const char* sectionNameTable;   // Section names
    u64 sectionNameTableSize;
    const char* sourceFileName;     // Name of the first STT_FILE symbol, or nullptr
    DynamicArray<ObjectSection> sections;
    DynamicArray<ObjectSymbol> symbols;
    DynamicArray<ObjectRelocation> relocations;
    u64 bytesPerType[SECTION_TYPE_COUNT];   // Aligned byte totals per section type

    ObjectDescriptor();

    /**
     * @brief Find a loadable section by name
     * @return Index into sections, or -1
     */
    i32 find_section(const char* name) const;

    /**
     * @brief Find a defined, non-local symbol by name
     * @return Index into symbols, or -1
     */
    i32 find_symbol(const char* name) const;

    /**
     * @brief Pointer to the file bytes of a loadable section (nullptr for BSS)
     */
    const u8* section_bytes(u32 index) const;
};

/**
 * @brief Object Reader - parses ELF64 relocatable objects
 * 
 * Validates every header, index and range it touches and reports any
 * inconsistency as MALFORMED_OBJECT_FILE. Has no side effects besides
 * filling the descriptor.
 */
class ObjectReader {
public:
    /**
     * @brief Parse a relocatable object
     * @param data Object image
     * @param size Size of the image in bytes
     * @param object Output descriptor (cleared first)
     * @return SUCCESS, MALFORMED_OBJECT_FILE or OUT_OF_MEMORY
     */
    static LinkResult read(const void* data, u64 size, ObjectDescriptor& object);

    /**
     * @brief Classify an allocated section by its flags
     */
    static SectionType classify_section(u32 shType, u64 shFlags);

    /**
     * @brief Width in bytes of the field patched by a relocation type
     * @return 0 if the type is not one the loader can apply
     */
    static u32 relocation_width(u32 type);

private:
    static LinkResult read_sections(const Elf64_Ehdr* header, ObjectDescriptor& object, i32* sectionMap);
    static LinkResult read_symbols(const Elf64_Shdr* symtab, ObjectDescriptor& object, const i32* sectionMap);
    static LinkResult read_relocations(const Elf64_Shdr* rela, u32 symtabIndex, ObjectDescriptor& object,
                                       const i32* sectionMap);
    static bool string_at(const char* table, u64 tableSize, u32 offset, const char*& out);
};

} // namespace strata::loaders
