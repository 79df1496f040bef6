#include "loaders/object_reader.hpp"
#include "core/utils.hpp"
#include "memory/memory.hpp"
#include "debug/klog.hpp"

namespace strata::loaders {

using namespace strata::utils;
using strata::modules::LinkResult;

static const char* const TAG = "objread";

// Largest section alignment the section loader can honour
constexpr u64 MAX_SECTION_ALIGNMENT = PAGE_SIZE;

// GNU extension binding, treated like STB_GLOBAL
constexpr u8 STB_GNU_UNIQUE = 10;

const char* section_type_name(SectionType type) {
    switch (type) {
        case SectionType::TEXT:   return "text";
        case SectionType::RODATA: return "rodata";
        case SectionType::DATA:   return "data";
        case SectionType::BSS:    return "bss";
    }
    return "unknown";
}

//=============================================================================
// ObjectDescriptor Implementation
//=============================================================================

ObjectDescriptor::ObjectDescriptor()
    : image(nullptr), imageSize(0), stringTable(nullptr), stringTableSize(0),
      sectionNameTable(nullptr), sectionNameTableSize(0), sourceFileName(nullptr) {
    for (u32 i = 0; i < SECTION_TYPE_COUNT; i++) {
        bytesPerType[i] = 0;
    }
}

i32 ObjectDescriptor::find_section(const char* name) const {
    for (u32 i = 0; i < sections.size(); i++) {
        if (strcmp(sections[i].name, name) == 0) {
            return static_cast<i32>(i);
        }
    }
    return -1;
}

i32 ObjectDescriptor::find_symbol(const char* name) const {
    for (u32 i = 0; i < symbols.size(); i++) {
        const ObjectSymbol& symbol = symbols[i];
        if (symbol.binding != STB_LOCAL && symbol.sectionIndex >= 0 &&
            strcmp(symbol.name, name) == 0) {
            return static_cast<i32>(i);
        }
    }
    return -1;
}

const u8* ObjectDescriptor::section_bytes(u32 index) const {
    if (index >= sections.size() || sections[index].type == SectionType::BSS) {
        return nullptr;
    }
    return image + sections[index].fileOffset;
}

//=============================================================================
// ObjectReader Implementation
//=============================================================================

SectionType ObjectReader::classify_section(u32 shType, u64 shFlags) {
    if (shFlags & SHF_EXECINSTR) {
        return SectionType::TEXT;
    }
    if (shType == SHT_NOBITS) {
        return SectionType::BSS;
    }
    if (shFlags & SHF_WRITE) {
        return SectionType::DATA;
    }
    return SectionType::RODATA;
}

u32 ObjectReader::relocation_width(u32 type) {
    switch (type) {
        case R_X86_64_64:
        case R_X86_64_PC64:
        case R_X86_64_SIZE64:
            return 8;
        case R_X86_64_32:
        case R_X86_64_32S:
        case R_X86_64_PC32:
        case R_X86_64_PLT32:
        case R_X86_64_SIZE32:
            return 4;
        default:
            return 0;
    }
}

bool ObjectReader::string_at(const char* table, u64 tableSize, u32 offset, const char*& out) {
    if (!table || offset >= tableSize) {
        return false;
    }
    // Tables are verified to end with a terminator, so any in-range offset is a valid string
    out = table + offset;
    return true;
}

/**
 * @brief Validate a string table header and return its bytes
 */
static bool get_string_table(const u8* image, u64 size, const Elf64_Shdr* shdr,
                             const char*& table, u64& tableSize) {
    if (!shdr || shdr->sh_type != SHT_STRTAB || shdr->sh_size == 0) {
        return false;
    }
    if (!ElfValidator::is_range_in_file(shdr->sh_offset, shdr->sh_size, size)) {
        return false;
    }
    
    table = reinterpret_cast<const char*>(image + shdr->sh_offset);
    tableSize = shdr->sh_size;
    return table[tableSize - 1] == '\0';
}

LinkResult ObjectReader::read(const void* data, u64 size, ObjectDescriptor& object) {
    object.sections.clear();
    object.symbols.clear();
    object.relocations.clear();
    object.sourceFileName = nullptr;
    object.stringTable = nullptr;
    object.stringTableSize = 0;
    for (u32 i = 0; i < SECTION_TYPE_COUNT; i++) {
        object.bytesPerType[i] = 0;
    }
    
    if (!ElfValidator::is_valid_elf64(data, size)) {
        LOG_ERROR(TAG, "not an ELF64 little-endian object (%llu bytes)", size);
        return LinkResult::MALFORMED_OBJECT_FILE;
    }
    
    const Elf64_Ehdr* header = static_cast<const Elf64_Ehdr*>(data);
    if (!ElfValidator::is_relocatable_x86_64(header)) {
        LOG_ERROR(TAG, "not a relocatable x86_64 object (type %u, machine %u)",
                  header->e_type, header->e_machine);
        return LinkResult::MALFORMED_OBJECT_FILE;
    }
    
    u64 tableBytes = static_cast<u64>(header->e_shnum) * sizeof(Elf64_Shdr);
    if (!ElfValidator::is_range_in_file(header->e_shoff, tableBytes, size)) {
        LOG_ERROR(TAG, "section header table exceeds the file");
        return LinkResult::MALFORMED_OBJECT_FILE;
    }
    
    object.image = static_cast<const u8*>(data);
    object.imageSize = size;
    
    const Elf64_Shdr* shstrtab = ElfValidator::get_section_header(data, size, header->e_shstrndx);
    if (header->e_shstrndx == SHN_UNDEF ||
        !get_string_table(object.image, size, shstrtab, object.sectionNameTable, object.sectionNameTableSize)) {
        LOG_ERROR(TAG, "missing or invalid section name string table (index %u)", header->e_shstrndx);
        return LinkResult::MALFORMED_OBJECT_FILE;
    }
    
    // ELF section index -> index in object.sections (or -1 when not loadable)
    DynamicArray<i32> sectionMap;
    if (!sectionMap.resize(header->e_shnum)) {
        return LinkResult::OUT_OF_MEMORY;
    }
    
    LinkResult result = read_sections(header, object, sectionMap.data());
    if (result != LinkResult::SUCCESS) {
        return result;
    }
    
    // Exactly one symbol table is allowed
    const Elf64_Shdr* symtab = nullptr;
    u32 symtabIndex = 0;
    for (u32 i = 1; i < header->e_shnum; i++) {
        const Elf64_Shdr* shdr = ElfValidator::get_section_header(data, size, i);
        if (shdr->sh_type != SHT_SYMTAB) continue;
        
        if (symtab) {
            LOG_ERROR(TAG, "object has more than one symbol table");
            return LinkResult::MALFORMED_OBJECT_FILE;
        }
        symtab = shdr;
        symtabIndex = i;
    }
    
    if (symtab) {
        result = read_symbols(symtab, object, sectionMap.data());
        if (result != LinkResult::SUCCESS) {
            return result;
        }
    }
    
    for (u32 i = 1; i < header->e_shnum; i++) {
        const Elf64_Shdr* shdr = ElfValidator::get_section_header(data, size, i);
        
        if (shdr->sh_type == SHT_REL) {
            if (shdr->sh_info < header->e_shnum && sectionMap[shdr->sh_info] >= 0) {
                LOG_ERROR(TAG, "REL tables without addends are not used on x86_64 (section %u)", i);
                return LinkResult::MALFORMED_OBJECT_FILE;
            }
            continue;
        }
        if (shdr->sh_type != SHT_RELA) continue;
        
        if (!symtab) {
            LOG_ERROR(TAG, "relocation table %u without a symbol table", i);
            return LinkResult::MALFORMED_OBJECT_FILE;
        }
        
        result = read_relocations(shdr, symtabIndex, object, sectionMap.data());
        if (result != LinkResult::SUCCESS) {
            return result;
        }
    }
    
    LOG_DEBUG(TAG, "parsed object: %u sections, %u symbols, %u relocations",
              object.sections.size(), object.symbols.size(), object.relocations.size());
    return LinkResult::SUCCESS;
}

LinkResult ObjectReader::read_sections(const Elf64_Ehdr* header, ObjectDescriptor& object, i32* sectionMap) {
    for (u32 i = 0; i < header->e_shnum; i++) {
        sectionMap[i] = -1;
    }
    
    for (u32 i = 1; i < header->e_shnum; i++) {
        const Elf64_Shdr* shdr = ElfValidator::get_section_header(object.image, object.imageSize, i);
        if (!shdr) {
            return LinkResult::MALFORMED_OBJECT_FILE;
        }
        if (shdr->sh_type == SHT_NULL || !(shdr->sh_flags & SHF_ALLOC)) {
            continue;
        }
        
        ObjectSection section = {};
        if (!string_at(object.sectionNameTable, object.sectionNameTableSize, shdr->sh_name, section.name)) {
            LOG_ERROR(TAG, "section %u has an out-of-range name offset", i);
            return LinkResult::MALFORMED_OBJECT_FILE;
        }
        
        if (shdr->sh_flags & SHF_TLS) {
            LOG_ERROR(TAG, "thread-local section %s cannot be loaded", section.name);
            return LinkResult::MALFORMED_OBJECT_FILE;
        }
        
        u64 alignment = shdr->sh_addralign ? shdr->sh_addralign : 1;
        if (!is_power_of_two(alignment) || alignment > MAX_SECTION_ALIGNMENT) {
            LOG_ERROR(TAG, "section %s has invalid alignment %llu", section.name, alignment);
            return LinkResult::MALFORMED_OBJECT_FILE;
        }
        
        section.elfIndex = i;
        section.type = classify_section(shdr->sh_type, shdr->sh_flags);
        section.size = shdr->sh_size;
        section.alignment = alignment;
        section.fileOffset = 0;
        
        if (shdr->sh_type != SHT_NOBITS) {
            if (!ElfValidator::is_range_in_file(shdr->sh_offset, shdr->sh_size, object.imageSize)) {
                LOG_ERROR(TAG, "section %s exceeds the file", section.name);
                return LinkResult::MALFORMED_OBJECT_FILE;
            }
            section.fileOffset = shdr->sh_offset;
        }
        
        u32 typeIndex = static_cast<u32>(section.type);
        object.bytesPerType[typeIndex] = align_up(object.bytesPerType[typeIndex], alignment) + section.size;
        
        sectionMap[i] = static_cast<i32>(object.sections.size());
        if (!object.sections.push_back(section)) {
            return LinkResult::OUT_OF_MEMORY;
        }
    }
    
    return LinkResult::SUCCESS;
}

LinkResult ObjectReader::read_symbols(const Elf64_Shdr* symtab, ObjectDescriptor& object, const i32* sectionMap) {
    const Elf64_Ehdr* header = reinterpret_cast<const Elf64_Ehdr*>(object.image);
    
    if (symtab->sh_entsize != sizeof(Elf64_Sym) || symtab->sh_size % sizeof(Elf64_Sym) != 0 ||
        !ElfValidator::is_range_in_file(symtab->sh_offset, symtab->sh_size, object.imageSize)) {
        LOG_ERROR(TAG, "malformed symbol table header");
        return LinkResult::MALFORMED_OBJECT_FILE;
    }
    
    const Elf64_Shdr* strtab = ElfValidator::get_section_header(object.image, object.imageSize, symtab->sh_link);
    if (symtab->sh_link == SHN_UNDEF ||
        !get_string_table(object.image, object.imageSize, strtab, object.stringTable, object.stringTableSize)) {
        LOG_ERROR(TAG, "missing or invalid symbol string table (index %u)", symtab->sh_link);
        return LinkResult::MALFORMED_OBJECT_FILE;
    }
    
    u64 count = symtab->sh_size / sizeof(Elf64_Sym);
    if (count > 0x00FFFFFF) {
        LOG_ERROR(TAG, "symbol table too large (%llu entries)", count);
        return LinkResult::MALFORMED_OBJECT_FILE;
    }
    if (!object.symbols.reserve(static_cast<u32>(count))) {
        return LinkResult::OUT_OF_MEMORY;
    }
    
    const Elf64_Sym* entries = reinterpret_cast<const Elf64_Sym*>(object.image + symtab->sh_offset);
    for (u64 i = 0; i < count; i++) {
        const Elf64_Sym& entry = entries[i];
        ObjectSymbol symbol = {};
        
        if (!string_at(object.stringTable, object.stringTableSize, entry.st_name, symbol.name)) {
            LOG_ERROR(TAG, "symbol %llu has an out-of-range name offset", i);
            return LinkResult::MALFORMED_OBJECT_FILE;
        }
        
        symbol.binding = elf64_st_bind(entry.st_info);
        symbol.type = elf64_st_type(entry.st_info);
        symbol.value = entry.st_value;
        symbol.size = entry.st_size;
        
        if (symbol.binding == STB_GNU_UNIQUE) {
            symbol.binding = STB_GLOBAL;
        }
        if (symbol.binding != STB_LOCAL && symbol.binding != STB_GLOBAL && symbol.binding != STB_WEAK) {
            LOG_ERROR(TAG, "symbol %s has unknown binding %u", symbol.name, symbol.binding);
            return LinkResult::MALFORMED_OBJECT_FILE;
        }
        if (symbol.type == STT_TLS || symbol.type == STT_COMMON) {
            LOG_ERROR(TAG, "symbol %s uses unsupported type %u", symbol.name, symbol.type);
            return LinkResult::MALFORMED_OBJECT_FILE;
        }
        
        u16 shndx = entry.st_shndx;
        if (shndx == SHN_UNDEF) {
            symbol.sectionIndex = SYMBOL_UNDEFINED;
        } else if (shndx == SHN_ABS) {
            symbol.sectionIndex = SYMBOL_ABSOLUTE;
        } else if (shndx >= SHN_LORESERVE) {
            LOG_ERROR(TAG, "symbol %s uses reserved section index %x", symbol.name, shndx);
            return LinkResult::MALFORMED_OBJECT_FILE;
        } else if (shndx >= header->e_shnum) {
            LOG_ERROR(TAG, "symbol %s references section %u of %u", symbol.name, shndx, header->e_shnum);
            return LinkResult::MALFORMED_OBJECT_FILE;
        } else if (sectionMap[shndx] < 0) {
            symbol.sectionIndex = SYMBOL_NOT_LOADED;
        } else {
            symbol.sectionIndex = sectionMap[shndx];
            const ObjectSection& section = object.sections[static_cast<u32>(symbol.sectionIndex)];
            if (symbol.value > section.size || symbol.size > section.size - symbol.value) {
                LOG_ERROR(TAG, "symbol %s lies outside section %s", symbol.name, section.name);
                return LinkResult::MALFORMED_OBJECT_FILE;
            }
        }
        
        if (symbol.type == STT_FILE && !object.sourceFileName && symbol.name[0] != '\0') {
            object.sourceFileName = symbol.name;
        }
        
        if (!object.symbols.push_back(symbol)) {
            return LinkResult::OUT_OF_MEMORY;
        }
    }
    
    return LinkResult::SUCCESS;
}

LinkResult ObjectReader::read_relocations(const Elf64_Shdr* rela, u32 symtabIndex, ObjectDescriptor& object,
                                          const i32* sectionMap) {
    const Elf64_Ehdr* header = reinterpret_cast<const Elf64_Ehdr*>(object.image);
    
    if (rela->sh_entsize != sizeof(Elf64_Rela) || rela->sh_size % sizeof(Elf64_Rela) != 0 ||
        !ElfValidator::is_range_in_file(rela->sh_offset, rela->sh_size, object.imageSize)) {
        LOG_ERROR(TAG, "malformed relocation table header");
        return LinkResult::MALFORMED_OBJECT_FILE;
    }
    if (rela->sh_link != symtabIndex) {
        LOG_ERROR(TAG, "relocation table links to section %u instead of the symbol table", rela->sh_link);
        return LinkResult::MALFORMED_OBJECT_FILE;
    }
    if (rela->sh_info == SHN_UNDEF || rela->sh_info >= header->e_shnum) {
        LOG_ERROR(TAG, "relocation table targets section %u of %u", rela->sh_info, header->e_shnum);
        return LinkResult::MALFORMED_OBJECT_FILE;
    }
    
    // Relocations against debug and other non-loaded sections are not applied
    i32 target = sectionMap[rela->sh_info];
    if (target < 0) {
        return LinkResult::SUCCESS;
    }
    
    const ObjectSection& section = object.sections[static_cast<u32>(target)];
    if (section.type == SectionType::BSS) {
        LOG_ERROR(TAG, "relocation table targets zero-initialized section %s", section.name);
        return LinkResult::MALFORMED_OBJECT_FILE;
    }
    
    u64 count = rela->sh_size / sizeof(Elf64_Rela);
    const Elf64_Rela* entries = reinterpret_cast<const Elf64_Rela*>(object.image + rela->sh_offset);
    for (u64 i = 0; i < count; i++) {
        const Elf64_Rela& entry = entries[i];
        u32 type = elf64_r_type(entry.r_info);
        u32 symbolIndex = elf64_r_sym(entry.r_info);
        
        if (type == R_X86_64_NONE) continue;
        
        if (type > R_X86_64_MAX_DEFINED) {
            LOG_ERROR(TAG, "relocation %llu in %s has undefined type %u", i, section.name, type);
            return LinkResult::MALFORMED_OBJECT_FILE;
        }
        if (symbolIndex == 0 || symbolIndex >= object.symbols.size()) {
            LOG_ERROR(TAG, "relocation %llu in %s references symbol %u of %u",
                      i, section.name, symbolIndex, object.symbols.size());
            return LinkResult::MALFORMED_OBJECT_FILE;
        }
        
        // Types the loader cannot apply are rejected at link time; bounds use one byte for them
        u32 width = relocation_width(type);
        if (width == 0) width = 1;
        if (entry.r_offset > section.size || width > section.size - entry.r_offset) {
            LOG_ERROR(TAG, "relocation %llu patches offset %llx beyond %s (size %llx)",
                      i, entry.r_offset, section.name, section.size);
            return LinkResult::MALFORMED_OBJECT_FILE;
        }
        
        ObjectRelocation relocation = {};
        relocation.sectionIndex = static_cast<u32>(target);
        relocation.offset = entry.r_offset;
        relocation.symbolIndex = symbolIndex;
        relocation.type = type;
        relocation.addend = entry.r_addend;
        
        if (!object.relocations.push_back(relocation)) {
            return LinkResult::OUT_OF_MEMORY;
        }
    }
    
    return LinkResult::SUCCESS;
}

} // namespace strata::loaders
