#include "test/object_builder.hpp"
#include "core/utils.hpp"

namespace strata::test {

using namespace strata::utils;

static bool append_bytes(DynamicArray<u8>& out, const void* data, u64 size) {
    u32 offset = out.size();
    if (!out.resize(offset + static_cast<u32>(size))) {
        return false;
    }
    if (size) {
        memcpy(out.data() + offset, data, size);
    }
    return true;
}

static bool pad_to(DynamicArray<u8>& out, u64 alignment) {
    return out.resize(static_cast<u32>(align_up(out.size(), alignment)));
}

// Appends prefix + str and returns its offset, or 0 on allocation failure
static u32 append_string(DynamicArray<char>& table, const char* prefix, const char* str) {
    u32 offset = table.size();
    for (u32 i = 0; prefix && prefix[i]; i++) {
        if (!table.push_back(prefix[i])) return 0;
    }
    for (u32 i = 0; str[i]; i++) {
        if (!table.push_back(str[i])) return 0;
    }
    return table.push_back('\0') ? offset : 0;
}

ObjectBuilder::ObjectBuilder() : m_failed(false) {}

u16 ObjectBuilder::add_section(const char* name, u32 type, u64 flags, const void* data, u64 size, u64 alignment) {
    Section section = {name, type, flags, static_cast<const u8*>(data), size, alignment};
    if (!m_sections.push_back(section)) m_failed = true;
    return static_cast<u16>(m_sections.size());
}

u16 ObjectBuilder::add_text(const char* name, const void* data, u64 size) {
    return add_section(name, SHT_PROGBITS, SHF_ALLOC | SHF_EXECINSTR, data, size, 16);
}

u16 ObjectBuilder::add_rodata(const char* name, const void* data, u64 size) {
    return add_section(name, SHT_PROGBITS, SHF_ALLOC, data, size, 8);
}

u16 ObjectBuilder::add_data(const char* name, const void* data, u64 size) {
    return add_section(name, SHT_PROGBITS, SHF_ALLOC | SHF_WRITE, data, size, 8);
}

u16 ObjectBuilder::add_bss(const char* name, u64 size) {
    return add_section(name, SHT_NOBITS, SHF_ALLOC | SHF_WRITE, nullptr, size, 8);
}

u32 ObjectBuilder::add_symbol(const char* name, u8 binding, u8 type, u16 sectionIndex, u64 value, u64 size) {
    Symbol symbol = {name, binding, type, sectionIndex, value, size};
    if (!m_symbols.push_back(symbol)) m_failed = true;
    return m_symbols.size() - 1;
}

u32 ObjectBuilder::add_global(const char* name, u16 sectionIndex, u64 value, u64 size, u8 type) {
    return add_symbol(name, STB_GLOBAL, type, sectionIndex, value, size);
}

u32 ObjectBuilder::add_weak(const char* name, u16 sectionIndex, u64 value, u64 size, u8 type) {
    return add_symbol(name, STB_WEAK, type, sectionIndex, value, size);
}

u32 ObjectBuilder::add_local(const char* name, u16 sectionIndex, u64 value, u64 size, u8 type) {
    return add_symbol(name, STB_LOCAL, type, sectionIndex, value, size);
}

u32 ObjectBuilder::add_undefined(const char* name, bool weak) {
    return add_symbol(name, weak ? STB_WEAK : STB_GLOBAL, STT_NOTYPE, SHN_UNDEF, 0, 0);
}

u32 ObjectBuilder::add_section_symbol(u16 sectionIndex) {
    return add_symbol("", STB_LOCAL, STT_SECTION, sectionIndex, 0, 0);
}

u32 ObjectBuilder::add_file(const char* name) {
    return add_symbol(name, STB_LOCAL, STT_FILE, SHN_ABS, 0, 0);
}

void ObjectBuilder::add_relocation(u16 sectionIndex, u64 offset, u32 symbol, u32 type, i64 addend) {
    Relocation relocation = {sectionIndex, offset, symbol, type, addend};
    if (!m_relocations.push_back(relocation)) m_failed = true;
}

bool ObjectBuilder::build(DynamicArray<u8>& out) const {
    out.clear();
    if (m_failed) {
        return false;
    }
    u32 sectionCount = m_sections.size();
    
    // Sections that get a .rela companion, in section order
    DynamicArray<u16> relocated;
    for (u32 s = 1; s <= sectionCount; s++) {
        for (u32 r = 0; r < m_relocations.size(); r++) {
            if (m_relocations[r].sectionIndex == s) {
                if (!relocated.push_back(static_cast<u16>(s))) return false;
                break;
            }
        }
    }
    
    u32 symtabIndex = sectionCount + 1;
    u32 strtabIndex = sectionCount + 2;
    u32 firstRelaIndex = sectionCount + 3;
    u32 shstrtabIndex = firstRelaIndex + relocated.size();
    u32 headerCount = shstrtabIndex + 1;
    
    DynamicArray<Elf64_Shdr> headers;
    DynamicArray<char> sectionNames;
    DynamicArray<char> symbolNames;
    if (!headers.resize(headerCount) || !sectionNames.push_back('\0') || !symbolNames.push_back('\0')) {
        return false;
    }
    if (!out.resize(sizeof(Elf64_Ehdr))) {
        return false;
    }
    
    //=========================================================================
    // Section contents
    //=========================================================================
    
    for (u32 s = 0; s < sectionCount; s++) {
        const Section& section = m_sections[s];
        Elf64_Shdr& header = headers[s + 1];
        header.sh_name = append_string(sectionNames, nullptr, section.name);
        if (!header.sh_name) return false;
        header.sh_type = section.type;
        header.sh_flags = section.flags;
        header.sh_size = section.size;
        header.sh_addralign = section.alignment;
        
        if (section.type != SHT_NOBITS) {
            if (!pad_to(out, 16)) return false;
            header.sh_offset = out.size();
            if (!append_bytes(out, section.data, section.size)) return false;
        } else {
            header.sh_offset = out.size();
        }
    }
    
    //=========================================================================
    // Symbol table, locals first
    //=========================================================================
    
    DynamicArray<u32> symbolIndex;
    DynamicArray<Elf64_Sym> symbols;
    if (!symbolIndex.resize(m_symbols.size()) || !symbols.resize(1)) {
        return false;
    }
    
    u32 firstGlobal = 0;
    for (u32 pass = 0; pass < 2; pass++) {
        for (u32 i = 0; i < m_symbols.size(); i++) {
            const Symbol& symbol = m_symbols[i];
            bool local = symbol.binding == STB_LOCAL;
            if (local != (pass == 0)) continue;
            
            Elf64_Sym entry = {};
            if (symbol.name && symbol.name[0]) {
                entry.st_name = append_string(symbolNames, nullptr, symbol.name);
                if (!entry.st_name) return false;
            }
            entry.st_info = elf64_st_info(symbol.binding, symbol.type);
            entry.st_shndx = symbol.sectionIndex;
            entry.st_value = symbol.value;
            entry.st_size = symbol.size;
            symbolIndex[i] = symbols.size();
            if (!symbols.push_back(entry)) return false;
        }
        if (pass == 0) {
            firstGlobal = symbols.size();
        }
    }
    
    Elf64_Shdr& symtab = headers[symtabIndex];
    symtab.sh_name = append_string(sectionNames, nullptr, ".symtab");
    if (!symtab.sh_name || !pad_to(out, 8)) return false;
    symtab.sh_type = SHT_SYMTAB;
    symtab.sh_offset = out.size();
    symtab.sh_size = static_cast<u64>(symbols.size()) * sizeof(Elf64_Sym);
    symtab.sh_link = strtabIndex;
    symtab.sh_info = firstGlobal;
    symtab.sh_addralign = 8;
    symtab.sh_entsize = sizeof(Elf64_Sym);
    if (!append_bytes(out, symbols.data(), symtab.sh_size)) return false;
    
    Elf64_Shdr& strtab = headers[strtabIndex];
    strtab.sh_name = append_string(sectionNames, nullptr, ".strtab");
    if (!strtab.sh_name) return false;
    strtab.sh_type = SHT_STRTAB;
    strtab.sh_offset = out.size();
    strtab.sh_size = symbolNames.size();
    strtab.sh_addralign = 1;
    if (!append_bytes(out, symbolNames.data(), strtab.sh_size)) return false;
    
    //=========================================================================
    // Relocations
    //=========================================================================
    
    for (u32 k = 0; k < relocated.size(); k++) {
        u16 target = relocated[k];
        DynamicArray<Elf64_Rela> entries;
        for (u32 r = 0; r < m_relocations.size(); r++) {
            const Relocation& relocation = m_relocations[r];
            if (relocation.sectionIndex != target) continue;
            
            // Ids past the last symbol are written unchanged
            u32 index = relocation.symbol < symbolIndex.size() ? symbolIndex[relocation.symbol] : relocation.symbol;
            Elf64_Rela entry = {relocation.offset, elf64_r_info(index, relocation.type), relocation.addend};
            if (!entries.push_back(entry)) return false;
        }
        
        Elf64_Shdr& rela = headers[firstRelaIndex + k];
        rela.sh_name = append_string(sectionNames, ".rela", m_sections[target - 1].name);
        if (!rela.sh_name || !pad_to(out, 8)) return false;
        rela.sh_type = SHT_RELA;
        rela.sh_flags = SHF_INFO_LINK;
        rela.sh_offset = out.size();
        rela.sh_size = static_cast<u64>(entries.size()) * sizeof(Elf64_Rela);
        rela.sh_link = symtabIndex;
        rela.sh_info = target;
        rela.sh_addralign = 8;
        rela.sh_entsize = sizeof(Elf64_Rela);
        if (!append_bytes(out, entries.data(), rela.sh_size)) return false;
    }
    
    Elf64_Shdr& shstrtab = headers[shstrtabIndex];
    shstrtab.sh_name = append_string(sectionNames, nullptr, ".shstrtab");
    if (!shstrtab.sh_name) return false;
    shstrtab.sh_type = SHT_STRTAB;
    shstrtab.sh_offset = out.size();
    shstrtab.sh_size = sectionNames.size();
    shstrtab.sh_addralign = 1;
    if (!append_bytes(out, sectionNames.data(), shstrtab.sh_size)) return false;
    
    //=========================================================================
    // Section header table and ELF header
    //=========================================================================
    
    if (!pad_to(out, 8)) return false;
    u64 shoff = out.size();
    if (!append_bytes(out, headers.data(), static_cast<u64>(headerCount) * sizeof(Elf64_Shdr))) return false;
    
    Elf64_Ehdr header = {};
    header.e_ident[0] = 0x7F;
    header.e_ident[1] = 'E';
    header.e_ident[2] = 'L';
    header.e_ident[3] = 'F';
    header.e_ident[EI_CLASS] = ELF_CLASS_64;
    header.e_ident[EI_DATA] = ELF_DATA_LSB;
    header.e_ident[EI_VERSION] = ELF_VERSION_CURRENT;
    header.e_type = ELF_TYPE_REL;
    header.e_machine = ELF_MACHINE_X86_64;
    header.e_version = ELF_VERSION_CURRENT;
    header.e_shoff = shoff;
    header.e_ehsize = sizeof(Elf64_Ehdr);
    header.e_shentsize = sizeof(Elf64_Shdr);
    header.e_shnum = static_cast<u16>(headerCount);
    header.e_shstrndx = static_cast<u16>(shstrtabIndex);
    memcpy(out.data(), &header, sizeof(header));
    return true;
}

} // namespace strata::test
