#include "formats/elf.hpp"
#include "core/utils.hpp"

namespace strata::formats {

bool ElfValidator::is_valid_elf64(const void* data, u64 size) {
    if (!data || size < sizeof(Elf64_Ehdr)) {
        return false;
    }
    
    const Elf64_Ehdr* header = static_cast<const Elf64_Ehdr*>(data);
    
    // Check ELF magic number
    u32 magic;
    utils::memcpy(&magic, header->e_ident, sizeof(magic));
    if (magic != ELF_MAGIC) {
        return false;
    }
    
    // Check for 64-bit ELF
    if (header->e_ident[EI_CLASS] != ELF_CLASS_64) {
        return false;
    }
    
    // Check for little endian
    if (header->e_ident[EI_DATA] != ELF_DATA_LSB) {
        return false;
    }
    
    // Check ELF version
    if (header->e_version != ELF_VERSION_CURRENT) {
        return false;
    }
    
    // Check header size
    if (header->e_ehsize != sizeof(Elf64_Ehdr)) {
        return false;
    }
    
    return true;
}

bool ElfValidator::is_relocatable_x86_64(const Elf64_Ehdr* header) {
    if (!header) {
        return false;
    }
    
    if (header->e_type != ELF_TYPE_REL) {
        return false;
    }
    
    if (header->e_machine != ELF_MACHINE_X86_64) {
        return false;
    }
    
    // Relocatable objects are described by sections, not segments
    if (header->e_shoff == 0 || header->e_shnum == 0 ||
        header->e_shentsize != sizeof(Elf64_Shdr)) {
        return false;
    }
    
    return true;
}

bool ElfValidator::is_range_in_file(u64 offset, u64 length, u64 fileSize) {
    if (offset > fileSize) return false;
    return length <= fileSize - offset;
}

const Elf64_Shdr* ElfValidator::get_section_header(const void* elfData, u64 size, u32 index) {
    if (!elfData) {
        return nullptr;
    }
    
    const Elf64_Ehdr* header = static_cast<const Elf64_Ehdr*>(elfData);
    
    if (index >= header->e_shnum) {
        return nullptr;
    }
    
    u64 offset = header->e_shoff + static_cast<u64>(index) * header->e_shentsize;
    if (!is_range_in_file(offset, sizeof(Elf64_Shdr), size)) {
        return nullptr;
    }
    
    return reinterpret_cast<const Elf64_Shdr*>(static_cast<const u8*>(elfData) + offset);
}

const char* ElfValidator::relocation_type_name(u32 type) {
    switch (type) {
        case R_X86_64_NONE:      return "R_X86_64_NONE";
        case R_X86_64_64:        return "R_X86_64_64";
        case R_X86_64_PC32:      return "R_X86_64_PC32";
        case R_X86_64_GOT32:     return "R_X86_64_GOT32";
        case R_X86_64_PLT32:     return "R_X86_64_PLT32";
        case R_X86_64_COPY:      return "R_X86_64_COPY";
        case R_X86_64_GLOB_DAT:  return "R_X86_64_GLOB_DAT";
        case R_X86_64_JUMP_SLOT: return "R_X86_64_JUMP_SLOT";
        case R_X86_64_RELATIVE:  return "R_X86_64_RELATIVE";
        case R_X86_64_GOTPCREL:  return "R_X86_64_GOTPCREL";
        case R_X86_64_32:        return "R_X86_64_32";
        case R_X86_64_32S:       return "R_X86_64_32S";
        case R_X86_64_16:        return "R_X86_64_16";
        case R_X86_64_PC16:      return "R_X86_64_PC16";
        case R_X86_64_8:         return "R_X86_64_8";
        case R_X86_64_PC8:       return "R_X86_64_PC8";
        case R_X86_64_TPOFF32:   return "R_X86_64_TPOFF32";
        case R_X86_64_PC64:      return "R_X86_64_PC64";
        case R_X86_64_GOTOFF64:  return "R_X86_64_GOTOFF64";
        case R_X86_64_GOTPC32:   return "R_X86_64_GOTPC32";
        case R_X86_64_SIZE32:    return "R_X86_64_SIZE32";
        case R_X86_64_SIZE64:    return "R_X86_64_SIZE64";
        case R_X86_64_GOTPCRELX: return "R_X86_64_GOTPCRELX";
        case R_X86_64_REX_GOTPCRELX: return "R_X86_64_REX_GOTPCRELX";
        default:                 return "R_X86_64_<other>";
    }
}

} // namespace strata::formats
