#pragma once

#include "core/types.hpp"

namespace strata::formats {

using namespace strata::system;

// ELF magic number
constexpr u32 ELF_MAGIC = 0x464C457F; // "\x7FELF"

// ELF identification indices
constexpr u32 EI_CLASS = 4;
constexpr u32 EI_DATA = 5;
constexpr u32 EI_VERSION = 6;
constexpr u32 EI_NIDENT = 16;

// ELF file classes
constexpr u8 ELF_CLASS_32 = 1;  // 32-bit
constexpr u8 ELF_CLASS_64 = 2;  // 64-bit

// ELF data encodings
constexpr u8 ELF_DATA_LSB = 1;  // Little endian
constexpr u8 ELF_DATA_MSB = 2;  // Big endian

// ELF file types
constexpr u16 ELF_TYPE_NONE = 0;    // No file type
constexpr u16 ELF_TYPE_REL = 1;     // Relocatable file
constexpr u16 ELF_TYPE_EXEC = 2;    // Executable file
constexpr u16 ELF_TYPE_DYN = 3;     // Shared object file

// ELF machine types
constexpr u16 ELF_MACHINE_NONE = 0;     // No machine
constexpr u16 ELF_MACHINE_X86_64 = 62;  // AMD x86-64

// ELF versions
constexpr u32 ELF_VERSION_CURRENT = 1;

// Section header types
constexpr u32 SHT_NULL = 0;         // Unused
constexpr u32 SHT_PROGBITS = 1;     // Program data
constexpr u32 SHT_SYMTAB = 2;       // Symbol table
constexpr u32 SHT_STRTAB = 3;       // String table
constexpr u32 SHT_RELA = 4;         // Relocation entries with addends
constexpr u32 SHT_HASH = 5;         // Symbol hash table
constexpr u32 SHT_DYNAMIC = 6;      // Dynamic linking info
constexpr u32 SHT_NOTE = 7;         // Notes
constexpr u32 SHT_NOBITS = 8;       // BSS section
constexpr u32 SHT_REL = 9;          // Relocation entries
constexpr u32 SHT_DYNSYM = 11;      // Dynamic symbol table
constexpr u32 SHT_INIT_ARRAY = 14;  // Constructor pointers
constexpr u32 SHT_FINI_ARRAY = 15;  // Destructor pointers
constexpr u32 SHT_GROUP = 17;       // Section group
constexpr u32 SHT_SYMTAB_SHNDX = 18;
constexpr u32 SHT_X86_64_UNWIND = 0x70000001;

// Section header flags
constexpr u64 SHF_WRITE = 0x1;
constexpr u64 SHF_ALLOC = 0x2;
constexpr u64 SHF_EXECINSTR = 0x4;
constexpr u64 SHF_MERGE = 0x10;
constexpr u64 SHF_STRINGS = 0x20;
constexpr u64 SHF_INFO_LINK = 0x40;
constexpr u64 SHF_GROUP = 0x200;
constexpr u64 SHF_TLS = 0x400;

// Special section indices
constexpr u16 SHN_UNDEF = 0;
constexpr u16 SHN_LORESERVE = 0xff00;
constexpr u16 SHN_ABS = 0xfff1;
constexpr u16 SHN_COMMON = 0xfff2;
constexpr u16 SHN_XINDEX = 0xffff;

// Symbol bindings
constexpr u8 STB_LOCAL = 0;
constexpr u8 STB_GLOBAL = 1;
constexpr u8 STB_WEAK = 2;

// Symbol types
constexpr u8 STT_NOTYPE = 0;
constexpr u8 STT_OBJECT = 1;
constexpr u8 STT_FUNC = 2;
constexpr u8 STT_SECTION = 3;
constexpr u8 STT_FILE = 4;
constexpr u8 STT_COMMON = 5;
constexpr u8 STT_TLS = 6;

// x86_64 relocation types
constexpr u32 R_X86_64_NONE = 0;
constexpr u32 R_X86_64_64 = 1;
constexpr u32 R_X86_64_PC32 = 2;
constexpr u32 R_X86_64_GOT32 = 3;
constexpr u32 R_X86_64_PLT32 = 4;
constexpr u32 R_X86_64_COPY = 5;
constexpr u32 R_X86_64_GLOB_DAT = 6;
constexpr u32 R_X86_64_JUMP_SLOT = 7;
constexpr u32 R_X86_64_RELATIVE = 8;
constexpr u32 R_X86_64_GOTPCREL = 9;
constexpr u32 R_X86_64_32 = 10;
constexpr u32 R_X86_64_32S = 11;
constexpr u32 R_X86_64_16 = 12;
constexpr u32 R_X86_64_PC16 = 13;
constexpr u32 R_X86_64_8 = 14;
constexpr u32 R_X86_64_PC8 = 15;
constexpr u32 R_X86_64_DTPMOD64 = 16;
constexpr u32 R_X86_64_DTPOFF64 = 17;
constexpr u32 R_X86_64_TPOFF64 = 18;
constexpr u32 R_X86_64_TLSGD = 19;
constexpr u32 R_X86_64_TLSLD = 20;
constexpr u32 R_X86_64_DTPOFF32 = 21;
constexpr u32 R_X86_64_GOTTPOFF = 22;
constexpr u32 R_X86_64_TPOFF32 = 23;
constexpr u32 R_X86_64_PC64 = 24;
constexpr u32 R_X86_64_GOTOFF64 = 25;
constexpr u32 R_X86_64_GOTPC32 = 26;
constexpr u32 R_X86_64_SIZE32 = 32;
constexpr u32 R_X86_64_SIZE64 = 33;
constexpr u32 R_X86_64_GOTPC32_TLSDESC = 34;
constexpr u32 R_X86_64_TLSDESC_CALL = 35;
constexpr u32 R_X86_64_TLSDESC = 36;
constexpr u32 R_X86_64_IRELATIVE = 37;
constexpr u32 R_X86_64_GOTPCRELX = 41;
constexpr u32 R_X86_64_REX_GOTPCRELX = 42;
// Highest relocation type defined by the x86_64 psABI
constexpr u32 R_X86_64_MAX_DEFINED = R_X86_64_REX_GOTPCRELX;

/**
 * @brief ELF64 Header Structure
 * 
 * The main header at the beginning of every ELF file.
 * Contains metadata about the file format and layout.
 */
struct Elf64_Ehdr {
    u8  e_ident[EI_NIDENT]; // ELF identification
    u16 e_type;             // Object file type
    u16 e_machine;          // Architecture
    u32 e_version;          // Object file version
    u64 e_entry;            // Entry point virtual address
    u64 e_phoff;            // Program header table file offset
    u64 e_shoff;            // Section header table file offset
    u32 e_flags;            // Processor-specific flags
    u16 e_ehsize;           // ELF header size in bytes
    u16 e_phentsize;        // Program header table entry size
    u16 e_phnum;            // Program header table entry count
    u16 e_shentsize;        // Section header table entry size
    u16 e_shnum;            // Section header table entry count
    u16 e_shstrndx;         // Section header string table index
} __attribute__((packed));

/**
 * @brief ELF64 Section Header Structure
 */
struct Elf64_Shdr {
    u32 sh_name;            // Section name (string table offset)
    u32 sh_type;            // Section type
    u64 sh_flags;           // Section flags
    u64 sh_addr;            // Section virtual address at execution
    u64 sh_offset;          // Section file offset
    u64 sh_size;            // Section size in bytes
    u32 sh_link;            // Link to another section
    u32 sh_info;            // Additional section information
    u64 sh_addralign;       // Section alignment
    u64 sh_entsize;         // Entry size if section holds table
} __attribute__((packed));

/**
 * @brief ELF64 Symbol Table Entry
 */
struct Elf64_Sym {
    u32 st_name;            // Symbol name (string table offset)
    u8  st_info;            // Binding and type
    u8  st_other;           // Visibility
    u16 st_shndx;           // Defining section index
    u64 st_value;           // Offset within the defining section
    u64 st_size;            // Size of the object
} __attribute__((packed));

/**
 * @brief ELF64 Relocation Entry with explicit addend
 */
struct Elf64_Rela {
    u64 r_offset;           // Offset of the patched field in the target section
    u64 r_info;             // Symbol index and relocation type
    i64 r_addend;           // Constant addend
} __attribute__((packed));

static_assert(sizeof(Elf64_Ehdr) == 64, "Elf64_Ehdr layout");
static_assert(sizeof(Elf64_Shdr) == 64, "Elf64_Shdr layout");
static_assert(sizeof(Elf64_Sym) == 24, "Elf64_Sym layout");
static_assert(sizeof(Elf64_Rela) == 24, "Elf64_Rela layout");

inline u8 elf64_st_bind(u8 info) { return info >> 4; }
inline u8 elf64_st_type(u8 info) { return info & 0xF; }
inline u8 elf64_st_info(u8 bind, u8 type) { return static_cast<u8>((bind << 4) | (type & 0xF)); }
inline u32 elf64_r_sym(u64 info) { return static_cast<u32>(info >> 32); }
inline u32 elf64_r_type(u64 info) { return static_cast<u32>(info & 0xFFFFFFFF); }
inline u64 elf64_r_info(u32 sym, u32 type) { return (static_cast<u64>(sym) << 32) | type; }

/**
 * @brief ELF Validation and Utility Functions
 */
class ElfValidator {
public:
    /**
     * @brief Check if data contains a valid ELF64 little-endian header
     * @param data Pointer to potential ELF data
     * @param size Size of data buffer
     * @return true if the identification and header sizes are valid
     */
    static bool is_valid_elf64(const void* data, u64 size);
    
    /**
     * @brief Check if ELF is a relocatable object for x86_64
     * @param header ELF header to check
     * @return true if relocatable x86_64 ELF with a section header table
     */
    static bool is_relocatable_x86_64(const Elf64_Ehdr* header);
    
    /**
     * @brief Get section header by index with bounds checking
     * @param elfData ELF file data
     * @param size Size of ELF data
     * @param index Section header index
     * @return Pointer to section header or nullptr
     */
    static const Elf64_Shdr* get_section_header(const void* elfData, u64 size, u32 index);
    
    /**
     * @brief Check that [offset, offset + length) lies inside the file
     */
    static bool is_range_in_file(u64 offset, u64 length, u64 fileSize);
    
    /**
     * @brief Get a relocation type's name for diagnostics
     */
    static const char* relocation_type_name(u32 type);
};

} // namespace strata::formats
