#pragma once

#include "core/types.hpp"

namespace strata::system {

// Memory map entry structure (matches E820h format)
struct MemoryMapEntry {
    u64 baseAddress;    // Base address of the memory region
    u64 length;         // Length of the memory region
    u32 type;           // Type of memory region
    u32 acpi;           // ACPI 3.0 extended attributes
} __attribute__((packed));

// Memory region types (from E820h)
enum class MemoryType : u32 {
    USABLE = 1,        // Usable memory
    RESERVED = 2,      // Reserved memory
    ACPI_RECLAIM = 3,  // ACPI reclaimable memory
    ACPI_NVS = 4,      // ACPI NVS memory
    BAD = 5            // Bad memory
};

// Page size constants
constexpr u64 PAGE_SIZE = 4096;                    // 4KB page size
constexpr u32 PAGE_SHIFT = 12;                     // Shift for page size
constexpr u64 PAGE_MASK = 0x000FFFFFFFFFF000ULL;   // Physical address bits of a PTE

// Page table entry flags (x86_64 layout)
using PageFlags = u64;
constexpr PageFlags PAGE_PRESENT = 1ULL << 0;      // Page is present
constexpr PageFlags PAGE_WRITE = 1ULL << 1;        // Page is writable
constexpr PageFlags PAGE_USER = 1ULL << 2;         // Page is user accessible
constexpr PageFlags PAGE_ACCESSED = 1ULL << 5;     // Page has been accessed
constexpr PageFlags PAGE_DIRTY = 1ULL << 6;        // Page has been written to
constexpr PageFlags PAGE_GLOBAL = 1ULL << 8;       // Global page
constexpr PageFlags PAGE_NO_EXECUTE = 1ULL << 63;  // Instruction fetch disallowed
constexpr PageFlags PAGE_FLAGS_MASK = PAGE_PRESENT | PAGE_WRITE | PAGE_USER | PAGE_ACCESSED |
                                      PAGE_DIRTY | PAGE_GLOBAL | PAGE_NO_EXECUTE;

// Page table entry (PTE)
struct PageTableEntry {
    u64 value;

    // Get/set physical frame address
    u64 get_address() const { return value & PAGE_MASK; }
    void set_address(u64 addr) { value = (value & ~PAGE_MASK) | (addr & PAGE_MASK); }

    PageFlags get_flags() const { return value & PAGE_FLAGS_MASK; }
    void set_flags(PageFlags flags) { value = (value & ~PAGE_FLAGS_MASK) | (flags & PAGE_FLAGS_MASK); }

    bool is_present() const { return value & PAGE_PRESENT; }
    bool is_writable() const { return value & PAGE_WRITE; }
    bool is_executable() const { return !(value & PAGE_NO_EXECUTE); }
};

/**
 * @brief Contiguous run of virtual pages
 */
struct VirtualRange {
    uintptr_t start;    // Page-aligned start address
    u32 pageCount;      // Number of pages

    u64 size_in_bytes() const { return static_cast<u64>(pageCount) * PAGE_SIZE; }
    uintptr_t end() const { return start + size_in_bytes(); }
    bool is_empty() const { return pageCount == 0; }
    bool contains(uintptr_t addr) const { return pageCount != 0 && addr >= start && addr < end(); }
};

/**
 * @brief Contiguous run of physical frames
 */
struct PhysicalRange {
    u64 start;          // Frame-aligned physical address
    u32 frameCount;     // Number of frames

    u64 size_in_bytes() const { return static_cast<u64>(frameCount) * PAGE_SIZE; }
    bool is_empty() const { return frameCount == 0; }
};

inline u32 pages_for_bytes(u64 bytes) {
    return static_cast<u32>((bytes + PAGE_SIZE - 1) / PAGE_SIZE);
}

} // namespace strata::system
