#pragma once

#include "core/types.hpp"
#include "core/sync.hpp"
#include "memory/memory.hpp"
#include "memory/memory_services.hpp"

namespace strata::system {

// Default kernel window reserved for loaded modules (x86_64 higher half)
constexpr uintptr_t MODULE_WINDOW_START = 0xFFFFFFFF90000000UL;
constexpr u32 MODULE_WINDOW_PAGES = 0x10000;      // 256MB

/**
 * @brief Virtual page allocator for a fixed kernel window
 * 
 * Hands out contiguous runs of pages from [base, base + pageCount * PAGE_SIZE)
 * using a first-fit bitmap.
 */
class VirtualWindowAllocator : public PageAllocator {
public:
    VirtualWindowAllocator();
    ~VirtualWindowAllocator() override;

    /**
     * @brief Set the managed window
     * @param base Page-aligned first address of the window
     * @param pageCount Number of pages in the window
     * @return false on misaligned base or allocation failure
     */
    bool initialize(uintptr_t base, u32 pageCount);

    bool allocate_pages(u32 count, VirtualRange& range) override;
    void free_pages(const VirtualRange& range) override;

    u32 get_free_page_count() const { return m_freePages; }
    uintptr_t get_base() const { return m_base; }
    u32 get_page_count() const { return m_pageCount; }

private:
    VirtualWindowAllocator(const VirtualWindowAllocator&) = delete;
    VirtualWindowAllocator& operator=(const VirtualWindowAllocator&) = delete;

    uintptr_t m_base;
    u32 m_pageCount;
    u8* m_used;             // One byte per page, non-zero = allocated
    u32 m_freePages;
    sync::Spinlock m_lock;
};

/**
 * @brief Page mapper over a fixed kernel window
 * 
 * Keeps one page table entry per window page. On the x86_64 port the
 * embedding kernel installs these entries as the leaf table of the window;
 * the hosted port only records them.
 */
class WindowMapper : public PageMapper {
public:
    WindowMapper();
    ~WindowMapper() override;

    /**
     * @brief Set the managed window
     * @param base Page-aligned first address of the window
     * @param pageCount Number of pages in the window
     */
    bool initialize(uintptr_t base, u32 pageCount);

    bool map(const VirtualRange& pages, const PhysicalRange& frames, PageFlags flags) override;
    bool remap(const VirtualRange& pages, PageFlags flags) override;
    void unmap(const VirtualRange& pages) override;

    /**
     * @brief Translate a virtual address to its physical address
     * @param virtualAddr Address inside the window
     * @param physicalAddr Output: physical address
     * @return false if the page is not mapped
     */
    bool translate(uintptr_t virtualAddr, u64& physicalAddr) const;

    /**
     * @brief Get the flags of the page containing virtualAddr (0 if unmapped)
     */
    PageFlags flags_of(uintptr_t virtualAddr) const;

    bool is_mapped(uintptr_t virtualAddr) const;

    u32 get_mapped_page_count() const { return m_mappedPages; }

    const PageTableEntry* get_entries() const { return m_entries; }

private:
    WindowMapper(const WindowMapper&) = delete;
    WindowMapper& operator=(const WindowMapper&) = delete;

    /**
     * @brief Get the entry index for a range, or false if outside the window
     */
    bool range_to_index(const VirtualRange& pages, u32& index) const;

    uintptr_t m_base;
    u32 m_pageCount;
    PageTableEntry* m_entries;
    u32 m_mappedPages;
    sync::Spinlock m_lock;
};

} // namespace strata::system
