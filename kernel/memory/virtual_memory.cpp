#include "memory/virtual_memory.hpp"
#include "arch/cpu.hpp"
#include "core/utils.hpp"
#include "debug/klog.hpp"

namespace strata::system {

using strata::sync::SpinlockGuard;

static const char* const TAG = "vmm";

//=============================================================================
// VirtualWindowAllocator Implementation
//=============================================================================

VirtualWindowAllocator::VirtualWindowAllocator()
    : m_base(0), m_pageCount(0), m_used(nullptr), m_freePages(0) {}

VirtualWindowAllocator::~VirtualWindowAllocator() {
    delete[] m_used;
}

bool VirtualWindowAllocator::initialize(uintptr_t base, u32 pageCount) {
    SpinlockGuard guard(m_lock);
    
    if ((base & (PAGE_SIZE - 1)) || pageCount == 0) {
        LOG_ERROR(TAG, "invalid window base %p / %u pages", reinterpret_cast<void*>(base), pageCount);
        return false;
    }
    
    u8* used = new (std::nothrow) u8[pageCount];
    if (!used) return false;
    utils::memset(used, 0, pageCount);
    
    delete[] m_used;
    m_used = used;
    m_base = base;
    m_pageCount = pageCount;
    m_freePages = pageCount;
    return true;
}

bool VirtualWindowAllocator::allocate_pages(u32 count, VirtualRange& range) {
    SpinlockGuard guard(m_lock);
    
    if (count == 0 || count > m_freePages || !m_used) {
        return false;
    }
    
    u32 runStart = 0;
    u32 runLength = 0;
    for (u32 page = 0; page < m_pageCount; page++) {
        if (m_used[page]) {
            runLength = 0;
            runStart = page + 1;
            continue;
        }
        
        if (++runLength == count) {
            utils::memset(m_used + runStart, 1, count);
            m_freePages -= count;
            range.start = m_base + static_cast<uintptr_t>(runStart) * PAGE_SIZE;
            range.pageCount = count;
            return true;
        }
    }
    
    return false;
}

void VirtualWindowAllocator::free_pages(const VirtualRange& range) {
    SpinlockGuard guard(m_lock);
    
    if (range.is_empty() || !m_used) return;
    
    if (range.start < m_base || (range.start & (PAGE_SIZE - 1)) ||
        (range.start - m_base) / PAGE_SIZE + range.pageCount > m_pageCount) {
        LOG_ERROR(TAG, "free of pages outside the window at %p", reinterpret_cast<void*>(range.start));
        return;
    }
    
    u32 first = static_cast<u32>((range.start - m_base) / PAGE_SIZE);
    for (u32 page = first; page < first + range.pageCount; page++) {
        if (m_used[page]) {
            m_used[page] = 0;
            m_freePages++;
        }
    }
}

//=============================================================================
// WindowMapper Implementation
//=============================================================================

WindowMapper::WindowMapper()
    : m_base(0), m_pageCount(0), m_entries(nullptr), m_mappedPages(0) {}

WindowMapper::~WindowMapper() {
    delete[] m_entries;
}

bool WindowMapper::initialize(uintptr_t base, u32 pageCount) {
    SpinlockGuard guard(m_lock);
    
    if ((base & (PAGE_SIZE - 1)) || pageCount == 0) {
        return false;
    }
    
    PageTableEntry* entries = new (std::nothrow) PageTableEntry[pageCount];
    if (!entries) return false;
    for (u32 i = 0; i < pageCount; i++) {
        entries[i].value = 0;
    }
    
    delete[] m_entries;
    m_entries = entries;
    m_base = base;
    m_pageCount = pageCount;
    m_mappedPages = 0;
    return true;
}

bool WindowMapper::range_to_index(const VirtualRange& pages, u32& index) const {
    if (!m_entries || pages.is_empty()) return false;
    if (pages.start < m_base || (pages.start & (PAGE_SIZE - 1))) return false;
    
    u64 first = (pages.start - m_base) / PAGE_SIZE;
    if (first + pages.pageCount > m_pageCount) return false;
    
    index = static_cast<u32>(first);
    return true;
}

bool WindowMapper::map(const VirtualRange& pages, const PhysicalRange& frames, PageFlags flags) {
    SpinlockGuard guard(m_lock);
    
    u32 index;
    if (!range_to_index(pages, index) || frames.frameCount < pages.pageCount) {
        LOG_ERROR(TAG, "map rejected for %u pages at %p", pages.pageCount, reinterpret_cast<void*>(pages.start));
        return false;
    }
    
    // Refuse to replace existing mappings
    for (u32 i = 0; i < pages.pageCount; i++) {
        if (m_entries[index + i].is_present()) {
            LOG_ERROR(TAG, "page %p is already mapped", reinterpret_cast<void*>(pages.start + i * PAGE_SIZE));
            return false;
        }
    }
    
    for (u32 i = 0; i < pages.pageCount; i++) {
        PageTableEntry& entry = m_entries[index + i];
        entry.value = 0;
        entry.set_address(frames.start + static_cast<u64>(i) * PAGE_SIZE);
        entry.set_flags(flags | PAGE_PRESENT);
        arch::flush_tlb_single(pages.start + static_cast<uintptr_t>(i) * PAGE_SIZE);
    }
    m_mappedPages += pages.pageCount;
    return true;
}

bool WindowMapper::remap(const VirtualRange& pages, PageFlags flags) {
    SpinlockGuard guard(m_lock);
    
    u32 index;
    if (!range_to_index(pages, index)) {
        return false;
    }
    
    for (u32 i = 0; i < pages.pageCount; i++) {
        if (!m_entries[index + i].is_present()) {
            LOG_ERROR(TAG, "remap of unmapped page %p", reinterpret_cast<void*>(pages.start + i * PAGE_SIZE));
            return false;
        }
    }
    
    for (u32 i = 0; i < pages.pageCount; i++) {
        m_entries[index + i].set_flags(flags | PAGE_PRESENT);
        arch::flush_tlb_single(pages.start + static_cast<uintptr_t>(i) * PAGE_SIZE);
    }
    return true;
}

void WindowMapper::unmap(const VirtualRange& pages) {
    SpinlockGuard guard(m_lock);
    
    u32 index;
    if (!range_to_index(pages, index)) {
        LOG_ERROR(TAG, "unmap of range outside the window at %p", reinterpret_cast<void*>(pages.start));
        return;
    }
    
    for (u32 i = 0; i < pages.pageCount; i++) {
        PageTableEntry& entry = m_entries[index + i];
        if (entry.is_present()) {
            entry.value = 0;
            m_mappedPages--;
            arch::flush_tlb_single(pages.start + static_cast<uintptr_t>(i) * PAGE_SIZE);
        }
    }
}

bool WindowMapper::translate(uintptr_t virtualAddr, u64& physicalAddr) const {
    if (!m_entries || virtualAddr < m_base) return false;
    
    u64 index = (virtualAddr - m_base) / PAGE_SIZE;
    if (index >= m_pageCount || !m_entries[index].is_present()) return false;
    
    physicalAddr = m_entries[index].get_address() + (virtualAddr & (PAGE_SIZE - 1));
    return true;
}

PageFlags WindowMapper::flags_of(uintptr_t virtualAddr) const {
    if (!m_entries || virtualAddr < m_base) return 0;
    
    u64 index = (virtualAddr - m_base) / PAGE_SIZE;
    if (index >= m_pageCount) return 0;
    return m_entries[index].get_flags();
}

bool WindowMapper::is_mapped(uintptr_t virtualAddr) const {
    return (flags_of(virtualAddr) & PAGE_PRESENT) != 0;
}

} // namespace strata::system
