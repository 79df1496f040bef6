#include "memory/memory_manager.hpp"
#include "core/utils.hpp"
#include "debug/klog.hpp"

namespace strata::system {

using strata::sync::SpinlockGuard;

// Frames below 1MB are never handed out
constexpr u64 LOW_MEMORY_LIMIT = 0x00100000;
// Upper bound on tracked frames (16GB of physical memory)
constexpr u32 MAX_TRACKED_FRAMES = 4 * 1024 * 1024;

static const char* const TAG = "pmm";

PhysicalMemoryManager::PhysicalMemoryManager()
    : m_baseFrame(0), m_frameCount(0), m_bitmap(nullptr), m_freeFrames(0), m_searchHint(0) {}

PhysicalMemoryManager::~PhysicalMemoryManager() {
    delete[] m_bitmap;
}

u64 PhysicalMemoryManager::calculate_total_usable_ram(const MemoryMapEntry* memoryMap, u32 memoryMapSize) {
    u64 total = 0;
    if (!memoryMap) return 0;
    
    for (u32 i = 0; i < memoryMapSize; i++) {
        if (memoryMap[i].type == static_cast<u32>(MemoryType::USABLE)) {
            u64 endAddr = memoryMap[i].baseAddress + memoryMap[i].length;
            if (endAddr > total) {
                total = endAddr;
            }
        }
    }
    
    return total;
}

bool PhysicalMemoryManager::initialize(const MemoryMapEntry* memoryMap, u32 memoryMapSize) {
    SpinlockGuard guard(m_lock);
    
    if (!memoryMap || memoryMapSize == 0) {
        LOG_ERROR(TAG, "no memory map provided");
        return false;
    }
    
    // Find the span of usable memory above the low-memory limit
    u64 lowest = ~0ULL;
    u64 highest = 0;
    for (u32 i = 0; i < memoryMapSize; i++) {
        if (memoryMap[i].type != static_cast<u32>(MemoryType::USABLE)) continue;
        
        u64 start = utils::align_up(memoryMap[i].baseAddress, PAGE_SIZE);
        u64 end = utils::align_down(memoryMap[i].baseAddress + memoryMap[i].length, PAGE_SIZE);
        if (start < LOW_MEMORY_LIMIT) start = LOW_MEMORY_LIMIT;
        if (end <= start) continue;
        
        if (start < lowest) lowest = start;
        if (end > highest) highest = end;
    }
    
    if (highest == 0) {
        LOG_ERROR(TAG, "memory map has no usable memory above 1MB");
        return false;
    }
    
    u64 frames = (highest - lowest) / PAGE_SIZE;
    if (frames > MAX_TRACKED_FRAMES) {
        LOG_WARN(TAG, "tracking only %u of %llu frames", MAX_TRACKED_FRAMES, frames);
        frames = MAX_TRACKED_FRAMES;
    }
    
    u32 words = static_cast<u32>((frames + 31) / 32);
    u32* bitmap = new (std::nothrow) u32[words];
    if (!bitmap) {
        LOG_ERROR(TAG, "cannot allocate frame bitmap (%u words)", words);
        return false;
    }
    
    delete[] m_bitmap;
    m_bitmap = bitmap;
    m_baseFrame = lowest / PAGE_SIZE;
    m_frameCount = static_cast<u32>(frames);
    m_freeFrames = 0;
    m_searchHint = 0;
    
    // Everything starts used; usable regions are then released
    utils::memset(m_bitmap, 0xFF, static_cast<size_t>(words) * sizeof(u32));
    
    for (u32 i = 0; i < memoryMapSize; i++) {
        if (memoryMap[i].type != static_cast<u32>(MemoryType::USABLE)) continue;
        
        u64 start = utils::align_up(memoryMap[i].baseAddress, PAGE_SIZE);
        u64 end = utils::align_down(memoryMap[i].baseAddress + memoryMap[i].length, PAGE_SIZE);
        if (start < LOW_MEMORY_LIMIT) start = LOW_MEMORY_LIMIT;
        
        for (u64 addr = start; addr < end; addr += PAGE_SIZE) {
            u64 index = addr / PAGE_SIZE - m_baseFrame;
            if (index >= m_frameCount) break;
            if (is_frame_used(static_cast<u32>(index))) {
                set_frame_used(static_cast<u32>(index), false);
                m_freeFrames++;
            }
        }
    }
    
    LOG_INFO(TAG, "%u frames free of %u tracked", m_freeFrames, m_frameCount);
    return true;
}

bool PhysicalMemoryManager::is_frame_used(u32 index) const {
    return (m_bitmap[index / 32] >> (index % 32)) & 1;
}

void PhysicalMemoryManager::set_frame_used(u32 index, bool used) {
    if (used) {
        m_bitmap[index / 32] |= (1u << (index % 32));
    } else {
        m_bitmap[index / 32] &= ~(1u << (index % 32));
    }
}

bool PhysicalMemoryManager::allocate_frames(u32 count, PhysicalRange& range) {
    SpinlockGuard guard(m_lock);
    
    if (count == 0 || !m_bitmap || count > m_freeFrames) {
        return false;
    }
    
    // First-fit scan for a run of count free frames
    u32 runStart = m_searchHint;
    u32 runLength = 0;
    for (u32 index = m_searchHint; index < m_frameCount; index++) {
        if (is_frame_used(index)) {
            runLength = 0;
            runStart = index + 1;
            continue;
        }
        
        if (++runLength == count) {
            for (u32 i = runStart; i < runStart + count; i++) {
                set_frame_used(i, true);
            }
            m_freeFrames -= count;
            if (runStart == m_searchHint) {
                m_searchHint = runStart + count;
            }
            
            range.start = (m_baseFrame + runStart) * PAGE_SIZE;
            range.frameCount = count;
            return true;
        }
    }
    
    return false;
}

void PhysicalMemoryManager::free_frames(const PhysicalRange& range) {
    SpinlockGuard guard(m_lock);
    
    if (range.is_empty() || !m_bitmap) return;
    
    // Additional check: ensure it's frame-aligned and tracked
    if (range.start & (PAGE_SIZE - 1)) {
        LOG_ERROR(TAG, "free of unaligned frame address %llx", range.start);
        return;
    }
    
    u64 first = range.start / PAGE_SIZE;
    if (first < m_baseFrame || first - m_baseFrame + range.frameCount > m_frameCount) {
        LOG_ERROR(TAG, "free of untracked frames at %llx", range.start);
        return;
    }
    
    u32 index = static_cast<u32>(first - m_baseFrame);
    for (u32 i = index; i < index + range.frameCount; i++) {
        if (!is_frame_used(i)) {
            LOG_WARN(TAG, "double free of frame %llx", (m_baseFrame + i) * PAGE_SIZE);
            continue;
        }
        set_frame_used(i, false);
        m_freeFrames++;
    }
    
    if (index < m_searchHint) {
        m_searchHint = index;
    }
}

} // namespace strata::system
