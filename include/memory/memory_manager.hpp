#pragma once

#include "core/types.hpp"
#include "core/sync.hpp"
#include "memory/memory.hpp"
#include "memory/memory_services.hpp"

namespace strata::system {

/**
 * @brief Bitmap physical frame allocator over the bootloader memory map
 * 
 * Tracks every frame between the lowest and highest usable address. Frames
 * in reserved holes and below 1MB are permanently marked as used.
 */
class PhysicalMemoryManager : public FrameAllocator {
public:
    PhysicalMemoryManager();
    ~PhysicalMemoryManager() override;

    /**
     * @brief Build the frame bitmap from a memory map
     * @param memoryMap Memory map entries from the bootloader
     * @param memoryMapSize Number of entries
     * @return false if the map has no usable memory or the bitmap cannot be allocated
     */
    bool initialize(const MemoryMapEntry* memoryMap, u32 memoryMapSize);

    bool allocate_frames(u32 count, PhysicalRange& range) override;
    void free_frames(const PhysicalRange& range) override;

    u32 get_free_frame_count() const { return m_freeFrames; }
    u32 get_total_frame_count() const { return m_frameCount; }

    /**
     * @brief Highest usable physical address described by a memory map
     */
    static u64 calculate_total_usable_ram(const MemoryMapEntry* memoryMap, u32 memoryMapSize);

private:
    PhysicalMemoryManager(const PhysicalMemoryManager&) = delete;
    PhysicalMemoryManager& operator=(const PhysicalMemoryManager&) = delete;

    bool is_frame_used(u32 index) const;
    void set_frame_used(u32 index, bool used);

    u64 m_baseFrame;        // Frame number of bitmap bit 0
    u32 m_frameCount;       // Frames covered by the bitmap
    u32* m_bitmap;          // One bit per frame, 1 = used
    u32 m_freeFrames;
    u32 m_searchHint;       // First index worth scanning from
    sync::Spinlock m_lock;
};

} // namespace strata::system
