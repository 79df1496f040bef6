#pragma once

#include "core/types.hpp"
#include "memory/memory.hpp"

namespace strata::system {

/**
 * @brief Virtual page allocator consumed by the module loader
 */
class PageAllocator {
public:
    virtual ~PageAllocator() = default;
    
    /**
     * @brief Reserve count contiguous virtual pages
     * @param count Number of pages
     * @param range Output: the reserved range
     * @return false if no run of that size is available
     */
    virtual bool allocate_pages(u32 count, VirtualRange& range) = 0;
    
    /**
     * @brief Return a range obtained from allocate_pages()
     */
    virtual void free_pages(const VirtualRange& range) = 0;
};

/**
 * @brief Physical frame allocator consumed by the module loader
 */
class FrameAllocator {
public:
    virtual ~FrameAllocator() = default;
    
    /**
     * @brief Allocate count contiguous physical frames
     * @param count Number of frames
     * @param range Output: the allocated frames
     * @return false if no run of that size is available
     */
    virtual bool allocate_frames(u32 count, PhysicalRange& range) = 0;
    
    /**
     * @brief Return frames obtained from allocate_frames()
     */
    virtual void free_frames(const PhysicalRange& range) = 0;
};

/**
 * @brief Page-table mapping service consumed by the module loader
 */
class PageMapper {
public:
    virtual ~PageMapper() = default;
    
    /**
     * @brief Map virtual pages onto physical frames
     * @param pages Virtual range (page-aligned)
     * @param frames Physical frames, at least as many as pages
     * @param flags Page table flags for every page
     * @return false if any page is already mapped or outside the managed space
     */
    virtual bool map(const VirtualRange& pages, const PhysicalRange& frames, PageFlags flags) = 0;
    
    /**
     * @brief Change the flags of an already mapped range
     */
    virtual bool remap(const VirtualRange& pages, PageFlags flags) = 0;
    
    /**
     * @brief Remove the mappings of a range
     */
    virtual void unmap(const VirtualRange& pages) = 0;
};

/**
 * @brief One mapped region owned by a loaded module
 */
struct MappedRegion {
    VirtualRange pages;
    PhysicalRange frames;
    PageFlags flags;        // Flags currently installed in the page tables

    bool is_mapped() const { return !pages.is_empty(); }
};

/**
 * @brief Bundle of the external memory services
 */
struct MemoryServices {
    PageAllocator* pages;
    FrameAllocator* frames;
    PageMapper* mapper;

    bool is_complete() const { return pages && frames && mapper; }
};

} // namespace strata::system
