#pragma once

#include "core/types.hpp"
#include "core/array.hpp"
#include "memory/memory.hpp"
#include "memory/memory_services.hpp"
#include "loaders/object_reader.hpp"

namespace strata::loaders {

using namespace strata::system;

/**
 * @brief Memory regions of a module, one per final permission set
 * 
 * BSS shares the data region since both end up read-write.
 */
enum class RegionKind : u8 {
    TEXT = 0,       // Read + execute
    RODATA = 1,     // Read only
    DATA = 2        // Read + write (data and bss)
};

constexpr u32 REGION_COUNT = 3;

// Flags every region is mapped with while the module is pending
constexpr PageFlags LOADING_PAGE_FLAGS = PAGE_PRESENT | PAGE_WRITE | PAGE_NO_EXECUTE;

/**
 * @brief Region that holds sections of the given type
 */
RegionKind region_for_section(SectionType type);

/**
 * @brief Page flags a region carries once its module is committed
 */
PageFlags final_region_flags(RegionKind region);

/**
 * @brief Mapped memory of a module that is being loaded
 * 
 * sectionAddresses runs parallel to ObjectDescriptor::sections.
 */
struct SectionImage {
    MappedRegion regions[REGION_COUNT];
    DynamicArray<uintptr_t> sectionAddresses;

    SectionImage();
};

/**
 * @brief Section Loader - materializes the allocatable sections of an object
 * 
 * Lays each region out contiguously (respecting section alignment), takes
 * virtual pages and physical frames from the external allocators and maps
 * them writable and non-executable. Final permissions are applied only
 * after relocation, by finalize_permissions().
 */
class SectionLoader {
public:
    explicit SectionLoader(const MemoryServices& services);

    /**
     * @brief Map and fill all allocatable sections of an object
     * @param object Parsed object
     * @param image Output mapping; left empty on failure
     * @return SUCCESS, OUT_OF_MEMORY or INVALID_PARAMETER
     */
    LinkResult load(const ObjectDescriptor& object, SectionImage& image);

    /**
     * @brief Remap the regions of a loaded module to their final permissions
     * @param regions REGION_COUNT regions indexed by RegionKind
     */
    LinkResult finalize_permissions(MappedRegion* regions);

    /**
     * @brief Release the memory of every region of an image
     */
    void release(SectionImage& image);

    /**
     * @brief Release the memory of a set of regions
     */
    void release_regions(MappedRegion* regions, u32 count);

    /**
     * @brief Make a mapped region temporarily writable
     * @param region Region to change
     * @param changed Output: true if the flags had to be changed
     */
    LinkResult make_writable(MappedRegion& region, bool& changed);

    /**
     * @brief Reinstall the given flags on a region
     */
    LinkResult restore_flags(MappedRegion& region, PageFlags flags);

    const MemoryServices& get_services() const { return m_services; }

private:
    bool map_region(u64 bytes, MappedRegion& region);
    void release_region(MappedRegion& region);

    MemoryServices m_services;
};

} // namespace strata::loaders
