#include "loaders/section_loader.hpp"
#include "core/utils.hpp"
#include "debug/klog.hpp"

namespace strata::loaders {

using namespace strata::utils;

static const char* const TAG = "secload";

RegionKind region_for_section(SectionType type) {
    switch (type) {
        case SectionType::TEXT:   return RegionKind::TEXT;
        case SectionType::RODATA: return RegionKind::RODATA;
        case SectionType::DATA:
        case SectionType::BSS:    return RegionKind::DATA;
    }
    return RegionKind::DATA;
}

PageFlags final_region_flags(RegionKind region) {
    switch (region) {
        case RegionKind::TEXT:   return PAGE_PRESENT;
        case RegionKind::RODATA: return PAGE_PRESENT | PAGE_NO_EXECUTE;
        case RegionKind::DATA:   return PAGE_PRESENT | PAGE_WRITE | PAGE_NO_EXECUTE;
    }
    return PAGE_PRESENT | PAGE_NO_EXECUTE;
}

SectionImage::SectionImage() {
    for (u32 i = 0; i < REGION_COUNT; i++) {
        regions[i] = MappedRegion();
    }
}

//=============================================================================
// SectionLoader Implementation
//=============================================================================

SectionLoader::SectionLoader(const MemoryServices& services) : m_services(services) {}

bool SectionLoader::map_region(u64 bytes, MappedRegion& region) {
    region = MappedRegion();
    if (bytes == 0) {
        return true;
    }
    
    u32 pageCount = pages_for_bytes(bytes);
    VirtualRange pages = {};
    if (!m_services.pages->allocate_pages(pageCount, pages)) {
        LOG_ERROR(TAG, "no virtual range of %u pages", pageCount);
        return false;
    }
    
    PhysicalRange frames = {};
    if (!m_services.frames->allocate_frames(pageCount, frames)) {
        LOG_ERROR(TAG, "no %u contiguous physical frames", pageCount);
        m_services.pages->free_pages(pages);
        return false;
    }
    
    if (!m_services.mapper->map(pages, frames, LOADING_PAGE_FLAGS)) {
        LOG_ERROR(TAG, "mapping %u pages at %p failed", pageCount, reinterpret_cast<void*>(pages.start));
        m_services.frames->free_frames(frames);
        m_services.pages->free_pages(pages);
        return false;
    }
    
    region.pages = pages;
    region.frames = frames;
    region.flags = LOADING_PAGE_FLAGS;
    
    // Frames are recycled, so padding between sections must not leak old contents
    memset(reinterpret_cast<void*>(pages.start), 0, pages.size_in_bytes());
    return true;
}

void SectionLoader::release_region(MappedRegion& region) {
    if (!region.is_mapped()) {
        return;
    }
    
    m_services.mapper->unmap(region.pages);
    m_services.frames->free_frames(region.frames);
    m_services.pages->free_pages(region.pages);
    region = MappedRegion();
}

LinkResult SectionLoader::load(const ObjectDescriptor& object, SectionImage& image) {
    if (!m_services.is_complete()) {
        LOG_ERROR(TAG, "memory services not configured");
        return LinkResult::INVALID_PARAMETER;
    }
    
    u32 count = object.sections.size();
    if (!image.sectionAddresses.resize(count)) {
        return LinkResult::OUT_OF_MEMORY;
    }
    
    // Lay out each region: offsets first, region sizes fall out of the last section
    u64 regionBytes[REGION_COUNT] = {0, 0, 0};
    DynamicArray<u64> offsets;
    if (!offsets.resize(count)) {
        return LinkResult::OUT_OF_MEMORY;
    }
    
    // BSS goes after all initialized data so the data region copy stays contiguous
    for (u32 pass = 0; pass < 2; pass++) {
        for (u32 i = 0; i < count; i++) {
            const ObjectSection& section = object.sections[i];
            bool isBss = section.type == SectionType::BSS;
            if (isBss != (pass == 1)) continue;
            
            u32 region = static_cast<u32>(region_for_section(section.type));
            offsets[i] = align_up(regionBytes[region], section.alignment);
            regionBytes[region] = offsets[i] + section.size;
        }
    }
    
    for (u32 region = 0; region < REGION_COUNT; region++) {
        if (!map_region(regionBytes[region], image.regions[region])) {
            release(image);
            return LinkResult::OUT_OF_MEMORY;
        }
    }
    
    for (u32 i = 0; i < count; i++) {
        const ObjectSection& section = object.sections[i];
        const MappedRegion& region = image.regions[static_cast<u32>(region_for_section(section.type))];
        uintptr_t address = region.pages.start + offsets[i];
        image.sectionAddresses[i] = address;
        
        // BSS is already zero from map_region()
        if (section.type != SectionType::BSS && section.size > 0) {
            memcpy(reinterpret_cast<void*>(address), object.section_bytes(i), section.size);
        }
        
        LOG_TRACE(TAG, "%s (%s, %llu bytes) at %p", section.name, section_type_name(section.type),
                  section.size, reinterpret_cast<void*>(address));
    }
    
    return LinkResult::SUCCESS;
}

LinkResult SectionLoader::finalize_permissions(MappedRegion* regions) {
    for (u32 i = 0; i < REGION_COUNT; i++) {
        MappedRegion& region = regions[i];
        if (!region.is_mapped()) continue;
        
        PageFlags flags = final_region_flags(static_cast<RegionKind>(i));
        if (!m_services.mapper->remap(region.pages, flags)) {
            LOG_ERROR(TAG, "remapping region at %p failed", reinterpret_cast<void*>(region.pages.start));
            return LinkResult::OUT_OF_MEMORY;
        }
        region.flags = flags;
    }
    return LinkResult::SUCCESS;
}

void SectionLoader::release(SectionImage& image) {
    release_regions(image.regions, REGION_COUNT);
    image.sectionAddresses.clear();
}

void SectionLoader::release_regions(MappedRegion* regions, u32 count) {
    for (u32 i = 0; i < count; i++) {
        release_region(regions[i]);
    }
}

LinkResult SectionLoader::make_writable(MappedRegion& region, bool& changed) {
    changed = false;
    if (!region.is_mapped()) {
        return LinkResult::INVALID_PARAMETER;
    }
    if (region.flags & PAGE_WRITE) {
        return LinkResult::SUCCESS;
    }
    
    // Text being patched keeps running in other tasks, so execute permission stays
    PageFlags flags = region.flags | PAGE_WRITE;
    if (!m_services.mapper->remap(region.pages, flags)) {
        return LinkResult::OUT_OF_MEMORY;
    }
    
    changed = true;
    return LinkResult::SUCCESS;
}

LinkResult SectionLoader::restore_flags(MappedRegion& region, PageFlags flags) {
    if (!m_services.mapper->remap(region.pages, flags)) {
        return LinkResult::OUT_OF_MEMORY;
    }
    region.flags = flags;
    return LinkResult::SUCCESS;
}

} // namespace strata::loaders
