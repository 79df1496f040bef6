#include "modules/relocation.hpp"
#include "core/utils.hpp"
#include "debug/klog.hpp"

namespace strata::modules {

using namespace strata::utils;
using namespace strata::formats;
using strata::loaders::ObjectDescriptor;
using strata::loaders::ObjectRelocation;
using strata::loaders::ObjectSymbol;

static const char* const TAG = "reloc";

static bool fits_u32(u64 value) {
    return value <= 0xFFFFFFFFULL;
}

static bool fits_i32(u64 value) {
    i64 signedValue = static_cast<i64>(value);
    return signedValue >= -2147483648LL && signedValue <= 2147483647LL;
}

LinkResult RelocationResolver::compute_value(u32 kind, u64 symbolAddress, i64 addend, u64 site,
                                             u64 symbolSize, u64& value, u32& width) {
    u64 a = static_cast<u64>(addend);
    
    switch (kind) {
        case R_X86_64_NONE:
            value = 0;
            width = 0;
            return LinkResult::SUCCESS;
        
        case R_X86_64_64:
            value = symbolAddress + a;
            width = 8;
            return LinkResult::SUCCESS;
        
        case R_X86_64_PC64:
            value = symbolAddress + a - site;
            width = 8;
            return LinkResult::SUCCESS;
        
        case R_X86_64_SIZE64:
            value = symbolSize + a;
            width = 8;
            return LinkResult::SUCCESS;
        
        case R_X86_64_32:
            value = symbolAddress + a;
            width = 4;
            return fits_u32(value) ? LinkResult::SUCCESS : LinkResult::OUT_OF_RANGE_RELOCATION;
        
        case R_X86_64_32S:
            value = symbolAddress + a;
            width = 4;
            return fits_i32(value) ? LinkResult::SUCCESS : LinkResult::OUT_OF_RANGE_RELOCATION;
        
        case R_X86_64_PC32:
        case R_X86_64_PLT32:
            value = symbolAddress + a - site;
            width = 4;
            return fits_i32(value) ? LinkResult::SUCCESS : LinkResult::OUT_OF_RANGE_RELOCATION;
        
        case R_X86_64_SIZE32:
            value = symbolSize + a;
            width = 4;
            return fits_u32(value) ? LinkResult::SUCCESS : LinkResult::OUT_OF_RANGE_RELOCATION;
        
        default:
            width = 0;
            return LinkResult::UNSUPPORTED_RELOCATION_KIND;
    }
}

void RelocationResolver::write_value(uintptr_t site, u64 value, u32 width) {
    // Little endian: the low bytes of value are the field
    memcpy(reinterpret_cast<void*>(site), &value, width);
}

u64 RelocationResolver::read_value(uintptr_t site, u32 width) {
    u64 value = 0;
    memcpy(&value, reinterpret_cast<const void*>(site), width);
    return value;
}

LinkResult RelocationResolver::resolve_target(LoadedModule& module, const ObjectDescriptor& object,
                                              const ObjectSymbol& symbol, SymbolResolver& resolver,
                                              RelocationRecord& record, u64& symbolAddress) {
    record.target.module = INVALID_MODULE;
    record.target.sectionIndex = 0;
    record.targetOffset = 0;
    record.targetSize = symbol.size;
    record.crossModule = false;
    
    if (symbol.sectionIndex >= 0) {
        // Defined by this module, including its own exports
        const LoadedSection& section = module.sections[static_cast<u32>(symbol.sectionIndex)];
        record.symbolName = (symbol.type == STT_SECTION || symbol.name[0] == '\0')
            ? section.name : module.rebase_symbol_name(object, symbol.name);
        record.target.sectionIndex = static_cast<u32>(symbol.sectionIndex);
        record.targetOffset = symbol.value;
        symbolAddress = section.address + symbol.value;
        return LinkResult::SUCCESS;
    }
    
    record.symbolName = module.rebase_symbol_name(object, symbol.name);
    
    if (symbol.sectionIndex == loaders::SYMBOL_ABSOLUTE) {
        symbolAddress = symbol.value;
        return LinkResult::SUCCESS;
    }
    
    if (symbol.sectionIndex == loaders::SYMBOL_NOT_LOADED || symbol.name[0] == '\0') {
        LOG_ERROR(TAG, "%s: relocation against symbol in a section that is not loaded", module.get_name());
        return LinkResult::MALFORMED_OBJECT_FILE;
    }
    
    bool weak = symbol.binding == STB_WEAK;
    SymbolLocation location = {};
    
    // A pin can race with an unload of the module found; look up once more in that case
    for (u32 attempt = 0; attempt < 2; attempt++) {
        LinkResult result = resolver.resolve_external(symbol.name, weak, location);
        if (result != LinkResult::SUCCESS) {
            if (weak) {
                LOG_DEBUG(TAG, "%s: weak %s left unresolved", module.get_name(), symbol.name);
                symbolAddress = 0;
                record.targetSize = 0;
                return LinkResult::SUCCESS;
            }
            LOG_ERROR(TAG, "%s: unresolved symbol %s", module.get_name(), symbol.name);
            return LinkResult::UNRESOLVED_SYMBOL;
        }
        
        if (module.find_strong_dependency(location.section.module)) {
            break;
        }
        
        result = resolver.pin(location.section.module);
        if (result == LinkResult::SUCCESS) {
            StrongDependency dependency = {location.section.module, 0};
            if (!module.strongDependencies.push_back(dependency)) {
                resolver.unpin(location.section.module);
                return LinkResult::OUT_OF_MEMORY;
            }
            break;
        }
        if (attempt == 1) {
            LOG_ERROR(TAG, "%s: provider of %s went away during linking", module.get_name(), symbol.name);
            return LinkResult::UNRESOLVED_SYMBOL;
        }
    }
    
    module.find_strong_dependency(location.section.module)->edgeCount++;
    record.target = location.section;
    record.targetOffset = location.offset;
    record.targetSize = location.size;
    record.crossModule = true;
    symbolAddress = location.address;
    return LinkResult::SUCCESS;
}

LinkResult RelocationResolver::apply_relocations(LoadedModule& module, const ObjectDescriptor& object,
                                                 SymbolResolver& resolver, bool verbose) {
    if (!module.relocations.reserve(object.relocations.size())) {
        return LinkResult::OUT_OF_MEMORY;
    }
    
    for (u32 i = 0; i < object.relocations.size(); i++) {
        const ObjectRelocation& entry = object.relocations[i];
        const ObjectSymbol& symbol = object.symbols[entry.symbolIndex];
        const LoadedSection& source = module.sections[entry.sectionIndex];
        
        RelocationRecord record = {};
        record.sourceSection = entry.sectionIndex;
        record.offset = entry.offset;
        record.kind = entry.type;
        record.addend = entry.addend;
        
        u64 symbolAddress = 0;
        LinkResult result = resolve_target(module, object, symbol, resolver, record, symbolAddress);
        if (result != LinkResult::SUCCESS) {
            return result;
        }
        
        uintptr_t site = source.address + entry.offset;
        u64 value = 0;
        u32 width = 0;
        result = compute_value(entry.type, symbolAddress, entry.addend, site, record.targetSize, value, width);
        if (result != LinkResult::SUCCESS) {
            LOG_ERROR(TAG, "%s: %s against %s at %s+%llx: %s", module.get_name(),
                      ElfValidator::relocation_type_name(entry.type), record.symbolName, source.name,
                      entry.offset, result_to_string(result));
            return result;
        }
        
        write_value(site, value, width);
        if (verbose) {
            LOG_DEBUG(TAG, "%s+%llx %s %s = %llx", source.name, entry.offset,
                      ElfValidator::relocation_type_name(entry.type), record.symbolName, value);
        }
        
        if (!module.relocations.push_back(record)) {
            return LinkResult::OUT_OF_MEMORY;
        }
    }
    
    return LinkResult::SUCCESS;
}

} // namespace strata::modules
