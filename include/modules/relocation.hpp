#pragma once

#include "core/types.hpp"
#include "loaders/object_reader.hpp"
#include "modules/link_result.hpp"
#include "modules/loaded_module.hpp"

namespace strata::modules {

using namespace strata::system;

/**
 * @brief Source of external symbol definitions for a module being linked
 */
class SymbolResolver {
public:
    virtual ~SymbolResolver() = default;

    /**
     * @brief Resolve a symbol the object does not define
     * @param name Symbol name
     * @param weak The reference is weak (may stay unresolved)
     * @param location Output: definition
     * @return SUCCESS or UNRESOLVED_SYMBOL
     */
    virtual LinkResult resolve_external(const char* name, bool weak, SymbolLocation& location) = 0;

    /**
     * @brief Take a strong reference on the module defining a resolved symbol
     * @return INVALID_HANDLE if that module was unloaded since the lookup
     */
    virtual LinkResult pin(ModuleHandle module) = 0;

    /**
     * @brief Release a reference taken by pin()
     */
    virtual void unpin(ModuleHandle module) = 0;
};

/**
 * @brief Relocation Resolver - applies RELA entries to mapped sections
 * 
 * Supported x86_64 kinds:
 *   R_X86_64_64, R_X86_64_PC64          S + A, S + A - P     (8 bytes)
 *   R_X86_64_32, R_X86_64_32S           S + A                (4 bytes, zero/sign extended)
 *   R_X86_64_PC32, R_X86_64_PLT32       S + A - P            (4 bytes, signed)
 *   R_X86_64_SIZE32, R_X86_64_SIZE64    Z + A
 * where S is the symbol address, A the addend, P the patched address and
 * Z the symbol size.
 */
class RelocationResolver {
public:
    /**
     * @brief Compute the field value of one relocation
     * @param kind R_X86_64_* type
     * @param symbolAddress S
     * @param addend A
     * @param site P
     * @param symbolSize Z
     * @param value Output: bytes to store (low width bytes are used)
     * @param width Output: field width in bytes
     * @return SUCCESS, UNSUPPORTED_RELOCATION_KIND or OUT_OF_RANGE_RELOCATION
     */
    static LinkResult compute_value(u32 kind, u64 symbolAddress, i64 addend, u64 site, u64 symbolSize,
                                    u64& value, u32& width);

    /**
     * @brief Store the low width bytes of value at site (unaligned)
     */
    static void write_value(uintptr_t site, u64 value, u32 width);

    /**
     * @brief Load width bytes from site (unaligned, zero extended)
     */
    static u64 read_value(uintptr_t site, u32 width);

    /**
     * @brief Resolve and apply every relocation of a pending module
     * 
     * Fills module.relocations and module.strongDependencies. On failure
     * the strong dependencies taken so far stay recorded in the module so
     * the caller can release them with the rest of the pending state.
     * @param module Pending module whose sections are mapped writable
     * @param object Descriptor the module was loaded from
     * @param resolver Lookup service for external symbols
     * @param verbose Log every applied relocation
     */
    static LinkResult apply_relocations(LoadedModule& module, const loaders::ObjectDescriptor& object,
                                        SymbolResolver& resolver, bool verbose);

private:
    static LinkResult resolve_target(LoadedModule& module, const loaders::ObjectDescriptor& object,
                                     const loaders::ObjectSymbol& symbol, SymbolResolver& resolver,
                                     RelocationRecord& record, u64& symbolAddress);
};

} // namespace strata::modules
