#pragma once

#include "core/types.hpp"

namespace strata::modules {

using namespace strata::system;

// Separates a module name from its build hash: "serial_port-4be8f0a1"
constexpr char MODULE_HASH_DELIMITER = '-';

// Separates a symbol path from its build hash: "serial_port::init::h5f1c2a9e"
constexpr const char* SYMBOL_HASH_DELIMITER = "::h";

// Separates a path component in a symbol name
constexpr const char* SYMBOL_PATH_DELIMITER = "::";

// Separates the kind/personality prefix from the file name of a boot module
constexpr char BOOT_MODULE_DELIMITER = '#';

constexpr u32 MAX_MODULE_NAME_LENGTH = 128;
constexpr u32 MAX_NAMESPACE_NAME_LENGTH = 64;

/**
 * @brief Length of a module name with its "-hash" suffix removed
 */
u32 module_name_hashless_length(const char* name);

/**
 * @brief Length of a symbol name with its "::h<hash>" suffix removed
 */
u32 symbol_name_hashless_length(const char* name);

/**
 * @brief Copy a module name without its hash into buffer
 * @return false if the buffer is too small
 */
bool module_name_without_hash(const char* name, char* buffer, u32 bufferSize);

/**
 * @brief Copy a symbol name without its hash into buffer
 * @return false if the buffer is too small
 */
bool symbol_name_without_hash(const char* name, char* buffer, u32 bufferSize);

/**
 * @brief Compare two symbol names ignoring their hashes
 */
bool symbol_names_match_without_hash(const char* lhs, const char* rhs);

/**
 * @brief Extract the module a symbol belongs to from its leading path component
 * 
 * "serial_port::init::h12" -> "serial_port"; a leading '<' of a qualified
 * impl path is skipped: "<vga::Writer as fmt::Write>::write_str" -> "vga".
 * @return false if the symbol has no path component
 */
bool module_prefix_of_symbol(const char* symbol, char* buffer, u32 bufferSize);

/**
 * @brief Kind of a module, taken from the first character of a boot module name
 */
enum class ModuleKind : u8 {
    KERNEL = 'k',
    APPLICATION = 'a',
    USERSPACE = 'u',
    EXECUTABLE = 'e'
};

/**
 * @brief Parsed boot module name such as "ksse#serial_port-4be8.o"
 */
struct BootModuleName {
    ModuleKind kind;
    char personality[MAX_NAMESPACE_NAME_LENGTH];    // "sse", or "" for the default namespace
    char moduleName[MAX_MODULE_NAME_LENGTH];        // "serial_port-4be8" (extension removed)
};

/**
 * @brief Parse a boot module name
 * @return false if the kind character or the '#' delimiter is missing
 */
bool parse_boot_module_name(const char* fullName, BootModuleName& parsed);

/**
 * @brief Name of the namespace a boot module belongs to
 * 
 * The default names are "_kernel", "_applications", "_userspace" and
 * "_executables"; a personality is prepended: ("sse", KERNEL) -> "sse_kernel".
 */
bool namespace_name_for(ModuleKind kind, const char* personality, char* buffer, u32 bufferSize);

/**
 * @brief Derive a module identity from its source file name and image bytes
 * 
 * "drivers/serial_port.cpp" + bytes -> "serial_port-<16 hex digits>"
 */
bool make_module_identity(const char* sourceFile, const void* data, u64 size, char* buffer, u32 bufferSize);

} // namespace strata::modules
