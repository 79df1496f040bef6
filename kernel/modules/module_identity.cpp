#include "modules/module_identity.hpp"
#include "core/utils.hpp"

namespace strata::modules {

using namespace strata::utils;

static bool is_hash_char(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z');
}

static bool is_hex_char(char c) {
    return (c >= '0' && c <= '9') || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

static bool copy_prefix(const char* source, u32 length, char* buffer, u32 bufferSize) {
    if (!buffer || length >= bufferSize) {
        return false;
    }
    memcpy(buffer, source, length);
    buffer[length] = '\0';
    return true;
}

u32 module_name_hashless_length(const char* name) {
    u32 length = strlen(name);
    
    // The hash is the run of alphanumerics after the last delimiter
    for (u32 i = length; i > 0; i--) {
        char c = name[i - 1];
        if (c == MODULE_HASH_DELIMITER) {
            return (i < length) ? i - 1 : length;
        }
        if (!is_hash_char(c)) {
            break;
        }
    }
    return length;
}

u32 symbol_name_hashless_length(const char* name) {
    const char* hash = strrstr(name, SYMBOL_HASH_DELIMITER);
    if (!hash) {
        return strlen(name);
    }
    
    const char* digits = hash + strlen(SYMBOL_HASH_DELIMITER);
    if (*digits == '\0') {
        return strlen(name);
    }
    for (const char* p = digits; *p; p++) {
        if (!is_hex_char(*p)) {
            return strlen(name);
        }
    }
    return static_cast<u32>(hash - name);
}

bool module_name_without_hash(const char* name, char* buffer, u32 bufferSize) {
    return copy_prefix(name, module_name_hashless_length(name), buffer, bufferSize);
}

bool symbol_name_without_hash(const char* name, char* buffer, u32 bufferSize) {
    return copy_prefix(name, symbol_name_hashless_length(name), buffer, bufferSize);
}

bool symbol_names_match_without_hash(const char* lhs, const char* rhs) {
    u32 lhsLength = symbol_name_hashless_length(lhs);
    u32 rhsLength = symbol_name_hashless_length(rhs);
    return lhsLength == rhsLength && strncmp(lhs, rhs, lhsLength) == 0;
}

bool module_prefix_of_symbol(const char* symbol, char* buffer, u32 bufferSize) {
    if (*symbol == '<') {
        symbol++;
    }
    
    const char* end = strstr(symbol, SYMBOL_PATH_DELIMITER);
    if (!end || end == symbol) {
        return false;
    }
    return copy_prefix(symbol, static_cast<u32>(end - symbol), buffer, bufferSize);
}

//=============================================================================
// Boot module names
//=============================================================================

static bool is_module_kind(char c) {
    return c == static_cast<char>(ModuleKind::KERNEL) ||
           c == static_cast<char>(ModuleKind::APPLICATION) ||
           c == static_cast<char>(ModuleKind::USERSPACE) ||
           c == static_cast<char>(ModuleKind::EXECUTABLE);
}

bool parse_boot_module_name(const char* fullName, BootModuleName& parsed) {
    if (!fullName || !is_module_kind(fullName[0])) {
        return false;
    }
    
    const char* delimiter = fullName;
    while (*delimiter && *delimiter != BOOT_MODULE_DELIMITER) {
        delimiter++;
    }
    if (*delimiter != BOOT_MODULE_DELIMITER) {
        return false;
    }
    
    parsed.kind = static_cast<ModuleKind>(fullName[0]);
    if (!copy_prefix(fullName + 1, static_cast<u32>(delimiter - fullName - 1),
                     parsed.personality, sizeof(parsed.personality))) {
        return false;
    }
    
    // Drop the object file extension
    const char* name = delimiter + 1;
    u32 length = strlen(name);
    const char* extension = strrstr(name, ".o");
    if (extension && extension[2] == '\0') {
        length = static_cast<u32>(extension - name);
    }
    if (length == 0) {
        return false;
    }
    return copy_prefix(name, length, parsed.moduleName, sizeof(parsed.moduleName));
}

bool namespace_name_for(ModuleKind kind, const char* personality, char* buffer, u32 bufferSize) {
    const char* base = nullptr;
    switch (kind) {
        case ModuleKind::KERNEL:      base = "_kernel"; break;
        case ModuleKind::APPLICATION: base = "_applications"; break;
        case ModuleKind::USERSPACE:   base = "_userspace"; break;
        case ModuleKind::EXECUTABLE:  base = "_executables"; break;
    }
    if (!base) {
        return false;
    }
    
    const char* prefix = personality ? personality : "";
    u32 prefixLength = strlen(prefix);
    u32 baseLength = strlen(base);
    if (prefixLength + baseLength >= bufferSize) {
        return false;
    }
    
    memcpy(buffer, prefix, prefixLength);
    memcpy(buffer + prefixLength, base, baseLength + 1);
    return true;
}

bool make_module_identity(const char* sourceFile, const void* data, u64 size, char* buffer, u32 bufferSize) {
    const char* base = sourceFile ? sourceFile : "module";
    const char* slash = strrstr(base, "/");
    if (slash) {
        base = slash + 1;
    }
    
    u32 length = strlen(base);
    const char* dot = strrstr(base, ".");
    if (dot && dot != base) {
        length = static_cast<u32>(dot - base);
    }
    if (length == 0) {
        base = "module";
        length = strlen(base);
    }
    
    // name + '-' + 16 hex digits + terminator
    if (length + 18 > bufferSize) {
        return false;
    }
    
    memcpy(buffer, base, length);
    buffer[length] = MODULE_HASH_DELIMITER;
    
    char hex[20];
    number_to_hex(hex, fnv1a_hash(data, size), 16);
    memcpy(buffer + length + 1, hex, 17);
    return true;
}

} // namespace strata::modules
