#pragma once

#include "core/types.hpp"
#include <new>

/**
 * @brief Utility functions for kernel use
 * 
 * Common utility functions that don't depend on external libraries
 * and can be used throughout the kernel and the module loader.
 */
namespace strata::utils {

// Bring types from strata::system into scope
using strata::system::u8;
using strata::system::u16;
using strata::system::u32;
using strata::system::u64;
using strata::system::i8;
using strata::system::i16;
using strata::system::i32;
using strata::system::i64;
using strata::system::uintptr_t;

/**
 * @brief Calculate the length of a null-terminated string
 * @param str Pointer to null-terminated string
 * @return Length of the string (excluding null terminator)
 */
inline u32 strlen(const char* str) {
    if (!str) return 0;
    
    u32 len = 0;
    while (str[len]) {
        len++;
    }
    return len;
}

/**
 * @brief Compare two null-terminated strings
 * @param str1 First string
 * @param str2 Second string
 * @return 0 if equal, negative if str1 < str2, positive if str1 > str2
 */
inline i32 strcmp(const char* str1, const char* str2) {
    if (!str1 || !str2) {
        if (str1 == str2) return 0;
        return str1 ? 1 : -1;
    }
    
    while (*str1 && *str2 && *str1 == *str2) {
        str1++;
        str2++;
    }
    
    return static_cast<i32>(static_cast<u8>(*str1)) - static_cast<i32>(static_cast<u8>(*str2));
}

/**
 * @brief Compare at most count characters of two strings
 * @return 0 if the first count characters are equal
 */
inline i32 strncmp(const char* str1, const char* str2, u32 count) {
    if (!str1 || !str2) {
        if (str1 == str2) return 0;
        return str1 ? 1 : -1;
    }
    
    for (u32 i = 0; i < count; i++) {
        if (str1[i] != str2[i] || str1[i] == '\0') {
            return static_cast<i32>(static_cast<u8>(str1[i])) - static_cast<i32>(static_cast<u8>(str2[i]));
        }
    }
    return 0;
}

/**
 * @brief Check whether str begins with prefix
 */
inline bool starts_with(const char* str, const char* prefix) {
    if (!str || !prefix) return false;
    return strncmp(str, prefix, strlen(prefix)) == 0;
}

/**
 * @brief Find the first occurrence of needle in str
 * @return Pointer into str, or nullptr if not found
 */
inline const char* strstr(const char* str, const char* needle) {
    if (!str || !needle) return nullptr;
    if (!*needle) return str;
    
    u32 needleLen = strlen(needle);
    for (const char* p = str; *p; p++) {
        if (strncmp(p, needle, needleLen) == 0) {
            return p;
        }
    }
    return nullptr;
}

/**
 * @brief Find the last occurrence of needle in str
 * @return Pointer into str, or nullptr if not found
 */
inline const char* strrstr(const char* str, const char* needle) {
    const char* last = nullptr;
    const char* p = strstr(str, needle);
    while (p) {
        last = p;
        p = strstr(p + 1, needle);
    }
    return last;
}

/**
 * @brief Safe string copy with bounds checking
 * @param dest Destination buffer
 * @param src Source string
 * @param maxLen Maximum number of characters to copy (including null terminator)
 * @note Refuses to copy if source and destination overlap (sets dest to empty string)
 */
inline void strcpy_s(char* dest, const char* src, u32 maxLen) {
    if (!dest || !src || maxLen == 0) return;
    if (dest == src) return;  // Same pointer, nothing to do
    
    u32 srcLen = strlen(src);
    
    bool overlaps = (dest > src && dest < src + srcLen) ||
                   (src > dest && src < dest + maxLen);
    
    if (overlaps) {
        dest[0] = '\0';
        return;
    }
    
    u32 i = 0;
    while (i < maxLen - 1 && src[i] != '\0') {
        dest[i] = src[i];
        i++;
    }
    dest[i] = '\0';
}

/**
 * @brief Duplicate at most length characters of a string onto the kernel heap
 * @param src Source string
 * @param length Number of characters to copy
 * @return Newly allocated null-terminated copy (release with delete[]), or nullptr
 */
inline char* strndup(const char* src, u32 length) {
    if (!src) return nullptr;
    
    char* copy = new (std::nothrow) char[length + 1];
    if (!copy) return nullptr;
    
    for (u32 i = 0; i < length; i++) {
        copy[i] = src[i];
    }
    copy[length] = '\0';
    return copy;
}

inline char* strdup(const char* src) {
    return strndup(src, strlen(src));
}

inline char to_upper(char c) {
    return (c >= 'a' && c <= 'z') ? static_cast<char>(c - 'a' + 'A') : c;
}

/**
 * @brief Convert number to hexadecimal string (lowercase, fixed width)
 * @param buffer Output buffer (must be at least digits + 1 characters)
 * @param number Number to convert
 * @param digits Number of hex digits to emit (8 for 32-bit, 16 for 64-bit)
 */
inline void number_to_hex(char* buffer, u64 number, u32 digits = 8) {
    if (!buffer) return;
    if (digits > 16) digits = 16;
    
    const char hex[] = "0123456789abcdef";
    for (u32 i = 0; i < digits; i++) {
        buffer[i] = hex[(number >> ((digits - 1 - i) * 4)) & 0xF];
    }
    buffer[digits] = '\0';
}

/**
 * @brief Convert number to decimal string
 * @param buffer Output buffer (must be at least 21 characters for u64)
 * @param number Number to convert
 */
inline void number_to_decimal(char* buffer, u64 number) {
    if (!buffer) return;
    
    if (number == 0) {
        buffer[0] = '0';
        buffer[1] = '\0';
        return;
    }
    
    char temp[24];
    int i = 0;
    while (number > 0) {
        temp[i++] = static_cast<char>('0' + (number % 10));
        number /= 10;
    }
    
    int j = 0;
    while (i > 0) {
        buffer[j++] = temp[--i];
    }
    buffer[j] = '\0';
}

/**
 * @brief Copy memory from source to destination
 * @param dest Destination buffer
 * @param src Source buffer
 * @param count Number of bytes to copy
 * @return Pointer to destination
 */
inline void* memcpy(void* dest, const void* src, size_t count) {
    if (!dest || !src || count == 0) return dest;
    
    u8* d = static_cast<u8*>(dest);
    const u8* s = static_cast<const u8*>(src);
    
    for (size_t i = 0; i < count; i++) {
        d[i] = s[i];
    }
    
    return dest;
}

/**
 * @brief Set memory to a specific value
 * @param dest Destination buffer
 * @param value Value to set (will be cast to u8)
 * @param count Number of bytes to set
 * @return Pointer to destination
 */
inline void* memset(void* dest, i32 value, size_t count) {
    if (!dest || count == 0) return dest;
    
    u8* d = static_cast<u8*>(dest);
    u8 val = static_cast<u8>(value);
    
    for (size_t i = 0; i < count; i++) {
        d[i] = val;
    }
    
    return dest;
}

inline i32 memcmp(const void* lhs, const void* rhs, size_t count) {
    const u8* a = static_cast<const u8*>(lhs);
    const u8* b = static_cast<const u8*>(rhs);
    for (size_t i = 0; i < count; i++) {
        if (a[i] != b[i]) {
            return static_cast<i32>(a[i]) - static_cast<i32>(b[i]);
        }
    }
    return 0;
}

// Alignment helpers; alignment must be a power of two
inline u64 align_up(u64 value, u64 alignment) {
    if (alignment <= 1) return value;
    return (value + alignment - 1) & ~(alignment - 1);
}

inline u64 align_down(u64 value, u64 alignment) {
    if (alignment <= 1) return value;
    return value & ~(alignment - 1);
}

inline bool is_power_of_two(u64 value) {
    return value != 0 && (value & (value - 1)) == 0;
}

/**
 * @brief System V ELF string hash
 * @param name Null-terminated string
 * @return 32-bit hash value used for symbol map buckets
 */
inline u32 elf_hash(const char* name) {
    u32 h = 0;
    if (!name) return h;
    
    while (*name) {
        h = (h << 4) + static_cast<u8>(*name++);
        u32 g = h & 0xF0000000;
        if (g) {
            h ^= g >> 24;
        }
        h &= ~g;
    }
    return h;
}

/**
 * @brief FNV-1a hash over a byte buffer
 * @param data Buffer to hash
 * @param size Number of bytes
 * @return 64-bit hash value
 */
inline u64 fnv1a_hash(const void* data, size_t size) {
    const u8* bytes = static_cast<const u8*>(data);
    u64 hash = 0xcbf29ce484222325ULL;
    for (size_t i = 0; i < size; i++) {
        hash ^= bytes[i];
        hash *= 0x100000001b3ULL;
    }
    return hash;
}

// Safe division functions for kernel code
template<typename T>
bool safe_divide(T dividend, T divisor, T& result) {
    if (divisor == 0) {
        return false;
    }
    result = dividend / divisor;
    return true;
}

/**
 * @brief Formatted output to the registered console sink
 * 
 * Supports %d %u %x %X %s %c %p %% with an optional 'l' or 'll'
 * length modifier for 64-bit integers.
 * @return Number of characters written
 */
int k_printf(const char* format, ...) __attribute__((format(printf, 1, 2)));

/**
 * @brief Formatted output with an explicit console color attribute
 */
int k_printf_colored(u16 color, const char* format, ...) __attribute__((format(printf, 2, 3)));

/**
 * @brief Format into a caller-provided buffer
 * @return Number of characters written (excluding terminator)
 */
int k_snprintf(char* buffer, u32 bufferSize, const char* format, ...) __attribute__((format(printf, 3, 4)));

/**
 * @brief Format into a caller-provided buffer from an argument list
 */
int k_vsnprintf(char* buffer, u32 bufferSize, const char* format, __builtin_va_list args);

} // namespace strata::utils
