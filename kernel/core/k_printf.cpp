#include "core/utils.hpp"
#include "display/console_sink.hpp"

namespace strata::utils {

using namespace strata::system;
using namespace strata::display;

// Compiler-provided variadic argument support (valid for the LP64 ABI)
typedef __builtin_va_list va_list;

#define va_start(ap, last) __builtin_va_start(ap, last)
#define va_arg(ap, type)   __builtin_va_arg(ap, type)
#define va_end(ap)         __builtin_va_end(ap)
#define va_copy(dst, src)  __builtin_va_copy(dst, src)

/**
 * @brief Append a null-terminated string to the output buffer
 * @return New length of buffer content
 */
static u32 append_string(char* buffer, u32 bufferSize, u32 currentLen, const char* str, bool upper = false) {
    while (*str && currentLen < bufferSize - 1) {
        buffer[currentLen++] = upper ? to_upper(*str) : *str;
        str++;
    }
    return currentLen;
}

/**
 * @brief Internal function to format a single argument and append to buffer
 * @param buffer Output buffer to append to
 * @param bufferSize Total size of output buffer
 * @param currentLen Current length of buffer content
 * @param specifier Format specifier character ('d', 'x', 's', 'c', ...)
 * @param wide true when an 'l' or 'll' length modifier preceded the specifier
 * @param args Variable arguments list
 * @return New length of buffer content
 */
static u32 format_argument(char* buffer, u32 bufferSize, u32 currentLen, char specifier, bool wide, va_list& args) {
    if (currentLen >= bufferSize - 1) return currentLen;
    
    char numBuffer[24];
    
    switch (specifier) {
        case 'd':
        case 'i': {
            // Signed decimal integer
            i64 value = wide ? va_arg(args, long long) : va_arg(args, int);
            u64 absValue;
            
            if (value < 0) {
                if (currentLen < bufferSize - 1) {
                    buffer[currentLen++] = '-';
                }
                absValue = static_cast<u64>(-(value + 1)) + 1;
            } else {
                absValue = static_cast<u64>(value);
            }
            
            number_to_decimal(numBuffer, absValue);
            currentLen = append_string(buffer, bufferSize, currentLen, numBuffer);
            break;
        }
        
        case 'u': {
            // Unsigned decimal integer
            u64 value = wide ? va_arg(args, unsigned long long) : va_arg(args, unsigned int);
            number_to_decimal(numBuffer, value);
            currentLen = append_string(buffer, bufferSize, currentLen, numBuffer);
            break;
        }
        
        case 'x':
        case 'X': {
            // Hexadecimal with "0x" prefix, 8 digits or 16 digits when wide
            u64 value = wide ? va_arg(args, unsigned long long) : va_arg(args, unsigned int);
            bool upper = (specifier == 'X');
            
            currentLen = append_string(buffer, bufferSize, currentLen, upper ? "0X" : "0x");
            number_to_hex(numBuffer, value, wide ? 16 : 8);
            currentLen = append_string(buffer, bufferSize, currentLen, numBuffer, upper);
            break;
        }
        
        case 's': {
            const char* str = va_arg(args, const char*);
            if (!str) str = "(null)";
            currentLen = append_string(buffer, bufferSize, currentLen, str);
            break;
        }
        
        case 'c': {
            char ch = static_cast<char>(va_arg(args, int));
            if (currentLen < bufferSize - 1) {
                buffer[currentLen++] = ch;
            }
            break;
        }
        
        case 'p': {
            // Pointer (as 64-bit hex)
            void* ptr = va_arg(args, void*);
            
            currentLen = append_string(buffer, bufferSize, currentLen, "0x");
            number_to_hex(numBuffer, reinterpret_cast<uintptr_t>(ptr), 16);
            currentLen = append_string(buffer, bufferSize, currentLen, numBuffer);
            break;
        }
        
        case '%': {
            if (currentLen < bufferSize - 1) {
                buffer[currentLen++] = '%';
            }
            break;
        }
        
        default: {
            // Unknown specifier - just add the % and the character
            if (currentLen < bufferSize - 2) {
                buffer[currentLen++] = '%';
                buffer[currentLen++] = specifier;
            }
            break;
        }
    }
    
    return currentLen;
}

/**
 * @brief Format a string into buffer
 * @return Number of characters written (excluding terminator)
 */
static u32 format_to_buffer(char* buffer, u32 bufferSize, const char* format, va_list& args) {
    if (!buffer || bufferSize == 0) return 0;
    
    u32 bufferLen = 0;
    const char* ptr = format;
    while (*ptr && bufferLen < bufferSize - 1) {
        if (*ptr == '%' && *(ptr + 1) != '\0') {
            ptr++; // Skip %
            
            // Length modifiers: 'l', 'll' and 'z' all select 64-bit arguments
            bool wide = false;
            while (*ptr == 'l' || *ptr == 'z') {
                wide = true;
                ptr++;
            }
            if (*ptr == '\0') break;
            
            char specifier = *ptr++;
            bufferLen = format_argument(buffer, bufferSize, bufferLen, specifier, wide, args);
        } else {
            buffer[bufferLen++] = *ptr++;
        }
    }
    
    buffer[bufferLen] = '\0';
    return bufferLen;
}

/**
 * @brief Internal k_printf implementation
 * @param color Console color for output (0 = use default)
 * @param format Format string
 * @param args Variable arguments list
 * @return Number of characters written
 */
static int k_printf_internal(u16 color, const char* format, va_list& args) {
    if (!format) return 0;
    
    constexpr u32 BUFFER_SIZE = 512;
    char buffer[BUFFER_SIZE];
    u32 bufferLen = format_to_buffer(buffer, BUFFER_SIZE, format, args);
    
    ConsoleSink sink = get_console_sink();
    if (sink) {
        sink(buffer, color == 0 ? VGA_WHITE_ON_BLUE : color);
    }
    
    return static_cast<int>(bufferLen);
}

int k_vsnprintf(char* buffer, u32 bufferSize, const char* format, __builtin_va_list args) {
    if (!format) return 0;
    
    va_list copy;
    va_copy(copy, args);
    u32 written = format_to_buffer(buffer, bufferSize, format, copy);
    va_end(copy);
    return static_cast<int>(written);
}

int k_printf(const char* format, ...) {
    va_list args;
    va_start(args, format);
    int result = k_printf_internal(0, format, args);
    va_end(args);
    return result;
}

int k_printf_colored(u16 color, const char* format, ...) {
    va_list args;
    va_start(args, format);
    int result = k_printf_internal(color, format, args);
    va_end(args);
    return result;
}

int k_snprintf(char* buffer, u32 bufferSize, const char* format, ...) {
    if (!format) return 0;
    
    va_list args;
    va_start(args, format);
    u32 written = format_to_buffer(buffer, bufferSize, format, args);
    va_end(args);
    return static_cast<int>(written);
}

} // namespace strata::utils
