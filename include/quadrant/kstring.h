#ifndef QUADRANT_KSTRING_H
#define QUADRANT_KSTRING_H

#include <cstdarg>
#include <cstddef>
#include <cstdint>

// =============================================================================
// MINIMAL STANDARD LIBRARY
// Freestanding replacements for the handful of libc routines the workspace
// needs. Prefixed so hosted builds never collide with the real libc.
// =============================================================================

namespace quadrant {

size_t k_strlen(const char* str);
int    k_strcmp(const char* s1, const char* s2);
int    k_strncmp(const char* s1, const char* s2, size_t n);
void*  k_memset(void* ptr, int value, size_t num);
void*  k_memcpy(void* dest, const void* src, size_t n);
void*  k_memmove(void* dest, const void* src, size_t n);

// Copies at most cap-1 characters and always terminates.
size_t k_strlcpy(char* dest, const char* src, size_t cap);

inline bool k_is_digit(char c) { return c >= '0' && c <= '9'; }
inline bool k_is_alpha(char c) { return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || c == '_'; }
inline bool k_is_alnum(char c) { return k_is_alpha(c) || k_is_digit(c); }
inline bool k_is_space(char c) { return c == ' ' || c == '\t' || c == '\r' || c == '\n'; }
inline bool k_is_printable(char c) { return c >= 32 && c < 127; }

// %d %u %x %s %c and %%, with an optional 'l' length modifier.
int k_vsnprintf(char* buffer, size_t size, const char* fmt, va_list args);
int k_snprintf(char* buffer, size_t size, const char* fmt, ...);

int int_to_string(int64_t value, char* buffer, size_t size);

// Fixed six-digit fraction with trailing zeros trimmed ("2.5", "3.131593").
int double_to_string(double value, char* buffer, size_t size);

bool parse_int(const char* text, int64_t* out);
bool parse_double(const char* text, double* out);

// Length of the leading run of printable ASCII and newlines. Stored content
// past the first other byte is ignored.
size_t valid_text_prefix(const char* text, size_t len);

}

#endif
