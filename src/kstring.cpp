#include "quadrant/kstring.h"

namespace quadrant {

size_t k_strlen(const char* str) { size_t len = 0; while (str[len]) len++; return len; }

int k_strcmp(const char* s1, const char* s2) {
    while (*s1 && (*s1 == *s2)) { s1++; s2++; }
    return *(const unsigned char*)s1 - *(const unsigned char*)s2;
}

int k_strncmp(const char* s1, const char* s2, size_t n) {
    if (n == 0) return 0;
    do {
        if (*s1 != *s2++) return *(const unsigned char*)s1 - *(const unsigned char*)--s2;
        if (*s1++ == 0) break;
    } while (--n != 0);
    return 0;
}

void* k_memset(void* ptr, int value, size_t num) {
    uint8_t* p = (uint8_t*)ptr;
    for (size_t i = 0; i < num; i++) p[i] = (uint8_t)value;
    return ptr;
}

void* k_memcpy(void* dest, const void* src, size_t n) {
    uint8_t* d = (uint8_t*)dest;
    const uint8_t* s = (const uint8_t*)src;
    for (size_t i = 0; i < n; i++) d[i] = s[i];
    return dest;
}

void* k_memmove(void* dest, const void* src, size_t n) {
    uint8_t* d = (uint8_t*)dest;
    const uint8_t* s = (const uint8_t*)src;
    if (d < s) {
        for (size_t i = 0; i < n; i++) d[i] = s[i];
    } else if (d > s) {
        for (size_t i = n; i > 0; i--) d[i - 1] = s[i - 1];
    }
    return dest;
}

size_t k_strlcpy(char* dest, const char* src, size_t cap) {
    if (cap == 0) return 0;
    size_t i = 0;
    for (; i + 1 < cap && src[i] != '\0'; i++) dest[i] = src[i];
    dest[i] = '\0';
    return i;
}

// --- Number formatting ---

static int format_unsigned(uint64_t value, unsigned base, char* tmp) {
    // tmp must hold 21 characters; digits are written right-aligned
    const char* digits = "0123456789abcdef";
    int pos = 20;
    tmp[pos] = '\0';
    if (value == 0) tmp[--pos] = '0';
    while (value > 0) {
        tmp[--pos] = digits[value % base];
        value /= base;
    }
    return pos;
}

int int_to_string(int64_t value, char* buffer, size_t size) {
    char tmp[22];
    bool neg = value < 0;
    uint64_t magnitude = neg ? (uint64_t)0 - (uint64_t)value : (uint64_t)value;
    int pos = format_unsigned(magnitude, 10, tmp + 1) + 1;
    if (neg) tmp[--pos] = '-';
    return (int)k_strlcpy(buffer, tmp + pos, size);
}

int double_to_string(double value, char* buffer, size_t size) {
    if (value != value) return (int)k_strlcpy(buffer, "nan", size);
    if (value > 9.0e18 || value < -9.0e18) return (int)k_strlcpy(buffer, value > 0 ? "inf" : "-inf", size);

    char out[48];
    int n = 0;
    if (value < 0) { out[n++] = '-'; value = -value; }

    uint64_t whole = (uint64_t)value;
    uint64_t frac = (uint64_t)((value - (double)whole) * 1000000.0 + 0.5);
    if (frac >= 1000000) { whole++; frac -= 1000000; }

    char tmp[22];
    int pos = format_unsigned(whole, 10, tmp);
    while (tmp[pos]) out[n++] = tmp[pos++];
    out[n++] = '.';

    char frac_digits[6];
    for (int i = 5; i >= 0; i--) { frac_digits[i] = (char)('0' + frac % 10); frac /= 10; }
    int last = 5;
    while (last > 0 && frac_digits[last] == '0') last--;
    for (int i = 0; i <= last; i++) out[n++] = frac_digits[i];
    out[n] = '\0';
    return (int)k_strlcpy(buffer, out, size);
}

int k_vsnprintf(char* buffer, size_t size, const char* fmt, va_list args) {
    if (size == 0) return 0;
    char* buf = buffer;
    char* end = buffer + size - 1;
    while (*fmt && buf < end) {
        if (*fmt != '%') { *buf++ = *fmt++; continue; }
        fmt++;
        bool is_long = false;
        if (*fmt == 'l') { is_long = true; fmt++; }
        char tmp[24];
        const char* s = tmp;
        switch (*fmt) {
            case 'd': {
                int64_t val = is_long ? va_arg(args, long) : va_arg(args, int);
                int_to_string(val, tmp, sizeof(tmp));
                break;
            }
            case 'u': {
                uint64_t val = is_long ? va_arg(args, unsigned long) : va_arg(args, unsigned int);
                s = tmp + format_unsigned(val, 10, tmp);
                break;
            }
            case 'x': {
                uint64_t val = is_long ? va_arg(args, unsigned long) : va_arg(args, unsigned int);
                s = tmp + format_unsigned(val, 16, tmp);
                break;
            }
            case 's':
                s = va_arg(args, const char*);
                if (!s) s = "(null)";
                break;
            case 'c':
                tmp[0] = (char)va_arg(args, int);
                tmp[1] = '\0';
                break;
            case '%':
                tmp[0] = '%';
                tmp[1] = '\0';
                break;
            case '\0':
                *buf = '\0';
                return (int)(buf - buffer);
            default:
                tmp[0] = '%';
                tmp[1] = *fmt;
                tmp[2] = '\0';
                break;
        }
        while (*s && buf < end) *buf++ = *s++;
        fmt++;
    }
    *buf = '\0';
    return (int)(buf - buffer);
}

int k_snprintf(char* buffer, size_t size, const char* fmt, ...) {
    va_list args;
    va_start(args, fmt);
    int n = k_vsnprintf(buffer, size, fmt, args);
    va_end(args);
    return n;
}

// --- Parsing ---

bool parse_int(const char* text, int64_t* out) {
    const char* p = text;
    bool neg = false;
    if (*p == '-' || *p == '+') { neg = (*p == '-'); p++; }
    if (!k_is_digit(*p)) return false;
    int64_t res = 0;
    while (k_is_digit(*p)) {
        if (res > (INT64_MAX - 9) / 10) return false;
        res = res * 10 + (*p - '0');
        p++;
    }
    if (*p != '\0') return false;
    *out = neg ? -res : res;
    return true;
}

bool parse_double(const char* text, double* out) {
    const char* p = text;
    bool neg = false;
    if (*p == '-' || *p == '+') { neg = (*p == '-'); p++; }
    bool any = false;
    double res = 0.0;
    while (k_is_digit(*p)) { res = res * 10.0 + (*p - '0'); p++; any = true; }
    if (*p == '.') {
        p++;
        double scale = 0.1;
        while (k_is_digit(*p)) { res += (*p - '0') * scale; scale /= 10.0; p++; any = true; }
    }
    if (!any || *p != '\0') return false;
    *out = neg ? -res : res;
    return true;
}

size_t valid_text_prefix(const char* text, size_t len) {
    size_t i = 0;
    while (i < len && (k_is_printable(text[i]) || text[i] == '\n')) i++;
    return i;
}

}
