// Support symbols the compiler expects from a hosted runtime.

#include <cstddef>
#include <cstdint>

#include "quadrant/klog.h"
#include "quadrant/kstring.h"

extern "C" {

void* memset(void* ptr, int value, size_t num) { return quadrant::k_memset(ptr, value, num); }
void* memcpy(void* dest, const void* src, size_t n) { return quadrant::k_memcpy(dest, src, n); }
void* memmove(void* dest, const void* src, size_t n) { return quadrant::k_memmove(dest, src, n); }

int memcmp(const void* a, const void* b, size_t n) {
    const unsigned char* p = (const unsigned char*)a;
    const unsigned char* q = (const unsigned char*)b;
    for (size_t i = 0; i < n; i++) {
        if (p[i] != q[i]) return p[i] - q[i];
    }
    return 0;
}

void __cxa_pure_virtual() { quadrant::kpanic(__FILE__, __LINE__, "pure virtual call"); }

// Static objects are never destroyed.
void* __dso_handle = 0;
int __cxa_atexit(void (*)(void*), void*, void*) { return 0; }

typedef void (*constructor_fn)();
extern constructor_fn __init_array_start[];
extern constructor_fn __init_array_end[];

void run_global_constructors() {
    for (constructor_fn* fn = __init_array_start; fn != __init_array_end; fn++) (*fn)();
}

}

// Virtual destructors reference sized delete even though nothing is freed.
void operator delete(void*) noexcept {}
void operator delete(void*, size_t) noexcept {}
