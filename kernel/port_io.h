#ifndef QUADRANT_KERNEL_PORT_IO_H
#define QUADRANT_KERNEL_PORT_IO_H

#include <cstdint>

static inline void outb(uint16_t port, uint8_t val) { asm volatile ("outb %0, %1" : : "a"(val), "d"(port)); }
static inline uint8_t inb(uint16_t port) { uint8_t ret; asm volatile ("inb %1, %0" : "=a"(ret) : "d"(port)); return ret; }
static inline void io_wait() { asm volatile("outb %%al, $0x80" : : "a"(0)); }

#endif
