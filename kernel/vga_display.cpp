#include "vga_display.h"

#include "port_io.h"

namespace quadrant {

#define VGA_TEXT_BUFFER 0xB8000
#define VGA_CRTC_INDEX  0x3D4
#define VGA_CRTC_DATA   0x3D5

VgaDisplay::VgaDisplay() : buffer((volatile uint16_t*)VGA_TEXT_BUFFER) {}

static inline uint16_t vga_entry(unsigned char uc, uint8_t color) {
    return (uint16_t)uc | (uint16_t)color << 8;
}

void VgaDisplay::plot(char c, int col, int row, ColorCode color) {
    if (col < 0 || col >= config::SCREEN_WIDTH || row < 0 || row >= config::SCREEN_HEIGHT) return;
    char shown = is_drawable(c) ? c : ' ';
    buffer[row * config::SCREEN_WIDTH + col] = vga_entry((unsigned char)shown, color.value);
}

void VgaDisplay::clear(ColorCode color) {
    for (int i = 0; i < config::SCREEN_WIDTH * config::SCREEN_HEIGHT; i++) {
        buffer[i] = vga_entry(' ', color.value);
    }
}

void VgaDisplay::hide_cursor() {
    outb(VGA_CRTC_INDEX, 0x0A);
    outb(VGA_CRTC_DATA, 0x20);
}

}
