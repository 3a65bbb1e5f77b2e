#include <cstdint>

#include "port_io.h"
#include "ps2_keyboard.h"
#include "serial.h"
#include "vga_display.h"

#include "quadrant/config.h"
#include "quadrant/klog.h"
#include "quadrant/scheduler.h"

using namespace quadrant;

#define MULTIBOOT_BOOTLOADER_MAGIC 0x2BADB002

static Scheduler   g_scheduler;
static VgaDisplay  g_vga;
static Ps2Keyboard g_keyboard;

static void init_screen_timer(uint16_t hz) {
    uint16_t divisor = 1193182 / hz;
    outb(0x43, 0x36);
    outb(0x40, divisor & 0xFF);
    outb(0x40, (divisor >> 8) & 0xFF);
}

[[noreturn]] static void halt_forever() {
    for (;;) asm volatile("cli; hlt");
}

static void vga_panic(const char* message) {
    g_vga.clear(Palette::error());
    plot_str(g_vga, "KERNEL PANIC", 0, 0, Palette::error());
    plot_str(g_vga, message, 0, 2, Palette::error());
    halt_forever();
}

// =============================================================================
// KERNEL MAIN
// =============================================================================

extern "C" void kernel_main(uint32_t magic, uint32_t multiboot_addr) {
    (void)multiboot_addr;

    bool serial_ok = serial_init();
    klog_set_sink(serial_log_sink);
    kpanic_set_handler(vga_panic);
    if (magic != MULTIBOOT_BOOTLOADER_MAGIC) klog(LOG_WARN, "boot: unexpected multiboot magic %x", magic);
    klog(LOG_INFO, "boot: serial %s", serial_ok ? "ready" : "missing");

    g_vga.hide_cursor();
    g_vga.clear(Palette::normal());
    g_keyboard.init();
    g_scheduler.init();

    init_screen_timer(QUADRANT_TIMER_HZ);

    // =============================================================================
    // MAIN LOOP
    // =============================================================================
    for (;;) {
        KeyEvent key;
        if (g_keyboard.poll(key)) g_scheduler.key(key);

        // Software tick throttle
        static uint32_t poll_counter = 0;
        if (++poll_counter >= QUADRANT_POLLS_PER_TICK) {
            poll_counter = 0;
            g_scheduler.update(g_vga);
        }
    }
}
