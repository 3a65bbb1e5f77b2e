#include "serial.h"

#include "port_io.h"

namespace quadrant {

#define COM1_PORT       0x3F8
#define COM1_DATA       (COM1_PORT + 0)
#define COM1_INT_ENABLE (COM1_PORT + 1)
#define COM1_FIFO_CTRL  (COM1_PORT + 2)
#define COM1_LINE_CTRL  (COM1_PORT + 3)
#define COM1_MODEM_CTRL (COM1_PORT + 4)
#define COM1_LINE_STAT  (COM1_PORT + 5)
#define LINE_STAT_THR_EMPTY 0x20

static bool g_serial_ready = false;

bool serial_init() {
    outb(COM1_INT_ENABLE, 0x00);
    outb(COM1_LINE_CTRL, 0x80);     // DLAB on
    outb(COM1_DATA, 0x03);          // divisor 3: 38400 baud
    outb(COM1_INT_ENABLE, 0x00);
    outb(COM1_LINE_CTRL, 0x03);     // 8N1
    outb(COM1_FIFO_CTRL, 0xC7);
    outb(COM1_MODEM_CTRL, 0x1E);    // loopback for the self test
    outb(COM1_DATA, 0xAE);
    if (inb(COM1_DATA) != 0xAE) return false;
    outb(COM1_MODEM_CTRL, 0x0F);
    g_serial_ready = true;
    return true;
}

static void serial_putc(char c) {
    int timeout = 100000;
    while (!(inb(COM1_LINE_STAT) & LINE_STAT_THR_EMPTY) && timeout--) {}
    outb(COM1_DATA, (uint8_t)c);
}

void serial_write(const char* s) {
    if (!g_serial_ready) return;
    for (; *s; s++) {
        if (*s == '\n') serial_putc('\r');
        serial_putc(*s);
    }
}

void serial_log_sink(LogLevel level, const char* line) {
    (void)level;
    serial_write(line);
    serial_write("\n");
}

}
