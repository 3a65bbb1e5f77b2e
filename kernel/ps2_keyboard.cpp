#include "ps2_keyboard.h"

#include "port_io.h"

namespace quadrant {

#define PS2_DATA_PORT           0x60
#define PS2_STATUS_PORT         0x64
#define PS2_STATUS_OUTPUT_FULL  0x01
#define PS2_STATUS_AUX_DATA     0x20

static void ps2_flush_output_buffer() {
    int timeout = 1000;
    while ((inb(PS2_STATUS_PORT) & PS2_STATUS_OUTPUT_FULL) && timeout--) {
        inb(PS2_DATA_PORT);
    }
}

void Ps2Keyboard::init() {
    ps2_flush_output_buffer();
    decoder.reset();
}

bool Ps2Keyboard::poll(KeyEvent& out) {
    for (int iterations = 0; iterations < 16; iterations++) {
        uint8_t status = inb(PS2_STATUS_PORT);
        if (!(status & PS2_STATUS_OUTPUT_FULL)) break;

        uint8_t data = inb(PS2_DATA_PORT);
        // mouse bytes are dropped
        if (status & PS2_STATUS_AUX_DATA) continue;
        if (decoder.feed(data, out)) return true;
    }
    return false;
}

}
