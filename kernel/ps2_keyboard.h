#ifndef QUADRANT_KERNEL_PS2_KEYBOARD_H
#define QUADRANT_KERNEL_PS2_KEYBOARD_H

#include "quadrant/keys.h"
#include "quadrant/scancode_decoder.h"

namespace quadrant {

// Polled keyboard on the PS/2 controller. No interrupts are enabled; the
// main loop calls poll() continuously.
class Ps2Keyboard {
public:
    void init();

    // Drains up to a handful of bytes and returns the first completed key.
    bool poll(KeyEvent& out);

private:
    ScancodeDecoder decoder;
};

}

#endif
