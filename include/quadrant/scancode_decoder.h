#ifndef QUADRANT_SCANCODE_DECODER_H
#define QUADRANT_SCANCODE_DECODER_H

#include <cstdint>

#include "quadrant/keys.h"

namespace quadrant {

// PS/2 scan code set 1, US layout. Fed one byte at a time by the kernel's
// port poller; holds the modifier and prefix state between bytes.
class ScancodeDecoder {
public:
    ScancodeDecoder();

    // Returns true and fills out when the byte completes a key press.
    bool feed(uint8_t data, KeyEvent& out);

    bool shift_held() const { return shift; }
    bool ctrl_held() const { return ctrl; }
    void reset();

private:
    bool shift;
    bool ctrl;
    bool extended;
};

}

#endif
