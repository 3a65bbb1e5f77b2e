#ifndef QUADRANT_KERNEL_VGA_DISPLAY_H
#define QUADRANT_KERNEL_VGA_DISPLAY_H

#include <cstdint>

#include "quadrant/display.h"

namespace quadrant {

// 80x25 colour text buffer at 0xB8000.
class VgaDisplay : public Display {
public:
    VgaDisplay();

    void plot(char c, int col, int row, ColorCode color) override;
    void clear(ColorCode color);
    void hide_cursor();

private:
    volatile uint16_t* buffer;
};

}

#endif
