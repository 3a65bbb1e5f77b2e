#ifndef QUADRANT_DISPLAY_H
#define QUADRANT_DISPLAY_H

#include <cstdint>

#include "quadrant/config.h"

namespace quadrant {

// VGA text-mode palette
enum Color {
    COLOR_BLACK = 0,
    COLOR_BLUE = 1,
    COLOR_GREEN = 2,
    COLOR_CYAN = 3,
    COLOR_RED = 4,
    COLOR_MAGENTA = 5,
    COLOR_BROWN = 6,
    COLOR_LIGHT_GREY = 7,
    COLOR_DARK_GREY = 8,
    COLOR_LIGHT_BLUE = 9,
    COLOR_LIGHT_GREEN = 10,
    COLOR_LIGHT_CYAN = 11,
    COLOR_LIGHT_RED = 12,
    COLOR_LIGHT_MAGENTA = 13,
    COLOR_YELLOW = 14,
    COLOR_WHITE = 15,
};

// Foreground in the low nibble, background in the high nibble, exactly the
// attribute byte the VGA text buffer expects.
struct ColorCode {
    uint8_t value;

    ColorCode() : value(0) {}
    ColorCode(Color fg, Color bg) : value((uint8_t)(fg | (bg << 4))) {}

    Color foreground() const { return (Color)(value & 0x0F); }
    Color background() const { return (Color)(value >> 4); }
    bool operator==(const ColorCode& other) const { return value == other.value; }
};

namespace Palette {
    inline ColorCode normal()   { return ColorCode(COLOR_WHITE, COLOR_BLACK); }
    inline ColorCode inverse()  { return ColorCode(COLOR_BLACK, COLOR_WHITE); }
    inline ColorCode blank()    { return ColorCode(COLOR_BLACK, COLOR_BLACK); }
    inline ColorCode cursor()   { return ColorCode(COLOR_WHITE, COLOR_WHITE); }
    inline ColorCode status()   { return ColorCode(COLOR_YELLOW, COLOR_BLUE); }
    inline ColorCode error()    { return ColorCode(COLOR_WHITE, COLOR_RED); }
}

// Character-cell display, write-only from the workspace.
class Display {
public:
    virtual ~Display() {}
    virtual void plot(char c, int col, int row, ColorCode color) = 0;
};

bool is_drawable(char c);
void plot_str(Display& display, const char* s, int col, int row, ColorCode color);
void plot_str_n(Display& display, const char* s, int len, int col, int row, ColorCode color);
void plot_num(Display& display, long value, int col, int row, ColorCode color);
void fill_row(Display& display, int col, int row, int width, ColorCode color);

// In-memory cell grid. Backs the simulator and lets tests read the screen.
class TextGrid : public Display {
public:
    TextGrid();

    void plot(char c, int col, int row, ColorCode color) override;
    void clear();

    char char_at(int col, int row) const;
    ColorCode color_at(int col, int row) const;

    // Copies the cells [col, col + width) of a row, trailing blanks trimmed.
    int text_at(int col, int row, int width, char* out, int cap) const;

    // True when the row contains the text anywhere.
    bool row_contains(int row, const char* text) const;

private:
    char      cells[config::SCREEN_HEIGHT][config::SCREEN_WIDTH];
    ColorCode colors[config::SCREEN_HEIGHT][config::SCREEN_WIDTH];
};

}

#endif
