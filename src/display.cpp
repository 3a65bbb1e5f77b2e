#include "quadrant/display.h"

#include "quadrant/kstring.h"

namespace quadrant {

bool is_drawable(char c) { return k_is_printable(c); }

void plot_str(Display& display, const char* s, int col, int row, ColorCode color) {
    for (int i = 0; s[i] != '\0'; i++) {
        if (col + i >= config::SCREEN_WIDTH) break;
        display.plot(s[i], col + i, row, color);
    }
}

void plot_str_n(Display& display, const char* s, int len, int col, int row, ColorCode color) {
    for (int i = 0; i < len && s[i] != '\0'; i++) {
        if (col + i >= config::SCREEN_WIDTH) break;
        display.plot(s[i], col + i, row, color);
    }
}

void plot_num(Display& display, long value, int col, int row, ColorCode color) {
    char buf[24];
    int_to_string(value, buf, sizeof(buf));
    plot_str(display, buf, col, row, color);
}

void fill_row(Display& display, int col, int row, int width, ColorCode color) {
    for (int i = 0; i < width && col + i < config::SCREEN_WIDTH; i++) {
        display.plot(' ', col + i, row, color);
    }
}

// =============================================================================
// TEXT GRID
// =============================================================================

TextGrid::TextGrid() { clear(); }

void TextGrid::clear() {
    for (int row = 0; row < config::SCREEN_HEIGHT; row++) {
        for (int col = 0; col < config::SCREEN_WIDTH; col++) {
            cells[row][col] = ' ';
            colors[row][col] = Palette::blank();
        }
    }
}

void TextGrid::plot(char c, int col, int row, ColorCode color) {
    if (col < 0 || col >= config::SCREEN_WIDTH || row < 0 || row >= config::SCREEN_HEIGHT) return;
    cells[row][col] = is_drawable(c) ? c : ' ';
    colors[row][col] = color;
}

char TextGrid::char_at(int col, int row) const {
    if (col < 0 || col >= config::SCREEN_WIDTH || row < 0 || row >= config::SCREEN_HEIGHT) return ' ';
    return cells[row][col];
}

ColorCode TextGrid::color_at(int col, int row) const {
    if (col < 0 || col >= config::SCREEN_WIDTH || row < 0 || row >= config::SCREEN_HEIGHT) return ColorCode();
    return colors[row][col];
}

int TextGrid::text_at(int col, int row, int width, char* out, int cap) const {
    int n = 0;
    for (int i = 0; i < width && n + 1 < cap; i++) out[n++] = char_at(col + i, row);
    while (n > 0 && out[n - 1] == ' ') n--;
    out[n] = '\0';
    return n;
}

bool TextGrid::row_contains(int row, const char* text) const {
    char line[config::SCREEN_WIDTH + 1];
    text_at(0, row, config::SCREEN_WIDTH, line, sizeof(line));
    size_t len = k_strlen(text);
    for (size_t start = 0; line[start] != '\0'; start++) {
        if (k_strncmp(line + start, text, len) == 0) return true;
    }
    return len == 0;
}

}
