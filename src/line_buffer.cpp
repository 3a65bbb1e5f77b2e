#include "quadrant/line_buffer.h"

#include "quadrant/klog.h"
#include "quadrant/kstring.h"

namespace quadrant {

LineBuffer::LineBuffer() { clear(); }

void LineBuffer::clear() {
    k_memset(cells, 0, sizeof(cells));
    cursor = 0;
    letters_in_row = 0;
    row = 0;
}

void LineBuffer::check_row(int r) const {
    QUADRANT_ASSERT(r >= 0 && r < HEIGHT, "line buffer row out of range");
}

// Row arithmetic wraps: a new line after the last row lands on row 0. The
// tracked length restarts at zero even when that row still holds text.
void LineBuffer::start_new_line() {
    row = (row + 1) % HEIGHT;
    cursor = 0;
    letters_in_row = 0;
}

// =============================================================================
// EDITING
// =============================================================================

void LineBuffer::insert_char(char c) {
    if (!k_is_printable(c)) return;
    // A full line never drops the keystroke: it moves on to the next row.
    if (letters_in_row >= WIDTH) start_new_line();

    char* line = cells[row];
    for (int i = letters_in_row; i > cursor; i--) line[i] = line[i - 1];
    line[cursor] = c;
    letters_in_row++;
    cursor++;
}

void LineBuffer::insert_newline() {
    start_new_line();
}

void LineBuffer::backspace() {
    if (cursor == 0) return;
    char* line = cells[row];
    for (int i = cursor - 1; i < letters_in_row - 1; i++) line[i] = line[i + 1];
    line[letters_in_row - 1] = '\0';
    letters_in_row--;
    cursor--;
}

void LineBuffer::move_up() {
    if (row == 0) return;
    row--;
    letters_in_row = line_length(row);
    if (cursor > letters_in_row) cursor = letters_in_row;
}

void LineBuffer::move_down() {
    if (row + 1 >= HEIGHT || is_empty(row + 1)) return;
    row++;
    letters_in_row = line_length(row);
    if (cursor > letters_in_row) cursor = letters_in_row;
}

void LineBuffer::move_left() {
    if (cursor > 0) cursor--;
}

void LineBuffer::move_right() {
    if (cursor < letters_in_row) cursor++;
}

// =============================================================================
// LOAD / SAVE
// =============================================================================

void LineBuffer::load_text(const char* text, int len) {
    clear();
    int r = 0;
    int c = 0;
    for (int i = 0; i < len && text[i] != '\0'; i++) {
        if (text[i] == '\n') {
            r++;
            c = 0;
            if (r >= HEIGHT) break;
            continue;
        }
        if (c < WIDTH && k_is_printable(text[i])) cells[r][c++] = text[i];
    }
    letters_in_row = line_length(0);
}

int LineBuffer::serialize(char* out, int cap) const {
    if (cap <= 0) return 0;
    int n = 0;
    bool first = true;
    for (int r = 0; r < HEIGHT; r++) {
        int len = line_length(r);
        if (len == 0) continue;
        int need = len + (first ? 0 : 1);
        if (n + need > cap - 1) break;
        if (!first) out[n++] = '\n';
        k_memcpy(out + n, cells[r], len);
        n += len;
        first = false;
    }
    out[n] = '\0';
    return n;
}

// =============================================================================
// ROWS
// =============================================================================

int LineBuffer::line_length(int r) const {
    check_row(r);
    int len = 0;
    while (len < WIDTH && cells[r][len] != '\0') len++;
    return len;
}

bool LineBuffer::is_empty(int r) const {
    check_row(r);
    return cells[r][0] == '\0';
}

const char* LineBuffer::row_data(int r) const {
    check_row(r);
    return cells[r];
}

int LineBuffer::row_text(int r, char* out, int cap) const {
    int len = line_length(r);
    if (len > cap - 1) len = cap - 1;
    k_memcpy(out, cells[r], len);
    out[len] = '\0';
    return len;
}

void LineBuffer::set_row(int r, const char* text, int len) {
    clear_row(r);
    int c = 0;
    for (int i = 0; i < len && c < WIDTH && text[i] != '\0'; i++) {
        if (k_is_printable(text[i])) cells[r][c++] = text[i];
    }
}

void LineBuffer::clear_row(int r) {
    check_row(r);
    k_memset(cells[r], 0, WIDTH);
}

void LineBuffer::scroll_up(int first, int last) {
    check_row(first);
    check_row(last);
    for (int r = first; r < last; r++) k_memcpy(cells[r], cells[r + 1], WIDTH);
    clear_row(last);
}

void LineBuffer::begin_isolated_line(int r) {
    clear_row(r);
    row = r;
    cursor = 0;
    letters_in_row = 0;
}

}
