#ifndef QUADRANT_LINE_BUFFER_H
#define QUADRANT_LINE_BUFFER_H

#include "quadrant/config.h"

namespace quadrant {

// Fixed character grid with one cursor. '\0' marks an unused cell; a row's
// length is the run of used cells from column 0.
//
// Invariant after every operation: 0 <= cursor <= num_letters <= WINDOW_WIDTH.
class LineBuffer {
public:
    static constexpr int WIDTH  = config::WINDOW_WIDTH;
    static constexpr int HEIGHT = config::WINDOW_HEIGHT;

    LineBuffer();

    void clear();

    // --- Editing ---
    void insert_char(char c);
    void insert_newline();
    void backspace();
    void move_up();
    void move_down();
    void move_left();
    void move_right();

    // Replaces the grid with text split on '\n'. Rows past the grid and
    // characters past the width are dropped. Cursor goes to row 0, column 0.
    void load_text(const char* text, int len);

    // Non-empty rows joined by '\n', no trailing separator. Stops before the
    // first row that would not fit; the result is always terminated.
    int serialize(char* out, int cap) const;

    // --- Rows ---
    int  line_length(int row) const;
    bool is_empty(int row) const;
    const char* row_data(int row) const;
    int  row_text(int row, char* out, int cap) const;
    void set_row(int row, const char* text, int len);
    void clear_row(int row);

    // Moves rows first+1..last up by one and clears the last.
    void scroll_up(int first, int last);

    // Clears the row and parks the cursor at its start.
    void begin_isolated_line(int row);

    int  cursor_position() const { return cursor; }
    int  num_letters() const { return letters_in_row; }
    int  current_row() const { return row; }

private:
    char cells[HEIGHT][WIDTH];
    int  cursor;
    int  letters_in_row;
    int  row;

    void start_new_line();
    void check_row(int r) const;
};

}

#endif
