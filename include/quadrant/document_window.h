#ifndef QUADRANT_DOCUMENT_WINDOW_H
#define QUADRANT_DOCUMENT_WINDOW_H

#include "quadrant/config.h"
#include "quadrant/display.h"
#include "quadrant/filesystem.h"
#include "quadrant/interpreter.h"
#include "quadrant/keys.h"
#include "quadrant/line_buffer.h"
#include "quadrant/program_slot.h"

namespace quadrant {

enum WindowStatus {
    WINDOW_DISPLAYING_FILES,
    WINDOW_EDITING_FILE,
    WINDOW_EXECUTING_FILE,
    WINDOW_AWAITING_INPUT,
    WINDOW_DISPLAYING_OUTPUT
};

const char* window_status_name(WindowStatus status);

// One of the four screen quadrants: a file browser, an editor and a program
// console over a private file system. Program output arrives through the
// InterpreterOutput interface.
class DocumentWindow : public InterpreterOutput {
public:
    static constexpr int NOTICE_CHARS = 48;

    DocumentWindow();

    // Places the window in its quadrant, formats its storage and seeds the
    // fixture programs.
    void init(int index);

    // Keys for the active window. F1-F6 never reach here.
    void key(const KeyEvent& key);

    // One scheduled step of the running program.
    TickStatus run_tick();

    // F6: back to the directory listing, dropping any program. Saving is
    // the scheduler's job since it spans every window.
    void close_to_directory();

    void print(const char* chars, int len) override;

    void render(Display& display) const;

    // Stores name = data in this window's file system.
    int store_file(const char* name, const char* data, int len);

    bool is_runnable() const { return running && status_ != WINDOW_AWAITING_INPUT; }
    bool has_named_edit() const { return status_ == WINDOW_EDITING_FILE && filename_len > 0; }
    int  serialize(char* out, int cap) const { return buffer_.serialize(out, cap); }

    void set_active(bool value) { active = value; }
    bool is_active() const { return active; }

    void set_notice(const char* text);
    void clear_notice() { notice_[0] = '\0'; }
    const char* notice() const { return notice_; }

    WindowStatus status() const { return status_; }
    bool program_running() const { return running; }
    bool has_program() const { return slot.is_running(); }
    int  highlighted() const { return active_file; }
    const char* filename() const { return filename_; }
    const LineBuffer& buffer() const { return buffer_; }
    FileSystem& storage() { return fs; }
    const FileSystem& storage() const { return fs; }
    int  start_col() const { return col0; }
    int  start_row() const { return row0; }

private:
    int          index;
    int          col0, row0;
    LineBuffer   buffer_;
    WindowStatus status_;
    bool         active;
    int          active_file;
    bool         running;
    int          output_row;
    char         filename_[config::MAX_FILENAME_BYTES + 1];
    int          filename_len;
    FileSystem   fs;
    ProgramSlot  slot;
    char         file_buffer[config::MAX_FILE_BYTES + 1];
    char         notice_[NOTICE_CHARS];

    void key_displaying_files(const KeyEvent& key);
    void key_editing(const KeyEvent& key);
    void key_awaiting_input(const KeyEvent& key);
    void move_highlight(int delta);

    int  load_highlighted(char* name_out);
    void start_editing();
    void start_program();
    void submit_input();
    void output_line(const char* text, int len);

    void draw_outline(Display& display) const;
    void draw_listing(Display& display) const;
    void draw_rows(Display& display, int first, int last) const;
    void draw_cursor(Display& display) const;
};

}

#endif
