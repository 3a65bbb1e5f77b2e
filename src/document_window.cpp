#include "quadrant/document_window.h"

#include "quadrant/fixtures.h"
#include "quadrant/klog.h"
#include "quadrant/kstring.h"

namespace quadrant {

const char* window_status_name(WindowStatus status) {
    switch (status) {
        case WINDOW_DISPLAYING_FILES:  return "files";
        case WINDOW_EDITING_FILE:      return "editing";
        case WINDOW_EXECUTING_FILE:    return "executing";
        case WINDOW_AWAITING_INPUT:    return "awaiting input";
        case WINDOW_DISPLAYING_OUTPUT: return "output";
    }
    return "?";
}

DocumentWindow::DocumentWindow()
    : index(0), col0(0), row0(0), status_(WINDOW_DISPLAYING_FILES), active(false),
      active_file(0), running(false), output_row(0), filename_len(0) {
    filename_[0] = '\0';
    file_buffer[0] = '\0';
    notice_[0] = '\0';
}

void DocumentWindow::init(int window_index) {
    QUADRANT_ASSERT(window_index >= 0 && window_index < config::NUM_WINDOWS, "window index out of range");
    index = window_index;
    col0 = config::WINDOW_START_COL[index];
    row0 = config::WINDOW_START_ROW[index];

    buffer_.clear();
    slot.release();
    status_ = WINDOW_DISPLAYING_FILES;
    active = false;
    active_file = 0;
    running = false;
    output_row = 0;
    filename_[0] = '\0';
    filename_len = 0;
    notice_[0] = '\0';

    fs.format();
    int status = seed_fixtures(fs);
    if (status != FS_OK) {
        klog(LOG_ERROR, "window %d: seeding fixtures failed: %s", index + 1, fs_strerror(status));
        set_notice(fs_strerror(status));
    }
}

void DocumentWindow::set_notice(const char* text) {
    k_strlcpy(notice_, text, sizeof(notice_));
}

// =============================================================================
// KEYBOARD
// =============================================================================

void DocumentWindow::key(const KeyEvent& key) {
    if (!active) return;
    clear_notice();
    switch (status_) {
        case WINDOW_DISPLAYING_FILES:
            key_displaying_files(key);
            break;
        case WINDOW_EDITING_FILE:
            key_editing(key);
            break;
        case WINDOW_AWAITING_INPUT:
            key_awaiting_input(key);
            break;
        case WINDOW_DISPLAYING_OUTPUT:
            if (key.is('r')) {
                buffer_.clear();
                output_row = 0;
                status_ = WINDOW_DISPLAYING_FILES;
            }
            break;
        case WINDOW_EXECUTING_FILE:
            break;
    }
}

void DocumentWindow::key_displaying_files(const KeyEvent& key) {
    if (key.is(KEY_ARROW_LEFT))       move_highlight(-1);
    else if (key.is(KEY_ARROW_RIGHT)) move_highlight(1);
    else if (key.is(KEY_ARROW_UP))    move_highlight(-config::LISTING_COLUMNS);
    else if (key.is(KEY_ARROW_DOWN))  move_highlight(config::LISTING_COLUMNS);
    else if (key.is('e'))             start_editing();
    else if (key.is('r'))             start_program();
}

void DocumentWindow::key_editing(const KeyEvent& key) {
    if (key.is_char) {
        if (key.ch == '\n')      buffer_.insert_newline();
        else if (key.ch == '\b') buffer_.backspace();
        else                     buffer_.insert_char(key.ch);
        return;
    }
    switch (key.code) {
        case KEY_ARROW_UP:    buffer_.move_up(); break;
        case KEY_ARROW_DOWN:  buffer_.move_down(); break;
        case KEY_ARROW_LEFT:  buffer_.move_left(); break;
        case KEY_ARROW_RIGHT: buffer_.move_right(); break;
        default: break;
    }
}

void DocumentWindow::key_awaiting_input(const KeyEvent& key) {
    if (!key.is_char) return;
    if (key.ch == '\n') {
        submit_input();
    } else if (key.ch == '\b') {
        buffer_.backspace();
    } else if (buffer_.num_letters() < LineBuffer::WIDTH) {
        buffer_.insert_char(key.ch);
    }
}

void DocumentWindow::move_highlight(int delta) {
    DirectoryListing listing;
    int count = fs.list_directory(listing);
    int target = active_file + delta;
    if (target > count - 1) target = count - 1;
    if (target < 0) target = 0;
    active_file = target;
}

// =============================================================================
// FILES AND PROGRAMS
// =============================================================================

int DocumentWindow::load_highlighted(char* name_out) {
    DirectoryListing listing;
    fs.list_directory(listing);
    if (active_file >= listing.count) return FS_ERR_FILE_NOT_FOUND;
    k_strlcpy(name_out, listing.names[active_file], config::MAX_FILENAME_BYTES + 1);

    int fd = fs.open_read(name_out);
    if (fd < 0) return fd;

    int total = 0;
    while (total < config::MAX_FILE_BYTES) {
        int n = fs.read(fd, file_buffer + total, config::MAX_FILE_BYTES - total);
        if (n < 0) {
            fs.close(fd);
            return n;
        }
        if (n == 0) break;
        total += n;
    }
    int closed = fs.close(fd);
    if (closed < 0) return closed;

    int valid = (int)valid_text_prefix(file_buffer, total);
    if (valid < total) {
        klog(LOG_WARN, "window %d: %s truncated to %d valid bytes", index + 1, name_out, valid);
    }
    file_buffer[valid] = '\0';
    return valid;
}

void DocumentWindow::start_editing() {
    char name[config::MAX_FILENAME_BYTES + 1];
    int len = load_highlighted(name);
    if (len < 0) {
        klog(LOG_WARN, "window %d: cannot edit: %s", index + 1, fs_strerror(len));
        set_notice(fs_strerror(len));
        return;
    }
    buffer_.load_text(file_buffer, len);
    filename_len = (int)k_strlcpy(filename_, name, sizeof(filename_));
    status_ = WINDOW_EDITING_FILE;
    klog(LOG_DEBUG, "window %d: editing %s", index + 1, filename_);
}

void DocumentWindow::start_program() {
    char name[config::MAX_FILENAME_BYTES + 1];
    int len = load_highlighted(name);
    if (len < 0) {
        klog(LOG_WARN, "window %d: cannot run: %s", index + 1, fs_strerror(len));
        set_notice(fs_strerror(len));
        return;
    }
    buffer_.clear();
    output_row = 0;
    slot.start(file_buffer);
    running = true;
    status_ = WINDOW_EXECUTING_FILE;
    klog(LOG_INFO, "window %d: running %s", index + 1, name);
}

TickStatus DocumentWindow::run_tick() {
    QUADRANT_ASSERT(status_ == WINDOW_EXECUTING_FILE && slot.is_running(), "tick for a window with no runnable program");
    TickStatus result = slot.step(*this);
    switch (result) {
        case TICK_FINISHED:
            slot.release();
            running = false;
            status_ = WINDOW_DISPLAYING_OUTPUT;
            klog(LOG_INFO, "window %d: program finished", index + 1);
            break;
        case TICK_AWAIT_INPUT:
            status_ = WINDOW_AWAITING_INPUT;
            buffer_.begin_isolated_line(config::INPUT_ROW);
            klog(LOG_INFO, "window %d: awaiting input", index + 1);
            break;
        case TICK_CONTINUING:
            break;
    }
    return result;
}

void DocumentWindow::submit_input() {
    char line[LineBuffer::WIDTH + 1];
    int len = buffer_.row_text(config::INPUT_ROW, line, sizeof(line));
    slot.queue_input(line);
    output_line(line, len);
    buffer_.begin_isolated_line(config::INPUT_ROW);
    status_ = WINDOW_EXECUTING_FILE;
}

void DocumentWindow::close_to_directory() {
    if (slot.is_running()) klog(LOG_INFO, "window %d: program stopped", index + 1);
    slot.release();
    running = false;
    buffer_.clear();
    output_row = 0;
    filename_[0] = '\0';
    filename_len = 0;
    status_ = WINDOW_DISPLAYING_FILES;
}

int DocumentWindow::store_file(const char* name, const char* data, int len) {
    int fd = fs.open_create(name);
    if (fd < 0) return fd;
    int written = fs.write(fd, data, len);
    int closed = fs.close(fd);
    if (written < 0) return written;
    return closed;
}

// =============================================================================
// OUTPUT
// =============================================================================

void DocumentWindow::output_line(const char* text, int len) {
    if (output_row >= config::OUTPUT_ROWS) {
        buffer_.scroll_up(0, config::OUTPUT_ROWS - 1);
        output_row = config::OUTPUT_ROWS - 1;
    }
    buffer_.set_row(output_row, text, len);
    output_row++;
}

// Long text and embedded newlines continue on the following lines.
void DocumentWindow::print(const char* chars, int len) {
    int start = 0;
    do {
        int end = start;
        while (end < len && chars[end] != '\n' && end - start < LineBuffer::WIDTH) end++;
        output_line(chars + start, end - start);
        start = (end < len && chars[end] == '\n') ? end + 1 : end;
    } while (start < len);
}

// =============================================================================
// RENDERING
// =============================================================================

void DocumentWindow::draw_outline(Display& display) const {
    ColorCode color = active ? Palette::inverse() : Palette::normal();
    for (int col = col0 - 1; col <= col0 + LineBuffer::WIDTH; col++) {
        display.plot('*', col, row0 - 1, color);
        display.plot('*', col, row0 + LineBuffer::HEIGHT, color);
    }
    for (int row = row0 - 1; row <= row0 + LineBuffer::HEIGHT; row++) {
        display.plot('*', col0 - 1, row, color);
        display.plot('*', col0 + LineBuffer::WIDTH, row, color);
    }

    char label[4];
    k_snprintf(label, sizeof(label), "F%d", index + 1);
    plot_str(display, label, config::WINDOW_LABEL_COL[index], config::WINDOW_LABEL_ROW[index], Palette::normal());
}

void DocumentWindow::draw_listing(Display& display) const {
    DirectoryListing listing;
    fs.list_directory(listing);
    for (int i = 0; i < listing.count; i++) {
        int col = col0 + (i % config::LISTING_COLUMNS) * config::LISTING_COL_WIDTH;
        int row = row0 + i / config::LISTING_COLUMNS;
        if (row >= row0 + LineBuffer::HEIGHT) break;
        ColorCode color = i == active_file ? Palette::inverse() : Palette::normal();
        plot_str(display, listing.names[i], col, row, color);
    }
}

void DocumentWindow::draw_rows(Display& display, int first, int last) const {
    for (int r = first; r <= last; r++) {
        plot_str_n(display, buffer_.row_data(r), buffer_.line_length(r), col0, row0 + r, Palette::normal());
    }
}

void DocumentWindow::draw_cursor(Display& display) const {
    int col = buffer_.cursor_position();
    if (col >= LineBuffer::WIDTH) col = LineBuffer::WIDTH - 1;
    display.plot(' ', col0 + col, row0 + buffer_.current_row(), Palette::cursor());
}

void DocumentWindow::render(Display& display) const {
    draw_outline(display);
    for (int r = 0; r < LineBuffer::HEIGHT; r++) fill_row(display, col0, row0 + r, LineBuffer::WIDTH, Palette::blank());

    switch (status_) {
        case WINDOW_DISPLAYING_FILES:
            draw_listing(display);
            break;
        case WINDOW_EDITING_FILE:
            draw_rows(display, 0, LineBuffer::HEIGHT - 1);
            if (active) draw_cursor(display);
            break;
        case WINDOW_EXECUTING_FILE:
        case WINDOW_DISPLAYING_OUTPUT:
            draw_rows(display, 0, config::OUTPUT_ROWS - 1);
            break;
        case WINDOW_AWAITING_INPUT:
            draw_rows(display, 0, config::INPUT_ROW);
            if (active) draw_cursor(display);
            break;
    }
}

}
