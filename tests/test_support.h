#ifndef QUADRANT_TEST_SUPPORT_H
#define QUADRANT_TEST_SUPPORT_H

#include <memory>
#include <string>
#include <vector>

#include "quadrant/display.h"
#include "quadrant/document_window.h"
#include "quadrant/filesystem.h"
#include "quadrant/interpreter.h"
#include "quadrant/keys.h"
#include "quadrant/scheduler.h"

namespace quadrant {
namespace test_support {

// Collects every print as one string.
class RecordingOutput : public InterpreterOutput {
public:
    std::vector<std::string> lines;

    void print(const char* chars, int len) override { lines.push_back(std::string(chars, len)); }
};

// Ticks until the program finishes or asks for input.
inline TickStatus run_until_blocked(Interpreter& interp, RecordingOutput& out, int max_ticks = 100000) {
    TickStatus status = TICK_CONTINUING;
    for (int i = 0; i < max_ticks && status == TICK_CONTINUING; i++) status = interp.tick(out);
    return status;
}

template <typename Target>
void type_text(Target& target, const char* text) {
    for (const char* p = text; *p; p++) target.key(KeyEvent::character(*p));
}

template <typename Target>
void press(Target& target, KeyCode code) {
    target.key(KeyEvent::raw(code));
}

inline std::string read_file(FileSystem& fs, const char* name) {
    int fd = fs.open_read(name);
    if (fd < 0) return std::string("<") + fs_strerror(fd) + ">";
    char buffer[config::MAX_FILE_BYTES];
    int n = fs.read(fd, buffer, sizeof(buffer));
    fs.close(fd);
    if (n < 0) return std::string("<") + fs_strerror(n) + ">";
    return std::string(buffer, n);
}

inline std::string row_text(const LineBuffer& buffer, int row) {
    char line[LineBuffer::WIDTH + 1];
    buffer.row_text(row, line, sizeof(line));
    return line;
}

inline std::string grid_text(const TextGrid& grid, int col, int row, int width) {
    char line[config::SCREEN_WIDTH + 1];
    grid.text_at(col, row, width, line, sizeof(line));
    return line;
}

// Highlights the named file in a window's listing.
inline bool highlight_file(DocumentWindow& window, const char* name) {
    DirectoryListing listing;
    window.storage().list_directory(listing);
    for (int i = 0; i < listing.count; i++) {
        if (std::string(listing.names[i]) == name) {
            for (int k = 0; k < listing.count; k++) window.key(KeyEvent::raw(KEY_ARROW_LEFT));
            for (int k = 0; k < i; k++) window.key(KeyEvent::raw(KEY_ARROW_RIGHT));
            return window.highlighted() == i;
        }
    }
    return false;
}

}
}

#endif
