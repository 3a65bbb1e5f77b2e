#ifndef QUADRANT_FILE_MODAL_H
#define QUADRANT_FILE_MODAL_H

#include "quadrant/config.h"

namespace quadrant {

// Name entry state for the F5 dialog. While open it owns the keyboard; the
// scheduler does the actual creation.
class FileCreationModal {
public:
    static constexpr int MESSAGE_CHARS = 48;

    FileCreationModal();

    void open();
    void close();
    bool is_open() const { return active; }

    // Printable characters only, up to MAX_FILENAME_BYTES. Returns false when
    // the character was not taken.
    bool append(char c);
    void backspace();

    const char* name() const { return filename; }
    int  length() const { return filename_len; }

    void set_error(const char* message);
    void clear_error() { error[0] = '\0'; }
    const char* message() const { return error; }
    bool has_error() const { return error[0] != '\0'; }

private:
    bool active;
    char filename[config::MAX_FILENAME_BYTES + 1];
    int  filename_len;
    char error[MESSAGE_CHARS];
};

}

#endif
