#include "quadrant/file_modal.h"

#include "quadrant/kstring.h"

namespace quadrant {

FileCreationModal::FileCreationModal() {
    close();
}

void FileCreationModal::open() {
    active = true;
    filename[0] = '\0';
    filename_len = 0;
    error[0] = '\0';
}

void FileCreationModal::close() {
    active = false;
    k_memset(filename, 0, sizeof(filename));
    filename_len = 0;
    error[0] = '\0';
}

bool FileCreationModal::append(char c) {
    if (!k_is_printable(c) || c == ' ') return false;
    if (filename_len >= config::MAX_FILENAME_BYTES) return false;
    filename[filename_len++] = c;
    filename[filename_len] = '\0';
    error[0] = '\0';
    return true;
}

void FileCreationModal::backspace() {
    if (filename_len == 0) return;
    filename[--filename_len] = '\0';
    error[0] = '\0';
}

void FileCreationModal::set_error(const char* message) {
    k_strlcpy(error, message, sizeof(error));
}

}
