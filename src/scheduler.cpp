#include "quadrant/scheduler.h"

#include "quadrant/klog.h"
#include "quadrant/kstring.h"

namespace quadrant {

Scheduler::Scheduler() : active(0), rotation(0) {
    for (int i = 0; i < config::NUM_WINDOWS; i++) ticks[i] = 0;
    save_buffer[0] = '\0';
}

void Scheduler::init() {
    for (int i = 0; i < config::NUM_WINDOWS; i++) {
        documents[i].init(i);
        ticks[i] = 0;
    }
    active = 0;
    rotation = 0;
    modal.close();
    refresh_active_flags();
    klog(LOG_INFO, "scheduler: %d windows ready", config::NUM_WINDOWS);
}

DocumentWindow& Scheduler::window(int i) {
    QUADRANT_ASSERT(i >= 0 && i < config::NUM_WINDOWS, "window index out of range");
    return documents[i];
}

const DocumentWindow& Scheduler::window(int i) const {
    QUADRANT_ASSERT(i >= 0 && i < config::NUM_WINDOWS, "window index out of range");
    return documents[i];
}

long Scheduler::cpu_ticks(int i) const {
    QUADRANT_ASSERT(i >= 0 && i < config::NUM_WINDOWS, "window index out of range");
    return ticks[i];
}

// =============================================================================
// KEYBOARD ROUTING
// =============================================================================

void Scheduler::key(const KeyEvent& key) {
    // The open dialog takes every key before any window sees it.
    if (modal.is_open()) {
        modal_key(key);
        return;
    }

    if (!key.is_char) {
        switch (key.code) {
            case KEY_F1: select_window(0); return;
            case KEY_F2: select_window(1); return;
            case KEY_F3: select_window(2); return;
            case KEY_F4: select_window(3); return;
            case KEY_F5:
                modal.open();
                refresh_active_flags();
                return;
            case KEY_F6:
                close_active();
                return;
            default:
                break;
        }
    }
    documents[active].key(key);
}

void Scheduler::modal_key(const KeyEvent& key) {
    if (key.is(KEY_ESCAPE)) {
        modal.close();
        refresh_active_flags();
        return;
    }
    if (!key.is_char) return;
    if (key.ch == '\n') create_file();
    else if (key.ch == '\b') modal.backspace();
    else modal.append(key.ch);
}

// Every window's storage is checked before any is touched, so a refusal
// leaves all of them as they were.
void Scheduler::create_file() {
    const char* name = modal.name();
    if (modal.length() == 0) return;

    for (int i = 0; i < config::NUM_WINDOWS; i++) {
        const FileSystem& fs = documents[i].storage();
        const char* reason = 0;
        if (fs.exists(name)) {
            reason = "file exists";
        } else {
            int status = fs.can_create(name);
            if (status != FS_OK) reason = fs_strerror(status);
        }
        if (!reason) continue;

        char message[FileCreationModal::MESSAGE_CHARS];
        k_snprintf(message, sizeof(message), "cannot create %s: %s", name, reason);
        modal.set_error(message);
        klog(LOG_WARN, "create %s refused by window %d: %s", name, i + 1, reason);
        return;
    }

    for (int i = 0; i < config::NUM_WINDOWS; i++) {
        int status = documents[i].store_file(name, "", 0);
        if (status < 0) {
            klog(LOG_ERROR, "create %s failed in window %d: %s", name, i + 1, fs_strerror(status));
            modal.set_error(fs_strerror(status));
            return;
        }
    }
    klog(LOG_INFO, "created %s in every window", name);
    modal.close();
    refresh_active_flags();
}

void Scheduler::select_window(int index) {
    active = index;
    refresh_active_flags();
}

void Scheduler::close_active() {
    DocumentWindow& doc = documents[active];
    bool save = doc.has_named_edit();
    char name[config::MAX_FILENAME_BYTES + 1];
    int len = 0;
    if (save) {
        k_strlcpy(name, doc.filename(), sizeof(name));
        len = doc.serialize(save_buffer, sizeof(save_buffer));
    }
    doc.close_to_directory();
    if (save) save_everywhere(name, save_buffer, len);
}

// As in create_file, every window must accept the save before any copy is
// replaced.
void Scheduler::save_everywhere(const char* name, const char* data, int len) {
    for (int i = 0; i < config::NUM_WINDOWS; i++) {
        int status = documents[i].storage().can_store(name, len);
        if (status == FS_OK) continue;

        klog(LOG_WARN, "save %s refused by window %d: %s", name, i + 1, fs_strerror(status));
        char message[DocumentWindow::NOTICE_CHARS];
        k_snprintf(message, sizeof(message), "save %s: F%d %s", name, i + 1, fs_strerror(status));
        documents[active].set_notice(message);
        return;
    }

    for (int i = 0; i < config::NUM_WINDOWS; i++) {
        int status = documents[i].store_file(name, data, len);
        if (status < 0) {
            klog(LOG_ERROR, "save %s failed in window %d: %s", name, i + 1, fs_strerror(status));
            char message[DocumentWindow::NOTICE_CHARS];
            k_snprintf(message, sizeof(message), "save %s: %s", name, fs_strerror(status));
            documents[active].set_notice(message);
            return;
        }
    }
    klog(LOG_INFO, "saved %s (%d bytes) to every window", name, len);
}

// =============================================================================
// CYCLE
// =============================================================================

void Scheduler::refresh_active_flags() {
    for (int i = 0; i < config::NUM_WINDOWS; i++) {
        documents[i].set_active(!modal.is_open() && i == active);
    }
}

void Scheduler::run_next_program() {
    int runnable[config::NUM_WINDOWS];
    int count = 0;
    for (int i = 0; i < config::NUM_WINDOWS; i++) {
        if (documents[i].is_runnable()) runnable[count++] = i;
    }
    if (count == 0) return;

    rotation %= count;
    int chosen = runnable[rotation];
    documents[chosen].run_tick();
    ticks[chosen]++;
    rotation++;
}

void Scheduler::update(Display& display) {
    refresh_active_flags();
    for (int i = 0; i < config::NUM_WINDOWS; i++) documents[i].render(display);
    run_next_program();
    draw_task_manager(display);
    draw_status_line(display);
}

void Scheduler::draw_task_manager(Display& display) const {
    for (int i = 0; i < config::NUM_WINDOWS; i++) {
        char label[4];
        k_snprintf(label, sizeof(label), "F%d", i + 1);
        int width = config::SCREEN_WIDTH - config::TASK_MANAGER_COL;
        fill_row(display, config::TASK_MANAGER_COL, 2 * i, width, Palette::normal());
        fill_row(display, config::TASK_MANAGER_COL, 2 * i + 1, width, Palette::normal());
        plot_str(display, label, config::TASK_MANAGER_COL, 2 * i, Palette::normal());
        plot_num(display, ticks[i], config::TASK_MANAGER_COL, 2 * i + 1, Palette::normal());
    }
}

void Scheduler::draw_status_line(Display& display) const {
    fill_row(display, 0, config::STATUS_ROW, config::SCREEN_WIDTH, Palette::normal());

    char line[config::SCREEN_WIDTH + 1];
    if (modal.is_open()) {
        if (modal.has_error()) {
            k_snprintf(line, sizeof(line), "New file: %s  %s", modal.name(), modal.message());
            plot_str(display, line, 0, config::STATUS_ROW, Palette::error());
        } else {
            k_snprintf(line, sizeof(line), "New file: %s", modal.name());
            plot_str(display, line, 0, config::STATUS_ROW, Palette::status());
        }
        return;
    }

    const char* notice = documents[active].notice();
    if (notice[0] != '\0') {
        k_snprintf(line, sizeof(line), "F%d: %s", active + 1, notice);
        plot_str(display, line, 0, config::STATUS_ROW, Palette::error());
    }
}

}
