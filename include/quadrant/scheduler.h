#ifndef QUADRANT_SCHEDULER_H
#define QUADRANT_SCHEDULER_H

#include "quadrant/config.h"
#include "quadrant/display.h"
#include "quadrant/document_window.h"
#include "quadrant/file_modal.h"
#include "quadrant/keys.h"

namespace quadrant {

// Owns the four windows. The host calls key() for every decoded key and
// update() once per timer tick; both run to completion.
class Scheduler {
public:
    Scheduler();

    // Seeds every window and makes window 0 active.
    void init();

    void key(const KeyEvent& key);

    // Redraws everything and gives one runnable program one step.
    void update(Display& display);

    int  active_window() const { return active; }
    long cpu_ticks(int window) const;
    DocumentWindow& window(int i);
    const DocumentWindow& window(int i) const;
    const FileCreationModal& creation_modal() const { return modal; }

private:
    DocumentWindow    documents[config::NUM_WINDOWS];
    int               active;
    long              ticks[config::NUM_WINDOWS];
    int               rotation;
    FileCreationModal modal;
    char              save_buffer[config::MAX_FILE_BYTES + 1];

    void modal_key(const KeyEvent& key);
    void create_file();
    void select_window(int index);
    void close_active();
    void save_everywhere(const char* name, const char* data, int len);
    void refresh_active_flags();
    void run_next_program();

    void draw_task_manager(Display& display) const;
    void draw_status_line(Display& display) const;
};

}

#endif
