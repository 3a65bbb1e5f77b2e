#ifndef QUADRANT_PROGRAM_SLOT_H
#define QUADRANT_PROGRAM_SLOT_H

#include "quadrant/config.h"
#include "quadrant/interpreter.h"

namespace quadrant {

// A window's single interpreter, stored in place. The slot is either empty
// or holds a running program plus at most one line of input waiting to be
// delivered on the next scheduled step.
class ProgramSlot {
public:
    ProgramSlot();

    void start(const char* source);
    void release();
    bool is_running() const { return tag == SLOT_RUNNING; }

    void queue_input(const char* line);
    bool has_pending_input() const { return pending_len >= 0; }

    // Delivers pending input if there is any, otherwise advances the program.
    TickStatus step(InterpreterOutput& out);

    const Interpreter& program() const;

private:
    enum Tag { SLOT_EMPTY, SLOT_RUNNING };

    Tag         tag;
    Interpreter interpreter;
    char        pending[config::WINDOW_WIDTH + 1];
    int         pending_len;
};

}

#endif
