#include "quadrant/program_slot.h"

#include "quadrant/klog.h"
#include "quadrant/kstring.h"

namespace quadrant {

ProgramSlot::ProgramSlot() : tag(SLOT_EMPTY), pending_len(-1) {
    pending[0] = '\0';
}

void ProgramSlot::start(const char* source) {
    interpreter.load(source);
    tag = SLOT_RUNNING;
    pending_len = -1;
    pending[0] = '\0';
}

void ProgramSlot::release() {
    tag = SLOT_EMPTY;
    pending_len = -1;
    pending[0] = '\0';
}

void ProgramSlot::queue_input(const char* line) {
    QUADRANT_ASSERT(tag == SLOT_RUNNING, "input queued on an empty program slot");
    QUADRANT_ASSERT(pending_len < 0, "pending input slot already full");
    pending_len = (int)k_strlcpy(pending, line, sizeof(pending));
}

TickStatus ProgramSlot::step(InterpreterOutput& out) {
    QUADRANT_ASSERT(tag == SLOT_RUNNING, "step on an empty program slot");
    if (pending_len >= 0) {
        interpreter.provide_input(pending);
        pending_len = -1;
        pending[0] = '\0';
        return TICK_CONTINUING;
    }
    return interpreter.tick(out);
}

const Interpreter& ProgramSlot::program() const {
    QUADRANT_ASSERT(tag == SLOT_RUNNING, "no program in slot");
    return interpreter;
}

}
