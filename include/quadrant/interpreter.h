#ifndef QUADRANT_INTERPRETER_H
#define QUADRANT_INTERPRETER_H

#include <cstdint>

#include "quadrant/config.h"

namespace quadrant {

enum TickStatus { TICK_CONTINUING, TICK_FINISHED, TICK_AWAIT_INPUT };

// Receives one call per print. Input prompts are printed through it too.
class InterpreterOutput {
public:
    virtual ~InterpreterOutput() {}
    virtual void print(const char* chars, int len) = 0;
};

enum ValueType { VAL_INT, VAL_FLOAT, VAL_BOOL, VAL_STRING };

struct Value {
    ValueType type;
    int64_t   i;
    double    f;
    bool      b;
    char      s[config::MAX_STRING_CHARS + 1];

    static Value make_int(int64_t v);
    static Value make_float(double v);
    static Value make_bool(bool v);
    static Value make_string(const char* text, int len);

    // Input lines become numbers when they parse as one.
    static Value from_input(const char* line);

    bool is_number() const { return type == VAL_INT || type == VAL_FLOAT; }
    double as_double() const { return type == VAL_INT ? (double)i : f; }
    int format(char* out, int cap) const;
};

const char* value_type_name(ValueType type);

// Compiled form of a source text: bytecode, constant pool and variable names.
struct Program {
    uint8_t code[config::MAX_CODE_BYTES];
    int     code_len;
    Value   constants[config::MAX_CONSTANTS];
    int     const_count;
    char    var_names[config::MAX_LOCAL_VARS][config::MAX_LITERAL_CHARS + 1];
    int     var_count;

    void reset();
    bool emit1(uint8_t byte);
    bool emit2(int value);
    void patch2(int at, int value);
    int  add_constant(const Value& v);
    int  find_var(const char* name) const;
    int  add_var(const char* name);
};

// Statement language interpreter. Nothing is allocated: the program is
// compiled into fixed arrays when loaded and every tick runs one
// statement-level step (assignment, print, input request or branch test).
class Interpreter {
public:
    static constexpr int ERROR_CHARS = 48;

    Interpreter();
    explicit Interpreter(const char* source);

    // Compiles the source and resets all run state. A compile error is
    // kept and reported by the first tick.
    void load(const char* source);

    TickStatus tick(InterpreterOutput& out);

    // Completes a pending input(...) and resumes on the next tick.
    void provide_input(const char* line);

    bool awaiting_input() const { return state == STATE_AWAITING_INPUT; }
    bool finished() const { return state == STATE_FINISHED; }
    bool has_error() const { return error[0] != '\0'; }
    const char* error_message() const { return error; }

private:
    enum State { STATE_RUNNING, STATE_AWAITING_INPUT, STATE_FINISHED, STATE_FAILED };

    Program program;
    Value   vars[config::MAX_LOCAL_VARS];
    bool    var_set[config::MAX_LOCAL_VARS];
    Value   stack[config::STACK_DEPTH];
    int     sp;
    int     pc;
    int     input_var;
    State   state;
    char    error[ERROR_CHARS];

    TickStatus fail(InterpreterOutput& out, const char* message);
    bool push(const Value& v);
    bool pop(Value& v);
    int  read2();
    bool binary(uint8_t op, const Value& a, const Value& b, Value& result);
};

}

#endif
