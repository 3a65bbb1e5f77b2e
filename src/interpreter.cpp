#include "quadrant/interpreter.h"

#include "quadrant/klog.h"
#include "quadrant/kstring.h"

namespace quadrant {

// ============================================================
// Bytecode
// ============================================================
enum Op : uint8_t {
    OP_HALT = 0,
    OP_CONST,           // u16 constant index
    OP_LOAD,            // u8 variable
    OP_STORE,           // u8 variable
    OP_ADD, OP_SUB, OP_MUL, OP_DIV, OP_MOD,
    OP_EQ, OP_NE, OP_LT, OP_LE, OP_GT, OP_GE,
    OP_AND, OP_OR,
    OP_NOT, OP_NEG,
    OP_PRINT,
    OP_INPUT,           // u8 variable, prompt on the stack
    OP_JUMP,            // u16 target
    OP_JUMP_IF_FALSE    // u16 target
};

// Upper bound on ops per tick; every loop iteration contains a
// step-ending op, so this only guards against a malformed program.
static const int MAX_OPS_PER_TICK = 256;

// ============================================================
// Values
// ============================================================

Value Value::make_int(int64_t v) {
    Value r; k_memset(&r, 0, sizeof(r));
    r.type = VAL_INT; r.i = v;
    return r;
}

Value Value::make_float(double v) {
    Value r; k_memset(&r, 0, sizeof(r));
    r.type = VAL_FLOAT; r.f = v;
    return r;
}

Value Value::make_bool(bool v) {
    Value r; k_memset(&r, 0, sizeof(r));
    r.type = VAL_BOOL; r.b = v;
    return r;
}

Value Value::make_string(const char* text, int len) {
    Value r; k_memset(&r, 0, sizeof(r));
    r.type = VAL_STRING;
    if (len > config::MAX_STRING_CHARS) len = config::MAX_STRING_CHARS;
    for (int i = 0; i < len && text[i] != '\0'; i++) r.s[i] = text[i];
    return r;
}

Value Value::from_input(const char* line) {
    char trimmed[config::MAX_STRING_CHARS + 1];
    while (*line == ' ') line++;
    int n = (int)k_strlcpy(trimmed, line, sizeof(trimmed));
    while (n > 0 && trimmed[n - 1] == ' ') trimmed[--n] = '\0';

    int64_t iv;
    if (parse_int(trimmed, &iv)) return make_int(iv);
    double dv;
    if (parse_double(trimmed, &dv)) return make_float(dv);
    return make_string(trimmed, n);
}

int Value::format(char* out, int cap) const {
    switch (type) {
        case VAL_INT:    return int_to_string(i, out, cap);
        case VAL_FLOAT:  return double_to_string(f, out, cap);
        case VAL_BOOL:   return (int)k_strlcpy(out, b ? "true" : "false", cap);
        case VAL_STRING: return (int)k_strlcpy(out, s, cap);
    }
    return 0;
}

const char* value_type_name(ValueType type) {
    switch (type) {
        case VAL_INT:    return "int";
        case VAL_FLOAT:  return "float";
        case VAL_BOOL:   return "bool";
        case VAL_STRING: return "string";
    }
    return "?";
}

// ============================================================
// Program buffers
// ============================================================

void Program::reset() {
    code_len = 0;
    const_count = 0;
    var_count = 0;
}

bool Program::emit1(uint8_t byte) {
    if (code_len >= config::MAX_CODE_BYTES) return false;
    code[code_len++] = byte;
    return true;
}

bool Program::emit2(int value) {
    if (code_len + 2 > config::MAX_CODE_BYTES) return false;
    code[code_len++] = value & 0xff;
    code[code_len++] = (value >> 8) & 0xff;
    return true;
}

void Program::patch2(int at, int value) {
    if (at + 2 > config::MAX_CODE_BYTES) return;
    code[at] = value & 0xff;
    code[at + 1] = (value >> 8) & 0xff;
}

int Program::add_constant(const Value& v) {
    if (const_count >= config::MAX_CONSTANTS) return -1;
    constants[const_count] = v;
    return const_count++;
}

int Program::find_var(const char* name) const {
    for (int i = 0; i < var_count; i++) {
        if (k_strcmp(var_names[i], name) == 0) return i;
    }
    return -1;
}

int Program::add_var(const char* name) {
    int existing = find_var(name);
    if (existing >= 0) return existing;
    if (var_count >= config::MAX_LOCAL_VARS) return -1;
    k_strlcpy(var_names[var_count], name, sizeof(var_names[var_count]));
    return var_count++;
}

// ============================================================
// Tokenizer
// ============================================================
enum TokType { TOK_EOF, TOK_IDENT, TOK_KEYWORD, TOK_INT, TOK_FLOAT, TOK_STRING, TOK_OP, TOK_BAD };

struct Token {
    TokType type;
    char    text[config::MAX_LITERAL_CHARS + 1];
    int64_t ival;
    double  fval;
    bool    too_long;
};

struct Lexer {
    const char* src;
    int pos;

    void init(const char* s) { src = s; pos = 0; }

    void skip_ws() {
        for (;;) {
            char c = src[pos];
            if (k_is_space(c)) { pos++; continue; }
            if (c == '#') { while (src[pos] && src[pos] != '\n') pos++; continue; }
            break;
        }
    }

    static void put(Token& t, int& n, char c) {
        if (n < config::MAX_LITERAL_CHARS) t.text[n++] = c;
        else t.too_long = true;
    }

    Token number() {
        Token t; k_memset(&t, 0, sizeof(t)); t.type = TOK_INT;
        int n = 0;
        while (k_is_digit(src[pos])) put(t, n, src[pos++]);
        if (src[pos] == '.' && k_is_digit(src[pos + 1])) {
            t.type = TOK_FLOAT;
            put(t, n, src[pos++]);
            while (k_is_digit(src[pos])) put(t, n, src[pos++]);
        }
        t.text[n] = '\0';
        if (t.type == TOK_INT) {
            if (!parse_int(t.text, &t.ival)) t.too_long = true;
        } else {
            parse_double(t.text, &t.fval);
        }
        return t;
    }

    Token ident() {
        Token t; k_memset(&t, 0, sizeof(t)); t.type = TOK_IDENT;
        int n = 0;
        while (k_is_alnum(src[pos])) put(t, n, src[pos++]);
        t.text[n] = '\0';
        const char* kw[] = { "print", "input", "while", "if", "else", "true", "false", "not", "and", "or", 0 };
        for (int k = 0; kw[k]; ++k) { if (k_strcmp(t.text, kw[k]) == 0) { t.type = TOK_KEYWORD; break; } }
        return t;
    }

    Token string() {
        Token t; k_memset(&t, 0, sizeof(t)); t.type = TOK_STRING;
        int n = 0;
        pos++;
        while (src[pos] && src[pos] != '"' && src[pos] != '\n') put(t, n, src[pos++]);
        t.text[n] = '\0';
        if (src[pos] == '"') pos++;
        else t.type = TOK_BAD;
        return t;
    }

    Token op() {
        Token t; k_memset(&t, 0, sizeof(t)); t.type = TOK_OP;
        char c = src[pos];
        char d = src[pos + 1];
        if ((c == ':' || c == '=' || c == '!' || c == '<' || c == '>') && d == '=') {
            t.text[0] = c; t.text[1] = '='; pos += 2;
            return t;
        }
        t.text[0] = c;
        pos++;
        const char* singles = "+-*/%<>(){}";
        for (int i = 0; singles[i]; i++) { if (singles[i] == c) return t; }
        t.type = TOK_BAD;
        return t;
    }

    Token next() {
        skip_ws();
        if (src[pos] == 0) { Token t; k_memset(&t, 0, sizeof(t)); t.type = TOK_EOF; return t; }
        if (src[pos] == '"') return string();
        if (k_is_digit(src[pos])) return number();
        if (k_is_alpha(src[pos])) return ident();
        return op();
    }
};

// ============================================================
// Parser / Compiler
// ============================================================
struct Compiler {
    Lexer    lx;
    Token    tk;
    Program* pr;
    char*    error;
    int      tokens;
    int      depth;

    bool failed() const { return error[0] != '\0'; }

    void fail(const char* fmt, const char* detail) {
        if (failed()) return;
        k_snprintf(error, Interpreter::ERROR_CHARS, fmt, detail);
    }

    void adv() {
        if (failed()) return;
        tk = lx.next();
        if (tk.type != TOK_EOF && ++tokens > config::MAX_TOKENS) fail("program too long%s", "");
        if (tk.too_long) fail("literal too long: %s", tk.text);
        if (tk.type == TOK_BAD) fail("bad token '%s'", tk.text);
    }

    bool is(const char* s) const {
        return (tk.type == TOK_OP || tk.type == TOK_KEYWORD) && k_strcmp(tk.text, s) == 0;
    }

    bool accept(const char* s) { if (is(s)) { adv(); return true; } return false; }

    void expect(const char* s) {
        if (!accept(s)) fail("expected %s", s);
    }

    void emit(uint8_t op) { if (!pr->emit1(op)) fail("program too long%s", ""); }
    void emit_arg(int v)  { if (!pr->emit2(v)) fail("program too long%s", ""); }

    void emit_const(const Value& v) {
        int idx = pr->add_constant(v);
        if (idx < 0) { fail("too many constants%s", ""); return; }
        emit(OP_CONST);
        emit_arg(idx);
    }

    int var_index(const char* name) {
        int idx = pr->add_var(name);
        if (idx < 0) fail("too many variables at %s", name);
        return idx;
    }

    void enter() { if (++depth > config::STACK_DEPTH) fail("nesting too deep%s", ""); }
    void leave() { depth--; }

    // --- Expressions ---

    void primary() {
        if (failed()) return;
        if (tk.type == TOK_INT)    { emit_const(Value::make_int(tk.ival)); adv(); return; }
        if (tk.type == TOK_FLOAT)  { emit_const(Value::make_float(tk.fval)); adv(); return; }
        if (tk.type == TOK_STRING) { emit_const(Value::make_string(tk.text, (int)k_strlen(tk.text))); adv(); return; }
        if (is("true"))  { emit_const(Value::make_bool(true)); adv(); return; }
        if (is("false")) { emit_const(Value::make_bool(false)); adv(); return; }
        if (tk.type == TOK_IDENT) {
            int idx = var_index(tk.text);
            emit(OP_LOAD);
            emit((uint8_t)idx);
            adv();
            return;
        }
        if (accept("(")) {
            enter();
            expression();
            leave();
            expect(")");
            return;
        }
        if (is("input")) { fail("input must be assigned to a variable%s", ""); return; }
        if (tk.type == TOK_EOF) { fail("unexpected end of program%s", ""); return; }
        fail("unexpected '%s'", tk.text);
    }

    void unary() {
        if (failed()) return;
        if (accept("not")) { enter(); unary(); leave(); emit(OP_NOT); return; }
        if (accept("-"))   { enter(); unary(); leave(); emit(OP_NEG); return; }
        primary();
    }

    void multiplicative() {
        unary();
        while (!failed()) {
            uint8_t op;
            if (is("*")) op = OP_MUL;
            else if (is("/")) op = OP_DIV;
            else if (is("%")) op = OP_MOD;
            else break;
            adv();
            unary();
            emit(op);
        }
    }

    void additive() {
        multiplicative();
        while (!failed()) {
            uint8_t op;
            if (is("+")) op = OP_ADD;
            else if (is("-")) op = OP_SUB;
            else break;
            adv();
            multiplicative();
            emit(op);
        }
    }

    void comparison() {
        additive();
        if (failed()) return;
        uint8_t op;
        if (is("==")) op = OP_EQ;
        else if (is("!=")) op = OP_NE;
        else if (is("<"))  op = OP_LT;
        else if (is("<=")) op = OP_LE;
        else if (is(">"))  op = OP_GT;
        else if (is(">=")) op = OP_GE;
        else return;
        adv();
        additive();
        emit(op);
    }

    void conjunction() {
        comparison();
        while (!failed() && accept("and")) { comparison(); emit(OP_AND); }
    }

    void expression() {
        conjunction();
        while (!failed() && accept("or")) { conjunction(); emit(OP_OR); }
    }

    // --- Statements ---

    void block() {
        expect("{");
        enter();
        while (!failed() && !is("}") && tk.type != TOK_EOF) statement();
        leave();
        expect("}");
    }

    void if_statement() {
        expression();
        emit(OP_JUMP_IF_FALSE);
        int skip_then = pr->code_len;
        emit_arg(0);
        block();
        if (accept("else")) {
            emit(OP_JUMP);
            int skip_else = pr->code_len;
            emit_arg(0);
            pr->patch2(skip_then, pr->code_len);
            if (accept("if")) {
                enter();
                if_statement();
                leave();
            } else {
                block();
            }
            pr->patch2(skip_else, pr->code_len);
        } else {
            pr->patch2(skip_then, pr->code_len);
        }
    }

    void statement() {
        if (failed()) return;
        if (accept("print")) {
            expect("(");
            expression();
            expect(")");
            emit(OP_PRINT);
            return;
        }
        if (accept("while")) {
            int top = pr->code_len;
            expression();
            emit(OP_JUMP_IF_FALSE);
            int exit_at = pr->code_len;
            emit_arg(0);
            block();
            emit(OP_JUMP);
            emit_arg(top);
            pr->patch2(exit_at, pr->code_len);
            return;
        }
        if (accept("if")) {
            if_statement();
            return;
        }
        if (tk.type == TOK_IDENT) {
            char name[config::MAX_LITERAL_CHARS + 1];
            k_strlcpy(name, tk.text, sizeof(name));
            int idx = var_index(name);
            adv();
            expect(":=");
            if (accept("input")) {
                expect("(");
                expression();
                expect(")");
                emit(OP_INPUT);
                emit((uint8_t)idx);
            } else {
                expression();
                emit(OP_STORE);
                emit((uint8_t)idx);
            }
            return;
        }
        if (tk.type == TOK_EOF) { fail("unexpected end of program%s", ""); return; }
        fail("unexpected '%s'", tk.text);
    }

    void compile(const char* source) {
        lx.init(source);
        tokens = 0;
        depth = 0;
        adv();
        while (!failed() && tk.type != TOK_EOF) statement();
        emit(OP_HALT);
    }
};

// ============================================================
// Interpreter
// ============================================================

Interpreter::Interpreter() {
    load("");
}

Interpreter::Interpreter(const char* source) {
    load(source);
}

void Interpreter::load(const char* source) {
    program.reset();
    k_memset(var_set, 0, sizeof(var_set));
    sp = 0;
    pc = 0;
    input_var = -1;
    error[0] = '\0';

    Compiler c;
    c.pr = &program;
    c.error = error;
    c.compile(source);
    state = has_error() ? STATE_FAILED : STATE_RUNNING;
    if (has_error()) klog(LOG_WARN, "interp: compile error: %s", error);
}

TickStatus Interpreter::fail(InterpreterOutput& out, const char* message) {
    if (message != error) k_strlcpy(error, message, sizeof(error));
    char line[ERROR_CHARS + 8];
    int n = k_snprintf(line, sizeof(line), "Error: %s", error);
    out.print(line, n);
    state = STATE_FINISHED;
    return TICK_FINISHED;
}

bool Interpreter::push(const Value& v) {
    if (sp >= config::STACK_DEPTH) {
        k_strlcpy(error, "stack overflow", sizeof(error));
        return false;
    }
    stack[sp++] = v;
    return true;
}

bool Interpreter::pop(Value& v) {
    QUADRANT_ASSERT(sp > 0, "interpreter stack underflow");
    v = stack[--sp];
    return true;
}

int Interpreter::read2() {
    int v = program.code[pc] | (program.code[pc + 1] << 8);
    pc += 2;
    return v;
}

static int64_t wrap_add(int64_t a, int64_t b) { return (int64_t)((uint64_t)a + (uint64_t)b); }
static int64_t wrap_sub(int64_t a, int64_t b) { return (int64_t)((uint64_t)a - (uint64_t)b); }
static int64_t wrap_mul(int64_t a, int64_t b) { return (int64_t)((uint64_t)a * (uint64_t)b); }

bool Interpreter::binary(uint8_t op, const Value& a, const Value& b, Value& result) {
    bool both_int = a.type == VAL_INT && b.type == VAL_INT;
    bool numeric = a.is_number() && b.is_number();

    switch (op) {
        case OP_ADD:
            if (a.type == VAL_STRING && b.type == VAL_STRING) {
                char joined[2 * config::MAX_STRING_CHARS + 1];
                int n = (int)k_strlcpy(joined, a.s, sizeof(joined));
                k_strlcpy(joined + n, b.s, sizeof(joined) - n);
                result = Value::make_string(joined, (int)k_strlen(joined));
                return true;
            }
            // fall through
        case OP_SUB:
        case OP_MUL:
            if (!numeric) break;
            if (both_int) {
                result = Value::make_int(op == OP_ADD ? wrap_add(a.i, b.i)
                                       : op == OP_SUB ? wrap_sub(a.i, b.i) : wrap_mul(a.i, b.i));
            } else {
                double x = a.as_double(), y = b.as_double();
                result = Value::make_float(op == OP_ADD ? x + y : op == OP_SUB ? x - y : x * y);
            }
            return true;
        case OP_DIV:
            if (!numeric) break;
            if (both_int) {
                if (b.i == 0) { k_strlcpy(error, "division by zero", sizeof(error)); return false; }
                result = Value::make_int(b.i == -1 ? wrap_sub(0, a.i) : a.i / b.i);
            } else {
                if (b.as_double() == 0.0) { k_strlcpy(error, "division by zero", sizeof(error)); return false; }
                result = Value::make_float(a.as_double() / b.as_double());
            }
            return true;
        case OP_MOD:
            if (!both_int) break;
            if (b.i == 0) { k_strlcpy(error, "division by zero", sizeof(error)); return false; }
            result = Value::make_int(b.i == -1 ? 0 : a.i % b.i);
            return true;
        case OP_EQ:
        case OP_NE: {
            bool equal;
            if (numeric) equal = both_int ? a.i == b.i : a.as_double() == b.as_double();
            else if (a.type != b.type) equal = false;
            else if (a.type == VAL_BOOL) equal = a.b == b.b;
            else equal = k_strcmp(a.s, b.s) == 0;
            result = Value::make_bool(op == OP_EQ ? equal : !equal);
            return true;
        }
        case OP_LT:
        case OP_LE:
        case OP_GT:
        case OP_GE: {
            int cmp;
            if (numeric) {
                if (both_int) cmp = a.i < b.i ? -1 : (a.i > b.i ? 1 : 0);
                else cmp = a.as_double() < b.as_double() ? -1 : (a.as_double() > b.as_double() ? 1 : 0);
            } else if (a.type == VAL_STRING && b.type == VAL_STRING) {
                cmp = k_strcmp(a.s, b.s);
            } else {
                break;
            }
            bool r = op == OP_LT ? cmp < 0 : op == OP_LE ? cmp <= 0 : op == OP_GT ? cmp > 0 : cmp >= 0;
            result = Value::make_bool(r);
            return true;
        }
        case OP_AND:
        case OP_OR:
            if (a.type != VAL_BOOL || b.type != VAL_BOOL) break;
            result = Value::make_bool(op == OP_AND ? (a.b && b.b) : (a.b || b.b));
            return true;
    }
    k_snprintf(error, sizeof(error), "type mismatch: %s and %s", value_type_name(a.type), value_type_name(b.type));
    return false;
}

TickStatus Interpreter::tick(InterpreterOutput& out) {
    switch (state) {
        case STATE_FINISHED:       return TICK_FINISHED;
        case STATE_AWAITING_INPUT: return TICK_AWAIT_INPUT;
        case STATE_FAILED:         return fail(out, error);
        case STATE_RUNNING:        break;
    }

    for (int budget = 0; budget < MAX_OPS_PER_TICK; budget++) {
        QUADRANT_ASSERT(pc < program.code_len, "interpreter ran past the program");
        uint8_t op = program.code[pc++];
        Value a, b, r;
        switch (op) {
            case OP_HALT:
                pc--;
                state = STATE_FINISHED;
                return TICK_FINISHED;

            case OP_CONST:
                if (!push(program.constants[read2()])) return fail(out, error);
                break;

            case OP_LOAD: {
                int idx = program.code[pc++];
                if (!var_set[idx]) {
                    char msg[ERROR_CHARS];
                    k_snprintf(msg, sizeof(msg), "undefined variable %s", program.var_names[idx]);
                    return fail(out, msg);
                }
                if (!push(vars[idx])) return fail(out, error);
                break;
            }

            case OP_STORE: {
                int idx = program.code[pc++];
                pop(vars[idx]);
                var_set[idx] = true;
                return TICK_CONTINUING;
            }

            case OP_ADD: case OP_SUB: case OP_MUL: case OP_DIV: case OP_MOD:
            case OP_EQ: case OP_NE: case OP_LT: case OP_LE: case OP_GT: case OP_GE:
            case OP_AND: case OP_OR:
                pop(b);
                pop(a);
                if (!binary(op, a, b, r)) return fail(out, error);
                push(r);
                break;

            case OP_NOT:
                pop(a);
                if (a.type != VAL_BOOL) return fail(out, "not needs true or false");
                push(Value::make_bool(!a.b));
                break;

            case OP_NEG:
                pop(a);
                if (a.type == VAL_INT) push(Value::make_int(wrap_sub(0, a.i)));
                else if (a.type == VAL_FLOAT) push(Value::make_float(-a.f));
                else return fail(out, "cannot negate a non-number");
                break;

            case OP_PRINT: {
                pop(a);
                char text[config::MAX_STRING_CHARS + 1];
                int n = a.format(text, sizeof(text));
                out.print(text, n);
                return TICK_CONTINUING;
            }

            case OP_INPUT: {
                input_var = program.code[pc++];
                pop(a);
                char prompt[config::MAX_STRING_CHARS + 1];
                int n = a.format(prompt, sizeof(prompt));
                if (n > 0) out.print(prompt, n);
                state = STATE_AWAITING_INPUT;
                return TICK_AWAIT_INPUT;
            }

            case OP_JUMP:
                pc = read2();
                break;

            case OP_JUMP_IF_FALSE: {
                int target = read2();
                pop(a);
                if (a.type != VAL_BOOL) return fail(out, "condition must be true or false");
                if (!a.b) pc = target;
                return TICK_CONTINUING;
            }

            default:
                QUADRANT_ASSERT(false, "bad opcode");
        }
    }
    return TICK_CONTINUING;
}

void Interpreter::provide_input(const char* line) {
    if (state != STATE_AWAITING_INPUT) return;
    vars[input_var] = Value::from_input(line);
    var_set[input_var] = true;
    input_var = -1;
    state = STATE_RUNNING;
}

}
