#ifndef QUADRANT_KEYS_H
#define QUADRANT_KEYS_H

namespace quadrant {

// Non-character keys the workspace reacts to. Anything else decodes to
// KEY_OTHER and is ignored.
enum KeyCode {
    KEY_NONE = 0,
    KEY_F1, KEY_F2, KEY_F3, KEY_F4, KEY_F5, KEY_F6,
    KEY_ARROW_UP, KEY_ARROW_DOWN, KEY_ARROW_LEFT, KEY_ARROW_RIGHT,
    KEY_ESCAPE,
    KEY_OTHER
};

// A decoded key: either a character ('\n' for enter, '\b' for backspace)
// or a raw key code.
struct KeyEvent {
    bool    is_char;
    char    ch;
    KeyCode code;

    static KeyEvent character(char c) { KeyEvent k = { true, c, KEY_NONE }; return k; }
    static KeyEvent raw(KeyCode code) { KeyEvent k = { false, 0, code }; return k; }

    bool is(char c) const { return is_char && ch == c; }
    bool is(KeyCode k) const { return !is_char && code == k; }
};

}

#endif
