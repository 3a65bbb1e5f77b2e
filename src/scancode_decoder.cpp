#include "quadrant/scancode_decoder.h"

namespace quadrant {

static const char sc_ascii_nomod_map[]={0,0,'1','2','3','4','5','6','7','8','9','0','-','=','\b','\t','q','w','e','r','t','y','u','i','o','p','[',']','\n',0,'a','s','d','f','g','h','j','k','l',';','\'','`',0,'\\','z','x','c','v','b','n','m',',','.','/',0,0,0,' ',0};
static const char sc_ascii_shift_map[]={0,0,'!','@','#','$','%','^','&','*','(',')','_','+','\b','\t','Q','W','E','R','T','Y','U','I','O','P','{','}','\n',0,'A','S','D','F','G','H','J','K','L',':','"','~',0,'|','Z','X','C','V','B','N','M','<','>','?',0,0,0,' ',0};
static const char sc_ascii_ctrl_map[]={0,0,0,0,0,0,0,0,0,0,0,0,0,0,'\b','\t','\x11',0,0,0,0,0,0,0,0,'\x10',0,0,'\n',0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,0,' ',0};

static const int MAP_SIZE = (int)sizeof(sc_ascii_nomod_map);

#define SC_EXTENDED_PREFIX 0xE0
#define SC_RELEASE_BIT     0x80
#define SC_ESCAPE          0x01
#define SC_LEFT_CTRL       0x1D
#define SC_LEFT_SHIFT      0x2A
#define SC_RIGHT_SHIFT     0x36
#define SC_F1              0x3B
#define SC_F6              0x40
#define SC_ARROW_UP        0x48
#define SC_ARROW_LEFT      0x4B
#define SC_ARROW_RIGHT     0x4D
#define SC_ARROW_DOWN      0x50

ScancodeDecoder::ScancodeDecoder() { reset(); }

void ScancodeDecoder::reset() {
    shift = false;
    ctrl = false;
    extended = false;
}

bool ScancodeDecoder::feed(uint8_t data, KeyEvent& out) {
    if (data == SC_EXTENDED_PREFIX) {
        extended = true;
        return false;
    }
    bool was_extended = extended;
    extended = false;

    bool is_press = !(data & SC_RELEASE_BIT);
    uint8_t scancode = data & 0x7F;
    if (scancode == 0) return false;

    if (scancode == SC_LEFT_SHIFT || scancode == SC_RIGHT_SHIFT) {
        // E0 2A / E0 36 are fake shifts sent around extended keys
        if (!was_extended) shift = is_press;
        return false;
    }
    if (scancode == SC_LEFT_CTRL) {
        ctrl = is_press;
        return false;
    }
    if (!is_press) return false;

    switch (scancode) {
        case SC_ARROW_UP:    out = KeyEvent::raw(KEY_ARROW_UP); return true;
        case SC_ARROW_DOWN:  out = KeyEvent::raw(KEY_ARROW_DOWN); return true;
        case SC_ARROW_LEFT:  out = KeyEvent::raw(KEY_ARROW_LEFT); return true;
        case SC_ARROW_RIGHT: out = KeyEvent::raw(KEY_ARROW_RIGHT); return true;
        case SC_ESCAPE:      out = KeyEvent::raw(KEY_ESCAPE); return true;
        default: break;
    }
    if (scancode >= SC_F1 && scancode <= SC_F6) {
        out = KeyEvent::raw((KeyCode)(KEY_F1 + (scancode - SC_F1)));
        return true;
    }
    if (was_extended) {
        out = KeyEvent::raw(KEY_OTHER);
        return true;
    }

    const char* map = ctrl ? sc_ascii_ctrl_map : (shift ? sc_ascii_shift_map : sc_ascii_nomod_map);
    if (scancode < MAP_SIZE && map[scancode] != 0) {
        out = KeyEvent::character(map[scancode]);
        return true;
    }
    out = KeyEvent::raw(KEY_OTHER);
    return true;
}

}
