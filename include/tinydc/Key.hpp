#ifndef TINYDC_KEY_HPP
#define TINYDC_KEY_HPP

// Terminal-independent key event handed to the navigator.
struct Key {
    enum class Code {
        Char,
        Enter,
        Escape,
        Backspace,
        Up,
        Down,
        Left,
        Right,
        Home,
        End,
        PageUp,
        PageDown,
        Unknown
    };

    Code code = Code::Unknown;
    char32_t ch = 0;   // only meaningful for Code::Char
    bool ctrl = false;

    static Key Char(char32_t c, bool with_ctrl = false) { return Key{Code::Char, c, with_ctrl}; }
    static Key Special(Code c) { return Key{c, 0, false}; }
};

#endif // TINYDC_KEY_HPP
