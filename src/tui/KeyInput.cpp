#include "tui/KeyInput.hpp"

#include <cctype>

Key TranslateKey(const ncinput& details) {
    const uint32_t id = details.id;

    switch (id) {
    case NCKEY_ENTER:
    case '\n':
    case '\r':
        return Key::Special(Key::Code::Enter);
    case NCKEY_ESC:
        return Key::Special(Key::Code::Escape);
    case NCKEY_BACKSPACE:
    case 0x7f:
    case 0x08:
        return Key::Special(Key::Code::Backspace);
    case NCKEY_UP:
        return Key::Special(Key::Code::Up);
    case NCKEY_DOWN:
        return Key::Special(Key::Code::Down);
    case NCKEY_LEFT:
        return Key::Special(Key::Code::Left);
    case NCKEY_RIGHT:
        return Key::Special(Key::Code::Right);
    case NCKEY_HOME:
        return Key::Special(Key::Code::Home);
    case NCKEY_END:
        return Key::Special(Key::Code::End);
    case NCKEY_PGUP:
        return Key::Special(Key::Code::PageUp);
    case NCKEY_PGDOWN:
        return Key::Special(Key::Code::PageDown);
    default:
        break;
    }

    if (nckey_synthesized_p(id)) {
        return Key::Special(Key::Code::Unknown);
    }

    // Terminals without modifier reporting deliver Ctrl+letter as a raw control byte.
    if (id >= 0x01 && id <= 0x1a && id != '\t') {
        return Key::Char(static_cast<char32_t>('a' + id - 1), true);
    }

    if (ncinput_ctrl_p(&details) && id < 0x80) {
        return Key::Char(static_cast<char32_t>(std::tolower(static_cast<int>(id))), true);
    }

    return Key::Char(static_cast<char32_t>(id));
}
