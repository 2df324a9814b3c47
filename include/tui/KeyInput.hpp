#ifndef TUI_KEYINPUT_HPP
#define TUI_KEYINPUT_HPP

#include <notcurses/notcurses.h>

#include "tinydc/Key.hpp"

// Maps a notcurses input event onto the navigator's key model.
Key TranslateKey(const ncinput& details);

#endif // TUI_KEYINPUT_HPP
