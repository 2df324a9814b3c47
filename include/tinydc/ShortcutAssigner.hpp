#ifndef TINYDC_SHORTCUTASSIGNER_HPP
#define TINYDC_SHORTCUTASSIGNER_HPP

#include <cstddef>
#include <string>
#include <vector>

// Keys offered as row shortcuts, most comfortable first. None of them is a navigation key.
extern const char kDefaultShortcutAlphabet[];

// Returns one label per visible row (index i labels row i).
// The first rows get single keys; once those run out the trailing alphabet keys turn into
// prefixes of two-key labels, so no label is a prefix of another. Rows past alphabet^2 get "".
std::vector<std::string> AssignShortcuts(std::size_t count, const std::string& alphabet = kDefaultShortcutAlphabet);

// Index of label in labels, or npos.
std::size_t FindShortcut(const std::vector<std::string>& labels, const std::string& typed);

// True when typed is a strict prefix of some label.
bool IsShortcutPrefix(const std::vector<std::string>& labels, const std::string& typed);

#endif // TINYDC_SHORTCUTASSIGNER_HPP
