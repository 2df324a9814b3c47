#ifndef TINYDC_UTF8_HPP
#define TINYDC_UTF8_HPP

#include <cstddef>
#include <string>

// Byte level helpers for the UTF-8 text typed into the search line and drawn in the list.

void AppendUtf8(std::string& out, char32_t cp);

// Removes the last code point.
void PopUtf8(std::string& s);

std::size_t CodePointCount(const std::string& text);

// Keeps at most max_code_points code points, never cutting one in half.
std::string ClipUtf8(const std::string& text, std::size_t max_code_points);

#endif // TINYDC_UTF8_HPP
