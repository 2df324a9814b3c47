#include "tinydc/ShortcutAssigner.hpp"

#include <algorithm>

const char kDefaultShortcutAlphabet[] = "asdfwertzxcvbyuiopnm";

std::vector<std::string> AssignShortcuts(std::size_t count, const std::string& alphabet) {
    std::vector<std::string> labels;
    labels.reserve(count);
    const std::size_t keys = alphabet.size();
    if (count == 0 || keys == 0) {
        labels.resize(count);
        return labels;
    }

    // Smallest number of prefix keys that still covers every row.
    std::size_t prefixes = 0;
    while (prefixes < keys && (keys - prefixes) + prefixes * keys < count) {
        ++prefixes;
    }

    const std::size_t singles = keys - prefixes;
    for (std::size_t i = 0; i < singles && labels.size() < count; ++i) {
        labels.emplace_back(1, alphabet[i]);
    }
    for (std::size_t p = singles; p < keys && labels.size() < count; ++p) {
        for (std::size_t s = 0; s < keys && labels.size() < count; ++s) {
            std::string label;
            label += alphabet[p];
            label += alphabet[s];
            labels.push_back(label);
        }
    }
    labels.resize(count);
    return labels;
}

std::size_t FindShortcut(const std::vector<std::string>& labels, const std::string& typed) {
    if (typed.empty()) {
        return std::string::npos;
    }
    auto it = std::find(labels.begin(), labels.end(), typed);
    if (it == labels.end()) {
        return std::string::npos;
    }
    return static_cast<std::size_t>(it - labels.begin());
}

bool IsShortcutPrefix(const std::vector<std::string>& labels, const std::string& typed) {
    return std::any_of(labels.begin(), labels.end(), [&typed](const std::string& label) {
        return label.size() > typed.size() && label.compare(0, typed.size(), typed) == 0;
    });
}
