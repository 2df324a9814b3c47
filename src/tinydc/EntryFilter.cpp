#include "tinydc/EntryFilter.hpp"

#include <algorithm>
#include <cctype>
#include <iterator>

std::size_t MatchPosition(const std::string& name, const std::string& query) {
    if (query.empty()) {
        return 0;
    }
    auto it = std::search(name.begin(), name.end(), query.begin(), query.end(), [](unsigned char a, unsigned char b) {
        return std::tolower(a) == std::tolower(b);
    });
    if (it == name.end()) {
        return std::string::npos;
    }
    return static_cast<std::size_t>(it - name.begin());
}

std::vector<Entry> ApplyFilter(const std::vector<Entry>& entries, const std::string& query) {
    if (query.empty()) {
        return entries;
    }
    std::vector<Entry> filtered;
    std::copy_if(entries.begin(), entries.end(), std::back_inserter(filtered), [&query](const Entry& entry) {
        return MatchPosition(entry.display_name, query) != std::string::npos;
    });
    return filtered;
}
