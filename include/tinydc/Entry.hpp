#ifndef TINYDC_ENTRY_HPP
#define TINYDC_ENTRY_HPP

#include <optional>
#include <string>

// One row of the browser list. score is only set for frecent entries.
struct Entry {
    std::string display_name;
    std::string path;
    std::optional<double> score;
};

enum class Category {
    Frecent,
    Children
};

#endif // TINYDC_ENTRY_HPP
