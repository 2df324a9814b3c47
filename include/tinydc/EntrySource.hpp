#ifndef TINYDC_ENTRYSOURCE_HPP
#define TINYDC_ENTRYSOURCE_HPP

#include <filesystem>
#include <string>
#include <vector>

#include "tinydc/Entry.hpp"

class FrecencyIndex;

// Entries for one browsing context. warning is non-empty when the listing degraded.
struct Listing {
    std::vector<Entry> entries;
    std::string warning;
};

// Capability the navigator calls to populate its list.
class EntrySource {
public:
    virtual ~EntrySource() = default;

    // Immediate subdirectories of path, sorted case-insensitively.
    virtual Listing Children(const std::filesystem::path& path) = 0;
    // Ranked frecent directories; limit 0 means all of them.
    virtual Listing Frecent(std::size_t limit) = 0;
};

// Lists the real filesystem and reads frecent entries from an index.
class FilesystemEntrySource : public EntrySource {
public:
    FilesystemEntrySource(const FrecencyIndex& index, bool show_hidden);

    Listing Children(const std::filesystem::path& path) override;
    Listing Frecent(std::size_t limit) override;

private:
    const FrecencyIndex& index_;
    bool show_hidden_;
};

// Case-insensitive name ordering, ties broken by byte order.
bool NameLess(const std::string& a, const std::string& b);

#endif // TINYDC_ENTRYSOURCE_HPP
