#include "tinydc/EntrySource.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>

#include "tinydc/FrecencyIndex.hpp"

bool NameLess(const std::string& a, const std::string& b) {
    const bool folded_less = std::lexicographical_compare(
        a.begin(), a.end(), b.begin(), b.end(), [](unsigned char x, unsigned char y) {
            return std::tolower(x) < std::tolower(y);
        });
    if (folded_less) {
        return true;
    }
    const bool folded_greater = std::lexicographical_compare(
        b.begin(), b.end(), a.begin(), a.end(), [](unsigned char x, unsigned char y) {
            return std::tolower(x) < std::tolower(y);
        });
    if (folded_greater) {
        return false;
    }
    return a < b;
}

FilesystemEntrySource::FilesystemEntrySource(const FrecencyIndex& index, bool show_hidden)
    : index_(index),
      show_hidden_(show_hidden) {}

Listing FilesystemEntrySource::Children(const std::filesystem::path& path) {
    Listing listing;

    std::error_code ec;
    std::filesystem::directory_iterator it(path, ec);
    if (ec) {
        listing.warning = "Cannot list " + path.string() + ": " + ec.message();
        return listing;
    }

    const std::filesystem::directory_iterator end;
    while (it != end) {
        const std::filesystem::directory_entry& dirent = *it;
        const std::string name = dirent.path().filename().string();

        // is_directory follows symlinks, so links to directories are listed too.
        std::error_code type_ec;
        const bool is_dir = dirent.is_directory(type_ec);
        if (!type_ec && is_dir && (show_hidden_ || name.empty() || name[0] != '.')) {
            listing.entries.push_back(Entry{name, dirent.path().string(), std::nullopt});
        }

        it.increment(ec);
        if (ec) {
            // The directory vanished or became unreadable mid-listing; keep what we have.
            listing.warning = "Listing of " + path.string() + " interrupted: " + ec.message();
            break;
        }
    }

    std::sort(listing.entries.begin(), listing.entries.end(), [](const Entry& a, const Entry& b) {
        return NameLess(a.display_name, b.display_name);
    });
    return listing;
}

Listing FilesystemEntrySource::Frecent(std::size_t limit) {
    Listing listing;
    for (const RankedPath& ranked : index_.RankedList(limit)) {
        listing.entries.push_back(Entry{ranked.path, ranked.path, ranked.score});
    }
    return listing;
}
