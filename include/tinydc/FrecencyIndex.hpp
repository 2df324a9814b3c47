#ifndef TINYDC_FRECENCYINDEX_HPP
#define TINYDC_FRECENCYINDEX_HPP

#include <cstdint>
#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <vector>

// Visit statistics for one directory. last_visited is in seconds since the Unix epoch.
struct VisitRecord {
    std::string path;
    std::uint64_t visit_count;
    std::int64_t last_visited;
};

struct RankedPath {
    std::string path;
    double score;
};

// Persistent map from absolute directory path to visit statistics.
// Loaded once, mutated in memory and written back with an atomic replace on Flush().
class FrecencyIndex {
public:
    FrecencyIndex();
    explicit FrecencyIndex(std::filesystem::path file);

    // Reads the backing file. A missing file is an empty index. Returns false (and leaves the
    // index empty) only when the file exists but cannot be read.
    bool Load();

    // Writes the index to disk if it changed since the last load/flush. Returns false on I/O failure.
    bool Flush();

    // Returns false when the path does not exist, is not a directory or contains a line break;
    // the index is untouched.
    bool RecordVisit(const std::filesystem::path& path);
    bool RecordVisit(const std::filesystem::path& path, std::int64_t now);

    // Existing directories ordered by descending score, then recency, then path. limit 0 = all.
    std::vector<RankedPath> RankedList(std::size_t limit) const;
    std::vector<RankedPath> RankedList(std::size_t limit, std::int64_t now) const;

    // Highest ranked path containing query (case-insensitive); nullopt when nothing matches.
    std::optional<std::string> BestMatch(const std::string& query) const;
    std::optional<std::string> BestMatch(const std::string& query, std::int64_t now) const;

    // Drops records whose directory no longer exists. Returns the number removed.
    std::size_t RemoveStale();

    const VisitRecord* Find(const std::string& path) const;
    std::vector<VisitRecord> Records() const;
    std::size_t Size() const { return records_.size(); }
    bool Empty() const { return records_.empty(); }
    bool Dirty() const { return dirty_; }
    const std::filesystem::path& File() const { return file_; }

    static double Score(std::uint64_t visit_count, std::int64_t age_seconds);
    static std::int64_t Now();

    // Canonical absolute form used as the record key.
    static std::string Normalize(const std::filesystem::path& path);

    // "<path>|<visit_count>|<last_visited>"; ParseLine returns nullopt for malformed lines.
    static std::string FormatLine(const VisitRecord& record);
    static std::optional<VisitRecord> ParseLine(const std::string& line);

private:
    std::filesystem::path file_;
    std::map<std::string, VisitRecord> records_;
    bool dirty_;
};

#endif // TINYDC_FRECENCYINDEX_HPP
