#include "tinydc/FrecencyIndex.hpp"

#include <algorithm>
#include <cctype>
#include <cerrno>
#include <chrono>
#include <cstring>
#include <fstream>
#include <stdexcept>
#include <type_traits>
#include <iostream>
#include <utility>

#include <fcntl.h>
#include <unistd.h>

namespace {
// Hyperbolic age decay borrowed from rupa/z: a record loses half of its weight after ~3.5 hours.
constexpr double kAgeDecayPerSecond = 0.0001;
constexpr double kAgeOffset = 1.25;
constexpr double kScale = 10000.0 * 3.75;

std::string ToLower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

bool IsDirectory(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::is_directory(path, ec);
}

template <typename T>
bool ParseNumber(const std::string& text, T& out) {
    if (text.empty()) {
        return false;
    }
    try {
        std::size_t consumed = 0;
        if constexpr (std::is_signed_v<T>) {
            const long long value = std::stoll(text, &consumed);
            out = static_cast<T>(value);
        } else {
            if (text[0] == '-') {
                return false;
            }
            const unsigned long long value = std::stoull(text, &consumed);
            out = static_cast<T>(value);
        }
        return consumed == text.size();
    } catch (const std::invalid_argument&) {
        return false;
    } catch (const std::out_of_range&) {
        return false;
    }
}

// Flushes a closed file to stable storage before it is renamed over the live index.
bool SyncFile(const std::filesystem::path& path) {
    const int fd = ::open(path.c_str(), O_RDONLY);
    if (fd < 0) {
        return false;
    }
    const bool ok = ::fsync(fd) == 0;
    ::close(fd);
    return ok;
}
}

FrecencyIndex::FrecencyIndex() : dirty_(false) {}

FrecencyIndex::FrecencyIndex(std::filesystem::path file) : file_(std::move(file)), dirty_(false) {}

bool FrecencyIndex::Load() {
    records_.clear();
    dirty_ = false;
    if (file_.empty()) {
        return true;
    }

    std::error_code ec;
    if (!std::filesystem::exists(file_, ec)) {
        if (ec) {
            std::cerr << "Warning: could not access index " << file_ << ": " << ec.message() << "; starting empty.\n";
            return false;
        }
        return true;
    }

    std::ifstream in(file_);
    if (!in.is_open()) {
        std::cerr << "Warning: could not read index " << file_ << "; starting empty.\n";
        return false;
    }

    std::string line;
    while (std::getline(in, line)) {
        std::optional<VisitRecord> record = ParseLine(line);
        if (!record) {
            continue;
        }
        records_[record->path] = *record;
    }
    if (in.bad()) {
        std::cerr << "Warning: error while reading index " << file_ << "; starting empty.\n";
        records_.clear();
        return false;
    }
    return true;
}

bool FrecencyIndex::Flush() {
    if (!dirty_ || file_.empty()) {
        return true;
    }

    std::error_code ec;
    const std::filesystem::path parent = file_.parent_path();
    if (!parent.empty()) {
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            std::cerr << "Warning: could not create " << parent << ": " << ec.message() << "\n";
            return false;
        }
    }

    // Unique per process so concurrent shells never write into the same temporary file.
    std::filesystem::path tmp = file_;
    tmp += ".tmp." + std::to_string(::getpid());

    {
        std::ofstream out(tmp, std::ios::trunc);
        if (!out.is_open()) {
            std::cerr << "Warning: could not open " << tmp << " for writing: " << std::strerror(errno) << "\n";
            return false;
        }
        for (const auto& kv : records_) {
            out << FormatLine(kv.second) << "\n";
        }
        out.flush();
        if (!out.good()) {
            std::cerr << "Warning: failed to write index to " << tmp << "\n";
            out.close();
            std::filesystem::remove(tmp, ec);
            return false;
        }
    }

    if (!SyncFile(tmp)) {
        std::cerr << "Warning: could not sync " << tmp << "\n";
    }

    std::filesystem::rename(tmp, file_, ec);
    if (ec) {
        std::cerr << "Warning: could not replace index " << file_ << ": " << ec.message() << "\n";
        std::error_code ignored;
        std::filesystem::remove(tmp, ignored);
        return false;
    }

    dirty_ = false;
    return true;
}

bool FrecencyIndex::RecordVisit(const std::filesystem::path& path) {
    return RecordVisit(path, Now());
}

bool FrecencyIndex::RecordVisit(const std::filesystem::path& path, std::int64_t now) {
    if (path.empty() || !IsDirectory(path)) {
        return false;
    }
    const std::string key = Normalize(path);
    // One record per line in the index file.
    if (key.find_first_of("\r\n") != std::string::npos) {
        return false;
    }

    auto it = records_.find(key);
    if (it != records_.end()) {
        ++it->second.visit_count;
        it->second.last_visited = now;
    } else {
        records_.emplace(key, VisitRecord{key, 1, now});
    }
    dirty_ = true;
    return true;
}

std::vector<RankedPath> FrecencyIndex::RankedList(std::size_t limit) const {
    return RankedList(limit, Now());
}

std::vector<RankedPath> FrecencyIndex::RankedList(std::size_t limit, std::int64_t now) const {
    struct Candidate {
        const VisitRecord* record;
        double score;
    };

    std::vector<Candidate> candidates;
    candidates.reserve(records_.size());
    for (const auto& kv : records_) {
        // Missing paths are hidden, not erased: they may live on an unmounted volume.
        if (!IsDirectory(kv.first)) {
            continue;
        }
        candidates.push_back(Candidate{&kv.second, Score(kv.second.visit_count, now - kv.second.last_visited)});
    }

    std::sort(candidates.begin(), candidates.end(), [](const Candidate& a, const Candidate& b) {
        if (a.score != b.score) {
            return a.score > b.score;
        }
        if (a.record->last_visited != b.record->last_visited) {
            return a.record->last_visited > b.record->last_visited;
        }
        return a.record->path < b.record->path;
    });

    if (limit != 0 && candidates.size() > limit) {
        candidates.resize(limit);
    }

    std::vector<RankedPath> ranked;
    ranked.reserve(candidates.size());
    for (const Candidate& c : candidates) {
        ranked.push_back(RankedPath{c.record->path, c.score});
    }
    return ranked;
}

std::optional<std::string> FrecencyIndex::BestMatch(const std::string& query) const {
    return BestMatch(query, Now());
}

std::optional<std::string> FrecencyIndex::BestMatch(const std::string& query, std::int64_t now) const {
    const std::string needle = ToLower(query);
    for (const RankedPath& ranked : RankedList(0, now)) {
        if (needle.empty() || ToLower(ranked.path).find(needle) != std::string::npos) {
            return ranked.path;
        }
    }
    return std::nullopt;
}

std::size_t FrecencyIndex::RemoveStale() {
    std::size_t removed = 0;
    for (auto it = records_.begin(); it != records_.end();) {
        if (IsDirectory(it->first)) {
            ++it;
            continue;
        }
        it = records_.erase(it);
        ++removed;
    }
    if (removed > 0) {
        dirty_ = true;
    }
    return removed;
}

const VisitRecord* FrecencyIndex::Find(const std::string& path) const {
    auto it = records_.find(path);
    return it == records_.end() ? nullptr : &it->second;
}

std::vector<VisitRecord> FrecencyIndex::Records() const {
    std::vector<VisitRecord> out;
    out.reserve(records_.size());
    for (const auto& kv : records_) {
        out.push_back(kv.second);
    }
    return out;
}

double FrecencyIndex::Score(std::uint64_t visit_count, std::int64_t age_seconds) {
    const double age = age_seconds > 0 ? static_cast<double>(age_seconds) : 0.0;
    return kScale * static_cast<double>(visit_count) / (kAgeDecayPerSecond * age + kAgeOffset);
}

std::int64_t FrecencyIndex::Now() {
    return std::chrono::duration_cast<std::chrono::seconds>(
               std::chrono::system_clock::now().time_since_epoch())
        .count();
}

std::string FrecencyIndex::Normalize(const std::filesystem::path& path) {
    std::error_code ec;
    std::filesystem::path absolute = std::filesystem::absolute(path, ec);
    if (ec) {
        absolute = path;
    }
    std::filesystem::path canonical = std::filesystem::weakly_canonical(absolute, ec);
    if (ec) {
        canonical = absolute.lexically_normal();
    }
    std::string out = canonical.string();
    // weakly_canonical keeps a trailing separator when the input had one.
    while (out.size() > 1 && out.back() == '/') {
        out.pop_back();
    }
    return out;
}

std::string FrecencyIndex::FormatLine(const VisitRecord& record) {
    return record.path + "|" + std::to_string(record.visit_count) + "|" + std::to_string(record.last_visited);
}

std::optional<VisitRecord> FrecencyIndex::ParseLine(const std::string& line) {
    std::string text = line;
    if (!text.empty() && text.back() == '\r') {
        text.pop_back();
    }

    // Numeric fields are split off from the right so that '|' may appear inside the path.
    const std::size_t last = text.rfind('|');
    if (last == std::string::npos || last == 0) {
        return std::nullopt;
    }
    const std::size_t middle = text.rfind('|', last - 1);
    if (middle == std::string::npos || middle == 0) {
        return std::nullopt;
    }

    VisitRecord record{text.substr(0, middle), 0, 0};
    if (record.path.front() != '/') {
        return std::nullopt;
    }
    if (!ParseNumber(text.substr(middle + 1, last - middle - 1), record.visit_count) || record.visit_count == 0) {
        return std::nullopt;
    }
    if (!ParseNumber(text.substr(last + 1), record.last_visited)) {
        return std::nullopt;
    }
    return record;
}
