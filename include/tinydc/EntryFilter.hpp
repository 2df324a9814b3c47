#ifndef TINYDC_ENTRYFILTER_HPP
#define TINYDC_ENTRYFILTER_HPP

#include <cstddef>
#include <string>
#include <vector>

#include "tinydc/Entry.hpp"

// Entries whose display name contains query, case-insensitively, in their original order.
// An empty query returns the list unchanged.
std::vector<Entry> ApplyFilter(const std::vector<Entry>& entries, const std::string& query);

// Offset of the first case-insensitive occurrence of query in name, or npos.
std::size_t MatchPosition(const std::string& name, const std::string& query);

#endif // TINYDC_ENTRYFILTER_HPP
