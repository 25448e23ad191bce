#pragma once

// Maps located entries onto character ranges of a page's text-show stream

#include "MappingContext.hpp"

#include <optional>
#include <set>
#include <string>
#include <utility>
#include <vector>

struct ReplacementRecord
{
    int start{0};
    int end{0};
    std::u32string replacement;
    // The stream text the range covered when planned
    std::u32string observed;
    // Entry of the page list passed to plan(); it must outlive the record
    MappingEntry *entry{nullptr};
    std::string fingerprint_key;
    std::optional<int> operator_index;
    bool applied{false};
};

namespace ReplacementPlanner
{

using Range = std::pair<int, int>;

// Entries without a match are skipped. Consumed fingerprints are added to
// `used_fingerprints`.
std::vector<ReplacementRecord>
plan(std::u32string_view stream, std::vector<MappingEntry> &entries,
     std::set<std::string> &used_fingerprints);

// Checks the text around [start, end) against the entry's prefix, or its
// suffix when no prefix was recorded.
bool
matchesSurroundings(std::u32string_view stream, int start, int end,
                    const MappingEntry &entry);

// Exact search, then a search over letters and digits only. Honours used
// ranges, surroundings and the entry's occurrence index.
std::optional<Range>
findInStream(std::u32string_view stream, std::u32string_view target,
             const MappingEntry &entry, const std::vector<Range> &used);

// Zero-width stripped equality, else equal compact ASCII forms
bool
sameText(std::u32string_view observed, std::u32string_view expected);

} // namespace ReplacementPlanner
