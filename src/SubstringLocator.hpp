#pragma once

// Finds the glyph range of a mapping entry on a page

#include "MappingContext.hpp"
#include "SpanIndex.hpp"

#include <optional>
#include <set>
#include <string>
#include <vector>

class SubstringLocator
{
public:
    struct Location
    {
        fz_rect rect{};
        float font_size{10.0f};
        int glyph_count{0};
    };

    // One hit of the page-wide scan
    struct Occurrence
    {
        fz_rect rect{};
        float font_size{10.0f};
        std::string font;
        int span_len{0};
        std::u32string prefix;
        std::u32string suffix;
        std::u32string text;
        int block{0};
        int line{0};
        int span{0};
        int char_start{0};
        int char_end{0};
    };

    explicit SubstringLocator(const SpanIndex &index) noexcept : m_index(index)
    {
    }

    // On success the entry's `match` is filled in
    std::optional<Location>
    locate(MappingEntry &entry, const std::vector<fz_rect> &used_rects,
           const std::set<std::string> &used_fingerprints) const;

    // Whitespace-, accent- and case-insensitive scan of every span, ordered
    // top to bottom then left to right.
    std::vector<Occurrence>
    findOccurrences(std::u32string_view needle,
                    const std::optional<fz_rect> &clip = std::nullopt) const;

    static bool fingerprintMatches(const Occurrence &occ,
                                   std::u32string_view expected_prefix,
                                   std::u32string_view expected_suffix);

private:
    std::optional<Location> locateFromGlyphPath(MappingEntry &entry) const;
    std::optional<Location> locateUsingSpanIds(MappingEntry &entry) const;
    std::optional<Location>
    locateAcrossSpans(MappingEntry &entry,
                      const std::vector<const SpanRecord *> &records,
                      const std::u32string &target_lower) const;
    std::optional<Location> locateInRegion(MappingEntry &entry,
                                           const fz_rect &region) const;

    // Records the match of raw chars [start, end) of one span
    Location recordSpanMatch(MappingEntry &entry, const SpanRecord &record,
                             int start, int end) const;

    const SpanIndex &m_index;
};
