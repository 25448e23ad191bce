#pragma once

// Aligns the glyph text of a page with the text of its text-show operators
// so located glyph ranges can be carried over to stream offsets.

#include "GlyphPage.hpp"
#include "MappingContext.hpp"

#include <string_view>
#include <vector>

namespace StreamAligner
{

// a[a .. a+size) == b[b .. b+size)
struct MatchingBlock
{
    int a{0};
    int b{0};
    int size{0};
};

constexpr double TRUNCATE_PENALTY = 0.75;
constexpr double SHIFT_PENALTY    = 0.6;
constexpr double WINDOW_PENALTY   = 0.5;

// Ratcliff/Obershelp: longest common block first, then recurse on both
// sides. No junk heuristics. Adjacent blocks are merged.
std::vector<MatchingBlock>
matchingBlocks(std::u32string_view a, std::u32string_view b);

// For each located entry, map its glyphs through the alignment, verify and
// repair the range, and attach it as entry.stream when the confidence
// reaches `min_confidence`. Every entry that was aligned gets
// alignment_confidence set.
void
attach(const GlyphPage &page, std::u32string_view stream,
       std::vector<MappingEntry> &entries, double min_confidence);

} // namespace StreamAligner
