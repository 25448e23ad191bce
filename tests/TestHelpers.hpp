#pragma once

// Builders shared by the tests: glyph pages laid out on a fixed grid and
// mapping entries derived from a stem text the way the loader derives them.

#include "GlyphPage.hpp"
#include "MappingContext.hpp"
#include "TextMeasurer.hpp"

#include <string>
#include <vector>

namespace testing_helpers
{

constexpr float GLYPH_WIDTH  = 6.0f;
constexpr float LINE_HEIGHT  = 12.0f;
constexpr float LEFT_MARGIN  = 72.0f;
constexpr float TOP_MARGIN   = 100.0f;

// Each inner vector is one line of spans. Glyphs are GLYPH_WIDTH wide and
// lines LINE_HEIGHT apart, all in one block.
inline GlyphPage
make_page(const std::vector<std::vector<std::u32string>> &lines,
          int index = 0, float size = 10.0f)
{
    GlyphPage page;
    page.index  = index;
    page.bounds = fz_make_rect(0, 0, 612, 792);

    GlyphBlock block;
    block.bbox = fz_empty_rect;
    float y    = TOP_MARGIN;
    for (const auto &spans : lines)
    {
        GlyphLine line;
        line.bbox = fz_empty_rect;
        float x   = LEFT_MARGIN;
        for (const std::u32string &text : spans)
        {
            GlyphSpan span;
            span.font = "Helvetica";
            span.size = size;
            span.bbox = fz_empty_rect;
            for (char32_t c : text)
            {
                Glyph g;
                g.c      = c;
                g.bbox   = fz_make_rect(x, y, x + GLYPH_WIDTH, y + 10.0f);
                g.origin = fz_make_point(x, y + 8.0f);
                span.bbox = span.chars.empty() ? g.bbox
                                               : fz_union_rect(span.bbox, g.bbox);
                span.chars.push_back(g);
                x += GLYPH_WIDTH;
            }
            line.bbox = line.spans.empty() ? span.bbox
                                           : fz_union_rect(line.bbox, span.bbox);
            line.spans.push_back(std::move(span));
        }
        block.bbox = block.lines.empty() ? line.bbox
                                         : fz_union_rect(block.bbox, line.bbox);
        block.lines.push_back(std::move(line));
        y += LINE_HEIGHT;
    }
    page.blocks.push_back(std::move(block));
    return page;
}

// Entry for the first occurrence of `original` at or after `from` in `stem`
inline MappingEntry
make_entry(std::u32string_view stem, std::u32string original,
           std::u32string replacement, size_t from = 0)
{
    MappingEntry entry;
    entry.q_label     = "1";
    entry.original    = std::move(original);
    entry.replacement = std::move(replacement);
    entry.stem_text   = std::u32string(stem);
    entry.page        = 0;

    const size_t idx = stem.find(entry.original, from);
    entry.start_pos  = static_cast<int>(idx);
    entry.end_pos    = entry.start_pos + static_cast<int>(entry.original.size());
    entry.occurrence_index = MappingContext::computeOccurrenceIndex(
        stem, entry.original, entry.start_pos);

    const int prefix_from = std::max(0, entry.start_pos - 24);
    entry.prefix = entry.stem_text.substr(prefix_from, entry.start_pos - prefix_from);
    entry.suffix = entry.stem_text.substr(entry.end_pos, 24);
    entry.fingerprint_key = MappingContext::fingerprintKey(
        entry.prefix, entry.original, entry.suffix, *entry.occurrence_index);
    return entry;
}

// Width is the number of characters times `per_char`
class CountingMeasurer : public TextMeasurer
{
public:
    explicit CountingMeasurer(float per_char = 1.0f) : m_per_char(per_char) {}

    float measure(std::u32string_view text, const std::string &,
                  float) const override
    {
        return static_cast<float>(text.size()) * m_per_char;
    }

private:
    float m_per_char;
};

} // namespace testing_helpers
