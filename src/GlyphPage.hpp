#pragma once

// Structured glyph layout of one page as reported by MuPDF's stext device.
// Blocks hold lines, lines hold spans (runs of glyphs sharing font and
// size), spans hold glyphs.

#include <cstdint>
#include <string>
#include <vector>

extern "C"
{
#include <mupdf/fitz.h>
}

struct Glyph
{
    char32_t c{0};
    fz_rect bbox{};
    fz_point origin{};
};

struct GlyphSpan
{
    std::string font;
    float size{0.0f};
    fz_rect bbox{};
    std::vector<Glyph> chars;

    std::u32string text() const
    {
        std::u32string s;
        s.reserve(chars.size());
        for (const Glyph &g : chars)
            s.push_back(g.c);
        return s;
    }
};

struct GlyphLine
{
    fz_rect bbox{};
    std::vector<GlyphSpan> spans;
};

struct GlyphBlock
{
    fz_rect bbox{};
    std::vector<GlyphLine> lines;
};

// Address of one glyph
struct GlyphRef
{
    int block{0};
    int line{0};
    int span{0};
    int index{0};

    bool operator==(const GlyphRef &o) const noexcept
    {
        return block == o.block && line == o.line && span == o.span
               && index == o.index;
    }
};

struct GlyphPage
{
    int index{0};
    fz_rect bounds{};
    std::vector<GlyphBlock> blocks;

    const GlyphSpan *span(int b, int l, int s) const noexcept
    {
        if (b < 0 || b >= static_cast<int>(blocks.size()))
            return nullptr;
        const auto &lines = blocks[b].lines;
        if (l < 0 || l >= static_cast<int>(lines.size()))
            return nullptr;
        const auto &spans = lines[l].spans;
        if (s < 0 || s >= static_cast<int>(spans.size()))
            return nullptr;
        return &spans[s];
    }

    const Glyph *glyph(const GlyphRef &ref) const noexcept
    {
        const GlyphSpan *sp = span(ref.block, ref.line, ref.span);
        if (!sp || ref.index < 0
            || ref.index >= static_cast<int>(sp->chars.size()))
            return nullptr;
        return &sp->chars[ref.index];
    }

    // Every glyph of the page in reading order, with the address of each
    void linearize(std::u32string &text, std::vector<GlyphRef> &refs) const
    {
        text.clear();
        refs.clear();
        for (int b = 0; b < static_cast<int>(blocks.size()); ++b)
        {
            const auto &lines = blocks[b].lines;
            for (int l = 0; l < static_cast<int>(lines.size()); ++l)
            {
                const auto &spans = lines[l].spans;
                for (int s = 0; s < static_cast<int>(spans.size()); ++s)
                {
                    const auto &chars = spans[s].chars;
                    for (int c = 0; c < static_cast<int>(chars.size()); ++c)
                    {
                        text.push_back(chars[c].c);
                        refs.push_back({b, l, s, c});
                    }
                }
            }
        }
    }
};
