#pragma once

#include "GlyphPage.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <vector>

struct SpanLocation
{
    int page{0};
    int block{0};
    int line{0};
    int span{0};
};

// One glyph span of a page with the text forms used for matching
struct SpanRecord
{
    int page{0};
    int block_index{0};
    int line_index{0};
    int span_index{0};
    std::string font;
    float font_size{0.0f};
    fz_rect bbox{};
    std::u32string raw_text;
    // raw_text without zero-width characters
    std::u32string normalized_text;
    std::vector<int> normalized_to_raw_index_map;
    std::vector<fz_rect> char_boxes;

    std::string id() const;
};

class SpanIndex
{
public:
    SpanIndex() = default;
    explicit SpanIndex(const GlyphPage &page);

    inline const std::vector<SpanRecord> &spans() const noexcept
    {
        return m_spans;
    }

    inline int page() const noexcept
    {
        return m_page;
    }

    const SpanRecord *find(int block, int line, int span) const noexcept;
    const SpanRecord *find(std::string_view span_id) const noexcept;

    static std::string formatId(int page, int block, int line, int span);
    // Accepts "page{p}:block{b}:line{l}:span{s}"
    static std::optional<SpanLocation> parseId(std::string_view span_id);

private:
    int m_page{0};
    std::vector<SpanRecord> m_spans;
};
