#include "SpanIndex.hpp"

#include "TextNormalizer.hpp"

#include <charconv>

std::string
SpanRecord::id() const
{
    return SpanIndex::formatId(page, block_index, line_index, span_index);
}

SpanIndex::SpanIndex(const GlyphPage &page) : m_page(page.index)
{
    for (int b = 0; b < static_cast<int>(page.blocks.size()); ++b)
    {
        const auto &lines = page.blocks[b].lines;
        for (int l = 0; l < static_cast<int>(lines.size()); ++l)
        {
            const auto &spans = lines[l].spans;
            for (int s = 0; s < static_cast<int>(spans.size()); ++s)
            {
                const GlyphSpan &span = spans[s];

                SpanRecord record;
                record.page        = page.index;
                record.block_index = b;
                record.line_index  = l;
                record.span_index  = s;
                record.font        = span.font;
                record.font_size   = span.size;
                record.bbox        = span.bbox;
                record.raw_text    = span.text();

                for (int i = 0; i < static_cast<int>(span.chars.size()); ++i)
                {
                    record.char_boxes.push_back(span.chars[i].bbox);
                    if (TextNormalizer::isZeroWidth(span.chars[i].c))
                        continue;
                    record.normalized_text.push_back(span.chars[i].c);
                    record.normalized_to_raw_index_map.push_back(i);
                }

                m_spans.push_back(std::move(record));
            }
        }
    }
}

const SpanRecord *
SpanIndex::find(int block, int line, int span) const noexcept
{
    for (const SpanRecord &r : m_spans)
        if (r.block_index == block && r.line_index == line
            && r.span_index == span)
            return &r;
    return nullptr;
}

const SpanRecord *
SpanIndex::find(std::string_view span_id) const noexcept
{
    auto loc = parseId(span_id);
    if (!loc || loc->page != m_page)
        return nullptr;
    return find(loc->block, loc->line, loc->span);
}

std::string
SpanIndex::formatId(int page, int block, int line, int span)
{
    return "page" + std::to_string(page) + ":block" + std::to_string(block)
           + ":line" + std::to_string(line) + ":span" + std::to_string(span);
}

std::optional<SpanLocation>
SpanIndex::parseId(std::string_view span_id)
{
    static constexpr std::string_view keys[] = {"page", "block", "line", "span"};

    int values[4] = {0, 0, 0, 0};
    size_t pos    = 0;
    for (int k = 0; k < 4; ++k)
    {
        if (k > 0)
        {
            if (pos >= span_id.size() || span_id[pos] != ':')
                return std::nullopt;
            ++pos;
        }
        if (span_id.substr(pos, keys[k].size()) != keys[k])
            return std::nullopt;
        pos += keys[k].size();

        const char *begin = span_id.data() + pos;
        const char *end   = span_id.data() + span_id.size();
        auto [ptr, ec]    = std::from_chars(begin, end, values[k]);
        if (ec != std::errc() || ptr == begin)
            return std::nullopt;
        pos += static_cast<size_t>(ptr - begin);
    }

    if (pos != span_id.size())
        return std::nullopt;

    return SpanLocation{values[0], values[1], values[2], values[3]};
}
