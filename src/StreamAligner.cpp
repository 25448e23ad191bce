#include "StreamAligner.hpp"

#include "ReplacementPlanner.hpp"
#include "TextNormalizer.hpp"
#include "utils.hpp"

#include <QDebug>
#include <algorithm>
#include <map>
#include <tuple>
#include <unordered_map>

namespace
{

using StreamAligner::MatchingBlock;

class LongestMatch
{
public:
    LongestMatch(std::u32string_view a, std::u32string_view b)
        : m_a(a), m_len(b.size() + 1, 0), m_next(b.size() + 1, 0)
    {
        for (int j = 0; j < static_cast<int>(b.size()); ++j)
            m_b2j[b[j]].push_back(j);
    }

    // Longest block in a[alo, ahi) x b[blo, bhi); earliest in a, then in b
    MatchingBlock find(int alo, int ahi, int blo, int bhi)
    {
        MatchingBlock best{alo, blo, 0};
        std::vector<int> touched;
        std::vector<int> next_touched;

        for (int i = alo; i < ahi; ++i)
        {
            next_touched.clear();
            auto it = m_b2j.find(m_a[i]);
            if (it != m_b2j.end())
            {
                for (int j : it->second)
                {
                    if (j < blo)
                        continue;
                    if (j >= bhi)
                        break;
                    // m_len[j] is the run ending at b[j - 1] on the previous row
                    const int k     = m_len[j] + 1;
                    m_next[j + 1]   = k;
                    next_touched.push_back(j + 1);
                    if (k > best.size)
                        best = {i - k + 1, j - k + 1, k};
                }
            }

            for (int t : touched)
                m_len[t] = 0;
            for (int t : next_touched)
            {
                m_len[t]  = m_next[t];
                m_next[t] = 0;
            }
            std::swap(touched, next_touched);
        }

        for (int t : touched)
            m_len[t] = 0;
        return best;
    }

private:
    std::u32string_view m_a;
    std::unordered_map<char32_t, std::vector<int>> m_b2j;
    std::vector<int> m_len;
    std::vector<int> m_next;
};

} // namespace

std::vector<MatchingBlock>
StreamAligner::matchingBlocks(std::u32string_view a, std::u32string_view b)
{
    std::vector<MatchingBlock> blocks;
    if (a.empty() || b.empty())
        return blocks;

    LongestMatch matcher(a, b);
    std::vector<std::tuple<int, int, int, int>> queue{
        {0, static_cast<int>(a.size()), 0, static_cast<int>(b.size())}};

    while (!queue.empty())
    {
        const auto [alo, ahi, blo, bhi] = queue.back();
        queue.pop_back();

        const MatchingBlock m = matcher.find(alo, ahi, blo, bhi);
        if (m.size == 0)
            continue;

        blocks.push_back(m);
        if (alo < m.a && blo < m.b)
            queue.emplace_back(alo, m.a, blo, m.b);
        if (m.a + m.size < ahi && m.b + m.size < bhi)
            queue.emplace_back(m.a + m.size, ahi, m.b + m.size, bhi);
    }

    std::sort(blocks.begin(), blocks.end(),
              [](const MatchingBlock &x, const MatchingBlock &y)
    { return std::tie(x.a, x.b) < std::tie(y.a, y.b); });

    std::vector<MatchingBlock> merged;
    for (const MatchingBlock &m : blocks)
    {
        if (!merged.empty())
        {
            MatchingBlock &last = merged.back();
            if (last.a + last.size == m.a && last.b + last.size == m.b)
            {
                last.size += m.size;
                continue;
            }
        }
        merged.push_back(m);
    }
    return merged;
}

void
StreamAligner::attach(const GlyphPage &page, std::u32string_view stream,
                      std::vector<MappingEntry> &entries, double min_confidence)
{
    if (stream.empty())
        return;

    std::u32string raw;
    std::vector<GlyphRef> refs;
    page.linearize(raw, refs);
    if (raw.empty())
        return;

    // Raw offset of the first glyph of every span
    std::map<std::tuple<int, int, int>, int> span_offsets;
    for (int i = 0; i < static_cast<int>(refs.size()); ++i)
        span_offsets.emplace(std::make_tuple(refs[i].block, refs[i].line, refs[i].span),
                             i);

    std::vector<int> alignment(raw.size(), -1);
    for (const MatchingBlock &m : matchingBlocks(raw, stream))
        for (int k = 0; k < m.size; ++k)
            alignment[m.a + k] = m.b + k;

    const int n = static_cast<int>(stream.size());

    for (MappingEntry &entry : entries)
    {
        if (!entry.match || entry.match->glyphs.empty())
            continue;

        int start    = -1;
        int end      = -1;
        int aligned  = 0;
        int total    = 0;
        for (const GlyphRef &g : entry.match->glyphs)
        {
            auto it = span_offsets.find({g.block, g.line, g.span});
            if (it == span_offsets.end())
                continue;
            const int raw_index = it->second + g.index;
            if (raw_index < 0 || raw_index >= static_cast<int>(raw.size()))
                continue;
            ++total;
            const int mapped = alignment[raw_index];
            if (mapped < 0)
                continue;
            ++aligned;
            start = start < 0 ? mapped : std::min(start, mapped);
            end   = std::max(end, mapped + 1);
        }

        if (total == 0 || aligned == 0 || end <= start)
        {
            entry.alignment_confidence = 0.0;
            continue;
        }

        double confidence = static_cast<double>(aligned) / total;

        const std::u32string expected = TextNormalizer::stripZeroWidth(
            entry.match->text.empty() ? entry.original : entry.match->text);
        const int len = static_cast<int>(expected.size());

        auto matches = [&](int s, int e)
        {
            if (s < 0 || e > n || e <= s)
                return false;
            return ReplacementPlanner::sameText(stream.substr(s, e - s), expected);
        };

        if (!expected.empty() && !matches(start, end))
        {
            end = std::min(n, start + len);
            if (matches(start, end))
                confidence *= TRUNCATE_PENALTY;
            else
            {
                bool shifted = false;
                for (int shift = 1; shift < 8; ++shift)
                {
                    if (matches(start - shift, start - shift + len))
                    {
                        start  -= shift;
                        end     = start + len;
                        shifted = true;
                        break;
                    }
                }

                if (shifted)
                    confidence *= SHIFT_PENALTY;
                else
                {
                    const int from = std::max(0, start - 50);
                    const int to   = std::min(n, end + 50);
                    const size_t idx
                        = stream.substr(from, to - from).find(expected);
                    if (idx == std::u32string_view::npos)
                    {
                        entry.alignment_confidence = 0.0;
                        continue;
                    }
                    start = from + static_cast<int>(idx);
                    end   = std::min(n, start + len);
                    confidence *= WINDOW_PENALTY;
                }
            }
        }

        if (!ReplacementPlanner::matchesSurroundings(stream, start, end, entry))
        {
            entry.alignment_confidence = 0.0;
            continue;
        }

        entry.alignment_confidence = confidence;
        if (confidence < min_confidence)
        {
            qDebug() << "Alignment confidence" << confidence << "too low for"
                     << to_qstring(entry.original);
            continue;
        }

        entry.stream = StreamRange{
            start, end, std::u32string(stream.substr(start, end - start)),
            confidence};
    }
}
