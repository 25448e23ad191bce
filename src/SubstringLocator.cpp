#include "SubstringLocator.hpp"

#include "TextNormalizer.hpp"
#include "utils.hpp"

#include <QChar>
#include <QDebug>
#include <algorithm>
#include <map>
#include <tuple>

namespace
{

constexpr int FINGERPRINT_WINDOW = 32;
constexpr float CLIP_PADDING     = 6.0f;
constexpr float DEFAULT_FONTSIZE = 10.0f;

bool
conflicts(const fz_rect &rect, const std::vector<fz_rect> &used) noexcept
{
    for (const fz_rect &u : used)
        if (rects_intersect(rect, u))
            return true;
    return false;
}

fz_rect
slice_rect(const SpanRecord &record, int start, int end) noexcept
{
    fz_rect r  = fz_empty_rect;
    bool first = true;
    for (int i = std::max(0, start);
         i < end && i < static_cast<int>(record.char_boxes.size()); ++i)
    {
        r     = first ? record.char_boxes[i] : fz_union_rect(r, record.char_boxes[i]);
        first = false;
    }
    return r;
}

int
raw_index(const SpanRecord &record, int normalized) noexcept
{
    const auto &map = record.normalized_to_raw_index_map;
    if (map.empty())
        return normalized;
    normalized = std::clamp(normalized, 0, static_cast<int>(map.size()) - 1);
    return map[normalized];
}

} // namespace

std::optional<SubstringLocator::Location>
SubstringLocator::locate(MappingEntry &entry,
                         const std::vector<fz_rect> &used_rects,
                         const std::set<std::string> &used_fingerprints) const
{
    // A claimed fingerprint is never located again, whatever the hints say
    if (!entry.fingerprint_key.empty()
        && used_fingerprints.count(entry.fingerprint_key))
        return std::nullopt;

    if (entry.glyph_hint)
    {
        auto loc = locateFromGlyphPath(entry);
        if (loc && !conflicts(loc->rect, used_rects))
            return loc;
        entry.match.reset();
    }

    if (!entry.span_ids.empty())
    {
        if (auto loc = locateUsingSpanIds(entry))
        {
            if (conflicts(loc->rect, used_rects))
            {
                entry.match.reset();
                return std::nullopt;
            }
            return loc;
        }
    }

    if (entry.selection_bbox)
    {
        if (auto loc = locateInRegion(entry, *entry.selection_bbox))
        {
            if (conflicts(loc->rect, used_rects))
            {
                entry.match.reset();
                return std::nullopt;
            }
            return loc;
        }
    }

    std::optional<fz_rect> padded;
    if (auto clip = entry.regionHint())
        padded = expand_rect(*clip, CLIP_PADDING);

    std::vector<Occurrence> compatible;
    for (Occurrence &occ : findOccurrences(entry.original))
    {
        if (padded && !rects_intersect(occ.rect, *padded))
            continue;
        if (conflicts(occ.rect, used_rects))
            continue;
        if (!fingerprintMatches(occ, entry.prefix, entry.suffix))
            continue;
        compatible.push_back(std::move(occ));
    }

    if (compatible.empty())
        return std::nullopt;

    size_t pick = 0;
    if (entry.occurrence_index && *entry.occurrence_index >= 0
        && static_cast<size_t>(*entry.occurrence_index) < compatible.size())
        pick = static_cast<size_t>(*entry.occurrence_index);

    const Occurrence &occ = compatible[pick];
    const SpanRecord *record = m_index.find(occ.block, occ.line, occ.span);
    if (!record)
        return std::nullopt;

    Location loc = recordSpanMatch(entry, *record, occ.char_start, occ.char_end);
    return loc;
}

std::vector<SubstringLocator::Occurrence>
SubstringLocator::findOccurrences(std::u32string_view needle,
                                  const std::optional<fz_rect> &clip) const
{
    std::vector<Occurrence> results;
    const std::u32string folded_needle = TextNormalizer::foldForSearch(needle).text;
    if (folded_needle.empty())
        return results;

    for (const SpanRecord &record : m_index.spans())
    {
        if (clip && !rects_intersect(record.bbox, *clip))
            continue;

        const std::u32string &text = record.raw_text;
        const TextNormalizer::MappedText folded
            = TextNormalizer::foldForSearch(text);

        size_t from = 0;
        for (;;)
        {
            const size_t idx = folded.text.find(folded_needle, from);
            if (idx == std::u32string::npos)
                break;
            from = idx + folded_needle.size();

            const int start = folded.index_map[idx];
            const int end   = folded.index_map[idx + folded_needle.size() - 1] + 1;
            const fz_rect rect = slice_rect(record, start, end);
            if (clip && !rects_intersect(rect, *clip))
                continue;

            Occurrence occ;
            occ.rect       = rect;
            occ.font_size  = record.font_size > 0 ? record.font_size
                                                  : DEFAULT_FONTSIZE;
            occ.font       = record.font;
            occ.span_len   = end - start;
            occ.prefix     = text.substr(std::max(0, start - FINGERPRINT_WINDOW),
                                         start - std::max(0, start - FINGERPRINT_WINDOW));
            occ.suffix     = text.substr(end, FINGERPRINT_WINDOW);
            occ.text       = text.substr(start, end - start);
            occ.block      = record.block_index;
            occ.line       = record.line_index;
            occ.span       = record.span_index;
            occ.char_start = start;
            occ.char_end   = end;
            results.push_back(std::move(occ));
        }
    }

    std::stable_sort(results.begin(), results.end(),
                     [](const Occurrence &a, const Occurrence &b)
    {
        return std::make_tuple(round_to(a.rect.y0, 3), round_to(a.rect.x0, 3))
               < std::make_tuple(round_to(b.rect.y0, 3), round_to(b.rect.x0, 3));
    });
    return results;
}

bool
SubstringLocator::fingerprintMatches(const Occurrence &occ,
                                     std::u32string_view expected_prefix,
                                     std::u32string_view expected_suffix)
{
    const std::u32string actual_prefix
        = TextNormalizer::normalizeForCompare(occ.prefix);
    const std::u32string actual_suffix
        = TextNormalizer::normalizeForCompare(occ.suffix);
    const std::u32string prefix = TextNormalizer::normalizeForCompare(expected_prefix);
    const std::u32string suffix = TextNormalizer::normalizeForCompare(expected_suffix);

    if (!prefix.empty())
    {
        const size_t n = std::min(actual_prefix.size(), prefix.size());
        if (actual_prefix.compare(actual_prefix.size() - n, n, prefix,
                                  prefix.size() - n, n)
            != 0)
            return false;
    }

    if (!suffix.empty())
    {
        const size_t n = std::min(actual_suffix.size(), suffix.size());
        if (actual_suffix.compare(0, n, suffix, 0, n) != 0)
            return false;
    }

    return true;
}

std::optional<SubstringLocator::Location>
SubstringLocator::locateFromGlyphPath(MappingEntry &entry) const
{
    const GlyphPath &hint = *entry.glyph_hint;
    const SpanRecord *record = m_index.find(hint.block, hint.line, hint.span);
    if (!record || hint.char_start < 0
        || hint.char_end > static_cast<int>(record->raw_text.size())
        || hint.char_end <= hint.char_start)
        return std::nullopt;

    const std::u32string slice = record->raw_text.substr(
        hint.char_start, hint.char_end - hint.char_start);
    if (TextNormalizer::foldForSearch(slice).text
        != TextNormalizer::foldForSearch(entry.original).text)
    {
        qDebug() << "Glyph path hint no longer spells" << to_qstring(entry.original);
        return std::nullopt;
    }

    return recordSpanMatch(entry, *record, hint.char_start, hint.char_end);
}

std::optional<SubstringLocator::Location>
SubstringLocator::locateUsingSpanIds(MappingEntry &entry) const
{
    const std::u32string target_lower = TextNormalizer::casefold(
        TextNormalizer::buildNormalizedMap(entry.original).text);
    if (target_lower.empty())
        return std::nullopt;

    // (block, line, span, input index)
    std::vector<std::pair<std::tuple<int, int, int, int>, const SpanRecord *>>
        ordered;
    std::set<std::string> seen;
    for (int i = 0; i < static_cast<int>(entry.span_ids.size()); ++i)
    {
        const std::string &id = entry.span_ids[i];
        if (!seen.insert(id).second)
            continue;
        const SpanRecord *record = m_index.find(id);
        if (!record)
            continue;
        ordered.push_back({{record->block_index, record->line_index,
                            record->span_index, i},
                           record});
    }
    std::sort(ordered.begin(), ordered.end(),
              [](const auto &a, const auto &b) { return a.first < b.first; });

    std::vector<const SpanRecord *> records;
    for (const auto &[key, record] : ordered)
        records.push_back(record);

    for (const SpanRecord *record : records)
    {
        const TextNormalizer::MappedText normalized
            = TextNormalizer::buildNormalizedMap(record->normalized_text);
        if (normalized.text.empty())
            continue;

        const size_t idx
            = TextNormalizer::casefold(normalized.text).find(target_lower);
        if (idx == std::u32string::npos)
            continue;

        const size_t last = std::min(idx + target_lower.size() - 1,
                                     normalized.index_map.size() - 1);
        const int start   = raw_index(*record, normalized.index_map[idx]);
        const int end     = raw_index(*record, normalized.index_map[last]) + 1;
        return recordSpanMatch(entry, *record, start, end);
    }

    if (records.size() > 1)
        return locateAcrossSpans(entry, records, target_lower);

    return std::nullopt;
}

std::optional<SubstringLocator::Location>
SubstringLocator::locateAcrossSpans(
    MappingEntry &entry, const std::vector<const SpanRecord *> &records,
    const std::u32string &target_lower) const
{
    struct Composite
    {
        const SpanRecord *record;
        char32_t c;
        int glyph; // index into record->normalized_text
    };

    std::vector<Composite> combined;
    std::u32string compact;
    std::vector<int> compact_map;

    for (const SpanRecord *record : records)
    {
        const TextNormalizer::MappedText normalized
            = TextNormalizer::buildNormalizedMap(record->normalized_text);
        for (size_t i = 0; i < normalized.text.size(); ++i)
        {
            const char32_t c = QChar::toCaseFolded(normalized.text[i]);
            combined.push_back({record, c, normalized.index_map[i]});
            if (c != U' ')
            {
                compact.push_back(c);
                compact_map.push_back(static_cast<int>(combined.size()) - 1);
            }
        }
    }

    if (combined.empty())
        return std::nullopt;

    std::u32string target_compact;
    for (char32_t c : target_lower)
        if (c != U' ')
            target_compact.push_back(c);

    int start = -1;
    int end   = -1;
    const size_t cidx = target_compact.empty()
                            ? std::u32string::npos
                            : compact.find(target_compact);
    if (cidx != std::u32string::npos)
    {
        start = compact_map[cidx];
        end   = compact_map[cidx + target_compact.size() - 1] + 1;
    }
    else
    {
        std::u32string text;
        for (const Composite &c : combined)
            text.push_back(c.c);
        const size_t idx = text.find(target_lower);
        if (idx == std::u32string::npos)
            return std::nullopt;
        start = static_cast<int>(idx);
        end   = static_cast<int>(idx + target_lower.size());
    }

    // Per span: [min raw, max raw]
    std::vector<const SpanRecord *> order;
    std::map<const SpanRecord *, std::pair<int, int>> ranges;
    for (int i = start; i < end; ++i)
    {
        const int raw = raw_index(*combined[i].record, combined[i].glyph);
        auto it       = ranges.find(combined[i].record);
        if (it == ranges.end())
        {
            ranges[combined[i].record] = {raw, raw};
            order.push_back(combined[i].record);
        }
        else
        {
            it->second.first  = std::min(it->second.first, raw);
            it->second.second = std::max(it->second.second, raw);
        }
    }

    LocatedMatch match;
    bool first      = true;
    int glyph_count = 0;
    for (const SpanRecord *record : order)
    {
        const auto [lo, hi] = ranges[record];
        const fz_rect rect  = slice_rect(*record, lo, hi + 1);
        if (rect_is_empty(rect))
            continue;

        match.rect = first ? rect : fz_union_rect(match.rect, rect);
        if (first)
        {
            match.font      = record->font;
            match.font_size = record->font_size > 0 ? record->font_size
                                                    : DEFAULT_FONTSIZE;
            match.path = GlyphPath{record->block_index, record->line_index,
                                   record->span_index, lo, hi + 1};
        }
        first = false;

        for (int c = lo; c <= hi; ++c)
            match.glyphs.push_back(
                {record->block_index, record->line_index, record->span_index, c});
        match.span_ids.push_back(record->id());
        glyph_count += hi + 1 - lo;
    }

    if (first)
        return std::nullopt;

    match.text  = TextNormalizer::stripZeroWidth(entry.original);
    entry.match = match;
    return Location{match.rect, match.font_size, glyph_count};
}

std::optional<SubstringLocator::Location>
SubstringLocator::locateInRegion(MappingEntry &entry,
                                 const fz_rect &region) const
{
    const std::u32string needle
        = TextNormalizer::casefold(trim(TextNormalizer::stripZeroWidth(entry.original)));
    if (needle.empty())
        return std::nullopt;

    for (const SpanRecord &record : m_index.spans())
    {
        if (!rects_intersect(record.bbox, region) || record.raw_text.empty())
            continue;

        const std::u32string lowered = TextNormalizer::casefold(record.raw_text);
        for (size_t idx : find_all(lowered, needle))
        {
            const int start = static_cast<int>(idx);
            const int end   = start + static_cast<int>(needle.size());
            if (!rects_intersect(slice_rect(record, start, end), region))
                continue;
            return recordSpanMatch(entry, record, start, end);
        }
    }
    return std::nullopt;
}

SubstringLocator::Location
SubstringLocator::recordSpanMatch(MappingEntry &entry, const SpanRecord &record,
                                  int start, int end) const
{
    LocatedMatch match;
    match.rect      = slice_rect(record, start, end);
    match.font      = record.font;
    match.font_size = record.font_size > 0 ? record.font_size : DEFAULT_FONTSIZE;
    match.text      = record.raw_text.substr(start, end - start);
    match.path      = GlyphPath{record.block_index, record.line_index,
                           record.span_index, start, end};
    match.span_ids  = {record.id()};
    for (int c = start; c < end; ++c)
        match.glyphs.push_back(
            {record.block_index, record.line_index, record.span_index, c});

    entry.match = match;
    return Location{match.rect, match.font_size, end - start};
}
