#include "SpanRewritePlan.hpp"

#include "TextNormalizer.hpp"
#include "utils.hpp"

#include <QJsonArray>
#include <algorithm>

namespace
{

struct Collapsed
{
    std::u32string text;
    std::vector<int> index_map;
};

Collapsed
collapse_with_index(std::u32string_view s)
{
    Collapsed out;
    for (size_t i = 0; i < s.size(); ++i)
    {
        for (char32_t piece : TextNormalizer::collapseNfkd(s.substr(i, 1)))
        {
            out.text.push_back(piece);
            out.index_map.push_back(static_cast<int>(i));
        }
    }
    return out;
}

QJsonValue
optional_int(const std::optional<int> &v)
{
    return v ? QJsonValue(*v) : QJsonValue();
}

QJsonArray
rect_json(const fz_rect &r)
{
    return {r.x0, r.y0, r.x1, r.y1};
}

} // namespace

SpanRewriteAccumulator::SpanRewriteAccumulator(SpanRecord span) noexcept
    : m_span(std::move(span))
{
}

bool
SpanRewriteAccumulator::addReplacement(int start, int end,
                                       std::u32string replacement,
                                       SpanMappingRef ref, bool overlay_fallback,
                                       bool requires_scaling)
{
    if (end <= start)
        return false;

    std::vector<size_t> covered;
    for (size_t i = 0; i < m_replacements.size(); ++i)
    {
        const Pending &existing = m_replacements[i];
        if (start <= existing.start && end >= existing.end)
        {
            covered.push_back(i);
            continue;
        }
        if (existing.start <= start && existing.end >= end)
            return false;
        if (start < existing.end && end > existing.start)
            return false;
    }

    for (auto it = covered.rbegin(); it != covered.rend(); ++it)
        m_replacements.erase(m_replacements.begin() + static_cast<long>(*it));

    m_replacements.push_back({start, end, std::move(replacement), std::move(ref),
                              overlay_fallback, requires_scaling});
    return true;
}

std::pair<int, int>
SpanRewriteAccumulator::normalizedToRaw(int start, int end) const
{
    const auto &map   = m_span.normalized_to_raw_index_map;
    const int raw_len = static_cast<int>(m_span.raw_text.size());
    const int n       = static_cast<int>(map.size());

    if (map.empty() || n != static_cast<int>(m_span.normalized_text.size()))
        return {std::max(0, start), std::max(0, end)};

    int raw_start = start <= 0 ? 0 : (start >= n ? raw_len : map[start]);
    int raw_end   = end <= 0 ? 0 : (end > n ? map.back() + 1 : map[end - 1] + 1);

    raw_start = std::clamp(raw_start, 0, raw_len);
    raw_end   = std::clamp(raw_end, raw_start, raw_len);
    return {raw_start, raw_end};
}

std::pair<int, int>
SpanRewriteAccumulator::rawToNormalized(const SpanRecord &span, int raw_start,
                                        int raw_end)
{
    const auto &map = span.normalized_to_raw_index_map;
    int start       = static_cast<int>(map.size());
    int end         = 0;
    for (int i = 0; i < static_cast<int>(map.size()); ++i)
    {
        if (map[i] >= raw_start && map[i] < raw_end)
        {
            start = std::min(start, i);
            end   = std::max(end, i + 1);
        }
    }
    if (end <= start)
        return {raw_start, raw_end};
    return {start, end};
}

std::optional<SpanRewriteEntry>
SpanRewriteAccumulator::buildEntry(int page, const TextMeasurer &measurer)
{
    m_failures.clear();
    if (m_replacements.empty())
        return std::nullopt;

    const std::u32string &base = m_span.raw_text.empty() ? m_span.normalized_text
                                                         : m_span.raw_text;
    if (base.empty())
        return std::nullopt;

    const std::u32string &normalized
        = m_span.normalized_text.empty() ? base : m_span.normalized_text;

    auto slice = [&](int raw_start, int raw_end)
    { return base.substr(raw_start, raw_end - raw_start); };

    std::vector<Pending> ordered = m_replacements;
    std::sort(ordered.begin(), ordered.end(),
              [](const Pending &a, const Pending &b) { return a.start > b.start; });

    struct Valid
    {
        Pending item;
        int raw_start;
        int raw_end;
    };
    std::vector<Valid> valid;

    for (Pending &item : ordered)
    {
        const std::u32string expected = TextNormalizer::collapseNfkd(item.ref.original);
        const int requested_start     = item.start;
        const int requested_end       = item.end;

        auto [raw_start, raw_end] = normalizedToRaw(item.start, item.end);
        std::u32string observed   = slice(raw_start, raw_end);

        if (!item.ref.original.empty()
            && TextNormalizer::collapseNfkd(observed) != expected)
        {
            bool adjusted    = false;
            const size_t idx = normalized.find(item.ref.original);
            if (idx != std::u32string::npos)
            {
                item.start = static_cast<int>(idx);
                item.end   = item.start + static_cast<int>(item.ref.original.size());
            }
            else
            {
                const Collapsed collapsed = collapse_with_index(normalized);
                const size_t cidx         = expected.empty()
                                                ? std::u32string::npos
                                                : collapsed.text.find(expected);
                if (cidx != std::u32string::npos)
                {
                    item.start = collapsed.index_map[cidx];
                    item.end   = collapsed.index_map[cidx + expected.size() - 1] + 1;
                }
            }

            if (item.start != requested_start || item.end != requested_end)
            {
                std::tie(raw_start, raw_end) = normalizedToRaw(item.start, item.end);
                observed = slice(raw_start, raw_end);
                adjusted = TextNormalizer::collapseNfkd(observed) == expected;
            }

            // A recovered range must agree with what the mapping asked for
            if (adjusted
                && ((item.ref.start && *item.ref.start != item.start)
                    || (item.ref.end && *item.ref.end != item.end)))
            {
                item.start = requested_start;
                item.end   = requested_end;
                std::tie(raw_start, raw_end) = normalizedToRaw(item.start, item.end);
                observed = slice(raw_start, raw_end);
                adjusted = TextNormalizer::collapseNfkd(observed) == expected;
            }

            if (!adjusted)
            {
                ValidationFailure failure;
                failure.expected       = item.ref.original;
                failure.observed       = observed;
                failure.start          = raw_start;
                failure.end            = raw_end;
                failure.replacement    = item.replacement;
                failure.q_label        = item.ref.q_label;
                failure.operator_index = item.ref.operator_index;
                m_failures.push_back(std::move(failure));
                continue;
            }
        }

        valid.push_back({item, raw_start, raw_end});
    }

    if (valid.empty())
        return std::nullopt;

    std::sort(valid.begin(), valid.end(), [](const Valid &a, const Valid &b)
    { return a.item.start > b.item.start; });

    SpanRewriteEntry entry;
    entry.replacement_text = base;
    for (const Valid &v : valid)
        entry.replacement_text.replace(v.raw_start, v.raw_end - v.raw_start,
                                       v.item.replacement);

    bool scaling_hint = false;
    for (auto it = valid.rbegin(); it != valid.rend(); ++it)
    {
        entry.slice_replacements.push_back({it->item.start, it->item.end,
                                            it->raw_start, it->raw_end,
                                            it->item.replacement});
        entry.mappings.push_back(it->item.ref);
        entry.overlay_fallback = entry.overlay_fallback || it->item.overlay_fallback;
        scaling_hint           = scaling_hint || it->item.requires_scaling;
        if (!entry.operator_index)
            entry.operator_index = it->item.ref.operator_index;
    }

    entry.page          = page;
    entry.block         = m_span.block_index;
    entry.line          = m_span.line_index;
    entry.span          = m_span.span_index;
    entry.original_text = base;
    entry.font          = m_span.font;
    entry.font_size     = m_span.font_size;
    entry.bbox          = m_span.bbox;
    entry.matrix        = fz_make_matrix(1, 0, 0, 1, m_span.bbox.x0, m_span.bbox.y0);
    entry.original_width = rect_width(m_span.bbox);
    entry.replacement_width
        = measurer.measure(entry.replacement_text, m_span.font, m_span.font_size);

    // A span without width is never scaled, however wide the replacement
    if (entry.replacement_width > 0.0 && entry.original_width > 0.0
        && entry.replacement_width > entry.original_width)
    {
        entry.scale_factor
            = std::max(entry.original_width / entry.replacement_width, 0.01);
        scaling_hint = true;
    }

    entry.requires_scaling
        = scaling_hint
          || (entry.scale_factor < 0.999 && entry.replacement_width > 0.0);
    entry.validation_failures = m_failures;
    return entry;
}

QJsonObject
SpanRewriteEntry::toJson() const
{
    QJsonArray mappings_json;
    for (const SpanMappingRef &m : mappings)
    {
        mappings_json.append(QJsonObject{
            {"q_number", m.q_label},
            {"original", to_qstring(m.original)},
            {"replacement", to_qstring(m.replacement)},
            {"entry_index", optional_int(m.entry_index)},
            {"start", optional_int(m.start)},
            {"end", optional_int(m.end)},
            {"operator_index", optional_int(m.operator_index)},
        });
    }

    QJsonArray slices_json;
    for (const SliceReplacement &s : slice_replacements)
    {
        slices_json.append(QJsonObject{
            {"normalized_start", s.normalized_start},
            {"normalized_end", s.normalized_end},
            {"raw_start", s.raw_start},
            {"raw_end", s.raw_end},
            {"replacement_text", to_qstring(s.replacement)},
        });
    }

    QJsonArray failures_json;
    for (const ValidationFailure &f : validation_failures)
    {
        failures_json.append(QJsonObject{
            {"expected", to_qstring(f.expected)},
            {"observed", to_qstring(f.observed)},
            {"start", f.start},
            {"end", f.end},
            {"replacement", to_qstring(f.replacement)},
            {"q_number", f.q_label},
            {"operator_index", optional_int(f.operator_index)},
        });
    }

    return QJsonObject{
        {"page_index", page},
        {"block_index", block},
        {"line_index", line},
        {"span_index", span},
        {"operator_index", optional_int(operator_index)},
        {"original_text", to_qstring(original_text)},
        {"replacement_text", to_qstring(replacement_text)},
        {"font", QString::fromStdString(font)},
        {"font_size", font_size},
        {"bbox", rect_json(bbox)},
        {"matrix", QJsonArray{matrix.a, matrix.b, matrix.c, matrix.d, matrix.e,
                              matrix.f}},
        {"original_width", original_width},
        {"replacement_width", replacement_width},
        {"scale_factor", scale_factor},
        {"mappings", mappings_json},
        {"slice_replacements", slices_json},
        {"overlay_fallback", overlay_fallback},
        {"requires_scaling", requires_scaling},
        {"validation_failures", failures_json},
    };
}

void
SpanRewritePlan::add(SpanRewriteEntry entry)
{
    m_pages[entry.page].push_back(std::move(entry));
}

int
SpanRewritePlan::size() const noexcept
{
    int n = 0;
    for (const auto &[page, entries] : m_pages)
        n += static_cast<int>(entries.size());
    return n;
}

QJsonDocument
SpanRewritePlan::toJson() const
{
    QJsonArray pages;
    for (const auto &[page, entries] : m_pages)
    {
        QJsonArray list;
        for (const SpanRewriteEntry &e : entries)
            list.append(e.toJson());
        pages.append(QJsonObject{{"page", page}, {"entries", list}});
    }
    return QJsonDocument(QJsonObject{{"pages", pages}});
}
