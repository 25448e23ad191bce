#include "MappingContext.hpp"

#include "TextNormalizer.hpp"
#include "utils.hpp"

#include <QDebug>
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <algorithm>
#include <cstdlib>
#include <tuple>

namespace
{

constexpr int CONTEXT_WINDOW = 24;

std::optional<int>
int_value(const QJsonValue &v)
{
    if (v.isDouble())
        return static_cast<int>(v.toDouble());
    if (v.isString())
    {
        bool ok       = false;
        const int out = v.toString().trimmed().toInt(&ok);
        if (ok)
            return out;
    }
    return std::nullopt;
}

std::optional<fz_rect>
rect_value(const QJsonValue &v)
{
    const QJsonArray arr = v.toArray();
    if (arr.size() != 4)
        return std::nullopt;
    for (const QJsonValue &n : arr)
        if (!n.isDouble())
            return std::nullopt;
    return fz_make_rect(arr[0].toDouble(), arr[1].toDouble(),
                        arr[2].toDouble(), arr[3].toDouble());
}

std::vector<fz_quad>
quads_value(const QJsonValue &v)
{
    std::vector<fz_quad> quads;
    for (const QJsonValue &q : v.toArray())
    {
        const QJsonArray arr = q.toArray();
        if (arr.size() != 8)
            continue;
        float f[8];
        bool ok = true;
        for (int i = 0; i < 8; ++i)
        {
            ok   = ok && arr[i].isDouble();
            f[i] = static_cast<float>(arr[i].toDouble());
        }
        if (!ok)
            continue;
        // ul, ur, ll, lr
        quads.push_back(fz_make_quad(f[0], f[1], f[2], f[3], f[4], f[5], f[6],
                                     f[7]));
    }
    return quads;
}

std::vector<std::string>
string_list(const QJsonValue &v)
{
    std::vector<std::string> out;
    if (v.isString())
    {
        if (!v.toString().isEmpty())
            out.push_back(v.toString().toStdString());
        return out;
    }
    for (const QJsonValue &item : v.toArray())
    {
        const QString s = item.toVariant().toString();
        if (!s.isEmpty())
            out.push_back(s.toStdString());
    }
    return out;
}

std::u32string
clean_text(const QJsonValue &v)
{
    return trim(TextNormalizer::stripZeroWidth(to_u32(v.toString())));
}

std::vector<std::u32string>
split_lines(std::u32string_view text)
{
    std::vector<std::u32string> parts;
    size_t start = 0;
    for (size_t i = 0; i <= text.size(); ++i)
    {
        if (i < text.size() && text[i] != U'\n' && text[i] != U'\r')
            continue;
        std::u32string part = trim(text.substr(start, i - start));
        if (!part.empty())
            parts.push_back(std::move(part));
        start = i + 1;
    }
    return parts;
}

} // namespace

std::optional<fz_rect>
MappingEntry::regionHint() const noexcept
{
    if (selection_bbox)
        return selection_bbox;
    return stem_bbox;
}

MappingContext
MappingContext::fromFile(const QString &path)
{
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly))
        throw MappingError("Cannot open mapping file: " + path.toStdString());
    return fromJson(file.readAll());
}

MappingContext
MappingContext::fromJson(const QByteArray &json)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(json, &err);
    if (err.error != QJsonParseError::NoError)
        throw MappingError("Invalid mapping JSON: "
                           + err.errorString().toStdString());

    MappingContext context;
    QJsonArray questions;
    if (doc.isArray())
        questions = doc.array();
    else
    {
        const QJsonObject root = doc.object();
        context.m_run_id       = root.value("run_id").toString();
        questions              = root.value("questions").toArray();
    }

    for (const QJsonValue &q : questions)
        if (q.isObject())
            context.addQuestion(q.toObject());

    return context;
}

void
MappingContext::addQuestion(const QJsonObject &question)
{
    const QString q_label = question.value("q_number").toVariant().toString();
    const std::u32string stem_text
        = TextNormalizer::stripZeroWidth(to_u32(question.value("stem_text").toString()));
    const std::optional<int> page
        = safePageIndex(int_value(question.value("page")));
    const std::optional<fz_rect> stem_bbox
        = rect_value(question.value("stem_bbox"));
    const std::vector<std::string> stem_spans
        = string_list(question.value("stem_spans"));

    const QJsonArray mappings = question.value("substring_mappings").toArray();
    for (int entry_index = 0; entry_index < mappings.size(); ++entry_index)
    {
        if (!mappings[entry_index].isObject())
            continue;
        const QJsonObject mapping = mappings[entry_index].toObject();

        MappingEntry entry;
        entry.q_label     = q_label;
        entry.entry_index = entry_index;
        entry.original    = clean_text(mapping.value("original"));
        entry.replacement = clean_text(mapping.value("replacement"));
        if (entry.original.empty() || entry.replacement.empty())
            continue;

        const std::string label = "Question " + q_label.toStdString()
                                  + " mapping '" + u32_to_utf8(entry.original)
                                  + "'";

        const auto start_pos = int_value(mapping.value("start_pos"));
        const auto end_pos   = int_value(mapping.value("end_pos"));
        if (!start_pos || !end_pos)
            throw MappingError(label + " missing valid span positions");
        if (*end_pos <= *start_pos)
            throw MappingError(label + " has invalid span bounds");

        std::tie(entry.start_pos, entry.end_pos) = normalizeSpanPosition(
            stem_text, entry.original, *start_pos, *end_pos);

        entry.stem_text = stem_text;
        entry.page      = page;
        entry.stem_bbox = stem_bbox;
        if (auto selection_page = int_value(mapping.value("selection_page")))
            entry.page = *selection_page >= 0 ? selection_page : std::nullopt;

        entry.selection_bbox  = rect_value(mapping.value("selection_bbox"));
        entry.selection_quads = quads_value(mapping.value("selection_quads"));
        if (!entry.selection_bbox && !entry.selection_quads.empty())
            entry.selection_bbox = bound_quads(entry.selection_quads);

        for (const char *key : {"selection_span_ids", "span_ids", "spans"})
        {
            entry.span_ids = string_list(mapping.value(key));
            if (!entry.span_ids.empty())
                break;
        }
        if (entry.span_ids.empty())
            entry.span_ids = stem_spans;

        const QJsonObject path = mapping.value("glyph_path").toObject();
        if (!path.isEmpty())
        {
            GlyphPath hint;
            hint.block      = path.value("block").toInt();
            hint.line       = path.value("line").toInt();
            hint.span       = path.value("span").toInt();
            hint.char_start = path.value("char_start").toInt();
            hint.char_end   = path.value("char_end").toInt();
            if (hint.char_end > hint.char_start)
                entry.glyph_hint = hint;
        }

        entry.overlay_hint = mapping.value("overlay_fallback").toBool(false);
        entry.scaling_hint = mapping.value("requires_scaling").toBool(false);

        const auto lines = splitMultiSpan(entry.original, entry.replacement);
        if (lines.size() < 2)
        {
            deriveContext(entry);
            m_entries.push_back(std::move(entry));
            continue;
        }

        // No text line of a page spans a line break: one entry per line
        int cursor = entry.start_pos;
        for (size_t i = 0; i < lines.size(); ++i)
        {
            const size_t at = std::u32string_view(stem_text)
                                  .substr(0, entry.end_pos)
                                  .find(lines[i].first, cursor);
            if (at == std::u32string_view::npos)
                throw MappingError(label + " line '"
                                   + u32_to_utf8(lines[i].first)
                                   + "' is not part of the stem text");

            MappingEntry part = entry;
            part.original     = lines[i].first;
            part.replacement  = lines[i].second;
            part.start_pos    = static_cast<int>(at);
            part.end_pos      = part.start_pos
                             + static_cast<int>(part.original.size());
            part.line         = static_cast<int>(i);
            part.glyph_hint.reset();
            deriveContext(part);

            cursor = part.end_pos;
            m_entries.push_back(std::move(part));
        }
    }
}

void
MappingContext::deriveContext(MappingEntry &entry)
{
    const std::u32string &stem = entry.stem_text;
    entry.occurrence_index
        = computeOccurrenceIndex(stem, entry.original, entry.start_pos);

    const int prefix_from = std::max(0, entry.start_pos - CONTEXT_WINDOW);
    entry.prefix = stem.substr(prefix_from, entry.start_pos - prefix_from);
    entry.suffix = entry.end_pos < static_cast<int>(stem.size())
                       ? stem.substr(entry.end_pos, CONTEXT_WINDOW)
                       : std::u32string{};
    entry.fingerprint_key = fingerprintKey(entry.prefix, entry.original,
                                           entry.suffix, *entry.occurrence_index);
}

std::map<int, std::vector<MappingEntry>>
MappingContext::byPage() const
{
    std::map<int, std::vector<MappingEntry>> pages;
    for (const MappingEntry &entry : m_entries)
        if (entry.page)
            pages[*entry.page].push_back(entry);

    for (auto &[page, entries] : pages)
        std::stable_sort(entries.begin(), entries.end(),
                         [](const MappingEntry &a, const MappingEntry &b)
        {
            if (a.start_pos != b.start_pos)
                return a.start_pos < b.start_pos;
            return a.entry_index < b.entry_index;
        });

    return pages;
}

std::u32string
MappingContext::markerFor(const QString &run_id, const MappingEntry &entry)
{
    const QString context = QString("%1:structured:%2:%3:%4")
                                .arg(run_id, entry.q_label)
                                .arg(entry.entry_index)
                                .arg(entry.line);
    return TextNormalizer::encodeMarker(to_u32(context));
}

std::optional<int>
MappingContext::safePageIndex(std::optional<int> page) noexcept
{
    if (!page || *page < 0)
        return std::nullopt;
    if (*page == 0)
        return 0;
    return *page - 1;
}

std::pair<int, int>
MappingContext::normalizeSpanPosition(std::u32string_view stem,
                                      std::u32string_view original, int start,
                                      int end)
{
    const int len = static_cast<int>(original.size());
    const int n   = static_cast<int>(stem.size());
    start         = std::max(start, 0);
    if (end < start)
        end = start + len;

    if (end - start == len && end <= n && stem.substr(start, len) == original)
        return {start, end};

    // Drift of a few characters: search around the requested range
    const int window      = std::max(len + 12, CONTEXT_WINDOW);
    const int local_start = std::min(std::max(0, start - window), n);
    const int local_end   = std::min(n, end + window);
    if (local_end > local_start)
    {
        const size_t idx
            = stem.substr(local_start, local_end - local_start).find(original);
        if (idx != std::u32string_view::npos)
            return {local_start + static_cast<int>(idx),
                    local_start + static_cast<int>(idx) + len};
    }

    if (start <= n)
    {
        const size_t idx = stem.find(original, start);
        if (idx != std::u32string_view::npos)
            return {static_cast<int>(idx), static_cast<int>(idx) + len};
    }

    throw MappingError("Unable to align substring '" + u32_to_utf8(original)
                       + "' within stem text");
}

int
MappingContext::computeOccurrenceIndex(std::u32string_view stem,
                                       std::u32string_view original,
                                       int target) noexcept
{
    const std::vector<size_t> hits = find_all(stem, original);
    if (hits.empty())
        return 0;

    int best = 0;
    for (int i = 0; i < static_cast<int>(hits.size()); ++i)
    {
        if (static_cast<int>(hits[i]) == target)
            return i;
        if (std::abs(static_cast<int>(hits[i]) - target)
            < std::abs(static_cast<int>(hits[best]) - target))
            best = i;
    }
    return best;
}

std::string
MappingContext::fingerprintKey(std::u32string_view prefix,
                               std::u32string_view original,
                               std::u32string_view suffix, int occurrence)
{
    const std::string raw = u32_to_utf8(prefix) + "|" + u32_to_utf8(original)
                            + "|" + u32_to_utf8(suffix) + "|"
                            + std::to_string(occurrence);
    return sha1_hex(raw);
}

std::vector<std::pair<std::u32string, std::u32string>>
MappingContext::splitMultiSpan(std::u32string_view original,
                               std::u32string_view replacement)
{
    std::vector<std::pair<std::u32string, std::u32string>> pairs;
    const auto originals      = split_lines(original);
    auto replacements         = split_lines(replacement);
    if (originals.empty())
        return pairs;
    if (replacements.empty())
        replacements = originals;
    while (replacements.size() < originals.size())
        replacements.push_back(replacements.back());

    for (size_t i = 0; i < originals.size(); ++i)
        pairs.emplace_back(originals[i], replacements[i]);
    return pairs;
}
