#include "ReplacementPlanner.hpp"

#include "TextNormalizer.hpp"
#include "utils.hpp"

#include <QDebug>
#include <algorithm>

namespace
{

bool
overlaps(const ReplacementPlanner::Range &r,
         const std::vector<ReplacementPlanner::Range> &used) noexcept
{
    for (const auto &u : used)
        if (r.first < u.second && r.second > u.first)
            return true;
    return false;
}

std::u32string
compact_compare(std::u32string_view s)
{
    return TextNormalizer::compactAscii(TextNormalizer::normalizeForCompare(s));
}

// Picks the candidate at the entry's occurrence ordinal, else the first
std::optional<ReplacementPlanner::Range>
pick(const std::vector<ReplacementPlanner::Range> &candidates,
     const MappingEntry &entry)
{
    if (candidates.empty())
        return std::nullopt;
    if (entry.occurrence_index && *entry.occurrence_index >= 0
        && static_cast<size_t>(*entry.occurrence_index) < candidates.size())
        return candidates[*entry.occurrence_index];
    return candidates.front();
}

} // namespace

bool
ReplacementPlanner::sameText(std::u32string_view observed,
                             std::u32string_view expected)
{
    const std::u32string a = TextNormalizer::stripZeroWidth(observed);
    const std::u32string b = TextNormalizer::stripZeroWidth(expected);
    if (a == b)
        return true;
    const std::u32string ca = TextNormalizer::compactAscii(a);
    return !ca.empty() && ca == TextNormalizer::compactAscii(b);
}

bool
ReplacementPlanner::matchesSurroundings(std::u32string_view stream, int start,
                                        int end, const MappingEntry &entry)
{
    if (start < 0 || end > static_cast<int>(stream.size()) || end <= start)
        return false;

    const std::u32string prefix = TextNormalizer::stripZeroWidth(entry.prefix);
    const std::u32string suffix = TextNormalizer::stripZeroWidth(entry.suffix);

    if (!prefix.empty())
    {
        const int from = std::max(0, start - static_cast<int>(prefix.size()));
        const std::u32string actual
            = compact_compare(TextNormalizer::stripZeroWidth(
                stream.substr(from, start - from)));
        const std::u32string expected = compact_compare(prefix);
        if (expected.empty())
            return true;
        return actual.size() >= expected.size()
               && actual.compare(actual.size() - expected.size(),
                                 expected.size(), expected)
                      == 0;
    }

    if (!suffix.empty())
    {
        const std::u32string actual = compact_compare(
            TextNormalizer::stripZeroWidth(stream.substr(end, suffix.size())));
        const std::u32string expected = compact_compare(suffix);
        if (expected.empty())
            return true;
        return actual.compare(0, expected.size(), expected) == 0;
    }

    return true;
}

std::optional<ReplacementPlanner::Range>
ReplacementPlanner::findInStream(std::u32string_view stream,
                                 std::u32string_view target,
                                 const MappingEntry &entry,
                                 const std::vector<Range> &used)
{
    if (target.empty())
        return std::nullopt;

    std::vector<Range> candidates;
    for (size_t idx : find_all(stream, target))
    {
        const Range r{static_cast<int>(idx),
                      static_cast<int>(idx + target.size())};
        if (overlaps(r, used)
            || !matchesSurroundings(stream, r.first, r.second, entry))
            continue;
        candidates.push_back(r);
    }
    if (auto r = pick(candidates, entry))
        return r;

    // Whitespace or punctuation drift between the stem and the stream
    const std::u32string compact_target
        = TextNormalizer::compactAlnum(TextNormalizer::stripZeroWidth(target)).text;
    if (compact_target.empty())
        return std::nullopt;

    const TextNormalizer::MappedText compact = TextNormalizer::compactAlnum(stream);
    candidates.clear();
    for (size_t idx : find_all(compact.text, compact_target))
    {
        const Range r{compact.index_map[idx],
                      compact.index_map[idx + compact_target.size() - 1] + 1};
        if (overlaps(r, used)
            || !matchesSurroundings(stream, r.first, r.second, entry))
            continue;
        candidates.push_back(r);
    }
    return pick(candidates, entry);
}

std::vector<ReplacementRecord>
ReplacementPlanner::plan(std::u32string_view stream,
                         std::vector<MappingEntry> &entries,
                         std::set<std::string> &used_fingerprints)
{
    std::vector<ReplacementRecord> records;
    std::vector<Range> used;
    const int n = static_cast<int>(stream.size());

    for (MappingEntry &entry : entries)
    {
        if (!entry.match || entry.replacement.empty())
            continue;

        const std::string &key = entry.fingerprint_key;
        if (!key.empty() && used_fingerprints.count(key))
            continue;

        const std::u32string expected
            = entry.match->text.empty() ? entry.original : entry.match->text;

        std::optional<Range> range;
        if (entry.stream)
        {
            const int start = std::clamp(entry.stream->start, 0, n);
            const int end   = std::clamp(entry.stream->end, start, n);
            const Range r{start, end};
            const std::u32string candidate = TextNormalizer::stripZeroWidth(
                stream.substr(start, end - start));
            const std::u32string reference = TextNormalizer::stripZeroWidth(
                entry.stream->text.empty() ? entry.original : entry.stream->text);

            if (end > start && !overlaps(r, used)
                && (reference.empty() || candidate == reference)
                && matchesSurroundings(stream, start, end, entry))
                range = r;
        }

        if (!range)
            range = findInStream(stream, expected, entry, used);

        if (!range)
        {
            qWarning() << "Stream text not found for question" << entry.q_label
                       << ":" << to_qstring(entry.original);
            continue;
        }

        if (range->second <= range->first)
        {
            qWarning() << "Rejecting empty stream range for" << to_qstring(entry.original);
            continue;
        }

        if (overlaps(*range, used))
        {
            qWarning() << "Stream range" << range->first << range->second
                       << "conflicts with an accepted replacement";
            continue;
        }

        const std::u32string observed(
            stream.substr(range->first, range->second - range->first));
        if (!sameText(observed, expected) && !sameText(observed, entry.original))
        {
            qWarning() << "Stream range mismatch for" << to_qstring(entry.original)
                       << "observed" << to_qstring(observed);
            continue;
        }

        if (!key.empty())
            used_fingerprints.insert(key);
        used.push_back(*range);

        ReplacementRecord record;
        record.start           = range->first;
        record.end             = range->second;
        record.replacement     = entry.replacement;
        record.observed        = observed;
        record.entry           = &entry;
        record.fingerprint_key = key;
        records.push_back(std::move(record));
    }

    std::sort(records.begin(), records.end(),
              [](const ReplacementRecord &a, const ReplacementRecord &b)
    { return a.start < b.start; });
    return records;
}
