#include "TokenRewriter.hpp"

#include "TextNormalizer.hpp"
#include "utils.hpp"

#include <QDebug>
#include <algorithm>
#include <cmath>
#include <set>

namespace
{

constexpr double DEFAULT_EMPTY_SIZE  = 8.0;
constexpr double MIN_SHORTER_SIZE    = 6.0;
constexpr double MAX_SHORTER_SIZE    = 12.0;
constexpr double MAX_LONGER_SIZE     = 16.0;
constexpr double WIDTH_TOLERANCE     = 0.1;
constexpr double KERN_EPSILON        = 1e-6;

int
unit_length(const FontCodec::CodeUnit &u) noexcept
{
    return static_cast<int>(u.text.size());
}

// Index of the first unit starting at or after char `offset`
size_t
unit_index_at(const std::vector<FontCodec::CodeUnit> &units, int offset) noexcept
{
    int pos = 0;
    for (size_t i = 0; i < units.size(); ++i)
    {
        if (pos >= offset)
            return i;
        pos += unit_length(units[i]);
    }
    return units.size();
}

int
text_length(const std::vector<FontCodec::CodeUnit> &units) noexcept
{
    int n = 0;
    for (const auto &u : units)
        n += unit_length(u);
    return n;
}

// Replacement as the single-byte substitute font will show it. Sizing and
// encoding both work on this text so measured and shown lengths agree.
std::u32string
substitute_text(std::u32string_view text)
{
    std::u32string out;
    out.reserve(text.size());
    for (char32_t c : TextNormalizer::stripZeroWidth(text))
    {
        if (c < 0x100)
        {
            out.push_back(c);
            continue;
        }
        const std::u32string folded
            = TextNormalizer::normalizeForMatch(std::u32string_view(&c, 1));
        if (folded.empty() && is_space(c))
            out.push_back(U' ');
        for (char32_t f : folded)
            out.push_back(f < 0x100 ? f : U'?');
    }
    return out;
}

// The substitute font is a simple WinAnsi font
std::string
encode_substitute(std::u32string_view text)
{
    std::string out;
    out.reserve(text.size());
    for (char32_t c : text)
        out.push_back(static_cast<char>(c));
    return out;
}

Operand
number_operand(double v)
{
    return Operand::makeNumber(v);
}

ContentOp
make_op(std::vector<Operand> operands, const char *op)
{
    ContentOp out;
    out.operands = std::move(operands);
    out.op       = op;
    return out;
}

ContentOp
array_op(const std::vector<TjEntry> &entries)
{
    std::vector<Operand> items;
    bool has_text = false;
    for (const TjEntry &e : entries)
    {
        if (!e.keep)
            continue;
        switch (e.kind)
        {
            case TjEntry::Kind::Text:
                items.push_back(Operand::makeString(e.bytes()));
                has_text = true;
                break;
            case TjEntry::Kind::Kern:
                items.push_back(number_operand(e.value));
                break;
            case TjEntry::Kind::Other:
                items.push_back(e.other);
                break;
        }
    }
    if (!has_text)
        items.insert(items.begin(), Operand::makeString({}));
    return make_op({Operand::makeArray(std::move(items))}, "TJ");
}

// Ops that move to the next line the way ' and " do before showing
std::vector<ContentOp>
line_preamble(const ContentOp &original)
{
    std::vector<ContentOp> ops;
    if (original.op == "\"" && original.operands.size() >= 3)
    {
        ops.push_back(make_op({original.operands[0]}, "Tw"));
        ops.push_back(make_op({original.operands[1]}, "Tc"));
    }
    if (original.op == "'" || original.op == "\"")
        ops.push_back(make_op({}, "T*"));
    return ops;
}

bool
has_content(const std::vector<TjEntry> &entries) noexcept
{
    for (const TjEntry &e : entries)
        if (e.keep && (e.kind != TjEntry::Kind::Text || !e.units.empty()))
            return true;
    return false;
}

} // namespace

const char *
rewriteStrategyName(RewriteStrategy s) noexcept
{
    switch (s)
    {
        case RewriteStrategy::SubstituteFont: return "substitute_font";
        case RewriteStrategy::Literal: return "literal";
    }
    return "unknown";
}

std::optional<RewriteStrategy>
rewriteStrategyFromName(const std::string &name) noexcept
{
    if (name == "substitute_font")
        return RewriteStrategy::SubstituteFont;
    if (name == "literal")
        return RewriteStrategy::Literal;
    return std::nullopt;
}

int
RewriteOutcome::appliedCount() const noexcept
{
    return static_cast<int>(std::count(applied.begin(), applied.end(), true));
}

std::u32string
TjEntry::text() const
{
    std::u32string out;
    for (const auto &u : units)
        out += u.text;
    return out;
}

std::string
TjEntry::bytes() const
{
    std::string out;
    for (const auto &u : units)
        out += u.bytes;
    return out;
}

TokenRewriter::TokenRewriter(RewriteOptions options) noexcept
    : m_options(std::move(options))
{
}

double
TokenRewriter::substituteFontSize(std::u32string_view replacement,
                                  double target_width, size_t original_length,
                                  double ratio) noexcept
{
    if (replacement.empty())
        return DEFAULT_EMPTY_SIZE;

    const double len      = static_cast<double>(replacement.size());
    const double required = target_width / (len * ratio);

    if (replacement.size() <= (original_length ? original_length : replacement.size()))
        return std::max(MIN_SHORTER_SIZE, std::min(required, MAX_SHORTER_SIZE));
    return std::clamp(required, 4.0, MAX_LONGER_SIZE);
}

FittedText
TokenRewriter::fitReplacement(std::u32string_view replacement,
                              double target_width, double min_size,
                              double ratio)
{
    if (replacement.empty())
        return {{}, FittedText::Kind::Empty};

    const double required
        = target_width / (static_cast<double>(replacement.size()) * ratio);
    if (required >= min_size)
        return {std::u32string(replacement), FittedText::Kind::Normal};

    const int max_chars = static_cast<int>(target_width / (min_size * ratio));
    if (max_chars <= 3)
        return {std::u32string(replacement.substr(0, 1)),
                FittedText::Kind::SingleChar};

    if (max_chars <= static_cast<int>(replacement.size()))
        return {std::u32string(replacement.substr(0, max_chars - 3)) + U"...",
                FittedText::Kind::Abbreviated};

    return {std::u32string(replacement), FittedText::Kind::Normal};
}

std::vector<TjEntry>
TokenRewriter::buildEntries(const ContentOp &op, const FontCodec &codec,
                            double space_threshold)
{
    std::vector<TjEntry> entries;

    if (op.op == "TJ")
    {
        if (op.operands.empty() || !op.operands[0].isArray())
            return entries;

        for (const Operand &item : op.operands[0].items)
        {
            TjEntry e;
            if (item.isString())
            {
                e.kind  = TjEntry::Kind::Text;
                e.units = codec.decode(item.bytes);
            }
            else if (item.isNumber())
            {
                e.kind       = TjEntry::Kind::Kern;
                e.value      = item.number;
                e.adds_space = item.number <= space_threshold;
            }
            else
            {
                e.kind  = TjEntry::Kind::Other;
                e.other = item;
            }
            entries.push_back(std::move(e));
        }
    }
    else if (op.isTextShow() && !op.operands.empty()
             && op.operands.back().isString())
    {
        TjEntry e;
        e.kind  = TjEntry::Kind::Text;
        e.units = codec.decode(op.operands.back().bytes);
        entries.push_back(std::move(e));
    }

    recalculate(entries);
    return entries;
}

int
TokenRewriter::recalculate(std::vector<TjEntry> &entries) noexcept
{
    int cursor = 0;
    for (TjEntry &e : entries)
    {
        e.start = cursor;
        if (!e.keep)
        {
            e.end = cursor;
            continue;
        }
        int length = 0;
        if (e.kind == TjEntry::Kind::Text)
            length = text_length(e.units);
        else if (e.kind == TjEntry::Kind::Kern && e.adds_space)
            length = 1;
        e.end  = cursor + length;
        cursor = e.end;
    }
    return cursor;
}

void
TokenRewriter::splice(std::vector<TjEntry> &entries, int start, int end,
                      const std::vector<FontCodec::CodeUnit> &replacement)
{
    recalculate(entries);
    bool inserted = replacement.empty();

    for (TjEntry &e : entries)
    {
        if (!e.keep)
            continue;

        if (e.kind == TjEntry::Kind::Text)
        {
            if (e.start == e.end || e.end <= start || e.start >= end)
                continue;

            const size_t ua = unit_index_at(e.units, std::max(start, e.start) - e.start);
            const size_t ub = unit_index_at(e.units, std::min(end, e.end) - e.start);

            std::vector<FontCodec::CodeUnit> units(e.units.begin(),
                                                   e.units.begin() + ua);
            if (!inserted)
            {
                units.insert(units.end(), replacement.begin(), replacement.end());
                inserted = true;
            }
            units.insert(units.end(), e.units.begin() + ub, e.units.end());
            e.units = std::move(units);
        }
        else if (e.kind == TjEntry::Kind::Kern)
        {
            // A space-producing kern occupies [p, p + 1); a plain kern sits
            // between two chars and survives on the edges of the range
            const int p = e.start;
            if (e.adds_space ? (start <= p && p < end) : (start < p && p < end))
                e.keep = false;
        }
    }

    if (!inserted)
    {
        // The range covered kern spaces only
        TjEntry *before = nullptr;
        TjEntry *after  = nullptr;
        for (TjEntry &e : entries)
        {
            if (!e.keep || e.kind != TjEntry::Kind::Text)
                continue;
            if (e.end <= start)
                before = &e;
            else if (!after && e.start >= end)
                after = &e;
        }

        if (before)
            before->units.insert(before->units.end(), replacement.begin(),
                                 replacement.end());
        else if (after)
            after->units.insert(after->units.begin(), replacement.begin(),
                                replacement.end());
        else
        {
            TjEntry e;
            e.kind  = TjEntry::Kind::Text;
            e.units = replacement;
            entries.push_back(std::move(e));
        }
    }

    for (TjEntry &e : entries)
        if (e.kind == TjEntry::Kind::Text && e.units.empty())
            e.keep = false;

    recalculate(entries);
}

std::pair<std::u32string, std::map<int, double>>
TokenRewriter::state(const std::vector<TjEntry> &entries)
{
    std::u32string text;
    std::map<int, double> kerning;
    for (const TjEntry &e : entries)
    {
        if (!e.keep)
            continue;
        if (e.kind == TjEntry::Kind::Text)
            text += e.text();
        else if (e.kind == TjEntry::Kind::Kern)
        {
            if (e.adds_space)
                text.push_back(U' ');
            if (std::abs(e.value) >= KERN_EPSILON)
                kerning[static_cast<int>(text.size())] += e.value;
        }
    }
    return {text, kerning};
}

std::vector<TjEntry>
TokenRewriter::slice(const std::vector<TjEntry> &entries, int from, int to)
{
    std::vector<TjEntry> out;
    for (const TjEntry &e : entries)
    {
        if (!e.keep)
            continue;

        switch (e.kind)
        {
            case TjEntry::Kind::Text:
            {
                const int a = std::max(from, e.start);
                const int b = std::min(to, e.end);
                if (b <= a)
                    break;
                const size_t ua = unit_index_at(e.units, a - e.start);
                const size_t ub = unit_index_at(e.units, b - e.start);
                if (ua >= ub)
                    break;
                TjEntry part = e;
                part.units.assign(e.units.begin() + ua, e.units.begin() + ub);
                out.push_back(std::move(part));
                break;
            }
            case TjEntry::Kind::Kern:
                if (e.adds_space ? (from <= e.start && e.start < to)
                                 : (from <= e.start && e.start <= to))
                    out.push_back(e);
                break;
            case TjEntry::Kind::Other:
                if (from <= e.start && e.start <= to)
                    out.push_back(e);
                break;
        }
    }
    recalculate(out);
    return out;
}

std::vector<ContentOp>
TokenRewriter::toOps(const std::vector<TjEntry> &entries,
                     const ContentOp &original, bool had_kerning)
{
    int texts     = 0;
    bool extras   = false;
    const TjEntry *single = nullptr;
    for (const TjEntry &e : entries)
    {
        if (!e.keep)
            continue;
        if (e.kind == TjEntry::Kind::Text)
        {
            ++texts;
            single = &e;
        }
        else
            extras = true;
    }

    if (original.op != "TJ" && texts <= 1 && !extras && !had_kerning)
    {
        ContentOp op = original;
        op.operands.back() = Operand::makeString(single ? single->bytes() : std::string{});
        return {op};
    }

    std::vector<ContentOp> ops = line_preamble(original);
    ops.push_back(array_op(entries));
    return ops;
}

std::map<int, std::vector<TokenRewriter::Edit>>
TokenRewriter::collectEdits(const ExtractedText &extracted,
                            const std::vector<ReplacementRecord> &records) const
{
    std::map<int, std::vector<Edit>> edits;
    for (size_t r = 0; r < records.size(); ++r)
    {
        const ReplacementRecord &rec = records[r];
        bool first                   = true;
        for (int s = 0; s < static_cast<int>(extracted.segments.size()); ++s)
        {
            const Segment &seg = extracted.segments[s];
            if (seg.start >= rec.end || seg.end <= rec.start)
                continue;

            Edit edit;
            edit.local_start = std::max(rec.start, seg.start) - seg.start;
            edit.local_end   = std::min(rec.end, seg.end) - seg.start;
            edit.text        = first ? rec.replacement : std::u32string{};
            edit.record      = r;
            edit.first       = first;
            edits[s].push_back(std::move(edit));
            first = false;
        }
        if (first)
            qWarning() << "No text-show operator covers stream range" << rec.start
                       << rec.end;
    }

    for (auto &[seg, list] : edits)
        std::sort(list.begin(), list.end(), [](const Edit &a, const Edit &b)
        { return a.local_start < b.local_start; });
    return edits;
}

double
TokenRewriter::coveredWidth(const std::vector<TjEntry> &entries, int from,
                            int to, const Segment &seg, const FontCodec &codec,
                            const ReplacementRecord &record) const
{
    const double size = seg.font.size;

    if (codec.hasWidths())
    {
        double width = 0.0;
        for (const TjEntry &e : entries)
        {
            if (!e.keep)
                continue;
            if (e.kind == TjEntry::Kind::Text)
            {
                int pos = e.start;
                for (const auto &u : e.units)
                {
                    if (pos >= from && pos < to)
                    {
                        width += u.advance / 1000.0 * size + seg.font.char_spacing;
                        if (u.text == U" ")
                            width += seg.font.word_spacing;
                    }
                    pos += unit_length(u);
                }
            }
            else if (e.kind == TjEntry::Kind::Kern)
            {
                const int p = e.start;
                if (e.adds_space ? (from <= p && p < to) : (from < p && p < to))
                    width -= e.value / 1000.0 * size;
            }
        }
        if (width > 0.0)
            return width;
    }

    // The matched rect is in page space, horizontal scaling included
    const int len = to - from;
    if (record.entry && record.entry->match
        && len == record.end - record.start)
    {
        const double scale = seg.font.horizontal_scaling / 100.0;
        const double w     = rect_width(record.entry->match->rect);
        if (w > 0.0 && scale > 0.0)
            return w / scale;
    }

    return static_cast<double>(len) * size;
}

RewriteOutcome
TokenRewriter::apply(const std::vector<ContentOp> &ops,
                     const ExtractedText &extracted,
                     const std::vector<ReplacementRecord> &records,
                     const SegmentExtractor::CodecMap &codecs) const
{
    RewriteOutcome last;
    last.ops     = ops;
    last.applied.assign(records.size(), false);
    last.error   = "no rewrite strategy configured";

    for (RewriteStrategy strategy : m_options.strategies)
    {
        RewriteOutcome outcome
            = applyStrategy(strategy, ops, extracted, records, codecs);
        if (outcome.ok)
            return outcome;

        qWarning() << "Rewrite strategy" << rewriteStrategyName(strategy)
                   << "failed:" << QString::fromStdString(outcome.error);
        last.strategy = strategy;
        last.error    = outcome.error;
    }

    return last;
}

RewriteOutcome
TokenRewriter::applyStrategy(RewriteStrategy strategy,
                             const std::vector<ContentOp> &ops,
                             const ExtractedText &extracted,
                             const std::vector<ReplacementRecord> &records,
                             const SegmentExtractor::CodecMap &codecs) const
{
    switch (strategy)
    {
        case RewriteStrategy::SubstituteFont:
            return substituteFont(ops, extracted, records, codecs);
        case RewriteStrategy::Literal:
            return literal(ops, extracted, records, codecs);
    }

    RewriteOutcome outcome;
    outcome.error = "unknown strategy";
    return outcome;
}

RewriteOutcome
TokenRewriter::substituteFont(const std::vector<ContentOp> &ops,
                              const ExtractedText &extracted,
                              const std::vector<ReplacementRecord> &records,
                              const SegmentExtractor::CodecMap &codecs) const
{
    RewriteOutcome out;
    out.strategy = RewriteStrategy::SubstituteFont;
    out.ops      = ops;
    out.applied.assign(records.size(), false);

    if (m_options.substitute_resource.empty())
    {
        out.error = "no substitute font resource";
        return out;
    }

    const double ratio = m_options.fixed_width_ratio;
    std::map<int, std::vector<ContentOp>> replaced;

    for (const auto &[seg_index, edits] : collectEdits(extracted, records))
    {
        const Segment &seg = extracted.segments[seg_index];
        const ContentOp &op = ops[seg.operator_index];
        const FontCodec &codec = SegmentExtractor::codecFor(codecs, seg.font.font);

        std::vector<TjEntry> entries
            = buildEntries(op, codec, m_options.space_threshold);
        if (entries.empty())
        {
            out.error = "malformed text operator at index "
                        + std::to_string(seg.operator_index);
            return out;
        }
        if (seg.font.font.empty() || seg.font.size <= 0.0)
        {
            out.error = "no font selected for operator "
                        + std::to_string(seg.operator_index);
            return out;
        }

        const int total = recalculate(entries);
        const Operand restore_font = Operand::makeName(seg.font.font);
        const Operand restore_size = number_operand(seg.font.size);

        std::vector<ContentOp> seq = line_preamble(op);
        int cursor = 0;

        for (const Edit &edit : edits)
        {
            const std::vector<TjEntry> prefix = slice(entries, cursor, edit.local_start);
            if (has_content(prefix))
                seq.push_back(array_op(prefix));

            const ReplacementRecord &record = records[edit.record];
            const double width = coveredWidth(entries, edit.local_start,
                                              edit.local_end, seg, codec, record);

            const FittedText fitted = fitReplacement(
                substitute_text(edit.text), width, m_options.min_font_size, ratio);

            if (!edit.first || fitted.kind == FittedText::Kind::Empty)
            {
                if (width > 0.0)
                    seq.push_back(make_op(
                        {Operand::makeArray({number_operand(-width * 1000.0 / seg.font.size)})},
                        "TJ"));
                // A removal is placed as soon as its spacing is
                if (edit.first)
                    out.applied[edit.record] = true;
            }
            else
            {
                if (fitted.kind == FittedText::Kind::Abbreviated
                    || fitted.kind == FittedText::Kind::SingleChar)
                    qInfo() << "Shortened replacement to" << to_qstring(fitted.text);

                const size_t original_len
                    = static_cast<size_t>(edit.local_end - edit.local_start);
                const double size
                    = substituteFontSize(fitted.text, width, original_len, ratio);
                const double n      = static_cast<double>(fitted.text.size());
                const double actual = n * size * ratio + n * seg.font.char_spacing;
                const double diff   = width - actual;

                std::vector<Operand> items{
                    Operand::makeString(encode_substitute(fitted.text))};
                if (std::abs(diff) > WIDTH_TOLERANCE)
                    items.push_back(number_operand(-diff * 1000.0 / size));

                seq.push_back(make_op({Operand::makeName(m_options.substitute_resource),
                                       number_operand(size)},
                                      "Tf"));
                seq.push_back(make_op({Operand::makeArray(std::move(items))}, "TJ"));
                seq.push_back(make_op({restore_font, restore_size}, "Tf"));
                out.applied[edit.record] = true;
            }

            cursor = edit.local_end;
        }

        const std::vector<TjEntry> suffix = slice(entries, cursor, total);
        if (has_content(suffix))
            seq.push_back(array_op(suffix));

        replaced[seg.operator_index] = std::move(seq);
    }

    out.ops.clear();
    for (int i = 0; i < static_cast<int>(ops.size()); ++i)
    {
        auto it = replaced.find(i);
        if (it == replaced.end())
            out.ops.push_back(ops[i]);
        else
            out.ops.insert(out.ops.end(), it->second.begin(), it->second.end());
    }

    out.ok = records.empty() || out.appliedCount() > 0;
    if (!out.ok)
        out.error = "no replacement could be placed";
    return out;
}

RewriteOutcome
TokenRewriter::literal(const std::vector<ContentOp> &ops,
                       const ExtractedText &extracted,
                       const std::vector<ReplacementRecord> &records,
                       const SegmentExtractor::CodecMap &codecs) const
{
    RewriteOutcome out;
    out.strategy = RewriteStrategy::Literal;
    out.ops      = ops;
    out.applied.assign(records.size(), false);

    const auto edits = collectEdits(extracted, records);

    std::map<int, std::vector<TjEntry>> entries;
    std::map<size_t, std::vector<std::pair<int, const Edit *>>> parts;
    for (const auto &[seg_index, list] : edits)
    {
        const Segment &seg = extracted.segments[seg_index];
        std::vector<TjEntry> built = buildEntries(
            ops[seg.operator_index],
            SegmentExtractor::codecFor(codecs, seg.font.font),
            m_options.space_threshold);
        if (built.empty())
        {
            out.error = "malformed text operator at index "
                        + std::to_string(seg.operator_index);
            return out;
        }
        entries[seg_index] = std::move(built);
        for (const Edit &edit : list)
            parts[edit.record].push_back({seg_index, &edit});
    }

    std::set<int> modified;

    // Right to left so local offsets of earlier records stay valid
    for (size_t r = records.size(); r-- > 0;)
    {
        auto pit = parts.find(r);
        if (pit == parts.end())
            continue;

        std::map<int, std::vector<TjEntry>> snapshot;
        bool ok = true;
        for (const auto &[seg_index, edit] : pit->second)
        {
            std::vector<TjEntry> &target = entries[seg_index];
            if (!snapshot.count(seg_index))
                snapshot[seg_index] = target;

            const FontCodec &codec = SegmentExtractor::codecFor(
                codecs, extracted.segments[seg_index].font.font);

            std::vector<FontCodec::CodeUnit> units;
            if (!edit->text.empty())
            {
                const std::optional<std::string> encoded = codec.encode(edit->text);
                if (!encoded)
                {
                    qWarning() << "Font" << QString::fromStdString(codec.name())
                               << "cannot encode" << to_qstring(edit->text);
                    ok = false;
                    break;
                }
                units = codec.decode(*encoded);
            }

            const std::u32string before = state(target).first;
            splice(target, edit->local_start, edit->local_end, units);
            if (state(target).first == before)
            {
                ok = false;
                break;
            }
        }

        if (!ok)
        {
            for (auto &[seg_index, saved] : snapshot)
                entries[seg_index] = std::move(saved);
            qWarning() << "Replacement of stream range" << records[r].start
                       << records[r].end << "left unapplied";
            continue;
        }

        out.applied[r] = true;
        for (const auto &[seg_index, saved] : snapshot)
            modified.insert(seg_index);
    }

    if (!records.empty() && out.appliedCount() == 0)
    {
        out.error = "no replacement could be encoded";
        return out;
    }

    std::map<int, std::vector<ContentOp>> replaced;
    for (int seg_index : modified)
    {
        const Segment &seg = extracted.segments[seg_index];
        replaced[seg.operator_index] = toOps(
            entries[seg_index], ops[seg.operator_index], !seg.kerning.empty());
    }

    out.ops.clear();
    for (int i = 0; i < static_cast<int>(ops.size()); ++i)
    {
        auto it = replaced.find(i);
        if (it == replaced.end())
            out.ops.push_back(ops[i]);
        else
            out.ops.insert(out.ops.end(), it->second.begin(), it->second.end());
    }

    out.ok = true;
    return out;
}
