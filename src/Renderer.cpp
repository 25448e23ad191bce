#include "Renderer.hpp"

#include "ReplacementPlanner.hpp"
#include "SegmentExtractor.hpp"
#include "StreamAligner.hpp"
#include "SubstringLocator.hpp"
#include "TextMeasurer.hpp"
#include "utils.hpp"

#include <QDebug>
#include <QJsonArray>
#include <algorithm>
#include <iterator>
#include <map>
#include <tuple>

namespace
{

const ReplacementRecord *
record_for(const std::vector<ReplacementRecord> &records,
           const MappingEntry &entry) noexcept
{
    for (const ReplacementRecord &r : records)
        if (r.entry == &entry)
            return &r;
    return nullptr;
}

} // namespace

const char *
rendererKindName(RendererKind kind) noexcept
{
    switch (kind)
    {
        case RendererKind::StreamRewrite:
            return "stream";
        case RendererKind::Hybrid:
            return "hybrid";
        case RendererKind::PlanOnly:
            return "plan";
        case RendererKind::DualLayer:
            return "dual";
    }
    return "stream";
}

std::optional<RendererKind>
rendererKindFromName(const std::string &name) noexcept
{
    if (name == "stream")
        return RendererKind::StreamRewrite;
    if (name == "hybrid")
        return RendererKind::Hybrid;
    if (name == "plan")
        return RendererKind::PlanOnly;
    if (name == "dual")
        return RendererKind::DualLayer;
    return std::nullopt;
}

QJsonObject
RenderStats::toJson() const
{
    QJsonArray failed;
    for (const FailedPage &f : failed_pages)
        failed.append(QJsonObject{{"page", f.page},
                                  {"reason", QString::fromStdString(f.reason)}});

    return QJsonObject{
        {"pages", pages},
        {"text_show_ops", text_show_ops},
        {"replacements_applied", replacements_applied},
        {"matches_found", matches_found},
        {"tokens_scanned", tokens_scanned},
        {"failed_pages", failed},
        {"overlay_count", overlay_count},
        {"overlay_area_pct", overlay_area_pct},
        {"invisible_layers", invisible_layers},
    };
}

Renderer::Renderer(RenderOptions options) noexcept : m_options(std::move(options))
{
}

RenderResult
Renderer::render(RenderSession &session, const std::string &pdf_bytes,
                 const MappingContext &context)
{
    if (!session.isValid())
        throw RenderError("MuPDF context is not available");

    session.begin(context.runId());

    Document source(session.context());
    if (!source.openFromBytes(pdf_bytes))
        throw RenderError("Cannot open the input document");

    Document target(session.context());
    if (writesDocument() && !target.openFromBytes(pdf_bytes))
        throw RenderError("Cannot open the input document");

    RenderResult result;
    result.stats.pages = source.pageCount();

    auto by_page = context.byPage();
    std::vector<PageWork> pages;
    pages.reserve(by_page.size());

    for (auto &[page, entries] : by_page)
    {
        if (page >= result.stats.pages)
        {
            qWarning() << "Page" << page << "is out of range for"
                       << entries.size() << "mapping entries";
            result.stats.failed_pages.push_back({page, "page out of range"});
            continue;
        }

        PageWork work;
        work.page    = page;
        work.entries = std::move(entries);
        locate(session, source, work, result.stats);
        if (rewritesStreams())
            rewrite(session, source, target, work, result.stats);
        pages.push_back(std::move(work));
    }

    if (!context.entries().empty() && pages.empty())
        throw RenderError("No mapping entry resolves to a page of the document");

    if (rewritesStreams())
    {
        auto bytes = target.saveToBytes();
        if (!bytes)
            throw RenderError("Cannot serialise the rewritten document");
        result.rewritten_bytes = std::move(*bytes);
    }
    else
        result.rewritten_bytes = pdf_bytes;
    result.bytes = result.rewritten_bytes;

    if (m_options.build_plan || kind() == RendererKind::PlanOnly)
    {
        Base14Measurer measurer(session.context());
        SpanRewritePlan plan;
        for (const PageWork &work : pages)
            buildPlan(session, source, work, measurer, plan);
        result.plan = std::move(plan);
    }

    finish(session, source, target, pages, result);

    for (PageWork &work : pages)
    {
        for (ReplacementRecord &r : work.records)
            r.entry = nullptr;
        std::move(work.entries.begin(), work.entries.end(),
                  std::back_inserter(result.entries));
    }

    const RenderStats &s = result.stats;
    qInfo() << rendererKindName(kind()) << "render:" << s.pages << "pages,"
            << s.matches_found << "matches," << s.replacements_applied
            << "replacements," << s.text_show_ops << "text-show operators,"
            << s.failed_pages.size() << "failed pages";
    qDebug() << "Span cache of run" << session.runId() << "holds"
             << session.cachedPages() << "pages";
    return result;
}

void
Renderer::finish(RenderSession &, Document &, Document &,
                 std::vector<PageWork> &, RenderResult &)
{
}

void
Renderer::locate(RenderSession &session, Document &source, PageWork &work,
                 RenderStats &stats)
{
    const SpanIndex *spans = session.spans(source, work.page);
    if (!spans)
    {
        stats.failed_pages.push_back({work.page, "no text layer"});
        return;
    }

    SubstringLocator locator(*spans);
    std::vector<fz_rect> used_rects;
    std::set<std::string> used_fingerprints;

    for (MappingEntry &entry : work.entries)
    {
        if (!entry.fingerprint_key.empty()
            && session.consumedFingerprints().count(entry.fingerprint_key))
        {
            qDebug() << "Fingerprint of" << entry.q_label
                     << "was consumed on an earlier page";
            continue;
        }

        auto location = locator.locate(entry, used_rects, used_fingerprints);
        if (!location)
        {
            qWarning() << "Cannot locate" << to_qstring(entry.original)
                       << "of question" << entry.q_label << "on page"
                       << work.page;
            continue;
        }

        used_rects.push_back(location->rect);
        if (!entry.fingerprint_key.empty())
            used_fingerprints.insert(entry.fingerprint_key);
        stats.matches_found++;
    }
}

void
Renderer::rewrite(RenderSession &session, Document &source, Document &target,
                  PageWork &work, RenderStats &stats)
{
    const int page = work.page;
    auto ops       = target.contentOps(page);
    if (!ops)
    {
        stats.failed_pages.push_back({page, "content stream cannot be parsed"});
        return;
    }
    stats.tokens_scanned += static_cast<int>(ops->size());

    const auto codecs = target.fontCodecs(page);
    const ExtractedText extracted
        = SegmentExtractor::extract(*ops, codecs, m_options.rewrite.space_threshold);
    stats.text_show_ops += extracted.text_show_ops;

    const std::u32string stream = extracted.text();
    if (const GlyphPage *glyphs = session.glyphPage(source, page))
        StreamAligner::attach(*glyphs, stream, work.entries,
                              m_options.min_confidence);

    std::set<std::string> page_fingerprints;
    work.records = ReplacementPlanner::plan(stream, work.entries, page_fingerprints);

    for (ReplacementRecord &record : work.records)
    {
        for (const Segment &seg : extracted.segments)
        {
            if (seg.end > record.start && seg.start < record.end)
            {
                record.operator_index = seg.operator_index;
                break;
            }
        }
    }

    if (work.records.empty())
        return;

    RewriteOptions options = m_options.rewrite;
    const bool wants_substitute
        = std::find(options.strategies.begin(), options.strategies.end(),
                    RewriteStrategy::SubstituteFont)
          != options.strategies.end();
    if (wants_substitute)
    {
        if (auto name = target.substituteFontKey(page))
            options.substitute_resource = *name;
    }

    TokenRewriter rewriter(options);
    RewriteOutcome outcome = rewriter.apply(*ops, extracted, work.records, codecs);

    // The font resource is only added once operators refer to it
    if (outcome.ok && outcome.strategy == RewriteStrategy::SubstituteFont)
    {
        const auto name = target.addSubstituteFont(page, m_options.substitute_font);
        if (!name || *name != options.substitute_resource)
        {
            outcome.ok    = false;
            outcome.error = "substitute font cannot be added";
        }
    }

    if (!outcome.ok)
    {
        qWarning() << "Page" << page << "keeps its original content:"
                   << QString::fromStdString(outcome.error);
        stats.failed_pages.push_back({page, outcome.error});
        return;
    }

    if (!target.setContentOps(page, outcome.ops))
    {
        stats.failed_pages.push_back({page, "content stream cannot be written"});
        return;
    }

    for (size_t i = 0; i < work.records.size() && i < outcome.applied.size(); ++i)
    {
        work.records[i].applied = outcome.applied[i];
        if (outcome.applied[i] && !work.records[i].fingerprint_key.empty())
            session.consumedFingerprints().insert(work.records[i].fingerprint_key);
    }

    const int applied = outcome.appliedCount();
    stats.replacements_applied += applied;
    qDebug() << "Page" << page << ":" << applied << "of" << work.records.size()
             << "replacements applied with"
             << rewriteStrategyName(outcome.strategy);
}

bool
Renderer::needsOverlay(const MappingEntry &entry,
                       const std::vector<ReplacementRecord> &records) const
{
    if (!entry.match)
        return false;

    if (m_options.overlay.all_spans || entry.overlay_hint)
        return true;

    if (entry.alignment_confidence
        && *entry.alignment_confidence < m_options.overlay.confidence_threshold)
        return true;

    if (!rewritesStreams())
        return false;

    const ReplacementRecord *record = record_for(records, entry);
    return !record || !record->applied;
}

void
Renderer::buildPlan(RenderSession &session, Document &source,
                    const PageWork &work, const TextMeasurer &measurer,
                    SpanRewritePlan &plan)
{
    const SpanIndex *spans = session.spans(source, work.page);
    if (!spans)
        return;

    using SpanKey = std::tuple<int, int, int>;
    std::map<SpanKey, SpanRewriteAccumulator> accumulators;

    for (const MappingEntry &entry : work.entries)
    {
        if (!entry.match)
            continue;

        // Raw char range of the match inside each span it touches
        std::map<SpanKey, std::pair<int, int>> parts;
        for (const GlyphRef &g : entry.match->glyphs)
        {
            auto [it, inserted] = parts.try_emplace(
                SpanKey{g.block, g.line, g.span}, g.index, g.index + 1);
            if (!inserted)
            {
                it->second.first  = std::min(it->second.first, g.index);
                it->second.second = std::max(it->second.second, g.index + 1);
            }
        }

        const ReplacementRecord *record = record_for(work.records, entry);
        const bool overlay              = needsOverlay(entry, work.records);
        bool first                      = true;

        for (const auto &[key, range] : parts)
        {
            const auto [b, l, s]     = key;
            const SpanRecord *span = spans->find(b, l, s);
            if (!span)
                continue;

            const auto [start, end] = SpanRewriteAccumulator::rawToNormalized(
                *span, range.first, range.second);

            SpanMappingRef ref;
            ref.q_label     = entry.q_label;
            ref.original    = parts.size() == 1
                                  ? entry.original
                                  : span->raw_text.substr(range.first,
                                                          range.second - range.first);
            ref.replacement = first ? entry.replacement : std::u32string{};
            ref.entry_index = entry.entry_index;
            ref.start       = start;
            ref.end         = end;
            if (record)
                ref.operator_index = record->operator_index;

            std::u32string replacement = ref.replacement;
            auto &acc = accumulators.try_emplace(key, *span).first->second;
            if (!acc.addReplacement(start, end, std::move(replacement),
                                    std::move(ref), overlay, entry.scaling_hint))
                qDebug() << "Dropped overlapping slice of question" << entry.q_label
                         << "in" << QString::fromStdString(span->id());
            first = false;
        }
    }

    for (auto &[key, acc] : accumulators)
    {
        auto entry = acc.buildEntry(work.page, measurer);
        for (const ValidationFailure &f : acc.validationFailures())
            qWarning() << "Span" << QString::fromStdString(acc.span().id())
                       << "expected" << to_qstring(f.expected) << "but shows"
                       << to_qstring(f.observed) << "for question" << f.q_label;
        if (entry)
            plan.add(std::move(*entry));
    }
}

void
HybridRenderer::finish(RenderSession &, Document &source, Document &target,
                       std::vector<PageWork> &pages, RenderResult &result)
{
    if (!m_options.overlay.enabled)
        return;

    VisualOverlay overlay(source, {m_options.overlay.prefer_vector,
                                   m_options.overlay.zoom});

    for (const PageWork &work : pages)
        for (const MappingEntry &entry : work.entries)
            if (needsOverlay(entry, work.records))
                overlay.addTargets(work.page, entry);

    if (m_options.overlay.all_spans && result.plan)
        for (const auto &[page, entries] : result.plan->pages())
            for (const SpanRewriteEntry &e : entries)
                overlay.addTarget(e);

    if (overlay.empty())
        return;

    const OverlayStats stats       = overlay.apply(target);
    result.stats.overlay_count    = stats.overlay_count;
    result.stats.overlay_area_pct = stats.overlay_area_pct;

    auto bytes = target.saveToBytes();
    if (!bytes)
        throw RenderError("Cannot serialise the overlaid document");
    result.bytes = std::move(*bytes);
}

void
DualLayerRenderer::finish(RenderSession &session, Document &, Document &target,
                          std::vector<PageWork> &pages, RenderResult &result)
{
    for (const PageWork &work : pages)
        for (const MappingEntry &entry : work.entries)
        {
            if (!entry.match)
                continue;

            const std::u32string text
                = entry.replacement
                  + MappingContext::markerFor(session.runId(), entry);
            if (target.appendInvisibleText(work.page, entry.match->rect,
                                           entry.match->font_size, text))
                ++result.stats.invisible_layers;
            else
                qWarning() << "No invisible layer for question" << entry.q_label
                           << "on page" << work.page + 1;
        }

    auto bytes = target.saveToBytes();
    if (!bytes)
        throw RenderError("Cannot serialise the layered document");
    result.bytes = std::move(*bytes);
}

std::unique_ptr<Renderer>
makeRenderer(RendererKind kind, RenderOptions options)
{
    switch (kind)
    {
        case RendererKind::StreamRewrite:
            return std::make_unique<StreamRewriteRenderer>(std::move(options));
        case RendererKind::Hybrid:
            return std::make_unique<HybridRenderer>(std::move(options));
        case RendererKind::PlanOnly:
            return std::make_unique<PlanOnlyRenderer>(std::move(options));
        case RendererKind::DualLayer:
            return std::make_unique<DualLayerRenderer>(std::move(options));
    }
    return std::make_unique<StreamRewriteRenderer>(std::move(options));
}
