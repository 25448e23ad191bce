#include "VisualOverlay.hpp"

#include "utils.hpp"

#include <QDebug>
#include <cmath>

VisualOverlay::VisualOverlay(Document &source, Options options) noexcept
    : m_source(source), m_options(options)
{
}

void
VisualOverlay::addTarget(int page, const OverlayTarget &target)
{
    m_targets[page].push_back(target);
}

void
VisualOverlay::addTargets(int page, const MappingEntry &entry)
{
    if (!entry.match)
    {
        if (auto region = entry.regionHint())
            addTarget(page, {std::nullopt, *region});
        return;
    }

    std::set<std::pair<int, int>> lines;
    for (const GlyphRef &ref : entry.match->glyphs)
        lines.insert({ref.block, ref.line});

    if (lines.empty())
    {
        addTarget(page, {std::nullopt, entry.match->rect});
        return;
    }

    for (const auto &line : lines)
        addTarget(page, {line, entry.match->rect});
}

void
VisualOverlay::addTarget(const SpanRewriteEntry &entry)
{
    addTarget(entry.page,
              {std::make_pair(entry.block, entry.line), entry.bbox});
}

std::map<std::pair<int, int>, fz_rect>
VisualOverlay::lineRects(int page)
{
    auto cached = m_line_cache.find(page);
    if (cached != m_line_cache.end())
        return cached->second;

    std::map<std::pair<int, int>, fz_rect> rects;
    if (auto glyphs = m_source.glyphPage(page))
    {
        for (int b = 0; b < static_cast<int>(glyphs->blocks.size()); ++b)
        {
            const auto &lines = glyphs->blocks[b].lines;
            for (int l = 0; l < static_cast<int>(lines.size()); ++l)
            {
                std::vector<fz_rect> boxes;
                for (const GlyphSpan &span : lines[l].spans)
                    for (const Glyph &g : span.chars)
                        boxes.push_back(g.bbox);

                const fz_rect r = bound_rects(boxes);
                if (!rect_is_empty(r))
                    rects[{b, l}] = r;
            }
        }
    }

    m_line_cache[page] = rects;
    return rects;
}

OverlayStats
VisualOverlay::apply(Document &target)
{
    OverlayStats stats;
    double overlay_area = 0.0;
    double page_area    = 0.0;

    for (const auto &[page, targets] : m_targets)
    {
        if (targets.empty() || page >= m_source.pageCount()
            || page >= target.pageCount())
            continue;

        const fz_rect bounds = target.pageBounds(page);
        page_area += std::abs(rect_width(bounds) * rect_height(bounds));

        const auto lines = lineRects(page);
        std::set<std::pair<int, int>> processed;
        std::vector<fz_rect> painted;

        for (const OverlayTarget &t : targets)
        {
            fz_rect rect = t.bbox;
            if (t.line)
            {
                if (processed.count(*t.line))
                    continue;
                auto it = lines.find(*t.line);
                if (it != lines.end())
                    rect = it->second;
            }
            else
            {
                const bool seen = std::any_of(
                    painted.begin(), painted.end(), [&](const fz_rect &r)
                { return fz_contains_rect(r, rect); });
                if (seen)
                    continue;
            }

            if (rect_is_empty(rect))
                continue;

            bool ok = false;
            if (m_options.prefer_vector)
                ok = target.overlayVector(page, m_source, rect);
            if (!ok)
                ok = target.overlayRaster(page, m_source, rect, m_options.zoom);
            if (!ok)
            {
                qWarning() << "Overlay failed on page" << page;
                continue;
            }

            if (t.line)
                processed.insert(*t.line);
            painted.push_back(rect);
            stats.overlay_count++;
            overlay_area += std::abs(rect_width(rect) * rect_height(rect));
        }
    }

    if (overlay_area > 0.0 && page_area > 0.0)
        stats.overlay_area_pct = std::min(100.0, overlay_area / page_area * 100.0);

    qDebug() << "Overlaid" << stats.overlay_count << "regions,"
             << stats.overlay_area_pct << "% of page area";
    return stats;
}
