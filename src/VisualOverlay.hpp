#pragma once

// Paints regions of the original page over the rewritten one, for spans
// whose rewrite is missing or not trusted to look right.

#include "Document.hpp"
#include "MappingContext.hpp"
#include "SpanRewritePlan.hpp"

#include <map>
#include <optional>
#include <set>
#include <utility>
#include <vector>

struct OverlayTarget
{
    // Source line the target sits on, when known
    std::optional<std::pair<int, int>> line;
    fz_rect bbox{};
};

struct OverlayStats
{
    int overlay_count{0};
    // Overlaid area over the area of the pages that got overlays, in percent
    double overlay_area_pct{0.0};
};

class VisualOverlay
{
public:
    struct Options
    {
        bool prefer_vector{true};
        float zoom{3.0f};
    };

    // `source` is the unmodified document and must outlive the overlay
    VisualOverlay(Document &source, Options options) noexcept;

    void addTarget(int page, const OverlayTarget &target);
    void addTargets(int page, const MappingEntry &entry);
    void addTarget(const SpanRewriteEntry &entry);

    inline bool empty() const noexcept
    {
        return m_targets.empty();
    }

    // Each source line is painted once per page. Vector first, raster when
    // the vector graft fails.
    OverlayStats apply(Document &target);

    // Union of the glyph boxes of every line of the source page
    std::map<std::pair<int, int>, fz_rect> lineRects(int page);

private:
    Document &m_source;
    Options m_options;
    std::map<int, std::vector<OverlayTarget>> m_targets;
    std::map<int, std::map<std::pair<int, int>, fz_rect>> m_line_cache;
};
