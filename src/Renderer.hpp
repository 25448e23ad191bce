#pragma once

// Renderers turn a PDF and a mapping context into the rewritten PDF

#include "MappingContext.hpp"
#include "RenderSession.hpp"
#include "SpanRewritePlan.hpp"
#include "TokenRewriter.hpp"
#include "VisualOverlay.hpp"

#include <QJsonObject>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class RenderError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

enum class RendererKind
{
    StreamRewrite = 0,
    Hybrid,
    PlanOnly,
    DualLayer,
};

const char *
rendererKindName(RendererKind kind) noexcept;

// Accepts "stream", "hybrid", "plan" and "dual"
std::optional<RendererKind>
rendererKindFromName(const std::string &name) noexcept;

struct RenderOptions
{
    RewriteOptions rewrite;
    std::string substitute_font{"Courier"};
    double min_confidence{0.5};

    struct overlay
    {
        bool enabled{true};
        bool prefer_vector{true};
        float zoom{3.0f};
        double confidence_threshold{0.8};
        bool all_spans{false};
    } overlay{};

    bool build_plan{false};
};

struct FailedPage
{
    int page{0};
    std::string reason;
};

struct RenderStats
{
    int pages{0};
    int text_show_ops{0};
    int replacements_applied{0};
    int matches_found{0};
    int tokens_scanned{0};
    std::vector<FailedPage> failed_pages;
    int overlay_count{0};
    double overlay_area_pct{0.0};
    int invisible_layers{0};

    QJsonObject toJson() const;
};

struct RenderResult
{
    // Final document
    std::string bytes;
    // Document after the stream rewrite, before any overlay
    std::string rewritten_bytes;
    RenderStats stats;
    std::optional<SpanRewritePlan> plan;
    // Entries of every page with the match data written while rendering
    std::vector<MappingEntry> entries;
};

class Renderer
{
public:
    explicit Renderer(RenderOptions options) noexcept;
    virtual ~Renderer() = default;

    virtual RendererKind kind() const noexcept = 0;

    // Throws RenderError when the document cannot be opened or no mapping
    // entry resolves to a page.
    RenderResult render(RenderSession &session, const std::string &pdf_bytes,
                        const MappingContext &context);

protected:
    struct PageWork
    {
        int page{0};
        std::vector<MappingEntry> entries;
        std::vector<ReplacementRecord> records;
    };

    // Hooks around the shared locate step
    virtual bool rewritesStreams() const noexcept
    {
        return true;
    }

    // Whether finish() writes to the target document
    virtual bool writesDocument() const noexcept
    {
        return rewritesStreams();
    }

    virtual void finish(RenderSession &session, Document &source,
                        Document &target, std::vector<PageWork> &pages,
                        RenderResult &result);

    // Finds every entry of the page, filling in its match
    void locate(RenderSession &session, Document &source, PageWork &work,
                RenderStats &stats);

    // Rewrites the text-show operators of one page of `target`
    void rewrite(RenderSession &session, Document &source, Document &target,
                 PageWork &work, RenderStats &stats);

    // Span plan entries for the located entries of one page
    void buildPlan(RenderSession &session, Document &source,
                   const PageWork &work, const TextMeasurer &measurer,
                   SpanRewritePlan &plan);

    // Whether the entry's region should be painted from the original
    bool needsOverlay(const MappingEntry &entry,
                      const std::vector<ReplacementRecord> &records) const;

    RenderOptions m_options;
};

class StreamRewriteRenderer : public Renderer
{
public:
    using Renderer::Renderer;

    RendererKind kind() const noexcept override
    {
        return RendererKind::StreamRewrite;
    }
};

// Stream rewrite followed by an overlay of the original glyphs wherever the
// rewrite is missing or not trusted.
class HybridRenderer : public Renderer
{
public:
    using Renderer::Renderer;

    RendererKind kind() const noexcept override
    {
        return RendererKind::Hybrid;
    }

protected:
    void finish(RenderSession &session, Document &source, Document &target,
                std::vector<PageWork> &pages, RenderResult &result) override;
};

// Locates entries and produces the span plan; the document is not touched
class PlanOnlyRenderer : public Renderer
{
public:
    using Renderer::Renderer;

    RendererKind kind() const noexcept override
    {
        return RendererKind::PlanOnly;
    }

protected:
    bool rewritesStreams() const noexcept override
    {
        return false;
    }
};

// Leaves the visible text alone and adds an invisible (render mode 3) copy
// of each replacement over its match, tagged with the entry's marker.
class DualLayerRenderer : public Renderer
{
public:
    using Renderer::Renderer;

    RendererKind kind() const noexcept override
    {
        return RendererKind::DualLayer;
    }

protected:
    bool rewritesStreams() const noexcept override
    {
        return false;
    }

    bool writesDocument() const noexcept override
    {
        return true;
    }

    void finish(RenderSession &session, Document &source, Document &target,
                std::vector<PageWork> &pages, RenderResult &result) override;
};

std::unique_ptr<Renderer>
makeRenderer(RendererKind kind, RenderOptions options);
