#pragma once

// State shared by the renders of one run: the MuPDF context, the glyph and
// span data of each source page, and the fingerprints consumed so far.

#include "Document.hpp"
#include "GlyphPage.hpp"
#include "SpanIndex.hpp"

#include <QString>
#include <map>
#include <memory>
#include <set>
#include <string>

extern "C"
{
#include <mupdf/fitz.h>
}

class RenderSession
{
public:
    RenderSession() noexcept;
    ~RenderSession() noexcept;

    RenderSession(const RenderSession &)            = delete;
    RenderSession &operator=(const RenderSession &) = delete;

    inline fz_context *context() const noexcept
    {
        return m_ctx;
    }

    inline bool isValid() const noexcept
    {
        return m_ctx != nullptr;
    }

    inline const QString &runId() const noexcept
    {
        return m_run_id;
    }

    // Starts a render. Cached pages are dropped when the run changes and the
    // document-wide fingerprint set is always cleared.
    void begin(const QString &run_id) noexcept;

    // Glyphs of the page as read from `doc` the first time it was asked for
    // in this run, nullptr when MuPDF cannot extract them.
    const GlyphPage *glyphPage(Document &doc, int pageno) noexcept;
    const SpanIndex *spans(Document &doc, int pageno) noexcept;

    inline std::set<std::string> &consumedFingerprints() noexcept
    {
        return m_consumed;
    }

    inline int cachedPages() const noexcept
    {
        return static_cast<int>(m_pages.size());
    }

private:
    struct CachedPage
    {
        GlyphPage glyphs;
        SpanIndex spans;
    };

    CachedPage *cached(Document &doc, int pageno) noexcept;

    fz_context *m_ctx{nullptr};
    fz_locks_context m_fz_locks{};
    QString m_run_id;
    std::map<int, std::unique_ptr<CachedPage>> m_pages;
    std::set<std::string> m_consumed;
};
