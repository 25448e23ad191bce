#include "RenderSession.hpp"

#include <QDebug>
#include <array>
#include <mutex>

static std::array<std::mutex, FZ_LOCK_MAX> mupdf_mutexes;

static void
mupdf_lock_mutex(void *user, int lock)
{
    auto *m = static_cast<std::mutex *>(user);
    m[lock].lock();
}

static void
mupdf_unlock_mutex(void *user, int lock)
{
    auto *m = static_cast<std::mutex *>(user);
    m[lock].unlock();
}

RenderSession::RenderSession() noexcept
{
    m_fz_locks.user   = mupdf_mutexes.data();
    m_fz_locks.lock   = mupdf_lock_mutex;
    m_fz_locks.unlock = mupdf_unlock_mutex;
    m_ctx             = fz_new_context(nullptr, &m_fz_locks, FZ_STORE_DEFAULT);
    if (!m_ctx)
    {
        qWarning() << "Cannot create MuPDF context";
        return;
    }
    fz_register_document_handlers(m_ctx);
}

RenderSession::~RenderSession() noexcept
{
    m_pages.clear();
    fz_drop_context(m_ctx);
}

void
RenderSession::begin(const QString &run_id) noexcept
{
    if (run_id != m_run_id)
    {
        if (!m_pages.empty())
            qDebug() << "Run changed to" << run_id << ", dropping"
                     << m_pages.size() << "cached pages";
        m_pages.clear();
        m_run_id = run_id;
    }
    m_consumed.clear();
}

RenderSession::CachedPage *
RenderSession::cached(Document &doc, int pageno) noexcept
{
    auto it = m_pages.find(pageno);
    if (it != m_pages.end())
        return it->second.get();

    auto glyphs = doc.glyphPage(pageno);
    if (!glyphs)
        return nullptr;

    auto page    = std::make_unique<CachedPage>();
    page->glyphs = std::move(*glyphs);
    page->spans  = SpanIndex(page->glyphs);

    CachedPage *raw = page.get();
    m_pages[pageno] = std::move(page);
    return raw;
}

const GlyphPage *
RenderSession::glyphPage(Document &doc, int pageno) noexcept
{
    CachedPage *page = cached(doc, pageno);
    return page ? &page->glyphs : nullptr;
}

const SpanIndex *
RenderSession::spans(Document &doc, int pageno) noexcept
{
    CachedPage *page = cached(doc, pageno);
    return page ? &page->spans : nullptr;
}
