#pragma once

// Wrapper for a MuPDF PDF document. Everything the pipeline needs from the
// PDF container goes through here.

#include "ContentStream.hpp"
#include "FontCodec.hpp"
#include "GlyphPage.hpp"

#include <QString>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

extern "C"
{
#include <mupdf/fitz.h>
#include <mupdf/pdf.h>
}

class Document
{
public:
    // The context is borrowed and must outlive the document
    explicit Document(fz_context *ctx) noexcept;
    ~Document() noexcept;

    Document(const Document &)            = delete;
    Document &operator=(const Document &) = delete;

    bool openFromBytes(const std::string &bytes) noexcept;
    void close() noexcept;

    inline bool isOpen() const noexcept
    {
        return m_doc != nullptr;
    }

    inline fz_context *context() const noexcept
    {
        return m_ctx;
    }

    int pageCount() const noexcept;
    fz_rect pageBounds(int pageno) noexcept;

    std::optional<GlyphPage> glyphPage(int pageno) noexcept;

    std::optional<std::string> contentBytes(int pageno) noexcept;
    bool setContentBytes(int pageno, const std::string &bytes) noexcept;
    std::optional<std::vector<ContentOp>> contentOps(int pageno) noexcept;
    bool setContentOps(int pageno, const std::vector<ContentOp> &ops) noexcept;

    // Codec for every entry of the page's /Font resource dictionary, keyed by
    // resource name. Fonts MuPDF cannot load fall back to Latin-1.
    std::unordered_map<std::string, FontCodec> fontCodecs(int pageno) noexcept;

    // Resource name addSubstituteFont will use for the page. Nothing is
    // written to the document.
    std::optional<std::string> substituteFontKey(int pageno) noexcept;

    // Adds a non-embedded simple font (WinAnsi) to the page resources and
    // returns its resource name. Repeated calls for a page reuse it.
    std::optional<std::string> addSubstituteFont(int pageno,
                                                 const std::string &base_font
                                                 = "Courier") noexcept;

    // Paint the same page of `source` over `rect` (page space) as a clipped
    // form XObject.
    bool overlayVector(int pageno, Document &source,
                       const fz_rect &rect) noexcept;

    // Paint a rendered image of the same page of `source` over `rect`
    bool overlayRaster(int pageno, Document &source, const fz_rect &rect,
                       float zoom) noexcept;

    // Text in render mode 3 over `rect` (page space), set in the substitute
    // font and stretched to the rect width. The full text, zero-width
    // characters included, goes into the /ActualText of a marked-content
    // span.
    bool appendInvisibleText(int pageno, const fz_rect &rect, float size,
                             std::u32string_view text,
                             const std::string &base_font = "Courier") noexcept;

    QString textInRect(int pageno, const fz_rect &rect) noexcept;

    std::optional<std::string> saveToBytes() noexcept;

private:
    pdf_page *page(int pageno) noexcept;
    fz_matrix pageToUser(pdf_page *pg) noexcept;
    pdf_obj *ownResources(pdf_page *pg);
    std::string uniqueKey(pdf_obj *dict, const char *prefix);
    bool appendOverlay(int pageno, const std::string &content) noexcept;
    fz_pixmap *rasterize(pdf_page *pg, const fz_rect &rect,
                         float zoom) noexcept;

    fz_context *m_ctx{nullptr};
    pdf_document *m_doc{nullptr};
    std::unordered_map<int, pdf_page *> m_pages;
    std::unordered_map<int, std::string> m_substitute_fonts;
};
