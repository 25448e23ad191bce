#include "Document.hpp"

#include "TextNormalizer.hpp"
#include "utils.hpp"

#include <QDebug>

Document::Document(fz_context *ctx) noexcept : m_ctx(ctx) {}

Document::~Document() noexcept
{
    close();
}

void
Document::close() noexcept
{
    for (auto &[pageno, pg] : m_pages)
        fz_drop_page(m_ctx, &pg->super);
    m_pages.clear();
    m_substitute_fonts.clear();

    pdf_drop_document(m_ctx, m_doc);
    m_doc = nullptr;
}

bool
Document::openFromBytes(const std::string &bytes) noexcept
{
    close();

    fz_buffer *buf  = nullptr;
    fz_stream *stm  = nullptr;
    fz_var(buf);
    fz_var(stm);

    fz_try(m_ctx)
    {
        buf = fz_new_buffer_from_copied_data(
            m_ctx, reinterpret_cast<const unsigned char *>(bytes.data()),
            bytes.size());
        stm   = fz_open_buffer(m_ctx, buf);
        m_doc = pdf_open_document_with_stream(m_ctx, stm);
        if (pdf_needs_password(m_ctx, m_doc)
            && !pdf_authenticate_password(m_ctx, m_doc, ""))
            fz_throw(m_ctx, FZ_ERROR_GENERIC, "document is password protected");
    }
    fz_always(m_ctx)
    {
        fz_drop_stream(m_ctx, stm);
        fz_drop_buffer(m_ctx, buf);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot open document: " << fz_caught_message(m_ctx);
        pdf_drop_document(m_ctx, m_doc);
        m_doc = nullptr;
        return false;
    }

    return true;
}

int
Document::pageCount() const noexcept
{
    if (!m_doc)
        return 0;

    int count = 0;
    fz_try(m_ctx)
    {
        count = pdf_count_pages(m_ctx, m_doc);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot count pages: " << fz_caught_message(m_ctx);
        count = 0;
    }
    return count;
}

pdf_page *
Document::page(int pageno) noexcept
{
    if (!m_doc || pageno < 0)
        return nullptr;

    auto it = m_pages.find(pageno);
    if (it != m_pages.end())
        return it->second;

    pdf_page *pg = nullptr;
    fz_try(m_ctx)
    {
        pg = pdf_load_page(m_ctx, m_doc, pageno);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot load page" << pageno << ": "
                   << fz_caught_message(m_ctx);
        return nullptr;
    }

    m_pages[pageno] = pg;
    return pg;
}

fz_rect
Document::pageBounds(int pageno) noexcept
{
    pdf_page *pg = page(pageno);
    if (!pg)
        return fz_empty_rect;

    fz_rect bounds = fz_empty_rect;
    fz_try(m_ctx)
    {
        bounds = fz_bound_page(m_ctx, &pg->super);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot bound page" << pageno << ": "
                   << fz_caught_message(m_ctx);
    }
    return bounds;
}

fz_matrix
Document::pageToUser(pdf_page *pg) noexcept
{
    fz_rect mediabox;
    fz_matrix ctm = fz_identity;
    fz_try(m_ctx)
    {
        pdf_page_transform(m_ctx, pg, &mediabox, &ctm);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot read page transform: "
                   << fz_caught_message(m_ctx);
        ctm = fz_identity;
    }
    return fz_invert_matrix(ctm);
}

std::optional<GlyphPage>
Document::glyphPage(int pageno) noexcept
{
    pdf_page *pg = page(pageno);
    if (!pg)
        return std::nullopt;

    fz_stext_page *stext = nullptr;
    fz_stext_options opts{};
    opts.flags = FZ_STEXT_PRESERVE_LIGATURES | FZ_STEXT_PRESERVE_WHITESPACE;

    fz_try(m_ctx)
    {
        stext = fz_new_stext_page_from_page(m_ctx, &pg->super, &opts);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot extract text of page" << pageno << ": "
                   << fz_caught_message(m_ctx);
        return std::nullopt;
    }

    GlyphPage result;
    result.index  = pageno;
    result.bounds = stext->mediabox;

    for (fz_stext_block *b = stext->first_block; b; b = b->next)
    {
        if (b->type != FZ_STEXT_BLOCK_TEXT)
            continue;

        GlyphBlock block;
        block.bbox = b->bbox;
        for (fz_stext_line *l = b->u.t.first_line; l; l = l->next)
        {
            GlyphLine line;
            line.bbox = l->bbox;

            GlyphSpan *current   = nullptr;
            fz_font *current_font = nullptr;
            for (fz_stext_char *c = l->first_char; c; c = c->next)
            {
                const bool new_span = !current || c->font != current_font
                                      || c->size != current->size;
                if (new_span)
                {
                    GlyphSpan span;
                    span.font  = c->font ? fz_font_name(m_ctx, c->font) : "";
                    span.size  = c->size;
                    line.spans.push_back(std::move(span));
                    current      = &line.spans.back();
                    current_font = c->font;
                }

                Glyph g;
                g.c      = static_cast<char32_t>(c->c);
                g.bbox   = fz_rect_from_quad(c->quad);
                g.origin = c->origin;
                current->bbox = current->chars.empty()
                                    ? g.bbox
                                    : fz_union_rect(current->bbox, g.bbox);
                current->chars.push_back(g);
            }

            if (!line.spans.empty())
                block.lines.push_back(std::move(line));
        }

        if (!block.lines.empty())
            result.blocks.push_back(std::move(block));
    }

    fz_drop_stext_page(m_ctx, stext);
    return result;
}

std::optional<std::string>
Document::contentBytes(int pageno) noexcept
{
    pdf_page *pg = page(pageno);
    if (!pg)
        return std::nullopt;

    fz_stream *stm = nullptr;
    fz_buffer *buf = nullptr;
    fz_var(stm);
    fz_var(buf);

    fz_try(m_ctx)
    {
        pdf_obj *contents = pdf_dict_get(m_ctx, pg->obj, PDF_NAME(Contents));
        stm               = pdf_open_contents_stream(m_ctx, m_doc, contents);
        buf               = fz_read_all(m_ctx, stm, 0);
    }
    fz_always(m_ctx)
    {
        fz_drop_stream(m_ctx, stm);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot read content stream of page" << pageno << ": "
                   << fz_caught_message(m_ctx);
        fz_drop_buffer(m_ctx, buf);
        return std::nullopt;
    }

    unsigned char *data = nullptr;
    const size_t len    = fz_buffer_storage(m_ctx, buf, &data);
    std::string bytes(reinterpret_cast<const char *>(data), len);
    fz_drop_buffer(m_ctx, buf);
    return bytes;
}

bool
Document::setContentBytes(int pageno, const std::string &bytes) noexcept
{
    pdf_page *pg = page(pageno);
    if (!pg)
        return false;

    fz_buffer *buf = nullptr;
    pdf_obj *ref   = nullptr;
    fz_var(buf);
    fz_var(ref);

    fz_try(m_ctx)
    {
        buf = fz_new_buffer_from_copied_data(
            m_ctx, reinterpret_cast<const unsigned char *>(bytes.data()),
            bytes.size());
        ref = pdf_add_stream(m_ctx, m_doc, buf, nullptr, 0);
        pdf_dict_put(m_ctx, pg->obj, PDF_NAME(Contents), ref);
    }
    fz_always(m_ctx)
    {
        pdf_drop_obj(m_ctx, ref);
        fz_drop_buffer(m_ctx, buf);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot write content stream of page" << pageno << ": "
                   << fz_caught_message(m_ctx);
        return false;
    }

    return true;
}

std::optional<std::vector<ContentOp>>
Document::contentOps(int pageno) noexcept
{
    auto bytes = contentBytes(pageno);
    if (!bytes)
        return std::nullopt;
    return ContentStream::parse(m_ctx, *bytes);
}

bool
Document::setContentOps(int pageno, const std::vector<ContentOp> &ops) noexcept
{
    return setContentBytes(pageno, ContentStream::serialize(ops));
}

std::unordered_map<std::string, FontCodec>
Document::fontCodecs(int pageno) noexcept
{
    std::unordered_map<std::string, FontCodec> codecs;
    pdf_page *pg = page(pageno);
    if (!pg)
        return codecs;

    pdf_obj *res   = nullptr;
    pdf_obj *fonts = nullptr;
    int count      = 0;
    fz_try(m_ctx)
    {
        res   = pdf_page_resources(m_ctx, pg);
        fonts = pdf_dict_get(m_ctx, res, PDF_NAME(Font));
        count = pdf_dict_len(m_ctx, fonts);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot read font resources of page" << pageno << ": "
                   << fz_caught_message(m_ctx);
        return codecs;
    }

    for (int i = 0; i < count; ++i)
    {
        const char *key     = pdf_to_name(m_ctx, pdf_dict_get_key(m_ctx, fonts, i));
        pdf_obj *font_obj   = pdf_dict_get_val(m_ctx, fonts, i);
        const std::string name(key ? key : "");
        if (name.empty())
            continue;

        pdf_font_desc *desc = nullptr;
        fz_try(m_ctx)
        {
            desc = pdf_load_font(m_ctx, m_doc, res, font_obj);
        }
        fz_catch(m_ctx)
        {
            qWarning() << "Cannot load font" << name.c_str() << ": "
                       << fz_caught_message(m_ctx);
            desc = nullptr;
        }

        if (desc)
        {
            codecs[name] = FontCodec::fromFontDesc(m_ctx, desc, name);
            pdf_drop_font(m_ctx, desc);
        }
        else
            codecs[name] = FontCodec::latin1(name);
    }

    return codecs;
}

pdf_obj *
Document::ownResources(pdf_page *pg)
{
    pdf_obj *res = pdf_dict_get(m_ctx, pg->obj, PDF_NAME(Resources));
    if (res)
        return res;

    pdf_obj *inherited
        = pdf_dict_get_inheritable(m_ctx, pg->obj, PDF_NAME(Resources));
    res = inherited ? pdf_copy_dict(m_ctx, inherited)
                    : pdf_new_dict(m_ctx, m_doc, 4);
    pdf_dict_put_drop(m_ctx, pg->obj, PDF_NAME(Resources), res);
    return res;
}

std::string
Document::uniqueKey(pdf_obj *dict, const char *prefix)
{
    for (int i = 0;; ++i)
    {
        std::string key = prefix + std::to_string(i);
        if (!pdf_dict_gets(m_ctx, dict, key.c_str()))
            return key;
    }
}

std::optional<std::string>
Document::substituteFontKey(int pageno) noexcept
{
    auto cached = m_substitute_fonts.find(pageno);
    if (cached != m_substitute_fonts.end())
        return cached->second;

    pdf_page *pg = page(pageno);
    if (!pg)
        return std::nullopt;

    std::string name;
    fz_try(m_ctx)
    {
        pdf_obj *res   = pdf_page_resources(m_ctx, pg);
        pdf_obj *fonts = pdf_dict_get(m_ctx, res, PDF_NAME(Font));
        name           = uniqueKey(fonts, "TSub");
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot read font resources of page" << pageno << ": "
                   << fz_caught_message(m_ctx);
        return std::nullopt;
    }
    return name;
}

std::optional<std::string>
Document::addSubstituteFont(int pageno, const std::string &base_font) noexcept
{
    auto cached = m_substitute_fonts.find(pageno);
    if (cached != m_substitute_fonts.end())
        return cached->second;

    pdf_page *pg = page(pageno);
    if (!pg)
        return std::nullopt;

    std::string name;
    pdf_obj *font = nullptr;
    fz_var(font);

    fz_try(m_ctx)
    {
        pdf_obj *res   = ownResources(pg);
        pdf_obj *fonts = pdf_dict_get(m_ctx, res, PDF_NAME(Font));
        if (!fonts)
            fonts = pdf_dict_put_dict(m_ctx, res, PDF_NAME(Font), 2);

        font = pdf_new_dict(m_ctx, m_doc, 4);
        pdf_dict_put(m_ctx, font, PDF_NAME(Type), PDF_NAME(Font));
        pdf_dict_put(m_ctx, font, PDF_NAME(Subtype), PDF_NAME(Type1));
        pdf_dict_put_name(m_ctx, font, PDF_NAME(BaseFont), base_font.c_str());
        pdf_dict_put(m_ctx, font, PDF_NAME(Encoding),
                     PDF_NAME(WinAnsiEncoding));

        name = uniqueKey(fonts, "TSub");
        pdf_dict_puts_drop(m_ctx, fonts, name.c_str(),
                           pdf_add_object(m_ctx, m_doc, font));
    }
    fz_always(m_ctx)
    {
        pdf_drop_obj(m_ctx, font);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot add substitute font to page" << pageno << ": "
                   << fz_caught_message(m_ctx);
        return std::nullopt;
    }

    m_substitute_fonts[pageno] = name;
    return name;
}

bool
Document::appendOverlay(int pageno, const std::string &content) noexcept
{
    auto existing = contentBytes(pageno);
    if (!existing)
        return false;

    // Isolate the page's own graphics state from the overlay
    return setContentBytes(pageno, "q\n" + *existing + "\nQ\n" + content);
}

bool
Document::overlayVector(int pageno, Document &source,
                        const fz_rect &rect) noexcept
{
    pdf_page *dst = page(pageno);
    pdf_page *src = source.page(pageno);
    if (!dst || !src)
        return false;

    auto src_content = source.contentBytes(pageno);
    if (!src_content)
        return false;

    const fz_rect user = fz_transform_rect(rect, pageToUser(dst));

    std::string name;
    pdf_graft_map *graft = nullptr;
    pdf_obj *res         = nullptr;
    pdf_obj *xobj        = nullptr;
    fz_buffer *buf       = nullptr;
    fz_var(graft);
    fz_var(res);
    fz_var(xobj);
    fz_var(buf);

    fz_try(m_ctx)
    {
        graft            = pdf_new_graft_map(m_ctx, m_doc);
        pdf_obj *src_res = pdf_page_resources(m_ctx, src);
        res = src_res ? pdf_graft_mapped_object(m_ctx, graft, src_res)
                      : pdf_new_dict(m_ctx, m_doc, 1);

        const fz_rect bbox = pdf_to_rect(
            m_ctx, pdf_dict_get_inheritable(m_ctx, src->obj, PDF_NAME(MediaBox)));
        buf = fz_new_buffer_from_copied_data(
            m_ctx, reinterpret_cast<const unsigned char *>(src_content->data()),
            src_content->size());
        xobj = pdf_new_xobject(m_ctx, m_doc, bbox, fz_identity, res, buf);

        pdf_obj *resources = ownResources(dst);
        pdf_obj *xobjects  = pdf_dict_get(m_ctx, resources, PDF_NAME(XObject));
        if (!xobjects)
            xobjects = pdf_dict_put_dict(m_ctx, resources, PDF_NAME(XObject), 2);
        name = uniqueKey(xobjects, "TSFm");
        pdf_dict_puts(m_ctx, xobjects, name.c_str(), xobj);
    }
    fz_always(m_ctx)
    {
        pdf_drop_obj(m_ctx, xobj);
        pdf_drop_obj(m_ctx, res);
        fz_drop_buffer(m_ctx, buf);
        pdf_drop_graft_map(m_ctx, graft);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot embed vector overlay on page" << pageno << ": "
                   << fz_caught_message(m_ctx);
        return false;
    }

    const std::string r = ContentStream::formatNumber(user.x0) + " "
                          + ContentStream::formatNumber(user.y0) + " "
                          + ContentStream::formatNumber(rect_width(user)) + " "
                          + ContentStream::formatNumber(rect_height(user));
    // White out what the rewrite left behind, then redraw the original
    return appendOverlay(pageno, "q " + r + " re W n 1 g " + r + " re f /"
                                     + name + " Do Q\n");
}

fz_pixmap *
Document::rasterize(pdf_page *pg, const fz_rect &rect, float zoom) noexcept
{
    fz_pixmap *pix = nullptr;
    fz_device *dev = nullptr;
    fz_var(pix);
    fz_var(dev);

    fz_try(m_ctx)
    {
        const fz_matrix ctm = fz_scale(zoom, zoom);
        const fz_irect bbox = fz_round_rect(fz_transform_rect(rect, ctm));
        pix = fz_new_pixmap_with_bbox(m_ctx, fz_device_rgb(m_ctx), bbox,
                                      nullptr, 0);
        fz_clear_pixmap_with_value(m_ctx, pix, 0xFF);
        dev = fz_new_draw_device(m_ctx, fz_identity, pix);
        fz_run_page(m_ctx, &pg->super, dev, ctm, nullptr);
        fz_close_device(m_ctx, dev);
    }
    fz_always(m_ctx)
    {
        fz_drop_device(m_ctx, dev);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot rasterize page region: "
                   << fz_caught_message(m_ctx);
        fz_drop_pixmap(m_ctx, pix);
        return nullptr;
    }

    return pix;
}

bool
Document::overlayRaster(int pageno, Document &source, const fz_rect &rect,
                        float zoom) noexcept
{
    pdf_page *dst = page(pageno);
    pdf_page *src = source.page(pageno);
    if (!dst || !src)
        return false;

    fz_pixmap *pix = source.rasterize(src, rect, zoom);
    if (!pix)
        return false;

    const fz_rect user = fz_transform_rect(rect, pageToUser(dst));

    std::string name;
    fz_image *image = nullptr;
    pdf_obj *ref    = nullptr;
    fz_var(image);
    fz_var(ref);

    fz_try(m_ctx)
    {
        image = fz_new_image_from_pixmap(m_ctx, pix, nullptr);
        ref   = pdf_add_image(m_ctx, m_doc, image);

        pdf_obj *resources = ownResources(dst);
        pdf_obj *xobjects  = pdf_dict_get(m_ctx, resources, PDF_NAME(XObject));
        if (!xobjects)
            xobjects = pdf_dict_put_dict(m_ctx, resources, PDF_NAME(XObject), 2);
        name = uniqueKey(xobjects, "TSIm");
        pdf_dict_puts(m_ctx, xobjects, name.c_str(), ref);
    }
    fz_always(m_ctx)
    {
        pdf_drop_obj(m_ctx, ref);
        fz_drop_image(m_ctx, image);
        fz_drop_pixmap(m_ctx, pix);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot embed raster overlay on page" << pageno << ": "
                   << fz_caught_message(m_ctx);
        return false;
    }

    return appendOverlay(
        pageno, "q " + ContentStream::formatNumber(rect_width(user)) + " 0 0 "
                    + ContentStream::formatNumber(rect_height(user)) + " "
                    + ContentStream::formatNumber(user.x0) + " "
                    + ContentStream::formatNumber(user.y0) + " cm /" + name
                    + " Do Q\n");
}

bool
Document::appendInvisibleText(int pageno, const fz_rect &rect, float size,
                              std::u32string_view text,
                              const std::string &base_font) noexcept
{
    pdf_page *pg = page(pageno);
    if (!pg || rect_is_empty(rect) || size <= 0.0f)
        return false;

    std::string shown;
    for (char32_t c : text)
    {
        if (c < 0x100)
            shown.push_back(static_cast<char>(c));
        else if (!TextNormalizer::isZeroWidth(c))
            shown.push_back('?');
    }
    if (shown.empty())
        return false;

    const auto font = addSubstituteFont(pageno, base_font);
    if (!font)
        return false;

    // UTF-16BE with a byte order mark
    std::string actual{'\xFE', '\xFF'};
    for (char16_t u : to_qstring(text).toStdU16String())
    {
        actual.push_back(static_cast<char>(u >> 8));
        actual.push_back(static_cast<char>(u & 0xFF));
    }

    const fz_rect user    = fz_transform_rect(rect, pageToUser(pg));
    const double advance  = static_cast<double>(shown.size()) * 0.6 * size;
    const double stretch  = rect_width(user) / advance * 100.0;
    const double baseline = user.y0 + 0.2 * size;

    return appendOverlay(
        pageno, "/Span <</ActualText " + ContentStream::formatString(actual)
                    + ">> BDC BT 3 Tr /" + *font + " "
                    + ContentStream::formatNumber(size) + " Tf "
                    + ContentStream::formatNumber(stretch) + " Tz "
                    + ContentStream::formatNumber(user.x0) + " "
                    + ContentStream::formatNumber(baseline) + " Td "
                    + ContentStream::formatString(shown) + " Tj ET EMC\n");
}

QString
Document::textInRect(int pageno, const fz_rect &rect) noexcept
{
    pdf_page *pg = page(pageno);
    if (!pg)
        return {};

    fz_stext_page *stext = nullptr;
    char *text           = nullptr;
    fz_var(stext);
    fz_var(text);

    QString result;
    fz_try(m_ctx)
    {
        stext = fz_new_stext_page_from_page(m_ctx, &pg->super, nullptr);
        text  = fz_copy_rectangle(m_ctx, stext, rect, 0);
    }
    fz_always(m_ctx)
    {
        fz_drop_stext_page(m_ctx, stext);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot copy text of page" << pageno << ": "
                   << fz_caught_message(m_ctx);
        return {};
    }

    if (text)
    {
        result = QString::fromUtf8(text);
        fz_free(m_ctx, text);
    }
    return result;
}

std::optional<std::string>
Document::saveToBytes() noexcept
{
    if (!m_doc)
        return std::nullopt;

    fz_buffer *buf  = nullptr;
    fz_output *out  = nullptr;
    fz_var(buf);
    fz_var(out);

    pdf_write_options opts = pdf_default_write_options;
    opts.do_compress       = 1;
    opts.do_garbage        = 1;

    fz_try(m_ctx)
    {
        buf = fz_new_buffer(m_ctx, 64 * 1024);
        out = fz_new_output_with_buffer(m_ctx, buf);
        pdf_write_document(m_ctx, m_doc, out, &opts);
        fz_close_output(m_ctx, out);
    }
    fz_always(m_ctx)
    {
        fz_drop_output(m_ctx, out);
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot save document: " << fz_caught_message(m_ctx);
        fz_drop_buffer(m_ctx, buf);
        return std::nullopt;
    }

    unsigned char *data = nullptr;
    const size_t len    = fz_buffer_storage(m_ctx, buf, &data);
    std::string bytes(reinterpret_cast<const char *>(data), len);
    fz_drop_buffer(m_ctx, buf);
    return bytes;
}
