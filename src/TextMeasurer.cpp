#include "TextMeasurer.hpp"

#include <QDebug>
#include <QString>

float
FixedPitchMeasurer::measure(std::u32string_view text, const std::string &,
                            float size) const
{
    return static_cast<float>(text.size()) * size * m_ratio;
}

Base14Measurer::Base14Measurer(fz_context *ctx) noexcept : m_ctx(ctx) {}

Base14Measurer::~Base14Measurer()
{
    for (auto &[name, font] : m_fonts)
        fz_drop_font(m_ctx, font);
}

std::string
Base14Measurer::base14Name(const std::string &font)
{
    const QString name = QString::fromStdString(font).toLower();

    QString family = "Helvetica";
    if (name.contains("courier") || name.contains("mono"))
        family = "Courier";
    else if (name.contains("times")
             || (name.contains("serif") && !name.contains("sans")))
        family = "Times";

    const bool bold   = name.contains("bold") || name.contains("black");
    const bool italic = name.contains("italic") || name.contains("oblique");

    if (family == "Times")
    {
        if (bold && italic)
            return "Times-BoldItalic";
        if (bold)
            return "Times-Bold";
        if (italic)
            return "Times-Italic";
        return "Times-Roman";
    }

    QString result = family;
    if (bold || italic)
        result += "-";
    if (bold)
        result += "Bold";
    if (italic)
        result += "Oblique";
    return result.toStdString();
}

fz_font *
Base14Measurer::loadFont(const std::string &base14) const noexcept
{
    auto it = m_fonts.find(base14);
    if (it != m_fonts.end())
        return it->second;

    fz_font *font = nullptr;
    fz_try(m_ctx)
    {
        font = fz_new_base14_font(m_ctx, base14.c_str());
    }
    fz_catch(m_ctx)
    {
        qWarning() << "Cannot load base-14 font" << base14.c_str() << ": "
                   << fz_caught_message(m_ctx);
        return nullptr;
    }

    m_fonts[base14] = font;
    return font;
}

float
Base14Measurer::measure(std::u32string_view text, const std::string &font,
                        float size) const
{
    fz_font *f = loadFont(base14Name(font));
    if (!f)
        return FixedPitchMeasurer().measure(text, font, size);

    float width = 0.0f;
    for (char32_t c : text)
    {
        const int gid = fz_encode_character(m_ctx, f, static_cast<int>(c));
        width += fz_advance_glyph(m_ctx, f, gid, 0);
    }
    return width * size;
}
