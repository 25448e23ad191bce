#include "FontCodec.hpp"

#include <algorithm>

namespace
{

constexpr char32_t REPLACEMENT_CHARACTER = 0xFFFD;

std::u32string
lookup_unicode(pdf_font_desc *desc, int cid)
{
    std::u32string text;
    if (desc->to_unicode)
    {
        int buf[8];
        const int n = pdf_lookup_cmap_full(desc->to_unicode,
                                           static_cast<unsigned int>(cid), buf);
        for (int i = 0; i < n && i < 8; ++i)
            text.push_back(static_cast<char32_t>(buf[i]));
    }

    if (text.empty() && desc->cid_to_ucs && cid >= 0
        && static_cast<size_t>(cid) < desc->cid_to_ucs_len)
    {
        const char32_t ucs = desc->cid_to_ucs[cid];
        if (ucs != 0 && ucs != REPLACEMENT_CHARACTER)
            text.push_back(ucs);
    }
    return text;
}

} // namespace

FontCodec
FontCodec::fromFontDesc(fz_context *ctx, pdf_font_desc *desc, std::string name)
{
    FontCodec codec;
    codec.m_name = std::move(name);
    if (!desc || !desc->encoding)
        return codec;

    pdf_cmap *encoding = desc->encoding;
    if (encoding->codespace_len > 0)
        codec.m_bytes_per_code = std::max(1, encoding->codespace[0].n);
    codec.m_has_widths    = desc->hmtx_len > 0;
    codec.m_default_width = static_cast<float>(desc->dhmtx.w);

    const uint32_t code_count = codec.m_bytes_per_code == 1 ? 0x100 : 0x10000;
    for (uint32_t code = 0; code < code_count; ++code)
    {
        const int cid = pdf_lookup_cmap(encoding, code);
        if (cid < 0)
            continue;

        std::u32string text = lookup_unicode(desc, cid);
        if (text.empty())
            continue;

        codec.m_widths[code]
            = static_cast<float>(pdf_lookup_hmtx(ctx, desc, cid).w);
        if (text.size() == 1 && !codec.m_from_unicode.count(text[0]))
            codec.m_from_unicode[text[0]] = code;
        codec.m_to_unicode.emplace(code, std::move(text));
    }

    return codec;
}

FontCodec
FontCodec::latin1(std::string name)
{
    FontCodec codec;
    codec.m_name = std::move(name);
    return codec;
}

std::vector<FontCodec::CodeUnit>
FontCodec::decode(std::string_view bytes) const
{
    std::vector<CodeUnit> units;
    size_t i = 0;
    while (i < bytes.size())
    {
        size_t n = static_cast<size_t>(m_bytes_per_code);
        if (i + n > bytes.size())
            n = 1;

        uint32_t code = 0;
        for (size_t k = 0; k < n; ++k)
            code = (code << 8) | static_cast<unsigned char>(bytes[i + k]);

        CodeUnit unit;
        unit.bytes = std::string(bytes.substr(i, n));

        auto it = m_to_unicode.find(code);
        if (it != m_to_unicode.end())
            unit.text = it->second;
        else
            // Latin-1 for codes the font does not map
            for (char b : unit.bytes)
                unit.text.push_back(static_cast<unsigned char>(b));

        auto w       = m_widths.find(code);
        unit.advance = w != m_widths.end() ? w->second : m_default_width;

        units.push_back(std::move(unit));
        i += n;
    }
    return units;
}

std::u32string
FontCodec::decodeText(std::string_view bytes) const
{
    std::u32string text;
    for (const CodeUnit &unit : decode(bytes))
        text += unit.text;
    return text;
}

std::optional<std::string>
FontCodec::encode(std::u32string_view text) const
{
    std::string out;
    for (char32_t c : text)
    {
        auto it = m_from_unicode.find(c);
        if (it != m_from_unicode.end())
        {
            for (int k = m_bytes_per_code - 1; k >= 0; --k)
                out.push_back(static_cast<char>((it->second >> (8 * k)) & 0xFF));
            continue;
        }

        if (m_bytes_per_code == 1 && c < 0x100 && !m_to_unicode.count(c))
        {
            out.push_back(static_cast<char>(c));
            continue;
        }

        return std::nullopt;
    }
    return out;
}

float
FontCodec::advance(std::string_view bytes) const
{
    float total = 0.0f;
    for (const CodeUnit &unit : decode(bytes))
        total += unit.advance;
    return total;
}
