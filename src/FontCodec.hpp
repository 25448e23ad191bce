#pragma once

// Byte <-> Unicode mapping and advance widths for one font resource of a
// page, extracted from MuPDF's loaded font descriptor so it stays usable
// after the descriptor is dropped.

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

class FontCodec
{
public:
    // One character code of a shown string
    struct CodeUnit
    {
        std::string bytes;
        std::u32string text;
        float advance{0.0f}; // glyph space, 1/1000 text space unit
    };

    FontCodec() = default;

    static FontCodec fromFontDesc(fz_context *ctx, pdf_font_desc *desc,
                                  std::string name);
    static FontCodec latin1(std::string name = {});

    std::vector<CodeUnit> decode(std::string_view bytes) const;
    std::u32string decodeText(std::string_view bytes) const;
    std::optional<std::string> encode(std::u32string_view text) const;

    // Sum of advances of `bytes`, in glyph space units
    float advance(std::string_view bytes) const;

    inline const std::string &name() const noexcept
    {
        return m_name;
    }

    inline int bytesPerCode() const noexcept
    {
        return m_bytes_per_code;
    }

    inline bool hasWidths() const noexcept
    {
        return m_has_widths;
    }

private:
    std::string m_name;
    int m_bytes_per_code{1};
    bool m_has_widths{false};
    float m_default_width{0.0f};
    std::unordered_map<uint32_t, std::u32string> m_to_unicode;
    std::unordered_map<uint32_t, float> m_widths;
    std::unordered_map<char32_t, uint32_t> m_from_unicode;
};
