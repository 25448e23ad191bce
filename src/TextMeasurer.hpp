#pragma once

#include <string>
#include <string_view>
#include <unordered_map>

extern "C"
{
#include <mupdf/fitz.h>
}

// Width of a run of text set in a font at a size, in points
class TextMeasurer
{
public:
    virtual ~TextMeasurer() = default;

    virtual float measure(std::u32string_view text, const std::string &font,
                          float size) const = 0;
};

// Every glyph advances by `ratio` em
class FixedPitchMeasurer : public TextMeasurer
{
public:
    explicit FixedPitchMeasurer(float ratio = 0.6f) noexcept : m_ratio(ratio)
    {
    }

    float measure(std::u32string_view text, const std::string &font,
                  float size) const override;

private:
    float m_ratio;
};

// Measures with MuPDF's built-in base-14 fonts, picking the family from the
// span's font name (Helvetica when nothing matches).
class Base14Measurer : public TextMeasurer
{
public:
    explicit Base14Measurer(fz_context *ctx) noexcept;
    ~Base14Measurer() override;

    Base14Measurer(const Base14Measurer &)            = delete;
    Base14Measurer &operator=(const Base14Measurer &) = delete;

    float measure(std::u32string_view text, const std::string &font,
                  float size) const override;

    static std::string base14Name(const std::string &font);

private:
    fz_font *loadFont(const std::string &base14) const noexcept;

    fz_context *m_ctx{nullptr};
    mutable std::unordered_map<std::string, fz_font *> m_fonts;
};
