#include "TextNormalizer.hpp"

#include "utils.hpp"

#include <QByteArray>
#include <QChar>
#include <QCryptographicHash>
#include <QString>
#include <array>

namespace
{

constexpr std::array<char32_t, 8> ZERO_WIDTH_MARKERS = {
    0x200B, // zero-width space
    0x200C, // zero-width non-joiner
    0x200D, // zero-width joiner
    0x2060, // word joiner
    0x2061, // function application
    0x2062, // invisible times
    0x2063, // invisible separator
    0xFEFF, // byte-order mark
};

// Returns true when `c` has an entry in the translation table. `out` receives
// the replacement (possibly empty).
bool
translate(char32_t c, std::u32string &out)
{
    switch (c)
    {
        case 0xFB01: out = U"fi"; return true;
        case 0xFB02: out = U"fl"; return true;
        case 0xFB00: out = U"ff"; return true;
        case 0xFB03: out = U"ffi"; return true;
        case 0xFB04: out = U"ffl"; return true;
        case 0xFB05: out = U"ft"; return true;
        case 0xFB06: out = U"st"; return true;
        case 0x2013:
        case 0x2014:
        case 0x2212:
        case 0x2011:
        case 0x2010: out = U"-"; return true;
        case 0x201C:
        case 0x201D:
        case 0x201F: out = U"\""; return true;
        case 0x2019:
        case 0x2018:
        case 0x201B: out = U"'"; return true;
        case 0x201A: out = U","; return true;
        case 0x2026: out = U"..."; return true;
        case 0x00A0: out = U" "; return true;
        case U'^':
        case 0x02C6: out.clear(); return true;
        default: return false;
    }
}

std::u32string
nfkd(char32_t c)
{
    return QString::fromUcs4(&c, 1)
        .normalized(QString::NormalizationForm_KD)
        .toStdU32String();
}

} // namespace

namespace TextNormalizer
{

bool
isZeroWidth(char32_t c) noexcept
{
    for (char32_t z : ZERO_WIDTH_MARKERS)
        if (z == c)
            return true;
    return false;
}

std::u32string
stripZeroWidth(std::u32string_view s)
{
    std::u32string out;
    out.reserve(s.size());
    for (char32_t c : s)
        if (!isZeroWidth(c))
            out.push_back(c);
    return out;
}

std::u32string
collapseWhitespace(std::u32string_view s)
{
    std::u32string out;
    out.reserve(s.size());
    bool pending_space = false;
    for (char32_t c : s)
    {
        if (is_space(c))
        {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space)
            out.push_back(U' ');
        pending_space = false;
        out.push_back(c);
    }
    return out;
}

std::u32string
normalizeForMatch(std::u32string_view s)
{
    std::u32string translated;
    translated.reserve(s.size());
    std::u32string piece;
    for (char32_t c : s)
    {
        if (isZeroWidth(c))
            continue;
        if (translate(c, piece))
            translated += piece;
        else
            translated.push_back(c);
    }
    return collapseWhitespace(translated);
}

std::u32string
normalizeForCompare(std::u32string_view s)
{
    std::u32string out = normalizeForMatch(s);
    for (char32_t &c : out)
        c = QChar::toLower(c);
    return out;
}

MappedText
buildNormalizedMap(std::u32string_view s)
{
    MappedText result;
    const std::u32string stripped = stripZeroWidth(s);

    bool last_was_space = false;
    std::u32string piece;
    for (size_t i = 0; i < stripped.size(); ++i)
    {
        const char32_t raw = stripped[i];
        if (!translate(raw, piece) || piece.empty())
            piece = std::u32string(1, raw);

        for (char32_t c : piece)
        {
            if (is_space(c))
            {
                if (last_was_space)
                    continue;
                c              = U' ';
                last_was_space = true;
            }
            else
                last_was_space = false;

            result.text.push_back(c);
            result.index_map.push_back(static_cast<int>(i));
        }
    }

    size_t start = 0;
    size_t end   = result.text.size();
    while (start < end && result.text[start] == U' ')
        ++start;
    while (end > start && result.text[end - 1] == U' ')
        --end;

    result.text = result.text.substr(start, end - start);
    result.index_map
        = std::vector<int>(result.index_map.begin() + start,
                           result.index_map.begin() + end);
    return result;
}

std::u32string
casefold(std::u32string_view s)
{
    std::u32string out;
    out.reserve(s.size());
    for (char32_t c : s)
        out.push_back(QChar::toCaseFolded(c));
    return out;
}

std::u32string
compactAscii(std::u32string_view s)
{
    std::u32string out;
    out.reserve(s.size());
    for (char32_t c : s)
    {
        const char32_t f = QChar::toCaseFolded(c);
        if ((f >= U'0' && f <= U'9') || (f >= U'a' && f <= U'z'))
            out.push_back(f);
    }
    return out;
}

MappedText
compactAlnum(std::u32string_view s)
{
    MappedText result;
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (!QChar::isLetterOrNumber(s[i]))
            continue;
        result.text.push_back(QChar::toCaseFolded(s[i]));
        result.index_map.push_back(static_cast<int>(i));
    }
    return result;
}

MappedText
foldForSearch(std::u32string_view s)
{
    MappedText result;
    for (size_t i = 0; i < s.size(); ++i)
    {
        if (is_space(s[i]) || isZeroWidth(s[i]))
            continue;
        for (char32_t d : nfkd(s[i]))
        {
            if (QChar::isMark(d) || is_space(d))
                continue;
            result.text.push_back(QChar::toCaseFolded(d));
            result.index_map.push_back(static_cast<int>(i));
        }
    }
    return result;
}

std::u32string
collapseNfkd(std::u32string_view s)
{
    const std::u32string decomposed
        = to_qstring(s).normalized(QString::NormalizationForm_KD)
              .toStdU32String();
    std::u32string out;
    out.reserve(decomposed.size());
    for (char32_t c : decomposed)
        if (!is_space(c))
            out.push_back(c);
    return out;
}

std::u32string
expandControlLigatures(std::u32string_view s)
{
    std::u32string out;
    out.reserve(s.size());
    for (char32_t c : s)
    {
        switch (c)
        {
            case 0x0B: out += U"ff"; break;
            case 0x0C: out += U"fi"; break;
            case 0x0D: out += U"fl"; break;
            case 0x0E: out += U"ffi"; break;
            case 0x0F: out += U"ffl"; break;
            default: out.push_back(c);
        }
    }
    return out;
}

std::u32string
encodeMarker(std::u32string_view context)
{
    const QByteArray digest = QCryptographicHash::hash(
        to_qstring(context).toUtf8(), QCryptographicHash::Sha1);

    std::u32string marker;
    for (int i = 0; i < 6; ++i)
    {
        const auto byte = static_cast<unsigned char>(digest.at(i));
        marker.push_back(ZERO_WIDTH_MARKERS[byte % ZERO_WIDTH_MARKERS.size()]);
    }
    return marker;
}

bool
containsMarker(std::u32string_view s) noexcept
{
    for (char32_t c : s)
        if (isZeroWidth(c))
            return true;
    return false;
}

} // namespace TextNormalizer
