#include "utils.hpp"

#include <QByteArray>
#include <QChar>
#include <QCryptographicHash>

fz_rect
bound_rects(const std::vector<fz_rect> &rects) noexcept
{
    fz_rect r = fz_empty_rect;
    bool first = true;
    for (const fz_rect &rect : rects)
    {
        if (first)
        {
            r     = rect;
            first = false;
            continue;
        }
        r = fz_union_rect(r, rect);
    }
    return r;
}

fz_rect
bound_quads(const std::vector<fz_quad> &quads) noexcept
{
    std::vector<fz_rect> rects;
    rects.reserve(quads.size());
    for (const fz_quad &q : quads)
        rects.push_back(rect_from_quad(q));
    return bound_rects(rects);
}

std::u32string
to_u32(const QString &s)
{
    return s.toStdU32String();
}

QString
to_qstring(std::u32string_view s)
{
    return QString::fromUcs4(s.data(), static_cast<qsizetype>(s.size()));
}

std::u32string
utf8_to_u32(std::string_view s)
{
    return QString::fromUtf8(s.data(), static_cast<qsizetype>(s.size()))
        .toStdU32String();
}

std::string
u32_to_utf8(std::u32string_view s)
{
    return to_qstring(s).toStdString();
}

bool
is_space(char32_t c) noexcept
{
    return QChar::isSpace(static_cast<char32_t>(c));
}

std::u32string
trim(std::u32string_view s)
{
    size_t start = 0;
    size_t end   = s.size();
    while (start < end && is_space(s[start]))
        ++start;
    while (end > start && is_space(s[end - 1]))
        --end;
    return std::u32string(s.substr(start, end - start));
}

std::string
sha1_hex(std::string_view data)
{
    const QByteArray digest = QCryptographicHash::hash(
        QByteArrayView(data.data(), static_cast<qsizetype>(data.size())),
        QCryptographicHash::Sha1);
    return digest.toHex().toStdString();
}

std::vector<size_t>
find_all(std::u32string_view haystack, std::u32string_view needle)
{
    std::vector<size_t> hits;
    if (needle.empty())
        return hits;

    size_t pos = haystack.find(needle);
    while (pos != std::u32string_view::npos)
    {
        hits.push_back(pos);
        pos = haystack.find(needle, pos + 1);
    }
    return hits;
}
