#pragma once

#include <QString>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

extern "C"
{
#include <mupdf/fitz.h>
}

static inline float
min4(float a, float b, float c, float d) noexcept
{
    return std::min({a, b, c, d});
}

static inline float
max4(float a, float b, float c, float d) noexcept
{
    return std::max({a, b, c, d});
}

static inline float
quad_top(const fz_quad &q) noexcept
{
    return min4(q.ul.y, q.ur.y, q.ll.y, q.lr.y);
}

static inline float
quad_bottom(const fz_quad &q) noexcept
{
    return max4(q.ul.y, q.ur.y, q.ll.y, q.lr.y);
}

static inline float
quad_left(const fz_quad &q) noexcept
{
    return min4(q.ul.x, q.ur.x, q.ll.x, q.lr.x);
}

static inline float
quad_right(const fz_quad &q) noexcept
{
    return max4(q.ul.x, q.ur.x, q.ll.x, q.lr.x);
}

static inline fz_rect
rect_from_quad(const fz_quad &q) noexcept
{
    return fz_make_rect(quad_left(q), quad_top(q), quad_right(q),
                        quad_bottom(q));
}

static inline float
rect_width(const fz_rect &r) noexcept
{
    return r.x1 - r.x0;
}

static inline float
rect_height(const fz_rect &r) noexcept
{
    return r.y1 - r.y0;
}

static inline bool
rect_is_empty(const fz_rect &r) noexcept
{
    return !(r.x0 < r.x1 && r.y0 < r.y1);
}

// Touching edges do not count as an intersection
static inline bool
rects_intersect(const fz_rect &a, const fz_rect &b) noexcept
{
    if (rect_is_empty(a) || rect_is_empty(b))
        return false;
    return a.x0 < b.x1 && b.x0 < a.x1 && a.y0 < b.y1 && b.y0 < a.y1;
}

static inline fz_rect
expand_rect(const fz_rect &r, float by) noexcept
{
    return fz_make_rect(r.x0 - by, r.y0 - by, r.x1 + by, r.y1 + by);
}

static inline double
round_to(double v, int digits) noexcept
{
    const double f = std::pow(10.0, digits);
    return std::round(v * f) / f;
}

fz_rect
bound_rects(const std::vector<fz_rect> &rects) noexcept;

fz_rect
bound_quads(const std::vector<fz_quad> &quads) noexcept;

// String conversion between the Qt layer, UTF-8 and code point strings
std::u32string
to_u32(const QString &s);

QString
to_qstring(std::u32string_view s);

std::u32string
utf8_to_u32(std::string_view s);

std::string
u32_to_utf8(std::u32string_view s);

bool
is_space(char32_t c) noexcept;

std::u32string
trim(std::u32string_view s);

std::string
sha1_hex(std::string_view data);

// All (possibly overlapping) start positions of needle
std::vector<size_t>
find_all(std::u32string_view haystack, std::u32string_view needle);
