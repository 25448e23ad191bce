#pragma once

// Decodes the text-show operators of a page into segments that share one
// character offset space.

#include "ContentStream.hpp"
#include "FontCodec.hpp"

#include <map>
#include <string>
#include <unordered_map>
#include <vector>

// Text state in effect when a segment was shown
struct FontContext
{
    std::string font; // resource name, without slash
    double size{0.0};
    double char_spacing{0.0};
    double word_spacing{0.0};
    double horizontal_scaling{100.0};
};

struct Segment
{
    int operator_index{0};
    std::string op;
    std::u32string text;
    int start{0};
    int end{0};
    // Every TJ number, keyed by the offset (relative to start) it follows
    std::map<int, double> kerning;
    FontContext font;

    inline int length() const noexcept
    {
        return end - start;
    }
};

struct ExtractedText
{
    std::vector<Segment> segments;
    int char_count{0};
    int text_show_ops{0};

    std::u32string text() const;
};

namespace SegmentExtractor
{

constexpr double SPACE_THRESHOLD = -80.0;

using CodecMap = std::unordered_map<std::string, FontCodec>;

ExtractedText
extract(const std::vector<ContentOp> &ops, const CodecMap &codecs,
        double space_threshold = SPACE_THRESHOLD);

// Codec of the named font resource, Latin-1 when the page has no such font
const FontCodec &
codecFor(const CodecMap &codecs, const std::string &font);

} // namespace SegmentExtractor
