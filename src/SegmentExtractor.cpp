#include "SegmentExtractor.hpp"

#include <QDebug>

namespace
{

const FontCodec &
fallback_codec()
{
    static const FontCodec codec = FontCodec::latin1();
    return codec;
}

double
number_at(const std::vector<Operand> &operands, size_t i, double fallback)
{
    if (i < operands.size() && operands[i].isNumber())
        return operands[i].number;
    return fallback;
}

} // namespace

std::u32string
ExtractedText::text() const
{
    std::u32string out;
    out.reserve(char_count);
    for (const Segment &s : segments)
        out += s.text;
    return out;
}

const FontCodec &
SegmentExtractor::codecFor(const CodecMap &codecs, const std::string &font)
{
    auto it = codecs.find(font);
    if (it == codecs.end())
        return fallback_codec();
    return it->second;
}

ExtractedText
SegmentExtractor::extract(const std::vector<ContentOp> &ops,
                          const CodecMap &codecs, double space_threshold)
{
    ExtractedText out;
    FontContext state;
    // Tf, Tc, Tw and Tz are part of the graphics state
    std::vector<FontContext> saved;

    for (int i = 0; i < static_cast<int>(ops.size()); ++i)
    {
        const ContentOp &op = ops[i];
        const auto &args    = op.operands;

        if (op.op == "q")
        {
            saved.push_back(state);
            continue;
        }
        if (op.op == "Q")
        {
            if (!saved.empty())
            {
                state = saved.back();
                saved.pop_back();
            }
            continue;
        }
        if (op.op == "Tf")
        {
            if (args.size() >= 2 && args[0].isName())
            {
                state.font = args[0].bytes;
                state.size = number_at(args, 1, state.size);
            }
            continue;
        }
        if (op.op == "Tc")
        {
            state.char_spacing = number_at(args, 0, state.char_spacing);
            continue;
        }
        if (op.op == "Tw")
        {
            state.word_spacing = number_at(args, 0, state.word_spacing);
            continue;
        }
        if (op.op == "Tz")
        {
            state.horizontal_scaling = number_at(args, 0, state.horizontal_scaling);
            continue;
        }

        if (!op.isTextShow() || args.empty())
            continue;

        const FontCodec &codec = codecFor(codecs, state.font);

        Segment seg;
        seg.operator_index = i;
        seg.op             = op.op;

        if (op.op == "TJ")
        {
            if (!args[0].isArray())
            {
                qWarning() << "Skipping TJ without array operand at" << i;
                continue;
            }
            for (const Operand &item : args[0].items)
            {
                if (item.isString())
                    seg.text += codec.decodeText(item.bytes);
                else if (item.isNumber())
                {
                    if (item.number <= space_threshold)
                        seg.text.push_back(U' ');
                    seg.kerning[static_cast<int>(seg.text.size())] += item.number;
                }
            }
        }
        else
        {
            // " sets word and character spacing before showing
            if (op.op == "\"" && args.size() >= 3)
            {
                state.word_spacing = number_at(args, 0, state.word_spacing);
                state.char_spacing = number_at(args, 1, state.char_spacing);
            }
            const Operand &str = args.back();
            if (!str.isString())
                continue;
            seg.text = codec.decodeText(str.bytes);
        }

        seg.font  = state;
        seg.start = out.char_count;
        seg.end   = seg.start + static_cast<int>(seg.text.size());
        out.char_count = seg.end;
        ++out.text_show_ops;
        out.segments.push_back(std::move(seg));
    }

    return out;
}
