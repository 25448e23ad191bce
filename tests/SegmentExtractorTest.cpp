#include "SegmentExtractor.hpp"

#include <gtest/gtest.h>

namespace
{

ContentOp
op(std::string name, std::vector<Operand> operands = {})
{
    ContentOp out;
    out.op       = std::move(name);
    out.operands = std::move(operands);
    return out;
}

ContentOp
tf(const std::string &font, double size)
{
    return op("Tf", {Operand::makeName(font), Operand::makeNumber(size)});
}

ContentOp
tj(const std::string &bytes)
{
    return op("Tj", {Operand::makeString(bytes)});
}

TEST(SegmentExtractorTest, KerningAndInferredSpaces)
{
    const std::vector<ContentOp> ops{
        op("BT"),
        tf("F1", 10),
        op("TJ", {Operand::makeArray({Operand::makeString("Q2"),
                                      Operand::makeNumber(-120),
                                      Operand::makeString("ints"),
                                      Operand::makeNumber(-30),
                                      Operand::makeString(" trailing")})}),
        op("ET"),
    };

    const ExtractedText text = SegmentExtractor::extract(ops, {});
    ASSERT_EQ(text.segments.size(), 1u);
    const Segment &seg = text.segments[0];
    EXPECT_EQ(seg.operator_index, 2);
    EXPECT_EQ(seg.text, U"Q2 ints trailing");
    EXPECT_EQ(seg.start, 0);
    EXPECT_EQ(seg.end, 16);

    // The -120 adjustment produced the space at offset 2
    const std::map<int, double> kerning{{3, -120.0}, {7, -30.0}};
    EXPECT_EQ(seg.kerning, kerning);
    EXPECT_EQ(seg.font.font, "F1");
    EXPECT_DOUBLE_EQ(seg.font.size, 10.0);
}

TEST(SegmentExtractorTest, SegmentsShareOneOffsetSpace)
{
    const std::vector<ContentOp> ops{
        tf("F1", 12), tj("Hello "), tf("F2", 9), tj("world"),
        op("'", {Operand::makeString("again")}),
    };

    const ExtractedText text = SegmentExtractor::extract(ops, {});
    ASSERT_EQ(text.segments.size(), 3u);
    EXPECT_EQ(text.text(), U"Hello worldagain");
    EXPECT_EQ(text.char_count, 16);
    EXPECT_EQ(text.text_show_ops, 3);

    EXPECT_EQ(text.segments[1].start, 6);
    EXPECT_EQ(text.segments[1].end, 11);
    EXPECT_EQ(text.segments[1].font.font, "F2");
    EXPECT_EQ(text.segments[2].op, "'");
    EXPECT_EQ(text.segments[2].start, 11);
}

TEST(SegmentExtractorTest, SaveRestoreCoversTextState)
{
    const std::vector<ContentOp> ops{
        tf("F1", 10),
        op("q"),
        tf("F2", 14),
        op("Tc", {Operand::makeNumber(2)}),
        op("Tz", {Operand::makeNumber(80)}),
        tj("inner"),
        op("Q"),
        tj("outer"),
    };

    const ExtractedText text = SegmentExtractor::extract(ops, {});
    ASSERT_EQ(text.segments.size(), 2u);
    EXPECT_EQ(text.segments[0].font.font, "F2");
    EXPECT_DOUBLE_EQ(text.segments[0].font.char_spacing, 2.0);
    EXPECT_DOUBLE_EQ(text.segments[0].font.horizontal_scaling, 80.0);

    EXPECT_EQ(text.segments[1].font.font, "F1");
    EXPECT_DOUBLE_EQ(text.segments[1].font.size, 10.0);
    EXPECT_DOUBLE_EQ(text.segments[1].font.char_spacing, 0.0);
    EXPECT_DOUBLE_EQ(text.segments[1].font.horizontal_scaling, 100.0);
}

TEST(SegmentExtractorTest, DoubleQuoteSetsSpacing)
{
    const std::vector<ContentOp> ops{
        tf("F1", 10),
        op("\"", {Operand::makeNumber(3), Operand::makeNumber(1),
                  Operand::makeString("spaced")}),
    };

    const ExtractedText text = SegmentExtractor::extract(ops, {});
    ASSERT_EQ(text.segments.size(), 1u);
    EXPECT_EQ(text.segments[0].text, U"spaced");
    EXPECT_DOUBLE_EQ(text.segments[0].font.word_spacing, 3.0);
    EXPECT_DOUBLE_EQ(text.segments[0].font.char_spacing, 1.0);
}

TEST(SegmentExtractorTest, CustomSpaceThreshold)
{
    const std::vector<ContentOp> ops{
        tf("F1", 10),
        op("TJ", {Operand::makeArray({Operand::makeString("a"),
                                      Operand::makeNumber(-50),
                                      Operand::makeString("b")})}),
    };

    EXPECT_EQ(SegmentExtractor::extract(ops, {}).text(), U"ab");
    EXPECT_EQ(SegmentExtractor::extract(ops, {}, -40.0).text(), U"a b");
}

TEST(SegmentExtractorTest, UnknownFontFallsBackToLatin1)
{
    SegmentExtractor::CodecMap codecs;
    codecs.emplace("F1", FontCodec::latin1("F1"));

    const FontCodec &codec = SegmentExtractor::codecFor(codecs, "F9");
    EXPECT_EQ(codec.bytesPerCode(), 1);
    EXPECT_EQ(codec.decodeText("caf\xe9"), U"caf\u00E9");
    EXPECT_EQ(&SegmentExtractor::codecFor(codecs, "F1"), &codecs.at("F1"));
}

} // namespace
