#include "TokenRewriter.hpp"

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
kerned_tj()
{
    return op("TJ", {Operand::makeArray({Operand::makeString("Q2"),
                                         Operand::makeNumber(-120),
                                         Operand::makeString("ints"),
                                         Operand::makeNumber(-30),
                                         Operand::makeString(" trailing")})});
}

ReplacementRecord
record(int start, int end, std::u32string replacement)
{
    ReplacementRecord r;
    r.start       = start;
    r.end         = end;
    r.replacement = std::move(replacement);
    return r;
}

RewriteOptions
only(RewriteStrategy strategy)
{
    RewriteOptions options;
    options.strategies          = {strategy};
    options.substitute_resource = "TSub0";
    return options;
}

TEST(TokenRewriterTest, SpliceAcrossKernSpace)
{
    const FontCodec codec = FontCodec::latin1();
    auto entries          = TokenRewriter::buildEntries(kerned_tj(), codec, -80.0);
    ASSERT_EQ(entries.size(), 5u);

    TokenRewriter::splice(entries, 0, 7, codec.decode("Question 2"));
    const auto [text, kerning] = TokenRewriter::state(entries);
    EXPECT_EQ(text, U"Question 2 trailing");
    const std::map<int, double> expected{{10, -30.0}};
    EXPECT_EQ(kerning, expected);
}

TEST(TokenRewriterTest, SliceKeepsEdgeKerns)
{
    const auto entries = TokenRewriter::buildEntries(
        kerned_tj(), FontCodec::latin1(), -80.0);
    const auto part    = TokenRewriter::slice(entries, 3, 7);
    const auto [text, kerning] = TokenRewriter::state(part);
    EXPECT_EQ(text, U"ints");
    const std::map<int, double> expected{{4, -30.0}};
    EXPECT_EQ(kerning, expected);
}

TEST(TokenRewriterTest, SubstituteFontSizeRules)
{
    EXPECT_DOUBLE_EQ(TokenRewriter::substituteFontSize(U"", 50, 4), 8.0);
    // Same length or shorter: kept within [6, 12]
    EXPECT_DOUBLE_EQ(TokenRewriter::substituteFontSize(U"ab", 100, 5), 12.0);
    EXPECT_DOUBLE_EQ(TokenRewriter::substituteFontSize(U"abc", 3, 5), 6.0);
    // Longer: within [4, 16]
    EXPECT_DOUBLE_EQ(TokenRewriter::substituteFontSize(U"abcdef", 36, 3), 10.0);
    EXPECT_DOUBLE_EQ(TokenRewriter::substituteFontSize(U"abcdef", 1000, 3), 16.0);
    EXPECT_DOUBLE_EQ(TokenRewriter::substituteFontSize(U"abcdef", 1, 3), 4.0);
}

TEST(TokenRewriterTest, FitReplacementShortens)
{
    const FittedText normal = TokenRewriter::fitReplacement(U"abc", 100);
    EXPECT_EQ(normal.kind, FittedText::Kind::Normal);
    EXPECT_EQ(normal.text, U"abc");

    const FittedText abbreviated
        = TokenRewriter::fitReplacement(U"abcdefghijklmnopqrst", 30);
    EXPECT_EQ(abbreviated.kind, FittedText::Kind::Abbreviated);
    EXPECT_EQ(abbreviated.text, U"abcdefghi...");

    const FittedText single
        = TokenRewriter::fitReplacement(U"abcdefghijklmnopqrst", 5);
    EXPECT_EQ(single.kind, FittedText::Kind::SingleChar);
    EXPECT_EQ(single.text, U"a");

    EXPECT_EQ(TokenRewriter::fitReplacement(U"", 10).kind,
              FittedText::Kind::Empty);
}

TEST(TokenRewriterTest, LiteralKeepsPlainTj)
{
    const std::vector<ContentOp> ops{
        op("Tf", {Operand::makeName("F1"), Operand::makeNumber(10)}),
        op("Tj", {Operand::makeString("long-term effect")}),
    };
    const ExtractedText extracted = SegmentExtractor::extract(ops, {});
    const std::vector<ReplacementRecord> records{record(0, 9, U"short-term")};

    const RewriteOutcome out = TokenRewriter(only(RewriteStrategy::Literal))
                                   .apply(ops, extracted, records, {});
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.strategy, RewriteStrategy::Literal);
    ASSERT_EQ(out.applied.size(), 1u);
    EXPECT_TRUE(out.applied[0]);
    ASSERT_EQ(out.ops.size(), 2u);
    EXPECT_EQ(out.ops[1].op, "Tj");
    EXPECT_EQ(out.ops[1].operands[0].bytes, "short-term effect");

    // The rewritten operators decode to the replaced text
    EXPECT_EQ(SegmentExtractor::extract(out.ops, {}).text(), U"short-term effect");
}

TEST(TokenRewriterTest, LiteralKeepsRemainingKerning)
{
    const std::vector<ContentOp> ops{
        op("Tf", {Operand::makeName("F1"), Operand::makeNumber(10)}),
        kerned_tj(),
    };
    const ExtractedText extracted = SegmentExtractor::extract(ops, {});
    const std::vector<ReplacementRecord> records{record(0, 7, U"Question 2")};

    const RewriteOutcome out = TokenRewriter(only(RewriteStrategy::Literal))
                                   .apply(ops, extracted, records, {});
    ASSERT_TRUE(out.ok);
    ASSERT_EQ(out.ops.size(), 2u);
    ASSERT_EQ(out.ops[1].op, "TJ");
    const auto &items = out.ops[1].operands.at(0).items;
    ASSERT_EQ(items.size(), 3u);
    EXPECT_EQ(items[0].bytes, "Question 2");
    EXPECT_DOUBLE_EQ(items[1].number, -30.0);
    EXPECT_EQ(items[2].bytes, " trailing");
}

TEST(TokenRewriterTest, LiteralFailsOnUnencodableText)
{
    const std::vector<ContentOp> ops{
        op("Tf", {Operand::makeName("F1"), Operand::makeNumber(10)}),
        op("Tj", {Operand::makeString("cost in euro")}),
    };
    const ExtractedText extracted = SegmentExtractor::extract(ops, {});
    const std::vector<ReplacementRecord> records{record(8, 12, U"\u20ACuro")};

    const RewriteOutcome out = TokenRewriter(only(RewriteStrategy::Literal))
                                   .apply(ops, extracted, records, {});
    EXPECT_FALSE(out.ok);
    EXPECT_FALSE(out.error.empty());
    EXPECT_EQ(out.appliedCount(), 0);
    ASSERT_EQ(out.ops.size(), 2u);
    EXPECT_EQ(out.ops[1].operands[0].bytes, "cost in euro");
}

TEST(TokenRewriterTest, SubstituteFontSplitsOperator)
{
    const std::vector<ContentOp> ops{
        op("Tf", {Operand::makeName("F1"), Operand::makeNumber(10)}),
        op("Tj", {Operand::makeString("long term effect")}),
    };
    const ExtractedText extracted = SegmentExtractor::extract(ops, {});
    const std::vector<ReplacementRecord> records{record(5, 9, U"short")};

    const RewriteOutcome out = TokenRewriter(only(RewriteStrategy::SubstituteFont))
                                   .apply(ops, extracted, records, {});
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.strategy, RewriteStrategy::SubstituteFont);

    std::vector<std::string> names;
    for (const ContentOp &o : out.ops)
        names.push_back(o.op);
    const std::vector<std::string> expected{"Tf", "TJ", "Tf", "TJ", "Tf", "TJ"};
    ASSERT_EQ(names, expected);

    EXPECT_EQ(out.ops[1].operands[0].items[0].bytes, "long ");
    EXPECT_EQ(out.ops[2].operands[0].bytes, "TSub0");
    // 4 chars at 10pt take 40pt; 5 chars at 0.6 em fill them at 13.33pt
    EXPECT_NEAR(out.ops[2].operands[1].number, 40.0 / 3.0, 1e-6);
    EXPECT_EQ(out.ops[3].operands[0].items.size(), 1u);
    EXPECT_EQ(out.ops[3].operands[0].items[0].bytes, "short");
    EXPECT_EQ(out.ops[4].operands[0].bytes, "F1");
    EXPECT_DOUBLE_EQ(out.ops[4].operands[1].number, 10.0);
    EXPECT_EQ(out.ops[5].operands[0].items[0].bytes, " effect");
}

TEST(TokenRewriterTest, SubstituteFontOutputReadsAsReplacement)
{
    const std::vector<ContentOp> ops{
        op("Tf", {Operand::makeName("F1"), Operand::makeNumber(10)}),
        op("Tj", {Operand::makeString("long term effect")}),
    };
    const ExtractedText extracted = SegmentExtractor::extract(ops, {});
    const std::vector<ReplacementRecord> records{record(5, 9, U"short")};

    const RewriteOutcome out = TokenRewriter(only(RewriteStrategy::SubstituteFont))
                                   .apply(ops, extracted, records, {});
    ASSERT_TRUE(out.ok);

    const std::u32string text = SegmentExtractor::extract(out.ops, {}).text();
    EXPECT_EQ(text, U"long short effect");
    EXPECT_EQ(text.find(U"term"), std::u32string::npos);
}

TEST(TokenRewriterTest, SubstituteFontEmptyReplacementLeavesSpacing)
{
    const std::vector<ContentOp> ops{
        op("Tf", {Operand::makeName("F1"), Operand::makeNumber(10)}),
        op("Tj", {Operand::makeString("long term effect")}),
    };
    const ExtractedText extracted = SegmentExtractor::extract(ops, {});
    const std::vector<ReplacementRecord> records{record(5, 9, U"")};

    const RewriteOutcome out = TokenRewriter(only(RewriteStrategy::SubstituteFont))
                                   .apply(ops, extracted, records, {});
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.appliedCount(), 1);

    std::vector<std::string> names;
    for (const ContentOp &o : out.ops)
        names.push_back(o.op);
    const std::vector<std::string> expected{"Tf", "TJ", "TJ", "TJ"};
    ASSERT_EQ(names, expected);

    // 4 chars at 10pt leave a 40pt gap
    const auto &gap = out.ops[2].operands.at(0).items;
    ASSERT_EQ(gap.size(), 1u);
    EXPECT_DOUBLE_EQ(gap[0].number, -4000.0);
    EXPECT_EQ(out.ops[3].operands[0].items[0].bytes, " effect");
}

TEST(TokenRewriterTest, SubstituteFontSizesTheShownText)
{
    const std::vector<ContentOp> ops{
        op("Tf", {Operand::makeName("F1"), Operand::makeNumber(10)}),
        op("Tj", {Operand::makeString("a good day")}),
    };
    const ExtractedText extracted = SegmentExtractor::extract(ops, {});
    // The ligature shows as two characters in the substitute font
    const std::vector<ReplacementRecord> records{record(2, 6, U"\uFB01ne")};

    const RewriteOutcome out = TokenRewriter(only(RewriteStrategy::SubstituteFont))
                                   .apply(ops, extracted, records, {});
    ASSERT_TRUE(out.ok);
    ASSERT_EQ(out.ops.size(), 6u);
    EXPECT_DOUBLE_EQ(out.ops[2].operands[1].number, 12.0);

    // 40pt covered, 4 chars at 12pt and 0.6 em fill 28.8pt
    const auto &items = out.ops[3].operands[0].items;
    ASSERT_EQ(items.size(), 2u);
    EXPECT_EQ(items[0].bytes, "fine");
    EXPECT_NEAR(items[1].number, -(40.0 - 28.8) * 1000.0 / 12.0, 1e-6);
}

TEST(TokenRewriterTest, FallsBackWhenNoSubstituteResource)
{
    const std::vector<ContentOp> ops{
        op("Tf", {Operand::makeName("F1"), Operand::makeNumber(10)}),
        op("Tj", {Operand::makeString("keep this")}),
    };
    const ExtractedText extracted = SegmentExtractor::extract(ops, {});
    const std::vector<ReplacementRecord> records{record(5, 9, U"that")};

    RewriteOptions options;
    ASSERT_TRUE(options.substitute_resource.empty());
    const RewriteOutcome out
        = TokenRewriter(options).apply(ops, extracted, records, {});
    ASSERT_TRUE(out.ok);
    EXPECT_EQ(out.strategy, RewriteStrategy::Literal);
    EXPECT_EQ(out.ops[1].operands[0].bytes, "keep that");
}

TEST(TokenRewriterTest, StrategyNames)
{
    EXPECT_STREQ(rewriteStrategyName(RewriteStrategy::SubstituteFont),
                 "substitute_font");
    EXPECT_EQ(rewriteStrategyFromName("literal"), RewriteStrategy::Literal);
    EXPECT_FALSE(rewriteStrategyFromName("glyph_swap").has_value());
}

} // namespace
