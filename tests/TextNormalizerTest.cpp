#include "TextNormalizer.hpp"

#include <gtest/gtest.h>

namespace
{

using namespace TextNormalizer;

TEST(TextNormalizerTest, NormalizeForMatchIsIdempotent)
{
    const std::u32string samples[] = {
        U"  plain   text ",
        U"\u201Cquoted\u201D \u2014 dash\u2026",
        U"o\uFB01ce \uFB02ow",
        U"zero\u200Bwidth\u2060here",
        U"tab\tand\nnewline",
    };
    for (const auto &s : samples)
    {
        const std::u32string once = normalizeForMatch(s);
        EXPECT_EQ(normalizeForMatch(once), once);
    }
}

TEST(TextNormalizerTest, TranslatesTypographicVariants)
{
    EXPECT_EQ(normalizeForMatch(U"\u201C\uFB01ne\u201D"), U"\"fine\"");
    EXPECT_EQ(normalizeForMatch(U"a\u2014b"), U"a-b");
    EXPECT_EQ(normalizeForMatch(U"wait\u2026"), U"wait...");
    EXPECT_EQ(normalizeForMatch(U"  two   spaces  "), U"two spaces");
}

TEST(TextNormalizerTest, StripsZeroWidthCharacters)
{
    EXPECT_TRUE(isZeroWidth(U'\u200B'));
    EXPECT_TRUE(isZeroWidth(U'\uFEFF'));
    EXPECT_FALSE(isZeroWidth(U'a'));
    EXPECT_EQ(stripZeroWidth(U"a\u200Bb\u200Cc\u200Dd\u2060e\uFEFF"), U"abcde");
}

TEST(TextNormalizerTest, MarkerSurvivesAndDisappears)
{
    const std::u32string marker = encodeMarker(U"run:structured:1:0:0");
    ASSERT_EQ(marker.size(), 6u);
    for (char32_t c : marker)
        EXPECT_TRUE(isZeroWidth(c));

    const std::u32string tagged = U"the" + marker;
    EXPECT_TRUE(containsMarker(tagged));
    EXPECT_FALSE(containsMarker(U"the"));
    EXPECT_EQ(stripZeroWidth(tagged), U"the");

    EXPECT_EQ(encodeMarker(U"run:structured:1:0:0"), marker);
    EXPECT_NE(encodeMarker(U"run:structured:1:0:1"), marker);
}

TEST(TextNormalizerTest, NormalizedMapPointsBackToSource)
{
    // Indices are into the zero-width stripped input "  a\uFB01 b "
    const MappedText mapped = buildNormalizedMap(U"  a\u200B\uFB01 b ");
    EXPECT_EQ(mapped.text, U"afi b");
    const std::vector<int> expected{2, 3, 3, 4, 5};
    EXPECT_EQ(mapped.index_map, expected);
}

TEST(TextNormalizerTest, CompactForms)
{
    EXPECT_EQ(compactAscii(U"Hello, World 42!"), U"helloworld42");

    const MappedText alnum = compactAlnum(U"x - Y");
    EXPECT_EQ(alnum.text, U"xy");
    const std::vector<int> expected{0, 4};
    EXPECT_EQ(alnum.index_map, expected);
}

TEST(TextNormalizerTest, FoldForSearchDropsAccentsCaseAndSpaces)
{
    const MappedText folded = foldForSearch(U"Caf\u00E9 Au");
    EXPECT_EQ(folded.text, U"cafeau");
    ASSERT_EQ(folded.index_map.size(), folded.text.size());
    EXPECT_EQ(folded.index_map[3], 3);
    EXPECT_EQ(folded.index_map[4], 5);
}

TEST(TextNormalizerTest, CollapseNfkdAndLigatures)
{
    EXPECT_EQ(collapseNfkd(U"\uFB01 x"), U"fix");
    EXPECT_EQ(expandControlLigatures(U"e\x0B" U"ect"), U"effect");
    EXPECT_EQ(casefold(U"\u00C0B"), U"\u00E0b");
}

} // namespace
