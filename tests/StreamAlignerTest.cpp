#include "StreamAligner.hpp"

#include "SubstringLocator.hpp"
#include "TestHelpers.hpp"

#include <gtest/gtest.h>

namespace
{

using testing_helpers::make_entry;
using testing_helpers::make_page;

std::vector<MappingEntry>
located(const GlyphPage &page, MappingEntry entry)
{
    const SpanIndex index(page);
    const SubstringLocator locator(index);
    EXPECT_TRUE(locator.locate(entry, {}, {}).has_value());
    return {std::move(entry)};
}

TEST(StreamAlignerTest, MatchingBlocksLongestFirst)
{
    const auto blocks = StreamAligner::matchingBlocks(U"abxcd", U"abcd");
    ASSERT_EQ(blocks.size(), 2u);
    EXPECT_EQ(blocks[0].a, 0);
    EXPECT_EQ(blocks[0].b, 0);
    EXPECT_EQ(blocks[0].size, 2);
    EXPECT_EQ(blocks[1].a, 3);
    EXPECT_EQ(blocks[1].b, 2);
    EXPECT_EQ(blocks[1].size, 2);
}

TEST(StreamAlignerTest, MatchingBlocksOfDisjointText)
{
    EXPECT_TRUE(StreamAligner::matchingBlocks(U"abc", U"xyz").empty());
    EXPECT_TRUE(StreamAligner::matchingBlocks(U"", U"xyz").empty());

    const auto same = StreamAligner::matchingBlocks(U"same", U"same");
    ASSERT_EQ(same.size(), 1u);
    EXPECT_EQ(same[0].size, 4);
}

TEST(StreamAlignerTest, AttachesExactRange)
{
    const GlyphPage page = make_page({{U"Hello world"}});
    auto entries = located(page, make_entry(U"Hello world", U"world", U"there"));

    StreamAligner::attach(page, U"Hello world", entries, 0.5);
    ASSERT_TRUE(entries[0].stream.has_value());
    EXPECT_EQ(entries[0].stream->start, 6);
    EXPECT_EQ(entries[0].stream->end, 11);
    EXPECT_EQ(entries[0].stream->text, U"world");
    EXPECT_DOUBLE_EQ(entries[0].stream->confidence, 1.0);
    EXPECT_EQ(entries[0].alignment_confidence, 1.0);
}

TEST(StreamAlignerTest, FollowsStreamOffsets)
{
    // The stream holds text the glyph layer does not show
    const GlyphPage page = make_page({{U"Hello world"}});
    auto entries = located(page, make_entry(U"Hello world", U"world", U"there"));

    StreamAligner::attach(page, U"XX Hello world", entries, 0.5);
    ASSERT_TRUE(entries[0].stream.has_value());
    EXPECT_EQ(entries[0].stream->start, 9);
    EXPECT_EQ(entries[0].stream->end, 14);
}

TEST(StreamAlignerTest, BelowThresholdKeepsConfidenceOnly)
{
    const GlyphPage page = make_page({{U"Hello world"}});
    auto entries = located(page, make_entry(U"Hello world", U"world", U"there"));

    StreamAligner::attach(page, U"Hello world", entries, 1.5);
    EXPECT_FALSE(entries[0].stream.has_value());
    ASSERT_TRUE(entries[0].alignment_confidence.has_value());
    EXPECT_DOUBLE_EQ(*entries[0].alignment_confidence, 1.0);
}

TEST(StreamAlignerTest, UnverifiableRangeIsDropped)
{
    const GlyphPage page = make_page({{U"Hello world"}});
    auto entries = located(page, make_entry(U"Hello world", U"world", U"there"));

    StreamAligner::attach(page, U"Hello wxrld", entries, 0.5);
    EXPECT_FALSE(entries[0].stream.has_value());
    EXPECT_EQ(entries[0].alignment_confidence, 0.0);
}

TEST(StreamAlignerTest, SkipsEntriesWithoutMatch)
{
    const GlyphPage page = make_page({{U"Hello world"}});
    std::vector<MappingEntry> entries{
        make_entry(U"Hello world", U"world", U"there")};

    StreamAligner::attach(page, U"Hello world", entries, 0.5);
    EXPECT_FALSE(entries[0].stream.has_value());
    EXPECT_FALSE(entries[0].alignment_confidence.has_value());
}

} // namespace
