#include "ReplacementPlanner.hpp"

#include "TestHelpers.hpp"

#include <gtest/gtest.h>

namespace
{

using testing_helpers::make_entry;

// Entry as the locator leaves it, matched on `text`
MappingEntry
matched(std::u32string_view stem, std::u32string original,
        std::u32string replacement, size_t from = 0)
{
    MappingEntry entry = make_entry(stem, original, std::move(replacement), from);
    entry.match        = LocatedMatch{};
    entry.match->text  = original;
    return entry;
}

TEST(ReplacementPlannerTest, SurroundingsUsePrefixThenSuffix)
{
    const std::u32string stream = U"long term and short term";
    MappingEntry entry;
    entry.prefix = U"short ";
    EXPECT_TRUE(ReplacementPlanner::matchesSurroundings(stream, 20, 24, entry));
    EXPECT_FALSE(ReplacementPlanner::matchesSurroundings(stream, 5, 9, entry));

    entry.prefix.clear();
    entry.suffix = U" and";
    EXPECT_TRUE(ReplacementPlanner::matchesSurroundings(stream, 5, 9, entry));
    EXPECT_FALSE(ReplacementPlanner::matchesSurroundings(stream, 20, 24, entry));

    EXPECT_FALSE(ReplacementPlanner::matchesSurroundings(stream, 9, 5, entry));
}

TEST(ReplacementPlannerTest, OccurrenceIndexPicksAmongCandidates)
{
    const std::u32string stream = U"x=1, x=2, x=3";
    MappingEntry entry;
    entry.occurrence_index = 2;
    auto range = ReplacementPlanner::findInStream(stream, U"x", entry, {});
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->first, 10);

    // The first candidate is used when the ordinal is out of range
    entry.occurrence_index = 7;
    range = ReplacementPlanner::findInStream(stream, U"x", entry, {});
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->first, 0);

    entry.occurrence_index = 0;
    range = ReplacementPlanner::findInStream(stream, U"x", entry, {{0, 1}});
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->first, 5);
}

TEST(ReplacementPlannerTest, CompactFallbackAbsorbsWhitespace)
{
    const std::u32string stream = U"value x - y here";
    MappingEntry entry;
    const auto range = ReplacementPlanner::findInStream(stream, U"x-y", entry, {});
    ASSERT_TRUE(range.has_value());
    EXPECT_EQ(range->first, 6);
    EXPECT_EQ(range->second, 11);
    EXPECT_TRUE(ReplacementPlanner::sameText(U"x - y", U"x-y"));
    EXPECT_FALSE(ReplacementPlanner::sameText(U"x - z", U"x-y"));
}

TEST(ReplacementPlannerTest, PlansEachOccurrenceOnce)
{
    const std::u32string stem = U"long term and short term";
    std::vector<MappingEntry> entries{
        matched(stem, U"term", U"run"),
        matched(stem, U"term", U"span", 10),
    };

    std::set<std::string> used;
    const auto records = ReplacementPlanner::plan(stem, entries, used);
    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].start, 5);
    EXPECT_EQ(records[0].end, 9);
    EXPECT_EQ(records[0].replacement, U"run");
    EXPECT_EQ(records[0].entry, &entries[0]);
    EXPECT_EQ(records[1].start, 20);
    EXPECT_EQ(records[1].replacement, U"span");
    EXPECT_EQ(records[1].observed, U"term");
    EXPECT_EQ(used.size(), 2u);
    EXPECT_FALSE(records[0].applied);
}

TEST(ReplacementPlannerTest, ConsumedFingerprintIsSkipped)
{
    const std::u32string stem = U"pick me";
    std::vector<MappingEntry> entries{matched(stem, U"me", U"you")};
    std::set<std::string> used{entries[0].fingerprint_key};

    EXPECT_TRUE(ReplacementPlanner::plan(stem, entries, used).empty());
}

TEST(ReplacementPlannerTest, SkipsUnmatchedAndMissingText)
{
    const std::u32string stem = U"some words here";
    MappingEntry unmatched = make_entry(stem, U"words", U"terms");
    MappingEntry missing   = matched(stem, U"here", U"there");
    missing.match->text    = U"absent";
    missing.original       = U"absent";

    std::vector<MappingEntry> entries{unmatched, missing};
    std::set<std::string> used;
    EXPECT_TRUE(ReplacementPlanner::plan(stem, entries, used).empty());
    EXPECT_TRUE(used.empty());
}

TEST(ReplacementPlannerTest, PrefersAlignedStreamRange)
{
    const std::u32string stream = U"ab ab ab";
    std::vector<MappingEntry> entries{matched(stream, U"ab", U"cd", 3)};
    entries[0].prefix.clear();
    entries[0].suffix.clear();
    entries[0].occurrence_index.reset();
    entries[0].stream = StreamRange{6, 8, U"ab", 1.0};

    std::set<std::string> used;
    const auto records = ReplacementPlanner::plan(stream, entries, used);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].start, 6);
}

TEST(ReplacementPlannerTest, OverlappingRangesAreRejected)
{
    const std::u32string stream = U"abcdef";
    std::vector<MappingEntry> entries{matched(stream, U"abcd", U"x"),
                                      matched(stream, U"cdef", U"y")};
    for (MappingEntry &e : entries)
    {
        e.prefix.clear();
        e.suffix.clear();
    }
    entries[1].stream = StreamRange{2, 6, U"cdef", 1.0};

    std::set<std::string> used;
    const auto records = ReplacementPlanner::plan(stream, entries, used);
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0].replacement, U"x");
}

} // namespace
