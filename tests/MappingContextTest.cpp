#include "MappingContext.hpp"

#include "TextNormalizer.hpp"

#include <QFile>
#include <QTemporaryDir>
#include <gtest/gtest.h>

namespace
{

MappingContext
load(const char *json)
{
    return MappingContext::fromJson(QByteArray(json));
}

TEST(MappingContextTest, LoadsQuestionsAndDerivesContext)
{
    const MappingContext context = load(R"({
        "run_id": "run-7",
        "questions": [{
            "q_number": "3",
            "page": 2,
            "stem_text": "Which of the following is the best answer?",
            "stem_bbox": [10, 20, 300, 40],
            "substring_mappings": [
                {"original": "best", "replacement": "worst",
                 "start_pos": 30, "end_pos": 34}
            ]
        }]
    })");

    EXPECT_EQ(context.runId(), "run-7");
    ASSERT_EQ(context.entries().size(), 1u);
    const MappingEntry &entry = context.entries()[0];
    EXPECT_EQ(entry.q_label, "3");
    EXPECT_EQ(entry.original, U"best");
    EXPECT_EQ(entry.replacement, U"worst");
    EXPECT_EQ(entry.start_pos, 30);
    EXPECT_EQ(entry.end_pos, 34);
    ASSERT_TRUE(entry.page.has_value());
    EXPECT_EQ(*entry.page, 1);
    EXPECT_EQ(entry.prefix, U"of the following is the ");
    EXPECT_EQ(entry.suffix, U" answer?");
    EXPECT_EQ(entry.occurrence_index, 0);
    ASSERT_TRUE(entry.regionHint().has_value());
    EXPECT_FLOAT_EQ(entry.regionHint()->x1, 300.0f);
    EXPECT_EQ(entry.fingerprint_key,
              MappingContext::fingerprintKey(entry.prefix, U"best", U" answer?", 0));
}

TEST(MappingContextTest, RejectsInvalidBounds)
{
    EXPECT_THROW(load(R"([{"q_number": "1", "stem_text": "abc def",
        "substring_mappings": [{"original": "def", "replacement": "xyz",
                                "start_pos": 4, "end_pos": 4}]}])"),
                 MappingError);

    EXPECT_THROW(load(R"([{"q_number": "1", "stem_text": "abc def",
        "substring_mappings": [{"original": "def", "replacement": "xyz"}]}])"),
                 MappingError);

    EXPECT_THROW(load("{not json"), MappingError);
}

TEST(MappingContextTest, SkipsEmptyMappings)
{
    const MappingContext context = load(R"([{"q_number": "1", "stem_text": "abc",
        "substring_mappings": [{"original": "", "replacement": "x",
                                "start_pos": 0, "end_pos": 1}]}])");
    EXPECT_TRUE(context.entries().empty());
}

TEST(MappingContextTest, RepairsDriftingOffsets)
{
    const std::u32string stem = U"The quick brown fox jumps";
    EXPECT_EQ(MappingContext::normalizeSpanPosition(stem, U"brown", 10, 15),
              std::make_pair(10, 15));
    EXPECT_EQ(MappingContext::normalizeSpanPosition(stem, U"brown", 12, 17),
              std::make_pair(10, 15));
    EXPECT_EQ(MappingContext::normalizeSpanPosition(stem, U"fox", -5, -1),
              std::make_pair(16, 19));
    EXPECT_THROW(MappingContext::normalizeSpanPosition(stem, U"cat", 0, 3),
                 MappingError);
}

TEST(MappingContextTest, OccurrenceIndexPicksNearestHit)
{
    const std::u32string stem = U"a cat and a cat and a cat";
    EXPECT_EQ(MappingContext::computeOccurrenceIndex(stem, U"cat", 2), 0);
    EXPECT_EQ(MappingContext::computeOccurrenceIndex(stem, U"cat", 12), 1);
    EXPECT_EQ(MappingContext::computeOccurrenceIndex(stem, U"cat", 21), 2);
    EXPECT_EQ(MappingContext::computeOccurrenceIndex(stem, U"dog", 3), 0);
}

TEST(MappingContextTest, SafePageIndex)
{
    EXPECT_EQ(MappingContext::safePageIndex(0), 0);
    EXPECT_EQ(MappingContext::safePageIndex(1), 0);
    EXPECT_EQ(MappingContext::safePageIndex(5), 4);
    EXPECT_FALSE(MappingContext::safePageIndex(-1).has_value());
    EXPECT_FALSE(MappingContext::safePageIndex(std::nullopt).has_value());
}

TEST(MappingContextTest, SelectionOverridesPageAndRegion)
{
    const MappingContext context = load(R"([{
        "q_number": "4", "page": 1, "stem_text": "one two three",
        "stem_spans": ["page0:block0:line0:span0"],
        "substring_mappings": [
            {"original": "two", "replacement": "2", "start_pos": 4, "end_pos": 7,
             "selection_page": 3,
             "selection_quads": [[10, 10, 30, 10, 10, 20, 30, 20]],
             "overlay_fallback": true},
            {"original": "three", "replacement": "3", "start_pos": 8, "end_pos": 13,
             "span_ids": ["page0:block0:line0:span2"],
             "glyph_path": {"block": 0, "line": 0, "span": 2,
                            "char_start": 0, "char_end": 5}}
        ]
    }])");

    ASSERT_EQ(context.entries().size(), 2u);
    const MappingEntry &two = context.entries()[0];
    EXPECT_EQ(two.page, 3);
    ASSERT_TRUE(two.selection_bbox.has_value());
    EXPECT_FLOAT_EQ(two.selection_bbox->x0, 10.0f);
    EXPECT_FLOAT_EQ(two.selection_bbox->y1, 20.0f);
    EXPECT_TRUE(two.overlay_hint);
    ASSERT_EQ(two.span_ids.size(), 1u);
    EXPECT_EQ(two.span_ids[0], "page0:block0:line0:span0");

    const MappingEntry &three = context.entries()[1];
    EXPECT_EQ(three.page, 0);
    ASSERT_EQ(three.span_ids.size(), 1u);
    EXPECT_EQ(three.span_ids[0], "page0:block0:line0:span2");
    ASSERT_TRUE(three.glyph_hint.has_value());
    EXPECT_EQ(three.glyph_hint->span, 2);
    EXPECT_EQ(three.glyph_hint->char_end, 5);
    EXPECT_FALSE(three.overlay_hint);
}

TEST(MappingContextTest, ByPageOrdersByStartThenIndex)
{
    const MappingContext context = load(R"([
        {"q_number": "1", "page": 1, "stem_text": "alpha beta gamma",
         "substring_mappings": [
            {"original": "gamma", "replacement": "G", "start_pos": 11, "end_pos": 16},
            {"original": "alpha", "replacement": "A", "start_pos": 0, "end_pos": 5}
         ]},
        {"q_number": "2", "page": 2, "stem_text": "delta",
         "substring_mappings": [
            {"original": "delta", "replacement": "D", "start_pos": 0, "end_pos": 5}
         ]},
        {"q_number": "3", "stem_text": "nowhere",
         "substring_mappings": [
            {"original": "nowhere", "replacement": "N", "start_pos": 0, "end_pos": 7}
         ]}
    ])");

    const auto pages = context.byPage();
    ASSERT_EQ(pages.size(), 2u);
    const auto &first = pages.at(0);
    ASSERT_EQ(first.size(), 2u);
    EXPECT_EQ(first[0].original, U"alpha");
    EXPECT_EQ(first[1].original, U"gamma");
    EXPECT_EQ(pages.at(1).at(0).original, U"delta");
}

TEST(MappingContextTest, SplitMultiSpanPairsLines)
{
    const auto pairs
        = MappingContext::splitMultiSpan(U"first line\n second line\n", U"one\ntwo");
    ASSERT_EQ(pairs.size(), 2u);
    EXPECT_EQ(pairs[0], std::make_pair(std::u32string(U"first line"),
                                       std::u32string(U"one")));
    EXPECT_EQ(pairs[1].first, U"second line");
    EXPECT_EQ(pairs[1].second, U"two");

    const auto padded = MappingContext::splitMultiSpan(U"a\nb\nc", U"x");
    ASSERT_EQ(padded.size(), 3u);
    EXPECT_EQ(padded[2].second, U"x");
}

TEST(MappingContextTest, MultiLineMappingBecomesOneEntryPerLine)
{
    const MappingContext context = load(R"([{
        "q_number": "4", "page": 1,
        "stem_text": "Fix the first line\nsecond line now",
        "substring_mappings": [
            {"original": "first line\nsecond line", "replacement": "one\ntwo",
             "start_pos": 8, "end_pos": 30}
        ]}])");

    ASSERT_EQ(context.entries().size(), 2u);
    const MappingEntry &first  = context.entries()[0];
    const MappingEntry &second = context.entries()[1];

    EXPECT_EQ(first.original, U"first line");
    EXPECT_EQ(first.replacement, U"one");
    EXPECT_EQ(first.start_pos, 8);
    EXPECT_EQ(first.end_pos, 18);
    EXPECT_EQ(first.line, 0);
    EXPECT_EQ(first.prefix, U"Fix the ");
    EXPECT_EQ(first.suffix, U"\nsecond line now");

    EXPECT_EQ(second.original, U"second line");
    EXPECT_EQ(second.replacement, U"two");
    EXPECT_EQ(second.start_pos, 19);
    EXPECT_EQ(second.end_pos, 30);
    EXPECT_EQ(second.line, 1);
    EXPECT_EQ(second.prefix, U"Fix the first line\n");
    EXPECT_EQ(second.suffix, U" now");
    EXPECT_EQ(second.occurrence_index, 0);
    EXPECT_NE(first.fingerprint_key, second.fingerprint_key);
    EXPECT_EQ(first.entry_index, second.entry_index);

    const auto pages = context.byPage();
    ASSERT_EQ(pages.at(0).size(), 2u);
    EXPECT_EQ(pages.at(0)[0].original, U"first line");
}

TEST(MappingContextTest, MarkerDependsOnRunEntryAndLine)
{
    MappingEntry entry;
    entry.q_label     = "1";
    entry.entry_index = 0;

    const std::u32string marker = MappingContext::markerFor("r1", entry);
    EXPECT_EQ(marker.size(), 6u);
    EXPECT_TRUE(TextNormalizer::containsMarker(U"red" + marker));
    EXPECT_TRUE(TextNormalizer::stripZeroWidth(marker).empty());
    EXPECT_EQ(marker, MappingContext::markerFor("r1", entry));
    EXPECT_NE(marker, MappingContext::markerFor("r2", entry));

    entry.line = 1;
    EXPECT_NE(marker, MappingContext::markerFor("r1", entry));
}

TEST(MappingContextTest, ReadsFromFile)
{
    QTemporaryDir dir;
    ASSERT_TRUE(dir.isValid());
    const QString path = dir.filePath("mapping.json");
    QFile file(path);
    ASSERT_TRUE(file.open(QIODevice::WriteOnly));
    file.write(R"([{"q_number": "1", "page": 1, "stem_text": "x y",
        "substring_mappings": [{"original": "y", "replacement": "z",
                                "start_pos": 2, "end_pos": 3}]}])");
    file.close();

    EXPECT_EQ(MappingContext::fromFile(path).entries().size(), 1u);
    EXPECT_THROW(MappingContext::fromFile(dir.filePath("missing.json")),
                 MappingError);
}

} // namespace
