#pragma once

// Mapping context: the questions of a run with the substrings to replace,
// loaded from JSON and turned into per-page MappingEntry lists.

#include "GlyphPage.hpp"

#include <QByteArray>
#include <QJsonObject>
#include <QString>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

class MappingError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

// Characters [char_start, char_end) of one span
struct GlyphPath
{
    int block{0};
    int line{0};
    int span{0};
    int char_start{0};
    int char_end{0};
};

// Where the locator found an entry on the page
struct LocatedMatch
{
    fz_rect rect{};
    float font_size{10.0f};
    std::string font;
    std::u32string text;
    std::vector<GlyphRef> glyphs;
    std::vector<std::string> span_ids;
    std::optional<GlyphPath> path;
};

// Character range of an entry in the page's text-show stream
struct StreamRange
{
    int start{0};
    int end{0};
    std::u32string text;
    double confidence{0.0};
};

struct MappingEntry
{
    QString q_label;
    int entry_index{0};

    std::u32string original;
    std::u32string replacement;
    std::u32string stem_text;
    int start_pos{0};
    int end_pos{0};

    std::optional<int> page;
    std::optional<fz_rect> stem_bbox;
    std::optional<fz_rect> selection_bbox;
    std::vector<fz_quad> selection_quads;
    std::vector<std::string> span_ids;

    // Line of a multi-line mapping this entry was split from
    int line{0};

    std::u32string prefix;
    std::u32string suffix;
    std::optional<int> occurrence_index;
    std::optional<GlyphPath> glyph_hint;
    std::string fingerprint_key;

    bool overlay_hint{false};
    bool scaling_hint{false};

    // Filled in while rendering
    std::optional<LocatedMatch> match;
    std::optional<StreamRange> stream;
    // Set by the aligner even when the range fell below the threshold
    std::optional<double> alignment_confidence;

    // Selection box when present, else the stem box
    std::optional<fz_rect> regionHint() const noexcept;
};

class MappingContext
{
public:
    static MappingContext fromJson(const QByteArray &json);
    static MappingContext fromFile(const QString &path);

    inline const QString &runId() const noexcept
    {
        return m_run_id;
    }

    inline void setRunId(const QString &id) noexcept
    {
        m_run_id = id;
    }

    inline const std::vector<MappingEntry> &entries() const noexcept
    {
        return m_entries;
    }

    // Entries grouped by page index, each list sorted by (start_pos,
    // entry_index). Entries without a page are left out.
    std::map<int, std::vector<MappingEntry>> byPage() const;

    // Zero-width marker unique to the run, the entry and its line
    static std::u32string markerFor(const QString &run_id,
                                    const MappingEntry &entry);

    static std::optional<int> safePageIndex(std::optional<int> page) noexcept;
    // Repairs drifting offsets against the stem text. Throws MappingError
    // when the substring cannot be found.
    static std::pair<int, int> normalizeSpanPosition(std::u32string_view stem,
                                                     std::u32string_view original,
                                                     int start, int end);
    static int computeOccurrenceIndex(std::u32string_view stem,
                                      std::u32string_view original,
                                      int target) noexcept;
    static std::string fingerprintKey(std::u32string_view prefix,
                                      std::u32string_view original,
                                      std::u32string_view suffix,
                                      int occurrence);
    // Pairs the lines of a multi-line original with those of the replacement
    static std::vector<std::pair<std::u32string, std::u32string>>
    splitMultiSpan(std::u32string_view original,
                   std::u32string_view replacement);

private:
    void addQuestion(const QJsonObject &question);
    // Occurrence index, prefix, suffix and fingerprint from the stem offsets
    static void deriveContext(MappingEntry &entry);

    QString m_run_id;
    std::vector<MappingEntry> m_entries;
};
