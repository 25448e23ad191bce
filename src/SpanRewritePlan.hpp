#pragma once

// Declarative output: per glyph span, the text it should show after the
// replacements, with the geometry needed to fit it.

#include "SpanIndex.hpp"
#include "TextMeasurer.hpp"

#include <QJsonDocument>
#include <QJsonObject>
#include <QString>
#include <map>
#include <optional>
#include <string>
#include <vector>

struct SpanMappingRef
{
    QString q_label;
    std::u32string original;
    std::u32string replacement;
    std::optional<int> entry_index;
    // Normalised offsets the mapping asked for
    std::optional<int> start;
    std::optional<int> end;
    std::optional<int> operator_index;
};

struct SliceReplacement
{
    int normalized_start{0};
    int normalized_end{0};
    int raw_start{0};
    int raw_end{0};
    std::u32string replacement;
};

struct ValidationFailure
{
    std::u32string expected;
    std::u32string observed;
    int start{0}; // raw
    int end{0};
    std::u32string replacement;
    QString q_label;
    std::optional<int> operator_index;
};

struct SpanRewriteEntry
{
    int page{0};
    int block{0};
    int line{0};
    int span{0};
    std::optional<int> operator_index;
    std::u32string original_text;
    std::u32string replacement_text;
    std::string font;
    float font_size{0.0f};
    fz_rect bbox{};
    fz_matrix matrix{fz_identity};
    double original_width{0.0};
    double replacement_width{0.0};
    double scale_factor{1.0};
    std::vector<SpanMappingRef> mappings;
    std::vector<SliceReplacement> slice_replacements;
    bool overlay_fallback{false};
    bool requires_scaling{false};
    std::vector<ValidationFailure> validation_failures;

    QJsonObject toJson() const;
};

class SpanRewriteAccumulator
{
public:
    struct Pending
    {
        int start{0}; // normalised offsets into the span
        int end{0};
        std::u32string replacement;
        SpanMappingRef ref;
        bool overlay_fallback{false};
        bool requires_scaling{false};
    };

    explicit SpanRewriteAccumulator(SpanRecord span) noexcept;

    // Returns false when the slice was dropped: empty, inside an existing
    // slice, or partially overlapping one. A slice covering existing ones
    // replaces them.
    bool addReplacement(int start, int end, std::u32string replacement,
                        SpanMappingRef ref, bool overlay_fallback = false,
                        bool requires_scaling = false);

    // Validates every slice against the span text and builds the entry.
    // std::nullopt when no slice survives; see validationFailures().
    std::optional<SpanRewriteEntry> buildEntry(int page,
                                               const TextMeasurer &measurer);

    inline const std::vector<Pending> &replacements() const noexcept
    {
        return m_replacements;
    }

    inline const std::vector<ValidationFailure> &
    validationFailures() const noexcept
    {
        return m_failures;
    }

    inline const SpanRecord &span() const noexcept
    {
        return m_span;
    }

    // Raw char range of the span -> normalised range
    static std::pair<int, int> rawToNormalized(const SpanRecord &span,
                                               int raw_start, int raw_end);

private:
    std::pair<int, int> normalizedToRaw(int start, int end) const;

    SpanRecord m_span;
    std::vector<Pending> m_replacements;
    std::vector<ValidationFailure> m_failures;
};

class SpanRewritePlan
{
public:
    void add(SpanRewriteEntry entry);

    inline bool empty() const noexcept
    {
        return m_pages.empty();
    }

    inline const std::map<int, std::vector<SpanRewriteEntry>> &
    pages() const noexcept
    {
        return m_pages;
    }

    int size() const noexcept;

    // {"pages": [{"page": n, "entries": [...]}, ...]} in page order
    QJsonDocument toJson() const;

private:
    std::map<int, std::vector<SpanRewriteEntry>> m_pages;
};
