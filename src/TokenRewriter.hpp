#pragma once

// Rewrites the text-show operators of a page so planned replacements take
// effect in the content stream.

#include "ContentStream.hpp"
#include "FontCodec.hpp"
#include "ReplacementPlanner.hpp"
#include "SegmentExtractor.hpp"

#include <map>
#include <optional>
#include <string>
#include <vector>

enum class RewriteStrategy
{
    SubstituteFont = 0,
    Literal,
};

const char *
rewriteStrategyName(RewriteStrategy s) noexcept;

std::optional<RewriteStrategy>
rewriteStrategyFromName(const std::string &name) noexcept;

struct RewriteOptions
{
    std::vector<RewriteStrategy> strategies{RewriteStrategy::SubstituteFont,
                                            RewriteStrategy::Literal};
    // Resource name of the substitute font on the page. SubstituteFont fails
    // when it is empty.
    std::string substitute_resource;
    double fixed_width_ratio{0.6};
    double min_font_size{4.0};
    double space_threshold{SegmentExtractor::SPACE_THRESHOLD};
};

struct RewriteOutcome
{
    bool ok{false};
    RewriteStrategy strategy{RewriteStrategy::Literal};
    std::vector<ContentOp> ops;
    // Parallel to the records passed in
    std::vector<bool> applied;
    std::string error;

    int appliedCount() const noexcept;
};

// One element of a TJ array (a Tj string is a single text entry)
struct TjEntry
{
    enum class Kind
    {
        Text = 0,
        Kern,
        Other,
    };

    Kind kind{Kind::Text};
    std::vector<FontCodec::CodeUnit> units;
    double value{0.0};
    bool adds_space{false};
    Operand other;
    bool keep{true};
    int start{0};
    int end{0};

    std::u32string text() const;
    std::string bytes() const;
};

// Fitted replacement text for the substitute font
struct FittedText
{
    enum class Kind
    {
        Empty = 0,
        Normal,
        SingleChar,
        Abbreviated,
    };

    std::u32string text;
    Kind kind{Kind::Normal};
};

class TokenRewriter
{
public:
    explicit TokenRewriter(RewriteOptions options) noexcept;

    // Tries the configured strategies in order. On failure of all of them
    // the outcome carries the original operators and ok == false.
    RewriteOutcome apply(const std::vector<ContentOp> &ops,
                         const ExtractedText &extracted,
                         const std::vector<ReplacementRecord> &records,
                         const SegmentExtractor::CodecMap &codecs) const;

    RewriteOutcome applyStrategy(RewriteStrategy strategy,
                                 const std::vector<ContentOp> &ops,
                                 const ExtractedText &extracted,
                                 const std::vector<ReplacementRecord> &records,
                                 const SegmentExtractor::CodecMap &codecs) const;

    // Substitute font size for `replacement` to span `target_width` points
    static double substituteFontSize(std::u32string_view replacement,
                                     double target_width, size_t original_length,
                                     double ratio = 0.6) noexcept;

    // Shortens the replacement when even `min_size` would overflow
    static FittedText fitReplacement(std::u32string_view replacement,
                                     double target_width, double min_size = 4.0,
                                     double ratio = 0.6);

    // TJ entry model
    static std::vector<TjEntry> buildEntries(const ContentOp &op,
                                             const FontCodec &codec,
                                             double space_threshold);
    static int recalculate(std::vector<TjEntry> &entries) noexcept;
    // Replaces chars [start, end) of the entries with `replacement` units
    static void splice(std::vector<TjEntry> &entries, int start, int end,
                       const std::vector<FontCodec::CodeUnit> &replacement);
    static std::pair<std::u32string, std::map<int, double>>
    state(const std::vector<TjEntry> &entries);
    // Entries with chars in [from, to) plus plain kerns at positions
    // from..to inclusive
    static std::vector<TjEntry> slice(const std::vector<TjEntry> &entries,
                                      int from, int to);
    // Operators showing the entries in place of `original`. A Tj, ' or "
    // stays what it was when the entries are a single string and the
    // original carried no kerning.
    static std::vector<ContentOp> toOps(const std::vector<TjEntry> &entries,
                                        const ContentOp &original,
                                        bool had_kerning);

private:
    struct Edit
    {
        int local_start{0};
        int local_end{0};
        std::u32string text;
        size_t record{0};
        bool first{true};
    };

    std::map<int, std::vector<Edit>>
    collectEdits(const ExtractedText &extracted,
                 const std::vector<ReplacementRecord> &records) const;

    RewriteOutcome substituteFont(const std::vector<ContentOp> &ops,
                                  const ExtractedText &extracted,
                                  const std::vector<ReplacementRecord> &records,
                                  const SegmentExtractor::CodecMap &codecs) const;

    RewriteOutcome literal(const std::vector<ContentOp> &ops,
                           const ExtractedText &extracted,
                           const std::vector<ReplacementRecord> &records,
                           const SegmentExtractor::CodecMap &codecs) const;

    // Width in points of chars [from, to) of a segment
    double coveredWidth(const std::vector<TjEntry> &entries, int from, int to,
                        const Segment &seg, const FontCodec &codec,
                        const ReplacementRecord &record) const;

    RewriteOptions m_options;
};
