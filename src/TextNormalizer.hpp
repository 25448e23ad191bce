#pragma once

// Text normalisation shared by every stage that compares the authored stem
// text against glyph text or content stream text.

#include <string>
#include <string_view>
#include <vector>

namespace TextNormalizer
{

// Normalised text together with, for every normalised character, the index
// of the character it came from in the source string.
struct MappedText
{
    std::u32string text;
    std::vector<int> index_map;
};

bool
isZeroWidth(char32_t c) noexcept;

std::u32string
stripZeroWidth(std::u32string_view s);

std::u32string
collapseWhitespace(std::u32string_view s);

// Strip zero-width marks, translate typographic variants and collapse
// whitespace. Idempotent.
std::u32string
normalizeForMatch(std::u32string_view s);

std::u32string
normalizeForCompare(std::u32string_view s);

// Like normalizeForMatch but keeps a map back to the zero-width stripped
// input. Characters whose translation is empty keep the raw character.
MappedText
buildNormalizedMap(std::u32string_view s);

// Simple (length preserving) case folding
std::u32string
casefold(std::u32string_view s);

// Case folded and reduced to [0-9a-z]
std::u32string
compactAscii(std::u32string_view s);

// Case folded letters and digits of any script, with a map back to the input
MappedText
compactAlnum(std::u32string_view s);

// NFKD, combining marks dropped, case folded, whitespace dropped.
MappedText
foldForSearch(std::u32string_view s);

// NFKD with whitespace removed
std::u32string
collapseNfkd(std::u32string_view s);

// Control-code ligatures (U+000B..U+000F) produced by some extractors
std::u32string
expandControlLigatures(std::u32string_view s);

// Six zero-width characters derived from the SHA-1 of `context`
std::u32string
encodeMarker(std::u32string_view context);

bool
containsMarker(std::u32string_view s) noexcept;

} // namespace TextNormalizer
