#pragma once

// Checks a rewritten document: in the region of every entry the original
// text must be gone and the replacement must show exactly once.

#include "Document.hpp"
#include "MappingContext.hpp"

#include <stdexcept>
#include <string>
#include <vector>

class ValidationError : public std::runtime_error
{
public:
    using std::runtime_error::runtime_error;
};

class OutputValidator
{
public:
    explicit OutputValidator(int max_errors = 5) noexcept
        : m_max_errors(max_errors)
    {
    }

    // Problems found, one message each, in entry order
    std::vector<std::string> check(Document &doc,
                                   const std::vector<MappingEntry> &entries) const;

    // Throws ValidationError carrying the first max_errors problems joined
    // with "; "
    void validate(Document &doc, const std::vector<MappingEntry> &entries) const;

    // Area the entry is checked in, empty when it has none
    static fz_rect clipFor(const MappingEntry &entry) noexcept;

    // Non-overlapping hits of needle, compared without whitespace
    static int countOccurrences(std::u32string_view haystack,
                                std::u32string_view needle);

private:
    int m_max_errors;
};
