#include "OutputValidator.hpp"

#include "TextNormalizer.hpp"
#include "utils.hpp"

#include <QDebug>

fz_rect
OutputValidator::clipFor(const MappingEntry &entry) noexcept
{
    if (!entry.selection_quads.empty())
        return expand_rect(bound_quads(entry.selection_quads), 1.0f);

    if (auto region = entry.regionHint())
        return expand_rect(*region, 10.0f);

    if (entry.match)
        return expand_rect(entry.match->rect, 10.0f);

    return fz_empty_rect;
}

int
OutputValidator::countOccurrences(std::u32string_view haystack,
                                  std::u32string_view needle)
{
    const std::u32string h = TextNormalizer::collapseNfkd(haystack);
    const std::u32string n = TextNormalizer::collapseNfkd(needle);
    if (n.empty())
        return 0;

    int count  = 0;
    size_t pos = h.find(n);
    while (pos != std::u32string::npos)
    {
        ++count;
        pos = h.find(n, pos + n.size());
    }
    return count;
}

std::vector<std::string>
OutputValidator::check(Document &doc,
                       const std::vector<MappingEntry> &entries) const
{
    std::vector<std::string> errors;

    for (const MappingEntry &entry : entries)
    {
        if (!entry.page || *entry.page >= doc.pageCount())
            continue;

        const fz_rect clip = clipFor(entry);
        if (rect_is_empty(clip))
            continue;

        const std::u32string text = to_u32(doc.textInRect(*entry.page, clip));
        const std::string label   = entry.q_label.toStdString();

        const int replacements = countOccurrences(text, entry.replacement);

        // Hits of the original that are only part of a replacement do not count
        const int original_in_replacement
            = countOccurrences(entry.replacement, entry.original);
        const int originals = countOccurrences(text, entry.original)
                              - replacements * original_in_replacement;

        if (originals > 0)
            errors.push_back("Q" + label + ": original '"
                             + u32_to_utf8(entry.original)
                             + "' still present on page "
                             + std::to_string(*entry.page));

        if (replacements != 1)
            errors.push_back("Q" + label + ": replacement '"
                             + u32_to_utf8(entry.replacement) + "' found "
                             + std::to_string(replacements) + " times on page "
                             + std::to_string(*entry.page));
    }

    return errors;
}

void
OutputValidator::validate(Document &doc,
                          const std::vector<MappingEntry> &entries) const
{
    const std::vector<std::string> errors = check(doc, entries);
    if (errors.empty())
        return;

    for (const std::string &e : errors)
        qWarning() << "Validation:" << e.c_str();

    std::string message;
    const int n = std::min(static_cast<int>(errors.size()), m_max_errors);
    for (int i = 0; i < n; ++i)
    {
        if (i > 0)
            message += "; ";
        message += errors[i];
    }
    throw ValidationError(message);
}
