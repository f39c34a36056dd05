#pragma once

#include "CitationTypes.hpp"

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace processing
{

// One description area: text between ". – " separators, in code points
struct DescriptionArea
{
    std::size_t begin = 0;
    std::size_t end = 0;
};

// Pulls named fields out of a citation with independent targeted patterns.
// The text is never modified; every value records where it was found.
// Areas no pattern explains are kept as notes so nothing is lost on render.
class FieldExtractor
{
public:
    FieldExtractor();
    ~FieldExtractor();

    FieldExtractor(const FieldExtractor&) = delete;
    FieldExtractor& operator=(const FieldExtractor&) = delete;

    [[nodiscard]] citation::ExtractedFields extract(const std::string& text) const;

    // Canonical "Surname, I. I." list, inverted form first, direct form as fallback
    [[nodiscard]] std::vector<std::string> extractAuthors(const std::string& text) const;

    [[nodiscard]] static std::vector<DescriptionArea> splitAreas(const std::wstring& text);

    static constexpr std::size_t kMaxAuthors = 10;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace processing
