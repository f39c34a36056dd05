#pragma once

#include "CitationTypes.hpp"
#include "TemplateLibrary.hpp"

#include <string>
#include <vector>

namespace processing
{

struct RenderOutput
{
    std::string draft;
    std::vector<citation::Issue> issues;
};

// Fills a category formula with extracted fields.
//
// Empty groups collapse together with their lead. A missing required field is
// written as "[?name]" and reported. Found fields the body does not mention go
// to the canonical tail and notes follow the group of their anchor field, so
// nothing extracted is dropped.
class TemplateRenderer
{
public:
    [[nodiscard]] RenderOutput render(citation::CategoryTag tag, const citation::ExtractedFields& fields,
                                      citation::FormattingStandard standard) const;

    [[nodiscard]] static std::string gapMarker(citation::FieldName field);
};

} // namespace processing
