#pragma once

#include "CitationTypes.hpp"

#include <map>
#include <string>
#include <vector>

namespace processing
{

// One field position inside a group. The joiner separates the slot from the
// previous rendered slot of the same group; the first rendered slot of a group
// takes the group lead instead.
struct TemplateSlot
{
    citation::FieldName field;
    std::string joiner;
    std::string prefix;
    std::string suffix;
};

struct TemplateGroup
{
    std::string name;
    std::string lead;
    std::vector<TemplateSlot> slots;
};

struct CitationTemplate
{
    citation::CategoryTag tag = citation::CategoryTag::Unknown;
    std::vector<TemplateGroup> body;
    std::vector<citation::FieldName> required;

    [[nodiscard]] bool references(citation::FieldName field) const;
    [[nodiscard]] bool isRequired(citation::FieldName field) const;
};

// Canonical formulas per category for one formatting standard.
// Instances are immutable once built and shared process-wide.
class TemplateLibrary
{
public:
    explicit TemplateLibrary(citation::FormattingStandard standard);

    [[nodiscard]] static const TemplateLibrary& forStandard(citation::FormattingStandard standard);

    [[nodiscard]] const CitationTemplate& get(citation::CategoryTag tag) const;

    // Groups appended after the body for found fields the body does not reference
    [[nodiscard]] const std::vector<TemplateGroup>& tail() const noexcept { return tail_; }

    [[nodiscard]] citation::FormattingStandard standard() const noexcept { return standard_; }

    static constexpr const char* kAreaLead = ". – ";

private:
    void addTemplate(citation::CategoryTag tag, std::vector<TemplateGroup> body,
                     std::vector<citation::FieldName> required);

    citation::FormattingStandard standard_;
    std::map<citation::CategoryTag, CitationTemplate> templates_;
    std::vector<TemplateGroup> tail_;
};

} // namespace processing
