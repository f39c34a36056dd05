#include "TemplateRenderer.hpp"
#include "Diagnostics.hpp"
#include "../utils/Profile.hpp"

#include <optional>
#include <plog/Log.h>
#include <set>

namespace processing
{

namespace
{

using citation::FieldName;

// Appends a joiner; a joiner opening with "." after text that already ends
// with "." loses its own period ("ун-т." + ". – " -> "ун-т. – ")
void appendAbsorbing(std::string& out, const std::string& piece)
{
    if (!out.empty() && out.back() == '.' && !piece.empty() && piece.front() == '.')
        out.append(piece, 1, std::string::npos);
    else
        out += piece;
}

std::optional<std::string> slotValue(const TemplateSlot& slot, const citation::ExtractedFields& fields)
{
    if (slot.field == FieldName::Authors)
    {
        if (!fields.heading || fields.authors.empty())
            return std::nullopt;
        return fields.authors.front();
    }

    const citation::FieldValue& fv = fields.get(slot.field);
    if (!fv.found || fv.embedded || fv.value.empty())
        return std::nullopt;

    if (slot.field == FieldName::Pages)
    {
        if (fields.page_range)
            return (fields.page_unit.empty() ? std::string("С.") : fields.page_unit) + " " + fv.value;
        if (!fields.page_unit.empty())
            return fv.value + " " + fields.page_unit;
    }
    return slot.prefix + fv.value + slot.suffix;
}

class DraftBuilder
{
public:
    DraftBuilder(const citation::ExtractedFields& fields, const CitationTemplate& tmpl, RenderOutput& output)
        : fields_(fields)
        , template_(tmpl)
        , output_(output)
    {
    }

    // Returns the fields the group rendered
    std::set<FieldName> renderGroup(const TemplateGroup& group, bool tail)
    {
        std::set<FieldName> rendered;
        std::string text;

        for (const auto& slot : group.slots)
        {
            if (tail && template_.references(slot.field))
                continue;

            std::optional<std::string> value = slotValue(slot, fields_);
            if (!value && !tail && template_.isRequired(slot.field))
            {
                value = TemplateRenderer::gapMarker(slot.field);
                output_.issues.push_back({ citation::IssueKind::MissingRequiredField, slot.field,
                                           "required field '" + std::string(citation::toString(slot.field)) +
                                               "' is missing" });
            }
            if (!value)
                continue;

            if (!text.empty())
                appendAbsorbing(text, slot.joiner);
            text += *value;
            rendered.insert(slot.field);
        }

        if (text.empty())
            return rendered;

        if (!output_.draft.empty())
            appendAbsorbing(output_.draft, group.lead);
        output_.draft += text;
        return rendered;
    }

    void appendNotesAnchoredTo(const std::set<FieldName>& rendered)
    {
        for (std::size_t i = 0; i < fields_.notes.size(); ++i)
        {
            const auto& note = fields_.notes[i];
            if (emitted_.count(i) || !note.anchor || !rendered.count(*note.anchor))
                continue;
            appendNote(i);
        }
    }

    void appendRemainingNotes()
    {
        for (std::size_t i = 0; i < fields_.notes.size(); ++i)
        {
            if (!emitted_.count(i))
                appendNote(i);
        }
    }

private:
    void appendNote(std::size_t index)
    {
        if (!output_.draft.empty())
            appendAbsorbing(output_.draft, TemplateLibrary::kAreaLead);
        output_.draft += fields_.notes[index].text;
        emitted_.insert(index);
    }

    const citation::ExtractedFields& fields_;
    const CitationTemplate& template_;
    RenderOutput& output_;
    std::set<std::size_t> emitted_;
};

} // anonymous namespace

std::string TemplateRenderer::gapMarker(FieldName field)
{
    return "[?" + std::string(citation::toString(field)) + "]";
}

RenderOutput TemplateRenderer::render(citation::CategoryTag tag, const citation::ExtractedFields& fields,
                                      citation::FormattingStandard standard) const
{
    PROFILE_SCOPE_CUSTOM("TemplateRenderer::render");

    const TemplateLibrary& library = TemplateLibrary::forStandard(standard);
    const CitationTemplate& tmpl = library.get(tag);

    RenderOutput output;
    DraftBuilder builder(fields, tmpl, output);

    for (const auto& group : tmpl.body)
        builder.appendNotesAnchoredTo(builder.renderGroup(group, false));
    for (const auto& group : library.tail())
        builder.appendNotesAnchoredTo(builder.renderGroup(group, true));
    builder.appendRemainingNotes();

    if (!output.draft.empty() && output.draft.back() != '.')
        output.draft.push_back('.');

    if (Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance)
            << "[TemplateRenderer] tag=" << citation::toString(tag) << " standard=" << citation::toString(standard)
            << " gaps=" << output.issues.size() << " draft=" << Diagnostics::Preview(output.draft);
    }
    return output;
}

} // namespace processing
