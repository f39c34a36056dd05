#include "TemplateLibrary.hpp"

#include <algorithm>

namespace processing
{

namespace
{

using citation::CategoryTag;
using citation::FieldName;
using citation::FormattingStandard;

TemplateGroup titleGroup()
{
    return { "title",
             "",
             { { FieldName::Authors, "", "", "" },
               { FieldName::Title, " ", "", "" },
               { FieldName::Designation, " ", "[", "]" },
               { FieldName::Subtitle, " : ", "", "" },
               { FieldName::Responsibility, " / ", "", "" },
               { FieldName::Journal, " // ", "", "" } } };
}

TemplateGroup editionGroup()
{
    return { "edition", TemplateLibrary::kAreaLead, { { FieldName::Edition, "", "", "" } } };
}

TemplateGroup imprintGroup()
{
    return { "imprint",
             TemplateLibrary::kAreaLead,
             { { FieldName::City, "", "", "" },
               { FieldName::Publisher, " : ", "", "" },
               { FieldName::Year, ", ", "", "" } } };
}

TemplateGroup yearGroup()
{
    return { "year", TemplateLibrary::kAreaLead, { { FieldName::Year, "", "", "" } } };
}

TemplateGroup numberingGroup()
{
    return { "numbering",
             TemplateLibrary::kAreaLead,
             { { FieldName::Volume, "", "Т. ", "" }, { FieldName::Issue, ", ", "№ ", "" } } };
}

// Page text (range marker or unit) is composed by the renderer
TemplateGroup extentGroup()
{
    return { "extent", TemplateLibrary::kAreaLead, { { FieldName::Pages, "", "", "" } } };
}

TemplateGroup seriesGroup()
{
    return { "series", TemplateLibrary::kAreaLead, { { FieldName::Series, "", "(", ")" } } };
}

TemplateGroup accessGroup(FormattingStandard standard)
{
    if (standard == FormattingStandard::Gost2018)
    {
        return { "access",
                 TemplateLibrary::kAreaLead,
                 { { FieldName::Url, "", "URL: ", "" },
                   { FieldName::AccessDate, " ", "(дата обращения: ", ")" } } };
    }
    return { "access",
             TemplateLibrary::kAreaLead,
             { { FieldName::Url, "", "Режим доступа: ", "" },
               { FieldName::AccessDate, TemplateLibrary::kAreaLead, "Дата доступа: ", "" } } };
}

TemplateGroup doiGroup()
{
    return { "doi", TemplateLibrary::kAreaLead, { { FieldName::Doi, "", "DOI: ", "" } } };
}

TemplateGroup isbnGroup()
{
    return { "isbn", TemplateLibrary::kAreaLead, { { FieldName::Isbn, "", "ISBN ", "" } } };
}

} // anonymous namespace

bool CitationTemplate::references(FieldName field) const
{
    return std::any_of(body.begin(), body.end(),
                       [field](const TemplateGroup& group)
                       {
                           return std::any_of(group.slots.begin(), group.slots.end(),
                                              [field](const TemplateSlot& slot) { return slot.field == field; });
                       });
}

bool CitationTemplate::isRequired(FieldName field) const
{
    return std::find(required.begin(), required.end(), field) != required.end();
}

TemplateLibrary::TemplateLibrary(FormattingStandard standard)
    : standard_(standard)
{
    const std::vector<TemplateGroup> monograph = { titleGroup(),  editionGroup(), imprintGroup(),
                                                   extentGroup(), seriesGroup(),  accessGroup(standard) };
    const std::vector<TemplateGroup> component = { titleGroup(),   editionGroup(), imprintGroup(),
                                                   numberingGroup(), extentGroup(), seriesGroup(),
                                                   accessGroup(standard) };
    const std::vector<TemplateGroup> periodical = { titleGroup(), yearGroup(), numberingGroup(), extentGroup(),
                                                    accessGroup(standard) };

    for (CategoryTag tag : citation::allCategories())
    {
        switch (tag)
        {
        case CategoryTag::JournalArticle:
        case CategoryTag::NewspaperArticle:
            addTemplate(tag, periodical, { FieldName::Title, FieldName::Journal });
            break;
        case CategoryTag::Law:
        case CategoryTag::Review:
            addTemplate(tag, periodical, { FieldName::Title });
            break;
        case CategoryTag::CollectionArticle:
            addTemplate(tag, component, { FieldName::Title, FieldName::Journal });
            break;
        case CategoryTag::Conference:
            addTemplate(tag, component, { FieldName::Title });
            break;
        case CategoryTag::ElectronicResource:
            addTemplate(tag, monograph, { FieldName::Title, FieldName::Url });
            break;
        default:
            addTemplate(tag, monograph, { FieldName::Title });
            break;
        }
    }

    tail_ = { editionGroup(), imprintGroup(),         numberingGroup(), extentGroup(),
              seriesGroup(),  accessGroup(standard), doiGroup(),       isbnGroup() };
}

void TemplateLibrary::addTemplate(CategoryTag tag, std::vector<TemplateGroup> body, std::vector<FieldName> required)
{
    templates_[tag] = CitationTemplate{ tag, std::move(body), std::move(required) };
}

const TemplateLibrary& TemplateLibrary::forStandard(FormattingStandard standard)
{
    static const TemplateLibrary vak(FormattingStandard::VakRb);
    static const TemplateLibrary gost(FormattingStandard::Gost2018);
    return standard == FormattingStandard::Gost2018 ? gost : vak;
}

const CitationTemplate& TemplateLibrary::get(CategoryTag tag) const
{
    auto it = templates_.find(tag);
    if (it == templates_.end())
        return templates_.at(CategoryTag::Unknown);
    return it->second;
}

} // namespace processing
