#include "CitationTypes.hpp"

#include <algorithm>
#include <array>
#include <utility>

namespace citation {

namespace {

constexpr std::array<std::pair<CategoryTag, std::string_view>, 25> kCategoryKeys{ {
    { CategoryTag::BookFewAuthors, "book_1_3_authors" },
    { CategoryTag::BookManyAuthors, "book_4plus_authors" },
    { CategoryTag::JournalArticle, "journal_article" },
    { CategoryTag::CollectionArticle, "collection_article" },
    { CategoryTag::Dissertation, "dissertation" },
    { CategoryTag::Abstract, "abstract" },
    { CategoryTag::Law, "law" },
    { CategoryTag::Standard, "standard" },
    { CategoryTag::Patent, "patent" },
    { CategoryTag::Conference, "conference" },
    { CategoryTag::ElectronicResource, "electronic_resource" },
    { CategoryTag::NewspaperArticle, "newspaper_article" },
    { CategoryTag::Preprint, "preprint" },
    { CategoryTag::Multimedia, "multimedia" },
    { CategoryTag::Map, "map" },
    { CategoryTag::MusicScore, "music_score" },
    { CategoryTag::VisualMaterial, "visual_material" },
    { CategoryTag::Archive, "archive" },
    { CategoryTag::ResearchReport, "research_report" },
    { CategoryTag::Deposited, "deposited" },
    { CategoryTag::Multivolume, "multivolume" },
    { CategoryTag::Review, "review" },
    { CategoryTag::Catalog, "catalog" },
    { CategoryTag::MethodicalGuide, "methodical_guide" },
    { CategoryTag::Unknown, "unknown" },
} };

} // anonymous namespace

std::string_view toString(CategoryTag tag) noexcept
{
    for (const auto& [value, key] : kCategoryKeys)
    {
        if (value == tag)
            return key;
    }
    return "unknown";
}

std::optional<CategoryTag> categoryFromString(std::string_view key) noexcept
{
    for (const auto& [value, name] : kCategoryKeys)
    {
        if (name == key)
            return value;
    }
    return std::nullopt;
}

const std::vector<CategoryTag>& allCategories()
{
    static const std::vector<CategoryTag> tags = []()
    {
        std::vector<CategoryTag> out;
        out.reserve(kCategoryKeys.size());
        for (const auto& entry : kCategoryKeys)
            out.push_back(entry.first);
        return out;
    }();
    return tags;
}

std::string_view toString(FormattingStandard standard) noexcept
{
    switch (standard)
    {
    case FormattingStandard::VakRb:
        return "VAK_RB";
    case FormattingStandard::Gost2018:
        return "GOST_2018";
    }
    return "VAK_RB";
}

std::optional<FormattingStandard> standardFromString(std::string_view key) noexcept
{
    if (key == "VAK_RB" || key == "vak_rb" || key == "STB_7_1_2003")
        return FormattingStandard::VakRb;
    if (key == "GOST_2018" || key == "gost_2018" || key == "GOST_R_7_0_100_2018")
        return FormattingStandard::Gost2018;
    return std::nullopt;
}

std::string_view toString(FieldName field) noexcept
{
    switch (field)
    {
    case FieldName::Authors: return "authors";
    case FieldName::Title: return "title";
    case FieldName::Subtitle: return "subtitle";
    case FieldName::Designation: return "designation";
    case FieldName::Responsibility: return "responsibility";
    case FieldName::Journal: return "journal";
    case FieldName::Edition: return "edition";
    case FieldName::City: return "city";
    case FieldName::Publisher: return "publisher";
    case FieldName::Year: return "year";
    case FieldName::Volume: return "volume";
    case FieldName::Issue: return "issue";
    case FieldName::Pages: return "pages";
    case FieldName::Series: return "series";
    case FieldName::Url: return "url";
    case FieldName::AccessDate: return "access_date";
    case FieldName::Doi: return "doi";
    case FieldName::Isbn: return "isbn";
    }
    return "unknown";
}

std::string_view toString(IssueKind kind) noexcept
{
    switch (kind)
    {
    case IssueKind::UnrecognizedType: return "UnrecognizedType";
    case IssueKind::FieldNotFound: return "FieldNotFound";
    case IssueKind::MissingRequiredField: return "MissingRequiredField";
    case IssueKind::AmbiguousRange: return "AmbiguousRange";
    case IssueKind::PunctuationViolation: return "PunctuationViolation";
    case IssueKind::StageFailure: return "StageFailure";
    case IssueKind::InputTruncated: return "InputTruncated";
    }
    return "Unknown";
}

bool ExtractedFields::found(FieldName field) const
{
    auto it = values.find(field);
    return it != values.end() && it->second.found;
}

const FieldValue& ExtractedFields::get(FieldName field) const
{
    static const FieldValue kMissing{};
    auto it = values.find(field);
    return it != values.end() ? it->second : kMissing;
}

std::optional<std::string> ExtractedFields::value(FieldName field) const
{
    const FieldValue& fv = get(field);
    if (!fv.found)
        return std::nullopt;
    return fv.value;
}

void ExtractedFields::set(FieldName field, std::string value, std::size_t offset, std::size_t length)
{
    FieldValue& fv = values[field];
    fv.found = true;
    fv.value = std::move(value);
    fv.offset = offset;
    fv.length = length;
    fv.embedded = false;
}

bool CitationResult::hasIssue(IssueKind kind) const
{
    return std::any_of(issues.begin(), issues.end(), [kind](const Issue& issue) { return issue.kind == kind; });
}

} // namespace citation
