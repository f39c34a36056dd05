#pragma once

#include <chrono>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace citation {

// Core data contracts for the citation pipeline.
// All stages use these types as input/output to ensure clean interfaces.

enum class CategoryTag
{
    BookFewAuthors,
    BookManyAuthors,
    JournalArticle,
    CollectionArticle,
    Dissertation,
    Abstract,
    Law,
    Standard,
    Patent,
    Conference,
    ElectronicResource,
    NewspaperArticle,
    Preprint,
    Multimedia,
    Map,
    MusicScore,
    VisualMaterial,
    Archive,
    ResearchReport,
    Deposited,
    Multivolume,
    Review,
    Catalog,
    MethodicalGuide,
    Unknown
};

// Corpus keys ("book_1_3_authors", "journal_article", ...)
[[nodiscard]] std::string_view toString(CategoryTag tag) noexcept;
[[nodiscard]] std::optional<CategoryTag> categoryFromString(std::string_view key) noexcept;
[[nodiscard]] const std::vector<CategoryTag>& allCategories();

enum class FormattingStandard
{
    VakRb,   // VAK of the Republic of Belarus / STB 7.1-2003
    Gost2018 // GOST R 7.0.100-2018
};

[[nodiscard]] std::string_view toString(FormattingStandard standard) noexcept;
[[nodiscard]] std::optional<FormattingStandard> standardFromString(std::string_view key) noexcept;

enum class FieldName
{
    Authors,
    Title,
    Subtitle,
    Designation,
    Responsibility,
    Journal,
    Edition,
    City,
    Publisher,
    Year,
    Volume,
    Issue,
    Pages,
    Series,
    Url,
    AccessDate,
    Doi,
    Isbn
};

[[nodiscard]] std::string_view toString(FieldName field) noexcept;

// A single extracted value. Offsets are code point positions in the text
// the extractor saw; the source text itself is never modified.
struct FieldValue
{
    bool found = false;
    std::string value;
    std::size_t offset = 0;
    std::size_t length = 0;
    bool embedded = false; // lies inside another rendered span (title, note, ...)
};

// A description area no field claimed, carried verbatim to the output
struct Note
{
    std::string text;
    std::optional<FieldName> anchor; // field rendered right before it in the source
    std::size_t offset = 0;
};

struct ExtractedFields
{
    std::vector<std::string> authors; // canonical inverted form "Surname, I. I."
    bool heading = false;             // source opens with an inverted author heading
    std::string page_unit;            // "с.", "с. : ил." after a page count; "С.", "P." before a range
    bool page_range = false;
    std::map<FieldName, FieldValue> values;
    std::vector<Note> notes;

    [[nodiscard]] bool found(FieldName field) const;
    [[nodiscard]] const FieldValue& get(FieldName field) const;
    [[nodiscard]] std::optional<std::string> value(FieldName field) const;

    void set(FieldName field, std::string value, std::size_t offset = 0, std::size_t length = 0);
};

// Structured input; absence (nullopt) is distinct from an empty string
struct CitationRecord
{
    std::vector<std::string> authors;
    std::optional<std::string> title;
    std::optional<std::string> subtitle;
    std::optional<std::string> responsibility;
    std::optional<std::string> year;
    std::optional<std::string> publisher;
    std::optional<std::string> city;
    std::optional<std::string> pages;
    std::optional<std::string> journal;
    std::optional<std::string> volume;
    std::optional<std::string> issue;
    std::optional<std::string> doi;
    std::optional<std::string> url;
    std::optional<std::string> access_date;
    std::optional<std::string> isbn;
    std::optional<std::string> edition;
    std::optional<std::string> series;
    std::optional<std::string> language;
    std::optional<CategoryTag> category_hint;
};

// Either an immutable text blob or a structured record
using Citation = std::variant<std::string, CitationRecord>;

enum class IssueKind
{
    UnrecognizedType,
    FieldNotFound,
    MissingRequiredField,
    AmbiguousRange,
    PunctuationViolation,
    StageFailure,
    InputTruncated
};

[[nodiscard]] std::string_view toString(IssueKind kind) noexcept;

struct Issue
{
    IssueKind kind;
    std::optional<FieldName> field;
    std::string message;
};

struct CitationResult
{
    CategoryTag tag = CategoryTag::Unknown;
    ExtractedFields fields;
    std::string formatted;
    int confidence = 0;
    std::vector<Issue> issues;
    std::chrono::microseconds processing_time{ 0 };

    [[nodiscard]] bool hasIssue(IssueKind kind) const;
};

// Pipeline execution result wrapper (common for all stages)
template<typename T>
struct StageResult {
    T result;                                 // The actual result payload
    bool succeeded = true;                    // Whether the stage completed successfully
    std::optional<std::string> error;         // Error message if stage failed
    std::chrono::microseconds duration{ 0 };  // How long the stage took to execute
    std::string stage_name;                   // Name of the stage (for logging/metrics)

    static StageResult success(T r, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.result = std::move(r);
        res.succeeded = true;
        res.duration = time;
        res.stage_name = name;
        return res;
    }

    static StageResult failure(const std::string& err, std::chrono::microseconds time, const std::string& name) {
        StageResult res;
        res.succeeded = false;
        res.error = err;
        res.duration = time;
        res.stage_name = name;
        return res;
    }
};

} // namespace citation
