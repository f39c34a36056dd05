#include "CitationPipeline.hpp"
#include "CitationPatterns.hpp"
#include "CitationValidator.hpp"
#include "Diagnostics.hpp"
#include "FieldExtractor.hpp"
#include "PunctuationNormalizer.hpp"
#include "StageRunner.hpp"
#include "TemplateRenderer.hpp"
#include "TextCanonicalizer.hpp"
#include "TypeClassifier.hpp"
#include "WideText.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <plog/Log.h>
#include <regex>
#include <sstream>

namespace processing
{

namespace
{

using citation::CategoryTag;
using citation::FieldName;
using citation::IssueKind;

void logInput(const std::string& input)
{
    if (Diagnostics::IsVerbose())
        PLOG_INFO_(Diagnostics::kLogInstance) << "[CitationPipeline] stage=input raw=" << Diagnostics::Preview(input);
}

template<typename T>
void logStageStatus(const citation::StageResult<T>& stage, const std::string* output_preview = nullptr)
{
    if (!Diagnostics::IsVerbose())
        return;

    std::ostringstream oss;
    oss << "[CitationPipeline] stage=" << stage.stage_name;
    if (stage.succeeded)
    {
        oss << " status=ok duration=" << stage.duration.count() << "us";
        if (output_preview)
            oss << " output=" << Diagnostics::Preview(*output_preview);
        PLOG_INFO_(Diagnostics::kLogInstance) << oss.str();
    }
    else
    {
        oss << " status=error duration=" << stage.duration.count()
            << "us reason=" << (stage.error ? *stage.error : "unknown");
        PLOG_ERROR_(Diagnostics::kLogInstance) << oss.str();
    }
}

// Records the failure on the result and hands back the fallback value
template<typename T, typename V>
V fallback(const citation::StageResult<T>& stage, const char* target, V fallback_value,
           citation::CitationResult& result)
{
    result.issues.push_back({ IssueKind::StageFailure, std::nullopt,
                              stage.stage_name + ": " + (stage.error ? *stage.error : "unknown") });
    if (Diagnostics::IsVerbose())
        PLOG_WARNING_(Diagnostics::kLogInstance) << "[CitationPipeline] fallback=" << target;
    return fallback_value;
}

void logCompletion(const citation::CitationResult& result)
{
    if (Diagnostics::IsVerbose())
    {
        PLOG_INFO_(Diagnostics::kLogInstance)
            << "[CitationPipeline] stage=complete tag=" << citation::toString(result.tag)
            << " confidence=" << result.confidence << " issues=" << result.issues.size()
            << " output=" << Diagnostics::Preview(result.formatted);
    }
}

void appendUnique(std::vector<citation::Issue>& issues, std::vector<citation::Issue> extra)
{
    for (auto& issue : extra)
    {
        bool seen = std::any_of(issues.begin(), issues.end(),
                                [&issue](const citation::Issue& existing)
                                {
                                    return existing.kind == issue.kind && existing.field == issue.field &&
                                           existing.message == issue.message;
                                });
        if (!seen)
            issues.push_back(std::move(issue));
    }
}

void reportMissingFields(const citation::ExtractedFields& fields, std::vector<citation::Issue>& issues)
{
    if (fields.authors.empty())
        issues.push_back({ IssueKind::FieldNotFound, FieldName::Authors, "no author found" });
    if (!fields.found(FieldName::Title))
        issues.push_back({ IssueKind::FieldNotFound, FieldName::Title, "no title found" });
    if (!fields.found(FieldName::Year))
        issues.push_back({ IssueKind::FieldNotFound, FieldName::Year, "no publication year found" });
}

// "Иванов, И. И." -> "И. И. Иванов"
std::string directForm(const std::string& inverted)
{
    auto comma = inverted.find(", ");
    if (comma == std::string::npos)
        return inverted;
    return inverted.substr(comma + 2) + " " + inverted.substr(0, comma);
}

// Cuts `text` to what is left of `budget`; records an InputTruncated issue when it had to
std::string bounded(const std::string& text, const char* what, std::size_t& budget,
                    std::vector<citation::Issue>& issues)
{
    const std::size_t length = codepointLength(text);
    if (length <= budget)
    {
        budget -= length;
        return text;
    }
    std::string cut = truncateCodepoints(text, budget);
    issues.push_back({ IssueKind::InputTruncated, std::nullopt,
                       std::string(what) + " cut from " + std::to_string(length) + " to " + std::to_string(budget) +
                           " characters" });
    budget = 0;
    return cut;
}

// Applies one shared length budget to every string of a record, in field order
citation::CitationRecord boundedRecord(const citation::CitationRecord& record, std::size_t budget,
                                       std::vector<citation::Issue>& issues)
{
    citation::CitationRecord out = record;
    out.authors.clear();
    for (const auto& author : record.authors)
    {
        std::string kept = bounded(author, "author", budget, issues);
        if (kept.empty())
            break;
        out.authors.push_back(std::move(kept));
    }

    auto cap = [&](std::optional<std::string>& value, const char* what)
    {
        if (!value)
            return;
        std::string kept = bounded(*value, what, budget, issues);
        if (kept.empty() && !value->empty())
            value.reset();
        else
            value = std::move(kept);
    };
    cap(out.title, "title");
    cap(out.subtitle, "subtitle");
    cap(out.responsibility, "responsibility");
    cap(out.journal, "journal");
    cap(out.edition, "edition");
    cap(out.city, "city");
    cap(out.publisher, "publisher");
    cap(out.year, "year");
    cap(out.volume, "volume");
    cap(out.issue, "issue");
    cap(out.pages, "pages");
    cap(out.series, "series");
    cap(out.url, "url");
    cap(out.doi, "doi");
    cap(out.access_date, "access date");
    cap(out.isbn, "isbn");
    cap(out.language, "language");
    return out;
}

} // anonymous namespace

struct CitationPipeline::Impl
{
    explicit Impl(const config::PipelineConfig& cfg)
        : config(cfg)
        , page_marker(citation_rules::compile(L"^([СCP]\\.) ?(.+)$"))
        , page_count(citation_rules::compile(L"^([0-9]+) ?([{L}].*)$"))
        , bare_author(citation_rules::compile(std::wstring(L"^(") + std::wstring(citation_rules::kSurname) + L") (" +
                                              std::wstring(citation_rules::kInitials) + L")$"))
    {
    }

    config::PipelineConfig config;
    TextCanonicalizer canonicalizer;
    PunctuationNormalizer normalizer;
    TypeClassifier classifier;
    FieldExtractor extractor;
    TemplateRenderer renderer;
    CitationValidator validator;
    std::wregex page_marker;
    std::wregex page_count;
    std::wregex bare_author; // "Иванов И. И.", no comma

    std::string invertedAuthor(const std::string& author) const;

    citation::ExtractedFields fieldsFromRecord(const citation::CitationRecord& record) const;
    void setPages(citation::ExtractedFields& fields, const std::string& pages) const;
    void finish(citation::CitationResult& result, const std::string& draft) const;
};

void CitationPipeline::Impl::setPages(citation::ExtractedFields& fields, const std::string& pages) const
{
    std::wstring text = trim(widen(pages));
    if (text.empty())
        return;

    std::wsmatch m;
    std::wstring marker;
    if (std::regex_match(text, m, page_marker))
    {
        marker = m.str(1);
        text = m.str(2);
    }

    if (std::regex_match(text, m, page_count) && marker.empty())
    {
        std::wstring unit = trim(m.str(2));
        if (!unit.empty() && unit.back() != L'.')
            unit.push_back(L'.');
        fields.set(FieldName::Pages, narrow(m.str(1)));
        fields.page_unit = narrow(unit);
        return;
    }

    const bool is_range = !marker.empty() || text.find_first_of(L"–-,") != std::wstring::npos;
    if (is_range)
    {
        std::replace(text.begin(), text.end(), L'-', citation_rules::kDash);
        fields.set(FieldName::Pages, normalizer.normalize(narrow(text)));
        fields.page_unit = marker.empty() ? "С." : narrow(marker);
        fields.page_range = true;
        return;
    }

    fields.set(FieldName::Pages, narrow(text));
    fields.page_unit = "с.";
}

// Record authors come as "Иванов, И. И.", "И. И. Иванов" or "Иванов И. И."; all
// three end up inverted. Anything else (an organisation) is kept as given.
std::string CitationPipeline::Impl::invertedAuthor(const std::string& author) const
{
    auto parsed = extractor.extractAuthors(author);
    if (parsed.size() == 1)
        return parsed.front();

    std::wsmatch m;
    const std::wstring wide = widen(author);
    if (std::regex_match(wide, m, bare_author))
        return narrow(m.str(1)) + ", " + narrow(m.str(2));
    return author;
}

citation::ExtractedFields CitationPipeline::Impl::fieldsFromRecord(const citation::CitationRecord& record) const
{
    citation::ExtractedFields fields;

    for (const auto& raw : record.authors)
    {
        std::string author = normalizer.normalize(canonicalizer.canonicalize(raw));
        if (author.empty())
            continue;
        fields.authors.push_back(invertedAuthor(author));
        if (fields.authors.size() >= FieldExtractor::kMaxAuthors)
            break;
    }
    fields.heading = !fields.authors.empty() && fields.authors.size() <= 3;
    if (!fields.authors.empty())
    {
        std::string joined;
        for (const auto& author : fields.authors)
            joined += (joined.empty() ? "" : "; ") + author;
        fields.set(FieldName::Authors, joined);
    }

    auto put = [&](FieldName field, const std::optional<std::string>& value)
    {
        if (!value)
            return;
        std::string cleaned = normalizer.normalize(canonicalizer.canonicalize(*value));
        if (!cleaned.empty())
            fields.set(field, std::move(cleaned));
    };

    put(FieldName::Title, record.title);
    put(FieldName::Subtitle, record.subtitle);
    put(FieldName::Responsibility, record.responsibility);
    put(FieldName::Journal, record.journal);
    put(FieldName::Edition, record.edition);
    put(FieldName::City, record.city);
    put(FieldName::Publisher, record.publisher);
    put(FieldName::Year, record.year);
    put(FieldName::Volume, record.volume);
    put(FieldName::Issue, record.issue);
    put(FieldName::Series, record.series);
    put(FieldName::AccessDate, record.access_date);
    put(FieldName::Isbn, record.isbn);

    // identifiers are copied verbatim; normalizing would touch "http:" and "10.1000/x:y"
    if (record.url && !trim(*record.url).empty())
        fields.set(FieldName::Url, trim(*record.url));
    if (record.doi && !trim(*record.doi).empty())
        fields.set(FieldName::Doi, trim(*record.doi));

    if (record.pages)
        setPages(fields, canonicalizer.canonicalize(*record.pages));

    if (!fields.found(FieldName::Responsibility) && !fields.authors.empty())
    {
        std::string responsibility;
        if (fields.authors.size() <= 3)
        {
            for (const auto& author : fields.authors)
                responsibility += (responsibility.empty() ? "" : ", ") + directForm(author);
        }
        else
        {
            responsibility = directForm(fields.authors.front()) + " [и др.]";
        }
        fields.set(FieldName::Responsibility, responsibility);
    }

    return fields;
}

// Shared tail of both entry points: final normalization, validation, scoring
void CitationPipeline::Impl::finish(citation::CitationResult& result, const std::string& draft) const
{
    auto final_stage = run_stage<NormalizationReport>("final_normalize",
                                                      [&]() { return normalizer.normalizeWithReport(draft); });
    logStageStatus(final_stage, final_stage.succeeded ? &final_stage.result.text : nullptr);
    if (final_stage.succeeded)
    {
        result.formatted = final_stage.result.text;
        appendUnique(result.issues, final_stage.result.issues);
    }
    else
    {
        result.formatted = fallback(final_stage, "draft", draft, result);
    }

    if (config.validate_output)
    {
        auto validate_stage = run_stage<std::vector<citation::Issue>>(
            "validate", [&]() { return validator.validate(result.formatted); });
        logStageStatus(validate_stage);
        if (validate_stage.succeeded)
            appendUnique(result.issues, validate_stage.result);
        else
            fallback(validate_stage, "unvalidated", 0, result);
    }

    reportMissingFields(result.fields, result.issues);
    if (result.tag == CategoryTag::Unknown)
        result.issues.push_back({ IssueKind::UnrecognizedType, std::nullopt, "no category rule matched" });
    result.confidence = computeConfidence(result.tag, result.fields);
}

CitationPipeline::CitationPipeline(const config::PipelineConfig& config)
    : impl_(std::make_unique<Impl>(config))
{
}

CitationPipeline::CitationPipeline(citation::FormattingStandard standard)
    : impl_(std::make_unique<Impl>(config::PipelineConfig{}))
{
    impl_->config.standard = standard;
}

CitationPipeline::~CitationPipeline() = default;

citation::FormattingStandard CitationPipeline::standard() const noexcept
{
    return impl_->config.standard;
}

int CitationPipeline::computeConfidence(CategoryTag tag, const citation::ExtractedFields& fields)
{
    if (tag == CategoryTag::Unknown)
        return kConfidenceFloor;

    int confidence = 100;
    if (fields.authors.empty())
        confidence -= kMissingAuthorPenalty;
    if (!fields.found(FieldName::Title))
        confidence -= kMissingTitlePenalty;
    if (!fields.found(FieldName::Year))
        confidence -= kMissingYearPenalty;
    return std::max(confidence, kConfidenceFloor);
}

citation::CitationResult CitationPipeline::process(const citation::Citation& citation) const
{
    if (const auto* text = std::get_if<std::string>(&citation))
        return processText(*text);
    return processRecord(std::get<citation::CitationRecord>(citation));
}

citation::CitationResult CitationPipeline::processText(const std::string& raw_input) const
{
    PROFILE_SCOPE_CUSTOM("CitationPipeline::processText");
    const auto started = std::chrono::steady_clock::now();

    citation::CitationResult result;
    std::size_t budget = impl_->config.max_input_chars;
    const std::string input = bounded(raw_input, "input", budget, result.issues);
    logInput(input);

    auto canonical_stage = run_stage<std::string>("canonicalize",
                                                  [&]() { return impl_->canonicalizer.canonicalize(input); });
    logStageStatus(canonical_stage, canonical_stage.succeeded ? &canonical_stage.result : nullptr);
    const std::string canonical =
        canonical_stage.succeeded ? canonical_stage.result : fallback(canonical_stage, "original", input, result);

    auto norm_stage = run_stage<NormalizationReport>("normalize",
                                                     [&]() { return impl_->normalizer.normalizeWithReport(canonical); });
    logStageStatus(norm_stage, norm_stage.succeeded ? &norm_stage.result.text : nullptr);
    std::string normalized;
    if (norm_stage.succeeded)
    {
        normalized = norm_stage.result.text;
        appendUnique(result.issues, norm_stage.result.issues);
    }
    else
    {
        normalized = fallback(norm_stage, "canonical", canonical, result);
    }

    auto classify_stage = run_stage<Classification>("classify",
                                                    [&]() { return impl_->classifier.explain(normalized); });
    logStageStatus(classify_stage);
    result.tag = classify_stage.succeeded ? classify_stage.result.tag
                                          : fallback(classify_stage, "unknown", CategoryTag::Unknown, result);

    auto extract_stage = run_stage<citation::ExtractedFields>("extract",
                                                              [&]() { return impl_->extractor.extract(normalized); });
    logStageStatus(extract_stage);
    result.fields = extract_stage.succeeded ? std::move(extract_stage.result)
                                            : fallback(extract_stage, "no_fields", citation::ExtractedFields{}, result);

    // Without a formula the cleaned source is the best rendering
    std::string draft = normalized;
    if (result.tag != CategoryTag::Unknown)
    {
        auto render_stage = run_stage<RenderOutput>(
            "render", [&]() { return impl_->renderer.render(result.tag, result.fields, impl_->config.standard); });
        logStageStatus(render_stage, render_stage.succeeded ? &render_stage.result.draft : nullptr);
        if (render_stage.succeeded)
        {
            draft = render_stage.result.draft;
            appendUnique(result.issues, render_stage.result.issues);
        }
        else
        {
            draft = fallback(render_stage, "normalized", normalized, result);
        }
    }

    impl_->finish(result, draft);
    result.processing_time =
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    logCompletion(result);
    return result;
}

citation::CitationResult CitationPipeline::processRecord(const citation::CitationRecord& raw_record) const
{
    PROFILE_SCOPE_CUSTOM("CitationPipeline::processRecord");
    const auto started = std::chrono::steady_clock::now();

    citation::CitationResult result;
    const citation::CitationRecord record = boundedRecord(raw_record, impl_->config.max_input_chars, result.issues);

    auto fields_stage = run_stage<citation::ExtractedFields>("record_fields",
                                                             [&]() { return impl_->fieldsFromRecord(record); });
    logStageStatus(fields_stage);
    result.fields = fields_stage.succeeded ? std::move(fields_stage.result)
                                           : fallback(fields_stage, "no_fields", citation::ExtractedFields{}, result);

    auto classify_stage = run_stage<Classification>("classify",
                                                    [&]() { return impl_->classifier.classifyRecord(record); });
    logStageStatus(classify_stage);
    result.tag = classify_stage.succeeded ? classify_stage.result.tag
                                          : fallback(classify_stage, "unknown", CategoryTag::Unknown, result);

    // An unknown record still has named fields, so it is rendered with the generic formula
    auto render_stage = run_stage<RenderOutput>(
        "render", [&]() { return impl_->renderer.render(result.tag, result.fields, impl_->config.standard); });
    logStageStatus(render_stage, render_stage.succeeded ? &render_stage.result.draft : nullptr);
    std::string draft;
    if (render_stage.succeeded)
    {
        draft = render_stage.result.draft;
        appendUnique(result.issues, render_stage.result.issues);
    }
    else
    {
        draft = fallback(render_stage, "empty", std::string(), result);
    }

    impl_->finish(result, draft);
    result.processing_time =
        std::chrono::duration_cast<std::chrono::microseconds>(std::chrono::steady_clock::now() - started);
    logCompletion(result);
    return result;
}

} // namespace processing
