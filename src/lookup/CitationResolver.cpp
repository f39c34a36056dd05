#include "CitationResolver.hpp"
#include "ICitationParser.hpp"
#include "IMetadataLookup.hpp"
#include "IdentifierDetector.hpp"
#include "../processing/CitationPipeline.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

namespace lookup
{

CitationResolver::CitationResolver(const processing::CitationPipeline& pipeline, IMetadataLookup* metadata,
                                   ICitationParser* parser)
    : pipeline_(pipeline)
    , metadata_(metadata)
    , parser_(parser)
{
}

std::optional<citation::CitationResult> CitationResolver::resolveIdentifier(const std::string& identifier)
{
    last_error_.clear();

    const Identifier id = detectIdentifier(identifier);
    if (id.kind == IdentifierKind::Unknown)
    {
        last_error_ = "Unrecognized identifier: " + identifier;
        return std::nullopt;
    }
    if (!metadata_)
    {
        last_error_ = "No metadata lookup configured";
        return std::nullopt;
    }

    citation::CitationRecord record;
    const bool found = id.kind == IdentifierKind::Doi ? metadata_->lookupDoi(id.value, record)
                                                      : metadata_->lookupIsbn(id.value, record);
    if (!found)
    {
        const char* err = metadata_->lastError();
        last_error_ = std::string(metadata_->source()) + ": " + (err && *err ? err : "lookup failed");
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Lookup, "Metadata lookup failed", last_error_);
        return std::nullopt;
    }

    if (id.kind == IdentifierKind::Doi && !record.doi)
        record.doi = id.value;
    if (id.kind == IdentifierKind::Isbn && !record.isbn)
        record.isbn = id.value;

    PLOG_INFO << "Resolved " << toString(id.kind) << " " << id.value << " via " << metadata_->source();
    return pipeline_.processRecord(record);
}

std::vector<citation::CitationResult> CitationResolver::resolveText(const std::string& text)
{
    last_error_.clear();
    std::vector<citation::CitationResult> results;

    if (parser_)
    {
        std::vector<citation::CitationRecord> records;
        if (parser_->parse(text, records) && !records.empty())
        {
            results.reserve(records.size());
            for (const auto& record : records)
                results.push_back(pipeline_.processRecord(record));
            return results;
        }

        const char* err = parser_->lastError();
        last_error_ = err && *err ? err : "parser returned no records";
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Lookup,
                                            "Citation parser failed, using rule pipeline", last_error_);
    }

    results.push_back(pipeline_.processText(text));
    return results;
}

} // namespace lookup
