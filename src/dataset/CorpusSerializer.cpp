#include "CorpusSerializer.hpp"
#include "../utils/ErrorReporter.hpp"

#include <nlohmann/json.hpp>
#include <plog/Log.h>

using json = nlohmann::json;
using ordered_json = nlohmann::ordered_json;

namespace dataset
{

bool CorpusSerializer::parse(const std::string& jsonContent, Corpus& outCorpus, std::string& outError) const
{
    try
    {
        json corpusJson = json::parse(jsonContent);
        if (!corpusJson.is_object())
        {
            outError = "Corpus root is not a JSON object";
            return false;
        }
        if (!corpusJson.contains("examples") || !corpusJson["examples"].is_array())
        {
            outError = "Corpus missing 'examples' array";
            return false;
        }

        Corpus corpus;
        corpus.description = corpusJson.value("description", "");

        std::size_t index = 0;
        for (const auto& exampleJson : corpusJson["examples"])
        {
            CorpusExample example;
            example.type = exampleJson.value("type", "");
            example.example = exampleJson.value("example", "");

            if (example.type.empty() || example.example.empty())
            {
                PLOG_WARNING << "Skipping corpus example " << index << " without type or text";
                ++index;
                continue;
            }
            if (!citation::categoryFromString(example.type))
                PLOG_WARNING << "Corpus example " << index << " has unknown type '" << example.type << "'";

            corpus.examples.push_back(std::move(example));
            ++index;
        }

        if (corpusJson.contains("statistics") && corpusJson["statistics"].is_object())
        {
            for (const auto& [key, value] : corpusJson["statistics"].items())
            {
                if (value.is_number_unsigned())
                    corpus.statistics[key] = value.get<std::size_t>();
            }
        }

        corpus.total_examples = corpusJson.value("total_examples", corpus.examples.size());
        if (corpus.total_examples != corpus.examples.size())
        {
            PLOG_WARNING << "Corpus total_examples=" << corpus.total_examples << " but "
                         << corpus.examples.size() << " examples were read";
        }

        outCorpus = std::move(corpus);
        PLOG_INFO << "Corpus parsed: " << outCorpus.examples.size() << " examples";
        return true;
    }
    catch (const json::exception& e)
    {
        outError = std::string("JSON parse error: ") + e.what();
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Dataset, "Failed to parse corpus", outError);
        return false;
    }
}

std::string CorpusSerializer::serialize(const Corpus& corpus, int indent) const
{
    ordered_json out;
    out["description"] = corpus.description;
    out["total_examples"] = corpus.total_examples;

    out["examples"] = ordered_json::array();
    for (const auto& example : corpus.examples)
    {
        ordered_json entry;
        entry["type"] = example.type;
        entry["example"] = example.example;
        out["examples"].push_back(std::move(entry));
    }

    out["statistics"] = ordered_json::object();
    for (const auto& [key, count] : corpus.statistics)
        out["statistics"][key] = count;

    return out.dump(indent, ' ', false, ordered_json::error_handler_t::replace);
}

std::vector<std::string> CorpusSerializer::validateStructure(const std::string& jsonContent)
{
    std::vector<std::string> errors;

    json data = json::parse(jsonContent, nullptr, false);
    if (data.is_discarded())
    {
        errors.emplace_back("Document is not valid JSON");
        return errors;
    }
    if (!data.is_object())
    {
        errors.emplace_back("Document root is not an object");
        return errors;
    }

    for (const char* field : { "description", "total_examples", "examples" })
    {
        if (!data.contains(field))
            errors.push_back(std::string("Missing required field: ") + field);
    }

    if (data.contains("examples"))
    {
        if (!data["examples"].is_array())
        {
            errors.emplace_back("Field 'examples' is not an array");
            return errors;
        }

        std::size_t i = 0;
        for (const auto& ex : data["examples"])
        {
            if (!ex.is_object() || !ex.contains("type"))
                errors.push_back("Example " + std::to_string(i) + ": missing 'type' field");
            if (!ex.is_object() || !ex.contains("example"))
                errors.push_back("Example " + std::to_string(i) + ": missing 'example' field");
            ++i;
        }
    }

    return errors;
}

void CorpusSerializer::refreshStatistics(Corpus& corpus)
{
    corpus.statistics.clear();
    for (const auto& example : corpus.examples)
        ++corpus.statistics[example.type];
    corpus.total_examples = corpus.examples.size();
}

AuditReport CorpusSerializer::audit(const Corpus& corpus) const
{
    AuditReport report;
    for (std::size_t i = 0; i < corpus.examples.size(); ++i)
    {
        const auto& example = corpus.examples[i];
        ++report.checked;

        auto findings = validator_.check(example.example);
        if (findings.empty())
            continue;

        std::map<std::string, bool> seen;
        for (const auto& finding : findings)
        {
            if (!seen[finding.check])
            {
                seen[finding.check] = true;
                ++report.per_check[finding.check];
            }
        }
        report.entries.push_back({ i, example.type, std::move(findings) });
    }

    if (!report.clean())
        PLOG_INFO << "Corpus audit: " << report.entries.size() << " of " << report.checked << " examples have defects";
    return report;
}

std::vector<std::size_t> CorpusSerializer::unknownTypes(const Corpus& corpus)
{
    std::vector<std::size_t> out;
    for (std::size_t i = 0; i < corpus.examples.size(); ++i)
    {
        if (!citation::categoryFromString(corpus.examples[i].type))
            out.push_back(i);
    }
    return out;
}

} // namespace dataset
