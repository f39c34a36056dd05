#pragma once

#include "../processing/CitationTypes.hpp"
#include "../processing/CitationValidator.hpp"

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace dataset
{

// One labelled example: {"type": "journal_article", "example": "..."}
struct CorpusExample
{
    std::string type;
    std::string example;
};

// Training corpus as persisted in JSON. Statistics count examples per type key.
struct Corpus
{
    std::string description;
    std::size_t total_examples = 0;
    std::vector<CorpusExample> examples;
    std::map<std::string, std::size_t> statistics;
};

struct AuditEntry
{
    std::size_t index = 0;
    std::string type;
    std::vector<processing::ValidationFinding> findings;
};

struct AuditReport
{
    std::size_t checked = 0;
    std::vector<AuditEntry> entries;                  // examples with at least one finding
    std::map<std::string, std::size_t> per_check;     // examples affected, by check name

    [[nodiscard]] bool clean() const noexcept { return entries.empty(); }
};

// JSON reading/writing of the corpus. Works on strings only; callers own file I/O.
class CorpusSerializer
{
public:
    // Lenient: unknown type keys are kept, missing counters are recomputed
    bool parse(const std::string& jsonContent, Corpus& outCorpus, std::string& outError) const;

    [[nodiscard]] std::string serialize(const Corpus& corpus, int indent = 2) const;

    // Structural errors of a raw document, one message each; empty when valid
    [[nodiscard]] static std::vector<std::string> validateStructure(const std::string& jsonContent);

    // Recomputes total_examples and per-type statistics from the examples
    static void refreshStatistics(Corpus& corpus);

    [[nodiscard]] AuditReport audit(const Corpus& corpus) const;

    // Examples whose type key is not a known category
    [[nodiscard]] static std::vector<std::size_t> unknownTypes(const Corpus& corpus);

private:
    processing::CitationValidator validator_;
};

} // namespace dataset
