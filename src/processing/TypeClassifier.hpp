#pragma once

#include "CitationTypes.hpp"

#include <functional>
#include <string>
#include <vector>

namespace processing
{

// Text a rule looks at: the citation as given and its lowercase form
struct ClassifierInput
{
    const std::wstring& text;
    const std::wstring& lower;
};

using ClassifierPredicate = std::function<bool(const ClassifierInput&)>;

struct ClassificationRule
{
    std::string name;
    citation::CategoryTag tag;
    ClassifierPredicate matches;
    bool lexical = true; // false: depends on citation layout, skipped for structured records
};

struct Classification
{
    citation::CategoryTag tag = citation::CategoryTag::Unknown;
    std::string rule; // name of the rule that fired, "fallback" for Unknown
};

// Assigns exactly one category tag using an ordered rule table.
// The first matching rule wins; no rule matching yields Unknown.
class TypeClassifier
{
public:
    TypeClassifier();

    [[nodiscard]] citation::CategoryTag classify(const std::string& text) const;
    [[nodiscard]] Classification explain(const std::string& text) const;

    // Hint first, then the lexical rules over the record's text, then its shape
    [[nodiscard]] Classification classifyRecord(const citation::CitationRecord& record) const;

    [[nodiscard]] const std::vector<ClassificationRule>& rules() const noexcept { return rules_; }
    [[nodiscard]] std::vector<std::string> ruleNames() const;

private:
    void registerRule(std::string name, citation::CategoryTag tag, ClassifierPredicate matches, bool lexical = true);
    void initializeDefaultRules();

    std::vector<ClassificationRule> rules_;
};

} // namespace processing
