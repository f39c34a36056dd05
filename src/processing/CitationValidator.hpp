#pragma once

#include "CitationTypes.hpp"

#include <functional>
#include <string>
#include <vector>

namespace processing
{

struct ValidationFinding
{
    std::string check;   // "missing_space_after_dash", "double_spaces", ...
    std::string message;
};

// Returns one message per offending occurrence; empty when the text is clean
using PunctuationMatcher = std::function<std::vector<std::string>(const std::wstring&)>;

struct PunctuationCheck
{
    std::string name;
    PunctuationMatcher matcher;
};

// Reports punctuation defects left in a finished citation.
// Reads only; fixing is the normalizer's job.
class CitationValidator
{
public:
    CitationValidator();

    [[nodiscard]] std::vector<ValidationFinding> check(const std::string& text) const;

    // Same findings as PunctuationViolation issues
    [[nodiscard]] std::vector<citation::Issue> validate(const std::string& text) const;

    [[nodiscard]] std::vector<std::string> checkNames() const;

private:
    void registerCheck(std::string name, PunctuationMatcher matcher);
    void initializeDefaultChecks();

    std::vector<PunctuationCheck> checks_;
};

} // namespace processing
