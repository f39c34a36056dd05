#pragma once

#include "CitationTypes.hpp"

#include <functional>
#include <string>
#include <string_view>
#include <vector>

namespace processing
{

// Collects side findings of rules (ambiguous ranges) during one normalization
struct NormalizationContext
{
    std::vector<citation::Issue> issues;
};

using RuleTransform = std::function<std::wstring(const std::wstring&, NormalizationContext&)>;

// One ordered rewrite step. Rules are pure: same input, same output.
struct NormalizationRule
{
    std::string name;
    std::string description;
    RuleTransform transform;
};

struct NormalizationReport
{
    std::string text;
    std::vector<citation::Issue> issues;
    std::vector<std::string> fired_rules; // rules that changed the text, in firing order
    int passes = 0;
};

// Rewrites a citation into canonical spacing and dash form.
//
// The rule list is applied in a fixed order; the whole list is repeated until
// the text stops changing, so normalize(normalize(x)) == normalize(x).
class PunctuationNormalizer
{
public:
    PunctuationNormalizer();

    [[nodiscard]] std::string normalize(const std::string& text) const;
    [[nodiscard]] NormalizationReport normalizeWithReport(const std::string& text) const;

    // Runs a single named rule without ellipsis protection; empty name match returns input
    [[nodiscard]] std::string applyRule(std::string_view name, const std::string& text) const;

    [[nodiscard]] const std::vector<NormalizationRule>& rules() const noexcept { return rules_; }
    [[nodiscard]] std::vector<std::string> ruleNames() const;

    static constexpr int kMaxPasses = 8;

private:
    void registerRule(std::string name, std::string description, RuleTransform transform);
    void initializeDefaultRules();

    std::vector<NormalizationRule> rules_;
};

} // namespace processing
