#include "CitationValidator.hpp"
#include "CitationPatterns.hpp"
#include "WideText.hpp"

#include <regex>

namespace processing
{

namespace
{

using citation_rules::compile;

// Every match of `pattern` becomes one finding quoting the matched text
PunctuationMatcher patternMatcher(std::wstring_view pattern, std::string label)
{
    auto re = compile(pattern);
    return [re = std::move(re), label = std::move(label)](const std::wstring& text)
    {
        std::vector<std::string> out;
        for (auto it = std::wsregex_iterator(text.begin(), text.end(), re); it != std::wsregex_iterator(); ++it)
            out.push_back(label + " '" + narrow(it->str(0)) + "'");
        return out;
    };
}

// Blanks URL bodies so their colons and slashes are not judged
std::wstring withoutUrls(const std::wstring& text, const std::wregex& url)
{
    return std::regex_replace(text, url, L"URL");
}

} // anonymous namespace

CitationValidator::CitationValidator()
{
    initializeDefaultChecks();
}

void CitationValidator::registerCheck(std::string name, PunctuationMatcher matcher)
{
    checks_.push_back({ std::move(name), std::move(matcher) });
}

void CitationValidator::initializeDefaultChecks()
{
    registerCheck("missing_space_after_dash", patternMatcher(LR"(\. –[^\s0-9])", "no space after area dash"));

    {
        auto url = compile(LR"((?:https?|ftp)://[^ ]+|www\.[^ ]+)");
        auto colon = compile(LR"(:[^\s/0-9])");
        registerCheck("missing_space_after_colon",
                      [url = std::move(url), colon = std::move(colon)](const std::wstring& text)
                      {
                          std::vector<std::string> out;
                          const std::wstring plain = withoutUrls(text, url);
                          for (auto it = std::wsregex_iterator(plain.begin(), plain.end(), colon);
                               it != std::wsregex_iterator(); ++it)
                          {
                              out.push_back("no space after colon '" + narrow(it->str(0)) + "'");
                          }
                          return out;
                      });
    }

    registerCheck("missing_space_after_initials",
                  patternMatcher(LR"([{L}0-9_]\. [{L}0-9_]\.[{L}])", "no space after initials"));

    registerCheck("spaces_in_range", patternMatcher(LR"([0-9] – [0-9])", "spaces around range dash"));
    registerCheck("trailing_space_in_range", patternMatcher(LR"([0-9]– [0-9])", "space after range dash"));
    registerCheck("leading_space_in_range", patternMatcher(LR"([0-9] –[0-9])", "space before range dash"));

    registerCheck("double_spaces",
                  [](const std::wstring& text)
                  {
                      std::vector<std::string> out;
                      if (text.find(L"  ") != std::wstring::npos)
                          out.push_back("double space");
                      return out;
                  });

    {
        // Standard numbers ("ГОСТ 7.1-2003", "ТКП 7696-2024") are not ranges
        auto range = compile(LR"(([0-9]{4})-([0-9]{4}))");
        registerCheck("hyphen_instead_of_dash",
                      [range = std::move(range)](const std::wstring& text)
                      {
                          std::vector<std::string> out;
                          for (auto it = std::wsregex_iterator(text.begin(), text.end(), range);
                               it != std::wsregex_iterator(); ++it)
                          {
                              int first = std::stoi(it->str(1));
                              int second = std::stoi(it->str(2));
                              if (1990 <= first && first < second && second <= 2030)
                                  out.push_back("hyphen in year range '" + narrow(it->str(0)) + "'");
                          }
                          return out;
                      });
    }

    registerCheck("hyphen_in_page_range", patternMatcher(LR"(С\. [0-9]+-[0-9]+)", "hyphen in page range"));
    registerCheck("page_range_spaces", patternMatcher(LR"(С\. [0-9]+(?: –|– | – )[0-9]+)", "spaces in page range"));
}

std::vector<std::string> CitationValidator::checkNames() const
{
    std::vector<std::string> names;
    names.reserve(checks_.size());
    for (const auto& c : checks_)
        names.push_back(c.name);
    return names;
}

std::vector<ValidationFinding> CitationValidator::check(const std::string& text) const
{
    std::vector<ValidationFinding> findings;
    const std::wstring wide = widen(text);
    for (const auto& c : checks_)
    {
        for (auto& message : c.matcher(wide))
            findings.push_back({ c.name, std::move(message) });
    }
    return findings;
}

std::vector<citation::Issue> CitationValidator::validate(const std::string& text) const
{
    std::vector<citation::Issue> issues;
    for (auto& finding : check(text))
        issues.push_back({ citation::IssueKind::PunctuationViolation, std::nullopt,
                           finding.check + ": " + finding.message });
    return issues;
}

} // namespace processing
