#include "PunctuationNormalizer.hpp"
#include "CitationPatterns.hpp"
#include "Diagnostics.hpp"
#include "WideText.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <plog/Log.h>
#include <regex>

namespace processing
{

namespace
{

using citation_rules::compile;

RuleTransform regexRule(std::wstring_view pattern, std::wstring replacement)
{
    auto re = compile(pattern);
    return [re = std::move(re), replacement = std::move(replacement)](const std::wstring& text, NormalizationContext&)
    {
        return std::regex_replace(text, re, replacement);
    };
}

std::wstring replaceLiteral(const std::wstring& text, std::wstring_view from, std::wstring_view to)
{
    std::wstring out;
    out.reserve(text.size());
    std::size_t last = 0;
    std::size_t pos = text.find(from);
    while (pos != std::wstring::npos)
    {
        out.append(text, last, pos - last);
        out.append(to);
        last = pos + from.size();
        pos = text.find(from, last);
    }
    out.append(text, last, std::wstring::npos);
    return out;
}

// Applies `fn` to the text between URLs; URL bodies are copied unchanged
template<typename Fn>
std::wstring outsideUrls(const std::wstring& text, const std::wregex& url, Fn&& fn)
{
    std::wstring out;
    out.reserve(text.size() + 8);
    std::size_t last = 0;
    for (auto it = std::wsregex_iterator(text.begin(), text.end(), url); it != std::wsregex_iterator(); ++it)
    {
        auto pos = static_cast<std::size_t>(it->position(0));
        std::wstring segment = fn(text.substr(last, pos - last));
        out += segment;
        if (!segment.empty() && segment.back() == L':')
            out.push_back(L' ');
        out += it->str(0);
        last = pos + static_cast<std::size_t>(it->length(0));
    }
    out += fn(text.substr(last));
    return out;
}

bool plausibleYearRange(int first, int second)
{
    return first >= 1990 && first < second && second <= 2030;
}

} // anonymous namespace

PunctuationNormalizer::PunctuationNormalizer()
{
    initializeDefaultRules();
}

void PunctuationNormalizer::registerRule(std::string name, std::string description, RuleTransform transform)
{
    rules_.push_back({ std::move(name), std::move(description), std::move(transform) });
}

void PunctuationNormalizer::initializeDefaultRules()
{
    const std::wstring sentinel(1, ELLIPSIS_SENTINEL);

    registerRule("protect_ellipsis", "hide \"...\" behind a sentinel",
                 [sentinel](const std::wstring& text, NormalizationContext&)
                 { return replaceLiteral(text, L"...", sentinel); });

    registerRule("collapse_double_periods", "\"журн..\" -> \"журн.\"",
                 regexRule(LR"(([{L}])\.\.(?!\.))", L"$1."));

    registerRule("collapse_spaces", "runs of spaces -> one space",
                 regexRule(LR"( {2,})", L" "));

    registerRule("space_after_separator_dash", "\". –X\" -> \". – X\" unless a numeric range follows",
                 regexRule(LR"(\. –(?=[^ ])(?![0-9]+–[0-9]))", L". – "));

    {
        auto url = compile(LR"((?:https?|ftp)://[^ ]+|www\.[^ ]+)");
        auto colon = compile(LR"(:(?=[{L}]))");
        registerRule("space_after_colon", "\":X\" -> \": X\" outside URLs",
                     [url = std::move(url), colon = std::move(colon)](const std::wstring& text, NormalizationContext&)
                     {
                         return outsideUrls(text, url, [&colon](const std::wstring& segment)
                                            { return std::regex_replace(segment, colon, L": "); });
                     });
    }

    registerRule("tighten_numeric_ranges", "\"45 – 52\" -> \"45–52\"",
                 regexRule(LR"(([0-9]) ?– ?([0-9]))", L"$1–$2"));

    {
        auto range = compile(LR"((^|[^0-9./\-–])([0-9]{4})-([0-9]{4})(?![0-9]))");
        registerRule("year_range_hyphen", "\"2015-2020\" -> \"2015–2020\" for plausible year ranges only",
                     [range = std::move(range)](const std::wstring& text, NormalizationContext& ctx)
                     {
                         std::wstring out;
                         std::size_t last = 0;
                         for (auto it = std::wsregex_iterator(text.begin(), text.end(), range);
                              it != std::wsregex_iterator(); ++it)
                         {
                             const auto& m = *it;
                             auto pos = static_cast<std::size_t>(m.position(0));
                             out.append(text, last, pos - last);

                             const int first = std::stoi(m.str(2));
                             const int second = std::stoi(m.str(3));
                             if (plausibleYearRange(first, second))
                             {
                                 out += m.str(1) + m.str(2) + L"–" + m.str(3);
                             }
                             else
                             {
                                 out += m.str(0);
                                 ctx.issues.push_back({ citation::IssueKind::AmbiguousRange, std::nullopt,
                                                        "hyphenated number pair '" + narrow(m.str(2) + L"-" + m.str(3)) +
                                                            "' is not a plausible year range; left unchanged" });
                             }
                             last = pos + static_cast<std::size_t>(m.length(0));
                         }
                         out.append(text, last, std::wstring::npos);
                         return out;
                     });
    }

    registerRule("tighten_page_ranges", "\"С. 88 – 91\" -> \"С. 88–91\"",
                 regexRule(LR"((^|[^{L}])([СCP]\.) ?([0-9]+) ?[–\-] ?([0-9]+))", L"$1$2 $3–$4"));

    {
        auto joined = compile(LR"((^|[^{L}])({U}\.)({U}\.))");
        auto before_word = compile(LR"((^|[^{L}])({U}\.) ?({U}\.)(?=[{U}]))");
        registerRule("space_after_initials", "\"А. А.Фамилия\" -> \"А. А. Фамилия\"",
                     [joined = std::move(joined), before_word = std::move(before_word)](const std::wstring& text,
                                                                                      NormalizationContext&)
                     {
                         std::wstring spaced = std::regex_replace(text, joined, L"$1$2 $3");
                         return std::regex_replace(spaced, before_word, L"$1$2 $3 ");
                     });
    }

    {
        auto abbreviations = compile(LR"((^|[^{L}])(Т|T|Вып|Выд|кн|Ч|Vol|No)\.(?=[0-9]))");
        auto number_sign = compile(LR"(№(?=[0-9{L}]))");
        registerRule("space_after_enumerators", "\"Т.5\", \"№5\", \"Вып.5\", \"кн.5\" -> one space before the number",
                     [abbreviations = std::move(abbreviations), number_sign = std::move(number_sign)](
                         const std::wstring& text, NormalizationContext&)
                     {
                         std::wstring spaced = std::regex_replace(text, abbreviations, L"$1$2. ");
                         return std::regex_replace(spaced, number_sign, L"№ ");
                     });
    }

    registerRule("strip_space_before_punctuation", "\"word .\" -> \"word.\"",
                 regexRule(LR"( +([.,]))", L"$1"));

    registerRule("restore_ellipsis", "sentinel -> \"...\"",
                 [sentinel](const std::wstring& text, NormalizationContext&)
                 { return replaceLiteral(text, sentinel, L"..."); });
}

std::vector<std::string> PunctuationNormalizer::ruleNames() const
{
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto& rule : rules_)
        names.push_back(rule.name);
    return names;
}

std::string PunctuationNormalizer::normalize(const std::string& text) const
{
    return normalizeWithReport(text).text;
}

NormalizationReport PunctuationNormalizer::normalizeWithReport(const std::string& text) const
{
    PROFILE_SCOPE_CUSTOM("PunctuationNormalizer::normalize");

    NormalizationReport report;
    NormalizationContext ctx;
    std::wstring current = widen(text);

    for (int pass = 0; pass < kMaxPasses; ++pass)
    {
        const std::wstring before = current;
        for (const auto& rule : rules_)
        {
            std::wstring next = rule.transform(current, ctx);
            if (next != current)
            {
                if (std::find(report.fired_rules.begin(), report.fired_rules.end(), rule.name) ==
                    report.fired_rules.end())
                {
                    report.fired_rules.push_back(rule.name);
                }
                current = std::move(next);
            }
        }
        report.passes = pass + 1;
        if (current == before)
            break;
    }

    if (report.passes == kMaxPasses && Diagnostics::IsVerbose())
    {
        PLOG_WARNING_(Diagnostics::kLogInstance)
            << "[PunctuationNormalizer] no fixpoint after " << kMaxPasses
            << " passes text=" << Diagnostics::Preview(text);
    }

    // Rules run once per pass; keep one copy of each finding
    for (auto& issue : ctx.issues)
    {
        bool seen = std::any_of(report.issues.begin(), report.issues.end(),
                                [&issue](const citation::Issue& existing)
                                { return existing.kind == issue.kind && existing.message == issue.message; });
        if (!seen)
            report.issues.push_back(std::move(issue));
    }

    report.text = narrow(current);
    return report;
}

std::string PunctuationNormalizer::applyRule(std::string_view name, const std::string& text) const
{
    for (const auto& rule : rules_)
    {
        if (rule.name == name)
        {
            NormalizationContext ctx;
            return narrow(rule.transform(widen(text), ctx));
        }
    }
    return text;
}

} // namespace processing
