#include "TypeClassifier.hpp"
#include "CitationPatterns.hpp"
#include "Diagnostics.hpp"
#include "WideText.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <plog/Log.h>
#include <regex>
#include <set>

namespace processing
{

namespace
{

using citation::CategoryTag;
using citation_rules::compile;

constexpr std::wstring_view kHostSeparator = L" // ";

ClassifierPredicate containsAny(std::vector<std::wstring> needles)
{
    return [needles = std::move(needles)](const ClassifierInput& in)
    {
        return std::any_of(needles.begin(), needles.end(),
                           [&in](const std::wstring& needle) { return in.lower.find(needle) != std::wstring::npos; });
    };
}

ClassifierPredicate lowerMatches(std::wstring_view pattern)
{
    auto re = compile(pattern);
    return [re = std::move(re)](const ClassifierInput& in) { return std::regex_search(in.lower, re); };
}

ClassifierPredicate textMatches(std::wstring_view pattern)
{
    auto re = compile(pattern);
    return [re = std::move(re)](const ClassifierInput& in) { return std::regex_search(in.text, re); };
}

// Segment between the first and the second "//", i.e. the host document
std::wstring hostSegment(const std::wstring& text)
{
    std::size_t first = text.find(kHostSeparator);
    if (first == std::wstring::npos)
        return {};
    std::size_t begin = first + kHostSeparator.size();
    std::size_t second = text.find(kHostSeparator, begin);
    return text.substr(begin, second == std::wstring::npos ? std::wstring::npos : second - begin);
}

std::size_t distinctInvertedAuthors(const std::wstring& text, const std::wregex& re)
{
    std::set<std::wstring> surnames;
    for (auto it = std::wsregex_iterator(text.begin(), text.end(), re); it != std::wsregex_iterator(); ++it)
        surnames.insert(it->str(1));
    return surnames.size();
}

void logClassification(const Classification& c, const std::string& text)
{
    if (Diagnostics::IsVerbose())
    {
        PLOG_DEBUG_(Diagnostics::kLogInstance)
            << "[TypeClassifier] tag=" << citation::toString(c.tag) << " rule=" << c.rule
            << " text=" << Diagnostics::Preview(text);
    }
}

} // anonymous namespace

TypeClassifier::TypeClassifier()
{
    initializeDefaultRules();
}

void TypeClassifier::registerRule(std::string name, CategoryTag tag, ClassifierPredicate matches, bool lexical)
{
    rules_.push_back({ std::move(name), tag, std::move(matches), lexical });
}

void TypeClassifier::initializeDefaultRules()
{
    // Bracketed medium
    registerRule("media_recording", CategoryTag::Multimedia, containsAny({ L"[звукозапись]", L"[видеозапись]" }));
    registerRule("media_visual", CategoryTag::VisualMaterial,
                 containsAny({ L"[изоматериал]", L"плакат]", L"[открытка]", L"[репродукция]" }));
    registerRule("media_score", CategoryTag::MusicScore, containsAny({ L"[ноты]" }));
    registerRule("media_map", CategoryTag::Map, containsAny({ L"[карт" }));

    // Country codes are upper case, so the patent rule reads the original text
    registerRule("patent", CategoryTag::Patent,
                 textMatches(LR"(пат\.\s*[A-Z]{2}|а\.\s*с\.\s*[A-Z]{2}|полез\.\s*модель)"));

    {
        auto degree = compile(LR"(д[иы]с\.\s*\.\.\.)");
        registerRule("dissertation", CategoryTag::Dissertation,
                     [degree = std::move(degree)](const ClassifierInput& in)
                     {
                         // an abstract repeats "дис. ..." in its own title
                         return std::regex_search(in.lower, degree) && in.lower.find(L"автореф") == std::wstring::npos;
                     });
    }
    registerRule("abstract", CategoryTag::Abstract, containsAny({ L"автореф" }));
    registerRule("preprint", CategoryTag::Preprint, containsAny({ L"препринт" }));

    registerRule("standard", CategoryTag::Standard, lowerMatches(LR"(гост\s*[0-9]|стб\s*[0-9]|ткп\s*[0-9]|тр\s*тс\s*[0-9])"));

    registerRule("law_constitution_code", CategoryTag::Law,
                 lowerMatches(LR"(конституц|(^|[^{L}])кодекс(?![{L}]))"));
    registerRule("law_act", CategoryTag::Law,
                 lowerMatches(LR"((^|[^{L}])(закон|указ|декрет)(?![{L}])|(^|[^{L}])постановлени|приказ\s+[{L}]+\.)"));

    registerRule("conference", CategoryTag::Conference, lowerMatches(LR"(матер.*конф|тезис.*докл|чтения\s*:)"));
    registerRule("collection", CategoryTag::CollectionArticle, lowerMatches(LR"(сб\.\s*(науч\.|ст\.|тр\.))"));

    registerRule("review", CategoryTag::Review, lowerMatches(LR"(\[рецензия\]|(^|[^{L}])рец\. на )"));
    registerRule("research_report", CategoryTag::ResearchReport, lowerMatches(LR"(отч[её]т о нир)"));
    registerRule("deposited", CategoryTag::Deposited, lowerMatches(LR"((^|[^{L}])деп\. в )"));
    registerRule("methodical_guide", CategoryTag::MethodicalGuide,
                 lowerMatches(LR"((^|[^\-{L}])метод\.\s*(указания|рекомендации|пособие))"));
    registerRule("multivolume", CategoryTag::Multivolume, lowerMatches(LR"(: [ув] [0-9]+ т\.)"));
    {
        auto fond = compile(LR"((^|[^{L}])ф\. ?[0-9]|дело №)");
        registerRule("archive", CategoryTag::Archive,
                     [fond = std::move(fond)](const ClassifierInput& in)
                     { return in.lower.find(L"архив") != std::wstring::npos && std::regex_search(in.lower, fond); });
    }
    registerRule("catalog", CategoryTag::Catalog,
                 [](const ClassifierInput& in) { return startsWith(in.lower, L"каталог"); });

    {
        auto numbering = compile(LR"([ТT]\.\s*[0-9]|№\s*[0-9])");
        registerRule("periodical_numbering", CategoryTag::JournalArticle,
                     [numbering = std::move(numbering)](const ClassifierInput& in)
                     {
                         if (in.text.find(kHostSeparator) == std::wstring::npos)
                             return false;
                         return std::regex_search(hostSegment(in.text), numbering);
                     },
                     false);
    }
    {
        auto newspaper = compile(LR"(\.by(?![{L}])|газет)");
        registerRule("periodical_newspaper", CategoryTag::NewspaperArticle,
                     [newspaper = std::move(newspaper)](const ClassifierInput& in)
                     {
                         if (in.text.find(kHostSeparator) == std::wstring::npos)
                             return false;
                         return std::regex_search(toLower(hostSegment(in.text)), newspaper);
                     },
                     false);
    }

    registerRule("et_al_marker", CategoryTag::BookManyAuthors, containsAny({ L"[и др.]", L"[et al.]" }));

    {
        auto inverted = compile(LR"(({U}[{l}]+),\s+{U}\.)");
        auto many = [inverted](const ClassifierInput& in) { return distinctInvertedAuthors(in.text, inverted) >= 4; };
        auto few = [inverted](const ClassifierInput& in) { return distinctInvertedAuthors(in.text, inverted) >= 1; };
        registerRule("author_count_many", CategoryTag::BookManyAuthors, many, false);
        registerRule("author_count_few", CategoryTag::BookFewAuthors, few, false);
    }

    registerRule("electronic_marker", CategoryTag::ElectronicResource, containsAny({ L"[электронный ресурс]" }), false);
}

std::vector<std::string> TypeClassifier::ruleNames() const
{
    std::vector<std::string> names;
    names.reserve(rules_.size());
    for (const auto& rule : rules_)
        names.push_back(rule.name);
    return names;
}

Classification TypeClassifier::explain(const std::string& text) const
{
    PROFILE_SCOPE_CUSTOM("TypeClassifier::explain");

    const std::wstring wide = widen(text);
    const std::wstring lower = toLower(wide);
    const ClassifierInput input{ wide, lower };

    for (const auto& rule : rules_)
    {
        if (rule.matches(input))
        {
            Classification c{ rule.tag, rule.name };
            logClassification(c, text);
            return c;
        }
    }

    Classification c{ CategoryTag::Unknown, "fallback" };
    logClassification(c, text);
    return c;
}

CategoryTag TypeClassifier::classify(const std::string& text) const
{
    return explain(text).tag;
}

Classification TypeClassifier::classifyRecord(const citation::CitationRecord& record) const
{
    if (record.category_hint)
        return { *record.category_hint, "hint" };

    std::string joined;
    for (const auto* part : { &record.title, &record.subtitle, &record.responsibility, &record.journal,
                              &record.publisher, &record.series, &record.edition })
    {
        if (part->has_value() && !(*part)->empty())
        {
            if (!joined.empty())
                joined += " ";
            joined += **part;
        }
    }

    const std::wstring wide = widen(joined);
    const std::wstring lower = toLower(wide);
    const ClassifierInput input{ wide, lower };
    for (const auto& rule : rules_)
    {
        if (rule.lexical && rule.matches(input))
            return { rule.tag, rule.name };
    }

    if (record.journal)
    {
        if (toLower(*record.journal).find("газет") != std::string::npos)
            return { CategoryTag::NewspaperArticle, "record_newspaper" };
        if (record.volume || record.issue)
            return { CategoryTag::JournalArticle, "record_journal" };
        return { CategoryTag::CollectionArticle, "record_host" };
    }
    if (record.authors.size() >= 4)
        return { CategoryTag::BookManyAuthors, "record_authors_many" };
    if (!record.authors.empty())
        return { CategoryTag::BookFewAuthors, "record_authors_few" };
    if (record.url || lower.find(L"[электронный ресурс]") != std::wstring::npos)
        return { CategoryTag::ElectronicResource, "record_url" };

    return { CategoryTag::Unknown, "fallback" };
}

} // namespace processing
