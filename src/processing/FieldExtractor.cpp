#include "FieldExtractor.hpp"
#include "CitationPatterns.hpp"
#include "Diagnostics.hpp"
#include "WideText.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <map>
#include <optional>
#include <plog/Log.h>
#include <regex>
#include <set>

namespace processing
{

namespace
{

using citation::FieldName;
using citation_rules::compile;

constexpr std::wstring_view kAreaSeparator = L". – ";
constexpr std::wstring_view kHostSeparator = L" // ";
constexpr std::wstring_view kSlashSeparator = L" / ";
constexpr std::wstring_view kSubtitleSeparator = L" : ";

// Year as accepted by publication patterns: [1950, 2029], optionally a range
constexpr std::wstring_view kYear = L"(?:19[5-9][0-9]|20[0-2][0-9])(?:–(?:19[5-9][0-9]|20[0-2][0-9]))?";

struct Span
{
    std::size_t begin = 0;
    std::size_t end = 0;

    [[nodiscard]] bool empty() const noexcept { return end <= begin; }
    [[nodiscard]] bool contains(const Span& other) const noexcept
    {
        return begin <= other.begin && other.end <= end && !(begin == other.begin && end == other.end);
    }
};

Span trimmed(const std::wstring& text, std::size_t begin, std::size_t end)
{
    end = std::min(end, text.size());
    while (begin < end && text[begin] == L' ')
        ++begin;
    while (end > begin && text[end - 1] == L' ')
        --end;
    return { begin, end };
}

std::wstring pattern(std::initializer_list<std::wstring_view> parts)
{
    std::wstring out;
    for (auto part : parts)
        out.append(part);
    return out;
}

// "Н.П." / "Н. П." / "Н.  П." -> "Н. П."
std::string canonicalInitials(const std::wstring& initials)
{
    std::wstring out;
    for (wchar_t c : initials)
    {
        if (c == L' ')
            continue;
        out.push_back(c);
        if (c == L'.')
            out.push_back(L' ');
    }
    return narrow(trim(out));
}

std::wstring stripUrlTail(std::wstring url)
{
    while (!url.empty())
    {
        wchar_t last = url.back();
        if (last == L'.' || last == L',' || last == L';')
        {
            url.pop_back();
        }
        else if (last == L')' && url.find(L'(') == std::wstring::npos)
        {
            url.pop_back();
        }
        else
        {
            break;
        }
    }
    return url;
}

struct Extraction
{
    explicit Extraction(const std::wstring& t)
        : text(t)
    {
    }

    const std::wstring& text;
    citation::ExtractedFields fields;
    std::map<FieldName, Span> spans;
    std::vector<Span> masked; // identifiers and dates: digits inside are not years

    void setSpan(FieldName field, std::size_t begin, std::size_t end)
    {
        Span s = trimmed(text, begin, end);
        if (s.empty())
            return;
        fields.set(field, narrow(text.substr(s.begin, s.end - s.begin)), s.begin, s.end - s.begin);
        spans[field] = s;
    }

    void setValue(FieldName field, const std::wstring& value, Span s)
    {
        std::wstring v = trim(value);
        if (v.empty())
            return;
        fields.set(field, narrow(v), s.begin, s.end - s.begin);
        spans[field] = s;
    }

    [[nodiscard]] bool isMasked(std::size_t pos) const
    {
        return std::any_of(masked.begin(), masked.end(),
                           [pos](const Span& s) { return pos >= s.begin && pos < s.end; });
    }
};

} // anonymous namespace

struct FieldExtractor::Impl
{
    Impl()
        : head_author(compile(pattern({ L"^(", citation_rules::kSurname, L"), (", citation_rules::kInitials, L")(?= |$)" })))
        , inverted_author(compile(pattern({ L"(^|[^{L}])(", citation_rules::kSurname, L"), (", citation_rules::kInitials, L")" })))
        , direct_author(compile(pattern({ L"(^|[^{L}])(", citation_rules::kInitials, L") (", citation_rules::kSurname, L")" })))
        , year_strict(compile(pattern({ L"[,–] ?(", kYear, L")(?= ?[.,–;)]| г\\.|$)" })))
        , year_fallback(compile(L"(^|[^0-9./\\-])(19[5-9][0-9]|20[0-2][0-9])(?![0-9]|\\.[0-9])"))
        , page_count(compile(L"^([0-9]+) ?((?:стр|с|л|pp|p|s|c|к|т)(?:\\..*)?)$"))
        , page_range(compile(L"(^|[^{L}])([СCP]\\.) ?([0-9]+(?:[–\\-][0-9]+)?(?:, ?[0-9]+(?:[–\\-][0-9]+)?)*)"))
        , imprint_full(compile(pattern({ L"^({U}[{L}.\\- ;]{0,40}?) : (.+), (", kYear, L")(?: г)?\\.?$" })))
        , imprint_publisher(compile(L"^({U}[{L}.\\- ;]{0,40}?) : ([^0-9].*?)\\.?$"))
        , imprint_city(compile(pattern({ L"^({U}[{L}.\\- ;]{0,40}?), (", kYear, L")(?: г)?\\.?$" })))
        , city_blacklist(compile(L"^(?:Режим|Рэжым|Дата|URL|Введ|Уведз|Опубл|Деп|Рец|DOI|ISBN|Загл|Систем)"))
        , volume(compile(L"(^|[^{L}])(?:Т|T|Vol|Том)\\. ?([0-9]+(?:[–\\-][0-9]+)?)"))
        , issue(compile(L"(^|[^{L}])(?:№|No\\.) ?([0-9]+(?:[/–\\-][0-9]+)?)"))
        , url(compile(L"(?:https?|ftp)://[^ ]+"))
        , access_date(compile(L"(?:[Дд]ата обращения|[Дд]ата доступа|[Дд]ата звароту): ?([0-9]{2}\\.[0-9]{2}\\.[0-9]{4})"))
        , doi(compile(L"(?:^|[^0-9])(10\\.[0-9]{4,}/[^ ]+)"))
        , isbn(compile(L"ISBN:? ?([0-9Xx][0-9Xx\\-]{8,16}[0-9Xx])"))
        , date(compile(L"[0-9]{2}\\.[0-9]{2}\\.[0-9]{2,4}"))
        , edition(compile(L"^(?:[0-9]+-(?:е|ае|ое|e) (?:изд|выд|ed)|(?:Изд|Выд)\\. [0-9]+-(?:е|ае|ое))"))
        , series(compile(L"^\\((.+)\\)\\.?$"))
        , designation(compile(L"\\[([^\\]]+)\\]"))
        , glue(compile(L"(^|[^{L}])(?:Режим доступа|Рэжым доступу|Дата доступа|[Дд]ата обращения|URL|DOI|doi|ISBN|Vol|No|Том|Т|T|С|C|P|г)(?![{L}])"))
        , residue(compile(L"[{L}0-9]"))
    {
    }

    std::wregex head_author;
    std::wregex inverted_author;
    std::wregex direct_author;
    std::wregex year_strict;
    std::wregex year_fallback;
    std::wregex page_count;
    std::wregex page_range;
    std::wregex imprint_full;
    std::wregex imprint_publisher;
    std::wregex imprint_city;
    std::wregex city_blacklist;
    std::wregex volume;
    std::wregex issue;
    std::wregex url;
    std::wregex access_date;
    std::wregex doi;
    std::wregex isbn;
    std::wregex date;
    std::wregex edition;
    std::wregex series;
    std::wregex designation;
    std::wregex glue;
    std::wregex residue;

    std::vector<std::string> authors(const std::wstring& text, std::optional<Span>& first) const;

    void extractIdentifiers(Extraction& ex) const;
    void extractHead(Extraction& ex, const DescriptionArea& head) const;
    void extractTitle(Extraction& ex, Span region) const;
    void extractAreas(Extraction& ex, const std::vector<DescriptionArea>& areas) const;
    void extractYear(Extraction& ex) const;
    void extractNumbering(Extraction& ex, std::size_t host_begin) const;
    void extractPageRange(Extraction& ex, std::size_t from) const;
    void collectNotes(Extraction& ex, const std::vector<DescriptionArea>& areas) const;
    void markEmbedded(Extraction& ex) const;
};

std::vector<std::string> FieldExtractor::Impl::authors(const std::wstring& text, std::optional<Span>& first) const
{
    std::vector<std::string> out;
    std::set<std::wstring> seen;

    auto collect = [&](const std::wregex& re, int surname_group, int initials_group)
    {
        for (auto it = std::wsregex_iterator(text.begin(), text.end(), re); it != std::wsregex_iterator(); ++it)
        {
            const auto& m = *it;
            std::wstring surname = m.str(surname_group);
            if (!seen.insert(surname).second)
                continue;

            if (!first)
            {
                auto begin = static_cast<std::size_t>(m.position(0)) + static_cast<std::size_t>(m.length(1));
                first = Span{ begin, static_cast<std::size_t>(m.position(0) + m.length(0)) };
            }
            out.push_back(narrow(surname) + ", " + canonicalInitials(m.str(initials_group)));
            if (out.size() >= kMaxAuthors)
                break;
        }
    };

    collect(inverted_author, 2, 3);
    if (out.empty())
        collect(direct_author, 3, 2);
    return out;
}

void FieldExtractor::Impl::extractIdentifiers(Extraction& ex) const
{
    const std::wstring& text = ex.text;
    std::wsmatch m;

    if (std::regex_search(text, m, url))
    {
        auto begin = static_cast<std::size_t>(m.position(0));
        std::wstring value = stripUrlTail(m.str(0));
        ex.setValue(FieldName::Url, value, { begin, begin + value.size() });
        ex.masked.push_back({ begin, begin + static_cast<std::size_t>(m.length(0)) });
    }

    if (std::regex_search(text, m, access_date))
    {
        auto begin = static_cast<std::size_t>(m.position(1));
        ex.setValue(FieldName::AccessDate, m.str(1), { begin, begin + static_cast<std::size_t>(m.length(1)) });
    }

    if (std::regex_search(text, m, doi))
    {
        auto begin = static_cast<std::size_t>(m.position(1));
        if (!ex.isMasked(begin))
        {
            std::wstring value = stripUrlTail(m.str(1));
            ex.setValue(FieldName::Doi, value, { begin, begin + value.size() });
            ex.masked.push_back({ begin, begin + static_cast<std::size_t>(m.length(1)) });
        }
    }

    if (std::regex_search(text, m, isbn))
    {
        auto begin = static_cast<std::size_t>(m.position(1));
        ex.setValue(FieldName::Isbn, m.str(1), { begin, begin + static_cast<std::size_t>(m.length(1)) });
        ex.masked.push_back({ begin, begin + static_cast<std::size_t>(m.length(1)) });
    }

    for (auto it = std::wsregex_iterator(text.begin(), text.end(), date); it != std::wsregex_iterator(); ++it)
    {
        auto begin = static_cast<std::size_t>(it->position(0));
        ex.masked.push_back({ begin, begin + static_cast<std::size_t>(it->length(0)) });
    }
}

void FieldExtractor::Impl::extractHead(Extraction& ex, const DescriptionArea& head) const
{
    const std::wstring& text = ex.text;
    std::size_t title_start = head.begin;

    std::wstring head_text = text.substr(head.begin, head.end - head.begin);
    std::wsmatch m;
    if (std::regex_search(head_text, m, head_author))
    {
        ex.fields.heading = true;
        title_start = head.begin + static_cast<std::size_t>(m.length(0));
    }

    auto find_in_head = [&](std::wstring_view needle, std::size_t from) -> std::size_t
    {
        std::size_t pos = text.find(needle, from);
        if (pos == std::wstring::npos || pos + needle.size() > head.end)
            return std::wstring::npos;
        return pos;
    };

    std::size_t host = find_in_head(kHostSeparator, title_start);
    std::size_t slash = find_in_head(kSlashSeparator, title_start);
    if (slash != std::wstring::npos && host != std::wstring::npos && slash > host)
        slash = std::wstring::npos;

    std::size_t title_end = std::min({ slash, host, head.end });
    extractTitle(ex, trimmed(text, title_start, title_end));

    if (slash != std::wstring::npos)
        ex.setSpan(FieldName::Responsibility, slash + kSlashSeparator.size(),
                   host != std::wstring::npos ? host : head.end);
    if (host != std::wstring::npos)
        ex.setSpan(FieldName::Journal, host + kHostSeparator.size(), head.end);
}

void FieldExtractor::Impl::extractTitle(Extraction& ex, Span region) const
{
    if (region.empty())
        return;

    const std::wstring& text = ex.text;
    std::size_t colon = text.find(kSubtitleSeparator, region.begin);
    if (colon != std::wstring::npos && colon + kSubtitleSeparator.size() > region.end)
        colon = std::wstring::npos;

    Span title_part = colon != std::wstring::npos ? trimmed(text, region.begin, colon) : region;
    Span subtitle_part = colon != std::wstring::npos
                             ? trimmed(text, colon + kSubtitleSeparator.size(), region.end)
                             : Span{};

    std::wstring title_text = text.substr(title_part.begin, title_part.end - title_part.begin);
    std::wsmatch m;
    if (std::regex_search(title_text, m, designation))
    {
        auto begin = title_part.begin + static_cast<std::size_t>(m.position(0));
        ex.setValue(FieldName::Designation, m.str(1), { begin, begin + static_cast<std::size_t>(m.length(0)) });

        std::wstring rest = m.prefix().str();
        if (!m.suffix().str().empty())
            rest += L" " + trim(m.suffix().str());
        ex.setValue(FieldName::Title, rest, title_part);
    }
    else
    {
        ex.setSpan(FieldName::Title, title_part.begin, title_part.end);
    }

    if (subtitle_part.empty())
        return;

    ex.setSpan(FieldName::Subtitle, subtitle_part.begin, subtitle_part.end);
    if (!ex.fields.found(FieldName::Designation))
    {
        std::wstring subtitle_text = text.substr(subtitle_part.begin, subtitle_part.end - subtitle_part.begin);
        if (std::regex_search(subtitle_text, m, designation))
        {
            auto begin = subtitle_part.begin + static_cast<std::size_t>(m.position(0));
            ex.setValue(FieldName::Designation, m.str(1), { begin, begin + static_cast<std::size_t>(m.length(0)) });
        }
    }
}

void FieldExtractor::Impl::extractAreas(Extraction& ex, const std::vector<DescriptionArea>& areas) const
{
    const std::wstring& text = ex.text;
    bool imprint_done = false;

    for (std::size_t i = 1; i < areas.size(); ++i)
    {
        Span area = trimmed(text, areas[i].begin, areas[i].end);
        if (area.empty())
            continue;

        std::wstring area_text = text.substr(area.begin, area.end - area.begin);
        std::wsmatch m;

        if (!ex.fields.found(FieldName::Pages) && std::regex_match(area_text, m, page_count))
        {
            std::wstring unit = m.str(2);
            if (unit.back() != L'.')
                unit.push_back(L'.');
            auto begin = area.begin + static_cast<std::size_t>(m.position(1));
            ex.setValue(FieldName::Pages, m.str(1), { begin, begin + static_cast<std::size_t>(m.length(1)) });
            ex.spans[FieldName::Pages] = area;
            ex.fields.page_unit = narrow(unit);
            continue;
        }

        if (!ex.fields.found(FieldName::Edition) && std::regex_search(area_text, m, edition))
        {
            ex.setSpan(FieldName::Edition, area.begin, area.end);
            continue;
        }

        if (!ex.fields.found(FieldName::Series) && std::regex_match(area_text, m, series))
        {
            ex.setValue(FieldName::Series, m.str(1), area);
            continue;
        }

        if (imprint_done || std::regex_search(area_text, city_blacklist))
            continue;

        auto at = [&](int group)
        {
            auto begin = area.begin + static_cast<std::size_t>(m.position(group));
            return Span{ begin, begin + static_cast<std::size_t>(m.length(group)) };
        };

        if (std::regex_match(area_text, m, imprint_full))
        {
            ex.setValue(FieldName::City, m.str(1), at(1));
            ex.setValue(FieldName::Publisher, m.str(2), at(2));
            if (!ex.fields.found(FieldName::Year))
                ex.setValue(FieldName::Year, m.str(3), at(3));
            imprint_done = true;
        }
        else if (std::regex_match(area_text, m, imprint_city))
        {
            ex.setValue(FieldName::City, m.str(1), at(1));
            if (!ex.fields.found(FieldName::Year))
                ex.setValue(FieldName::Year, m.str(2), at(2));
            imprint_done = true;
        }
        else if (std::regex_match(area_text, m, imprint_publisher))
        {
            ex.setValue(FieldName::City, m.str(1), at(1));
            ex.setValue(FieldName::Publisher, m.str(2), at(2));
            imprint_done = true;
        }
    }
}

void FieldExtractor::Impl::extractYear(Extraction& ex) const
{
    const std::wstring& text = ex.text;

    for (auto it = std::wsregex_iterator(text.begin(), text.end(), year_strict); it != std::wsregex_iterator(); ++it)
    {
        auto begin = static_cast<std::size_t>(it->position(1));
        if (ex.isMasked(begin))
            continue;
        ex.setValue(FieldName::Year, it->str(1), { begin, begin + static_cast<std::size_t>(it->length(1)) });
        return;
    }

    for (auto it = std::wsregex_iterator(text.begin(), text.end(), year_fallback); it != std::wsregex_iterator(); ++it)
    {
        auto begin = static_cast<std::size_t>(it->position(2));
        if (ex.isMasked(begin))
            continue;
        ex.setValue(FieldName::Year, it->str(2), { begin, begin + static_cast<std::size_t>(it->length(2)) });
        return;
    }
}

void FieldExtractor::Impl::extractNumbering(Extraction& ex, std::size_t host_begin) const
{
    const std::wstring& text = ex.text;

    auto search = [&](const std::wregex& re, FieldName field)
    {
        // the host document after "//" owns the numbering when present
        std::vector<std::size_t> starts;
        if (host_begin != std::wstring::npos)
            starts.push_back(host_begin);
        starts.push_back(0);

        for (std::size_t start : starts)
        {
            auto first = text.begin() + static_cast<std::ptrdiff_t>(start);
            for (auto it = std::wsregex_iterator(first, text.end(), re); it != std::wsregex_iterator(); ++it)
            {
                auto begin = start + static_cast<std::size_t>(it->position(2));
                if (ex.isMasked(begin))
                    continue;
                ex.setValue(field, it->str(2), { begin, begin + static_cast<std::size_t>(it->length(2)) });
                return;
            }
        }
    };

    search(volume, FieldName::Volume);
    search(issue, FieldName::Issue);
}

void FieldExtractor::Impl::extractPageRange(Extraction& ex, std::size_t from) const
{
    if (ex.fields.found(FieldName::Pages) || from >= ex.text.size())
        return;

    const std::wstring& text = ex.text;
    std::wsmatch m;
    auto first = text.begin() + static_cast<std::ptrdiff_t>(from);
    if (std::regex_search(first, text.end(), m, page_range))
    {
        auto begin = from + static_cast<std::size_t>(m.position(3));
        ex.setValue(FieldName::Pages, m.str(3), { begin, begin + static_cast<std::size_t>(m.length(3)) });
        ex.fields.page_unit = narrow(m.str(2));
        ex.fields.page_range = true;
    }
}

void FieldExtractor::Impl::collectNotes(Extraction& ex, const std::vector<DescriptionArea>& areas) const
{
    const std::wstring& text = ex.text;

    for (std::size_t i = 1; i < areas.size(); ++i)
    {
        Span area = trimmed(text, areas[i].begin, areas[i].end);
        if (area.empty())
            continue;

        // blank out everything a field explains, then drop the literal glue
        std::wstring rest = text.substr(area.begin, area.end - area.begin);
        for (const auto& [field, span] : ex.spans)
        {
            if (field == FieldName::Authors)
                continue;
            std::size_t b = std::max(span.begin, area.begin);
            std::size_t e = std::min(span.end, area.end);
            for (std::size_t pos = b; pos < e; ++pos)
                rest[pos - area.begin] = L' ';
        }
        rest = std::regex_replace(rest, glue, L"$1");
        if (!std::regex_search(rest, residue))
            continue;

        citation::Note note;
        note.text = narrow(text.substr(area.begin, area.end - area.begin));
        note.offset = area.begin;

        std::size_t best_end = 0;
        for (const auto& [field, span] : ex.spans)
        {
            if (span.end > area.begin || !ex.fields.found(field))
                continue;
            if (field != FieldName::Authors && ex.fields.get(field).embedded)
                continue;
            if (!note.anchor || span.end >= best_end)
            {
                best_end = span.end;
                note.anchor = field;
            }
        }
        ex.fields.notes.push_back(std::move(note));
    }
}

void FieldExtractor::Impl::markEmbedded(Extraction& ex) const
{
    std::vector<std::pair<FieldName, Span>> containers;
    for (FieldName f : { FieldName::Title, FieldName::Subtitle, FieldName::Responsibility, FieldName::Journal,
                         FieldName::Edition, FieldName::Series })
    {
        auto it = ex.spans.find(f);
        if (it != ex.spans.end())
            containers.emplace_back(f, it->second);
    }

    std::vector<Span> note_spans;
    for (const auto& note : ex.fields.notes)
        note_spans.push_back({ note.offset, note.offset + codepointLength(note.text) });

    for (auto& [field, value] : ex.fields.values)
    {
        if (!value.found || field == FieldName::Authors)
            continue;
        auto span_it = ex.spans.find(field);
        if (span_it == ex.spans.end())
            continue;
        const Span& span = span_it->second;

        for (const auto& [container, container_span] : containers)
        {
            if (container == field)
                continue;
            // the title keeps its own designation out of its value
            if (container == FieldName::Title && field == FieldName::Designation)
                continue;
            if (container_span.contains(span))
                value.embedded = true;
        }
        for (const auto& note_span : note_spans)
        {
            if (note_span.begin <= span.begin && span.end <= note_span.end)
                value.embedded = true;
        }
    }
}

FieldExtractor::FieldExtractor()
    : impl_(std::make_unique<Impl>())
{
}

FieldExtractor::~FieldExtractor() = default;

std::vector<DescriptionArea> FieldExtractor::splitAreas(const std::wstring& text)
{
    std::vector<DescriptionArea> areas;
    std::size_t start = 0;
    std::size_t pos = text.find(kAreaSeparator);
    while (pos != std::wstring::npos)
    {
        areas.push_back({ start, pos });
        start = pos + kAreaSeparator.size();
        pos = text.find(kAreaSeparator, start);
    }
    areas.push_back({ start, text.size() });
    return areas;
}

std::vector<std::string> FieldExtractor::extractAuthors(const std::string& text) const
{
    std::optional<Span> first;
    return impl_->authors(widen(text), first);
}

citation::ExtractedFields FieldExtractor::extract(const std::string& text) const
{
    PROFILE_SCOPE_CUSTOM("FieldExtractor::extract");

    const std::wstring wide = widen(text);
    Extraction ex(wide);
    if (wide.empty())
        return ex.fields;

    const auto areas = splitAreas(wide);

    impl_->extractIdentifiers(ex);
    impl_->extractHead(ex, areas.front());

    std::optional<Span> first_author;
    ex.fields.authors = impl_->authors(wide, first_author);
    if (!ex.fields.authors.empty())
    {
        std::string joined;
        for (const auto& author : ex.fields.authors)
        {
            if (!joined.empty())
                joined += "; ";
            joined += author;
        }
        ex.fields.set(FieldName::Authors, joined, first_author->begin, first_author->end - first_author->begin);
        ex.spans[FieldName::Authors] = *first_author;
    }

    impl_->extractYear(ex);
    impl_->extractAreas(ex, areas);

    const std::size_t host = wide.find(kHostSeparator);
    impl_->extractNumbering(ex, host);
    impl_->extractPageRange(ex, areas.size() > 1 ? areas[1].begin : wide.size());

    impl_->collectNotes(ex, areas);
    impl_->markEmbedded(ex);

    if (Diagnostics::IsVerbose())
    {
        std::size_t found = 0;
        for (const auto& [field, value] : ex.fields.values)
            found += value.found ? 1 : 0;
        PLOG_DEBUG_(Diagnostics::kLogInstance)
            << "[FieldExtractor] fields=" << found << " authors=" << ex.fields.authors.size()
            << " notes=" << ex.fields.notes.size() << " heading=" << (ex.fields.heading ? "yes" : "no");
    }

    return ex.fields;
}

} // namespace processing
