#include "CitationPatterns.hpp"

namespace citation_rules {

std::wstring expandClasses(std::wstring_view pattern)
{
    std::wstring out;
    out.reserve(pattern.size() * 2);

    // Inside [...] a placeholder contributes its ranges; outside it becomes a class of its own
    bool in_class = false;
    for (std::size_t i = 0; i < pattern.size(); ++i)
    {
        const wchar_t ch = pattern[i];
        if (ch == L'\\' && i + 1 < pattern.size())
        {
            out.push_back(ch);
            out.push_back(pattern[++i]);
            continue;
        }
        if (ch == L'[' && !in_class)
        {
            in_class = true;
            out.push_back(ch);
            if (i + 1 < pattern.size() && pattern[i + 1] == L'^')
                out.push_back(pattern[++i]);
            continue;
        }
        if (ch == L']' && in_class)
        {
            in_class = false;
            out.push_back(ch);
            continue;
        }

        if (ch == L'{' && i + 2 < pattern.size() && pattern[i + 2] == L'}')
        {
            std::wstring_view ranges;
            switch (pattern[i + 1])
            {
            case L'U':
                ranges = kUpper;
                break;
            case L'l':
                ranges = kLower;
                break;
            case L'L':
                ranges = kLetters;
                break;
            case L'D':
                ranges = kDashes;
                break;
            default:
                break;
            }
            if (!ranges.empty())
            {
                if (!in_class)
                    out.push_back(L'[');
                out.append(ranges);
                if (!in_class)
                    out.push_back(L']');
                i += 2;
                continue;
            }
        }
        out.push_back(ch);
    }
    return out;
}

std::wregex compile(std::wstring_view pattern)
{
    return std::wregex(expandClasses(pattern), std::regex_constants::ECMAScript);
}

} // namespace citation_rules
