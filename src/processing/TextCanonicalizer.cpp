#include "TextCanonicalizer.hpp"
#include "WideText.hpp"

#include <cstdlib>
#include <plog/Log.h>
#include <utf8proc.h>

namespace processing
{

std::string TextCanonicalizer::flattenLineBreaks(const std::string& text) const
{
    if (text.empty())
        return text;

    std::string out;
    out.reserve(text.size());

    for (size_t i = 0; i < text.size(); ++i)
    {
        char c = text[i];
        if (c == '\r')
        {
            if (i + 1 < text.size() && text[i + 1] == '\n')
                ++i;
            out.push_back(' ');
        }
        else if (c == '\n' || c == '\t')
        {
            out.push_back(' ');
        }
        else
        {
            out.push_back(c);
        }
    }

    return out;
}

std::string TextCanonicalizer::composeNFC(const std::string& text) const
{
    if (text.empty())
        return text;

    utf8proc_uint8_t* composed = utf8proc_NFC(reinterpret_cast<const utf8proc_uint8_t*>(text.c_str()));
    if (!composed)
    {
        PLOG_WARNING << "NFC composition failed, keeping text as decoded";
        return text;
    }

    std::string out(reinterpret_cast<char*>(composed));
    std::free(composed);
    return out;
}

std::wstring TextCanonicalizer::unifyDashes(const std::wstring& text) const
{
    std::wstring out;
    out.reserve(text.size());

    for (std::size_t i = 0; i < text.size(); ++i)
    {
        wchar_t c = text[i];
        switch (c)
        {
        case L'\u00A0': // no-break space
        case L'\u2009': // thin space
        case L'\u202F': // narrow no-break space
            out.push_back(L' ');
            break;
        case L'\u2012': // figure dash
        case L'\u2014': // em dash
        case L'\u2212': // minus sign
            out.push_back(L'\u2013');
            break;
        case L'\u2026': // horizontal ellipsis
            out.append(L"...");
            break;
        case L'-':
            // a hyphen standing between spaces is a separator, not a compound word
            if (i > 0 && i + 1 < text.size() && text[i - 1] == L' ' && text[i + 1] == L' ')
                out.push_back(L'\u2013');
            else
                out.push_back(c);
            break;
        default:
            out.push_back(c);
            break;
        }
    }
    return out;
}

std::string TextCanonicalizer::canonicalize(const std::string& text) const
{
    if (text.empty())
        return text;

    std::string flat = flattenLineBreaks(text);
    std::string composed = composeNFC(flat);
    return narrow(trim(unifyDashes(widen(composed))));
}

} // namespace processing
