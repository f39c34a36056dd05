#include "WideText.hpp"
#include <utf8proc.h>

#include <cstdint>

namespace processing
{

std::wstring widen(std::string_view utf8_str)
{
    std::wstring result;
    if (utf8_str.empty())
        return result;

    const auto* str = reinterpret_cast<const utf8proc_uint8_t*>(utf8_str.data());
    auto len = static_cast<utf8proc_ssize_t>(utf8_str.size());
    result.reserve(utf8_str.size());

    utf8proc_ssize_t pos = 0;
    while (pos < len)
    {
        utf8proc_int32_t codepoint;
        utf8proc_ssize_t bytes = utf8proc_iterate(str + pos, len - pos, &codepoint);
        if (bytes <= 0)
        {
            ++pos;
            continue;
        }
        if constexpr (sizeof(wchar_t) == 2)
        {
            // UTF-16 platforms: astral code points become a surrogate pair
            if (codepoint > 0xFFFF)
            {
                const auto offset = static_cast<std::uint32_t>(codepoint) - 0x10000u;
                result.push_back(static_cast<wchar_t>(0xD800u + (offset >> 10)));
                result.push_back(static_cast<wchar_t>(0xDC00u + (offset & 0x3FFu)));
                pos += bytes;
                continue;
            }
        }
        result.push_back(static_cast<wchar_t>(codepoint));
        pos += bytes;
    }
    return result;
}

std::string narrow(std::wstring_view wide_str)
{
    std::string result;
    result.reserve(wide_str.size() * 2);
    for (std::size_t i = 0; i < wide_str.size(); ++i)
    {
        auto cp = static_cast<std::uint32_t>(wide_str[i]);
        if constexpr (sizeof(wchar_t) == 2)
        {
            const bool high = cp >= 0xD800u && cp <= 0xDBFFu;
            if (high && i + 1 < wide_str.size())
            {
                const auto low = static_cast<std::uint32_t>(wide_str[i + 1]);
                if (low >= 0xDC00u && low <= 0xDFFFu)
                {
                    cp = 0x10000u + ((cp - 0xD800u) << 10) + (low - 0xDC00u);
                    ++i;
                }
            }
        }
        utf8proc_uint8_t buffer[4];
        utf8proc_ssize_t bytes = utf8proc_encode_char(static_cast<utf8proc_int32_t>(cp), buffer);
        if (bytes > 0)
        {
            result.append(reinterpret_cast<const char*>(buffer), static_cast<size_t>(bytes));
        }
    }
    return result;
}

std::wstring toLower(std::wstring_view text)
{
    std::wstring out;
    out.reserve(text.size());
    for (wchar_t cp : text)
    {
        out.push_back(static_cast<wchar_t>(utf8proc_tolower(static_cast<utf8proc_int32_t>(cp))));
    }
    return out;
}

std::string toLower(std::string_view utf8_str)
{
    return narrow(toLower(widen(utf8_str)));
}

std::wstring trim(std::wstring_view text)
{
    auto begin = text.find_first_not_of(L' ');
    if (begin == std::wstring_view::npos)
        return std::wstring();
    auto end = text.find_last_not_of(L' ');
    return std::wstring(text.substr(begin, end - begin + 1));
}

std::string trim(std::string_view text)
{
    auto begin = text.find_first_not_of(' ');
    if (begin == std::string_view::npos)
        return std::string();
    auto end = text.find_last_not_of(' ');
    return std::string(text.substr(begin, end - begin + 1));
}

bool startsWith(std::wstring_view text, std::wstring_view prefix) noexcept
{
    return text.size() >= prefix.size() && text.compare(0, prefix.size(), prefix) == 0;
}

bool endsWith(std::wstring_view text, std::wstring_view suffix) noexcept
{
    return text.size() >= suffix.size() && text.compare(text.size() - suffix.size(), suffix.size(), suffix) == 0;
}

std::size_t codepointLength(std::string_view utf8_str)
{
    std::size_t count = 0;
    for (unsigned char c : utf8_str)
    {
        if ((c & 0xC0) != 0x80)
            ++count;
    }
    return count;
}

std::string truncateCodepoints(std::string_view utf8_str, std::size_t max_codepoints)
{
    std::size_t seen = 0;
    for (std::size_t i = 0; i < utf8_str.size(); ++i)
    {
        if ((static_cast<unsigned char>(utf8_str[i]) & 0xC0) == 0x80)
            continue;
        if (seen == max_codepoints)
            return std::string(utf8_str.substr(0, i));
        ++seen;
    }
    return std::string(utf8_str);
}

} // namespace processing
