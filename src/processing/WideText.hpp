#pragma once

#include <cstddef>
#include <string>
#include <string_view>

namespace processing
{

/// UTF-8 to wide conversion: UTF-32 where wchar_t is 32-bit, UTF-16 with
/// surrogate pairs where it is 16-bit (MSVC). Invalid bytes are dropped
std::wstring widen(std::string_view utf8_str);

/// Wide to UTF-8 conversion; joins surrogate pairs on 16-bit wchar_t
std::string narrow(std::wstring_view wide_str);

/// Unicode-aware lowercase (Cyrillic, Belarusian, Latin)
std::wstring toLower(std::wstring_view text);
std::string toLower(std::string_view utf8_str);

/// Strip ASCII spaces from both ends
std::wstring trim(std::wstring_view text);
std::string trim(std::string_view text);

bool startsWith(std::wstring_view text, std::wstring_view prefix) noexcept;
bool endsWith(std::wstring_view text, std::wstring_view suffix) noexcept;

/// Number of code points in a UTF-8 string
std::size_t codepointLength(std::string_view utf8_str);

/// Leading `max_codepoints` code points of a UTF-8 string, never splitting a sequence
std::string truncateCodepoints(std::string_view utf8_str, std::size_t max_codepoints);

/// PUA marker that stands in for a protected "..." while punctuation rules run
constexpr wchar_t ELLIPSIS_SENTINEL = L'\uE100';

} // namespace processing
