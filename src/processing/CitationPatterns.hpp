#pragma once

#include <regex>
#include <string>
#include <string_view>

namespace citation_rules {

// std::wregex has no Unicode-aware \w or \b, so patterns spell letter classes
// out through placeholders expanded by compile(). Outside brackets a
// placeholder becomes a class of its own ("{U}" -> "[A-Z...]"); inside
// brackets it adds its ranges ("[{l}'’]"):
//   {U}  uppercase letter   (Latin, Russian, Belarusian, Ukrainian)
//   {l}  lowercase letter
//   {L}  any letter
//   {D}  dash: en dash or em dash
inline constexpr std::wstring_view kUpper = L"A-ZА-ЯЁІЎЇЄҐ";
inline constexpr std::wstring_view kLower = L"a-zа-яёіўїєґ";
inline constexpr std::wstring_view kLetters = L"A-Za-zА-Яа-яЁёІіЎўЇїЄєҐґ";
inline constexpr std::wstring_view kDashes = L"–—";

// En dash used as area separator and range dash
inline constexpr wchar_t kDash = L'–';

[[nodiscard]] std::wstring expandClasses(std::wstring_view pattern);

// ECMAScript grammar; throws std::regex_error on a malformed pattern
[[nodiscard]] std::wregex compile(std::wstring_view pattern);

// Surname of an author heading: capitalised word, optional hyphenated part,
// Belarusian apostrophes allowed
inline constexpr std::wstring_view kSurname = L"{U}[{l}'’]+(?:-{U}[{l}'’]+)?";

// One or two initials: "Н.", "Н. П.", "Н.П."
inline constexpr std::wstring_view kInitials = L"{U}\\.(?: ?{U}\\.)?";

} // namespace citation_rules
