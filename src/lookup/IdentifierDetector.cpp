#include "IdentifierDetector.hpp"

#include <algorithm>
#include <cctype>
#include <regex>

namespace lookup
{

namespace
{

std::string trimmed(std::string_view text)
{
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string_view::npos)
        return {};
    auto end = text.find_last_not_of(" \t\r\n");
    return std::string(text.substr(begin, end - begin + 1));
}

bool startsWithNoCase(const std::string& text, std::string_view prefix)
{
    if (text.size() < prefix.size())
        return false;
    return std::equal(prefix.begin(), prefix.end(), text.begin(),
                      [](char a, char b)
                      {
                          return std::tolower(static_cast<unsigned char>(a)) ==
                                 std::tolower(static_cast<unsigned char>(b));
                      });
}

bool allDigits(std::string_view s)
{
    return std::all_of(s.begin(), s.end(), [](char c) { return std::isdigit(static_cast<unsigned char>(c)) != 0; });
}

} // anonymous namespace

std::string_view toString(IdentifierKind kind) noexcept
{
    switch (kind)
    {
    case IdentifierKind::Doi:
        return "doi";
    case IdentifierKind::Isbn:
        return "isbn";
    case IdentifierKind::Unknown:
        break;
    }
    return "unknown";
}

Identifier detectIdentifier(std::string_view text)
{
    static const std::regex doi(R"(^10\.[0-9]{4,}/\S+$)");

    std::string value = trimmed(text);
    for (std::string_view prefix : { "https://doi.org/", "http://doi.org/", "http://dx.doi.org/", "doi:" })
    {
        if (startsWithNoCase(value, prefix))
        {
            value = trimmed(std::string_view(value).substr(prefix.size()));
            break;
        }
    }

    if (std::regex_match(value, doi))
        return { IdentifierKind::Doi, value };

    std::string isbn = value;
    if (startsWithNoCase(isbn, "isbn"))
        isbn = trimmed(std::string_view(isbn).substr(4));
    isbn.erase(std::remove_if(isbn.begin(), isbn.end(), [](char c) { return c == '-' || c == ' ' || c == ':'; }),
               isbn.end());

    if (isbn.size() == 13 && allDigits(isbn))
        return { IdentifierKind::Isbn, isbn };
    if (isbn.size() == 10 && allDigits(std::string_view(isbn).substr(0, 9)) &&
        (std::isdigit(static_cast<unsigned char>(isbn.back())) || isbn.back() == 'X' || isbn.back() == 'x'))
    {
        isbn.back() = static_cast<char>(std::toupper(static_cast<unsigned char>(isbn.back())));
        return { IdentifierKind::Isbn, isbn };
    }

    return { IdentifierKind::Unknown, trimmed(text) };
}

} // namespace lookup
