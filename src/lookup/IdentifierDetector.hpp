#pragma once

#include <string>
#include <string_view>

namespace lookup
{

enum class IdentifierKind
{
    Doi,
    Isbn,
    Unknown
};

[[nodiscard]] std::string_view toString(IdentifierKind kind) noexcept;

struct Identifier
{
    IdentifierKind kind = IdentifierKind::Unknown;
    std::string value; // cleaned: DOI as given, ISBN without hyphens or spaces
};

// "10.1000/xyz" -> Doi; 13 digits or 9 digits + check character -> Isbn.
// "doi:" and "https://doi.org/" prefixes are accepted.
[[nodiscard]] Identifier detectIdentifier(std::string_view text);

} // namespace lookup
