#pragma once

#include <string>

namespace processing
{

// Character-level cleanup that runs before any punctuation rule:
// line breaks and exotic spaces become plain spaces, dash variants become
// the en dash, the single-character ellipsis is spelled out, and the text is
// NFC-composed. Compatibility (NFKC) folding is avoided on purpose: it
// rewrites "№" into "No".
class TextCanonicalizer
{
public:
    [[nodiscard]] std::string canonicalize(const std::string& text) const;

    // Converts \r\n, \r, \n and \t to single spaces
    [[nodiscard]] std::string flattenLineBreaks(const std::string& text) const;

    [[nodiscard]] std::string composeNFC(const std::string& text) const;

    // " - ", "—", "‒" used as separators become " – "
    [[nodiscard]] std::wstring unifyDashes(const std::wstring& text) const;
};

} // namespace processing
