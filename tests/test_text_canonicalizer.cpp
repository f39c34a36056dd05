#include <catch2/catch_test_macros.hpp>

#include "processing/TextCanonicalizer.hpp"

#include <string>

using processing::TextCanonicalizer;

TEST_CASE("TextCanonicalizer - line breaks and tabs become spaces", "[canonicalizer]") {
    TextCanonicalizer c;
    REQUIRE(c.flattenLineBreaks("a\r\nb\nc\td\re") == "a b c d e");
    REQUIRE(c.canonicalize("  Минск\r\n2013  ") == "Минск 2013");
}

TEST_CASE("TextCanonicalizer - exotic spaces become plain spaces", "[canonicalizer]") {
    TextCanonicalizer c;
    REQUIRE(c.canonicalize("2013\u00A0г.") == "2013 г.");
    REQUIRE(c.canonicalize("С.\u202F88") == "С. 88");
}

TEST_CASE("TextCanonicalizer - dash variants become the en dash", "[canonicalizer]") {
    TextCanonicalizer c;
    REQUIRE(c.canonicalize("Текст. \u2014 Минск") == "Текст. – Минск");
    REQUIRE(c.canonicalize("Текст. - Минск") == "Текст. – Минск");

    SECTION("compound words keep their hyphen") {
        REQUIRE(c.canonicalize("учеб.-метод. пособие") == "учеб.-метод. пособие");
        REQUIRE(c.canonicalize("Интернет-портал") == "Интернет-портал");
    }
}

TEST_CASE("TextCanonicalizer - ellipsis character is spelled out", "[canonicalizer]") {
    TextCanonicalizer c;
    REQUIRE(c.canonicalize("дис. \u2026 канд.") == "дис. ... канд.");
}

TEST_CASE("TextCanonicalizer - decomposed letters are composed", "[canonicalizer]") {
    TextCanonicalizer c;
    // "и" + combining breve -> "й"
    REQUIRE(c.composeNFC("и\u0306") == "й");
    // number sign survives (no compatibility folding)
    REQUIRE(c.canonicalize("№ 5") == "№ 5");
}

TEST_CASE("TextCanonicalizer - empty input", "[canonicalizer]") {
    TextCanonicalizer c;
    REQUIRE(c.canonicalize("").empty());
}
