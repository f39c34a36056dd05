#include <catch2/catch_test_macros.hpp>

#include "processing/PunctuationNormalizer.hpp"

#include <algorithm>
#include <string>
#include <vector>

using processing::PunctuationNormalizer;

namespace
{
bool contains(const std::vector<std::string>& names, const std::string& name)
{
    return std::find(names.begin(), names.end(), name) != names.end();
}
}

TEST_CASE("PunctuationNormalizer - rules run in a fixed order", "[normalizer]") {
    PunctuationNormalizer n;
    std::vector<std::string> expected = {
        "protect_ellipsis",      "collapse_double_periods", "collapse_spaces",
        "space_after_separator_dash", "space_after_colon",  "tighten_numeric_ranges",
        "year_range_hyphen",     "tighten_page_ranges",     "space_after_initials",
        "space_after_enumerators", "strip_space_before_punctuation", "restore_ellipsis",
    };
    REQUIRE(n.ruleNames() == expected);
}

TEST_CASE("PunctuationNormalizer - area separator dash", "[normalizer]") {
    PunctuationNormalizer n;
    REQUIRE(n.normalize("Текст. –Минск, 2013.") == "Текст. – Минск, 2013.");

    SECTION("numeric range after the dash is left alone") {
        REQUIRE(n.applyRule("space_after_separator_dash", "Т. –12–15") == "Т. –12–15");
    }
}

TEST_CASE("PunctuationNormalizer - numeric and page ranges are tightened", "[normalizer]") {
    PunctuationNormalizer n;
    REQUIRE(n.normalize("С. 88 – 91") == "С. 88–91");
    REQUIRE(n.normalize("45 –52") == "45–52");
    REQUIRE(n.applyRule("tighten_page_ranges", "С. 88 - 91") == "С. 88–91");
    REQUIRE(n.applyRule("tighten_page_ranges", "С.88-91") == "С. 88–91");

    auto report = n.normalizeWithReport("С. 88 – 91");
    REQUIRE(contains(report.fired_rules, "tighten_numeric_ranges"));
}

TEST_CASE("PunctuationNormalizer - year ranges", "[normalizer]") {
    PunctuationNormalizer n;

    SECTION("plausible year range gets an en dash") {
        REQUIRE(n.normalize("Отчет за 1995-2005 гг.") == "Отчет за 1995–2005 гг.");
    }

    SECTION("implausible pair is kept and reported") {
        auto report = n.normalizeWithReport("ТКП 7696-2024");
        REQUIRE(report.text == "ТКП 7696-2024");
        REQUIRE(report.issues.size() == 1);
        REQUIRE(report.issues[0].kind == citation::IssueKind::AmbiguousRange);
    }

    SECTION("standard numbers are not ranges") {
        auto report = n.normalizeWithReport("ГОСТ 7.1-2003");
        REQUIRE(report.text == "ГОСТ 7.1-2003");
        REQUIRE(report.issues.empty());
    }
}

TEST_CASE("PunctuationNormalizer - colons outside URLs", "[normalizer]") {
    PunctuationNormalizer n;
    REQUIRE(n.normalize("Минск :Выш. шк.") == "Минск : Выш. шк.");
    REQUIRE(n.normalize("Режим доступа:http://site.by/a:b") == "Режим доступа: http://site.by/a:b");
}

TEST_CASE("PunctuationNormalizer - initials", "[normalizer]") {
    PunctuationNormalizer n;
    REQUIRE(n.normalize("А. А.Фамилия") == "А. А. Фамилия");
    REQUIRE(n.normalize("И.И.Иванов") == "И. И. Иванов");
    REQUIRE(n.normalize("Н. П. Дробышевский") == "Н. П. Дробышевский");
    REQUIRE(n.normalize("Иванов, И.И.Петров") == "Иванов, И. И. Петров");
    REQUIRE(n.normalize("Ўласаў, Ў.Я.") == "Ўласаў, Ў. Я.");
}

TEST_CASE("PunctuationNormalizer - enumerators", "[normalizer]") {
    PunctuationNormalizer n;
    REQUIRE(n.normalize("Т.5, №3, Вып.2, кн.1") == "Т. 5, № 3, Вып. 2, кн. 1");
}

TEST_CASE("PunctuationNormalizer - spacing and doubled periods", "[normalizer]") {
    PunctuationNormalizer n;
    REQUIRE(n.normalize("Минск , 2013 .") == "Минск, 2013.");
    REQUIRE(n.normalize("Вестн. журн.. – 2013.") == "Вестн. журн. – 2013.");
    REQUIRE(n.normalize("a  b   c") == "a b c");
}

TEST_CASE("PunctuationNormalizer - ellipsis is preserved", "[normalizer]") {
    PunctuationNormalizer n;
    const std::string text = "дыс. ... канд. гіст. навук";
    REQUIRE(n.normalize(text) == text);
}

TEST_CASE("PunctuationNormalizer - normalization is idempotent", "[normalizer]") {
    PunctuationNormalizer n;
    const std::vector<std::string> inputs = {
        "Дробышевский, Н. П. Ревизия и аудит : учеб.-метод. пособие / Н. П. Дробышевский. – Минск : Амалфея, 2013. – 415 с.",
        "С. 88 – 91",
        "И.И.Иванов. –Минск :БГУ , 2013 .",
        "Режим доступа:http://www.pravo.by. – Дата доступа:24.06.2024.",
        "Т.5, №3. – С.1-10.",
        "дис. ... канд. техн. наук",
    };
    for (const auto& input : inputs) {
        auto once = n.normalize(input);
        REQUIRE(n.normalize(once) == once);
    }
}

TEST_CASE("PunctuationNormalizer - unknown rule name returns the input", "[normalizer]") {
    PunctuationNormalizer n;
    REQUIRE(n.applyRule("no_such_rule", "a  b") == "a  b");
}
