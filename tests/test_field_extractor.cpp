#include <catch2/catch_test_macros.hpp>

#include "processing/FieldExtractor.hpp"
#include "processing/WideText.hpp"

#include <string>
#include <vector>

using citation::FieldName;
using processing::FieldExtractor;

TEST_CASE("FieldExtractor - book with inverted heading", "[field_extractor]") {
    FieldExtractor extractor;
    auto f = extractor.extract("Дробышевский, Н. П. Ревизия и аудит : учеб.-метод. пособие / Н. П. Дробышевский. – "
                               "Минск : Амалфея, 2013. – 415 с.");

    REQUIRE(f.heading);
    REQUIRE(f.authors == std::vector<std::string>{ "Дробышевский, Н. П." });
    REQUIRE(f.value(FieldName::Title) == std::string("Ревизия и аудит"));
    REQUIRE(f.value(FieldName::Subtitle) == std::string("учеб.-метод. пособие"));
    REQUIRE(f.value(FieldName::Responsibility) == std::string("Н. П. Дробышевский"));
    REQUIRE(f.value(FieldName::City) == std::string("Минск"));
    REQUIRE(f.value(FieldName::Publisher) == std::string("Амалфея"));
    REQUIRE(f.value(FieldName::Year) == std::string("2013"));
    REQUIRE(f.value(FieldName::Pages) == std::string("415"));
    REQUIRE(f.page_unit == "с.");
    REQUIRE_FALSE(f.page_range);
    REQUIRE(f.notes.empty());
}

TEST_CASE("FieldExtractor - journal article numbering and page range", "[field_extractor]") {
    FieldExtractor extractor;

    SECTION("issue only") {
        auto f = extractor.extract("Иванов, И. И. Методика обучения / И. И. Иванов // Нар. асвета. – 2013. – № 5. – С. 88–91.");
        REQUIRE(f.value(FieldName::Journal) == std::string("Нар. асвета"));
        REQUIRE(f.value(FieldName::Year) == std::string("2013"));
        REQUIRE(f.value(FieldName::Issue) == std::string("5"));
        REQUIRE_FALSE(f.found(FieldName::Volume));
        REQUIRE(f.value(FieldName::Pages) == std::string("88–91"));
        REQUIRE(f.page_range);
        REQUIRE(f.page_unit == "С.");
    }

    SECTION("volume and issue") {
        auto f = extractor.extract(
            "Сидоров, С. С. Статья / С. С. Сидоров // Вестн. БГУ. Сер. 1. – 2015. – Т. 12, № 3. – С. 5–10.");
        REQUIRE(f.value(FieldName::Journal) == std::string("Вестн. БГУ. Сер. 1"));
        REQUIRE(f.value(FieldName::Volume) == std::string("12"));
        REQUIRE(f.value(FieldName::Issue) == std::string("3"));
        REQUIRE(f.value(FieldName::Pages) == std::string("5–10"));
        REQUIRE(f.notes.empty());
    }
}

TEST_CASE("FieldExtractor - electronic resource access data", "[field_extractor]") {
    FieldExtractor extractor;
    auto f = extractor.extract("Национальный правовой Интернет-портал Республики Беларусь [Электронный ресурс]. – "
                               "Режим доступа: http://www.pravo.by. – Дата доступа: 24.06.2024.");

    REQUIRE(f.value(FieldName::Title) == std::string("Национальный правовой Интернет-портал Республики Беларусь"));
    REQUIRE(f.value(FieldName::Designation) == std::string("Электронный ресурс"));
    REQUIRE(f.value(FieldName::Url) == std::string("http://www.pravo.by"));
    REQUIRE(f.value(FieldName::AccessDate) == std::string("24.06.2024"));
    // the access date is not a publication year
    REQUIRE_FALSE(f.found(FieldName::Year));
    REQUIRE(f.authors.empty());
    REQUIRE(f.notes.empty());
}

TEST_CASE("FieldExtractor - identifiers", "[field_extractor]") {
    FieldExtractor extractor;
    auto f = extractor.extract("Smith, J. Title / J. Smith. – London : Pub, 2019. – 300 p. – "
                               "ISBN 978-3-16-148410-0. – DOI: 10.1000/xyz123.");

    REQUIRE(f.authors == std::vector<std::string>{ "Smith, J." });
    REQUIRE(f.value(FieldName::Isbn) == std::string("978-3-16-148410-0"));
    REQUIRE(f.value(FieldName::Doi) == std::string("10.1000/xyz123"));
    REQUIRE(f.value(FieldName::City) == std::string("London"));
    REQUIRE(f.value(FieldName::Year) == std::string("2019"));
    REQUIRE(f.page_unit == "p.");
    REQUIRE(f.notes.empty());
}

TEST_CASE("FieldExtractor - edition and series areas", "[field_extractor]") {
    FieldExtractor extractor;
    auto f = extractor.extract("Петров, П. П. Учебник / П. П. Петров. – 2-е изд., перераб. – Минск : Выш. шк., 2015. – "
                               "320 с. – (Высшее образование).");

    REQUIRE(f.value(FieldName::Edition) == std::string("2-е изд., перераб"));
    REQUIRE(f.value(FieldName::Publisher) == std::string("Выш. шк."));
    REQUIRE(f.value(FieldName::Year) == std::string("2015"));
    REQUIRE(f.value(FieldName::Series) == std::string("Высшее образование"));
    REQUIRE(f.notes.empty());
}

TEST_CASE("FieldExtractor - unexplained areas are kept as notes", "[field_extractor]") {
    FieldExtractor extractor;
    auto f = extractor.extract("Иванов, И. И. Книга / И. И. Иванов. – Минск : БГУ, 2010. – 200 с. – Библиогр.: с. 190–199.");

    REQUIRE(f.value(FieldName::Pages) == std::string("200"));
    REQUIRE(f.value(FieldName::Year) == std::string("2010"));
    REQUIRE(f.notes.size() == 1);
    REQUIRE(f.notes[0].text == "Библиогр.: с. 190–199.");
    REQUIRE(f.notes[0].anchor == FieldName::Pages);
}

TEST_CASE("FieldExtractor - dissertation keeps its code out of the year", "[field_extractor]") {
    FieldExtractor extractor;
    auto f = extractor.extract("Петров, П. П. Гісторыя адукацыі : дыс. ... канд. гіст. навук : 07.00.09 / П. П. Петров. – "
                               "Мінск, 2013. – 150 л.");

    REQUIRE(f.value(FieldName::Title) == std::string("Гісторыя адукацыі"));
    REQUIRE(f.value(FieldName::Subtitle) == std::string("дыс. ... канд. гіст. навук : 07.00.09"));
    REQUIRE(f.value(FieldName::City) == std::string("Мінск"));
    REQUIRE(f.value(FieldName::Year) == std::string("2013"));
    REQUIRE(f.page_unit == "л.");
}

TEST_CASE("FieldExtractor - author lists", "[field_extractor]") {
    FieldExtractor extractor;

    SECTION("direct form is used when no inverted author exists") {
        auto authors = extractor.extractAuthors("Методика / И. И. Иванов, П. С. Сидоров");
        REQUIRE(authors == std::vector<std::string>{ "Иванов, И. И.", "Сидоров, П. С." });
    }

    SECTION("initials are canonicalised") {
        auto authors = extractor.extractAuthors("Иванов, И.И. Текст");
        REQUIRE(authors == std::vector<std::string>{ "Иванов, И. И." });
    }

    SECTION("repeated surnames are dropped") {
        auto authors = extractor.extractAuthors("Иванов, И. И., Иванов, И. И., Петров, П. П.");
        REQUIRE(authors.size() == 2);
    }

    SECTION("list is capped") {
        const std::vector<std::string> surnames = { "Аксенов", "Быков",  "Волков",  "Гусев",   "Дьяков", "Егоров",
                                                    "Жуков",   "Зайцев", "Ильин",   "Козлов",  "Лебедев", "Морозов" };
        std::string text;
        for (const auto& s : surnames)
            text += s + ", А. А., ";
        auto authors = extractor.extractAuthors(text);
        REQUIRE(authors.size() == FieldExtractor::kMaxAuthors);
        REQUIRE(authors.front() == "Аксенов, А. А.");
    }
}

TEST_CASE("FieldExtractor - offsets point into the source", "[field_extractor]") {
    FieldExtractor extractor;
    const std::string text = "Петров, П. П. Книга / П. П. Петров. – Минск : БГУ, 2020. – 100 с.";
    auto f = extractor.extract(text);

    const auto& year = f.get(FieldName::Year);
    REQUIRE(year.found);
    std::wstring wide = processing::widen(text);
    REQUIRE(processing::narrow(wide.substr(year.offset, year.length)) == "2020");
}

TEST_CASE("FieldExtractor - area splitting", "[field_extractor]") {
    auto areas = FieldExtractor::splitAreas(L"A. – B. – C");
    REQUIRE(areas.size() == 3);
    REQUIRE(areas[1].begin == 5);
    REQUIRE(areas[1].end == 6);
}

TEST_CASE("FieldExtractor - empty input", "[field_extractor]") {
    FieldExtractor extractor;
    auto f = extractor.extract("");
    REQUIRE(f.values.empty());
    REQUIRE(f.authors.empty());
}
