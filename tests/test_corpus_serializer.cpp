#include <catch2/catch_test_macros.hpp>

#include "dataset/CorpusSerializer.hpp"

#include <string>

using dataset::Corpus;
using dataset::CorpusSerializer;

namespace
{
const char* kCorpusJson = R"({
  "description": "Примеры библиографических описаний",
  "total_examples": 3,
  "examples": [
    { "type": "book_1_3_authors", "example": "Дробышевский, Н. П. Ревизия и аудит : учеб.-метод. пособие / Н. П. Дробышевский. – Минск : Амалфея, 2013. – 415 с." },
    { "type": "journal_article", "example": "Иванов, И. И. Методика / И. И. Иванов // Нар. асвета. – 2013. – № 5. – С. 88 – 91." },
    { "type": "poster", "example": "Плакат. –Минск, 2010." }
  ],
  "statistics": { "book_1_3_authors": 1, "journal_article": 1, "poster": 1 }
})";
}

TEST_CASE("CorpusSerializer - parse a corpus", "[corpus]") {
    CorpusSerializer serializer;
    Corpus corpus;
    std::string error;

    REQUIRE(serializer.parse(kCorpusJson, corpus, error));
    REQUIRE(error.empty());
    REQUIRE(corpus.description == "Примеры библиографических описаний");
    REQUIRE(corpus.total_examples == 3);
    REQUIRE(corpus.examples.size() == 3);
    REQUIRE(corpus.examples[1].type == "journal_article");
    REQUIRE(corpus.statistics.at("book_1_3_authors") == 1);

    SECTION("unknown type keys are kept and listed") {
        auto unknown = CorpusSerializer::unknownTypes(corpus);
        REQUIRE(unknown.size() == 1);
        REQUIRE(unknown[0] == 2);
    }
}

TEST_CASE("CorpusSerializer - lenient parsing", "[corpus]") {
    CorpusSerializer serializer;
    Corpus corpus;
    std::string error;

    const std::string json = R"({"examples": [{"type": "law"}, {"type": "law", "example": "Закон."}]})";
    REQUIRE(serializer.parse(json, corpus, error));
    REQUIRE(corpus.examples.size() == 1);
    REQUIRE(corpus.total_examples == 1);
    REQUIRE(corpus.description.empty());
}

TEST_CASE("CorpusSerializer - parse failures", "[corpus]") {
    CorpusSerializer serializer;
    Corpus corpus;
    std::string error;

    REQUIRE_FALSE(serializer.parse("{ not json", corpus, error));
    REQUIRE_FALSE(error.empty());

    error.clear();
    REQUIRE_FALSE(serializer.parse("[1, 2]", corpus, error));
    REQUIRE(error == "Corpus root is not a JSON object");

    error.clear();
    REQUIRE_FALSE(serializer.parse(R"({"description": "x"})", corpus, error));
    REQUIRE(error == "Corpus missing 'examples' array");
}

TEST_CASE("CorpusSerializer - serialize keeps key order and text", "[corpus]") {
    CorpusSerializer serializer;
    Corpus corpus;
    corpus.description = "Набор";
    corpus.examples.push_back({ "law", "Закон Респ. Беларусь." });
    CorpusSerializer::refreshStatistics(corpus);

    std::string out = serializer.serialize(corpus);
    REQUIRE(out.find("Закон Респ. Беларусь.") != std::string::npos);
    REQUIRE(out.find("\"description\"") < out.find("\"total_examples\""));
    REQUIRE(out.find("\"total_examples\"") < out.find("\"examples\""));
    REQUIRE(out.find("\"examples\"") < out.find("\"statistics\""));

    Corpus back;
    std::string error;
    REQUIRE(serializer.parse(out, back, error));
    REQUIRE(back.examples.size() == 1);
    REQUIRE(back.examples[0].example == corpus.examples[0].example);
    REQUIRE(back.statistics == corpus.statistics);
}

TEST_CASE("CorpusSerializer - structure validation", "[corpus]") {
    REQUIRE(CorpusSerializer::validateStructure(kCorpusJson).empty());

    auto invalid = CorpusSerializer::validateStructure("{");
    REQUIRE(invalid == std::vector<std::string>{ "Document is not valid JSON" });

    auto missing = CorpusSerializer::validateStructure(R"({"examples": [{"type": "law"}, {}]})");
    REQUIRE(missing == std::vector<std::string>{
                           "Missing required field: description",
                           "Missing required field: total_examples",
                           "Example 0: missing 'example' field",
                           "Example 1: missing 'type' field",
                           "Example 1: missing 'example' field",
                       });
}

TEST_CASE("CorpusSerializer - statistics refresh", "[corpus]") {
    Corpus corpus;
    corpus.examples = { { "law", "a" }, { "law", "b" }, { "patent", "c" } };
    corpus.statistics["stale"] = 7;

    CorpusSerializer::refreshStatistics(corpus);
    REQUIRE(corpus.total_examples == 3);
    REQUIRE(corpus.statistics.size() == 2);
    REQUIRE(corpus.statistics.at("law") == 2);
    REQUIRE(corpus.statistics.at("patent") == 1);
}

TEST_CASE("CorpusSerializer - punctuation audit", "[corpus]") {
    CorpusSerializer serializer;
    Corpus corpus;
    std::string error;
    REQUIRE(serializer.parse(kCorpusJson, corpus, error));

    auto report = serializer.audit(corpus);
    REQUIRE(report.checked == 3);
    REQUIRE_FALSE(report.clean());
    REQUIRE(report.entries.size() == 2);
    REQUIRE(report.entries[0].index == 1);
    REQUIRE(report.entries[1].index == 2);
    REQUIRE(report.per_check.at("page_range_spaces") == 1);
    REQUIRE(report.per_check.at("missing_space_after_dash") == 1);
}
