#include <catch2/catch_test_macros.hpp>

#include "config/Settings.hpp"
#include "processing/CitationPipeline.hpp"
#include "processing/WideText.hpp"

#include <string>
#include <vector>

using citation::CategoryTag;
using citation::FieldName;
using citation::IssueKind;
using processing::CitationPipeline;

namespace
{
const std::string kBook = "Дробышевский, Н. П. Ревизия и аудит : учеб.-метод. пособие / Н. П. Дробышевский. – "
                          "Минск : Амалфея, 2013. – 415 с.";
const std::string kArticle = "Иванов, И. И. Методика обучения / И. И. Иванов // Нар. асвета. – 2013. – № 5. – С. 88–91.";
const std::string kDissertation = "Петров, П. П. Гісторыя адукацыі : дыс. ... канд. гіст. навук : 07.00.09 / П. П. Петров. – "
                                  "Мінск, 2013. – 150 л.";
const std::string kPortal = "Национальный правовой Интернет-портал Республики Беларусь [Электронный ресурс]. – "
                            "Режим доступа: http://www.pravo.by. – Дата доступа: 24.06.2024.";
const std::string kUnknown = "Что-то совсем непонятное без всяких признаков";
}

TEST_CASE("CitationPipeline - book with one author", "[pipeline]") {
    CitationPipeline pipeline;
    auto result = pipeline.processText(kBook);

    REQUIRE(result.tag == CategoryTag::BookFewAuthors);
    REQUIRE(result.fields.value(FieldName::Year) == std::string("2013"));
    REQUIRE(result.fields.value(FieldName::City) == std::string("Минск"));
    REQUIRE(result.fields.value(FieldName::Publisher) == std::string("Амалфея"));
    REQUIRE(result.fields.value(FieldName::Pages) == std::string("415"));
    REQUIRE(result.formatted == kBook);
    REQUIRE(result.confidence == 100);
    REQUIRE(result.issues.empty());
}

TEST_CASE("CitationPipeline - journal article", "[pipeline]") {
    CitationPipeline pipeline;
    auto result = pipeline.processText(kArticle);

    REQUIRE(result.tag == CategoryTag::JournalArticle);
    REQUIRE(result.fields.value(FieldName::Issue) == std::string("5"));
    REQUIRE(result.fields.value(FieldName::Pages) == std::string("88–91"));
    REQUIRE(result.formatted == kArticle);
}

TEST_CASE("CitationPipeline - dissertation keeps its ellipsis", "[pipeline]") {
    CitationPipeline pipeline;
    auto result = pipeline.processText(kDissertation);

    REQUIRE(result.tag == CategoryTag::Dissertation);
    REQUIRE(result.formatted.find("дыс. ... канд.") != std::string::npos);
    REQUIRE(result.formatted == kDissertation);
}

TEST_CASE("CitationPipeline - electronic resource", "[pipeline]") {
    SECTION("VAK RB access area") {
        CitationPipeline pipeline;
        auto result = pipeline.processText(kPortal);

        REQUIRE(result.tag == CategoryTag::ElectronicResource);
        REQUIRE(result.fields.value(FieldName::Url) == std::string("http://www.pravo.by"));
        REQUIRE(result.fields.value(FieldName::AccessDate) == std::string("24.06.2024"));
        REQUIRE_FALSE(result.fields.found(FieldName::Year));
        REQUIRE(result.formatted == kPortal);
        REQUIRE(result.confidence == 70);
        REQUIRE(result.hasIssue(IssueKind::FieldNotFound));
        REQUIRE_FALSE(result.hasIssue(IssueKind::PunctuationViolation));
    }

    SECTION("GOST 2018 access area") {
        CitationPipeline pipeline(citation::FormattingStandard::Gost2018);
        REQUIRE(pipeline.standard() == citation::FormattingStandard::Gost2018);
        auto result = pipeline.processText(kPortal);
        REQUIRE(result.formatted ==
                "Национальный правовой Интернет-портал Республики Беларусь [Электронный ресурс]. – "
                "URL: http://www.pravo.by (дата обращения: 24.06.2024).");
    }
}

TEST_CASE("CitationPipeline - unrecognized text", "[pipeline]") {
    CitationPipeline pipeline;
    auto result = pipeline.processText(kUnknown);

    REQUIRE(result.tag == CategoryTag::Unknown);
    REQUIRE(result.confidence == CitationPipeline::kConfidenceFloor);
    REQUIRE(result.hasIssue(IssueKind::UnrecognizedType));
    REQUIRE(result.formatted == kUnknown);
}

TEST_CASE("CitationPipeline - messy input is cleaned", "[pipeline]") {
    CitationPipeline pipeline;
    auto result = pipeline.processText("Иванов, И.И. Методика обучения / И.И.Иванов // Нар. асвета. — 2013. — №5. — "
                                       "С. 88 - 91.");
    REQUIRE(result.tag == CategoryTag::JournalArticle);
    REQUIRE(result.formatted == kArticle);
}

TEST_CASE("CitationPipeline - processing is deterministic", "[pipeline]") {
    CitationPipeline pipeline;
    auto first = pipeline.processText(kArticle);
    auto second = pipeline.processText(kArticle);
    REQUIRE(first.formatted == second.formatted);
    REQUIRE(first.tag == second.tag);
    REQUIRE(first.confidence == second.confidence);

    SECTION("output is a fixpoint") {
        auto again = pipeline.processText(first.formatted);
        REQUIRE(again.formatted == first.formatted);
    }
}

TEST_CASE("CitationPipeline - structured records", "[pipeline]") {
    CitationPipeline pipeline;

    SECTION("book record") {
        citation::CitationRecord record;
        record.authors = { "Иванов, И. И." };
        record.title = "Книга";
        record.city = "Минск";
        record.publisher = "БГУ";
        record.year = "2020";
        record.pages = "150";

        auto result = pipeline.process(record);
        REQUIRE(result.tag == CategoryTag::BookFewAuthors);
        REQUIRE(result.formatted == "Иванов, И. И. Книга / И. И. Иванов. – Минск : БГУ, 2020. – 150 с.");
        REQUIRE(result.confidence == 100);
    }

    SECTION("journal record with four authors") {
        citation::CitationRecord record;
        record.authors = { "Иванов, И. И.", "Петров, П. П.", "Сидоров, С. С.", "Кузнецов, К. К." };
        record.title = "Статья";
        record.journal = "Журнал";
        record.year = "2021";
        record.volume = "5";
        record.issue = "2";
        record.pages = "10-20";

        auto result = pipeline.processRecord(record);
        REQUIRE(result.tag == CategoryTag::JournalArticle);
        REQUIRE_FALSE(result.fields.heading);
        REQUIRE(result.formatted == "Статья / И. И. Иванов [и др.] // Журнал. – 2021. – Т. 5, № 2. – С. 10–20.");
    }

    SECTION("record without a title reports the gap") {
        citation::CitationRecord record;
        record.authors = { "Иванов, И. И." };
        record.year = "2020";

        auto result = pipeline.processRecord(record);
        REQUIRE(result.hasIssue(IssueKind::MissingRequiredField));
        REQUIRE(result.formatted.find("[?title]") != std::string::npos);
        REQUIRE(result.confidence == 70);
    }
}

TEST_CASE("CitationPipeline - confidence scoring", "[pipeline]") {
    citation::ExtractedFields empty;
    REQUIRE(CitationPipeline::computeConfidence(CategoryTag::BookFewAuthors, empty) == 40);
    REQUIRE(CitationPipeline::computeConfidence(CategoryTag::Unknown, empty) == 30);

    citation::ExtractedFields full;
    full.authors = { "Иванов, И. И." };
    full.set(FieldName::Title, "Книга");
    full.set(FieldName::Year, "2020");
    REQUIRE(CitationPipeline::computeConfidence(CategoryTag::BookFewAuthors, full) == 100);
    REQUIRE(CitationPipeline::computeConfidence(CategoryTag::Unknown, full) == 30);
}

TEST_CASE("CitationPipeline - validation can be switched off", "[pipeline]") {
    const std::string text = "Книга :«Нечто»";

    CitationPipeline checked;
    REQUIRE(checked.processText(text).hasIssue(IssueKind::PunctuationViolation));

    config::PipelineConfig cfg;
    cfg.validate_output = false;
    CitationPipeline unchecked(cfg);
    REQUIRE_FALSE(unchecked.processText(text).hasIssue(IssueKind::PunctuationViolation));
}

TEST_CASE("CitationPipeline - ambiguous ranges are reported once", "[pipeline]") {
    CitationPipeline pipeline;
    auto result = pipeline.processText("ТКП 7696-2024 Что-то");
    REQUIRE(result.formatted.find("7696-2024") != std::string::npos);
    std::size_t count = 0;
    for (const auto& issue : result.issues)
        count += issue.kind == IssueKind::AmbiguousRange ? 1 : 0;
    REQUIRE(count == 1);
}

TEST_CASE("CitationPipeline - found fields reach the output", "[pipeline]") {
    const std::vector<std::string> inputs = {
        kBook,
        kArticle,
        kDissertation,
        kPortal,
        "Иванов, И. И. Тема : автореф. дис. ... канд. техн. наук : 05.13.01 / И. И. Иванов. – Минск, 2010. – 20 с.",
        "Петров, П. П. Тезисы / П. П. Петров // Материалы конф. – Минск, 2015. – С. 1–2.",
        "Берникович, Д. Агрогородок / Д. Берникович // Сельская газета. – 2023. – 3 окт. – С. 1.",
        "Методика / А. А. Иванов [и др.]. – Минск : БГУ, 2019. – 100 с.",
        "ГОСТ 7.1-2003. Библиографическая запись. – Введ. 2004-07-01.",
        "Способ очистки : пат. BY 12345 / И. И. Иванов. – Опубл. 30.12.2010.",
        "Песни [Звукозапись]. – Минск, 2010.",
        "Беларусь [Карты]. – Минск, 2012.",
    };

    CitationPipeline pipeline;
    for (const auto& input : inputs) {
        INFO(input);
        auto result = pipeline.processText(input);
        REQUIRE_FALSE(result.formatted.empty());

        for (const auto& [field, fv] : result.fields.values) {
            if (field == FieldName::Authors || !fv.found || fv.embedded)
                continue;
            INFO(citation::toString(field));
            CHECK(result.formatted.find(fv.value) != std::string::npos);
        }
        if (result.fields.heading && !result.fields.authors.empty()) {
            const std::string& first = result.fields.authors.front();
            CHECK(result.formatted.find(first.substr(0, first.find(','))) != std::string::npos);
        }
    }
}

TEST_CASE("CitationPipeline - oversized input is cut before matching", "[pipeline]") {
    std::string text = "Иванов, И. И. Материалы ";
    for (int i = 0; i < 5000; ++i)
        text += "слово ";
    text += "конф. – Минск : Изд, 2020. – 10 с.";

    SECTION("default limit") {
        CitationPipeline pipeline;
        auto result = pipeline.processText(text);
        REQUIRE(result.hasIssue(IssueKind::InputTruncated));
        REQUIRE_FALSE(result.formatted.empty());
        REQUIRE(result.formatted.size() < text.size());
        REQUIRE(result.formatted.rfind("Иванов, И. И.", 0) == 0);
    }

    SECTION("configured limit") {
        config::PipelineConfig cfg;
        cfg.max_input_chars = 100;
        CitationPipeline pipeline(cfg);
        auto result = pipeline.processText(text);

        const std::string expected =
            "input cut from " + std::to_string(processing::codepointLength(text)) + " to 100 characters";
        bool reported = false;
        for (const auto& issue : result.issues)
            reported = reported || (issue.kind == IssueKind::InputTruncated && issue.message == expected);
        REQUIRE(reported);
    }

    SECTION("short input is untouched") {
        CitationPipeline pipeline;
        REQUIRE_FALSE(pipeline.processText(kBook).hasIssue(IssueKind::InputTruncated));
    }

    SECTION("records share one budget") {
        citation::CitationRecord record;
        record.authors = { "Иванов, И. И." };
        record.title = std::string(3000, 'x');
        record.year = "2020";

        CitationPipeline pipeline;
        auto result = pipeline.processRecord(record);
        REQUIRE(result.hasIssue(IssueKind::InputTruncated));
        REQUIRE_FALSE(result.fields.found(FieldName::Year));
        REQUIRE(result.fields.found(FieldName::Title));
        REQUIRE(result.fields.value(FieldName::Title)->size() < 3000);
    }
}

TEST_CASE("CitationPipeline - record authors without a comma", "[pipeline]") {
    citation::CitationRecord record;
    record.title = "Книга";
    record.city = "Минск";
    record.publisher = "БГУ";
    record.year = "2020";
    record.pages = "150";

    CitationPipeline pipeline;
    record.authors = { "Иванов И. И." };
    auto bare = pipeline.processRecord(record);
    REQUIRE(bare.fields.authors == std::vector<std::string>{ "Иванов, И. И." });
    REQUIRE(bare.formatted == "Иванов, И. И. Книга / И. И. Иванов. – Минск : БГУ, 2020. – 150 с.");

    record.authors = { "И. И. Иванов" };
    REQUIRE(pipeline.processRecord(record).formatted == bare.formatted);

    SECTION("organisations are kept as given") {
        record.authors = { "Белорусский государственный университет" };
        auto org = pipeline.processRecord(record);
        REQUIRE(org.fields.authors == std::vector<std::string>{ "Белорусский государственный университет" });
    }
}
