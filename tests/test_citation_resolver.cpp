#include <catch2/catch_test_macros.hpp>

#include "lookup/CitationResolver.hpp"
#include "lookup/IdentifierDetector.hpp"
#include "lookup/mock_lookup.hpp"
#include "processing/CitationPipeline.hpp"
#include "utils/ErrorReporter.hpp"

#include <string>

using lookup::CitationResolver;
using lookup::IdentifierKind;
using test_utils::MockCitationParser;
using test_utils::MockMetadataLookup;
using test_utils::MockRecords;

TEST_CASE("IdentifierDetector - DOI forms", "[lookup]") {
    auto plain = lookup::detectIdentifier("10.1000/xyz123");
    REQUIRE(plain.kind == IdentifierKind::Doi);
    REQUIRE(plain.value == "10.1000/xyz123");

    REQUIRE(lookup::detectIdentifier("https://doi.org/10.1000/xyz123").value == "10.1000/xyz123");
    REQUIRE(lookup::detectIdentifier("doi: 10.1000/xyz123").value == "10.1000/xyz123");
    REQUIRE(lookup::detectIdentifier("DOI:10.1000/xyz123").kind == IdentifierKind::Doi);
    REQUIRE(lookup::detectIdentifier("10.12/short").kind == IdentifierKind::Unknown);
}

TEST_CASE("IdentifierDetector - ISBN forms", "[lookup]") {
    auto isbn13 = lookup::detectIdentifier("ISBN 978-3-16-148410-0");
    REQUIRE(isbn13.kind == IdentifierKind::Isbn);
    REQUIRE(isbn13.value == "9783161484100");

    auto isbn10 = lookup::detectIdentifier("0-306-40615-x");
    REQUIRE(isbn10.kind == IdentifierKind::Isbn);
    REQUIRE(isbn10.value == "030640615X");

    REQUIRE(lookup::detectIdentifier("12345").kind == IdentifierKind::Unknown);
    REQUIRE(lookup::detectIdentifier("X-306-40615-2").kind == IdentifierKind::Unknown);
    REQUIRE(lookup::toString(IdentifierKind::Isbn) == "isbn");
}

TEST_CASE("CitationResolver - DOI through metadata lookup", "[lookup]") {
    processing::CitationPipeline pipeline;
    MockMetadataLookup metadata;
    metadata.addDoi("10.1000/xyz123", MockRecords::journalArticle());
    CitationResolver resolver(pipeline, &metadata);

    auto result = resolver.resolveIdentifier("https://doi.org/10.1000/xyz123");
    REQUIRE(result.has_value());
    REQUIRE(result->tag == citation::CategoryTag::JournalArticle);
    REQUIRE(result->fields.value(citation::FieldName::Doi) == std::string("10.1000/xyz123"));
    REQUIRE(result->formatted ==
            "Smith, J. Title / J. Smith // Journal. – 2019. – Т. 12, № 3. – С. 5–10. – DOI: 10.1000/xyz123.");
    REQUIRE(resolver.lastError().empty());
}

TEST_CASE("CitationResolver - ISBN through metadata lookup", "[lookup]") {
    processing::CitationPipeline pipeline;
    MockMetadataLookup metadata;
    metadata.addIsbn("9783161484100", MockRecords::book());
    CitationResolver resolver(pipeline, &metadata);

    auto result = resolver.resolveIdentifier("978-3-16-148410-0");
    REQUIRE(result.has_value());
    REQUIRE(result->tag == citation::CategoryTag::BookFewAuthors);
    REQUIRE(result->fields.value(citation::FieldName::Isbn) == std::string("9783161484100"));
    REQUIRE(result->formatted.find("ISBN 9783161484100") != std::string::npos);
}

TEST_CASE("CitationResolver - identifier failures", "[lookup]") {
    utils::ErrorReporter::ClearErrors();
    processing::CitationPipeline pipeline;

    SECTION("unrecognized identifier") {
        MockMetadataLookup metadata;
        CitationResolver resolver(pipeline, &metadata);
        REQUIRE_FALSE(resolver.resolveIdentifier("not an id").has_value());
        REQUIRE(resolver.lastError() == "Unrecognized identifier: not an id");
        REQUIRE(metadata.callCount() == 0);
    }

    SECTION("no lookup configured") {
        CitationResolver resolver(pipeline);
        REQUIRE_FALSE(resolver.resolveIdentifier("10.1000/xyz123").has_value());
        REQUIRE(resolver.lastError() == "No metadata lookup configured");
    }

    SECTION("lookup error is reported") {
        MockMetadataLookup metadata;
        metadata.simulateNetworkError("timeout");
        CitationResolver resolver(pipeline, &metadata);
        REQUIRE_FALSE(resolver.resolveIdentifier("10.1000/xyz123").has_value());
        REQUIRE(resolver.lastError() == "mock: timeout");
        REQUIRE(utils::ErrorReporter::HasPendingErrors());
        REQUIRE(utils::ErrorReporter::GetLastError().category == utils::ErrorCategory::Lookup);
        REQUIRE(utils::ErrorReporter::CountFor(utils::ErrorCategory::Lookup) == 1);

        auto drained = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(drained.size() == 1);
        REQUIRE(drained.front().describe() == "[Lookup] Metadata lookup failed | mock: timeout");
        REQUIRE_FALSE(utils::ErrorReporter::HasPendingErrors());
        REQUIRE(utils::ErrorReporter::CountFor(utils::ErrorCategory::Lookup) == 1);
    }

    utils::ErrorReporter::ClearErrors();
}

TEST_CASE("CitationResolver - parser records go through the pipeline", "[lookup]") {
    processing::CitationPipeline pipeline;
    MockCitationParser parser;
    parser.setRecords({ MockRecords::book(), MockRecords::journalArticle() });
    CitationResolver resolver(pipeline, nullptr, &parser);

    auto results = resolver.resolveText("две ссылки одной строкой");
    REQUIRE(results.size() == 2);
    REQUIRE(results[0].formatted == "Иванов, И. И. Книга / И. И. Иванов. – Минск : БГУ, 2020. – 150 с.");
    REQUIRE(results[1].tag == citation::CategoryTag::JournalArticle);
}

TEST_CASE("CitationResolver - text falls back to the rule pipeline", "[lookup]") {
    utils::ErrorReporter::ClearErrors();
    processing::CitationPipeline pipeline;
    const std::string text = "Иванов, И. И. Методика обучения / И. И. Иванов // Нар. асвета. – 2013. – № 5. – С. 88–91.";

    SECTION("no parser") {
        CitationResolver resolver(pipeline);
        auto results = resolver.resolveText(text);
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].formatted == text);
    }

    SECTION("parser failure") {
        MockCitationParser parser;
        parser.simulateFailure("model unavailable");
        CitationResolver resolver(pipeline, nullptr, &parser);
        auto results = resolver.resolveText(text);
        REQUIRE(results.size() == 1);
        REQUIRE(results[0].tag == citation::CategoryTag::JournalArticle);
        REQUIRE(resolver.lastError() == "model unavailable");
    }

    SECTION("parser returns nothing") {
        MockCitationParser parser;
        CitationResolver resolver(pipeline, nullptr, &parser);
        auto results = resolver.resolveText(text);
        REQUIRE(results.size() == 1);
        REQUIRE(resolver.lastError() == "parser returned no records");
    }

    utils::ErrorReporter::ClearErrors();
}
