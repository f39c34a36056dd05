#pragma once

#include "lookup/ICitationParser.hpp"
#include "lookup/IMetadataLookup.hpp"

#include <string>
#include <unordered_map>
#include <vector>

namespace test_utils {

// In-memory metadata service keyed by cleaned identifier
class MockMetadataLookup : public lookup::IMetadataLookup {
public:
    void addDoi(const std::string& doi, const citation::CitationRecord& record);
    void addIsbn(const std::string& isbn, const citation::CitationRecord& record);

    // Every lookup fails with this message
    void simulateNetworkError(const std::string& error_msg);

    bool lookupDoi(const std::string& doi, citation::CitationRecord& out) override;
    bool lookupIsbn(const std::string& isbn, citation::CitationRecord& out) override;
    const char* source() const override { return "mock"; }
    const char* lastError() const override { return last_error_.c_str(); }

    int callCount() const { return calls_; }

private:
    bool find(const std::unordered_map<std::string, citation::CitationRecord>& table, const std::string& key,
              citation::CitationRecord& out);

    std::unordered_map<std::string, citation::CitationRecord> doi_records_;
    std::unordered_map<std::string, citation::CitationRecord> isbn_records_;
    bool simulate_error_ = false;
    std::string error_message_;
    std::string last_error_;
    int calls_ = 0;
};

// Parser that returns a fixed list of records, or fails
class MockCitationParser : public lookup::ICitationParser {
public:
    void setRecords(std::vector<citation::CitationRecord> records);
    void simulateFailure(const std::string& error_msg);

    bool parse(const std::string& text, std::vector<citation::CitationRecord>& out) override;
    const char* lastError() const override { return last_error_.c_str(); }

private:
    std::vector<citation::CitationRecord> records_;
    bool fail_ = false;
    std::string error_message_;
    std::string last_error_;
};

// Common records for testing
class MockRecords {
public:
    static citation::CitationRecord journalArticle();
    static citation::CitationRecord book();
};

}  // namespace test_utils
