#pragma once

#include "../processing/CitationTypes.hpp"

#include <string>

namespace lookup
{

// Bibliographic metadata service reachable by identifier (CrossRef for DOI,
// Open Library for ISBN in the reference deployment). Implementations live
// outside this library; a record they return is processed like any input.
class IMetadataLookup
{
public:
    virtual ~IMetadataLookup() = default;
    virtual bool lookupDoi(const std::string& doi, citation::CitationRecord& out) = 0;
    virtual bool lookupIsbn(const std::string& isbn, citation::CitationRecord& out) = 0;
    virtual const char* source() const = 0;
    virtual const char* lastError() const = 0;
};

} // namespace lookup
