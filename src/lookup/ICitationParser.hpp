#pragma once

#include "../processing/CitationTypes.hpp"

#include <string>
#include <vector>

namespace lookup
{

// Generative-model parser: splits free text into structured records.
// Its output is never trusted as final and always goes through the pipeline.
class ICitationParser
{
public:
    virtual ~ICitationParser() = default;
    virtual bool parse(const std::string& text, std::vector<citation::CitationRecord>& out) = 0;
    virtual const char* lastError() const = 0;
};

} // namespace lookup
