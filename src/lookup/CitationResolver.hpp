#pragma once

#include "../processing/CitationTypes.hpp"

#include <optional>
#include <string>
#include <vector>

namespace processing
{
class CitationPipeline;
}

namespace lookup
{

class ICitationParser;
class IMetadataLookup;

// Routes input through the optional external collaborators before the
// deterministic pipeline. Collaborators are not owned and may be null.
class CitationResolver
{
public:
    explicit CitationResolver(const processing::CitationPipeline& pipeline, IMetadataLookup* metadata = nullptr,
                              ICitationParser* parser = nullptr);

    // DOI / ISBN -> record -> pipeline; nullopt when the identifier is unknown or the lookup fails
    [[nodiscard]] std::optional<citation::CitationResult> resolveIdentifier(const std::string& identifier);

    // Free text through the parser, one result per returned record. Without a
    // parser, or when it fails or returns nothing, the text itself is processed.
    [[nodiscard]] std::vector<citation::CitationResult> resolveText(const std::string& text);

    [[nodiscard]] const std::string& lastError() const noexcept { return last_error_; }

private:
    const processing::CitationPipeline& pipeline_;
    IMetadataLookup* metadata_;
    ICitationParser* parser_;
    std::string last_error_;
};

} // namespace lookup
