#pragma once

#include "CitationTypes.hpp"
#include "../config/Settings.hpp"

#include <memory>
#include <string>

namespace processing
{

// canonicalize -> normalize -> classify -> extract -> render -> normalize -> validate
//
// Every stage runs through run_stage: a stage that throws is reported, recorded
// as a StageFailure issue and replaced by a fallback value, so process() never
// throws for bad input. Text longer than PipelineConfig::max_input_chars (for a
// record: all of its strings together) is cut first and reported as
// InputTruncated.
class CitationPipeline
{
public:
    explicit CitationPipeline(const config::PipelineConfig& config);
    explicit CitationPipeline(citation::FormattingStandard standard = citation::FormattingStandard::VakRb);
    ~CitationPipeline();

    CitationPipeline(const CitationPipeline&) = delete;
    CitationPipeline& operator=(const CitationPipeline&) = delete;

    [[nodiscard]] citation::CitationResult process(const citation::Citation& citation) const;
    [[nodiscard]] citation::CitationResult processText(const std::string& text) const;
    [[nodiscard]] citation::CitationResult processRecord(const citation::CitationRecord& record) const;

    [[nodiscard]] citation::FormattingStandard standard() const noexcept;

    static constexpr int kConfidenceFloor = 30;
    static constexpr int kMissingAuthorPenalty = 20;
    static constexpr int kMissingTitlePenalty = 30;
    static constexpr int kMissingYearPenalty = 10;

    [[nodiscard]] static int computeConfidence(citation::CategoryTag tag, const citation::ExtractedFields& fields);

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace processing
