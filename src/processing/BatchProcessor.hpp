#pragma once

#include "CitationTypes.hpp"

#include <atomic>
#include <cstddef>
#include <map>
#include <optional>
#include <vector>

namespace processing
{

class CitationPipeline;

struct BatchStatistics
{
    std::size_t processed = 0;
    std::size_t unprocessed = 0; // left behind by cancel() or failed with an exception
    std::map<citation::CategoryTag, std::size_t> per_tag;
    std::map<citation::IssueKind, std::size_t> per_issue;
    double mean_confidence = 0.0;
};

struct BatchResult
{
    // Same order as the input; nullopt for items skipped by cancellation or that threw
    std::vector<std::optional<citation::CitationResult>> results;
    BatchStatistics statistics;
};

// Runs one pipeline over a collection on a fixed pool of std::threads.
// Workers claim indices from an atomic cursor and write into pre-sized slots,
// so output order always matches input order.
class BatchProcessor
{
public:
    // threads == 0 uses std::thread::hardware_concurrency()
    explicit BatchProcessor(const CitationPipeline& pipeline, std::size_t threads = 0);

    [[nodiscard]] BatchResult processAll(const std::vector<citation::Citation>& citations);

    // Safe from any thread; items not yet claimed stay unprocessed
    void cancel() noexcept;
    [[nodiscard]] bool isCancelled() const noexcept;

    [[nodiscard]] std::size_t threadCount() const noexcept { return threads_; }

    [[nodiscard]] static BatchStatistics summarize(const std::vector<std::optional<citation::CitationResult>>& results);

private:
    const CitationPipeline& pipeline_;
    std::size_t threads_;
    std::atomic<bool> cancelled_{ false };
};

} // namespace processing
