#include "BatchProcessor.hpp"
#include "CitationPipeline.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/Profile.hpp"

#include <algorithm>
#include <plog/Log.h>
#include <system_error>
#include <thread>

namespace processing
{

namespace
{

// Joins every started worker, also when spawning the next one throws
class WorkerGroup
{
public:
    ~WorkerGroup() { joinAll(); }

    void joinAll()
    {
        for (auto& t : threads_)
        {
            if (t.joinable())
                t.join();
        }
    }

    template<typename Fn>
    bool spawn(Fn& fn)
    {
        try
        {
            threads_.emplace_back(fn);
            return true;
        }
        catch (const std::system_error& e)
        {
            PLOG_WARNING << "Could not start batch worker " << threads_.size() << ": " << e.what();
            return false;
        }
    }

    [[nodiscard]] std::size_t size() const noexcept { return threads_.size(); }

private:
    std::vector<std::thread> threads_;
};

} // anonymous namespace

BatchProcessor::BatchProcessor(const CitationPipeline& pipeline, std::size_t threads)
    : pipeline_(pipeline)
    , threads_(threads != 0 ? threads : std::max(1u, std::thread::hardware_concurrency()))
{
}

void BatchProcessor::cancel() noexcept
{
    cancelled_.store(true, std::memory_order_release);
}

bool BatchProcessor::isCancelled() const noexcept
{
    return cancelled_.load(std::memory_order_acquire);
}

BatchResult BatchProcessor::processAll(const std::vector<citation::Citation>& citations)
{
    PROFILE_SCOPE_CUSTOM("BatchProcessor::processAll");

    BatchResult batch;
    batch.results.resize(citations.size());
    if (citations.empty())
        return batch;

    std::atomic<std::size_t> cursor{ 0 };
    auto worker = [&]()
    {
        while (!isCancelled())
        {
            std::size_t index = cursor.fetch_add(1, std::memory_order_relaxed);
            if (index >= citations.size())
                break;
            try
            {
                batch.results[index] = pipeline_.process(citations[index]);
            }
            catch (const std::exception& e)
            {
                // the slot stays empty and is counted as unprocessed
                utils::ErrorReporter::ReportError(utils::ErrorCategory::Pipeline, "Citation could not be processed",
                                                  "item " + std::to_string(index) + ": " + e.what());
            }
        }
    };

    std::size_t pool = std::min(threads_, citations.size());
    {
        WorkerGroup workers;
        while (workers.size() < pool && workers.spawn(worker))
        {
        }
        // No thread could be started: the calling thread does the work
        if (workers.size() == 0)
            worker();
        pool = std::max<std::size_t>(workers.size(), 1);
    }

    batch.statistics = summarize(batch.results);
    PLOG_INFO << "Batch finished: processed=" << batch.statistics.processed
              << " unprocessed=" << batch.statistics.unprocessed << " threads=" << pool
              << (isCancelled() ? " (cancelled)" : "");
    return batch;
}

BatchStatistics BatchProcessor::summarize(const std::vector<std::optional<citation::CitationResult>>& results)
{
    BatchStatistics stats;
    long long confidence_sum = 0;

    for (const auto& slot : results)
    {
        if (!slot)
        {
            ++stats.unprocessed;
            continue;
        }
        ++stats.processed;
        ++stats.per_tag[slot->tag];
        for (const auto& issue : slot->issues)
            ++stats.per_issue[issue.kind];
        confidence_sum += slot->confidence;
    }

    if (stats.processed > 0)
        stats.mean_confidence = static_cast<double>(confidence_sum) / static_cast<double>(stats.processed);
    return stats;
}

} // namespace processing
