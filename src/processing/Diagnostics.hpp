#pragma once

#include <atomic>
#include <chrono>
#include <cstddef>
#include <map>
#include <mutex>
#include <string>
#include <string_view>

namespace processing
{

// Process-wide state of the pipeline trace log (plog instance kLogInstance).
// Stages write trace lines only while IsVerbose() is set; stage failures are
// always counted and forwarded to utils::ErrorReporter.
class Diagnostics
{
public:
    static constexpr int kLogInstance = 1;

    static void SetVerbose(bool enabled) noexcept;
    [[nodiscard]] static bool IsVerbose() noexcept;

    // Limit is in code points, not bytes
    static void SetMaxPreview(std::size_t chars) noexcept;
    [[nodiscard]] static std::size_t MaxPreview() noexcept;

    // Single-line excerpt of `text` for trace output
    [[nodiscard]] static std::string Preview(std::string_view text);

    static void StageSucceeded(const std::string& stage, std::chrono::microseconds took);
    static void StageFailed(const std::string& stage, const std::string& reason, std::chrono::microseconds took);

    // Failures per stage name since the last ResetCounters()
    [[nodiscard]] static std::map<std::string, std::size_t> StageFailures();
    static void ResetCounters();

private:
    static std::atomic<bool> verbose_;
    static std::atomic<std::size_t> max_preview_;
    static std::mutex failures_mutex_;
    static std::map<std::string, std::size_t> failures_;
};

} // namespace processing
