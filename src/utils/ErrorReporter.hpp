#pragma once

#include <array>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <vector>

namespace utils {

enum class ErrorCategory
{
    Initialization, // logger setup, log directory
    Configuration,  // TOML parsing, invalid config values
    Pipeline,       // a citation stage threw and fell back
    Dataset,        // corpus JSON shape or content
    Lookup,         // metadata / generative-model collaborators
    Unknown
};

enum class ErrorSeverity
{
    Info,
    Warning, // degraded result, processing continues
    Error,   // the operation failed, the caller can continue
    Fatal
};

struct ErrorReport
{
    ErrorCategory category = ErrorCategory::Unknown;
    ErrorSeverity severity = ErrorSeverity::Info;
    std::string user_message;
    std::string technical_details;
    std::string timestamp;

    // "[Lookup] Metadata lookup failed | DOI not found"
    [[nodiscard]] std::string describe() const;
};

/**
 * @brief Process-wide sink for recovered faults
 *
 * Stage fallbacks, rejected config values, malformed corpus entries and
 * collaborator failures all land here. Each report goes to the default plog
 * instance immediately and is queued for the embedding application, which
 * drains the queue with GetPendingErrors(). Counters per category survive
 * draining and are only reset by ClearErrors().
 *
 *   ErrorReporter::ReportWarning(ErrorCategory::Pipeline, "Citation stage failed", "extract: regex_error");
 */
class ErrorReporter
{
public:
    static void Report(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                       const std::string& technical_details = "");

    static void ReportError(ErrorCategory category, const std::string& user_message,
                            const std::string& technical_details = "")
    {
        Report(category, ErrorSeverity::Error, user_message, technical_details);
    }

    static void ReportWarning(ErrorCategory category, const std::string& user_message,
                              const std::string& technical_details = "")
    {
        Report(category, ErrorSeverity::Warning, user_message, technical_details);
    }

    static bool HasPendingErrors();

    // Moves the queued reports out, oldest first
    static std::vector<ErrorReport> GetPendingErrors();

    // Newest queued report, or a default one when the queue is empty
    static ErrorReport GetLastError();

    // Reports seen for a category since the last ClearErrors()
    static std::size_t CountFor(ErrorCategory category);

    static void ClearErrors();

    static const char* CategoryName(ErrorCategory category);
    static const char* SeverityName(ErrorSeverity severity);

private:
    static constexpr std::size_t kQueueLimit = 100;
    static constexpr std::size_t kCategoryCount = static_cast<std::size_t>(ErrorCategory::Unknown) + 1;

    static std::mutex s_mutex;
    static std::deque<ErrorReport> s_queue;
    static std::array<std::size_t, kCategoryCount> s_counts;
};

} // namespace utils
