#include "ErrorReporter.hpp"

#include <plog/Log.h>

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iterator>
#include <sstream>

namespace utils
{

std::mutex ErrorReporter::s_mutex;
std::deque<ErrorReport> ErrorReporter::s_queue;
std::array<std::size_t, ErrorReporter::kCategoryCount> ErrorReporter::s_counts{};

namespace
{

std::string nowStamp()
{
    const auto now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
    std::tm tm_buf{};
#ifdef _WIN32
    localtime_s(&tm_buf, &now);
#else
    localtime_r(&now, &tm_buf);
#endif
    std::ostringstream os;
    os << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S");
    return os.str();
}

plog::Severity toPlog(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return plog::info;
    case ErrorSeverity::Warning:
        return plog::warning;
    case ErrorSeverity::Error:
        return plog::error;
    case ErrorSeverity::Fatal:
        return plog::fatal;
    }
    return plog::error;
}

} // namespace

std::string ErrorReport::describe() const
{
    std::string out = "[";
    out += ErrorReporter::CategoryName(category);
    out += "] ";
    out += user_message;
    if (!technical_details.empty())
    {
        out += " | ";
        out += technical_details;
    }
    return out;
}

void ErrorReporter::Report(ErrorCategory category, ErrorSeverity severity, const std::string& user_message,
                           const std::string& technical_details)
{
    ErrorReport report;
    report.category = category;
    report.severity = severity;
    report.user_message = user_message;
    report.technical_details = technical_details;
    report.timestamp = nowStamp();

    PLOG(toPlog(severity)) << report.describe();

    std::lock_guard<std::mutex> lock(s_mutex);
    ++s_counts[static_cast<std::size_t>(category)];
    s_queue.push_back(std::move(report));
    // A batch can fail many items in a row; only the newest reports are kept
    while (s_queue.size() > kQueueLimit)
        s_queue.pop_front();
}

bool ErrorReporter::HasPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return !s_queue.empty();
}

std::vector<ErrorReport> ErrorReporter::GetPendingErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    std::vector<ErrorReport> out(std::make_move_iterator(s_queue.begin()), std::make_move_iterator(s_queue.end()));
    s_queue.clear();
    return out;
}

ErrorReport ErrorReporter::GetLastError()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_queue.empty() ? ErrorReport{} : s_queue.back();
}

std::size_t ErrorReporter::CountFor(ErrorCategory category)
{
    std::lock_guard<std::mutex> lock(s_mutex);
    return s_counts[static_cast<std::size_t>(category)];
}

void ErrorReporter::ClearErrors()
{
    std::lock_guard<std::mutex> lock(s_mutex);
    s_queue.clear();
    s_counts.fill(0);
}

const char* ErrorReporter::CategoryName(ErrorCategory category)
{
    switch (category)
    {
    case ErrorCategory::Initialization:
        return "Initialization";
    case ErrorCategory::Configuration:
        return "Configuration";
    case ErrorCategory::Pipeline:
        return "Pipeline";
    case ErrorCategory::Dataset:
        return "Dataset";
    case ErrorCategory::Lookup:
        return "Lookup";
    case ErrorCategory::Unknown:
        break;
    }
    return "Unknown";
}

const char* ErrorReporter::SeverityName(ErrorSeverity severity)
{
    switch (severity)
    {
    case ErrorSeverity::Info:
        return "Info";
    case ErrorSeverity::Warning:
        return "Warning";
    case ErrorSeverity::Error:
        return "Error";
    case ErrorSeverity::Fatal:
        return "Fatal";
    }
    return "Unknown";
}

} // namespace utils
