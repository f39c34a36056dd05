#include "LogManager.hpp"
#include "ErrorReporter.hpp"
#include "Profile.hpp"
#include "../config/Settings.hpp"
#include "../processing/Diagnostics.hpp"

#include <filesystem>
#include <fstream>
#include <iomanip>

#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>
#include <plog/Init.h>
#include <plog/Log.h>

namespace utils
{

namespace
{

constexpr std::size_t kMaxFileSize = 10 * 1024 * 1024;
constexpr int kBackupCount = 3;

// "14:02:31.057 DEBUG [tid] message": the trace log is read next to the
// application log, so it drops the date and source location
class TraceFormatter
{
public:
    static plog::util::nstring header() { return plog::util::nstring(); }

    static plog::util::nstring format(const plog::Record& record)
    {
        tm t;
        plog::util::localtime_s(&t, &record.getTime().time);

        plog::util::nostringstream ss;
        ss << std::setfill(PLOG_NSTR('0')) << std::setw(2) << t.tm_hour << PLOG_NSTR(":") << std::setw(2)
           << t.tm_min << PLOG_NSTR(":") << std::setw(2) << t.tm_sec << PLOG_NSTR(".") << std::setw(3)
           << static_cast<int>(record.getTime().millitm) << PLOG_NSTR(" ");
        ss << std::setfill(PLOG_NSTR(' ')) << std::setw(5) << std::left
           << plog::severityToString(record.getSeverity()) << PLOG_NSTR(" ");
        ss << PLOG_NSTR("[") << record.getTid() << PLOG_NSTR("] ") << record.getMessage() << PLOG_NSTR("\n");
        return ss.str();
    }
};

} // namespace

bool LogManager::s_initialized = false;
plog::Severity LogManager::s_default_level = plog::info;
std::string LogManager::s_log_directory;
std::map<int, std::string> LogManager::s_files;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

bool LogManager::Initialize(const config::LoggingConfig& config)
{
    if (s_initialized)
        return true;

    if (config.level >= 0 && config.level <= 6)
        s_default_level = static_cast<plog::Severity>(config.level);
    s_log_directory = std::filesystem::path(config.file).parent_path().string();

    const bool truncate = !config.append;
    if (!Attach<0, plog::TxtFormatter>(config.file, s_default_level, truncate, config.console))
        return false;

    if (!config.trace_file.empty() &&
        !Attach<processing::Diagnostics::kLogInstance, TraceFormatter>(config.trace_file, plog::verbose, truncate,
                                                                        false))
    {
        return false;
    }

#if GOSTREF_PROFILING_LEVEL >= 1
    const auto profile_file = (std::filesystem::path(s_log_directory) / "profile.log").string();
    if (!Attach<profiling::kProfilingLogInstance, TraceFormatter>(profile_file, plog::debug, truncate, false))
        return false;
#endif

    s_initialized = true;
    PLOG_INFO << "Logging initialized (level=" << plog::severityToString(s_default_level)
              << ", append=" << (config.append ? "true" : "false") << ", trace="
              << (config.trace_file.empty() ? "off" : config.trace_file) << ")";
    return true;
}

template<int Instance, class Formatter>
bool LogManager::Attach(const std::string& file, plog::Severity level, bool truncate, bool console)
{

    if (auto* logger = plog::get<Instance>())
    {
        // Already wired by an earlier Initialize(); plog cannot detach appenders
        if (s_files[Instance] != file)
        {
            PLOG_WARNING << "Log instance " << Instance << " keeps writing to " << s_files[Instance]
                         << ", ignoring new path " << file;
        }
        logger->setMaxSeverity(level);
        return true;
    }

    if (!EnsureParentDirectory(file))
        return false;

    try
    {
        if (truncate)
            std::ofstream(file, std::ios::trunc).close();

        auto rolling = std::make_unique<plog::RollingFileAppender<Formatter>>(file.c_str(), kMaxFileSize,
                                                                              kBackupCount);
        auto& logger = plog::init<Instance>(level, rolling.get());
        s_appenders.push_back(std::move(rolling));

        if (console)
        {
            auto stdout_appender = std::make_unique<plog::ConsoleAppender<Formatter>>();
            logger.addAppender(stdout_appender.get());
            s_appenders.push_back(std::move(stdout_appender));
        }
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to open log file", file + ": " + ex.what());
        return false;
    }

    s_files[Instance] = file;
    return true;
}

void LogManager::Shutdown()
{
    if (auto* logger = plog::get<0>())
        logger->setMaxSeverity(plog::none);
    if (auto* logger = plog::get<processing::Diagnostics::kLogInstance>())
        logger->setMaxSeverity(plog::none);
#if GOSTREF_PROFILING_LEVEL >= 1
    if (auto* logger = plog::get<profiling::kProfilingLogInstance>())
        logger->setMaxSeverity(plog::none);
#endif
    s_initialized = false;
}

bool LogManager::IsInitialized() { return s_initialized; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

const std::string& LogManager::GetLogDirectory() { return s_log_directory; }

std::string LogManager::FileFor(int instance)
{
    auto it = s_files.find(instance);
    return it == s_files.end() ? std::string() : it->second;
}

bool LogManager::EnsureParentDirectory(const std::string& file)
{
    const auto parent = std::filesystem::path(file).parent_path();
    if (parent.empty())
        return true;

    std::error_code ec;
    std::filesystem::create_directories(parent, ec);
    if (ec)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Unable to prepare log directory",
                                   parent.string() + ": " + ec.message());
        return false;
    }
    return true;
}

} // namespace utils
