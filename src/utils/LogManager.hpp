#pragma once

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <plog/Severity.h>

namespace plog
{
class IAppender;
}

namespace config
{
struct LoggingConfig;
}

namespace utils
{

// Wires the plog instances used by the library:
//   0                               application log, rolling file + optional console
//   Diagnostics::kLogInstance       pipeline trace, one line per stage
//   profiling::kProfilingLogInstance scope timers (GOSTREF_PROFILING_LEVEL >= 1)
//
// plog keeps raw appender pointers for the life of the process, so appenders
// are never destroyed. Shutdown() mutes the loggers and a later Initialize()
// unmutes them; files are opened once per instance.
class LogManager
{
public:
    static bool Initialize(const config::LoggingConfig& config);
    static void Shutdown();

    [[nodiscard]] static bool IsInitialized();
    [[nodiscard]] static plog::Severity GetDefaultLogLevel();
    [[nodiscard]] static const std::string& GetLogDirectory();

    // Log file an instance writes to, empty when the instance is not attached
    [[nodiscard]] static std::string FileFor(int instance);

private:
    LogManager() = default;

    template<int Instance, class Formatter>
    static bool Attach(const std::string& file, plog::Severity level, bool truncate, bool console);

    static bool EnsureParentDirectory(const std::string& file);

    static bool s_initialized;
    static plog::Severity s_default_level;
    static std::string s_log_directory;
    static std::map<int, std::string> s_files;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
