#include "Settings.hpp"
#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <cstdint>
#include <plog/Log.h>
#include <toml++/toml.h>

namespace config
{

namespace
{

void loadPipeline(const toml::table& section, PipelineConfig& out)
{
    if (auto standard = section["standard"].value<std::string>())
    {
        if (auto parsed = citation::standardFromString(*standard))
        {
            out.standard = *parsed;
        }
        else
        {
            utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                                "Unknown formatting standard, keeping " +
                                                    std::string(citation::toString(out.standard)),
                                                "pipeline.standard = " + *standard);
        }
    }
    if (auto threads = section["threads"].value<std::int64_t>())
    {
        if (*threads >= 0 && *threads <= 256)
            out.threads = static_cast<std::size_t>(*threads);
        else
            PLOG_WARNING << "pipeline.threads out of range (" << *threads << "), keeping " << out.threads;
    }
    if (auto verbose = section["verbose"].value<bool>())
        out.verbose = *verbose;
    if (auto preview = section["max_preview"].value<std::int64_t>())
    {
        if (*preview > 0)
            out.max_preview = static_cast<std::size_t>(*preview);
    }
    if (auto validate = section["validate_output"].value<bool>())
        out.validate_output = *validate;
    if (auto limit = section["max_input_chars"].value<std::int64_t>())
    {
        if (*limit >= 64 && *limit <= 10000)
            out.max_input_chars = static_cast<std::size_t>(*limit);
        else
            PLOG_WARNING << "pipeline.max_input_chars must be within 64..10000, got " << *limit;
    }
}

void loadLogging(const toml::table& section, LoggingConfig& out)
{
    if (auto level = section["level"].value<std::int64_t>())
    {
        if (*level >= 0 && *level <= 6)
            out.level = static_cast<int>(*level);
        else
            PLOG_WARNING << "logging.level must be within 0..6, got " << *level;
    }
    if (auto append = section["append"].value<bool>())
        out.append = *append;
    if (auto file = section["file"].value<std::string>())
        out.file = *file;
    if (auto trace = section["trace_file"].value<std::string>())
        out.trace_file = *trace;
    if (auto console = section["console"].value<bool>())
        out.console = *console;
}

} // anonymous namespace

bool bindSettings(ConfigManager& manager, Settings& settings)
{
    bool ok = manager.registerTable("pipeline",
                                    TableCallbacks{ [&settings](const toml::table& section)
                                                    { loadPipeline(section, settings.pipeline); } },
                                    { "standard", "threads", "verbose", "max_preview", "validate_output",
                                      "max_input_chars" });
    ok = manager.registerTable("logging",
                               TableCallbacks{ [&settings](const toml::table& section)
                                               { loadLogging(section, settings.logging); } },
                               { "level", "append", "file", "trace_file", "console" }) &&
         ok;
    return ok;
}

} // namespace config
