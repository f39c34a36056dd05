#pragma once

#include "../processing/CitationTypes.hpp"

#include <cstddef>
#include <string>

namespace config
{

class ConfigManager;

// [logging] section of gostref.toml
struct LoggingConfig
{
    int level = 4;                                  // plog::Severity, 0 (none) .. 6 (verbose)
    bool append = true;
    std::string file = "logs/gostref.log";           // application log, plog instance 0
    std::string trace_file = "logs/pipeline.log";    // per-stage trace, Diagnostics::kLogInstance
    bool console = false;
};

// [pipeline] section of gostref.toml
struct PipelineConfig
{
    citation::FormattingStandard standard = citation::FormattingStandard::VakRb;
    std::size_t threads = 0;       // 0 = hardware concurrency
    bool verbose = false;          // stage tracing via Diagnostics
    std::size_t max_preview = 160; // characters of text shown in trace lines
    bool validate_output = true;   // run the punctuation validator on every result
    // Text beyond this many code points is cut before any regex stage runs;
    // std::regex backtracking recurses per character
    std::size_t max_input_chars = 2000;
};

struct Settings
{
    PipelineConfig pipeline;
    LoggingConfig logging;
};

// Registers the [pipeline] and [logging] handlers; values land in `settings`
// every time the manager loads. `settings` must outlive the manager.
bool bindSettings(ConfigManager& manager, Settings& settings);

} // namespace config
