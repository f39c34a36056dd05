#pragma once

#include "../config/Settings.hpp"
#include "../processing/BatchProcessor.hpp"
#include "../processing/CitationTypes.hpp"

#include <memory>
#include <string>
#include <vector>

namespace config
{
class ConfigManager;
}

namespace processing
{
class CitationPipeline;
}

namespace app
{

// Owns configuration, logging and the pipeline for an embedding application.
//
// Typical use:
//   app::Engine engine("gostref.toml");
//   engine.initialize();
//   auto result = engine.pipeline().process(citation);
class Engine
{
public:
    explicit Engine(std::string config_path = "gostref.toml");
    ~Engine();

    Engine(const Engine&) = delete;
    Engine& operator=(const Engine&) = delete;

    // Config, then logging, then the pipeline; a config error keeps defaults
    bool initialize();

    // Settings only (no log files); used when the host owns logging
    bool loadConfig();
    bool loadConfigFromString(const std::string& content);

    [[nodiscard]] const processing::CitationPipeline& pipeline();
    [[nodiscard]] processing::BatchResult processAll(const std::vector<citation::Citation>& citations);

    [[nodiscard]] const config::Settings& settings() const noexcept { return settings_; }

    void shutdown();

private:
    bool initializeLogging();
    void applySettings();

    config::Settings settings_;
    std::unique_ptr<config::ConfigManager> config_;
    std::unique_ptr<processing::CitationPipeline> pipeline_;
};

} // namespace app
