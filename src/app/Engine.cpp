#include "Engine.hpp"
#include "../config/ConfigManager.hpp"
#include "../processing/CitationPipeline.hpp"
#include "../processing/Diagnostics.hpp"
#include "../utils/ErrorReporter.hpp"
#include "../utils/LogManager.hpp"
#include "../utils/Profile.hpp"

#include <plog/Log.h>

namespace app
{

Engine::Engine(std::string config_path)
    : config_(std::make_unique<config::ConfigManager>(std::move(config_path)))
{
    if (!config::bindSettings(*config_, settings_))
    {
        utils::ErrorReporter::ReportError(utils::ErrorCategory::Configuration, "Failed to register settings handlers",
                                          config_->lastError());
    }
}

Engine::~Engine() = default;

bool Engine::initialize()
{
    PROFILE_SCOPE_FUNCTION();

    bool config_ok = loadConfig();
    bool logging_ok = initializeLogging();
    PLOG_INFO << "gostref engine ready (standard=" << citation::toString(settings_.pipeline.standard)
              << ", threads=" << settings_.pipeline.threads << ")";
    return config_ok && logging_ok;
}

bool Engine::loadConfig()
{
    bool ok = config_->load();
    if (!ok)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Failed to load configuration",
                                            config_->lastError());
    }
    applySettings();
    return ok;
}

bool Engine::loadConfigFromString(const std::string& content)
{
    bool ok = config_->loadFromString(content);
    if (!ok)
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Failed to parse configuration",
                                            config_->lastError());
    }
    applySettings();
    return ok;
}

bool Engine::initializeLogging()
{
    PROFILE_SCOPE_FUNCTION();

    if (!utils::LogManager::Initialize(settings_.logging))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            settings_.logging.file);
        return false;
    }
    return true;
}

void Engine::applySettings()
{
    processing::Diagnostics::SetVerbose(settings_.pipeline.verbose);
    processing::Diagnostics::SetMaxPreview(settings_.pipeline.max_preview);

    // The pipeline keeps its standard for life; rebuild it on every (re)load
    pipeline_ = std::make_unique<processing::CitationPipeline>(settings_.pipeline);
}

const processing::CitationPipeline& Engine::pipeline()
{
    if (!pipeline_)
        applySettings();
    return *pipeline_;
}

processing::BatchResult Engine::processAll(const std::vector<citation::Citation>& citations)
{
    processing::BatchProcessor batch(pipeline(), settings_.pipeline.threads);
    return batch.processAll(citations);
}

void Engine::shutdown()
{
    if (utils::ErrorReporter::HasPendingErrors())
    {
        for (const auto& report : utils::ErrorReporter::GetPendingErrors())
            PLOG_WARNING << "Unhandled " << utils::ErrorReporter::SeverityName(report.severity)
                         << " at shutdown: " << report.describe();
    }
    pipeline_.reset();
    utils::LogManager::Shutdown();
}

} // namespace app
