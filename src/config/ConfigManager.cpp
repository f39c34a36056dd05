#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <plog/Log.h>

#include <algorithm>
#include <fstream>
#include <string_view>

namespace config
{

ConfigManager::ConfigManager(std::string path)
    : config_path_(std::move(path))
    , root_(std::make_unique<toml::table>())
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys)
{
    std::set<std::string> keys(ownedKeys.begin(), ownedKeys.end());
    for (const auto& handler : handlers_)
    {
        if (handler.table != path)
            continue;
        auto clash = std::find_if(keys.begin(), keys.end(),
                                  [&handler](const std::string& key) { return handler.keys.count(key) != 0; });
        if (clash != keys.end())
        {
            last_error_ = "Duplicate ownership: key '" + *clash + "' at path '" + path + "' already registered";
            PLOG_ERROR << last_error_;
            return false;
        }
    }

    handlers_.push_back({ path, std::move(cb), std::move(keys) });
    return true;
}

bool ConfigManager::load()
{
    std::ifstream in(config_path_, std::ios::binary);
    if (!in)
    {
        PLOG_INFO << "No config file at " << config_path_ << ", using defaults";
        return parse([] { return toml::table{}; });
    }
    return parse([&] { return toml::parse(in, config_path_); });
}

bool ConfigManager::loadFromString(const std::string& content)
{
    return parse([&] { return toml::parse(content); });
}

bool ConfigManager::parse(const std::function<toml::table()>& parser)
{
    last_error_.clear();
    try
    {
        root_ = std::make_unique<toml::table>(parser());
    }
    catch (const toml::parse_error& pe)
    {
        // Previous values stay in place; handlers are not called
        const auto& where = pe.source().begin;
        last_error_ = "config parse error: " + std::string(pe.description());
        PLOG_WARNING << last_error_;
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration, "Configuration file has errors",
                                            config_path_ + ":" + std::to_string(where.line) + ":" +
                                                std::to_string(where.column) + " " + std::string(pe.description()));
        return false;
    }

    dispatch();
    return true;
}

void ConfigManager::dispatch()
{
    unknown_keys_.clear();
    const toml::table empty;

    for (const auto& handler : handlers_)
    {
        const toml::table* section = findTable(handler.table);
        if (section)
        {
            for (const auto& entry : *section)
            {
                const std::string key(entry.first.str());
                bool owned = std::any_of(handlers_.begin(), handlers_.end(), [&](const Handler& h)
                                         { return h.table == handler.table && h.keys.count(key) != 0; });
                std::string qualified = handler.table + "." + key;
                if (!owned && std::find(unknown_keys_.begin(), unknown_keys_.end(), qualified) == unknown_keys_.end())
                {
                    PLOG_WARNING << "Unknown config key '" << qualified << "', ignoring";
                    unknown_keys_.push_back(std::move(qualified));
                }
            }
        }
        if (handler.callbacks.load)
            handler.callbacks.load(section ? *section : empty);
    }
}

const toml::table* ConfigManager::findTable(const std::string& dotted) const
{
    const toml::table* current = root_.get();
    std::string_view rest(dotted);
    while (current && !rest.empty())
    {
        const auto dot = rest.find('.');
        const std::string_view part = rest.substr(0, dot);
        rest = dot == std::string_view::npos ? std::string_view{} : rest.substr(dot + 1);
        current = current->get_as<toml::table>(part);
    }
    return current;
}

} // namespace config
