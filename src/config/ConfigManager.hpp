#pragma once

#include <functional>
#include <memory>
#include <set>
#include <string>
#include <vector>

#include <toml++/toml.h>

namespace config
{

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

// Owns the parsed gostref.toml and hands each registered table to its handler.
// Several handlers may share a table as long as their keys do not overlap.
class ConfigManager
{
public:
    explicit ConfigManager(std::string path = "gostref.toml");
    ~ConfigManager();

    // `path` is a dotted table path ("pipeline", "lookup.crossref")
    bool registerTable(const std::string& path, TableCallbacks cb, std::vector<std::string> ownedKeys);

    // Missing file is not an error: handlers receive empty tables and keep defaults
    bool load();
    bool loadFromString(const std::string& content);

    const toml::table& root() const { return *root_; }
    const std::string& path() const { return config_path_; }

    // "table.key" entries seen during the last load that no handler owns
    const std::vector<std::string>& unknownKeys() const { return unknown_keys_; }

    const char* lastError() const { return last_error_.c_str(); }

private:
    struct Handler
    {
        std::string table;
        TableCallbacks callbacks;
        std::set<std::string> keys;
    };

    bool parse(const std::function<toml::table()>& parser);
    void dispatch();
    const toml::table* findTable(const std::string& dotted) const;

    std::string config_path_;
    std::string last_error_;
    std::vector<Handler> handlers_;
    std::vector<std::string> unknown_keys_;
    std::unique_ptr<toml::table> root_;
};

} // namespace config
