#pragma once

#include <string>
#include <memory>
#include <functional>
#include <vector>

#include <toml++/toml.h>

struct TableCallbacks
{
    std::function<void(const toml::table& section)> load;
};

// Loads a TOML file and hands each registered section to its owner.
// A missing file is not an error: every owner receives an empty table and keeps its defaults.
class ConfigManager
{
public:
    explicit ConfigManager(std::string config_path = "config.toml");
    ~ConfigManager();

    bool registerTable(const std::string& path, TableCallbacks cb);
    bool load();
    const toml::table& root() const;

    const std::string& path() const { return config_path_; }
    const char* lastError() const { return last_error_.c_str(); }

private:
    const toml::table* resolveTablePath(const toml::table& root, const std::string& path) const;
    void dispatch(const toml::table& root);

    std::string config_path_;
    std::string last_error_;

    struct HandlerEntry {
        std::string path;
        TableCallbacks callbacks;
    };
    std::vector<HandlerEntry> handlers_;
    std::unique_ptr<toml::table> root_;
};
