#include "ConfigManager.hpp"
#include "../utils/ErrorReporter.hpp"

#include <toml++/toml.h>
#include <plog/Log.h>
#include <fstream>
#include <sstream>

ConfigManager::ConfigManager(std::string config_path)
    : config_path_(std::move(config_path))
{
}

ConfigManager::~ConfigManager() = default;

bool ConfigManager::registerTable(const std::string& path, TableCallbacks cb)
{
    if (!cb.load)
    {
        last_error_ = "Handler for '" + path + "' has no load callback";
        PLOG_ERROR << last_error_;
        return false;
    }
    for (const auto& handler : handlers_)
    {
        if (handler.path == path)
        {
            last_error_ = "Duplicate handler for path '" + path + "'";
            PLOG_ERROR << last_error_;
            return false;
        }
    }

    handlers_.push_back({path, std::move(cb)});
    return true;
}

bool ConfigManager::load()
{
    last_error_.clear();
    std::ifstream ifs(config_path_, std::ios::binary);
    if (!ifs)
    {
        PLOG_INFO << "No config at " << config_path_ << ", using defaults";
        root_ = std::make_unique<toml::table>();
        dispatch(*root_);
        return true;
    }

    try
    {
        root_ = std::make_unique<toml::table>(toml::parse(ifs, config_path_));
        dispatch(*root_);
        PLOG_INFO << "Loaded config from " << config_path_;
        return true;
    }
    catch (const toml::parse_error& pe)
    {
        last_error_ = std::string("config parse error: ") + std::string(pe.description());
        PLOG_WARNING << last_error_;

        std::string error_details;
        if (pe.source().begin.line > 0)
        {
            error_details = "Error at line " + std::to_string(pe.source().begin.line) + ": " + std::string(pe.description());
        }
        else
        {
            error_details = std::string(pe.description());
        }

        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Configuration,
                                            "Configuration file has errors. Using defaults.",
                                            error_details + "\nFile: " + config_path_);

        root_ = std::make_unique<toml::table>();
        dispatch(*root_);
        return false;
    }
}

const toml::table& ConfigManager::root() const
{
    static const toml::table empty;
    return root_ ? *root_ : empty;
}

void ConfigManager::dispatch(const toml::table& root)
{
    for (const auto& handler : handlers_)
    {
        const toml::table* section = resolveTablePath(root, handler.path);
        if (section)
        {
            handler.callbacks.load(*section);
        }
        else
        {
            toml::table empty;
            handler.callbacks.load(empty);
        }
    }
}

const toml::table* ConfigManager::resolveTablePath(const toml::table& root, const std::string& path) const
{
    if (path.empty())
        return &root;

    std::istringstream ss(path);
    std::string segment;
    const toml::table* current = &root;

    while (std::getline(ss, segment, '.'))
    {
        if (segment.empty())
        {
            PLOG_WARNING << "Invalid path segment (empty) in path: " << path;
            return nullptr;
        }

        const toml::table* next = (*current)[segment].as_table();
        if (!next)
        {
            if (current->contains(segment))
                PLOG_WARNING << "Path segment '" << segment << "' exists but is not a table";
            return nullptr;
        }
        current = next;
    }

    return current;
}
