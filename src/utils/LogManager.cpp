#include "LogManager.hpp"
#include "ErrorReporter.hpp"

#include <filesystem>
#include <fstream>

#include <plog/Log.h>
#include <plog/Init.h>
#include <plog/Appenders/ConsoleAppender.h>
#include <plog/Appenders/RollingFileAppender.h>
#include <plog/Formatters/TxtFormatter.h>

namespace utils
{

bool LogManager::s_initialized = false;
bool LogManager::s_append_logs = true;
plog::Severity LogManager::s_default_level = plog::info;
std::vector<std::unique_ptr<plog::IAppender>> LogManager::s_appenders;

LogManager::LogSettings LogManager::LogSettings::fromToml(const toml::table& t)
{
    LogSettings s;
    if (auto level = t["level"].value<int64_t>())
    {
        int level_int = static_cast<int>(*level);
        if (level_int >= 0 && level_int <= 6)
        {
            s.level = static_cast<plog::Severity>(level_int);
        }
    }
    if (auto append = t["append"].value<bool>())
        s.append = *append;
    if (auto file = t["file"].value<std::string>())
    {
        if (!file->empty())
            s.file = *file;
    }
    if (auto console = t["console"].value<bool>())
        s.console = *console;
    return s;
}

bool LogManager::Initialize(const LogSettings& settings)
{
    if (s_initialized)
        return true;

    s_append_logs = settings.append;
    s_default_level = settings.level;
    PrepareLogDirectory(settings.file);

    s_initialized = true;
    return true;
}

template <int InstanceId>
bool LogManager::RegisterLogger(const LoggerConfig& config)
{
    if (!s_initialized)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization,
                                   "LogManager not initialized before registering logger", config.name);
        return false;
    }

    try
    {
        bool append = config.append_override.value_or(s_append_logs);
        if (!append)
        {
            std::ofstream(config.filepath, std::ios::trunc).close();
        }

        auto file_appender = std::make_unique<plog::RollingFileAppender<plog::TxtFormatter>>(
            config.filepath.c_str(), config.max_file_size, config.backup_count);

        plog::Severity level = config.level_override.value_or(s_default_level);

        plog::init<InstanceId>(level, file_appender.get());

        if (config.add_console_appender)
        {
            auto console_appender = std::make_unique<plog::ConsoleAppender<plog::TxtFormatter>>();
            if (auto logger = plog::get<InstanceId>())
            {
                logger->addAppender(console_appender.get());
                s_appenders.push_back(std::move(console_appender));
            }
        }

        s_appenders.push_back(std::move(file_appender));
        return true;
    }
    catch (const std::exception& ex)
    {
        ErrorReporter::ReportError(ErrorCategory::Initialization, "Failed to register logger: " + config.name,
                                   ex.what());
        return false;
    }
}

template bool LogManager::RegisterLogger<0>(const LoggerConfig&);

void LogManager::Shutdown()
{
    s_appenders.clear();
    s_initialized = false;
}

bool LogManager::IsAppendMode() { return s_append_logs; }

plog::Severity LogManager::GetDefaultLogLevel() { return s_default_level; }

void LogManager::PrepareLogDirectory(const std::string& filepath)
{
    const auto dir = std::filesystem::path(filepath).parent_path();
    if (dir.empty())
        return;

    std::error_code ec;
    std::filesystem::create_directories(dir, ec);
    if (ec)
    {
        ErrorReporter::ReportWarning(ErrorCategory::Initialization, "Unable to prepare log directory", ec.message());
    }
}

} // namespace utils
