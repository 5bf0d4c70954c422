#pragma once

#include <string>
#include <optional>
#include <vector>
#include <memory>
#include <plog/Severity.h>
#include <toml++/toml.h>

namespace plog
{
class IAppender;
}

namespace utils
{

class LogManager
{
public:
    // [log] section of the config file
    struct LogSettings
    {
        plog::Severity level = plog::info;
        bool append = true;
        std::string file = "logs/gtx-translate.log";
        bool console = false;

        static LogSettings fromToml(const toml::table& section);
    };

    struct LoggerConfig
    {
        std::string name;
        std::string filepath;
        std::optional<bool> append_override;
        std::optional<plog::Severity> level_override;
        size_t max_file_size = 10 * 1024 * 1024;
        size_t backup_count = 3;
        bool add_console_appender = false;
    };

    static bool Initialize(const LogSettings& settings);

    template<int InstanceId = 0>
    static bool RegisterLogger(const LoggerConfig& config);

    static void Shutdown();

    static bool IsAppendMode();
    static plog::Severity GetDefaultLogLevel();
    static void PrepareLogDirectory(const std::string& filepath);

private:
    LogManager() = default;

    static bool s_initialized;
    static bool s_append_logs;
    static plog::Severity s_default_level;
    static std::vector<std::unique_ptr<plog::IAppender>> s_appenders;
};

} // namespace utils
