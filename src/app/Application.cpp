#include "Application.hpp"

#include "config/ConfigManager.hpp"
#include "translate/GoogleTranslator.hpp"
#include "utils/ErrorReporter.hpp"
#include "utils/LogManager.hpp"

#include <plog/Log.h>

#include <atomic>
#include <csignal>
#include <iostream>

#ifndef GTX_VERSION_STRING
#define GTX_VERSION_STRING "0.0.0"
#endif

namespace
{

enum ExitCode
{
    kExitOk = 0,
    kExitFailure = 1,
    kExitUsage = 2
};

// Cleared by SIGINT/SIGTERM; in-flight transfers see it through the progress callback
std::atomic<bool> g_running{ true };

extern "C" void handle_stop_signal(int) { g_running.store(false); }

utils::LogManager::LogSettings g_log_settings;
translate::TranslatorConfig g_translator_config;

} // namespace

Application::Application(int argc, char** argv)
    : args_(argv + (argc > 0 ? 1 : 0), argv + (argc > 0 ? argc : 0))
{
}

Application::~Application()
{
    translator_.reset();
    utils::LogManager::Shutdown();
}

int Application::run()
{
    if (!parseCommandLineArgs())
    {
        printUsage();
        return kExitUsage;
    }

    initializeConfig();
    if (!initializeLogging())
    {
        printPendingErrors();
        return kExitFailure;
    }
    installSignalHandlers();

    PLOG_INFO << "gtx-translate " << GTX_VERSION_STRING << " starting";
    translator_ = std::make_unique<translate::GoogleTranslator>(g_translator_config);

    int rc = kExitFailure;
    switch (options_.command)
    {
    case Command::Translate:
        rc = runTranslate();
        break;
    case Command::Detect:
        rc = runDetect();
        break;
    case Command::Token:
        rc = runToken();
        break;
    case Command::Languages:
        rc = runLanguages();
        break;
    }

    if (rc != kExitOk)
        printPendingErrors();
    return rc;
}

bool Application::parseCommandLineArgs()
{
    std::string text;
    for (std::size_t i = 0; i < args_.size(); ++i)
    {
        const std::string& arg = args_[i];
        auto next_value = [&](std::string& out) -> bool {
            if (i + 1 >= args_.size())
            {
                std::cerr << "missing value for " << arg << "\n";
                return false;
            }
            out = args_[++i];
            return true;
        };

        if (arg == "--config" || arg == "-c")
        {
            if (!next_value(options_.config_path))
                return false;
        }
        else if (arg == "--from" || arg == "-f")
        {
            if (!next_value(options_.from))
                return false;
        }
        else if (arg == "--to" || arg == "-t")
        {
            if (!next_value(options_.to))
                return false;
        }
        else if (arg == "--detect")
            options_.command = Command::Detect;
        else if (arg == "--token")
            options_.command = Command::Token;
        else if (arg == "--languages")
            options_.command = Command::Languages;
        else if (arg == "--refresh-languages")
            options_.refresh_languages = true;
        else if (arg == "--help" || arg == "-h")
            return false;
        else if (arg.size() > 1 && arg[0] == '-' && arg != "--")
        {
            std::cerr << "unknown option " << arg << "\n";
            return false;
        }
        else
        {
            if (arg == "--")
                continue;
            if (!text.empty())
                text.push_back(' ');
            text += arg;
        }
    }

    options_.text = std::move(text);
    if (options_.command != Command::Languages && options_.text.empty())
    {
        std::cerr << "no text given\n";
        return false;
    }
    return true;
}

void Application::initializeConfig()
{
    config_ = std::make_unique<ConfigManager>(options_.config_path);
    config_->registerTable("log", TableCallbacks{ [](const toml::table& t) {
                               g_log_settings = utils::LogManager::LogSettings::fromToml(t);
                           } });
    config_->registerTable("translator", TableCallbacks{ [](const toml::table& t) {
                               g_translator_config = translate::TranslatorConfig::fromToml(t);
                           } });
    // Parse problems are reported and the defaults stay in place
    config_->load();
}

bool Application::initializeLogging()
{
    if (!utils::LogManager::Initialize(g_log_settings))
    {
        utils::ErrorReporter::ReportWarning(utils::ErrorCategory::Initialization, "Failed to initialize logging system",
                                            "");
        return false;
    }

    return utils::LogManager::RegisterLogger<0>({ .name = "main",
                                                  .filepath = g_log_settings.file,
                                                  .append_override = std::nullopt,
                                                  .level_override = std::nullopt,
                                                  .max_file_size = 10 * 1024 * 1024,
                                                  .backup_count = 3,
                                                  .add_console_appender = g_log_settings.console });
}

void Application::installSignalHandlers()
{
    std::signal(SIGINT, handle_stop_signal);
    std::signal(SIGTERM, handle_stop_signal);
}

void Application::printUsage() const
{
    std::cerr << "usage: gtx-translate [options] TEXT...\n"
                 "  -c, --config FILE       config file (default config.toml)\n"
                 "  -f, --from LANG         source language code or name (default auto)\n"
                 "  -t, --to LANG           destination language code or name (default en)\n"
                 "      --detect            detect the language of TEXT\n"
                 "      --token             print the tk value for TEXT\n"
                 "      --languages         list known languages\n"
                 "      --refresh-languages update the list from the documentation page first\n";
}

void Application::printPendingErrors() const
{
    for (const auto& report : utils::ErrorReporter::GetPendingErrors())
    {
        std::cerr << utils::ErrorReporter::SeverityToString(report.severity) << " ["
                  << utils::ErrorReporter::CategoryToString(report.category) << "] " << report.user_message;
        if (!report.technical_details.empty())
            std::cerr << ": " << report.technical_details;
        std::cerr << "\n";
    }
}

int Application::runTranslate()
{
    std::string src;
    std::string dst;
    if (!translate::is_auto_language(options_.from) && !translator_->validLanguageKey(options_.from, src))
    {
        std::cerr << translator_->lastError() << "\n";
        return kExitUsage;
    }
    if (src.empty())
        src = translate::kDefaultLanguage;
    if (!translator_->validLanguageKey(options_.to, dst))
    {
        std::cerr << translator_->lastError() << "\n";
        return kExitUsage;
    }

    translate::Translated result;
    if (!translator_->translate(options_.text, src, dst, result, &g_running))
    {
        std::cerr << "translation failed: " << translator_->lastError() << "\n";
        return kExitFailure;
    }
    std::cout << result.text << "\n";
    return kExitOk;
}

int Application::runDetect()
{
    std::string dst;
    if (!translator_->validLanguageKey(options_.to, dst))
    {
        std::cerr << translator_->lastError() << "\n";
        return kExitUsage;
    }

    translate::DetectResult detected;
    if (!translator_->detectLanguage(options_.text, dst, detected, &g_running))
    {
        std::cerr << "detection failed: " << translator_->lastError() << "\n";
        return kExitFailure;
    }
    std::cout << detected.src << " " << detected.confidence << "\n";
    return kExitOk;
}

int Application::runToken()
{
    std::cout << translator_->tokenAcquirer().derive(options_.text, &g_running) << "\n";
    return kExitOk;
}

int Application::runLanguages()
{
    auto table = translator_->languages();
    if (options_.refresh_languages && !translator_->fetchLanguages(true, table, &g_running))
    {
        std::cerr << "language refresh failed, showing built-in list: " << translator_->lastError() << "\n";
    }
    for (const auto& [code, name] : table->entries())
        std::cout << code << "\t" << name << "\n";
    return kExitOk;
}
