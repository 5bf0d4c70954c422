#pragma once

#include <memory>
#include <string>
#include <vector>

class ConfigManager;

namespace translate
{
class GoogleTranslator;
}

class Application
{
public:
    Application(int argc, char** argv);
    ~Application();

    int run();

private:
    enum class Command
    {
        Translate,
        Detect,
        Token,
        Languages
    };

    struct Options
    {
        std::string config_path = "config.toml";
        std::string from = "auto";
        std::string to = "en";
        Command command = Command::Translate;
        bool refresh_languages = false;
        std::string text;
    };

    bool parseCommandLineArgs();
    bool initializeLogging();
    void initializeConfig();
    void installSignalHandlers();
    void printUsage() const;
    void printPendingErrors() const;

    int runTranslate();
    int runDetect();
    int runToken();
    int runLanguages();

    std::vector<std::string> args_;
    Options options_;
    std::unique_ptr<ConfigManager> config_;
    std::unique_ptr<translate::GoogleTranslator> translator_;
};
