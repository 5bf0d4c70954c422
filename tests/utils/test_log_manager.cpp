#include <catch2/catch_test_macros.hpp>
#include "utils/LogManager.hpp"
#include "utils/ErrorReporter.hpp"

#include <filesystem>

using utils::LogManager;

TEST_CASE("Log settings from TOML", "[utils][logging]") {

    SECTION("Defaults") {
        auto s = LogManager::LogSettings::fromToml(toml::table{});
        REQUIRE(s.level == plog::info);
        REQUIRE(s.append);
        REQUIRE(s.file == "logs/gtx-translate.log");
        REQUIRE_FALSE(s.console);
    }

    SECTION("Values from the [log] section") {
        auto root = toml::parse(R"(
            level = 5
            append = false
            file = "out/run.log"
            console = true
        )");
        auto s = LogManager::LogSettings::fromToml(root);
        REQUIRE(s.level == plog::debug);
        REQUIRE_FALSE(s.append);
        REQUIRE(s.file == "out/run.log");
        REQUIRE(s.console);
    }

    SECTION("Invalid level and empty file are ignored") {
        auto root = toml::parse(R"(
            level = 9
            file = ""
        )");
        auto s = LogManager::LogSettings::fromToml(root);
        REQUIRE(s.level == plog::info);
        REQUIRE(s.file == "logs/gtx-translate.log");
    }
}

TEST_CASE("Log manager setup", "[utils][logging]") {
    utils::ErrorReporter::ClearErrors();

    SECTION("Registering before initialization fails") {
        LogManager::Shutdown();
        REQUIRE_FALSE(LogManager::RegisterLogger<0>({.name = "early", .filepath = "unused.log"}));
        auto errors = utils::ErrorReporter::GetPendingErrors();
        REQUIRE(errors.size() == 1);
        REQUIRE(errors[0].category == utils::ErrorCategory::Initialization);
    }

    SECTION("Log directory is created") {
        const auto dir = std::filesystem::temp_directory_path() / "gtx_translate_logs_test";
        std::error_code ec;
        std::filesystem::remove_all(dir, ec);

        LogManager::PrepareLogDirectory((dir / "nested" / "run.log").string());
        REQUIRE(std::filesystem::is_directory(dir / "nested"));
        std::filesystem::remove_all(dir, ec);
    }

    SECTION("Initialize records append mode and level") {
        LogManager::Shutdown();
        LogManager::LogSettings s;
        s.append = false;
        s.level = plog::warning;
        s.file = "run.log";
        REQUIRE(LogManager::Initialize(s));
        REQUIRE_FALSE(LogManager::IsAppendMode());
        REQUIRE(LogManager::GetDefaultLogLevel() == plog::warning);
        LogManager::Shutdown();
    }
}
