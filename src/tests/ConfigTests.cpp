// SPDX-License-Identifier: Apache-2.0
#include <vosklink/Config.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

using namespace vosklink;

TEST_CASE("Default config values", "[config]")
{
    auto const config = LibraryConfig {};

    CHECK(config.nativeLogLevel == NativeLogSilent);
    CHECK(config.logLevel == log::Level::Info);
    CHECK(config.modelPath.empty());
    CHECK(config.dispatcher.regularThreads == 2);
    CHECK(config.dispatcher.cpuBoundThreads == 0);
    CHECK(config.recognizer.sampleRate == 16000.0f);
    CHECK(config.recognizer.chunkSize == 8000);
    CHECK(config.recognizer.options.maxAlternatives == 0);
    CHECK(!config.recognizer.options.words);
    CHECK(!config.recognizer.options.partialWords);
}

TEST_CASE("Config loads from JSON file", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "vosklink_test_config.json";
    {
        auto file = std::ofstream(tempPath);
        file << R"({
            "nativeLogLevel": 0,
            "logLevel": "debug",
            "modelPath": "/models/vosk-model-small-en-us-0.15",
            "dispatcher": { "regularThreads": 1, "cpuBoundThreads": 3 },
            "recognizer": {
                "sampleRate": 8000,
                "maxAlternatives": 2,
                "words": true,
                "partialWords": true,
                "chunkSize": 4000
            }
        })";
    }

    auto result = loadConfigFromFile(tempPath.string());
    std::filesystem::remove(tempPath);

    REQUIRE(result.has_value());
    auto const& config = *result;
    CHECK(config.nativeLogLevel == 0);
    CHECK(config.logLevel == log::Level::Debug);
    CHECK(config.modelPath == "/models/vosk-model-small-en-us-0.15");
    CHECK(config.dispatcher.regularThreads == 1);
    CHECK(config.dispatcher.cpuBoundThreads == 3);
    CHECK(config.recognizer.sampleRate == 8000.0f);
    CHECK(config.recognizer.options.maxAlternatives == 2);
    CHECK(config.recognizer.options.words);
    CHECK(config.recognizer.options.partialWords);
    CHECK(config.recognizer.chunkSize == 4000);
}

TEST_CASE("Config missing sections use defaults", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "vosklink_test_partial.json";
    {
        auto file = std::ofstream(tempPath);
        file << R"({ "modelPath": "m" })";
    }

    auto result = loadConfigFromFile(tempPath.string());
    std::filesystem::remove(tempPath);

    REQUIRE(result.has_value());
    CHECK(result->modelPath == "m");
    CHECK(result->nativeLogLevel == NativeLogSilent);
    CHECK(result->recognizer.chunkSize == 8000);
}

TEST_CASE("Config rejects invalid content", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "vosklink_test_invalid.json";

    auto loadText = [&tempPath](const char* text) {
        {
            auto file = std::ofstream(tempPath);
            file << text;
        }
        auto result = loadConfigFromFile(tempPath.string());
        std::filesystem::remove(tempPath);
        return result;
    };

    auto const cases = { "{ broken", R"({ "logLevel": "loud" })", R"({ "recognizer": { "chunkSize": 7 } })",
                         R"({ "recognizer": { "sampleRate": -1 } })", "[]" };
    for (auto const* text: cases)
    {
        auto result = loadText(text);
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ConfigError);
    }
}

TEST_CASE("Config load fails for missing file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("Config save and reload preserves values", "[config]")
{
    auto const tempDir = std::filesystem::temp_directory_path() / "vosklink_test_save";
    auto const tempPath = tempDir / "config.json";

    auto config = LibraryConfig {};
    config.nativeLogLevel = 1;
    config.logLevel = log::Level::Warning;
    config.modelPath = "/models/en";
    config.dispatcher.cpuBoundThreads = 4;
    config.recognizer.sampleRate = 44100.0f;
    config.recognizer.options.words = true;
    config.recognizer.chunkSize = 3200;

    REQUIRE(saveConfigToFile(tempPath.string(), config).has_value());
    auto loaded = loadConfigFromFile(tempPath.string());
    std::filesystem::remove_all(tempDir);

    REQUIRE(loaded.has_value());
    CHECK(loaded->nativeLogLevel == 1);
    CHECK(loaded->logLevel == log::Level::Warning);
    CHECK(loaded->modelPath == "/models/en");
    CHECK(loaded->dispatcher.cpuBoundThreads == 4);
    CHECK(loaded->recognizer.sampleRate == 44100.0f);
    CHECK(loaded->recognizer.options.words);
    CHECK(!loaded->recognizer.options.partialWords);
    CHECK(loaded->recognizer.chunkSize == 3200);
}

TEST_CASE("initialize applies both log levels", "[config]")
{
    auto const previous = log::getLevel();

    auto config = LibraryConfig {};
    config.logLevel = log::Level::Error;
    config.nativeLogLevel = NativeLogSilent;
    initialize(config);

    CHECK(log::getLevel() == log::Level::Error);
    CHECK(nativeLogLevel() == NativeLogSilent);

    log::setLevel(previous);
}

TEST_CASE("Default config path follows XDG_CONFIG_HOME", "[config]")
{
    auto const* const previous = std::getenv("XDG_CONFIG_HOME");
    auto const saved = previous ? std::optional<std::string>(previous) : std::nullopt;
    auto const tempDir = std::filesystem::temp_directory_path() / "vosklink_test_xdg";

    ::setenv("XDG_CONFIG_HOME", tempDir.c_str(), 1);
    auto const path = defaultConfigPath();
    auto config = loadConfig();

    if (saved)
        ::setenv("XDG_CONFIG_HOME", saved->c_str(), 1);
    else
        ::unsetenv("XDG_CONFIG_HOME");

    CHECK(path == (tempDir / "vosklink" / "config.json").string());
    REQUIRE(config.has_value());
    CHECK(config->recognizer.chunkSize == 8000);
}
