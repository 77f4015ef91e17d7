// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>

#include <nlohmann/json.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace vosklink
{

namespace
{

    auto getSizeOr(const nlohmann::json& obj, std::string_view key, std::size_t defaultValue) -> std::size_t
    {
        auto const value = json::getIntOr(obj, key, -1);
        return value < 0 ? defaultValue : static_cast<std::size_t>(value);
    }

    auto defaultConfigDir() -> std::string
    {
#ifdef _WIN32
        auto const* const appData = std::getenv("APPDATA");
        if (appData)
            return std::string(appData) + "\\vosklink";
        return ".";
#elif defined(__APPLE__)
        auto const* const home = std::getenv("HOME");
        if (home)
            return std::string(home) + "/Library/Application Support/vosklink";
        return ".";
#else
        auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
        if (xdgConfig)
            return std::string(xdgConfig) + "/vosklink";
        auto const* const home = std::getenv("HOME");
        if (home)
            return std::string(home) + "/.config/vosklink";
        return ".";
#endif
    }

} // namespace

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<LibraryConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str(), ErrorCode::ConfigError);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} is not a JSON object", path));

    auto config = LibraryConfig {};
    config.nativeLogLevel = json::getIntOr(root, "nativeLogLevel", NativeLogSilent);
    config.modelPath = json::getStringOr(root, "modelPath", "");

    auto const levelName = json::getStringOr(root, "logLevel", "info");
    auto const level = log::parseLevel(levelName);
    if (!level)
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level: {}", levelName));
    config.logLevel = *level;

    if (auto const it = root.find("dispatcher"); it != root.end() && it->is_object())
    {
        config.dispatcher.regularThreads = getSizeOr(*it, "regularThreads", 2);
        config.dispatcher.cpuBoundThreads = getSizeOr(*it, "cpuBoundThreads", 0);
    }

    if (auto const it = root.find("recognizer"); it != root.end() && it->is_object())
    {
        auto const& rec = *it;
        config.recognizer.sampleRate = static_cast<float>(json::getDoubleOr(rec, "sampleRate", 16000.0));
        config.recognizer.options.maxAlternatives = json::getIntOr(rec, "maxAlternatives", 0);
        config.recognizer.options.words = json::getBoolOr(rec, "words", false);
        config.recognizer.options.partialWords = json::getBoolOr(rec, "partialWords", false);
        config.recognizer.chunkSize = getSizeOr(rec, "chunkSize", 8000);

        if (config.recognizer.sampleRate <= 0.0f)
            return makeError(ErrorCode::ConfigError,
                             std::format("recognizer.sampleRate must be positive, got {}",
                                         config.recognizer.sampleRate));
        if (config.recognizer.chunkSize == 0 || config.recognizer.chunkSize % 2 != 0)
            return makeError(ErrorCode::ConfigError,
                             std::format("recognizer.chunkSize must be a positive even number, got {}",
                                         config.recognizer.chunkSize));
    }

    return config;
}

auto saveConfigToFile(std::string_view path, const LibraryConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();
    root["nativeLogLevel"] = config.nativeLogLevel;
    root["logLevel"] = std::string(log::levelName(config.logLevel));
    if (!config.modelPath.empty())
        root["modelPath"] = config.modelPath;

    auto dispatcher = nlohmann::json::object();
    dispatcher["regularThreads"] = config.dispatcher.regularThreads;
    dispatcher["cpuBoundThreads"] = config.dispatcher.cpuBoundThreads;
    root["dispatcher"] = std::move(dispatcher);

    auto rec = nlohmann::json::object();
    rec["sampleRate"] = config.recognizer.sampleRate;
    rec["maxAlternatives"] = config.recognizer.options.maxAlternatives;
    rec["words"] = config.recognizer.options.words;
    rec["partialWords"] = config.recognizer.options.partialWords;
    rec["chunkSize"] = config.recognizer.chunkSize;
    root["recognizer"] = std::move(rec);

    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << root.dump(4) << '\n';
    return {};
}

auto loadConfig() -> Result<LibraryConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::debug("No config file found at {}, using defaults", path);
        return LibraryConfig {};
    }

    return loadConfigFromFile(path);
}

void initialize(const LibraryConfig& config)
{
    log::setLevel(config.logLevel);
    setNativeLogLevel(config.nativeLogLevel);
}

} // namespace vosklink
