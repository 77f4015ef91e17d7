// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Log.hpp>
#include <runtime/Dispatcher.hpp>
#include <speech/NativeLog.hpp>
#include <speech/Recognizer.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace vosklink
{

/// @brief Recognizer defaults section.
struct RecognizerDefaults
{
    float sampleRate = 16000.0f;
    RecognizerOptions options;

    /// @brief Bytes per acceptWaveform() call when streaming a file.
    std::size_t chunkSize = 8000;
};

/// @brief Top-level library configuration.
struct LibraryConfig
{
    /// @brief libvosk verbosity applied at initialization; silent by default.
    int nativeLogLevel = NativeLogSilent;

    /// @brief Verbosity of vosklink's own messages.
    log::Level logLevel = log::Level::Info;

    /// @brief Default model directory, may be empty.
    std::string modelPath;

    DispatcherConfig dispatcher;
    RecognizerDefaults recognizer;
};

/// @brief Loads the configuration from the default config path, or defaults if there is none.
[[nodiscard]] auto loadConfig() -> Result<LibraryConfig>;

/// @brief Loads the configuration from a specific file path.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<LibraryConfig>;

/// @brief Saves the configuration to a file, creating the parent directory if needed.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const LibraryConfig& config) -> VoidResult;

/// @brief Returns the default config file path.
/// On Linux: $XDG_CONFIG_HOME/vosklink/config.json or ~/.config/vosklink/config.json
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Applies the log levels of @p config. Safe to call again later.
void initialize(const LibraryConfig& config);

} // namespace vosklink
