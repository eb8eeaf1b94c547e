// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <cstddef>
#include <map>
#include <string>
#include <string_view>

namespace readalong
{

/// @brief Synthesis configuration section.
struct SynthesisConfig
{
    /// @brief Default voice alias (or model path).
    std::string voice = "alloy";

    /// @brief Speaking-rate multiplier, 0 < rate <= 2.
    double rate = 1.0;

    std::size_t maxSegmentChars = 2000;
    std::size_t maxConcurrency = 2;

    /// @brief Path to the espeak-ng-data directory (optional, defaults to built-in).
    std::string espeakDataPath;

    /// @brief Voice aliases mapped to piper voice models (.onnx files).
    std::map<std::string, std::string> voices = defaultVoices();

    /// @brief The built-in alias table, pointing into defaultVoiceDir().
    [[nodiscard]] static auto defaultVoices() -> std::map<std::string, std::string>;
};

/// @brief Text normalizer configuration section.
struct NormalizerConfig
{
    bool markdown = true;
    bool headingContext = true;
    bool describeCode = true;
    bool stripEmoji = true;
};

/// @brief Word index configuration section.
struct IndexConfig
{
    double charsPerSecond = 15.0;
};

/// @brief Playback synchronization configuration section.
struct SyncSettings
{
    double jitterTolerance = 0.25;
    std::size_t positionIntervalMs = 50;
};

/// @brief Top-level application configuration.
struct AppConfig
{
    SynthesisConfig synthesis;
    NormalizerConfig normalizer;
    IndexConfig index;
    SyncSettings sync;
};

/// @brief Loads the application configuration from the default config path.
/// @return The loaded configuration, defaults if no file exists, or an error.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads the application configuration from a specific file path.
/// @param path The path to the config file.
/// @return The loaded configuration or an error.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Saves the application configuration to a file.
/// @param path The path to the config file.
/// @param config The configuration to save.
/// @return Success or an error.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Returns the default data directory path for the current platform.
/// On Linux: $XDG_DATA_HOME/readalong or ~/.local/share/readalong
/// On macOS: ~/Library/Application Support/readalong
/// On Windows: %APPDATA%\readalong
[[nodiscard]] auto defaultDataDir() -> std::string;

/// @brief Returns the directory the built-in voice aliases point into.
[[nodiscard]] auto defaultVoiceDir() -> std::string;

} // namespace readalong
