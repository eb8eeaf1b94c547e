// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <nlohmann/json.hpp>

#include <cmath>
#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace readalong
{

namespace
{

    /// @brief Rejects values the pipeline cannot work with.
    auto validate(const AppConfig& config) -> VoidResult
    {
        auto const& synthesis = config.synthesis;
        if (!std::isfinite(synthesis.rate) || synthesis.rate <= 0.0 || synthesis.rate > 2.0)
            return makeError(ErrorCode::ConfigError,
                             std::format("synthesis.rate must lie in (0, 2], got {}", synthesis.rate));
        if (synthesis.maxSegmentChars == 0)
            return makeError(ErrorCode::ConfigError, "synthesis.maxSegmentChars must be positive");
        if (synthesis.maxConcurrency == 0)
            return makeError(ErrorCode::ConfigError, "synthesis.maxConcurrency must be positive");
        if (!(config.index.charsPerSecond > 0.0))
            return makeError(ErrorCode::ConfigError, "index.charsPerSecond must be positive");
        if (!(config.sync.jitterTolerance >= 0.0))
            return makeError(ErrorCode::ConfigError, "sync.jitterTolerance must not be negative");
        if (config.sync.positionIntervalMs == 0)
            return makeError(ErrorCode::ConfigError, "sync.positionIntervalMs must be positive");
        return {};
    }

} // namespace

auto SynthesisConfig::defaultVoices() -> std::map<std::string, std::string>
{
    auto const dir = defaultVoiceDir();
    auto model = [&](std::string_view name) { return std::format("{}/{}.onnx", dir, name); };
    return {
        { "alloy", model("en_US-amy-medium") },
        { "ash", model("en_US-ryan-medium") },
        { "ballad", model("en_GB-alan-medium") },
        { "coral", model("en_GB-jenny_dioco-medium") },
        { "echo", model("en_US-joe-medium") },
        { "fable", model("en_GB-southern_english_female-low") },
        { "nova", model("en_US-lessac-medium") },
        { "onyx", model("en_US-john-medium") },
        { "sage", model("en_US-kristin-medium") },
        { "shimmer", model("en_US-hfc_female-medium") },
        { "verse", model("en_US-bryce-medium") },
    };
}

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\readalong";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/readalong";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig)
        return std::string(xdgConfig) + "/readalong";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/readalong";
    return ".";
#endif
}

auto defaultDataDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\readalong";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/readalong";
    return ".";
#else
    auto const* const xdgData = std::getenv("XDG_DATA_HOME");
    if (xdgData)
        return std::string(xdgData) + "/readalong";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.local/share/readalong";
    return ".";
#endif
}

auto defaultVoiceDir() -> std::string
{
    return defaultDataDir() + "/voices";
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    auto const content = ss.str();

    auto parseResult = json::parse(content);
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto const& root = *parseResult;
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, std::format("Config file {} is not a JSON object", path));

    auto config = AppConfig {};

    // Synthesis section
    if (root.contains("synthesis"))
    {
        auto const& synthesis = root["synthesis"];
        config.synthesis.voice = json::getStringOr(synthesis, "voice", config.synthesis.voice);
        config.synthesis.rate = json::getDoubleOr(synthesis, "rate", config.synthesis.rate);
        config.synthesis.maxSegmentChars =
            json::getSizeOr(synthesis, "maxSegmentChars", config.synthesis.maxSegmentChars);
        config.synthesis.maxConcurrency =
            json::getSizeOr(synthesis, "maxConcurrency", config.synthesis.maxConcurrency);
        config.synthesis.espeakDataPath = json::getStringOr(synthesis, "espeakDataPath", "");

        // Configured aliases extend and override the built-in table.
        for (auto& [alias, model]: json::getStringMap(synthesis, "voices"))
            config.synthesis.voices[alias] = std::move(model);
    }

    // Normalizer section
    if (root.contains("normalizer"))
    {
        auto const& normalizer = root["normalizer"];
        config.normalizer.markdown = json::getBoolOr(normalizer, "markdown", true);
        config.normalizer.headingContext = json::getBoolOr(normalizer, "headingContext", true);
        config.normalizer.describeCode = json::getBoolOr(normalizer, "describeCode", true);
        config.normalizer.stripEmoji = json::getBoolOr(normalizer, "stripEmoji", true);
    }

    // Index section
    if (root.contains("index"))
        config.index.charsPerSecond = json::getDoubleOr(root["index"], "charsPerSecond", 15.0);

    // Sync section
    if (root.contains("sync"))
    {
        auto const& sync = root["sync"];
        config.sync.jitterTolerance = json::getDoubleOr(sync, "jitterTolerance", 0.25);
        config.sync.positionIntervalMs = json::getSizeOr(sync, "positionIntervalMs", 50);
    }

    if (auto valid = validate(config); !valid)
        return std::unexpected(valid.error());

    return config;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    auto root = nlohmann::json::object();

    // Synthesis section
    auto synthesis = nlohmann::json::object();
    synthesis["voice"] = config.synthesis.voice;
    synthesis["rate"] = config.synthesis.rate;
    synthesis["maxSegmentChars"] = config.synthesis.maxSegmentChars;
    synthesis["maxConcurrency"] = config.synthesis.maxConcurrency;
    if (!config.synthesis.espeakDataPath.empty())
        synthesis["espeakDataPath"] = config.synthesis.espeakDataPath;
    auto voices = nlohmann::json::object();
    for (auto const& [alias, model]: config.synthesis.voices)
        voices[alias] = model;
    synthesis["voices"] = std::move(voices);
    root["synthesis"] = std::move(synthesis);

    // Normalizer section
    auto normalizer = nlohmann::json::object();
    normalizer["markdown"] = config.normalizer.markdown;
    normalizer["headingContext"] = config.normalizer.headingContext;
    normalizer["describeCode"] = config.normalizer.describeCode;
    normalizer["stripEmoji"] = config.normalizer.stripEmoji;
    root["normalizer"] = std::move(normalizer);

    root["index"] = nlohmann::json { { "charsPerSecond", config.index.charsPerSecond } };

    auto sync = nlohmann::json::object();
    sync["jitterTolerance"] = config.sync.jitterTolerance;
    sync["positionIntervalMs"] = config.sync.positionIntervalMs;
    root["sync"] = std::move(sync);

    // Create parent directory if needed
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

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

} // namespace readalong
