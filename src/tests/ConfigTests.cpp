// SPDX-License-Identifier: Apache-2.0
#include <readalong/Config.hpp>

#include <catch2/catch_test_macros.hpp>
#include <catch2/generators/catch_generators.hpp>

#include <filesystem>
#include <fstream>

using namespace readalong;

namespace
{
auto writeTempConfig(std::string_view name, std::string_view content) -> std::filesystem::path
{
    auto const path = std::filesystem::temp_directory_path() / name;
    auto file = std::ofstream(path);
    file << content;
    return path;
}
} // namespace

TEST_CASE("defaultConfigPath returns a path ending with config.json", "[config]")
{
    REQUIRE(!defaultConfigDir().empty());
    REQUIRE(defaultConfigPath().ends_with("config.json"));
}

TEST_CASE("defaultVoiceDir lies under the data dir", "[config]")
{
    auto const voiceDir = defaultVoiceDir();
    REQUIRE(voiceDir.starts_with(defaultDataDir()));
    REQUIRE(voiceDir.ends_with("voices"));
}

TEST_CASE("AppConfig has expected defaults", "[config]")
{
    auto const config = AppConfig {};
    CHECK(config.synthesis.voice == "alloy");
    CHECK(config.synthesis.rate == 1.0);
    CHECK(config.synthesis.maxSegmentChars == 2000);
    CHECK(config.synthesis.maxConcurrency == 2);
    CHECK(config.normalizer.markdown);
    CHECK(config.normalizer.headingContext);
    CHECK(config.index.charsPerSecond == 15.0);
    CHECK(config.sync.jitterTolerance == 0.25);
    CHECK(config.sync.positionIntervalMs == 50);

    REQUIRE(config.synthesis.voices.size() == 11);
    REQUIRE(config.synthesis.voices.contains("nova"));
    CHECK(config.synthesis.voices.at("nova").starts_with(defaultVoiceDir()));
    CHECK(config.synthesis.voices.at("nova").ends_with(".onnx"));
}

TEST_CASE("loadConfigFromFile parses every section", "[config]")
{
    auto const tempPath = writeTempConfig("readalong_test_config.json", R"({
        "synthesis": {
            "voice": "reader",
            "rate": 1.5,
            "maxSegmentChars": 500,
            "maxConcurrency": 4,
            "espeakDataPath": "/opt/espeak-ng-data",
            "voices": {
                "reader": "/tmp/reader.onnx",
                "alloy": "/tmp/alloy.onnx"
            }
        },
        "normalizer": {
            "markdown": false,
            "headingContext": false,
            "describeCode": false,
            "stripEmoji": false
        },
        "index": { "charsPerSecond": 12.5 },
        "sync": { "jitterTolerance": 0.1, "positionIntervalMs": 20 }
    })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());
    auto const& config = *result;

    SECTION("synthesis")
    {
        CHECK(config.synthesis.voice == "reader");
        CHECK(config.synthesis.rate == 1.5);
        CHECK(config.synthesis.maxSegmentChars == 500);
        CHECK(config.synthesis.maxConcurrency == 4);
        CHECK(config.synthesis.espeakDataPath == "/opt/espeak-ng-data");
    }

    SECTION("voice aliases extend and override the built-in table")
    {
        CHECK(config.synthesis.voices.at("reader") == "/tmp/reader.onnx");
        CHECK(config.synthesis.voices.at("alloy") == "/tmp/alloy.onnx");
        CHECK(config.synthesis.voices.contains("echo"));
        CHECK(config.synthesis.voices.size() == 12);
    }

    SECTION("normalizer")
    {
        CHECK(!config.normalizer.markdown);
        CHECK(!config.normalizer.headingContext);
        CHECK(!config.normalizer.describeCode);
        CHECK(!config.normalizer.stripEmoji);
    }

    SECTION("index and sync")
    {
        CHECK(config.index.charsPerSecond == 12.5);
        CHECK(config.sync.jitterTolerance == 0.1);
        CHECK(config.sync.positionIntervalMs == 20);
    }

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile keeps defaults for missing sections", "[config]")
{
    auto const tempPath = writeTempConfig("readalong_test_partial.json", R"({ "synthesis": { "rate": 0.8 } })");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(result.has_value());
    CHECK(result->synthesis.rate == 0.8);
    CHECK(result->synthesis.voice == "alloy");
    CHECK(result->normalizer.markdown);
    CHECK(result->sync.positionIntervalMs == 50);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile rejects invalid values", "[config]")
{
    auto const content = GENERATE(as<std::string> {},
                                  R"({ "synthesis": { "rate": 0 } })",
                                  R"({ "synthesis": { "rate": 2.5 } })",
                                  R"({ "synthesis": { "maxSegmentChars": 0 } })",
                                  R"({ "synthesis": { "maxConcurrency": 0 } })",
                                  R"({ "index": { "charsPerSecond": 0 } })",
                                  R"({ "sync": { "jitterTolerance": -1 } })",
                                  R"({ "sync": { "positionIntervalMs": 0 } })",
                                  R"([1, 2, 3])");
    auto const tempPath = writeTempConfig("readalong_test_invalid_value.json", content);

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("loadConfigFromFile returns error for non-existent file", "[config]")
{
    auto result = loadConfigFromFile("/nonexistent/path/config.json");
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);
}

TEST_CASE("loadConfigFromFile returns error for invalid JSON", "[config]")
{
    auto const tempPath = writeTempConfig("readalong_test_invalid.json", "{ invalid json }}}");

    auto result = loadConfigFromFile(tempPath.string());
    REQUIRE(!result.has_value());
    CHECK(result.error().code == ErrorCode::ConfigError);

    std::filesystem::remove(tempPath);
}

TEST_CASE("saveConfigToFile writes a valid config that can be loaded back", "[config]")
{
    auto const tempPath = std::filesystem::temp_directory_path() / "readalong_save_test" / "config.json";

    auto config = AppConfig {};
    config.synthesis.voice = "shimmer";
    config.synthesis.rate = 1.25;
    config.synthesis.voices["custom"] = "/tmp/custom.onnx";
    config.normalizer.describeCode = false;
    config.index.charsPerSecond = 18.0;
    config.sync.positionIntervalMs = 100;

    auto saveResult = saveConfigToFile(tempPath.string(), config);
    REQUIRE(saveResult.has_value());

    auto loadResult = loadConfigFromFile(tempPath.string());
    REQUIRE(loadResult.has_value());
    CHECK(loadResult->synthesis.voice == "shimmer");
    CHECK(loadResult->synthesis.rate == 1.25);
    CHECK(loadResult->synthesis.voices.at("custom") == "/tmp/custom.onnx");
    CHECK(!loadResult->normalizer.describeCode);
    CHECK(loadResult->index.charsPerSecond == 18.0);
    CHECK(loadResult->sync.positionIntervalMs == 100);

    std::filesystem::remove_all(tempPath.parent_path());
}
