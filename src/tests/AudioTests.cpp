// SPDX-License-Identifier: Apache-2.0
#include <audio/AudioExport.hpp>
#include <audio/MiniaudioPlayer.hpp>
#include <synth/SynthesisBackend.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <cmath>
#include <chrono>
#include <filesystem>

using namespace readalong;

namespace
{
auto makeClip(std::size_t frames, std::uint32_t sampleRate = 1000, std::uint32_t channels = 1) -> AudioClip
{
    auto clip = AudioClip {};
    clip.sampleRate = sampleRate;
    clip.channels = channels;
    clip.samples.assign(frames * channels, 0.5f);
    return clip;
}
} // namespace

TEST_CASE("concatenate joins clips in order", "[audio]")
{
    auto const clips = std::array { makeClip(100), AudioClip {}, makeClip(50) };

    auto const joined = concatenate(clips);
    REQUIRE(joined.has_value());
    CHECK(joined->audio.sampleRate == 1000);
    CHECK(joined->audio.frameCount() == 150);
    CHECK(joined->segmentStartFrames == std::vector<std::size_t> { 0, 100, 100 });
}

TEST_CASE("concatenate of nothing is empty", "[audio]")
{
    auto const joined = concatenate({});
    REQUIRE(joined.has_value());
    CHECK(joined->audio.empty());
    CHECK(joined->segmentStartFrames.empty());
}

TEST_CASE("concatenate rejects mismatched formats", "[audio]")
{
    SECTION("sample rate")
    {
        auto const clips = std::array { makeClip(10, 22050), makeClip(10, 16000) };
        auto const joined = concatenate(clips);
        REQUIRE(!joined.has_value());
        CHECK(joined.error().code == ErrorCode::AudioError);
    }

    SECTION("channels")
    {
        auto const clips = std::array { makeClip(10, 22050, 1), makeClip(10, 22050, 2) };
        auto const joined = concatenate(clips);
        REQUIRE(!joined.has_value());
        CHECK(joined.error().code == ErrorCode::AudioError);
    }
}

TEST_CASE("exportWav writes a file", "[audio]")
{
    auto const path = std::filesystem::temp_directory_path() / "readalong_export_test.wav";
    std::filesystem::remove(path);

    auto const result = exportWav(makeClip(1000), path);
    REQUIRE(result.has_value());
    REQUIRE(std::filesystem::exists(path));
    // 1000 float frames plus the header.
    CHECK(std::filesystem::file_size(path) > 4000);

    std::filesystem::remove(path);
}

TEST_CASE("exportWav reports errors", "[audio]")
{
    SECTION("invalid format")
    {
        auto clip = makeClip(10);
        clip.sampleRate = 0;
        auto const result = exportWav(clip, std::filesystem::temp_directory_path() / "readalong_invalid.wav");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ExportError);
    }

    SECTION("unwritable path")
    {
        auto const result = exportWav(makeClip(10), "/nonexistent/directory/out.wav");
        REQUIRE(!result.has_value());
        CHECK(result.error().code == ErrorCode::ExportError);
    }
}

TEST_CASE("Playing silent audio finishes at once", "[audio]")
{
    // A generation whose every segment failed joins into an empty clip.
    auto const joined = concatenate(std::array { AudioClip {}, AudioClip {} });
    REQUIRE(joined.has_value());
    REQUIRE(joined->audio.empty());

    auto player = MiniaudioPlayer(std::chrono::milliseconds(5));
    REQUIRE(player.load(joined->audio).has_value());
    REQUIRE(player.play().has_value());
    player.waitUntilFinished();

    CHECK(player.position() == 0.0);
    CHECK(player.duration() == 0.0);
    player.stop();
}

TEST_CASE("Rate multipliers are checked before any synthesis", "[audio]")
{
    SECTION("playback speed lies in (0, 4]")
    {
        CHECK(validatePlaybackRate(1.0).has_value());
        CHECK(validatePlaybackRate(4.0).has_value());
        for (auto const speed: { 0.0, -1.0, 4.5, std::nan("") })
        {
            auto const valid = validatePlaybackRate(speed);
            REQUIRE(!valid.has_value());
            CHECK(valid.error().code == ErrorCode::InvalidArgument);
        }
    }

    SECTION("synthesis rate lies in (0, 2]")
    {
        CHECK(validateSynthesisRate(2.0).has_value());
        CHECK(validateSynthesisRate(0.0).error().code == ErrorCode::InvalidArgument);
        CHECK(validateSynthesisRate(2.01).error().code == ErrorCode::InvalidArgument);
    }

    SECTION("the player refuses an out-of-range speed")
    {
        auto player = MiniaudioPlayer();
        CHECK(player.setRate(0.0).error().code == ErrorCode::InvalidArgument);
        CHECK(player.setRate(2.0).has_value());
    }
}
