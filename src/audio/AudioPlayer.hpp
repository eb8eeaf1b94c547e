// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cmath>
#include <format>
#include <functional>

namespace readalong
{

/// @brief Receives the playback position in seconds of source audio.
using PositionCallback = std::function<void(double seconds)>;

/// @brief Checks that a playback speed multiplier lies in (0, 4].
[[nodiscard]] inline auto validatePlaybackRate(double multiplier) -> VoidResult
{
    if (!std::isfinite(multiplier) || multiplier <= 0.0 || multiplier > 4.0)
        return makeError(ErrorCode::InvalidArgument, std::format("playback rate {} is outside (0, 4]", multiplier));
    return {};
}

/// @brief Abstract audio player capability: load, play, pause, seek, rate and position reports.
///
/// Positions are always reported in source-audio time; a rate change alters
/// how fast the position advances, never its scale.
class AudioPlayer
{
  public:
    virtual ~AudioPlayer() = default;

    /// @brief Replaces the loaded audio and rewinds to the start (paused).
    [[nodiscard]] virtual auto load(AudioClip clip) -> VoidResult = 0;

    [[nodiscard]] virtual auto play() -> VoidResult = 0;
    virtual void pause() = 0;

    /// @brief Moves the cursor to @p seconds (clamped to the loaded audio).
    [[nodiscard]] virtual auto seek(double seconds) -> VoidResult = 0;

    /// @brief Sets the playback speed multiplier, 0 < multiplier <= 4.
    [[nodiscard]] virtual auto setRate(double multiplier) -> VoidResult = 0;

    /// @brief Installs the callback invoked periodically while playing, from a player-owned thread.
    virtual void setPositionCallback(PositionCallback callback) = 0;

    [[nodiscard]] virtual auto position() const -> double = 0;
    [[nodiscard]] virtual auto duration() const -> double = 0;

    /// @brief Blocks until the cursor reaches the end of the audio or stop() is called.
    virtual void waitUntilFinished() = 0;

    /// @brief Stops playback and wakes waitUntilFinished().
    virtual void stop() = 0;
};

} // namespace readalong
