// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioPlayer.hpp>

#include <chrono>
#include <memory>

namespace readalong
{

/// @brief Plays a loaded clip through the default playback device using miniaudio.
///
/// Uses PIMPL to isolate miniaudio headers from consumers. The cursor is
/// fractional so that rate changes resample by linear interpolation; a
/// ticker thread reports the position every @c positionInterval while playing.
class MiniaudioPlayer final: public AudioPlayer
{
  public:
    explicit MiniaudioPlayer(std::chrono::milliseconds positionInterval = std::chrono::milliseconds(50));
    ~MiniaudioPlayer() override;

    MiniaudioPlayer(const MiniaudioPlayer&) = delete;
    MiniaudioPlayer& operator=(const MiniaudioPlayer&) = delete;

    [[nodiscard]] auto load(AudioClip clip) -> VoidResult override;
    [[nodiscard]] auto play() -> VoidResult override;
    void pause() override;
    [[nodiscard]] auto seek(double seconds) -> VoidResult override;
    [[nodiscard]] auto setRate(double multiplier) -> VoidResult override;
    void setPositionCallback(PositionCallback callback) override;
    [[nodiscard]] auto position() const -> double override;
    [[nodiscard]] auto duration() const -> double override;
    void waitUntilFinished() override;
    void stop() override;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace readalong
