// SPDX-License-Identifier: Apache-2.0
#include "MiniaudioPlayer.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <cmath>
#include <condition_variable>
#include <format>
#include <mutex>
#include <thread>

namespace readalong
{

struct MiniaudioPlayer::Impl
{
    ma_device device {};
    bool initialized = false;
    std::chrono::milliseconds positionInterval;

    // Playback state, guarded by mutex and shared with the device callback.
    mutable std::mutex mutex;
    std::condition_variable_any changed;
    AudioClip clip;
    double cursor = 0.0; ///< Fractional frame position.
    double rate = 1.0;
    bool playing = false;
    bool finished = false;
    bool stopped = false;
    bool endReported = true;

    std::mutex callbackMutex;
    PositionCallback positionCallback;

    std::jthread ticker;

    ~Impl()
    {
        if (initialized)
            ma_device_uninit(&device);
    }

    [[nodiscard]] auto positionSeconds() const -> double
    {
        return clip.sampleRate == 0 ? 0.0 : cursor / static_cast<double>(clip.sampleRate);
    }

    /// @brief Reports the position every interval while playing, plus once when the end is reached.
    void runTicker(const std::stop_token& stopToken)
    {
        while (!stopToken.stop_requested())
        {
            auto seconds = 0.0;
            {
                auto lock = std::unique_lock(mutex);
                changed.wait_for(lock, stopToken, positionInterval, [] { return false; });
                if (stopToken.stop_requested())
                    return;
                if (!playing && endReported)
                    continue;
                if (!playing)
                    endReported = true;
                seconds = positionSeconds();
            }

            auto lock = std::lock_guard(callbackMutex);
            if (positionCallback)
                positionCallback(seconds);
        }
    }

    /// @brief Fills one device period from the clip. Requires the lock.
    void render(float* out, ma_uint32 frameCount)
    {
        auto const channels = static_cast<std::size_t>(clip.channels);
        auto const frames = clip.frameCount();
        auto const totalSamples = static_cast<std::size_t>(frameCount) * channels;

        if (!playing)
        {
            std::fill_n(out, totalSamples, 0.0f);
            return;
        }

        for (auto frame = std::size_t { 0 }; frame < frameCount; ++frame)
        {
            auto const index = static_cast<std::size_t>(cursor);
            if (index >= frames)
            {
                std::fill_n(out + frame * channels, (frameCount - frame) * channels, 0.0f);
                cursor = static_cast<double>(frames);
                playing = false;
                finished = true;
                endReported = false;
                changed.notify_all();
                return;
            }

            auto const fraction = static_cast<float>(cursor - static_cast<double>(index));
            auto const next = std::min(index + 1, frames - 1);
            for (auto ch = std::size_t { 0 }; ch < channels; ++ch)
            {
                auto const a = clip.samples[index * channels + ch];
                auto const b = clip.samples[next * channels + ch];
                out[frame * channels + ch] = a + (b - a) * fraction;
            }
            cursor += rate;
        }
    }
};

namespace
{

    void playbackDataCallback(ma_device* device, void* output, const void* /*input*/, ma_uint32 frameCount)
    {
        auto* impl = static_cast<MiniaudioPlayer::Impl*>(device->pUserData);
        auto lock = std::lock_guard(impl->mutex);
        impl->render(static_cast<float*>(output), frameCount);
    }

} // namespace

MiniaudioPlayer::MiniaudioPlayer(std::chrono::milliseconds positionInterval): _impl(std::make_unique<Impl>())
{
    _impl->positionInterval = std::max(positionInterval, std::chrono::milliseconds(1));
    _impl->ticker = std::jthread([this](const std::stop_token& token) { _impl->runTicker(token); });
}

MiniaudioPlayer::~MiniaudioPlayer()
{
    stop();
    _impl->ticker.request_stop();
    if (_impl->ticker.joinable())
        _impl->ticker.join();
}

auto MiniaudioPlayer::load(AudioClip clip) -> VoidResult
{
    if (clip.channels == 0 || clip.sampleRate == 0)
        return makeError(ErrorCode::AudioError, "audio has no valid format");

    // Nothing to render, so no device is needed; play() completes at once.
    if (clip.empty())
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->clip = std::move(clip);
        _impl->cursor = 0.0;
        _impl->playing = false;
        _impl->finished = false;
        _impl->stopped = false;
        _impl->endReported = true;
        return {};
    }

    auto const formatChanged = !_impl->initialized || _impl->device.playback.channels != clip.channels
                               || _impl->device.sampleRate != clip.sampleRate;
    if (formatChanged)
    {
        if (_impl->initialized)
        {
            ma_device_uninit(&_impl->device);
            _impl->initialized = false;
        }

        auto config = ma_device_config_init(ma_device_type_playback);
        config.playback.format = ma_format_f32;
        config.playback.channels = clip.channels;
        config.sampleRate = clip.sampleRate;
        config.dataCallback = playbackDataCallback;
        config.pUserData = _impl.get();

        auto const result = ma_device_init(nullptr, &config, &_impl->device);
        if (result != MA_SUCCESS)
            return makeError(ErrorCode::AudioError,
                             std::format("Failed to initialize playback device: {}", static_cast<int>(result)));
        _impl->initialized = true;
        log::info("Audio playback initialized ({}Hz, {} channel(s), f32)", clip.sampleRate, clip.channels);
    }

    auto lock = std::lock_guard(_impl->mutex);
    _impl->clip = std::move(clip);
    _impl->cursor = 0.0;
    _impl->playing = false;
    _impl->finished = false;
    _impl->stopped = false;
    _impl->endReported = true;
    return {};
}

auto MiniaudioPlayer::play() -> VoidResult
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        if (_impl->clip.empty())
        {
            _impl->finished = true;
            _impl->changed.notify_all();
            return {};
        }
        if (!_impl->initialized)
            return makeError(ErrorCode::AudioError, "Playback device not initialized");
        _impl->playing = true;
        _impl->finished = false;
        _impl->stopped = false;
    }

    auto const startResult = ma_device_start(&_impl->device);
    if (startResult != MA_SUCCESS)
        return makeError(ErrorCode::AudioError,
                         std::format("Failed to start playback: {}", static_cast<int>(startResult)));
    return {};
}

void MiniaudioPlayer::pause()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->playing = false;
    }
    if (_impl->initialized)
        ma_device_stop(&_impl->device);
}

auto MiniaudioPlayer::seek(double seconds) -> VoidResult
{
    if (!std::isfinite(seconds))
        return makeError(ErrorCode::InvalidArgument, "seek target is not a finite time");

    auto lock = std::lock_guard(_impl->mutex);
    auto const frames = static_cast<double>(_impl->clip.frameCount());
    _impl->cursor = std::clamp(seconds * static_cast<double>(_impl->clip.sampleRate), 0.0, frames);
    _impl->finished = false;
    return {};
}

auto MiniaudioPlayer::setRate(double multiplier) -> VoidResult
{
    if (auto valid = validatePlaybackRate(multiplier); !valid)
        return valid;

    auto lock = std::lock_guard(_impl->mutex);
    _impl->rate = multiplier;
    return {};
}

void MiniaudioPlayer::setPositionCallback(PositionCallback callback)
{
    auto lock = std::lock_guard(_impl->callbackMutex);
    _impl->positionCallback = std::move(callback);
}

auto MiniaudioPlayer::position() const -> double
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->positionSeconds();
}

auto MiniaudioPlayer::duration() const -> double
{
    auto lock = std::lock_guard(_impl->mutex);
    return _impl->clip.duration();
}

void MiniaudioPlayer::waitUntilFinished()
{
    auto lock = std::unique_lock(_impl->mutex);
    _impl->changed.wait(lock, [this] { return _impl->finished || _impl->stopped; });
}

void MiniaudioPlayer::stop()
{
    {
        auto lock = std::lock_guard(_impl->mutex);
        _impl->playing = false;
        _impl->stopped = true;
    }
    _impl->changed.notify_all();

    if (_impl->initialized)
        ma_device_stop(&_impl->device);
}

} // namespace readalong
