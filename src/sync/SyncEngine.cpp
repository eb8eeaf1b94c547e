// SPDX-License-Identifier: Apache-2.0
#include <audio/AudioPlayer.hpp>
#include <core/Log.hpp>
#include <sync/SyncEngine.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace readalong
{

SyncEngine::SyncEngine(SyncConfig config, HighlightCallback callback):
    _config { config }, _callback { std::move(callback) }
{
}

void SyncEngine::setCallback(HighlightCallback callback)
{
    auto lock = std::lock_guard(_mutex);
    _callback = std::move(callback);
}

auto SyncEngine::attach(std::shared_ptr<const WordIndex> index, std::uint64_t generation) -> VoidResult
{
    if (!index)
        return makeError(ErrorCode::InvalidArgument, "cannot attach an empty word index");

    auto lock = std::lock_guard(_mutex);
    if (generation < _generation)
        return makeError(ErrorCode::StaleGeneration,
                         std::format("generation {} is older than the attached generation {}",
                                     generation,
                                     _generation));

    _index = std::move(index);
    _generation = generation;
    _phase = PlaybackPhase::Idle;
    _state = PlaybackState {};
    _pendingRewind.reset();
    log::debug("Sync: attached generation {} ({} words, {:.2f}s)", generation, _index->size(), _index->duration());
    return {};
}

void SyncEngine::detach(std::uint64_t generation)
{
    auto lock = std::lock_guard(_mutex);
    if (generation < _generation)
        return;
    _index.reset();
    _generation = generation;
    _phase = PlaybackPhase::Idle;
    _state = PlaybackState {};
    _pendingRewind.reset();
}

auto SyncEngine::play() -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (!_index)
        return makeError(ErrorCode::NotReadyError, "no word index for the current generation");

    switch (_phase)
    {
        case PlaybackPhase::Idle:
            _state = PlaybackState {};
            [[fallthrough]];
        case PlaybackPhase::Paused:
            _phase = PlaybackPhase::Playing;
            _state.isPlaying = true;
            break;
        case PlaybackPhase::Seeking: _resumePhase = PlaybackPhase::Playing; break;
        case PlaybackPhase::Playing: break;
    }
    return {};
}

auto SyncEngine::pause() -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    switch (_phase)
    {
        case PlaybackPhase::Idle: return makeError(ErrorCode::NotReadyError, "cannot pause: playback is idle");
        case PlaybackPhase::Playing:
            _phase = PlaybackPhase::Paused;
            _state.isPlaying = false;
            break;
        case PlaybackPhase::Seeking: _resumePhase = PlaybackPhase::Paused; break;
        case PlaybackPhase::Paused: break;
    }
    return {};
}

void SyncEngine::stop()
{
    auto lock = std::lock_guard(_mutex);
    _phase = PlaybackPhase::Idle;
    _state = PlaybackState {};
    _pendingRewind.reset();
}

auto SyncEngine::beginSeek() -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    switch (_phase)
    {
        case PlaybackPhase::Idle:
            if (!_index)
                return makeError(ErrorCode::NotReadyError, "no word index for the current generation");
            // Seeking before playback starts positions the paused cursor.
            _resumePhase = PlaybackPhase::Paused;
            break;
        case PlaybackPhase::Playing:
        case PlaybackPhase::Paused: _resumePhase = _phase; break;
        case PlaybackPhase::Seeking: return {};
    }
    _phase = PlaybackPhase::Seeking;
    _state.isPlaying = false;
    return {};
}

auto SyncEngine::completeSeek(double audioTime) -> VoidResult
{
    auto lock = std::lock_guard(_mutex);
    if (_phase != PlaybackPhase::Seeking)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("completeSeek in phase {}", phaseName(_phase)));
    if (!std::isfinite(audioTime))
        return makeError(ErrorCode::InvalidArgument, "seek target is not a finite time");

    _phase = _resumePhase;
    _state.isPlaying = _phase == PlaybackPhase::Playing;
    _state.currentAudioTime = std::clamp(audioTime, 0.0, _index->duration());
    _pendingRewind.reset();
    log::debug("Sync: seek to {:.3f}s", _state.currentAudioTime);
    resolveAndEmit();
    return {};
}

auto SyncEngine::seek(double audioTime) -> VoidResult
{
    if (auto result = beginSeek(); !result)
        return result;
    return completeSeek(audioTime);
}

auto SyncEngine::seekTargetForWord(std::size_t wordIndex) const -> Result<double>
{
    auto lock = std::lock_guard(_mutex);
    if (!_index)
        return makeError(ErrorCode::NotReadyError, "no word index for the current generation");
    return _index->startTimeOf(wordIndex);
}

void SyncEngine::reportPosition(double audioTime, std::uint64_t generation)
{
    auto lock = std::lock_guard(_mutex);
    if (generation != _generation || !_index)
    {
        log::trace("Sync: dropping position from generation {} (current {})", generation, _generation);
        return;
    }
    if (_phase == PlaybackPhase::Idle || _phase == PlaybackPhase::Seeking)
        return;
    if (!std::isfinite(audioTime))
        return;

    audioTime = std::max(audioTime, 0.0);
    if (audioTime < _state.currentAudioTime)
    {
        if (_state.currentAudioTime - audioTime <= _config.jitterTolerance)
            return;

        if (!_pendingRewind)
        {
            // A single large backward report is treated as out-of-order delivery.
            _pendingRewind = audioTime;
            log::trace("Sync: holding back backward report {:.3f}s", audioTime);
            return;
        }
        log::debug("Sync: player rewound to {:.3f}s", audioTime);
    }
    _pendingRewind.reset();
    _state.currentAudioTime = audioTime;
    resolveAndEmit();
}

auto SyncEngine::setRate(double multiplier) -> VoidResult
{
    if (auto valid = validatePlaybackRate(multiplier); !valid)
        return valid;
    auto lock = std::lock_guard(_mutex);
    _rate = multiplier;
    return {};
}

auto SyncEngine::phase() const -> PlaybackPhase
{
    auto lock = std::lock_guard(_mutex);
    return _phase;
}

auto SyncEngine::state() const -> PlaybackState
{
    auto lock = std::lock_guard(_mutex);
    return _state;
}

auto SyncEngine::generation() const -> std::uint64_t
{
    auto lock = std::lock_guard(_mutex);
    return _generation;
}

auto SyncEngine::rate() const -> double
{
    auto lock = std::lock_guard(_mutex);
    return _rate;
}

auto SyncEngine::index() const -> std::shared_ptr<const WordIndex>
{
    auto lock = std::lock_guard(_mutex);
    return _index;
}

void SyncEngine::resolveAndEmit()
{
    auto const word = _index->wordAt(_state.currentAudioTime);
    if (word == _state.lastReportedWordIndex)
        return;
    _state.lastReportedWordIndex = word;

    if (!_callback)
        return;

    auto event = HighlightEvent { .generation = _generation, .wordIndex = word, .audioTime = _state.currentAudioTime };
    if (word)
    {
        auto const& entry = (*_index)[*word];
        event.originalRange = entry.originalRange;
        event.normalizedRange = entry.normalizedRange;
    }
    _callback(event);
}

} // namespace readalong
