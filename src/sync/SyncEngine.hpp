// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <align/WordIndex.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <string_view>

namespace readalong
{

/// @brief Playback phases of the synchronization state machine.
enum class PlaybackPhase : std::uint8_t
{
    Idle,
    Playing,
    Paused,
    Seeking,
};

[[nodiscard]] constexpr auto phaseName(PlaybackPhase phase) -> std::string_view
{
    switch (phase)
    {
        case PlaybackPhase::Idle: return "idle";
        case PlaybackPhase::Playing: return "playing";
        case PlaybackPhase::Paused: return "paused";
        case PlaybackPhase::Seeking: return "seeking";
    }
    return "unknown";
}

/// @brief Transient playback state of the current generation.
struct PlaybackState
{
    double currentAudioTime = 0.0;
    std::optional<std::size_t> lastReportedWordIndex;
    bool isPlaying = false;
};

/// @brief Sent to the UI sink whenever the highlighted word changes.
struct HighlightEvent
{
    std::uint64_t generation = 0;

    /// @brief The word to highlight, or nullopt to clear the highlight (lead-in before the first word).
    std::optional<std::size_t> wordIndex;

    TextRange originalRange;
    TextRange normalizedRange;
    double audioTime = 0.0;
};

/// @brief Receives highlight changes. Invoked with the engine's lock held: must not call back into the engine.
using HighlightCallback = std::function<void(const HighlightEvent& event)>;

/// @brief Tuning for the synchronization engine.
struct SyncConfig
{
    /// @brief Backward position jumps up to this many seconds are treated as jitter and ignored.
    ///
    /// A larger backward jump is ignored once; if the next report confirms it,
    /// it is accepted as a seek performed by the player itself.
    double jitterTolerance = 0.25;
};

/// @brief Resolves the live audio position into the word to highlight.
///
/// State machine over Idle, Playing, Paused and Seeking. Position reports may
/// arrive from the audio thread at any cadence; a highlight event is emitted
/// only when the resolved word changes. All methods are thread-safe.
class SyncEngine
{
  public:
    explicit SyncEngine(SyncConfig config = {}, HighlightCallback callback = {});

    void setCallback(HighlightCallback callback);

    /// @brief Installs the WordIndex of @p generation, discarding the previous generation's state.
    /// @return StaleGeneration if a newer generation is already attached.
    [[nodiscard]] auto attach(std::shared_ptr<const WordIndex> index, std::uint64_t generation) -> VoidResult;

    /// @brief Drops the index and playback state (a new generation has started, nothing is built yet).
    void detach(std::uint64_t generation);

    /// @brief Idle → Playing, or Paused → Playing. Fails with NotReadyError without an index.
    [[nodiscard]] auto play() -> VoidResult;

    /// @brief Playing → Paused.
    [[nodiscard]] auto pause() -> VoidResult;

    /// @brief Any phase → Idle; the playback state is discarded.
    void stop();

    /// @brief Playing/Paused → Seeking. Position reports are ignored until completeSeek().
    [[nodiscard]] auto beginSeek() -> VoidResult;

    /// @brief Seeking → the phase seeking started from, positioned at @p audioTime.
    [[nodiscard]] auto completeSeek(double audioTime) -> VoidResult;

    /// @brief beginSeek() followed by completeSeek().
    [[nodiscard]] auto seek(double audioTime) -> VoidResult;

    /// @brief Reverse lookup for click-to-seek: where playback must seek to for @p wordIndex.
    [[nodiscard]] auto seekTargetForWord(std::size_t wordIndex) const -> Result<double>;

    /// @brief Handles a position report from the audio player.
    /// @param audioTime Current playback position in seconds.
    /// @param generation The generation the player was loaded with; stale reports are dropped.
    void reportPosition(double audioTime, std::uint64_t generation);

    /// @brief Records a playback speed change. Timing lives in absolute audio time, so nothing is rebuilt.
    [[nodiscard]] auto setRate(double multiplier) -> VoidResult;

    [[nodiscard]] auto phase() const -> PlaybackPhase;
    [[nodiscard]] auto state() const -> PlaybackState;
    [[nodiscard]] auto generation() const -> std::uint64_t;
    [[nodiscard]] auto rate() const -> double;
    [[nodiscard]] auto index() const -> std::shared_ptr<const WordIndex>;

  private:
    /// @brief Resolves the current position and emits if the word changed. Requires the lock.
    void resolveAndEmit();

    SyncConfig _config;
    HighlightCallback _callback;

    mutable std::mutex _mutex;
    std::shared_ptr<const WordIndex> _index;
    std::uint64_t _generation = 0;
    PlaybackPhase _phase = PlaybackPhase::Idle;
    PlaybackPhase _resumePhase = PlaybackPhase::Paused;
    PlaybackState _state;
    std::optional<double> _pendingRewind;
    double _rate = 1.0;
};

} // namespace readalong
