// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <sync/Generation.hpp>
#include <sync/SyncEngine.hpp>
#include <synth/SynthesisPipeline.hpp>

#include <memory>
#include <mutex>
#include <string_view>

namespace readalong
{

/// @brief Owns the current generation and routes its WordIndex to the sync engine.
///
/// generate() may be called again while an earlier call is still running on
/// another thread: the earlier run is cancelled and, should it complete
/// anyway, its result is dropped with StaleGeneration.
class Session
{
  public:
    explicit Session(SynthesisPipeline pipeline, SyncConfig syncConfig = {}, HighlightCallback callback = {});

    /// @brief Builds a new generation for @p source and attaches its index to the engine.
    [[nodiscard]] auto generate(std::string_view source,
                                const VoiceSettings& voice,
                                const ProgressCallback& progress = {})
        -> Result<std::shared_ptr<const GenerationResult>>;

    /// @brief Attaches a built generation and makes it current, unless a newer one has started.
    ///
    /// The stale check, the engine attach and the update of current() happen
    /// under one lock, so current() never falls back to an older generation.
    /// @return StaleGeneration if @p generation is no longer the newest.
    [[nodiscard]] auto adopt(std::shared_ptr<const GenerationResult> generation) -> VoidResult;

    /// @brief Cancels the in-flight generation, if any.
    void cancel() { _tracker.cancel(); }

    [[nodiscard]] auto engine() noexcept -> SyncEngine& { return _engine; }
    [[nodiscard]] auto pipeline() const noexcept -> const SynthesisPipeline& { return _pipeline; }

    /// @brief The most recently attached generation, or nullptr.
    [[nodiscard]] auto current() const -> std::shared_ptr<const GenerationResult>;

  private:
    SynthesisPipeline _pipeline;
    GenerationTracker _tracker;
    SyncEngine _engine;

    mutable std::mutex _mutex;
    std::shared_ptr<const GenerationResult> _current;
};

} // namespace readalong
