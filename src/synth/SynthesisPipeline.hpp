// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <align/WordIndex.hpp>
#include <core/Error.hpp>
#include <core/Types.hpp>
#include <sync/Generation.hpp>
#include <synth/SynthesisBackend.hpp>
#include <text/TextNormalizer.hpp>

#include <cstdint>
#include <functional>
#include <memory>
#include <string_view>
#include <vector>

namespace readalong
{

/// @brief Tuning for one SynthesisPipeline.
struct PipelineOptions
{
    NormalizerOptions normalizer;
    std::size_t maxSegmentChars = 2000;

    /// @brief Upper bound on segments synthesized at once.
    std::size_t maxConcurrency = 2;

    WordIndexOptions index;
};

/// @brief Everything one generation produced.
struct GenerationResult
{
    std::uint64_t generation = 0;
    NormalizedText text;
    std::vector<Segment> segments;

    /// @brief Audio of each segment, in segment order; failed segments have an empty clip.
    std::vector<AudioClip> clips;

    /// @brief All clips joined; its timeline matches the WordIndex.
    AudioClip audio;

    std::vector<double> segmentStarts;
    std::shared_ptr<const WordIndex> index;

    /// @brief Recoverable SynthesisError and AlignmentError entries.
    std::vector<Error> issues;
};

/// @brief Called after each segment completes, from the worker that finished it.
using ProgressCallback = std::function<void(std::size_t completed, std::size_t total)>;

/// @brief Runs one document through normalization, splitting, synthesis, collection and indexing.
///
/// Segments are synthesized concurrently on at most maxConcurrency worker
/// threads. The result does not depend on completion order. A failed segment
/// degrades to an unanchored stretch of the index and an entry in issues.
class SynthesisPipeline
{
  public:
    SynthesisPipeline(std::shared_ptr<SynthesisBackend> backend, PipelineOptions options = {});

    /// @brief Builds a generation.
    /// @param source Raw document text.
    /// @param voice Voice and synthesis rate.
    /// @param ticket Generation identity; a stop request aborts with Cancelled.
    /// @param progress Optional progress callback.
    /// @return The generation, or NormalizationError / InvalidArgument / Cancelled / AudioError.
    [[nodiscard]] auto run(std::string_view source,
                           const VoiceSettings& voice,
                           const GenerationTicket& ticket,
                           const ProgressCallback& progress = {}) const -> Result<GenerationResult>;

    [[nodiscard]] auto options() const noexcept -> const PipelineOptions& { return _options; }

  private:
    std::shared_ptr<SynthesisBackend> _backend;
    PipelineOptions _options;
};

} // namespace readalong
