// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <filesystem>
#include <span>
#include <vector>

namespace readalong
{

/// @brief Segment clips joined into one stream.
struct ConcatenatedAudio
{
    AudioClip audio;

    /// @brief Frame at which each input clip starts in @c audio.
    std::vector<std::size_t> segmentStartFrames;
};

/// @brief Joins per-segment clips in order.
///
/// Empty clips (failed segments) contribute no frames. All non-empty clips
/// must share one sample rate and channel count, otherwise AudioError.
[[nodiscard]] auto concatenate(std::span<const AudioClip> clips) -> Result<ConcatenatedAudio>;

/// @brief Writes a clip as a 32-bit float WAV file.
[[nodiscard]] auto exportWav(const AudioClip& clip, const std::filesystem::path& path) -> VoidResult;

} // namespace readalong
