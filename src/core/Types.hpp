// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace readalong
{

/// @brief Half-open byte range [start, end) into a UTF-8 string.
struct TextRange
{
    std::size_t start = 0;
    std::size_t end = 0;

    [[nodiscard]] constexpr auto size() const noexcept -> std::size_t { return end - start; }
    [[nodiscard]] constexpr auto empty() const noexcept -> bool { return end == start; }
    [[nodiscard]] constexpr auto contains(std::size_t offset) const noexcept -> bool
    {
        return offset >= start && offset < end;
    }

    constexpr auto operator==(const TextRange&) const -> bool = default;
};

/// @brief One chunk of spoken text submitted independently to the synthesis backend.
struct Segment
{
    std::size_t id = 0;
    std::string text;
    std::size_t normalizedOffsetStart = 0; ///< Offset of text[0] in the normalized spoken text.

    /// @brief Range this segment occupies in the normalized spoken text.
    [[nodiscard]] auto normalizedRange() const noexcept -> TextRange
    {
        return TextRange { .start = normalizedOffsetStart, .end = normalizedOffsetStart + text.size() };
    }
};

/// @brief A raw word-boundary timing hint as emitted by a synthesis backend.
///
/// Offsets and times are relative to the segment the hint belongs to. Hints are
/// not trusted to be ordered, unique or complete.
struct BoundaryHint
{
    std::size_t segmentId = 0;
    std::size_t chunkRelativeTextOffset = 0;
    double chunkRelativeAudioTime = 0.0; ///< Seconds from the start of the segment's audio.
};

/// @brief A trusted (normalized text offset, global audio time) pair.
struct Anchor
{
    std::size_t textOffset = 0;
    double audioTime = 0.0;
};

/// @brief Interleaved float32 PCM audio.
struct AudioClip
{
    std::vector<float> samples;
    std::uint32_t sampleRate = 22050;
    std::uint32_t channels = 1;

    [[nodiscard]] auto frameCount() const noexcept -> std::size_t
    {
        return channels == 0 ? 0 : samples.size() / channels;
    }

    /// @brief Duration in seconds.
    [[nodiscard]] auto duration() const noexcept -> double
    {
        return sampleRate == 0 ? 0.0 : static_cast<double>(frameCount()) / static_cast<double>(sampleRate);
    }

    [[nodiscard]] auto empty() const noexcept -> bool { return samples.empty(); }
};

} // namespace readalong
