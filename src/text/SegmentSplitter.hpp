// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstddef>
#include <string_view>
#include <vector>

namespace readalong
{

/// @brief Splits spoken text into synthesis-sized segments.
///
/// Greedy single pass: sentences (and paragraphs) are packed into a segment
/// until the next one would exceed the limit. A sentence longer than the limit
/// is cut at the last whitespace that fits; a single word longer than the limit
/// is cut at a grapheme cluster boundary. Whitespace at cut points is dropped,
/// so every segment's text equals the spoken text at
/// [normalizedOffsetStart, normalizedOffsetStart + text.size()).
/// The limit is measured in UTF-8 bytes.
class SegmentSplitter
{
  public:
    explicit SegmentSplitter(std::size_t maxChars);

    /// @brief Splits @p spoken into ordered, non-empty, non-overlapping segments.
    /// @return The segments, or InvalidArgument if the limit is zero.
    [[nodiscard]] auto split(std::string_view spoken) const -> Result<std::vector<Segment>>;

    [[nodiscard]] auto maxChars() const noexcept -> std::size_t { return _maxChars; }

  private:
    /// @brief Cut position for a chunk starting at @p start that has no sentence end within the limit.
    [[nodiscard]] auto hardCut(std::string_view spoken, std::size_t start) const -> std::size_t;

    std::size_t _maxChars;
};

} // namespace readalong
