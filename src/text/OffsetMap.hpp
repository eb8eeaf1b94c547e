// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstddef>
#include <optional>
#include <vector>

namespace readalong
{

/// @brief One entry of an OffsetMap.
///
/// Three shapes occur:
/// - copied text: equal widths on both sides, mapped character by character;
/// - inserted text: zero original width, every spoken character maps to @c originalStart;
/// - removed markup: zero normalized width, anchors the dropped original span at a spoken position.
/// Anything else (e.g. a whitespace run collapsed to one space) maps every spoken
/// character to the whole original span.
struct OffsetRange
{
    std::size_t normalizedStart = 0;
    std::size_t normalizedEnd = 0;
    std::size_t originalStart = 0;
    std::size_t originalEnd = 0;

    [[nodiscard]] auto normalizedSize() const noexcept -> std::size_t { return normalizedEnd - normalizedStart; }
    [[nodiscard]] auto originalSize() const noexcept -> std::size_t { return originalEnd - originalStart; }
    [[nodiscard]] auto isRemoved() const noexcept -> bool { return normalizedSize() == 0; }
    [[nodiscard]] auto isInserted() const noexcept -> bool { return originalSize() == 0 && !isRemoved(); }
    [[nodiscard]] auto isOneToOne() const noexcept -> bool { return normalizedSize() == originalSize(); }

    auto operator==(const OffsetRange&) const -> bool = default;
};

/// @brief Bidirectional map between spoken-text offsets and original-document offsets.
///
/// Ranges are sorted by normalizedStart, contiguous in normalized space, and
/// non-decreasing in original space. Lookups are binary searches.
class OffsetMap
{
  public:
    OffsetMap() = default;
    explicit OffsetMap(std::vector<OffsetRange> ranges);

    /// @brief Builds the map of an unmodified text of @p length bytes.
    [[nodiscard]] static auto identity(std::size_t length) -> OffsetMap;

    [[nodiscard]] auto ranges() const noexcept -> const std::vector<OffsetRange>& { return _ranges; }
    [[nodiscard]] auto empty() const noexcept -> bool { return _ranges.empty(); }

    /// @brief Total length of the spoken text covered by this map.
    [[nodiscard]] auto normalizedLength() const noexcept -> std::size_t;

    /// @brief Returns the range covering the given spoken character, if any.
    [[nodiscard]] auto find(std::size_t normalizedOffset) const -> const OffsetRange*;

    /// @brief Maps a spoken character to its original-document position.
    [[nodiscard]] auto toOriginal(std::size_t normalizedOffset) const -> std::optional<std::size_t>;

    /// @brief Maps a spoken span to the original-document span it was produced from.
    ///
    /// An empty span maps to an empty range at the position of its start.
    [[nodiscard]] auto toOriginalRange(TextRange normalized) const -> std::optional<TextRange>;

    /// @brief Maps an original-document position to the closest spoken-text position.
    ///
    /// Positions inside removed markup land on the spoken position the markup was removed at.
    [[nodiscard]] auto toNormalized(std::size_t originalOffset) const -> std::size_t;

    /// @brief Checks the ordering, contiguity and coverage invariants against a spoken text length.
    [[nodiscard]] auto validate(std::size_t normalizedLength) const -> VoidResult;

  private:
    std::vector<OffsetRange> _ranges;
};

/// @brief Incrementally records how a spoken text is produced from its source.
///
/// Calls must follow the original document left to right; adjacent entries of
/// the same shape are merged.
class OffsetMapBuilder
{
  public:
    /// @brief Records @p length bytes copied verbatim from @p originalStart.
    void copy(std::size_t originalStart, std::size_t length);

    /// @brief Records @p length spoken bytes that have no source text, attached at @p originalPosition.
    void insert(std::size_t length, std::size_t originalPosition);

    /// @brief Records @p normalizedLength spoken bytes standing for the whole @p original span.
    void replace(std::size_t normalizedLength, TextRange original);

    /// @brief Records an original span that produced no spoken text.
    void remove(TextRange original);

    [[nodiscard]] auto normalizedLength() const noexcept -> std::size_t { return _normalizedLength; }

    [[nodiscard]] auto build() && -> OffsetMap;

  private:
    void append(OffsetRange range);

    std::vector<OffsetRange> _ranges;
    std::size_t _normalizedLength = 0;
};

} // namespace readalong
