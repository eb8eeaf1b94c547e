// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <text/WordTokenizer.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace readalong
{

/// @brief Timing of one spoken word.
struct WordEntry
{
    std::size_t wordIndex = 0;
    std::string text;
    TextRange normalizedRange;
    TextRange originalRange;
    double audioStart = 0.0;
    double audioEnd = 0.0;

    /// @brief True when the timing was computed rather than reported by the backend.
    bool interpolated = false;
};

/// @brief Immutable, time-ordered sequence of word timings for one generation.
///
/// Invariant: entries are ordered by wordIndex and audioStart never decreases.
/// audioEnd of an entry is the audioStart of the next one; the last entry ends
/// at the total duration.
class WordIndex
{
  public:
    WordIndex() = default;
    WordIndex(std::vector<WordEntry> entries, double duration);

    [[nodiscard]] auto entries() const noexcept -> std::span<const WordEntry> { return _entries; }
    [[nodiscard]] auto size() const noexcept -> std::size_t { return _entries.size(); }
    [[nodiscard]] auto empty() const noexcept -> bool { return _entries.empty(); }
    [[nodiscard]] auto duration() const noexcept -> double { return _duration; }
    [[nodiscard]] auto operator[](std::size_t index) const -> const WordEntry& { return _entries[index]; }

    /// @brief Resolves the word being spoken at @p audioTime.
    ///
    /// Returns nullopt before the first word starts. After the last word's end
    /// the last word is returned. Ranges are [audioStart, audioEnd); the last one
    /// is closed at both ends.
    [[nodiscard]] auto wordAt(double audioTime) const -> std::optional<std::size_t>;

    /// @brief Reverse lookup for click-to-seek: the time at which word @p wordIndex starts.
    [[nodiscard]] auto startTimeOf(std::size_t wordIndex) const -> Result<double>;

    /// @brief The word containing (or the first word after) a spoken-text offset.
    [[nodiscard]] auto wordAtNormalizedOffset(std::size_t offset) const -> std::optional<std::size_t>;

    /// @brief Number of entries whose timing was interpolated.
    [[nodiscard]] auto interpolatedCount() const noexcept -> std::size_t;

    /// @brief Verifies the ordering invariants.
    [[nodiscard]] auto validate() const -> VoidResult;

  private:
    std::vector<WordEntry> _entries;
    double _duration = 0.0;
};

/// @brief Tuning for the WordIndex builder.
struct WordIndexOptions
{
    /// @brief Speaking-rate estimate used when the total duration is unknown.
    double charsPerSecond = 15.0;
};

/// @brief Builds a WordIndex from tokenized words and timeline anchors.
///
/// Each word takes its start from the first anchor inside its span, or by
/// linear interpolation (in spoken-text offset) between the nearest anchors
/// before and after it. Without any anchor, the total duration is spread
/// uniformly over the words. The total duration is estimated when unknown.
class WordIndexBuilder
{
  public:
    explicit WordIndexBuilder(WordIndexOptions options = {});

    /// @brief Builds the index.
    /// @param words Words in spoken order.
    /// @param anchors Anchors ordered by text offset (out-of-order anchors are re-sorted).
    /// @param totalDuration Total audio length, if known (positive).
    /// @param textLength Length of the spoken text; the end of text is pinned to the total duration.
    [[nodiscard]] auto build(std::span<const Word> words,
                             std::span<const Anchor> anchors,
                             std::optional<double> totalDuration,
                             std::size_t textLength) const -> WordIndex;

    /// @brief Duration estimate for a text of @p textLength bytes.
    [[nodiscard]] auto estimateDuration(std::size_t textLength) const -> double;

  private:
    WordIndexOptions _options;
};

/// @brief Serializes a WordIndex for inspection ("--dump-index").
[[nodiscard]] auto toJson(const WordIndex& index) -> nlohmann::json;

} // namespace readalong
