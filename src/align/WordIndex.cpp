// SPDX-License-Identifier: Apache-2.0
#include <align/WordIndex.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace readalong
{

WordIndex::WordIndex(std::vector<WordEntry> entries, double duration):
    _entries(std::move(entries)), _duration(duration)
{
}

auto WordIndex::wordAt(double audioTime) const -> std::optional<std::size_t>
{
    if (_entries.empty() || !std::isfinite(audioTime) || audioTime < _entries.front().audioStart)
        return std::nullopt;

    auto const it = std::ranges::upper_bound(_entries, audioTime, {}, &WordEntry::audioStart);
    return static_cast<std::size_t>(std::distance(_entries.begin(), it)) - 1;
}

auto WordIndex::startTimeOf(std::size_t wordIndex) const -> Result<double>
{
    if (wordIndex >= _entries.size())
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Word index {} out of range (index has {} words)", wordIndex, _entries.size()));
    return _entries[wordIndex].audioStart;
}

auto WordIndex::wordAtNormalizedOffset(std::size_t offset) const -> std::optional<std::size_t>
{
    auto const it = std::ranges::partition_point(
        _entries, [offset](const WordEntry& entry) { return entry.normalizedRange.end <= offset; });
    if (it == _entries.end())
        return std::nullopt;
    return static_cast<std::size_t>(std::distance(_entries.begin(), it));
}

auto WordIndex::interpolatedCount() const noexcept -> std::size_t
{
    return static_cast<std::size_t>(std::ranges::count_if(_entries, &WordEntry::interpolated));
}

auto WordIndex::validate() const -> VoidResult
{
    for (auto i = std::size_t { 0 }; i < _entries.size(); ++i)
    {
        auto const& entry = _entries[i];
        if (entry.wordIndex != i)
            return makeError(ErrorCode::AlignmentError,
                             std::format("Entry {} carries word index {}", i, entry.wordIndex));
        if (entry.audioEnd < entry.audioStart)
            return makeError(ErrorCode::AlignmentError,
                             std::format("Word {} ends at {:.3f}s before it starts at {:.3f}s",
                                         i,
                                         entry.audioEnd,
                                         entry.audioStart));
        if (i > 0 && entry.audioStart < _entries[i - 1].audioStart)
            return makeError(ErrorCode::AlignmentError,
                             std::format("Word {} starts at {:.3f}s before word {} at {:.3f}s",
                                         i,
                                         entry.audioStart,
                                         i - 1,
                                         _entries[i - 1].audioStart));
    }
    return {};
}

WordIndexBuilder::WordIndexBuilder(WordIndexOptions options): _options(options)
{
}

auto WordIndexBuilder::estimateDuration(std::size_t textLength) const -> double
{
    auto const charsPerSecond = _options.charsPerSecond > 0.0 ? _options.charsPerSecond : 15.0;
    return static_cast<double>(textLength) / charsPerSecond;
}

auto WordIndexBuilder::build(std::span<const Word> words,
                             std::span<const Anchor> anchorsIn,
                             std::optional<double> totalDuration,
                             std::size_t textLength) const -> WordIndex
{
    auto const durationKnown = totalDuration && std::isfinite(*totalDuration) && *totalDuration > 0.0;

    if (words.empty())
        return WordIndex({}, durationKnown ? *totalDuration : 0.0);

    textLength = std::max(textLength, words.back().normalizedRange.end);

    auto anchors = std::vector<Anchor> {};
    anchors.reserve(anchorsIn.size());
    for (auto const& anchor: anchorsIn)
    {
        if (anchor.textOffset < textLength && std::isfinite(anchor.audioTime) && anchor.audioTime >= 0.0)
            anchors.push_back(anchor);
    }
    std::ranges::stable_sort(anchors, {}, &Anchor::textOffset);

    auto entries = std::vector<WordEntry> {};
    entries.reserve(words.size());
    for (auto const& word: words)
    {
        entries.push_back(WordEntry {
            .wordIndex = entries.size(),
            .text = word.text,
            .normalizedRange = word.normalizedRange,
            .originalRange = word.originalRange,
            .audioStart = 0.0,
            .audioEnd = 0.0,
            .interpolated = true,
        });
    }

    // Total backend failure: spread the duration uniformly over the words.
    if (anchors.empty())
    {
        auto const duration = durationKnown ? *totalDuration : estimateDuration(textLength);
        auto const slice = duration / static_cast<double>(entries.size());
        for (auto i = std::size_t { 0 }; i < entries.size(); ++i)
        {
            entries[i].audioStart = slice * static_cast<double>(i);
            entries[i].audioEnd = i + 1 == entries.size() ? duration : slice * static_cast<double>(i + 1);
        }
        log::debug("No anchors: {} word(s) spread uniformly over {:.3f}s", entries.size(), duration);
        return WordIndex(std::move(entries), duration);
    }

    // Seconds per spoken byte, for extrapolating past the last anchor when the duration is unknown.
    auto secondsPerByte = 1.0 / (_options.charsPerSecond > 0.0 ? _options.charsPerSecond : 15.0);
    if (anchors.size() >= 2 && anchors.back().textOffset > anchors.front().textOffset
        && anchors.back().audioTime > anchors.front().audioTime)
    {
        secondsPerByte = (anchors.back().audioTime - anchors.front().audioTime)
                         / static_cast<double>(anchors.back().textOffset - anchors.front().textOffset);
    }

    auto const lastAnchorTime = std::ranges::max(anchors, {}, &Anchor::audioTime).audioTime;
    auto const endTime =
        durationKnown ? std::max(*totalDuration, lastAnchorTime)
                      : anchors.back().audioTime
                            + static_cast<double>(textLength - anchors.back().textOffset) * secondsPerByte;

    auto const origin = Anchor { .textOffset = 0, .audioTime = 0.0 };
    auto const terminus = Anchor { .textOffset = textLength, .audioTime = endTime };

    for (auto& entry: entries)
    {
        auto const range = entry.normalizedRange;
        auto const it = std::ranges::lower_bound(anchors, range.start, {}, &Anchor::textOffset);

        if (it != anchors.end() && it->textOffset < range.end)
        {
            entry.audioStart = it->audioTime;
            entry.interpolated = false;
            continue;
        }

        auto const& before = it == anchors.begin() ? origin : *std::prev(it);
        auto const& after = it == anchors.end() ? terminus : *it;
        if (after.textOffset <= before.textOffset)
        {
            entry.audioStart = before.audioTime;
            continue;
        }

        auto const fraction = static_cast<double>(range.start - before.textOffset)
                              / static_cast<double>(after.textOffset - before.textOffset);
        entry.audioStart = before.audioTime + (after.audioTime - before.audioTime) * fraction;
    }

    // Enforce the timeline invariant: starts never decrease.
    auto clamped = std::size_t { 0 };
    auto floor = 0.0;
    for (auto& entry: entries)
    {
        if (entry.audioStart < floor)
        {
            entry.audioStart = floor;
            ++clamped;
        }
        floor = entry.audioStart;
    }
    if (clamped > 0)
        log::debug("Clamped {} word start(s) to keep the timeline monotonic", clamped);

    for (auto i = std::size_t { 0 }; i + 1 < entries.size(); ++i)
        entries[i].audioEnd = entries[i + 1].audioStart;
    entries.back().audioEnd = std::max(endTime, entries.back().audioStart);

    auto const duration = std::max(durationKnown ? *totalDuration : endTime, entries.back().audioEnd);
    auto index = WordIndex(std::move(entries), duration);
    log::debug("Built word index: {} word(s), {} interpolated, {:.3f}s",
               index.size(),
               index.interpolatedCount(),
               index.duration());
    return index;
}

auto toJson(const WordIndex& index) -> nlohmann::json
{
    auto words = nlohmann::json::array();
    for (auto const& entry: index.entries())
    {
        words.push_back({
            { "index", entry.wordIndex },
            { "text", entry.text },
            { "start", entry.audioStart },
            { "end", entry.audioEnd },
            { "interpolated", entry.interpolated },
            { "normalized", { entry.normalizedRange.start, entry.normalizedRange.end } },
            { "original", { entry.originalRange.start, entry.originalRange.end } },
        });
    }

    return nlohmann::json {
        { "duration", index.duration() },
        { "words", std::move(words) },
    };
}

} // namespace readalong
