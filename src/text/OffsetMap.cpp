// SPDX-License-Identifier: Apache-2.0
#include "OffsetMap.hpp"

#include <algorithm>
#include <format>

namespace readalong
{

OffsetMap::OffsetMap(std::vector<OffsetRange> ranges): _ranges(std::move(ranges))
{
}

auto OffsetMap::identity(std::size_t length) -> OffsetMap
{
    if (length == 0)
        return OffsetMap {};
    return OffsetMap({ OffsetRange {
        .normalizedStart = 0, .normalizedEnd = length, .originalStart = 0, .originalEnd = length } });
}

auto OffsetMap::normalizedLength() const noexcept -> std::size_t
{
    return _ranges.empty() ? 0 : _ranges.back().normalizedEnd;
}

auto OffsetMap::find(std::size_t normalizedOffset) const -> const OffsetRange*
{
    auto it = std::upper_bound(
        _ranges.begin(), _ranges.end(), normalizedOffset, [](std::size_t offset, const OffsetRange& range) {
            return offset < range.normalizedStart;
        });

    while (it != _ranges.begin())
    {
        --it;
        if (it->normalizedStart <= normalizedOffset && normalizedOffset < it->normalizedEnd)
            return &*it;
        if (!it->isRemoved())
            break;
    }
    return nullptr;
}

auto OffsetMap::toOriginal(std::size_t normalizedOffset) const -> std::optional<std::size_t>
{
    auto const* range = find(normalizedOffset);
    if (!range)
        return std::nullopt;

    if (range->isOneToOne())
        return range->originalStart + (normalizedOffset - range->normalizedStart);
    return range->originalStart;
}

auto OffsetMap::toOriginalRange(TextRange normalized) const -> std::optional<TextRange>
{
    if (normalized.empty())
    {
        if (normalized.start == normalizedLength() && !_ranges.empty())
            return TextRange { .start = _ranges.back().originalEnd, .end = _ranges.back().originalEnd };
        auto const position = toOriginal(normalized.start);
        if (!position)
            return std::nullopt;
        return TextRange { .start = *position, .end = *position };
    }

    auto const start = toOriginal(normalized.start);
    auto const* last = find(normalized.end - 1);
    if (!start || !last)
        return std::nullopt;

    auto const end = last->isOneToOne() ? last->originalStart + (normalized.end - last->normalizedStart)
                                        : last->originalEnd;
    return TextRange { .start = *start, .end = std::max(*start, end) };
}

auto OffsetMap::toNormalized(std::size_t originalOffset) const -> std::size_t
{
    auto it = std::partition_point(_ranges.begin(), _ranges.end(), [originalOffset](const OffsetRange& range) {
        return range.originalEnd <= originalOffset;
    });

    if (it == _ranges.end())
        return normalizedLength();

    if (originalOffset < it->originalStart || !it->isOneToOne())
        return it->normalizedStart;
    return it->normalizedStart + (originalOffset - it->originalStart);
}

auto OffsetMap::validate(std::size_t normalizedLength) const -> VoidResult
{
    auto expectedStart = std::size_t { 0 };
    auto originalFloor = std::size_t { 0 };

    for (auto i = std::size_t { 0 }; i < _ranges.size(); ++i)
    {
        auto const& range = _ranges[i];
        if (range.normalizedStart != expectedStart)
            return makeError(ErrorCode::NormalizationError,
                             std::format("offset map range {} starts at {} but {} was expected",
                                         i,
                                         range.normalizedStart,
                                         expectedStart));
        if (range.normalizedEnd < range.normalizedStart || range.originalEnd < range.originalStart)
            return makeError(ErrorCode::NormalizationError, std::format("offset map range {} is inverted", i));
        if (range.originalStart < originalFloor)
            return makeError(ErrorCode::NormalizationError,
                             std::format("offset map range {} moves backwards in the original text", i));

        expectedStart = range.normalizedEnd;
        originalFloor = range.originalEnd;
    }

    if (expectedStart != normalizedLength)
        return makeError(ErrorCode::NormalizationError,
                         std::format("offset map covers {} of {} spoken bytes", expectedStart, normalizedLength));
    return {};
}

void OffsetMapBuilder::copy(std::size_t originalStart, std::size_t length)
{
    if (length == 0)
        return;
    append(OffsetRange { .normalizedStart = _normalizedLength,
                         .normalizedEnd = _normalizedLength + length,
                         .originalStart = originalStart,
                         .originalEnd = originalStart + length });
}

void OffsetMapBuilder::insert(std::size_t length, std::size_t originalPosition)
{
    if (length == 0)
        return;
    append(OffsetRange { .normalizedStart = _normalizedLength,
                         .normalizedEnd = _normalizedLength + length,
                         .originalStart = originalPosition,
                         .originalEnd = originalPosition });
}

void OffsetMapBuilder::replace(std::size_t normalizedLength, TextRange original)
{
    if (normalizedLength == 0)
    {
        remove(original);
        return;
    }
    append(OffsetRange { .normalizedStart = _normalizedLength,
                         .normalizedEnd = _normalizedLength + normalizedLength,
                         .originalStart = original.start,
                         .originalEnd = original.end });
}

void OffsetMapBuilder::remove(TextRange original)
{
    if (original.empty())
        return;
    append(OffsetRange { .normalizedStart = _normalizedLength,
                         .normalizedEnd = _normalizedLength,
                         .originalStart = original.start,
                         .originalEnd = original.end });
}

void OffsetMapBuilder::append(OffsetRange range)
{
    _normalizedLength = range.normalizedEnd;

    if (!_ranges.empty())
    {
        auto& last = _ranges.back();
        auto const adjacent =
            last.normalizedEnd == range.normalizedStart && last.originalEnd == range.originalStart;

        // Consecutive removed markup collapses into one zero-width entry.
        if (last.isRemoved() && range.isRemoved() && adjacent)
        {
            last.originalEnd = range.originalEnd;
            return;
        }

        if (last.isOneToOne() && !last.isRemoved() && range.isOneToOne() && adjacent)
        {
            last.normalizedEnd = range.normalizedEnd;
            last.originalEnd = range.originalEnd;
            return;
        }

        if (last.isInserted() && range.isInserted() && adjacent)
        {
            last.normalizedEnd = range.normalizedEnd;
            return;
        }
    }

    _ranges.push_back(range);
}

auto OffsetMapBuilder::build() && -> OffsetMap
{
    return OffsetMap(std::move(_ranges));
}

} // namespace readalong
