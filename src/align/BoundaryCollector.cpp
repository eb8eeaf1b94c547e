// SPDX-License-Identifier: Apache-2.0
#include <align/BoundaryCollector.hpp>
#include <core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace readalong
{

namespace
{
    /// @brief Start times closer than this to the previous end are not reported as overlaps.
    constexpr auto OverlapTolerance = 1e-6;

    void report(Timeline& timeline, Error issue)
    {
        log::warning("{}", issue);
        timeline.issues.push_back(std::move(issue));
    }
} // namespace

auto sortAndDeduplicate(std::vector<BoundaryHint> hints) -> std::vector<BoundaryHint>
{
    std::ranges::stable_sort(hints, {}, &BoundaryHint::chunkRelativeTextOffset);
    auto const duplicates = std::ranges::unique(hints, {}, &BoundaryHint::chunkRelativeTextOffset);
    hints.erase(duplicates.begin(), duplicates.end());
    return hints;
}

BoundaryCollector::BoundaryCollector(std::span<const Segment> segments): _segments(segments)
{
}

auto BoundaryCollector::collect(std::span<const SegmentOutcome> outcomes) const -> Timeline
{
    auto timeline = Timeline {};
    timeline.segmentStarts.resize(_segments.size(), 0.0);

    // Index outcomes by segment id; emission order across segments is irrelevant.
    auto bySegment = std::vector<const SegmentOutcome*>(_segments.size(), nullptr);
    for (auto const& outcome: outcomes)
    {
        if (outcome.segmentId >= _segments.size())
        {
            report(timeline,
                   Error { ErrorCode::AlignmentError,
                           std::format("Timing reported for unknown segment {}", outcome.segmentId) });
            continue;
        }
        if (!bySegment[outcome.segmentId])
            bySegment[outcome.segmentId] = &outcome;
    }

    auto previousEnd = 0.0;
    for (auto index = std::size_t { 0 }; index < _segments.size(); ++index)
    {
        auto const& segment = _segments[index];
        auto const* outcome = bySegment[index];
        auto const* timing = outcome && outcome->timing ? &*outcome->timing : nullptr;

        if (!outcome)
            report(timeline,
                   Error { ErrorCode::SynthesisError, std::format("Segment {} produced no outcome", segment.id) });
        else if (!outcome->timing)
            report(timeline, outcome->timing.error());

        auto start = timing && timing->startTime ? *timing->startTime : previousEnd;
        if (!std::isfinite(start) || start < previousEnd - OverlapTolerance)
        {
            report(timeline,
                   Error { ErrorCode::AlignmentError,
                           std::format("Segment {} starts at {:.3f}s before the previous end {:.3f}s; clamped",
                                       segment.id,
                                       start,
                                       previousEnd) });
            start = previousEnd;
        }
        start = std::max(start, previousEnd);

        auto duration = timing ? timing->duration : 0.0;
        if (!std::isfinite(duration) || duration < 0.0)
        {
            report(timeline,
                   Error { ErrorCode::AlignmentError,
                           std::format("Segment {} reports an invalid duration {}; treated as 0",
                                       segment.id,
                                       duration) });
            duration = 0.0;
        }

        timeline.segmentStarts[index] = start;
        previousEnd = start + duration;

        if (!timing || timing->hints.empty())
        {
            log::debug("Segment {} contributes no anchors; its words will be interpolated", segment.id);
            continue;
        }

        for (auto const& hint: sortAndDeduplicate(timing->hints))
        {
            if (hint.chunkRelativeTextOffset >= segment.text.size() || !std::isfinite(hint.chunkRelativeAudioTime)
                || hint.chunkRelativeAudioTime < 0.0)
            {
                report(timeline,
                       Error { ErrorCode::AlignmentError,
                               std::format("Segment {} hint at offset {} / {:.3f}s is out of range; dropped",
                                           segment.id,
                                           hint.chunkRelativeTextOffset,
                                           hint.chunkRelativeAudioTime) });
                continue;
            }

            timeline.anchors.push_back(Anchor {
                .textOffset = segment.normalizedOffsetStart + hint.chunkRelativeTextOffset,
                .audioTime = start + hint.chunkRelativeAudioTime,
            });
        }
    }

    timeline.totalDuration = previousEnd;
    log::debug("Collected {} anchor(s) over {} segment(s), {:.3f}s total",
               timeline.anchors.size(),
               _segments.size(),
               timeline.totalDuration);
    return timeline;
}

} // namespace readalong
