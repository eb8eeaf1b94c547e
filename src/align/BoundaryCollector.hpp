// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cstddef>
#include <optional>
#include <span>
#include <vector>

namespace readalong
{

/// @brief Timing information the synthesis backend produced for one segment.
struct SegmentTiming
{
    /// @brief Audio length of the segment in seconds.
    double duration = 0.0;

    /// @brief Playback start of the segment, if the caller knows it.
    ///
    /// When absent the collector uses the sum of the preceding segments' durations.
    std::optional<double> startTime;

    /// @brief Boundary hints in emission order (not trusted to be sorted or unique).
    std::vector<BoundaryHint> hints;
};

/// @brief Outcome of synthesizing one segment; a failure carries a SynthesisError.
struct SegmentOutcome
{
    std::size_t segmentId = 0;
    Result<SegmentTiming> timing;
};

/// @brief The merged, global timeline of all segments.
struct Timeline
{
    /// @brief Anchors ordered by segment, then by text offset.
    std::vector<Anchor> anchors;

    /// @brief Effective playback start of every segment, indexed by segment id.
    std::vector<double> segmentStarts;

    /// @brief End of the last segment's audio.
    double totalDuration = 0.0;

    /// @brief Recoverable problems encountered while merging (SynthesisError, AlignmentError).
    std::vector<Error> issues;
};

/// @brief Merges per-segment boundary hints into one global, ordered anchor sequence.
///
/// The merge is a pure reduction: outcomes may be supplied in any order (as
/// they complete on a worker pool) and the result depends only on their
/// content. A failed segment is treated exactly like a segment with no hints.
/// Segment ids are their positions in the sequence, as produced by SegmentSplitter.
class BoundaryCollector
{
  public:
    explicit BoundaryCollector(std::span<const Segment> segments);

    /// @brief Collects the timeline.
    /// @param outcomes One outcome per segment, in any order; segments without an outcome count as failed.
    [[nodiscard]] auto collect(std::span<const SegmentOutcome> outcomes) const -> Timeline;

  private:
    std::span<const Segment> _segments;
};

/// @brief Sorts one segment's hints by text offset (stable) and drops repeated offsets.
[[nodiscard]] auto sortAndDeduplicate(std::vector<BoundaryHint> hints) -> std::vector<BoundaryHint>;

} // namespace readalong
