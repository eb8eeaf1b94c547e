// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <cmath>
#include <cstdint>
#include <format>
#include <stop_token>
#include <string>
#include <vector>

namespace readalong
{

/// @brief Voice selection for one generation.
struct VoiceSettings
{
    /// @brief Voice alias or model path.
    std::string voice;

    /// @brief Speaking-rate multiplier, 0 < rate <= 2.
    double rate = 1.0;
};

/// @brief Audio and raw boundary hints produced for one segment.
struct SynthesisOutput
{
    AudioClip audio;
    std::vector<BoundaryHint> hints;
};

/// @brief Checks that a synthesis rate lies in (0, 2].
[[nodiscard]] inline auto validateSynthesisRate(double rate) -> VoidResult
{
    if (!std::isfinite(rate) || rate <= 0.0 || rate > 2.0)
        return makeError(ErrorCode::InvalidArgument, std::format("synthesis rate {} is outside (0, 2]", rate));
    return {};
}

/// @brief A text-to-speech engine that turns one segment into audio plus boundary hints.
///
/// Implementations must be safe to call from several worker threads at once.
/// Hints carry the segment's id, offsets relative to the segment text and
/// times relative to the segment's audio. A backend may emit no hints at all.
class SynthesisBackend
{
  public:
    virtual ~SynthesisBackend() = default;

    /// @brief Synthesizes one segment.
    /// @param segment The segment to speak.
    /// @param voice Voice and rate; the rate has already been validated.
    /// @param stopToken Requested when the generation is superseded; return Cancelled early.
    /// @return The audio and hints, or SynthesisError / Cancelled.
    [[nodiscard]] virtual auto synthesize(const Segment& segment,
                                          const VoiceSettings& voice,
                                          std::stop_token stopToken) -> Result<SynthesisOutput> = 0;

    /// @brief Names of the voices this backend can resolve.
    [[nodiscard]] virtual auto voices() const -> std::vector<std::string> = 0;
};

} // namespace readalong
