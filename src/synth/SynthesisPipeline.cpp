// SPDX-License-Identifier: Apache-2.0
#include "SynthesisPipeline.hpp"

#include <align/BoundaryCollector.hpp>
#include <audio/AudioExport.hpp>
#include <core/Log.hpp>
#include <text/SegmentSplitter.hpp>
#include <text/WordTokenizer.hpp>

#include <algorithm>
#include <atomic>
#include <format>
#include <mutex>
#include <thread>

namespace readalong
{

SynthesisPipeline::SynthesisPipeline(std::shared_ptr<SynthesisBackend> backend, PipelineOptions options):
    _backend { std::move(backend) }, _options { std::move(options) }
{
}

auto SynthesisPipeline::run(std::string_view source,
                            const VoiceSettings& voice,
                            const GenerationTicket& ticket,
                            const ProgressCallback& progress) const -> Result<GenerationResult>
{
    if (!_backend)
        return makeError(ErrorCode::InvalidArgument, "no synthesis backend");
    if (auto valid = validateSynthesisRate(voice.rate); !valid)
        return std::unexpected(valid.error());

    auto result = GenerationResult { .generation = ticket.id };

    auto normalized = TextNormalizer(_options.normalizer).normalize(source);
    if (!normalized)
        return std::unexpected(normalized.error());
    result.text = std::move(*normalized);

    auto segments = SegmentSplitter(_options.maxSegmentChars).split(result.text.spoken);
    if (!segments)
        return std::unexpected(segments.error());
    result.segments = std::move(*segments);

    auto const total = result.segments.size();
    log::info("Generation {}: {} bytes of spoken text in {} segment(s)", ticket.id, result.text.spoken.size(), total);

    // Each worker writes only the slots of the segments it claimed.
    auto outcomes = std::vector<SegmentOutcome>(total);
    auto clips = std::vector<AudioClip>(total);
    auto nextSegment = std::atomic<std::size_t> { 0 };
    auto completed = std::size_t { 0 };
    auto progressMutex = std::mutex {};

    auto worker = [&](const std::stop_token& workerStop) {
        while (true)
        {
            auto const i = nextSegment.fetch_add(1);
            if (i >= total)
                return;

            auto const& segment = result.segments[i];
            outcomes[i].segmentId = segment.id;
            if (ticket.stopToken.stop_requested() || workerStop.stop_requested())
            {
                outcomes[i].timing = makeError(ErrorCode::Cancelled, "generation cancelled");
                continue;
            }

            auto output = _backend->synthesize(segment, voice, ticket.stopToken);
            if (output)
            {
                outcomes[i].timing = SegmentTiming { .duration = output->audio.duration(),
                                                     .hints = std::move(output->hints) };
                clips[i] = std::move(output->audio);
            }
            else
            {
                outcomes[i].timing = std::unexpected(output.error());
            }

            auto lock = std::lock_guard(progressMutex);
            ++completed;
            if (progress)
                progress(completed, total);
        }
    };

    {
        auto const workerCount = std::clamp<std::size_t>(_options.maxConcurrency, 1, std::max<std::size_t>(total, 1));
        auto workers = std::vector<std::jthread> {};
        workers.reserve(workerCount);
        for (auto i = std::size_t { 0 }; i < workerCount; ++i)
            workers.emplace_back(worker);
    }

    if (ticket.stopToken.stop_requested())
    {
        log::debug("Generation {} cancelled", ticket.id);
        return makeError(ErrorCode::Cancelled, std::format("generation {} cancelled", ticket.id));
    }

    auto timeline = BoundaryCollector(result.segments).collect(outcomes);
    result.segmentStarts = std::move(timeline.segmentStarts);
    result.issues = std::move(timeline.issues);

    auto joined = concatenate(clips);
    if (!joined)
        return std::unexpected(joined.error());
    for (auto i = std::size_t { 0 }; i < total; ++i)
        log::trace(
            "Segment {} starts at frame {} ({:.3f}s)", i, joined->segmentStartFrames[i], result.segmentStarts[i]);
    result.audio = std::move(joined->audio);
    result.clips = std::move(clips);

    auto const words = tokenizeWords(result.text.spoken, result.text.map);
    auto const duration =
        timeline.totalDuration > 0.0 ? std::optional<double> { timeline.totalDuration } : std::nullopt;
    auto index = WordIndexBuilder(_options.index).build(words, timeline.anchors, duration, result.text.spoken.size());
    if (auto valid = index.validate(); !valid)
    {
        log::error("Generation {}: {}", ticket.id, valid.error());
        result.issues.push_back(valid.error());
    }
    result.index = std::make_shared<const WordIndex>(std::move(index));

    log::info("Generation {}: {} word(s), {:.2f}s of audio, {} issue(s)",
              ticket.id,
              result.index->size(),
              result.index->duration(),
              result.issues.size());
    return result;
}

} // namespace readalong
