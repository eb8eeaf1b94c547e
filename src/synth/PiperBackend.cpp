// SPDX-License-Identifier: Apache-2.0
#include "PiperBackend.hpp"

#include <core/Log.hpp>
#include <text/Sentences.hpp>
#include <text/Utf8.hpp>

#include <format>
#include <mutex>
#include <string>
#include <vector>

extern "C"
{
#include <piper.h>
}

namespace readalong
{

namespace
{

    /// @brief Piper output format: float32 PCM, 22050 Hz, mono.
    constexpr auto PiperSampleRate = 22050u;
    constexpr auto PiperChannels = 1u;

    constexpr auto PiperOk = 0;
    constexpr auto PiperDone = 1;

    struct SynthesizerDeleter
    {
        void operator()(piper_synthesizer* synth) const noexcept { piper_free(synth); }
    };

    using SynthesizerPtr = std::unique_ptr<piper_synthesizer, SynthesizerDeleter>;

} // namespace

struct PiperBackend::Impl
{
    PiperBackendConfig config;

    // piper synthesizers are not reentrant; all synthesis runs under this lock.
    std::mutex mutex;
    std::map<std::string, SynthesizerPtr> synthesizers;

    /// @brief Returns the synthesizer for @p modelPath, creating it on first use. Requires the lock.
    auto synthesizerFor(const std::string& modelPath) -> Result<piper_synthesizer*>
    {
        if (auto it = synthesizers.find(modelPath); it != synthesizers.end())
            return it->second.get();

        auto const configPath = modelPath + ".json";
        auto const& espeakData =
            config.espeakDataPath.empty() ? std::string(PIPER_ESPEAK_DATA_DIR) : config.espeakDataPath;

        auto synth = SynthesizerPtr { piper_create(modelPath.c_str(), configPath.c_str(), espeakData.c_str()) };
        if (!synth)
            return makeError(ErrorCode::SynthesisError,
                             std::format("Failed to create piper synthesizer (model: {}, config: {}, espeak: {})",
                                         modelPath,
                                         configPath,
                                         espeakData));

        log::info("Piper voice loaded (model: {}, espeak: {})", modelPath, espeakData);
        auto* raw = synth.get();
        synthesizers.emplace(modelPath, std::move(synth));
        return raw;
    }

    /// @brief Synthesizes one sentence and appends its samples to @p audio.
    static auto synthesizeSentence(piper_synthesizer* synth, const std::string& text, double rate, AudioClip& audio)
        -> VoidResult
    {
        auto opts = piper_default_synthesize_options(synth);
        opts.length_scale = static_cast<float>(opts.length_scale / rate);

        auto const startResult = piper_synthesize_start(synth, text.c_str(), &opts);
        if (startResult != PiperOk)
            return makeError(ErrorCode::SynthesisError,
                             std::format("piper_synthesize_start failed ({})", startResult));

        auto chunk = piper_audio_chunk {};
        while (true)
        {
            auto const rc = piper_synthesize_next(synth, &chunk);
            if (rc == PiperDone)
                break;
            if (rc < 0)
                return makeError(ErrorCode::SynthesisError, std::format("piper_synthesize_next failed ({})", rc));
            audio.samples.insert(audio.samples.end(), chunk.samples, chunk.samples + chunk.num_samples);
        }
        return {};
    }
};

PiperBackend::PiperBackend(PiperBackendConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

PiperBackend::~PiperBackend() = default;

auto PiperBackend::resolveModelPath(const std::string& voice) const -> std::string
{
    if (auto it = _impl->config.voices.find(voice); it != _impl->config.voices.end())
        return it->second;
    return voice;
}

auto PiperBackend::voices() const -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    names.reserve(_impl->config.voices.size());
    for (auto const& [alias, _]: _impl->config.voices)
        names.push_back(alias);
    return names;
}

auto PiperBackend::synthesize(const Segment& segment, const VoiceSettings& voice, std::stop_token stopToken)
    -> Result<SynthesisOutput>
{
    auto const modelPath = resolveModelPath(voice.voice);
    if (modelPath.empty())
        return makeError(ErrorCode::SynthesisError, "no voice configured");

    auto output = SynthesisOutput {};
    output.audio.sampleRate = PiperSampleRate;
    output.audio.channels = PiperChannels;

    auto lock = std::lock_guard(_impl->mutex);
    auto synth = _impl->synthesizerFor(modelPath);
    if (!synth)
        return std::unexpected(synth.error());

    std::string_view const text = segment.text;
    auto pos = std::size_t { 0 };
    while (pos < text.size())
    {
        if (stopToken.stop_requested())
            return makeError(ErrorCode::Cancelled, std::format("segment {} cancelled", segment.id));

        while (pos < text.size() && utf8::isSpace(text[pos]))
            ++pos;
        if (pos >= text.size())
            break;

        auto const end = nextSentenceEnd(text, pos);
        output.hints.push_back(BoundaryHint { .segmentId = segment.id,
                                              .chunkRelativeTextOffset = pos,
                                              .chunkRelativeAudioTime = output.audio.duration() });

        auto const sentence = std::string(text.substr(pos, end - pos));
        if (auto result = Impl::synthesizeSentence(*synth, sentence, voice.rate, output.audio); !result)
            return makeError(result.error().code, std::format("segment {}: {}", segment.id, result.error().message));
        pos = end;
    }

    log::debug("Piper: segment {} synthesized ({} hints, {:.2f}s)",
               segment.id,
               output.hints.size(),
               output.audio.duration());
    return output;
}

} // namespace readalong
