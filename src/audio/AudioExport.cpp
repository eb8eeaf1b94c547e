// SPDX-License-Identifier: Apache-2.0
#include "AudioExport.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <format>

namespace readalong
{

auto concatenate(std::span<const AudioClip> clips) -> Result<ConcatenatedAudio>
{
    auto result = ConcatenatedAudio {};
    result.segmentStartFrames.reserve(clips.size());

    auto formatKnown = false;
    auto totalSamples = std::size_t { 0 };
    for (auto const& clip: clips)
    {
        totalSamples += clip.samples.size();
        if (clip.empty())
            continue;
        if (!formatKnown)
        {
            result.audio.sampleRate = clip.sampleRate;
            result.audio.channels = clip.channels;
            formatKnown = true;
        }
        else if (clip.sampleRate != result.audio.sampleRate || clip.channels != result.audio.channels)
        {
            return makeError(ErrorCode::AudioError,
                             std::format("cannot join {}Hz/{}ch audio with {}Hz/{}ch audio",
                                         clip.sampleRate,
                                         clip.channels,
                                         result.audio.sampleRate,
                                         result.audio.channels));
        }
    }

    result.audio.samples.reserve(totalSamples);
    for (auto const& clip: clips)
    {
        result.segmentStartFrames.push_back(result.audio.frameCount());
        result.audio.samples.insert(result.audio.samples.end(), clip.samples.begin(), clip.samples.end());
    }
    return result;
}

auto exportWav(const AudioClip& clip, const std::filesystem::path& path) -> VoidResult
{
    if (clip.channels == 0 || clip.sampleRate == 0)
        return makeError(ErrorCode::ExportError, "audio has no valid format");

    auto config = ma_encoder_config_init(ma_encoding_format_wav, ma_format_f32, clip.channels, clip.sampleRate);
    auto encoder = ma_encoder {};
    auto const pathString = path.string();

    auto const initResult = ma_encoder_init_file(pathString.c_str(), &config, &encoder);
    if (initResult != MA_SUCCESS)
        return makeError(ErrorCode::ExportError,
                         std::format("Failed to open {} for writing: {}", pathString, static_cast<int>(initResult)));

    auto framesWritten = ma_uint64 { 0 };
    auto const writeResult =
        ma_encoder_write_pcm_frames(&encoder, clip.samples.data(), clip.frameCount(), &framesWritten);
    ma_encoder_uninit(&encoder);

    if (writeResult != MA_SUCCESS || framesWritten != clip.frameCount())
        return makeError(ErrorCode::ExportError,
                         std::format("Failed to write {}: {} of {} frames written",
                                     pathString,
                                     framesWritten,
                                     clip.frameCount()));

    log::info("Exported {:.2f}s of audio to {}", clip.duration(), pathString);
    return {};
}

} // namespace readalong
