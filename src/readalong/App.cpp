// SPDX-License-Identifier: Apache-2.0
#include "App.hpp"

#include <audio/AudioExport.hpp>
#include <audio/MiniaudioPlayer.hpp>
#include <core/Log.hpp>
#include <sync/Session.hpp>
#include <synth/PiperBackend.hpp>

#include <chrono>
#include <cstdio>
#include <format>
#include <fstream>
#include <print>
#include <sstream>
#include <string>

namespace readalong
{

namespace
{

    auto readFile(const std::string& path) -> Result<std::string>
    {
        auto file = std::ifstream(path, std::ios::binary);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot open input file: {}", path));

        auto ss = std::stringstream {};
        ss << file.rdbuf();
        if (file.bad())
            return makeError(ErrorCode::IoError, std::format("Failed to read input file: {}", path));
        return ss.str();
    }

    auto writeIndex(const GenerationResult& generation, const std::string& path) -> VoidResult
    {
        auto const text = toJson(*generation.index).dump(2);
        if (path == "-")
        {
            std::println("{}", text);
            return {};
        }

        auto file = std::ofstream(path);
        if (!file.is_open())
            return makeError(ErrorCode::IoError, std::format("Cannot write index file: {}", path));
        file << text << '\n';
        log::info("Word index written to {}", path);
        return {};
    }

    auto toPipelineOptions(const AppConfig& config) -> PipelineOptions
    {
        return PipelineOptions {
            .normalizer = NormalizerOptions { .markdown = config.normalizer.markdown,
                                              .headingContext = config.normalizer.headingContext,
                                              .describeCode = config.normalizer.describeCode,
                                              .stripEmoji = config.normalizer.stripEmoji },
            .maxSegmentChars = config.synthesis.maxSegmentChars,
            .maxConcurrency = config.synthesis.maxConcurrency,
            .index = WordIndexOptions { .charsPerSecond = config.index.charsPerSecond },
        };
    }

} // namespace

struct App::Impl
{
    AppConfig config;
    std::shared_ptr<PiperBackend> backend;
    std::unique_ptr<Session> session;

    // Source document of the current generation, for printing highlighted words.
    std::string document;

    /// @brief Terminal highlight sink: prints each newly highlighted word with its time.
    void printHighlight(const HighlightEvent& event) const
    {
        if (!event.wordIndex)
            return;
        auto const& range = event.originalRange;
        auto const word = range.end <= document.size() ? std::string_view(document).substr(range.start, range.size())
                                                        : std::string_view {};
        std::println("[{:7.2f}s] #{:<5} {}", event.audioTime, *event.wordIndex, word);
        std::fflush(stdout);
    }

    auto playGeneration(const GenerationResult& generation, const RunOptions& options) -> VoidResult
    {
        if (generation.audio.empty())
        {
            log::warning("Generation {} produced no audio; nothing to play", generation.generation);
            return {};
        }

        auto& engine = session->engine();
        auto player = MiniaudioPlayer(std::chrono::milliseconds(config.sync.positionIntervalMs));

        if (auto result = player.load(generation.audio); !result)
            return result;
        if (auto result = player.setRate(options.speed); !result)
            return result;
        if (auto result = engine.setRate(options.speed); !result)
            return result;

        auto const generationId = generation.generation;
        player.setPositionCallback([&engine, generationId](double seconds) {
            engine.reportPosition(seconds, generationId);
        });

        if (options.startWord)
        {
            auto target = engine.seekTargetForWord(*options.startWord);
            if (!target)
                return std::unexpected(target.error());
            if (auto result = player.seek(*target); !result)
                return result;
            if (auto result = engine.seek(*target); !result)
                return result;
        }

        if (auto result = engine.play(); !result)
            return result;
        if (auto result = player.play(); !result)
            return result;

        player.waitUntilFinished();
        player.stop();
        player.setPositionCallback({});
        engine.stop();
        return {};
    }
};

App::App(AppConfig config): _impl(std::make_unique<Impl>())
{
    _impl->config = std::move(config);
}

App::~App() = default;

auto App::initialize() -> VoidResult
{
    auto const& synthesis = _impl->config.synthesis;
    _impl->backend = std::make_shared<PiperBackend>(
        PiperBackendConfig { .voices = synthesis.voices, .espeakDataPath = synthesis.espeakDataPath });

    auto pipeline = SynthesisPipeline(_impl->backend, toPipelineOptions(_impl->config));
    _impl->session = std::make_unique<Session>(
        std::move(pipeline),
        SyncConfig { .jitterTolerance = _impl->config.sync.jitterTolerance },
        [impl = _impl.get()](const HighlightEvent& event) { impl->printHighlight(event); });
    return {};
}

void App::listVoices() const
{
    for (auto const& [alias, model]: _impl->config.synthesis.voices)
        std::println("{:<10} {}", alias, model);
}

auto App::run(const RunOptions& options) -> int
{
    if (auto valid = validatePlaybackRate(options.speed); !valid)
    {
        log::error("{}", valid.error());
        return 1;
    }

    auto source = readFile(options.inputPath);
    if (!source)
    {
        log::error("{}", source.error());
        return 1;
    }
    _impl->document = std::move(*source);

    auto const voice = VoiceSettings { .voice = _impl->config.synthesis.voice, .rate = _impl->config.synthesis.rate };
    auto generation = _impl->session->generate(_impl->document, voice, [](std::size_t completed, std::size_t total) {
        log::info("Synthesized {}/{} segment(s)", completed, total);
    });
    if (!generation)
    {
        log::error("Failed to build generation: {}", generation.error());
        return 1;
    }

    auto const& result = **generation;
    for (auto const& issue: result.issues)
        log::warning("{}", issue);

    if (!options.exportPath.empty())
    {
        if (auto exported = exportWav(result.audio, options.exportPath); !exported)
        {
            log::error("{}", exported.error());
            return 1;
        }
    }

    if (!options.dumpIndexPath.empty())
    {
        if (auto written = writeIndex(result, options.dumpIndexPath); !written)
        {
            log::error("{}", written.error());
            return 1;
        }
    }

    if (!options.play)
        return 0;

    if (auto played = _impl->playGeneration(result, options); !played)
    {
        log::error("Playback failed: {}", played.error());
        return 1;
    }
    return 0;
}

} // namespace readalong
