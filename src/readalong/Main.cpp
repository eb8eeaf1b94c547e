// SPDX-License-Identifier: Apache-2.0
#include <audio/AudioPlayer.hpp>
#include <core/Log.hpp>
#include <readalong/App.hpp>
#include <readalong/Config.hpp>
#include <synth/SynthesisBackend.hpp>

#include <CLI/CLI.hpp>

#include <format>

int main(int argc, char** argv)
{
    auto app = CLI::App { "readalong: read Markdown documents aloud with word-level highlighting" };

    auto options = readalong::RunOptions {};
    auto configPath = std::string {};
    auto voice = std::string {};
    auto rate = 1.0;
    auto logLevel = std::string {};
    auto startWord = std::size_t { 0 };
    auto noPlay = false;
    auto plain = false;
    auto listVoices = false;
    auto verbose = false;

    app.add_option("input", options.inputPath, "Markdown or text file to read aloud");
    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_option("--voice", voice, "Voice alias or piper model path");
    auto* rateOption = app.add_option("--rate", rate, "Synthesis speaking rate (0 < rate <= 2)");
    app.add_option("--speed", options.speed, "Playback speed multiplier (0 < speed <= 4)");
    app.add_option("--export", options.exportPath, "Write the synthesized audio as WAV");
    app.add_option("--dump-index", options.dumpIndexPath, "Write the word timing index as JSON ('-' for stdout)");
    auto* startWordOption = app.add_option("--start-word", startWord, "Start playback at this word index");
    app.add_option("--log-level", logLevel, "Log level (error|warning|info|debug|trace)");
    app.add_flag("--no-play", noPlay, "Synthesize only, do not play");
    app.add_flag("--plain", plain, "Treat the input as plain text instead of Markdown");
    app.add_flag("--list-voices", listVoices, "List the configured voice aliases and exit");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");

    CLI11_PARSE(app, argc, argv);

    if (verbose)
        readalong::log::setLevel(readalong::log::Level::Debug);
    if (!logLevel.empty())
    {
        auto const level = readalong::log::levelFromString(logLevel);
        if (!level)
        {
            readalong::log::error("Unknown log level: {}", logLevel);
            return 1;
        }
        readalong::log::setLevel(*level);
    }
    readalong::log::debug("Log level: {}", readalong::log::levelName(readalong::log::getLevel()));

    // Load config
    auto configResult = configPath.empty() ? readalong::loadConfig() : readalong::loadConfigFromFile(configPath);

    if (!configResult)
    {
        readalong::log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }

    auto& config = *configResult;

    // Apply CLI overrides
    if (!voice.empty())
        config.synthesis.voice = voice;
    if (*rateOption)
    {
        if (auto valid = readalong::validateSynthesisRate(rate); !valid)
        {
            readalong::log::error("--rate: {}", valid.error().message);
            return 1;
        }
        config.synthesis.rate = rate;
    }
    if (auto valid = readalong::validatePlaybackRate(options.speed); !valid)
    {
        readalong::log::error("--speed: {}", valid.error().message);
        return 1;
    }
    if (plain)
        config.normalizer.markdown = false;
    if (*startWordOption)
        options.startWord = startWord;
    options.play = !noPlay;

    auto application = readalong::App(std::move(config));
    if (listVoices)
    {
        application.listVoices();
        return 0;
    }

    if (options.inputPath.empty())
    {
        readalong::log::error("No input file given (see --help)");
        return 1;
    }

    auto initResult = application.initialize();
    if (!initResult)
    {
        readalong::log::error("Initialization failed: {}", initResult.error().message);
        return 1;
    }

    return application.run(options);
}
