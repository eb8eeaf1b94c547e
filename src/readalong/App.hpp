// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <readalong/Config.hpp>

#include <memory>
#include <optional>
#include <string>

namespace readalong
{

/// @brief What a single command line invocation should do.
struct RunOptions
{
    /// @brief Markdown or plain text document to read aloud.
    std::string inputPath;

    /// @brief Write the concatenated audio as WAV here (empty: no export).
    std::string exportPath;

    /// @brief Write the WordIndex as JSON here; "-" writes to stdout (empty: no dump).
    std::string dumpIndexPath;

    /// @brief Start playback at this word instead of the beginning.
    std::optional<std::size_t> startWord;

    /// @brief Playback speed multiplier, 0 < speed <= 4.
    double speed = 1.0;

    bool play = true;
};

/// @brief Main application orchestrator that wires all components together.
class App
{
  public:
    /// @brief Constructs the application with the given configuration.
    /// @param config The application configuration.
    explicit App(AppConfig config);
    ~App();

    App(const App&) = delete;
    App& operator=(const App&) = delete;

    /// @brief Creates the synthesis backend and the session.
    /// @return Success or an error.
    [[nodiscard]] auto initialize() -> VoidResult;

    /// @brief Prints the configured voice aliases.
    void listVoices() const;

    /// @brief Builds a generation for the input document, then exports, dumps and plays it.
    /// @return Exit code (0 for success).
    [[nodiscard]] auto run(const RunOptions& options) -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace readalong
