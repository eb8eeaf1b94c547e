// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <synth/SynthesisBackend.hpp>

#include <map>
#include <memory>
#include <string>

namespace readalong
{

/// @brief Configuration for the piper synthesis backend.
struct PiperBackendConfig
{
    /// @brief Voice aliases mapped to piper voice models (.onnx files).
    ///
    /// Names not found here are used verbatim as model paths.
    std::map<std::string, std::string> voices;

    /// @brief Path to the espeak-ng-data directory (defaults to built-in).
    std::string espeakDataPath;
};

/// @brief Synthesizes speech using the piper library (linked at build time).
///
/// Each segment is synthesized sentence by sentence; the start of every
/// sentence is reported as a boundary hint. Synthesizers are created lazily,
/// one per voice model, and shared by all workers under a lock.
class PiperBackend final: public SynthesisBackend
{
  public:
    explicit PiperBackend(PiperBackendConfig config);
    ~PiperBackend() override;

    PiperBackend(const PiperBackend&) = delete;
    PiperBackend& operator=(const PiperBackend&) = delete;

    [[nodiscard]] auto synthesize(const Segment& segment, const VoiceSettings& voice, std::stop_token stopToken)
        -> Result<SynthesisOutput> override;

    [[nodiscard]] auto voices() const -> std::vector<std::string> override;

    /// @brief Resolves a voice alias to the model path it refers to.
    [[nodiscard]] auto resolveModelPath(const std::string& voice) const -> std::string;

    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace readalong
