// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <expected>
#include <format>
#include <string>

namespace readalong
{

/// @brief Error codes for categorizing failures across the pipeline.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    NormalizationError, ///< Malformed input text (fatal for the run).
    SynthesisError,     ///< One segment failed to synthesize (recoverable).
    AlignmentError,     ///< Timing data contradicts itself (recoverable, clamped).
    NotReadyError,      ///< Playback requested before a WordIndex exists.
    AudioError,
    ExportError,
    Cancelled,
    StaleGeneration,
};

/// @brief Returns a short human readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "Unknown";
        case ErrorCode::InvalidArgument: return "InvalidArgument";
        case ErrorCode::IoError: return "IoError";
        case ErrorCode::ConfigError: return "ConfigError";
        case ErrorCode::NormalizationError: return "NormalizationError";
        case ErrorCode::SynthesisError: return "SynthesisError";
        case ErrorCode::AlignmentError: return "AlignmentError";
        case ErrorCode::NotReadyError: return "NotReadyError";
        case ErrorCode::AudioError: return "AudioError";
        case ErrorCode::ExportError: return "ExportError";
        case ErrorCode::Cancelled: return "Cancelled";
        case ErrorCode::StaleGeneration: return "StaleGeneration";
    }
    return "Unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;
};

/// @brief Result type for operations that return a value or an error.
/// @tparam T The success value type.
template <typename T>
using Result = std::expected<T, Error>;

/// @brief Result type for operations that return no value on success.
using VoidResult = std::expected<void, Error>;

/// @brief Creates an unexpected Error value for use with std::expected.
/// @param code The error code.
/// @param message A descriptive error message.
/// @return An unexpected Error.
[[nodiscard]] inline auto makeError(ErrorCode code, std::string message) -> std::unexpected<Error>
{
    return std::unexpected<Error>(Error { code, std::move(message) });
}

} // namespace readalong

template <>
struct std::formatter<readalong::Error>: std::formatter<std::string>
{
    auto format(const readalong::Error& error, auto& ctx) const
    {
        return std::formatter<std::string>::format(
            std::format("[{}] {}", readalong::errorCodeName(error.code), error.message), ctx);
    }
};
