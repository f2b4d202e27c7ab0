// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <cstddef>
#include <expected>
#include <format>
#include <optional>
#include <string>
#include <string_view>

namespace supervox
{

/// @brief Error codes for categorizing failures across the recording pipeline.
enum class ErrorCode
{
    Unknown,
    InvalidArgument,
    IoError,
    ConfigError,
    CaptureError,
    ConversionError,
    ProviderError,
    MergeInconsistency,
    PersistenceError,
    ProcessError,
    ClipboardError,
    Cancelled,
};

/// @brief Returns a short, human-readable name for an error code.
[[nodiscard]] constexpr auto errorCodeName(ErrorCode code) -> std::string_view
{
    switch (code)
    {
        case ErrorCode::Unknown: return "unknown";
        case ErrorCode::InvalidArgument: return "invalid argument";
        case ErrorCode::IoError: return "i/o error";
        case ErrorCode::ConfigError: return "config error";
        case ErrorCode::CaptureError: return "capture error";
        case ErrorCode::ConversionError: return "conversion error";
        case ErrorCode::ProviderError: return "provider error";
        case ErrorCode::MergeInconsistency: return "merge inconsistency";
        case ErrorCode::PersistenceError: return "persistence error";
        case ErrorCode::ProcessError: return "process error";
        case ErrorCode::ClipboardError: return "clipboard error";
        case ErrorCode::Cancelled: return "cancelled";
    }
    return "unknown";
}

/// @brief Represents an error with a code and descriptive message.
struct Error
{
    ErrorCode code = ErrorCode::Unknown;
    std::string message;

    /// @brief Index of the chunk being processed when the error occurred, if any.
    std::optional<std::size_t> chunkIndex = std::nullopt;
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
    return std::unexpected<Error>(Error { .code = code, .message = std::move(message) });
}

/// @brief Creates an unexpected Error that is attributed to a specific chunk.
[[nodiscard]] inline auto makeChunkError(ErrorCode code, std::size_t chunkIndex, std::string message)
    -> std::unexpected<Error>
{
    return std::unexpected<Error>(
        Error { .code = code, .message = std::move(message), .chunkIndex = chunkIndex });
}

} // namespace supervox

template <>
struct std::formatter<supervox::Error>: std::formatter<std::string>
{
    auto format(const supervox::Error& error, auto& ctx) const
    {
        if (error.chunkIndex)
            return std::formatter<std::string>::format(std::format("[{}, chunk {}] {}",
                                                                   supervox::errorCodeName(error.code),
                                                                   *error.chunkIndex + 1,
                                                                   error.message),
                                                       ctx);
        return std::formatter<std::string>::format(
            std::format("[{}] {}", supervox::errorCodeName(error.code), error.message), ctx);
    }
};
