// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <optional>
#include <string_view>

namespace supervox
{

/// @brief Container format of the audio sent for transcription.
enum class AudioFormat
{
    Wav,
    Mp3,
    Opus,
};

/// @brief Returns the format's name, which is also its file extension.
[[nodiscard]] constexpr auto audioFormatName(AudioFormat format) -> std::string_view
{
    switch (format)
    {
        case AudioFormat::Wav: return "wav";
        case AudioFormat::Mp3: return "mp3";
        case AudioFormat::Opus: return "opus";
    }
    return "wav";
}

/// @brief Parses "wav", "mp3" or "opus".
[[nodiscard]] constexpr auto parseAudioFormat(std::string_view name) -> std::optional<AudioFormat>
{
    if (name == "wav")
        return AudioFormat::Wav;
    if (name == "mp3")
        return AudioFormat::Mp3;
    if (name == "opus")
        return AudioFormat::Opus;
    return std::nullopt;
}

} // namespace supervox
