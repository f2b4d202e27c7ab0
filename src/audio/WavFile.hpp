// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>
#include <core/Error.hpp>

#include <filesystem>

namespace supervox
{

/// @brief Writes a buffer as a 16-bit PCM WAV file.
/// @return Success or an IoError.
[[nodiscard]] auto writeWav(const std::filesystem::path& path, const AudioBuffer& buffer) -> VoidResult;

/// @brief Decodes an audio file into mono 16-bit PCM at the file's sample rate.
///
/// Anything miniaudio can decode is accepted (WAV, MP3, FLAC); multi-channel input is downmixed.
/// @return The decoded buffer or an IoError.
[[nodiscard]] auto readWav(const std::filesystem::path& path) -> Result<AudioBuffer>;

} // namespace supervox
