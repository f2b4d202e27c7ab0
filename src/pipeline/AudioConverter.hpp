// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioFormat.hpp>
#include <core/Error.hpp>
#include <core/Process.hpp>

#include <filesystem>
#include <string>
#include <vector>

namespace supervox
{

/// @brief Converts a raw WAV recording into a compressed container.
class AudioConverter
{
  public:
    virtual ~AudioConverter() = default;

    /// @brief Converts rawPath to the target format next to it (same stem, new extension).
    /// @return The converted file, or a ConversionError.
    [[nodiscard]] virtual auto convert(const std::filesystem::path& rawPath, AudioFormat format)
        -> Result<std::filesystem::path> = 0;
};

/// @brief AudioConverter backed by the ffmpeg command-line tool.
///
/// mp3 is encoded with libmp3lame at VBR quality 3, opus with libopus at 24 kbit/s.
class FfmpegConverter: public AudioConverter
{
  public:
    explicit FfmpegConverter(ProcessRunner runner = runProcess, std::string executable = "ffmpeg");

    [[nodiscard]] auto convert(const std::filesystem::path& rawPath, AudioFormat format)
        -> Result<std::filesystem::path> override;

    /// @brief The ffmpeg arguments for one conversion.
    [[nodiscard]] static auto arguments(const std::filesystem::path& input,
                                        const std::filesystem::path& output,
                                        AudioFormat format) -> std::vector<std::string>;

  private:
    ProcessRunner _runner;
    std::string _executable;
};

} // namespace supervox
