// SPDX-License-Identifier: Apache-2.0
#include <pipeline/AudioConverter.hpp>

#include <core/Log.hpp>
#include <transcript/Formatting.hpp>

#include <format>

namespace supervox
{

FfmpegConverter::FfmpegConverter(ProcessRunner runner, std::string executable):
    _runner(std::move(runner)), _executable(std::move(executable))
{
}

auto FfmpegConverter::arguments(const std::filesystem::path& input,
                                const std::filesystem::path& output,
                                AudioFormat format) -> std::vector<std::string>
{
    auto args = std::vector<std::string> { "-y", "-i", input.string() };
    switch (format)
    {
        case AudioFormat::Mp3:
            args.insert(args.end(), { "-codec:a", "libmp3lame", "-q:a", "3" });
            break;
        case AudioFormat::Opus:
            args.insert(args.end(), { "-c:a", "libopus", "-b:a", "24k" });
            break;
        case AudioFormat::Wav: break;
    }
    args.push_back(output.string());
    return args;
}

auto FfmpegConverter::convert(const std::filesystem::path& rawPath, AudioFormat format)
    -> Result<std::filesystem::path>
{
    if (format == AudioFormat::Wav)
        return rawPath;

    auto output = rawPath;
    output.replace_extension(std::string(".") + std::string(audioFormatName(format)));

    auto const config = ProcessConfig {
        .command = _executable,
        .args = arguments(rawPath, output, format),
        .env = {},
        .stdinData = {},
    };

    log::info("Converting {} to {}", rawPath.filename().string(), audioFormatName(format));
    auto result = _runner(config);
    if (!result)
        return makeError(ErrorCode::ConversionError,
                         std::format("Cannot run {}: {}. Please install ffmpeg.", _executable, result.error().message));

    if (!result->succeeded())
    {
        log::error("ffmpeg failed: {}", trim(result->stderrData));
        return makeError(ErrorCode::ConversionError,
                         std::format("ffmpeg conversion failed with code {}", result->exitCode));
    }

    return output;
}

} // namespace supervox
