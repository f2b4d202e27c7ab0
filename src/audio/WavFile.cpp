// SPDX-License-Identifier: Apache-2.0
#include "WavFile.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <array>
#include <format>

namespace supervox
{

namespace
{

    class ScopedEncoder
    {
      public:
        ScopedEncoder() = default;
        ~ScopedEncoder()
        {
            if (initialized)
                ma_encoder_uninit(&encoder);
        }

        ScopedEncoder(const ScopedEncoder&) = delete;
        ScopedEncoder& operator=(const ScopedEncoder&) = delete;

        ma_encoder encoder {};
        bool initialized = false;
    };

    class ScopedDecoder
    {
      public:
        ScopedDecoder() = default;
        ~ScopedDecoder()
        {
            if (initialized)
                ma_decoder_uninit(&decoder);
        }

        ScopedDecoder(const ScopedDecoder&) = delete;
        ScopedDecoder& operator=(const ScopedDecoder&) = delete;

        ma_decoder decoder {};
        bool initialized = false;
    };

} // namespace

auto writeWav(const std::filesystem::path& path, const AudioBuffer& buffer) -> VoidResult
{
    if (buffer.channels == 0 || buffer.sampleRate == 0)
        return makeError(ErrorCode::InvalidArgument, "Cannot write WAV with zero channels or sample rate");

    auto const dir = path.parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create directory '{}': {}", dir.string(), ec.message()));
    }

    auto const config =
        ma_encoder_config_init(ma_encoding_format_wav, ma_format_s16, buffer.channels, buffer.sampleRate);

    auto scoped = ScopedEncoder {};
    auto const initResult = ma_encoder_init_file(path.string().c_str(), &config, &scoped.encoder);
    if (initResult != MA_SUCCESS)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to open '{}' for writing: {}",
                                     path.string(),
                                     static_cast<int>(initResult)));
    scoped.initialized = true;

    auto written = ma_uint64 { 0 };
    auto const writeResult = ma_encoder_write_pcm_frames(
        &scoped.encoder, buffer.samples.data(), static_cast<ma_uint64>(buffer.frameCount()), &written);
    if (writeResult != MA_SUCCESS || written != buffer.frameCount())
        return makeError(ErrorCode::IoError,
                         std::format("Failed to write audio to '{}' ({} of {} frames)",
                                     path.string(),
                                     written,
                                     buffer.frameCount()));

    log::debug("Wrote {} frames to {}", written, path.string());
    return {};
}

auto readWav(const std::filesystem::path& path) -> Result<AudioBuffer>
{
    // Rate 0 keeps the file's own rate; 1 channel downmixes.
    auto const config = ma_decoder_config_init(ma_format_s16, 1, 0);

    auto scoped = ScopedDecoder {};
    auto const initResult = ma_decoder_init_file(path.string().c_str(), &config, &scoped.decoder);
    if (initResult != MA_SUCCESS)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to open '{}' for reading: {}",
                                     path.string(),
                                     static_cast<int>(initResult)));
    scoped.initialized = true;

    auto buffer = AudioBuffer { .samples = {}, .sampleRate = scoped.decoder.outputSampleRate, .channels = 1 };

    auto block = std::array<std::int16_t, 4096> {};
    while (true)
    {
        auto framesRead = ma_uint64 { 0 };
        auto const result =
            ma_decoder_read_pcm_frames(&scoped.decoder, block.data(), block.size(), &framesRead);
        if (framesRead > 0)
            buffer.append(std::span<const std::int16_t>(block.data(), static_cast<std::size_t>(framesRead)));
        if (result == MA_AT_END || framesRead == 0)
            break;
        if (result != MA_SUCCESS)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to decode '{}': {}", path.string(), static_cast<int>(result)));
    }

    return buffer;
}

} // namespace supervox
