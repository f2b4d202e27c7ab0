// SPDX-License-Identifier: Apache-2.0
#include "ChunkSplitter.hpp"

#include <core/Log.hpp>

#include <algorithm>
#include <cmath>
#include <format>

namespace supervox
{

namespace
{

    auto toFrames(double seconds, unsigned sampleRate) -> std::size_t
    {
        return static_cast<std::size_t>(std::llround(seconds * static_cast<double>(sampleRate)));
    }

    auto makeChunk(std::size_t index, std::size_t startFrame, std::size_t endFrame, unsigned sampleRate) -> Chunk
    {
        auto const rate = static_cast<double>(sampleRate);
        return Chunk {
            .index = index,
            .startFrame = startFrame,
            .endFrame = endFrame,
            .startSeconds = static_cast<double>(startFrame) / rate,
            .endSeconds = static_cast<double>(endFrame) / rate,
        };
    }

} // namespace

ChunkSplitter::ChunkSplitter(double chunkDuration, double chunkOverlap):
    _chunkDuration(chunkDuration), _chunkOverlap(chunkOverlap)
{
}

auto ChunkSplitter::validate(double chunkDuration, double chunkOverlap) -> VoidResult
{
    if (!(chunkDuration > 0.0))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Chunk duration must be positive, got {}", chunkDuration));
    if (chunkOverlap < 0.0 || !(chunkOverlap < chunkDuration))
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Chunk overlap must be in [0, {}), got {}", chunkDuration, chunkOverlap));
    return {};
}

auto ChunkSplitter::split(const AudioBuffer& buffer) const -> Result<std::vector<Chunk>>
{
    if (auto valid = validate(_chunkDuration, _chunkOverlap); !valid)
        return std::unexpected(valid.error());
    if (buffer.sampleRate == 0)
        return makeError(ErrorCode::InvalidArgument, "Cannot split audio with a sample rate of 0");

    auto const totalFrames = buffer.frameCount();
    auto const windowFrames = toFrames(_chunkDuration, buffer.sampleRate);
    auto const overlapFrames = toFrames(_chunkOverlap, buffer.sampleRate);

    if (totalFrames <= windowFrames)
        return std::vector<Chunk> { makeChunk(0, 0, totalFrames, buffer.sampleRate) };

    if (overlapFrames >= windowFrames)
        return makeError(ErrorCode::InvalidArgument,
                         std::format("Chunk overlap of {} frames leaves no step in a {}-frame window",
                                     overlapFrames,
                                     windowFrames));

    auto const stepFrames = windowFrames - overlapFrames;
    auto chunks = std::vector<Chunk> {};

    for (auto start = std::size_t { 0 }; start < totalFrames; start += stepFrames)
    {
        auto const end = std::min(start + windowFrames, totalFrames);
        chunks.push_back(makeChunk(chunks.size(), start, end, buffer.sampleRate));
        log::debug("Chunk {}: {:.1f}s - {:.1f}s",
                   chunks.back().index,
                   chunks.back().startSeconds,
                   chunks.back().endSeconds);

        if (end >= totalFrames)
            break;
    }

    log::info("Split {:.1f}s of audio into {} chunks of {}s with {}s overlap",
              buffer.duration(),
              chunks.size(),
              _chunkDuration,
              _chunkOverlap);
    return chunks;
}

auto ChunkSplitter::extract(const AudioBuffer& buffer, const Chunk& chunk) -> AudioBuffer
{
    auto const channels = std::max(buffer.channels, 1u);
    auto const first = std::min(chunk.startFrame * channels, buffer.samples.size());
    auto const last = std::min(chunk.endFrame * channels, buffer.samples.size());

    auto out = AudioBuffer { .samples = {}, .sampleRate = buffer.sampleRate, .channels = buffer.channels };
    out.samples.assign(buffer.samples.begin() + static_cast<std::ptrdiff_t>(first),
                       buffer.samples.begin() + static_cast<std::ptrdiff_t>(std::max(first, last)));
    return out;
}

} // namespace supervox
