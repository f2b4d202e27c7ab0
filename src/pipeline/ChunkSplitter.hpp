// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>
#include <core/Error.hpp>

#include <cstddef>
#include <vector>

namespace supervox
{

/// @brief A frame range of a finished recording.
struct Chunk
{
    std::size_t index = 0;
    std::size_t startFrame = 0;
    std::size_t endFrame = 0; ///< Exclusive.
    double startSeconds = 0.0;
    double endSeconds = 0.0;

    [[nodiscard]] auto frameCount() const -> std::size_t { return endFrame - startFrame; }
    [[nodiscard]] auto duration() const -> double { return endSeconds - startSeconds; }
};

/// @brief Slices recordings into overlapping windows.
///
/// Boundaries are computed in whole frames: a window is round(chunkDuration * rate)
/// frames long and consecutive windows start round((chunkDuration - chunkOverlap) * rate)
/// frames apart, so neighbours overlap by exactly round(chunkOverlap * rate) frames.
class ChunkSplitter
{
  public:
    ChunkSplitter(double chunkDuration, double chunkOverlap);

    /// @brief Checks 0 <= chunkOverlap < chunkDuration and chunkDuration > 0.
    [[nodiscard]] static auto validate(double chunkDuration, double chunkOverlap) -> VoidResult;

    /// @brief Computes the chunk layout for a buffer.
    ///
    /// A buffer no longer than chunkDuration yields one chunk covering all of it.
    /// Otherwise the last chunk is clipped to the buffer end. A chunk only starts when the
    /// previous window ends before the buffer does, so the last chunk is always longer
    /// than the overlap.
    /// @return The chunks in index order, or InvalidArgument for an unusable configuration.
    [[nodiscard]] auto split(const AudioBuffer& buffer) const -> Result<std::vector<Chunk>>;

    /// @brief Copies a chunk's samples into a standalone buffer.
    [[nodiscard]] static auto extract(const AudioBuffer& buffer, const Chunk& chunk) -> AudioBuffer;

    [[nodiscard]] auto chunkDuration() const noexcept -> double { return _chunkDuration; }
    [[nodiscard]] auto chunkOverlap() const noexcept -> double { return _chunkOverlap; }

  private:
    double _chunkDuration;
    double _chunkOverlap;
};

} // namespace supervox
