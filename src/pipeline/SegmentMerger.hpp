// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <pipeline/ChunkSplitter.hpp>
#include <transcript/Types.hpp>

#include <span>
#include <string>

namespace supervox
{

/// @brief Stitches per-chunk transcriptions into one transcript of the whole recording.
///
/// Segment timestamps are shifted by their chunk's start. In the overlap between
/// chunk i-1 and chunk i, a segment starting before the overlap midpoint belongs to
/// chunk i-1 and one starting at or after it belongs to chunk i; segments are never
/// split. Speaker ids are taken as reported by each chunk and are not reconciled
/// across chunks.
class SegmentMerger
{
  public:
    /// @brief Merges results given in chunk order.
    ///
    /// Unless every chunk carries segments, the chunk texts are concatenated instead.
    /// A single chunk passes through unchanged.
    /// @return The merged transcript, or MergeInconsistency when the chunks and results
    ///         do not line up.
    [[nodiscard]] static auto merge(std::span<const Chunk> chunks, std::span<const TranscriptionResult> results)
        -> Result<MergedTranscript>;

    /// @brief Joins segment texts in order with a single space.
    [[nodiscard]] static auto segmentText(std::span<const TranscriptionSegment> segments) -> std::string;

    /// @brief Joins non-empty chunk texts with a blank line. Overlap duplicates are left in place.
    [[nodiscard]] static auto mergeTexts(std::span<const std::string> texts) -> std::string;

    /// @brief Midpoint of the overlap between two consecutive chunks, in recording time.
    [[nodiscard]] static auto overlapMidpoint(const Chunk& earlier, const Chunk& later) -> double;
};

} // namespace supervox
