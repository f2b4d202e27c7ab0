// SPDX-License-Identifier: Apache-2.0
#include "SegmentMerger.hpp"

#include <core/Log.hpp>
#include <transcript/Formatting.hpp>

#include <algorithm>
#include <format>
#include <limits>
#include <vector>

namespace supervox
{

namespace
{

    auto checkAlignment(std::span<const Chunk> chunks, std::span<const TranscriptionResult> results) -> VoidResult
    {
        if (chunks.size() != results.size())
            return makeError(ErrorCode::MergeInconsistency,
                             std::format("Got {} transcriptions for {} chunks", results.size(), chunks.size()));

        for (auto i = std::size_t { 0 }; i < chunks.size(); ++i)
        {
            if (chunks[i].index != i)
                return makeError(ErrorCode::MergeInconsistency,
                                 std::format("Chunk at position {} has index {}", i, chunks[i].index));
            if (i > 0 && chunks[i].startFrame < chunks[i - 1].startFrame)
                return makeError(ErrorCode::MergeInconsistency,
                                 std::format("Chunk {} starts before chunk {}", i, i - 1));
        }
        return {};
    }

} // namespace

auto SegmentMerger::overlapMidpoint(const Chunk& earlier, const Chunk& later) -> double
{
    return earlier.endSeconds - (earlier.endSeconds - later.startSeconds) / 2.0;
}

auto SegmentMerger::segmentText(std::span<const TranscriptionSegment> segments) -> std::string
{
    auto text = std::string {};
    for (auto const& segment: segments)
    {
        auto const piece = trim(segment.text);
        if (piece.empty())
            continue;
        if (!text.empty())
            text += ' ';
        text += piece;
    }
    return text;
}

auto SegmentMerger::mergeTexts(std::span<const std::string> texts) -> std::string
{
    auto merged = std::string {};
    for (auto const& text: texts)
    {
        auto const piece = trim(text);
        if (piece.empty())
            continue;
        if (!merged.empty())
            merged += "\n\n";
        merged += piece;
    }
    return merged;
}

auto SegmentMerger::merge(std::span<const Chunk> chunks, std::span<const TranscriptionResult> results)
    -> Result<MergedTranscript>
{
    if (auto aligned = checkAlignment(chunks, results); !aligned)
        return std::unexpected(aligned.error());

    if (chunks.empty())
        return MergedTranscript {};

    if (chunks.size() == 1)
    {
        auto const& only = results.front();
        auto merged = MergedTranscript { .segments = only.segments, .text = only.fullText };
        if (chunks.front().startSeconds != 0.0)
        {
            for (auto& segment: merged.segments)
            {
                segment.start += chunks.front().startSeconds;
                segment.end += chunks.front().startSeconds;
            }
        }
        if (merged.text.empty())
            merged.text = segmentText(merged.segments);
        return merged;
    }

    auto const allTimed =
        std::ranges::all_of(results, [](const TranscriptionResult& r) { return !r.segments.empty(); });
    if (!allTimed)
    {
        auto texts = std::vector<std::string> {};
        texts.reserve(results.size());
        for (auto const& result: results)
            texts.push_back(result.fullText.empty() ? segmentText(result.segments) : result.fullText);
        log::info("Merged text of {} chunks without segment timing", chunks.size());
        return MergedTranscript { .segments = {}, .text = mergeTexts(texts) };
    }

    auto merged = MergedTranscript {};
    for (auto i = std::size_t { 0 }; i < chunks.size(); ++i)
    {
        auto const& chunk = chunks[i];
        auto const lower =
            i == 0 ? -std::numeric_limits<double>::infinity() : overlapMidpoint(chunks[i - 1], chunk);
        auto const upper = i + 1 == chunks.size() ? std::numeric_limits<double>::infinity()
                                                  : overlapMidpoint(chunk, chunks[i + 1]);

        for (auto const& segment: results[i].segments)
        {
            auto shifted = segment;
            shifted.start += chunk.startSeconds;
            shifted.end += chunk.startSeconds;
            if (lower <= shifted.start && shifted.start < upper)
                merged.segments.push_back(std::move(shifted));
        }
    }

    std::ranges::stable_sort(merged.segments, {}, &TranscriptionSegment::start);
    merged.text = segmentText(merged.segments);

    log::info("Merged {} segments from {} chunks", merged.segments.size(), chunks.size());
    return merged;
}

} // namespace supervox
