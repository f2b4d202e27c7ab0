// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace supervox
{

/// @brief One timed piece of transcribed speech.
///
/// Times are in seconds. A provider reports them relative to the audio it was
/// given; after merging they are relative to the start of the recording.
struct TranscriptionSegment
{
    std::optional<std::string> speakerId;
    double start = 0.0;
    double end = 0.0;
    std::string text;
    std::optional<double> score;
};

/// @brief The transcription of one audio file (a chunk, or the whole recording).
struct TranscriptionResult
{
    std::string fullText;

    /// @brief Segments in non-decreasing start order. Empty when the provider returned text only.
    std::vector<TranscriptionSegment> segments;

    /// @brief Provider response, kept verbatim for the raw JSON output.
    nlohmann::json raw;
};

/// @brief The deduplicated transcript of a whole recording.
struct MergedTranscript
{
    std::vector<TranscriptionSegment> segments;
    std::string text;
};

/// @brief Reply of a text transformation request.
struct ChatResult
{
    std::string text;
    nlohmann::json raw;
};

} // namespace supervox
