// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <transcript/Types.hpp>

#include <span>
#include <string>
#include <string_view>

namespace supervox
{

/// @brief Formats seconds as MM:SS, or HH:MM:SS from one hour on. Fractions are truncated.
[[nodiscard]] auto formatTimestamp(double seconds) -> std::string;

/// @brief Turns a provider speaker id into a display name ("speaker_0" -> "Speaker 0").
[[nodiscard]] auto speakerDisplayName(std::string_view speakerId) -> std::string;

/// @brief Renders diarized segments as speaker-labeled paragraphs.
///
/// Consecutive segments of the same speaker form one group:
/// @code
/// [00:12 - 00:45] Speaker 0:
/// Hello everyone, welcome to the meeting.
///
/// [00:45 - 01:02] Speaker 1:
/// Thanks.
/// @endcode
/// Groups without a speaker get a bare time header. Returns an empty string for no segments.
[[nodiscard]] auto formatDiarizedTranscript(std::span<const TranscriptionSegment> segments) -> std::string;

/// @brief Trims ASCII whitespace from both ends.
[[nodiscard]] auto trim(std::string_view text) -> std::string_view;

} // namespace supervox
