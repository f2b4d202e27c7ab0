// SPDX-License-Identifier: Apache-2.0
#include "Formatting.hpp"

#include <cctype>
#include <cmath>
#include <format>
#include <vector>

namespace supervox
{

namespace
{

    struct SpeakerGroup
    {
        std::optional<std::string> speaker;
        double start = 0.0;
        double end = 0.0;
        std::vector<std::string_view> texts;
    };

    auto groupBySpeaker(std::span<const TranscriptionSegment> segments) -> std::vector<SpeakerGroup>
    {
        auto groups = std::vector<SpeakerGroup> {};
        auto current = SpeakerGroup {};

        for (auto const& segment: segments)
        {
            if (segment.speakerId != current.speaker && !current.texts.empty())
            {
                groups.push_back(std::move(current));
                current = SpeakerGroup {};
            }

            if (current.texts.empty())
                current.start = segment.start;

            current.speaker = segment.speakerId;
            current.end = segment.end;
            if (auto const text = trim(segment.text); !text.empty())
                current.texts.push_back(text);
        }

        if (!current.texts.empty())
            groups.push_back(std::move(current));
        return groups;
    }

} // namespace

auto trim(std::string_view text) -> std::string_view
{
    auto const isSpace = [](char c) { return std::isspace(static_cast<unsigned char>(c)) != 0; };
    while (!text.empty() && isSpace(text.front()))
        text.remove_prefix(1);
    while (!text.empty() && isSpace(text.back()))
        text.remove_suffix(1);
    return text;
}

auto formatTimestamp(double seconds) -> std::string
{
    auto const total = seconds > 0.0 ? static_cast<long long>(std::floor(seconds)) : 0LL;
    auto const hours = total / 3600;
    auto const minutes = (total % 3600) / 60;
    auto const secs = total % 60;
    if (hours > 0)
        return std::format("{:02}:{:02}:{:02}", hours, minutes, secs);
    return std::format("{:02}:{:02}", minutes, secs);
}

auto speakerDisplayName(std::string_view speakerId) -> std::string
{
    auto name = std::string {};
    name.reserve(speakerId.size());

    auto startOfWord = true;
    for (auto const c: speakerId)
    {
        auto const ch = c == '_' ? ' ' : c;
        auto const uc = static_cast<unsigned char>(ch);
        if (std::isalpha(uc))
        {
            name.push_back(static_cast<char>(startOfWord ? std::toupper(uc) : std::tolower(uc)));
            startOfWord = false;
        }
        else
        {
            name.push_back(ch);
            startOfWord = true;
        }
    }
    return name;
}

auto formatDiarizedTranscript(std::span<const TranscriptionSegment> segments) -> std::string
{
    auto out = std::string {};
    for (auto const& group: groupBySpeaker(segments))
    {
        if (!out.empty())
            out += "\n\n";

        if (group.speaker && !group.speaker->empty())
            out += std::format("[{} - {}] {}:\n",
                               formatTimestamp(group.start),
                               formatTimestamp(group.end),
                               speakerDisplayName(*group.speaker));
        else
            out += std::format("[{} - {}]\n", formatTimestamp(group.start), formatTimestamp(group.end));

        for (auto i = std::size_t { 0 }; i < group.texts.size(); ++i)
        {
            if (i > 0)
                out += ' ';
            out += group.texts[i];
        }
    }
    return out;
}

} // namespace supervox
