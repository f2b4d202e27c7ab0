// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <chrono>
#include <cstddef>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

namespace supervox
{

/// @brief States of one recording run.
enum class PipelineState
{
    Idle,
    Recording,
    Converting,
    Chunking,
    Transcribing,
    Merging,
    Transforming,
    Persisting,
    Cleaned,
    Failed,
};

[[nodiscard]] constexpr auto pipelineStateName(PipelineState state) -> std::string_view
{
    switch (state)
    {
        case PipelineState::Idle: return "idle";
        case PipelineState::Recording: return "recording";
        case PipelineState::Converting: return "converting";
        case PipelineState::Chunking: return "chunking";
        case PipelineState::Transcribing: return "transcribing";
        case PipelineState::Merging: return "merging";
        case PipelineState::Transforming: return "transforming";
        case PipelineState::Persisting: return "persisting";
        case PipelineState::Cleaned: return "cleaned";
        case PipelineState::Failed: return "failed";
    }
    return "unknown";
}

/// @brief A state transition or status message published by the pipeline.
struct PipelineEvent
{
    PipelineState state = PipelineState::Idle;
    std::string message;
    std::chrono::system_clock::time_point time = std::chrono::system_clock::now();
};

/// @brief Renders an event as one log line: "YYYY-MM-DD HH:MM:SS | state | message" (UTC).
[[nodiscard]] auto formatEvent(const PipelineEvent& event) -> std::string;

/// @brief Hands pipeline events from the orchestration thread to the presentation.
///
/// The pipeline publishes; the presentation drains at its own cadence. Every event
/// is also kept in the history, which is what the pipeline log is written from.
class EventChannel
{
  public:
    void publish(PipelineEvent event);

    /// @brief Returns the events published since the previous drain, oldest first.
    [[nodiscard]] auto drain() -> std::vector<PipelineEvent>;

    /// @brief All events published so far.
    [[nodiscard]] auto history() const -> std::vector<PipelineEvent>;

    [[nodiscard]] auto pendingCount() const -> std::size_t;

  private:
    mutable std::mutex _mutex;
    std::deque<PipelineEvent> _pending;
    std::vector<PipelineEvent> _history;
};

} // namespace supervox
