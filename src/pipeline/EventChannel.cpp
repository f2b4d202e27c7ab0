// SPDX-License-Identifier: Apache-2.0
#include "EventChannel.hpp"

#include <format>
#include <iterator>

namespace supervox
{

auto formatEvent(const PipelineEvent& event) -> std::string
{
    return std::format("{:%Y-%m-%d %H:%M:%S} | {} | {}",
                       std::chrono::floor<std::chrono::seconds>(event.time),
                       pipelineStateName(event.state),
                       event.message);
}

void EventChannel::publish(PipelineEvent event)
{
    auto const lock = std::lock_guard { _mutex };
    _history.push_back(event);
    _pending.push_back(std::move(event));
}

auto EventChannel::drain() -> std::vector<PipelineEvent>
{
    auto const lock = std::lock_guard { _mutex };
    auto events = std::vector<PipelineEvent>(std::make_move_iterator(_pending.begin()),
                                             std::make_move_iterator(_pending.end()));
    _pending.clear();
    return events;
}

auto EventChannel::history() const -> std::vector<PipelineEvent>
{
    auto const lock = std::lock_guard { _mutex };
    return _history;
}

auto EventChannel::pendingCount() const -> std::size_t
{
    auto const lock = std::lock_guard { _mutex };
    return _pending.size();
}

} // namespace supervox
