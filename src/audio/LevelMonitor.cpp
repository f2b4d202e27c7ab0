// SPDX-License-Identifier: Apache-2.0
#include "LevelMonitor.hpp"

#include <algorithm>
#include <cmath>
#include <limits>

namespace supervox
{

LevelMonitor::LevelMonitor(bool loopbackEnabled): _loopbackEnabled(loopbackEnabled)
{
}

auto LevelMonitor::push(LevelSource source, std::span<const float> samples) -> float
{
    auto const level = rms(samples);
    pushLevel(source, level);
    return level;
}

auto LevelMonitor::push(LevelSource source, std::span<const std::int16_t> samples) -> float
{
    auto const level = rms(samples);
    pushLevel(source, level);
    return level;
}

void LevelMonitor::pushLevel(LevelSource source, float level)
{
    if (!(level > 0.0f))
        return;

    auto& target = slot(source);
    auto current = target.load(std::memory_order_relaxed);
    while (level > current
           && !target.compare_exchange_weak(current, level, std::memory_order_relaxed, std::memory_order_relaxed))
        ;
}

auto LevelMonitor::getAndResetPeaks() -> LevelPeaks
{
    auto peaks = LevelPeaks {};
    peaks.mic = _micPeak.exchange(0.0f, std::memory_order_relaxed);

    auto const loop = _loopPeak.exchange(0.0f, std::memory_order_relaxed);
    if (_loopbackEnabled.load(std::memory_order_relaxed))
        peaks.loopback = loop;

    return peaks;
}

void LevelMonitor::setLoopbackEnabled(bool enabled)
{
    _loopbackEnabled.store(enabled, std::memory_order_relaxed);
}

auto LevelMonitor::loopbackEnabled() const -> bool
{
    return _loopbackEnabled.load(std::memory_order_relaxed);
}

auto LevelMonitor::rms(std::span<const float> samples) -> float
{
    if (samples.empty())
        return 0.0f;

    auto sum = 0.0;
    for (auto const s: samples)
        sum += static_cast<double>(s) * static_cast<double>(s);
    return static_cast<float>(std::sqrt(sum / static_cast<double>(samples.size())));
}

auto LevelMonitor::rms(std::span<const std::int16_t> samples) -> float
{
    if (samples.empty())
        return 0.0f;

    constexpr auto Scale = static_cast<double>(std::numeric_limits<std::int16_t>::max());
    auto sum = 0.0;
    for (auto const s: samples)
    {
        auto const normalized = static_cast<double>(s) / Scale;
        sum += normalized * normalized;
    }
    return static_cast<float>(std::min(1.0, std::sqrt(sum / static_cast<double>(samples.size()))));
}

auto LevelMonitor::peak(std::span<const float> samples) -> float
{
    auto result = 0.0f;
    for (auto const s: samples)
        result = std::max(result, std::abs(s));
    return result;
}

auto LevelMonitor::slot(LevelSource source) -> std::atomic<float>&
{
    return source == LevelSource::Mic ? _micPeak : _loopPeak;
}

} // namespace supervox
