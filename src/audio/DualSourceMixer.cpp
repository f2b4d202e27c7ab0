// SPDX-License-Identifier: Apache-2.0
#include "DualSourceMixer.hpp"

#include <algorithm>

namespace supervox
{

DualSourceMixer::DualSourceMixer(MixGains gains): _gains(gains)
{
}

auto DualSourceMixer::mixSample(float mic, float loopback, MixGains gains) -> std::int16_t
{
    return quantizeSample(mic * gains.mic + loopback * gains.loopback);
}

auto DualSourceMixer::mix(std::span<const float> mic, std::span<const float> loopback, MixGains gains)
    -> std::vector<std::int16_t>
{
    auto const length = std::max(mic.size(), loopback.size());
    auto output = std::vector<std::int16_t>(length);

    for (auto i = std::size_t { 0 }; i < length; ++i)
    {
        auto const m = i < mic.size() ? mic[i] : 0.0f;
        auto const l = i < loopback.size() ? loopback[i] : 0.0f;
        output[i] = mixSample(m, l, gains);
    }
    return output;
}

auto DualSourceMixer::mixToBuffer(std::span<const float> mic,
                                  std::span<const float> loopback,
                                  MixGains gains,
                                  unsigned sampleRate) -> AudioBuffer
{
    return AudioBuffer { .samples = mix(mic, loopback, gains), .sampleRate = sampleRate, .channels = 1 };
}

void DualSourceMixer::setSink(MixSink sink)
{
    auto lock = std::lock_guard(_mutex);
    _sink = std::move(sink);
}

void DualSourceMixer::feedMic(std::span<const float> block)
{
    auto lock = std::lock_guard(_mutex);
    _micCarry.insert(_micCarry.end(), block.begin(), block.end());
    mixAvailable();
}

void DualSourceMixer::feedLoopback(std::span<const float> block)
{
    auto lock = std::lock_guard(_mutex);
    _loopCarry.insert(_loopCarry.end(), block.begin(), block.end());
    mixAvailable();
}

void DualSourceMixer::flush()
{
    auto lock = std::lock_guard(_mutex);
    mixAvailable();

    // At most one of the carries is non-empty here.
    _scratch.clear();
    for (auto const s: _micCarry)
        _scratch.push_back(mixSample(s, 0.0f, _gains));
    for (auto const s: _loopCarry)
        _scratch.push_back(mixSample(0.0f, s, _gains));
    _micCarry.clear();
    _loopCarry.clear();

    if (_sink && !_scratch.empty())
        _sink(_scratch);
}

auto DualSourceMixer::pendingMic() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _micCarry.size();
}

auto DualSourceMixer::pendingLoopback() const -> std::size_t
{
    auto lock = std::lock_guard(_mutex);
    return _loopCarry.size();
}

void DualSourceMixer::mixAvailable()
{
    auto const count = std::min(_micCarry.size(), _loopCarry.size());
    if (count == 0)
        return;

    _scratch.resize(count);
    for (auto i = std::size_t { 0 }; i < count; ++i)
        _scratch[i] = mixSample(_micCarry[i], _loopCarry[i], _gains);

    _micCarry.erase(_micCarry.begin(), _micCarry.begin() + static_cast<std::ptrdiff_t>(count));
    _loopCarry.erase(_loopCarry.begin(), _loopCarry.begin() + static_cast<std::ptrdiff_t>(count));

    if (_sink)
        _sink(_scratch);
}

} // namespace supervox
