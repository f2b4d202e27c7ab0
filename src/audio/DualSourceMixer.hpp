// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>

#include <cstdint>
#include <functional>
#include <mutex>
#include <span>
#include <vector>

namespace supervox
{

/// @brief Gain applied to each source before summing.
struct MixGains
{
    float mic = 1.0f;
    float loopback = 1.0f;
};

/// @brief Receives mixed, quantized mono samples as they become available.
using MixSink = std::function<void(std::span<const std::int16_t> samples)>;

/// @brief Combines a microphone and a loopback stream into one mono stream.
///
/// Output sample = clamp(mic * micGain + loop * loopGain) quantized to 16-bit.
/// No averaging factor is applied: the two sides rarely speak at the same time,
/// and halving would attenuate the common single-speaker case. Clamping handles
/// the moments both sources peak together.
///
/// In streaming use, the two capture callbacks deliver blocks of independent sizes.
/// Each feed mixes only the sample count both sources have delivered so far and
/// carries the remainder of the longer one to the next feed.
class DualSourceMixer
{
  public:
    explicit DualSourceMixer(MixGains gains = {});

    DualSourceMixer(const DualSourceMixer&) = delete;
    DualSourceMixer& operator=(const DualSourceMixer&) = delete;

    /// @brief Mixes two complete streams. The shorter one is padded with silence.
    [[nodiscard]] static auto mix(std::span<const float> mic, std::span<const float> loopback, MixGains gains)
        -> std::vector<std::int16_t>;

    /// @brief Mixes two complete streams into a mono AudioBuffer at the given sample rate.
    [[nodiscard]] static auto mixToBuffer(std::span<const float> mic,
                                          std::span<const float> loopback,
                                          MixGains gains,
                                          unsigned sampleRate) -> AudioBuffer;

    /// @brief Mixes a single sample pair.
    [[nodiscard]] static auto mixSample(float mic, float loopback, MixGains gains) -> std::int16_t;

    /// @brief Installs the sink that receives mixed output. Must be set before feeding.
    void setSink(MixSink sink);

    /// @brief Feeds a microphone block from the mic capture callback.
    void feedMic(std::span<const float> block);

    /// @brief Feeds a loopback block from the loopback capture callback.
    void feedLoopback(std::span<const float> block);

    /// @brief Emits whatever one source delivered beyond the other, with its own gain only.
    ///
    /// Called once after both captures stopped; the missing side counts as silence.
    void flush();

    /// @brief Number of mic samples waiting for their loopback counterpart.
    [[nodiscard]] auto pendingMic() const -> std::size_t;

    /// @brief Number of loopback samples waiting for their mic counterpart.
    [[nodiscard]] auto pendingLoopback() const -> std::size_t;

  private:
    void mixAvailable();

    MixGains _gains;
    MixSink _sink;

    // Short critical sections only: the two capture callbacks run on different threads.
    mutable std::mutex _mutex;
    std::vector<float> _micCarry;
    std::vector<float> _loopCarry;
    std::vector<std::int16_t> _scratch;
};

} // namespace supervox
