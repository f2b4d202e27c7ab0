// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <span>
#include <vector>

namespace supervox
{

/// @brief Converts a float sample in [-1, 1] to signed 16-bit PCM, clamping out-of-range values.
[[nodiscard]] inline auto quantizeSample(float sample) -> std::int16_t
{
    constexpr auto Max = static_cast<float>(std::numeric_limits<std::int16_t>::max());
    constexpr auto Min = static_cast<float>(std::numeric_limits<std::int16_t>::min());
    return static_cast<std::int16_t>(std::clamp(std::round(sample * Max), Min, Max));
}

/// @brief Mono (or interleaved) 16-bit PCM audio with its sample rate.
///
/// Grows only while capture runs; read-only once handed to processing.
struct AudioBuffer
{
    std::vector<std::int16_t> samples;
    unsigned sampleRate = 16000;
    unsigned channels = 1;

    /// @brief Number of frames (samples per channel).
    [[nodiscard]] auto frameCount() const -> std::size_t { return channels == 0 ? 0 : samples.size() / channels; }

    /// @brief Duration in seconds.
    [[nodiscard]] auto duration() const -> double
    {
        if (sampleRate == 0)
            return 0.0;
        return static_cast<double>(frameCount()) / static_cast<double>(sampleRate);
    }

    [[nodiscard]] auto empty() const -> bool { return samples.empty(); }

    /// @brief Appends float samples, quantizing each to 16-bit.
    void append(std::span<const float> block)
    {
        samples.reserve(samples.size() + block.size());
        for (auto const s: block)
            samples.push_back(quantizeSample(s));
    }

    /// @brief Appends already-quantized samples.
    void append(std::span<const std::int16_t> block) { samples.insert(samples.end(), block.begin(), block.end()); }
};

} // namespace supervox
