// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <atomic>
#include <cstdint>
#include <optional>
#include <span>

namespace supervox
{

/// @brief Audio source a level value belongs to.
enum class LevelSource : std::uint8_t
{
    Mic,
    Loopback,
};

/// @brief Per-source maximum RMS accumulated since the previous read.
struct LevelPeaks
{
    float mic = 0.0f;

    /// @brief Loopback peak; std::nullopt when no loopback source is configured.
    std::optional<float> loopback;
};

/// @brief Push-based peak/RMS accumulator for live level feedback.
///
/// The capture thread calls push() once per audio block; a display loop calls
/// getAndResetPeaks() at its own cadence. Both sides are lock-free: push() raises
/// a per-source running maximum with compare-and-swap, and getAndResetPeaks()
/// swaps it back to zero, so every value pushed before the swap is reported by
/// exactly one read.
class LevelMonitor
{
  public:
    /// @param loopbackEnabled Whether the loopback source is reported by getAndResetPeaks().
    explicit LevelMonitor(bool loopbackEnabled = false);

    LevelMonitor(const LevelMonitor&) = delete;
    LevelMonitor& operator=(const LevelMonitor&) = delete;

    /// @brief Computes the RMS of a block of float samples and accumulates it.
    /// @return The block's RMS.
    auto push(LevelSource source, std::span<const float> samples) -> float;

    /// @brief Computes the RMS of a block of 16-bit samples (normalized to [0, 1]) and accumulates it.
    /// @return The block's RMS.
    auto push(LevelSource source, std::span<const std::int16_t> samples) -> float;

    /// @brief Accumulates a precomputed level value.
    void pushLevel(LevelSource source, float level);

    /// @brief Returns the per-source peaks since the last call and resets them to zero.
    [[nodiscard]] auto getAndResetPeaks() -> LevelPeaks;

    /// @brief Enables or disables loopback reporting (e.g. when dual capture starts).
    void setLoopbackEnabled(bool enabled);

    [[nodiscard]] auto loopbackEnabled() const -> bool;

    /// @brief Computes the root-mean-square of a float block; zero for an empty block.
    [[nodiscard]] static auto rms(std::span<const float> samples) -> float;

    /// @brief Computes the root-mean-square of a 16-bit block, normalized to [0, 1].
    [[nodiscard]] static auto rms(std::span<const std::int16_t> samples) -> float;

    /// @brief Returns the absolute peak amplitude of a float block.
    [[nodiscard]] static auto peak(std::span<const float> samples) -> float;

  private:
    auto slot(LevelSource source) -> std::atomic<float>&;

    std::atomic<float> _micPeak { 0.0f };
    std::atomic<float> _loopPeak { 0.0f };
    std::atomic<bool> _loopbackEnabled;
};

} // namespace supervox
