// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/LevelMonitor.hpp>

#include <cstddef>
#include <string>
#include <string_view>

namespace supervox
{

/// @brief Number of bar glyphs in one meter.
inline constexpr auto MeterBarCount = std::size_t { 5 };

/// @brief Maps a linear amplitude in [0, 1] to the number of lit bars on a -48 dB..0 dB scale.
[[nodiscard]] auto meterBarsLit(float level) -> std::size_t;

/// @brief Renders one source's meter, e.g. "mic ▁▂▃▅▇".
/// @param color Whether to emit ANSI colors (green, yellow, red; gray for unlit bars).
[[nodiscard]] auto renderMeter(std::string_view label, float level, bool color) -> std::string;

/// @brief Renders the mic meter and, when the loopback is reported, the loopback meter on one line.
[[nodiscard]] auto renderLevelLine(const LevelPeaks& peaks, bool color) -> std::string;

} // namespace supervox
