// SPDX-License-Identifier: Apache-2.0
#include "LevelMeter.hpp"

#include <algorithm>
#include <array>
#include <cmath>
#include <format>

namespace supervox
{

namespace
{

    constexpr auto MeterBars = std::array { "▁", "▂", "▃", "▅", "▇" };
    static_assert(MeterBars.size() == MeterBarCount);

    constexpr auto FloorDb = -48.0f;

    auto barColor(std::size_t index) -> std::string_view
    {
        if (index < 2)
            return "\033[32m"; // Green
        if (index < 4)
            return "\033[33m"; // Yellow
        return "\033[31m";     // Red
    }

} // namespace

auto meterBarsLit(float level) -> std::size_t
{
    // Convert linear amplitude to perceptual dB scale
    auto scaledLevel = 0.0f;
    if (level > 0.0f)
    {
        auto const db = 20.0f * std::log10(level);
        scaledLevel = std::clamp((db - FloorDb) / -FloorDb, 0.0f, 1.0f);
    }
    return static_cast<std::size_t>(scaledLevel * static_cast<float>(MeterBarCount));
}

auto renderMeter(std::string_view label, float level, bool color) -> std::string
{
    auto const activeBars = meterBarsLit(level);

    auto out = std::format("{} ", label);
    for (auto i = std::size_t { 0 }; i < MeterBarCount; ++i)
    {
        if (color)
            out += i < activeBars ? barColor(i) : std::string_view { "\033[90m" };
        if (color || i < activeBars)
            out += MeterBars[i];
        else
            out += ' ';
    }
    if (color)
        out += "\033[0m";
    return out;
}

auto renderLevelLine(const LevelPeaks& peaks, bool color) -> std::string
{
    auto line = renderMeter("mic", peaks.mic, color);
    if (peaks.loopback)
    {
        line += "  ";
        line += renderMeter("loop", *peaks.loopback, color);
    }
    return line;
}

} // namespace supervox
