// SPDX-License-Identifier: Apache-2.0
#include <audio/LevelMonitor.hpp>

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <array>
#include <cstdint>
#include <thread>
#include <vector>

using namespace supervox;

TEST_CASE("LevelMonitor rms of a constant block equals its amplitude", "[level]")
{
    auto const block = std::vector<float>(256, 0.5f);
    CHECK(LevelMonitor::rms(block) == Catch::Approx(0.5f));
}

TEST_CASE("LevelMonitor rms of an empty block is zero", "[level]")
{
    CHECK(LevelMonitor::rms(std::span<const float> {}) == 0.0f);
    CHECK(LevelMonitor::rms(std::span<const std::int16_t> {}) == 0.0f);
}

TEST_CASE("LevelMonitor rms of 16-bit samples is normalized", "[level]")
{
    auto const full = std::vector<std::int16_t>(64, 32767);
    auto const half = std::vector<std::int16_t>(64, -16384);
    CHECK(LevelMonitor::rms(full) == Catch::Approx(1.0f));
    CHECK(LevelMonitor::rms(half) == Catch::Approx(0.5f).margin(1e-4));
}

TEST_CASE("LevelMonitor peak returns the absolute maximum", "[level]")
{
    auto const block = std::array { 0.1f, -0.8f, 0.3f };
    CHECK(LevelMonitor::peak(block) == Catch::Approx(0.8f));
}

TEST_CASE("LevelMonitor reports the maximum rms since the last read", "[level]")
{
    auto monitor = LevelMonitor {};

    CHECK(monitor.push(LevelSource::Mic, std::vector<float>(128, 0.2f)) == Catch::Approx(0.2f));
    monitor.push(LevelSource::Mic, std::vector<float>(128, 0.6f));
    monitor.push(LevelSource::Mic, std::vector<float>(128, 0.4f));

    auto const peaks = monitor.getAndResetPeaks();
    CHECK(peaks.mic == Catch::Approx(0.6f));
    CHECK_FALSE(peaks.loopback.has_value());

    // Nothing pushed since the reset.
    CHECK(monitor.getAndResetPeaks().mic == 0.0f);
}

TEST_CASE("LevelMonitor keeps sources independent", "[level]")
{
    auto monitor = LevelMonitor { true };

    monitor.push(LevelSource::Mic, std::vector<float>(32, 0.3f));
    monitor.push(LevelSource::Loopback, std::vector<float>(32, 0.9f));
    monitor.push(LevelSource::Mic, std::vector<float>(32, 0.1f));

    auto const peaks = monitor.getAndResetPeaks();
    CHECK(peaks.mic == Catch::Approx(0.3f));
    REQUIRE(peaks.loopback.has_value());
    CHECK(*peaks.loopback == Catch::Approx(0.9f));

    auto const after = monitor.getAndResetPeaks();
    CHECK(after.mic == 0.0f);
    REQUIRE(after.loopback.has_value());
    CHECK(*after.loopback == 0.0f);
}

TEST_CASE("LevelMonitor hides the loopback source until enabled", "[level]")
{
    auto monitor = LevelMonitor {};
    CHECK_FALSE(monitor.loopbackEnabled());

    monitor.setLoopbackEnabled(true);
    monitor.pushLevel(LevelSource::Loopback, 0.25f);
    auto const peaks = monitor.getAndResetPeaks();
    REQUIRE(peaks.loopback.has_value());
    CHECK(*peaks.loopback == Catch::Approx(0.25f));
}

TEST_CASE("LevelMonitor never loses the peak under concurrent pushes", "[level]")
{
    auto monitor = LevelMonitor {};
    constexpr auto Iterations = 10000;

    auto producer = std::jthread([&] {
        for (auto i = 0; i < Iterations; ++i)
            monitor.pushLevel(LevelSource::Mic, i == Iterations / 2 ? 0.95f : 0.1f);
    });

    auto observed = 0.0f;
    for (auto i = 0; i < 1000; ++i)
        observed = std::max(observed, monitor.getAndResetPeaks().mic);
    producer.join();
    observed = std::max(observed, monitor.getAndResetPeaks().mic);

    CHECK(observed == Catch::Approx(0.95f));
}
