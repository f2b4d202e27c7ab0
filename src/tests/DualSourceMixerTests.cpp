// SPDX-License-Identifier: Apache-2.0
#include <audio/DualSourceMixer.hpp>

#include <catch2/catch_test_macros.hpp>

#include <array>
#include <limits>
#include <vector>

using namespace supervox;

TEST_CASE("DualSourceMixer sums both sources without averaging", "[mixer]")
{
    auto const mic = std::array { 0.25f, 0.0f, -0.25f };
    auto const loop = std::array { 0.25f, 0.5f, 0.0f };

    auto const mixed = DualSourceMixer::mix(mic, loop, MixGains {});
    REQUIRE(mixed.size() == 3);
    CHECK(mixed[0] == quantizeSample(0.5f));
    CHECK(mixed[1] == quantizeSample(0.5f));
    CHECK(mixed[2] == quantizeSample(-0.25f));
}

TEST_CASE("DualSourceMixer with zero loopback gain reproduces the mic", "[mixer]")
{
    auto const mic = std::array { 0.1f, -0.7f, 0.99f, -1.0f };
    auto const loop = std::array { 0.9f, 0.9f, -0.9f, 0.9f };

    auto const mixed = DualSourceMixer::mix(mic, loop, MixGains { .mic = 1.0f, .loopback = 0.0f });
    REQUIRE(mixed.size() == mic.size());
    for (auto i = std::size_t { 0 }; i < mic.size(); ++i)
        CHECK(mixed[i] == quantizeSample(mic[i]));
}

TEST_CASE("DualSourceMixer clamps to the 16-bit range", "[mixer]")
{
    auto const mic = std::array { 0.9f, -0.9f };
    auto const loop = std::array { 0.9f, -0.9f };

    auto const mixed = DualSourceMixer::mix(mic, loop, MixGains { .mic = 2.0f, .loopback = 2.0f });
    CHECK(mixed[0] == std::numeric_limits<std::int16_t>::max());
    CHECK(mixed[1] == std::numeric_limits<std::int16_t>::min());
}

TEST_CASE("DualSourceMixer pads the shorter source with silence", "[mixer]")
{
    auto const mic = std::array { 0.5f, 0.5f, 0.5f };
    auto const loop = std::array { 0.25f };

    auto const buffer = DualSourceMixer::mixToBuffer(mic, loop, MixGains {}, 48000);
    CHECK(buffer.sampleRate == 48000);
    CHECK(buffer.channels == 1);
    REQUIRE(buffer.samples.size() == 3);
    CHECK(buffer.samples[0] == quantizeSample(0.75f));
    CHECK(buffer.samples[2] == quantizeSample(0.5f));
}

TEST_CASE("DualSourceMixer streams only the overlapping sample count", "[mixer]")
{
    auto mixer = DualSourceMixer {};
    auto output = std::vector<std::int16_t> {};
    mixer.setSink([&](std::span<const std::int16_t> samples) {
        output.insert(output.end(), samples.begin(), samples.end());
    });

    mixer.feedMic(std::vector<float>(480, 0.25f));
    CHECK(output.empty());
    CHECK(mixer.pendingMic() == 480);

    mixer.feedLoopback(std::vector<float>(300, 0.25f));
    CHECK(output.size() == 300);
    CHECK(mixer.pendingMic() == 180);
    CHECK(mixer.pendingLoopback() == 0);

    mixer.feedLoopback(std::vector<float>(500, 0.25f));
    CHECK(output.size() == 480);
    CHECK(mixer.pendingMic() == 0);
    CHECK(mixer.pendingLoopback() == 320);

    for (auto const sample: output)
        CHECK(sample == quantizeSample(0.5f));
}

TEST_CASE("DualSourceMixer flush emits leftovers with their own gain", "[mixer]")
{
    auto mixer = DualSourceMixer { MixGains { .mic = 1.0f, .loopback = 0.5f } };
    auto output = std::vector<std::int16_t> {};
    mixer.setSink([&](std::span<const std::int16_t> samples) {
        output.insert(output.end(), samples.begin(), samples.end());
    });

    mixer.feedMic(std::vector<float>(2, 0.2f));
    mixer.feedLoopback(std::vector<float>(5, 0.4f));
    REQUIRE(output.size() == 2);

    mixer.flush();
    REQUIRE(output.size() == 5);
    CHECK(output[0] == quantizeSample(0.2f + 0.2f));
    CHECK(output[4] == quantizeSample(0.2f));
    CHECK(mixer.pendingLoopback() == 0);
}
