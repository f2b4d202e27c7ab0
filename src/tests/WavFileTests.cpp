// SPDX-License-Identifier: Apache-2.0
#include "TempDirectory.hpp"

#include <audio/WavFile.hpp>

#include <catch2/catch_test_macros.hpp>

#include <cstdint>
#include <cstdlib>
#include <vector>

using namespace supervox;

TEST_CASE("A written WAV reads back with the same samples and rate", "[wav]")
{
    auto const dir = test::TempDirectory("wav");
    auto const path = dir / "ramp.wav";

    auto buffer = AudioBuffer { .samples = {}, .sampleRate = 22050, .channels = 1 };
    for (auto i = 0; i < 5000; ++i)
        buffer.samples.push_back(static_cast<std::int16_t>((i * 13) % 20000 - 10000));

    REQUIRE(writeWav(path, buffer).has_value());
    CHECK(std::filesystem::exists(path));

    auto const loaded = readWav(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded->sampleRate == 22050);
    CHECK(loaded->channels == 1);
    REQUIRE(loaded->frameCount() == buffer.frameCount());
    CHECK(loaded->samples == buffer.samples);
}

TEST_CASE("readWav downmixes stereo to mono", "[wav]")
{
    auto const dir = test::TempDirectory("wav");
    auto const path = dir / "stereo.wav";

    auto buffer = AudioBuffer { .samples = {}, .sampleRate = 16000, .channels = 2 };
    for (auto i = 0; i < 1600; ++i)
    {
        buffer.samples.push_back(1000);
        buffer.samples.push_back(3000);
    }
    REQUIRE(writeWav(path, buffer).has_value());

    auto const loaded = readWav(path);
    REQUIRE(loaded.has_value());
    CHECK(loaded->channels == 1);
    REQUIRE(loaded->frameCount() == 1600);
    for (auto const sample: loaded->samples)
        CHECK(std::abs(sample - 2000) <= 2);
}

TEST_CASE("writeWav creates missing parent directories", "[wav]")
{
    auto const dir = test::TempDirectory("wav");
    auto const path = dir / "recordings/nested/out.wav";

    auto const buffer =
        AudioBuffer { .samples = std::vector<std::int16_t>(160, 0), .sampleRate = 16000, .channels = 1 };
    REQUIRE(writeWav(path, buffer).has_value());
    CHECK(std::filesystem::is_regular_file(path));
}

TEST_CASE("writeWav rejects a buffer without channels or rate", "[wav]")
{
    auto const dir = test::TempDirectory("wav");

    auto buffer = AudioBuffer { .samples = { 1, 2, 3 }, .sampleRate = 0, .channels = 1 };
    auto written = writeWav(dir / "a.wav", buffer);
    REQUIRE_FALSE(written.has_value());
    CHECK(written.error().code == ErrorCode::InvalidArgument);

    buffer.sampleRate = 16000;
    buffer.channels = 0;
    written = writeWav(dir / "b.wav", buffer);
    REQUIRE_FALSE(written.has_value());
    CHECK(written.error().code == ErrorCode::InvalidArgument);
    CHECK_FALSE(std::filesystem::exists(dir / "b.wav"));
}

TEST_CASE("readWav reports a missing file as an I/O error", "[wav]")
{
    auto const dir = test::TempDirectory("wav");
    auto const loaded = readWav(dir / "missing.wav");
    REQUIRE_FALSE(loaded.has_value());
    CHECK(loaded.error().code == ErrorCode::IoError);
}
