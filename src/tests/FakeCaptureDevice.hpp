// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/CaptureDevice.hpp>

#include <algorithm>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace supervox::test
{

/// @brief What a FakeCaptureDevice delivers once started.
struct FakeCaptureScript
{
    /// @brief Rate reported when the caller asks for the native rate (0).
    unsigned nativeRate = 1000;

    /// @brief Rate reported regardless of the request.
    std::optional<unsigned> forcedRate;

    unsigned channels = 1;

    std::vector<std::vector<float>> blocks;
    bool failInitialize = false;
};

/// @brief Capture device that plays scripted blocks synchronously from start().
class FakeCaptureDevice: public CaptureDevice
{
  public:
    explicit FakeCaptureDevice(FakeCaptureScript script): _script(std::move(script)) {}

    auto initialize(const CaptureDeviceConfig& config, AudioCallback callback) -> VoidResult override
    {
        if (_script.failInitialize)
            return makeError(ErrorCode::CaptureError, "Failed to open fake device");

        requested = config;
        _callback = std::move(callback);
        _rate = _script.forcedRate.value_or(config.sampleRate != 0 ? config.sampleRate : _script.nativeRate);
        return {};
    }

    auto start() -> VoidResult override
    {
        _capturing = true;
        for (auto const& block: _script.blocks)
            _callback(block);
        return {};
    }

    void stop() override { _capturing = false; }

    [[nodiscard]] auto isCapturing() const -> bool override { return _capturing; }
    [[nodiscard]] auto sampleRate() const -> unsigned override { return _rate; }
    [[nodiscard]] auto channels() const -> unsigned override { return _script.channels; }
    [[nodiscard]] auto name() const -> std::string override { return "fake"; }

    CaptureDeviceConfig requested;

  private:
    FakeCaptureScript _script;
    AudioCallback _callback;
    unsigned _rate = 0;
    bool _capturing = false;
};

/// @brief Splits a constant signal of the given length into fixed-size blocks.
inline auto constantBlocks(float value, std::size_t samples, std::size_t blockSize = 4096)
    -> std::vector<std::vector<float>>
{
    auto blocks = std::vector<std::vector<float>> {};
    for (auto offset = std::size_t { 0 }; offset < samples; offset += blockSize)
        blocks.emplace_back(std::min(blockSize, samples - offset), value);
    return blocks;
}

/// @brief Factory handing out one device per script, in order; nullptr once exhausted.
inline auto scriptedFactory(std::vector<FakeCaptureScript> scripts, std::shared_ptr<std::size_t> calls = nullptr)
    -> CaptureDeviceFactory
{
    if (!calls)
        calls = std::make_shared<std::size_t>(0);
    return [scripts = std::move(scripts), calls]() -> std::unique_ptr<CaptureDevice> {
        auto const index = (*calls)++;
        if (index >= scripts.size())
            return nullptr;
        return std::make_unique<FakeCaptureDevice>(scripts[index]);
    };
}

} // namespace supervox::test
