// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/CaptureDevice.hpp>
#include <core/Error.hpp>

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace supervox
{

/// @brief Description of an available capture device.
struct CaptureDeviceInfo
{
    std::string name;
    unsigned nativeSampleRate = 0;
    bool isDefault = false;
};

/// @brief Lists the capture devices known to the audio backend.
/// @return The device list or a CaptureError.
[[nodiscard]] auto listCaptureDevices() -> Result<std::vector<CaptureDeviceInfo>>;

/// @brief Finds a capture device by case-insensitive name substring.
/// @return The first matching device or a CaptureError naming the filter.
[[nodiscard]] auto findCaptureDevice(std::string_view name) -> Result<CaptureDeviceInfo>;

/// @brief Captures float32 audio from an input device using miniaudio.
class AudioCapture: public CaptureDevice
{
  public:
    AudioCapture();
    ~AudioCapture() override;

    AudioCapture(const AudioCapture&) = delete;
    AudioCapture& operator=(const AudioCapture&) = delete;

    [[nodiscard]] auto initialize(const CaptureDeviceConfig& config, AudioCallback callback)
        -> VoidResult override;
    [[nodiscard]] auto start() -> VoidResult override;
    void stop() override;
    [[nodiscard]] auto isCapturing() const -> bool override;
    [[nodiscard]] auto sampleRate() const -> unsigned override;
    [[nodiscard]] auto channels() const -> unsigned override;
    [[nodiscard]] auto name() const -> std::string override;

    // Impl must be accessible from the C audio callback
    struct Impl;

  private:
    std::unique_ptr<Impl> _impl;
};

} // namespace supervox
