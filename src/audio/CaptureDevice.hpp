// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <functional>
#include <memory>
#include <span>
#include <string>

namespace supervox
{

/// @brief Callback invoked when audio data is captured.
/// @param samples Float32 PCM samples in [-1, 1], interleaved when the stream has more than one channel.
using AudioCallback = std::function<void(std::span<const float> samples)>;

/// @brief Parameters for opening a capture device.
struct CaptureDeviceConfig
{
    /// @brief Case-insensitive substring of the device name; empty selects a default microphone.
    std::string deviceName;

    /// @brief Requested sample rate in Hz; 0 opens the device at its native rate.
    unsigned sampleRate = 0;

    /// @brief Number of interleaved channels to capture.
    unsigned channels = 1;

    /// @brief Fail instead of falling back to a default device when deviceName matches nothing.
    bool requireMatch = false;
};

/// @brief Abstract interface for an audio input stream.
///
/// The callback runs on the audio subsystem's thread and must not block.
class CaptureDevice
{
  public:
    virtual ~CaptureDevice() = default;

    /// @brief Opens the device.
    /// @return Success or a CaptureError.
    [[nodiscard]] virtual auto initialize(const CaptureDeviceConfig& config, AudioCallback callback)
        -> VoidResult = 0;

    /// @brief Starts delivering samples to the callback.
    [[nodiscard]] virtual auto start() -> VoidResult = 0;

    /// @brief Stops capturing. No callback runs after this returns.
    virtual void stop() = 0;

    /// @brief Returns true if currently capturing.
    [[nodiscard]] virtual auto isCapturing() const -> bool = 0;

    /// @brief Actual sample rate of the opened stream.
    [[nodiscard]] virtual auto sampleRate() const -> unsigned = 0;

    /// @brief Channel count of the opened stream.
    [[nodiscard]] virtual auto channels() const -> unsigned = 0;

    /// @brief Name of the opened device.
    [[nodiscard]] virtual auto name() const -> std::string = 0;
};

/// @brief Creates unopened capture devices; one call per stream.
using CaptureDeviceFactory = std::function<std::unique_ptr<CaptureDevice>()>;

} // namespace supervox
