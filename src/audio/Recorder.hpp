// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>
#include <audio/CaptureDevice.hpp>
#include <audio/DualSourceMixer.hpp>
#include <audio/LevelMonitor.hpp>
#include <core/Error.hpp>

#include <memory>
#include <optional>
#include <string>

namespace supervox
{

/// @brief Capture parameters for one recording.
struct RecorderConfig
{
    /// @brief Microphone name filter; empty selects the default microphone.
    std::string micDevice;

    /// @brief Loopback device name. Its presence selects dual capture through DualSourceMixer.
    std::optional<std::string> loopbackDevice;

    /// @brief Requested sample rate for single-source capture. Dual capture uses the mic's native rate.
    unsigned sampleRate = 16000;

    /// @brief Channel count for single-source capture. Dual capture is always mono.
    unsigned channels = 1;

    MixGains gains;
};

/// @brief Owns the capture streams of one recording and accumulates the result.
///
/// Mic-only capture appends quantized mic samples straight into the buffer and
/// never touches the mixer; it may record more than one channel. Dual capture
/// opens the loopback stream at the mic stream's actual rate and routes both
/// through a DualSourceMixer. Every block's RMS is pushed into the LevelMonitor
/// for its source.
class Recorder
{
  public:
    Recorder(CaptureDeviceFactory factory, LevelMonitor& monitor);
    ~Recorder();

    Recorder(const Recorder&) = delete;
    Recorder& operator=(const Recorder&) = delete;

    /// @brief Opens and starts the capture streams.
    /// @return Success or a CaptureError; on error nothing is left running.
    [[nodiscard]] auto start(const RecorderConfig& config) -> VoidResult;

    /// @brief Stops all streams, flushes the mixer, and hands over the finished buffer.
    [[nodiscard]] auto stop() -> AudioBuffer;

    [[nodiscard]] auto isRecording() const -> bool;

    /// @brief Whether the running capture mixes a loopback source.
    [[nodiscard]] auto isDualSource() const -> bool;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace supervox
