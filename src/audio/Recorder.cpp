// SPDX-License-Identifier: Apache-2.0
#include "Recorder.hpp"

#include <core/Log.hpp>

#include <format>

namespace supervox
{

struct Recorder::Impl
{
    CaptureDeviceFactory factory;
    LevelMonitor& monitor;

    std::unique_ptr<CaptureDevice> mic;
    std::unique_ptr<CaptureDevice> loopback;
    std::unique_ptr<DualSourceMixer> mixer;

    // Single writer: the mic callback (mic-only) or the mixer sink (dual).
    AudioBuffer buffer;
    bool recording = false;

    Impl(CaptureDeviceFactory f, LevelMonitor& m): factory(std::move(f)), monitor(m) {}

    void shutdownDevices()
    {
        if (mic)
            mic->stop();
        if (loopback)
            loopback->stop();
    }

    auto startSingle(const RecorderConfig& config) -> VoidResult
    {
        auto const captureConfig = CaptureDeviceConfig {
            .deviceName = config.micDevice,
            .sampleRate = config.sampleRate,
            .channels = config.channels,
            .requireMatch = false,
        };

        auto result = mic->initialize(captureConfig, [this](std::span<const float> block) {
            monitor.push(LevelSource::Mic, block);
            buffer.append(block);
        });
        if (!result)
            return result;

        buffer.sampleRate = mic->sampleRate();
        buffer.channels = mic->channels();
        return mic->start();
    }

    auto startDual(const RecorderConfig& config) -> VoidResult
    {
        mixer = std::make_unique<DualSourceMixer>(config.gains);
        mixer->setSink([this](std::span<const std::int16_t> mixed) { buffer.append(mixed); });

        // Open the mic at its native rate; the loopback follows it so no stream is resampled.
        auto micResult = mic->initialize(
            CaptureDeviceConfig {
                .deviceName = config.micDevice, .sampleRate = 0, .channels = 1, .requireMatch = false },
            [this](std::span<const float> block) {
                monitor.push(LevelSource::Mic, block);
                mixer->feedMic(block);
            });
        if (!micResult)
            return micResult;

        auto const rate = mic->sampleRate();
        if (rate != config.sampleRate)
            log::info("Using device native sample rate {} Hz (requested {} Hz)", rate, config.sampleRate);

        auto loopResult = loopback->initialize(
            CaptureDeviceConfig {
                .deviceName = *config.loopbackDevice, .sampleRate = rate, .channels = 1, .requireMatch = true },
            [this](std::span<const float> block) {
                monitor.push(LevelSource::Loopback, block);
                mixer->feedLoopback(block);
            });
        if (!loopResult)
            return loopResult;

        if (loopback->sampleRate() != rate)
            return makeError(ErrorCode::CaptureError,
                             std::format("Loopback device runs at {} Hz, expected {} Hz",
                                         loopback->sampleRate(),
                                         rate));

        buffer.sampleRate = rate;
        buffer.channels = 1;

        if (auto started = mic->start(); !started)
            return started;
        return loopback->start();
    }
};

Recorder::Recorder(CaptureDeviceFactory factory, LevelMonitor& monitor):
    _impl(std::make_unique<Impl>(std::move(factory), monitor))
{
}

Recorder::~Recorder()
{
    _impl->shutdownDevices();
}

auto Recorder::start(const RecorderConfig& config) -> VoidResult
{
    if (_impl->recording)
        return makeError(ErrorCode::CaptureError, "Recording already in progress");

    _impl->buffer = AudioBuffer { .samples = {}, .sampleRate = config.sampleRate, .channels = 1 };
    _impl->mixer.reset();
    _impl->loopback.reset();
    _impl->mic = _impl->factory();
    if (!_impl->mic)
        return makeError(ErrorCode::CaptureError, "No capture device available");

    auto const dual = config.loopbackDevice.has_value() && !config.loopbackDevice->empty();
    _impl->monitor.setLoopbackEnabled(dual);

    auto result = VoidResult {};
    if (dual)
    {
        _impl->loopback = _impl->factory();
        if (!_impl->loopback)
            return makeError(ErrorCode::CaptureError, "No capture device available for loopback");
        result = _impl->startDual(config);
    }
    else
    {
        result = _impl->startSingle(config);
    }

    if (!result)
    {
        _impl->shutdownDevices();
        _impl->mic.reset();
        _impl->loopback.reset();
        return result;
    }

    _impl->recording = true;
    log::info("Recording started ({}, {} Hz)", dual ? "dual: mic + loopback" : "mic", _impl->buffer.sampleRate);
    return {};
}

auto Recorder::stop() -> AudioBuffer
{
    if (!_impl->recording)
        return std::move(_impl->buffer);

    _impl->shutdownDevices();
    if (_impl->mixer)
        _impl->mixer->flush();

    _impl->recording = false;
    _impl->mic.reset();
    _impl->loopback.reset();
    _impl->mixer.reset();

    auto buffer = std::move(_impl->buffer);
    _impl->buffer = AudioBuffer {};
    log::info("Recording stopped ({:.2f}s @ {} Hz)", buffer.duration(), buffer.sampleRate);
    return buffer;
}

auto Recorder::isRecording() const -> bool
{
    return _impl->recording;
}

auto Recorder::isDualSource() const -> bool
{
    return _impl->recording && _impl->loopback != nullptr;
}

} // namespace supervox
