// SPDX-License-Identifier: Apache-2.0

#include "AudioCapture.hpp"

#include <core/Log.hpp>

#include <miniaudio.h>

#include <algorithm>
#include <atomic>
#include <cctype>
#include <optional>
#include <string>

namespace supervox
{

struct AudioCapture::Impl
{
    ma_context context {};
    ma_device device {};
    AudioCallback callback;
    std::atomic<bool> capturing = false;
    bool contextInitialized = false;
    bool initialized = false;
};

namespace
{

    void audioDataCallback(ma_device* device, void* /*output*/, const void* input, ma_uint32 frameCount)
    {
        auto* impl = static_cast<AudioCapture::Impl*>(device->pUserData);
        if (impl && impl->callback && input && impl->capturing.load(std::memory_order_relaxed))
            impl->callback(std::span<const float>(static_cast<const float*>(input),
                                                  static_cast<std::size_t>(frameCount) * device->capture.channels));
    }

    auto toLower(std::string s) -> std::string
    {
        std::ranges::transform(s, s.begin(), [](unsigned char c) { return std::tolower(c); });
        return s;
    }

    /// @brief Monitor sources are loopbacks of an output, not microphones.
    auto isMonitorSource(std::string_view name) -> bool
    {
        auto const lower = toLower(std::string(name));
        return lower.starts_with("monitor") || lower.contains(".monitor");
    }

    auto nativeRateOf(const ma_device_info& info) -> unsigned
    {
        for (auto i = ma_uint32 { 0 }; i < info.nativeDataFormatCount; ++i)
        {
            if (info.nativeDataFormats[i].sampleRate != 0)
                return info.nativeDataFormats[i].sampleRate;
        }
        return 0;
    }

    /// @brief Owns a temporary miniaudio context for one-shot device queries.
    class ScopedContext
    {
      public:
        ScopedContext(): _ok(ma_context_init(nullptr, 0, nullptr, &_context) == MA_SUCCESS) {}
        ~ScopedContext()
        {
            if (_ok)
                ma_context_uninit(&_context);
        }

        ScopedContext(const ScopedContext&) = delete;
        ScopedContext& operator=(const ScopedContext&) = delete;

        [[nodiscard]] auto ok() const -> bool { return _ok; }
        [[nodiscard]] auto get() -> ma_context* { return &_context; }

      private:
        ma_context _context {};
        bool _ok;
    };

} // namespace

auto listCaptureDevices() -> Result<std::vector<CaptureDeviceInfo>>
{
    auto context = ScopedContext {};
    if (!context.ok())
        return makeError(ErrorCode::CaptureError, "Failed to initialize audio context");

    ma_device_info* pCaptureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const result =
        ma_context_get_devices(context.get(), nullptr, nullptr, &pCaptureDevices, &captureCount);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::CaptureError,
                         std::format("Failed to enumerate capture devices: {}", static_cast<int>(result)));

    auto devices = std::vector<CaptureDeviceInfo> {};
    for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
    {
        // Full info (native formats) requires a per-device query.
        auto detailed = pCaptureDevices[i];
        ma_context_get_device_info(context.get(), ma_device_type_capture, &pCaptureDevices[i].id, &detailed);

        devices.push_back(CaptureDeviceInfo {
            .name = pCaptureDevices[i].name,
            .nativeSampleRate = nativeRateOf(detailed),
            .isDefault = pCaptureDevices[i].isDefault != MA_FALSE,
        });
    }
    return devices;
}

auto findCaptureDevice(std::string_view name) -> Result<CaptureDeviceInfo>
{
    auto devices = listCaptureDevices();
    if (!devices)
        return std::unexpected(devices.error());

    auto const target = toLower(std::string(name));
    for (auto& device: *devices)
    {
        if (toLower(device.name).contains(target))
        {
            log::info("Found capture device '{}' for filter '{}'", device.name, name);
            return std::move(device);
        }
    }
    return makeError(ErrorCode::CaptureError,
                     std::format("Capture device '{}' not found. Check your audio configuration.", name));
}

AudioCapture::AudioCapture(): _impl(std::make_unique<Impl>())
{
}

AudioCapture::~AudioCapture()
{
    stop();
    if (_impl->initialized)
        ma_device_uninit(&_impl->device);
    if (_impl->contextInitialized)
        ma_context_uninit(&_impl->context);
}

auto AudioCapture::initialize(const CaptureDeviceConfig& config, AudioCallback callback) -> VoidResult
{
    if (_impl->initialized)
        return makeError(ErrorCode::CaptureError, "Audio device already initialized");

    _impl->callback = std::move(callback);

    // The context must outlive the device
    auto const ctxResult = ma_context_init(nullptr, 0, nullptr, &_impl->context);
    if (ctxResult != MA_SUCCESS)
        return makeError(ErrorCode::CaptureError,
                         std::format("Failed to initialize audio context: {}", static_cast<int>(ctxResult)));
    _impl->contextInitialized = true;

    // Enumerate capture devices
    ma_device_info* pCaptureDevices = nullptr;
    auto captureCount = ma_uint32 { 0 };
    auto const enumResult =
        ma_context_get_devices(&_impl->context, nullptr, nullptr, &pCaptureDevices, &captureCount);

    auto matchedDeviceId = std::optional<ma_device_id> {};
    if (enumResult == MA_SUCCESS)
    {
        log::debug("Available capture devices:");
        for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            log::debug("  [{}] {}", i, pCaptureDevices[i].name);

        if (!config.deviceName.empty())
        {
            auto const lowerTarget = toLower(config.deviceName);
            for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            {
                if (toLower(pCaptureDevices[i].name).contains(lowerTarget))
                {
                    log::info("Matched capture device '{}' for filter '{}'",
                              pCaptureDevices[i].name,
                              config.deviceName);
                    matchedDeviceId = pCaptureDevices[i].id;
                    break;
                }
            }

            if (!matchedDeviceId)
            {
                if (config.requireMatch)
                    return makeError(ErrorCode::CaptureError,
                                     std::format("Capture device '{}' not found", config.deviceName));
                log::warning("No capture device matching '{}' found, falling back to auto-select",
                             config.deviceName);
            }
        }

        // Auto-select: pick the first non-monitor device
        if (!matchedDeviceId)
        {
            for (auto i = ma_uint32 { 0 }; i < captureCount; ++i)
            {
                if (!isMonitorSource(pCaptureDevices[i].name))
                {
                    log::info("Auto-selected capture device '{}' (skipping monitor sources)",
                              pCaptureDevices[i].name);
                    matchedDeviceId = pCaptureDevices[i].id;
                    break;
                }
            }
        }
    }
    else if (config.requireMatch)
    {
        return makeError(ErrorCode::CaptureError,
                         std::format("Failed to enumerate capture devices (code: {})", static_cast<int>(enumResult)));
    }
    else
    {
        log::warning("Failed to enumerate capture devices (code: {}), using default",
                     static_cast<int>(enumResult));
    }

    auto deviceConfig = ma_device_config_init(ma_device_type_capture);
    deviceConfig.capture.format = ma_format_f32;
    deviceConfig.capture.channels = config.channels == 0 ? 1 : config.channels;
    deviceConfig.sampleRate = config.sampleRate; // 0 = device native rate, no resampling
    deviceConfig.dataCallback = audioDataCallback;
    deviceConfig.pUserData = _impl.get();

    if (matchedDeviceId)
        deviceConfig.capture.pDeviceID = &*matchedDeviceId;

    auto const result = ma_device_init(&_impl->context, &deviceConfig, &_impl->device);
    if (result != MA_SUCCESS)
        return makeError(ErrorCode::CaptureError,
                         std::format("Failed to initialize audio device: {}", static_cast<int>(result)));

    _impl->initialized = true;
    log::info("Audio capture initialized: '{}' ({} Hz, {} ch, float32)",
              _impl->device.capture.name,
              _impl->device.sampleRate,
              _impl->device.capture.channels);
    return {};
}

auto AudioCapture::start() -> VoidResult
{
    if (!_impl->initialized)
        return makeError(ErrorCode::CaptureError, "Audio device not initialized");

    if (_impl->capturing)
        return {};

    _impl->capturing = true;
    auto const result = ma_device_start(&_impl->device);
    if (result != MA_SUCCESS)
    {
        _impl->capturing = false;
        return makeError(ErrorCode::CaptureError,
                         std::format("Failed to start audio capture: {}", static_cast<int>(result)));
    }

    log::debug("Audio capture started: {}", _impl->device.capture.name);
    return {};
}

void AudioCapture::stop()
{
    if (!_impl->capturing)
        return;

    // ma_device_stop() waits for the in-flight callback to return.
    ma_device_stop(&_impl->device);
    _impl->capturing = false;
    log::debug("Audio capture stopped: {}", _impl->device.capture.name);
}

auto AudioCapture::isCapturing() const -> bool
{
    return _impl->capturing;
}

auto AudioCapture::sampleRate() const -> unsigned
{
    return _impl->initialized ? _impl->device.sampleRate : 0;
}

auto AudioCapture::channels() const -> unsigned
{
    return _impl->initialized ? _impl->device.capture.channels : 0;
}

auto AudioCapture::name() const -> std::string
{
    return _impl->initialized ? std::string(_impl->device.capture.name) : std::string {};
}

} // namespace supervox
