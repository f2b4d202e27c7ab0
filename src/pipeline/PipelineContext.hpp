// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioFormat.hpp>
#include <audio/CaptureDevice.hpp>
#include <audio/DualSourceMixer.hpp>
#include <audio/LevelMonitor.hpp>
#include <pipeline/AudioConverter.hpp>
#include <pipeline/Clipboard.hpp>
#include <pipeline/EventChannel.hpp>
#include <pipeline/Storage.hpp>
#include <providers/Provider.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace supervox
{

/// @brief Configured keep flags, before the long-recording override.
struct PersistenceFlags
{
    bool keepRawAudio = false;
    bool keepCompressedAudio = false;
    bool keepTranscripts = false;
    bool keepLogs = false;
};

/// @brief Immutable settings of one pipeline run.
struct PipelineConfig
{
    std::string micDevice;
    std::optional<std::string> loopbackDevice;
    unsigned sampleRate = 16000;
    unsigned channels = 1;
    MixGains gains;

    AudioFormat format = AudioFormat::Opus;
    std::string model = "voxtral-mini-latest";
    std::string chatModel = "mistral-small-latest";
    std::optional<std::string> language;
    bool diarize = false;
    std::vector<std::string> contextBias;

    double chunkDuration = 300.0;
    double chunkOverlap = 30.0;
    unsigned maxParallelRequests = 1;

    /// @brief Resolved transformation prompt; none means transcription only.
    std::optional<std::string> prompt;

    PersistenceFlags keep;
    bool saveAll = false;
    bool copyToClipboard = true;

    std::filesystem::path recordingsDir = "recordings";
    std::filesystem::path transcriptsDir = "transcripts";
    std::filesystem::path logsDir = "logs";

    /// @brief Base name of output files; empty selects rec_YYYYMMDD_HHMMSS.
    std::string outfilePrefix;

    /// @brief Parent of the per-run working directory; empty selects the system temp directory.
    std::filesystem::path workRoot;
};

/// @brief The collaborators of one run, owned by the caller and outliving the pipeline.
struct PipelineContext
{
    Provider& provider;
    AudioConverter& converter;
    Storage& storage;
    Clipboard& clipboard;
    CaptureDeviceFactory captureFactory;
    LevelMonitor& levels;
    EventChannel& events;
};

} // namespace supervox
