// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioBuffer.hpp>
#include <core/Error.hpp>
#include <pipeline/EventChannel.hpp>
#include <pipeline/PipelineContext.hpp>
#include <transcript/Types.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <map>
#include <memory>
#include <optional>
#include <stop_token>
#include <string>
#include <vector>

namespace supervox
{

/// @brief A finished recording, written to the run's working directory.
struct CapturedAudio
{
    AudioBuffer buffer;
    std::filesystem::path wavPath;
};

/// @brief Which outputs go to durable storage.
struct PersistencePlan
{
    bool rawAudio = false;
    bool compressedAudio = false;
    bool transcripts = false;
    bool logs = false;

    /// @brief Set when the recording was longer than one chunk and everything is kept regardless of flags.
    bool forced = false;
};

/// @brief Where and why a run failed.
struct PipelineFailure
{
    PipelineState stage = PipelineState::Idle;
    Error error;

    /// @brief Chunks whose transcription had completed when the run failed.
    std::vector<std::size_t> completedChunks;
};

/// @brief Result of process().
struct PipelineOutput
{
    /// @brief Final text: the transformation when a prompt ran, else the transcript.
    std::string text;

    /// @brief Transcript before transformation (speaker-formatted when diarized).
    std::string rawTranscript;

    nlohmann::json raw;
    MergedTranscript merged;
    double duration = 0.0;
    std::size_t chunkCount = 0;

    /// @brief Written files keyed by role ("wav", "converted", "txt", "json", "raw_txt", "log").
    std::map<std::string, std::filesystem::path> paths;

    PersistencePlan persistence;

    /// @brief Saves that failed; the transcript above is still valid.
    std::vector<Error> persistenceErrors;
};

/// @brief Drives one recording from capture to persisted transcript.
///
/// States: Idle -> Recording -> Converting? -> Chunking? -> Transcribing -> Merging
/// -> Transforming? -> Persisting -> Cleaned, with Failed reachable from any stage.
/// A failed run still cleans up its working directory. Every transition and status
/// message is published on the context's EventChannel.
class RecordingPipeline
{
  public:
    RecordingPipeline(PipelineConfig config, PipelineContext& context);
    ~RecordingPipeline();

    RecordingPipeline(const RecordingPipeline&) = delete;
    RecordingPipeline& operator=(const RecordingPipeline&) = delete;

    /// @brief Captures audio until stop is requested, then writes it as WAV.
    /// @return The recording, or a CaptureError.
    [[nodiscard]] auto record(std::stop_token stop) -> Result<CapturedAudio>;

    /// @brief Converts, chunks, transcribes, merges, transforms and persists a recording.
    ///
    /// A stop request aborts with Cancelled before the next chunk and skips persistence.
    [[nodiscard]] auto process(const CapturedAudio& audio, std::stop_token stop = {}) -> Result<PipelineOutput>;

    /// @brief Deletes the working directory and detaches the log file this run opened.
    void clean();

    /// @brief record(), process() and clean() in sequence. clean() runs even on failure.
    /// @param recordStop Ends the recording.
    /// @param processStop Cancels processing.
    [[nodiscard]] auto run(std::stop_token recordStop, std::stop_token processStop = {}) -> Result<PipelineOutput>;

    [[nodiscard]] auto state() const -> PipelineState;

    /// @brief Set once the run failed; kept after clean().
    [[nodiscard]] auto failure() const -> std::optional<PipelineFailure>;

    /// @brief Per-run directory for temporary audio, created by record(). Empty before.
    [[nodiscard]] auto workDir() const -> std::filesystem::path;

    /// @brief Output base name of this run.
    [[nodiscard]] auto baseName() const -> std::string;

    /// @brief Applies the keep flags, saveAll, and the long-recording override.
    [[nodiscard]] static auto planPersistence(const PipelineConfig& config, double duration) -> PersistencePlan;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace supervox
