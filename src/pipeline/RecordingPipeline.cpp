// SPDX-License-Identifier: Apache-2.0
#include "RecordingPipeline.hpp"

#include <audio/Recorder.hpp>
#include <audio/WavFile.hpp>
#include <core/Log.hpp>
#include <pipeline/ChunkSplitter.hpp>
#include <pipeline/SegmentMerger.hpp>
#include <transcript/Formatting.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <ctime>
#include <format>
#include <mutex>
#include <random>
#include <thread>

namespace supervox
{

namespace
{

    /// @brief One provider call: a chunk and the file that carries its audio.
    struct TranscriptionJob
    {
        Chunk chunk;
        std::filesystem::path audioPath;
        AudioFormat format = AudioFormat::Wav;
    };

    auto timestampBaseName() -> std::string
    {
        auto const now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
        auto local = std::tm {};
#ifdef _WIN32
        localtime_s(&local, &now);
#else
        localtime_r(&now, &local);
#endif
        auto buffer = std::array<char, 32> {};
        auto const length = std::strftime(buffer.data(), buffer.size(), "rec_%Y%m%d_%H%M%S", &local);
        return std::string(buffer.data(), length);
    }

    auto createWorkDir(const std::filesystem::path& root) -> Result<std::filesystem::path>
    {
        auto ec = std::error_code {};
        auto const parent = root.empty() ? std::filesystem::temp_directory_path(ec) : root;
        if (ec)
            return makeError(ErrorCode::IoError, std::format("No temporary directory: {}", ec.message()));

        std::filesystem::create_directories(parent, ec);
        if (ec)
            return makeError(ErrorCode::IoError,
                             std::format("Failed to create '{}': {}", parent.string(), ec.message()));

        auto random = std::mt19937_64 { std::random_device {}() };
        for (auto attempt = 0; attempt < 16; ++attempt)
        {
            auto const candidate = parent / std::format("supervox_{:016x}", random());
            if (std::filesystem::create_directory(candidate, ec))
                return candidate;
            if (ec)
                return makeError(ErrorCode::IoError,
                                 std::format("Failed to create '{}': {}", candidate.string(), ec.message()));
        }
        return makeError(ErrorCode::IoError, std::format("No free working directory name under {}", parent.string()));
    }

} // namespace

struct RecordingPipeline::Impl
{
    PipelineConfig config;
    PipelineContext& context;

    std::atomic<PipelineState> state = PipelineState::Idle;

    mutable std::mutex failureMutex;
    std::optional<PipelineFailure> failure;

    std::filesystem::path workDir;
    std::string base;
    std::optional<PersistencePlan> plan;
    bool openedLogFile = false;

    Impl(PipelineConfig c, PipelineContext& ctx): config(std::move(c)), context(ctx) {}

    auto layout() const -> OutputLayout
    {
        return OutputLayout {
            .recordingsDir = config.recordingsDir,
            .transcriptsDir = config.transcriptsDir,
            .logsDir = config.logsDir,
            .base = base,
            .provider = std::string(context.provider.name()),
        };
    }

    void transition(PipelineState next, std::string message)
    {
        state = next;
        log::info("{}", message);
        context.events.publish(PipelineEvent { .state = next, .message = std::move(message) });
    }

    void status(std::string message)
    {
        log::info("{}", message);
        context.events.publish(PipelineEvent { .state = state.load(), .message = std::move(message) });
    }

    auto fail(PipelineState stage, Error error, std::vector<std::size_t> completed = {}) -> std::unexpected<Error>
    {
        {
            auto const lock = std::lock_guard { failureMutex };
            failure = PipelineFailure { .stage = stage, .error = error, .completedChunks = std::move(completed) };
        }

        log::error("{} failed: {}", pipelineStateName(stage), error);
        transition(PipelineState::Failed, std::format("{} failed: {}", pipelineStateName(stage), error));

        if (plan && plan->logs)
            writePipelineLog(nullptr);
        return std::unexpected<Error>(std::move(error));
    }

    auto cancelled(PipelineState stage) -> std::unexpected<Error>
    {
        return fail(stage, Error { .code = ErrorCode::Cancelled, .message = "Processing cancelled" });
    }

    void ensureBaseName()
    {
        if (base.empty())
            base = config.outfilePrefix.empty() ? timestampBaseName() : config.outfilePrefix;
    }

    auto ensureWorkDir() -> VoidResult
    {
        if (!workDir.empty())
            return {};
        auto created = createWorkDir(config.workRoot);
        if (!created)
            return std::unexpected(created.error());
        workDir = std::move(*created);
        log::debug("Working directory: {}", workDir.string());
        return {};
    }

    void openLogFile()
    {
        if (openedLogFile)
            return;
        if (auto opened = log::openFile(layout().appLog()); !opened)
        {
            log::warning("File logging disabled: {}", opened.error());
            return;
        }
        openedLogFile = true;
        log::info("File logging enabled for this run");
    }

    void writePipelineLog(PipelineOutput* output)
    {
        auto text = std::string {};
        for (auto const& event: context.events.history())
        {
            text += formatEvent(event);
            text += '\n';
        }

        auto saved = context.storage.save(OutputKind::Log, text, layout().pipelineLog());
        if (!saved)
        {
            log::warning("{}", saved.error());
            if (output)
                output->persistenceErrors.push_back(saved.error());
            return;
        }
        if (output)
            output->paths["log"] = *saved;
    }

    void saveChunkTranscript(const Chunk& chunk, const TranscriptionResult& result)
    {
        auto saved =
            context.storage.save(OutputKind::Transcript, result.fullText, layout().chunkTranscript(chunk.index));
        if (!saved)
            log::warning("Chunk {} transcript not saved: {}", chunk.index + 1, saved.error());
    }

    /// @brief Runs all jobs on up to maxParallelRequests threads and returns results in chunk order.
    auto transcribeAll(const std::vector<TranscriptionJob>& jobs,
                       bool saveChunks,
                       std::stop_token stop,
                       std::vector<std::size_t>& completed) -> Result<std::vector<TranscriptionResult>>
    {
        auto results = std::vector<std::optional<TranscriptionResult>>(jobs.size());
        auto next = std::atomic<std::size_t> { 0 };
        auto abort = std::atomic<bool> { false };
        auto errorMutex = std::mutex {};
        auto firstError = std::optional<Error> {};

        auto const recordError = [&](Error error) {
            auto const lock = std::lock_guard { errorMutex };
            if (!firstError)
                firstError = std::move(error);
            abort = true;
        };

        auto const worker = [&] {
            while (!abort)
            {
                if (stop.stop_requested())
                {
                    recordError(Error { .code = ErrorCode::Cancelled, .message = "Processing cancelled" });
                    return;
                }

                auto const i = next.fetch_add(1);
                if (i >= jobs.size())
                    return;

                auto const& job = jobs[i];
                if (jobs.size() > 1)
                    status(std::format("Transcribing chunk {}/{} ({:.0f}s - {:.0f}s)...",
                                       i + 1,
                                       jobs.size(),
                                       job.chunk.startSeconds,
                                       job.chunk.endSeconds));

                auto result = context.provider.transcribe(TranscriptionRequest {
                    .audioPath = job.audioPath,
                    .format = job.format,
                    .model = config.model,
                    .language = config.language,
                    .diarize = config.diarize,
                    .contextBias = config.contextBias,
                });

                if (!result)
                {
                    auto error = result.error();
                    error.chunkIndex = i;
                    recordError(std::move(error));
                    return;
                }

                if (saveChunks && jobs.size() > 1)
                    saveChunkTranscript(job.chunk, *result);
                results[i] = std::move(*result);
            }
        };

        auto const workers =
            std::clamp<std::size_t>(config.maxParallelRequests, 1, std::max<std::size_t>(jobs.size(), 1));
        if (workers == 1)
        {
            worker();
        }
        else
        {
            auto threads = std::vector<std::jthread> {};
            threads.reserve(workers);
            for (auto w = std::size_t { 0 }; w < workers; ++w)
                threads.emplace_back(worker);
        }

        for (auto i = std::size_t { 0 }; i < results.size(); ++i)
        {
            if (results[i])
                completed.push_back(i);
        }

        if (firstError)
            return std::unexpected(*firstError);

        auto ordered = std::vector<TranscriptionResult> {};
        ordered.reserve(results.size());
        for (auto& result: results)
            ordered.push_back(std::move(*result));
        return ordered;
    }
};

RecordingPipeline::RecordingPipeline(PipelineConfig config, PipelineContext& context):
    _impl(std::make_unique<Impl>(std::move(config), context))
{
}

RecordingPipeline::~RecordingPipeline()
{
    if (_impl->state != PipelineState::Cleaned && (!_impl->workDir.empty() || _impl->openedLogFile))
        clean();
}

auto RecordingPipeline::planPersistence(const PipelineConfig& config, double duration) -> PersistencePlan
{
    auto const forced = duration > config.chunkDuration;
    auto const all = forced || config.saveAll;
    return PersistencePlan {
        .rawAudio = all || config.keep.keepRawAudio,
        .compressedAudio = all || config.keep.keepCompressedAudio,
        .transcripts = all || config.keep.keepTranscripts,
        .logs = all || config.keep.keepLogs,
        .forced = forced,
    };
}

auto RecordingPipeline::record(std::stop_token stop) -> Result<CapturedAudio>
{
    auto& impl = *_impl;
    if (impl.state != PipelineState::Idle)
        return makeError(ErrorCode::InvalidArgument, "A pipeline records only once");

    impl.ensureBaseName();
    if (auto dir = impl.ensureWorkDir(); !dir)
        return impl.fail(PipelineState::Recording, dir.error());

    if (impl.config.saveAll || impl.config.keep.keepLogs)
        impl.openLogFile();

    auto const dual = impl.config.loopbackDevice && !impl.config.loopbackDevice->empty();
    impl.transition(PipelineState::Recording, dual ? "Recording (dual: mic + loopback)..." : "Recording...");

    auto recorder = Recorder(impl.context.captureFactory, impl.context.levels);
    auto started = recorder.start(RecorderConfig {
        .micDevice = impl.config.micDevice,
        .loopbackDevice = impl.config.loopbackDevice,
        .sampleRate = impl.config.sampleRate,
        .channels = impl.config.channels,
        .gains = impl.config.gains,
    });
    if (!started)
        return impl.fail(PipelineState::Recording, started.error());

    {
        auto mutex = std::mutex {};
        auto stopped = std::condition_variable_any {};
        auto lock = std::unique_lock { mutex };
        stopped.wait(lock, stop, [] { return false; });
    }

    auto buffer = recorder.stop();
    if (buffer.empty())
        return impl.fail(PipelineState::Recording,
                         Error { .code = ErrorCode::CaptureError, .message = "No audio was captured" });

    auto wavPath = impl.workDir / std::format("{}.wav", sanitizeFileComponent(impl.base));
    if (auto written = writeWav(wavPath, buffer); !written)
        return impl.fail(PipelineState::Recording, written.error());

    impl.status(std::format("Recording completed ({:.1f}s).", buffer.duration()));
    return CapturedAudio { .buffer = std::move(buffer), .wavPath = std::move(wavPath) };
}

auto RecordingPipeline::process(const CapturedAudio& audio, std::stop_token stop) -> Result<PipelineOutput>
{
    auto& impl = *_impl;
    auto const& config = impl.config;

    impl.ensureBaseName();
    if (auto dir = impl.ensureWorkDir(); !dir)
        return impl.fail(PipelineState::Converting, dir.error());

    auto const duration = audio.buffer.duration();
    auto const plan = planPersistence(config, duration);
    impl.plan = plan;

    if (plan.forced && !config.saveAll)
        impl.status(std::format("Long recording ({:.1f}s > {}s): keeping all outputs", duration, config.chunkDuration));
    if (plan.logs)
        impl.openLogFile();

    auto output = PipelineOutput {};
    output.duration = duration;
    output.persistence = plan;

    // Conversion failures fall back to the raw WAV.
    auto sendPath = audio.wavPath;
    auto sendFormat = AudioFormat::Wav;
    auto converted = std::optional<std::filesystem::path> {};
    if (config.format != AudioFormat::Wav)
    {
        impl.transition(PipelineState::Converting, std::format("Converting to {}...", audioFormatName(config.format)));
        if (auto result = impl.context.converter.convert(audio.wavPath, config.format); result)
        {
            converted = *result;
            sendPath = *result;
            sendFormat = config.format;
        }
        else
        {
            log::warning("{}", result.error());
            impl.status(std::format("Conversion failed, sending WAV instead: {}", result.error().message));
        }
    }

    if (stop.stop_requested())
        return impl.cancelled(impl.state);

    auto chunks = std::vector<Chunk> {};
    auto jobs = std::vector<TranscriptionJob> {};
    if (duration > config.chunkDuration)
    {
        impl.transition(PipelineState::Chunking,
                        std::format("Long recording ({:.0f}s > {}s): chunking enabled.",
                                    duration,
                                    config.chunkDuration));

        auto split = ChunkSplitter(config.chunkDuration, config.chunkOverlap).split(audio.buffer);
        if (!split)
            return impl.fail(PipelineState::Chunking, split.error());
        chunks = std::move(*split);

        for (auto const& chunk: chunks)
        {
            auto const chunkWav = impl.workDir / std::format("chunk_{:03}.wav", chunk.index);
            if (auto written = writeWav(chunkWav, ChunkSplitter::extract(audio.buffer, chunk)); !written)
                return impl.fail(PipelineState::Chunking, written.error());

            auto job = TranscriptionJob { .chunk = chunk, .audioPath = chunkWav, .format = AudioFormat::Wav };
            if (converted)
            {
                if (auto result = impl.context.converter.convert(chunkWav, config.format); result)
                {
                    job.audioPath = *result;
                    job.format = config.format;
                }
                else
                {
                    log::warning("Chunk {} sent as WAV: {}", chunk.index + 1, result.error());
                }
            }
            jobs.push_back(std::move(job));
        }
    }
    else
    {
        auto const whole = Chunk {
            .index = 0,
            .startFrame = 0,
            .endFrame = audio.buffer.frameCount(),
            .startSeconds = 0.0,
            .endSeconds = duration,
        };
        chunks.push_back(whole);
        jobs.push_back(TranscriptionJob { .chunk = whole, .audioPath = sendPath, .format = sendFormat });
    }
    output.chunkCount = chunks.size();

    if (stop.stop_requested())
        return impl.cancelled(impl.state);

    impl.transition(PipelineState::Transcribing,
                    jobs.size() == 1 ? std::string("Transcribing...")
                                     : std::format("Transcribing {} chunks...", jobs.size()));

    auto completed = std::vector<std::size_t> {};
    auto transcribed = impl.transcribeAll(jobs, plan.transcripts, stop, completed);
    if (!transcribed)
    {
        if (!completed.empty())
        {
            auto list = std::string {};
            for (auto const index: completed)
                list += std::format("{}{}", list.empty() ? "" : ", ", index + 1);
            log::info("Chunks completed before the failure: {}", list);
        }
        return impl.fail(PipelineState::Transcribing, transcribed.error(), std::move(completed));
    }

    auto& results = *transcribed;
    if (results.size() > 1)
    {
        impl.transition(PipelineState::Merging, std::format("Merging {} chunk transcripts...", results.size()));
        auto merged = SegmentMerger::merge(chunks, results);
        if (!merged)
            return impl.fail(PipelineState::Merging, merged.error());
        output.merged = std::move(*merged);

        auto raws = nlohmann::json::array();
        for (auto& result: results)
            raws.push_back(std::move(result.raw));
        output.raw = nlohmann::json { { "chunks", std::move(raws) } };
    }
    else
    {
        output.merged = MergedTranscript { .segments = results.front().segments, .text = results.front().fullText };
        output.raw = std::move(results.front().raw);
    }

    output.rawTranscript = config.diarize && !output.merged.segments.empty()
                               ? formatDiarizedTranscript(output.merged.segments)
                               : output.merged.text;
    output.text = output.rawTranscript;

    auto const transform = config.prompt && !trim(*config.prompt).empty();
    if (transform)
    {
        impl.transition(PipelineState::Transforming, "Applying prompt...");
        auto chat = impl.context.provider.chat(output.rawTranscript, *config.prompt, config.chatModel);
        if (!chat)
            return impl.fail(PipelineState::Transforming, chat.error());

        output.text = std::move(chat->text);
        output.raw = nlohmann::json {
            { "transcription", std::move(output.raw) },
            { "transformation", std::move(chat->raw) },
        };
    }

    if (stop.stop_requested())
        return impl.cancelled(impl.state);

    impl.transition(PipelineState::Persisting,
                    plan.rawAudio || plan.compressedAudio || plan.transcripts || plan.logs
                        ? std::string("Saving outputs...")
                        : std::string("Nothing to save (zero-footprint mode)."));

    auto const layout = impl.layout();
    auto const save = [&](OutputKind kind, OutputContent content, const std::filesystem::path& destination,
                          std::string key) {
        auto saved = impl.context.storage.save(kind, content, destination);
        if (!saved)
        {
            log::warning("{}", saved.error());
            output.persistenceErrors.push_back(saved.error());
            return;
        }
        output.paths[std::move(key)] = *saved;
    };

    if (plan.rawAudio)
        save(OutputKind::Audio, audio.wavPath, layout.rawAudio(), "wav");
    if (plan.compressedAudio && converted)
        save(OutputKind::CompressedAudio,
             *converted,
             layout.compressedAudio(audioFormatName(config.format)),
             "converted");
    if (plan.transcripts)
    {
        save(OutputKind::Transcript, output.text, layout.transcript(), "txt");
        save(OutputKind::RawJson, output.raw, layout.rawJson(), "json");
        if (transform)
            save(OutputKind::Transcript, output.rawTranscript, layout.rawTranscript(), "raw_txt");
    }

    if (config.copyToClipboard)
    {
        if (auto copied = impl.context.clipboard.copy(output.text); copied)
            impl.status("Copied transcription to clipboard.");
        else
            impl.status(std::format("Failed to copy to clipboard: {}", copied.error().message));
    }

    impl.status(std::format("Processing finished ({:.2f}s of audio).", duration));
    if (plan.logs)
        impl.writePipelineLog(&output);

    return output;
}

void RecordingPipeline::clean()
{
    auto& impl = *_impl;
    if (impl.state == PipelineState::Cleaned)
        return;

    if (!impl.workDir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::remove_all(impl.workDir, ec);
        if (ec)
            log::warning("Failed to delete working directory {}: {}", impl.workDir.string(), ec.message());
        else
            log::info("Deleted working directory {}", impl.workDir.string());
    }

    impl.transition(PipelineState::Cleaned, "Cleanup completed.");

    if (impl.openedLogFile)
    {
        log::closeFile();
        impl.openedLogFile = false;
    }
}

auto RecordingPipeline::run(std::stop_token recordStop, std::stop_token processStop) -> Result<PipelineOutput>
{
    auto captured = record(std::move(recordStop));
    if (!captured)
    {
        clean();
        return std::unexpected(captured.error());
    }

    auto output = process(*captured, std::move(processStop));
    clean();
    return output;
}

auto RecordingPipeline::state() const -> PipelineState
{
    return _impl->state;
}

auto RecordingPipeline::failure() const -> std::optional<PipelineFailure>
{
    auto const lock = std::lock_guard { _impl->failureMutex };
    return _impl->failure;
}

auto RecordingPipeline::workDir() const -> std::filesystem::path
{
    return _impl->workDir;
}

auto RecordingPipeline::baseName() const -> std::string
{
    return _impl->base;
}

} // namespace supervox
