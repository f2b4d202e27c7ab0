// SPDX-License-Identifier: Apache-2.0
#include "FakeCaptureDevice.hpp"
#include "TempDirectory.hpp"

#include <pipeline/RecordingPipeline.hpp>

#include <catch2/catch_test_macros.hpp>

#include <algorithm>
#include <format>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <stop_token>
#include <string>
#include <vector>

using namespace supervox;
using namespace supervox::test;

namespace
{

    auto segment(double start, double end, std::string text, std::optional<std::string> speaker = std::nullopt)
        -> TranscriptionSegment
    {
        return TranscriptionSegment {
            .speakerId = std::move(speaker),
            .start = start,
            .end = end,
            .text = std::move(text),
            .score = std::nullopt,
        };
    }

    /// @brief Answers by audio file stem (chunk_000, chunk_001, or the recording's base name).
    class MockProvider: public Provider
    {
      public:
        struct ChatCall
        {
            std::string text;
            std::string prompt;
            std::string model;
        };

        std::map<std::string, TranscriptionResult> results;
        std::set<std::string> failing;
        std::optional<Error> chatError;

        [[nodiscard]] auto name() const -> std::string_view override { return "mock"; }

        auto transcribe(const TranscriptionRequest& request) -> Result<TranscriptionResult> override
        {
            auto const stem = request.audioPath.stem().string();
            {
                auto const lock = std::lock_guard { _mutex };
                _requests.push_back(request);
            }

            if (failing.contains(stem))
                return makeError(ErrorCode::ProviderError, std::format("HTTP 500 for {}", stem));
            if (auto const it = results.find(stem); it != results.end())
                return it->second;
            return TranscriptionResult { .fullText = "text of " + stem, .segments = {}, .raw = { { "file", stem } } };
        }

        auto chat(std::string_view text, std::string_view prompt, std::string_view model) -> Result<ChatResult> override
        {
            {
                auto const lock = std::lock_guard { _mutex };
                _chats.push_back(
                    ChatCall { .text = std::string(text), .prompt = std::string(prompt), .model = std::string(model) });
            }
            if (chatError)
                return std::unexpected(*chatError);
            return ChatResult { .text = std::format("Summary: {}", text), .raw = { { "reply", "ok" } } };
        }

        [[nodiscard]] auto requests() const -> std::vector<TranscriptionRequest>
        {
            auto const lock = std::lock_guard { _mutex };
            return _requests;
        }

        [[nodiscard]] auto requestedStems() const -> std::vector<std::string>
        {
            auto stems = std::vector<std::string> {};
            for (auto const& request: requests())
                stems.push_back(request.audioPath.stem().string());
            std::ranges::sort(stems);
            return stems;
        }

        [[nodiscard]] auto chats() const -> std::vector<ChatCall>
        {
            auto const lock = std::lock_guard { _mutex };
            return _chats;
        }

      private:
        mutable std::mutex _mutex;
        std::vector<TranscriptionRequest> _requests;
        std::vector<ChatCall> _chats;
    };

    /// @brief Pretends to convert by renaming the extension.
    class StubConverter: public AudioConverter
    {
      public:
        bool fail = false;
        std::size_t calls = 0;

        auto convert(const std::filesystem::path& rawPath, AudioFormat format) -> Result<std::filesystem::path> override
        {
            ++calls;
            if (fail)
                return makeError(ErrorCode::ConversionError, "ffmpeg not found");
            return std::filesystem::path(rawPath).replace_extension(audioFormatName(format));
        }
    };

    /// @brief Remembers every save and writes nothing.
    class RecordingStorage: public Storage
    {
      public:
        struct Save
        {
            OutputKind kind;
            std::filesystem::path destination;
        };

        bool fail = false;

        auto save(OutputKind kind, const OutputContent& /*content*/, const std::filesystem::path& destination)
            -> Result<std::filesystem::path> override
        {
            if (fail)
                return makeError(ErrorCode::PersistenceError, std::format("Disk full: {}", destination.string()));

            auto const lock = std::lock_guard { _mutex };
            _saves.push_back(Save { .kind = kind, .destination = destination });
            return destination;
        }

        [[nodiscard]] auto count(OutputKind kind) const -> std::size_t
        {
            auto const lock = std::lock_guard { _mutex };
            return static_cast<std::size_t>(std::ranges::count(_saves, kind, &Save::kind));
        }

        [[nodiscard]] auto size() const -> std::size_t
        {
            auto const lock = std::lock_guard { _mutex };
            return _saves.size();
        }

      private:
        mutable std::mutex _mutex;
        std::vector<Save> _saves;
    };

    class RecordingClipboard: public Clipboard
    {
      public:
        bool fail = false;
        std::vector<std::string> copies;

        auto copy(std::string_view text) -> VoidResult override
        {
            if (fail)
                return makeError(ErrorCode::ClipboardError, "No clipboard tool found");
            copies.emplace_back(text);
            return {};
        }
    };

    /// @brief Collaborators of one pipeline run that records the given number of seconds at 1 kHz.
    struct Harness
    {
        TempDirectory dir { "pipeline" };
        MockProvider provider;
        StubConverter converter;
        RecordingStorage storage;
        RecordingClipboard clipboard;
        LevelMonitor levels;
        EventChannel events;
        std::vector<FakeCaptureScript> scripts;
        std::shared_ptr<std::size_t> captureCalls = std::make_shared<std::size_t>(0);
        PipelineConfig config;

        explicit Harness(double seconds)
        {
            scripts.push_back(
                FakeCaptureScript { .blocks = constantBlocks(0.1f, static_cast<std::size_t>(seconds * 1000)) });

            config.sampleRate = 1000;
            config.format = AudioFormat::Wav;
            config.outfilePrefix = "meeting";
            config.workRoot = dir / "work";
            config.recordingsDir = dir / "recordings";
            config.transcriptsDir = dir / "transcripts";
            config.logsDir = dir / "logs";
        }

        auto context() -> PipelineContext
        {
            return PipelineContext {
                .provider = provider,
                .converter = converter,
                .storage = storage,
                .clipboard = clipboard,
                .captureFactory = scriptedFactory(scripts, captureCalls),
                .levels = levels,
                .events = events,
            };
        }

        /// @brief States of the published events with consecutive repeats collapsed.
        [[nodiscard]] auto states() const -> std::vector<PipelineState>
        {
            auto states = std::vector<PipelineState> {};
            for (auto const& event: events.history())
                if (states.empty() || states.back() != event.state)
                    states.push_back(event.state);
            return states;
        }

        [[nodiscard]] auto hasMessage(std::string_view needle) const -> bool
        {
            return std::ranges::any_of(events.history(),
                                       [&](const PipelineEvent& event) { return event.message.contains(needle); });
        }
    };

    auto stopped() -> std::stop_token
    {
        auto source = std::stop_source {};
        source.request_stop();
        return source.get_token();
    }

} // namespace

TEST_CASE("A 400 s recording is transcribed in two chunks without duplicating the overlap", "[pipeline]")
{
    auto h = Harness(400.0);
    h.provider.results["chunk_000"] = TranscriptionResult {
        .fullText = "Intro. Before the midpoint. Sentence across the boundary.",
        .segments = { segment(0.0, 10.0, "Intro."),
                      segment(275.0, 283.0, "Before the midpoint."),
                      segment(286.0, 299.0, "Sentence across the boundary.") },
        .raw = { { "chunk", 0 } },
    };
    h.provider.results["chunk_001"] = TranscriptionResult {
        .fullText = "Before the midpoint. Sentence across the boundary. Closing.",
        .segments = { segment(5.0, 13.0, "Before the midpoint."),
                      segment(16.0, 29.0, "Sentence across the boundary."),
                      segment(60.0, 70.0, "Closing.") },
        .raw = { { "chunk", 1 } },
    };

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped());

    REQUIRE(output.has_value());
    CHECK(output->chunkCount == 2);
    CHECK(output->duration == 400.0);
    CHECK(output->text == "Intro. Before the midpoint. Sentence across the boundary. Closing.");
    REQUIRE(output->merged.segments.size() == 4);
    CHECK(output->merged.segments[3].start == 330.0);
    CHECK(h.provider.requestedStems() == std::vector<std::string> { "chunk_000", "chunk_001" });

    REQUIRE(output->raw.contains("chunks"));
    CHECK(output->raw["chunks"].size() == 2);

    // Longer than one chunk: everything is kept although no keep flag is set.
    CHECK(output->persistence.forced);
    CHECK(output->paths.contains("wav"));
    CHECK(output->paths.contains("txt"));
    CHECK(output->paths.contains("json"));
    CHECK(output->paths.contains("log"));
    CHECK_FALSE(output->paths.contains("converted"));
    CHECK(h.storage.count(OutputKind::Transcript) == 3); // final text and two chunk transcripts
    CHECK(h.storage.count(OutputKind::Log) == 1);

    CHECK(h.hasMessage("Transcribing chunk 2/2"));
    CHECK(pipeline.state() == PipelineState::Cleaned);
    CHECK_FALSE(std::filesystem::exists(pipeline.workDir()));
}

TEST_CASE("A 120 s recording is sent whole and leaves nothing behind", "[pipeline]")
{
    auto h = Harness(120.0);
    h.provider.results["meeting"] = TranscriptionResult {
        .fullText = "Hello there.",
        .segments = { segment(0.0, 4.0, "Hello there.") },
        .raw = { { "text", "Hello there." } },
    };

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped());

    REQUIRE(output.has_value());
    CHECK(output->chunkCount == 1);
    CHECK(output->text == "Hello there.");
    CHECK(output->rawTranscript == "Hello there.");
    CHECK(output->raw == nlohmann::json { { "text", "Hello there." } });
    CHECK(*h.captureCalls == 1);
    CHECK(h.provider.requestedStems() == std::vector<std::string> { "meeting" });

    CHECK_FALSE(output->persistence.forced);
    CHECK(output->paths.empty());
    CHECK(output->persistenceErrors.empty());
    CHECK(h.storage.size() == 0);
    CHECK(h.clipboard.copies == std::vector<std::string> { "Hello there." });

    CHECK(h.states()
          == std::vector {
              PipelineState::Recording,
              PipelineState::Transcribing,
              PipelineState::Persisting,
              PipelineState::Cleaned,
          });
    CHECK(pipeline.baseName() == "meeting");
    CHECK_FALSE(pipeline.workDir().empty());
    CHECK_FALSE(std::filesystem::exists(pipeline.workDir()));
}

TEST_CASE("A failing chunk fails the run and reports the chunks already done", "[pipeline]")
{
    auto h = Harness(600.0);
    h.provider.failing.insert("chunk_001");

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped());

    REQUIRE_FALSE(output.has_value());
    CHECK(output.error().code == ErrorCode::ProviderError);
    REQUIRE(output.error().chunkIndex.has_value());
    CHECK(*output.error().chunkIndex == 1);
    CHECK(std::format("{}", output.error()).starts_with("[provider error, chunk 2]"));

    // Chunks run in order on one worker: the third is never sent.
    CHECK(h.provider.requests().size() == 2);

    auto const failure = pipeline.failure();
    REQUIRE(failure.has_value());
    CHECK(failure->stage == PipelineState::Transcribing);
    CHECK(failure->completedChunks == std::vector<std::size_t> { 0 });

    auto const states = h.states();
    CHECK(std::ranges::find(states, PipelineState::Failed) != states.end());
    CHECK(std::ranges::find(states, PipelineState::Merging) == states.end());
    CHECK(pipeline.state() == PipelineState::Cleaned);
    CHECK_FALSE(std::filesystem::exists(pipeline.workDir()));

    // The forced plan keeps the pipeline log of the failed run.
    CHECK(h.storage.count(OutputKind::Log) == 1);
}

TEST_CASE("Parallel chunk requests keep the merged text in chunk order", "[pipeline]")
{
    auto h = Harness(600.0);
    h.config.maxParallelRequests = 3;
    h.provider.results["chunk_000"] = TranscriptionResult { .fullText = "one", .segments = {}, .raw = {} };
    h.provider.results["chunk_001"] = TranscriptionResult { .fullText = "two", .segments = {}, .raw = {} };
    h.provider.results["chunk_002"] = TranscriptionResult { .fullText = "three", .segments = {}, .raw = {} };

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped());

    REQUIRE(output.has_value());
    CHECK(output->chunkCount == 3);
    CHECK(output->text == "one\n\ntwo\n\nthree");
    CHECK(h.provider.requestedStems() == std::vector<std::string> { "chunk_000", "chunk_001", "chunk_002" });
}

TEST_CASE("A failed conversion sends the WAV instead", "[pipeline]")
{
    auto h = Harness(120.0);
    h.config.format = AudioFormat::Opus;
    h.converter.fail = true;

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped());

    REQUIRE(output.has_value());
    CHECK(output->text == "text of meeting");

    auto const requests = h.provider.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].format == AudioFormat::Wav);
    CHECK(requests[0].audioPath.extension() == ".wav");
    CHECK(h.hasMessage("Conversion failed, sending WAV instead"));
}

TEST_CASE("A converted recording is uploaded and kept as compressed audio", "[pipeline]")
{
    auto h = Harness(120.0);
    h.config.format = AudioFormat::Mp3;
    h.config.keep.keepCompressedAudio = true;

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped());

    REQUIRE(output.has_value());
    auto const requests = h.provider.requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].format == AudioFormat::Mp3);
    CHECK(requests[0].audioPath.extension() == ".mp3");

    CHECK(output->paths.contains("converted"));
    CHECK_FALSE(output->paths.contains("wav"));
    CHECK(h.storage.count(OutputKind::CompressedAudio) == 1);
    CHECK(h.states()[1] == PipelineState::Converting);
}

TEST_CASE("Long recordings convert every chunk", "[pipeline]")
{
    auto h = Harness(400.0);
    h.config.format = AudioFormat::Opus;

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped());

    REQUIRE(output.has_value());
    CHECK(h.converter.calls == 3); // whole recording and two chunks
    for (auto const& request: h.provider.requests())
    {
        CHECK(request.format == AudioFormat::Opus);
        CHECK(request.audioPath.extension() == ".opus");
    }
}

TEST_CASE("A prompt transforms the transcript", "[pipeline]")
{
    auto h = Harness(120.0);
    h.config.prompt = "Summarize.";
    h.config.keep.keepTranscripts = true;
    h.provider.results["meeting"] = TranscriptionResult { .fullText = "Hello there.", .segments = {}, .raw = {} };

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped());

    REQUIRE(output.has_value());
    CHECK(output->text == "Summary: Hello there.");
    CHECK(output->rawTranscript == "Hello there.");
    CHECK(output->raw.contains("transcription"));
    CHECK(output->raw.contains("transformation"));
    CHECK(output->paths.contains("txt"));
    CHECK(output->paths.contains("raw_txt"));
    CHECK(h.clipboard.copies == std::vector<std::string> { "Summary: Hello there." });

    auto const chats = h.provider.chats();
    REQUIRE(chats.size() == 1);
    CHECK(chats[0].text == "Hello there.");
    CHECK(chats[0].prompt == "Summarize.");
    CHECK(chats[0].model == h.config.chatModel);

    auto const states = h.states();
    CHECK(std::ranges::find(states, PipelineState::Transforming) != states.end());
}

TEST_CASE("A blank prompt means transcription only", "[pipeline]")
{
    auto h = Harness(10.0);
    h.config.prompt = "  \n ";

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped());

    REQUIRE(output.has_value());
    CHECK(h.provider.chats().empty());
    CHECK(output->text == output->rawTranscript);
}

TEST_CASE("A failed transformation fails the run", "[pipeline]")
{
    auto h = Harness(10.0);
    h.config.prompt = "Summarize.";
    h.provider.chatError = Error { .code = ErrorCode::ProviderError, .message = "HTTP 401" };

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped());

    REQUIRE_FALSE(output.has_value());
    CHECK(output.error().code == ErrorCode::ProviderError);
    REQUIRE(pipeline.failure().has_value());
    CHECK(pipeline.failure()->stage == PipelineState::Transforming);
    CHECK(h.clipboard.copies.empty());
}

TEST_CASE("Diarized transcripts are grouped by speaker", "[pipeline]")
{
    auto h = Harness(10.0);
    h.config.diarize = true;
    h.provider.results["meeting"] = TranscriptionResult {
        .fullText = "Hi. Hello.",
        .segments = { segment(0.0, 1.0, "Hi.", "speaker_0"), segment(1.5, 3.0, "Hello.", "speaker_1") },
        .raw = {},
    };

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped());

    REQUIRE(output.has_value());
    CHECK(h.provider.requests().front().diarize);
    CHECK(output->text == "[00:00 - 00:01] Speaker 0:\nHi.\n\n[00:01 - 00:03] Speaker 1:\nHello.");
}

TEST_CASE("A clipboard failure does not fail the run", "[pipeline]")
{
    auto h = Harness(10.0);
    h.clipboard.fail = true;

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped());

    REQUIRE(output.has_value());
    CHECK(h.hasMessage("Failed to copy to clipboard: No clipboard tool found"));
}

TEST_CASE("Copying can be switched off", "[pipeline]")
{
    auto h = Harness(10.0);
    h.config.copyToClipboard = false;

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    REQUIRE(pipeline.run(stopped()).has_value());
    CHECK(h.clipboard.copies.empty());
}

TEST_CASE("A persistence failure keeps the transcript", "[pipeline]")
{
    auto h = Harness(10.0);
    h.config.keep.keepTranscripts = true;
    h.storage.fail = true;

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped());

    REQUIRE(output.has_value());
    CHECK(output->text == "text of meeting");
    CHECK(output->paths.empty());
    REQUIRE(output->persistenceErrors.size() == 2);
    CHECK(output->persistenceErrors[0].code == ErrorCode::PersistenceError);
}

TEST_CASE("Save-all keeps every output of a short recording", "[pipeline]")
{
    auto h = Harness(10.0);
    h.config.saveAll = true;
    h.config.format = AudioFormat::Opus;

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped());

    REQUIRE(output.has_value());
    CHECK_FALSE(output->persistence.forced);
    for (auto const* key: { "wav", "converted", "txt", "json", "log" })
        CHECK(output->paths.contains(key));
}

TEST_CASE("Cancelling processing skips transcription and persistence", "[pipeline]")
{
    auto h = Harness(10.0);
    h.config.keep.keepTranscripts = true;

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped(), stopped());

    REQUIRE_FALSE(output.has_value());
    CHECK(output.error().code == ErrorCode::Cancelled);
    CHECK(h.provider.requests().empty());
    CHECK(h.storage.size() == 0);
    CHECK(pipeline.state() == PipelineState::Cleaned);
    CHECK_FALSE(std::filesystem::exists(pipeline.workDir()));
}

TEST_CASE("A device that cannot be opened fails the recording stage", "[pipeline]")
{
    auto h = Harness(10.0);
    h.scripts.front().failInitialize = true;

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped());

    REQUIRE_FALSE(output.has_value());
    CHECK(output.error().code == ErrorCode::CaptureError);
    REQUIRE(pipeline.failure().has_value());
    CHECK(pipeline.failure()->stage == PipelineState::Recording);
    CHECK(pipeline.state() == PipelineState::Cleaned);
    CHECK(h.provider.requests().empty());
}

TEST_CASE("An empty capture is an error", "[pipeline]")
{
    auto h = Harness(0.0);

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto output = pipeline.run(stopped());

    REQUIRE_FALSE(output.has_value());
    CHECK(output.error().code == ErrorCode::CaptureError);
    CHECK(output.error().message == "No audio was captured");
}

TEST_CASE("A pipeline records only once", "[pipeline]")
{
    auto h = Harness(1.0);

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    auto first = pipeline.record(stopped());
    REQUIRE(first.has_value());
    CHECK(first->buffer.sampleRate == 1000);
    CHECK(first->buffer.frameCount() == 1000);
    CHECK(std::filesystem::exists(first->wavPath));
    CHECK(first->wavPath.filename() == "meeting.wav");

    auto second = pipeline.record(stopped());
    REQUIRE_FALSE(second.has_value());
    CHECK(second.error().code == ErrorCode::InvalidArgument);

    pipeline.clean();
    CHECK_FALSE(std::filesystem::exists(first->wavPath));
}

TEST_CASE("Without a prefix the base name is a timestamp", "[pipeline]")
{
    auto h = Harness(1.0);
    h.config.outfilePrefix.clear();

    auto context = h.context();
    auto pipeline = RecordingPipeline(h.config, context);
    REQUIRE(pipeline.run(stopped()).has_value());

    auto const base = pipeline.baseName();
    CHECK(base.starts_with("rec_"));
    CHECK(base.size() == std::string_view("rec_YYYYMMDD_HHMMSS").size());
}

TEST_CASE("planPersistence applies keep flags, save-all and the long-recording override", "[pipeline]")
{
    auto config = PipelineConfig {};
    config.chunkDuration = 300.0;

    SECTION("nothing is kept by default")
    {
        auto const plan = RecordingPipeline::planPersistence(config, 120.0);
        CHECK_FALSE(plan.rawAudio);
        CHECK_FALSE(plan.compressedAudio);
        CHECK_FALSE(plan.transcripts);
        CHECK_FALSE(plan.logs);
        CHECK_FALSE(plan.forced);
    }

    SECTION("keep flags select single outputs")
    {
        config.keep.keepTranscripts = true;
        auto const plan = RecordingPipeline::planPersistence(config, 120.0);
        CHECK(plan.transcripts);
        CHECK_FALSE(plan.rawAudio);
        CHECK_FALSE(plan.logs);
    }

    SECTION("save-all keeps everything without forcing")
    {
        config.saveAll = true;
        auto const plan = RecordingPipeline::planPersistence(config, 120.0);
        CHECK(plan.rawAudio);
        CHECK(plan.compressedAudio);
        CHECK(plan.transcripts);
        CHECK(plan.logs);
        CHECK_FALSE(plan.forced);
    }

    SECTION("exactly one chunk long is not forced")
    {
        CHECK_FALSE(RecordingPipeline::planPersistence(config, 300.0).forced);
    }

    SECTION("longer than one chunk keeps everything")
    {
        auto const plan = RecordingPipeline::planPersistence(config, 300.5);
        CHECK(plan.forced);
        CHECK(plan.rawAudio);
        CHECK(plan.compressedAudio);
        CHECK(plan.transcripts);
        CHECK(plan.logs);
    }
}
