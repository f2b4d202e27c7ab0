// SPDX-License-Identifier: Apache-2.0
#include <audio/AudioCapture.hpp>
#include <core/Log.hpp>
#include <pipeline/AudioConverter.hpp>
#include <pipeline/Clipboard.hpp>
#include <pipeline/EventChannel.hpp>
#include <pipeline/RecordingPipeline.hpp>
#include <pipeline/Storage.hpp>
#include <providers/ProviderFactory.hpp>
#include <supervox/Config.hpp>
#include <supervox/LevelMeter.hpp>

#include <CLI/CLI.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <chrono>
#include <csignal>
#include <filesystem>
#include <format>
#include <optional>
#include <print>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

#ifndef _WIN32
    #include <poll.h>
    #include <unistd.h>
#else
    #include <iostream>
#endif

using namespace supervox;

namespace
{

    constexpr auto MeterInterval = std::chrono::milliseconds(50);

    std::atomic<bool> gInterrupted = false; // NOLINT(cppcoreguidelines-avoid-non-const-global-variables)

    void sigintHandler(int /*sig*/)
    {
        gInterrupted = true;
    }

    auto stderrIsTerminal() -> bool
    {
#ifndef _WIN32
        return ::isatty(STDERR_FILENO) != 0;
#else
        return false;
#endif
    }

    /// @brief Blocks until a line is read from stdin or stop is requested.
    /// @return True when Enter was pressed.
    auto waitForEnter(std::stop_token stop) -> bool
    {
#ifndef _WIN32
        while (!stop.stop_requested())
        {
            auto fd = pollfd { .fd = STDIN_FILENO, .events = POLLIN, .revents = 0 };
            auto const ready = ::poll(&fd, 1, 100);
            if (ready < 0)
            {
                if (errno == EINTR)
                    continue;
                return false;
            }
            if (ready == 0)
                continue;

            auto buffer = std::array<char, 256> {};
            auto const bytesRead = ::read(STDIN_FILENO, buffer.data(), buffer.size());
            if (bytesRead <= 0)
                return false; // stdin closed; Ctrl+C remains available
            if (std::string_view(buffer.data(), static_cast<std::size_t>(bytesRead)).contains('\n'))
                return true;
        }
        return false;
#else
        (void) stop;
        auto line = std::string {};
        return static_cast<bool>(std::getline(std::cin, line));
#endif
    }

    void clearStatusLine()
    {
        if (stderrIsTerminal())
            std::print(stderr, "\r\033[K");
    }

    /// @brief Routes log output to stderr without tearing the live meter line.
    void installConsoleLogger(bool verbose)
    {
        log::setCallback([verbose](log::Level level, std::string_view message) {
            if (!verbose && level > log::Level::Warning)
                return;
            clearStatusLine();
            auto const prefix = level == log::Level::Error ? "error" : level == log::Level::Warning ? "warning" : "log";
            std::println(stderr, "{}: {}", prefix, message);
        });
    }

    auto loadAppConfig(const std::string& configPath) -> Result<AppConfig>
    {
        return configPath.empty() ? loadConfig() : loadConfigFromFile(configPath);
    }

    auto runRecord(const AppConfig& config, const RecordOptions& options) -> int
    {
        auto const pipelineConfig = toPipelineConfig(config, options, userPromptDir());

        if (pipelineConfig.loopbackDevice)
        {
            if (auto device = findCaptureDevice(*pipelineConfig.loopbackDevice); !device)
            {
                log::error("{}", device.error().message);
                std::println(stderr, "Loopback device not found. Check your audio configuration.");
                return 1;
            }
        }

        auto provider = makeProvider(config.defaults.provider, config.providers);
        if (!provider)
        {
            log::error("{}", provider.error().message);
            return 1;
        }

        auto converter = FfmpegConverter {};
        auto storage = FileStorage {};
        auto clipboard = SystemClipboard {};
        auto levels = LevelMonitor { pipelineConfig.loopbackDevice.has_value() };
        auto events = EventChannel {};

        auto context = PipelineContext {
            .provider = **provider,
            .converter = converter,
            .storage = storage,
            .clipboard = clipboard,
            .captureFactory = [] { return std::make_unique<AudioCapture>(); },
            .levels = levels,
            .events = events,
        };
        auto pipeline = RecordingPipeline(pipelineConfig, context);

        if (pipelineConfig.prompt)
            std::println(stderr, "Prompt: {}", pipelineConfig.prompt->substr(0, 80));
        std::println(stderr, "Press Enter or Ctrl+C to stop recording. Ctrl+C again cancels processing.");

        std::signal(SIGINT, sigintHandler);

        auto const color = stderrIsTerminal();
        auto recordStop = std::stop_source {};
        auto processStop = std::stop_source {};
        auto result = std::optional<Result<PipelineOutput>> {};
        auto done = std::atomic<bool> { false };

        {
            auto worker = std::jthread([&] {
                result = pipeline.run(recordStop.get_token(), processStop.get_token());
                done = true;
            });
            auto enterWatcher = std::jthread([&](std::stop_token stop) {
                if (waitForEnter(stop))
                    recordStop.request_stop();
            });

            while (!done)
            {
                for (auto const& event: events.drain())
                {
                    clearStatusLine();
                    std::println(stderr, "{}", event.message);
                }

                if (gInterrupted.exchange(false))
                {
                    if (!recordStop.stop_requested())
                    {
                        recordStop.request_stop();
                    }
                    else
                    {
                        clearStatusLine();
                        std::println(stderr, "Cancelling...");
                        processStop.request_stop();
                    }
                }

                if (pipeline.state() == PipelineState::Recording && !recordStop.stop_requested() && color)
                    std::print(stderr,
                               "\r\033[K\033[31m●\033[0m REC  {}",
                               renderLevelLine(levels.getAndResetPeaks(), color));

                std::this_thread::sleep_for(MeterInterval);
            }
            enterWatcher.request_stop();
        }

        std::signal(SIGINT, SIG_DFL);

        for (auto const& event: events.drain())
        {
            clearStatusLine();
            std::println(stderr, "{}", event.message);
        }

        if (!*result)
        {
            auto const& error = result->error();
            if (auto failure = pipeline.failure(); failure && !failure->completedChunks.empty())
            {
                auto list = std::string {};
                for (auto const index: failure->completedChunks)
                    list += std::format("{}{}", list.empty() ? "" : ", ", index + 1);
                std::println(stderr, "Chunks transcribed before the failure: {}", list);
            }
            std::println(stderr, "Error: {}", error);
            return error.code == ErrorCode::Cancelled ? 130 : 1;
        }

        auto const& output = **result;
        for (auto const& [key, path]: output.paths)
            std::println(stderr, "Saved {}: {}", key, path.string());
        for (auto const& error: output.persistenceErrors)
            std::println(stderr, "Not saved: {}", error);

        std::println("{}", output.text);
        return 0;
    }

    auto runDevices() -> int
    {
        auto devices = listCaptureDevices();
        if (!devices)
        {
            log::error("{}", devices.error().message);
            return 1;
        }

        if (devices->empty())
            std::println("No capture devices found.");
        for (auto const& device: *devices)
            std::println("{} {} ({} Hz)", device.isDefault ? "*" : " ", device.name, device.nativeSampleRate);
        return 0;
    }

    auto runConfigShow(const AppConfig& config, const std::string& configPath) -> int
    {
        std::println("# {}", configPath.empty() ? defaultConfigPath() : configPath);
        std::println("{}", configToJson(config, true).dump(4));
        return 0;
    }

    auto runConfigInit(const std::string& configPath, bool force) -> int
    {
        auto const path = configPath.empty() ? defaultConfigPath() : configPath;
        if (std::filesystem::exists(path) && !force)
        {
            std::println(stderr, "{} already exists (use --force to overwrite).", path);
            return 1;
        }

        if (auto saved = saveConfigToFile(path, AppConfig {}); !saved)
        {
            log::error("{}", saved.error().message);
            return 1;
        }
        if (auto prompts = initPromptFiles(userPromptDir()); !prompts)
        {
            log::error("{}", prompts.error().message);
            return 1;
        }

        std::println("Wrote {}", path);
        std::println("Prompt file: {}", (userPromptDir() / "user.md").string());
        return 0;
    }

} // namespace

int main(int argc, char** argv)
{
    auto app = CLI::App { "supervox: record, transcribe and transform speech" };
    app.require_subcommand(1);

    auto configPath = std::string {};
    auto verbose = false;
    auto logLevel = std::string {};

    app.add_option("-c,--config", configPath, "Path to config file");
    app.add_flag("-v,--verbose", verbose, "Enable verbose logging");
    app.add_option("--log-level", logLevel, "Log level (ERROR, WARNING, INFO, DEBUG, TRACE)");

    // record
    auto options = RecordOptions {};
    auto prompt = std::string {};
    auto promptFile = std::string {};
    auto format = std::string {};
    auto language = std::string {};
    auto device = std::string {};
    auto loopback = std::string {};
    auto noCopy = false;

    auto* record = app.add_subcommand("record", "Record until Enter is pressed, then transcribe");
    record->add_option("--prompt", prompt, "Transformation prompt applied to the transcript");
    record->add_option("--prompt-file", promptFile, "Read the transformation prompt from a file");
    record->add_option("--prompt-key", options.promptKey, "Named prompt from the config file");
    record->add_flag("--transcribe", options.transcribeOnly, "Transcribe only, ignore all prompts");
    record->add_flag("--save-all", options.saveAll, "Keep audio, transcripts and logs of this run");
    record->add_option("--outfile-prefix", options.outfilePrefix, "Base name of output files");
    record->add_option("--device", device, "Microphone name (substring match)");
    record->add_option("--loopback", loopback, "Loopback device to mix with the microphone");
    record->add_flag("--diarize", options.diarize, "Attribute speech to speakers");
    record->add_option("--format", format, "Upload format")->check(CLI::IsMember({ "wav", "mp3", "opus" }));
    record->add_option("--language", language, "Language code, e.g. en");
    record->add_flag("--no-copy", noCopy, "Do not copy the result to the clipboard");

    // devices
    auto* devices = app.add_subcommand("devices", "List capture devices");

    // config
    auto force = false;
    auto* configCommand = app.add_subcommand("config", "Show or create the configuration");
    configCommand->require_subcommand(1);
    auto* configShow = configCommand->add_subcommand("show", "Print the effective configuration");
    auto* configInit = configCommand->add_subcommand("init", "Write a starter configuration");
    configInit->add_flag("--force", force, "Overwrite an existing configuration");

    CLI11_PARSE(app, argc, argv);

    installConsoleLogger(verbose);

    if (configInit->parsed())
        return runConfigInit(configPath, force);

    auto configResult = loadAppConfig(configPath);
    if (!configResult)
    {
        log::error("Failed to load config: {}", configResult.error().message);
        return 1;
    }
    auto& config = *configResult;

    // Verbosity: config, then --log-level, then -v
    auto level = log::parseLevel(config.defaults.logLevel).value_or(log::Level::Info);
    if (!logLevel.empty())
    {
        auto const parsed = log::parseLevel(logLevel);
        if (!parsed)
        {
            log::error("Unknown log level '{}'", logLevel);
            return 1;
        }
        level = *parsed;
    }
    if (verbose)
        level = log::Level::Debug;
    log::setLevel(level);

    if (configShow->parsed())
        return runConfigShow(config, configPath);
    if (devices->parsed())
        return runDevices();

    // Apply CLI overrides
    if (!prompt.empty())
        options.prompt = prompt;
    if (!promptFile.empty())
        options.promptFile = expandHome(promptFile);
    if (!format.empty())
        options.format = parseAudioFormat(format);
    if (!language.empty())
        options.language = language;
    if (!device.empty())
        options.device = device;
    if (!loopback.empty())
        options.loopbackDevice = loopback;
    if (noCopy)
        options.copy = false;

    return runRecord(config, options);
}
