// SPDX-License-Identifier: Apache-2.0
#include "Config.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <pipeline/ChunkSplitter.hpp>

#include <cstdlib>
#include <filesystem>
#include <format>
#include <fstream>
#include <sstream>

namespace supervox
{

namespace
{

    auto readUnsigned(const nlohmann::json& obj, std::string_view key, unsigned defaultValue) -> Result<unsigned>
    {
        auto const value = json::getIntOr(obj, key, static_cast<int>(defaultValue));
        if (value < 0)
            return makeError(ErrorCode::ConfigError,
                             std::format("defaults.{} must not be negative, got {}", key, value));
        return static_cast<unsigned>(value);
    }

    auto pathToString(const std::filesystem::path& path) -> std::string
    {
        return path.generic_string();
    }

} // namespace

auto defaultConfigDir() -> std::string
{
#ifdef _WIN32
    auto const* const appData = std::getenv("APPDATA");
    if (appData)
        return std::string(appData) + "\\supervox";
    return ".";
#elif defined(__APPLE__)
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/Library/Application Support/supervox";
    return ".";
#else
    auto const* const xdgConfig = std::getenv("XDG_CONFIG_HOME");
    if (xdgConfig && *xdgConfig)
        return std::string(xdgConfig) + "/supervox";
    auto const* const home = std::getenv("HOME");
    if (home)
        return std::string(home) + "/.config/supervox";
    return ".";
#endif
}

auto defaultConfigPath() -> std::string
{
    return defaultConfigDir() + "/config.json";
}

auto userPromptDir() -> std::filesystem::path
{
    return std::filesystem::path(defaultConfigDir()) / "prompt";
}

auto maskedApiKey(std::string_view key) -> std::string
{
    if (key.empty())
        return {};
    if (key.size() <= 8)
        return std::string(key.size(), '*');
    return std::format("{}...{}", key.substr(0, 4), key.substr(key.size() - 4));
}

auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>
{
    if (!root.is_object())
        return makeError(ErrorCode::ConfigError, "Config root must be a JSON object");

    auto config = AppConfig {};

    // Providers section
    if (root.contains("providers") && root["providers"].is_object())
    {
        for (const auto& [name, providerJson]: root["providers"].items())
        {
            config.providers[name] = ProviderConfig {
                .apiKey = json::getStringOr(providerJson, "apiKey", ""),
                .baseUrl = json::getStringOr(providerJson, "baseUrl", ""),
            };
        }
    }

    // Defaults section
    if (root.contains("defaults"))
    {
        auto const& defaults = root["defaults"];
        auto& d = config.defaults;

        d.provider = json::getStringOr(defaults, "provider", d.provider);

        auto const formatName = json::getStringOr(defaults, "format", audioFormatName(d.format));
        auto const format = parseAudioFormat(formatName);
        if (!format)
            return makeError(ErrorCode::ConfigError,
                             std::format("Unknown audio format '{}' (expected wav, mp3 or opus)", formatName));
        d.format = *format;

        d.model = json::getStringOr(defaults, "model", d.model);
        d.chatModel = json::getStringOr(defaults, "chatModel", d.chatModel);
        d.language = json::getOptionalString(defaults, "language");

        auto sampleRate = readUnsigned(defaults, "sampleRate", d.sampleRate);
        if (!sampleRate)
            return std::unexpected(sampleRate.error());
        d.sampleRate = *sampleRate;

        auto channels = readUnsigned(defaults, "channels", d.channels);
        if (!channels)
            return std::unexpected(channels.error());
        d.channels = *channels;

        d.device = json::getStringOr(defaults, "device", "");
        d.loopbackDevice = json::getOptionalString(defaults, "loopbackDevice");
        d.micGain = static_cast<float>(json::getDoubleOr(defaults, "micGain", d.micGain));
        d.loopbackGain = static_cast<float>(json::getDoubleOr(defaults, "loopbackGain", d.loopbackGain));
        d.diarize = json::getBoolOr(defaults, "diarize", d.diarize);
        d.contextBias = json::getStringList(defaults, "contextBias");
        d.chunkDuration = json::getDoubleOr(defaults, "chunkDuration", d.chunkDuration);
        d.chunkOverlap = json::getDoubleOr(defaults, "chunkOverlap", d.chunkOverlap);

        auto parallel = readUnsigned(defaults, "maxParallelRequests", d.maxParallelRequests);
        if (!parallel)
            return std::unexpected(parallel.error());
        d.maxParallelRequests = *parallel;

        d.keep.keepRawAudio = json::getBoolOr(defaults, "keepRawAudio", false);
        d.keep.keepCompressedAudio = json::getBoolOr(defaults, "keepCompressedAudio", false);
        d.keep.keepTranscripts = json::getBoolOr(defaults, "keepTranscriptFiles", false);
        d.keep.keepLogs = json::getBoolOr(defaults, "keepLogFiles", false);
        d.copy = json::getBoolOr(defaults, "copy", d.copy);
        d.logLevel = json::getStringOr(defaults, "logLevel", d.logLevel);
    }

    // Prompt section
    if (root.contains("prompt") && root["prompt"].is_object())
    {
        for (const auto& [key, entry]: root["prompt"].items())
        {
            if (entry.is_string())
                config.prompts[key] = PromptEntry { .text = entry.get<std::string>(), .file = {} };
            else
                config.prompts[key] = PromptEntry {
                    .text = json::getStringOr(entry, "text", ""),
                    .file = json::getStringOr(entry, "file", ""),
                };
        }
    }

    // Paths section
    if (root.contains("paths"))
    {
        auto const& paths = root["paths"];
        config.paths.recordings = json::getStringOr(paths, "recordings", pathToString(config.paths.recordings));
        config.paths.transcripts = json::getStringOr(paths, "transcripts", pathToString(config.paths.transcripts));
        config.paths.logs = json::getStringOr(paths, "logs", pathToString(config.paths.logs));
    }

    if (auto valid = validateConfig(config); !valid)
        return std::unexpected(valid.error());
    return config;
}

auto validateConfig(const AppConfig& config) -> VoidResult
{
    auto const& d = config.defaults;

    if (d.channels != 1 && d.channels != 2)
        return makeError(ErrorCode::ConfigError, std::format("defaults.channels must be 1 or 2, got {}", d.channels));
    if (d.sampleRate == 0)
        return makeError(ErrorCode::ConfigError, "defaults.sampleRate must be positive");
    if (d.micGain < 0.0f || d.loopbackGain < 0.0f)
        return makeError(ErrorCode::ConfigError, "defaults.micGain and defaults.loopbackGain must not be negative");
    if (d.maxParallelRequests == 0)
        return makeError(ErrorCode::ConfigError, "defaults.maxParallelRequests must be at least 1");
    if (!log::parseLevel(d.logLevel))
        return makeError(ErrorCode::ConfigError, std::format("Unknown log level '{}'", d.logLevel));

    if (auto chunking = ChunkSplitter::validate(d.chunkDuration, d.chunkOverlap); !chunking)
        return makeError(ErrorCode::ConfigError, chunking.error().message);

    return {};
}

auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>
{
    auto file = std::ifstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot open config file: {}", path));

    auto ss = std::stringstream {};
    ss << file.rdbuf();

    auto parseResult = json::parse(ss.str());
    if (!parseResult)
        return std::unexpected(parseResult.error());

    auto config = configFromJson(*parseResult);
    if (!config)
        return makeError(ErrorCode::ConfigError, std::format("{}: {}", path, config.error().message));
    return config;
}

auto configToJson(const AppConfig& config, bool maskSecrets) -> nlohmann::json
{
    auto root = nlohmann::json::object();

    // Providers section
    auto providers = nlohmann::json::object();
    for (const auto& [name, provider]: config.providers)
    {
        auto entry = nlohmann::json::object();
        entry["apiKey"] = maskSecrets ? maskedApiKey(provider.apiKey) : provider.apiKey;
        if (!provider.baseUrl.empty())
            entry["baseUrl"] = provider.baseUrl;
        providers[name] = std::move(entry);
    }
    root["providers"] = std::move(providers);

    // Defaults section
    auto const& d = config.defaults;
    auto defaults = nlohmann::json::object();
    defaults["provider"] = d.provider;
    defaults["format"] = std::string(audioFormatName(d.format));
    defaults["model"] = d.model;
    defaults["chatModel"] = d.chatModel;
    if (d.language)
        defaults["language"] = *d.language;
    defaults["sampleRate"] = d.sampleRate;
    defaults["channels"] = d.channels;
    if (!d.device.empty())
        defaults["device"] = d.device;
    if (d.loopbackDevice)
        defaults["loopbackDevice"] = *d.loopbackDevice;
    defaults["micGain"] = d.micGain;
    defaults["loopbackGain"] = d.loopbackGain;
    defaults["diarize"] = d.diarize;
    defaults["contextBias"] = d.contextBias;
    defaults["chunkDuration"] = d.chunkDuration;
    defaults["chunkOverlap"] = d.chunkOverlap;
    defaults["maxParallelRequests"] = d.maxParallelRequests;
    defaults["keepRawAudio"] = d.keep.keepRawAudio;
    defaults["keepCompressedAudio"] = d.keep.keepCompressedAudio;
    defaults["keepTranscriptFiles"] = d.keep.keepTranscripts;
    defaults["keepLogFiles"] = d.keep.keepLogs;
    defaults["copy"] = d.copy;
    defaults["logLevel"] = d.logLevel;
    root["defaults"] = std::move(defaults);

    // Prompt section
    auto prompts = nlohmann::json::object();
    for (const auto& [key, entry]: config.prompts)
    {
        auto prompt = nlohmann::json::object();
        prompt["text"] = entry.text;
        if (!entry.file.empty())
            prompt["file"] = entry.file;
        prompts[key] = std::move(prompt);
    }
    root["prompt"] = std::move(prompts);

    // Paths section
    root["paths"] = {
        { "recordings", pathToString(config.paths.recordings) },
        { "transcripts", pathToString(config.paths.transcripts) },
        { "logs", pathToString(config.paths.logs) },
    };

    return root;
}

auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult
{
    // Create parent directory if needed
    auto const dir = std::filesystem::path(path).parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(
                ErrorCode::ConfigError,
                std::format("Failed to create config directory '{}': {}", dir.string(), ec.message()));
    }

    auto file = std::ofstream(std::string(path));
    if (!file.is_open())
        return makeError(ErrorCode::ConfigError, std::format("Cannot write config file: {}", path));

    file << configToJson(config).dump(4) << '\n';
    if (!file)
        return makeError(ErrorCode::ConfigError, std::format("Failed to write config file: {}", path));
    return {};
}

auto loadConfig() -> Result<AppConfig>
{
    auto const path = defaultConfigPath();
    if (!std::filesystem::exists(path))
    {
        log::info("No config file found at {}, using defaults", path);
        return AppConfig {};
    }

    return loadConfigFromFile(path);
}

auto toPipelineConfig(const AppConfig& config, const RecordOptions& options, const std::filesystem::path& promptDir)
    -> PipelineConfig
{
    auto const& d = config.defaults;
    auto pipeline = PipelineConfig {};

    pipeline.micDevice = options.device.value_or(d.device);
    pipeline.loopbackDevice = options.loopbackDevice ? options.loopbackDevice : d.loopbackDevice;
    pipeline.sampleRate = d.sampleRate;
    pipeline.channels = d.channels;
    pipeline.gains = MixGains { .mic = d.micGain, .loopback = d.loopbackGain };

    pipeline.format = options.format.value_or(d.format);
    pipeline.model = d.model;
    pipeline.chatModel = d.chatModel;
    pipeline.language = options.language ? options.language : d.language;
    pipeline.diarize = options.diarize || d.diarize;
    pipeline.contextBias = d.contextBias;

    pipeline.chunkDuration = d.chunkDuration;
    pipeline.chunkOverlap = d.chunkOverlap;
    pipeline.maxParallelRequests = d.maxParallelRequests;

    if (!options.transcribeOnly)
    {
        pipeline.prompt = resolvePrompt(PromptSources {
            .inlineText = options.prompt,
            .file = options.promptFile,
            .key = options.promptKey,
            .entries = config.prompts,
            .userPromptDir = promptDir,
        });
    }

    pipeline.keep = d.keep;
    pipeline.saveAll = options.saveAll;
    pipeline.copyToClipboard = options.copy.value_or(d.copy);
    pipeline.recordingsDir = expandHome(config.paths.recordings);
    pipeline.transcriptsDir = expandHome(config.paths.transcripts);
    pipeline.logsDir = expandHome(config.paths.logs);
    pipeline.outfilePrefix = options.outfilePrefix;
    return pipeline;
}

} // namespace supervox
