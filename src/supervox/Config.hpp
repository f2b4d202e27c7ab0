// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioFormat.hpp>
#include <core/Error.hpp>
#include <pipeline/PipelineContext.hpp>
#include <pipeline/Prompt.hpp>
#include <providers/Provider.hpp>

#include <nlohmann/json.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace supervox
{

/// @brief The "defaults" section: settings applied to every recording unless overridden.
struct DefaultsConfig
{
    std::string provider = "mistral";
    AudioFormat format = AudioFormat::Opus;
    std::string model = "voxtral-mini-latest";
    std::string chatModel = "mistral-small-latest";
    std::optional<std::string> language;

    unsigned sampleRate = 16000;
    unsigned channels = 1;

    /// @brief Microphone name filter; empty selects the default microphone.
    std::string device;

    /// @brief Loopback device name; when set, recordings mix mic and loopback.
    std::optional<std::string> loopbackDevice;

    float micGain = 1.0f;
    float loopbackGain = 1.0f;

    bool diarize = false;
    std::vector<std::string> contextBias;

    double chunkDuration = 300.0;
    double chunkOverlap = 30.0;
    unsigned maxParallelRequests = 1;

    PersistenceFlags keep;
    bool copy = true;
    std::string logLevel = "INFO";
};

/// @brief The "paths" section: where durable outputs go.
struct PathsConfig
{
    std::filesystem::path recordings = "recordings";
    std::filesystem::path transcripts = "transcripts";
    std::filesystem::path logs = "logs";
};

/// @brief Top-level application configuration.
struct AppConfig
{
    std::map<std::string, ProviderConfig> providers;
    DefaultsConfig defaults;

    /// @brief Named prompts; "default" is always present.
    std::map<std::string, PromptEntry> prompts { { "default", PromptEntry {} } };

    PathsConfig paths;
};

/// @brief Per-invocation overrides from the record command line.
struct RecordOptions
{
    std::optional<std::string> prompt;
    std::optional<std::filesystem::path> promptFile;
    std::string promptKey = "default";

    /// @brief Skips prompt resolution entirely.
    bool transcribeOnly = false;

    bool saveAll = false;
    std::string outfilePrefix;
    std::optional<std::string> device;
    std::optional<std::string> loopbackDevice;
    bool diarize = false;
    std::optional<AudioFormat> format;
    std::optional<std::string> language;
    std::optional<bool> copy;
};

/// @brief Loads the application configuration from the default config path.
/// A missing file yields the built-in defaults.
[[nodiscard]] auto loadConfig() -> Result<AppConfig>;

/// @brief Loads and validates the application configuration from a specific file path.
[[nodiscard]] auto loadConfigFromFile(std::string_view path) -> Result<AppConfig>;

/// @brief Builds a configuration from an already parsed JSON document.
[[nodiscard]] auto configFromJson(const nlohmann::json& root) -> Result<AppConfig>;

/// @brief Serializes a configuration. API keys are masked when maskSecrets is set.
[[nodiscard]] auto configToJson(const AppConfig& config, bool maskSecrets = false) -> nlohmann::json;

/// @brief Checks value ranges.
/// @return Success or a ConfigError naming the offending setting.
[[nodiscard]] auto validateConfig(const AppConfig& config) -> VoidResult;

/// @brief Saves the application configuration to a file.
[[nodiscard]] auto saveConfigToFile(std::string_view path, const AppConfig& config) -> VoidResult;

/// @brief Returns the default config directory path for the current platform.
/// On Linux: $XDG_CONFIG_HOME/supervox or ~/.config/supervox
/// On macOS: ~/Library/Application Support/supervox
/// On Windows: %APPDATA%\supervox
[[nodiscard]] auto defaultConfigDir() -> std::string;

/// @brief Returns the default config file path for the current platform.
[[nodiscard]] auto defaultConfigPath() -> std::string;

/// @brief Directory holding user prompt files (user.md).
[[nodiscard]] auto userPromptDir() -> std::filesystem::path;

/// @brief Shows the first and last characters of an API key only.
[[nodiscard]] auto maskedApiKey(std::string_view key) -> std::string;

/// @brief Derives the immutable settings of one run from the configuration and the command line.
/// @param promptDir Directory searched for user.md when no other prompt source applies.
[[nodiscard]] auto toPipelineConfig(const AppConfig& config,
                                    const RecordOptions& options,
                                    const std::filesystem::path& promptDir) -> PipelineConfig;

} // namespace supervox
