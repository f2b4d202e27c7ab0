// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Process.hpp>
#include <providers/Provider.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace supervox
{

/// @brief Mistral AI provider: Voxtral transcription and chat completions.
///
/// Requests are made by running curl. The API key is handed to curl on stdin as
/// a config file so it never appears in the process list.
class MistralProvider: public Provider
{
  public:
    static constexpr auto DefaultBaseUrl = std::string_view { "https://api.mistral.ai/v1" };

    explicit MistralProvider(ProviderConfig config, ProcessRunner runner = runProcess);

    [[nodiscard]] auto name() const -> std::string_view override { return "mistral"; }

    [[nodiscard]] auto transcribe(const TranscriptionRequest& request) -> Result<TranscriptionResult> override;

    [[nodiscard]] auto chat(std::string_view text, std::string_view prompt, std::string_view model)
        -> Result<ChatResult> override;

    /// @brief Builds the curl arguments for a transcription upload (without the key).
    [[nodiscard]] auto transcriptionArgs(const TranscriptionRequest& request) const -> std::vector<std::string>;

    /// @brief Builds the JSON body of a chat completion request.
    [[nodiscard]] static auto chatRequestBody(std::string_view text, std::string_view prompt, std::string_view model)
        -> nlohmann::json;

    /// @brief Maps a transcription response body to a TranscriptionResult.
    [[nodiscard]] static auto parseTranscription(std::string_view body) -> Result<TranscriptionResult>;

    /// @brief Extracts the assistant reply from a chat completion response body.
    [[nodiscard]] static auto parseChat(std::string_view body) -> Result<ChatResult>;

    /// @brief Finds a human-readable message in an API error payload, if there is one.
    [[nodiscard]] static auto apiErrorMessage(const nlohmann::json& payload) -> std::string;

    /// @brief Quotes a value for a curl config file line.
    [[nodiscard]] static auto quoteConfigValue(std::string_view value) -> std::string;

  private:
    struct HttpReply
    {
        int status = 0;
        std::string body;
    };

    [[nodiscard]] auto post(std::vector<std::string> args, std::string extraConfig) const -> Result<HttpReply>;
    [[nodiscard]] auto endpoint(std::string_view path) const -> std::string;

    ProviderConfig _config;
    ProcessRunner _runner;
};

} // namespace supervox
