// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <audio/AudioFormat.hpp>
#include <core/Error.hpp>
#include <transcript/Types.hpp>

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace supervox
{

/// @brief Credentials and endpoint of one provider, from the config file.
struct ProviderConfig
{
    std::string apiKey;

    /// @brief API root; empty selects the provider's public endpoint.
    std::string baseUrl;
};

/// @brief One transcription call.
struct TranscriptionRequest
{
    std::filesystem::path audioPath;
    AudioFormat format = AudioFormat::Wav;
    std::string model;
    std::optional<std::string> language;

    /// @brief Requests speaker attribution and segment-level timestamps.
    bool diarize = false;

    /// @brief Words or phrases the recognizer should favour.
    std::vector<std::string> contextBias;
};

/// @brief A remote transcription and text transformation service.
///
/// transcribe() may be called concurrently for different chunks; implementations
/// must not share mutable state between calls.
class Provider
{
  public:
    virtual ~Provider() = default;

    /// @brief Short lowercase identifier, used in output file names.
    [[nodiscard]] virtual auto name() const -> std::string_view = 0;

    /// @brief Transcribes one audio file.
    /// @return The transcription or a ProviderError.
    [[nodiscard]] virtual auto transcribe(const TranscriptionRequest& request) -> Result<TranscriptionResult> = 0;

    /// @brief Transforms text with a system prompt using a chat model.
    /// @return The model's reply or a ProviderError.
    [[nodiscard]] virtual auto chat(std::string_view text, std::string_view prompt, std::string_view model)
        -> Result<ChatResult> = 0;
};

} // namespace supervox
