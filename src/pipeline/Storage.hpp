// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <variant>

namespace supervox
{

/// @brief What a persisted file holds.
enum class OutputKind
{
    Audio,
    CompressedAudio,
    Transcript,
    RawJson,
    Log,
};

[[nodiscard]] constexpr auto outputKindName(OutputKind kind) -> std::string_view
{
    switch (kind)
    {
        case OutputKind::Audio: return "audio";
        case OutputKind::CompressedAudio: return "compressed audio";
        case OutputKind::Transcript: return "transcript";
        case OutputKind::RawJson: return "raw json";
        case OutputKind::Log: return "log";
    }
    return "output";
}

/// @brief Payload of a save: text, a JSON document, or an existing file to copy.
using OutputContent = std::variant<std::string, nlohmann::json, std::filesystem::path>;

/// @brief Durable storage for pipeline outputs.
class Storage
{
  public:
    virtual ~Storage() = default;

    /// @brief Writes content to destination, creating parent directories.
    /// @return The written path, or a PersistenceError.
    [[nodiscard]] virtual auto save(OutputKind kind,
                                    const OutputContent& content,
                                    const std::filesystem::path& destination) -> Result<std::filesystem::path> = 0;
};

/// @brief Storage on the local file system.
///
/// Text is written as UTF-8, JSON pretty-printed with a 2-space indent,
/// and files are copied (a file saved onto itself is left alone).
class FileStorage: public Storage
{
  public:
    [[nodiscard]] auto save(OutputKind kind, const OutputContent& content, const std::filesystem::path& destination)
        -> Result<std::filesystem::path> override;
};

/// @brief Makes a string safe as a file name component.
///
/// Runs of characters other than letters, digits, '.', '_' and '-' become a single '_'.
/// Surrounding whitespace is dropped first; an empty result becomes "out".
[[nodiscard]] auto sanitizeFileComponent(std::string_view value) -> std::string;

/// @brief File names of one run's outputs.
struct OutputLayout
{
    std::filesystem::path recordingsDir;
    std::filesystem::path transcriptsDir;
    std::filesystem::path logsDir;
    std::string base;
    std::string provider;

    [[nodiscard]] auto rawAudio() const -> std::filesystem::path;
    [[nodiscard]] auto compressedAudio(std::string_view extension) const -> std::filesystem::path;
    [[nodiscard]] auto transcript() const -> std::filesystem::path;
    [[nodiscard]] auto rawJson() const -> std::filesystem::path;

    /// @brief The pre-transformation transcript, written when a prompt was applied.
    [[nodiscard]] auto rawTranscript() const -> std::filesystem::path;

    /// @brief Intermediate transcript of one chunk (zero-based index, rendered with three digits).
    [[nodiscard]] auto chunkTranscript(std::size_t index) const -> std::filesystem::path;

    [[nodiscard]] auto pipelineLog() const -> std::filesystem::path;
    [[nodiscard]] auto appLog() const -> std::filesystem::path;
};

} // namespace supervox
