// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <map>
#include <optional>
#include <string>

namespace supervox
{

/// @brief A named prompt from the config file. Inline text wins over the file.
struct PromptEntry
{
    std::string text;
    std::string file;
};

/// @brief Everything a prompt can come from, highest priority first.
struct PromptSources
{
    std::optional<std::string> inlineText;
    std::optional<std::filesystem::path> file;
    std::string key = "default";
    std::map<std::string, PromptEntry> entries;

    /// @brief Directory holding the fallback user.md; empty skips it.
    std::filesystem::path userPromptDir;
};

/// @brief Picks the transformation prompt.
///
/// Order: inline text, explicit file, config entry for the key (text, then file),
/// then user.md in the user prompt directory. The first non-empty trimmed value wins.
/// @return The prompt, or std::nullopt when no source provides one.
[[nodiscard]] auto resolvePrompt(const PromptSources& sources) -> std::optional<std::string>;

/// @brief Reads a UTF-8 text file; logs a warning and returns std::nullopt if it cannot be read.
[[nodiscard]] auto readTextFile(const std::filesystem::path& path) -> std::optional<std::string>;

/// @brief Replaces a leading "~" with $HOME.
[[nodiscard]] auto expandHome(const std::filesystem::path& path) -> std::filesystem::path;

/// @brief Creates the prompt directory and an empty user.md if missing.
[[nodiscard]] auto initPromptFiles(const std::filesystem::path& promptDir) -> VoidResult;

} // namespace supervox
