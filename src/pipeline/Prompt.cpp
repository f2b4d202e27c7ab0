// SPDX-License-Identifier: Apache-2.0
#include "Prompt.hpp"

#include <core/Log.hpp>
#include <transcript/Formatting.hpp>

#include <cstdlib>
#include <format>
#include <fstream>
#include <sstream>

namespace supervox
{

namespace
{

    auto nonEmpty(std::string_view text) -> std::optional<std::string>
    {
        auto const trimmed = trim(text);
        if (trimmed.empty())
            return std::nullopt;
        return std::string(trimmed);
    }

    auto fromFile(const std::filesystem::path& path) -> std::optional<std::string>
    {
        auto const content = readTextFile(path);
        if (!content)
            return std::nullopt;
        return nonEmpty(*content);
    }

} // namespace

auto expandHome(const std::filesystem::path& path) -> std::filesystem::path
{
    auto const text = path.string();
    if (text != "~" && !text.starts_with("~/"))
        return path;

    auto const* const home = std::getenv("HOME");
    if (!home)
        return path;
    if (text == "~")
        return std::filesystem::path(home);
    return std::filesystem::path(home) / text.substr(2);
}

auto readTextFile(const std::filesystem::path& path) -> std::optional<std::string>
{
    auto file = std::ifstream(path, std::ios::binary);
    if (!file.is_open())
    {
        log::warning("Failed to read text file {}", path.string());
        return std::nullopt;
    }

    auto ss = std::stringstream {};
    ss << file.rdbuf();
    return ss.str();
}

auto resolvePrompt(const PromptSources& sources) -> std::optional<std::string>
{
    if (sources.inlineText)
    {
        if (auto prompt = nonEmpty(*sources.inlineText))
            return prompt;
    }

    if (sources.file)
    {
        if (auto prompt = fromFile(expandHome(*sources.file)))
            return prompt;
        log::warning("Prompt file {} is missing or empty, trying other sources", sources.file->string());
    }

    if (auto const it = sources.entries.find(sources.key); it != sources.entries.end())
    {
        if (auto prompt = nonEmpty(it->second.text))
            return prompt;
        if (!trim(it->second.file).empty())
        {
            if (auto prompt = fromFile(expandHome(it->second.file)))
                return prompt;
        }
    }
    else if (sources.key != "default")
    {
        log::warning("No prompt entry named '{}' in the config", sources.key);
    }

    if (!sources.userPromptDir.empty())
    {
        auto const userFile = sources.userPromptDir / "user.md";
        auto ec = std::error_code {};
        if (std::filesystem::exists(userFile, ec))
            return fromFile(userFile);
    }

    return std::nullopt;
}

auto initPromptFiles(const std::filesystem::path& promptDir) -> VoidResult
{
    auto ec = std::error_code {};
    std::filesystem::create_directories(promptDir, ec);
    if (ec)
        return makeError(ErrorCode::IoError,
                         std::format("Failed to create prompt directory '{}': {}", promptDir.string(), ec.message()));

    auto const userFile = promptDir / "user.md";
    if (std::filesystem::exists(userFile, ec))
        return {};

    auto file = std::ofstream(userFile);
    if (!file.is_open())
        return makeError(ErrorCode::IoError, std::format("Cannot create {}", userFile.string()));
    return {};
}

} // namespace supervox
