// SPDX-License-Identifier: Apache-2.0
#include "Storage.hpp"

#include <core/Log.hpp>
#include <transcript/Formatting.hpp>

#include <cctype>
#include <format>
#include <fstream>
#include <type_traits>

namespace supervox
{

namespace
{

    auto isSafeChar(char c) -> bool
    {
        return std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '_' || c == '-';
    }

    auto writeText(const std::filesystem::path& destination, std::string_view text) -> VoidResult
    {
        auto file = std::ofstream(destination, std::ios::binary | std::ios::trunc);
        if (!file.is_open())
            return makeError(ErrorCode::PersistenceError, std::format("Cannot write {}", destination.string()));
        file << text;
        file.flush();
        if (!file)
            return makeError(ErrorCode::PersistenceError, std::format("Failed writing {}", destination.string()));
        return {};
    }

    auto copyFile(const std::filesystem::path& source, const std::filesystem::path& destination) -> VoidResult
    {
        auto ec = std::error_code {};
        if (std::filesystem::exists(destination, ec) && std::filesystem::equivalent(source, destination, ec))
            return {};

        std::filesystem::copy_file(source, destination, std::filesystem::copy_options::overwrite_existing, ec);
        if (ec)
            return makeError(ErrorCode::PersistenceError,
                             std::format("Cannot copy {} to {}: {}",
                                         source.string(),
                                         destination.string(),
                                         ec.message()));
        return {};
    }

} // namespace

auto sanitizeFileComponent(std::string_view value) -> std::string
{
    auto out = std::string {};
    auto inRun = false;
    for (auto const c: trim(value))
    {
        if (isSafeChar(c))
        {
            out += c;
            inRun = false;
        }
        else if (!inRun)
        {
            out += '_';
            inRun = true;
        }
    }
    return out.empty() ? std::string("out") : out;
}

auto FileStorage::save(OutputKind kind, const OutputContent& content, const std::filesystem::path& destination)
    -> Result<std::filesystem::path>
{
    auto const dir = destination.parent_path();
    if (!dir.empty())
    {
        auto ec = std::error_code {};
        std::filesystem::create_directories(dir, ec);
        if (ec)
            return makeError(ErrorCode::PersistenceError,
                             std::format("Failed to create directory '{}': {}", dir.string(), ec.message()));
    }

    auto result = std::visit(
        [&](auto const& value) -> VoidResult {
            using T = std::decay_t<decltype(value)>;
            if constexpr (std::is_same_v<T, std::string>)
                return writeText(destination, value);
            else if constexpr (std::is_same_v<T, nlohmann::json>)
                return writeText(destination, value.dump(2, ' ', false, nlohmann::json::error_handler_t::replace));
            else
                return copyFile(value, destination);
        },
        content);

    if (!result)
        return std::unexpected(result.error());

    log::info("Saved {} to {}", outputKindName(kind), destination.string());
    return destination;
}

auto OutputLayout::rawAudio() const -> std::filesystem::path
{
    return recordingsDir / std::format("{}.wav", sanitizeFileComponent(base));
}

auto OutputLayout::compressedAudio(std::string_view extension) const -> std::filesystem::path
{
    return recordingsDir / std::format("{}.{}", sanitizeFileComponent(base), extension);
}

auto OutputLayout::transcript() const -> std::filesystem::path
{
    return transcriptsDir
           / std::format("{}_{}.txt", sanitizeFileComponent(base), sanitizeFileComponent(provider));
}

auto OutputLayout::rawJson() const -> std::filesystem::path
{
    return transcriptsDir
           / std::format("{}_{}.json", sanitizeFileComponent(base), sanitizeFileComponent(provider));
}

auto OutputLayout::rawTranscript() const -> std::filesystem::path
{
    return transcriptsDir
           / std::format("{}_{}_raw.txt", sanitizeFileComponent(base), sanitizeFileComponent(provider));
}

auto OutputLayout::chunkTranscript(std::size_t index) const -> std::filesystem::path
{
    return transcriptsDir / std::format("{}_chunk{:03}.txt", sanitizeFileComponent(base), index);
}

auto OutputLayout::pipelineLog() const -> std::filesystem::path
{
    return logsDir / std::format("{}_pipeline.log", sanitizeFileComponent(base));
}

auto OutputLayout::appLog() const -> std::filesystem::path
{
    return logsDir / "app.log";
}

} // namespace supervox
