// SPDX-License-Identifier: Apache-2.0
#include "MistralProvider.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>
#include <transcript/Formatting.hpp>

#include <charconv>
#include <format>
#include <iterator>
#include <system_error>

namespace supervox
{

namespace
{

    auto parseSegment(const nlohmann::json& item) -> TranscriptionSegment
    {
        auto segment = TranscriptionSegment {
            .speakerId = json::getOptionalString(item, "speaker_id"),
            .start = json::getDoubleOr(item, "start", 0.0),
            .end = json::getDoubleOr(item, "end", 0.0),
            .text = json::getStringOr(item, "text", ""),
            .score = json::getOptionalDouble(item, "score"),
        };
        if (!segment.speakerId && item.contains("speaker_id") && item["speaker_id"].is_number_integer())
            segment.speakerId = std::format("speaker_{}", item["speaker_id"].get<int>());
        if (segment.end < segment.start)
            segment.end = segment.start;
        return segment;
    }

    auto contentText(const nlohmann::json& content) -> std::string
    {
        if (content.is_string())
            return content.get<std::string>();

        auto text = std::string {};
        if (content.is_array())
        {
            for (auto const& part: content)
            {
                if (json::getStringOr(part, "type", "") != "text")
                    continue;
                auto const piece = json::getStringOr(part, "text", "");
                if (piece.empty())
                    continue;
                if (!text.empty())
                    text += '\n';
                text += piece;
            }
        }
        return text;
    }

} // namespace

MistralProvider::MistralProvider(ProviderConfig config, ProcessRunner runner):
    _config(std::move(config)), _runner(std::move(runner))
{
}

auto MistralProvider::endpoint(std::string_view path) const -> std::string
{
    auto base = _config.baseUrl.empty() ? std::string(DefaultBaseUrl) : _config.baseUrl;
    while (base.ends_with('/'))
        base.pop_back();
    return std::format("{}{}", base, path);
}

auto MistralProvider::quoteConfigValue(std::string_view value) -> std::string
{
    auto quoted = std::string { "\"" };
    for (auto const c: value)
    {
        switch (c)
        {
            case '\\': quoted += "\\\\"; break;
            case '"': quoted += "\\\""; break;
            case '\n': quoted += "\\n"; break;
            case '\r': quoted += "\\r"; break;
            case '\t': quoted += "\\t"; break;
            default: quoted += c; break;
        }
    }
    quoted += '"';
    return quoted;
}

auto MistralProvider::apiErrorMessage(const nlohmann::json& payload) -> std::string
{
    if (!payload.is_object())
        return {};

    for (auto const* key: { "message", "detail", "error" })
    {
        if (!payload.contains(key))
            continue;
        auto const& value = payload[key];
        if (value.is_string())
            return value.get<std::string>();
        if (value.is_object() && value.contains("message") && value["message"].is_string())
            return value["message"].get<std::string>();
        if (!value.is_null())
            return value.dump();
    }
    return {};
}

auto MistralProvider::transcriptionArgs(const TranscriptionRequest& request) const -> std::vector<std::string>
{
    auto args = std::vector<std::string> {
        "--form-string", std::format("model={}", request.model),
        "-F",            std::format("file=@{}", request.audioPath.string()),
    };

    if (request.language && !request.language->empty())
    {
        args.emplace_back("--form-string");
        args.push_back(std::format("language={}", *request.language));
    }

    if (request.diarize)
    {
        args.emplace_back("--form-string");
        args.emplace_back("diarize=true");
        args.emplace_back("--form-string");
        args.emplace_back("timestamp_granularities=segment");
    }

    for (auto const& term: request.contextBias)
    {
        args.emplace_back("--form-string");
        args.push_back(std::format("context_bias={}", term));
    }

    args.push_back(endpoint("/audio/transcriptions"));
    return args;
}

auto MistralProvider::chatRequestBody(std::string_view text, std::string_view prompt, std::string_view model)
    -> nlohmann::json
{
    return nlohmann::json {
        { "model", model },
        { "messages",
          nlohmann::json::array({
              { { "role", "system" }, { "content", prompt } },
              { { "role", "user" }, { "content", text } },
          }) },
    };
}

auto MistralProvider::post(std::vector<std::string> args, std::string extraConfig) const -> Result<HttpReply>
{
    if (_config.apiKey.empty())
        return makeError(ErrorCode::ProviderError, "Missing providers.mistral.apiKey in the config file");

    auto config = ProcessConfig {
        .command = "curl",
        .args = { "-sS", "-X", "POST", "--connect-timeout", "30", "-K", "-", "-w", "\n%{http_code}" },
        .env = {},
        .stdinData = std::format("header = {}\n", quoteConfigValue("Authorization: Bearer " + _config.apiKey)),
    };
    config.args.insert(config.args.end(), std::make_move_iterator(args.begin()), std::make_move_iterator(args.end()));
    config.stdinData += extraConfig;

    auto output = _runner(config);
    if (!output)
        return makeError(ErrorCode::ProviderError, std::format("Failed to run curl: {}", output.error().message));

    if (!output->succeeded())
        return makeError(ErrorCode::ProviderError,
                         std::format("curl exited with code {}: {}", output->exitCode, trim(output->stderrData)));

    auto& out = output->stdoutData;
    auto const split = out.rfind('\n');
    if (split == std::string::npos)
        return makeError(ErrorCode::ProviderError, "Malformed curl output: missing HTTP status");

    auto reply = HttpReply {};
    auto const statusText = trim(std::string_view(out).substr(split + 1));
    auto const [ptr, ec] = std::from_chars(statusText.data(), statusText.data() + statusText.size(), reply.status);
    if (ec != std::errc {} || ptr != statusText.data() + statusText.size())
        return makeError(ErrorCode::ProviderError, std::format("Malformed HTTP status '{}'", statusText));

    out.resize(split);
    reply.body = std::move(out);

    if (reply.status < 200 || reply.status >= 300)
    {
        auto message = std::string {};
        if (auto payload = json::parse(reply.body, ErrorCode::ProviderError); payload)
            message = apiErrorMessage(*payload);
        if (message.empty())
            message = std::string(trim(reply.body));
        return makeError(ErrorCode::ProviderError, std::format("HTTP {}: {}", reply.status, message));
    }

    return reply;
}

auto MistralProvider::parseTranscription(std::string_view body) -> Result<TranscriptionResult>
{
    auto payload = json::parse(body, ErrorCode::ProviderError);
    if (!payload)
        return std::unexpected(payload.error());

    if (!payload->is_object())
        return makeError(ErrorCode::ProviderError, "Transcription response is not a JSON object");

    if (!payload->contains("text"))
    {
        auto message = apiErrorMessage(*payload);
        return makeError(ErrorCode::ProviderError,
                         message.empty() ? std::string("Transcription response has no text") : message);
    }

    auto result = TranscriptionResult {};
    result.fullText = json::getStringOr(*payload, "text", "");

    if (payload->contains("segments") && (*payload)["segments"].is_array())
    {
        for (auto const& item: (*payload)["segments"])
            result.segments.push_back(parseSegment(item));
    }

    result.raw = std::move(*payload);
    return result;
}

auto MistralProvider::parseChat(std::string_view body) -> Result<ChatResult>
{
    auto payload = json::parse(body, ErrorCode::ProviderError);
    if (!payload)
        return std::unexpected(payload.error());

    auto const& root = *payload;
    if (!root.is_object() || !root.contains("choices") || !root["choices"].is_array() || root["choices"].empty())
    {
        auto message = apiErrorMessage(root);
        return makeError(ErrorCode::ProviderError,
                         message.empty() ? std::string("Chat response has no choices") : message);
    }

    auto const& choice = root["choices"][0];
    if (!choice.is_object() || !choice.contains("message") || !choice["message"].is_object())
        return makeError(ErrorCode::ProviderError, "Chat response choice has no message");

    auto const& message = choice["message"];
    auto result = ChatResult {
        .text = message.contains("content") ? contentText(message["content"]) : std::string {},
        .raw = std::move(*payload),
    };
    return result;
}

auto MistralProvider::transcribe(const TranscriptionRequest& request) -> Result<TranscriptionResult>
{
    auto ec = std::error_code {};
    if (!std::filesystem::exists(request.audioPath, ec))
        return makeError(ErrorCode::ProviderError,
                         std::format("Audio file not found: {}", request.audioPath.string()));

    log::info("Calling Mistral transcription model={} audio={} language={} diarize={}",
              request.model,
              request.audioPath.filename().string(),
              request.language.value_or("auto"),
              request.diarize);

    auto reply = post(transcriptionArgs(request), {});
    if (!reply)
        return std::unexpected(reply.error());

    return parseTranscription(reply->body);
}

auto MistralProvider::chat(std::string_view text, std::string_view prompt, std::string_view model)
    -> Result<ChatResult>
{
    log::info("Calling Mistral chat model={} ({} chars)", model, text.size());

    // Prompt files are read as raw bytes; invalid UTF-8 becomes U+FFFD instead of throwing.
    auto const body =
        chatRequestBody(text, prompt, model).dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    auto extraConfig = std::format("header = {}\ndata-binary = {}\n",
                                   quoteConfigValue("Content-Type: application/json"),
                                   quoteConfigValue(body));

    auto reply = post({ endpoint("/chat/completions") }, std::move(extraConfig));
    if (!reply)
        return std::unexpected(reply.error());

    return parseChat(reply->body);
}

} // namespace supervox
