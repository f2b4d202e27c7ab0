// SPDX-License-Identifier: Apache-2.0
#include "ProviderFactory.hpp"

#include <providers/MistralProvider.hpp>

#include <array>
#include <format>

namespace supervox
{

namespace
{

    constexpr auto AllProviders = std::array { ProviderKind::Mistral };

} // namespace

auto parseProviderKind(std::string_view name) -> std::optional<ProviderKind>
{
    for (auto const kind: AllProviders)
    {
        if (providerKindName(kind) == name)
            return kind;
    }
    return std::nullopt;
}

auto availableProviders() -> std::vector<std::string>
{
    auto names = std::vector<std::string> {};
    for (auto const kind: AllProviders)
        names.emplace_back(providerKindName(kind));
    return names;
}

auto makeProvider(std::string_view name, const std::map<std::string, ProviderConfig>& providers)
    -> Result<std::unique_ptr<Provider>>
{
    auto const kind = parseProviderKind(name);
    if (!kind)
    {
        auto list = std::string {};
        for (auto const& available: availableProviders())
            list += (list.empty() ? "" : ", ") + available;
        return makeError(ErrorCode::ConfigError, std::format("Unknown provider '{}'. Available: {}", name, list));
    }

    auto const it = providers.find(std::string(providerKindName(*kind)));
    auto config = it != providers.end() ? it->second : ProviderConfig {};
    if (config.apiKey.empty())
        return makeError(ErrorCode::ProviderError,
                         std::format("Missing providers.{}.apiKey in the config file", providerKindName(*kind)));

    switch (*kind)
    {
        case ProviderKind::Mistral: return std::make_unique<MistralProvider>(std::move(config));
    }
    return makeError(ErrorCode::ConfigError, std::format("Unsupported provider '{}'", name));
}

} // namespace supervox
