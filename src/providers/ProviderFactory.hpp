// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <providers/Provider.hpp>

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace supervox
{

/// @brief The providers this build knows about.
enum class ProviderKind
{
    Mistral,
};

[[nodiscard]] constexpr auto providerKindName(ProviderKind kind) -> std::string_view
{
    switch (kind)
    {
        case ProviderKind::Mistral: return "mistral";
    }
    return "mistral";
}

/// @brief Resolves a provider name (case-sensitive, lowercase).
[[nodiscard]] auto parseProviderKind(std::string_view name) -> std::optional<ProviderKind>;

/// @brief Names of all available providers.
[[nodiscard]] auto availableProviders() -> std::vector<std::string>;

/// @brief Creates the provider selected by name, configured from its config entry.
/// @param name Provider name from the config or command line.
/// @param providers Per-provider settings keyed by provider name.
/// @return The provider, a ConfigError for an unknown name, or a ProviderError when its API key is missing.
[[nodiscard]] auto makeProvider(std::string_view name, const std::map<std::string, ProviderConfig>& providers)
    -> Result<std::unique_ptr<Provider>>;

} // namespace supervox
