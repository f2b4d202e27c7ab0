// SPDX-License-Identifier: Apache-2.0
#include <pipeline/Clipboard.hpp>

#include <core/Log.hpp>

#include <format>

namespace supervox
{

SystemClipboard::SystemClipboard(ProcessRunner runner): _runner(std::move(runner))
{
}

auto SystemClipboard::tools() -> std::vector<Tool>
{
    return {
        { .command = "wl-copy", .args = {} },
        { .command = "xclip", .args = { "-selection", "clipboard" } },
        { .command = "xsel", .args = { "--clipboard", "--input" } },
        { .command = "pbcopy", .args = {} },
    };
}

auto SystemClipboard::copy(std::string_view text) -> VoidResult
{
    auto failures = std::string {};
    for (auto const& tool: tools())
    {
        auto const config = ProcessConfig {
            .command = tool.command,
            .args = tool.args,
            .env = {},
            .stdinData = std::string(text),
            .captureOutput = false,
        };

        auto result = _runner(config);
        if (result && result->succeeded())
        {
            log::debug("Copied {} bytes to the clipboard with {}", text.size(), tool.command);
            return {};
        }

        auto const reason = result ? std::format("exit code {}", result->exitCode) : result.error().message;
        log::debug("Clipboard tool {} failed: {}", tool.command, reason);
        failures += std::format("{}{}: {}", failures.empty() ? "" : "; ", tool.command, reason);
    }

    return makeError(ErrorCode::ClipboardError, std::format("No clipboard tool succeeded ({})", failures));
}

} // namespace supervox
