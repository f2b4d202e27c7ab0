// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Process.hpp>

#include <string>
#include <string_view>
#include <vector>

namespace supervox
{

/// @brief Destination for the final text. Failures are reported, never fatal to the caller.
class Clipboard
{
  public:
    virtual ~Clipboard() = default;

    /// @return Success or a ClipboardError.
    [[nodiscard]] virtual auto copy(std::string_view text) -> VoidResult = 0;
};

/// @brief Copies through the first clipboard tool that works: wl-copy, xclip, xsel, pbcopy.
class SystemClipboard: public Clipboard
{
  public:
    struct Tool
    {
        std::string command;
        std::vector<std::string> args;
    };

    explicit SystemClipboard(ProcessRunner runner = runProcess);

    [[nodiscard]] auto copy(std::string_view text) -> VoidResult override;

    /// @brief The tools tried, in order.
    [[nodiscard]] static auto tools() -> std::vector<Tool>;

  private:
    ProcessRunner _runner;
};

} // namespace supervox
