// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <filesystem>
#include <functional>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace supervox
{

/// @brief Describes a child process to run to completion.
struct ProcessConfig
{
    std::string command;
    std::vector<std::string> args;

    /// @brief Extra environment variables, added on top of the inherited environment.
    std::map<std::string, std::string> env;

    /// @brief Data written to the child's stdin before it is closed.
    std::string stdinData;

    /// @brief When false, the child's stdout and stderr go to /dev/null.
    ///
    /// Needed for tools that leave a forked daemon holding their output open (xclip, wl-copy).
    bool captureOutput = true;
};

/// @brief Captured result of a finished child process.
struct ProcessOutput
{
    int exitCode = -1;
    std::string stdoutData;
    std::string stderrData;

    [[nodiscard]] auto succeeded() const -> bool { return exitCode == 0; }
};

/// @brief Spawns a process, feeds it stdin, and collects stdout/stderr until it exits.
///
/// The call blocks until the child terminates. A non-zero exit code is not an error
/// at this level; callers inspect ProcessOutput::exitCode.
/// @param config The process description.
/// @return The captured output, or a ProcessError if the process could not be spawned.
[[nodiscard]] auto runProcess(const ProcessConfig& config) -> Result<ProcessOutput>;

/// @brief Callable with the signature of runProcess(), injected where tests replace the child process.
using ProcessRunner = std::function<Result<ProcessOutput>(const ProcessConfig&)>;

/// @brief Searches PATH for an executable with the given name.
/// @param name Executable name without directory.
/// @return The absolute path, or std::nullopt if not found.
[[nodiscard]] auto findExecutable(std::string_view name) -> std::optional<std::filesystem::path>;

} // namespace supervox
