// SPDX-License-Identifier: Apache-2.0
#include "Process.hpp"

#include <core/Log.hpp>

#include <array>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <format>

#ifndef _WIN32
    #include <sys/wait.h>

    #include <fcntl.h>
    #include <poll.h>
    #include <pthread.h>
    #include <signal.h>
    #include <spawn.h>
    #include <unistd.h>

extern char** environ;
#endif

namespace supervox
{

#ifndef _WIN32

namespace
{

    /// @brief Closes the wrapped descriptors on scope exit.
    struct PipePair
    {
        std::array<int, 2> fds { -1, -1 };

        ~PipePair()
        {
            closeRead();
            closeWrite();
        }

        void closeRead()
        {
            if (fds[0] >= 0)
                ::close(fds[0]);
            fds[0] = -1;
        }

        void closeWrite()
        {
            if (fds[1] >= 0)
                ::close(fds[1]);
            fds[1] = -1;
        }
    };

    /// @brief Opens a pipe whose ends are not inherited by other children spawned concurrently.
    auto openPipe(PipePair& pipePair) -> bool
    {
        if (::pipe(pipePair.fds.data()) != 0)
            return false;
        for (auto const fd: pipePair.fds)
            ::fcntl(fd, F_SETFD, FD_CLOEXEC);
        return true;
    }

    /// @brief Writes all of data to fd with SIGPIPE blocked for the calling thread only.
    ///
    /// A child that exits without reading its stdin must not terminate the process.
    /// Any SIGPIPE raised while blocked is consumed before the mask is restored.
    auto writeAll(int fd, std::string_view data) -> bool
    {
        sigset_t pipeMask;
        sigset_t previousMask;
        sigemptyset(&pipeMask);
        sigaddset(&pipeMask, SIGPIPE);
        pthread_sigmask(SIG_BLOCK, &pipeMask, &previousMask);

        auto ok = true;
        while (!data.empty())
        {
            auto const written = ::write(fd, data.data(), data.size());
            if (written < 0)
            {
                if (errno == EINTR)
                    continue;
                ok = false;
                break;
            }
            data.remove_prefix(static_cast<std::size_t>(written));
        }

        if (!ok)
        {
            auto const noWait = timespec { .tv_sec = 0, .tv_nsec = 0 };
            while (sigtimedwait(&pipeMask, nullptr, &noWait) == SIGPIPE)
                ;
        }

        pthread_sigmask(SIG_SETMASK, &previousMask, nullptr);
        return ok;
    }

} // namespace

auto runProcess(const ProcessConfig& config) -> Result<ProcessOutput>
{
    auto stdinPipe = PipePair {};
    auto stdoutPipe = PipePair {};
    auto stderrPipe = PipePair {};

    if (!openPipe(stdinPipe) || !openPipe(stdoutPipe) || !openPipe(stderrPipe))
        return makeError(ErrorCode::ProcessError, std::format("Failed to create pipes: {}", strerror(errno)));

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe.fds[0], STDIN_FILENO);
    if (config.captureOutput)
    {
        posix_spawn_file_actions_adddup2(&actions, stdoutPipe.fds[1], STDOUT_FILENO);
        posix_spawn_file_actions_adddup2(&actions, stderrPipe.fds[1], STDERR_FILENO);
    }
    else
    {
        posix_spawn_file_actions_addopen(&actions, STDOUT_FILENO, "/dev/null", O_WRONLY, 0);
        posix_spawn_file_actions_addopen(&actions, STDERR_FILENO, "/dev/null", O_WRONLY, 0);
    }
    posix_spawn_file_actions_addclose(&actions, stdinPipe.fds[1]);
    posix_spawn_file_actions_addclose(&actions, stdoutPipe.fds[0]);
    posix_spawn_file_actions_addclose(&actions, stderrPipe.fds[0]);
    posix_spawn_file_actions_addclose(&actions, stdoutPipe.fds[1]);
    posix_spawn_file_actions_addclose(&actions, stderrPipe.fds[1]);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit + config overrides)
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
            envStrings.emplace_back(*e);
    }
    for (const auto& [key, value]: config.env)
        envStrings.push_back(std::format("{}={}", key, value));

    auto envp = std::vector<char*> {};
    for (auto& s: envStrings)
        envp.push_back(s.data());
    envp.push_back(nullptr);

    pid_t pid;
    auto const status =
        posix_spawnp(&pid, config.command.c_str(), &actions, nullptr, argv.data(), envp.data());
    posix_spawn_file_actions_destroy(&actions);

    stdinPipe.closeRead();
    stdoutPipe.closeWrite();
    stderrPipe.closeWrite();

    if (status != 0)
        return makeError(ErrorCode::ProcessError,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));

    log::debug("Spawned '{}' (pid {})", config.command, pid);

    if (!config.stdinData.empty() && !writeAll(stdinPipe.fds[1], config.stdinData))
        log::debug("Child '{}' closed stdin early", config.command);
    stdinPipe.closeWrite();

    auto output = ProcessOutput {};
    auto fds = std::array<pollfd, 2> { {
        { .fd = stdoutPipe.fds[0], .events = POLLIN, .revents = 0 },
        { .fd = stderrPipe.fds[0], .events = POLLIN, .revents = 0 },
    } };

    auto buf = std::array<char, 4096> {};
    auto openStreams = config.captureOutput ? 2 : 0;
    while (openStreams > 0)
    {
        if (poll(fds.data(), fds.size(), -1) < 0)
        {
            if (errno == EINTR)
                continue;
            break;
        }

        for (auto i = std::size_t { 0 }; i < fds.size(); ++i)
        {
            if (fds[i].fd < 0 || fds[i].revents == 0)
                continue;

            auto const bytesRead = ::read(fds[i].fd, buf.data(), buf.size());
            if (bytesRead <= 0)
            {
                fds[i].fd = -1;
                --openStreams;
                continue;
            }
            auto& target = (i == 0) ? output.stdoutData : output.stderrData;
            target.append(buf.data(), static_cast<std::size_t>(bytesRead));
        }
    }

    int waitStatus = 0;
    while (waitpid(pid, &waitStatus, 0) < 0)
    {
        if (errno != EINTR)
            return makeError(ErrorCode::ProcessError,
                             std::format("Failed to wait for '{}': {}", config.command, strerror(errno)));
    }

    if (WIFEXITED(waitStatus))
        output.exitCode = WEXITSTATUS(waitStatus);
    else if (WIFSIGNALED(waitStatus))
        output.exitCode = 128 + WTERMSIG(waitStatus);

    // posix_spawnp reports a missing executable through the child's exit code 127.
    if (output.exitCode == 127 && !findExecutable(config.command) && !config.command.contains('/'))
        return makeError(ErrorCode::ProcessError, std::format("Command not found: {}", config.command));

    log::debug("'{}' exited with code {}", config.command, output.exitCode);
    return output;
}

auto findExecutable(std::string_view name) -> std::optional<std::filesystem::path>
{
    if (name.empty())
        return std::nullopt;

    if (name.contains('/'))
    {
        auto const path = std::filesystem::path(name);
        if (::access(path.c_str(), X_OK) == 0)
            return path;
        return std::nullopt;
    }

    auto const* const pathEnv = std::getenv("PATH");
    if (!pathEnv)
        return std::nullopt;

    auto dirs = std::string_view { pathEnv };
    while (!dirs.empty())
    {
        auto const sep = dirs.find(':');
        auto const dir = dirs.substr(0, sep);
        dirs = (sep == std::string_view::npos) ? std::string_view {} : dirs.substr(sep + 1);
        if (dir.empty())
            continue;

        auto const candidate = std::filesystem::path(dir) / name;
        if (::access(candidate.c_str(), X_OK) == 0)
            return candidate;
    }
    return std::nullopt;
}

#else

auto runProcess(const ProcessConfig& config) -> Result<ProcessOutput>
{
    return makeError(ErrorCode::ProcessError,
                     std::format("Running '{}' is not supported on this platform", config.command));
}

auto findExecutable(std::string_view /*name*/) -> std::optional<std::filesystem::path>
{
    return std::nullopt;
}

#endif

} // namespace supervox
