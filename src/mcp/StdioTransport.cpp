// SPDX-License-Identifier: Apache-2.0
#include "StdioTransport.hpp"

#include <core/JsonUtils.hpp>
#include <core/Log.hpp>

#include <array>
#include <atomic>
#include <cerrno>
#include <cstring>
#include <format>
#include <mutex>
#include <optional>
#include <thread>

#include <sys/wait.h>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <spawn.h>
#include <unistd.h>

extern char** environ;

namespace coderig
{

namespace
{
    void ignoreSigpipeOnce()
    {
        static auto once = std::once_flag {};
        std::call_once(once, [] { ::signal(SIGPIPE, SIG_IGN); });
    }

    void closeFd(int& fd)
    {
        if (fd >= 0)
        {
            ::close(fd);
            fd = -1;
        }
    }

    auto describeExitStatus(int status) -> std::string
    {
        if (WIFEXITED(status))
            return std::format("exit code {}", WEXITSTATUS(status));
        if (WIFSIGNALED(status))
            return std::format("killed by signal {}", WTERMSIG(status));
        return std::format("status {}", status);
    }

    auto environmentKey(std::string_view entry) -> std::string_view
    {
        return entry.substr(0, entry.find('='));
    }
} // namespace

struct StdioTransport::Impl
{
    pid_t childPid = -1;
    int stdinWrite = -1;
    int stdoutRead = -1;
    int wakeRead = -1;
    int wakeWrite = -1;
    std::chrono::milliseconds gracePeriod { 2000 };
    std::string command;

    std::atomic<bool> connected = false;
    std::atomic<bool> closing = false;

    // Guards childPid and exitStatus; waitpid may be called from the liveness
    // check and from close() concurrently.
    mutable std::mutex processMutex;
    std::optional<int> exitStatus;

    std::mutex closeMutex;

    // Serializes writers on stdinWrite against close() releasing it.
    std::mutex writeMutex;

    // Only touched by the thread calling receive().
    std::string readBuffer;

    // Waits until stdin accepts more data. Returns false once close() has
    // signalled the wake pipe. Requires writeMutex.
    auto waitWritable() -> bool
    {
        auto fds = std::array<pollfd, 2> { {
            { .fd = stdinWrite, .events = POLLOUT, .revents = 0 },
            { .fd = wakeRead, .events = POLLIN, .revents = 0 },
        } };
        while (::poll(fds.data(), fds.size(), -1) < 0)
        {
            if (errno != EINTR)
                return false;
        }
        return !closing && (fds[1].revents & POLLIN) == 0;
    }

    // Reaps the child if it has exited. Requires processMutex.
    auto pollChild() -> bool
    {
        if (childPid <= 0)
            return false;

        int status = 0;
        auto const rc = ::waitpid(childPid, &status, WNOHANG);
        if (rc == childPid)
        {
            exitStatus = status;
            childPid = -1;
            return false;
        }
        return rc == 0;
    }

    void terminateChild()
    {
        auto const lock = std::lock_guard { processMutex };
        if (!pollChild())
            return;

        ::kill(childPid, SIGTERM);

        auto const deadline = std::chrono::steady_clock::now() + gracePeriod;
        while (std::chrono::steady_clock::now() < deadline)
        {
            if (!pollChild())
                return;
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }

        log::warning("MCP server '{}' ignored SIGTERM, sending SIGKILL", command);
        ::kill(childPid, SIGKILL);
        int status = 0;
        if (::waitpid(childPid, &status, 0) == childPid)
            exitStatus = status;
        childPid = -1;
    }
};

StdioTransport::StdioTransport(): _impl(std::make_unique<Impl>())
{
}

StdioTransport::~StdioTransport()
{
    close();
    closeFd(_impl->stdoutRead);
    closeFd(_impl->wakeRead);
    closeFd(_impl->wakeWrite);
}

auto StdioTransport::start(const StdioTransportConfig& config) -> VoidResult
{
    if (_impl->connected || _impl->childPid > 0)
        return makeError(ErrorCode::TransportError, "Transport already connected");

    if (config.command.empty())
        return makeError(ErrorCode::InvalidArgument, "No command given for MCP server process");

    ignoreSigpipeOnce();

    int stdinPipe[2];
    int stdoutPipe[2];
    int wakePipe[2];

    if (::pipe2(stdinPipe, O_CLOEXEC) != 0)
        return makeError(ErrorCode::TransportError, "Failed to create stdin pipe");
    if (::pipe2(stdoutPipe, O_CLOEXEC) != 0)
    {
        ::close(stdinPipe[0]);
        ::close(stdinPipe[1]);
        return makeError(ErrorCode::TransportError, "Failed to create stdout pipe");
    }
    if (::pipe2(wakePipe, O_CLOEXEC | O_NONBLOCK) != 0)
    {
        for (auto const fd: { stdinPipe[0], stdinPipe[1], stdoutPipe[0], stdoutPipe[1] })
            ::close(fd);
        return makeError(ErrorCode::TransportError, "Failed to create wake-up pipe");
    }

    posix_spawn_file_actions_t actions;
    posix_spawn_file_actions_init(&actions);
    posix_spawn_file_actions_adddup2(&actions, stdinPipe[0], STDIN_FILENO);
    posix_spawn_file_actions_adddup2(&actions, stdoutPipe[1], STDOUT_FILENO);

    // Build argv
    auto argv = std::vector<char*> {};
    auto cmdCopy = config.command;
    argv.push_back(cmdCopy.data());
    auto argCopies = std::vector<std::string>(config.args);
    for (auto& arg: argCopies)
        argv.push_back(arg.data());
    argv.push_back(nullptr);

    // Build environment (inherit, with config entries replacing inherited ones)
    auto envStrings = std::vector<std::string> {};
    if (environ)
    {
        for (auto** e = environ; *e; ++e)
        {
            auto const entry = std::string_view(*e);
            if (!config.env.contains(std::string(environmentKey(entry))))
                envStrings.emplace_back(entry);
        }
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

    ::close(stdinPipe[0]);
    ::close(stdoutPipe[1]);

    // A child that stops reading must not pin a writer inside write().
    ::fcntl(stdinPipe[1], F_SETFL, ::fcntl(stdinPipe[1], F_GETFL) | O_NONBLOCK);

    if (status != 0)
    {
        ::close(stdinPipe[1]);
        ::close(stdoutPipe[0]);
        ::close(wakePipe[0]);
        ::close(wakePipe[1]);
        return makeError(ErrorCode::TransportError,
                         std::format("Failed to spawn process '{}': {}", config.command, strerror(status)));
    }

    {
        auto const lock = std::lock_guard { _impl->processMutex };
        _impl->childPid = pid;
        _impl->exitStatus.reset();
    }
    _impl->stdinWrite = stdinPipe[1];
    _impl->stdoutRead = stdoutPipe[0];
    _impl->wakeRead = wakePipe[0];
    _impl->wakeWrite = wakePipe[1];
    _impl->gracePeriod = config.terminateGracePeriod;
    _impl->command = config.command;
    _impl->readBuffer.clear();
    _impl->closing = false;
    _impl->connected = true;

    log::debug("MCP server process started: {} (pid {})", config.command, pid);
    return {};
}

auto StdioTransport::send(const nlohmann::json& message) -> VoidResult
{
    auto const data = json::dumpSafe(message) + "\n";

    auto const lock = std::lock_guard { _impl->writeMutex };
    if (!_impl->connected || _impl->stdinWrite < 0)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    auto offset = size_t { 0 };
    while (offset < data.size())
    {
        auto const result = ::write(_impl->stdinWrite, data.data() + offset, data.size() - offset);
        if (result < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EAGAIN || errno == EWOULDBLOCK)
            {
                if (!_impl->waitWritable())
                    return makeError(ErrorCode::TransportError, "Transport closed while sending");
                continue;
            }
            return makeError(ErrorCode::TransportError,
                             std::format("Failed to write to process stdin: {}", strerror(errno)));
        }
        offset += static_cast<size_t>(result);
    }

    return {};
}

auto StdioTransport::receive() -> Result<nlohmann::json>
{
    if (!_impl->connected)
        return makeError(ErrorCode::TransportError, "Transport not connected");

    // Read until we get a complete line
    while (true)
    {
        auto const newlinePos = _impl->readBuffer.find('\n');
        if (newlinePos != std::string::npos)
        {
            auto line = _impl->readBuffer.substr(0, newlinePos);
            _impl->readBuffer.erase(0, newlinePos + 1);

            if (!line.empty() && line.back() == '\r')
                line.pop_back();
            if (line.find_first_not_of(" \t") == std::string::npos)
                continue;

            log::trace("MCP <- {}", line);
            return json::parse(line);
        }

        auto fds = std::array<pollfd, 2> { {
            { .fd = _impl->stdoutRead, .events = POLLIN, .revents = 0 },
            { .fd = _impl->wakeRead, .events = POLLIN, .revents = 0 },
        } };

        if (::poll(fds.data(), fds.size(), -1) < 0)
        {
            if (errno == EINTR)
                continue;
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, std::format("poll() failed: {}", strerror(errno)));
        }

        if (_impl->closing || (fds[1].revents & POLLIN) != 0)
            return makeError(ErrorCode::TransportError, "Transport closed");

        if (fds[0].revents == 0)
            continue;

        auto buf = std::array<char, 4096> {};
        auto const bytesRead = ::read(_impl->stdoutRead, buf.data(), buf.size());
        if (bytesRead < 0 && errno == EINTR)
            continue;
        if (bytesRead <= 0)
        {
            _impl->connected = false;
            return makeError(ErrorCode::TransportError, "Process stdout closed");
        }
        _impl->readBuffer.append(buf.data(), static_cast<size_t>(bytesRead));
    }
}

void StdioTransport::close()
{
    auto const lock = std::lock_guard { _impl->closeMutex };

    if (_impl->closing)
        return;

    _impl->closing = true;
    _impl->connected = false;

    // Wake up a reader blocked in poll(); the read end stays open until destruction
    // so the reader never races with a reused descriptor.
    if (_impl->wakeWrite >= 0)
    {
        auto const byte = char { 1 };
        [[maybe_unused]] auto const written = ::write(_impl->wakeWrite, &byte, 1);
    }

    {
        auto const writeLock = std::lock_guard { _impl->writeMutex };
        closeFd(_impl->stdinWrite);
    }
    _impl->terminateChild();

    log::debug("MCP transport closed");
}

auto StdioTransport::isConnected() const -> bool
{
    return _impl->connected;
}

auto StdioTransport::checkAlive() -> VoidResult
{
    auto const lock = std::lock_guard { _impl->processMutex };

    if (_impl->pollChild())
        return {};

    if (_impl->exitStatus)
        return makeError(ErrorCode::TransportError,
                         std::format("MCP server process '{}' has terminated ({})",
                                     _impl->command,
                                     describeExitStatus(*_impl->exitStatus)));

    return makeError(ErrorCode::TransportError, "MCP server process is not running");
}

auto StdioTransport::processId() const -> int
{
    auto const lock = std::lock_guard { _impl->processMutex };
    return _impl->childPid;
}

} // namespace coderig
