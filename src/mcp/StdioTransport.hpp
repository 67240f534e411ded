// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <mcp/Transport.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <string>
#include <vector>

namespace coderig
{

/// @brief Configuration for spawning an MCP server process.
struct StdioTransportConfig
{
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;

    /// @brief How long close() waits after SIGTERM before sending SIGKILL.
    std::chrono::milliseconds terminateGracePeriod { 2000 };
};

/// @brief Transport that communicates with an MCP server via stdio pipes.
///
/// Spawns a child process and communicates via its stdin/stdout using
/// newline-delimited JSON. The child's stderr is inherited.
class StdioTransport: public Transport
{
  public:
    StdioTransport();
    ~StdioTransport() override;

    StdioTransport(const StdioTransport&) = delete;
    StdioTransport& operator=(const StdioTransport&) = delete;

    /// @brief Starts the MCP server process.
    /// @param config The process configuration.
    /// @return Success or an error.
    [[nodiscard]] auto start(const StdioTransportConfig& config) -> VoidResult;

    [[nodiscard]] auto send(const nlohmann::json& message) -> VoidResult override;
    [[nodiscard]] auto receive() -> Result<nlohmann::json> override;
    void close() override;
    [[nodiscard]] auto isConnected() const -> bool override;

    /// @brief Polls the child with waitpid(WNOHANG); fails if it has exited.
    [[nodiscard]] auto checkAlive() -> VoidResult override;

    /// @brief Returns the child's process id, or -1 when no child is running.
    [[nodiscard]] auto processId() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

} // namespace coderig
