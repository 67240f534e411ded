// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <nlohmann/json.hpp>

namespace coderig
{

/// @brief Abstract interface for MCP transport communication.
///
/// A transport is driven by two threads: a single reader thread blocked in receive(),
/// and writers that are serialized by the owner. close() may be called from any thread
/// and must make a blocked receive() return.
class Transport
{
  public:
    virtual ~Transport() = default;

    /// @brief Sends a JSON message to the server.
    /// @param message The JSON message to send.
    /// @return Success or an error.
    [[nodiscard]] virtual auto send(const nlohmann::json& message) -> VoidResult = 0;

    /// @brief Receives a JSON message from the server (blocking).
    ///
    /// A ProtocolError means one malformed message was consumed and the transport
    /// is still usable. A TransportError means the channel is gone (EOF, I/O error, closed).
    /// @return The received JSON message or an error.
    [[nodiscard]] virtual auto receive() -> Result<nlohmann::json> = 0;

    /// @brief Closes the transport connection.
    virtual void close() = 0;

    /// @brief Returns true if the transport is connected.
    [[nodiscard]] virtual auto isConnected() const -> bool = 0;

    /// @brief Non-blocking check that the peer is still alive.
    ///
    /// Transports without a cheap liveness check report success.
    [[nodiscard]] virtual auto checkAlive() -> VoidResult { return {}; }
};

} // namespace coderig
