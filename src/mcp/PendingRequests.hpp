// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <mcp/JsonRpc.hpp>

#include <atomic>
#include <cstdint>
#include <future>
#include <map>
#include <mutex>
#include <string>

namespace coderig
{

/// @brief Correlates outstanding JSON-RPC requests with their responses.
///
/// Every waiter is resolved exactly once: by complete(), by failAll(), or
/// dropped by remove() after its caller gave up waiting.
class PendingRequests
{
  public:
    using Reply = Result<jsonrpc::Response>;

    /// @brief Mints the next request id (starting at 1).
    [[nodiscard]] auto nextId() -> int64_t;

    /// @brief Registers a waiter for the given id.
    ///
    /// Must be called before the request is written, so a fast reply cannot
    /// arrive ahead of its waiter.
    [[nodiscard]] auto registerRequest(int64_t id) -> std::future<Reply>;

    /// @brief Hands a response to its waiter.
    /// @return false if no waiter is registered for the response's id.
    auto complete(jsonrpc::Response response) -> bool;

    /// @brief Drops the waiter for an id (after a timeout or failed write).
    void remove(int64_t id);

    /// @brief Resolves every outstanding waiter with the given error.
    void failAll(const Error& error);

    [[nodiscard]] auto size() const -> size_t;

  private:
    std::atomic<int64_t> _nextId = 1;
    mutable std::mutex _mutex;
    std::map<std::string, std::promise<Reply>> _waiters;
};

} // namespace coderig
