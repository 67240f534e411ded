// SPDX-License-Identifier: Apache-2.0
#include "PendingRequests.hpp"

#include <core/Log.hpp>

namespace coderig
{

auto PendingRequests::nextId() -> int64_t
{
    return _nextId.fetch_add(1);
}

auto PendingRequests::registerRequest(int64_t id) -> std::future<Reply>
{
    auto promise = std::promise<Reply> {};
    auto future = promise.get_future();

    auto const lock = std::lock_guard { _mutex };
    _waiters.insert_or_assign(std::to_string(id), std::move(promise));
    return future;
}

auto PendingRequests::complete(jsonrpc::Response response) -> bool
{
    auto const key = jsonrpc::idKey(response.id);
    if (!key)
        return false;

    auto promise = std::promise<Reply> {};
    {
        auto const lock = std::lock_guard { _mutex };
        auto const it = _waiters.find(*key);
        if (it == _waiters.end())
            return false;
        promise = std::move(it->second);
        _waiters.erase(it);
    }

    promise.set_value(std::move(response));
    return true;
}

void PendingRequests::remove(int64_t id)
{
    auto const lock = std::lock_guard { _mutex };
    _waiters.erase(std::to_string(id));
}

void PendingRequests::failAll(const Error& error)
{
    auto waiters = std::map<std::string, std::promise<Reply>> {};
    {
        auto const lock = std::lock_guard { _mutex };
        waiters.swap(_waiters);
    }

    if (!waiters.empty())
        log::debug("Failing {} pending MCP request(s): {}", waiters.size(), error.message);

    for (auto& [key, promise]: waiters)
        promise.set_value(std::unexpected(error));
}

auto PendingRequests::size() const -> size_t
{
    auto const lock = std::lock_guard { _mutex };
    return _waiters.size();
}

} // namespace coderig
