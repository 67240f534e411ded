// SPDX-License-Identifier: Apache-2.0
#include "ToolNames.hpp"

#include <format>

namespace coderig
{

auto makeExternalToolName(std::string_view server, std::string_view tool) -> std::string
{
    return std::format("{}{}_{}", ExternalToolPrefix, server, tool);
}

auto isExternalToolName(std::string_view name) -> bool
{
    return name.starts_with(ExternalToolPrefix);
}

auto splitExternalToolName(std::string_view composite, const std::vector<std::string>& servers)
    -> std::optional<std::pair<std::string, std::string>>
{
    if (!isExternalToolName(composite))
        return std::nullopt;

    auto const rest = composite.substr(ExternalToolPrefix.size());
    std::string const* best = nullptr;

    for (const auto& server: servers)
    {
        if (server.empty() || rest.size() <= server.size() + 1)
            continue;
        if (!rest.starts_with(server) || rest[server.size()] != '_')
            continue;
        if (!best || server.size() > best->size())
            best = &server;
    }

    if (!best)
        return std::nullopt;

    return std::pair { *best, std::string(rest.substr(best->size() + 1)) };
}

} // namespace coderig
