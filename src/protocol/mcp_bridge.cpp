#include <agentlink/errors.hpp>
#include <agentlink/mcp/server.hpp>
#include <agentlink/protocol/handlers.hpp>

namespace agentlink
{
namespace protocol
{

McpBridge::McpBridge(std::map<std::string, std::shared_ptr<mcp::McpServer>> servers)
    : servers_(std::move(servers))
{
}

json McpBridge::handle(const ControlRequest& request)
{
    const json& body = request.request;

    std::string server_name = body.value("server_name", "");
    json message = body.value("message", json());
    if (server_name.empty() || !message.is_object())
        throw ProtocolError("Missing server_name or message for MCP request");

    auto it = servers_.find(server_name);
    if (it == servers_.end() || !it->second)
    {
        // A missing server is a JSON-RPC level error, not a control failure
        json error = {{"jsonrpc", "2.0"},
                      {"id", message.value("id", json())},
                      {"error",
                       {{"code", mcp::ErrorCode::MethodNotFound},
                        {"message", "Server not found: " + server_name}}}};
        return {{"mcp_response", error}};
    }

    return {{"mcp_response", it->second->handle_message(message)}};
}

std::vector<std::string> McpBridge::server_names() const
{
    std::vector<std::string> names;
    for (const auto& [name, server] : servers_)
        names.push_back(name);
    return names;
}

} // namespace protocol
} // namespace agentlink
