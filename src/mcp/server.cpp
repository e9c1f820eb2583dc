#include <agentlink/errors.hpp>
#include <agentlink/mcp/server.hpp>

namespace agentlink
{
namespace mcp
{

ToolServer::ToolServer(std::string name, std::string version, std::vector<ToolDefinition> tools)
    : name_(std::move(name)), version_(std::move(version))
{
    for (auto& tool : tools)
        add_tool(std::move(tool));
}

void ToolServer::add_tool(ToolDefinition tool)
{
    if (tool.name.empty())
        throw ConfigurationError("Tool name must not be empty");
    if (!tool.handler)
        throw ConfigurationError("Tool '" + tool.name + "' has no handler");

    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& existing : tools_)
    {
        if (existing.name == tool.name)
            throw ConfigurationError("Duplicate tool name: " + tool.name);
    }
    tools_.push_back(std::move(tool));
}

bool ToolServer::has_tool(const std::string& name) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& tool : tools_)
    {
        if (tool.name == name)
            return true;
    }
    return false;
}

size_t ToolServer::tool_count() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return tools_.size();
}

json ToolServer::handle_message(const json& message)
{
    if (!message.is_object())
        return make_error(nullptr, ErrorCode::InvalidRequest, "Invalid Request: not an object");

    const bool is_notification = !message.contains("id");
    json id = message.value("id", json());

    if (!message.contains("method") || !message["method"].is_string())
    {
        return make_error(id, ErrorCode::InvalidRequest,
                          "Invalid Request: missing 'method' field");
    }

    const std::string method = message["method"].get<std::string>();
    json response;

    if (method == "initialize")
        response = make_result(id, initialize_result());
    else if (method == "notifications/initialized")
        return json::object();
    else if (method == "tools/list")
        response = make_result(id, tools_list_result());
    else if (method == "tools/call")
        response = call_tool(id, message.value("params", json()));
    else
        response = make_error(id, ErrorCode::MethodNotFound, "Method not found: " + method);

    // Notifications never get a reply
    if (is_notification)
        return json::object();
    return response;
}

json ToolServer::initialize_result() const
{
    return {{"protocolVersion", kProtocolVersion},
            {"capabilities", {{"tools", json::object()}}},
            {"serverInfo", {{"name", name_}, {"version", version_}}}};
}

json ToolServer::tools_list_result() const
{
    json tools = json::array();
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& tool : tools_)
        tools.push_back(tool.to_json());
    return {{"tools", tools}};
}

json ToolServer::call_tool(const json& id, const json& params) const
{
    if (!params.is_object() || !params.contains("name") || !params["name"].is_string())
        return make_error(id, ErrorCode::InvalidParams, "Invalid params: missing tool name");

    const std::string tool_name = params["name"].get<std::string>();

    ToolHandler handler;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        for (const auto& tool : tools_)
        {
            if (tool.name == tool_name)
            {
                handler = tool.handler;
                break;
            }
        }
    }
    if (!handler)
        return make_error(id, ErrorCode::InvalidParams, "Tool not found: " + tool_name);

    json arguments = params.value("arguments", json::object());
    if (arguments.is_null())
        arguments = json::object();

    try
    {
        return make_result(id, handler(arguments).to_json());
    }
    catch (const std::exception& e)
    {
        return make_error(id, ErrorCode::ToolError, std::string("Tool error: ") + e.what());
    }
}

json ToolServer::make_result(const json& id, json result)
{
    return {{"jsonrpc", "2.0"}, {"id", id}, {"result", std::move(result)}};
}

json ToolServer::make_error(const json& id, int code, const std::string& message)
{
    return {{"jsonrpc", "2.0"}, {"id", id}, {"error", {{"code", code}, {"message", message}}}};
}

std::shared_ptr<ToolServer> create_tool_server(std::string name, std::string version,
                                               std::vector<ToolDefinition> tools)
{
    return std::make_shared<ToolServer>(std::move(name), std::move(version), std::move(tools));
}

} // namespace mcp
} // namespace agentlink
