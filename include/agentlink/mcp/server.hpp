#ifndef AGENTLINK_MCP_SERVER_HPP
#define AGENTLINK_MCP_SERVER_HPP

#include <agentlink/mcp/tool.hpp>
#include <memory>
#include <mutex>
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace agentlink
{
namespace mcp
{

/// JSON-RPC error codes used by the embedded server
namespace ErrorCode
{
constexpr int InvalidRequest = -32600;
constexpr int MethodNotFound = -32601;
constexpr int InvalidParams = -32602;
constexpr int ToolError = -32000;
} // namespace ErrorCode

constexpr const char* kProtocolVersion = "2024-11-05";

/// In-process server reachable through mcp_message control requests
class McpServer
{
  public:
    virtual ~McpServer() = default;

    virtual std::string name() const = 0;

    /// Answer one JSON-RPC message. Never throws for protocol-level problems;
    /// those come back as JSON-RPC error objects. Notifications produce an
    /// empty object.
    virtual json handle_message(const json& message) = 0;
};

/// Tool-only MCP server: initialize, notifications/initialized, tools/list,
/// tools/call. Tools may be added at any time but are never removed.
class ToolServer : public McpServer
{
  public:
    explicit ToolServer(std::string name, std::string version = "1.0.0",
                        std::vector<ToolDefinition> tools = {});

    /// @throws ConfigurationError on an empty or duplicate name
    void add_tool(ToolDefinition tool);

    bool has_tool(const std::string& name) const;
    size_t tool_count() const;

    std::string name() const override
    {
        return name_;
    }

    const std::string& version() const
    {
        return version_;
    }

    json handle_message(const json& message) override;

  private:
    json initialize_result() const;
    json tools_list_result() const;
    json call_tool(const json& id, const json& params) const;

    static json make_result(const json& id, json result);
    static json make_error(const json& id, int code, const std::string& message);

    std::string name_;
    std::string version_;
    std::vector<ToolDefinition> tools_; // registration order
    mutable std::mutex mutex_;
};

/// Convenience factory for LinkOptions::sdk_mcp_servers
std::shared_ptr<ToolServer> create_tool_server(std::string name, std::string version = "1.0.0",
                                               std::vector<ToolDefinition> tools = {});

} // namespace mcp
} // namespace agentlink

#endif // AGENTLINK_MCP_SERVER_HPP
