#ifndef AGENTLINK_MCP_TOOL_HPP
#define AGENTLINK_MCP_TOOL_HPP

#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace agentlink
{
namespace mcp
{

using json = nlohmann::json;

// ============================================================================
// Tool Results
// ============================================================================

/// One item of tool output
struct ContentItem
{
    enum class Kind
    {
        Text,
        Image,
        Resource
    };

    Kind kind = Kind::Text;
    std::optional<std::string> text;      // Required for Text, optional for Resource
    std::string data;                     // Image: base64 payload
    std::string uri;                      // Resource
    std::optional<std::string> mime_type; // Required for Image

    static ContentItem make_text(std::string text);
    static ContentItem make_image(std::string data, std::string mime_type);
    static ContentItem make_resource(std::string uri,
                                     std::optional<std::string> mime_type = std::nullopt,
                                     std::optional<std::string> text = std::nullopt);

    json to_json() const;
};

/// Result returned from a tool handler
struct ToolResult
{
    std::vector<ContentItem> content;
    bool is_error = false;

    static ToolResult text(std::string text, bool is_error = false);
    static ToolResult error(std::string message);

    /// {"content": [...], "isError": bool}
    json to_json() const;
};

// ============================================================================
// Tool Annotations
// ============================================================================

/// Hints about tool behavior, reported by tools/list
struct ToolAnnotations
{
    std::optional<std::string> title = std::nullopt;
    std::optional<bool> read_only_hint = std::nullopt;
    std::optional<bool> destructive_hint = std::nullopt;
    std::optional<bool> idempotent_hint = std::nullopt;
    std::optional<bool> open_world_hint = std::nullopt;

    json to_json() const;
    bool has_any() const;
};

// ============================================================================
// Tool Definition
// ============================================================================

using ToolHandler = std::function<ToolResult(const json& arguments)>;

struct ToolDefinition
{
    std::string name;
    std::string description;
    json input_schema = json{{"type", "object"}, {"properties", json::object()}};
    ToolHandler handler;
    std::optional<ToolAnnotations> annotations = std::nullopt;

    /// {"name", "description", "inputSchema"[, "annotations"]}
    json to_json() const;
};

// ============================================================================
// Schema Builder
// ============================================================================

/// JSON Schema fragment for a tool parameter
class ParameterType
{
  public:
    static ParameterType string(std::optional<std::string> description = std::nullopt);
    static ParameterType number(std::optional<std::string> description = std::nullopt);
    static ParameterType integer(std::optional<std::string> description = std::nullopt);
    static ParameterType boolean(std::optional<std::string> description = std::nullopt);
    static ParameterType array(const ParameterType& items,
                               std::optional<std::string> description = std::nullopt);
    static ParameterType object(const std::map<std::string, ParameterType>& properties,
                                std::optional<std::string> description = std::nullopt);

    const json& schema() const
    {
        return schema_;
    }

  private:
    ParameterType(std::string type, std::optional<std::string> description);

    json schema_;
};

/// Build a tool from an explicit parameter list
ToolDefinition make_tool(std::string name, std::string description,
                         const std::map<std::string, ParameterType>& parameters,
                         const std::vector<std::string>& required, ToolHandler handler);

} // namespace mcp
} // namespace agentlink

#endif // AGENTLINK_MCP_TOOL_HPP
