#include <agentlink/mcp/tool.hpp>

namespace agentlink
{
namespace mcp
{

// ============================================================================
// ContentItem / ToolResult
// ============================================================================

ContentItem ContentItem::make_text(std::string text)
{
    ContentItem item;
    item.kind = Kind::Text;
    item.text = std::move(text);
    return item;
}

ContentItem ContentItem::make_image(std::string data, std::string mime_type)
{
    ContentItem item;
    item.kind = Kind::Image;
    item.data = std::move(data);
    item.mime_type = std::move(mime_type);
    return item;
}

ContentItem ContentItem::make_resource(std::string uri, std::optional<std::string> mime_type,
                                       std::optional<std::string> text)
{
    ContentItem item;
    item.kind = Kind::Resource;
    item.uri = std::move(uri);
    item.mime_type = std::move(mime_type);
    item.text = std::move(text);
    return item;
}

json ContentItem::to_json() const
{
    switch (kind)
    {
    case Kind::Image:
        return {{"type", "image"}, {"data", data}, {"mimeType", mime_type.value_or("")}};
    case Kind::Resource:
    {
        json resource = {{"uri", uri}};
        if (mime_type.has_value())
            resource["mimeType"] = *mime_type;
        if (text.has_value())
            resource["text"] = *text;
        return {{"type", "resource"}, {"resource", resource}};
    }
    case Kind::Text:
    default:
        return {{"type", "text"}, {"text", text.value_or("")}};
    }
}

ToolResult ToolResult::text(std::string text, bool is_error)
{
    ToolResult result;
    result.content.push_back(ContentItem::make_text(std::move(text)));
    result.is_error = is_error;
    return result;
}

ToolResult ToolResult::error(std::string message)
{
    return text(std::move(message), true);
}

json ToolResult::to_json() const
{
    json items = json::array();
    for (const auto& item : content)
        items.push_back(item.to_json());
    return {{"content", items}, {"isError", is_error}};
}

// ============================================================================
// ToolAnnotations / ToolDefinition
// ============================================================================

json ToolAnnotations::to_json() const
{
    json out = json::object();
    if (title.has_value())
        out["title"] = *title;
    if (read_only_hint.has_value())
        out["readOnlyHint"] = *read_only_hint;
    if (destructive_hint.has_value())
        out["destructiveHint"] = *destructive_hint;
    if (idempotent_hint.has_value())
        out["idempotentHint"] = *idempotent_hint;
    if (open_world_hint.has_value())
        out["openWorldHint"] = *open_world_hint;
    return out;
}

bool ToolAnnotations::has_any() const
{
    return title.has_value() || read_only_hint.has_value() || destructive_hint.has_value() ||
           idempotent_hint.has_value() || open_world_hint.has_value();
}

json ToolDefinition::to_json() const
{
    json out = {{"name", name}, {"description", description}, {"inputSchema", input_schema}};
    if (annotations.has_value() && annotations->has_any())
        out["annotations"] = annotations->to_json();
    return out;
}

// ============================================================================
// ParameterType
// ============================================================================

ParameterType::ParameterType(std::string type, std::optional<std::string> description)
    : schema_({{"type", std::move(type)}})
{
    if (description.has_value())
        schema_["description"] = *description;
}

ParameterType ParameterType::string(std::optional<std::string> description)
{
    return ParameterType("string", std::move(description));
}

ParameterType ParameterType::number(std::optional<std::string> description)
{
    return ParameterType("number", std::move(description));
}

ParameterType ParameterType::integer(std::optional<std::string> description)
{
    return ParameterType("integer", std::move(description));
}

ParameterType ParameterType::boolean(std::optional<std::string> description)
{
    return ParameterType("boolean", std::move(description));
}

ParameterType ParameterType::array(const ParameterType& items,
                                   std::optional<std::string> description)
{
    ParameterType type("array", std::move(description));
    type.schema_["items"] = items.schema();
    return type;
}

ParameterType ParameterType::object(const std::map<std::string, ParameterType>& properties,
                                    std::optional<std::string> description)
{
    ParameterType type("object", std::move(description));
    json props = json::object();
    for (const auto& [name, prop] : properties)
        props[name] = prop.schema();
    type.schema_["properties"] = props;
    return type;
}

ToolDefinition make_tool(std::string name, std::string description,
                         const std::map<std::string, ParameterType>& parameters,
                         const std::vector<std::string>& required, ToolHandler handler)
{
    json properties = json::object();
    for (const auto& [param, type] : parameters)
        properties[param] = type.schema();

    ToolDefinition tool;
    tool.name = std::move(name);
    tool.description = std::move(description);
    tool.input_schema = {{"type", "object"}, {"properties", properties}, {"required", required}};
    tool.handler = std::move(handler);
    return tool;
}

} // namespace mcp
} // namespace agentlink
