#include "../internal/timed_call.hpp"

#include <agentlink/errors.hpp>
#include <agentlink/protocol/handlers.hpp>

namespace agentlink
{
namespace protocol
{

PermissionHandler::PermissionHandler(std::optional<ToolPermissionCallback> callback,
                                     std::chrono::milliseconds timeout,
                                     std::shared_ptr<const AbortSignal> signal)
    : callback_(std::move(callback)), timeout_(timeout), signal_(std::move(signal))
{
}

json PermissionHandler::handle(const ControlRequest& request)
{
    const json& body = request.request;

    std::string tool_name = body.value("tool_name", "");
    if (tool_name.empty())
        throw ProtocolError("can_use_tool request missing tool_name");

    json input = json::object();
    if (body.contains("input") && body["input"].is_object())
        input = body["input"];
    else if (body.contains("tool_input") && body["tool_input"].is_object())
        input = body["tool_input"];

    ToolPermissionContext context;
    context.signal = signal_;
    if (body.contains("session_id") && body["session_id"].is_string())
        context.session_id = body["session_id"].get<std::string>();
    if (body.contains("permission_suggestions") && body["permission_suggestions"].is_array())
    {
        for (const auto& suggestion : body["permission_suggestions"])
            context.suggestions.push_back(PermissionUpdate::from_json(suggestion));
    }

    if (signal_ && signal_->is_aborted())
        throw AbortedError("Permission check for " + tool_name + " aborted");

    PermissionResult result = PermissionResultAllow{};
    if (callback_ && *callback_)
    {
        auto callback = *callback_;
        result = internal::call_with_timeout<PermissionResult>(
            [callback, tool_name, input, context]() { return callback(tool_name, input, context); },
            timeout_, "can_use_tool " + tool_name);
    }

    if (signal_ && signal_->is_aborted())
        throw AbortedError("Permission check for " + tool_name + " aborted");

    return to_payload(result, input);
}

json PermissionHandler::to_payload(const PermissionResult& result, const json& original_input)
{
    json payload;

    if (const auto* allow = std::get_if<PermissionResultAllow>(&result))
    {
        payload["behavior"] = "allow";
        payload["updatedInput"] = allow->updated_input.value_or(original_input);

        if (allow->updated_permissions.has_value())
        {
            json permissions = json::array();
            for (const auto& perm : *allow->updated_permissions)
                permissions.push_back(perm.to_json());
            payload["updatedPermissions"] = permissions;
        }
    }
    else
    {
        const auto& deny = std::get<PermissionResultDeny>(result);
        payload["behavior"] = "deny";
        payload["message"] = deny.message;
        if (deny.interrupt)
            payload["interrupt"] = true;
    }

    return payload;
}

} // namespace protocol
} // namespace agentlink
