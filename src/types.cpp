#include <agentlink/hooks.hpp>
#include <agentlink/types.hpp>

namespace agentlink
{

// ============================================================================
// Hooks
// ============================================================================

bool is_valid_hook_event(const std::string& name)
{
    return name == HookEvent::PreToolUse || name == HookEvent::PostToolUse ||
           name == HookEvent::UserPromptSubmit || name == HookEvent::Stop ||
           name == HookEvent::SubagentStop || name == HookEvent::PreCompact;
}

namespace
{

std::optional<std::string> optional_string(const json& j, const char* key)
{
    if (j.contains(key) && j[key].is_string())
        return j[key].get<std::string>();
    return std::nullopt;
}

std::optional<json> optional_value(const json& j, const char* key)
{
    if (j.contains(key) && !j[key].is_null())
        return j[key];
    return std::nullopt;
}

} // namespace

HookInput HookInput::from_request(const json& request)
{
    const json& source =
        request.contains("input") && request["input"].is_object() ? request["input"] : request;

    HookInput input;
    input.raw = source;
    input.hook_event_name = source.value("hook_event_name", request.value("hook_event", ""));
    input.session_id = source.value("session_id", "");
    input.tool_name = optional_string(source, "tool_name");
    input.tool_input = optional_value(source, "tool_input");
    input.tool_response = optional_value(source, "tool_response");
    if (!input.tool_response)
        input.tool_response = optional_value(source, "tool_output");
    input.prompt = optional_string(source, "prompt");
    input.stop_reason = optional_string(source, "stop_reason");
    return input;
}

bool HookOutput::blocks() const
{
    if (!should_continue)
        return true;
    return decision.has_value() &&
           (*decision == HookDecision::Block || *decision == HookDecision::Deny);
}

json HookOutput::to_json() const
{
    json out = {{"continue", should_continue}};
    if (suppress_output)
        out["suppressOutput"] = true;
    if (stop_reason.has_value())
        out["stopReason"] = *stop_reason;
    if (decision.has_value())
        out["decision"] = *decision;
    if (system_message.has_value())
        out["systemMessage"] = *system_message;
    if (reason.has_value())
        out["reason"] = *reason;
    if (hook_specific_output.has_value())
        out["hookSpecificOutput"] = *hook_specific_output;
    return out;
}

HookOutput HookOutput::block(std::string reason)
{
    HookOutput out;
    out.decision = HookDecision::Block;
    out.reason = std::move(reason);
    return out;
}

bool HookMatcher::matches(const std::optional<std::string>& tool_name) const
{
    if (!matcher.has_value() || matcher->empty() || !tool_name.has_value())
        return true;
    return *tool_name == *matcher || tool_name->find(*matcher) != std::string::npos;
}

// ============================================================================
// Permissions
// ============================================================================

json PermissionUpdate::to_json() const
{
    json result = {{"type", type}};

    if (destination.has_value())
        result["destination"] = *destination;

    if (type == "addRules" || type == "replaceRules" || type == "removeRules")
    {
        if (rules.has_value())
        {
            json rules_array = json::array();
            for (const auto& rule : *rules)
            {
                json rule_obj = {{"toolName", rule.tool_name}};
                rule_obj["ruleContent"] =
                    rule.rule_content.has_value() ? json(*rule.rule_content) : json(nullptr);
                rules_array.push_back(rule_obj);
            }
            result["rules"] = rules_array;
        }
        if (behavior.has_value())
            result["behavior"] = *behavior;
    }
    else if (type == "setMode")
    {
        if (mode.has_value())
            result["mode"] = *mode;
    }
    else if (type == "addDirectories" || type == "removeDirectories")
    {
        if (directories.has_value())
            result["directories"] = *directories;
    }

    return result;
}

PermissionUpdate PermissionUpdate::from_json(const json& j)
{
    PermissionUpdate update;
    update.type = j.value("type", "");

    if (j.contains("rules") && j["rules"].is_array())
    {
        std::vector<PermissionRuleValue> rules;
        for (const auto& rule_json : j["rules"])
        {
            PermissionRuleValue rule;
            rule.tool_name = rule_json.value("toolName", "");
            rule.rule_content = optional_string(rule_json, "ruleContent");
            rules.push_back(std::move(rule));
        }
        update.rules = std::move(rules);
    }

    update.behavior = optional_string(j, "behavior");
    update.mode = optional_string(j, "mode");
    update.destination = optional_string(j, "destination");
    if (j.contains("directories") && j["directories"].is_array())
        update.directories = j["directories"].get<std::vector<std::string>>();

    return update;
}

} // namespace agentlink
