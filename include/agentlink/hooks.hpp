#ifndef AGENTLINK_HOOKS_HPP
#define AGENTLINK_HOOKS_HPP

#include <functional>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace agentlink
{

using json = nlohmann::json;

class AbortSignal;

// ============================================================================
// Hook Events
// ============================================================================

/// Lifecycle points at which the CLI asks the client to run hooks
namespace HookEvent
{
constexpr const char* PreToolUse = "PreToolUse";
constexpr const char* PostToolUse = "PostToolUse";
constexpr const char* UserPromptSubmit = "UserPromptSubmit";
constexpr const char* Stop = "Stop";
constexpr const char* SubagentStop = "SubagentStop";
constexpr const char* PreCompact = "PreCompact";
} // namespace HookEvent

/// Values for HookOutput::decision
namespace HookDecision
{
constexpr const char* Block = "block";
constexpr const char* Allow = "allow";
constexpr const char* Deny = "deny";
constexpr const char* Ask = "ask";
} // namespace HookDecision

/// True when name is one of the HookEvent constants
bool is_valid_hook_event(const std::string& name);

// ============================================================================
// Hook Input / Output
// ============================================================================

/// Fields the CLI sends along with a hook invocation.
/// Only the fields relevant to the event are populated; the complete
/// object is preserved in raw.
struct HookInput
{
    std::string hook_event_name;
    std::string session_id;
    std::optional<std::string> tool_name;
    std::optional<json> tool_input;
    std::optional<json> tool_response;
    std::optional<std::string> prompt;
    std::optional<std::string> stop_reason;
    json raw = json::object();

    /// Build from a hook_callback request (either the nested "input" object
    /// or the request itself when the fields are inline)
    static HookInput from_request(const json& request);
};

/// Result of a hook callback
struct HookOutput
{
    bool should_continue = true;
    bool suppress_output = false;
    std::optional<std::string> stop_reason;
    std::optional<std::string> decision; // HookDecision value
    std::optional<std::string> system_message;
    std::optional<std::string> reason;
    std::optional<json> hook_specific_output;

    /// A blocking result stops dispatch of any remaining callbacks
    bool blocks() const;

    /// Wire representation ("continue", "suppressOutput", ...)
    json to_json() const;

    static HookOutput block(std::string reason);
};

/// Per-invocation context handed to hook callbacks
struct HookContext
{
    std::shared_ptr<const AbortSignal> signal;
};

/// Callback invoked when a registered hook is triggered.
/// @param input Event fields from the CLI
/// @param tool_use_id Tool use identifier for tool events, empty otherwise
/// @param context Cancellation context
using HookCallback = std::function<HookOutput(
    const HookInput& input, const std::optional<std::string>& tool_use_id,
    const HookContext& context)>;

// ============================================================================
// Hook Configuration
// ============================================================================

/// Hook matcher configuration
struct HookMatcher
{
    /// Tool name pattern. A registration runs when the pattern equals the
    /// tool name or is contained in it. Absent matches every tool.
    std::optional<std::string> matcher;

    /// Callbacks run in order
    std::vector<HookCallback> hooks;

    /// Per-callback timeout in seconds (default 30). Accepts fractional seconds.
    std::optional<double> timeout;

    HookMatcher() = default;
    HookMatcher(std::optional<std::string> m, std::vector<HookCallback> h,
                std::optional<double> t = std::nullopt)
        : matcher(std::move(m)), hooks(std::move(h)), timeout(t)
    {
    }

    /// Apply the matcher pattern to a tool name. Events without a tool
    /// name are never filtered out.
    bool matches(const std::optional<std::string>& tool_name) const;
};

} // namespace agentlink

#endif // AGENTLINK_HOOKS_HPP
