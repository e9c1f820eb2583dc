#ifndef AGENTLINK_TYPES_HPP
#define AGENTLINK_TYPES_HPP

#include <agentlink/hooks.hpp>
#include <atomic>
#include <chrono>
#include <cstddef>
#include <functional>
#include <map>
#include <memory>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace agentlink
{

// JSON type alias - allows swapping implementation later if needed
using json = nlohmann::json;

namespace mcp
{
class McpServer;
} // namespace mcp

// ============================================================================
// Cancellation
// ============================================================================

/// One-way, thread-safe abort flag shared by a connection and the contexts it
/// hands to capability handlers. Handlers check it before producing a result.
class AbortSignal
{
  public:
    bool is_aborted() const noexcept
    {
        return aborted_.load(std::memory_order_acquire);
    }

    void abort() noexcept
    {
        aborted_.store(true, std::memory_order_release);
    }

  private:
    std::atomic<bool> aborted_{false};
};

// ============================================================================
// Permission Types
// ============================================================================

/// Permission modes
namespace PermissionMode
{
constexpr const char* Default = "default";
constexpr const char* AcceptEdits = "acceptEdits";
constexpr const char* Plan = "plan";
constexpr const char* BypassPermissions = "bypassPermissions";
} // namespace PermissionMode

/// Permission rule value
struct PermissionRuleValue
{
    std::string tool_name;
    std::optional<std::string> rule_content = std::nullopt;
};

/// Permission rule update proposed by the CLI or returned by a permission callback
struct PermissionUpdate
{
    std::string type; // "addRules", "replaceRules", "removeRules", "setMode", "addDirectories",
                      // "removeDirectories"
    std::optional<std::vector<PermissionRuleValue>> rules = std::nullopt;
    std::optional<std::string> behavior = std::nullopt;
    std::optional<std::string> mode = std::nullopt;
    std::optional<std::vector<std::string>> directories = std::nullopt;
    std::optional<std::string> destination = std::nullopt;

    json to_json() const;
    static PermissionUpdate from_json(const json& j);
};

/// Context information for tool permission callbacks
struct ToolPermissionContext
{
    std::vector<PermissionUpdate> suggestions; // Suggestions from the CLI
    std::optional<std::string> session_id;
    std::shared_ptr<const AbortSignal> signal;
};

/// Permission result: Allow
struct PermissionResultAllow
{
    std::optional<json> updated_input = std::nullopt;
    std::optional<std::vector<PermissionUpdate>> updated_permissions = std::nullopt;
};

/// Permission result: Deny
struct PermissionResultDeny
{
    std::string message = "";
    bool interrupt = false;
};

using PermissionResult = std::variant<PermissionResultAllow, PermissionResultDeny>;

// ============================================================================
// Callback Function Types
// ============================================================================

/// Callback invoked when the CLI asks whether a tool may run.
/// @param tool_name Tool name (e.g., "Read", "Write", "Bash")
/// @param input Tool-specific arguments
/// @param context Suggestions and cancellation context
using ToolPermissionCallback = std::function<PermissionResult(
    const std::string& tool_name, const json& input, const ToolPermissionContext& context)>;

/// Receives each line the child process writes to stderr
using StderrCallback = std::function<void(const std::string& line)>;

/// Receives library warnings (dropped lines, undeliverable responses, ...).
/// Defaults to std::cerr when unset.
using DiagnosticCallback = std::function<void(const std::string& message)>;

// ============================================================================
// Options
// ============================================================================

/// Default size cap for an unterminated line (1 MiB)
constexpr std::size_t kDefaultMaxBufferSize = 1024 * 1024;

struct LinkOptions
{
    // Process settings, used by create_cli_transport()
    std::string cli_path; // Empty: CLAUDE_CLI_PATH, then PATH lookup
    std::optional<std::string> working_directory;
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
    std::string model;
    std::string permission_mode;
    /// Extra CLI flags, flag -> value (empty value for boolean flags)
    std::map<std::string, std::string> extra_args;

    // Framing
    std::size_t max_buffer_size = kDefaultMaxBufferSize;
    /// Treat every unparseable line as a decode error instead of dropping
    /// lines that do not look like complete objects
    bool strict_framing = false;

    // Timeouts
    std::chrono::milliseconds control_timeout{60000};
    std::chrono::milliseconds initialize_timeout{60000};
    std::chrono::milliseconds permission_timeout{60000};
    std::chrono::milliseconds default_hook_timeout{30000};

    /// Hook registrations keyed by HookEvent name
    /// ```cpp
    /// opts.hooks[HookEvent::PreToolUse] = {
    ///     HookMatcher{"Bash", {my_hook_callback}}
    /// };
    /// ```
    std::map<std::string, std::vector<HookMatcher>> hooks;

    /// If not set, every tool is allowed
    std::optional<ToolPermissionCallback> can_use_tool;

    /// In-process tool servers reachable through mcp_message requests
    std::map<std::string, std::shared_ptr<mcp::McpServer>> sdk_mcp_servers;

    /// Runs on the stderr reader thread
    std::optional<StderrCallback> stderr_callback;

    std::optional<DiagnosticCallback> diagnostic_callback;
};

} // namespace agentlink

#endif // AGENTLINK_TYPES_HPP
