#ifndef AGENTLINK_PROTOCOL_HANDLERS_HPP
#define AGENTLINK_PROTOCOL_HANDLERS_HPP

#include <agentlink/protocol/router.hpp>
#include <agentlink/types.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentlink
{
namespace protocol
{

// ============================================================================
// Permission gate (can_use_tool)
// ============================================================================

class PermissionHandler : public ControlRequestHandler
{
  public:
    /// Without a callback every tool is allowed
    PermissionHandler(std::optional<ToolPermissionCallback> callback,
                      std::chrono::milliseconds timeout,
                      std::shared_ptr<const AbortSignal> signal);

    std::string subtype() const override
    {
        return "can_use_tool";
    }

    json handle(const ControlRequest& request) override;

    /// Response payload for a decision
    static json to_payload(const PermissionResult& result, const json& original_input);

  private:
    std::optional<ToolPermissionCallback> callback_;
    std::chrono::milliseconds timeout_;
    std::shared_ptr<const AbortSignal> signal_;
};

// ============================================================================
// Hook dispatch (hook_callback)
// ============================================================================

/// Owns the hook registrations of a connection.
///
/// Callbacks get stable ids ("hook_0", "hook_1", ...) that are announced to
/// the CLI during initialize. A request naming a callback_id runs that one
/// callback; a request naming only an event runs every matching registration
/// in order until one blocks.
class HookDispatcher : public ControlRequestHandler
{
  public:
    HookDispatcher(std::map<std::string, std::vector<HookMatcher>> hooks,
                   std::chrono::milliseconds default_timeout,
                   std::shared_ptr<const AbortSignal> signal);

    std::string subtype() const override
    {
        return "hook_callback";
    }

    json handle(const ControlRequest& request) override;

    /// Run the registrations for one event
    HookOutput dispatch(const std::string& event, const HookInput& input,
                        const std::optional<std::string>& tool_use_id) const;

    /// "hooks" object of the initialize request, empty when nothing is registered
    json build_config() const;

    bool empty() const
    {
        return registrations_.empty();
    }

  private:
    struct Registration
    {
        std::string event;
        HookMatcher matcher;
        std::vector<std::string> callback_ids;
    };

    std::chrono::milliseconds timeout_for(const HookMatcher& matcher) const;
    HookOutput run_callback(const HookCallback& callback, std::chrono::milliseconds timeout,
                            const std::string& event, const HookInput& input,
                            const std::optional<std::string>& tool_use_id) const;

    std::vector<Registration> registrations_;
    std::map<std::string, std::pair<size_t, size_t>> callback_index_; // id -> (registration, hook)
    std::chrono::milliseconds default_timeout_;
    std::shared_ptr<const AbortSignal> signal_;
};

// ============================================================================
// Embedded tool server bridge (mcp_message)
// ============================================================================

class McpBridge : public ControlRequestHandler
{
  public:
    explicit McpBridge(std::map<std::string, std::shared_ptr<mcp::McpServer>> servers);

    std::string subtype() const override
    {
        return "mcp_message";
    }

    json handle(const ControlRequest& request) override;

    std::vector<std::string> server_names() const;

  private:
    std::map<std::string, std::shared_ptr<mcp::McpServer>> servers_;
};

} // namespace protocol
} // namespace agentlink

#endif // AGENTLINK_PROTOCOL_HANDLERS_HPP
