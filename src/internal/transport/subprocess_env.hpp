#ifndef AGENTLINK_INTERNAL_TRANSPORT_SUBPROCESS_ENV_HPP
#define AGENTLINK_INTERNAL_TRANSPORT_SUBPROCESS_ENV_HPP

#include <agentlink/transport.hpp>
#include <agentlink/version.hpp>

namespace agentlink
{
namespace internal
{

inline void apply_link_environment(SubprocessCommand& command, const std::string& entrypoint)
{
    // User supplied values win
    command.environment.emplace("CLAUDE_CODE_ENTRYPOINT", entrypoint);
    command.environment.emplace("CLAUDE_AGENT_SDK_VERSION", version_string());
}

} // namespace internal
} // namespace agentlink

#endif // AGENTLINK_INTERNAL_TRANSPORT_SUBPROCESS_ENV_HPP
