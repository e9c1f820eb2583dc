#ifndef AGENTLINK_HPP
#define AGENTLINK_HPP

// Main header that includes everything

#include <agentlink/connection.hpp>
#include <agentlink/errors.hpp>
#include <agentlink/hooks.hpp>
#include <agentlink/transport.hpp>
#include <agentlink/types.hpp>
#include <agentlink/version.hpp>

// Embedded tool servers, answered in-process over the control channel
#include <agentlink/mcp/server.hpp>
#include <agentlink/mcp/typed_tool.hpp>

#endif // AGENTLINK_HPP
