#ifndef AGENTLINK_PROTOCOL_ROUTER_HPP
#define AGENTLINK_PROTOCOL_ROUTER_HPP

#include <agentlink/protocol/control.hpp>
#include <agentlink/protocol/event_queue.hpp>
#include <agentlink/types.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace agentlink
{
namespace protocol
{

/// Local logic answering one kind of remote-initiated control request
class ControlRequestHandler
{
  public:
    virtual ~ControlRequestHandler() = default;

    /// Request subtype this handler answers ("can_use_tool", ...)
    virtual std::string subtype() const = 0;

    /// Produce the success payload. Throwing produces an error response.
    virtual json handle(const ControlRequest& request) = 0;
};

/// Table of capability handlers keyed by subtype, fixed after setup
class RequestDispatcher
{
  public:
    /// @throws ConfigurationError if the subtype is already registered
    void register_handler(std::shared_ptr<ControlRequestHandler> handler);

    bool has_handler(const std::string& subtype) const;

    /// Never throws: handler failures and unknown subtypes become error responses
    ControlResponse dispatch(const ControlRequest& request) const;

  private:
    std::map<std::string, std::shared_ptr<ControlRequestHandler>> handlers_;
};

/// Decides the disposition of each framed object read from the transport.
///
/// route() is called from the single reader thread. Inbound control requests
/// run on their own thread so the reader keeps servicing responses (a
/// handler may itself be waiting on one).
class MessageRouter
{
  public:
    enum class Disposition
    {
        Response,       // resolved a pending request
        InboundRequest, // handed to a capability handler
        Event,          // queued for the consumer
        Dropped         // unmatched response or malformed request
    };

    MessageRouter(ControlProtocol& control, EventQueue& events,
                  std::shared_ptr<const RequestDispatcher> dispatcher, WriteFunction write,
                  std::optional<DiagnosticCallback> diagnostics = std::nullopt);

    // No copy
    MessageRouter(const MessageRouter&) = delete;
    MessageRouter& operator=(const MessageRouter&) = delete;

    Disposition route(json message);

    /// Inbound requests still being handled
    size_t handlers_in_flight() const;

    /// Wait until no inbound request is being handled. Returns false on timeout.
    bool wait_idle(std::chrono::milliseconds timeout) const;

  private:
    struct InFlight;

    void dispatch_async(ControlRequest request);

    ControlProtocol& control_;
    EventQueue& events_;
    std::shared_ptr<const RequestDispatcher> dispatcher_;
    WriteFunction write_;
    std::optional<DiagnosticCallback> diagnostics_;
    std::shared_ptr<InFlight> in_flight_;
};

} // namespace protocol
} // namespace agentlink

#endif // AGENTLINK_PROTOCOL_ROUTER_HPP
