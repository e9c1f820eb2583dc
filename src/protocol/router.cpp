#include "../internal/diagnostics.hpp"

#include <agentlink/errors.hpp>
#include <agentlink/protocol/router.hpp>
#include <condition_variable>
#include <mutex>
#include <thread>

namespace agentlink
{
namespace protocol
{

// ============================================================================
// RequestDispatcher
// ============================================================================

void RequestDispatcher::register_handler(std::shared_ptr<ControlRequestHandler> handler)
{
    if (!handler)
        throw ConfigurationError("Null control request handler");

    std::string subtype = handler->subtype();
    if (handlers_.count(subtype))
        throw ConfigurationError("Handler already registered for subtype: " + subtype);
    handlers_.emplace(std::move(subtype), std::move(handler));
}

bool RequestDispatcher::has_handler(const std::string& subtype) const
{
    return handlers_.count(subtype) > 0;
}

ControlResponse RequestDispatcher::dispatch(const ControlRequest& request) const
{
    const std::string subtype = request.subtype();

    auto it = handlers_.find(subtype);
    if (it == handlers_.end())
    {
        return ControlResponse::failure(request.request_id,
                                        "Unsupported control request subtype: " + subtype);
    }

    try
    {
        return ControlResponse::success(request.request_id, it->second->handle(request));
    }
    catch (const std::exception& e)
    {
        return ControlResponse::failure(request.request_id, e.what());
    }
}

// ============================================================================
// MessageRouter
// ============================================================================

struct MessageRouter::InFlight
{
    mutable std::mutex mutex;
    mutable std::condition_variable cv;
    size_t count = 0;

    void enter()
    {
        std::lock_guard<std::mutex> lock(mutex);
        ++count;
    }

    void leave()
    {
        {
            std::lock_guard<std::mutex> lock(mutex);
            --count;
        }
        cv.notify_all();
    }
};

MessageRouter::MessageRouter(ControlProtocol& control, EventQueue& events,
                             std::shared_ptr<const RequestDispatcher> dispatcher,
                             WriteFunction write, std::optional<DiagnosticCallback> diagnostics)
    : control_(control), events_(events), dispatcher_(std::move(dispatcher)),
      write_(std::move(write)), diagnostics_(std::move(diagnostics)),
      in_flight_(std::make_shared<InFlight>())
{
    if (!dispatcher_)
        dispatcher_ = std::make_shared<RequestDispatcher>();
}

MessageRouter::Disposition MessageRouter::route(json message)
{
    auto type_it = message.find("type");
    const std::string type =
        type_it != message.end() && type_it->is_string() ? type_it->get<std::string>() : "";

    if (type == "control_response")
    {
        try
        {
            if (control_.handle_response(message))
                return Disposition::Response;
        }
        catch (const ProtocolError& e)
        {
            internal::warn(diagnostics_, std::string("malformed control_response: ") + e.what());
            return Disposition::Dropped;
        }

        internal::warn(diagnostics_, "ignoring control_response with no pending request: " +
                                         internal::preview(message.dump()));
        return Disposition::Dropped;
    }

    if (type == "control_request")
    {
        ControlRequest request;
        try
        {
            request = ControlRequest::from_json(message);
        }
        catch (const ProtocolError& e)
        {
            // Nothing to correlate an error response with
            internal::warn(diagnostics_, std::string("malformed control_request: ") + e.what());
            return Disposition::Dropped;
        }

        dispatch_async(std::move(request));
        return Disposition::InboundRequest;
    }

    events_.push(std::move(message));
    return Disposition::Event;
}

void MessageRouter::dispatch_async(ControlRequest request)
{
    auto dispatcher = dispatcher_;
    auto write = write_;
    auto diagnostics = diagnostics_;
    auto in_flight = in_flight_;

    in_flight->enter();
    try
    {
        std::thread(
            [dispatcher, write, diagnostics, in_flight, request = std::move(request)]()
            {
                ControlResponse response = dispatcher->dispatch(request);
                try
                {
                    write(response.to_json().dump() + "\n");
                }
                catch (const std::exception& e)
                {
                    internal::warn(diagnostics, "could not send control response for " +
                                                    request.request_id + ": " + e.what());
                }
                in_flight->leave();
            })
            .detach();
    }
    catch (...)
    {
        in_flight->leave();
        throw;
    }
}

size_t MessageRouter::handlers_in_flight() const
{
    std::lock_guard<std::mutex> lock(in_flight_->mutex);
    return in_flight_->count;
}

bool MessageRouter::wait_idle(std::chrono::milliseconds timeout) const
{
    std::unique_lock<std::mutex> lock(in_flight_->mutex);
    return in_flight_->cv.wait_for(lock, timeout, [this] { return in_flight_->count == 0; });
}

} // namespace protocol
} // namespace agentlink
