#include <agentlink/errors.hpp>
#include <agentlink/protocol/control.hpp>
#include <iomanip>
#include <random>
#include <sstream>

namespace agentlink
{
namespace protocol
{

// ============================================================================
// Wire structs
// ============================================================================

json ControlRequest::to_json() const
{
    return {{"type", "control_request"}, {"request_id", request_id}, {"request", request}};
}

ControlRequest ControlRequest::from_json(const json& message)
{
    if (!message.contains("request_id") || !message["request_id"].is_string())
        throw ProtocolError("control_request without request_id");
    if (!message.contains("request") || !message["request"].is_object())
        throw ProtocolError("control_request without request body");

    ControlRequest req;
    req.request_id = message["request_id"].get<std::string>();
    req.request = message["request"];
    return req;
}

json ControlResponse::to_json() const
{
    json body = {{"subtype", subtype}, {"request_id", request_id}};
    if (subtype == "error")
        body["error"] = error;
    else
        body["response"] = response;
    return {{"type", "control_response"}, {"response", body}};
}

ControlResponse ControlResponse::from_json(const json& message)
{
    ControlResponse resp;
    const json& body = message.contains("response") && message["response"].is_object()
                           ? message["response"]
                           : message;

    if (body.contains("request_id") && !body["request_id"].is_string())
        throw ProtocolError("control_response request_id is not a string");
    if (body.contains("subtype") && !body["subtype"].is_string())
        throw ProtocolError("control_response subtype is not a string");

    resp.request_id = body.value("request_id", "");
    resp.subtype = body.value("subtype", "success");

    if (body.contains("error") && !body["error"].is_null())
    {
        const auto& err = body["error"];
        resp.error = err.is_string() ? err.get<std::string>() : err.dump();
        resp.subtype = "error";
    }
    else if (resp.subtype == "error")
    {
        resp.error = "Unknown error";
    }

    if (body.contains("response"))
        resp.response = body["response"];
    else
    {
        // Flat payload: everything except the envelope keys
        resp.response = body;
        resp.response.erase("request_id");
        resp.response.erase("subtype");
    }
    return resp;
}

ControlResponse ControlResponse::success(std::string request_id, json payload)
{
    ControlResponse resp;
    resp.request_id = std::move(request_id);
    resp.response = std::move(payload);
    return resp;
}

ControlResponse ControlResponse::failure(std::string request_id, std::string message)
{
    ControlResponse resp;
    resp.request_id = std::move(request_id);
    resp.subtype = "error";
    resp.response = nullptr;
    resp.error = std::move(message);
    return resp;
}

// ============================================================================
// ControlProtocol
// ============================================================================

ControlProtocol::ControlProtocol() {}

ControlProtocol::~ControlProtocol()
{
    fail_all_pending("Control protocol shutting down");
}

std::string ControlProtocol::generate_request_id()
{
    int counter = request_counter_++;

    // Random suffix (4 bytes = 8 hex chars)
    thread_local std::mt19937 gen{std::random_device{}()};
    std::uniform_int_distribution<> dis(0, 255);

    std::ostringstream oss;
    oss << "req_" << counter << "_";
    for (int i = 0; i < 4; ++i)
        oss << std::hex << std::setfill('0') << std::setw(2) << dis(gen);

    return oss.str();
}

std::future<json> ControlProtocol::register_request(const std::string& request_id)
{
    std::lock_guard<std::mutex> lock(requests_mutex_);

    if (closed_)
        throw ConnectionError("Connection closed: " + close_reason_);

    PendingRequest pending;
    auto future = pending.promise.get_future();

    pending_requests_.emplace(request_id, std::move(pending));
    return future;
}

std::optional<ControlProtocol::PendingRequest>
ControlProtocol::take_request(const std::string& request_id)
{
    std::lock_guard<std::mutex> lock(requests_mutex_);

    auto it = pending_requests_.find(request_id);
    if (it == pending_requests_.end())
        return std::nullopt;

    PendingRequest pending = std::move(it->second);
    pending_requests_.erase(it);
    return pending;
}

json ControlProtocol::send_request(const WriteFunction& write_func, const std::string& subtype,
                                   const json& request_data, std::chrono::milliseconds timeout)
{
    ControlRequest req;
    req.request_id = generate_request_id();
    req.request = request_data.is_object() ? request_data : json::object();
    req.request["subtype"] = subtype;

    // Register pending request BEFORE sending
    auto future = register_request(req.request_id);

    try
    {
        write_func(req.to_json().dump() + "\n");
    }
    catch (const std::exception& e)
    {
        take_request(req.request_id);
        throw WriteError(std::string("Failed to send ") + subtype + " request: " + e.what());
    }

    if (timeout.count() > 0 &&
        future.wait_for(timeout) == std::future_status::timeout)
    {
        // Removing the entry is the timer's claim on the request. If the
        // entry is already gone a response won the race and the future is
        // (or is about to be) satisfied.
        if (take_request(req.request_id))
            throw TimeoutError(subtype, timeout);
    }

    return future.get();
}

bool ControlProtocol::handle_response(const json& message)
{
    ControlResponse resp = ControlResponse::from_json(message);
    if (resp.request_id.empty())
        return false;

    auto pending = take_request(resp.request_id);
    if (!pending)
        return false;

    if (resp.is_error())
        pending->promise.set_exception(std::make_exception_ptr(ProtocolError(resp.error)));
    else
        pending->promise.set_value(resp.response);
    return true;
}

void ControlProtocol::fail_all_pending(const std::string& reason)
{
    std::map<std::string, PendingRequest> failed;
    {
        std::lock_guard<std::mutex> lock(requests_mutex_);
        closed_ = true;
        close_reason_ = reason;
        failed.swap(pending_requests_);
    }

    for (auto& [id, pending] : failed)
    {
        pending.promise.set_exception(
            std::make_exception_ptr(ConnectionError("Connection closed: " + reason)));
    }
}

bool ControlProtocol::is_pending(const std::string& request_id) const
{
    std::lock_guard<std::mutex> lock(requests_mutex_);
    return pending_requests_.count(request_id) > 0;
}

size_t ControlProtocol::pending_count() const
{
    std::lock_guard<std::mutex> lock(requests_mutex_);
    return pending_requests_.size();
}

} // namespace protocol
} // namespace agentlink
