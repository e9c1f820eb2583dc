#ifndef AGENTLINK_PROTOCOL_CONTROL_HPP
#define AGENTLINK_PROTOCOL_CONTROL_HPP

#include <atomic>
#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace agentlink
{

using json = nlohmann::json;

namespace protocol
{

using WriteFunction = std::function<void(const std::string&)>;

// Control request - either direction
struct ControlRequest
{
    std::string request_id;
    json request = json::object(); // Subtype-specific data, includes "subtype"

    std::string subtype() const
    {
        auto it = request.find("subtype");
        return it != request.end() && it->is_string() ? it->get<std::string>() : std::string();
    }

    json to_json() const;

    /// @throws ProtocolError when request_id or request is missing
    static ControlRequest from_json(const json& message);
};

// Control response - either direction
struct ControlResponse
{
    std::string request_id;
    std::string subtype = "success"; // "success" or "error"
    json response = json::object();  // Payload on success
    std::string error;               // Message on error

    bool is_error() const
    {
        return subtype == "error" || !error.empty();
    }

    json to_json() const;

    /// @throws ProtocolError when request_id or subtype is not a string
    static ControlResponse from_json(const json& message);

    static ControlResponse success(std::string request_id, json payload);
    static ControlResponse failure(std::string request_id, std::string message);
};

/// Correlates outgoing control requests with their responses.
///
/// Each pending request resolves exactly once: with the response payload,
/// a ProtocolError, a TimeoutError, or a ConnectionError after
/// fail_all_pending(). Whichever path removes the entry from the pending
/// table first wins; later arrivals for the same id are ignored.
class ControlProtocol
{
  public:
    ControlProtocol();
    ~ControlProtocol();

    // No copy
    ControlProtocol(const ControlProtocol&) = delete;
    ControlProtocol& operator=(const ControlProtocol&) = delete;

    /// Send a control request and wait for its response.
    /// A non-positive timeout waits indefinitely.
    /// @throws TimeoutError, ProtocolError, ConnectionError, WriteError
    json send_request(const WriteFunction& write_func, const std::string& subtype,
                      const json& request_data,
                      std::chrono::milliseconds timeout = std::chrono::milliseconds(60000));

    /// Deliver a control_response message. Returns false if no pending
    /// request matched (unknown, already timed out, or already resolved).
    /// @throws ProtocolError for a malformed envelope
    bool handle_response(const json& message);

    /// Fail every pending request with ConnectionError and reject new ones.
    void fail_all_pending(const std::string& reason);

    bool is_pending(const std::string& request_id) const;
    size_t pending_count() const;

    // Generate unique request ID: req_{counter}_{8 hex}
    std::string generate_request_id();

  private:
    struct PendingRequest
    {
        std::promise<json> promise;
    };

    std::future<json> register_request(const std::string& request_id);

    // Remove the entry; returns it if this call won the race
    std::optional<PendingRequest> take_request(const std::string& request_id);

    std::atomic<int> request_counter_{0};

    std::map<std::string, PendingRequest> pending_requests_;
    mutable std::mutex requests_mutex_;
    bool closed_ = false;
    std::string close_reason_;
};

} // namespace protocol
} // namespace agentlink

#endif // AGENTLINK_PROTOCOL_CONTROL_HPP
