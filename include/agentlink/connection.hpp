#ifndef AGENTLINK_CONNECTION_HPP
#define AGENTLINK_CONNECTION_HPP

#include <agentlink/protocol/event_queue.hpp>
#include <agentlink/transport.hpp>
#include <agentlink/types.hpp>
#include <chrono>
#include <cstddef>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentlink
{

/// Consumer view of a connection's ordinary events.
///
/// Buffered events come first, in arrival order, then live ones. Only the
/// most recently attached stream receives events; older streams end.
class EventStream
{
  public:
    class Iterator
    {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = json;
        using difference_type = std::ptrdiff_t;
        using pointer = const json*;
        using reference = const json&;

        Iterator();
        explicit Iterator(EventStream* stream);

        reference operator*() const;
        pointer operator->() const;
        Iterator& operator++();

        bool operator==(const Iterator& other) const;
        bool operator!=(const Iterator& other) const;

      private:
        EventStream* stream_;
        std::optional<json> current_;
        bool is_end_;

        void fetch_next();
    };

    EventStream() = default;

    // No copy, move only
    EventStream(const EventStream&) = delete;
    EventStream& operator=(const EventStream&) = delete;
    EventStream(EventStream&&) noexcept = default;
    EventStream& operator=(EventStream&&) noexcept = default;

    Iterator begin();
    Iterator end();

    /// Next event (blocking). std::nullopt when the connection ended or this
    /// stream was superseded. Rethrows the error that ended the connection.
    std::optional<json> get_next();

    /// Next event, or std::nullopt after timeout
    std::optional<json> get_next_for(std::chrono::milliseconds timeout);

    /// False once a newer stream was attached
    bool is_active() const;

  private:
    friend class Connection;
    EventStream(std::shared_ptr<protocol::EventQueue> queue,
                protocol::EventQueue::ReaderToken token);

    std::shared_ptr<protocol::EventQueue> queue_;
    protocol::EventQueue::ReaderToken token_ = 0;
};

/// One logical connection to the agent CLI: a single reader thread, the
/// control protocol in both directions, and the event stream.
class Connection
{
  public:
    /// Spawns the CLI described by options on connect()
    explicit Connection(const LinkOptions& options = LinkOptions{});
    Connection(const LinkOptions& options, std::unique_ptr<Transport> transport);
    ~Connection();

    // No copy, move only
    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;
    Connection(Connection&&) noexcept;
    Connection& operator=(Connection&&) noexcept;

    /// Open the transport, start reading and run the initialize handshake.
    /// On failure the connection is closed and the error rethrown.
    void connect();

    /// Stop reading, fail pending requests, release the process. Idempotent.
    void close();

    bool is_connected() const;

    // Returns 0 if the transport is not a subprocess
    long get_pid() const;

    // session_id defaults to "default" for multi-turn continuity
    void send_user_message(const std::string& prompt, const std::string& session_id = "default");

    EventStream receive_events();

    /// Events up to and including the next "result" event
    std::vector<json> receive_response();

    /// Generic correlated request; the configured control timeout applies
    /// when none is given.
    json send_control_request(const std::string& subtype, const json& data = json::object(),
                              std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // Control operations
    void interrupt();
    void set_model(const std::string& model); // empty selects the default model
    void set_permission_mode(const std::string& mode);
    void rewind_files(const std::string& user_message_id);
    json get_mcp_status();

    /// Result of the initialize handshake
    std::optional<json> server_info() const;

    std::shared_ptr<const AbortSignal> abort_signal() const;
    void abort();

  private:
    class Impl;

    // Throws ConfigurationError on a moved-from Connection
    Impl& impl() const;

    std::unique_ptr<Impl> impl_;
};

} // namespace agentlink

#endif // AGENTLINK_CONNECTION_HPP
