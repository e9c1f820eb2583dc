#include "internal/diagnostics.hpp"

#include <agentlink/connection.hpp>
#include <agentlink/errors.hpp>
#include <agentlink/protocol/control.hpp>
#include <agentlink/protocol/framer.hpp>
#include <agentlink/protocol/handlers.hpp>
#include <agentlink/protocol/router.hpp>
#include <algorithm>
#include <atomic>
#include <cstdlib>
#include <mutex>
#include <thread>

namespace agentlink
{

namespace
{

constexpr std::chrono::milliseconds kInterruptTimeout{5000};
constexpr std::chrono::milliseconds kSetModelTimeout{10000};
constexpr std::chrono::milliseconds kSetPermissionModeTimeout{10000};
constexpr std::chrono::milliseconds kRewindFilesTimeout{30000};
constexpr std::chrono::milliseconds kMcpStatusTimeout{10000};

// CLAUDE_CODE_STREAM_CLOSE_TIMEOUT (ms) can only lengthen the handshake window
std::chrono::milliseconds initialize_timeout(std::chrono::milliseconds configured)
{
    const char* env = std::getenv("CLAUDE_CODE_STREAM_CLOSE_TIMEOUT");
    if (!env || !*env)
        return configured;

    char* end = nullptr;
    long long parsed = std::strtoll(env, &end, 10);
    if (end == env || *end != '\0')
        return configured;

    return std::max(configured, std::chrono::milliseconds(parsed));
}

} // namespace

// ============================================================================
// EventStream
// ============================================================================

EventStream::EventStream(std::shared_ptr<protocol::EventQueue> queue,
                         protocol::EventQueue::ReaderToken token)
    : queue_(std::move(queue)), token_(token)
{
}

EventStream::Iterator EventStream::begin()
{
    return Iterator(this);
}

EventStream::Iterator EventStream::end()
{
    return Iterator();
}

std::optional<json> EventStream::get_next()
{
    if (!queue_)
        return std::nullopt;
    return queue_->pop(token_);
}

std::optional<json> EventStream::get_next_for(std::chrono::milliseconds timeout)
{
    if (!queue_)
        return std::nullopt;
    return queue_->pop_for(token_, timeout);
}

bool EventStream::is_active() const
{
    return queue_ && queue_->is_current(token_);
}

EventStream::Iterator::Iterator() : stream_(nullptr), is_end_(true) {}

EventStream::Iterator::Iterator(EventStream* stream) : stream_(stream), is_end_(false)
{
    fetch_next();
}

EventStream::Iterator::reference EventStream::Iterator::operator*() const
{
    return *current_;
}

EventStream::Iterator::pointer EventStream::Iterator::operator->() const
{
    return &(*current_);
}

EventStream::Iterator& EventStream::Iterator::operator++()
{
    fetch_next();
    return *this;
}

bool EventStream::Iterator::operator==(const Iterator& other) const
{
    return is_end_ == other.is_end_ && (is_end_ || stream_ == other.stream_);
}

bool EventStream::Iterator::operator!=(const Iterator& other) const
{
    return !(*this == other);
}

void EventStream::Iterator::fetch_next()
{
    if (!stream_)
    {
        is_end_ = true;
        return;
    }

    current_ = stream_->get_next();
    if (!current_)
        is_end_ = true;
}

// ============================================================================
// Connection::Impl
// ============================================================================

class Connection::Impl
{
  public:
    enum class State
    {
        Idle,
        Connected,
        Closed
    };

    LinkOptions options_;
    std::shared_ptr<Transport> transport_;
    protocol::WriteFunction write_;
    protocol::ControlProtocol control_;
    std::shared_ptr<protocol::EventQueue> events_;
    std::shared_ptr<AbortSignal> signal_;
    std::shared_ptr<protocol::HookDispatcher> hooks_;
    std::shared_ptr<protocol::McpBridge> mcp_bridge_;
    std::unique_ptr<protocol::MessageRouter> router_;

    std::thread reader_thread_;
    std::atomic<bool> running_{false};

    mutable std::mutex state_mutex_;
    State state_ = State::Idle;
    std::optional<json> server_info_;

    Impl(const LinkOptions& options, std::unique_ptr<Transport> transport)
        : options_(options), transport_(std::move(transport)),
          events_(std::make_shared<protocol::EventQueue>()),
          signal_(std::make_shared<AbortSignal>())
    {
        if (!transport_)
            throw ConfigurationError("Connection requires a transport");
        if (options_.max_buffer_size == 0)
            throw ConfigurationError("max_buffer_size must be positive");

        auto transport_ref = transport_;
        write_ = [transport_ref](const std::string& data) { transport_ref->write(data); };

        hooks_ = std::make_shared<protocol::HookDispatcher>(
            options_.hooks, options_.default_hook_timeout, signal_);
        mcp_bridge_ = std::make_shared<protocol::McpBridge>(options_.sdk_mcp_servers);

        auto dispatcher = std::make_shared<protocol::RequestDispatcher>();
        dispatcher->register_handler(std::make_shared<protocol::PermissionHandler>(
            options_.can_use_tool, options_.permission_timeout, signal_));
        dispatcher->register_handler(hooks_);
        dispatcher->register_handler(mcp_bridge_);

        router_ = std::make_unique<protocol::MessageRouter>(control_, *events_, dispatcher,
                                                            write_, options_.diagnostic_callback);
    }

    ~Impl()
    {
        close();
    }

    void connect()
    {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ == State::Connected)
                return;
            if (state_ == State::Closed)
                throw ConfigurationError("Connection already closed");
        }

        transport_->connect();

        running_ = true;
        reader_thread_ = std::thread(&Impl::reader_loop, this);

        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            state_ = State::Connected;
        }

        try
        {
            initialize();
        }
        catch (...)
        {
            close();
            throw;
        }
    }

    void initialize()
    {
        json request = json::object();

        json hooks_config = hooks_->build_config();
        if (!hooks_config.empty())
            request["hooks"] = hooks_config;

        auto servers = mcp_bridge_->server_names();
        if (!servers.empty())
            request["sdkMcpServers"] = servers;

        json result = control_.send_request(write_, "initialize", request,
                                            initialize_timeout(options_.initialize_timeout));

        std::lock_guard<std::mutex> lock(state_mutex_);
        server_info_ = std::move(result);
    }

    void reader_loop()
    {
        protocol::FramerOptions framing;
        framing.max_buffer_size = options_.max_buffer_size;
        framing.strict = options_.strict_framing;
        framing.diagnostics = options_.diagnostic_callback;

        protocol::FramedReader reader(*transport_, framing);
        std::exception_ptr error;

        try
        {
            while (auto message = reader.next(running_))
                router_->route(std::move(*message));
        }
        catch (const std::exception& e)
        {
            error = std::current_exception();
            control_.fail_all_pending(e.what());
        }

        if (!error)
            control_.fail_all_pending(running_ ? "end of stream" : "connection closed");
        events_->close(error);
    }

    void close()
    {
        {
            std::lock_guard<std::mutex> lock(state_mutex_);
            if (state_ == State::Closed)
                return;
            state_ = State::Closed;
        }

        running_ = false;
        if (reader_thread_.joinable())
            reader_thread_.join();

        // stdin stays open so handlers finishing inside the grace can answer
        if (!router_->wait_idle(std::chrono::milliseconds(500)))
        {
            internal::warn(options_.diagnostic_callback,
                           "closing with " + std::to_string(router_->handlers_in_flight()) +
                               " control request handler(s) still running");
        }

        transport_->end_input();
        control_.fail_all_pending("connection closed");
        events_->close();
        transport_->close();
    }

    void ensure_connected() const
    {
        std::lock_guard<std::mutex> lock(state_mutex_);
        if (state_ != State::Connected)
            throw ConfigurationError("Not connected");
    }

    json control_request(const std::string& subtype, const json& data,
                         std::chrono::milliseconds timeout)
    {
        ensure_connected();
        return control_.send_request(write_, subtype, data, timeout);
    }
};

// ============================================================================
// Connection
// ============================================================================

Connection::Connection(const LinkOptions& options)
    : impl_(std::make_unique<Impl>(options, create_cli_transport(options)))
{
}

Connection::Connection(const LinkOptions& options, std::unique_ptr<Transport> transport)
    : impl_(std::make_unique<Impl>(options, std::move(transport)))
{
}

Connection::~Connection() = default;

Connection::Connection(Connection&&) noexcept = default;
Connection& Connection::operator=(Connection&&) noexcept = default;

Connection::Impl& Connection::impl() const
{
    if (!impl_)
        throw ConfigurationError("Not connected");
    return *impl_;
}

void Connection::connect()
{
    impl().connect();
}

void Connection::close()
{
    if (impl_)
        impl_->close();
}

bool Connection::is_connected() const
{
    if (!impl_)
        return false;
    std::lock_guard<std::mutex> lock(impl_->state_mutex_);
    return impl_->state_ == Impl::State::Connected && impl_->transport_->is_running();
}

long Connection::get_pid() const
{
    return impl_ ? impl_->transport_->get_pid() : 0;
}

void Connection::send_user_message(const std::string& prompt, const std::string& session_id)
{
    impl().ensure_connected();

    json message = {{"type", "user"},
                    {"message", {{"role", "user"}, {"content", prompt}}},
                    {"session_id", session_id}};
    impl().write_(message.dump() + "\n");
}

EventStream Connection::receive_events()
{
    {
        std::lock_guard<std::mutex> lock(impl().state_mutex_);
        if (impl().state_ == Impl::State::Idle)
            throw ConfigurationError("Not connected");
    }
    return EventStream(impl().events_, impl().events_->attach_reader());
}

std::vector<json> Connection::receive_response()
{
    std::vector<json> events;
    EventStream stream = receive_events();
    while (auto event = stream.get_next())
    {
        bool is_result = event->value("type", "") == "result";
        events.push_back(std::move(*event));
        if (is_result)
            break;
    }
    return events;
}

json Connection::send_control_request(const std::string& subtype, const json& data,
                                      std::optional<std::chrono::milliseconds> timeout)
{
    return impl().control_request(subtype, data, timeout.value_or(impl().options_.control_timeout));
}

void Connection::interrupt()
{
    impl().control_request("interrupt", json::object(), kInterruptTimeout);
}

void Connection::set_model(const std::string& model)
{
    json data = {{"model", model.empty() ? json(nullptr) : json(model)}};
    impl().control_request("set_model", data, kSetModelTimeout);
}

void Connection::set_permission_mode(const std::string& mode)
{
    impl().control_request("set_permission_mode", {{"mode", mode}}, kSetPermissionModeTimeout);
}

void Connection::rewind_files(const std::string& user_message_id)
{
    impl().control_request("rewind_files", {{"user_message_id", user_message_id}},
                           kRewindFilesTimeout);
}

json Connection::get_mcp_status()
{
    return impl().control_request("mcp_status", json::object(), kMcpStatusTimeout);
}

std::optional<json> Connection::server_info() const
{
    std::lock_guard<std::mutex> lock(impl().state_mutex_);
    return impl().server_info_;
}

std::shared_ptr<const AbortSignal> Connection::abort_signal() const
{
    return impl().signal_;
}

void Connection::abort()
{
    impl().signal_->abort();
}

} // namespace agentlink
