#ifndef AGENTLINK_PROTOCOL_EVENT_QUEUE_HPP
#define AGENTLINK_PROTOCOL_EVENT_QUEUE_HPP

#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <mutex>
#include <nlohmann/json.hpp>
#include <optional>

namespace agentlink
{

using json = nlohmann::json;

namespace protocol
{

/// FIFO of ordinary events between the reader thread and the consumer.
///
/// Events pushed before any reader attached (the handshake, or while the
/// caller was blocked on a control request) are delivered before later ones
/// simply because the queue is FIFO. Attaching a reader invalidates the
/// previously attached one.
class EventQueue
{
  public:
    enum class Phase
    {
        Buffering, // no reader attached yet
        Draining,  // a reader is attached
        Closed
    };

    using ReaderToken = std::uint64_t;

    EventQueue() = default;

    // No copy
    EventQueue(const EventQueue&) = delete;
    EventQueue& operator=(const EventQueue&) = delete;

    /// Append an event. Ignored once the queue is closed.
    void push(json event);

    /// Attach a new reader and return its token.
    ReaderToken attach_reader();

    /// Block until an event is available for the given reader.
    /// Returns std::nullopt once the queue is closed and drained, or when
    /// the reader was superseded. Rethrows the terminal error, if any, after
    /// the remaining events were delivered.
    std::optional<json> pop(ReaderToken reader);

    /// Like pop() but gives up after timeout, returning std::nullopt.
    std::optional<json> pop_for(ReaderToken reader, std::chrono::milliseconds timeout);

    /// Stop accepting events. A non-null error is surfaced to the reader
    /// after the buffered events.
    void close(std::exception_ptr error = nullptr);

    bool is_current(ReaderToken reader) const;
    Phase phase() const;
    size_t size() const;

  private:
    bool ready(ReaderToken reader) const;
    std::optional<json> take(ReaderToken reader);

    std::deque<json> events_;
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    ReaderToken current_reader_ = 0;
    bool closed_ = false;
    std::exception_ptr terminal_error_;
};

} // namespace protocol
} // namespace agentlink

#endif // AGENTLINK_PROTOCOL_EVENT_QUEUE_HPP
