#include <agentlink/protocol/event_queue.hpp>

namespace agentlink
{
namespace protocol
{

void EventQueue::push(json event)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return;
        events_.push_back(std::move(event));
    }
    cv_.notify_all();
}

EventQueue::ReaderToken EventQueue::attach_reader()
{
    ReaderToken token;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        token = ++current_reader_;
    }
    // Wake the superseded reader so it can observe the new token
    cv_.notify_all();
    return token;
}

bool EventQueue::ready(ReaderToken reader) const
{
    return reader != current_reader_ || !events_.empty() || closed_;
}

std::optional<json> EventQueue::take(ReaderToken reader)
{
    if (reader != current_reader_)
        return std::nullopt;

    if (!events_.empty())
    {
        json event = std::move(events_.front());
        events_.pop_front();
        return event;
    }

    // Closed and drained
    if (terminal_error_)
    {
        auto error = terminal_error_;
        terminal_error_ = nullptr;
        std::rethrow_exception(error);
    }
    return std::nullopt;
}

std::optional<json> EventQueue::pop(ReaderToken reader)
{
    std::unique_lock<std::mutex> lock(mutex_);
    cv_.wait(lock, [&] { return ready(reader); });
    return take(reader);
}

std::optional<json> EventQueue::pop_for(ReaderToken reader, std::chrono::milliseconds timeout)
{
    std::unique_lock<std::mutex> lock(mutex_);
    if (!cv_.wait_for(lock, timeout, [&] { return ready(reader); }))
        return std::nullopt;
    return take(reader);
}

void EventQueue::close(std::exception_ptr error)
{
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_)
            return;
        closed_ = true;
        terminal_error_ = error;
    }
    cv_.notify_all();
}

bool EventQueue::is_current(ReaderToken reader) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return reader == current_reader_;
}

EventQueue::Phase EventQueue::phase() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (closed_ && events_.empty())
        return Phase::Closed;
    return current_reader_ == 0 ? Phase::Buffering : Phase::Draining;
}

size_t EventQueue::size() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return events_.size();
}

} // namespace protocol
} // namespace agentlink
