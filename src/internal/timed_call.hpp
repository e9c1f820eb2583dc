#ifndef AGENTLINK_INTERNAL_TIMED_CALL_HPP
#define AGENTLINK_INTERNAL_TIMED_CALL_HPP

#include <agentlink/errors.hpp>
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <string>
#include <thread>

namespace agentlink
{
namespace internal
{

// Run fn on its own thread and wait at most timeout for the result.
// On timeout the call keeps running detached; its result is discarded.
// fn must own (copy) everything it touches. A non-positive timeout runs fn inline.
template <typename Result>
Result call_with_timeout(std::function<Result()> fn, std::chrono::milliseconds timeout,
                         const std::string& operation)
{
    if (timeout.count() <= 0)
        return fn();

    auto promise = std::make_shared<std::promise<Result>>();
    auto future = promise->get_future();

    std::thread(
        [promise, fn = std::move(fn)]()
        {
            try
            {
                promise->set_value(fn());
            }
            catch (...)
            {
                promise->set_exception(std::current_exception());
            }
        })
        .detach();

    if (future.wait_for(timeout) == std::future_status::timeout)
        throw TimeoutError(operation, timeout);

    return future.get();
}

} // namespace internal
} // namespace agentlink

#endif // AGENTLINK_INTERNAL_TIMED_CALL_HPP
