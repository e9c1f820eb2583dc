#pragma once

#include "../src/internal/subprocess/process.hpp"

#include <agentlink/errors.hpp>
#include <agentlink/transport.hpp>
#include <chrono>
#include <condition_variable>
#include <cstdlib>
#include <deque>
#include <functional>
#include <gtest/gtest.h>
#include <mutex>
#include <string>
#include <vector>

namespace agentlink
{
namespace test
{

inline bool is_ci_environment()
{
    const char* ci_vars[] = {
        "CI",                 // Generic (GitHub Actions, GitLab CI, etc.)
        "GITHUB_ACTIONS",     // GitHub Actions
        "GITLAB_CI",          // GitLab CI
        "JENKINS_URL",        // Jenkins
        "BUILDKITE",          // Buildkite
        "CODEBUILD_BUILD_ID", // AWS CodeBuild
    };

    for (const char* var : ci_vars)
    {
        const char* value = std::getenv(var);
        if (value != nullptr && value[0] != '\0')
            return true;
    }
    return false;
}

inline bool has_env_flag(const char* name)
{
    const char* value = std::getenv(name);
    return value != nullptr && value[0] != '\0' && std::string(value) != "0";
}

inline bool is_cli_available()
{
    if (const char* cli_path = std::getenv("CLAUDE_CLI_PATH"); cli_path != nullptr && cli_path[0] != '\0')
        return true;
    return subprocess::find_executable("claude").has_value();
}

inline bool should_run_live_tests()
{
    if (is_ci_environment())
        return false;
    if (!has_env_flag("AGENTLINK_RUN_LIVE_TESTS"))
        return false;
    return is_cli_available();
}

inline bool has_posix_shell()
{
    return subprocess::find_executable("/bin/sh").has_value();
}

/// In-memory transport driven by the test.
///
/// feed() queues bytes for the reader thread; finish() ends the stream with
/// an exit status. Every write is recorded, and an optional responder can
/// react to writes (for example by answering the initialize request).
class MockTransport : public Transport
{
  public:
    using Responder = std::function<void(MockTransport&, const std::string&)>;

    void connect() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        if (fail_connect_)
            throw ConnectionError("mock connect failure");
        connected_ = true;
    }

    void write(const std::string& data) override
    {
        Responder responder;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            if (!connected_ || input_ended_)
                throw WriteError("mock transport not writable");
            writes_.push_back(data);
            responder = responder_;
        }
        cv_.notify_all();
        if (responder)
            responder(*this, data);
    }

    std::optional<std::string> read_chunk(std::chrono::milliseconds poll_timeout) override
    {
        std::unique_lock<std::mutex> lock(mutex_);
        cv_.wait_for(lock, poll_timeout, [this] { return !chunks_.empty() || eof_; });
        if (!chunks_.empty())
        {
            std::string chunk = std::move(chunks_.front());
            chunks_.pop_front();
            return chunk;
        }
        if (eof_)
            return std::nullopt;
        return std::string();
    }

    void end_input() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        input_ended_ = true;
    }

    void close() override
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            connected_ = false;
            eof_ = true;
            ++close_count_;
        }
        cv_.notify_all();
    }

    bool is_ready() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_;
    }

    bool is_running() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return connected_ && !eof_;
    }

    std::optional<int> exit_code() override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return exit_code_;
    }

    std::string stderr_output() const override
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return stderr_;
    }

    // ---- test controls ----

    void feed(const std::string& chunk)
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            chunks_.push_back(chunk);
        }
        cv_.notify_all();
    }

    void feed_line(const json& message)
    {
        feed(message.dump() + "\n");
    }

    void finish(int exit_code = 0, std::string stderr_text = {})
    {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            eof_ = true;
            exit_code_ = exit_code;
            stderr_ = std::move(stderr_text);
        }
        cv_.notify_all();
    }

    void set_responder(Responder responder)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        responder_ = std::move(responder);
    }

    void set_fail_connect(bool fail)
    {
        std::lock_guard<std::mutex> lock(mutex_);
        fail_connect_ = fail;
    }

    std::vector<std::string> writes() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return writes_;
    }

    /// Writes parsed as JSON, skipping anything that does not parse
    std::vector<json> written_messages() const
    {
        std::vector<json> out;
        for (const auto& w : writes())
        {
            auto parsed = json::parse(w, nullptr, false);
            if (!parsed.is_discarded())
                out.push_back(std::move(parsed));
        }
        return out;
    }

    /// Wait until a write satisfies pred; returns it parsed
    std::optional<json> wait_for_write(const std::function<bool(const json&)>& pred,
                                       std::chrono::milliseconds timeout = std::chrono::seconds(5))
    {
        std::unique_lock<std::mutex> lock(mutex_);
        std::optional<json> found;
        cv_.wait_for(lock, timeout,
                     [&]
                     {
                         for (const auto& w : writes_)
                         {
                             auto parsed = json::parse(w, nullptr, false);
                             if (!parsed.is_discarded() && pred(parsed))
                             {
                                 found = std::move(parsed);
                                 return true;
                             }
                         }
                         return false;
                     });
        return found;
    }

    int close_count() const
    {
        std::lock_guard<std::mutex> lock(mutex_);
        return close_count_;
    }

  private:
    mutable std::mutex mutex_;
    std::condition_variable cv_;
    std::deque<std::string> chunks_;
    std::vector<std::string> writes_;
    Responder responder_;
    std::optional<int> exit_code_;
    std::string stderr_;
    bool connected_ = false;
    bool input_ended_ = false;
    bool eof_ = false;
    bool fail_connect_ = false;
    int close_count_ = 0;
};

/// Matches the control_response written for a given inbound request id
inline std::function<bool(const json&)> response_for(const std::string& request_id)
{
    return [request_id](const json& msg)
    {
        return msg.value("type", "") == "control_response" && msg.contains("response") &&
               msg["response"].value("request_id", "") == request_id;
    };
}

/// Matches an outgoing control_request of the given subtype
inline std::function<bool(const json&)> request_of(const std::string& subtype)
{
    return [subtype](const json& msg)
    {
        return msg.value("type", "") == "control_request" && msg.contains("request") &&
               msg["request"].value("subtype", "") == subtype;
    };
}

/// Build the success envelope the CLI sends back for one of our requests
inline json success_response(const std::string& request_id, const json& payload = json::object())
{
    return {{"type", "control_response"},
            {"response", {{"subtype", "success"}, {"request_id", request_id}, {"response", payload}}}};
}

/// Responder that answers initialize requests with the given payload
inline MockTransport::Responder answer_initialize(json payload = {{"commands", json::array()}})
{
    return [payload](MockTransport& transport, const std::string& data)
    {
        auto msg = json::parse(data, nullptr, false);
        if (msg.is_discarded() || msg.value("type", "") != "control_request")
            return;
        if (msg["request"].value("subtype", "") == "initialize")
            transport.feed_line(success_response(msg["request_id"].get<std::string>(), payload));
    };
}

} // namespace test
} // namespace agentlink

#define SKIP_IN_CI()                                                                               \
    do                                                                                             \
    {                                                                                              \
        if (!agentlink::test::should_run_live_tests())                                             \
        {                                                                                          \
            GTEST_SKIP() << "Skipped live CLI test (set AGENTLINK_RUN_LIVE_TESTS=1 and ensure "    \
                            "`claude` is in PATH or set CLAUDE_CLI_PATH)";                         \
        }                                                                                          \
    } while (0)
