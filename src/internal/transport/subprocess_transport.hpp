#ifndef AGENTLINK_INTERNAL_TRANSPORT_SUBPROCESS_TRANSPORT_HPP
#define AGENTLINK_INTERNAL_TRANSPORT_SUBPROCESS_TRANSPORT_HPP

#include "../subprocess/process.hpp"

#include <agentlink/transport.hpp>
#include <atomic>
#include <deque>
#include <memory>
#include <mutex>
#include <thread>

namespace agentlink
{
namespace internal
{

// Byte-level transport over a child process's stdin/stdout.
// stderr is drained on a separate thread so the child never blocks on it.
class SubprocessTransport : public Transport
{
  public:
    explicit SubprocessTransport(SubprocessCommand command);
    ~SubprocessTransport() override;

    SubprocessTransport(const SubprocessTransport&) = delete;
    SubprocessTransport& operator=(const SubprocessTransport&) = delete;

    void connect() override;
    void write(const std::string& data) override;
    std::optional<std::string> read_chunk(std::chrono::milliseconds poll_timeout) override;
    void end_input() override;
    void close() override;
    bool is_ready() const override;
    bool is_running() const override;
    std::optional<int> exit_code() override;
    std::string stderr_output() const override;
    long get_pid() const override;

    static constexpr std::size_t kStderrTailLines = 50;

  private:
    void stderr_reader_loop();
    void record_stderr_line(std::string line);

    SubprocessCommand command_;
    std::unique_ptr<subprocess::Process> process_;

    std::atomic<bool> ready_{false};
    std::atomic<bool> closed_{false};
    std::atomic<bool> eof_{false};
    std::optional<int> exit_code_;
    std::mutex wait_mutex_;

    std::mutex write_mutex_;

    std::thread stderr_thread_;
    std::atomic<bool> stderr_running_{false};
    mutable std::mutex stderr_mutex_;
    std::deque<std::string> stderr_tail_;
};

} // namespace internal
} // namespace agentlink

#endif // AGENTLINK_INTERNAL_TRANSPORT_SUBPROCESS_TRANSPORT_HPP
