#ifndef AGENTLINK_SUBPROCESS_PROCESS_HPP
#define AGENTLINK_SUBPROCESS_PROCESS_HPP

#include <map>
#include <memory>
#include <optional>
#include <string>
#include <sys/types.h>
#include <vector>

namespace agentlink
{
namespace subprocess
{

/// One end of a pipe to the child. Owns the descriptor.
class Pipe
{
  public:
    explicit Pipe(int fd) : fd_(fd) {}
    ~Pipe();

    Pipe(const Pipe&) = delete;
    Pipe& operator=(const Pipe&) = delete;

    /// Returns 0 at EOF. @throws ConnectionError
    size_t read(char* buffer, size_t size);

    /// Wait up to timeout_ms for data or EOF to become readable
    bool has_data(int timeout_ms = 0);

    /// @throws WriteError, including when the reader has gone away
    void write_all(const std::string& data);

    void close();
    bool is_open() const
    {
        return fd_ >= 0;
    }

  private:
    int fd_;
};

struct ProcessOptions
{
    std::string working_directory;
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
    bool redirect_stdin = true;
    bool redirect_stdout = true;
    bool redirect_stderr = false;
};

/// A forked child. Exit status follows the shell convention: the exit code,
/// or 128 + signal number when the child was killed.
class Process
{
  public:
    Process() = default;
    ~Process();

    Process(const Process&) = delete;
    Process& operator=(const Process&) = delete;

    /// @throws ConnectionError if pipes or fork fail. A failed exec shows up
    /// as exit status 127.
    void spawn(const std::string& executable, const std::vector<std::string>& args,
               const ProcessOptions& options = {});

    /// Only valid for redirected streams; @throws ConnectionError otherwise
    Pipe& stdin_pipe();
    Pipe& stdout_pipe();
    Pipe& stderr_pipe();

    bool is_running() const;
    std::optional<int> try_wait();
    int wait();
    void terminate(); // SIGTERM
    void kill();      // SIGKILL

    int pid() const
    {
        return static_cast<int>(pid_);
    }

  private:
    int reap(int options);

    pid_t pid_ = 0;
    bool running_ = false;
    int exit_code_ = -1;
    std::unique_ptr<Pipe> stdin_;
    std::unique_ptr<Pipe> stdout_;
    std::unique_ptr<Pipe> stderr_;
};

/// Resolve a name containing '/' directly, otherwise search PATH
std::optional<std::string> find_executable(const std::string& name);

} // namespace subprocess
} // namespace agentlink

#endif // AGENTLINK_SUBPROCESS_PROCESS_HPP
