// POSIX process management for the subprocess transport

#include "process.hpp"

#include <agentlink/errors.hpp>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <poll.h>
#include <pthread.h>
#include <sys/wait.h>
#include <time.h>
#include <unistd.h>

extern char** environ;

namespace agentlink
{
namespace subprocess
{

namespace
{

std::string errno_message(int err)
{
    return std::strerror(err);
}

struct PipePair
{
    int fds[2] = {-1, -1};

    ~PipePair()
    {
        for (int fd : fds)
            if (fd >= 0)
                ::close(fd);
    }

    void open(const char* what)
    {
        if (::pipe2(fds, O_CLOEXEC) != 0)
            throw ConnectionError(std::string("Failed to create ") + what +
                                  " pipe: " + errno_message(errno));
    }

    // Hand ownership of one end to the caller
    int release(int index)
    {
        int fd = fds[index];
        fds[index] = -1;
        return fd;
    }
};

int decode_status(int status)
{
    if (WIFEXITED(status))
        return WEXITSTATUS(status);
    if (WIFSIGNALED(status))
        return 128 + WTERMSIG(status);
    return -1;
}

// Writes to a pipe whose reader is gone raise SIGPIPE. Block it on this
// thread for the duration of the write and discard it if it became pending.
class SigpipeGuard
{
  public:
    SigpipeGuard()
    {
        sigemptyset(&sigpipe_);
        sigaddset(&sigpipe_, SIGPIPE);

        sigset_t pending;
        sigpending(&pending);
        was_pending_ = sigismember(&pending, SIGPIPE) == 1;

        blocked_ = pthread_sigmask(SIG_BLOCK, &sigpipe_, &old_) == 0;
    }

    ~SigpipeGuard()
    {
        if (!blocked_)
            return;

        if (raised_ && !was_pending_)
        {
            struct timespec zero = {0, 0};
            while (sigtimedwait(&sigpipe_, nullptr, &zero) == -1 && errno == EINTR)
            {
            }
        }
        pthread_sigmask(SIG_SETMASK, &old_, nullptr);
    }

    void mark_raised()
    {
        raised_ = true;
    }

  private:
    sigset_t sigpipe_;
    sigset_t old_;
    bool blocked_ = false;
    bool was_pending_ = false;
    bool raised_ = false;
};

} // namespace

// ============================================================================
// Pipe
// ============================================================================

Pipe::~Pipe()
{
    close();
}

size_t Pipe::read(char* buffer, size_t size)
{
    if (!is_open())
        throw ConnectionError("Pipe is not open");

    for (;;)
    {
        ssize_t bytes_read = ::read(fd_, buffer, size);
        if (bytes_read >= 0)
            return static_cast<size_t>(bytes_read);
        if (errno == EINTR)
            continue;
        if (errno == EAGAIN || errno == EWOULDBLOCK)
            return 0;
        throw ConnectionError("Read failed: " + errno_message(errno));
    }
}

bool Pipe::has_data(int timeout_ms)
{
    if (!is_open())
        return false;

    struct pollfd pfd;
    pfd.fd = fd_;
    pfd.events = POLLIN;
    pfd.revents = 0;

    int result = ::poll(&pfd, 1, timeout_ms);
    if (result < 0)
    {
        if (errno == EINTR)
            return false;
        throw ConnectionError("poll failed: " + errno_message(errno));
    }

    // POLLHUP means EOF is readable
    return result > 0 && (pfd.revents & (POLLIN | POLLHUP | POLLERR)) != 0;
}

void Pipe::write_all(const std::string& data)
{
    if (!is_open())
        throw WriteError("Pipe is not open");

    SigpipeGuard guard;
    size_t offset = 0;
    while (offset < data.size())
    {
        ssize_t written = ::write(fd_, data.data() + offset, data.size() - offset);
        if (written < 0)
        {
            if (errno == EINTR)
                continue;
            if (errno == EPIPE)
            {
                guard.mark_raised();
                throw WriteError("Broken pipe (process closed stdin)");
            }
            throw WriteError("Write failed: " + errno_message(errno));
        }
        offset += static_cast<size_t>(written);
    }
}

void Pipe::close()
{
    if (fd_ >= 0)
    {
        ::close(fd_);
        fd_ = -1;
    }
}

// ============================================================================
// Process
// ============================================================================

Process::~Process()
{
    if (!running_)
        return;
    terminate();
    try
    {
        reap(0);
    }
    catch (const ConnectionError&)
    {
        // Child already reaped elsewhere; nothing left to release
    }
}

void Process::spawn(const std::string& executable, const std::vector<std::string>& args,
                    const ProcessOptions& options)
{
    PipePair in, out, err;
    if (options.redirect_stdin)
        in.open("stdin");
    if (options.redirect_stdout)
        out.open("stdout");
    if (options.redirect_stderr)
        err.open("stderr");

    // Everything the child needs is prepared before fork
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args)
        argv.push_back(const_cast<char*>(arg.c_str()));
    argv.push_back(nullptr);

    std::map<std::string, std::string> env_map;
    if (options.inherit_environment && environ)
    {
        for (char** entry = environ; *entry; ++entry)
        {
            std::string kv(*entry);
            size_t eq = kv.find('=');
            if (eq != std::string::npos)
                env_map[kv.substr(0, eq)] = kv.substr(eq + 1);
        }
    }
    for (const auto& [key, value] : options.environment)
        env_map[key] = value;

    std::vector<std::string> env_strings;
    env_strings.reserve(env_map.size());
    for (const auto& [key, value] : env_map)
        env_strings.push_back(key + "=" + value);
    std::vector<char*> envp;
    for (auto& entry : env_strings)
        envp.push_back(entry.data());
    envp.push_back(nullptr);

    pid_t pid = fork();
    if (pid < 0)
        throw ConnectionError("Failed to fork process: " + errno_message(errno));

    if (pid == 0)
    {
        // Child: only async-signal-safe calls from here on
        if (options.redirect_stdin && dup2(in.fds[0], STDIN_FILENO) < 0)
            _exit(127);
        if (options.redirect_stdout && dup2(out.fds[1], STDOUT_FILENO) < 0)
            _exit(127);
        if (options.redirect_stderr && dup2(err.fds[1], STDERR_FILENO) < 0)
            _exit(127);

        if (!options.working_directory.empty() && chdir(options.working_directory.c_str()) != 0)
            _exit(127);

        execvpe(executable.c_str(), argv.data(), envp.data());
        _exit(127);
    }

    // Parent keeps the opposite ends; PipePair closes the rest
    if (options.redirect_stdin)
        stdin_ = std::make_unique<Pipe>(in.release(1));
    if (options.redirect_stdout)
        stdout_ = std::make_unique<Pipe>(out.release(0));
    if (options.redirect_stderr)
        stderr_ = std::make_unique<Pipe>(err.release(0));

    pid_ = pid;
    running_ = true;
    exit_code_ = -1;
}

Pipe& Process::stdin_pipe()
{
    if (!stdin_)
        throw ConnectionError("stdin not redirected");
    return *stdin_;
}

Pipe& Process::stdout_pipe()
{
    if (!stdout_)
        throw ConnectionError("stdout not redirected");
    return *stdout_;
}

Pipe& Process::stderr_pipe()
{
    if (!stderr_)
        throw ConnectionError("stderr not redirected");
    return *stderr_;
}

bool Process::is_running() const
{
    if (pid_ == 0 || !running_)
        return false;

    // Signal 0 probes for existence; a zombie still counts until reaped
    if (::kill(pid_, 0) == 0)
        return true;
    return errno != ESRCH;
}

// waitpid with EINTR retry; returns -1 while a WNOHANG child is still running
int Process::reap(int options)
{
    int status = 0;
    pid_t result;
    do
    {
        result = waitpid(pid_, &status, options);
    } while (result < 0 && errno == EINTR);

    if (result == 0)
        return -1;
    if (result < 0)
        throw ConnectionError("waitpid failed: " + errno_message(errno));

    exit_code_ = decode_status(status);
    running_ = false;
    return exit_code_;
}

std::optional<int> Process::try_wait()
{
    if (pid_ == 0)
        return std::nullopt;
    if (!running_)
        return exit_code_;
    if (reap(WNOHANG) < 0 && running_)
        return std::nullopt;
    return exit_code_;
}

int Process::wait()
{
    if (pid_ == 0)
        return -1;
    if (!running_)
        return exit_code_;
    return reap(0);
}

void Process::terminate()
{
    if (pid_ > 0 && running_)
        ::kill(pid_, SIGTERM);
}

void Process::kill()
{
    if (pid_ > 0 && running_)
        ::kill(pid_, SIGKILL);
}

// ============================================================================
// PATH lookup
// ============================================================================

namespace
{

bool is_executable_file(const std::filesystem::path& path)
{
    std::error_code ec;
    return std::filesystem::is_regular_file(path, ec) && access(path.c_str(), X_OK) == 0;
}

} // namespace

std::optional<std::string> find_executable(const std::string& name)
{
    namespace fs = std::filesystem;

    if (name.empty())
        return std::nullopt;

    // Absolute or relative path: no PATH search
    if (name.find('/') != std::string::npos)
    {
        if (!is_executable_file(name))
            return std::nullopt;
        std::error_code ec;
        fs::path absolute = fs::absolute(name, ec);
        return ec ? name : absolute.string();
    }

    const char* path_env = std::getenv("PATH");
    if (!path_env)
        return std::nullopt;

    std::string path_str(path_env);
    size_t start = 0;
    while (start <= path_str.size())
    {
        size_t end = path_str.find(':', start);
        if (end == std::string::npos)
            end = path_str.size();

        std::string dir = path_str.substr(start, end - start);
        if (!dir.empty())
        {
            fs::path candidate = fs::path(dir) / name;
            if (is_executable_file(candidate))
                return candidate.string();
        }
        start = end + 1;
    }

    return std::nullopt;
}

} // namespace subprocess
} // namespace agentlink
