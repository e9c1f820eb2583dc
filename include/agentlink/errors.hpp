#ifndef AGENTLINK_ERRORS_HPP
#define AGENTLINK_ERRORS_HPP

#include <chrono>
#include <cstddef>
#include <stdexcept>
#include <string>

namespace agentlink
{

// Base exception
class LinkError : public std::runtime_error
{
  public:
    explicit LinkError(const std::string& message) : std::runtime_error(message) {}
};

// CLI not found
class CLINotFoundError : public LinkError
{
  public:
    explicit CLINotFoundError(const std::string& message) : LinkError(message) {}
};

// Process or pipe unusable, or connection closed underneath a caller
class ConnectionError : public LinkError
{
  public:
    explicit ConnectionError(const std::string& message) : LinkError(message) {}
};

// Outgoing channel rejected a write
class WriteError : public LinkError
{
  public:
    explicit WriteError(const std::string& message) : LinkError(message) {}
};

// Child process exited with a non-zero status
class ProcessError : public LinkError
{
  public:
    ProcessError(const std::string& message, int exit_code, std::string stderr_output = {})
        : LinkError(message), exit_code_(exit_code), stderr_output_(std::move(stderr_output))
    {
    }

    int exit_code() const
    {
        return exit_code_;
    }

    const std::string& stderr_output() const
    {
        return stderr_output_;
    }

  private:
    int exit_code_;
    std::string stderr_output_;
};

// Structurally complete line that failed to parse
class JSONDecodeError : public LinkError
{
  public:
    JSONDecodeError(const std::string& message, std::string line)
        : LinkError(message), line_(std::move(line))
    {
    }

    const std::string& line() const
    {
        return line_;
    }

  private:
    std::string line_;
};

// Unterminated output grew past the configured limit
class BufferOverflowError : public LinkError
{
  public:
    BufferOverflowError(std::size_t buffer_size, std::size_t max_size)
        : LinkError("JSON message exceeded maximum buffer size of " + std::to_string(max_size) +
                    " bytes (buffered " + std::to_string(buffer_size) + ")"),
          buffer_size_(buffer_size), max_size_(max_size)
    {
    }

    std::size_t buffer_size() const
    {
        return buffer_size_;
    }

    std::size_t max_size() const
    {
        return max_size_;
    }

  private:
    std::size_t buffer_size_;
    std::size_t max_size_;
};

// Error reported by the remote side, or a malformed control message
class ProtocolError : public LinkError
{
  public:
    explicit ProtocolError(const std::string& message) : LinkError(message) {}
};

// No answer within the allowed window
class TimeoutError : public LinkError
{
  public:
    TimeoutError(const std::string& operation, std::chrono::milliseconds timeout)
        : LinkError("Operation '" + operation + "' timed out after " +
                    std::to_string(timeout.count()) + "ms"),
          operation_(operation), timeout_(timeout)
    {
    }

    const std::string& operation() const
    {
        return operation_;
    }

    std::chrono::milliseconds timeout() const
    {
        return timeout_;
    }

  private:
    std::string operation_;
    std::chrono::milliseconds timeout_;
};

// Invalid options or wrong connection state
class ConfigurationError : public LinkError
{
  public:
    explicit ConfigurationError(const std::string& message) : LinkError(message) {}
};

// A handler observed the connection's abort signal
class AbortedError : public LinkError
{
  public:
    explicit AbortedError(const std::string& message) : LinkError(message) {}
};

} // namespace agentlink

#endif // AGENTLINK_ERRORS_HPP
