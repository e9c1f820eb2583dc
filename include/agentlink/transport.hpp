#ifndef AGENTLINK_TRANSPORT_HPP
#define AGENTLINK_TRANSPORT_HPP

#include <agentlink/types.hpp>
#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace agentlink
{

/**
 * Abstract byte-stream transport.
 *
 * A transport moves raw bytes to and from the remote CLI. It knows nothing
 * about JSON; framing and routing are layered on top by FramedReader and
 * MessageRouter.
 *
 * Implementations include:
 * - SubprocessTransport: local child process using stdin/stdout
 * - MockTransport (tests): in-memory scripted peer
 */
class Transport
{
  public:
    virtual ~Transport() = default;

    /**
     * Connect the transport and prepare for communication.
     * For subprocess transports, this starts the process.
     */
    virtual void connect() = 0;

    /**
     * Write raw data (typically one JSON line). Must be safe to call from
     * several threads; implementations serialize writes.
     * @throws WriteError if the channel rejected the data
     */
    virtual void write(const std::string& data) = 0;

    /**
     * Read the next chunk of output.
     * Blocks for at most poll_timeout. Returns an empty string when no data
     * arrived in time and std::nullopt once the stream reached end-of-file.
     */
    virtual std::optional<std::string>
    read_chunk(std::chrono::milliseconds poll_timeout = std::chrono::milliseconds(100)) = 0;

    /**
     * End the input stream (close stdin for process transports).
     */
    virtual void end_input() = 0;

    /**
     * Close the transport connection and release resources. Idempotent.
     */
    virtual void close() = 0;

    /**
     * Check if transport is ready for communication.
     */
    virtual bool is_ready() const = 0;

    /**
     * Check if the peer is still running/connected.
     */
    virtual bool is_running() const = 0;

    /**
     * Exit status of the peer once it has terminated, std::nullopt while it
     * runs or when the transport has no notion of one.
     */
    virtual std::optional<int> exit_code() = 0;

    /**
     * Tail of the peer's diagnostic output, attached to ProcessError.
     */
    virtual std::string stderr_output() const
    {
        return {};
    }

    /**
     * Process ID for subprocess transports, 0 otherwise.
     */
    virtual long get_pid() const
    {
        return 0;
    }
};

/// Fully resolved command line for a subprocess transport
struct SubprocessCommand
{
    std::string executable;
    std::vector<std::string> args;
    std::optional<std::string> working_directory;
    std::map<std::string, std::string> environment;
    bool inherit_environment = true;
    std::optional<StderrCallback> stderr_callback;
};

/// Locate the CLI executable: options.cli_path, then CLAUDE_CLI_PATH, then PATH.
/// @throws CLINotFoundError
std::string find_cli(const LinkOptions& options);

/// Arguments for a streaming-mode CLI session
std::vector<std::string> build_cli_arguments(const LinkOptions& options);

// Factory functions for creating transports
std::unique_ptr<Transport> create_subprocess_transport(SubprocessCommand command);
std::unique_ptr<Transport> create_cli_transport(const LinkOptions& options);

} // namespace agentlink

#endif // AGENTLINK_TRANSPORT_HPP
