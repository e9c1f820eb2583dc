#ifndef AGENTLINK_PROTOCOL_FRAMER_HPP
#define AGENTLINK_PROTOCOL_FRAMER_HPP

#include <agentlink/types.hpp>
#include <atomic>
#include <cstddef>
#include <deque>
#include <exception>
#include <optional>
#include <string>
#include <vector>

namespace agentlink
{

class Transport;

namespace protocol
{

struct FramerOptions
{
    std::size_t max_buffer_size = kDefaultMaxBufferSize;
    bool strict = false;
    std::optional<DiagnosticCallback> diagnostics;
};

/// Splits a chunked byte stream into newline-delimited JSON objects.
///
/// Output is independent of how the input was chunked. A line that fails to
/// parse but is wrapped in braces raises JSONDecodeError; any other
/// unparseable line is dropped unless FramerOptions::strict is set.
class LineFramer
{
  public:
    explicit LineFramer(FramerOptions options = {});

    /// Append a chunk and return every object completed by it.
    /// @throws BufferOverflowError, JSONDecodeError
    std::vector<json> push(const std::string& chunk);

    /// Same, appending to @p out as each line parses. Objects from lines
    /// ahead of a failing one are already in @p out when the error is thrown.
    void push(const std::string& chunk, std::vector<json>& out);

    /// Treat any unterminated remainder as a final line (end of stream).
    std::vector<json> finish();

    std::size_t buffered_size() const
    {
        return buffer_.size();
    }

  private:
    void parse_line(std::string line, std::vector<json>& out);

    FramerOptions options_;
    std::string buffer_;
};

/// Lazily pulls chunks from a Transport through a LineFramer.
/// Not restartable: after the sequence ends or fails, next() keeps
/// returning std::nullopt.
class FramedReader
{
  public:
    FramedReader(Transport& transport, FramerOptions options = {});

    /// Next framed object, std::nullopt at a clean end of stream or when
    /// keep_running was cleared.
    /// @throws ProcessError when the peer exited with a non-zero status
    /// @throws BufferOverflowError, JSONDecodeError on framing failures
    std::optional<json> next(const std::atomic<bool>& keep_running);

    bool finished() const
    {
        return finished_;
    }

  private:
    void finish_stream();

    Transport& transport_;
    LineFramer framer_;
    std::deque<json> ready_;
    bool finished_ = false;
    std::exception_ptr terminal_error_;
};

} // namespace protocol
} // namespace agentlink

#endif // AGENTLINK_PROTOCOL_FRAMER_HPP
