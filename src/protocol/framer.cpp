#include "../internal/diagnostics.hpp"

#include <agentlink/errors.hpp>
#include <agentlink/protocol/framer.hpp>
#include <agentlink/transport.hpp>

namespace agentlink
{
namespace protocol
{

namespace
{

std::string trim(const std::string& s)
{
    const char* ws = " \t\r";
    size_t start = s.find_first_not_of(ws);
    if (start == std::string::npos)
        return {};
    size_t end = s.find_last_not_of(ws);
    return s.substr(start, end - start + 1);
}

bool looks_complete(const std::string& line)
{
    return line.size() >= 2 && line.front() == '{' && line.back() == '}';
}

} // namespace

// ============================================================================
// LineFramer
// ============================================================================

LineFramer::LineFramer(FramerOptions options) : options_(std::move(options)) {}

std::vector<json> LineFramer::push(const std::string& chunk)
{
    std::vector<json> messages;
    push(chunk, messages);
    return messages;
}

void LineFramer::push(const std::string& chunk, std::vector<json>& out)
{
    buffer_ += chunk;

    size_t start = 0;
    size_t pos;
    while ((pos = buffer_.find('\n', start)) != std::string::npos)
    {
        size_t length = pos - start;
        if (length > options_.max_buffer_size)
        {
            buffer_.clear();
            throw BufferOverflowError(length, options_.max_buffer_size);
        }
        std::string line = buffer_.substr(start, length);
        start = pos + 1;
        try
        {
            parse_line(std::move(line), out);
        }
        catch (const JSONDecodeError&)
        {
            buffer_.clear();
            throw;
        }
    }
    buffer_.erase(0, start);

    // Whatever is left has no newline yet
    if (buffer_.size() > options_.max_buffer_size)
    {
        size_t size = buffer_.size();
        buffer_.clear();
        throw BufferOverflowError(size, options_.max_buffer_size);
    }
}

std::vector<json> LineFramer::finish()
{
    std::vector<json> messages;
    if (!buffer_.empty())
    {
        std::string rest;
        rest.swap(buffer_);
        parse_line(std::move(rest), messages);
    }
    return messages;
}

void LineFramer::parse_line(std::string line, std::vector<json>& out)
{
    line = trim(line);
    if (line.empty())
        return;

    json parsed;
    try
    {
        parsed = json::parse(line);
    }
    catch (const json::parse_error& e)
    {
        if (options_.strict || looks_complete(line))
            throw JSONDecodeError(std::string("Failed to decode JSON line: ") + e.what(), line);

        internal::warn(options_.diagnostics,
                       "dropping partial line: " + internal::preview(line));
        return;
    }

    if (!parsed.is_object())
    {
        if (options_.strict)
            throw JSONDecodeError("Expected a JSON object", line);
        internal::warn(options_.diagnostics,
                       "dropping non-object line: " + internal::preview(line));
        return;
    }

    out.push_back(std::move(parsed));
}

// ============================================================================
// FramedReader
// ============================================================================

FramedReader::FramedReader(Transport& transport, FramerOptions options)
    : transport_(transport), framer_(std::move(options))
{
}

std::optional<json> FramedReader::next(const std::atomic<bool>& keep_running)
{
    while (ready_.empty())
    {
        if (finished_)
        {
            // Remaining objects were delivered first; now surface the exit status
            if (terminal_error_)
            {
                auto error = terminal_error_;
                terminal_error_ = nullptr;
                std::rethrow_exception(error);
            }
            return std::nullopt;
        }
        if (!keep_running.load())
            return std::nullopt;

        std::optional<std::string> chunk;
        try
        {
            chunk = transport_.read_chunk();
        }
        catch (...)
        {
            finished_ = true;
            throw;
        }

        if (!chunk)
        {
            finish_stream();
            continue;
        }

        if (chunk->empty())
            continue;

        // Objects completed ahead of a framing failure still go out first
        std::vector<json> parsed;
        try
        {
            framer_.push(*chunk, parsed);
        }
        catch (const LinkError&)
        {
            finished_ = true;
            terminal_error_ = std::current_exception();
        }
        for (auto& message : parsed)
            ready_.push_back(std::move(message));
    }

    json message = std::move(ready_.front());
    ready_.pop_front();
    return message;
}

void FramedReader::finish_stream()
{
    finished_ = true;

    for (auto& message : framer_.finish())
        ready_.push_back(std::move(message));

    auto code = transport_.exit_code();
    if (code && *code != 0)
    {
        terminal_error_ = std::make_exception_ptr(
            ProcessError("Command failed with exit code " + std::to_string(*code), *code,
                         transport_.stderr_output()));
    }
}

} // namespace protocol
} // namespace agentlink
