#include "subprocess_transport.hpp"

#include "subprocess_env.hpp"

#include <agentlink/errors.hpp>
#include <cstdlib>
#include <filesystem>

namespace agentlink
{
namespace internal
{

SubprocessTransport::SubprocessTransport(SubprocessCommand command)
    : command_(std::move(command)), process_(std::make_unique<subprocess::Process>())
{
}

SubprocessTransport::~SubprocessTransport()
{
    try
    {
        close();
    }
    catch (const std::exception&)
    {
        // Destructor must not throw; the child has been signalled either way
    }
}

void SubprocessTransport::connect()
{
    if (ready_)
        return;
    if (closed_)
        throw ConnectionError("Transport has been closed");

    if (command_.working_directory && !command_.working_directory->empty() &&
        !std::filesystem::is_directory(*command_.working_directory))
        throw ConnectionError("Working directory does not exist: " + *command_.working_directory);

    subprocess::ProcessOptions proc_opts;
    proc_opts.redirect_stdin = true;
    proc_opts.redirect_stdout = true;
    proc_opts.redirect_stderr = true;
    proc_opts.inherit_environment = command_.inherit_environment;
    proc_opts.environment = command_.environment;
    if (command_.working_directory)
        proc_opts.working_directory = *command_.working_directory;

    try
    {
        process_->spawn(command_.executable, command_.args, proc_opts);
    }
    catch (const std::exception& e)
    {
        throw ConnectionError("Failed to start " + command_.executable + ": " + e.what());
    }

    stderr_running_ = true;
    stderr_thread_ = std::thread([this] { stderr_reader_loop(); });
    ready_ = true;
}

void SubprocessTransport::write(const std::string& data)
{
    std::lock_guard<std::mutex> lock(write_mutex_);

    if (!ready_ || closed_)
        throw WriteError("Transport is not ready for writing");

    auto& pipe = process_->stdin_pipe();
    if (!pipe.is_open())
        throw WriteError("Input stream has been closed");

    pipe.write_all(data);
}

std::optional<std::string> SubprocessTransport::read_chunk(std::chrono::milliseconds poll_timeout)
{
    if (eof_ || !ready_)
        return std::nullopt;

    auto& pipe = process_->stdout_pipe();
    if (!pipe.is_open())
    {
        eof_ = true;
        return std::nullopt;
    }

    if (!pipe.has_data(static_cast<int>(poll_timeout.count())))
        return std::string();

    char buffer[4096];
    std::size_t n = pipe.read(buffer, sizeof(buffer));
    if (n == 0)
    {
        eof_ = true;
        return std::nullopt;
    }
    return std::string(buffer, n);
}

void SubprocessTransport::end_input()
{
    std::lock_guard<std::mutex> lock(write_mutex_);
    if (process_)
        process_->stdin_pipe().close();
}

void SubprocessTransport::close()
{
    if (closed_.exchange(true))
        return;

    bool was_ready = ready_.exchange(false);
    end_input();

    if (was_ready)
    {
        std::lock_guard<std::mutex> lock(wait_mutex_);
        if (!exit_code_)
        {
            // Give the child a moment to exit on its own after stdin closes
            auto deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(500);
            while (!(exit_code_ = process_->try_wait()) &&
                   std::chrono::steady_clock::now() < deadline)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
        }
        if (!exit_code_)
        {
            process_->terminate();
            auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
            while (!(exit_code_ = process_->try_wait()) &&
                   std::chrono::steady_clock::now() < deadline)
            {
                std::this_thread::sleep_for(std::chrono::milliseconds(10));
            }
            if (!exit_code_)
            {
                process_->kill();
                exit_code_ = process_->wait();
            }
        }
    }

    stderr_running_ = false;
    if (stderr_thread_.joinable())
        stderr_thread_.join();

    process_->stdout_pipe().close();
    process_->stderr_pipe().close();
}

bool SubprocessTransport::is_ready() const
{
    return ready_ && !closed_;
}

bool SubprocessTransport::is_running() const
{
    return process_ && process_->is_running();
}

std::optional<int> SubprocessTransport::exit_code()
{
    std::lock_guard<std::mutex> lock(wait_mutex_);
    if (exit_code_)
        return exit_code_;

    exit_code_ = process_->try_wait();
    if (!exit_code_ && eof_)
    {
        // stdout closed; the child is normally a few milliseconds from exiting
        auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(2);
        while (!(exit_code_ = process_->try_wait()) &&
               std::chrono::steady_clock::now() < deadline)
        {
            std::this_thread::sleep_for(std::chrono::milliseconds(10));
        }
    }
    return exit_code_;
}

std::string SubprocessTransport::stderr_output() const
{
    std::lock_guard<std::mutex> lock(stderr_mutex_);
    std::string out;
    for (const auto& line : stderr_tail_)
    {
        if (!out.empty())
            out += '\n';
        out += line;
    }
    return out;
}

long SubprocessTransport::get_pid() const
{
    return process_ ? process_->pid() : 0;
}

void SubprocessTransport::record_stderr_line(std::string line)
{
    while (!line.empty() && (line.back() == '\r' || line.back() == '\n'))
        line.pop_back();
    if (line.empty())
        return;

    if (command_.stderr_callback && *command_.stderr_callback)
        (*command_.stderr_callback)(line);

    std::lock_guard<std::mutex> lock(stderr_mutex_);
    stderr_tail_.push_back(std::move(line));
    if (stderr_tail_.size() > kStderrTailLines)
        stderr_tail_.pop_front();
}

void SubprocessTransport::stderr_reader_loop()
{
    auto& pipe = process_->stderr_pipe();
    std::string pending;
    char buffer[1024];

    try
    {
        while (stderr_running_ && pipe.is_open())
        {
            if (!pipe.has_data(100))
                continue;

            std::size_t n = pipe.read(buffer, sizeof(buffer));
            if (n == 0)
                break;

            pending.append(buffer, n);
            std::size_t pos;
            while ((pos = pending.find('\n')) != std::string::npos)
            {
                record_stderr_line(pending.substr(0, pos));
                pending.erase(0, pos + 1);
            }
        }
        record_stderr_line(std::move(pending));
    }
    catch (const std::exception& e)
    {
        std::lock_guard<std::mutex> lock(stderr_mutex_);
        stderr_tail_.push_back(std::string("[stderr reader stopped: ") + e.what() + "]");
    }
}

} // namespace internal

std::string find_cli(const LinkOptions& options)
{
    namespace fs = std::filesystem;

    auto validate = [](const std::string& path) -> std::string
    {
        if (!fs::exists(path))
            throw CLINotFoundError("CLI path does not exist: " + path);
        return path;
    };

    if (!options.cli_path.empty())
        return validate(options.cli_path);

    if (const char* env_cli = std::getenv("CLAUDE_CLI_PATH"))
        return validate(std::string(env_cli));

    if (auto result = subprocess::find_executable("claude"))
        return *result;

    if (const char* home = std::getenv("HOME"))
    {
        fs::path local_cli = fs::path(home) / ".claude" / "local" / "claude";
        if (fs::exists(local_cli))
            return local_cli.string();
    }

    throw CLINotFoundError("Could not find 'claude' executable in PATH. "
                           "Set cli_path or CLAUDE_CLI_PATH.");
}

std::vector<std::string> build_cli_arguments(const LinkOptions& options)
{
    std::vector<std::string> args;

    // Both directions speak newline-delimited JSON
    args.push_back("--output-format");
    args.push_back("stream-json");
    args.push_back("--input-format");
    args.push_back("stream-json");

    // Required when using stream-json output format
    args.push_back("--verbose");

    // Route permission prompts back over the control channel
    if (options.can_use_tool)
    {
        args.push_back("--permission-prompt-tool");
        args.push_back("stdio");
    }

    if (!options.model.empty())
    {
        args.push_back("--model");
        args.push_back(options.model);
    }

    if (!options.permission_mode.empty())
    {
        args.push_back("--permission-mode");
        args.push_back(options.permission_mode);
    }

    // Extra flags: empty value means a bare flag
    for (const auto& [flag, value] : options.extra_args)
    {
        args.push_back(flag.rfind("--", 0) == 0 ? flag : "--" + flag);
        if (!value.empty())
            args.push_back(value);
    }
    return args;
}

std::unique_ptr<Transport> create_subprocess_transport(SubprocessCommand command)
{
    return std::make_unique<internal::SubprocessTransport>(std::move(command));
}

std::unique_ptr<Transport> create_cli_transport(const LinkOptions& options)
{
    SubprocessCommand command;
    command.executable = find_cli(options);
    command.args = build_cli_arguments(options);
    command.working_directory = options.working_directory;
    command.environment = options.environment;
    command.inherit_environment = options.inherit_environment;
    command.stderr_callback = options.stderr_callback;
    internal::apply_link_environment(command, "sdk-cpp");
    return create_subprocess_transport(std::move(command));
}

} // namespace agentlink
