#include "../../src/internal/subprocess/process.hpp"

#include <agentlink/errors.hpp>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace agentlink;
using namespace agentlink::subprocess;

namespace
{

// Read until EOF
std::string read_all(Pipe& pipe)
{
    std::string out;
    char buffer[256];
    while (true)
    {
        std::size_t n = pipe.read(buffer, sizeof(buffer));
        if (n == 0)
            break;
        out.append(buffer, n);
    }
    return out;
}

} // namespace

// Test basic process spawn
TEST(ProcessTest, SpawnEcho)
{
    Process proc;
    proc.spawn("/bin/echo", {"Hello"});

    EXPECT_TRUE(proc.is_running() || proc.try_wait().has_value());
    EXPECT_EQ(proc.wait(), 0);
}

// Test stdout capture
TEST(ProcessTest, CaptureStdout)
{
    Process proc;
    proc.spawn("/bin/echo", {"TestOutput"});

    EXPECT_EQ(read_all(proc.stdout_pipe()), "TestOutput\n");
    proc.wait();
}

// Test stdin write
TEST(ProcessTest, WriteStdin)
{
    Process proc;
    proc.spawn("/bin/cat", {});

    proc.stdin_pipe().write_all("{\"type\":\"user\"}\n");
    proc.stdin_pipe().close(); // EOF

    EXPECT_EQ(read_all(proc.stdout_pipe()), "{\"type\":\"user\"}\n");
    EXPECT_EQ(proc.wait(), 0);
}

TEST(ProcessTest, HasDataTimesOutOnIdlePipe)
{
    Process proc;
    proc.spawn("/bin/sleep", {"2"});

    auto start = std::chrono::steady_clock::now();
    EXPECT_FALSE(proc.stdout_pipe().has_data(50));
    EXPECT_GE(std::chrono::steady_clock::now() - start, std::chrono::milliseconds(40));

    proc.kill();
    proc.wait();
}

TEST(ProcessTest, HasDataReportsEof)
{
    Process proc;
    proc.spawn("/bin/true", {});
    proc.wait();

    // A closed writer end is readable (read returns 0)
    EXPECT_TRUE(proc.stdout_pipe().has_data(1000));
    char c;
    EXPECT_EQ(proc.stdout_pipe().read(&c, 1), 0u);
}

// Test process termination
TEST(ProcessTest, Terminate)
{
    Process proc;
    proc.spawn("/bin/sleep", {"10"});
    EXPECT_TRUE(proc.is_running());

    std::this_thread::sleep_for(std::chrono::milliseconds(100));
    proc.terminate();

    // SIGTERM is reported as 128 + 15
    EXPECT_EQ(proc.wait(), 143);
    EXPECT_FALSE(proc.is_running());
}

TEST(ProcessTest, ExitCodeReported)
{
    Process proc;
    proc.spawn("/bin/sh", {"-c", "exit 7"});
    EXPECT_EQ(proc.wait(), 7);
    EXPECT_EQ(proc.try_wait(), 7);
}

TEST(ProcessTest, MissingExecutableExits127)
{
    Process proc;
    proc.spawn("/definitely/not/here", {});
    EXPECT_EQ(proc.wait(), 127);
}

TEST(ProcessTest, WriteAfterReaderExitIsWriteError)
{
    Process proc;
    proc.spawn("/bin/true", {});
    proc.wait();

    // The child never reads, so the pipe is broken; SIGPIPE must not kill us
    std::string payload(1 << 16, 'x');
    EXPECT_THROW(proc.stdin_pipe().write_all(payload), WriteError);
}

TEST(ProcessTest, StderrRedirect)
{
    Process proc;
    ProcessOptions opts;
    opts.redirect_stderr = true;
    proc.spawn("/bin/sh", {"-c", "echo oops 1>&2"}, opts);

    EXPECT_EQ(read_all(proc.stderr_pipe()), "oops\n");
    proc.wait();
}

// Test find_executable
TEST(ProcessTest, FindExecutable)
{
    auto sh = find_executable("sh");
    EXPECT_TRUE(sh.has_value());

    auto absolute = find_executable("/bin/sh");
    ASSERT_TRUE(absolute.has_value());
    EXPECT_EQ(*absolute, "/bin/sh");

    auto nonexistent = find_executable("this_should_not_exist_12345");
    EXPECT_FALSE(nonexistent.has_value());
}

// Test working directory
TEST(ProcessTest, WorkingDirectory)
{
    Process proc;
    ProcessOptions opts;
    opts.working_directory = "/";
    proc.spawn("/bin/pwd", {}, opts);

    EXPECT_EQ(read_all(proc.stdout_pipe()), "/\n");
    proc.wait();
}

// Test environment variables
TEST(ProcessTest, Environment)
{
    Process proc;
    ProcessOptions opts;
    opts.environment["AGENTLINK_TEST_VAR"] = "test_value";
    proc.spawn("/bin/sh", {"-c", "echo $AGENTLINK_TEST_VAR"}, opts);

    EXPECT_EQ(read_all(proc.stdout_pipe()), "test_value\n");
    proc.wait();
}

TEST(ProcessTest, EnvironmentWithoutInheritance)
{
    Process proc;
    ProcessOptions opts;
    opts.inherit_environment = false;
    opts.environment["ONLY_VAR"] = "1";
    proc.spawn("/usr/bin/env", {}, opts);

    EXPECT_EQ(read_all(proc.stdout_pipe()), "ONLY_VAR=1\n");
    proc.wait();
}

// Test PID
TEST(ProcessTest, ProcessID)
{
    Process proc;
    proc.spawn("/bin/echo", {"test"});
    EXPECT_GT(proc.pid(), 0);
    proc.wait();
}

// Test multiple sequential processes
TEST(ProcessTest, SequentialProcesses)
{
    for (int i = 0; i < 3; i++)
    {
        Process proc;
        proc.spawn("/bin/echo", {"test" + std::to_string(i)});

        EXPECT_EQ(read_all(proc.stdout_pipe()), "test" + std::to_string(i) + "\n");
        EXPECT_EQ(proc.wait(), 0);
    }
}
