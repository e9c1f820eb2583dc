#include <agentlink/errors.hpp>
#include <agentlink/transport.hpp>
#include <agentlink/types.hpp>
#include <algorithm>
#include <cstdlib>
#include <gtest/gtest.h>
#include <iterator>

using namespace agentlink;

namespace
{

bool has_pair(const std::vector<std::string>& args, const std::string& flag,
              const std::string& value)
{
    auto it = std::find(args.begin(), args.end(), flag);
    return it != args.end() && std::next(it) != args.end() && *std::next(it) == value;
}

bool has_flag(const std::vector<std::string>& args, const std::string& flag)
{
    return std::find(args.begin(), args.end(), flag) != args.end();
}

} // namespace

TEST(TransportCliPathTest, InvalidCliPathRaisesError)
{
    LinkOptions opts;
    opts.cli_path = "/this/path/does/not/exist/claude";
    EXPECT_THROW(find_cli(opts), CLINotFoundError);
    EXPECT_THROW(create_cli_transport(opts), CLINotFoundError);
}

TEST(TransportCliPathTest, ExplicitPathWins)
{
    LinkOptions opts;
    opts.cli_path = "/bin/sh";
    EXPECT_EQ(find_cli(opts), "/bin/sh");
}

TEST(TransportCliPathTest, EnvironmentOverride)
{
    setenv("CLAUDE_CLI_PATH", "/bin/sh", 1);
    EXPECT_EQ(find_cli(LinkOptions{}), "/bin/sh");

    setenv("CLAUDE_CLI_PATH", "/nope/claude", 1);
    EXPECT_THROW(find_cli(LinkOptions{}), CLINotFoundError);
    unsetenv("CLAUDE_CLI_PATH");
}

TEST(CliArgumentsTest, StreamingFormatAlwaysPresent)
{
    auto args = build_cli_arguments(LinkOptions{});
    EXPECT_TRUE(has_pair(args, "--output-format", "stream-json"));
    EXPECT_TRUE(has_pair(args, "--input-format", "stream-json"));
    EXPECT_TRUE(has_flag(args, "--verbose"));
    EXPECT_FALSE(has_flag(args, "--permission-prompt-tool"));
    EXPECT_FALSE(has_flag(args, "--model"));
}

TEST(CliArgumentsTest, OptionsMapToFlags)
{
    LinkOptions opts;
    opts.model = "claude-sonnet-4-5";
    opts.permission_mode = PermissionMode::AcceptEdits;
    opts.can_use_tool = [](const std::string&, const json&, const ToolPermissionContext&)
        -> PermissionResult { return PermissionResultAllow{}; };
    opts.extra_args["max-turns"] = "3";
    opts.extra_args["--debug"] = "";

    auto args = build_cli_arguments(opts);
    EXPECT_TRUE(has_pair(args, "--model", "claude-sonnet-4-5"));
    EXPECT_TRUE(has_pair(args, "--permission-mode", "acceptEdits"));
    EXPECT_TRUE(has_pair(args, "--permission-prompt-tool", "stdio"));
    EXPECT_TRUE(has_pair(args, "--max-turns", "3"));
    EXPECT_TRUE(has_flag(args, "--debug"));
    EXPECT_FALSE(has_flag(args, "----debug"));
}
