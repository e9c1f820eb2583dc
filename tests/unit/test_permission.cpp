#include <agentlink/errors.hpp>
#include <agentlink/protocol/handlers.hpp>
#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <thread>

using namespace agentlink;
using namespace agentlink::protocol;

namespace
{

ControlRequest can_use_tool(const std::string& tool, const json& input)
{
    return {"perm_1", {{"subtype", "can_use_tool"}, {"tool_name", tool}, {"input", input}}};
}

std::shared_ptr<AbortSignal> fresh_signal()
{
    return std::make_shared<AbortSignal>();
}

} // namespace

TEST(PermissionHandlerTest, NoCallbackAllowsWithOriginalInput)
{
    PermissionHandler handler(std::nullopt, std::chrono::seconds(1), fresh_signal());
    json payload = handler.handle(can_use_tool("Read", {{"file_path", "/tmp/a"}}));

    EXPECT_EQ(payload["behavior"], "allow");
    EXPECT_EQ(payload["updatedInput"]["file_path"], "/tmp/a");
}

TEST(PermissionHandlerTest, CallbackReceivesToolAndInput)
{
    std::string seen_tool;
    json seen_input;
    std::optional<std::string> seen_session;
    ToolPermissionCallback callback =
        [&](const std::string& tool, const json& input, const ToolPermissionContext& ctx)
    {
        seen_tool = tool;
        seen_input = input;
        seen_session = ctx.session_id;
        return PermissionResultAllow{};
    };

    PermissionHandler handler(callback, std::chrono::seconds(1), fresh_signal());
    ControlRequest req = can_use_tool("Bash", {{"command", "ls"}});
    req.request["session_id"] = "s-1";
    handler.handle(req);

    EXPECT_EQ(seen_tool, "Bash");
    EXPECT_EQ(seen_input["command"], "ls");
    EXPECT_EQ(seen_session, "s-1");
}

TEST(PermissionHandlerTest, DenyCarriesMessageAndInterrupt)
{
    ToolPermissionCallback callback = [](const std::string&, const json&,
                                         const ToolPermissionContext&)
    { return PermissionResultDeny{"writes are disabled", true}; };

    PermissionHandler handler(callback, std::chrono::seconds(1), fresh_signal());
    json payload = handler.handle(can_use_tool("Write", json::object()));

    EXPECT_EQ(payload["behavior"], "deny");
    EXPECT_EQ(payload["message"], "writes are disabled");
    EXPECT_EQ(payload["interrupt"], true);
}

TEST(PermissionHandlerTest, DenyWithoutInterruptOmitsField)
{
    json payload = PermissionHandler::to_payload(PermissionResultDeny{"no"}, json::object());
    EXPECT_FALSE(payload.contains("interrupt"));
}

TEST(PermissionHandlerTest, AllowWithRewrittenInputAndPermissions)
{
    PermissionUpdate update;
    update.type = "addRules";
    update.rules = std::vector<PermissionRuleValue>{{"Bash", std::string("ls:*")}};
    update.behavior = "allow";
    update.destination = "session";

    PermissionResultAllow allow;
    allow.updated_input = json{{"command", "ls -la"}};
    allow.updated_permissions = std::vector<PermissionUpdate>{update};

    json payload = PermissionHandler::to_payload(allow, {{"command", "ls"}});
    EXPECT_EQ(payload["updatedInput"]["command"], "ls -la");
    ASSERT_TRUE(payload["updatedPermissions"].is_array());
    EXPECT_EQ(payload["updatedPermissions"][0]["type"], "addRules");
    EXPECT_EQ(payload["updatedPermissions"][0]["rules"][0]["toolName"], "Bash");
    EXPECT_EQ(payload["updatedPermissions"][0]["destination"], "session");
}

TEST(PermissionHandlerTest, LegacyToolInputFieldAndSuggestions)
{
    size_t suggestion_count = 0;
    json seen_input;
    ToolPermissionCallback callback =
        [&](const std::string&, const json& input, const ToolPermissionContext& ctx)
    {
        seen_input = input;
        suggestion_count = ctx.suggestions.size();
        return PermissionResultAllow{};
    };

    PermissionHandler handler(callback, std::chrono::seconds(1), fresh_signal());
    ControlRequest req{"perm_2",
                       {{"subtype", "can_use_tool"},
                        {"tool_name", "Edit"},
                        {"tool_input", {{"path", "x"}}},
                        {"permission_suggestions",
                         json::array({{{"type", "setMode"}, {"mode", "acceptEdits"}}})}}};
    handler.handle(req);

    EXPECT_EQ(seen_input["path"], "x");
    EXPECT_EQ(suggestion_count, 1u);
}

TEST(PermissionHandlerTest, MissingToolNameIsProtocolError)
{
    PermissionHandler handler(std::nullopt, std::chrono::seconds(1), fresh_signal());
    EXPECT_THROW(handler.handle({"perm_3", {{"subtype", "can_use_tool"}}}), ProtocolError);
}

TEST(PermissionHandlerTest, CallbackExceptionPropagates)
{
    ToolPermissionCallback callback = [](const std::string&, const json&,
                                         const ToolPermissionContext&) -> PermissionResult
    { throw std::runtime_error("policy store unavailable"); };

    PermissionHandler handler(callback, std::chrono::seconds(1), fresh_signal());
    try
    {
        handler.handle(can_use_tool("Read", json::object()));
        FAIL() << "Expected exception";
    }
    catch (const std::runtime_error& e)
    {
        EXPECT_STREQ(e.what(), "policy store unavailable");
    }
}

TEST(PermissionHandlerTest, SlowCallbackTimesOut)
{
    ToolPermissionCallback callback = [](const std::string&, const json&,
                                         const ToolPermissionContext&)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(300));
        return PermissionResultAllow{};
    };

    PermissionHandler handler(callback, std::chrono::milliseconds(30), fresh_signal());
    EXPECT_THROW(handler.handle(can_use_tool("Read", json::object())), TimeoutError);
}

TEST(PermissionHandlerTest, AbortedSignalRejectsRequest)
{
    auto signal = fresh_signal();
    std::atomic<bool> called{false};
    ToolPermissionCallback callback = [&](const std::string&, const json&,
                                          const ToolPermissionContext&)
    {
        called = true;
        return PermissionResultAllow{};
    };

    PermissionHandler handler(callback, std::chrono::seconds(1), signal);
    signal->abort();
    EXPECT_THROW(handler.handle(can_use_tool("Read", json::object())), AbortedError);
    EXPECT_FALSE(called);
}

TEST(PermissionHandlerTest, AbortDuringCallbackDiscardsResult)
{
    auto signal = fresh_signal();
    ToolPermissionCallback callback = [](const std::string&, const json&,
                                         const ToolPermissionContext& ctx)
    {
        // Simulate the user cancelling while the decision is pending
        std::const_pointer_cast<AbortSignal>(ctx.signal)->abort();
        return PermissionResultAllow{};
    };

    PermissionHandler handler(callback, std::chrono::seconds(1), signal);
    EXPECT_THROW(handler.handle(can_use_tool("Read", json::object())), AbortedError);
}
