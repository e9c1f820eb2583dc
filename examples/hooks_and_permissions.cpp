#include <agentlink/agentlink.hpp>
#include <iostream>

int main()
{
    agentlink::LinkOptions opts;
    opts.permission_mode = agentlink::PermissionMode::Default;

    // Block obviously destructive shell commands before they run
    auto guard_bash = [](const agentlink::HookInput& input,
                         const std::optional<std::string>& tool_use_id,
                         const agentlink::HookContext&) -> agentlink::HookOutput
    {
        std::cout << "[HOOK] " << input.hook_event_name << " - Tool: "
                  << input.tool_name.value_or("?");
        if (tool_use_id)
            std::cout << " (ID: " << *tool_use_id << ")";
        std::cout << "\n";

        if (input.tool_input && input.tool_input->value("command", "").find("rm -rf") !=
                                    std::string::npos)
            return agentlink::HookOutput::block("Recursive deletes are not allowed");
        return agentlink::HookOutput{};
    };

    opts.hooks[agentlink::HookEvent::PreToolUse] = {agentlink::HookMatcher{"Bash", {guard_bash}}};

    opts.can_use_tool = [](const std::string& tool_name, const agentlink::json& input,
                           const agentlink::ToolPermissionContext&) -> agentlink::PermissionResult
    {
        if (tool_name == "Write" && input.value("file_path", "").rfind("/etc/", 0) == 0)
            return agentlink::PermissionResultDeny{"System files are read-only", false};

        std::cout << "[TOOL PERMISSION] " << tool_name << " [APPROVED]\n";
        return agentlink::PermissionResultAllow{};
    };

    opts.stderr_callback = [](const std::string& line) { std::cerr << "[cli] " << line << "\n"; };

    try
    {
        agentlink::Connection connection(opts);
        connection.connect();

        connection.send_user_message("List the files in the current directory using bash.");
        for (const auto& event : connection.receive_events())
        {
            if (event.value("type", "") == "result")
            {
                std::cout << "Done: " << event.value("subtype", "") << "\n";
                break;
            }
        }

        connection.close();
    }
    catch (const agentlink::LinkError& e)
    {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
    return 0;
}
