#include "../internal/timed_call.hpp"

#include <agentlink/errors.hpp>
#include <agentlink/protocol/handlers.hpp>
#include <cmath>

namespace agentlink
{
namespace protocol
{

HookDispatcher::HookDispatcher(std::map<std::string, std::vector<HookMatcher>> hooks,
                               std::chrono::milliseconds default_timeout,
                               std::shared_ptr<const AbortSignal> signal)
    : default_timeout_(default_timeout), signal_(std::move(signal))
{
    size_t next_id = 0;
    for (auto& [event, matchers] : hooks)
    {
        if (!is_valid_hook_event(event))
            throw ConfigurationError("Unknown hook event: " + event);

        for (auto& matcher : matchers)
        {
            Registration reg;
            reg.event = event;
            for (size_t i = 0; i < matcher.hooks.size(); ++i)
            {
                std::string id = "hook_" + std::to_string(next_id++);
                callback_index_[id] = {registrations_.size(), i};
                reg.callback_ids.push_back(std::move(id));
            }
            reg.matcher = std::move(matcher);
            registrations_.push_back(std::move(reg));
        }
    }
}

std::chrono::milliseconds HookDispatcher::timeout_for(const HookMatcher& matcher) const
{
    if (!matcher.timeout.has_value())
        return default_timeout_;
    return std::chrono::milliseconds(static_cast<long long>(std::llround(*matcher.timeout * 1000.0)));
}

HookOutput HookDispatcher::run_callback(const HookCallback& callback,
                                        std::chrono::milliseconds timeout,
                                        const std::string& event, const HookInput& input,
                                        const std::optional<std::string>& tool_use_id) const
{
    if (signal_ && signal_->is_aborted())
        throw AbortedError(event + " hook aborted");

    HookContext context{signal_};
    HookOutput output = internal::call_with_timeout<HookOutput>(
        [callback, input, tool_use_id, context]() { return callback(input, tool_use_id, context); },
        timeout, event + " hook");

    if (signal_ && signal_->is_aborted())
        throw AbortedError(event + " hook aborted");

    return output;
}

HookOutput HookDispatcher::dispatch(const std::string& event, const HookInput& input,
                                    const std::optional<std::string>& tool_use_id) const
{
    for (const auto& reg : registrations_)
    {
        if (reg.event != event || !reg.matcher.matches(input.tool_name))
            continue;

        auto timeout = timeout_for(reg.matcher);
        for (const auto& callback : reg.matcher.hooks)
        {
            HookOutput output = run_callback(callback, timeout, event, input, tool_use_id);
            if (output.blocks())
                return output;
        }
    }

    return HookOutput{};
}

json HookDispatcher::handle(const ControlRequest& request)
{
    const json& body = request.request;
    HookInput input = HookInput::from_request(body);

    std::optional<std::string> tool_use_id;
    if (body.contains("tool_use_id") && body["tool_use_id"].is_string())
        tool_use_id = body["tool_use_id"].get<std::string>();

    if (body.contains("callback_id"))
    {
        std::string callback_id = body.value("callback_id", "");
        auto it = callback_index_.find(callback_id);
        if (it == callback_index_.end())
            throw ProtocolError("No hook callback found for ID: " + callback_id);

        const auto& reg = registrations_[it->second.first];
        const auto& callback = reg.matcher.hooks[it->second.second];
        return run_callback(callback, timeout_for(reg.matcher), reg.event, input, tool_use_id)
            .to_json();
    }

    std::string event = body.value("hook_event", input.hook_event_name);
    if (event.empty())
        throw ProtocolError("hook_callback request names neither callback_id nor hook_event");

    return dispatch(event, input, tool_use_id).to_json();
}

json HookDispatcher::build_config() const
{
    json config = json::object();

    for (const auto& reg : registrations_)
    {
        if (reg.callback_ids.empty())
            continue;

        json entry = {{"hookCallbackIds", reg.callback_ids}};
        if (reg.matcher.matcher.has_value())
            entry["matcher"] = *reg.matcher.matcher;
        else
            entry["matcher"] = nullptr;
        if (reg.matcher.timeout.has_value())
            entry["timeout"] = *reg.matcher.timeout;

        config[reg.event].push_back(entry);
    }

    return config;
}

} // namespace protocol
} // namespace agentlink
