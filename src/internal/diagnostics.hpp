#ifndef AGENTLINK_INTERNAL_DIAGNOSTICS_HPP
#define AGENTLINK_INTERNAL_DIAGNOSTICS_HPP

#include <agentlink/types.hpp>
#include <iostream>
#include <optional>
#include <string>

namespace agentlink
{
namespace internal
{

// Route a warning to the user callback, or stderr when none is set
inline void warn(const std::optional<DiagnosticCallback>& callback, const std::string& message)
{
    if (callback && *callback)
    {
        (*callback)(message);
        return;
    }
    std::cerr << "Warning: " << message << std::endl;
}

// Shorten a line for inclusion in a diagnostic
inline std::string preview(const std::string& text, std::size_t max_len = 120)
{
    if (text.size() <= max_len)
        return text;
    return text.substr(0, max_len) + "...";
}

} // namespace internal
} // namespace agentlink

#endif // AGENTLINK_INTERNAL_DIAGNOSTICS_HPP
