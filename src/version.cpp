#include <agentlink/version.hpp>
#include <sstream>

namespace agentlink
{

std::string version_string()
{
    std::ostringstream oss;
    oss << VERSION_MAJOR << "." << VERSION_MINOR << "." << VERSION_PATCH;
    return oss.str();
}

} // namespace agentlink
