#include <ibmcloud_mcp/backend/safe_mode.hpp>

#include <algorithm>

namespace ibmcloud_mcp {

std::vector<std::string> DefaultSafeModeAllowlist() {
    return {"list", "show", "get", "target", "regions",
            "zones", "plugins", "help", "version", "instances"};
}

SafeModeFilter::SafeModeFilter() : allowlist_(DefaultSafeModeAllowlist()) {}

SafeModeFilter::SafeModeFilter(std::vector<std::string> allowlist)
    : allowlist_(std::move(allowlist)) {}

bool SafeModeFilter::IsAllowed(std::string_view raw_command,
                               bool safe_mode) const {
    if (!safe_mode) {
        return true;
    }
    return std::any_of(allowlist_.begin(), allowlist_.end(),
                       [&](const std::string& keyword) {
                           return raw_command.find(keyword) !=
                                  std::string_view::npos;
                       });
}

std::string SafeModeDenial(std::string_view command) {
    return "Error: Command '" + std::string(command) +
           "' is not allowed in safe mode. Only read-only operations are "
           "permitted.";
}

} // namespace ibmcloud_mcp
