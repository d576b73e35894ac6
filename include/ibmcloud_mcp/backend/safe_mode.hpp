#pragma once

#include <string>
#include <string_view>
#include <vector>

namespace ibmcloud_mcp {

// Read-only keywords accepted by execute_command in safe mode:
// list, show, get, target, regions, zones, plugins, help, version, instances.
std::vector<std::string> DefaultSafeModeAllowlist();

// ---------------------------------------------------------------------------
// SafeModeFilter — allow/deny decision for free-form CLI commands.
//
// With safe mode on, a command is allowed iff it contains at least one
// allowlist entry as a case-sensitive substring. The match is deliberately
// not word-bounded: "resource service-instances" passes through "instances",
// and a keyword embedded in a resource name passes too.
// ---------------------------------------------------------------------------
class SafeModeFilter {
public:
    SafeModeFilter();
    explicit SafeModeFilter(std::vector<std::string> allowlist);

    [[nodiscard]] bool IsAllowed(std::string_view raw_command,
                                 bool safe_mode) const;

    [[nodiscard]] const std::vector<std::string>& Allowlist() const noexcept {
        return allowlist_;
    }

private:
    std::vector<std::string> allowlist_;
};

// Message returned to the client when the filter rejects a command.
std::string SafeModeDenial(std::string_view command);

} // namespace ibmcloud_mcp
