#pragma once

#include <ibmcloud_mcp/backend/safe_mode.hpp>
#include <ibmcloud_mcp/core/log.hpp>

#include <optional>
#include <string>
#include <vector>

namespace ibmcloud_mcp {

// Upper bound for timeout_seconds: one day.
constexpr int kMaxTimeoutSeconds = 24 * 60 * 60;

struct AppConfig {
    std::string cli_path = "ibmcloud";
    std::string tools_manifest = "assets/ibmcloud_tools.json";
    std::string log_file = "logs/ibmcloud.log";
    std::string dotenv_path = ".env";
    std::string api_key_env = "IBMCLOUD_API_KEY";
    std::optional<std::string> region;   // login region; --no-region when unset
    int timeout_seconds = 30;
    int status_cache_seconds = 0;        // 0 = probe before every tool call
    std::vector<std::string> safe_mode_allowlist = DefaultSafeModeAllowlist();
    LogLevel log_level = LogLevel::Info;
};

} // namespace ibmcloud_mcp
