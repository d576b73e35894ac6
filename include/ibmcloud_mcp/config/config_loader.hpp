#pragma once

#include <ibmcloud_mcp/config/app_config.hpp>
#include <ibmcloud_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace ibmcloud_mcp {

// Command-line options that are not part of AppConfig itself.
struct CliOptions {
    AppConfig overrides;
    std::optional<std::string> config_path;  // -c/--config
    bool show_version = false;
    // Which AppConfig fields were given on the command line.
    bool has_cli_path = false;
    bool has_tools_manifest = false;
    bool has_log_file = false;
    bool has_dotenv_path = false;
    bool has_api_key_env = false;
    bool has_timeout = false;
    bool has_log_level = false;
};

// Parse a YAML config file into an AppConfig (missing keys keep defaults).
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse command-line arguments.
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Merge: fields given on the command line replace those in base.
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli);

// Validate that values are present and sane.
Result<void, Error> ValidateConfig(const AppConfig& config);

} // namespace ibmcloud_mcp
