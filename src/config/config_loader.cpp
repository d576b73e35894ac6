#include <ibmcloud_mcp/config/config_loader.hpp>

#include <ibmcloud_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <stdexcept>

namespace ibmcloud_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    Error error;
    error.operation = "ConfigLoader";
    error.message = message;
    error.category = ErrorCategory::Config;
    return error;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    YAML::Node root;
    try {
        root = YAML::LoadFile(std::string(file_path));
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    AppConfig config;
    try {
        if (root["cli_path"]) {
            config.cli_path = root["cli_path"].as<std::string>();
        }
        if (root["tools_manifest"]) {
            config.tools_manifest = root["tools_manifest"].as<std::string>();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["dotenv_path"]) {
            config.dotenv_path = root["dotenv_path"].as<std::string>();
        }
        if (root["api_key_env"]) {
            config.api_key_env = root["api_key_env"].as<std::string>();
        }
        if (root["region"]) {
            config.region = root["region"].as<std::string>();
        }
        if (root["timeout"]) {
            config.timeout_seconds = root["timeout"].as<int>();
        }
        if (root["status_cache_seconds"]) {
            config.status_cache_seconds = root["status_cache_seconds"].as<int>();
        }
        if (root["safe_mode_allowlist"]) {
            const auto& list = root["safe_mode_allowlist"];
            if (!list.IsSequence()) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("'safe_mode_allowlist' must be a list"));
            }
            config.safe_mode_allowlist.clear();
            for (const auto& entry : list) {
                config.safe_mode_allowlist.push_back(entry.as<std::string>());
            }
        }
        if (root["log_level"]) {
            auto name = root["log_level"].as<std::string>();
            auto level = ParseLogLevel(name);
            if (!level) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("Invalid log_level: " + name));
            }
            config.log_level = *level;
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Invalid value in YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("ibmcloud-mcp", kVersion,
                                     argparse::default_arguments::help);

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--tools")
        .help("Path to the tool manifest (JSON)");
    program.add_argument("--cli")
        .help("IBM Cloud CLI executable");
    program.add_argument("--log-file")
        .help("Log file path");
    program.add_argument("--env-file")
        .help("Dotenv file holding the API key");
    program.add_argument("--api-key-env")
        .help("Name of the API key variable");
    program.add_argument("--region")
        .help("Region used when logging in with an API key");
    program.add_argument("--timeout")
        .help("Backend command timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("-v", "--verbose")
        .help("Debug logging")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--version")
        .help("Print version and exit")
        .default_value(false)
        .implicit_value(true);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions cli;
    auto& config = cli.overrides;

    if (auto val = program.present("--config")) {
        cli.config_path = *val;
    }
    if (auto val = program.present("--tools")) {
        config.tools_manifest = *val;
        cli.has_tools_manifest = true;
    }
    if (auto val = program.present("--cli")) {
        config.cli_path = *val;
        cli.has_cli_path = true;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
        cli.has_log_file = true;
    }
    if (auto val = program.present("--env-file")) {
        config.dotenv_path = *val;
        cli.has_dotenv_path = true;
    }
    if (auto val = program.present("--api-key-env")) {
        config.api_key_env = *val;
        cli.has_api_key_env = true;
    }
    if (auto val = program.present("--region")) {
        config.region = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.timeout_seconds = *val;
        cli.has_timeout = true;
    }
    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (!level) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --log-level: " + *val));
        }
        config.log_level = *level;
        cli.has_log_level = true;
    }
    if (program.get<bool>("--verbose")) {
        config.log_level = LogLevel::Debug;
        cli.has_log_level = true;
    }
    cli.show_version = program.get<bool>("--version");

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& base, const CliOptions& cli) {
    AppConfig merged = base;
    const auto& o = cli.overrides;

    if (cli.has_cli_path) merged.cli_path = o.cli_path;
    if (cli.has_tools_manifest) merged.tools_manifest = o.tools_manifest;
    if (cli.has_log_file) merged.log_file = o.log_file;
    if (cli.has_dotenv_path) merged.dotenv_path = o.dotenv_path;
    if (cli.has_api_key_env) merged.api_key_env = o.api_key_env;
    if (o.region.has_value()) merged.region = o.region;
    if (cli.has_timeout) merged.timeout_seconds = o.timeout_seconds;
    if (cli.has_log_level) merged.log_level = o.log_level;

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.cli_path.empty()) {
        return Result<void, Error>::Err(MakeConfigError("Missing required field: cli_path"));
    }
    if (config.tools_manifest.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: tools_manifest"));
    }
    if (config.api_key_env.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Missing required field: api_key_env"));
    }
    if (config.timeout_seconds <= 0) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be positive, got " +
                            std::to_string(config.timeout_seconds)));
    }
    if (config.timeout_seconds > kMaxTimeoutSeconds) {
        return Result<void, Error>::Err(
            MakeConfigError("Timeout must be at most " +
                            std::to_string(kMaxTimeoutSeconds) + " seconds, got " +
                            std::to_string(config.timeout_seconds)));
    }
    if (config.status_cache_seconds < 0) {
        return Result<void, Error>::Err(
            MakeConfigError("status_cache_seconds must not be negative, got " +
                            std::to_string(config.status_cache_seconds)));
    }
    if (config.safe_mode_allowlist.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("safe_mode_allowlist must not be empty"));
    }
    for (const auto& entry : config.safe_mode_allowlist) {
        // An empty keyword would match every command.
        if (entry.empty()) {
            return Result<void, Error>::Err(
                MakeConfigError("safe_mode_allowlist contains an empty entry"));
        }
    }
    return Result<void, Error>::Ok();
}

} // namespace ibmcloud_mcp
