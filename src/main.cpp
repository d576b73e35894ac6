#include <ibmcloud_mcp/backend/process_invoker.hpp>
#include <ibmcloud_mcp/backend/safe_mode.hpp>
#include <ibmcloud_mcp/config/config_loader.hpp>
#include <ibmcloud_mcp/core/log.hpp>
#include <ibmcloud_mcp/core/stop_signal.hpp>
#include <ibmcloud_mcp/core/version.hpp>
#include <ibmcloud_mcp/mcp/mcp_server.hpp>
#include <ibmcloud_mcp/mcp/mcp_tool_handlers.hpp>
#include <ibmcloud_mcp/mcp/tool_manifest.hpp>
#include <ibmcloud_mcp/mcp/tool_registry.hpp>
#include <ibmcloud_mcp/session/session_gate.hpp>

#include <unistd.h>

#include <chrono>
#include <filesystem>
#include <iostream>
#include <memory>
#include <string>
#include <system_error>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitStartup = 1;

void PrintStartupError(const ibmcloud_mcp::Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

// Relative manifest paths are tried against the working directory first,
// then against the directory holding the executable.
std::string ResolveManifestPath(const std::string& configured) {
    namespace fs = std::filesystem;
    fs::path path(configured);
    std::error_code ec;
    if (path.is_absolute() || fs::exists(path, ec)) {
        return configured;
    }
    auto self = fs::read_symlink("/proc/self/exe", ec);
    if (ec) {
        return configured;
    }
    auto beside_binary = self.parent_path() / path;
    if (fs::exists(beside_binary, ec)) {
        return beside_binary.string();
    }
    return configured;
}

std::unique_ptr<ibmcloud_mcp::ILogSink> MakeLogSink(
    const ibmcloud_mcp::AppConfig& config) {
    using namespace ibmcloud_mcp;
    auto tee = std::make_unique<TeeSink>();
    if (!config.log_file.empty()) {
        auto file = std::make_unique<FileSink>(config.log_file);
        if (!file->IsOpen()) {
            std::cerr << "ibmcloud-mcp: cannot open log file "
                      << config.log_file << ", logging to stderr only\n";
        } else {
            tee->Add(std::move(file));
        }
    }
    tee->Add(std::make_unique<ConsoleSink>(std::cerr));
    return tee;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace ibmcloud_mcp;

    // Step 1: command line.
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        PrintStartupError(cli_result.Error());
        return kExitStartup;
    }
    auto cli = std::move(cli_result).Value();

    if (cli.show_version) {
        std::cout << kServerName << " " << kVersion << "\n";
        return kExitSuccess;
    }

    // Step 2: optional YAML file, command line wins.
    AppConfig base;
    if (cli.config_path) {
        auto yaml_result = LoadFromYaml(*cli.config_path);
        if (yaml_result.IsErr()) {
            PrintStartupError(yaml_result.Error());
            return kExitStartup;
        }
        base = std::move(yaml_result).Value();
    }
    AppConfig config = MergeConfigs(base, cli);

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        PrintStartupError(valid.Error());
        return kExitStartup;
    }

    // Step 3: logging. stdout stays reserved for JSON-RPC.
    InitGlobalLogger(MakeLogSink(config), config.log_level);
    LogInfo("main", std::string("starting ") + kServerName + " " + kVersion);

    // Step 4: tool manifest.
    auto manifest_path = ResolveManifestPath(config.tools_manifest);
    auto manifest = LoadToolManifest(manifest_path);
    if (manifest.IsErr()) {
        LogError("main", manifest.Error().ToString());
        PrintStartupError(manifest.Error());
        return kExitStartup;
    }
    LogInfo("main", "loaded " + std::to_string(manifest.Value().size()) +
                        " tools from " + manifest_path);

    // Step 5: backend CLI.
    auto cli_binary = FindExecutable(config.cli_path);
    if (!cli_binary) {
        Error error;
        error.operation = "Startup";
        error.message = "IBM Cloud CLI not found: " + config.cli_path;
        error.detail = "Install it from https://cloud.ibm.com/docs/cli";
        error.category = ErrorCategory::Dependency;
        LogError("main", error.ToString());
        PrintStartupError(error);
        return kExitStartup;
    }
    LogInfo("main", "using CLI at " + *cli_binary);

    ProcessInvoker backend(*cli_binary,
                           std::chrono::seconds(config.timeout_seconds));
    SafeModeFilter filter(config.safe_mode_allowlist);

    SessionOptions session_options;
    session_options.region = config.region;
    session_options.status_cache =
        std::chrono::seconds(config.status_cache_seconds);
    SessionContext session(backend,
                           CredentialResolver(config.api_key_env,
                                              config.dotenv_path),
                           session_options);

    // Step 6: tool table.
    ToolRegistry registry;
    registry.AddDescriptors(std::move(manifest).Value());
    RegisterCloudTools(registry, backend, filter);
    auto complete = registry.CheckComplete();
    if (complete.IsErr()) {
        LogError("main", complete.Error().ToString());
        PrintStartupError(complete.Error());
        return kExitStartup;
    }

    // Step 7: serve until EOF or a stop signal.
    auto signals = InstallStopSignalHandlers(STDIN_FILENO);
    if (signals.IsErr()) {
        PrintStartupError(signals.Error());
        return kExitStartup;
    }
    McpServer server(std::move(registry), &session);
    server.SetStopFlag(StopFlag());
    server.Run();

    LogInfo("main", "shutting down after " +
                        std::to_string(server.RequestCount()) + " requests");
    return kExitSuccess;
}
