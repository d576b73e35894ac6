#pragma once

#include <ibmcloud_mcp/mcp/tool_registry.hpp>
#include <ibmcloud_mcp/session/session_gate.hpp>

#include <csignal>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ibmcloud_mcp {

// JSON-RPC 2.0 error codes.
inline constexpr int kParseError = -32700;
inline constexpr int kInvalidRequest = -32600;
inline constexpr int kMethodNotFound = -32601;
inline constexpr int kInvalidParams = -32602;
inline constexpr int kInternalError = -32603;

// ---------------------------------------------------------------------------
// ServerInfo — static metadata returned by initialize.
// ---------------------------------------------------------------------------
struct ServerInfo {
    std::string name;
    std::string version;
    std::string description = "MCP Server for IBM Cloud CLI operations";
    std::string protocol_version = "2024-11-05";
    std::string instructions =
        "This server provides access to IBM Cloud CLI operations including "
        "resource management, VPC operations, and account information. "
        "Requires IBM Cloud CLI to be installed and authenticated.";
    std::vector<std::string> required_tools = {"ibmcloud"};
    std::vector<std::string> optional_plugins = {
        "vpc-infrastructure", "cloud-functions", "kubernetes-service"};
    bool tools_list_changed = false;

    static ServerInfo Default();
};

// ---------------------------------------------------------------------------
// McpServer — MCP server over line-delimited JSON-RPC 2.0 on stdin/stdout.
//
// Methods:
//   - initialize
//   - tools/list
//   - tools/call   (session gate, then the bound handler)
//   - ping
// Messages without an "id" member are notifications and get no response.
// Every request with an id gets exactly one response line carrying it.
// ---------------------------------------------------------------------------
class McpServer {
public:
    // `gate` may be null (no authentication step); it must outlive Run().
    McpServer(ToolRegistry registry,
              ISessionGate* gate,
              ServerInfo info = ServerInfo::Default(),
              std::istream& in = std::cin,
              std::ostream& out = std::cout);

    // Run the server loop. Blocks until EOF, or until the stop flag (set by
    // a signal handler) is raised between requests.
    void Run();

    void SetStopFlag(const volatile std::sig_atomic_t* flag) noexcept {
        stop_flag_ = flag;
    }

    // Parse and process one input line. Returns nullopt for blank lines and
    // notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleLine(
        const std::string& line);

    // Process a single JSON-RPC message and return the response (if any).
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] size_t RequestCount() const noexcept { return requests_; }

private:
    nlohmann::json HandleInitialize(const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    nlohmann::json MakeError(const nlohmann::json& id, int code,
                             const std::string& message,
                             const std::optional<std::string>& data =
                                 std::nullopt);
    nlohmann::json MakeResult(const nlohmann::json& id,
                              const nlohmann::json& result);
    bool StopRequested() const noexcept;

    ToolRegistry registry_;
    ISessionGate* gate_;
    ServerInfo info_;
    std::istream& in_;
    std::ostream& out_;
    const volatile std::sig_atomic_t* stop_flag_ = nullptr;
    size_t requests_ = 0;
};

} // namespace ibmcloud_mcp
