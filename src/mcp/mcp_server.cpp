#include <ibmcloud_mcp/mcp/mcp_server.hpp>

#include <ibmcloud_mcp/core/log.hpp>
#include <ibmcloud_mcp/core/version.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace ibmcloud_mcp {

namespace {

bool IsValidId(const nlohmann::json& id) {
    return id.is_string() || id.is_number() || id.is_null();
}

std::string IdForLog(const nlohmann::json& id) {
    return id.dump();
}

// Keep log lines bounded; tool output can be large.
std::string Abbreviate(const std::string& text, size_t max_len = 200) {
    if (text.size() <= max_len) return text;
    return text.substr(0, max_len) + "...";
}

} // anonymous namespace

ServerInfo ServerInfo::Default() {
    ServerInfo info;
    info.name = kServerName;
    info.version = kVersion;
    return info;
}

McpServer::McpServer(ToolRegistry registry,
                     ISessionGate* gate,
                     ServerInfo info,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)),
      gate_(gate),
      info_(std::move(info)),
      in_(in),
      out_(out) {}

void McpServer::Run() {
    LogInfo("mcp", "server loop started (" +
                       std::to_string(registry_.Tools().size()) + " tools)");
    std::string line;
    while (!StopRequested() && std::getline(in_, line)) {
        auto response = HandleLine(line);
        if (response) {
            out_ << response->dump() << "\n";
            out_.flush();
        }
    }
    if (StopRequested()) {
        LogInfo("mcp", "stop requested, leaving server loop");
    } else {
        LogInfo("mcp", "end of input after " + std::to_string(requests_) +
                           " requests");
    }
}

bool McpServer::StopRequested() const noexcept {
    return stop_flag_ != nullptr && *stop_flag_ != 0;
}

std::optional<nlohmann::json> McpServer::HandleLine(const std::string& line) {
    if (line.find_first_not_of(" \t\r") == std::string::npos) {
        return std::nullopt;
    }

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line);
    } catch (const nlohmann::json::exception&) {
        LogWarn("mcp", "parse error: " + Abbreviate(line, 100));
        return MakeError(nullptr, kParseError, "Parse error");
    }
    return HandleMessage(message);
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeError(nullptr, kInvalidRequest,
                         "Invalid Request: message must be a JSON object");
    }

    // A missing or unusable id is answered with id null.
    nlohmann::json id = nullptr;
    if (message.contains("id")) {
        if (!IsValidId(message["id"])) {
            return MakeError(nullptr, kInvalidRequest,
                             "Invalid Request: id must be a string, number or null");
        }
        id = message["id"];
    }

    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        return MakeError(id, kInvalidRequest, "Invalid JSON-RPC version");
    }
    if (!message.contains("method") || !message["method"].is_string()) {
        return MakeError(id, kInvalidRequest,
                         "Invalid Request: method must be a string");
    }
    const auto method = message["method"].get<std::string>();

    nlohmann::json params = nlohmann::json::object();
    if (message.contains("params") && !message["params"].is_null()) {
        if (!message["params"].is_object()) {
            return MakeError(id, kInvalidRequest,
                             "Invalid Request: params must be an object");
        }
        params = message["params"];
    }

    // Only a well-formed envelope without "id" is a notification: no response.
    if (!message.contains("id")) {
        LogDebug("mcp", "notification " + method);
        return std::nullopt;
    }

    ++requests_;
    LogInfo("mcp", "request id=" + IdForLog(id) + " method=" + method);

    if (method == "initialize") {
        return HandleInitialize(id);
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else if (method == "ping") {
        return MakeResult(id, nlohmann::json::object());
    } else {
        return MakeError(id, kMethodNotFound, "Method not found: " + method);
    }
}

nlohmann::json McpServer::HandleInitialize(const nlohmann::json& id) {
    nlohmann::json result;
    result["protocolVersion"] = info_.protocol_version;
    result["serverInfo"] = {
        {"name", info_.name},
        {"version", info_.version},
        {"description", info_.description}
    };
    result["capabilities"] = {
        {"tools", {{"listChanged", info_.tools_list_changed}}}
    };
    result["instructions"] = info_.instructions;
    result["environment"] = {
        {"required_tools", info_.required_tools},
        {"optional_plugins", info_.optional_plugins}
    };

    return MakeResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& descriptor : registry_.Tools()) {
        tools.push_back(descriptor.ToJson());
    }
    return MakeResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.contains("name") || !params["name"].is_string()) {
        return MakeError(id, kInvalidParams, "Missing 'name' parameter");
    }
    auto tool_name = params["name"].get<std::string>();

    nlohmann::json arguments = nlohmann::json::object();
    if (params.contains("arguments") && !params["arguments"].is_null()) {
        if (!params["arguments"].is_object()) {
            return MakeError(id, kInvalidParams,
                             "'arguments' must be an object");
        }
        arguments = params["arguments"];
    }

    if (!registry_.HasTool(tool_name)) {
        LogWarn("mcp", "unknown tool: " + tool_name);
        return MakeError(id, kMethodNotFound, "Tool not found: " + tool_name);
    }

    const auto started = std::chrono::steady_clock::now();
    auto elapsed_ms = [&started]() {
        return std::to_string(
            std::chrono::duration_cast<std::chrono::milliseconds>(
                std::chrono::steady_clock::now() - started).count());
    };

    if (gate_ != nullptr && registry_.RequiresSession(tool_name)) {
        auto auth = gate_->EnsureAuthenticated();
        if (auth.IsErr()) {
            std::string data = "Error: " + auth.Error().message;
            if (auth.Error().detail.has_value()) {
                data += "\n" + *auth.Error().detail;
            }
            LogWarn("mcp", "tool " + tool_name + " blocked: " + auth.Error().message);
            return MakeError(id, kInternalError, "Tool execution error", data);
        }
    }

    auto result = registry_.Execute(tool_name, arguments);
    if (result.is_error) {
        LogWarn("mcp", "tool " + tool_name + " failed after " + elapsed_ms() +
                           "ms: " + Abbreviate(result.output));
        return MakeError(id, kInternalError, "Tool execution error",
                         result.output);
    }

    LogInfo("mcp", "tool " + tool_name + " ok after " + elapsed_ms() + "ms (" +
                       std::to_string(result.output.size()) + " bytes)");
    return MakeResult(id, result.output);
}

nlohmann::json McpServer::MakeError(
    const nlohmann::json& id, int code, const std::string& message,
    const std::optional<std::string>& data) {
    nlohmann::json error = {
        {"code", code},
        {"message", message}
    };
    if (data.has_value()) {
        error["data"] = *data;
    }
    return {
        {"jsonrpc", "2.0"},
        {"error", error},
        {"id", id}
    };
}

nlohmann::json McpServer::MakeResult(
    const nlohmann::json& id, const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"result", result},
        {"id", id}
    };
}

} // namespace ibmcloud_mcp
