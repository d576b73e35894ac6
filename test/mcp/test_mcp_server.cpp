#include <catch2/catch_test_macros.hpp>

#include <ibmcloud_mcp/mcp/mcp_server.hpp>
#include <ibmcloud_mcp/mcp/mcp_tool_handlers.hpp>
#include <ibmcloud_mcp/mcp/tool_manifest.hpp>

#include "../../test/mocks/mock_backend.hpp"

#include <csignal>
#include <cstdlib>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

using namespace ibmcloud_mcp;
using namespace ibmcloud_mcp::testing;

namespace {

// Gate with a scripted answer; counts how often it was asked.
class FakeGate : public ISessionGate {
public:
    explicit FakeGate(bool authenticated) : authenticated_(authenticated) {}

    Result<void, Error> EnsureAuthenticated() override {
        ++checks;
        if (authenticated_) {
            return Result<void, Error>::Ok();
        }
        Error error;
        error.operation = "SessionGate";
        error.message = "Not logged in to IBM Cloud. Please run 'ibmcloud login' "
                        "or set IBMCLOUD_API_KEY";
        error.category = ErrorCategory::Authentication;
        return Result<void, Error>::Err(std::move(error));
    }

    int checks = 0;

private:
    bool authenticated_;
};

ToolRegistry MakeTestRegistry() {
    ToolRegistry registry;
    registry.Register("echo", "Echo the input",
        {{"type", "object"},
         {"properties", {{"message", {{"type", "string"}}}}},
         {"required", nlohmann::json::array({"message"})}},
        [](const nlohmann::json& params) -> ToolResult {
            return ToolResult::Ok(params.value("message", ""));
        });
    registry.Register("fail", "Always fails", nlohmann::json{{"type", "object"}},
        [](const nlohmann::json&) -> ToolResult {
            return ToolResult::Fail("Error doing things: boom");
        });
    registry.Register("local", "No session needed", nlohmann::json{{"type", "object"}},
        [](const nlohmann::json&) -> ToolResult {
            return ToolResult::Ok("local ok");
        },
        false);
    return registry;
}

nlohmann::json Request(const nlohmann::json& id, const std::string& method,
                       const nlohmann::json& params = nullptr) {
    nlohmann::json msg = {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}};
    if (!params.is_null()) {
        msg["params"] = params;
    }
    return msg;
}

std::vector<nlohmann::json> ParseLines(const std::string& text) {
    std::vector<nlohmann::json> lines;
    std::istringstream in(text);
    std::string line;
    while (std::getline(in, line)) {
        lines.push_back(nlohmann::json::parse(line));
    }
    return lines;
}

std::string AssetPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto test_dir = this_file.substr(0, this_file.rfind('/'));
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));
    auto repo_root = test_root.substr(0, test_root.rfind('/'));
    return repo_root + "/assets/" + filename;
}

} // anonymous namespace

// ===========================================================================
// initialize / tools/list / ping
// ===========================================================================

TEST_CASE("McpServer: initialize returns server metadata", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), nullptr, ServerInfo::Default(), in, out);

    auto response = server.HandleMessage(
        Request(1, "initialize", {{"protocolVersion", "2024-11-05"}}));
    REQUIRE(response.has_value());
    CHECK((*response)["jsonrpc"] == "2.0");
    CHECK((*response)["id"] == 1);

    const auto& result = (*response)["result"];
    CHECK(result["protocolVersion"] == "2024-11-05");
    CHECK(result["serverInfo"]["name"] == "IBMCloudServer");
    CHECK(result["serverInfo"]["description"] == "MCP Server for IBM Cloud CLI operations");
    CHECK(result["serverInfo"]["version"].is_string());
    CHECK(result["capabilities"]["tools"].contains("listChanged"));
    CHECK(result["instructions"].get<std::string>().find("IBM Cloud CLI") != std::string::npos);
    CHECK(result["environment"]["required_tools"] == nlohmann::json::array({"ibmcloud"}));
    CHECK(result["environment"]["optional_plugins"].size() == 3);
}

TEST_CASE("McpServer: initialize is idempotent", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), nullptr, ServerInfo::Default(), in, out);

    auto first = server.HandleMessage(Request(1, "initialize"));
    auto second = server.HandleMessage(Request(1, "initialize"));
    REQUIRE(first.has_value());
    REQUIRE(second.has_value());
    CHECK(first->dump() == second->dump());
}

TEST_CASE("McpServer: tools/list returns descriptors in order", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), nullptr, ServerInfo::Default(), in, out);

    auto response = server.HandleMessage(Request(2, "tools/list"));
    REQUIRE(response.has_value());
    const auto& tools = (*response)["result"]["tools"];
    REQUIRE(tools.size() == 3);
    CHECK(tools[0]["name"] == "echo");
    CHECK(tools[0]["description"] == "Echo the input");
    CHECK(tools[0]["parameters"]["required"][0] == "message");
    CHECK(tools[1]["name"] == "fail");
    CHECK(tools[2]["name"] == "local");

    auto again = server.HandleMessage(Request(2, "tools/list"));
    CHECK(again->dump() == response->dump());
}

TEST_CASE("McpServer: ping", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), nullptr, ServerInfo::Default(), in, out);

    auto response = server.HandleMessage(Request("p-1", "ping"));
    REQUIRE(response.has_value());
    CHECK((*response)["id"] == "p-1");
    CHECK((*response)["result"] == nlohmann::json::object());
}

// ===========================================================================
// tools/call
// ===========================================================================

TEST_CASE("McpServer: tools/call returns handler output as result", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    FakeGate gate(true);
    McpServer server(MakeTestRegistry(), &gate, ServerInfo::Default(), in, out);

    auto response = server.HandleMessage(Request(3, "tools/call",
        {{"name", "echo"}, {"arguments", {{"message", "hello"}}}}));
    REQUIRE(response.has_value());
    CHECK((*response)["id"] == 3);
    CHECK((*response)["result"] == "hello");
    CHECK_FALSE(response->contains("error"));
    CHECK(gate.checks == 1);
}

TEST_CASE("McpServer: tools/call handler failure", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    FakeGate gate(true);
    McpServer server(MakeTestRegistry(), &gate, ServerInfo::Default(), in, out);

    auto response = server.HandleMessage(Request(4, "tools/call", {{"name", "fail"}}));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == kInternalError);
    CHECK((*response)["error"]["message"] == "Tool execution error");
    CHECK((*response)["error"]["data"] == "Error doing things: boom");
    CHECK_FALSE(response->contains("result"));
}

TEST_CASE("McpServer: gate failure blocks the handler", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    FakeGate gate(false);
    McpServer server(MakeTestRegistry(), &gate, ServerInfo::Default(), in, out);

    auto response = server.HandleMessage(Request(5, "tools/call",
        {{"name", "echo"}, {"arguments", {{"message", "hello"}}}}));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == kInternalError);
    CHECK((*response)["error"]["data"].get<std::string>().find("Not logged in") !=
          std::string::npos);
}

TEST_CASE("McpServer: tools without a session skip the gate", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    FakeGate gate(false);
    McpServer server(MakeTestRegistry(), &gate, ServerInfo::Default(), in, out);

    auto response = server.HandleMessage(Request(6, "tools/call", {{"name", "local"}}));
    REQUIRE(response.has_value());
    CHECK((*response)["result"] == "local ok");
    CHECK(gate.checks == 0);
}

TEST_CASE("McpServer: tools/call unknown tool", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    FakeGate gate(true);
    McpServer server(MakeTestRegistry(), &gate, ServerInfo::Default(), in, out);

    auto response = server.HandleMessage(Request(7, "tools/call", {{"name", "nope"}}));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == kMethodNotFound);
    CHECK((*response)["error"]["message"] == "Tool not found: nope");
    CHECK(gate.checks == 0);
}

TEST_CASE("McpServer: tools/call invalid params", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), nullptr, ServerInfo::Default(), in, out);

    SECTION("missing name") {
        auto response = server.HandleMessage(Request(8, "tools/call",
                                                     nlohmann::json::object()));
        CHECK((*response)["error"]["code"] == kInvalidParams);
    }
    SECTION("name not a string") {
        auto response = server.HandleMessage(Request(8, "tools/call", {{"name", 42}}));
        CHECK((*response)["error"]["code"] == kInvalidParams);
    }
    SECTION("arguments not an object") {
        auto response = server.HandleMessage(Request(8, "tools/call",
            {{"name", "echo"}, {"arguments", "hello"}}));
        CHECK((*response)["error"]["code"] == kInvalidParams);
    }
    SECTION("null arguments mean none") {
        auto response = server.HandleMessage(Request(8, "tools/call",
            {{"name", "echo"}, {"arguments", nullptr}}));
        CHECK((*response)["result"] == "");
    }
}

// ===========================================================================
// Envelope handling
// ===========================================================================

TEST_CASE("McpServer: unknown method", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), nullptr, ServerInfo::Default(), in, out);

    auto response = server.HandleMessage(Request(9, "resources/list"));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == kMethodNotFound);
    CHECK((*response)["id"] == 9);
}

TEST_CASE("McpServer: notifications get no response", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), nullptr, ServerInfo::Default(), in, out);

    nlohmann::json msg = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    CHECK_FALSE(server.HandleMessage(msg).has_value());

    nlohmann::json call = {{"jsonrpc", "2.0"}, {"method", "tools/call"},
                           {"params", {{"name", "echo"}}}};
    CHECK_FALSE(server.HandleMessage(call).has_value());
    CHECK(server.RequestCount() == 0);
}

TEST_CASE("McpServer: explicit null id still gets a response", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), nullptr, ServerInfo::Default(), in, out);

    auto response = server.HandleMessage(Request(nullptr, "ping"));
    REQUIRE(response.has_value());
    CHECK((*response)["id"].is_null());
}

TEST_CASE("McpServer: invalid envelopes", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), nullptr, ServerInfo::Default(), in, out);

    SECTION("not an object") {
        auto response = server.HandleMessage(nlohmann::json::array({1, 2}));
        CHECK((*response)["error"]["code"] == kInvalidRequest);
        CHECK((*response)["id"].is_null());
    }
    SECTION("wrong version") {
        nlohmann::json msg = {{"jsonrpc", "1.0"}, {"id", 1}, {"method", "ping"}};
        auto response = server.HandleMessage(msg);
        CHECK((*response)["error"]["code"] == kInvalidRequest);
        CHECK((*response)["id"] == 1);
    }
    SECTION("method not a string") {
        nlohmann::json msg = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", 5}};
        CHECK((*server.HandleMessage(msg))["error"]["code"] == kInvalidRequest);
    }
    SECTION("id is an object") {
        nlohmann::json msg = {{"jsonrpc", "2.0"}, {"id", {{"a", 1}}}, {"method", "ping"}};
        auto response = server.HandleMessage(msg);
        CHECK((*response)["error"]["code"] == kInvalidRequest);
        CHECK((*response)["id"].is_null());
    }
    SECTION("params not an object") {
        nlohmann::json msg = {{"jsonrpc", "2.0"}, {"id", 1}, {"method", "tools/call"},
                              {"params", nlohmann::json::array()}};
        CHECK((*server.HandleMessage(msg))["error"]["code"] == kInvalidRequest);
    }
    SECTION("object without id, version or method") {
        auto response = server.HandleMessage(nlohmann::json{{"foo", 1}});
        REQUIRE(response.has_value());
        CHECK((*response)["error"]["code"] == kInvalidRequest);
        CHECK((*response)["id"].is_null());
    }
    SECTION("method not a string and no id") {
        nlohmann::json msg = {{"jsonrpc", "2.0"}, {"method", 5}};
        auto response = server.HandleMessage(msg);
        REQUIRE(response.has_value());
        CHECK((*response)["error"]["code"] == kInvalidRequest);
        CHECK((*response)["id"].is_null());
    }
    SECTION("wrong version and no id") {
        nlohmann::json msg = {{"jsonrpc", "1.0"}, {"method", "tools/list"}};
        auto response = server.HandleMessage(msg);
        REQUIRE(response.has_value());
        CHECK((*response)["error"]["code"] == kInvalidRequest);
        CHECK((*response)["id"].is_null());
    }
    SECTION("params not an object and no id") {
        nlohmann::json msg = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"},
                              {"params", 3}};
        auto response = server.HandleMessage(msg);
        REQUIRE(response.has_value());
        CHECK((*response)["id"].is_null());
    }
    CHECK(server.RequestCount() == 0);
}

TEST_CASE("McpServer: Run answers malformed id-less lines", "[mcp][server]") {
    std::istringstream in(
        R"({"foo":1})" "\n"
        R"({"jsonrpc":"2.0","method":5})" "\n"
        R"({"jsonrpc":"1.0","method":"tools/list"})" "\n"
        R"({"jsonrpc":"2.0","id":1,"method":"ping"})" "\n");
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), nullptr, ServerInfo::Default(), in, out);
    server.Run();

    auto lines = ParseLines(out.str());
    REQUIRE(lines.size() == 4);
    for (size_t i = 0; i < 3; ++i) {
        CHECK(lines[i]["error"]["code"] == kInvalidRequest);
        CHECK(lines[i]["id"].is_null());
    }
    CHECK(lines[3]["id"] == 1);
    CHECK(lines[3]["result"] == nlohmann::json::object());
}

TEST_CASE("McpServer: HandleLine parse error and blank lines", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), nullptr, ServerInfo::Default(), in, out);

    auto response = server.HandleLine("{not json");
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == kParseError);
    CHECK((*response)["id"].is_null());

    CHECK_FALSE(server.HandleLine("").has_value());
    CHECK_FALSE(server.HandleLine("   \r").has_value());
}

// ===========================================================================
// Run loop
// ===========================================================================

TEST_CASE("McpServer: Run answers each request on its own line", "[mcp][server]") {
    std::istringstream in(
        R"({"jsonrpc":"2.0","id":1,"method":"initialize"})" "\n"
        R"({"jsonrpc":"2.0","method":"notifications/initialized"})" "\n"
        "\n"
        R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})" "\n"
        "garbage\n"
        R"({"jsonrpc":"2.0","id":"three","method":"tools/call","params":{"name":"echo","arguments":{"message":"hi"}}})" "\n");
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), nullptr, ServerInfo::Default(), in, out);

    server.Run();

    auto lines = ParseLines(out.str());
    REQUIRE(lines.size() == 4);
    CHECK(lines[0]["id"] == 1);
    CHECK(lines[1]["id"] == 2);
    CHECK(lines[2]["error"]["code"] == kParseError);
    CHECK(lines[3]["id"] == "three");
    CHECK(lines[3]["result"] == "hi");
    CHECK(server.RequestCount() == 3);
}

TEST_CASE("McpServer: Run stops when the stop flag is raised", "[mcp][server]") {
    std::istringstream in(R"({"jsonrpc":"2.0","id":1,"method":"ping"})" "\n");
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), nullptr, ServerInfo::Default(), in, out);

    volatile std::sig_atomic_t stop = 1;
    server.SetStopFlag(&stop);
    server.Run();
    CHECK(out.str().empty());
}

// ===========================================================================
// End to end: manifest + handlers + session gate over a mock backend
// ===========================================================================

namespace {

constexpr const char* kTestKeyVar = "IBMCLOUD_MCP_E2E_API_KEY";

struct CloudServer {
    MockBackend backend;
    SafeModeFilter filter;
    SessionContext session{backend, CredentialResolver(kTestKeyVar, "")};
    std::istringstream in;
    std::ostringstream out;
    std::optional<McpServer> server;

    CloudServer() {
        unsetenv(kTestKeyVar);
        auto manifest = LoadToolManifest(AssetPath("ibmcloud_tools.json"));
        REQUIRE(manifest.IsOk());
        ToolRegistry registry;
        registry.AddDescriptors(std::move(manifest).Value());
        RegisterCloudTools(registry, backend, filter);
        REQUIRE(registry.CheckComplete().IsOk());
        server.emplace(std::move(registry), &session, ServerInfo::Default(), in, out);
    }

    nlohmann::json Send(const std::string& line) {
        auto response = server->HandleLine(line);
        REQUIRE(response.has_value());
        return *response;
    }
};

} // anonymous namespace

TEST_CASE("End to end: get_target when logged in", "[mcp][server][e2e]") {
    CloudServer s;
    s.backend.EnqueueOutput("");  // status probe
    s.backend.EnqueueOutput(R"({"account":"acct1","region":"us-south"})");

    auto response = s.Send(
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"get_target"},"id":7})");
    CHECK(response == nlohmann::json::parse(
        R"({"jsonrpc":"2.0","result":"{\"account\":\"acct1\",\"region\":\"us-south\"}","id":7})"));
    CHECK(s.backend.CallLine(0) == "target");
    CHECK(s.backend.CallLine(1) == "target --output json");
}

TEST_CASE("End to end: not logged in and no credential", "[mcp][server][e2e]") {
    CloudServer s;
    s.backend.EnqueueOutput("FAILED\nNot logged in. Use 'ibmcloud login' to log in.", 1);

    auto response = s.Send(
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"get_target"},"id":7})");
    CHECK(response["id"] == 7);
    CHECK(response["error"]["code"] == -32603);
    CHECK(response["error"]["data"].get<std::string>().find("Not logged in") !=
          std::string::npos);
    CHECK(s.backend.CallCount() == 1);
}

TEST_CASE("End to end: execute_command in safe mode", "[mcp][server][e2e]") {
    CloudServer s;
    s.backend.EnqueueOutput("");  // status probe

    auto denied = s.Send(
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"execute_command","arguments":{"command":"resource service-instance-create x","safe_mode":true}},"id":8})");
    CHECK(denied["error"]["code"] == -32603);
    CHECK(denied["error"]["data"].get<std::string>().find("not allowed in safe mode") !=
          std::string::npos);

    s.backend.EnqueueOutput("");  // status probe
    s.backend.EnqueueOutput("Service instance x was created.");
    auto allowed = s.Send(
        R"({"jsonrpc":"2.0","method":"tools/call","params":{"name":"execute_command","arguments":{"command":"resource service-instance-create x","safe_mode":false}},"id":9})");
    CHECK(allowed["id"] == 9);
    CHECK(allowed["result"] == "Service instance x was created.");
}

TEST_CASE("End to end: tools/list advertises the manifest", "[mcp][server][e2e]") {
    CloudServer s;
    auto response = s.Send(R"({"jsonrpc":"2.0","method":"tools/list","id":1})");
    const auto& tools = response["result"]["tools"];
    REQUIRE(tools.size() == 9);
    CHECK(tools[0]["name"] == "list_resources");
    CHECK(tools[8]["name"] == "execute_command");
    CHECK(s.backend.CallCount() == 0);
}
