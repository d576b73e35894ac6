#include <catch2/catch_test_macros.hpp>

#include <ibmcloud_mcp/mcp/tool_manifest.hpp>

#include <set>
#include <string>

using namespace ibmcloud_mcp;

namespace {

std::string TestDataPath(const std::string& filename) {
    std::string this_file = __FILE__;
    auto last_slash = this_file.rfind('/');
    auto test_dir = this_file.substr(0, last_slash);   // .../test/mcp
    auto test_root = test_dir.substr(0, test_dir.rfind('/'));  // .../test
    return test_root + "/testdata/" + filename;
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
// ParseToolManifest
// ===========================================================================

TEST_CASE("ParseToolManifest: object with tools array", "[mcp][manifest]") {
    auto doc = nlohmann::json::parse(R"({
        "tools": [
            {"name": "get_target", "description": "Show target",
             "parameters": {"type": "object", "properties": {}}}
        ]
    })");
    auto result = ParseToolManifest(doc);
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().size() == 1);
    CHECK(result.Value()[0].name == "get_target");
    CHECK(result.Value()[0].description == "Show target");
}

TEST_CASE("ParseToolManifest: bare array and defaults", "[mcp][manifest]") {
    auto doc = nlohmann::json::parse(R"([{"name": "list_regions"}])");
    auto result = ParseToolManifest(doc);
    REQUIRE(result.IsOk());
    const auto& tool = result.Value()[0];
    CHECK(tool.description.empty());
    CHECK(tool.parameters["type"] == "object");
    CHECK(tool.parameters["properties"].is_object());
}

TEST_CASE("ParseToolManifest: rejects malformed entries", "[mcp][manifest]") {
    SECTION("object without tools") {
        auto result = ParseToolManifest(nlohmann::json::parse(R"({"x": 1})"));
        REQUIRE(result.IsErr());
        CHECK(result.Error().category == ErrorCategory::Manifest);
    }
    SECTION("tools not an array") {
        CHECK(ParseToolManifest(nlohmann::json::parse(R"({"tools": {}})")).IsErr());
    }
    SECTION("entry not an object") {
        CHECK(ParseToolManifest(nlohmann::json::parse(R"(["get_target"])")).IsErr());
    }
    SECTION("missing name") {
        auto result = ParseToolManifest(nlohmann::json::parse(R"([{"description": "x"}])"));
        REQUIRE(result.IsErr());
        CHECK(result.Error().message == "tool #0 has no 'name'");
    }
    SECTION("empty name") {
        CHECK(ParseToolManifest(nlohmann::json::parse(R"([{"name": ""}])")).IsErr());
    }
    SECTION("description not a string") {
        CHECK(ParseToolManifest(
                  nlohmann::json::parse(R"([{"name": "a", "description": 3}])"))
                  .IsErr());
    }
    SECTION("parameters not an object schema") {
        CHECK(ParseToolManifest(nlohmann::json::parse(
                  R"([{"name": "a", "parameters": {"type": "array"}}])"))
                  .IsErr());
        CHECK(ParseToolManifest(nlohmann::json::parse(
                  R"([{"name": "a", "parameters": []}])"))
                  .IsErr());
    }
}

// ===========================================================================
// LoadToolManifest
// ===========================================================================

TEST_CASE("LoadToolManifest: valid file", "[mcp][manifest]") {
    auto result = LoadToolManifest(TestDataPath("valid_tools.json"));
    REQUIRE(result.IsOk());
    REQUIRE(result.Value().size() == 2);
    CHECK(result.Value()[0].name == "get_target");
    CHECK(result.Value()[1].name == "execute_command");
    CHECK(result.Value()[1].parameters["required"][0] == "command");
}

TEST_CASE("LoadToolManifest: duplicate names", "[mcp][manifest]") {
    auto result = LoadToolManifest(TestDataPath("duplicate_tools.json"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Duplicate tool name: get_target");
}

TEST_CASE("LoadToolManifest: malformed JSON", "[mcp][manifest]") {
    auto result = LoadToolManifest(TestDataPath("malformed_tools.json"));
    REQUIRE(result.IsErr());
    CHECK(result.Error().message.find("Failed to parse") != std::string::npos);
}

TEST_CASE("LoadToolManifest: missing file", "[mcp][manifest]") {
    auto path = TestDataPath("no_such_tools.json");
    auto result = LoadToolManifest(path);
    REQUIRE(result.IsErr());
    CHECK(result.Error().message == "Tools manifest not found: " + path);
    CHECK(result.Error().IsStartupError());
}

TEST_CASE("LoadToolManifest: shipped manifest lists every cloud tool", "[mcp][manifest]") {
    auto result = LoadToolManifest(AssetPath("ibmcloud_tools.json"));
    REQUIRE(result.IsOk());

    std::set<std::string> names;
    for (const auto& tool : result.Value()) {
        names.insert(tool.name);
        CHECK_FALSE(tool.description.empty());
    }
    CHECK(names == std::set<std::string>{
        "list_resources", "get_target", "list_vpc_instances", "list_vpcs",
        "list_resource_groups", "list_regions", "get_account_info",
        "list_cf_apps", "execute_command"});
}
