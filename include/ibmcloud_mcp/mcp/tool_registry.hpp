#pragma once

#include <ibmcloud_mcp/core/result.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace ibmcloud_mcp {

// ---------------------------------------------------------------------------
// ToolDescriptor — one tool as advertised by tools/list.
// ---------------------------------------------------------------------------
struct ToolDescriptor {
    std::string name;
    std::string description;
    nlohmann::json parameters;  // JSON Schema object

    [[nodiscard]] nlohmann::json ToJson() const {
        return {{"name", name},
                {"description", description},
                {"parameters", parameters}};
    }
};

// ---------------------------------------------------------------------------
// ToolResult — handler outcome. On success `output` becomes the JSON-RPC
// result; on failure it becomes the error data.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    std::string output;

    static ToolResult Ok(std::string text) { return {false, std::move(text)}; }
    static ToolResult Fail(std::string text) { return {true, std::move(text)}; }
};

// A tool handler takes the JSON arguments object and returns a ToolResult.
using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

struct ToolBinding {
    ToolHandler handler;
    bool requires_session = true;  // run the session gate first
};

// ---------------------------------------------------------------------------
// ToolRegistry — descriptors (in manifest order) plus an explicit
// name -> handler map. Both sides must name the same set of tools; see
// CheckComplete().
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Add descriptors loaded from a manifest.
    void AddDescriptors(std::vector<ToolDescriptor> descriptors);

    void Bind(const std::string& name, ToolHandler handler,
              bool requires_session = true);

    // Descriptor and handler in one call.
    void Register(const std::string& name,
                  const std::string& description,
                  const nlohmann::json& parameters,
                  ToolHandler handler,
                  bool requires_session = true);

    [[nodiscard]] const std::vector<ToolDescriptor>& Tools() const noexcept {
        return descriptors_;
    }

    [[nodiscard]] bool HasTool(const std::string& name) const;

    [[nodiscard]] bool RequiresSession(const std::string& name) const;

    // Fails with ErrorCategory::Manifest listing descriptors without a
    // handler and handlers without a descriptor.
    [[nodiscard]] Result<void, Error> CheckComplete() const;

    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& arguments) const;

private:
    std::vector<ToolDescriptor> descriptors_;
    std::map<std::string, ToolBinding> bindings_;
};

} // namespace ibmcloud_mcp
