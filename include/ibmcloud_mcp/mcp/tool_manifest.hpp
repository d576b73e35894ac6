#pragma once

#include <ibmcloud_mcp/core/result.hpp>
#include <ibmcloud_mcp/mcp/tool_registry.hpp>

#include <string>
#include <string_view>
#include <vector>

#include <nlohmann/json.hpp>

namespace ibmcloud_mcp {

// Parse a manifest document: {"tools": [...]} or a bare array of
// {name, description, parameters} objects. Names must be unique and
// `parameters` must be a JSON Schema object with "type": "object".
Result<std::vector<ToolDescriptor>, Error> ParseToolManifest(
    const nlohmann::json& document);

// Read and parse a manifest file. A missing or malformed file is an
// ErrorCategory::Manifest error.
Result<std::vector<ToolDescriptor>, Error> LoadToolManifest(
    std::string_view path);

} // namespace ibmcloud_mcp
