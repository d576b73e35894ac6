#pragma once

#include <ibmcloud_mcp/backend/i_backend.hpp>
#include <ibmcloud_mcp/backend/safe_mode.hpp>
#include <ibmcloud_mcp/mcp/tool_registry.hpp>

namespace ibmcloud_mcp {

// Bind the IBM Cloud tool handlers by name. Descriptors come from the tool
// manifest; ToolRegistry::CheckComplete() verifies the two agree.
// Handlers capture &backend and &filter by reference: both must outlive
// the registry.
void RegisterCloudTools(ToolRegistry& registry, IBackend& backend,
                        const SafeModeFilter& filter);

} // namespace ibmcloud_mcp
