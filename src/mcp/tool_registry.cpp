#include <ibmcloud_mcp/mcp/tool_registry.hpp>

#include <algorithm>
#include <set>

namespace ibmcloud_mcp {

void ToolRegistry::AddDescriptors(std::vector<ToolDescriptor> descriptors) {
    for (auto& descriptor : descriptors) {
        descriptors_.push_back(std::move(descriptor));
    }
}

void ToolRegistry::Bind(const std::string& name, ToolHandler handler,
                        bool requires_session) {
    bindings_[name] = ToolBinding{std::move(handler), requires_session};
}

void ToolRegistry::Register(const std::string& name,
                            const std::string& description,
                            const nlohmann::json& parameters,
                            ToolHandler handler,
                            bool requires_session) {
    descriptors_.push_back({name, description, parameters});
    Bind(name, std::move(handler), requires_session);
}

bool ToolRegistry::HasTool(const std::string& name) const {
    if (bindings_.count(name) == 0) {
        return false;
    }
    return std::any_of(descriptors_.begin(), descriptors_.end(),
                       [&](const ToolDescriptor& d) { return d.name == name; });
}

bool ToolRegistry::RequiresSession(const std::string& name) const {
    auto it = bindings_.find(name);
    return it == bindings_.end() || it->second.requires_session;
}

Result<void, Error> ToolRegistry::CheckComplete() const {
    std::set<std::string> described;
    std::string missing_handlers;
    for (const auto& descriptor : descriptors_) {
        described.insert(descriptor.name);
        if (bindings_.count(descriptor.name) == 0) {
            if (!missing_handlers.empty()) missing_handlers += ", ";
            missing_handlers += descriptor.name;
        }
    }

    std::string missing_descriptors;
    for (const auto& [name, binding] : bindings_) {
        if (described.count(name) == 0) {
            if (!missing_descriptors.empty()) missing_descriptors += ", ";
            missing_descriptors += name;
        }
    }

    if (missing_handlers.empty() && missing_descriptors.empty()) {
        return Result<void, Error>::Ok();
    }

    std::string message;
    if (!missing_handlers.empty()) {
        message = "tools without a handler: " + missing_handlers;
    }
    if (!missing_descriptors.empty()) {
        if (!message.empty()) message += "; ";
        message += "handlers without a manifest entry: " + missing_descriptors;
    }
    Error error;
    error.operation = "ToolRegistry";
    error.message = message;
    error.category = ErrorCategory::Manifest;
    return Result<void, Error>::Err(std::move(error));
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& arguments) const {
    auto it = bindings_.find(name);
    if (it == bindings_.end()) {
        return ToolResult::Fail("Unknown tool: " + name);
    }

    try {
        return it->second.handler(arguments);
    } catch (const std::exception& e) {
        return ToolResult::Fail(std::string("Tool error: ") + e.what());
    }
}

} // namespace ibmcloud_mcp
