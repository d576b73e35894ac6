#include <ibmcloud_mcp/mcp/tool_manifest.hpp>

#include <fstream>
#include <set>

namespace ibmcloud_mcp {

namespace {

using ManifestResult = Result<std::vector<ToolDescriptor>, Error>;

Error MakeManifestError(const std::string& message) {
    Error error;
    error.operation = "ToolManifest";
    error.message = message;
    error.category = ErrorCategory::Manifest;
    return error;
}

} // anonymous namespace

ManifestResult ParseToolManifest(const nlohmann::json& document) {
    const nlohmann::json* entries = &document;
    if (document.is_object()) {
        if (!document.contains("tools")) {
            return ManifestResult::Err(
                MakeManifestError("Manifest object has no 'tools' array"));
        }
        entries = &document["tools"];
    }
    if (!entries->is_array()) {
        return ManifestResult::Err(
            MakeManifestError("Manifest 'tools' must be an array"));
    }

    std::vector<ToolDescriptor> descriptors;
    std::set<std::string> seen;
    size_t index = 0;
    for (const auto& entry : *entries) {
        const auto where = "tool #" + std::to_string(index++);
        if (!entry.is_object()) {
            return ManifestResult::Err(MakeManifestError(where + " is not an object"));
        }
        if (!entry.contains("name") || !entry["name"].is_string() ||
            entry["name"].get<std::string>().empty()) {
            return ManifestResult::Err(
                MakeManifestError(where + " has no 'name'"));
        }
        auto name = entry["name"].get<std::string>();
        if (!seen.insert(name).second) {
            return ManifestResult::Err(
                MakeManifestError("Duplicate tool name: " + name));
        }

        std::string description;
        if (entry.contains("description")) {
            if (!entry["description"].is_string()) {
                return ManifestResult::Err(MakeManifestError(
                    "Tool '" + name + "': 'description' must be a string"));
            }
            description = entry["description"].get<std::string>();
        }

        nlohmann::json parameters = {{"type", "object"},
                                     {"properties", nlohmann::json::object()}};
        if (entry.contains("parameters")) {
            parameters = entry["parameters"];
            if (!parameters.is_object() || parameters.value("type", "") != "object") {
                return ManifestResult::Err(MakeManifestError(
                    "Tool '" + name +
                    "': 'parameters' must be a schema with type \"object\""));
            }
        }

        descriptors.push_back({std::move(name), std::move(description),
                               std::move(parameters)});
    }

    return ManifestResult::Ok(std::move(descriptors));
}

ManifestResult LoadToolManifest(std::string_view path) {
    std::ifstream in{std::string(path)};
    if (!in) {
        return ManifestResult::Err(MakeManifestError(
            "Tools manifest not found: " + std::string(path)));
    }

    nlohmann::json document;
    try {
        document = nlohmann::json::parse(in);
    } catch (const nlohmann::json::exception& e) {
        return ManifestResult::Err(MakeManifestError(
            "Failed to parse " + std::string(path) + ": " + e.what()));
    }
    return ParseToolManifest(document);
}

} // namespace ibmcloud_mcp
