#include <ibmcloud_mcp/mcp/mcp_tool_handlers.hpp>

#include <ibmcloud_mcp/backend/process_invoker.hpp>
#include <ibmcloud_mcp/core/log.hpp>

#include <nlohmann/json.hpp>

#include <string>

namespace ibmcloud_mcp {

namespace {

constexpr const char* kVpcPlugin = "vpc-infrastructure";

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

// Get an optional string argument. Missing, null and non-string values read
// as the default.
std::string OptString(const nlohmann::json& args, const std::string& key,
                      const std::string& default_val = "") {
    if (args.is_object() && args.contains(key) && args[key].is_string()) {
        return args[key].get<std::string>();
    }
    return default_val;
}

// Get an optional boolean argument. Accepts true/false and the strings
// "true"/"false".
bool OptBool(const nlohmann::json& args, const std::string& key,
             bool default_val) {
    if (!args.is_object() || !args.contains(key)) {
        return default_val;
    }
    const auto& value = args[key];
    if (value.is_boolean()) {
        return value.get<bool>();
    }
    if (value.is_string()) {
        const auto text = value.get<std::string>();
        if (text == "true") return true;
        if (text == "false") return false;
    }
    return default_val;
}

// ---------------------------------------------------------------------------
// Backend helpers
// ---------------------------------------------------------------------------

std::string DescribeFailure(const Error& error) {
    std::string text = error.message;
    if (error.detail.has_value() && !error.detail->empty()) {
        text += "\n" + *error.detail;
    }
    return text;
}

// Run the main query of a tool. Any failure becomes
// "Error <doing>: <captured output>".
ToolResult RunQuery(IBackend& backend, const CommandLine& command,
                    const std::string& doing) {
    auto result = backend.Invoke(command, backend.DefaultTimeout());
    if (result.IsErr()) {
        return ToolResult::Fail("Error " + doing + ": " +
                                DescribeFailure(result.Error()));
    }
    const auto& run = result.Value();
    if (!run.Succeeded()) {
        return ToolResult::Fail("Error " + doing + ": " + run.output);
    }
    return ToolResult::Ok(run.output);
}

// Best-effort `target ...`; the caller carries on regardless.
void Retarget(IBackend& backend, std::vector<std::string> args) {
    CommandLine command;
    command.args.push_back("target");
    command.args.insert(command.args.end(), args.begin(), args.end());

    auto result = backend.Invoke(command, backend.DefaultTimeout());
    if (result.IsErr()) {
        LogWarn("tools", "retarget failed: " + result.Error().ToString());
    } else if (!result.Value().Succeeded()) {
        LogWarn("tools", "retarget '" + command.ToString() + "' exited with " +
                             std::to_string(result.Value().exit_code));
    }
}

bool HasPlugin(IBackend& backend, const std::string& plugin) {
    auto result = backend.Invoke(CommandLine{{"plugin", "list"}, {}},
                                 backend.DefaultTimeout());
    if (result.IsErr() || !result.Value().Succeeded()) {
        return false;
    }
    return result.Value().output.find(plugin) != std::string::npos;
}

ToolResult MissingVpcPlugin() {
    return ToolResult::Fail(
        std::string("Error: IBM Cloud VPC plugin is not installed. "
                    "Install with: ibmcloud plugin install ") + kVpcPlugin);
}

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

// list_resources
ToolResult HandleListResources(IBackend& backend, const nlohmann::json& args) {
    auto resource_type = OptString(args, "resource_type", "all");
    auto region = OptString(args, "region");

    CommandLine command{{"resource", "service-instances"}, {}};
    if (!resource_type.empty() && resource_type != "all") {
        command.args.push_back("--service-name");
        command.args.push_back(resource_type);
    }
    if (!region.empty()) {
        command.args.push_back("--location");
        command.args.push_back(region);
    }
    command.args.push_back("--output");
    command.args.push_back("json");
    return RunQuery(backend, command, "listing resources");
}

// get_target
ToolResult HandleGetTarget(IBackend& backend, const nlohmann::json&) {
    return RunQuery(backend, CommandLine{{"target", "--output", "json"}, {}},
                    "getting target information");
}

// list_vpc_instances
ToolResult HandleListVpcInstances(IBackend& backend,
                                  const nlohmann::json& args) {
    if (!HasPlugin(backend, kVpcPlugin)) {
        return MissingVpcPlugin();
    }
    auto region = OptString(args, "region");
    if (!region.empty()) {
        Retarget(backend, {"-r", region});
    }
    return RunQuery(backend,
                    CommandLine{{"is", "instances", "--output", "json"}, {}},
                    "listing VPC instances");
}

// list_vpcs
ToolResult HandleListVpcs(IBackend& backend, const nlohmann::json& args) {
    if (!HasPlugin(backend, kVpcPlugin)) {
        return MissingVpcPlugin();
    }
    auto region = OptString(args, "region");
    if (!region.empty()) {
        Retarget(backend, {"-r", region});
    }
    return RunQuery(backend, CommandLine{{"is", "vpcs", "--output", "json"}, {}},
                    "listing VPCs");
}

// list_resource_groups
ToolResult HandleListResourceGroups(IBackend& backend, const nlohmann::json&) {
    return RunQuery(backend,
                    CommandLine{{"resource", "groups", "--output", "json"}, {}},
                    "listing resource groups");
}

// list_regions
ToolResult HandleListRegions(IBackend& backend, const nlohmann::json&) {
    return RunQuery(backend, CommandLine{{"regions", "--output", "json"}, {}},
                    "listing regions");
}

// get_account_info
ToolResult HandleGetAccountInfo(IBackend& backend, const nlohmann::json&) {
    return RunQuery(backend,
                    CommandLine{{"account", "show", "--output", "json"}, {}},
                    "getting account info");
}

// list_cf_apps — `cf apps` has no JSON mode, so the text is wrapped.
ToolResult HandleListCfApps(IBackend& backend, const nlohmann::json& args) {
    auto org = OptString(args, "org");
    auto space = OptString(args, "space");
    if (!org.empty()) {
        std::vector<std::string> target_args{"-o", org};
        if (!space.empty()) {
            target_args.push_back("-s");
            target_args.push_back(space);
        }
        Retarget(backend, std::move(target_args));
    }

    auto result = RunQuery(backend, CommandLine{{"cf", "apps"}, {}},
                           "listing CF apps");
    if (result.is_error) {
        return result;
    }
    nlohmann::json wrapped = {{"apps", result.output}};
    return ToolResult::Ok(wrapped.dump());
}

// execute_command
ToolResult HandleExecuteCommand(IBackend& backend, const SafeModeFilter& filter,
                                const nlohmann::json& args) {
    auto command = OptString(args, "command");
    if (command.empty()) {
        return ToolResult::Fail("Error: No command provided");
    }

    bool safe_mode = OptBool(args, "safe_mode", true);
    if (!filter.IsAllowed(command, safe_mode)) {
        LogWarn("tools", "safe mode rejected: " + command);
        return ToolResult::Fail(SafeModeDenial(command));
    }

    auto words = SplitCommandWords(command);
    if (words.empty()) {
        return ToolResult::Fail("Error: No command provided");
    }
    return RunQuery(backend, CommandLine{std::move(words), {}},
                    "executing command");
}

} // anonymous namespace

void RegisterCloudTools(ToolRegistry& registry, IBackend& backend,
                        const SafeModeFilter& filter) {
    registry.Bind("list_resources", [&backend](const nlohmann::json& args) {
        return HandleListResources(backend, args);
    });
    registry.Bind("get_target", [&backend](const nlohmann::json& args) {
        return HandleGetTarget(backend, args);
    });
    registry.Bind("list_vpc_instances", [&backend](const nlohmann::json& args) {
        return HandleListVpcInstances(backend, args);
    });
    registry.Bind("list_vpcs", [&backend](const nlohmann::json& args) {
        return HandleListVpcs(backend, args);
    });
    registry.Bind("list_resource_groups", [&backend](const nlohmann::json& args) {
        return HandleListResourceGroups(backend, args);
    });
    registry.Bind("list_regions", [&backend](const nlohmann::json& args) {
        return HandleListRegions(backend, args);
    });
    registry.Bind("get_account_info", [&backend](const nlohmann::json& args) {
        return HandleGetAccountInfo(backend, args);
    });
    registry.Bind("list_cf_apps", [&backend](const nlohmann::json& args) {
        return HandleListCfApps(backend, args);
    });
    registry.Bind("execute_command",
                  [&backend, &filter](const nlohmann::json& args) {
                      return HandleExecuteCommand(backend, filter, args);
                  });
}

} // namespace ibmcloud_mcp
