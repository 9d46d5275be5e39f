#pragma once

#include <cstddef>
#include <filesystem>
#include <memory>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "policy/policy_guard.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_handler.hpp"
#include "tools/tool_registry.hpp"

namespace strand::tools {

struct BuiltinToolOptions {
    std::filesystem::path workspace_root = std::filesystem::current_path();
    policy::CommandPolicy command_policy;
    bool enable_read_file = true;
    bool enable_run_command = false;
};

// {op: add|sub|mul|div, a: number, b: number} -> number
protocol::ToolDescriptor calculator_descriptor();
core::errors::Result<nlohmann::json> calculate(const nlohmann::json& arguments,
                                               const ToolContext& context);

// Reads a UTF-8 text file inside the workspace.
class ReadFileTool : public ToolHandler {
public:
    explicit ReadFileTool(policy::PolicyGuard guard);

    static protocol::ToolDescriptor descriptor();

    core::errors::Result<nlohmann::json> invoke(const nlohmann::json& arguments,
                                                const ToolContext& context) override;

private:
    policy::PolicyGuard guard_;
};

// Runs a shell command inside the workspace under the command policy.
class RunCommandTool : public ToolHandler {
public:
    explicit RunCommandTool(policy::PolicyGuard guard);

    static protocol::ToolDescriptor descriptor();

    core::errors::Result<nlohmann::json> invoke(const nlohmann::json& arguments,
                                                const ToolContext& context) override;

private:
    policy::PolicyGuard guard_;
};

// Registers calculator plus whichever file/command tools `options` enables.
// Returns the number of tools registered.
core::errors::Result<std::size_t> register_builtin_tools(ToolRegistry& registry,
                                                         const BuiltinToolOptions& options);

}  // namespace strand::tools
