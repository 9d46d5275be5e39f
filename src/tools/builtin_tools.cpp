#include "tools/builtin_tools.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <fstream>
#include <sstream>
#include <string>
#include <system_error>
#include <utility>
#include "tools/process_runner.hpp"

namespace strand::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

constexpr std::uintmax_t kMaxReadBytes = 1024 * 1024;

bool is_probably_binary(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    if (!in.is_open()) {
        return false;
    }
    char buffer[1024];
    in.read(buffer, static_cast<std::streamsize>(sizeof(buffer)));
    const std::streamsize read_bytes = in.gcount();
    return std::find(buffer, buffer + read_bytes, '\0') != buffer + read_bytes;
}

AgentError tool_failure(const std::string& message, const std::string& code) {
    return AgentError{ErrorCategory::ToolExecution, message, code};
}

std::uint32_t remaining_ms(const ToolContext& context) {
    const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
                          context.deadline - std::chrono::steady_clock::now())
                          .count();
    return left > 0 ? static_cast<std::uint32_t>(left) : 1u;
}

}  // namespace

protocol::ToolDescriptor calculator_descriptor() {
    protocol::ToolDescriptor descriptor;
    descriptor.name = "calculator";
    descriptor.description = "Applies a basic arithmetic operation to two numbers.";
    descriptor.parameter_schema = json::parse(R"({
        "type": "object",
        "properties": {
            "op": {"type": "string", "enum": ["add", "sub", "mul", "div"]},
            "a": {"type": "number"},
            "b": {"type": "number"}
        },
        "required": ["op", "a", "b"],
        "additionalProperties": false
    })");
    return descriptor;
}

core::errors::Result<json> calculate(const json& arguments, const ToolContext&) {
    const std::string op = arguments.at("op").get<std::string>();
    const json& a = arguments.at("a");
    const json& b = arguments.at("b");

    if (op == "div") {
        if (b.get<double>() == 0.0) {
            return tool_failure("Division by zero.", "division_by_zero");
        }
        return json(a.get<double>() / b.get<double>());
    }

    if (a.is_number_integer() && b.is_number_integer()) {
        const std::int64_t x = a.get<std::int64_t>();
        const std::int64_t y = b.get<std::int64_t>();
        if (op == "add") return json(x + y);
        if (op == "sub") return json(x - y);
        return json(x * y);
    }

    const double x = a.get<double>();
    const double y = b.get<double>();
    if (op == "add") return json(x + y);
    if (op == "sub") return json(x - y);
    return json(x * y);
}

ReadFileTool::ReadFileTool(policy::PolicyGuard guard) : guard_(std::move(guard)) {}

protocol::ToolDescriptor ReadFileTool::descriptor() {
    protocol::ToolDescriptor descriptor;
    descriptor.name = "read_file";
    descriptor.description = "Returns the contents of a text file in the workspace.";
    descriptor.parameter_schema = json::parse(R"({
        "type": "object",
        "properties": {"path": {"type": "string"}},
        "required": ["path"],
        "additionalProperties": false
    })");
    return descriptor;
}

core::errors::Result<json> ReadFileTool::invoke(const json& arguments,
                                                const ToolContext&) {
    auto resolved = guard_.resolve_path(arguments.at("path").get<std::string>());
    if (core::errors::is_error(resolved)) {
        return core::errors::get_error(resolved);
    }
    const std::filesystem::path& file_path = core::errors::get_value(resolved);

    std::error_code ec;
    if (!std::filesystem::is_regular_file(file_path, ec) || ec) {
        return tool_failure("Not a regular file: " + file_path.string(), "file_not_found");
    }
    const auto size = std::filesystem::file_size(file_path, ec);
    if (ec || size > kMaxReadBytes) {
        return tool_failure("File too large to read: " + file_path.string(),
                            "file_too_large");
    }
    if (is_probably_binary(file_path)) {
        return tool_failure("Refusing to read binary file: " + file_path.string(),
                            "binary_file");
    }

    std::ifstream in(file_path);
    if (!in.is_open()) {
        return tool_failure("Failed to open file: " + file_path.string(), "file_open_failed");
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();

    json output;
    output["path"] = file_path.string();
    output["content"] = guard_.truncate_output(buffer.str());
    return output;
}

RunCommandTool::RunCommandTool(policy::PolicyGuard guard) : guard_(std::move(guard)) {}

protocol::ToolDescriptor RunCommandTool::descriptor() {
    protocol::ToolDescriptor descriptor;
    descriptor.name = "run_command";
    descriptor.description =
        "Runs a shell command in the workspace and returns exit code and output.";
    descriptor.parameter_schema = json::parse(R"({
        "type": "object",
        "properties": {
            "command": {"type": "string"},
            "cwd": {"type": "string"}
        },
        "required": ["command"],
        "additionalProperties": false
    })");
    return descriptor;
}

core::errors::Result<json> RunCommandTool::invoke(const json& arguments,
                                                  const ToolContext& context) {
    auto command = guard_.check_command(arguments.at("command").get<std::string>());
    if (core::errors::is_error(command)) {
        return core::errors::get_error(command);
    }
    auto cwd = guard_.resolve_path(arguments.value("cwd", std::string(".")));
    if (core::errors::is_error(cwd)) {
        return core::errors::get_error(cwd);
    }

    auto outcome_result = run_process(core::errors::get_value(command),
                                      core::errors::get_value(cwd),
                                      remaining_ms(context), context.cancel_token);
    if (core::errors::is_error(outcome_result)) {
        return core::errors::get_error(outcome_result);
    }
    const auto& outcome = core::errors::get_value(outcome_result);
    if (outcome.cancelled) {
        return tool_failure("Command cancelled.", "command_cancelled");
    }
    if (outcome.timed_out) {
        return tool_failure("Command timed out.", "command_timed_out");
    }

    json output;
    output["exit_code"] = outcome.exit_code;
    output["stdout"] = guard_.truncate_output(outcome.stdout_text);
    output["stderr"] = guard_.truncate_output(outcome.stderr_text);
    output["duration_ms"] = outcome.duration_ms;
    return output;
}

core::errors::Result<std::size_t> register_builtin_tools(ToolRegistry& registry,
                                                         const BuiltinToolOptions& options) {
    std::size_t count = 0;
    auto registered = registry.register_function(calculator_descriptor(), calculate);
    if (core::errors::is_error(registered)) {
        return core::errors::get_error(registered);
    }
    ++count;

    if (!options.enable_read_file && !options.enable_run_command) {
        return count;
    }
    auto guard_result =
        policy::PolicyGuard::for_workspace(options.workspace_root, options.command_policy);
    if (core::errors::is_error(guard_result)) {
        return core::errors::get_error(guard_result);
    }
    const policy::PolicyGuard& guard = core::errors::get_value(guard_result);

    if (options.enable_read_file) {
        registered = registry.register_tool(ReadFileTool::descriptor(),
                                            std::make_shared<ReadFileTool>(guard));
        if (core::errors::is_error(registered)) {
            return core::errors::get_error(registered);
        }
        ++count;
    }
    if (options.enable_run_command) {
        registered = registry.register_tool(RunCommandTool::descriptor(),
                                            std::make_shared<RunCommandTool>(guard));
        if (core::errors::is_error(registered)) {
            return core::errors::get_error(registered);
        }
        ++count;
    }
    return count;
}

}  // namespace strand::tools
