#include "tools/tool_registry.hpp"

#include <cctype>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/schema_validator.hpp"

namespace strand::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

bool is_valid_tool_name(const std::string& name) {
    if (name.empty() || name.size() > 64) {
        return false;
    }
    for (const char c : name) {
        if (std::isalnum(static_cast<unsigned char>(c)) == 0 && c != '_' && c != '-') {
            return false;
        }
    }
    return true;
}

}  // namespace

core::errors::Result<std::string> ToolRegistry::register_tool(
    protocol::ToolDescriptor descriptor, std::shared_ptr<ToolHandler> handler) {
    if (!is_valid_tool_name(descriptor.name)) {
        return AgentError{ErrorCategory::Validation,
                          "Invalid tool name: '" + descriptor.name + "'",
                          "invalid_tool_name",
                          "Use 1-64 letters, digits, '_' or '-'."};
    }
    if (!handler) {
        return AgentError{ErrorCategory::Validation,
                          "Tool '" + descriptor.name + "' has no handler.",
                          "missing_tool_handler"};
    }
    if (tools_.find(descriptor.name) != tools_.end()) {
        return AgentError{ErrorCategory::Validation,
                          "Tool already registered: " + descriptor.name,
                          "duplicate_tool"};
    }

    const SchemaValidator validator;
    auto schema = validator.check_schema(descriptor.parameter_schema);
    if (core::errors::is_error(schema)) {
        const auto& err = core::errors::get_error(schema);
        return AgentError{err.category,
                          "Tool '" + descriptor.name + "': " + err.message, err.code};
    }

    std::string name = descriptor.name;
    tools_.emplace(name, RegisteredTool{std::move(descriptor), std::move(handler)});
    STRAND_LOG_DEBUG("ToolRegistry: registered " + name);
    return name;
}

core::errors::Result<std::string> ToolRegistry::register_function(
    protocol::ToolDescriptor descriptor, ToolFunction function) {
    if (!function) {
        return AgentError{ErrorCategory::Validation,
                          "Tool '" + descriptor.name + "' has no handler.",
                          "missing_tool_handler"};
    }
    return register_tool(std::move(descriptor),
                         std::make_shared<FunctionTool>(std::move(function)));
}

std::vector<protocol::ToolDescriptor> ToolRegistry::describe_all() const {
    std::vector<protocol::ToolDescriptor> out;
    out.reserve(tools_.size());
    for (const auto& [name, tool] : tools_) {
        out.push_back(tool.descriptor);
    }
    return out;
}

const RegisteredTool* ToolRegistry::find(const std::string& name) const {
    auto it = tools_.find(name);
    return it == tools_.end() ? nullptr : &it->second;
}

std::shared_ptr<const ToolRegistry> ToolRegistry::snapshot() const {
    return std::make_shared<const ToolRegistry>(*this);
}

}  // namespace strand::tools
