#pragma once

#include <cstddef>
#include <map>
#include <memory>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_handler.hpp"

namespace strand::tools {

struct RegisteredTool {
    protocol::ToolDescriptor descriptor;
    std::shared_ptr<ToolHandler> handler;
};

// Named set of callable tools. Build it up front, then hand sessions a
// snapshot(): the snapshot is immutable, so later registrations never
// show up in a session that is already running.
class ToolRegistry {
public:
    core::errors::Result<std::string> register_tool(protocol::ToolDescriptor descriptor,
                                                    std::shared_ptr<ToolHandler> handler);

    core::errors::Result<std::string> register_function(protocol::ToolDescriptor descriptor,
                                                        ToolFunction function);

    // Sorted by name.
    std::vector<protocol::ToolDescriptor> describe_all() const;

    const RegisteredTool* find(const std::string& name) const;
    bool has(const std::string& name) const { return find(name) != nullptr; }
    std::size_t size() const { return tools_.size(); }

    std::shared_ptr<const ToolRegistry> snapshot() const;

private:
    std::map<std::string, RegisteredTool> tools_;
};

}  // namespace strand::tools
