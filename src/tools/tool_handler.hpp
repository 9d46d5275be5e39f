#pragma once

#include <chrono>
#include <functional>
#include <string>
#include <utility>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace strand::tools {

// Passed to every handler invocation. `cancel_token` flips when the call
// runs past its deadline; long-running handlers should poll it and return.
struct ToolContext {
    std::string call_id;
    protocol::CancelToken cancel_token;
    std::chrono::steady_clock::time_point deadline;
};

class ToolHandler {
public:
    virtual ~ToolHandler() = default;

    virtual core::errors::Result<nlohmann::json> invoke(const nlohmann::json& arguments,
                                                        const ToolContext& context) = 0;
};

using ToolFunction = std::function<core::errors::Result<nlohmann::json>(
    const nlohmann::json&, const ToolContext&)>;

// Adapts a plain callable to the handler interface.
class FunctionTool : public ToolHandler {
public:
    explicit FunctionTool(ToolFunction function) : function_(std::move(function)) {}

    core::errors::Result<nlohmann::json> invoke(const nlohmann::json& arguments,
                                                const ToolContext& context) override {
        return function_(arguments, context);
    }

private:
    ToolFunction function_;
};

}  // namespace strand::tools
