#pragma once

#include <cstddef>
#include <cstdint>
#include <memory>
#include "protocol/execution_contract.hpp"
#include "protocol/tool_contract.hpp"
#include "tools/tool_registry.hpp"

namespace strand::tools {

// Runs one tool call against a registry snapshot. Never throws: unknown
// tools, schema mismatches, handler failures and timeouts all come back
// as a ToolCallResult carrying a ToolError.
class ToolInvoker {
public:
    ToolInvoker(std::shared_ptr<const ToolRegistry> registry, std::uint32_t timeout_ms);

    // A set `cancel_token` is forwarded to the handler's context; the call
    // still runs until the handler returns or the deadline passes.
    //
    // The handler runs on its own detached thread. On timeout its context
    // token is flipped and invoke() returns at once; the thread lives on
    // until the handler returns, and whatever it returns then is logged and
    // dropped. A handler that ignores its token therefore holds a thread
    // until it finishes.
    protocol::ToolCallResult invoke(const protocol::ToolCall& call,
                                    const protocol::CancelToken& cancel_token = nullptr) const;

    // Handlers that timed out and have not returned yet, process-wide.
    static std::size_t abandoned_calls();

private:
    std::shared_ptr<const ToolRegistry> registry_;
    std::uint32_t timeout_ms_;
};

}  // namespace strand::tools
