#pragma once

#include <cstdint>
#include <functional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/execution_contract.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace strand::model {

// Either final text or at least one tool call.
struct ModelResponse {
    std::string text;
    std::vector<protocol::ToolCall> tool_calls;

    bool has_tool_calls() const { return !tool_calls.empty(); }
};

using TextDeltaCallback = std::function<void(const std::string& delta)>;

struct CompletionOptions {
    std::uint32_t step_index = 0;
    protocol::CancelToken cancel_token;

    // Adapters that stream call this for each text fragment as it arrives.
    TextDeltaCallback on_text_delta;
};

// Vendor-neutral model contract. Failures are reported with
// ErrorCategory::TransientProvider (worth retrying) or ErrorCategory::Provider.
class ModelAdapter {
public:
    virtual ~ModelAdapter() = default;

    virtual core::errors::Result<ModelResponse> complete(
        const std::vector<protocol::Message>& context,
        const std::vector<protocol::ToolDescriptor>& tools,
        const CompletionOptions& options) = 0;
};

}  // namespace strand::model
