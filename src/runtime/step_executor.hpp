#pragma once

#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include "core/config/executor_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "memory/thread_manager.hpp"
#include "model/model_adapter.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/execution_contract.hpp"
#include "runtime/event_stream.hpp"
#include "tools/tool_invoker.hpp"
#include "tools/tool_registry.hpp"

namespace strand::runtime {

// Attempt counter and next backoff delay for one model call.
struct RetryState {
    std::uint32_t attempt = 1;
    std::uint32_t next_delay_ms = 0;

    explicit RetryState(const core::config::RetryPolicy& policy);

    bool exhausted(const core::config::RetryPolicy& policy) const;
    void advance(const core::config::RetryPolicy& policy);
};

// Sleeps in short slices; returns false as soon as the token is set.
bool sleep_unless_cancelled(std::uint32_t duration_ms, const protocol::CancelToken& token);

// Serializes emits from the coordinating thread and tool workers. A null
// sink swallows events (batch mode).
class SerializedSink {
public:
    explicit SerializedSink(EventSink* sink) : sink_(sink) {}

    void emit(protocol::AgentEvent event);

private:
    std::mutex mutex_;
    EventSink* sink_;
};

// Drives the model/tool loop for one generation on one thread.
//
// The user message is appended before the first model call. Each tool step
// appends the assistant tool-call message and its results as one batch
// once every call has finished, so history only ever holds complete steps.
class StepExecutor {
public:
    StepExecutor(std::shared_ptr<model::ModelAdapter> model,
                 std::shared_ptr<const tools::ToolRegistry> registry,
                 std::shared_ptr<memory::ThreadManager> threads,
                 core::config::ExecutorConfig config);

    // Always ends with exactly one terminal event on `sink` when one is given.
    protocol::GenerationResult run(const std::string& thread_id, const std::string& input,
                                   const protocol::GenerateOptions& options,
                                   EventSink* sink) const;

    const core::config::ExecutorConfig& config() const { return config_; }

private:
    core::errors::Result<model::ModelResponse> call_model(
        const std::vector<protocol::Message>& context,
        const std::vector<protocol::ToolDescriptor>& tools, std::uint32_t step_index,
        const protocol::CancelToken& cancel_token, SerializedSink& events,
        bool& streamed) const;

    std::vector<protocol::ToolCallResult> invoke_tools(
        const std::vector<protocol::ToolCall>& calls,
        const protocol::CancelToken& cancel_token, SerializedSink& events) const;

    void emit_text(const std::string& text, SerializedSink& events) const;

    std::shared_ptr<model::ModelAdapter> model_;
    std::shared_ptr<const tools::ToolRegistry> registry_;
    std::shared_ptr<memory::ThreadManager> threads_;
    core::config::ExecutorConfig config_;
    tools::ToolInvoker invoker_;
};

}  // namespace strand::runtime
