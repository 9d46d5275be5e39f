#pragma once

#include <memory>
#include <string>
#include "core/config/executor_config.hpp"
#include "core/errors/agent_errors.hpp"
#include "memory/thread_manager.hpp"
#include "model/model_adapter.hpp"
#include "protocol/execution_contract.hpp"
#include "runtime/event_stream.hpp"
#include "runtime/step_executor.hpp"
#include "tools/tool_registry.hpp"

namespace strand::session {

// One conversation thread bound to a model, a tool registry snapshot and an
// executor configuration. Calls on one session are not queued; callers
// must not overlap generate/stream on the same thread.
class AgentSession {
public:
    static core::errors::Result<std::shared_ptr<AgentSession>> open(
        const std::string& thread_id, std::shared_ptr<memory::ThreadManager> threads,
        std::shared_ptr<model::ModelAdapter> model,
        std::shared_ptr<const tools::ToolRegistry> registry,
        const core::config::ExecutorConfig& config = {});

    protocol::GenerationResult generate(const std::string& input,
                                        const protocol::GenerateOptions& options = {}) const;

    // Dropping the returned stream before its terminal event cancels the run.
    std::unique_ptr<runtime::EventStream> stream(
        const std::string& input, protocol::GenerateOptions options = {}) const;

    const std::string& thread_id() const { return thread_id_; }
    const core::config::ExecutorConfig& config() const { return executor_.config(); }

    AgentSession(std::string thread_id, std::shared_ptr<memory::ThreadManager> threads,
                 runtime::StepExecutor executor);

private:
    std::string thread_id_;
    std::shared_ptr<memory::ThreadManager> threads_;
    runtime::StepExecutor executor_;
};

}  // namespace strand::session
