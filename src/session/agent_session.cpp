#include "session/agent_session.hpp"

#include <atomic>
#include <exception>
#include <utility>
#include "core/logging/logger.hpp"

namespace strand::session {

using core::errors::AgentError;
using core::errors::ErrorCategory;

AgentSession::AgentSession(std::string thread_id,
                           std::shared_ptr<memory::ThreadManager> threads,
                           runtime::StepExecutor executor)
    : thread_id_(std::move(thread_id)),
      threads_(std::move(threads)),
      executor_(std::move(executor)) {}

core::errors::Result<std::shared_ptr<AgentSession>> AgentSession::open(
    const std::string& thread_id, std::shared_ptr<memory::ThreadManager> threads,
    std::shared_ptr<model::ModelAdapter> model,
    std::shared_ptr<const tools::ToolRegistry> registry,
    const core::config::ExecutorConfig& config) {
    if (!threads || !model || !registry) {
        return AgentError{ErrorCategory::Validation,
                          "Session needs a thread manager, a model and a tool registry.",
                          "invalid_session"};
    }
    auto validated = core::config::validate(config);
    if (core::errors::is_error(validated)) {
        return core::errors::get_error(validated);
    }
    auto thread = threads->get(thread_id);
    if (core::errors::is_error(thread)) {
        return core::errors::get_error(thread);
    }

    STRAND_LOG_INFO("AgentSession: opened thread " + thread_id + " with " +
                    std::to_string(registry->size()) + " tool(s)");
    runtime::StepExecutor executor(std::move(model), std::move(registry), threads,
                                   core::errors::get_value(validated));
    return std::make_shared<AgentSession>(thread_id, std::move(threads), std::move(executor));
}

protocol::GenerationResult AgentSession::generate(
    const std::string& input, const protocol::GenerateOptions& options) const {
    return executor_.run(thread_id_, input, options, nullptr);
}

std::unique_ptr<runtime::EventStream> AgentSession::stream(
    const std::string& input, protocol::GenerateOptions options) const {
    if (!options.cancel_token) {
        options.cancel_token = std::make_shared<std::atomic_bool>(false);
    }
    const protocol::CancelToken token = options.cancel_token;

    auto producer = [executor = executor_, thread_id = thread_id_, input,
                     options](runtime::EventSink& sink) {
        try {
            executor.run(thread_id, input, options, &sink);
        } catch (const std::exception& e) {
            STRAND_LOG_ERROR("AgentSession: stream producer failed: " + std::string(e.what()));
            sink.emit(protocol::ErrorEvent{
                AgentError{ErrorCategory::Internal,
                           std::string("Generation aborted: ") + e.what(),
                           "generation_aborted"},
                {}});
        }
    };
    return std::make_unique<runtime::EventStream>(executor_.config().event_buffer_capacity,
                                                  token, std::move(producer));
}

}  // namespace strand::session
