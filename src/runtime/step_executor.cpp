#include "runtime/step_executor.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <thread>
#include <utility>
#include "core/config/id_generator.hpp"
#include "core/logging/logger.hpp"
#include "core/time/timestamps.hpp"

namespace strand::runtime {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::AgentStep;
using protocol::GenerationResult;
using protocol::GenerationStatus;
using protocol::Message;
using protocol::Role;
using protocol::ToolCall;
using protocol::ToolCallResult;

namespace {

constexpr std::uint32_t kSleepSliceMs = 10;

AgentError cancelled_error() {
    return AgentError{ErrorCategory::Cancelled, "Generation cancelled by caller.",
                      "generation_cancelled"};
}

// A trimmed window must not start with tool results whose call was cut off.
void drop_orphan_tool_results(std::vector<Message>& context) {
    auto first = std::find_if(context.begin(), context.end(),
                              [](const Message& m) { return m.role != Role::Tool; });
    context.erase(context.begin(), first);
}

// Chunk boundaries never split a UTF-8 sequence.
std::vector<std::string> split_text(const std::string& text, const std::size_t chunk_size) {
    std::vector<std::string> chunks;
    std::size_t pos = 0;
    while (pos < text.size()) {
        std::size_t end = std::min(text.size(), pos + std::max<std::size_t>(chunk_size, 1));
        while (end < text.size() &&
               (static_cast<unsigned char>(text[end]) & 0xC0) == 0x80) {
            ++end;
        }
        chunks.push_back(text.substr(pos, end - pos));
        pos = end;
    }
    return chunks;
}

}  // namespace

RetryState::RetryState(const core::config::RetryPolicy& policy)
    : attempt(1), next_delay_ms(policy.initial_backoff_ms) {}

bool RetryState::exhausted(const core::config::RetryPolicy& policy) const {
    return attempt >= policy.max_attempts;
}

void RetryState::advance(const core::config::RetryPolicy& policy) {
    ++attempt;
    const double grown = static_cast<double>(next_delay_ms) * policy.multiplier;
    next_delay_ms = grown >= static_cast<double>(policy.max_backoff_ms)
                        ? policy.max_backoff_ms
                        : static_cast<std::uint32_t>(grown);
}

bool sleep_unless_cancelled(const std::uint32_t duration_ms,
                            const protocol::CancelToken& token) {
    const auto deadline =
        std::chrono::steady_clock::now() + std::chrono::milliseconds(duration_ms);
    while (std::chrono::steady_clock::now() < deadline) {
        if (protocol::is_cancelled(token)) {
            return false;
        }
        const auto left = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        std::this_thread::sleep_for(
            std::min(left, std::chrono::milliseconds(kSleepSliceMs)));
    }
    return !protocol::is_cancelled(token);
}

void SerializedSink::emit(protocol::AgentEvent event) {
    if (sink_ == nullptr) {
        return;
    }
    std::lock_guard<std::mutex> lock(mutex_);
    if (!sink_->emit(std::move(event))) {
        STRAND_LOG_DEBUG("StepExecutor: event dropped, stream consumer is gone");
    }
}

StepExecutor::StepExecutor(std::shared_ptr<model::ModelAdapter> model,
                           std::shared_ptr<const tools::ToolRegistry> registry,
                           std::shared_ptr<memory::ThreadManager> threads,
                           core::config::ExecutorConfig config)
    : model_(std::move(model)),
      registry_(std::move(registry)),
      threads_(std::move(threads)),
      config_(std::move(config)),
      invoker_(registry_, config_.tool_timeout_ms) {}

GenerationResult StepExecutor::run(const std::string& thread_id, const std::string& input,
                                   const protocol::GenerateOptions& options,
                                   EventSink* sink) const {
    SerializedSink events(sink);
    GenerationResult result;
    result.thread_id = thread_id;

    auto finish = [&](const GenerationStatus status, AgentError error) {
        result.status = status;
        STRAND_LOG_WARN("StepExecutor: thread " + thread_id + " ended " +
                        protocol::to_string(status) + " [" + error.code + "] " +
                        error.message);
        result.error = error;
        events.emit(protocol::ErrorEvent{std::move(error), result.steps});
        return result;
    };

    const std::uint32_t max_steps = options.max_steps.value_or(config_.max_steps);
    if (max_steps == 0) {
        return finish(GenerationStatus::Failed,
                      AgentError{ErrorCategory::Validation, "max_steps must be at least 1.",
                                 "invalid_max_steps"});
    }
    if (protocol::is_cancelled(options.cancel_token)) {
        return finish(GenerationStatus::Cancelled, cancelled_error());
    }

    auto history = threads_->get_history(thread_id, config_.context_window);
    if (core::errors::is_error(history)) {
        return finish(GenerationStatus::Failed, core::errors::get_error(history));
    }
    std::vector<Message> context = core::errors::take_value(std::move(history));
    if (config_.context_window > 0) {
        drop_orphan_tool_results(context);
    }

    auto user_message =
        threads_->add_message(thread_id, protocol::make_message(Role::User, input));
    if (core::errors::is_error(user_message)) {
        return finish(GenerationStatus::Failed, core::errors::get_error(user_message));
    }
    context.push_back(core::errors::take_value(std::move(user_message)));

    const auto tools = registry_->describe_all();
    STRAND_LOG_INFO("StepExecutor: thread " + thread_id + " generation started (max_steps=" +
                    std::to_string(max_steps) + ", tools=" + std::to_string(tools.size()) +
                    ")");

    for (std::uint32_t step_index = 1;; ++step_index) {
        if (protocol::is_cancelled(options.cancel_token)) {
            return finish(GenerationStatus::Cancelled, cancelled_error());
        }

        AgentStep step;
        step.index = step_index;
        step.input_message_count = context.size();
        step.started_at_ms = core::time::now_unix_ms();
        STRAND_LOG_DEBUG("StepExecutor: step " + std::to_string(step_index) + " " +
                         protocol::to_string(protocol::StepState::AwaitingModel));

        bool streamed = false;
        auto response = call_model(context, tools, step_index, options.cancel_token, events,
                                   streamed);
        if (core::errors::is_error(response)) {
            const AgentError& error = core::errors::get_error(response);
            return finish(error.category == ErrorCategory::Cancelled
                              ? GenerationStatus::Cancelled
                              : GenerationStatus::Failed,
                          error);
        }
        model::ModelResponse reply = core::errors::take_value(std::move(response));

        if (!reply.has_tool_calls()) {
            STRAND_LOG_DEBUG("StepExecutor: step " + std::to_string(step_index) + " " +
                             protocol::to_string(protocol::StepState::ModelReturnedText));
            if (reply.text.empty()) {
                return finish(GenerationStatus::Failed,
                              AgentError{ErrorCategory::Provider,
                                         "Model returned neither text nor tool calls.",
                                         "empty_model_response"});
            }
            auto stored = threads_->add_message(
                thread_id, protocol::make_message(Role::Assistant, reply.text));
            if (core::errors::is_error(stored)) {
                return finish(GenerationStatus::Failed, core::errors::get_error(stored));
            }
            if (!streamed) {
                emit_text(reply.text, events);
            }

            step.text = reply.text;
            step.finished_at_ms = core::time::now_unix_ms();
            result.steps.push_back(step);
            events.emit(protocol::StepCompleteEvent{step});

            result.status = GenerationStatus::Completed;
            result.text = reply.text;
            STRAND_LOG_INFO("StepExecutor: thread " + thread_id + " completed after " +
                            std::to_string(step_index) + " step(s)");
            events.emit(protocol::GenerationCompleteEvent{result});
            return result;
        }

        STRAND_LOG_DEBUG("StepExecutor: step " + std::to_string(step_index) + " " +
                         protocol::to_string(protocol::StepState::ModelReturnedToolCalls) +
                         " (" + std::to_string(reply.tool_calls.size()) + ")");
        for (auto& call : reply.tool_calls) {
            if (call.id.empty()) {
                call.id = core::config::generate_id("call");
            }
        }

        if (protocol::is_cancelled(options.cancel_token)) {
            return finish(GenerationStatus::Cancelled, cancelled_error());
        }

        STRAND_LOG_DEBUG("StepExecutor: step " + std::to_string(step_index) + " " +
                         protocol::to_string(protocol::StepState::InvokingTools));
        std::vector<ToolCallResult> results =
            invoke_tools(reply.tool_calls, options.cancel_token, events);

        std::vector<Message> batch;
        batch.reserve(results.size() + 1);
        batch.push_back(protocol::make_tool_call_message(reply.tool_calls, reply.text));
        for (const auto& tool_result : results) {
            batch.push_back(protocol::make_tool_result_message(tool_result));
        }
        auto stored = threads_->add_messages(thread_id, batch);
        if (core::errors::is_error(stored)) {
            return finish(GenerationStatus::Failed, core::errors::get_error(stored));
        }
        auto stored_messages = core::errors::take_value(std::move(stored));
        context.insert(context.end(), std::make_move_iterator(stored_messages.begin()),
                       std::make_move_iterator(stored_messages.end()));

        step.text = reply.text;
        step.tool_calls = reply.tool_calls;
        step.tool_results = std::move(results);
        step.finished_at_ms = core::time::now_unix_ms();
        result.steps.push_back(step);
        events.emit(protocol::StepCompleteEvent{step});
        STRAND_LOG_DEBUG("StepExecutor: step " + std::to_string(step_index) + " " +
                         protocol::to_string(protocol::StepState::ResultsReady));

        if (step_index >= max_steps) {
            return finish(GenerationStatus::StepLimitExceeded,
                          AgentError{ErrorCategory::StepLimitExceeded,
                                     "Step limit of " + std::to_string(max_steps) +
                                         " reached with tool results still pending a reply.",
                                     "step_limit_exceeded",
                                     "Raise max_steps or simplify the request."});
        }
    }
}

core::errors::Result<model::ModelResponse> StepExecutor::call_model(
    const std::vector<Message>& context, const std::vector<protocol::ToolDescriptor>& tools,
    const std::uint32_t step_index, const protocol::CancelToken& cancel_token,
    SerializedSink& events, bool& streamed) const {
    model::CompletionOptions completion;
    completion.step_index = step_index;
    completion.cancel_token = cancel_token;
    // Deltas of one attempt are held back until it succeeds so a retried
    // attempt never leaves a partial reply on the stream.
    std::vector<std::string> pending;
    completion.on_text_delta = [&pending](const std::string& delta) {
        pending.push_back(delta);
    };

    RetryState retry(config_.retry);
    while (true) {
        if (protocol::is_cancelled(cancel_token)) {
            return cancelled_error();
        }
        pending.clear();
        auto response = model_->complete(context, tools, completion);
        if (!core::errors::is_error(response)) {
            streamed = !pending.empty();
            for (auto& delta : pending) {
                events.emit(protocol::TextDeltaEvent{std::move(delta)});
            }
            return response;
        }
        if (!pending.empty()) {
            STRAND_LOG_DEBUG("StepExecutor: discarding " + std::to_string(pending.size()) +
                             " deltas from failed attempt " + std::to_string(retry.attempt));
        }

        const AgentError& error = core::errors::get_error(response);
        if (!core::errors::is_retryable(error)) {
            return error;
        }
        if (retry.exhausted(config_.retry)) {
            return AgentError{ErrorCategory::Provider,
                              "Model still failing after " + std::to_string(retry.attempt) +
                                  " attempts: " + error.message,
                              "provider_retries_exhausted"};
        }

        STRAND_LOG_WARN("StepExecutor: transient model failure on attempt " +
                        std::to_string(retry.attempt) + ", retrying in " +
                        std::to_string(retry.next_delay_ms) + " ms: " + error.message);
        if (!sleep_unless_cancelled(retry.next_delay_ms, cancel_token)) {
            return cancelled_error();
        }
        retry.advance(config_.retry);
    }
}

std::vector<ToolCallResult> StepExecutor::invoke_tools(
    const std::vector<ToolCall>& calls, const protocol::CancelToken& cancel_token,
    SerializedSink& events) const {
    std::vector<ToolCallResult> results(calls.size());
    auto run_one = [this, &calls, &cancel_token, &results, &events](const std::size_t i) {
        results[i] = invoker_.invoke(calls[i], cancel_token);
        if (!results[i].ok()) {
            STRAND_LOG_WARN("StepExecutor: tool " + calls[i].tool_name + " (" + calls[i].id +
                            ") failed: " + results[i].error->message);
        }
        events.emit(protocol::ToolCallCompleteEvent{calls[i].id, results[i]});
    };

    if (!config_.parallel_tool_calls || calls.size() == 1) {
        for (std::size_t i = 0; i < calls.size(); ++i) {
            events.emit(protocol::ToolCallStartEvent{calls[i]});
            run_one(i);
        }
        return results;
    }

    std::vector<std::thread> workers;
    workers.reserve(calls.size());
    for (std::size_t i = 0; i < calls.size(); ++i) {
        events.emit(protocol::ToolCallStartEvent{calls[i]});
        workers.emplace_back(run_one, i);
    }
    for (auto& worker : workers) {
        worker.join();
    }
    return results;
}

void StepExecutor::emit_text(const std::string& text, SerializedSink& events) const {
    for (auto& chunk : split_text(text, config_.text_chunk_size)) {
        events.emit(protocol::TextDeltaEvent{std::move(chunk)});
    }
}

}  // namespace strand::runtime
