#include "tools/tool_invoker.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <condition_variable>
#include <exception>
#include <mutex>
#include <string>
#include <thread>
#include <utility>
#include "core/logging/logger.hpp"
#include "tools/schema_validator.hpp"

namespace strand::tools {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::ToolCall;
using protocol::ToolCallResult;
using protocol::ToolError;
using protocol::ToolErrorKind;

namespace {

constexpr auto kCancelPoll = std::chrono::milliseconds(10);

std::atomic<std::size_t> g_abandoned_calls{0};

// Shared between the waiting caller and the worker thread, which may
// outlive the wait when the handler overruns its deadline.
struct PendingCall {
    std::mutex mutex;
    std::condition_variable done_cv;
    bool done = false;
    bool abandoned = false;
    core::errors::Result<nlohmann::json> outcome;
};

core::errors::Result<nlohmann::json> run_guarded(ToolHandler& handler,
                                                 const nlohmann::json& arguments,
                                                 const ToolContext& context) {
    try {
        return handler.invoke(arguments, context);
    } catch (const std::exception& e) {
        return AgentError{ErrorCategory::ToolExecution,
                          std::string("Tool handler threw: ") + e.what(),
                          "tool_threw"};
    } catch (...) {
        return AgentError{ErrorCategory::ToolExecution,
                          "Tool handler threw a non-standard exception.",
                          "tool_threw"};
    }
}

ToolCallResult failure(const ToolCall& call, ToolErrorKind kind, std::string message,
                       double duration_ms = 0.0) {
    ToolCallResult result;
    result.call_id = call.id;
    result.tool_name = call.tool_name;
    result.error = ToolError{kind, std::move(message)};
    result.duration_ms = duration_ms;
    return result;
}

}  // namespace

ToolInvoker::ToolInvoker(std::shared_ptr<const ToolRegistry> registry,
                         const std::uint32_t timeout_ms)
    : registry_(std::move(registry)), timeout_ms_(timeout_ms) {}

ToolCallResult ToolInvoker::invoke(const ToolCall& call,
                                   const protocol::CancelToken& cancel_token) const {
    const RegisteredTool* tool = registry_ ? registry_->find(call.tool_name) : nullptr;
    if (tool == nullptr) {
        STRAND_LOG_WARN("ToolInvoker: unknown tool '" + call.tool_name + "'");
        return failure(call, ToolErrorKind::UnknownTool,
                       "Unknown tool: " + call.tool_name);
    }

    const SchemaValidator validator;
    auto validated = validator.validate(tool->descriptor.parameter_schema, call.arguments);
    if (core::errors::is_error(validated)) {
        STRAND_LOG_WARN("ToolInvoker: rejected arguments for '" + call.tool_name +
                        "': " + core::errors::get_error(validated).message);
        return failure(call, ToolErrorKind::InvalidArguments,
                       core::errors::get_error(validated).message);
    }

    const auto started = std::chrono::steady_clock::now();
    const auto deadline = started + std::chrono::milliseconds(timeout_ms_);
    auto pending = std::make_shared<PendingCall>();
    ToolContext context{call.id, std::make_shared<std::atomic_bool>(false), deadline};

    std::thread worker([handler = tool->handler, arguments = call.arguments, context,
                        pending, name = call.tool_name]() {
        auto outcome = run_guarded(*handler, arguments, context);
        std::lock_guard<std::mutex> lock(pending->mutex);
        pending->outcome = std::move(outcome);
        pending->done = true;
        if (pending->abandoned) {
            --g_abandoned_calls;
            STRAND_LOG_WARN("ToolInvoker: discarding late result of '" + name + "' (" +
                            context.call_id + ")");
            return;
        }
        pending->done_cv.notify_all();
    });
    worker.detach();

    std::unique_lock<std::mutex> lock(pending->mutex);
    bool finished = false;
    bool forwarded = false;
    while (true) {
        const auto wake = (cancel_token && !forwarded)
                              ? std::min(deadline, std::chrono::steady_clock::now() + kCancelPoll)
                              : deadline;
        finished = pending->done_cv.wait_until(lock, wake, [&pending] { return pending->done; });
        if (finished || std::chrono::steady_clock::now() >= deadline) {
            break;
        }
        if (!forwarded && protocol::is_cancelled(cancel_token)) {
            STRAND_LOG_DEBUG("ToolInvoker: forwarding cancellation to '" + call.tool_name + "'");
            context.cancel_token->store(true);
            forwarded = true;
        }
    }
    const double elapsed_ms =
        std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started)
            .count();

    if (!finished) {
        context.cancel_token->store(true);
        pending->abandoned = true;
        ++g_abandoned_calls;
        STRAND_LOG_WARN("ToolInvoker: '" + call.tool_name + "' (" + call.id +
                        ") timed out after " + std::to_string(timeout_ms_) + " ms");
        return failure(call, ToolErrorKind::ExecutionFailed,
                       "Tool timed out after " + std::to_string(timeout_ms_) + " ms",
                       elapsed_ms);
    }

    if (core::errors::is_error(pending->outcome)) {
        const auto& err = core::errors::get_error(pending->outcome);
        STRAND_LOG_WARN("ToolInvoker: '" + call.tool_name + "' failed [" + err.code +
                        "]: " + err.message);
        return failure(call, ToolErrorKind::ExecutionFailed, err.message, elapsed_ms);
    }

    ToolCallResult result;
    result.call_id = call.id;
    result.tool_name = call.tool_name;
    result.output = core::errors::get_value(pending->outcome);
    result.duration_ms = elapsed_ms;
    STRAND_LOG_DEBUG("ToolInvoker: '" + call.tool_name + "' completed in " +
                     std::to_string(elapsed_ms) + " ms");
    return result;
}

std::size_t ToolInvoker::abandoned_calls() {
    return g_abandoned_calls.load();
}

}  // namespace strand::tools
