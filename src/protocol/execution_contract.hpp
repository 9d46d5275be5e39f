#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace strand::protocol {

using CancelToken = std::shared_ptr<std::atomic_bool>;

inline bool is_cancelled(const CancelToken& token) {
    return token && token->load();
}

enum class StepState {
    AwaitingModel,
    ModelReturnedText,
    ModelReturnedToolCalls,
    InvokingTools,
    ResultsReady,
    Done,
    Failed,
    StepLimitExceeded,
    Cancelled
};

struct AgentStep {
    std::uint32_t index = 0;
    std::size_t input_message_count = 0;
    std::string text;
    std::vector<ToolCall> tool_calls;
    std::vector<ToolCallResult> tool_results;
    std::int64_t started_at_ms = 0;
    std::int64_t finished_at_ms = 0;
};

enum class GenerationStatus {
    Completed,
    Failed,
    StepLimitExceeded,
    Cancelled
};

struct GenerationResult {
    std::string thread_id;
    GenerationStatus status = GenerationStatus::Completed;
    std::string text;
    std::vector<AgentStep> steps;
    std::optional<core::errors::AgentError> error;

    bool ok() const { return status == GenerationStatus::Completed; }
};

struct GenerateOptions {
    CancelToken cancel_token;
    std::optional<std::uint32_t> max_steps;  // overrides ExecutorConfig::max_steps
};

inline std::string to_string(const StepState state) {
    switch (state) {
        case StepState::AwaitingModel:
            return "awaiting_model";
        case StepState::ModelReturnedText:
            return "model_returned_text";
        case StepState::ModelReturnedToolCalls:
            return "model_returned_tool_calls";
        case StepState::InvokingTools:
            return "invoking_tools";
        case StepState::ResultsReady:
            return "results_ready";
        case StepState::Done:
            return "done";
        case StepState::Failed:
            return "failed";
        case StepState::StepLimitExceeded:
            return "step_limit_exceeded";
        case StepState::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

inline std::string to_string(const GenerationStatus status) {
    switch (status) {
        case GenerationStatus::Completed:
            return "completed";
        case GenerationStatus::Failed:
            return "failed";
        case GenerationStatus::StepLimitExceeded:
            return "step_limit_exceeded";
        case GenerationStatus::Cancelled:
            return "cancelled";
        default:
            return "unknown";
    }
}

}  // namespace strand::protocol
