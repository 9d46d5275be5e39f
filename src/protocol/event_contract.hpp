#pragma once
#include <string>
#include <variant>
#include <vector>
#include "core/errors/agent_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace strand::protocol {

    struct TextDeltaEvent { std::string delta; };
    struct ToolCallStartEvent { ToolCall call; };
    struct ToolCallCompleteEvent { std::string call_id; ToolCallResult result; };
    struct StepCompleteEvent { AgentStep step; };
    struct GenerationCompleteEvent { GenerationResult result; };
    struct ErrorEvent {
        core::errors::AgentError error;
        std::vector<AgentStep> partial_steps;
    };

    // One incremental unit of progress. A stream ends with exactly one
    // GenerationCompleteEvent or ErrorEvent.
    using AgentEvent = std::variant<
        TextDeltaEvent,
        ToolCallStartEvent,
        ToolCallCompleteEvent,
        StepCompleteEvent,
        GenerationCompleteEvent,
        ErrorEvent
    >;

    inline bool is_terminal(const AgentEvent& event) {
        return std::holds_alternative<GenerationCompleteEvent>(event) ||
               std::holds_alternative<ErrorEvent>(event);
    }

    inline std::string event_name(const AgentEvent& event) {
        switch (event.index()) {
            case 0: return "text_delta";
            case 1: return "tool_call_start";
            case 2: return "tool_call_complete";
            case 3: return "step_complete";
            case 4: return "generation_complete";
            case 5: return "error";
            default: return "unknown";
        }
    }

} // namespace strand::protocol
