#pragma once

#include <string>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"
#include "protocol/event_contract.hpp"
#include "protocol/message_contract.hpp"
#include "protocol/thread_contract.hpp"
#include "protocol/tool_contract.hpp"

namespace strand::protocol {

nlohmann::json tool_call_to_json(const ToolCall& call);
core::errors::Result<ToolCall> tool_call_from_json(const nlohmann::json& payload);

nlohmann::json tool_result_to_json(const ToolCallResult& result);

nlohmann::json message_to_json(const Message& message);
core::errors::Result<Message> message_from_json(const nlohmann::json& payload);

nlohmann::json thread_to_json(const MemoryThread& thread);
core::errors::Result<MemoryThread> thread_from_json(const nlohmann::json& payload);

nlohmann::json error_to_json(const core::errors::AgentError& error);
nlohmann::json step_to_json(const AgentStep& step);
nlohmann::json event_to_json(const AgentEvent& event);

// Compact single-line serialization. Invalid UTF-8 in strings is replaced
// with U+FFFD instead of throwing.
std::string to_line(const nlohmann::json& payload);

}  // namespace strand::protocol
