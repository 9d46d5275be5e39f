#include "protocol/json_codec.hpp"

#include <string>
#include <variant>

namespace strand::protocol {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentError malformed(const std::string& what) {
    return AgentError{ErrorCategory::Validation, "Malformed record: " + what,
                      "malformed_record"};
}

std::optional<ToolErrorKind> tool_error_from_string(const std::string& value) {
    if (value == "UnknownTool") return ToolErrorKind::UnknownTool;
    if (value == "InvalidArguments") return ToolErrorKind::InvalidArguments;
    if (value == "ExecutionFailed") return ToolErrorKind::ExecutionFailed;
    return std::nullopt;
}

bool has_string(const json& payload, const char* key) {
    auto it = payload.find(key);
    return it != payload.end() && it->is_string();
}

json steps_to_json(const std::vector<AgentStep>& steps) {
    json out = json::array();
    for (const auto& step : steps) {
        out.push_back(step_to_json(step));
    }
    return out;
}

}  // namespace

json tool_call_to_json(const ToolCall& call) {
    json payload;
    payload["id"] = call.id;
    payload["tool_name"] = call.tool_name;
    payload["arguments"] = call.arguments;
    return payload;
}

core::errors::Result<ToolCall> tool_call_from_json(const json& payload) {
    if (!payload.is_object() || !has_string(payload, "tool_name")) {
        return malformed("tool call requires a string 'tool_name'");
    }

    ToolCall call;
    call.tool_name = payload["tool_name"].get<std::string>();
    if (has_string(payload, "id")) {
        call.id = payload["id"].get<std::string>();
    }
    auto args = payload.find("arguments");
    if (args != payload.end()) {
        call.arguments = *args;
    }
    return call;
}

json tool_result_to_json(const ToolCallResult& result) {
    json payload;
    payload["call_id"] = result.call_id;
    payload["tool_name"] = result.tool_name;
    payload["duration_ms"] = result.duration_ms;
    if (result.output.has_value()) {
        payload["output"] = result.output.value();
    }
    if (result.error.has_value()) {
        payload["error"] = {{"kind", to_string(result.error->kind)},
                            {"message", result.error->message}};
    }
    return payload;
}

json message_to_json(const Message& message) {
    json payload;
    payload["id"] = message.id;
    payload["thread_id"] = message.thread_id;
    payload["sequence"] = message.sequence;
    payload["role"] = to_string(message.role);
    payload["content"] = message.content;
    payload["created_at_ms"] = message.created_at_ms;
    if (!message.tool_calls.empty()) {
        json calls = json::array();
        for (const auto& call : message.tool_calls) {
            calls.push_back(tool_call_to_json(call));
        }
        payload["tool_calls"] = calls;
    }
    if (message.tool_call_id.has_value()) {
        payload["tool_call_id"] = message.tool_call_id.value();
    }
    if (message.tool_error.has_value()) {
        payload["tool_error"] = to_string(message.tool_error.value());
    }
    return payload;
}

core::errors::Result<Message> message_from_json(const json& payload) {
    if (!payload.is_object() || !has_string(payload, "role") ||
        !has_string(payload, "content")) {
        return malformed("message requires string 'role' and 'content'");
    }

    const auto role = role_from_string(payload["role"].get<std::string>());
    if (!role.has_value()) {
        return malformed("unknown role '" + payload["role"].get<std::string>() + "'");
    }

    Message message;
    message.role = role.value();
    message.content = payload["content"].get<std::string>();
    if (has_string(payload, "id")) {
        message.id = payload["id"].get<std::string>();
    }
    if (has_string(payload, "thread_id")) {
        message.thread_id = payload["thread_id"].get<std::string>();
    }
    if (payload.contains("sequence") && payload["sequence"].is_number_unsigned()) {
        message.sequence = payload["sequence"].get<std::uint64_t>();
    }
    if (payload.contains("created_at_ms") && payload["created_at_ms"].is_number_integer()) {
        message.created_at_ms = payload["created_at_ms"].get<std::int64_t>();
    }
    if (payload.contains("tool_calls")) {
        if (!payload["tool_calls"].is_array()) {
            return malformed("'tool_calls' must be an array");
        }
        for (const auto& entry : payload["tool_calls"]) {
            auto call = tool_call_from_json(entry);
            if (core::errors::is_error(call)) {
                return core::errors::get_error(call);
            }
            message.tool_calls.push_back(core::errors::get_value(call));
        }
    }
    if (has_string(payload, "tool_call_id")) {
        message.tool_call_id = payload["tool_call_id"].get<std::string>();
    }
    if (has_string(payload, "tool_error")) {
        message.tool_error =
            tool_error_from_string(payload["tool_error"].get<std::string>());
    }
    return message;
}

json thread_to_json(const MemoryThread& thread) {
    json payload;
    payload["id"] = thread.id;
    payload["title"] = thread.title;
    payload["agent_id"] =
        thread.agent_id.has_value() ? json(thread.agent_id.value()) : json(nullptr);
    payload["resource_id"] = thread.resource_id.has_value()
                                 ? json(thread.resource_id.value())
                                 : json(nullptr);
    payload["metadata"] = json::object();
    for (const auto& [key, value] : thread.metadata) {
        payload["metadata"][key] = value;
    }
    payload["created_at_ms"] = thread.created_at_ms;
    payload["updated_at_ms"] = thread.updated_at_ms;
    return payload;
}

core::errors::Result<MemoryThread> thread_from_json(const json& payload) {
    if (!payload.is_object() || !has_string(payload, "id")) {
        return malformed("thread requires a string 'id'");
    }

    MemoryThread thread;
    thread.id = payload["id"].get<std::string>();
    if (has_string(payload, "title")) {
        thread.title = payload["title"].get<std::string>();
    }
    if (has_string(payload, "agent_id")) {
        thread.agent_id = payload["agent_id"].get<std::string>();
    }
    if (has_string(payload, "resource_id")) {
        thread.resource_id = payload["resource_id"].get<std::string>();
    }
    if (payload.contains("metadata")) {
        if (!payload["metadata"].is_object()) {
            return malformed("'metadata' must be an object");
        }
        for (auto it = payload["metadata"].begin(); it != payload["metadata"].end();
             ++it) {
            thread.metadata[it.key()] = it.value();
        }
    }
    if (payload.contains("created_at_ms") && payload["created_at_ms"].is_number_integer()) {
        thread.created_at_ms = payload["created_at_ms"].get<std::int64_t>();
    }
    if (payload.contains("updated_at_ms") && payload["updated_at_ms"].is_number_integer()) {
        thread.updated_at_ms = payload["updated_at_ms"].get<std::int64_t>();
    }
    return thread;
}

json error_to_json(const AgentError& error) {
    json payload;
    payload["category"] = core::errors::to_string(error.category);
    payload["code"] = error.code;
    payload["message"] = error.message;
    if (!error.hint.empty()) {
        payload["hint"] = error.hint;
    }
    return payload;
}

json step_to_json(const AgentStep& step) {
    json payload;
    payload["index"] = step.index;
    payload["input_message_count"] = step.input_message_count;
    payload["text"] = step.text;
    payload["tool_calls"] = json::array();
    for (const auto& call : step.tool_calls) {
        payload["tool_calls"].push_back(tool_call_to_json(call));
    }
    payload["tool_results"] = json::array();
    for (const auto& result : step.tool_results) {
        payload["tool_results"].push_back(tool_result_to_json(result));
    }
    payload["started_at_ms"] = step.started_at_ms;
    payload["finished_at_ms"] = step.finished_at_ms;
    return payload;
}

json event_to_json(const AgentEvent& event) {
    json payload;
    payload["event"] = event_name(event);
    if (const auto* delta = std::get_if<TextDeltaEvent>(&event)) {
        payload["delta"] = delta->delta;
    } else if (const auto* start = std::get_if<ToolCallStartEvent>(&event)) {
        payload["call"] = tool_call_to_json(start->call);
    } else if (const auto* done = std::get_if<ToolCallCompleteEvent>(&event)) {
        payload["call_id"] = done->call_id;
        payload["result"] = tool_result_to_json(done->result);
    } else if (const auto* step = std::get_if<StepCompleteEvent>(&event)) {
        payload["step"] = step_to_json(step->step);
    } else if (const auto* complete = std::get_if<GenerationCompleteEvent>(&event)) {
        payload["status"] = to_string(complete->result.status);
        payload["text"] = complete->result.text;
        payload["total_steps"] = complete->result.steps.size();
    } else if (const auto* failure = std::get_if<ErrorEvent>(&event)) {
        payload["error"] = error_to_json(failure->error);
        payload["partial_steps"] = steps_to_json(failure->partial_steps);
    }
    return payload;
}

std::string to_line(const json& payload) {
    return payload.dump(-1, ' ', false, json::error_handler_t::replace);
}

}  // namespace strand::protocol
