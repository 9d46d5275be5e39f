#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "protocol/tool_contract.hpp"

namespace strand::protocol {

    enum class Role {
        System,
        User,
        Assistant,
        Tool
    };

    // One conversation turn. The store assigns id, sequence and created_at
    // on append; after that the message never changes.
    struct Message {
        std::string id;
        std::string thread_id;
        std::uint64_t sequence = 0;
        Role role = Role::User;
        std::string content;

        // Assistant turns that request tools list them here.
        std::vector<ToolCall> tool_calls;

        // Tool turns point back at the call they answer.
        std::optional<std::string> tool_call_id;
        std::optional<ToolErrorKind> tool_error;

        std::int64_t created_at_ms = 0;
    };

    inline std::string to_string(const Role role) {
        switch (role) {
            case Role::System:
                return "system";
            case Role::User:
                return "user";
            case Role::Assistant:
                return "assistant";
            case Role::Tool:
                return "tool";
            default:
                return "unknown";
        }
    }

    inline std::optional<Role> role_from_string(const std::string& value) {
        if (value == "system") return Role::System;
        if (value == "user") return Role::User;
        if (value == "assistant") return Role::Assistant;
        if (value == "tool") return Role::Tool;
        return std::nullopt;
    }

    inline Message make_message(Role role, std::string content) {
        Message message;
        message.role = role;
        message.content = std::move(content);
        return message;
    }

    inline Message make_tool_call_message(std::vector<ToolCall> calls,
                                          std::string content = "") {
        Message message;
        message.role = Role::Assistant;
        message.content = std::move(content);
        message.tool_calls = std::move(calls);
        return message;
    }

    // Tool messages carry the output JSON, or an error object the model can read.
    inline Message make_tool_result_message(const ToolCallResult& result) {
        Message message;
        message.role = Role::Tool;
        message.tool_call_id = result.call_id;
        if (result.error.has_value()) {
            message.tool_error = result.error->kind;
            nlohmann::json payload;
            payload["error"] = to_string(result.error->kind);
            payload["message"] = result.error->message;
            message.content =
                payload.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
        } else if (result.output.has_value()) {
            message.content = result.output->is_string()
                                  ? result.output->get<std::string>()
                                  : result.output->dump(-1, ' ', false,
                                                        nlohmann::json::error_handler_t::replace);
        }
        return message;
    }

} // namespace strand::protocol
