#pragma once
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace strand::protocol {

    // What a tool advertises to the model. Immutable once registered.
    struct ToolDescriptor {
        std::string name;
        std::string description;
        nlohmann::json parameter_schema = nlohmann::json::object();
    };

    // How the model asks the executor to run a tool
    struct ToolCall {
        std::string id;
        std::string tool_name;
        nlohmann::json arguments = nlohmann::json::object();
    };

    enum class ToolErrorKind {
        UnknownTool,
        InvalidArguments,
        ExecutionFailed
    };

    struct ToolError {
        ToolErrorKind kind;
        std::string message;
    };

    // Exactly one of output / error is set.
    struct ToolCallResult {
        std::string call_id;
        std::string tool_name;
        std::optional<nlohmann::json> output;
        std::optional<ToolError> error;
        double duration_ms = 0.0;

        bool ok() const { return output.has_value() && !error.has_value(); }
    };

    inline std::string to_string(const ToolErrorKind kind) {
        switch (kind) {
            case ToolErrorKind::UnknownTool:
                return "UnknownTool";
            case ToolErrorKind::InvalidArguments:
                return "InvalidArguments";
            case ToolErrorKind::ExecutionFailed:
                return "ExecutionFailed";
            default:
                return "Unknown";
        }
    }

} // namespace strand::protocol
