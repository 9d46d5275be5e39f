#pragma once
#include <string>
#include <variant>

namespace strand::core::errors {

    // 1. Typed error categories
    enum class ErrorCategory {
        Validation,         // Malformed input, unknown tool, bad arguments
        NotFound,           // Thread or message does not exist
        AccessDenied,       // Thread owned by another resource
        TransientProvider,  // Rate limit or timeout from the model adapter
        Provider,           // Fatal model adapter failure
        ToolExecution,      // Handler failure or timeout
        StepLimitExceeded,  // Loop guard tripped
        Storage,            // Persistence backend fault
        Cancelled,          // Caller-initiated stop
        Internal            // Logic bug or invariant break
    };

    // The standardized error payload
    struct AgentError {
            ErrorCategory category;
            std::string message;
            std::string code = "unknown_error";
            std::string hint = "";
        };

    // 2. Propagation strategy: a Result holds either a value of type T or an AgentError.
    template <typename T>
    using Result = std::variant<T, AgentError>;

    template <typename T>
    bool is_error(const Result<T>& result) {
        return std::holds_alternative<AgentError>(result);
    }

    template <typename T>
    const AgentError& get_error(const Result<T>& result) {
        return std::get<AgentError>(result);
    }

    template <typename T>
    const T& get_value(const Result<T>& result) {
        return std::get<T>(result);
    }

    template <typename T>
    T take_value(Result<T>&& result) {
        return std::get<T>(std::move(result));
    }

    inline std::string to_string(const ErrorCategory category) {
        switch (category) {
            case ErrorCategory::Validation: return "validation";
            case ErrorCategory::NotFound: return "not_found";
            case ErrorCategory::AccessDenied: return "access_denied";
            case ErrorCategory::TransientProvider: return "transient_provider";
            case ErrorCategory::Provider: return "provider";
            case ErrorCategory::ToolExecution: return "tool_execution";
            case ErrorCategory::StepLimitExceeded: return "step_limit_exceeded";
            case ErrorCategory::Storage: return "storage";
            case ErrorCategory::Cancelled: return "cancelled";
            case ErrorCategory::Internal: return "internal";
            default: return "unknown";
        }
    }

    // Only transient provider faults are worth another attempt.
    inline bool is_retryable(const AgentError& error) {
        return error.category == ErrorCategory::TransientProvider;
    }

} // namespace strand::core::errors
