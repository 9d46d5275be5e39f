#include "core/config/executor_config.hpp"

#include <cstdint>
#include <fstream>
#include <limits>
#include <sstream>
#include <string>

namespace strand::core::config {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentError invalid(const std::string& message) {
    return AgentError{ErrorCategory::Validation, message, "invalid_config"};
}

// Reads an unsigned field when present, leaves the target untouched otherwise.
template <typename T>
bool read_unsigned(const json& object, const char* key, T& target,
                   std::string& failure) {
    auto it = object.find(key);
    if (it == object.end()) {
        return true;
    }
    if (!it->is_number_unsigned()) {
        failure = std::string("Field '") + key + "' must be a non-negative integer.";
        return false;
    }
    const auto value = it->get<std::uint64_t>();
    if (value > static_cast<std::uint64_t>(std::numeric_limits<T>::max())) {
        failure = std::string("Field '") + key + "' is out of range.";
        return false;
    }
    target = static_cast<T>(value);
    return true;
}

bool read_bool(const json& object, const char* key, bool& target,
               std::string& failure) {
    auto it = object.find(key);
    if (it == object.end()) {
        return true;
    }
    if (!it->is_boolean()) {
        failure = std::string("Field '") + key + "' must be a boolean.";
        return false;
    }
    target = it->get<bool>();
    return true;
}

}  // namespace

core::errors::Result<ExecutorConfig> validate(const ExecutorConfig& config) {
    if (config.max_steps == 0 || config.max_steps > 1000) {
        return invalid("max_steps must be between 1 and 1000.");
    }
    if (config.retry.max_attempts == 0) {
        return invalid("retry.max_attempts must be at least 1.");
    }
    if (config.retry.multiplier < 1.0) {
        return invalid("retry.multiplier must be >= 1.0.");
    }
    if (config.retry.max_backoff_ms < config.retry.initial_backoff_ms) {
        return invalid("retry.max_backoff_ms must be >= retry.initial_backoff_ms.");
    }
    if (config.tool_timeout_ms == 0) {
        return invalid("tool_timeout_ms must be greater than zero.");
    }
    if (config.event_buffer_capacity == 0) {
        return invalid("event_buffer_capacity must be greater than zero.");
    }
    if (config.text_chunk_size == 0) {
        return invalid("text_chunk_size must be greater than zero.");
    }
    return config;
}

core::errors::Result<ExecutorConfig> executor_config_from_json(
    const json& document) {
    if (!document.is_object()) {
        return invalid("Executor config must be a JSON object.");
    }

    ExecutorConfig config;
    std::string failure;
    if (!read_unsigned(document, "max_steps", config.max_steps, failure) ||
        !read_unsigned(document, "tool_timeout_ms", config.tool_timeout_ms, failure) ||
        !read_unsigned(document, "event_buffer_capacity",
                       config.event_buffer_capacity, failure) ||
        !read_bool(document, "parallel_tool_calls", config.parallel_tool_calls,
                   failure) ||
        !read_unsigned(document, "text_chunk_size", config.text_chunk_size,
                       failure) ||
        !read_unsigned(document, "context_window", config.context_window,
                       failure)) {
        return invalid(failure);
    }

    auto retry_it = document.find("retry");
    if (retry_it != document.end()) {
        if (!retry_it->is_object()) {
            return invalid("Field 'retry' must be an object.");
        }
        const json& retry = *retry_it;
        if (!read_unsigned(retry, "max_attempts", config.retry.max_attempts,
                           failure) ||
            !read_unsigned(retry, "initial_backoff_ms",
                           config.retry.initial_backoff_ms, failure) ||
            !read_unsigned(retry, "max_backoff_ms", config.retry.max_backoff_ms,
                           failure)) {
            return invalid(failure);
        }
        auto multiplier_it = retry.find("multiplier");
        if (multiplier_it != retry.end()) {
            if (!multiplier_it->is_number()) {
                return invalid("Field 'retry.multiplier' must be a number.");
            }
            config.retry.multiplier = multiplier_it->get<double>();
        }
    }

    return validate(config);
}

core::errors::Result<ExecutorConfig> load_executor_config(
    const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Validation,
                          "Unable to open config file: " + path.string(),
                          "config_read_failed"};
    }

    std::ostringstream buffer;
    buffer << in.rdbuf();
    const json document = json::parse(buffer.str(), nullptr, false);
    if (document.is_discarded()) {
        return AgentError{ErrorCategory::Validation,
                          "Config file is not valid JSON: " + path.string(),
                          "config_parse_failed"};
    }
    return executor_config_from_json(document);
}

json to_json(const ExecutorConfig& config) {
    json retry;
    retry["max_attempts"] = config.retry.max_attempts;
    retry["initial_backoff_ms"] = config.retry.initial_backoff_ms;
    retry["max_backoff_ms"] = config.retry.max_backoff_ms;
    retry["multiplier"] = config.retry.multiplier;

    json payload;
    payload["max_steps"] = config.max_steps;
    payload["retry"] = retry;
    payload["tool_timeout_ms"] = config.tool_timeout_ms;
    payload["event_buffer_capacity"] = config.event_buffer_capacity;
    payload["parallel_tool_calls"] = config.parallel_tool_calls;
    payload["text_chunk_size"] = config.text_chunk_size;
    payload["context_window"] = config.context_window;
    return payload;
}

}  // namespace strand::core::config
