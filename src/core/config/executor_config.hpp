#pragma once

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <nlohmann/json.hpp>
#include "core/errors/agent_errors.hpp"

namespace strand::core::config {

struct RetryPolicy {
    std::uint32_t max_attempts = 3;  // total model calls per step, first one included
    std::uint32_t initial_backoff_ms = 200;
    std::uint32_t max_backoff_ms = 5000;
    double multiplier = 2.0;
};

struct ExecutorConfig {
    std::uint32_t max_steps = 5;
    RetryPolicy retry;
    std::uint32_t tool_timeout_ms = 30000;
    std::size_t event_buffer_capacity = 64;
    bool parallel_tool_calls = true;
    std::size_t text_chunk_size = 16;
    std::size_t context_window = 0;  // 0 keeps the whole thread
};

core::errors::Result<ExecutorConfig> validate(const ExecutorConfig& config);

core::errors::Result<ExecutorConfig> executor_config_from_json(
    const nlohmann::json& document);

core::errors::Result<ExecutorConfig> load_executor_config(
    const std::filesystem::path& path);

nlohmann::json to_json(const ExecutorConfig& config);

}  // namespace strand::core::config
