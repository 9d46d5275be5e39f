#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include "core/errors/agent_errors.hpp"
#include "protocol/execution_contract.hpp"

namespace strand::tools {

struct ProcessOutcome {
    int exit_code = -1;
    bool timed_out = false;
    bool cancelled = false;
    std::string stdout_text;
    std::string stderr_text;
    double duration_ms = 0.0;
};

// Runs `command` through /bin/sh in `cwd`, capturing both streams.
// The child is killed when `timeout_ms` elapses or `cancel_token` flips.
core::errors::Result<ProcessOutcome> run_process(const std::string& command,
                                                 const std::filesystem::path& cwd,
                                                 std::uint32_t timeout_ms,
                                                 const protocol::CancelToken& cancel_token);

}  // namespace strand::tools
