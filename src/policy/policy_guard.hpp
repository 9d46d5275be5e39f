#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>
#include "core/errors/agent_errors.hpp"

namespace strand::policy {

struct CommandPolicy {
    std::vector<std::string> blocked_substrings = {
        "sudo",
        "rm -rf",
        "shutdown",
        "reboot",
        "mkfs",
        "dd if=",
        ":(){ :|:& };:"};

    // When non-empty, the first word of a command must be listed here.
    std::vector<std::string> allowed_programs;

    std::size_t max_output_bytes = 64 * 1024;
};

// Sandbox shared by the built-in tools of one session. Paths resolve inside
// a single canonical workspace root, commands pass the command policy and
// captured output is capped.
class PolicyGuard {
public:
    // Fails with invalid_workspace_root unless `workspace_root` is a directory.
    static core::errors::Result<PolicyGuard> for_workspace(
        const std::filesystem::path& workspace_root, CommandPolicy command_policy = {});

    core::errors::Result<std::filesystem::path> resolve_path(
        const std::filesystem::path& target) const;

    core::errors::Result<std::string> check_command(const std::string& command) const;

    std::string truncate_output(const std::string& output) const;

    const std::filesystem::path& workspace_root() const { return workspace_root_; }
    const CommandPolicy& command_policy() const { return command_policy_; }

private:
    PolicyGuard(std::filesystem::path workspace_root, CommandPolicy command_policy);

    std::filesystem::path workspace_root_;
    CommandPolicy command_policy_;
};

}  // namespace strand::policy
