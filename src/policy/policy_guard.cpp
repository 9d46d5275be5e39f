#include "policy/policy_guard.hpp"

#include <algorithm>
#include <cctype>
#include <system_error>
#include <utility>

namespace strand::policy {

using core::errors::AgentError;
using core::errors::ErrorCategory;

namespace {

// Component-wise prefix test on canonical paths.
bool starts_with_path(const std::filesystem::path& root, const std::filesystem::path& child) {
    return std::mismatch(root.begin(), root.end(), child.begin(), child.end()).first ==
           root.end();
}

std::string to_lower(std::string text) {
    for (char& c : text) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return text;
}

// Leading program name, stopping at whitespace or a shell separator.
std::string program_of(const std::string& command) {
    const auto start = command.find_first_not_of(" \t");
    if (start == std::string::npos) {
        return "";
    }
    const auto stop = command.find_first_of(" \t;|&", start);
    return stop == std::string::npos ? command.substr(start)
                                     : command.substr(start, stop - start);
}

}  // namespace

PolicyGuard::PolicyGuard(std::filesystem::path workspace_root, CommandPolicy command_policy)
    : workspace_root_(std::move(workspace_root)), command_policy_(std::move(command_policy)) {}

core::errors::Result<PolicyGuard> PolicyGuard::for_workspace(
    const std::filesystem::path& workspace_root, CommandPolicy command_policy) {
    std::error_code ec;
    const bool is_dir = std::filesystem::is_directory(workspace_root, ec);
    std::filesystem::path canonical;
    if (is_dir && !ec) {
        canonical = std::filesystem::weakly_canonical(workspace_root, ec);
    }
    if (!is_dir || ec) {
        return AgentError{ErrorCategory::Validation,
                          "Workspace root is not a usable directory: " +
                              workspace_root.string(),
                          "invalid_workspace_root",
                          "Pass an existing directory as the workspace."};
    }
    return PolicyGuard(std::move(canonical), std::move(command_policy));
}

core::errors::Result<std::filesystem::path> PolicyGuard::resolve_path(
    const std::filesystem::path& target) const {
    std::error_code ec;
    const auto resolved = std::filesystem::weakly_canonical(
        target.is_absolute() ? target : workspace_root_ / target, ec);
    if (ec) {
        return AgentError{ErrorCategory::Validation,
                          "Unable to resolve path: " + target.string(), "invalid_path"};
    }
    if (!starts_with_path(workspace_root_, resolved)) {
        return AgentError{ErrorCategory::AccessDenied,
                          "Path escapes workspace root: " + resolved.string(),
                          "path_outside_workspace"};
    }
    return resolved;
}

core::errors::Result<std::string> PolicyGuard::check_command(const std::string& command) const {
    const std::string program = program_of(command);
    if (program.empty()) {
        return AgentError{ErrorCategory::Validation, "Command cannot be empty.",
                          "empty_command"};
    }

    const std::string haystack = to_lower(command);
    const auto& blocked = command_policy_.blocked_substrings;
    const auto hit = std::find_if(blocked.begin(), blocked.end(), [&](const std::string& b) {
        return haystack.find(to_lower(b)) != std::string::npos;
    });
    if (hit != blocked.end()) {
        return AgentError{ErrorCategory::AccessDenied,
                          "Command contains blocked operation: " + *hit, "blocked_command"};
    }

    const auto& allowed = command_policy_.allowed_programs;
    if (!allowed.empty() && std::count(allowed.begin(), allowed.end(), program) == 0) {
        return AgentError{ErrorCategory::AccessDenied,
                          "Program is not on the allow list: " + program,
                          "program_not_allowed"};
    }
    return command;
}

std::string PolicyGuard::truncate_output(const std::string& output) const {
    const std::size_t limit = command_policy_.max_output_bytes;
    if (limit == 0 || output.size() <= limit) {
        return output;
    }
    // Back up to a lead byte so a multi-byte sequence is never split.
    std::size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(output[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return output.substr(0, cut) + "\n[truncated " + std::to_string(output.size() - cut) +
           " bytes]";
}

}  // namespace strand::policy
