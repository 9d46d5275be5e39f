#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include "core/errors/agent_errors.hpp"

namespace strand::app::cli {

    enum class CommandKind {
        Chat,
        History
    };

    struct CliRequest {
        CommandKind command = CommandKind::Chat;

        // chat
        std::string message;
        std::filesystem::path script_file;
        std::optional<std::filesystem::path> config_file;
        std::optional<std::uint32_t> max_steps;
        std::filesystem::path workspace = std::filesystem::current_path();
        bool allow_commands = false;
        bool stream = false;

        // chat + history
        std::optional<std::string> thread_id;
        std::filesystem::path store_dir = ".strand";
        bool verbose = false;

        // history
        std::size_t limit = 50;
        std::optional<std::string> cursor;
    };

    strand::core::errors::Result<CliRequest> parse_and_validate(int argc, char* argv[]);

    std::string usage();
}
