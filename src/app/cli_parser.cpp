#include "cli_parser.hpp"
#include <charconv>
#include <optional>
#include <system_error>
#include <utility>
#include <vector>

namespace strand::app::cli {

    using namespace strand::core::errors;

    // 1. Raw Options Struct (Internal only)
    struct RawCliOptions {
        std::optional<std::string> message;
        std::optional<std::string> script;
        std::optional<std::string> config;
        std::optional<std::string> max_steps;
        std::optional<std::string> workspace;
        std::optional<std::string> thread_id;
        std::optional<std::string> store_dir;
        std::optional<std::string> limit;
        std::optional<std::string> cursor;
        bool allow_commands = false;
        bool stream = false;
        bool verbose = false;
    };

    namespace {

        // Exception-free integer parsing
        template <typename T>
        Result<T> parse_bounded(const std::string& flag, const std::string& text, T low, T high) {
            T value = 0;
            const char* begin = text.data();
            const char* end = text.data() + text.size();
            auto [ptr, ec] = std::from_chars(begin, end, value);
            if (ec != std::errc() || ptr != end) {
                return AgentError{ErrorCategory::Validation, "Invalid number for " + flag, "invalid_integer", "Provide a positive integer."};
            }
            if (value < low || value > high) {
                return AgentError{ErrorCategory::Validation, flag + " out of bounds", "bounds_error",
                                  "Must be between " + std::to_string(low) + " and " + std::to_string(high) + "."};
            }
            return value;
        }

        Result<std::filesystem::path> existing_file(const std::string& flag, const std::string& raw) {
            std::filesystem::path p(raw);
            std::error_code path_ec;
            const bool is_file = std::filesystem::is_regular_file(p, path_ec);
            if (path_ec || !is_file) {
                return AgentError{ErrorCategory::Validation, flag + " file does not exist: " + raw, "invalid_path"};
            }
            return p;
        }

        Result<std::filesystem::path> existing_directory(const std::string& flag, const std::string& raw) {
            std::filesystem::path p(raw);
            std::error_code path_ec;
            const bool is_dir = std::filesystem::is_directory(p, path_ec);
            if (path_ec || !is_dir) {
                return AgentError{ErrorCategory::Validation, flag + " does not exist or is not a directory", "invalid_path"};
            }
            std::filesystem::path canonical_path = std::filesystem::canonical(p, path_ec);
            if (path_ec) {
                return AgentError{ErrorCategory::Validation, "Failed to canonicalize " + flag, "invalid_path"};
            }
            return canonical_path;
        }

    } // namespace

    std::string usage() {
        return "Usage:\n"
               "  strand chat --message \"...\" --script replies.json [--thread-id ID]\n"
               "              [--store-dir DIR] [--config FILE] [--max-steps N]\n"
               "              [--workspace DIR] [--allow-commands] [--stream] [--verbose]\n"
               "  strand history --thread-id ID [--store-dir DIR] [--limit N] [--cursor C] [--verbose]";
    }

    Result<CliRequest> parse_and_validate(int argc, char* argv[]) {
        if (argc < 2) {
            return AgentError{ErrorCategory::Validation, "No command provided.", "missing_command", usage()};
        }

        CliRequest req;
        std::string command = argv[1];
        if (command == "chat") {
            req.command = CommandKind::Chat;
        } else if (command == "history") {
            req.command = CommandKind::History;
        } else {
            return AgentError{ErrorCategory::Validation, "Unknown command: " + command, "unknown_command", usage()};
        }

        RawCliOptions raw;
        std::vector<std::string> args;
        for (int i = 2; i < argc; ++i) { // Start at 2 to skip program name and command
            args.push_back(argv[i]);
        }

        // 2. Parser Phase: Just read the raw strings
        const std::vector<std::pair<std::string, std::optional<std::string>*>> valued = {
            {"--message", &raw.message},     {"--script", &raw.script},
            {"--config", &raw.config},       {"--max-steps", &raw.max_steps},
            {"--workspace", &raw.workspace}, {"--thread-id", &raw.thread_id},
            {"--store-dir", &raw.store_dir}, {"--limit", &raw.limit},
            {"--cursor", &raw.cursor}};

        for (size_t i = 0; i < args.size(); ++i) {
            if (args[i] == "--allow-commands") {
                raw.allow_commands = true;
                continue;
            }
            if (args[i] == "--stream") {
                raw.stream = true;
                continue;
            }
            if (args[i] == "--verbose") {
                raw.verbose = true;
                continue;
            }

            bool matched = false;
            for (const auto& [flag, slot] : valued) {
                if (args[i] != flag) continue;
                if (i + 1 >= args.size()) {
                    return AgentError{ErrorCategory::Validation, "Missing value for " + flag, "missing_value"};
                }
                *slot = args[++i];
                matched = true;
                break;
            }
            if (!matched) {
                return AgentError{ErrorCategory::Validation, "Unknown argument: " + args[i], "unknown_argument"};
            }
        }

        // 3. Validator Phase: Enforce logic and bounds
        req.verbose = raw.verbose;
        if (raw.thread_id) {
            if (raw.thread_id->empty()) {
                return AgentError{ErrorCategory::Validation, "--thread-id cannot be empty", "invalid_thread_id"};
            }
            req.thread_id = raw.thread_id;
        }
        if (raw.store_dir) req.store_dir = std::filesystem::path(raw.store_dir.value());

        if (req.command == CommandKind::History) {
            if (raw.message || raw.script || raw.config || raw.max_steps || raw.workspace ||
                raw.allow_commands || raw.stream) {
                return AgentError{ErrorCategory::Validation, "Chat options are not valid for 'history'", "conflicting_flags"};
            }
            if (!req.thread_id) {
                return AgentError{ErrorCategory::Validation, "Must provide --thread-id", "missing_required_flag"};
            }
            if (raw.limit) {
                auto limit = parse_bounded<std::size_t>("--limit", raw.limit.value(), 1, 1000);
                if (is_error(limit)) return get_error(limit);
                req.limit = get_value(limit);
            }
            req.cursor = raw.cursor;
            return req;
        }

        if (raw.limit || raw.cursor) {
            return AgentError{ErrorCategory::Validation, "--limit and --cursor only apply to 'history'", "conflicting_flags"};
        }
        if (!raw.message.has_value() || raw.message->empty()) {
            return AgentError{ErrorCategory::Validation, "Must provide a non-empty --message", "missing_required_flag"};
        }
        if (!raw.script.has_value()) {
            return AgentError{ErrorCategory::Validation, "Must provide --script", "missing_required_flag",
                              "The script file lists the model replies to play back."};
        }
        req.message = raw.message.value();
        req.allow_commands = raw.allow_commands;
        req.stream = raw.stream;

        auto script = existing_file("--script", raw.script.value());
        if (is_error(script)) return get_error(script);
        req.script_file = get_value(script);

        if (raw.config) {
            auto config = existing_file("--config", raw.config.value());
            if (is_error(config)) return get_error(config);
            req.config_file = get_value(config);
        }

        if (raw.max_steps) {
            auto steps = parse_bounded<std::uint32_t>("--max-steps", raw.max_steps.value(), 1, 1000);
            if (is_error(steps)) return get_error(steps);
            req.max_steps = get_value(steps);
        }

        if (raw.workspace) {
            auto workspace = existing_directory("--workspace", raw.workspace.value());
            if (is_error(workspace)) return get_error(workspace);
            req.workspace = get_value(workspace);
        }

        return req;
    }

} // namespace strand::app::cli
