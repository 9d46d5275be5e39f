#pragma once
#include <cstddef>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "protocol/message_contract.hpp"

namespace strand::protocol {

    using Metadata = std::map<std::string, nlohmann::json>;

    struct MemoryThread {
        std::string id;
        std::string title;
        std::optional<std::string> agent_id;
        std::optional<std::string> resource_id;  // owning user or organization
        Metadata metadata;
        std::int64_t created_at_ms = 0;
        std::int64_t updated_at_ms = 0;
    };

    struct CreateThreadParams {
        std::optional<std::string> id;
        std::string title;
        std::optional<std::string> agent_id;
        std::optional<std::string> resource_id;
        Metadata metadata;
    };

    // Partial update. Keys in `metadata` overwrite, keys absent are kept,
    // keys in `remove_keys` are dropped.
    struct ThreadPatch {
        std::optional<std::string> title;
        Metadata metadata;
        std::vector<std::string> remove_keys;
    };

    struct ThreadQuery {
        std::optional<std::string> agent_id;
        std::optional<std::string> resource_id;
    };

    struct MessageQuery {
        std::size_t limit = 50;
        std::optional<std::string> cursor;
        bool reverse = false;
        std::optional<Role> role;
        std::vector<std::string> keywords;  // all must appear in content
    };

    struct MessagePage {
        std::vector<Message> messages;
        std::optional<std::string> next_cursor;
    };

    struct ThreadStats {
        std::size_t message_count = 0;
        std::size_t user_message_count = 0;
        std::size_t assistant_message_count = 0;
        std::size_t tool_message_count = 0;
        std::int64_t created_at_ms = 0;
        std::optional<std::int64_t> last_message_at_ms;
        std::size_t size_bytes = 0;
    };

} // namespace strand::protocol
