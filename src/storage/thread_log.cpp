#include "storage/thread_log.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <system_error>
#include <unordered_set>
#include <utility>
#include "core/config/id_generator.hpp"

namespace strand::storage {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using protocol::Message;
using protocol::MessagePage;
using protocol::MessageQuery;

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](const unsigned char c) {
                       return static_cast<char>(std::tolower(c));
                   });
    return value;
}

bool matches(const Message& message, const MessageQuery& query,
             const std::vector<std::string>& lowered_keywords) {
    if (query.role.has_value() && message.role != query.role.value()) {
        return false;
    }
    if (lowered_keywords.empty()) {
        return true;
    }
    const std::string content = lowercase(message.content);
    for (const auto& keyword : lowered_keywords) {
        if (content.find(keyword) == std::string::npos) {
            return false;
        }
    }
    return true;
}

}  // namespace

ThreadLog::ThreadLog(protocol::MemoryThread header) : header_(std::move(header)) {}

protocol::MemoryThread ThreadLog::patched_header(
    const protocol::ThreadPatch& patch, const std::int64_t now_ms) const {
    protocol::MemoryThread next = header_;
    if (patch.title.has_value()) {
        next.title = patch.title.value();
    }
    for (const auto& [key, value] : patch.metadata) {
        next.metadata[key] = value;
    }
    for (const auto& key : patch.remove_keys) {
        next.metadata.erase(key);
    }
    next.updated_at_ms = std::max(next.updated_at_ms, now_ms);
    return next;
}

void ThreadLog::set_header(protocol::MemoryThread header) {
    header_ = std::move(header);
}

void ThreadLog::apply_patch(const protocol::ThreadPatch& patch,
                            const std::int64_t now_ms) {
    set_header(patched_header(patch, now_ms));
}

void ThreadLog::touch(const std::int64_t now_ms) {
    header_.updated_at_ms = std::max(header_.updated_at_ms, now_ms);
}

std::optional<Message> ThreadLog::find(const std::string& message_id) const {
    auto it = index_by_id_.find(message_id);
    if (it == index_by_id_.end()) {
        return std::nullopt;
    }
    return messages_[it->second];
}

StampedBatch ThreadLog::stamp(const std::vector<Message>& batch,
                              const std::int64_t now_ms) const {
    StampedBatch out;
    std::unordered_set<std::string> batch_ids;
    std::uint64_t sequence = next_sequence_;

    for (const auto& input : batch) {
        if (!input.id.empty()) {
            auto existing = find(input.id);
            if (existing.has_value()) {
                out.resolved.push_back(existing.value());
                continue;
            }
            if (!batch_ids.insert(input.id).second) {
                // Same client id twice in one batch: the first copy wins.
                for (const auto& earlier : out.fresh) {
                    if (earlier.id == input.id) {
                        out.resolved.push_back(earlier);
                        break;
                    }
                }
                continue;
            }
        }

        Message stamped = input;
        if (stamped.id.empty()) {
            stamped.id = core::config::generate_id("msg");
        }
        stamped.thread_id = header_.id;
        stamped.sequence = sequence++;
        stamped.created_at_ms = now_ms;
        out.fresh.push_back(stamped);
        out.resolved.push_back(std::move(stamped));
    }
    return out;
}

void ThreadLog::commit(const std::vector<Message>& stamped) {
    for (const auto& message : stamped) {
        index_by_id_[message.id] = messages_.size();
        messages_.push_back(message);
        next_sequence_ = std::max(next_sequence_, message.sequence + 1);
        touch(message.created_at_ms);
    }
}

core::errors::Result<MessagePage> ThreadLog::page(const MessageQuery& query) const {
    if (query.limit == 0) {
        return AgentError{ErrorCategory::Validation,
                          "Message query limit must be greater than zero.",
                          "invalid_limit"};
    }

    std::optional<std::uint64_t> cursor;
    if (query.cursor.has_value()) {
        std::uint64_t value = 0;
        const std::string& text = query.cursor.value();
        const char* begin = text.data();
        const char* end = text.data() + text.size();
        auto [ptr, ec] = std::from_chars(begin, end, value);
        if (text.empty() || ec != std::errc() || ptr != end) {
            return AgentError{ErrorCategory::Validation,
                              "Invalid pagination cursor: " + text,
                              "invalid_cursor"};
        }
        cursor = value;
    }

    std::vector<std::string> keywords;
    for (const auto& keyword : query.keywords) {
        if (!keyword.empty()) {
            keywords.push_back(lowercase(keyword));
        }
    }

    MessagePage result;
    bool more = false;
    auto visit = [&](const Message& message) {
        if (!matches(message, query, keywords)) {
            return true;
        }
        if (result.messages.size() == query.limit) {
            more = true;
            return false;
        }
        result.messages.push_back(message);
        return true;
    };

    if (!query.reverse) {
        for (const auto& message : messages_) {
            if (cursor.has_value() && message.sequence <= cursor.value()) {
                continue;
            }
            if (!visit(message)) {
                break;
            }
        }
    } else {
        for (auto it = messages_.rbegin(); it != messages_.rend(); ++it) {
            if (cursor.has_value() && it->sequence >= cursor.value()) {
                continue;
            }
            if (!visit(*it)) {
                break;
            }
        }
    }

    if (more && !result.messages.empty()) {
        result.next_cursor = std::to_string(result.messages.back().sequence);
    }
    return result;
}

std::size_t ThreadLog::erase(const std::vector<std::string>& message_ids) {
    const std::unordered_set<std::string> doomed(message_ids.begin(),
                                                 message_ids.end());
    const std::size_t before = messages_.size();
    messages_.erase(std::remove_if(messages_.begin(), messages_.end(),
                                   [&doomed](const Message& message) {
                                       return doomed.count(message.id) > 0;
                                   }),
                    messages_.end());
    rebuild_index();
    return before - messages_.size();
}

protocol::ThreadStats ThreadLog::stats() const {
    protocol::ThreadStats stats;
    stats.created_at_ms = header_.created_at_ms;
    stats.message_count = messages_.size();
    for (const auto& message : messages_) {
        switch (message.role) {
            case protocol::Role::User:
                ++stats.user_message_count;
                break;
            case protocol::Role::Assistant:
                ++stats.assistant_message_count;
                break;
            case protocol::Role::Tool:
                ++stats.tool_message_count;
                break;
            default:
                break;
        }
        stats.size_bytes += message.content.size();
    }
    if (!messages_.empty()) {
        stats.last_message_at_ms = messages_.back().created_at_ms;
    }
    return stats;
}

void ThreadLog::rebuild_index() {
    index_by_id_.clear();
    for (std::size_t i = 0; i < messages_.size(); ++i) {
        index_by_id_[messages_[i].id] = i;
    }
}

void ThreadLog::advance_sequence(std::uint64_t next) {
    next_sequence_ = std::max(next_sequence_, next);
}

}  // namespace strand::storage
