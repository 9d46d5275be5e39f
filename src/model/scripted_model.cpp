#include "model/scripted_model.hpp"

#include <fstream>
#include <sstream>
#include <utility>
#include "protocol/json_codec.hpp"

namespace strand::model {

using core::errors::AgentError;
using core::errors::ErrorCategory;
using nlohmann::json;

namespace {

AgentError invalid_script(const std::string& message) {
    return AgentError{ErrorCategory::Validation, "Invalid model script: " + message,
                      "invalid_script"};
}

core::errors::Result<std::vector<std::string>> stream_chunks(const json& entry) {
    if (!entry["stream"].is_array()) {
        return invalid_script("'stream' must be an array");
    }
    std::vector<std::string> chunks;
    for (const auto& chunk : entry["stream"]) {
        if (!chunk.is_string()) {
            return invalid_script("'stream' entries must be strings");
        }
        chunks.push_back(chunk.get<std::string>());
    }
    return chunks;
}

core::errors::Result<ScriptedReply> reply_from_json(const json& entry) {
    if (!entry.is_object()) {
        return invalid_script("each reply must be an object");
    }
    if (entry.contains("text") && entry["text"].is_string()) {
        return ScriptedReply::make_text(entry["text"].get<std::string>());
    }
    if (entry.contains("error") && entry["error"].is_string()) {
        const std::string kind = entry["error"].get<std::string>();
        const std::string message = entry.value("message", std::string("scripted failure"));
        if (kind == "transient" && entry.contains("stream")) {
            auto chunks = stream_chunks(entry);
            if (core::errors::is_error(chunks)) {
                return core::errors::get_error(chunks);
            }
            return ScriptedReply::make_interrupted_stream(
                core::errors::take_value(std::move(chunks)), message);
        }
        if (kind == "transient") {
            return ScriptedReply::make_transient_error(message);
        }
        if (kind == "fatal") {
            return ScriptedReply::make_fatal_error(message);
        }
        return invalid_script("unknown error kind '" + kind + "'");
    }
    if (entry.contains("stream")) {
        auto chunks = stream_chunks(entry);
        if (core::errors::is_error(chunks)) {
            return core::errors::get_error(chunks);
        }
        return ScriptedReply::make_streamed_text(core::errors::take_value(std::move(chunks)));
    }
    if (entry.contains("tool_calls") && entry["tool_calls"].is_array()) {
        std::vector<protocol::ToolCall> calls;
        for (const auto& raw : entry["tool_calls"]) {
            auto call = protocol::tool_call_from_json(raw);
            if (core::errors::is_error(call)) {
                return core::errors::get_error(call);
            }
            calls.push_back(core::errors::get_value(call));
        }
        if (calls.empty()) {
            return invalid_script("'tool_calls' cannot be empty");
        }
        return ScriptedReply::make_tool_calls(std::move(calls));
    }
    return invalid_script("reply needs one of text, stream, tool_calls, error");
}

}  // namespace

ScriptedReply ScriptedReply::make_text(std::string text) {
    ScriptedReply reply;
    reply.kind = Kind::Text;
    reply.text = std::move(text);
    return reply;
}

ScriptedReply ScriptedReply::make_streamed_text(std::vector<std::string> chunks) {
    ScriptedReply reply;
    reply.kind = Kind::Text;
    for (const auto& chunk : chunks) {
        reply.text += chunk;
    }
    reply.stream_chunks = std::move(chunks);
    return reply;
}

ScriptedReply ScriptedReply::make_tool_calls(std::vector<protocol::ToolCall> calls) {
    ScriptedReply reply;
    reply.kind = Kind::ToolCalls;
    reply.tool_calls = std::move(calls);
    return reply;
}

ScriptedReply ScriptedReply::make_transient_error(std::string message) {
    ScriptedReply reply;
    reply.kind = Kind::TransientError;
    reply.text = std::move(message);
    return reply;
}

ScriptedReply ScriptedReply::make_interrupted_stream(std::vector<std::string> chunks,
                                                     std::string message) {
    ScriptedReply reply = make_transient_error(std::move(message));
    reply.stream_chunks = std::move(chunks);
    return reply;
}

ScriptedReply ScriptedReply::make_fatal_error(std::string message) {
    ScriptedReply reply;
    reply.kind = Kind::FatalError;
    reply.text = std::move(message);
    return reply;
}

ScriptedModel::ScriptedModel(std::vector<ScriptedReply> replies)
    : replies_(replies.begin(), replies.end()) {}

core::errors::Result<std::shared_ptr<ScriptedModel>> ScriptedModel::from_json(
    const json& script) {
    if (!script.is_object() || !script.contains("replies") ||
        !script["replies"].is_array()) {
        return invalid_script("expected an object with a 'replies' array");
    }
    std::vector<ScriptedReply> replies;
    for (const auto& entry : script["replies"]) {
        auto reply = reply_from_json(entry);
        if (core::errors::is_error(reply)) {
            return core::errors::get_error(reply);
        }
        replies.push_back(core::errors::get_value(reply));
    }
    return std::make_shared<ScriptedModel>(std::move(replies));
}

core::errors::Result<std::shared_ptr<ScriptedModel>> ScriptedModel::from_file(
    const std::filesystem::path& path) {
    std::ifstream in(path);
    if (!in.is_open()) {
        return AgentError{ErrorCategory::Validation,
                          "Unable to open model script: " + path.string(),
                          "script_read_failed"};
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    const json script = json::parse(buffer.str(), nullptr, false);
    if (script.is_discarded()) {
        return invalid_script(path.string() + " is not valid JSON");
    }
    return from_json(script);
}

void ScriptedModel::push(ScriptedReply reply) {
    std::lock_guard<std::mutex> lock(mutex_);
    replies_.push_back(std::move(reply));
}

core::errors::Result<ModelResponse> ScriptedModel::complete(
    const std::vector<protocol::Message>& context,
    const std::vector<protocol::ToolDescriptor>& tools,
    const CompletionOptions& options) {
    ScriptedReply reply;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        contexts_.push_back(context);
        last_tool_names_.clear();
        for (const auto& tool : tools) {
            last_tool_names_.push_back(tool.name);
        }
        if (replies_.empty()) {
            return AgentError{ErrorCategory::Provider,
                              "Model script exhausted after " +
                                  std::to_string(contexts_.size() - 1) + " replies.",
                              "script_exhausted"};
        }
        reply = std::move(replies_.front());
        replies_.pop_front();
    }

    switch (reply.kind) {
        case ScriptedReply::Kind::TransientError:
            if (options.on_text_delta) {
                for (const auto& chunk : reply.stream_chunks) {
                    options.on_text_delta(chunk);
                }
            }
            return AgentError{ErrorCategory::TransientProvider, reply.text,
                              "provider_rate_limited"};
        case ScriptedReply::Kind::FatalError:
            return AgentError{ErrorCategory::Provider, reply.text, "provider_failed"};
        case ScriptedReply::Kind::ToolCalls: {
            ModelResponse response;
            response.tool_calls = std::move(reply.tool_calls);
            return response;
        }
        case ScriptedReply::Kind::Text:
        default: {
            if (options.on_text_delta) {
                for (const auto& chunk : reply.stream_chunks) {
                    options.on_text_delta(chunk);
                }
            }
            ModelResponse response;
            response.text = std::move(reply.text);
            return response;
        }
    }
}

std::size_t ScriptedModel::call_count() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_.size();
}

std::size_t ScriptedModel::remaining() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return replies_.size();
}

std::vector<std::vector<protocol::Message>> ScriptedModel::received_contexts() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return contexts_;
}

std::vector<std::string> ScriptedModel::advertised_tools() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return last_tool_names_;
}

}  // namespace strand::model
