#pragma once

#include <cstddef>
#include <deque>
#include <filesystem>
#include <memory>
#include <mutex>
#include <string>
#include <vector>
#include <nlohmann/json.hpp>
#include "model/model_adapter.hpp"

namespace strand::model {

struct ScriptedReply {
    enum class Kind {
        Text,
        ToolCalls,
        TransientError,
        FatalError
    };

    Kind kind = Kind::Text;
    std::string text;                        // reply text or error message
    std::vector<protocol::ToolCall> tool_calls;
    std::vector<std::string> stream_chunks;  // delivered through on_text_delta

    static ScriptedReply make_text(std::string text);
    static ScriptedReply make_streamed_text(std::vector<std::string> chunks);
    static ScriptedReply make_tool_calls(std::vector<protocol::ToolCall> calls);
    static ScriptedReply make_transient_error(std::string message);
    // Streams `chunks`, then fails with a transient error.
    static ScriptedReply make_interrupted_stream(std::vector<std::string> chunks,
                                                 std::string message);
    static ScriptedReply make_fatal_error(std::string message);
};

// Replays a fixed queue of replies and records what it was asked.
//
// Script file format:
//   {"replies": [
//     {"text": "..."},
//     {"stream": ["chunk", "chunk"]},
//     {"tool_calls": [{"id": "call-1", "tool_name": "calculator", "arguments": {...}}]},
//     {"error": "transient" | "fatal", "message": "..."},
//     {"error": "transient", "stream": ["partial"], "message": "..."}
//   ]}
class ScriptedModel : public ModelAdapter {
public:
    ScriptedModel() = default;
    explicit ScriptedModel(std::vector<ScriptedReply> replies);

    static core::errors::Result<std::shared_ptr<ScriptedModel>> from_json(
        const nlohmann::json& script);
    static core::errors::Result<std::shared_ptr<ScriptedModel>> from_file(
        const std::filesystem::path& path);

    void push(ScriptedReply reply);

    core::errors::Result<ModelResponse> complete(
        const std::vector<protocol::Message>& context,
        const std::vector<protocol::ToolDescriptor>& tools,
        const CompletionOptions& options) override;

    std::size_t call_count() const;
    std::size_t remaining() const;
    std::vector<std::vector<protocol::Message>> received_contexts() const;
    std::vector<std::string> advertised_tools() const;

private:
    mutable std::mutex mutex_;
    std::deque<ScriptedReply> replies_;
    std::vector<std::vector<protocol::Message>> contexts_;
    std::vector<std::string> last_tool_names_;
};

}  // namespace strand::model
