#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ollama/common.hpp"
#include "ollama/keep_alive.hpp"
#include "ollama/options.hpp"
#include "ollama/request_options.hpp"
#include "ollama/streaming.hpp"

namespace ollama {

struct ToolCallFunction {
  std::string name;
  nlohmann::json arguments = nlohmann::json::object();
  std::optional<int> index;
};

struct ToolCall {
  ToolCallFunction function;
};

struct ChatMessage {
  std::string role;
  std::string content;
  std::optional<std::string> thinking;
  std::vector<Image> images;
  std::vector<ToolCall> tool_calls;
  /// Name of the tool whose result this message carries (role "tool").
  std::optional<std::string> tool_name;
};

ChatMessage make_tool_result_message(const std::string& tool_name, const std::string& content);

struct ToolFunctionDefinition {
  std::string name;
  std::optional<std::string> description;
  nlohmann::json parameters = nlohmann::json::object();
};

struct ToolDefinition {
  std::string type = "function";
  ToolFunctionDefinition function;
};

struct ChatRequest {
  std::string model;
  std::vector<ChatMessage> messages;
  std::vector<ToolDefinition> tools;
  /// Either the string "json" or a JSON schema object.
  std::optional<nlohmann::json> format;
  KeepAlive keep_alive;
  Options options;
  std::optional<ThinkSetting> think;
};

/**
 * One piece of a tool call as it arrives in a streamed chunk. Fragments sharing
 * an index across chunks belong to the same call. `complete` is set when the
 * server delivered the arguments as a whole object instead of a text piece.
 */
struct ToolCallFragment {
  int index = 0;
  std::optional<std::string> function_name;
  std::optional<std::string> arguments_text;
  bool complete = false;
};

struct PartialMessage {
  std::string role;
  std::optional<std::string> content;
  std::optional<std::string> thinking;
  std::vector<ToolCallFragment> tool_calls;
};

struct ChatChunk {
  std::string model;
  std::string created_at;
  PartialMessage message;
  bool done = false;
  std::optional<std::string> done_reason;
  GenerationMetrics metrics;
  nlohmann::json raw = nlohmann::json::object();
};

struct ChatResponse {
  std::string model;
  std::string created_at;
  ChatMessage message;
  bool done = false;
  std::optional<std::string> done_reason;
  GenerationMetrics metrics;
  nlohmann::json raw = nlohmann::json::object();
};

/// A tool call whose fragments have all arrived. Invoking the tool is up to the caller.
struct ReassembledToolCall {
  int index = 0;
  std::string name;
  std::map<std::string, std::string> arguments;
  nlohmann::json arguments_json = nlohmann::json::object();
  /// Fragments for this index disagreed on the function name; `name` holds the last one seen.
  bool name_conflict = false;

  /// Converts the call back into the message form used when replaying the conversation.
  ToolCall to_tool_call() const;
};

class ChatEventStream;
class OllamaClient;

class ChatResource {
public:
  explicit ChatResource(OllamaClient& client) : client_(client) {}

  /// Single-shot chat (`stream: false`).
  ChatResponse create(const ChatRequest& request, const RequestOptions& options = {}) const;

  /// Raw chunks, one per record, with tool-call fragments as received.
  Stream<ChatChunk> stream(const ChatRequest& request, const RequestOptions& options = {}) const;

  /// Content and thinking deltas plus tool calls reassembled across chunks.
  ChatEventStream events(const ChatRequest& request, const RequestOptions& options = {}) const;

private:
  OllamaClient& client_;
};

}  // namespace ollama
