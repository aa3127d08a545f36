#include "ollama/chat.hpp"

#include "ollama/chat_stream.hpp"
#include "ollama/client.hpp"
#include "ollama/utils/values.hpp"

namespace ollama {
namespace {

using json = nlohmann::json;

json tool_call_to_json(const ToolCall& call) {
  json function;
  if (call.function.index) function["index"] = *call.function.index;
  function["name"] = call.function.name;
  function["arguments"] = call.function.arguments;
  return json{{"function", std::move(function)}};
}

json message_to_json(const ChatMessage& message) {
  json body;
  body["role"] = message.role;
  body["content"] = message.content;
  if (message.thinking) body["thinking"] = *message.thinking;
  if (!message.images.empty()) body["images"] = images_to_json(message.images);
  if (!message.tool_calls.empty()) {
    json calls = json::array();
    for (const auto& call : message.tool_calls) {
      calls.push_back(tool_call_to_json(call));
    }
    body["tool_calls"] = std::move(calls);
  }
  if (message.tool_name) body["tool_name"] = *message.tool_name;
  return body;
}

json tool_definition_to_json(const ToolDefinition& tool) {
  json function;
  function["name"] = tool.function.name;
  if (tool.function.description) function["description"] = *tool.function.description;
  function["parameters"] = tool.function.parameters;
  return json{{"type", tool.type}, {"function", std::move(function)}};
}

json chat_request_to_json(const ChatRequest& request,
                          bool stream,
                          const KeepAlive& keep_alive,
                          const Options& options) {
  json body;
  body["model"] = request.model;
  json messages = json::array();
  for (const auto& message : request.messages) {
    messages.push_back(message_to_json(message));
  }
  body["messages"] = std::move(messages);
  body["stream"] = stream;
  if (!request.tools.empty()) {
    json tools = json::array();
    for (const auto& tool : request.tools) {
      tools.push_back(tool_definition_to_json(tool));
    }
    body["tools"] = std::move(tools);
  }
  if (request.format) body["format"] = *request.format;
  if (auto wire = keep_alive.to_json()) body["keep_alive"] = *wire;
  if (!options.empty()) body["options"] = options.to_json();
  if (request.think) body["think"] = think_to_json(*request.think);
  return body;
}

std::optional<int> fragment_index(const json& call, const json& function) {
  if (auto index = utils::optional_integer(function, "index")) {
    return static_cast<int>(*index);
  }
  if (auto index = utils::optional_integer(call, "index")) {
    return static_cast<int>(*index);
  }
  return std::nullopt;
}

ToolCallFragment parse_tool_call_fragment(const json& call, std::size_t position) {
  ToolCallFragment fragment;
  const json& function = call.contains("function") && call.at("function").is_object() ? call.at("function") : call;
  fragment.index = fragment_index(call, function).value_or(static_cast<int>(position));
  fragment.function_name = utils::optional_string(function, "name");
  if (function.contains("arguments")) {
    const auto& arguments = function.at("arguments");
    if (arguments.is_string()) {
      fragment.arguments_text = arguments.get<std::string>();
    } else if (arguments.is_object()) {
      fragment.arguments_text = arguments.dump();
      fragment.complete = true;
    } else if (!arguments.is_null()) {
      throw DecodeError("Tool call arguments must be a string or an object");
    }
  }
  return fragment;
}

ChatChunk parse_chat_chunk(const json& payload) {
  ChatChunk chunk;
  chunk.raw = payload;
  chunk.model = payload.value("model", "");
  chunk.created_at = payload.value("created_at", "");
  if (payload.contains("message") && payload.at("message").is_object()) {
    const auto& message = payload.at("message");
    chunk.message.role = message.value("role", "assistant");
    chunk.message.content = utils::optional_string(message, "content");
    chunk.message.thinking = utils::optional_string(message, "thinking");
    if (message.contains("tool_calls") && message.at("tool_calls").is_array()) {
      const auto& calls = message.at("tool_calls");
      for (std::size_t i = 0; i < calls.size(); ++i) {
        chunk.message.tool_calls.push_back(parse_tool_call_fragment(calls.at(i), i));
      }
    }
  }
  chunk.done = utils::require_field(payload, "done", "chat chunk").get<bool>();
  chunk.done_reason = utils::optional_string(payload, "done_reason");
  chunk.metrics = parse_generation_metrics(payload);
  return chunk;
}

ToolCall parse_tool_call(const json& call, std::size_t position) {
  const json& function = call.contains("function") && call.at("function").is_object() ? call.at("function") : call;
  ToolCall result;
  result.function.name = function.value("name", "");
  result.function.index = fragment_index(call, function);
  if (!result.function.index) {
    result.function.index = static_cast<int>(position);
  }
  if (function.contains("arguments")) {
    const auto& arguments = function.at("arguments");
    if (arguments.is_string()) {
      auto parsed = utils::safe_json(arguments.get<std::string>());
      if (!parsed || !parsed->is_object()) {
        throw DecodeError("Arguments of tool call " + result.function.name + " are not a JSON object");
      }
      result.function.arguments = std::move(*parsed);
    } else if (arguments.is_object()) {
      result.function.arguments = arguments;
    }
  }
  return result;
}

ChatResponse parse_chat_response(const json& payload) {
  ChatResponse response;
  response.raw = payload;
  response.model = payload.value("model", "");
  response.created_at = payload.value("created_at", "");
  const auto& message = utils::require_field(payload, "message", "chat response");
  response.message.role = message.value("role", "assistant");
  response.message.content = message.value("content", "");
  response.message.thinking = utils::optional_string(message, "thinking");
  if (message.contains("tool_calls") && message.at("tool_calls").is_array()) {
    const auto& calls = message.at("tool_calls");
    for (std::size_t i = 0; i < calls.size(); ++i) {
      response.message.tool_calls.push_back(parse_tool_call(calls.at(i), i));
    }
  }
  response.done = payload.value("done", true);
  response.done_reason = utils::optional_string(payload, "done_reason");
  response.metrics = parse_generation_metrics(payload);
  return response;
}

StreamCompletion chat_completion(const ChatChunk& chunk) {
  return StreamCompletion{chunk.done, chunk.done_reason};
}

}  // namespace

ChatMessage make_tool_result_message(const std::string& tool_name, const std::string& content) {
  ChatMessage message;
  message.role = "tool";
  message.content = content;
  message.tool_name = tool_name;
  return message;
}

ChatResponse ChatResource::create(const ChatRequest& request, const RequestOptions& options) const {
  auto body = chat_request_to_json(request, false, client_.effective_keep_alive(request.keep_alive),
                                   client_.effective_options(request.options));
  auto response = client_.perform_request("POST", "/api/chat", body.dump(), options);
  ChatResponse result;
  try {
    result = parse_chat_response(json::parse(response.body));
  } catch (const json::exception& ex) {
    throw DecodeError(std::string("Failed to parse chat response: ") + ex.what());
  }
  if (think_enabled(request.think) && !result.message.thinking) {
    client_.log(LogLevel::Warn, "thinking requested but not returned", json{{"model", result.model}});
  }
  return result;
}

Stream<ChatChunk> ChatResource::stream(const ChatRequest& request, const RequestOptions& options) const {
  auto body = chat_request_to_json(request, true, client_.effective_keep_alive(request.keep_alive),
                                   client_.effective_options(request.options));
  return client_.open_stream<ChatChunk>("/api/chat", body, parse_chat_chunk, chat_completion, options);
}

ChatEventStream ChatResource::events(const ChatRequest& request, const RequestOptions& options) const {
  return ChatEventStream(stream(request, options));
}

}  // namespace ollama
