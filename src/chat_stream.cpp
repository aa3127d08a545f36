#include "ollama/chat_stream.hpp"

#include <utility>

#include <nlohmann/json.hpp>

namespace ollama {
namespace {

using json = nlohmann::json;

ChatStreamEvent text_event(ChatStreamEvent::Type type, const std::string& text) {
  ChatStreamEvent event;
  event.type = type;
  event.text = text;
  return event;
}

bool is_blank(const std::string& text) {
  return text.find_first_not_of(" \t\r\n") == std::string::npos;
}

}  // namespace

std::vector<ChatStreamEvent> ToolCallReassembler::ingest(const ChatChunk& chunk) {
  std::vector<ChatStreamEvent> events;

  if (chunk.message.thinking && !chunk.message.thinking->empty()) {
    events.push_back(text_event(ChatStreamEvent::Type::Thinking, *chunk.message.thinking));
  }
  if (chunk.message.content && !chunk.message.content->empty()) {
    events.push_back(text_event(ChatStreamEvent::Type::Content, *chunk.message.content));
  }

  for (const auto& fragment : chunk.message.tool_calls) {
    auto& pending = pending_[fragment.index];
    if (fragment.function_name && !fragment.function_name->empty()) {
      if (pending.name && *pending.name != *fragment.function_name) {
        pending.name_conflict = true;
      }
      pending.name = fragment.function_name;
    }
    if (fragment.arguments_text) {
      pending.arguments_text += *fragment.arguments_text;
    }
    if (fragment.complete) {
      auto node = pending_.extract(fragment.index);
      events.push_back(finalize(fragment.index, std::move(node.mapped())));
    }
  }

  if (chunk.done) {
    auto flushed = finish();
    events.insert(events.end(), std::make_move_iterator(flushed.begin()), std::make_move_iterator(flushed.end()));

    ChatStreamEvent done;
    done.type = ChatStreamEvent::Type::Done;
    done.final_chunk = chunk;
    events.push_back(std::move(done));
  }

  return events;
}

std::vector<ChatStreamEvent> ToolCallReassembler::finish() {
  std::vector<ChatStreamEvent> events;
  for (auto& [index, pending] : pending_) {
    events.push_back(finalize(index, std::move(pending)));
  }
  pending_.clear();
  return events;
}

ChatStreamEvent ToolCallReassembler::finalize(int index, PendingToolCall pending) const {
  const std::string name = pending.name.value_or("");

  json arguments = json::object();
  if (!is_blank(pending.arguments_text)) {
    try {
      arguments = json::parse(pending.arguments_text);
    } catch (const json::parse_error& ex) {
      ChatStreamEvent event;
      event.type = ChatStreamEvent::Type::ToolCallError;
      event.tool_call_error = ToolCallParseError(
          "Failed to parse arguments of tool call " + std::to_string(index) + " (" + name + "): " + ex.what(),
          index, name, std::move(pending.arguments_text));
      return event;
    }
    if (!arguments.is_object()) {
      ChatStreamEvent event;
      event.type = ChatStreamEvent::Type::ToolCallError;
      event.tool_call_error = ToolCallParseError(
          "Arguments of tool call " + std::to_string(index) + " (" + name + ") are not a JSON object",
          index, name, std::move(pending.arguments_text));
      return event;
    }
  }

  ReassembledToolCall call;
  call.index = index;
  call.name = name;
  call.name_conflict = pending.name_conflict;
  for (const auto& item : arguments.items()) {
    call.arguments[item.key()] = item.value().is_string() ? item.value().get<std::string>() : item.value().dump();
  }
  call.arguments_json = std::move(arguments);

  ChatStreamEvent event;
  event.type = ChatStreamEvent::Type::ToolCall;
  event.tool_call = std::move(call);
  return event;
}

std::optional<ChatStreamEvent> ChatEventStream::next() {
  while (ready_.empty()) {
    std::optional<StreamEvent<ChatChunk>> chunk;
    try {
      chunk = chunks_.next();
    } catch (...) {
      reassembler_.reset();
      throw;
    }
    if (!chunk) {
      reassembler_.reset();
      return std::nullopt;
    }
    for (auto& event : reassembler_.ingest(chunk->payload)) {
      ready_.push_back(std::move(event));
    }
  }

  ChatStreamEvent event = std::move(ready_.front());
  ready_.pop_front();
  record(event);
  return event;
}

void ChatEventStream::close() {
  ready_.clear();
  reassembler_.reset();
  chunks_.close();
}

void ChatEventStream::record(const ChatStreamEvent& event) {
  switch (event.type) {
    case ChatStreamEvent::Type::Content:
      content_ += event.text;
      break;
    case ChatStreamEvent::Type::Thinking:
      thinking_ += event.text;
      break;
    case ChatStreamEvent::Type::ToolCall:
      if (event.tool_call) tool_calls_.push_back(*event.tool_call);
      break;
    case ChatStreamEvent::Type::ToolCallError:
    case ChatStreamEvent::Type::Done:
      break;
  }
}

ToolCall ReassembledToolCall::to_tool_call() const {
  ToolCall call;
  call.function.name = name;
  call.function.arguments = arguments_json;
  call.function.index = index;
  return call;
}

}  // namespace ollama
