#pragma once

#include <deque>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "ollama/chat.hpp"
#include "ollama/error.hpp"
#include "ollama/streaming.hpp"

namespace ollama {

struct ChatStreamEvent {
  enum class Type { Content, Thinking, ToolCall, ToolCallError, Done };

  Type type = Type::Content;
  /// Delta text for Content and Thinking events.
  std::string text;
  std::optional<ReassembledToolCall> tool_call;
  std::optional<ToolCallParseError> tool_call_error;
  /// The final chunk (done reason, metrics) for Done events.
  std::optional<ChatChunk> final_chunk;
};

/**
 * Accumulates tool-call fragments by index for the lifetime of one chat stream.
 *
 * Argument text is appended in arrival order. A call is finalized when one of its
 * fragments is marked complete, or when a chunk with `done` set flushes every call
 * still open. Finalization parses the accumulated text as one JSON object; a parse
 * failure yields a ToolCallError event for that index only.
 */
class ToolCallReassembler {
public:
  std::vector<ChatStreamEvent> ingest(const ChatChunk& chunk);

  /// Finalizes every open call, in index order.
  std::vector<ChatStreamEvent> finish();

  /// Drops open calls without finalizing them.
  void reset() { pending_.clear(); }

  [[nodiscard]] std::size_t open_calls() const { return pending_.size(); }

private:
  struct PendingToolCall {
    std::optional<std::string> name;
    std::string arguments_text;
    bool name_conflict = false;
  };

  ChatStreamEvent finalize(int index, PendingToolCall pending) const;

  std::map<int, PendingToolCall> pending_;
};

/**
 * Lazily turns a chunk stream into ChatStreamEvents. Same ownership and
 * cancellation rules as Stream: destroying or closing it closes the connection.
 * Calls still open when the stream ends without a `done` chunk are discarded.
 */
class ChatEventStream {
public:
  using iterator = PullIterator<ChatEventStream, ChatStreamEvent>;

  explicit ChatEventStream(Stream<ChatChunk> chunks) : chunks_(std::move(chunks)) {}

  std::optional<ChatStreamEvent> next();
  void close();

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

  /// Every tool call finalized so far, in finalization order.
  const std::vector<ReassembledToolCall>& tool_calls() const { return tool_calls_; }
  /// Content text received so far.
  const std::string& content() const { return content_; }
  const std::string& thinking() const { return thinking_; }

  [[nodiscard]] std::size_t source_reads() const { return chunks_.source_reads(); }

private:
  void record(const ChatStreamEvent& event);

  Stream<ChatChunk> chunks_;
  ToolCallReassembler reassembler_;
  std::deque<ChatStreamEvent> ready_;
  std::vector<ReassembledToolCall> tool_calls_;
  std::string content_;
  std::string thinking_;
};

}  // namespace ollama
