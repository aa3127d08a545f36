#pragma once

#include <cstddef>
#include <deque>
#include <functional>
#include <iterator>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include <nlohmann/json.hpp>

#include "ollama/error.hpp"
#include "ollama/http_client.hpp"

namespace ollama {

/**
 * Splits a newline-delimited byte stream into records. Partial records are kept
 * until the rest of the line arrives; blank lines are dropped.
 */
class NdjsonParser {
public:
  std::vector<std::string> feed(const char* data, std::size_t size);

  /// Returns the trailing partial record, if it holds anything but whitespace.
  std::optional<std::string> finalize();

  [[nodiscard]] bool has_partial_record() const;

private:
  std::string buffer_;
};

std::vector<std::string> parse_ndjson_stream(const std::string& payload);

/// True when `record` is a whole JSON text (used for a last line missing its newline).
bool is_complete_record(const std::string& record);

/// Parses a single record, raising DecodeError for malformed JSON and
/// ServerStreamError when the record carries an `error` payload.
nlohmann::json decode_record(const std::string& record);

struct StreamCompletion {
  bool done = false;
  std::optional<std::string> reason;
};

/**
 * Single-pass input iterator over anything exposing `std::optional<Value> next()`.
 * Reaching the end (next() returning nullopt) turns the iterator into the end sentinel.
 */
template <typename Source, typename Value>
class PullIterator {
public:
  using iterator_category = std::input_iterator_tag;
  using value_type = Value;
  using difference_type = std::ptrdiff_t;
  using pointer = Value*;
  using reference = Value&;

  PullIterator() = default;
  explicit PullIterator(Source* source) : source_(source) { advance(); }

  reference operator*() { return *current_; }
  pointer operator->() { return &*current_; }

  PullIterator& operator++() {
    advance();
    return *this;
  }

  friend bool operator==(const PullIterator& lhs, const PullIterator& rhs) { return lhs.source_ == rhs.source_; }
  friend bool operator!=(const PullIterator& lhs, const PullIterator& rhs) { return !(lhs == rhs); }

private:
  void advance() {
    current_ = source_->next();
    if (!current_) {
      source_ = nullptr;
    }
  }

  Source* source_ = nullptr;
  std::optional<Value> current_;
};

template <typename T>
struct StreamEvent {
  T payload;
  bool done = false;
  std::optional<std::string> done_reason;
};

/**
 * Lazy, finite, non-restartable sequence of decoded records pulled from a ByteSource.
 *
 * The source is only read when the consumer asks for an event and no complete
 * record is buffered. Destroying or closing the stream closes the source without
 * draining it. The event that satisfies the completion predicate is the last one:
 * the source is closed right after it is decoded. Any terminal error closes the
 * source as well; later calls to next() return std::nullopt.
 */
template <typename T>
class Stream {
public:
  using Decoder = std::function<T(const nlohmann::json&)>;
  using CompletionPredicate = std::function<StreamCompletion(const T&)>;

  using iterator = PullIterator<Stream, StreamEvent<T>>;

  Stream(std::unique_ptr<ByteSource> source, Decoder decoder, CompletionPredicate completion = nullptr)
      : source_(std::move(source)), decoder_(std::move(decoder)), completion_(std::move(completion)) {}

  ~Stream() { close(); }

  Stream(Stream&&) = default;
  Stream& operator=(Stream&& other) {
    if (this != &other) {
      close();
      source_ = std::move(other.source_);
      parser_ = std::move(other.parser_);
      pending_ = std::move(other.pending_);
      decoder_ = std::move(other.decoder_);
      completion_ = std::move(other.completion_);
      reads_ = other.reads_;
      events_ = other.events_;
      saw_done_ = other.saw_done_;
    }
    return *this;
  }

  Stream(const Stream&) = delete;
  Stream& operator=(const Stream&) = delete;

  /// Returns the next event, or std::nullopt once the stream has ended or been closed.
  std::optional<StreamEvent<T>> next() {
    while (pending_.empty()) {
      if (!source_) {
        return std::nullopt;
      }
      std::optional<std::string> chunk;
      try {
        ++reads_;
        chunk = source_->read();
      } catch (...) {
        close();
        throw;
      }
      if (!chunk) {
        auto partial = parser_.finalize();
        close();
        if (!partial) {
          return std::nullopt;
        }
        if (!is_complete_record(*partial)) {
          throw TruncationError("Stream ended with an incomplete record", std::move(*partial));
        }
        // A final record without its trailing newline.
        pending_.push_back(std::move(*partial));
        break;
      }
      for (auto& record : parser_.feed(chunk->data(), chunk->size())) {
        pending_.push_back(std::move(record));
      }
    }

    std::string record = std::move(pending_.front());
    pending_.pop_front();
    try {
      StreamEvent<T> event{decoder_(decode_record(record))};
      if (completion_) {
        StreamCompletion completion = completion_(event.payload);
        event.done = completion.done;
        event.done_reason = std::move(completion.reason);
      }
      ++events_;
      if (event.done) {
        // The completing record ends the sequence; anything the server sends after it is ignored.
        saw_done_ = true;
        close();
      }
      return event;
    } catch (const nlohmann::json::exception& ex) {
      close();
      throw DecodeError(std::string("Failed to decode stream record: ") + ex.what());
    } catch (...) {
      close();
      throw;
    }
  }

  /// Releases the underlying connection. Safe to call more than once.
  void close() {
    pending_.clear();
    if (source_) {
      auto source = std::move(source_);
      source->close();
    }
  }

  iterator begin() { return iterator(this); }
  iterator end() { return iterator(); }

  [[nodiscard]] bool closed() const { return !source_ && pending_.empty(); }
  [[nodiscard]] bool saw_done() const { return saw_done_; }
  [[nodiscard]] std::size_t events_delivered() const { return events_; }
  [[nodiscard]] std::size_t source_reads() const { return reads_; }

private:
  std::unique_ptr<ByteSource> source_;
  NdjsonParser parser_;
  std::deque<std::string> pending_;
  Decoder decoder_;
  CompletionPredicate completion_;
  std::size_t reads_ = 0;
  std::size_t events_ = 0;
  bool saw_done_ = false;
};

}  // namespace ollama
