#include "ollama/streaming.hpp"

#include <algorithm>
#include <cctype>

namespace ollama {
namespace {

void trim_carriage_return(std::string& line) {
  if (!line.empty() && line.back() == '\r') {
    line.pop_back();
  }
}

bool is_blank(const std::string& text) {
  return std::all_of(text.begin(), text.end(), [](unsigned char ch) { return std::isspace(ch) != 0; });
}

std::string extract_error_message(const nlohmann::json& error) {
  if (error.is_string()) {
    return error.get<std::string>();
  }
  if (error.is_object() && error.contains("message") && error.at("message").is_string()) {
    return error.at("message").get<std::string>();
  }
  return error.dump();
}

}  // namespace

std::vector<std::string> NdjsonParser::feed(const char* data, std::size_t size) {
  buffer_.append(data, size);

  std::vector<std::string> records;
  std::size_t start = 0;
  while (true) {
    auto newline_pos = buffer_.find('\n', start);
    if (newline_pos == std::string::npos) {
      break;
    }

    std::string line = buffer_.substr(start, newline_pos - start);
    trim_carriage_return(line);
    start = newline_pos + 1;
    if (!is_blank(line)) {
      records.push_back(std::move(line));
    }
  }

  buffer_.erase(0, start);
  return records;
}

std::optional<std::string> NdjsonParser::finalize() {
  std::string remaining;
  remaining.swap(buffer_);
  if (is_blank(remaining)) {
    return std::nullopt;
  }
  return remaining;
}

bool NdjsonParser::has_partial_record() const {
  return !is_blank(buffer_);
}

std::vector<std::string> parse_ndjson_stream(const std::string& payload) {
  NdjsonParser parser;
  auto records = parser.feed(payload.data(), payload.size());
  if (auto partial = parser.finalize()) {
    if (!is_complete_record(*partial)) {
      throw TruncationError("Payload ended with an incomplete record", std::move(*partial));
    }
    records.push_back(std::move(*partial));
  }
  return records;
}

bool is_complete_record(const std::string& record) {
  return nlohmann::json::accept(record);
}

nlohmann::json decode_record(const std::string& record) {
  nlohmann::json payload;
  try {
    payload = nlohmann::json::parse(record);
  } catch (const nlohmann::json::parse_error& ex) {
    throw DecodeError(std::string("Invalid JSON record: ") + ex.what());
  }
  if (!payload.is_object()) {
    throw DecodeError("Expected a JSON object record, got " + std::string(payload.type_name()));
  }
  auto error = payload.find("error");
  if (error != payload.end() && !error->is_null()) {
    throw ServerStreamError(extract_error_message(*error));
  }
  return payload;
}

}  // namespace ollama
