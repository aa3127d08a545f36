#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>

namespace ollama {

/// Per-call overrides. A header mapped to std::nullopt removes that header.
struct RequestOptions {
  std::map<std::string, std::optional<std::string>> headers;
  std::optional<std::chrono::milliseconds> timeout;
};

}  // namespace ollama
