#pragma once

#include <cstdint>
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

struct GenerateRequest {
  std::string model;
  std::string prompt;
  /// Text after the insertion point for fill-in-the-middle completion.
  std::optional<std::string> suffix;
  std::optional<std::string> system;
  std::optional<std::string> template_text;
  /// Context returned by a previous response, for short conversational memory.
  std::vector<std::int64_t> context;
  std::optional<bool> raw;
  /// Either the string "json" or a JSON schema object.
  std::optional<nlohmann::json> format;
  std::vector<Image> images;
  KeepAlive keep_alive;
  Options options;
  std::optional<ThinkSetting> think;
};

struct GenerateResponse {
  std::string model;
  std::string created_at;
  std::string response;
  std::optional<std::string> thinking;
  bool done = false;
  std::optional<std::string> done_reason;
  std::vector<std::int64_t> context;
  GenerationMetrics metrics;
  nlohmann::json raw = nlohmann::json::object();
};

class OllamaClient;

class GenerateResource {
public:
  explicit GenerateResource(OllamaClient& client) : client_(client) {}

  /// Single-shot generation (`stream: false`).
  GenerateResponse create(const GenerateRequest& request, const RequestOptions& options = {}) const;

  /// Token-by-token generation; the event with `done` set carries the final metrics.
  Stream<GenerateResponse> stream(const GenerateRequest& request, const RequestOptions& options = {}) const;

private:
  OllamaClient& client_;
};

}  // namespace ollama
