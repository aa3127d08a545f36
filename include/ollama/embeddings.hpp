#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <variant>
#include <vector>

#include <nlohmann/json.hpp>

#include "ollama/keep_alive.hpp"
#include "ollama/options.hpp"
#include "ollama/request_options.hpp"

namespace ollama {

struct EmbedRequest {
  using Input = std::variant<std::string, std::vector<std::string>>;

  std::string model;
  Input input;
  std::optional<bool> truncate;
  /// Forwarded verbatim; whether the model supports it is for the server to decide.
  std::optional<int> dimensions;
  KeepAlive keep_alive;
  Options options;
};

struct EmbedResponse {
  std::string model;
  /// One vector per input, in input order.
  std::vector<std::vector<float>> embeddings;
  std::optional<std::int64_t> total_duration;
  std::optional<std::int64_t> load_duration;
  std::optional<std::int64_t> prompt_eval_count;
  nlohmann::json raw = nlohmann::json::object();
};

/// Single-prompt form of the older embeddings endpoint.
struct EmbeddingsRequest {
  std::string model;
  std::string prompt;
  KeepAlive keep_alive;
  Options options;
};

struct EmbeddingsResponse {
  std::vector<float> embedding;
  nlohmann::json raw = nlohmann::json::object();
};

class OllamaClient;

class EmbeddingsResource {
public:
  explicit EmbeddingsResource(OllamaClient& client) : client_(client) {}

  EmbedResponse embed(const EmbedRequest& request, const RequestOptions& options = {}) const;

  EmbeddingsResponse legacy(const EmbeddingsRequest& request, const RequestOptions& options = {}) const;

private:
  OllamaClient& client_;
};

}  // namespace ollama
