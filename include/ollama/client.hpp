#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>

#include <nlohmann/json.hpp>

#include "ollama/chat.hpp"
#include "ollama/chat_stream.hpp"
#include "ollama/embeddings.hpp"
#include "ollama/error.hpp"
#include "ollama/generate.hpp"
#include "ollama/http_client.hpp"
#include "ollama/keep_alive.hpp"
#include "ollama/logging.hpp"
#include "ollama/models.hpp"
#include "ollama/options.hpp"
#include "ollama/request_options.hpp"
#include "ollama/streaming.hpp"

namespace ollama {

struct ClientOptions {
  /// Server address; bare hosts, ":port" and full URLs are accepted.
  std::string host = "http://127.0.0.1:11434";
  /// Replaces the default `ollama-cpp/<version> (<arch> <os>) <compiler>` identity.
  std::optional<std::string> user_agent;
  /// Sent as a Bearer token when non-empty.
  std::string api_key;
  std::map<std::string, std::string> default_headers;
  /// Tuning parameters merged under every request's own options.
  Options default_options;
  /// Applied to requests that leave keep_alive at Default.
  KeepAlive default_keep_alive;
  std::chrono::milliseconds timeout{300000};
  LogLevel log_level = LogLevel::Off;
  LoggerCallback logger;
};

class OllamaClient {
public:
  explicit OllamaClient(ClientOptions options = {},
                        std::unique_ptr<HttpClient> http_client = nullptr);

  OllamaClient(const OllamaClient&) = delete;
  OllamaClient& operator=(const OllamaClient&) = delete;

  const ClientOptions& options() const { return options_; }

  GenerateResource& generate() { return generate_; }
  const GenerateResource& generate() const { return generate_; }

  ChatResource& chat() { return chat_; }
  const ChatResource& chat() const { return chat_; }

  EmbeddingsResource& embeddings() { return embeddings_; }
  const EmbeddingsResource& embeddings() const { return embeddings_; }

  ModelsResource& models() { return models_; }
  const ModelsResource& models() const { return models_; }

  BlobsResource& blobs() { return blobs_; }
  const BlobsResource& blobs() const { return blobs_; }

  VersionResponse version(const RequestOptions& options = {}) const;

private:
  friend class GenerateResource;
  friend class ChatResource;
  friend class EmbeddingsResource;
  friend class ModelsResource;
  friend class BlobsResource;

  HttpResponse perform_request(const std::string& method,
                               const std::string& path,
                               const std::string& body,
                               const RequestOptions& options) const;

  /// Like perform_request but returns the raw response for any status, without mapping errors.
  HttpResponse perform_unchecked(const std::string& method,
                                 const std::string& path,
                                 const std::string& body,
                                 const RequestOptions& options) const;

  /// Throws the APIError subclass matching an error status; no-op below 400.
  void raise_for_status(const HttpResponse& response) const;

  /// Opens a streaming exchange. Error statuses are thrown after draining the body.
  std::unique_ptr<ByteSource> perform_stream(const std::string& method,
                                             const std::string& path,
                                             const std::string& body,
                                             const RequestOptions& options) const;

  template <typename T>
  Stream<T> open_stream(const std::string& path,
                        const nlohmann::json& body,
                        typename Stream<T>::Decoder decoder,
                        typename Stream<T>::CompletionPredicate completion,
                        const RequestOptions& options) const {
    return Stream<T>(perform_stream("POST", path, body.dump(), options), std::move(decoder), std::move(completion));
  }

  /// Request options layered over the client defaults.
  Options effective_options(const Options& request_options) const;
  KeepAlive effective_keep_alive(const KeepAlive& request_keep_alive) const;

  /// Logs and throws LocalValidationError.
  [[noreturn]] void fail_validation(const std::string& message) const;

  void log(LogLevel level, const std::string& message, const nlohmann::json& details = {}) const;

  HttpRequest build_request(const std::string& method,
                            const std::string& path,
                            const std::string& body,
                            const RequestOptions& options,
                            bool streaming) const;

  ClientOptions options_;
  std::unique_ptr<HttpClient> http_client_;
  GenerateResource generate_;
  ChatResource chat_;
  EmbeddingsResource embeddings_;
  ModelsResource models_;
  BlobsResource blobs_;
};

}  // namespace ollama
