#pragma once

#include <cstdint>
#include <optional>
#include <set>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "ollama/options.hpp"
#include "ollama/request_options.hpp"
#include "ollama/streaming.hpp"

namespace ollama {

/**
 * Status record streamed by pull, push and create. `completed` and `total` are
 * passed through as sent: the server may repeat earlier statuses or report
 * non-monotonic progress, and computing a percentage is up to the caller.
 */
struct ProgressResponse {
  std::string status;
  std::optional<std::string> digest;
  std::optional<std::int64_t> total;
  std::optional<std::int64_t> completed;
  nlohmann::json raw = nlohmann::json::object();
};

/// Completion predicate shared by pull, push and create.
bool is_progress_success(const ProgressResponse& progress);

struct PullRequest {
  std::string model;
  std::optional<bool> insecure;
};

struct PushRequest {
  std::string model;
  std::optional<bool> insecure;
};

/// Exactly one of `modelfile` (inline definition) or `path` (server-side file) must be set.
struct CreateRequest {
  std::string model;
  std::optional<std::string> modelfile;
  std::optional<std::string> path;
  std::optional<std::string> from;
  std::optional<std::string> quantize;
  std::optional<std::string> system;
  std::optional<std::string> template_text;
  std::optional<std::string> license;
  Options parameters;
};

struct ModelDetails {
  std::string parent_model;
  std::string format;
  std::string family;
  std::vector<std::string> families;
  std::string parameter_size;
  std::string quantization_level;
};

struct ModelSummary {
  std::string name;
  std::string model;
  std::string modified_at;
  std::int64_t size = 0;
  std::string digest;
  ModelDetails details;
  std::optional<std::string> expires_at;
  std::optional<std::int64_t> size_vram;
  nlohmann::json raw = nlohmann::json::object();
};

struct ModelList {
  std::vector<ModelSummary> models;
};

struct ShowRequest {
  std::string model;
  std::optional<bool> verbose;
};

struct ShowResponse {
  std::string license;
  std::string modelfile;
  std::string parameters;
  std::string template_text;
  std::string system;
  ModelDetails details;
  nlohmann::json model_info = nlohmann::json::object();
  nlohmann::json projector_info = nlohmann::json::object();
  /// Capability tags as reported ("completion", "tools", "thinking", "vision", ...).
  std::set<std::string> capabilities;
  std::optional<std::string> modified_at;
  nlohmann::json raw = nlohmann::json::object();

  bool has_capability(const std::string& tag) const { return capabilities.count(tag) > 0; }
};

struct CopyRequest {
  std::string source;
  std::string destination;
};

struct VersionResponse {
  std::string version;
};

class OllamaClient;

class ModelsResource {
public:
  explicit ModelsResource(OllamaClient& client) : client_(client) {}

  /// Models available locally.
  ModelList list(const RequestOptions& options = {}) const;

  /// Models currently loaded in memory.
  ModelList ps(const RequestOptions& options = {}) const;

  ShowResponse show(const ShowRequest& request, const RequestOptions& options = {}) const;

  void copy(const CopyRequest& request, const RequestOptions& options = {}) const;

  void remove(const std::string& model, const RequestOptions& options = {}) const;

  Stream<ProgressResponse> pull(const PullRequest& request, const RequestOptions& options = {}) const;
  ProgressResponse pull_sync(const PullRequest& request, const RequestOptions& options = {}) const;

  Stream<ProgressResponse> push(const PushRequest& request, const RequestOptions& options = {}) const;
  ProgressResponse push_sync(const PushRequest& request, const RequestOptions& options = {}) const;

  /// Throws LocalValidationError before any request when both or neither of modelfile/path are set.
  Stream<ProgressResponse> create(const CreateRequest& request, const RequestOptions& options = {}) const;

private:
  OllamaClient& client_;
};

class BlobsResource {
public:
  explicit BlobsResource(OllamaClient& client) : client_(client) {}

  /// True when the server already holds the blob; false on 404.
  bool check(const std::string& digest, const RequestOptions& options = {}) const;

  /// Uploads `data` under the caller-computed `digest`.
  void create(const std::string& digest, const std::string& data, const RequestOptions& options = {}) const;

private:
  OllamaClient& client_;
};

}  // namespace ollama
