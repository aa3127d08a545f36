#include "ollama/models.hpp"

#include "ollama/client.hpp"
#include "ollama/utils/values.hpp"

namespace ollama {
namespace {

using json = nlohmann::json;

ProgressResponse parse_progress_response(const json& payload) {
  ProgressResponse progress;
  progress.raw = payload;
  progress.status = utils::require_field(payload, "status", "progress record").get<std::string>();
  progress.digest = utils::optional_string(payload, "digest");
  progress.total = utils::optional_integer(payload, "total");
  progress.completed = utils::optional_integer(payload, "completed");
  return progress;
}

StreamCompletion progress_completion(const ProgressResponse& progress) {
  if (is_progress_success(progress)) {
    return StreamCompletion{true, progress.status};
  }
  return StreamCompletion{};
}

ModelDetails parse_model_details(const json& payload) {
  ModelDetails details;
  if (!payload.is_object()) {
    return details;
  }
  details.parent_model = payload.value("parent_model", "");
  details.format = payload.value("format", "");
  details.family = payload.value("family", "");
  if (payload.contains("families") && payload.at("families").is_array()) {
    details.families = payload.at("families").get<std::vector<std::string>>();
  }
  details.parameter_size = payload.value("parameter_size", "");
  details.quantization_level = payload.value("quantization_level", "");
  return details;
}

ModelSummary parse_model_summary(const json& payload) {
  ModelSummary summary;
  summary.raw = payload;
  summary.name = payload.value("name", "");
  summary.model = payload.value("model", summary.name);
  summary.modified_at = payload.value("modified_at", "");
  summary.size = utils::optional_integer(payload, "size").value_or(0);
  summary.digest = payload.value("digest", "");
  if (payload.contains("details")) {
    summary.details = parse_model_details(payload.at("details"));
  }
  summary.expires_at = utils::optional_string(payload, "expires_at");
  summary.size_vram = utils::optional_integer(payload, "size_vram");
  return summary;
}

ModelList parse_model_list(const json& payload) {
  ModelList list;
  const auto& models = utils::require_field(payload, "models", "model list");
  for (const auto& item : models) {
    list.models.push_back(parse_model_summary(item));
  }
  return list;
}

ShowResponse parse_show_response(const json& payload) {
  ShowResponse response;
  response.raw = payload;
  response.license = payload.value("license", "");
  response.modelfile = payload.value("modelfile", "");
  response.parameters = payload.value("parameters", "");
  response.template_text = payload.value("template", "");
  response.system = payload.value("system", "");
  if (payload.contains("details")) {
    response.details = parse_model_details(payload.at("details"));
  }
  if (payload.contains("model_info") && payload.at("model_info").is_object()) {
    response.model_info = payload.at("model_info");
  }
  if (payload.contains("projector_info") && payload.at("projector_info").is_object()) {
    response.projector_info = payload.at("projector_info");
  }
  if (payload.contains("capabilities") && payload.at("capabilities").is_array()) {
    for (const auto& tag : payload.at("capabilities")) {
      response.capabilities.insert(tag.get<std::string>());
    }
  }
  response.modified_at = utils::optional_string(payload, "modified_at");
  return response;
}

json transfer_request_to_json(const std::string& model, const std::optional<bool>& insecure, bool stream) {
  json body;
  body["model"] = model;
  if (insecure) body["insecure"] = *insecure;
  body["stream"] = stream;
  return body;
}

template <typename Parser>
auto parse_body(const HttpResponse& response, const char* what, Parser parser) {
  try {
    return parser(json::parse(response.body));
  } catch (const json::exception& ex) {
    throw DecodeError(std::string("Failed to parse ") + what + ": " + ex.what());
  }
}

}  // namespace

bool is_progress_success(const ProgressResponse& progress) {
  return progress.status == "success";
}

ModelList ModelsResource::list(const RequestOptions& options) const {
  auto response = client_.perform_request("GET", "/api/tags", "", options);
  return parse_body(response, "model list", parse_model_list);
}

ModelList ModelsResource::ps(const RequestOptions& options) const {
  auto response = client_.perform_request("GET", "/api/ps", "", options);
  return parse_body(response, "running model list", parse_model_list);
}

ShowResponse ModelsResource::show(const ShowRequest& request, const RequestOptions& options) const {
  json body;
  body["model"] = request.model;
  if (request.verbose) body["verbose"] = *request.verbose;
  auto response = client_.perform_request("POST", "/api/show", body.dump(), options);
  return parse_body(response, "show response", parse_show_response);
}

void ModelsResource::copy(const CopyRequest& request, const RequestOptions& options) const {
  json body;
  body["source"] = request.source;
  body["destination"] = request.destination;
  client_.perform_request("POST", "/api/copy", body.dump(), options);
}

void ModelsResource::remove(const std::string& model, const RequestOptions& options) const {
  json body;
  body["model"] = model;
  client_.perform_request("DELETE", "/api/delete", body.dump(), options);
}

Stream<ProgressResponse> ModelsResource::pull(const PullRequest& request, const RequestOptions& options) const {
  return client_.open_stream<ProgressResponse>("/api/pull", transfer_request_to_json(request.model, request.insecure, true),
                                               parse_progress_response, progress_completion, options);
}

ProgressResponse ModelsResource::pull_sync(const PullRequest& request, const RequestOptions& options) const {
  auto body = transfer_request_to_json(request.model, request.insecure, false);
  auto response = client_.perform_request("POST", "/api/pull", body.dump(), options);
  return parse_body(response, "pull response", parse_progress_response);
}

Stream<ProgressResponse> ModelsResource::push(const PushRequest& request, const RequestOptions& options) const {
  return client_.open_stream<ProgressResponse>("/api/push", transfer_request_to_json(request.model, request.insecure, true),
                                               parse_progress_response, progress_completion, options);
}

ProgressResponse ModelsResource::push_sync(const PushRequest& request, const RequestOptions& options) const {
  auto body = transfer_request_to_json(request.model, request.insecure, false);
  auto response = client_.perform_request("POST", "/api/push", body.dump(), options);
  return parse_body(response, "push response", parse_progress_response);
}

Stream<ProgressResponse> ModelsResource::create(const CreateRequest& request, const RequestOptions& options) const {
  if (request.modelfile && request.path) {
    client_.fail_validation("create accepts either modelfile or path, not both");
  }
  if (!request.modelfile && !request.path) {
    client_.fail_validation("create requires a modelfile or a path");
  }

  json body;
  body["model"] = request.model;
  if (request.modelfile) body["modelfile"] = *request.modelfile;
  if (request.path) body["path"] = *request.path;
  if (request.from) body["from"] = *request.from;
  if (request.quantize) body["quantize"] = *request.quantize;
  if (request.system) body["system"] = *request.system;
  if (request.template_text) body["template"] = *request.template_text;
  if (request.license) body["license"] = *request.license;
  if (!request.parameters.empty()) body["parameters"] = request.parameters.to_json();
  body["stream"] = true;

  return client_.open_stream<ProgressResponse>("/api/create", body, parse_progress_response, progress_completion,
                                               options);
}

bool BlobsResource::check(const std::string& digest, const RequestOptions& options) const {
  if (!utils::is_valid_digest(digest)) {
    client_.fail_validation("Invalid blob digest: " + digest);
  }
  auto response = client_.perform_unchecked("HEAD", "/api/blobs/" + digest, "", options);
  if (response.status_code == 404) {
    return false;
  }
  client_.raise_for_status(response);
  return true;
}

void BlobsResource::create(const std::string& digest, const std::string& data, const RequestOptions& options) const {
  if (!utils::is_valid_digest(digest)) {
    client_.fail_validation("Invalid blob digest: " + digest);
  }
  RequestOptions upload_options = options;
  if (!upload_options.headers.count("Content-Type")) {
    upload_options.headers["Content-Type"] = "application/octet-stream";
  }
  client_.perform_request("POST", "/api/blobs/" + digest, data, upload_options);
}

}  // namespace ollama
