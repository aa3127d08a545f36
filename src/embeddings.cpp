#include "ollama/embeddings.hpp"

#include "ollama/client.hpp"
#include "ollama/utils/values.hpp"

namespace ollama {
namespace {

using json = nlohmann::json;

std::size_t input_count(const EmbedRequest::Input& input) {
  if (const auto* batch = std::get_if<std::vector<std::string>>(&input)) {
    return batch->size();
  }
  return 1;
}

json embed_input_to_json(const EmbedRequest::Input& input) {
  return std::visit([](const auto& value) -> json { return json(value); }, input);
}

json embed_request_to_json(const EmbedRequest& request, const KeepAlive& keep_alive, const Options& options) {
  json body;
  body["model"] = request.model;
  body["input"] = embed_input_to_json(request.input);
  if (request.truncate) body["truncate"] = *request.truncate;
  if (request.dimensions) body["dimensions"] = *request.dimensions;
  if (auto wire = keep_alive.to_json()) body["keep_alive"] = *wire;
  if (!options.empty()) body["options"] = options.to_json();
  return body;
}

std::vector<float> parse_vector(const json& values) {
  if (!values.is_array()) {
    throw DecodeError("Embedding must be an array of numbers");
  }
  std::vector<float> vector;
  vector.reserve(values.size());
  for (const auto& value : values) {
    vector.push_back(value.get<float>());
  }
  return vector;
}

EmbedResponse parse_embed_response(const json& payload) {
  EmbedResponse response;
  response.raw = payload;
  response.model = payload.value("model", "");
  const auto& embeddings = utils::require_field(payload, "embeddings", "embed response");
  if (!embeddings.is_array()) {
    throw DecodeError("embed response field 'embeddings' must be an array");
  }
  for (const auto& embedding : embeddings) {
    response.embeddings.push_back(parse_vector(embedding));
  }
  response.total_duration = utils::optional_integer(payload, "total_duration");
  response.load_duration = utils::optional_integer(payload, "load_duration");
  response.prompt_eval_count = utils::optional_integer(payload, "prompt_eval_count");
  return response;
}

EmbeddingsResponse parse_embeddings_response(const json& payload) {
  EmbeddingsResponse response;
  response.raw = payload;
  response.embedding = parse_vector(utils::require_field(payload, "embedding", "embeddings response"));
  return response;
}

}  // namespace

EmbedResponse EmbeddingsResource::embed(const EmbedRequest& request, const RequestOptions& options) const {
  if (request.dimensions && *request.dimensions <= 0) {
    client_.fail_validation("dimensions must be a positive integer");
  }
  const std::size_t expected = input_count(request.input);
  if (expected == 0) {
    client_.fail_validation("embed requires at least one input");
  }

  auto body = embed_request_to_json(request, client_.effective_keep_alive(request.keep_alive),
                                    client_.effective_options(request.options));
  auto response = client_.perform_request("POST", "/api/embed", body.dump(), options);
  EmbedResponse result;
  try {
    result = parse_embed_response(json::parse(response.body));
  } catch (const json::exception& ex) {
    throw DecodeError(std::string("Failed to parse embed response: ") + ex.what());
  }
  if (result.embeddings.size() != expected) {
    throw DecodeError("embed response holds " + std::to_string(result.embeddings.size()) + " embeddings for " +
                      std::to_string(expected) + " inputs");
  }
  return result;
}

EmbeddingsResponse EmbeddingsResource::legacy(const EmbeddingsRequest& request, const RequestOptions& options) const {
  json body;
  body["model"] = request.model;
  body["prompt"] = request.prompt;
  if (auto wire = client_.effective_keep_alive(request.keep_alive).to_json()) body["keep_alive"] = *wire;
  auto merged = client_.effective_options(request.options);
  if (!merged.empty()) body["options"] = merged.to_json();

  auto response = client_.perform_request("POST", "/api/embeddings", body.dump(), options);
  try {
    return parse_embeddings_response(json::parse(response.body));
  } catch (const json::exception& ex) {
    throw DecodeError(std::string("Failed to parse embeddings response: ") + ex.what());
  }
}

}  // namespace ollama
