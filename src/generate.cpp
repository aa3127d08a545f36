#include "ollama/generate.hpp"

#include "ollama/client.hpp"
#include "ollama/utils/values.hpp"

namespace ollama {
namespace {

using json = nlohmann::json;

json generate_request_to_json(const GenerateRequest& request,
                              bool stream,
                              const KeepAlive& keep_alive,
                              const Options& options) {
  json body;
  body["model"] = request.model;
  body["prompt"] = request.prompt;
  body["stream"] = stream;
  if (request.suffix) body["suffix"] = *request.suffix;
  if (request.system) body["system"] = *request.system;
  if (request.template_text) body["template"] = *request.template_text;
  if (!request.context.empty()) body["context"] = request.context;
  if (request.raw) body["raw"] = *request.raw;
  if (request.format) body["format"] = *request.format;
  if (!request.images.empty()) body["images"] = images_to_json(request.images);
  if (auto wire = keep_alive.to_json()) body["keep_alive"] = *wire;
  if (!options.empty()) body["options"] = options.to_json();
  if (request.think) body["think"] = think_to_json(*request.think);
  return body;
}

GenerateResponse parse_generate_response(const json& payload) {
  GenerateResponse response;
  response.raw = payload;
  response.model = payload.value("model", "");
  response.created_at = payload.value("created_at", "");
  response.response = payload.value("response", "");
  response.thinking = utils::optional_string(payload, "thinking");
  response.done = utils::require_field(payload, "done", "generate response").get<bool>();
  response.done_reason = utils::optional_string(payload, "done_reason");
  if (payload.contains("context") && payload.at("context").is_array()) {
    for (const auto& token : payload.at("context")) {
      response.context.push_back(utils::coerce_integer(token));
    }
  }
  response.metrics = parse_generation_metrics(payload);
  return response;
}

StreamCompletion generate_completion(const GenerateResponse& response) {
  return StreamCompletion{response.done, response.done_reason};
}

}  // namespace

GenerateResponse GenerateResource::create(const GenerateRequest& request, const RequestOptions& options) const {
  auto body = generate_request_to_json(request, false, client_.effective_keep_alive(request.keep_alive),
                                       client_.effective_options(request.options));
  auto response = client_.perform_request("POST", "/api/generate", body.dump(), options);
  GenerateResponse result;
  try {
    result = parse_generate_response(json::parse(response.body));
  } catch (const json::exception& ex) {
    throw DecodeError(std::string("Failed to parse generate response: ") + ex.what());
  }
  if (think_enabled(request.think) && !result.thinking) {
    client_.log(LogLevel::Warn, "thinking requested but not returned", json{{"model", result.model}});
  }
  return result;
}

Stream<GenerateResponse> GenerateResource::stream(const GenerateRequest& request, const RequestOptions& options) const {
  auto body = generate_request_to_json(request, true, client_.effective_keep_alive(request.keep_alive),
                                       client_.effective_options(request.options));
  return client_.open_stream<GenerateResponse>("/api/generate", body, parse_generate_response, generate_completion,
                                               options);
}

}  // namespace ollama
