#include "ollama/client.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <iterator>
#include <set>
#include <utility>

#include <nlohmann/json.hpp>

#include "ollama/error.hpp"
#include "ollama/http_client.hpp"
#include "ollama/logging.hpp"
#include "ollama/utils/env.hpp"
#include "ollama/utils/host.hpp"
#include "ollama/utils/platform.hpp"
#include "ollama/utils/values.hpp"

namespace ollama {
namespace {

using json = nlohmann::json;

std::string to_lower(const std::string& value) {
  std::string lowered;
  lowered.reserve(value.size());
  std::transform(value.begin(), value.end(), std::back_inserter(lowered), [](unsigned char c) {
    return static_cast<char>(std::tolower(c));
  });
  return lowered;
}

/// Header names are case-insensitive; an override replaces any spelling of the same name.
void apply_header_overrides(std::map<std::string, std::string>& target,
                            const std::map<std::string, std::optional<std::string>>& overrides) {
  for (const auto& [key, value] : overrides) {
    const std::string lowered = to_lower(key);
    for (auto it = target.begin(); it != target.end();) {
      if (to_lower(it->first) == lowered) {
        it = target.erase(it);
      } else {
        ++it;
      }
    }
    if (value) {
      target[key] = *value;
    }
  }
}

std::string build_url(const std::string& host, const std::string& path) {
  if (utils::is_absolute_url(path)) {
    return path;
  }
  std::string url = host;
  while (!url.empty() && url.back() == '/') {
    url.pop_back();
  }
  if (!path.empty() && path.front() != '/') {
    url.push_back('/');
  }
  url += path;
  return url;
}

std::string extract_error_message(const json& payload) {
  if (payload.is_object() && payload.contains("error")) {
    const auto& err = payload.at("error");
    if (err.is_string()) {
      return err.get<std::string>();
    }
    if (err.is_object()) {
      return err.value("message", "");
    }
  }
  return {};
}

std::map<std::string, std::string> sanitize_headers(const std::map<std::string, std::string>& headers) {
  static const std::set<std::string> kSensitive = {"authorization", "cookie", "set-cookie"};
  std::map<std::string, std::string> sanitized;
  for (const auto& [key, value] : headers) {
    sanitized[key] = kSensitive.count(to_lower(key)) ? "***" : value;
  }
  return sanitized;
}

json build_request_log_details(const HttpRequest& request) {
  json details;
  details["method"] = request.method;
  details["url"] = request.url;
  details["headers"] = sanitize_headers(request.headers);
  return details;
}

json build_response_log_details(const HttpRequest& request,
                                long status_code,
                                const std::map<std::string, std::string>& response_headers,
                                std::chrono::steady_clock::duration duration) {
  json details = build_request_log_details(request);
  details["status"] = status_code;
  details["duration_ms"] = std::chrono::duration_cast<std::chrono::milliseconds>(duration).count();
  details["response_headers"] = sanitize_headers(response_headers);
  return details;
}

[[noreturn]] void throw_api_error(long status,
                                  const std::string& body,
                                  const std::map<std::string, std::string>& headers) {
  json error_body = json::object();
  std::string message;
  if (auto payload = utils::safe_json(body)) {
    error_body = *payload;
    message = extract_error_message(*payload);
  } else if (!body.empty()) {
    error_body = body;
  }
  if (message.empty()) {
    message = "HTTP " + std::to_string(status) + " error";
  }

  switch (status) {
    case 400:
      throw BadRequestError(message, status, error_body, headers);
    case 401:
      throw AuthenticationError(message, status, error_body, headers);
    case 403:
      throw PermissionDeniedError(message, status, error_body, headers);
    case 404:
      throw NotFoundError(message, status, error_body, headers);
    case 409:
      throw ConflictError(message, status, error_body, headers);
    case 422:
      throw UnprocessableEntityError(message, status, error_body, headers);
    case 429:
      throw RateLimitError(message, status, error_body, headers);
    default:
      if (status >= 500) {
        throw InternalServerError(message, status, error_body, headers);
      }
      throw APIError(message, status, error_body, headers);
  }
}

VersionResponse parse_version_response(const json& payload) {
  VersionResponse version;
  version.version = utils::require_field(payload, "version", "version response").get<std::string>();
  return version;
}

}  // namespace

OllamaClient::OllamaClient(ClientOptions options, std::unique_ptr<HttpClient> http_client)
    : options_(std::move(options)),
      http_client_(http_client ? std::move(http_client) : make_default_http_client()),
      generate_(*this),
      chat_(*this),
      embeddings_(*this),
      models_(*this),
      blobs_(*this) {
  const utils::EnvironmentSettings env = utils::read_environment();

  if (env.host && (options_.host.empty() || options_.host == utils::kDefaultHost)) {
    options_.host = *env.host;
  }
  options_.host = utils::format_host(options_.host);

  if (options_.api_key.empty() && env.api_key) {
    options_.api_key = *env.api_key;
  }

  if (options_.log_level == LogLevel::Off && env.log_level) {
    options_.log_level = parse_log_level(*env.log_level, options_.log_level);
  }

  if (options_.default_keep_alive.is_default() && env.keep_alive) {
    options_.default_keep_alive = KeepAlive::parse(*env.keep_alive);
  }

  utils::validate_positive_integer("ClientOptions.timeout", options_.timeout.count());
}

VersionResponse OllamaClient::version(const RequestOptions& options) const {
  auto response = perform_request("GET", "/api/version", "", options);
  try {
    return parse_version_response(json::parse(response.body));
  } catch (const json::exception& ex) {
    throw DecodeError(std::string("Failed to parse version response: ") + ex.what());
  }
}

void OllamaClient::log(LogLevel level, const std::string& message, const json& details) const {
  if (!options_.logger || !should_log(options_.log_level, level)) {
    return;
  }
  options_.logger(level, message, details);
}

void OllamaClient::fail_validation(const std::string& message) const {
  log(LogLevel::Warn, "local validation failed", json{{"message", message}});
  throw LocalValidationError(message);
}

Options OllamaClient::effective_options(const Options& request_options) const {
  return options_.default_options.merged_with(request_options);
}

KeepAlive OllamaClient::effective_keep_alive(const KeepAlive& request_keep_alive) const {
  return request_keep_alive.is_default() ? options_.default_keep_alive : request_keep_alive;
}

HttpRequest OllamaClient::build_request(const std::string& method,
                                        const std::string& path,
                                        const std::string& body,
                                        const RequestOptions& options,
                                        bool streaming) const {
  if (options.timeout) {
    utils::validate_positive_integer("RequestOptions.timeout", options.timeout->count());
  }

  HttpRequest http_request;
  http_request.method = method;
  http_request.url = build_url(options_.host, path);
  http_request.body = body;
  http_request.timeout = options.timeout.value_or(options_.timeout);

  std::map<std::string, std::string> headers;
  headers["Accept"] = streaming ? "application/x-ndjson" : "application/json";
  headers["User-Agent"] = options_.user_agent.value_or(utils::user_agent());
  if (!options_.api_key.empty()) {
    headers["Authorization"] = "Bearer " + options_.api_key;
  }
  for (const auto& [key, value] : options_.default_headers) {
    headers[key] = value;
  }
  if (!body.empty()) {
    headers["Content-Type"] = "application/json";
  }

  apply_header_overrides(headers, options.headers);
  http_request.headers = std::move(headers);
  return http_request;
}

HttpResponse OllamaClient::perform_unchecked(const std::string& method,
                                             const std::string& path,
                                             const std::string& body,
                                             const RequestOptions& options) const {
  HttpRequest http_request = build_request(method, path, body, options, false);
  log(LogLevel::Debug, "sending request", build_request_log_details(http_request));
  const auto start_time = std::chrono::steady_clock::now();

  HttpResponse response;
  try {
    response = http_client_->request(http_request);
  } catch (const OllamaError& error) {
    auto details = build_request_log_details(http_request);
    details["error"] = error.what();
    log(LogLevel::Error, "request failed", details);
    throw;
  } catch (const std::exception& error) {
    auto details = build_request_log_details(http_request);
    details["error"] = error.what();
    log(LogLevel::Error, "request failed", details);
    throw TransportError(error.what());
  }

  const auto duration = std::chrono::steady_clock::now() - start_time;
  auto details = build_response_log_details(http_request, response.status_code, response.headers, duration);
  if (response.status_code < 400) {
    log(LogLevel::Info, "request succeeded", details);
  } else {
    log(LogLevel::Error, "request failed", details);
  }
  return response;
}

HttpResponse OllamaClient::perform_request(const std::string& method,
                                           const std::string& path,
                                           const std::string& body,
                                           const RequestOptions& options) const {
  HttpResponse response = perform_unchecked(method, path, body, options);
  raise_for_status(response);
  return response;
}

void OllamaClient::raise_for_status(const HttpResponse& response) const {
  if (response.status_code >= 400) {
    throw_api_error(response.status_code, response.body, response.headers);
  }
}

std::unique_ptr<ByteSource> OllamaClient::perform_stream(const std::string& method,
                                                         const std::string& path,
                                                         const std::string& body,
                                                         const RequestOptions& options) const {
  HttpRequest http_request = build_request(method, path, body, options, true);
  log(LogLevel::Debug, "sending request", build_request_log_details(http_request));
  const auto start_time = std::chrono::steady_clock::now();

  StreamingHttpResponse response;
  try {
    response = http_client_->stream(http_request);
  } catch (const OllamaError& error) {
    auto details = build_request_log_details(http_request);
    details["error"] = error.what();
    log(LogLevel::Error, "request failed", details);
    throw;
  } catch (const std::exception& error) {
    auto details = build_request_log_details(http_request);
    details["error"] = error.what();
    log(LogLevel::Error, "request failed", details);
    throw TransportError(error.what());
  }

  const auto duration = std::chrono::steady_clock::now() - start_time;
  auto details = build_response_log_details(http_request, response.status_code, response.headers, duration);

  if (response.status_code >= 400) {
    // The exchange has already failed; the body only carries the error message.
    std::string error_body;
    if (response.body) {
      while (auto chunk = response.body->read()) {
        error_body += *chunk;
      }
      response.body->close();
    }
    log(LogLevel::Error, "request failed", details);
    throw_api_error(response.status_code, error_body, response.headers);
  }

  if (!response.body) {
    throw TransportError("Streaming response for " + path + " has no body");
  }
  log(LogLevel::Debug, "stream opened", details);
  return std::move(response.body);
}

}  // namespace ollama
