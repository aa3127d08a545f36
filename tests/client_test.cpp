#include <gtest/gtest.h>

#include "ollama/client.hpp"
#include "ollama/error.hpp"
#include "ollama/logging.hpp"
#include "ollama/utils/platform.hpp"

#include "support/env_guard.hpp"
#include "support/mock_http_client.hpp"

#include <tuple>

using ollama::ClientOptions;
using ollama::HttpResponse;
using ollama::KeepAlive;
using ollama::LogLevel;
using ollama::OllamaClient;
using ollama::RequestOptions;
namespace mock = ollama::testing;
namespace utils = ollama::utils;
using json = nlohmann::json;

namespace {

HttpResponse tags_response() {
  HttpResponse response;
  response.status_code = 200;
  response.body = R"({"models":[]})";
  return response;
}

}  // namespace

TEST(OllamaClientTest, SendsDefaultHeadersAndUserAgent) {
  mock::CleanOllamaEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_response(tags_response());

  OllamaClient client({}, std::move(http_mock));
  client.models().list();

  const auto& captured = mock_ptr->last_request();
  ASSERT_TRUE(captured.has_value());
  const auto& headers = captured->headers;
  EXPECT_EQ(headers.at("Accept"), "application/json");
  EXPECT_EQ(headers.at("User-Agent"), utils::user_agent());
  EXPECT_EQ(headers.count("Authorization"), 0u);
  EXPECT_EQ(headers.count("Content-Type"), 0u);
  EXPECT_EQ(captured->timeout, client.options().timeout);
  EXPECT_EQ(utils::user_agent().rfind("ollama-cpp/", 0), 0u);
}

TEST(OllamaClientTest, IdentityAndAuthAreConfigurable) {
  mock::CleanOllamaEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_response(tags_response());

  ClientOptions options;
  options.host = "https://ollama.example.com/";
  options.user_agent = "my-app/2.0";
  options.api_key = "secret-key";
  OllamaClient client(std::move(options), std::move(http_mock));
  client.models().list();

  const auto& captured = *mock_ptr->last_request();
  EXPECT_EQ(captured.url, "https://ollama.example.com:443/api/tags");
  EXPECT_EQ(captured.headers.at("User-Agent"), "my-app/2.0");
  EXPECT_EQ(captured.headers.at("Authorization"), "Bearer secret-key");
}

TEST(OllamaClientTest, DefaultHeadersAppliedAndOverridable) {
  mock::CleanOllamaEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_response(tags_response());

  ClientOptions options;
  options.default_headers["X-Test-Default"] = "alpha";
  options.default_headers["X-Remove"] = "beta";
  OllamaClient client(std::move(options), std::move(http_mock));

  RequestOptions request_options;
  request_options.headers["x-remove"] = std::nullopt;
  request_options.headers["X-New"] = std::string("gamma");
  request_options.timeout = std::chrono::milliseconds(1500);
  client.models().list(request_options);

  const auto& captured = *mock_ptr->last_request();
  EXPECT_EQ(captured.headers.at("X-Test-Default"), "alpha");
  EXPECT_EQ(captured.headers.count("X-Remove"), 0u);
  EXPECT_EQ(captured.headers.at("X-New"), "gamma");
  EXPECT_EQ(captured.timeout, std::chrono::milliseconds(1500));
}

TEST(OllamaClientTest, ReadsSettingsFromEnvironment) {
  mock::CleanOllamaEnvironment env;
  mock::EnvVarGuard host("OLLAMA_HOST", std::string("gpu-box:8080"));
  mock::EnvVarGuard key("OLLAMA_API_KEY", std::string("env-key"));
  mock::EnvVarGuard log("OLLAMA_LOG", std::string("debug"));
  mock::EnvVarGuard keep_alive("OLLAMA_KEEP_ALIVE", std::string("10m"));

  OllamaClient client({}, std::make_unique<mock::MockHttpClient>());
  EXPECT_EQ(client.options().host, "http://gpu-box:8080");
  EXPECT_EQ(client.options().api_key, "env-key");
  EXPECT_EQ(client.options().log_level, LogLevel::Debug);
  EXPECT_EQ(client.options().default_keep_alive, KeepAlive::seconds(600));
}

TEST(OllamaClientTest, ExplicitOptionsWinOverEnvironment) {
  mock::CleanOllamaEnvironment env;
  mock::EnvVarGuard host("OLLAMA_HOST", std::string("gpu-box:8080"));
  mock::EnvVarGuard key("OLLAMA_API_KEY", std::string("env-key"));
  mock::EnvVarGuard keep_alive("OLLAMA_KEEP_ALIVE", std::string("10m"));

  ClientOptions options;
  options.host = ":9999";
  options.api_key = "explicit";
  options.default_keep_alive = KeepAlive::none();
  OllamaClient client(std::move(options), std::make_unique<mock::MockHttpClient>());
  EXPECT_EQ(client.options().host, "http://127.0.0.1:9999");
  EXPECT_EQ(client.options().api_key, "explicit");
  EXPECT_EQ(client.options().default_keep_alive, KeepAlive::none());
}

TEST(OllamaClientTest, RejectsInvalidConfiguration) {
  mock::CleanOllamaEnvironment env;
  {
    mock::EnvVarGuard keep_alive("OLLAMA_KEEP_ALIVE", std::string("forever-ish"));
    EXPECT_THROW(OllamaClient({}, std::make_unique<mock::MockHttpClient>()), ollama::LocalValidationError);
  }
  ClientOptions options;
  options.timeout = std::chrono::milliseconds(0);
  EXPECT_THROW(OllamaClient(std::move(options), std::make_unique<mock::MockHttpClient>()),
               ollama::LocalValidationError);
}

TEST(OllamaClientTest, EmitsLogsWithSanitizedHeaders) {
  mock::CleanOllamaEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  HttpResponse response = tags_response();
  response.headers["Set-Cookie"] = "session";
  mock_ptr->enqueue_response(response);

  std::vector<std::tuple<LogLevel, std::string, json>> logs;
  ClientOptions options;
  options.api_key = "secret-key";
  options.log_level = LogLevel::Debug;
  options.logger = [&](LogLevel level, const std::string& message, const json& details) {
    logs.emplace_back(level, message, details);
  };
  OllamaClient client(std::move(options), std::move(http_mock));
  client.models().list();

  ASSERT_EQ(logs.size(), 2u);
  EXPECT_EQ(std::get<0>(logs[0]), LogLevel::Debug);
  EXPECT_EQ(std::get<1>(logs[0]), "sending request");
  EXPECT_EQ(std::get<2>(logs[0])["headers"]["Authorization"], "***");
  EXPECT_EQ(std::get<0>(logs[1]), LogLevel::Info);
  EXPECT_EQ(std::get<1>(logs[1]), "request succeeded");
  EXPECT_EQ(std::get<2>(logs[1])["status"], 200);
  EXPECT_EQ(std::get<2>(logs[1])["response_headers"]["Set-Cookie"], "***");
}

TEST(OllamaClientTest, LogLevelFiltersMessages) {
  mock::CleanOllamaEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  http_mock->enqueue_response(tags_response());
  http_mock->enqueue_stream({"{\"status\":\"success\"}\n"});

  std::vector<std::string> messages;
  ClientOptions options;
  options.log_level = LogLevel::Info;
  options.logger = [&](LogLevel, const std::string& message, const json&) { messages.push_back(message); };
  OllamaClient client(std::move(options), std::move(http_mock));

  client.models().list();
  auto stream = client.models().pull({"llama3.2", std::nullopt});
  EXPECT_EQ(messages, std::vector<std::string>{"request succeeded"});
}

TEST(OllamaClientTest, MapsStatusCodesToSpecificErrors) {
  mock::CleanOllamaEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  const std::vector<long> statuses = {400, 401, 403, 404, 409, 422, 429, 500, 503, 418};
  for (long status : statuses) {
    mock_ptr->enqueue_json(status, R"({"error":"status )" + std::to_string(status) + "\"}");
  }
  OllamaClient client({}, std::move(http_mock));

  auto expect_error = [&](long status, auto tag) {
    using Expected = decltype(tag);
    try {
      client.models().list();
      ADD_FAILURE() << "Expected an error for HTTP " << status;
    } catch (const Expected& error) {
      EXPECT_EQ(error.status_code(), status);
      EXPECT_EQ(std::string(error.what()), "status " + std::to_string(status));
    }
  };

  expect_error(400, ollama::BadRequestError("", 0, {}, {}));
  expect_error(401, ollama::AuthenticationError("", 0, {}, {}));
  expect_error(403, ollama::PermissionDeniedError("", 0, {}, {}));
  expect_error(404, ollama::NotFoundError("", 0, {}, {}));
  expect_error(409, ollama::ConflictError("", 0, {}, {}));
  expect_error(422, ollama::UnprocessableEntityError("", 0, {}, {}));
  expect_error(429, ollama::RateLimitError("", 0, {}, {}));
  expect_error(500, ollama::InternalServerError("", 0, {}, {}));
  expect_error(503, ollama::InternalServerError("", 0, {}, {}));
  expect_error(418, ollama::APIError("", 0, {}, {}));
}

TEST(OllamaClientTest, ErrorWithoutJsonBodyUsesStatusMessage) {
  mock::CleanOllamaEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  http_mock->enqueue_json(502, "Bad Gateway");
  OllamaClient client({}, std::move(http_mock));

  try {
    client.models().list();
    FAIL() << "Expected InternalServerError";
  } catch (const ollama::InternalServerError& error) {
    EXPECT_STREQ(error.what(), "HTTP 502 error");
    EXPECT_EQ(error.error_body(), json("Bad Gateway"));
  }
}

TEST(OllamaClientTest, TransportFailuresAreNotRetried) {
  mock::CleanOllamaEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_error("connection refused");
  mock_ptr->enqueue_response(tags_response());
  OllamaClient client({}, std::move(http_mock));

  EXPECT_THROW(client.models().list(), ollama::TransportError);
  EXPECT_EQ(mock_ptr->requests().size(), 1u);
  EXPECT_EQ(mock_ptr->pending(), 1u);
}

TEST(OllamaClientTest, VersionReadsServerVersion) {
  mock::CleanOllamaEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  auto* mock_ptr = http_mock.get();
  mock_ptr->enqueue_json(200, R"({"version":"0.12.6"})");
  OllamaClient client({}, std::move(http_mock));

  EXPECT_EQ(client.version().version, "0.12.6");
  EXPECT_EQ(mock_ptr->last_request()->url, "http://127.0.0.1:11434/api/version");
}

TEST(OllamaClientTest, IndependentStreamsDoNotShareState) {
  mock::CleanOllamaEnvironment env;
  auto http_mock = std::make_unique<mock::MockHttpClient>();
  http_mock->enqueue_stream({"{\"status\":\"a1\"}\n{\"status\":\"a2\"}\n"});
  http_mock->enqueue_stream({"{\"status\":\"b1\"}\n{\"error\":\"boom\"}\n"});
  OllamaClient client({}, std::move(http_mock));

  auto first = client.models().pull({"a", std::nullopt});
  auto second = client.models().pull({"b", std::nullopt});

  EXPECT_EQ(first.next()->payload.status, "a1");
  EXPECT_EQ(second.next()->payload.status, "b1");
  EXPECT_THROW(second.next(), ollama::ServerStreamError);
  EXPECT_EQ(first.next()->payload.status, "a2");
  EXPECT_FALSE(first.next().has_value());
}
