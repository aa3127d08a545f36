#pragma once

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>

namespace ollama {

struct HttpRequest {
  std::string method;
  std::string url;
  std::map<std::string, std::string> headers;
  std::string body;
  std::chrono::milliseconds timeout{60000};
};

struct HttpResponse {
  long status_code = 0;
  std::map<std::string, std::string> headers;
  std::string body;
};

/**
 * Incrementally readable response body. `read()` blocks until the next chunk of
 * bytes is available and returns std::nullopt once the transfer has ended.
 * `close()` aborts the transfer; reads after close return std::nullopt.
 */
class ByteSource {
public:
  virtual ~ByteSource() = default;
  virtual std::optional<std::string> read() = 0;
  virtual void close() = 0;
};

struct StreamingHttpResponse {
  long status_code = 0;
  std::map<std::string, std::string> headers;
  std::unique_ptr<ByteSource> body;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;
  virtual HttpResponse request(const HttpRequest& request) = 0;

  /// Returns once the response headers have arrived; the body is pulled through the returned source.
  virtual StreamingHttpResponse stream(const HttpRequest& request) = 0;
};

std::unique_ptr<HttpClient> make_default_http_client();

}  // namespace ollama
