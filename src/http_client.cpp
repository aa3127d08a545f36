#include "ollama/http_client.hpp"

#include "ollama/error.hpp"

#include <curl/curl.h>

#include <algorithm>
#include <cctype>
#include <map>
#include <memory>
#include <string>

namespace ollama {
namespace {

constexpr long kStreamPollIntervalMs = 1000;

void trim(std::string& s) {
  auto not_space = [](unsigned char ch) { return !std::isspace(ch); };
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), not_space));
  s.erase(std::find_if(s.rbegin(), s.rend(), not_space).base(), s.end());
}

struct HeaderContext {
  std::map<std::string, std::string> headers;
  bool complete = false;
};

size_t header_callback(char* buffer, size_t size, size_t nitems, void* userdata) {
  std::size_t total_size = size * nitems;
  std::string line(buffer, total_size);

  auto* context = static_cast<HeaderContext*>(userdata);
  if (line.rfind("HTTP/", 0) == 0) {
    // A new header block starts (redirects, 100-continue); keep only the last one.
    context->headers.clear();
    context->complete = false;
    return total_size;
  }
  if (line == "\r\n" || line == "\n") {
    context->complete = true;
    return total_size;
  }

  auto colon_pos = line.find(':');
  if (colon_pos != std::string::npos) {
    std::string key = line.substr(0, colon_pos);
    std::string value = line.substr(colon_pos + 1);
    trim(key);
    trim(value);
    if (!key.empty()) {
      context->headers[key] = value;
    }
  }

  return total_size;
}

size_t append_callback(char* ptr, size_t size, size_t nmemb, void* userdata) {
  auto* body = static_cast<std::string*>(userdata);
  const size_t total = size * nmemb;
  body->append(ptr, total);
  return total;
}

curl_slist* build_header_list(const std::map<std::string, std::string>& headers) {
  curl_slist* header_list = nullptr;
  for (const auto& [key, value] : headers) {
    std::string header = key + ": " + value;
    header_list = curl_slist_append(header_list, header.c_str());
  }
  return header_list;
}

[[noreturn]] void throw_transfer_error(CURLcode code) {
  std::string message = std::string("libcurl error: ") + curl_easy_strerror(code);
  if (code == CURLE_OPERATION_TIMEDOUT) {
    throw TransportTimeoutError(message);
  }
  throw TransportError(message);
}

void apply_method_and_body(CURL* curl, const std::string& method, const std::string& body) {
  if (method == "HEAD") {
    curl_easy_setopt(curl, CURLOPT_NOBODY, 1L);
  } else {
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, method.c_str());
  }
  if (!body.empty()) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, body.data());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE_LARGE, static_cast<curl_off_t>(body.size()));
  }
}

/**
 * Pull-driven body reader on top of the curl multi interface. The transfer only
 * advances inside `read()`, so nothing is received after the consumer stops asking.
 */
class CurlByteSource : public ByteSource {
public:
  explicit CurlByteSource(const HttpRequest& request) : body_(request.body) {
    easy_ = curl_easy_init();
    multi_ = curl_multi_init();
    if (!easy_ || !multi_) {
      close();
      throw TransportError("Failed to initialize libcurl");
    }
    header_list_ = build_header_list(request.headers);

    curl_easy_setopt(easy_, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(easy_, CURLOPT_HTTPHEADER, header_list_);
    curl_easy_setopt(easy_, CURLOPT_WRITEFUNCTION, append_callback);
    curl_easy_setopt(easy_, CURLOPT_WRITEDATA, &pending_);
    curl_easy_setopt(easy_, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(easy_, CURLOPT_HEADERDATA, &header_context_);
    curl_easy_setopt(easy_, CURLOPT_FOLLOWLOCATION, 1L);
    // Generation time is open-ended; only the connection phase is bounded.
    curl_easy_setopt(easy_, CURLOPT_CONNECTTIMEOUT_MS, static_cast<long>(request.timeout.count()));
    apply_method_and_body(easy_, request.method, body_);

    curl_multi_add_handle(multi_, easy_);
    attached_ = true;
  }

  ~CurlByteSource() override { close(); }

  CurlByteSource(const CurlByteSource&) = delete;
  CurlByteSource& operator=(const CurlByteSource&) = delete;

  void wait_for_headers() {
    while (!finished_ && !headers_ready()) {
      pump();
    }
    if (finished_ && result_ != CURLE_OK) {
      CURLcode code = result_;
      close();
      throw_transfer_error(code);
    }
  }

  long status_code() const {
    long status_code = 0;
    if (easy_) {
      curl_easy_getinfo(easy_, CURLINFO_RESPONSE_CODE, &status_code);
    }
    return status_code;
  }

  const std::map<std::string, std::string>& headers() const { return header_context_.headers; }

  std::optional<std::string> read() override {
    if (closed_) {
      return std::nullopt;
    }
    while (pending_.empty() && !finished_) {
      pump();
    }
    if (!pending_.empty()) {
      std::string chunk;
      chunk.swap(pending_);
      return chunk;
    }
    if (result_ != CURLE_OK) {
      CURLcode code = result_;
      close();
      throw_transfer_error(code);
    }
    close();
    return std::nullopt;
  }

  void close() override {
    if (closed_) {
      return;
    }
    closed_ = true;
    if (multi_ && easy_ && attached_) {
      curl_multi_remove_handle(multi_, easy_);
      attached_ = false;
    }
    if (easy_) {
      curl_easy_cleanup(easy_);
      easy_ = nullptr;
    }
    if (multi_) {
      curl_multi_cleanup(multi_);
      multi_ = nullptr;
    }
    if (header_list_) {
      curl_slist_free_all(header_list_);
      header_list_ = nullptr;
    }
  }

private:
  bool headers_ready() const {
    if (!header_context_.complete) {
      return false;
    }
    const long code = status_code();
    return code >= 200 && (code < 300 || code >= 400);
  }

  void pump() {
    int running = 0;
    CURLMcode mc = curl_multi_perform(multi_, &running);
    if (mc != CURLM_OK) {
      close();
      throw TransportError(std::string("libcurl multi error: ") + curl_multi_strerror(mc));
    }
    if (running == 0) {
      int remaining = 0;
      while (CURLMsg* message = curl_multi_info_read(multi_, &remaining)) {
        if (message->msg == CURLMSG_DONE) {
          result_ = message->data.result;
        }
      }
      finished_ = true;
      return;
    }
    if (pending_.empty()) {
      mc = curl_multi_poll(multi_, nullptr, 0, kStreamPollIntervalMs, nullptr);
      if (mc != CURLM_OK) {
        close();
        throw TransportError(std::string("libcurl multi error: ") + curl_multi_strerror(mc));
      }
    }
  }

  std::string body_;
  std::string pending_;
  HeaderContext header_context_;
  CURL* easy_ = nullptr;
  CURLM* multi_ = nullptr;
  curl_slist* header_list_ = nullptr;
  CURLcode result_ = CURLE_OK;
  bool attached_ = false;
  bool finished_ = false;
  bool closed_ = false;
};

class CurlHttpClient : public HttpClient {
public:
  CurlHttpClient() = default;

  HttpResponse request(const HttpRequest& request) override {
    CURL* curl = curl_easy_init();
    if (!curl) {
      throw TransportError("Failed to initialize libcurl");
    }

    curl_slist* header_list = build_header_list(request.headers);

    std::string response_body;
    HeaderContext header_context;

    curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
    curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, append_callback);
    curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response_body);
    curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
    curl_easy_setopt(curl, CURLOPT_HEADERDATA, &header_context);
    curl_easy_setopt(curl, CURLOPT_FOLLOWLOCATION, 1L);
    curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout.count()));
    apply_method_and_body(curl, request.method, request.body);

    CURLcode res = curl_easy_perform(curl);

    if (res != CURLE_OK) {
      curl_slist_free_all(header_list);
      curl_easy_cleanup(curl);
      throw_transfer_error(res);
    }

    long status_code = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status_code);

    curl_slist_free_all(header_list);
    curl_easy_cleanup(curl);

    return HttpResponse{status_code, std::move(header_context.headers), std::move(response_body)};
  }

  StreamingHttpResponse stream(const HttpRequest& request) override {
    auto source = std::make_unique<CurlByteSource>(request);
    source->wait_for_headers();

    StreamingHttpResponse response;
    response.status_code = source->status_code();
    response.headers = source->headers();
    response.body = std::move(source);
    return response;
  }
};

struct CurlGlobalState {
  CurlGlobalState() { curl_global_init(CURL_GLOBAL_DEFAULT); }
  ~CurlGlobalState() { curl_global_cleanup(); }
};

CurlGlobalState& curl_state() {
  static CurlGlobalState state;
  return state;
}

}  // namespace

std::unique_ptr<HttpClient> make_default_http_client() {
  (void)curl_state();
  return std::make_unique<CurlHttpClient>();
}

}  // namespace ollama
