#include "ollama/utils/host.hpp"

#include "ollama/error.hpp"

#include <algorithm>
#include <cctype>

namespace ollama::utils {

std::string format_host(const std::string& host) {
  std::string value = host;
  value.erase(value.begin(), std::find_if(value.begin(), value.end(), [](unsigned char ch) { return !std::isspace(ch); }));
  value.erase(std::find_if(value.rbegin(), value.rend(), [](unsigned char ch) { return !std::isspace(ch); }).base(),
              value.end());
  if (value.empty()) {
    return kDefaultHost;
  }

  bool explicit_scheme = value.find("://") != std::string::npos;
  if (value.front() == ':') {
    value = std::string("http://127.0.0.1") + value;
    explicit_scheme = true;
  }

  std::string scheme = "http";
  std::string rest = value;
  if (explicit_scheme) {
    const auto scheme_end = value.find("://");
    scheme = value.substr(0, scheme_end);
    std::transform(scheme.begin(), scheme.end(), scheme.begin(), [](unsigned char ch) {
      return static_cast<char>(std::tolower(ch));
    });
    rest = value.substr(scheme_end + 3);
  }

  const auto path_start = rest.find('/');
  std::string authority = rest.substr(0, path_start);
  std::string path = path_start == std::string::npos ? std::string() : rest.substr(path_start);

  std::string userinfo;
  const auto at = authority.rfind('@');
  if (at != std::string::npos) {
    userinfo = authority.substr(0, at + 1);
    authority = authority.substr(at + 1);
  }

  std::string hostname = authority;
  std::string port;
  if (!authority.empty() && authority.front() == '[') {
    const auto bracket = authority.find(']');
    if (bracket == std::string::npos) {
      throw LocalValidationError("Invalid host: \"" + host + "\"");
    }
    hostname = authority.substr(0, bracket + 1);
    if (bracket + 1 < authority.size() && authority[bracket + 1] == ':') {
      port = authority.substr(bracket + 2);
    }
  } else {
    const auto colon = authority.rfind(':');
    if (colon != std::string::npos) {
      hostname = authority.substr(0, colon);
      port = authority.substr(colon + 1);
    }
  }
  if (hostname.empty()) {
    throw LocalValidationError("Invalid host: \"" + host + "\"");
  }
  if (!std::all_of(port.begin(), port.end(), [](unsigned char ch) { return std::isdigit(ch) != 0; })) {
    throw LocalValidationError("Invalid port in host: \"" + host + "\"");
  }
  if (port.empty()) {
    if (!explicit_scheme) {
      port = kDefaultPort;
    } else {
      port = scheme == "https" ? "443" : "80";
    }
  }

  std::string formatted = scheme + "://" + userinfo + hostname + ":" + port + path;
  while (!formatted.empty() && formatted.back() == '/') {
    formatted.pop_back();
  }
  return formatted;
}

}  // namespace ollama::utils
