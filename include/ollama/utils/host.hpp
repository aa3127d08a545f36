#pragma once

#include <string>

namespace ollama::utils {

constexpr const char* kDefaultHost = "http://127.0.0.1:11434";
constexpr const char* kDefaultPort = "11434";

/**
 * Normalizes a host setting into `scheme://host:port[/path]`.
 *
 * A bare host gets `http://` and the default port 11434; ":port" means the
 * loopback address; an explicit scheme without a port gets 80 or 443.
 * Trailing slashes are removed. An empty value yields the default host.
 */
std::string format_host(const std::string& host);

}  // namespace ollama::utils
