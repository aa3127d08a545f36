#include "ollama/utils/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>

namespace ollama::utils {
namespace {

std::string trim(std::string value) {
  auto is_space = [](unsigned char ch) { return std::isspace(ch) != 0; };
  auto begin = std::find_if_not(value.begin(), value.end(), is_space);
  auto end = std::find_if_not(value.rbegin(), value.rend(), is_space).base();
  if (begin >= end) {
    return {};
  }
  return std::string(begin, end);
}

}  // namespace

std::optional<std::string> read_env(const std::string& name) {
  const char* raw = std::getenv(name.c_str());
  if (!raw) {
    return std::nullopt;
  }
  std::string trimmed = trim(raw);
  if (trimmed.empty()) {
    return std::nullopt;
  }
  return trimmed;
}

EnvironmentSettings read_environment() {
  EnvironmentSettings settings;
  settings.host = read_env("OLLAMA_HOST");
  settings.api_key = read_env("OLLAMA_API_KEY");
  settings.log_level = read_env("OLLAMA_LOG");
  settings.keep_alive = read_env("OLLAMA_KEEP_ALIVE");
  return settings;
}

}  // namespace ollama::utils
