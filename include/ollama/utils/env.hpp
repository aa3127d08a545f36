#pragma once

#include <optional>
#include <string>

namespace ollama::utils {

/**
 * Reads an environment variable and trims leading/trailing whitespace.
 * Returns std::nullopt when the variable is not set or holds only whitespace.
 */
std::optional<std::string> read_env(const std::string& name);

/// Client settings picked up from the process environment.
struct EnvironmentSettings {
  std::optional<std::string> host;        // OLLAMA_HOST
  std::optional<std::string> api_key;     // OLLAMA_API_KEY
  std::optional<std::string> log_level;   // OLLAMA_LOG
  std::optional<std::string> keep_alive;  // OLLAMA_KEEP_ALIVE
};

EnvironmentSettings read_environment();

}  // namespace ollama::utils
