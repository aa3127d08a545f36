#pragma once

#include <string>

namespace ollama::utils {

struct PlatformProperties {
  std::string package_version;
  std::string os;
  std::string arch;
  std::string compiler;
};

/**
 * Returns cached properties describing the build and runtime environment.
 */
const PlatformProperties& platform_properties();

/**
 * Returns the default identity string sent as User-Agent,
 * e.g. `ollama-cpp/0.1.0 (x64 Linux) gcc/13.2.0`.
 */
std::string user_agent();

}  // namespace ollama::utils
