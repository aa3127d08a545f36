#pragma once

#include <functional>
#include <string>

#include <nlohmann/json.hpp>

namespace ollama {

enum class LogLevel { Off = 0, Error = 1, Warn = 2, Info = 3, Debug = 4 };

using LoggerCallback = std::function<void(LogLevel level, const std::string& message, const nlohmann::json& details)>;

/// Accepts off/none, error, warn/warning, info and debug in any case; anything else yields `fallback`.
LogLevel parse_log_level(const std::string& value, LogLevel fallback = LogLevel::Off);

const char* to_string(LogLevel level);

/// True when a message at `level` passes a logger configured at `threshold`. Off never passes.
bool should_log(LogLevel threshold, LogLevel level);

}  // namespace ollama
